#include <gtest/gtest.h>
#include "safety_number.h"
#include <set>
#include <string>
#include <vector>

using namespace cloudless;

namespace {

// base64 of bytes 0..31 and 32..63
const std::string KEY_A = "AAECAwQFBgcICQoLDA0ODxAREhMUFRYXGBkaGxwdHh8=";
const std::string KEY_B = "ICEiIyQlJicoKSorLC0uLzAxMjM0NTY3ODk6Ozw9Pj8=";

} // namespace

TEST(SafetyNumberTest, Sha256KnownAnswer) {
    Sha256Digest digest;
    const std::string input = "abc";
    ASSERT_TRUE(sha256(reinterpret_cast<const uint8_t*>(input.data()), input.size(), digest));
    EXPECT_EQ(digest[0], 0xba);
    EXPECT_EQ(digest[1], 0x78);
    EXPECT_EQ(digest[2], 0x16);
    EXPECT_EQ(digest[31], 0xad);
}

TEST(SafetyNumberTest, DecodeBase64) {
    std::vector<uint8_t> out;
    ASSERT_TRUE(decode_base64(KEY_A, out));
    ASSERT_EQ(out.size(), 32);
    for (size_t i = 0; i < out.size(); ++i) {
        EXPECT_EQ(out[i], i);
    }

    ASSERT_TRUE(decode_base64("aGk=", out));
    EXPECT_EQ(std::string(out.begin(), out.end()), "hi");

    ASSERT_TRUE(decode_base64("", out));
    EXPECT_TRUE(out.empty());
}

TEST(SafetyNumberTest, DecodeBase64RejectsMalformedInput) {
    std::vector<uint8_t> out;
    EXPECT_FALSE(decode_base64("abc", out));
    EXPECT_FALSE(decode_base64("!!!!", out));
}

TEST(SafetyNumberTest, KnownValue) {
    EXPECT_EQ(generate_safety_number(KEY_A, KEY_B),
              "22293 89565 03533 70501 99378 89339 66103 10918 22219 89961 29021 79871");
}

TEST(SafetyNumberTest, SymmetricInKeyOrder) {
    EXPECT_EQ(generate_safety_number(KEY_A, KEY_B), generate_safety_number(KEY_B, KEY_A));
}

TEST(SafetyNumberTest, FormatIsTwelveGroupsOfFiveDigits) {
    std::string number = generate_safety_number("key-one", "key-two");
    ASSERT_EQ(number.size(), SAFETY_NUMBER_GROUPS * SAFETY_NUMBER_GROUP_DIGITS + SAFETY_NUMBER_GROUPS - 1);
    for (size_t i = 0; i < number.size(); ++i) {
        if (i % 6 == 5) {
            EXPECT_EQ(number[i], ' ');
        } else {
            EXPECT_TRUE(number[i] >= '0' && number[i] <= '9');
        }
    }
}

TEST(SafetyNumberTest, DifferentKeysGiveDifferentNumbers) {
    EXPECT_NE(generate_safety_number(KEY_A, KEY_B), generate_safety_number(KEY_A, KEY_A));
}

TEST(SafetyNumberTest, EmojiFingerprintKnownValue) {
    std::vector<std::string> fingerprint;
    ASSERT_TRUE(generate_emoji_fingerprint(KEY_A, fingerprint));
    ASSERT_EQ(fingerprint.size(), EMOJI_FINGERPRINT_LENGTH);
    EXPECT_EQ(fingerprint[0], "\xE2\x9A\xA1");
    EXPECT_EQ(fingerprint[1], "\xF0\x9F\x8E\xB8");
    EXPECT_EQ(fingerprint[2], "\xF0\x9F\x8E\xB8");
    EXPECT_EQ(fingerprint[3], "\xF0\x9F\x8C\x88");
    EXPECT_EQ(fingerprint[4], "\xF0\x9F\x9A\x80");
}

TEST(SafetyNumberTest, EmojiFingerprintRejectsInvalidKey) {
    std::vector<std::string> fingerprint;
    EXPECT_FALSE(generate_emoji_fingerprint("not base64", fingerprint));
}
