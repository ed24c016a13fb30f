#include "safety_number.h"
#include <openssl/evp.h>
#include <algorithm>
#include <cstdio>

namespace cloudless {

namespace {

const char* const FINGERPRINT_EMOJIS[] = {
    "\xF0\x9F\x94\x90", "\xF0\x9F\x94\x91", "\xF0\x9F\x9B\xA1\xEF\xB8\x8F", "\xE2\x9A\xA1",
    "\xF0\x9F\x8C\x9F", "\xF0\x9F\x8E\xAF", "\xF0\x9F\x9A\x80", "\xF0\x9F\x92\x8E",
    "\xF0\x9F\x94\xAE", "\xF0\x9F\x8C\x88", "\xF0\x9F\x8E\xAA", "\xF0\x9F\x8E\xAD",
    "\xF0\x9F\x8E\xA8", "\xF0\x9F\x8E\xB8", "\xF0\x9F\x8E\xBA", "\xF0\x9F\x8E\xBB",
    "\xF0\x9F\x8C\xBA", "\xF0\x9F\x8C\xB8", "\xF0\x9F\x8C\xBC", "\xF0\x9F\x8C\xBB",
    "\xF0\x9F\x8D\x80", "\xF0\x9F\x8C\xB4", "\xF0\x9F\x8C\xB5", "\xF0\x9F\x8E\x84",
    "\xF0\x9F\xA6\x8A", "\xF0\x9F\xA6\x81", "\xF0\x9F\x90\xAF", "\xF0\x9F\xA6\x84",
    "\xF0\x9F\x90\xB2", "\xF0\x9F\xA6\x85", "\xF0\x9F\xA6\x8B", "\xF0\x9F\x90\x99"
};

constexpr size_t FINGERPRINT_EMOJI_COUNT = sizeof(FINGERPRINT_EMOJIS) / sizeof(FINGERPRINT_EMOJIS[0]);

} // namespace

bool sha256(const uint8_t* data, size_t size, Sha256Digest& digest) {
    unsigned int length = 0;
    if (EVP_Digest(data, size, digest.data(), &length, EVP_sha256(), nullptr) != 1) {
        return false;
    }
    return length == digest.size();
}

bool decode_base64(const std::string& input, std::vector<uint8_t>& out) {
    if (input.empty()) {
        out.clear();
        return true;
    }
    if (input.size() % 4 != 0) {
        return false;
    }

    std::vector<uint8_t> buffer(input.size() / 4 * 3);
    int decoded = EVP_DecodeBlock(buffer.data(), reinterpret_cast<const unsigned char*>(input.data()),
                                  static_cast<int>(input.size()));
    if (decoded < 0) {
        return false;
    }

    // EVP_DecodeBlock counts padding as zero bytes
    size_t padding = 0;
    if (input[input.size() - 1] == '=') padding++;
    if (input[input.size() - 2] == '=') padding++;

    buffer.resize(static_cast<size_t>(decoded) - padding);
    out = std::move(buffer);
    return true;
}

std::string generate_safety_number(const std::string& public_key_a, const std::string& public_key_b) {
    const std::string& first = std::min(public_key_a, public_key_b);
    const std::string& second = std::max(public_key_a, public_key_b);
    std::string combined = first + second;

    std::vector<uint8_t> material;
    Sha256Digest digest;
    if (!sha256(reinterpret_cast<const uint8_t*>(combined.data()), combined.size(), digest)) {
        return std::string();
    }
    material.insert(material.end(), digest.begin(), digest.end());

    Sha256Digest extension;
    if (!sha256(digest.data(), digest.size(), extension)) {
        return std::string();
    }
    material.insert(material.end(), extension.begin(), extension.end());

    std::string formatted;
    for (size_t group = 0; group < SAFETY_NUMBER_GROUPS; ++group) {
        uint64_t value = 0;
        for (size_t i = 0; i < 5; ++i) {
            value = (value << 8) | material[group * 5 + i];
        }
        char digits[8];
        std::snprintf(digits, sizeof(digits), "%05u", static_cast<unsigned>(value % 100000));
        if (group > 0) {
            formatted.push_back(' ');
        }
        formatted.append(digits);
    }
    return formatted;
}

bool generate_emoji_fingerprint(const std::string& public_key, std::vector<std::string>& fingerprint) {
    std::vector<uint8_t> key_bytes;
    if (!decode_base64(public_key, key_bytes)) {
        return false;
    }

    Sha256Digest digest;
    if (!sha256(key_bytes.data(), key_bytes.size(), digest)) {
        return false;
    }

    fingerprint.clear();
    for (size_t i = 0; i < EMOJI_FINGERPRINT_LENGTH; ++i) {
        fingerprint.emplace_back(FINGERPRINT_EMOJIS[digest[i] % FINGERPRINT_EMOJI_COUNT]);
    }
    return true;
}

} // namespace cloudless
