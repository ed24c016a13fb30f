#pragma once

/**
 * @file safety_number.h
 * @brief Human-comparable digests of two members' public keys
 *
 * Both peers derive the same values from the same pair of keys, so reading the
 * digits (or emojis) aloud over another channel detects a substituted key.
 */

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace cloudless {

constexpr size_t SAFETY_NUMBER_GROUPS = 12;
constexpr size_t SAFETY_NUMBER_GROUP_DIGITS = 5;
constexpr size_t EMOJI_FINGERPRINT_LENGTH = 8;

using Sha256Digest = std::array<uint8_t, 32>;

bool sha256(const uint8_t* data, size_t size, Sha256Digest& digest);

/**
 * Standard base64 (with padding) to bytes
 * @return false on malformed input
 */
bool decode_base64(const std::string& input, std::vector<uint8_t>& out);

/**
 * 60 digits as 12 space-separated groups of 5.
 *
 * The keys are sorted and concatenated; D1 = SHA-256 of that text and
 * D2 = SHA-256(D1). Group i is the big-endian integer of bytes [5i, 5i+5) of
 * D1||D2, modulo 100000, zero padded.
 */
std::string generate_safety_number(const std::string& public_key_a, const std::string& public_key_b);

/**
 * Eight emojis picked by the first eight bytes of SHA-256 of the decoded key
 * @param public_key Base64 public key
 * @return false if the key is not valid base64
 */
bool generate_emoji_fingerprint(const std::string& public_key, std::vector<std::string>& fingerprint);

} // namespace cloudless
