#pragma once

/**
 * @file chunk_bitfield.h
 * @brief Received-chunk tracking for relay uploads
 *
 * Each relay transfer keeps one bit per chunk index so that a re-uploaded chunk
 * is recognized and counted once.
 */

#include <vector>
#include <cstdint>
#include <cstddef>
#include <string>

namespace cloudless {

/**
 * @brief Packed bit array indexed by chunk number
 *
 * Bits are stored MSB-first in 32-bit words; the hex form used for persistence
 * is MSB-first per byte.
 */
class ChunkBitfield {
public:
    ChunkBitfield() noexcept;

    /**
     * @brief Create bitfield with specified number of bits, all clear
     * @param num_bits Number of chunk indices tracked
     */
    explicit ChunkBitfield(size_t num_bits);

    ChunkBitfield(const ChunkBitfield& other) = default;
    ChunkBitfield(ChunkBitfield&& other) noexcept;
    ChunkBitfield& operator=(const ChunkBitfield& other) = default;
    ChunkBitfield& operator=(ChunkBitfield&& other) noexcept;
    ~ChunkBitfield() = default;

    /**
     * @brief Mark an index as received
     * @param index Chunk index (0-based)
     * @return true if the bit was previously clear; false if already set or out of range
     */
    bool set_bit(size_t index);

    bool get_bit(size_t index) const;
    bool operator[](size_t index) const { return get_bit(index); }

    void clear_all();

    bool all_set() const;
    bool none_set() const;

    /**
     * @brief Count the number of set bits
     */
    size_t count() const;

    size_t size() const noexcept { return num_bits_; }
    bool empty() const noexcept { return num_bits_ == 0; }

    /**
     * @brief Find the first clear bit
     * @return Index of first missing chunk, or size() if none
     */
    size_t find_first_clear() const;

    //=========================================================================
    // Persistence
    //=========================================================================

    /**
     * @brief Hex string of the packed bytes (2 characters per 8 chunks)
     */
    std::string to_hex() const;

    /**
     * @brief Rebuild a bitfield from to_hex() output
     * @param hex Hex string (may be shorter than needed; missing bits are clear)
     * @param num_bits Number of bits
     * @param out Result
     * @return false if the string contains non-hex characters
     */
    static bool from_hex(const std::string& hex, size_t num_bits, ChunkBitfield& out);

    bool operator==(const ChunkBitfield& other) const;
    bool operator!=(const ChunkBitfield& other) const { return !(*this == other); }

private:
    std::vector<uint32_t> data_;
    size_t num_bits_;

    static size_t popcount32(uint32_t x);
};

} // namespace cloudless
