#include "chunk_bitfield.h"
#include <algorithm>

namespace cloudless {

ChunkBitfield::ChunkBitfield() noexcept
    : num_bits_(0) {
}

ChunkBitfield::ChunkBitfield(size_t num_bits)
    : num_bits_(num_bits) {
    if (num_bits_ > 0) {
        data_.resize((num_bits_ + 31) / 32, 0);
    }
}

ChunkBitfield::ChunkBitfield(ChunkBitfield&& other) noexcept
    : data_(std::move(other.data_)), num_bits_(other.num_bits_) {
    other.num_bits_ = 0;
}

ChunkBitfield& ChunkBitfield::operator=(ChunkBitfield&& other) noexcept {
    if (this != &other) {
        data_ = std::move(other.data_);
        num_bits_ = other.num_bits_;
        other.num_bits_ = 0;
    }
    return *this;
}

bool ChunkBitfield::set_bit(size_t index) {
    if (index >= num_bits_) {
        return false;
    }

    size_t word_idx = index / 32;
    uint32_t mask = 1U << (31 - (index % 32));
    if (data_[word_idx] & mask) {
        return false;
    }
    data_[word_idx] |= mask;
    return true;
}

bool ChunkBitfield::get_bit(size_t index) const {
    if (index >= num_bits_) {
        return false;
    }

    size_t word_idx = index / 32;
    size_t bit_idx = 31 - (index % 32);
    return (data_[word_idx] & (1U << bit_idx)) != 0;
}

void ChunkBitfield::clear_all() {
    std::fill(data_.begin(), data_.end(), 0);
}

bool ChunkBitfield::all_set() const {
    return count() == num_bits_;
}

bool ChunkBitfield::none_set() const {
    for (const auto& word : data_) {
        if (word != 0) return false;
    }
    return true;
}

size_t ChunkBitfield::count() const {
    size_t total = 0;
    for (const auto& word : data_) {
        total += popcount32(word);
    }
    return total;
}

size_t ChunkBitfield::find_first_clear() const {
    for (size_t i = 0; i < num_bits_; ++i) {
        if (!get_bit(i)) {
            return i;
        }
    }
    return num_bits_;
}

size_t ChunkBitfield::popcount32(uint32_t x) {
#if defined(__GNUC__) || defined(__clang__)
    return static_cast<size_t>(__builtin_popcount(x));
#else
    x = x - ((x >> 1) & 0x55555555);
    x = (x & 0x33333333) + ((x >> 2) & 0x33333333);
    x = (x + (x >> 4)) & 0x0F0F0F0F;
    x = x + (x >> 8);
    x = x + (x >> 16);
    return x & 0x3F;
#endif
}

std::string ChunkBitfield::to_hex() const {
    static const char* digits = "0123456789abcdef";
    size_t byte_count = (num_bits_ + 7) / 8;
    std::string hex;
    hex.reserve(byte_count * 2);

    for (size_t b = 0; b < byte_count; ++b) {
        uint32_t word = data_[b / 4];
        uint8_t byte = static_cast<uint8_t>((word >> (24 - 8 * (b % 4))) & 0xFF);
        hex.push_back(digits[byte >> 4]);
        hex.push_back(digits[byte & 0x0F]);
    }
    return hex;
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool ChunkBitfield::from_hex(const std::string& hex, size_t num_bits, ChunkBitfield& out) {
    ChunkBitfield result(num_bits);

    size_t byte_count = std::min(hex.size() / 2, (num_bits + 7) / 8);
    for (size_t b = 0; b < byte_count; ++b) {
        int hi = hex_value(hex[2 * b]);
        int lo = hex_value(hex[2 * b + 1]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        uint8_t byte = static_cast<uint8_t>((hi << 4) | lo);
        for (size_t bit = 0; bit < 8; ++bit) {
            if (byte & (0x80 >> bit)) {
                result.set_bit(b * 8 + bit);
            }
        }
    }

    out = std::move(result);
    return true;
}

bool ChunkBitfield::operator==(const ChunkBitfield& other) const {
    return num_bits_ == other.num_bits_ && data_ == other.data_;
}

} // namespace cloudless
