/**
 * @file bitreader.hpp
 * @brief Sequential bit reading from an interchange buffer.
 *
 * @cond INTERNAL
 * ============================================================================
 *  _____                                   ____
 * |_   _|_ _ _ __   __ _  __ _ _ __ __ _  / ___| _ __   __ _  ___ ___
 *   | |/ _` | '_ \ / _` |/ _` | '__/ _` | \___ \| '_ \ / _` |/ __/ _ \
 *   | | (_| | | | | (_| | (_| | | | (_| |  ___) | |_) | (_| | (_|  __/
 *   |_|\__,_|_| |_|\__,_|\__, |_|  \__,_| |____/| .__/ \__,_|\___\___|
 *                        |___/                  |_|
 * ============================================================================
 * @endcond
 *
 * The bit reader provides stateful bit-level access to a decimal128
 * buffer, reading MSB-first within each byte, bytes in buffer order.
 *
 * @see https://ieeexplore.ieee.org/document/4610935 IEEE 754-2008
 */

#ifndef DEC128_BITREADER_HPP
#define DEC128_BITREADER_HPP

#include "config.hpp"

namespace dec128 {

/**
 * @brief Sequential bit reader over a byte buffer.
 *
 * Tracks position within a byte buffer for bit-level access.
 * Used by the decoder to pull the sign, exponent and significand fields.
 */
class BitReader {
public:
    /**
     * @brief Construct a bit reader.
     *
     * @param data Pointer to source data buffer
     * @param num_bits Number of valid bits in buffer
     */
    BitReader(const std::uint8_t* data, std::size_t num_bits) noexcept
        : data_(data), num_bits_(num_bits), bit_pos_(0) {}

    /**
     * @brief Read a single bit.
     *
     * @return Bit value (0 or 1), or -1 if no bits remaining
     */
    inline int read_bit() noexcept {
        if (bit_pos_ >= num_bits_) [[unlikely]] {
            return -1;
        }

        std::size_t byte_idx = bit_pos_ >> 3; // bit_pos_ / 8
        std::size_t bit_idx = bit_pos_ & 7;   // bit_pos_ % 8

        // MSB-first: bit 0 of byte is at position 7
        int bit = (data_[byte_idx] >> (7 - bit_idx)) & 1;
        ++bit_pos_;

        return bit;
    }

    /**
     * @brief Read multiple bits as unsigned value.
     *
     * Reads up to 64 bits MSB-first. Whole bytes are consumed a byte at
     * a time, partial bytes by shift and mask.
     *
     * @param num_bits Number of bits to read (1-64)
     * @return Unsigned value from bits read, 0 on underflow
     */
    std::uint64_t read_bits(std::size_t num_bits) noexcept {
        if (num_bits == 0 || num_bits > 64) [[unlikely]] {
            return 0;
        }

        if (bit_pos_ + num_bits > num_bits_) [[unlikely]] {
            return 0; // Underflow protection
        }

        std::uint64_t value = 0;
        std::size_t remaining = num_bits;

        while (remaining > 0) {
            std::size_t byte_idx = bit_pos_ >> 3;
            std::size_t bit_idx = bit_pos_ & 7;

            // Bits available in current byte
            std::size_t bits_in_byte = 8 - bit_idx;
            std::size_t bits_to_read = (remaining < bits_in_byte) ? remaining : bits_in_byte;

            // Extract bits from current byte (MSB-first)
            std::uint32_t byte_val = data_[byte_idx];
            std::uint32_t shift = static_cast<std::uint32_t>(8 - bit_idx - bits_to_read);
            std::uint32_t mask = (1U << bits_to_read) - 1U;
            std::uint64_t extracted = (byte_val >> shift) & mask;

            value = (value << bits_to_read) | extracted;
            bit_pos_ += bits_to_read;
            remaining -= bits_to_read;
        }

        return value;
    }

    /**
     * @brief Read up to 128 bits as a wide unsigned value.
     *
     * @param num_bits Number of bits to read (1-128)
     * @return Unsigned value from bits read, 0 on underflow
     */
    uint128_t read_wide(std::size_t num_bits) noexcept {
        if (num_bits == 0 || num_bits > 128 || bit_pos_ + num_bits > num_bits_) [[unlikely]] {
            return 0;
        }
        if (num_bits <= 64) {
            return read_bits(num_bits);
        }
        uint128_t high = read_bits(num_bits - 64);
        return (high << 64) | read_bits(64);
    }

    /**
     * @brief Advance without reading.
     *
     * @param num_bits Number of bits to skip (clamped to the end of data)
     */
    void skip(std::size_t num_bits) noexcept {
        bit_pos_ = (num_bits < remaining()) ? bit_pos_ + num_bits : num_bits_;
    }

    /**
     * @brief Get current bit position.
     *
     * @return Number of bits already read
     */
    [[nodiscard]] std::size_t position() const noexcept {
        return bit_pos_;
    }

    /**
     * @brief Get remaining bits.
     *
     * @return Number of bits remaining to read
     */
    [[nodiscard]] std::size_t remaining() const noexcept {
        return (bit_pos_ < num_bits_) ? (num_bits_ - bit_pos_) : 0;
    }

private:
    const std::uint8_t* data_;
    std::size_t num_bits_;
    std::size_t bit_pos_;
};

} // namespace dec128

#endif // DEC128_BITREADER_HPP
