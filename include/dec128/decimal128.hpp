/**
 * @file decimal128.hpp
 * @brief Decoded decimal128 value.
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
 * A decimal128 is broken down like so:
 *
 *     [ 1 bit ] [ 5 bits      ] [ 122 bits                   ]
 *       sign     combination     exponent and significand rest
 *
 * The value equals (-1)^sign * significand * 10^(exponent - 6176).
 *
 * @see https://en.wikipedia.org/wiki/Decimal128_floating-point_format
 */

#ifndef DEC128_DECIMAL128_HPP
#define DEC128_DECIMAL128_HPP

#include <array>
#include <compare>
#include <iosfwd>
#include <string>

#include "config.hpp"

namespace dec128 {

/**
 * @brief Numeric class of a decoded value.
 */
enum class Classification : std::uint8_t {
    Finite,   ///< Zero or finite number
    Infinity, ///< Positive or negative infinity
    NaN       ///< Not a number (quiet or signaling)
};

/**
 * @brief Immutable decimal128 value.
 *
 * Created by decode() from a 16-byte big-endian buffer; keeps the
 * original bytes for hex and word-level introspection.
 * A default-constructed value is +0E-6176, the decoding of 16 zero bytes.
 */
class Decimal128 {
public:
    /// Raw interchange bytes, big-endian (sign bit in byte 0)
    using Bytes = std::array<std::uint8_t, NUM_BYTES>;

    constexpr Decimal128() noexcept = default;

    [[nodiscard]] bool sign() const noexcept {
        return sign_;
    }

    [[nodiscard]] Classification classification() const noexcept {
        return classification_;
    }

    /**
     * @brief Biased exponent (0-16383), zero for NaN and Infinity.
     */
    [[nodiscard]] std::uint16_t exponent() const noexcept {
        return exponent_;
    }

    /**
     * @brief Exponent with the bias of 6176 removed.
     */
    [[nodiscard]] int adjusted_exponent() const noexcept {
        return static_cast<int>(exponent_) - EXPONENT_BIAS;
    }

    /**
     * @brief Significand magnitude, zero for NaN and Infinity.
     *
     * Not clamped: non-canonical encodings keep the assembled integer.
     */
    [[nodiscard]] uint128_t significand() const noexcept {
        return significand_;
    }

    [[nodiscard]] bool is_nan() const noexcept {
        return classification_ == Classification::NaN;
    }

    [[nodiscard]] bool is_infinite() const noexcept {
        return classification_ == Classification::Infinity;
    }

    [[nodiscard]] bool is_finite() const noexcept {
        return classification_ == Classification::Finite;
    }

    [[nodiscard]] bool is_negative() const noexcept {
        return sign_;
    }

    [[nodiscard]] bool is_positive() const noexcept {
        return !sign_;
    }

    /**
     * @brief Finite with a zero significand, at any exponent.
     */
    [[nodiscard]] bool is_zero() const noexcept {
        return is_finite() && significand_ == 0;
    }

    /**
     * @brief False for finite values whose significand exceeds 10^34 - 1.
     */
    [[nodiscard]] bool is_canonical() const noexcept {
        return !is_finite() || significand_ <= MAX_SIGNIFICAND;
    }

    /**
     * @brief Original interchange bytes.
     */
    [[nodiscard]] const Bytes& to_raw_bytes() const noexcept {
        return bytes_;
    }

    /**
     * @brief Upper 64 bits of the interchange value (bytes 0-7).
     */
    [[nodiscard]] std::uint64_t high() const noexcept;

    /**
     * @brief Lower 64 bits of the interchange value (bytes 8-15).
     */
    [[nodiscard]] std::uint64_t low() const noexcept;

    /**
     * @brief Canonical decimal string, see format().
     */
    [[nodiscard]] std::string to_string() const;

    /**
     * @brief Hex of the raw bytes, least significant byte first, see to_hex().
     */
    [[nodiscard]] std::string to_hex() const;

    /**
     * @brief Total order, see compare().
     */
    std::strong_ordering operator<=>(const Decimal128& other) const noexcept;
    bool operator==(const Decimal128& other) const noexcept;

private:
    Decimal128(bool sign, Classification classification, std::uint16_t exponent,
               uint128_t significand, const Bytes& bytes) noexcept
        : sign_(sign), classification_(classification), exponent_(exponent),
          significand_(significand), bytes_(bytes) {}

    friend Decimal128 decode(const Bytes& buffer) noexcept;

    bool sign_ = false;
    Classification classification_ = Classification::Finite;
    std::uint16_t exponent_ = 0;
    uint128_t significand_ = 0;
    Bytes bytes_{};
};

/**
 * @brief Write format(value) to a stream.
 */
std::ostream& operator<<(std::ostream& os, const Decimal128& value);

} // namespace dec128

#endif // DEC128_DECIMAL128_HPP
