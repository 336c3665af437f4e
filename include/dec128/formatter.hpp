/**
 * @file formatter.hpp
 * @brief decimal128 to-string conversion.
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
 * Implements the to-scientific-string conversion of the General Decimal
 * Arithmetic specification:
 * - Scientific notation when the exponent is positive or the adjusted
 *   (scientific) exponent is below -6
 * - Plain notation with an inserted decimal point otherwise
 * - "NaN" without sign, "Infinity" / "-Infinity"
 *
 * @see https://speleotrove.com/decimal/daconvs.html
 */

#ifndef DEC128_FORMATTER_HPP
#define DEC128_FORMATTER_HPP

#include <string>

#include "config.hpp"
#include "decimal128.hpp"

namespace dec128 {

/// Digits needed for any 128-bit unsigned value
inline constexpr std::size_t MAX_UINT128_DIGITS = 39U;

/**
 * @brief Write the decimal digits of a 128-bit value, most significant first.
 *
 * Zero is written as a single '0'. No terminator is written.
 *
 * @param value Value to convert
 * @param[out] out Destination with room for MAX_UINT128_DIGITS characters
 * @return Number of digits written
 */
std::size_t to_digits(uint128_t value, char* out) noexcept;

/**
 * @brief Count decimal digits of a 128-bit value (1 for zero).
 */
[[nodiscard]] std::size_t count_digits(uint128_t value) noexcept;

/**
 * @brief Render a value into a caller buffer without allocating.
 *
 * @param value Value to render
 * @param[out] out Destination, not null-terminated
 * @param capacity Size of out; MAX_STRING_LENGTH always suffices
 * @return Characters written, or 0 (nothing written) if capacity is too small
 */
std::size_t format_into(const Decimal128& value, char* out, std::size_t capacity) noexcept;

/**
 * @brief Canonical decimal string of a value.
 *
 * Examples: "0.001234", "123456789012", "1E-6176", "-Infinity", "NaN".
 */
[[nodiscard]] std::string format(const Decimal128& value);

/**
 * @brief Lowercase hex of the raw bytes, least significant byte first.
 *
 * @return HEX_STRING_LENGTH characters
 */
[[nodiscard]] std::string to_hex(const Decimal128& value);

} // namespace dec128

#endif // DEC128_FORMATTER_HPP
