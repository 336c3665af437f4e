/**
 * @file config.hpp
 * @brief dec128 compile-time configuration.
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
 * IEEE 754-2008 decimal128 interchange format, binary integer significand.
 *
 * @see https://ieeexplore.ieee.org/document/4610935 IEEE 754-2008
 * @see https://speleotrove.com/decimal/daconvs.html Decimal string conversion
 */

#ifndef DEC128_CONFIG_HPP
#define DEC128_CONFIG_HPP

#include <cstdint>
#include <cstddef>

namespace dec128 {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Format Constants
 * @{
 */

/// Size of one interchange value in bytes
inline constexpr std::size_t NUM_BYTES = 16U;
inline constexpr std::size_t NUM_BITS = NUM_BYTES * 8U;

/// Combination field: the 5 bits following the sign bit
inline constexpr std::size_t COMBINATION_BITS = 5U;

/// Biased exponent width and range
inline constexpr std::size_t EXPONENT_BITS = 14U;
inline constexpr std::uint16_t MAX_EXPONENT = (1U << EXPONENT_BITS) - 1U;
inline constexpr int EXPONENT_BIAS = 6176;

/// Significand widths for the two finite layouts (trailing bits read from the buffer)
inline constexpr std::size_t SIGNIFICAND_BITS_A = 113U;
inline constexpr std::size_t SIGNIFICAND_BITS_B = 111U;

/// Largest canonical significand has 34 decimal digits
inline constexpr std::size_t MAX_SIGNIFICAND_DIGITS = 34U;

/// Exponent distance within which compare() tries to align two values
inline constexpr int COMPARE_EXPONENT_WINDOW = 66;

/// Longest string format() can produce, without terminator
inline constexpr std::size_t MAX_STRING_LENGTH = 44U;

/// Length of the hex rendering (two characters per byte)
inline constexpr std::size_t HEX_STRING_LENGTH = NUM_BYTES * 2U;

/// 128-bit container for the significand
using uint128_t = unsigned __int128;

/// 10^34 - 1
inline constexpr uint128_t MAX_SIGNIFICAND =
    static_cast<uint128_t>(9999999999999999ULL) * 1000000000000000000ULL + 999999999999999999ULL;

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define DEC128_NO_EXCEPTIONS=1 to disable exceptions for embedded use.
 * @{
 */
#ifndef DEC128_NO_EXCEPTIONS
#define DEC128_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace dec128

#endif // DEC128_CONFIG_HPP
