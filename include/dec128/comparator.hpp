/**
 * @file comparator.hpp
 * @brief Total order over decimal128 values.
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
 * Orders values as
 *
 *     -NaN < -Infinity < negative finites < -0 < +0 < positive finites < +Infinity < +NaN
 *
 * Zeros of one sign are equal at every exponent, as are members of a
 * cohort (1E+1 and 10).
 */

#ifndef DEC128_COMPARATOR_HPP
#define DEC128_COMPARATOR_HPP

#include <compare>

#include "config.hpp"
#include "decimal128.hpp"

namespace dec128 {

/**
 * @brief Three-way comparison under the total order.
 *
 * The negative value of a pair with different signs sorts first,
 * NaN included. With equal signs NaN lies outside Infinity, which lies
 * outside every finite value. Finite magnitudes are compared after moving
 * both values to a common exponent where the significands allow it.
 *
 * @param a Left operand
 * @param b Right operand
 * @return Ordering of a relative to b
 */
[[nodiscard]] std::strong_ordering compare(const Decimal128& a, const Decimal128& b) noexcept;

namespace detail {

/**
 * @brief Raise exponent towards goal by dividing out trailing zeros.
 *
 * Stops at goal or at the first significand not divisible by 10.
 * A zero significand jumps straight to goal.
 */
void increase_exponent(uint128_t& significand, int& exponent, int goal) noexcept;

/**
 * @brief Lower exponent towards goal by multiplying by 10.
 *
 * Stops at goal or when the next product would exceed 10^34 - 1.
 * A zero significand jumps straight to goal.
 */
void decrease_exponent(uint128_t& significand, int& exponent, int goal) noexcept;

} // namespace detail

} // namespace dec128

#endif // DEC128_COMPARATOR_HPP
