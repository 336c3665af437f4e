/**
 * @file comparator.cpp
 * @brief Total order over decimal128 values.
 */

#include <dec128/comparator.hpp>
#include <dec128/formatter.hpp>

namespace dec128 {

namespace {

/// Rank of the non-finite classes within one sign: finite < Infinity < NaN
int magnitude_rank(const Decimal128& value) noexcept {
    switch (value.classification()) {
    case Classification::Finite:
        return 0;
    case Classification::Infinity:
        return 1;
    case Classification::NaN:
        return 2;
    }
    return 0;
}

static_assert(MAX_SIGNIFICAND_DIGITS + 1 < MAX_UINT128_DIGITS, "padded significands must fit 128 bits");

/**
 * @brief Compare two non-zero magnitudes whose exponents differ.
 *
 * Orders by scientific exponent (digits - 1 + exponent), then by the
 * significands padded to the same digit count. Significands have at most
 * one digit more than a canonical one, so the padded values stay below
 * 10^35 and fit the 128-bit container.
 */
std::strong_ordering compare_unaligned(uint128_t a_significand, int a_exponent,
                                       uint128_t b_significand, int b_exponent) noexcept {
    const auto a_digits = static_cast<int>(count_digits(a_significand));
    const auto b_digits = static_cast<int>(count_digits(b_significand));

    const auto scientific = (a_digits + a_exponent) <=> (b_digits + b_exponent);
    if (scientific != 0) {
        return scientific;
    }

    for (int i = a_digits; i < b_digits; ++i) {
        a_significand *= 10;
    }
    for (int i = b_digits; i < a_digits; ++i) {
        b_significand *= 10;
    }
    return a_significand <=> b_significand;
}

/**
 * @brief Compare |a| and |b| for finite values.
 */
std::strong_ordering compare_magnitude(const Decimal128& a, const Decimal128& b) noexcept {
    uint128_t a_significand = a.significand();
    uint128_t b_significand = b.significand();

    // Zeros are equal at any exponent and below every non-zero value
    if (a_significand == 0 || b_significand == 0) {
        return (a_significand != 0) <=> (b_significand != 0);
    }

    int a_exponent = a.adjusted_exponent();
    int b_exponent = b.adjusted_exponent();

    // 1E+3 and 10E+2 are the same number, so align exponents first.
    // Beyond the window no 34-digit significand can bridge the gap.
    const int distance = (a_exponent > b_exponent) ? a_exponent - b_exponent
                                                   : b_exponent - a_exponent;
    if (distance <= COMPARE_EXPONENT_WINDOW) {
        if (a_exponent < b_exponent) {
            detail::increase_exponent(a_significand, a_exponent, b_exponent);
            detail::decrease_exponent(b_significand, b_exponent, a_exponent);
        } else if (a_exponent > b_exponent) {
            detail::increase_exponent(b_significand, b_exponent, a_exponent);
            detail::decrease_exponent(a_significand, a_exponent, b_exponent);
        }
    }

    if (a_exponent == b_exponent) {
        return a_significand <=> b_significand;
    }

    return compare_unaligned(a_significand, a_exponent, b_significand, b_exponent);
}

} // namespace

namespace detail {

void increase_exponent(uint128_t& significand, int& exponent, int goal) noexcept {
    if (significand == 0) {
        exponent = goal;
        return;
    }

    while (exponent < goal && significand % 10 == 0) {
        significand /= 10;
        ++exponent;
    }
}

void decrease_exponent(uint128_t& significand, int& exponent, int goal) noexcept {
    if (significand == 0) {
        exponent = goal;
        return;
    }

    while (exponent > goal && significand <= MAX_SIGNIFICAND / 10) {
        significand *= 10;
        --exponent;
    }
}

} // namespace detail

std::strong_ordering compare(const Decimal128& a, const Decimal128& b) noexcept {
    if (a.sign() != b.sign()) {
        return a.sign() ? std::strong_ordering::less : std::strong_ordering::greater;
    }

    std::strong_ordering magnitude = std::strong_ordering::equal;
    if (a.is_finite() && b.is_finite()) {
        magnitude = compare_magnitude(a, b);
    } else {
        magnitude = magnitude_rank(a) <=> magnitude_rank(b);
    }

    // Larger magnitude is the smaller value below zero
    return a.sign() ? 0 <=> magnitude : magnitude;
}

} // namespace dec128
