/**
 * @file formatter.cpp
 * @brief decimal128 to-string conversion.
 */

#include <dec128/formatter.hpp>

#include <cstring>

namespace dec128 {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

// Sign, one digit past the canonical limit, point, 'E', exponent sign, 4 exponent digits
static_assert(MAX_STRING_LENGTH >= 1 + (MAX_SIGNIFICAND_DIGITS + 1) + 1 + 2 + 4,
              "MAX_STRING_LENGTH cannot hold the longest scientific form");
static_assert(MAX_UINT128_DIGITS > MAX_SIGNIFICAND_DIGITS, "digit buffer too small");

std::size_t append(char* out, std::size_t pos, const char* text, std::size_t length) noexcept {
    std::memcpy(&out[pos], text, length);
    return pos + length;
}

std::size_t append_zeros(char* out, std::size_t pos, std::size_t count) noexcept {
    std::memset(&out[pos], '0', count);
    return pos + count;
}

/**
 * @brief Lay out a finite value's digits.
 *
 * out must hold MAX_STRING_LENGTH characters.
 */
std::size_t format_finite(const Decimal128& value, char* out) noexcept {
    char digits[MAX_UINT128_DIGITS];
    const std::size_t n = to_digits(value.significand(), digits);
    const int exponent = value.adjusted_exponent();
    const int scientific_exponent = static_cast<int>(n) - 1 + exponent;

    std::size_t pos = 0;
    if (value.is_negative()) {
        out[pos++] = '-';
    }

    if (exponent > 0 || scientific_exponent < -6) {
        out[pos++] = digits[0];
        if (n > 1) {
            out[pos++] = '.';
            pos = append(out, pos, &digits[1], n - 1);
        }

        out[pos++] = 'E';
        out[pos++] = (exponent < 0) ? '-' : '+';

        char exponent_digits[MAX_UINT128_DIGITS];
        const int magnitude = (scientific_exponent < 0) ? -scientific_exponent
                                                        : scientific_exponent;
        const std::size_t exponent_length =
            to_digits(static_cast<uint128_t>(magnitude), exponent_digits);
        return append(out, pos, exponent_digits, exponent_length);
    }

    if (exponent < 0) {
        const auto fraction_digits = static_cast<std::size_t>(-exponent);
        if (n > fraction_digits) {
            const std::size_t point = n - fraction_digits;
            pos = append(out, pos, digits, point);
            out[pos++] = '.';
            return append(out, pos, &digits[point], fraction_digits);
        }

        out[pos++] = '0';
        out[pos++] = '.';
        pos = append_zeros(out, pos, fraction_digits - n);
        return append(out, pos, digits, n);
    }

    return append(out, pos, digits, n);
}

} // namespace

std::size_t to_digits(uint128_t value, char* out) noexcept {
    char reversed[MAX_UINT128_DIGITS];
    std::size_t n = 0;
    do {
        reversed[n++] = static_cast<char>('0' + static_cast<int>(value % 10));
        value /= 10;
    } while (value != 0);

    for (std::size_t i = 0; i < n; ++i) {
        out[i] = reversed[n - 1 - i];
    }
    return n;
}

std::size_t count_digits(uint128_t value) noexcept {
    std::size_t n = 1;
    while (value >= 10) {
        value /= 10;
        ++n;
    }
    return n;
}

std::size_t format_into(const Decimal128& value, char* out, std::size_t capacity) noexcept {
    char buffer[MAX_STRING_LENGTH];
    std::size_t length = 0;

    switch (value.classification()) {
    case Classification::NaN:
        length = append(buffer, 0, "NaN", 3);
        break;
    case Classification::Infinity:
        length = value.is_negative() ? append(buffer, 0, "-Infinity", 9)
                                     : append(buffer, 0, "Infinity", 8);
        break;
    case Classification::Finite:
        length = format_finite(value, buffer);
        break;
    }

    if (out == nullptr || length > capacity) {
        return 0;
    }
    std::memcpy(out, buffer, length);
    return length;
}

std::string format(const Decimal128& value) {
    char buffer[MAX_STRING_LENGTH];
    const std::size_t length = format_into(value, buffer, sizeof(buffer));
    return std::string(buffer, length);
}

std::string to_hex(const Decimal128& value) {
    const auto& bytes = value.to_raw_bytes();
    std::string hex;
    hex.reserve(HEX_STRING_LENGTH);
    for (auto it = bytes.rbegin(); it != bytes.rend(); ++it) {
        hex.push_back(HEX_DIGITS[*it >> 4]);
        hex.push_back(HEX_DIGITS[*it & 0x0FU]);
    }
    return hex;
}

} // namespace dec128
