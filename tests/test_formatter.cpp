/**
 * @file test_formatter.cpp
 * @brief Unit tests for decimal128 to-string conversion.
 */

#include <dec128/decoder.hpp>
#include <dec128/formatter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>

using namespace dec128;

static Decimal128 from_words(std::uint64_t high, std::uint64_t low) {
    Decimal128::Bytes bytes{};
    for (std::size_t i = 0; i < 8; ++i) {
        bytes[i] = static_cast<std::uint8_t>(high >> (56 - 8 * i));
        bytes[8 + i] = static_cast<std::uint8_t>(low >> (56 - 8 * i));
    }
    return decode(bytes);
}

/// Finite value with a 64-bit significand and an unbiased exponent.
static Decimal128 finite(bool negative, int exponent, std::uint64_t significand) {
    std::uint64_t high = static_cast<std::uint64_t>(exponent + EXPONENT_BIAS) << 49;
    if (negative) {
        high |= 0x8000000000000000ULL;
    }
    return from_words(high, significand);
}

TEST_CASE("to_digits", "[formatter]") {
    char digits[MAX_UINT128_DIGITS];

    SECTION("zero") {
        REQUIRE(to_digits(0, digits) == 1);
        REQUIRE(digits[0] == '0');
    }

    SECTION("small") {
        std::size_t n = to_digits(1234, digits);
        REQUIRE(std::string(digits, n) == "1234");
    }

    SECTION("largest 128-bit value") {
        uint128_t max = ~static_cast<uint128_t>(0);
        std::size_t n = to_digits(max, digits);
        REQUIRE(n == 39);
        REQUIRE(std::string(digits, n) == "340282366920938463463374607431768211455");
    }
}

TEST_CASE("count_digits", "[formatter]") {
    REQUIRE(count_digits(0) == 1);
    REQUIRE(count_digits(9) == 1);
    REQUIRE(count_digits(10) == 2);
    REQUIRE(count_digits(123456789012ULL) == 12);
    REQUIRE(count_digits(MAX_SIGNIFICAND) == MAX_SIGNIFICAND_DIGITS);
    REQUIRE(count_digits(MAX_SIGNIFICAND + 1) == MAX_SIGNIFICAND_DIGITS + 1);
}

TEST_CASE("format special values", "[formatter]") {
    REQUIRE(format(from_words(0x7C00000000000000ULL, 0)) == "NaN");
    REQUIRE(format(from_words(0xFC00000000000000ULL, 0)) == "NaN");
    REQUIRE(format(from_words(0x7E00000000000000ULL, 1)) == "NaN");
    REQUIRE(format(from_words(0x7800000000000000ULL, 0)) == "Infinity");
    REQUIRE(format(from_words(0xF800000000000000ULL, 0)) == "-Infinity");
}

TEST_CASE("format plain integers", "[formatter]") {
    REQUIRE(format(finite(false, 0, 0)) == "0");
    REQUIRE(format(finite(true, 0, 0)) == "-0");
    REQUIRE(format(finite(false, 0, 10)) == "10");
    REQUIRE(format(finite(false, 0, 123456789012ULL)) == "123456789012");
    REQUIRE(format(finite(true, 0, 42)) == "-42");
}

TEST_CASE("format decimal point inside the digits", "[formatter]") {
    REQUIRE(format(finite(false, -1, 12)) == "1.2");
    REQUIRE(format(finite(true, -1, 12)) == "-1.2");
    REQUIRE(format(finite(false, -2, 12345)) == "123.45");
    REQUIRE(format(finite(false, -3, 1000)) == "1.000");
}

TEST_CASE("format zero padded fractions", "[formatter]") {
    REQUIRE(format(finite(false, -6, 1234)) == "0.001234");
    REQUIRE(format(finite(false, -4, 123)) == "0.0123");
    REQUIRE(format(finite(false, -2, 12)) == "0.12");
    REQUIRE(format(finite(false, -6, 1)) == "0.000001");
    REQUIRE(format(finite(false, -2, 0)) == "0.00");
    REQUIRE(format(finite(false, -6, 0)) == "0.000000");
    REQUIRE(format(finite(true, -6, 1234)) == "-0.001234");
}

TEST_CASE("format scientific notation", "[formatter]") {
    SECTION("positive exponent") {
        REQUIRE(format(finite(false, 1, 1)) == "1E+1");
        REQUIRE(format(finite(false, 1, 12)) == "1.2E+2");
        REQUIRE(format(finite(false, 3, 0)) == "0E+3");
        REQUIRE(format(finite(true, 2, 123)) == "-1.23E+4");
    }

    SECTION("scientific exponent below -6") {
        REQUIRE(format(finite(false, -7, 1)) == "1E-7");
        REQUIRE(format(finite(false, -8, 1)) == "1E-8");
        REQUIRE(format(finite(false, -8, 12)) == "1.2E-7");
        REQUIRE(format(finite(false, -7, 0)) == "0E-7");
        REQUIRE(format(finite(true, -10, 5)) == "-5E-10");
    }

    SECTION("smallest exponent") {
        REQUIRE(format(from_words(0, 1)) == "1E-6176");
        REQUIRE(format(from_words(0, 0)) == "0E-6176");
        REQUIRE(format(from_words(0x8000000000000000ULL, 0)) == "-0E-6176");
    }
}

TEST_CASE("format non-canonical significand", "[formatter]") {
    // Layout B: 2^113 at exponent 0
    REQUIRE(format(from_words(0x6000000000000000ULL, 0)) ==
            "1.0384593717069655257060992658440192E-6142");
    REQUIRE(format(from_words(0x6C01800000000000ULL, 5)) ==
            "103845.93717069655257060992658440197");
}

TEST_CASE("format_into", "[formatter]") {
    char buffer[MAX_STRING_LENGTH];

    SECTION("writes without terminator") {
        std::size_t n = format_into(finite(false, -6, 1234), buffer, sizeof(buffer));
        REQUIRE(std::string(buffer, n) == "0.001234");
    }

    SECTION("too small writes nothing") {
        buffer[0] = 'x';
        REQUIRE(format_into(finite(false, -6, 1234), buffer, 7) == 0);
        REQUIRE(buffer[0] == 'x');
        REQUIRE(format_into(finite(false, -6, 1234), buffer, 8) == 8);
    }

    SECTION("longest output fits MAX_STRING_LENGTH") {
        auto value = from_words(0xF7FFFFFFFFFFFFFFULL, 0xFFFFFFFFFFFFFFFFULL);
        std::size_t n = format_into(value, buffer, sizeof(buffer));
        REQUIRE(n > 0);
        REQUIRE(std::string(buffer, n) == "-1.2980742146337069071326240823050239E+6145");
        // Sign, 35 digits, point, 'E', exponent sign and 4 exponent digits
        REQUIRE(n == 1 + (MAX_SIGNIFICAND_DIGITS + 1) + 1 + 2 + 4);
    }
}

TEST_CASE("to_hex reverses byte order", "[formatter]") {
    auto value = from_words(0x3034000000000000ULL, 0x04D2);
    REQUIRE(to_hex(value) == "d2040000000000000000000000003430");
    REQUIRE(to_hex(value).size() == HEX_STRING_LENGTH);
    REQUIRE(value.to_hex() == to_hex(value));

    REQUIRE(to_hex(from_words(0x7C00000000000000ULL, 0)) == "0000000000000000000000000000007c");
}

TEST_CASE("Decimal128 to_string and stream output", "[formatter]") {
    auto value = from_words(0x3040000000000000ULL, 0x0000001CBE991A14ULL);
    REQUIRE(value.to_string() == "123456789012");

    std::ostringstream os;
    os << value << ' ' << from_words(0xF800000000000000ULL, 0);
    REQUIRE(os.str() == "123456789012 -Infinity");
}
