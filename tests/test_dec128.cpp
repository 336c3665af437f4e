/**
 * @file test_dec128.cpp
 * @brief Tests for the top-level record API.
 */

#include <dec128/dec128.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace dec128;

TEST_CASE("decode_records decodes consecutive records", "[dec128]") {
    std::vector<std::uint8_t> input(3 * NUM_BYTES, 0);
    input[0] = 0x78;                          // Infinity
    input[NUM_BYTES] = 0x30;                  // 5, exponent 0
    input[NUM_BYTES + 1] = 0x40;
    input[2 * NUM_BYTES - 1] = 0x05;
    input[2 * NUM_BYTES] = 0xFC;              // NaN, sign set
    std::vector<Decimal128> output(3);
    std::size_t count = 0;

    REQUIRE(decode_records(input.data(), input.size(), output.data(), output.size(), count) ==
            Error::Ok);
    REQUIRE(count == 3);
    REQUIRE(output[0].is_infinite());
    REQUIRE(output[1].to_string() == "5");
    REQUIRE(output[2].is_nan());
    REQUIRE(output[2].is_negative());
}

TEST_CASE("decode_records rejects bad input", "[dec128]") {
    std::uint8_t input[2 * NUM_BYTES + 1] = {};
    Decimal128 output[4];
    std::size_t count = 42;

    SECTION("empty input") {
        REQUIRE(decode_records(input, 0, output, 4, count) == Error::InvalidArg);
        REQUIRE(count == 42);
    }

    SECTION("partial record") {
        REQUIRE(decode_records(input, NUM_BYTES + 1, output, 4, count) == Error::InvalidArg);
        REQUIRE(decode_records(input, 2 * NUM_BYTES + 1, output, 4, count) == Error::InvalidArg);
        REQUIRE(count == 42);
    }

    SECTION("null pointers") {
        REQUIRE(decode_records(nullptr, NUM_BYTES, output, 4, count) == Error::InvalidArg);
        REQUIRE(decode_records(input, NUM_BYTES, nullptr, 4, count) == Error::InvalidArg);
    }

    SECTION("output too small") {
        REQUIRE(decode_records(input, 2 * NUM_BYTES, output, 1, count) == Error::Overflow);
        REQUIRE(count == 42);
    }

    SECTION("exact capacity") {
        REQUIRE(decode_records(input, 2 * NUM_BYTES, output, 2, count) == Error::Ok);
        REQUIRE(count == 2);
        REQUIRE(output[1].is_zero());
    }
}

TEST_CASE("error_string", "[dec128]") {
    REQUIRE(std::string(error_string(Error::Ok)) == "Success");
    REQUIRE(std::string(error_string(Error::InvalidArg)) == "Invalid argument");
    REQUIRE(std::string(error_string(Error::Overflow)) == "Output buffer overflow");
}

#if !DEC128_NO_EXCEPTIONS
TEST_CASE("Dec128Exception carries its code", "[dec128]") {
    InvalidArgumentException e("bad buffer");
    REQUIRE(e.code() == Error::InvalidArg);
    REQUIRE(std::string(e.what()) == "bad buffer");

    const Dec128Exception& base = e;
    REQUIRE(base.code() == Error::InvalidArg);
}
#endif // !DEC128_NO_EXCEPTIONS

TEST_CASE("version", "[dec128]") {
    std::string expected = std::to_string(VERSION_MAJOR) + "." + std::to_string(VERSION_MINOR) +
                           "." + std::to_string(VERSION_PATCH);
    REQUIRE(std::string(version()) == expected);
}
