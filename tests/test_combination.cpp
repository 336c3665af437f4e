/**
 * @file test_combination.cpp
 * @brief Unit tests for the combination field table.
 */

#include <catch2/catch_test_macros.hpp>
#include <dec128/combination.hpp>

using namespace dec128;

TEST_CASE("combination_field extraction", "[combination]") {
    REQUIRE(combination_field(0x00) == 0x00);
    REQUIRE(combination_field(0x7C) == 0x1F); // 0 11111 00
    REQUIRE(combination_field(0xFC) == 0x1F); // sign ignored
    REQUIRE(combination_field(0x78) == 0x1E); // 0 11110 00
    REQUIRE(combination_field(0x30) == 0x0C); // 0 01100 00
    REQUIRE(combination_field(0x03) == 0x00); // low bits ignored
}

TEST_CASE("combination table special values", "[combination]") {
    REQUIRE(COMBINATION_TABLE[0x1F].layout == Layout::NaN);
    REQUIRE(COMBINATION_TABLE[0x1E].layout == Layout::Infinity);
    REQUIRE_FALSE(COMBINATION_TABLE[0x1F].is_finite());
    REQUIRE_FALSE(COMBINATION_TABLE[0x1E].is_finite());
}

TEST_CASE("combination table layout A rows", "[combination]") {
    for (std::uint8_t field = 0; field < 0x18; ++field) {
        const auto& entry = COMBINATION_TABLE[field];
        REQUIRE(entry.layout == Layout::FiniteA);
        REQUIRE(entry.exponent_msbs == (field >> 3));
        REQUIRE(entry.exponent_offset == 1);
        REQUIRE(entry.significand_offset == 15);
        REQUIRE(entry.significand_bits == 113);
        REQUIRE(entry.implicit_prefix == 0);
    }
}

TEST_CASE("combination table layout B rows", "[combination]") {
    for (std::uint8_t field = 0x18; field < 0x1E; ++field) {
        const auto& entry = COMBINATION_TABLE[field];
        REQUIRE(entry.layout == Layout::FiniteB);
        REQUIRE(entry.exponent_msbs == ((field >> 1) & 0x3));
        REQUIRE(entry.exponent_offset == 3);
        REQUIRE(entry.significand_offset == 17);
        REQUIRE(entry.significand_bits == 111);
        REQUIRE(entry.implicit_prefix == 0x4); // '100'
    }
}

TEST_CASE("combination_entry from first byte", "[combination]") {
    SECTION("NaN with either sign") {
        REQUIRE(combination_entry(0x7C).layout == Layout::NaN);
        REQUIRE(combination_entry(0xFE).layout == Layout::NaN);
    }

    SECTION("Infinity with either sign") {
        REQUIRE(combination_entry(0x78).layout == Layout::Infinity);
        REQUIRE(combination_entry(0xF9).layout == Layout::Infinity);
    }

    SECTION("finite layouts") {
        REQUIRE(combination_entry(0x30).layout == Layout::FiniteA);
        REQUIRE(combination_entry(0x5F).layout == Layout::FiniteA);
        REQUIRE(combination_entry(0x60).layout == Layout::FiniteB);
        REQUIRE(combination_entry(0x77).layout == Layout::FiniteB);
    }
}

TEST_CASE("combination table is usable at compile time", "[combination]") {
    STATIC_REQUIRE(COMBINATION_TABLE[0x1F].layout == Layout::NaN);
    STATIC_REQUIRE(combination_entry(0x6C).exponent_msbs == 0x1);
}

TEST_CASE("exponent field fits its container", "[combination]") {
    STATIC_REQUIRE(EXPONENT_BITS == 14);
    STATIC_REQUIRE(MAX_EXPONENT == 16383);
    // Neither finite layout can store an exponent with MSBs '11'
    STATIC_REQUIRE(combination_entry(0x5F).exponent_msbs == 0x2);
    STATIC_REQUIRE(combination_entry(0x77).exponent_msbs == 0x2);
}
