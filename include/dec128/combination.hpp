/**
 * @file combination.hpp
 * @brief Combination field layout table.
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
 * The five bits after the sign bit select one of four layouts:
 *
 * | Combination field | Layout    | Exponent bits | Significand bits      |
 * |-------------------|-----------|---------------|-----------------------|
 * | a b c d e         | Finite A  | 1..14         | 15..127 (113 bits)    |
 * | 1 1 c d e         | Finite B  | 3..16         | '100' + 17..127 (111) |
 * | 1 1 1 1 0         | Infinity  | -             | -                     |
 * | 1 1 1 1 1         | NaN       | -             | -                     |
 *
 * The exponent MSBs are 'a b' in layout A and 'c d' in layout B.
 *
 * @see https://ieeexplore.ieee.org/document/4610935 IEEE 754-2008, 3.5.2
 */

#ifndef DEC128_COMBINATION_HPP
#define DEC128_COMBINATION_HPP

#include <array>
#include <limits>

#include "config.hpp"

namespace dec128 {

/**
 * @brief Bit layout selected by the combination field.
 */
enum class Layout : std::uint8_t {
    FiniteA,  ///< Exponent MSBs '00', '01' or '10'
    FiniteB,  ///< Exponent MSBs follow a '11' prefix
    Infinity, ///< '11110'
    NaN       ///< '11111'
};

/**
 * @brief One row of the combination field table.
 *
 * Offsets are bit positions in the 128-bit buffer, 0 being the sign bit.
 * Non-finite rows leave the field offsets at zero.
 */
struct CombinationEntry {
    Layout layout;
    std::uint8_t exponent_msbs;      ///< Two most significant exponent bits
    std::uint8_t exponent_offset;    ///< Position of the first exponent bit
    std::uint8_t significand_offset; ///< Position of the first stored significand bit
    std::uint8_t significand_bits;   ///< Number of stored significand bits
    std::uint8_t implicit_prefix;    ///< Significand bits above the stored ones

    [[nodiscard]] constexpr bool is_finite() const noexcept {
        return layout == Layout::FiniteA || layout == Layout::FiniteB;
    }
};

namespace detail {

constexpr CombinationEntry make_combination_entry(std::uint8_t field) noexcept {
    if (field == 0x1FU) {
        return {Layout::NaN, 0, 0, 0, 0, 0};
    }
    if (field == 0x1EU) {
        return {Layout::Infinity, 0, 0, 0, 0, 0};
    }
    if ((field >> 3) == 0x3U) {
        return {Layout::FiniteB,
                static_cast<std::uint8_t>((field >> 1) & 0x3U),
                3,
                static_cast<std::uint8_t>(3 + EXPONENT_BITS),
                static_cast<std::uint8_t>(SIGNIFICAND_BITS_B),
                0x4U};
    }
    return {Layout::FiniteA,
            static_cast<std::uint8_t>(field >> 3),
            1,
            static_cast<std::uint8_t>(1 + EXPONENT_BITS),
            static_cast<std::uint8_t>(SIGNIFICAND_BITS_A),
            0x0U};
}

constexpr std::array<CombinationEntry, 32> make_combination_table() noexcept {
    std::array<CombinationEntry, 32> table{};
    for (std::size_t i = 0; i < table.size(); ++i) {
        table[i] = make_combination_entry(static_cast<std::uint8_t>(i));
    }
    return table;
}

/// Every finite row must tile the buffer exactly and fit the containers.
constexpr bool combination_table_is_consistent(
    const std::array<CombinationEntry, 32>& table) noexcept {
    for (const auto& entry : table) {
        if (!entry.is_finite()) {
            continue;
        }
        if (entry.exponent_offset + EXPONENT_BITS != entry.significand_offset) {
            return false;
        }
        if (entry.significand_offset + entry.significand_bits != NUM_BITS) {
            return false;
        }
        // Prefix occupies at most 3 bits above the stored significand
        if (entry.significand_bits + 3U > 128U || entry.implicit_prefix > 0x7U) {
            return false;
        }
    }
    return true;
}

} // namespace detail

/// Combination field table, indexed by the 5-bit field value.
inline constexpr std::array<CombinationEntry, 32> COMBINATION_TABLE =
    detail::make_combination_table();

static_assert(detail::combination_table_is_consistent(COMBINATION_TABLE),
              "combination table does not tile the 128-bit layout");
static_assert(EXPONENT_BITS <= static_cast<std::size_t>(std::numeric_limits<std::uint16_t>::digits),
              "exponent must fit its 16-bit container");

/**
 * @brief Extract the combination field from the first buffer byte.
 *
 * @param first_byte Byte 0 of the big-endian buffer
 * @return Field value 0-31
 */
[[nodiscard]] constexpr std::uint8_t combination_field(std::uint8_t first_byte) noexcept {
    return static_cast<std::uint8_t>((first_byte >> 2) & ((1U << COMBINATION_BITS) - 1U));
}

/**
 * @brief Look up the layout row for a first buffer byte.
 */
[[nodiscard]] constexpr const CombinationEntry& combination_entry(std::uint8_t first_byte) noexcept {
    return COMBINATION_TABLE[combination_field(first_byte)];
}

} // namespace dec128

#endif // DEC128_COMBINATION_HPP
