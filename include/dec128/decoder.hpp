/**
 * @file decoder.hpp
 * @brief decimal128 field extraction.
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
 * Decodes a 16-byte big-endian buffer into sign, classification,
 * biased exponent and binary integer significand. Every 16-byte input
 * decodes; only a buffer of the wrong size is rejected.
 *
 * @see https://ieeexplore.ieee.org/document/4610935 IEEE 754-2008, 3.5.2
 */

#ifndef DEC128_DECODER_HPP
#define DEC128_DECODER_HPP

#include "config.hpp"
#include "decimal128.hpp"
#include "error.hpp"

namespace dec128 {

/**
 * @brief Decode a decimal128 interchange value.
 *
 * The combination field selects the layout from COMBINATION_TABLE; the
 * exponent (14 bits) and significand (113 bits, or '100' followed by 111
 * bits) are then read MSB-first. NaN and Infinity keep exponent and
 * significand at zero.
 *
 * @param buffer Big-endian interchange bytes
 * @return Decoded value
 */
Decimal128 decode(const Decimal128::Bytes& buffer) noexcept;

/**
 * @brief Decode from a pointer and length.
 *
 * @param data Source bytes
 * @param size Number of bytes, must be 16
 * @param[out] out Decoded value, untouched on error
 * @return Error::Ok on success, Error::InvalidArg if data is null or size != 16
 */
Error decode(const std::uint8_t* data, std::size_t size, Decimal128& out) noexcept;

#if !DEC128_NO_EXCEPTIONS

/**
 * @brief Decode from a pointer and length.
 *
 * @throws InvalidArgumentException if data is null or size != 16
 */
Decimal128 decode(const std::uint8_t* data, std::size_t size);

#endif // !DEC128_NO_EXCEPTIONS

} // namespace dec128

#endif // DEC128_DECODER_HPP
