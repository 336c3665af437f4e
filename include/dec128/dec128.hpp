/**
 * @file dec128.hpp
 * @brief High-level decimal128 decoding API.
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
 * Provides decode_records() for bulk data, suitable for file-level
 * operations, and pulls in the whole public API.
 *
 * @see https://ieeexplore.ieee.org/document/4610935 IEEE 754-2008
 */

#ifndef DEC128_HPP
#define DEC128_HPP

#include "bitreader.hpp"
#include "combination.hpp"
#include "comparator.hpp"
#include "config.hpp"
#include "decimal128.hpp"
#include "decoder.hpp"
#include "error.hpp"
#include "formatter.hpp"

namespace dec128 {

/**
 * @brief Decode a stream of consecutive 16-byte records.
 *
 * @param input_data Input bytes
 * @param input_size Input size in bytes (must be a non-zero multiple of 16)
 * @param output Array receiving the decoded values
 * @param output_capacity Number of elements in output
 * @param[out] count Number of records decoded
 * @return Error::Ok on success, Error::InvalidArg for a bad input size or
 *         null pointer, Error::Overflow if output is too small
 */
inline Error decode_records(const std::uint8_t* input_data, std::size_t input_size,
                            Decimal128* output, std::size_t output_capacity,
                            std::size_t& count) noexcept {
    if (input_data == nullptr || output == nullptr) {
        return Error::InvalidArg;
    }

    // Verify input is a whole number of records
    if (input_size == 0 || (input_size % NUM_BYTES) != 0) {
        return Error::InvalidArg;
    }

    std::size_t num_records = input_size / NUM_BYTES;
    if (num_records > output_capacity) {
        return Error::Overflow;
    }

    for (std::size_t i = 0; i < num_records; ++i) {
        auto result = decode(&input_data[i * NUM_BYTES], NUM_BYTES, output[i]);
        if (result != Error::Ok) {
            return result;
        }
    }

    count = num_records;
    return Error::Ok;
}

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace dec128

#endif // DEC128_HPP
