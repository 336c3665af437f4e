/**
 * @file decoder.cpp
 * @brief decimal128 field extraction.
 */

#include <dec128/bitreader.hpp>
#include <dec128/combination.hpp>
#include <dec128/decoder.hpp>

#include <cstring>

namespace dec128 {

Decimal128 decode(const Decimal128::Bytes& buffer) noexcept {
    BitReader reader(buffer.data(), NUM_BITS);
    const bool sign = reader.read_bit() == 1;
    const CombinationEntry& entry = combination_entry(buffer[0]);

    switch (entry.layout) {
    case Layout::NaN:
        return Decimal128(sign, Classification::NaN, 0, 0, buffer);
    case Layout::Infinity:
        return Decimal128(sign, Classification::Infinity, 0, 0, buffer);
    case Layout::FiniteA:
    case Layout::FiniteB:
        break;
    }

    reader.skip(entry.exponent_offset - reader.position());

    const auto exponent = static_cast<std::uint16_t>(reader.read_bits(EXPONENT_BITS));

    // Stored bits, then the implicit '100' of layout B above them
    uint128_t significand = reader.read_wide(entry.significand_bits);
    significand |= static_cast<uint128_t>(entry.implicit_prefix) << entry.significand_bits;

    return Decimal128(sign, Classification::Finite, exponent, significand, buffer);
}

Error decode(const std::uint8_t* data, std::size_t size, Decimal128& out) noexcept {
    if (data == nullptr || size != NUM_BYTES) {
        return Error::InvalidArg;
    }

    Decimal128::Bytes buffer;
    std::memcpy(buffer.data(), data, NUM_BYTES);
    out = decode(buffer);
    return Error::Ok;
}

#if !DEC128_NO_EXCEPTIONS

Decimal128 decode(const std::uint8_t* data, std::size_t size) {
    Decimal128 value;
    if (decode(data, size, value) != Error::Ok) {
        throw InvalidArgumentException("decimal128 buffer must be exactly 16 bytes, got " +
                                       std::to_string(size));
    }
    return value;
}

#endif // !DEC128_NO_EXCEPTIONS

} // namespace dec128
