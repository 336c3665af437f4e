/**
 * @file decimal128.cpp
 * @brief Decimal128 member functions.
 */

#include <dec128/comparator.hpp>
#include <dec128/decimal128.hpp>
#include <dec128/formatter.hpp>

#include <ostream>

namespace dec128 {

std::uint64_t Decimal128::high() const noexcept {
    std::uint64_t word = 0;
    for (std::size_t i = 0; i < 8; ++i) {
        word = (word << 8) | bytes_[i];
    }
    return word;
}

std::uint64_t Decimal128::low() const noexcept {
    std::uint64_t word = 0;
    for (std::size_t i = 8; i < NUM_BYTES; ++i) {
        word = (word << 8) | bytes_[i];
    }
    return word;
}

std::string Decimal128::to_string() const {
    return format(*this);
}

std::string Decimal128::to_hex() const {
    return dec128::to_hex(*this);
}

std::strong_ordering Decimal128::operator<=>(const Decimal128& other) const noexcept {
    return compare(*this, other);
}

bool Decimal128::operator==(const Decimal128& other) const noexcept {
    return compare(*this, other) == 0;
}

std::ostream& operator<<(std::ostream& os, const Decimal128& value) {
    char buffer[MAX_STRING_LENGTH];
    const std::size_t length = format_into(value, buffer, sizeof(buffer));
    return os.write(buffer, static_cast<std::streamsize>(length));
}

} // namespace dec128
