/**
 * @file error.hpp
 * @brief dec128 error handling.
 *
 * Provides both exception-based and error-code-based error handling
 * for embedded compatibility (-fno-exceptions).
 */

#ifndef DEC128_ERROR_HPP
#define DEC128_ERROR_HPP

#include "config.hpp"

#if !DEC128_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace dec128 {

/**
 * @brief Error codes for error-code-based error handling.
 *
 * Decoding a 16-byte buffer cannot fail; these codes only report
 * precondition violations by the caller.
 */
enum class Error {
    Ok = 0,          ///< Success
    InvalidArg = -1, ///< Buffer is not exactly 16 bytes, or null
    Overflow = -2    ///< Output array too small
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::InvalidArg:
        return "Invalid argument";
    case Error::Overflow:
        return "Output buffer overflow";
    default:
        return "Unknown error";
    }
}

#if !DEC128_NO_EXCEPTIONS

/**
 * @brief Base exception for dec128 errors.
 */
class Dec128Exception : public std::runtime_error {
public:
    explicit Dec128Exception(const std::string& message, Error code = Error::InvalidArg)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for a buffer that is not a decimal128 interchange value.
 */
class InvalidArgumentException : public Dec128Exception {
public:
    explicit InvalidArgumentException(const std::string& message)
        : Dec128Exception(message, Error::InvalidArg) {}
};

#endif // !DEC128_NO_EXCEPTIONS

} // namespace dec128

#endif // DEC128_ERROR_HPP
