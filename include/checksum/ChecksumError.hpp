#pragma once

#include <stdexcept>
#include <string>

namespace verhoeff {
namespace checksum {

/**
 * @brief Caller-input failures reported by the checksum operations
 */
enum class ErrorKind {
    MALFORMED_INPUT,    // Text contains a non-digit character
    INVALID_DIGIT,      // Supplied digit value outside [0, 9]
    EMPTY_INPUT,        // Nothing to validate
    WRONG_LENGTH        // Fixed-length identifier has the wrong size
};

const char* toString(ErrorKind kind);

class ChecksumError : public std::invalid_argument {
public:
    ChecksumError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace checksum
} // namespace verhoeff
