#include "checksum/ChecksumError.hpp"

namespace verhoeff {
namespace checksum {

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MALFORMED_INPUT: return "MalformedInput";
        case ErrorKind::INVALID_DIGIT:   return "InvalidDigit";
        case ErrorKind::EMPTY_INPUT:     return "EmptyInput";
        case ErrorKind::WRONG_LENGTH:    return "WrongLength";
        default: return "Unknown";
    }
}

ChecksumError::ChecksumError(ErrorKind kind, const std::string& message)
    : std::invalid_argument(message)
    , kind_(kind) {
}

} // namespace checksum
} // namespace verhoeff
