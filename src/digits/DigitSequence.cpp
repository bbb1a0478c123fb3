#include "digits/DigitSequence.hpp"
#include "checksum/ChecksumError.hpp"
#include "utils/Logger.hpp"
#include <algorithm>

namespace verhoeff {
namespace digits {

using checksum::ChecksumError;
using checksum::ErrorKind;

DigitSequence fromText(std::string_view text) {
    DigitSequence digits;
    digits.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i) {
        char ch = text[i];
        if (ch < '0' || ch > '9') {
            LOG_DEBUG("DigitSequence: Non-digit character at offset ", i);
            throw ChecksumError(ErrorKind::MALFORMED_INPUT,
                                "input contains non-digit characters");
        }
        digits.push_back(static_cast<uint8_t>(ch - '0'));
    }

    return digits;
}

DigitSequence fromInteger(int64_t value) {
    // Magnitude in unsigned arithmetic so INT64_MIN does not overflow
    uint64_t magnitude = value < 0
        ? static_cast<uint64_t>(0) - static_cast<uint64_t>(value)
        : static_cast<uint64_t>(value);

    if (magnitude == 0) {
        return DigitSequence{0};
    }

    DigitSequence digits;
    while (magnitude > 0) {
        digits.push_back(static_cast<uint8_t>(magnitude % 10));
        magnitude /= 10;
    }
    std::reverse(digits.begin(), digits.end());

    return digits;
}

DigitSequence fromSequence(const std::vector<int>& values) {
    DigitSequence digits;
    digits.reserve(values.size());

    for (size_t i = 0; i < values.size(); ++i) {
        int value = values[i];
        if (value < 0 || value > 9) {
            LOG_DEBUG("DigitSequence: Value ", value, " out of range at index ", i);
            throw ChecksumError(ErrorKind::INVALID_DIGIT,
                                "input contains invalid digit");
        }
        digits.push_back(static_cast<uint8_t>(value));
    }

    return digits;
}

DigitSequence reversed(const DigitSequence& digits) {
    return DigitSequence(digits.rbegin(), digits.rend());
}

std::string toString(const DigitSequence& digits) {
    std::string text;
    text.reserve(digits.size());
    for (uint8_t digit : digits) {
        text.push_back(static_cast<char>('0' + digit));
    }
    return text;
}

} // namespace digits
} // namespace verhoeff
