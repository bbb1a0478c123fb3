#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace verhoeff {
namespace digits {

/**
 * @brief Decimal digits, most significant first, each in [0, 9]
 */
using DigitSequence = std::vector<uint8_t>;

/**
 * @brief Parse ASCII decimal text
 *
 * Empty text yields an empty sequence.
 * @throws checksum::ChecksumError (MALFORMED_INPUT) on any non-digit character
 */
DigitSequence fromText(std::string_view text);

/**
 * @brief Decompose an integer into its decimal digits
 *
 * Zero yields {0}. The sign of a negative value is dropped.
 */
DigitSequence fromInteger(int64_t value);

/**
 * @brief Check caller-supplied digit values
 * @throws checksum::ChecksumError (INVALID_DIGIT) on a value outside [0, 9]
 */
DigitSequence fromSequence(const std::vector<int>& values);

/**
 * @brief Copy of the sequence with the least significant digit first
 */
DigitSequence reversed(const DigitSequence& digits);

/**
 * @brief Render digits as ASCII text
 */
std::string toString(const DigitSequence& digits);

} // namespace digits
} // namespace verhoeff
