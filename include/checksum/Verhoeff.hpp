#pragma once

#include "checksum/ChecksumError.hpp"
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief Verhoeff check digits for decimal identifiers
 *
 * Every operation accepts three input shapes: ASCII digit text, a machine
 * integer, or explicit digit values. A non-empty braced list such as
 * generate({5}) is always taken as digit values, never as an integer; pass
 * std::vector<int>{} for an empty sequence. All operations are pure and may
 * be called from any number of threads at once. Failures are reported by
 * throwing checksum::ChecksumError.
 */
namespace verhoeff {

constexpr size_t AADHAAR_LENGTH = 12;

/**
 * @brief Check digit (0-9) for the given number
 *
 * Empty text yields 0.
 */
uint8_t generate(std::string_view text);
uint8_t generate(int64_t value);
uint8_t generate(const std::vector<int>& digits);
uint8_t generate(std::initializer_list<int> digits);

/**
 * @brief Check digit rendered as a one-character string
 */
std::string generateString(std::string_view text);
std::string generateString(int64_t value);
std::string generateString(const std::vector<int>& digits);
std::string generateString(std::initializer_list<int> digits);

/**
 * @brief Validate a number whose last digit is its check digit
 * @throws checksum::ChecksumError (EMPTY_INPUT) when there are no digits
 */
bool validate(std::string_view text);
bool validate(int64_t value);
bool validate(const std::vector<int>& digits);
bool validate(std::initializer_list<int> digits);

/**
 * @brief Input followed by its check digit
 *
 * Text is kept as written, so leading zeros survive.
 */
std::string append(std::string_view text);
std::string append(int64_t value);
std::vector<int> append(const std::vector<int>& digits);
std::vector<int> append(std::initializer_list<int> digits);

/**
 * @brief Validate an identifier that must be exactly required_length characters
 *
 * The length is checked before the characters.
 * @throws checksum::ChecksumError (WRONG_LENGTH, MALFORMED_INPUT)
 */
bool validateFixedLength(std::string_view text, size_t required_length = AADHAAR_LENGTH);

/**
 * @brief 12-digit Aadhaar number validation
 */
bool validateAadhaar(std::string_view text);

/**
 * @brief Replace the last digit of text with the correct check digit
 * @throws checksum::ChecksumError (EMPTY_INPUT) on empty text
 */
std::string expectedNumber(std::string_view text);

} // namespace verhoeff
