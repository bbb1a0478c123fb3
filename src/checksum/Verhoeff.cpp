#include "checksum/Verhoeff.hpp"
#include "checksum/ChecksumKernel.hpp"
#include "digits/DigitSequence.hpp"
#include "utils/Logger.hpp"

namespace verhoeff {

using checksum::ChecksumError;
using checksum::ChecksumKernel;
using checksum::ErrorKind;

uint8_t generate(std::string_view text) {
    return ChecksumKernel::calculate(digits::fromText(text));
}

uint8_t generate(int64_t value) {
    return ChecksumKernel::calculate(digits::fromInteger(value));
}

uint8_t generate(const std::vector<int>& digits) {
    return ChecksumKernel::calculate(digits::fromSequence(digits));
}

uint8_t generate(std::initializer_list<int> digits) {
    return generate(std::vector<int>(digits));
}

std::string generateString(std::string_view text) {
    return std::to_string(generate(text));
}

std::string generateString(int64_t value) {
    return std::to_string(generate(value));
}

std::string generateString(const std::vector<int>& digits) {
    return std::to_string(generate(digits));
}

std::string generateString(std::initializer_list<int> digits) {
    return generateString(std::vector<int>(digits));
}

bool validate(std::string_view text) {
    return ChecksumKernel::validate(digits::fromText(text));
}

bool validate(int64_t value) {
    return ChecksumKernel::validate(digits::fromInteger(value));
}

bool validate(const std::vector<int>& digits) {
    return ChecksumKernel::validate(digits::fromSequence(digits));
}

bool validate(std::initializer_list<int> digits) {
    return validate(std::vector<int>(digits));
}

std::string append(std::string_view text) {
    uint8_t check = generate(text);

    std::string result(text);
    result.push_back(static_cast<char>('0' + check));
    return result;
}

std::string append(int64_t value) {
    // Sign stays in the text; the digit covers the magnitude
    return std::to_string(value) + std::to_string(generate(value));
}

std::vector<int> append(const std::vector<int>& digits) {
    uint8_t check = generate(digits);

    std::vector<int> result(digits);
    result.push_back(check);
    return result;
}

std::vector<int> append(std::initializer_list<int> digits) {
    return append(std::vector<int>(digits));
}

bool validateFixedLength(std::string_view text, size_t required_length) {
    if (text.size() != required_length) {
        LOG_DEBUG("Verhoeff: Expected ", required_length, " characters, got ", text.size());
        throw ChecksumError(ErrorKind::WRONG_LENGTH,
                            "identifier must be " + std::to_string(required_length) +
                            " digits in length");
    }

    return validate(text);
}

bool validateAadhaar(std::string_view text) {
    return validateFixedLength(text, AADHAAR_LENGTH);
}

std::string expectedNumber(std::string_view text) {
    auto full = digits::fromText(text);
    if (full.empty()) {
        throw ChecksumError(ErrorKind::EMPTY_INPUT, "empty input");
    }

    full.pop_back();
    full.push_back(ChecksumKernel::calculate(full));
    return digits::toString(full);
}

} // namespace verhoeff
