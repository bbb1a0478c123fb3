#pragma once

#include "digits/DigitSequence.hpp"
#include <cstddef>
#include <cstdint>

namespace verhoeff {
namespace checksum {


class ChecksumKernel {
public:
    /**
     * @brief Calculate the Verhoeff check digit for a digit sequence
     *
     * An empty sequence yields 0.
     */
    static uint8_t calculate(const digits::DigitSequence& digits);

    /**
     * @brief Validate a sequence whose last digit is the check digit
     * @throws ChecksumError (EMPTY_INPUT) if the sequence is empty
     */
    static bool validate(const digits::DigitSequence& digits);

private:
    // Check digit takes position 0 when generating, so the body shifts by one
    static constexpr size_t GENERATE_OFFSET = 1;
    static constexpr size_t VALIDATE_OFFSET = 0;

    static uint8_t fold(const digits::DigitSequence& digits, size_t offset);
};

} // namespace checksum
} // namespace verhoeff
