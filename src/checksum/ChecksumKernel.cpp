#include "checksum/ChecksumKernel.hpp"
#include "checksum/ChecksumError.hpp"
#include "checksum/VerhoeffTables.hpp"

namespace verhoeff {
namespace checksum {

uint8_t ChecksumKernel::calculate(const digits::DigitSequence& digits) {
    return tables::INVERSE[fold(digits, GENERATE_OFFSET)];
}

bool ChecksumKernel::validate(const digits::DigitSequence& digits) {
    if (digits.empty()) {
        throw ChecksumError(ErrorKind::EMPTY_INPUT, "empty input");
    }

    return fold(digits, VALIDATE_OFFSET) == 0;
}

uint8_t ChecksumKernel::fold(const digits::DigitSequence& digits, size_t offset) {
    uint8_t c = 0;
    size_t position = offset;

    // Walk from the units digit towards the most significant one
    for (auto it = digits.rbegin(); it != digits.rend(); ++it, ++position) {
        if (*it > 9) {
            throw ChecksumError(ErrorKind::INVALID_DIGIT, "input contains invalid digit");
        }
        const auto& row = tables::PERMUTATION[position % tables::PERMUTATION_PERIOD];
        c = tables::MULTIPLICATION[c][row[*it]];
    }

    return c;
}

} // namespace checksum
} // namespace verhoeff
