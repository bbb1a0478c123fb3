#include "checksum/Verhoeff.hpp"
#include "digits/DigitSequence.hpp"
#include "utils/Logger.hpp"
#include <iostream>
#include <string>
#include <vector>

using namespace verhoeff;

int main() {
    utils::Logger::getInstance().setLevel(utils::LogLevel::WARN);

    std::cout << "=== Generating Checksum ===" << std::endl;
    std::string number = "12345";
    int check = generate(number);
    std::cout << "Checksum for " << number << ": " << check << std::endl;
    std::cout << "Complete number: " << number << check << std::endl;
    std::cout << std::endl;

    std::cout << "=== Validating Numbers ===" << std::endl;
    for (const char* candidate : {"123451", "123450"}) {
        std::cout << candidate << " is valid: " << (validate(candidate) ? "true" : "false")
                  << std::endl;
    }
    std::cout << std::endl;

    std::cout << "=== Appending Checksum ===" << std::endl;
    std::string original = "987654";
    std::cout << "Original:      " << original << std::endl;
    std::cout << "With checksum: " << append(original) << std::endl;
    std::cout << "Leading zeros: " << append("00012") << std::endl;
    std::cout << std::endl;

    std::cout << "=== Integers and Digit Sequences ===" << std::endl;
    int64_t value = 54321;
    std::cout << "Checksum for " << value << ": " << static_cast<int>(generate(value)) << std::endl;

    std::vector<int> sequence = {2, 3, 6};
    std::cout << "Checksum for {2, 3, 6}: " << static_cast<int>(generate(sequence)) << std::endl;
    std::cout << std::endl;

    std::cout << "=== Validating Aadhaar Number ===" << std::endl;
    std::string aadhaar = append("23412341234");
    std::cout << "Aadhaar " << aadhaar << " is valid: "
              << (validateAadhaar(aadhaar) ? "true" : "false") << std::endl;

    try {
        validateAadhaar("12345");
    } catch (const checksum::ChecksumError& e) {
        std::cout << "Rejected 12345 (" << checksum::toString(e.kind()) << "): "
                  << e.what() << std::endl;
    }

    return 0;
}
