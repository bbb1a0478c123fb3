#include "cli/CommandRunner.hpp"
#include <charconv>

namespace verhoeff {
namespace cli {

CommandRunner::CommandRunner(std::ostream& out, std::ostream& err, const Config& config)
    : out_(out)
    , err_(err)
    , config_(config) {
}

CommandRunner::CommandRunner(std::ostream& out, std::ostream& err)
    : CommandRunner(out, err, Config{}) {
}

void CommandRunner::printUsage() const {
    out_ << "Usage:\n";
    out_ << "  verhoeff_cli [--log-level LEVEL] [--length N] COMMAND NUMBER\n";
    out_ << "\n";
    out_ << "  generate NUMBER        - Generate a checksum for NUMBER\n";
    out_ << "  validate NUMBER        - Validate NUMBER (with checksum as the last digit)\n";
    out_ << "  validateaadhaar NUMBER - Validate a fixed-length identifier (default 12 digits)\n";
    out_ << "  append NUMBER          - Append a checksum to NUMBER\n";
}

int CommandRunner::run(const std::vector<std::string>& args) {
    std::vector<std::string> positional;
    if (!parseOptions(args, positional)) {
        return EXIT_CODE_ERROR;
    }

    utils::Logger::getInstance().setLevel(config_.log_level);

    if (positional.empty()) {
        printUsage();
        return EXIT_CODE_ERROR;
    }

    if (positional.size() < 2) {
        err_ << "Error: NUMBER argument is required\n";
        return EXIT_CODE_ERROR;
    }

    if (positional.size() > 2) {
        err_ << "Error: unexpected argument '" << positional[2] << "'\n";
        return EXIT_CODE_ERROR;
    }

    return dispatch(positional[0], positional[1]);
}

bool CommandRunner::parseOptions(const std::vector<std::string>& args,
                                 std::vector<std::string>& positional) {
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg != "--log-level" && arg != "--length") {
            positional.push_back(arg);
            continue;
        }

        if (i + 1 >= args.size()) {
            err_ << "Error: " << arg << " requires a value\n";
            return false;
        }
        const std::string& value = args[++i];

        if (arg == "--log-level") {
            auto level = utils::parseLogLevel(value);
            if (!level) {
                err_ << "Error: unknown log level '" << value << "'\n";
                return false;
            }
            config_.log_level = *level;
        } else {
            size_t length = 0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
            if (ec != std::errc() || ptr != value.data() + value.size() || length == 0) {
                err_ << "Error: invalid length '" << value << "'\n";
                return false;
            }
            config_.fixed_length = length;
        }
    }

    return true;
}

int CommandRunner::dispatch(const std::string& command, const std::string& number) {
    LOG_DEBUG("CommandRunner: Running '", command, "' on ", number);

    try {
        if (command == "generate") {
            runGenerate(number);
        } else if (command == "validate") {
            runValidate(number);
        } else if (command == "validateaadhaar") {
            runValidateFixedLength(number);
        } else if (command == "append") {
            runAppend(number);
        } else {
            err_ << "Unknown command: " << command << "\n";
            return EXIT_CODE_ERROR;
        }
    } catch (const checksum::ChecksumError& e) {
        LOG_ERROR("CommandRunner: ", command, " failed (", checksum::toString(e.kind()), ")");
        err_ << "Error: " << e.what() << "\n";
        return EXIT_CODE_ERROR;
    }

    return EXIT_CODE_OK;
}

void CommandRunner::runGenerate(const std::string& number) {
    uint8_t check = generate(number);
    out_ << "Checksum for " << number << ": " << static_cast<int>(check) << "\n";
}

void CommandRunner::runValidate(const std::string& number) {
    if (validate(number)) {
        out_ << number << " is valid\n";
        return;
    }

    out_ << number << " is NOT valid\n";

    // Suggest the correct check digit for the same body
    if (number.size() > 1) {
        std::string corrected = expectedNumber(number);
        std::string base = number.substr(0, number.size() - 1);
        out_ << "The correct checksum for " << base << " would be " << corrected.back()
             << " (you provided " << number.back() << ")\n";
        out_ << "Correct number would be: " << corrected << "\n";
    }
}

void CommandRunner::runValidateFixedLength(const std::string& number) {
    const char* label = config_.fixed_length == AADHAAR_LENGTH ? "Aadhaar number " : "Identifier ";

    if (validateFixedLength(number, config_.fixed_length)) {
        out_ << label << number << " is valid\n";
    } else {
        out_ << label << number << " is NOT valid\n";
    }
}

void CommandRunner::runAppend(const std::string& number) {
    std::string result = append(number);
    out_ << number << " with checksum: " << result << "\n";

    if (!validate(result)) {
        LOG_WARN("CommandRunner: Appended number ", result, " failed validation");
        err_ << "Warning: The generated number failed validation!\n";
    }
}

} // namespace cli
} // namespace verhoeff
