#pragma once

#include "checksum/Verhoeff.hpp"
#include "utils/Logger.hpp"
#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace verhoeff {
namespace cli {

/**
 * @brief Command-line front end over the public checksum operations
 *
 * Usage: [--log-level LEVEL] [--length N] COMMAND NUMBER
 * Commands: generate, validate, validateaadhaar, append
 */
class CommandRunner {
public:
    struct Config {
        utils::LogLevel log_level{utils::LogLevel::WARN};
        size_t fixed_length{AADHAAR_LENGTH};   // Used by validateaadhaar
    };

    static constexpr int EXIT_CODE_OK = 0;
    static constexpr int EXIT_CODE_ERROR = 1;

    CommandRunner(std::ostream& out, std::ostream& err, const Config& config);
    CommandRunner(std::ostream& out, std::ostream& err);

    /**
     * @brief Parse arguments (program name excluded) and run one command
     * @return Process exit code
     */
    int run(const std::vector<std::string>& args);

    const Config& getConfig() const { return config_; }

    void printUsage() const;

private:
    std::ostream& out_;
    std::ostream& err_;
    Config config_;

    bool parseOptions(const std::vector<std::string>& args,
                      std::vector<std::string>& positional);
    int dispatch(const std::string& command, const std::string& number);

    void runGenerate(const std::string& number);
    void runValidate(const std::string& number);
    void runValidateFixedLength(const std::string& number);
    void runAppend(const std::string& number);
};

} // namespace cli
} // namespace verhoeff
