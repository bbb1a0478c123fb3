#include "cli/CommandRunner.hpp"
#include "utils/Environment.hpp"
#include <iostream>
#include <string>
#include <vector>

using namespace verhoeff;

int main(int argc, char** argv) {
    cli::CommandRunner::Config config;
    if (auto level = utils::env::getLogLevel()) {
        config.log_level = *level;
    }

    std::vector<std::string> args(argv + 1, argv + argc);

    cli::CommandRunner runner(std::cout, std::cerr, config);
    return runner.run(args);
}
