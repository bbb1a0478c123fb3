#include <gtest/gtest.h>
#include "cli/CommandRunner.hpp"
#include <sstream>
#include <string>
#include <vector>

using namespace verhoeff::cli;
using verhoeff::utils::LogLevel;

class CommandRunnerTest : public ::testing::Test {
protected:
    std::ostringstream out;
    std::ostringstream err;

    int run(const std::vector<std::string>& args) {
        CommandRunner runner(out, err);
        return runner.run(args);
    }
};

TEST_F(CommandRunnerTest, Generate) {
    EXPECT_EQ(run({"generate", "236"}), CommandRunner::EXIT_CODE_OK);
    EXPECT_EQ(out.str(), "Checksum for 236: 3\n");
    EXPECT_TRUE(err.str().empty());
}

TEST_F(CommandRunnerTest, ValidateValid) {
    EXPECT_EQ(run({"validate", "2363"}), CommandRunner::EXIT_CODE_OK);
    EXPECT_EQ(out.str(), "2363 is valid\n");
}

TEST_F(CommandRunnerTest, ValidateInvalidSuggestsCorrection) {
    EXPECT_EQ(run({"validate", "2364"}), CommandRunner::EXIT_CODE_OK);
    EXPECT_EQ(out.str(),
              "2364 is NOT valid\n"
              "The correct checksum for 236 would be 3 (you provided 4)\n"
              "Correct number would be: 2363\n");
}

TEST_F(CommandRunnerTest, ValidateAadhaar) {
    EXPECT_EQ(run({"validateaadhaar", "234123412346"}), CommandRunner::EXIT_CODE_OK);
    EXPECT_EQ(out.str(), "Aadhaar number 234123412346 is valid\n");
}

TEST_F(CommandRunnerTest, ValidateAadhaarWrongLength) {
    EXPECT_EQ(run({"validateaadhaar", "12345"}), CommandRunner::EXIT_CODE_ERROR);
    EXPECT_EQ(err.str(), "Error: identifier must be 12 digits in length\n");
}

TEST_F(CommandRunnerTest, CustomFixedLength) {
    EXPECT_EQ(run({"--length", "4", "validateaadhaar", "2363"}), CommandRunner::EXIT_CODE_OK);
    EXPECT_EQ(out.str(), "Identifier 2363 is valid\n");
}

TEST_F(CommandRunnerTest, AppendKeepsLeadingZeros) {
    EXPECT_EQ(run({"append", "00012"}), CommandRunner::EXIT_CODE_OK);
    EXPECT_EQ(out.str(), "00012 with checksum: 000123\n");
}

TEST_F(CommandRunnerTest, MalformedNumber) {
    EXPECT_EQ(run({"generate", "12a"}), CommandRunner::EXIT_CODE_ERROR);
    EXPECT_EQ(err.str(), "Error: input contains non-digit characters\n");
    EXPECT_TRUE(out.str().empty());
}

TEST_F(CommandRunnerTest, FailedCommandsWriteNothingToOutput) {
    const std::vector<std::vector<std::string>> failing = {
        {"generate", "12a"},
        {"validate", "23-63"},
        {"validate", ""},
        {"validateaadhaar", "12345"},
        {"validateaadhaar", "12345678901a"},
        {"append", "1 2"},
    };

    for (const auto& args : failing) {
        out.str("");
        err.str("");

        EXPECT_EQ(run(args), CommandRunner::EXIT_CODE_ERROR) << args[0] << " " << args[1];
        EXPECT_TRUE(out.str().empty()) << args[0] << " " << args[1] << ": '" << out.str() << "'";
        EXPECT_EQ(err.str().rfind("Error: ", 0), 0u) << err.str();
    }
}

TEST_F(CommandRunnerTest, NoArgumentsPrintsUsage) {
    EXPECT_EQ(run({}), CommandRunner::EXIT_CODE_ERROR);
    EXPECT_NE(out.str().find("Usage:"), std::string::npos);
}

TEST_F(CommandRunnerTest, MissingNumber) {
    EXPECT_EQ(run({"generate"}), CommandRunner::EXIT_CODE_ERROR);
    EXPECT_EQ(err.str(), "Error: NUMBER argument is required\n");
}

TEST_F(CommandRunnerTest, UnknownCommand) {
    EXPECT_EQ(run({"checksum", "236"}), CommandRunner::EXIT_CODE_ERROR);
    EXPECT_EQ(err.str(), "Unknown command: checksum\n");
}

TEST_F(CommandRunnerTest, BadOptions) {
    EXPECT_EQ(run({"--length", "zero", "generate", "1"}), CommandRunner::EXIT_CODE_ERROR);
    EXPECT_EQ(run({"--length", "0", "generate", "1"}), CommandRunner::EXIT_CODE_ERROR);
    EXPECT_EQ(run({"--log-level", "loud", "generate", "1"}), CommandRunner::EXIT_CODE_ERROR);
    EXPECT_EQ(run({"generate", "1", "--length"}), CommandRunner::EXIT_CODE_ERROR);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(CommandRunnerTest, OptionsUpdateConfig) {
    CommandRunner runner(out, err);
    EXPECT_EQ(runner.run({"--log-level", "error", "--length", "8", "generate", "1"}),
              CommandRunner::EXIT_CODE_OK);

    EXPECT_EQ(runner.getConfig().log_level, LogLevel::ERROR);
    EXPECT_EQ(runner.getConfig().fixed_length, 8u);
    EXPECT_EQ(verhoeff::utils::Logger::getInstance().getLevel(), LogLevel::ERROR);

    verhoeff::utils::Logger::getInstance().setLevel(LogLevel::WARN);
}
