#pragma once

#include "utils/Logger.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace verhoeff {
namespace utils {
namespace env {

constexpr const char* LOG_LEVEL_VARIABLE = "VERHOEFF_LOG_LEVEL";

/**
 * @brief Value of an environment variable, empty if unset
 */
std::string get(std::string_view name);

/**
 * @brief Log level named by VERHOEFF_LOG_LEVEL
 * @return nullopt if unset or not a known level
 */
std::optional<LogLevel> getLogLevel();

} // namespace env
} // namespace utils
} // namespace verhoeff
