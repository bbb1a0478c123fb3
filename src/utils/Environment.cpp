#include "utils/Environment.hpp"
#include <cstdlib>

namespace verhoeff {
namespace utils {
namespace env {

std::string get(std::string_view name) {
    std::string key(name);
    const char* value = std::getenv(key.c_str());
    if (!value) {
        return {};
    }
    return std::string(value);
}

std::optional<LogLevel> getLogLevel() {
    std::string value = get(LOG_LEVEL_VARIABLE);
    if (value.empty()) {
        return std::nullopt;
    }

    auto level = parseLogLevel(value);
    if (!level) {
        LOG_WARN("Environment: Ignoring unknown ", LOG_LEVEL_VARIABLE, " value '", value, "'");
    }
    return level;
}

} // namespace env
} // namespace utils
} // namespace verhoeff
