#include "util/logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace plughost::util {

void init_logger() {
    auto console = spdlog::get("console");
    if (!console) {
        console = spdlog::stdout_color_mt("console");
    }
    spdlog::set_default_logger(console);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
    if (name == "warning") {
        return spdlog::level::warn;
    }
    auto level = spdlog::level::from_str(name);
    // from_str falls back to off for unknown names
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

} // namespace plughost::util
