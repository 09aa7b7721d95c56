#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace plughost::util {

// Initialize logging with console output
void init_logger();

// Set log level
void set_log_level(spdlog::level::level_enum level);

// Parse a level name ("trace" .. "critical", "off"); unknown names map to info
spdlog::level::level_enum parse_log_level(const std::string& name);

} // namespace plughost::util
