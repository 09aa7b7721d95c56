#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include "adapters/hook_list.hpp"
#include "adapters/logger.hpp"

namespace plughost::adapters::builtin {

struct SpdlogLoggerConfig {
    LogLevel level = LogLevel::Info;
    std::string source = "plugin";
};

SpdlogLoggerConfig spdlog_logger_config_from_json(const nlohmann::json& settings);

// Logger writing through a dedicated spdlog logger named after the source.
// Every record at or above the configured level fires onLog.
class SpdlogLogger final : public Logger {
public:
    static constexpr const char* ON_LOG_HOOK = "onLog";

    explicit SpdlogLogger(SpdlogLoggerConfig config = {});

    void log(LogLevel level, const std::string& message,
             const nlohmann::json& fields = nlohmann::json::object()) override;

    HookRegistrar hook(const std::string& name) override;

    size_t listener_count() const { return on_log_.size(); }

private:
    SpdlogLoggerConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
    HookList on_log_;
};

} // namespace plughost::adapters::builtin
