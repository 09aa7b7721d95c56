#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include "adapters/adapter.hpp"

namespace plughost::adapters {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

const char* log_level_to_string(LogLevel level);
std::optional<LogLevel> log_level_from_string(const std::string& name);

// Payload of the logger's onLog hook
struct LogRecord {
    int64_t timestamp = 0; // ms since epoch
    LogLevel level = LogLevel::Info;
    std::string message;
    nlohmann::json fields = nlohmann::json::object();
    std::string source;
};

void to_json(nlohmann::json& j, const LogRecord& record);
void from_json(const nlohmann::json& j, LogRecord& record);

// Filter over log records; unset fields match everything
struct LogQuery {
    std::optional<LogLevel> level; // minimum level
    std::optional<std::string> source;
    std::optional<int64_t> start_time;
    std::optional<int64_t> end_time;
    std::optional<size_t> limit;

    bool matches(const LogRecord& record) const;
};

LogQuery log_query_from_json(const nlohmann::json& j);
nlohmann::json log_query_to_json(const LogQuery& query);

int64_t now_ms();

// ILogger capability. RPC surface: trace, debug, info, warn, error.
// Hook: onLog, fired with each LogRecord.
class Logger : public Adapter {
public:
    virtual void log(LogLevel level, const std::string& message,
                     const nlohmann::json& fields = nlohmann::json::object()) = 0;

    void trace(const std::string& message, const nlohmann::json& fields = nlohmann::json::object()) {
        log(LogLevel::Trace, message, fields);
    }
    void debug(const std::string& message, const nlohmann::json& fields = nlohmann::json::object()) {
        log(LogLevel::Debug, message, fields);
    }
    void info(const std::string& message, const nlohmann::json& fields = nlohmann::json::object()) {
        log(LogLevel::Info, message, fields);
    }
    void warn(const std::string& message, const nlohmann::json& fields = nlohmann::json::object()) {
        log(LogLevel::Warn, message, fields);
    }
    void error(const std::string& message, const nlohmann::json& fields = nlohmann::json::object()) {
        log(LogLevel::Error, message, fields);
    }

    void register_methods(MethodTable& table) override;
};

} // namespace plughost::adapters
