#include "adapters/logger.hpp"
#include <chrono>
#include <stdexcept>

namespace plughost::adapters {

using json = nlohmann::json;

const char* log_level_to_string(LogLevel level) {
    switch (level) {
    case LogLevel::Trace: return "trace";
    case LogLevel::Debug: return "debug";
    case LogLevel::Info: return "info";
    case LogLevel::Warn: return "warn";
    case LogLevel::Error: return "error";
    case LogLevel::Fatal: return "fatal";
    }
    return "info";
}

std::optional<LogLevel> log_level_from_string(const std::string& name) {
    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "fatal") return LogLevel::Fatal;
    return std::nullopt;
}

void to_json(json& j, const LogRecord& record) {
    j = json{
        {"timestamp", record.timestamp},
        {"level", log_level_to_string(record.level)},
        {"message", record.message},
        {"fields", record.fields},
        {"source", record.source}
    };
}

void from_json(const json& j, LogRecord& record) {
    record.timestamp = j.value("timestamp", int64_t{0});
    auto level = log_level_from_string(j.value("level", std::string("info")));
    if (!level) {
        throw std::invalid_argument("Unknown log level '" + j.value("level", std::string()) + "'");
    }
    record.level = *level;
    record.message = j.value("message", std::string());
    record.fields = j.value("fields", json::object());
    record.source = j.value("source", std::string());
}

bool LogQuery::matches(const LogRecord& record) const {
    if (level && record.level < *level) {
        return false;
    }
    if (source && record.source != *source) {
        return false;
    }
    if (start_time && record.timestamp < *start_time) {
        return false;
    }
    if (end_time && record.timestamp > *end_time) {
        return false;
    }
    return true;
}

LogQuery log_query_from_json(const json& j) {
    LogQuery query;
    if (!j.is_object()) {
        return query;
    }
    if (auto it = j.find("level"); it != j.end() && it->is_string()) {
        query.level = log_level_from_string(it->get<std::string>());
    }
    if (auto it = j.find("source"); it != j.end() && it->is_string()) {
        query.source = it->get<std::string>();
    }
    if (auto it = j.find("startTime"); it != j.end() && it->is_number()) {
        query.start_time = it->get<int64_t>();
    }
    if (auto it = j.find("endTime"); it != j.end() && it->is_number()) {
        query.end_time = it->get<int64_t>();
    }
    if (auto it = j.find("limit"); it != j.end() && it->is_number_integer() && it->get<int64_t>() >= 0) {
        query.limit = static_cast<size_t>(it->get<int64_t>());
    }
    return query;
}

json log_query_to_json(const LogQuery& query) {
    json j = json::object();
    if (query.level) j["level"] = log_level_to_string(*query.level);
    if (query.source) j["source"] = *query.source;
    if (query.start_time) j["startTime"] = *query.start_time;
    if (query.end_time) j["endTime"] = *query.end_time;
    if (query.limit) j["limit"] = *query.limit;
    return j;
}

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

void Logger::register_methods(MethodTable& table) {
    auto bind = [this](LogLevel level) {
        return [this, level](const std::vector<json>& args) {
            const json& fields = arg_at(args, 1);
            log(level, string_arg(args, 0, "message"), fields.is_object() ? fields : json::object());
            return json();
        };
    };

    table.register_method("trace", bind(LogLevel::Trace));
    table.register_method("debug", bind(LogLevel::Debug));
    table.register_method("info", bind(LogLevel::Info));
    table.register_method("warn", bind(LogLevel::Warn));
    table.register_method("error", bind(LogLevel::Error));
}

} // namespace plughost::adapters
