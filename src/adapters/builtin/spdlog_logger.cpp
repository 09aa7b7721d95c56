#include "adapters/builtin/spdlog_logger.hpp"

namespace plughost::adapters::builtin {

using json = nlohmann::json;

namespace {

spdlog::level::level_enum to_spdlog(LogLevel level) {
    switch (level) {
    case LogLevel::Trace: return spdlog::level::trace;
    case LogLevel::Debug: return spdlog::level::debug;
    case LogLevel::Info: return spdlog::level::info;
    case LogLevel::Warn: return spdlog::level::warn;
    case LogLevel::Error: return spdlog::level::err;
    case LogLevel::Fatal: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

} // anonymous namespace

SpdlogLoggerConfig spdlog_logger_config_from_json(const json& settings) {
    SpdlogLoggerConfig config;
    if (!settings.is_object()) {
        return config;
    }
    if (auto it = settings.find("level"); it != settings.end() && it->is_string()) {
        if (auto level = log_level_from_string(it->get<std::string>())) {
            config.level = *level;
        }
    }
    if (auto it = settings.find("source"); it != settings.end() && it->is_string()) {
        config.source = it->get<std::string>();
    }
    return config;
}

SpdlogLogger::SpdlogLogger(SpdlogLoggerConfig config)
    : config_(std::move(config)), on_log_(ON_LOG_HOOK) {
    // Share the default logger's sinks so output stays in one stream
    auto base = spdlog::default_logger();
    logger_ = std::make_shared<spdlog::logger>(config_.source, base->sinks().begin(),
                                               base->sinks().end());
    logger_->set_level(to_spdlog(config_.level));
}

void SpdlogLogger::log(LogLevel level, const std::string& message, const json& fields) {
    if (level < config_.level) {
        return;
    }

    if (fields.empty()) {
        logger_->log(to_spdlog(level), "[{}] {}", config_.source, message);
    } else {
        logger_->log(to_spdlog(level), "[{}] {} {}", config_.source, message, fields.dump());
    }

    LogRecord record;
    record.timestamp = now_ms();
    record.level = level;
    record.message = message;
    record.fields = fields.is_object() ? fields : json::object();
    record.source = config_.source;
    on_log_.fire(json(record));
}

HookRegistrar SpdlogLogger::hook(const std::string& name) {
    if (name == ON_LOG_HOOK) {
        return on_log_.registrar();
    }
    return nullptr;
}

} // namespace plughost::adapters::builtin
