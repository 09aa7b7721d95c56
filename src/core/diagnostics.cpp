#include "core/diagnostics.hpp"
#include <spdlog/spdlog.h>

namespace plughost::core {

const char* warning_kind_to_string(WarningKind kind) {
    switch (kind) {
    case WarningKind::ExtensionWiring:
        return "ExtensionWiringWarning";
    case WarningKind::ProtocolVersionMismatch:
        return "ProtocolVersionMismatch";
    case WarningKind::MalformedMessage:
        return "MalformedMessage";
    }
    return "Warning";
}

void LogDiagnosticSink::warn(const Warning& warning) {
    if (warning.details.empty()) {
        spdlog::warn("[{}] {}", warning_kind_to_string(warning.kind), warning.message);
    } else {
        spdlog::warn("[{}] {} {}", warning_kind_to_string(warning.kind), warning.message,
                     warning.details.dump());
    }
}

void report_warning(DiagnosticSink* sink, const Warning& warning) {
    if (!sink) {
        LogDiagnosticSink fallback;
        fallback.warn(warning);
        return;
    }

    try {
        sink->warn(warning);
    } catch (const std::exception& e) {
        spdlog::error("Diagnostic sink failed on {}: {}",
                      warning_kind_to_string(warning.kind), e.what());
    } catch (...) {
        spdlog::error("Diagnostic sink failed on {} with a non-standard exception",
                      warning_kind_to_string(warning.kind));
    }
}

} // namespace plughost::core
