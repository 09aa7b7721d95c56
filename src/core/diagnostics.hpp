#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace plughost::core {

enum class WarningKind {
    ExtensionWiring,
    ProtocolVersionMismatch,
    MalformedMessage
};

const char* warning_kind_to_string(WarningKind kind);

struct Warning {
    WarningKind kind;
    std::string message;
    nlohmann::json details = nlohmann::json::object();
};

// Receives non-fatal runtime warnings
class DiagnosticSink {
public:
    virtual ~DiagnosticSink() = default;
    virtual void warn(const Warning& warning) = 0;
};

// Default sink: writes warnings through spdlog
class LogDiagnosticSink final : public DiagnosticSink {
public:
    void warn(const Warning& warning) override;
};

// Deliver a warning to sink (spdlog when null). A failing sink is logged and
// never propagates to the caller.
void report_warning(DiagnosticSink* sink, const Warning& warning);

} // namespace plughost::core
