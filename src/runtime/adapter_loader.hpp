#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "adapters/module_registry.hpp"
#include "core/diagnostics.hpp"
#include "runtime/dependency_graph.hpp"

namespace plughost::runtime {

// Runtime token -> live instance
using AdapterInstances = std::map<std::string, std::shared_ptr<adapters::Adapter>>;

struct AdapterConfigEntry {
    std::string module;
    nlohmann::json config = nlohmann::json::object();
};

// Runtime token -> module reference and settings
using AdapterConfigSet = std::map<std::string, AdapterConfigEntry>;

// Accepts {"token": {"module": ref, "config": {...}}} or {"token": ref}.
// Throws ConfigurationError on malformed entries.
AdapterConfigSet parse_adapter_configs(const nlohmann::json& j);

// Outcome of wiring one extension
struct ExtensionConnection {
    std::string extension;
    std::string target;
    std::string hook;
    std::string method;
    int priority = 0;
    bool connected = false;
    std::string reason;
};

struct LoadedAdapters {
    AdapterInstances instances;
    std::vector<std::string> load_order;
    std::vector<ExtensionConnection> extensions;
};

// Resolves a configuration set into live instances: graph, sort,
// instantiate, then wire extensions. Any configuration failure aborts the
// whole load; extension wiring failures only warn.
class AdapterLoader {
public:
    explicit AdapterLoader(adapters::ModuleResolver resolver,
                           core::DiagnosticSink* diagnostics = nullptr);

    // Throws ConfigurationError on unknown modules or missing required deps
    DependencyGraph build_dependency_graph(const AdapterConfigSet& configs) const;

    // Instantiates in the given order. Throws ConfigurationError if a factory fails.
    AdapterInstances instantiate(const std::vector<const DependencyGraphNode*>& sorted) const;

    // Wires extensions by descending priority then ascending token
    std::vector<ExtensionConnection> connect_extensions(const AdapterInstances& instances,
                                                        const DependencyGraph& graph) const;

    LoadedAdapters load_adapters(const AdapterConfigSet& configs) const;

private:
    [[noreturn]] void missing_dependency(const std::string& dependent, const std::string& missing,
                                         const AdapterConfigSet& configs,
                                         const std::map<std::string, std::string>& manifest_ids) const;

    adapters::ModuleResolver resolver_;
    core::DiagnosticSink* diagnostics_;
};

} // namespace plughost::runtime
