#include "runtime/adapter_loader.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace plughost::runtime {

using json = nlohmann::json;

namespace {

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); i++) {
        if (i > 0) out += ", ";
        out += items[i];
    }
    return out;
}

} // anonymous namespace

AdapterConfigSet parse_adapter_configs(const json& j) {
    AdapterConfigSet configs;
    if (j.is_null()) {
        return configs;
    }
    if (!j.is_object()) {
        throw ConfigurationError("Adapter configuration must be an object keyed by token");
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& token = it.key();
        const json& value = it.value();
        AdapterConfigEntry entry;

        if (value.is_string()) {
            entry.module = value.get<std::string>();
        } else if (value.is_object()) {
            auto module = value.find("module");
            if (module == value.end() || !module->is_string()) {
                throw ConfigurationError("Adapter \"" + token + "\" is missing a module reference", {token});
            }
            entry.module = module->get<std::string>();
            auto config = value.find("config");
            if (config != value.end() && !config->is_null()) {
                if (!config->is_object()) {
                    throw ConfigurationError("Adapter \"" + token + "\" config must be an object", {token});
                }
                entry.config = *config;
            }
        } else {
            throw ConfigurationError("Adapter \"" + token + "\" must be a module reference or an object", {token});
        }

        if (entry.module.empty()) {
            throw ConfigurationError("Adapter \"" + token + "\" has an empty module reference", {token});
        }
        configs.emplace(token, std::move(entry));
    }
    return configs;
}

AdapterLoader::AdapterLoader(adapters::ModuleResolver resolver, core::DiagnosticSink* diagnostics)
    : resolver_(std::move(resolver)), diagnostics_(diagnostics) {}

void AdapterLoader::missing_dependency(const std::string& dependent, const std::string& missing,
                                       const AdapterConfigSet& configs,
                                       const std::map<std::string, std::string>& manifest_ids) const {
    std::vector<std::string> configured;
    for (const auto& [token, entry] : configs) {
        configured.push_back(token);
    }

    std::vector<std::string> matching;
    for (const auto& [token, id] : manifest_ids) {
        if (id == missing) {
            matching.push_back(token);
        }
    }

    std::string message = "Adapter \"" + dependent + "\" requires adapter \"" + missing +
                          "\" but it's not configured.";
    if (!matching.empty()) {
        message += " Dependencies must reference runtime adapter tokens (config keys), not manifest.id."
                   " Token \"" + missing + "\" matches manifest.id of configured adapter token(s): " +
                   join(matching) + ".";
    }
    message += " Configured tokens: " + (configured.empty() ? std::string("(none)") : join(configured));

    throw ConfigurationError(message, {dependent, missing});
}

DependencyGraph AdapterLoader::build_dependency_graph(const AdapterConfigSet& configs) const {
    std::map<std::string, DependencyGraphNode> nodes;
    std::map<std::string, std::string> manifest_ids;

    for (const auto& [token, entry] : configs) {
        DependencyGraphNode node;
        node.token = token;
        node.settings = entry.config.is_null() ? json::object() : entry.config;

        try {
            node.module = resolver_(entry.module);
        } catch (const ConfigurationError& e) {
            throw ConfigurationError("Adapter \"" + token + "\": " + e.what(), {token});
        } catch (const std::exception& e) {
            throw ConfigurationError("Adapter \"" + token + "\": failed to resolve module '" +
                                     entry.module + "': " + e.what(), {token});
        }
        if (!node.module.create) {
            throw ConfigurationError("Adapter \"" + token + "\": module '" + entry.module +
                                     "' has no factory", {token});
        }
        try {
            adapters::validate_manifest(node.module.manifest);
        } catch (const ConfigurationError& e) {
            throw ConfigurationError("Adapter \"" + token + "\": " + e.what(), {token});
        }

        manifest_ids[token] = node.module.manifest.id;
        nodes.emplace(token, std::move(node));
    }

    for (auto& [token, node] : nodes) {
        for (const auto& dep : node.manifest().required_adapters) {
            if (!configs.count(dep.id)) {
                missing_dependency(token, dep.id, configs, manifest_ids);
            }
            node.required_deps.push_back(dep.id);
        }
        for (const auto& dep : node.manifest().optional_adapters) {
            if (configs.count(dep)) {
                node.optional_deps.push_back(dep);
            } else {
                spdlog::debug("Adapter {}: optional dependency {} not configured", token, dep);
            }
        }
    }

    DependencyGraph graph;
    for (auto& [token, node] : nodes) {
        graph.add_node(node);
    }
    for (const auto& [token, node] : nodes) {
        for (const auto& dep : node.required_deps) {
            graph.add_edge(dep, token);
        }
        for (const auto& dep : node.optional_deps) {
            graph.add_edge(dep, token);
        }
    }
    return graph;
}

AdapterInstances AdapterLoader::instantiate(const std::vector<const DependencyGraphNode*>& sorted) const {
    AdapterInstances instances;

    for (const auto* node : sorted) {
        adapters::DependencyBundle deps;
        for (const auto& dep : node->manifest().required_adapters) {
            auto it = instances.find(dep.id);
            if (it == instances.end()) {
                throw ConfigurationError("Adapter \"" + node->token + "\" was ordered before its dependency \"" +
                                         dep.id + "\"", {node->token, dep.id});
            }
            deps.add(dep.effective_alias(), it->second);
        }
        for (const auto& dep : node->optional_deps) {
            auto it = instances.find(dep);
            if (it != instances.end()) {
                deps.add(dep, it->second);
            }
        }

        std::shared_ptr<adapters::Adapter> instance;
        try {
            instance = node->module.create(node->settings, deps);
        } catch (const std::exception& e) {
            throw ConfigurationError("Failed to create adapter \"" + node->token + "\": " + e.what(),
                                     {node->token});
        }
        if (!instance) {
            throw ConfigurationError("Factory for adapter \"" + node->token + "\" returned no instance",
                                     {node->token});
        }

        spdlog::info("Loaded adapter {} ({} v{})", node->token, node->manifest().id,
                     node->manifest().version);
        instances.emplace(node->token, std::move(instance));
    }

    return instances;
}

std::vector<ExtensionConnection> AdapterLoader::connect_extensions(const AdapterInstances& instances,
                                                                   const DependencyGraph& graph) const {
    std::vector<const DependencyGraphNode*> extensions;
    for (const auto& token : graph.tokens()) {
        const DependencyGraphNode* node = graph.get_node(token);
        if (node && node->manifest().extends) {
            extensions.push_back(node);
        }
    }

    std::stable_sort(extensions.begin(), extensions.end(),
                     [](const DependencyGraphNode* a, const DependencyGraphNode* b) {
                         int pa = a->manifest().extends->priority;
                         int pb = b->manifest().extends->priority;
                         if (pa != pb) {
                             return pa > pb;
                         }
                         return a->token < b->token;
                     });

    std::vector<ExtensionConnection> report;
    for (const auto* node : extensions) {
        const auto& ext = *node->manifest().extends;
        ExtensionConnection conn;
        conn.extension = node->token;
        conn.target = ext.adapter;
        conn.hook = ext.hook;
        conn.method = ext.method;
        conn.priority = ext.priority;

        auto skip = [&](const std::string& reason) {
            conn.reason = reason;
            core::report_warning(diagnostics_, core::Warning{
                core::WarningKind::ExtensionWiring,
                "Extension \"" + conn.extension + "\" not connected: " + reason,
                {{"extension", conn.extension}, {"target", conn.target},
                 {"hook", conn.hook}, {"method", conn.method}}
            });
            report.push_back(conn);
        };

        auto target = instances.find(ext.adapter);
        if (target == instances.end()) {
            skip("target adapter \"" + ext.adapter + "\" is not loaded");
            continue;
        }
        adapters::HookRegistrar registrar = target->second->hook(ext.hook);
        if (!registrar) {
            skip("adapter \"" + ext.adapter + "\" has no hook \"" + ext.hook + "\"");
            continue;
        }
        auto self = instances.find(node->token);
        if (self == instances.end()) {
            skip("extension instance is not loaded");
            continue;
        }
        adapters::HookCallback method = self->second->extension_method(ext.method);
        if (!method) {
            skip("extension has no method \"" + ext.method + "\"");
            continue;
        }

        try {
            registrar(std::move(method));
        } catch (const std::exception& e) {
            skip(std::string("hook registration failed: ") + e.what());
            continue;
        }

        conn.connected = true;
        spdlog::info("Connected extension {} -> {}.{} via {} (priority {})", conn.extension,
                     conn.target, conn.hook, conn.method, conn.priority);
        report.push_back(conn);
    }

    return report;
}

LoadedAdapters AdapterLoader::load_adapters(const AdapterConfigSet& configs) const {
    DependencyGraph graph = build_dependency_graph(configs);
    auto sorted = graph.topological_sort();

    LoadedAdapters loaded;
    loaded.instances = instantiate(sorted);
    for (const auto* node : sorted) {
        loaded.load_order.push_back(node->token);
    }
    loaded.extensions = connect_extensions(loaded.instances, graph);

    spdlog::info("Adapter set ready: {} adapter(s), load order: {}", loaded.instances.size(),
                 join(loaded.load_order));
    return loaded;
}

} // namespace plughost::runtime
