#pragma once
#include <map>
#include <set>
#include <string>
#include <vector>
#include "adapters/module_registry.hpp"

namespace plughost::runtime {

// One configured adapter during loading
struct DependencyGraphNode {
    std::string token;
    adapters::AdapterModule module;
    nlohmann::json settings = nlohmann::json::object();
    // Required dependency tokens, in manifest order
    std::vector<std::string> required_deps;
    // Optional dependency tokens that are configured
    std::vector<std::string> optional_deps;
    int in_degree = 0;

    const adapters::AdapterManifest& manifest() const { return module.manifest; }
};

// Must-load-before graph keyed by runtime token. An edge from -> to means
// `to` depends on `from`.
class DependencyGraph {
public:
    // Returns false if the token is already present
    bool add_node(DependencyGraphNode node);

    // Unknown endpoints are ignored; duplicate edges count once
    void add_edge(const std::string& from, const std::string& to);

    // Returns nullptr if absent
    const DependencyGraphNode* get_node(const std::string& token) const;

    bool has_node(const std::string& token) const { return nodes_.count(token) > 0; }

    // Tokens in ascending order
    std::vector<std::string> tokens() const;

    // Tokens depending directly on token
    std::vector<std::string> dependents(const std::string& token) const;

    size_t size() const { return nodes_.size(); }

    // Kahn's algorithm with ties broken by token order. Throws
    // ConfigurationError naming the tokens on cycles if not every node can
    // be emitted.
    std::vector<const DependencyGraphNode*> topological_sort() const;

private:
    std::vector<std::string> cyclic_tokens(const std::set<std::string>& remaining) const;

    std::map<std::string, DependencyGraphNode> nodes_;
    std::map<std::string, std::set<std::string>> edges_;
};

} // namespace plughost::runtime
