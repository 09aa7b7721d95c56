#include "runtime/dependency_graph.hpp"
#include "core/errors.hpp"
#include <algorithm>

namespace plughost::runtime {

bool DependencyGraph::add_node(DependencyGraphNode node) {
    std::string token = node.token;
    node.in_degree = 0;
    return nodes_.emplace(token, std::move(node)).second;
}

void DependencyGraph::add_edge(const std::string& from, const std::string& to) {
    auto target = nodes_.find(to);
    if (target == nodes_.end() || !nodes_.count(from)) {
        return;
    }
    if (edges_[from].insert(to).second) {
        target->second.in_degree++;
    }
}

const DependencyGraphNode* DependencyGraph::get_node(const std::string& token) const {
    auto it = nodes_.find(token);
    if (it == nodes_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<std::string> DependencyGraph::tokens() const {
    std::vector<std::string> result;
    result.reserve(nodes_.size());
    for (const auto& [token, node] : nodes_) {
        result.push_back(token);
    }
    return result;
}

std::vector<std::string> DependencyGraph::dependents(const std::string& token) const {
    auto it = edges_.find(token);
    if (it == edges_.end()) {
        return {};
    }
    return std::vector<std::string>(it->second.begin(), it->second.end());
}

std::vector<const DependencyGraphNode*> DependencyGraph::topological_sort() const {
    std::map<std::string, int> in_degree;
    std::set<std::string> ready;
    for (const auto& [token, node] : nodes_) {
        in_degree[token] = node.in_degree;
        if (node.in_degree == 0) {
            ready.insert(token);
        }
    }

    std::vector<const DependencyGraphNode*> sorted;
    sorted.reserve(nodes_.size());

    while (!ready.empty()) {
        std::string token = *ready.begin();
        ready.erase(ready.begin());
        sorted.push_back(&nodes_.at(token));

        auto edges = edges_.find(token);
        if (edges == edges_.end()) {
            continue;
        }
        for (const auto& dependent : edges->second) {
            if (--in_degree[dependent] == 0) {
                ready.insert(dependent);
            }
        }
    }

    if (sorted.size() < nodes_.size()) {
        std::set<std::string> remaining;
        for (const auto& [token, degree] : in_degree) {
            if (degree > 0) {
                remaining.insert(token);
            }
        }

        std::vector<std::string> cycle = cyclic_tokens(remaining);
        std::string message = "Circular dependency detected in adapters: ";
        for (size_t i = 0; i < cycle.size(); i++) {
            if (i > 0) message += ", ";
            message += cycle[i];
        }
        if (cycle.size() < remaining.size()) {
            message += " (also blocked:";
            for (const auto& token : remaining) {
                if (std::find(cycle.begin(), cycle.end(), token) == cycle.end()) {
                    message += " " + token;
                }
            }
            message += ")";
        }
        throw ConfigurationError(message, cycle);
    }

    return sorted;
}

std::vector<std::string> DependencyGraph::cyclic_tokens(const std::set<std::string>& remaining) const {
    // A remaining token is on a cycle if it can reach itself through remaining tokens
    std::vector<std::string> result;
    for (const auto& start : remaining) {
        std::set<std::string> visited;
        std::vector<std::string> stack{start};
        bool found = false;
        while (!stack.empty() && !found) {
            std::string current = stack.back();
            stack.pop_back();
            auto edges = edges_.find(current);
            if (edges == edges_.end()) {
                continue;
            }
            for (const auto& next : edges->second) {
                if (next == start) {
                    found = true;
                    break;
                }
                if (remaining.count(next) && visited.insert(next).second) {
                    stack.push_back(next);
                }
            }
        }
        if (found) {
            result.push_back(start);
        }
    }
    return result;
}

} // namespace plughost::runtime
