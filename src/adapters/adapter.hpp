#pragma once
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace plughost::adapters {

// RPC-callable method: deserialized positional args in, result value out
using Method = std::function<nlohmann::json(const std::vector<nlohmann::json>& args)>;

// Callback an extension attaches to a hook
using HookCallback = std::function<void(const nlohmann::json& payload)>;

// Registration entry point of a named hook on a target adapter
using HookRegistrar = std::function<void(HookCallback callback)>;

// Fixed name -> method table a capability publishes for dispatch
class MethodTable {
public:
    void register_method(const std::string& name, Method method);

    // Returns nullptr if the method is not published
    const Method* find(const std::string& name) const;

    std::vector<std::string> names() const;
    size_t size() const { return methods_.size(); }
    bool empty() const { return methods_.empty(); }

private:
    std::map<std::string, Method> methods_;
};

// Base of every adapter instance held by the host
class Adapter : public std::enable_shared_from_this<Adapter> {
public:
    virtual ~Adapter() = default;

    // Publish methods reachable over RPC
    virtual void register_methods(MethodTable& /*table*/) {}

    // Registrar for a hook this adapter exposes; empty if it has none
    virtual HookRegistrar hook(const std::string& /*name*/) { return nullptr; }

    // Extension method bound to this instance; empty if it has none
    virtual HookCallback extension_method(const std::string& /*name*/) { return nullptr; }
};

// Positional argument or null when the caller omitted it
const nlohmann::json& arg_at(const std::vector<nlohmann::json>& args, size_t index);

// Required string argument; throws std::invalid_argument otherwise
std::string string_arg(const std::vector<nlohmann::json>& args, size_t index, const char* name);

} // namespace plughost::adapters
