#include "adapters/adapter.hpp"
#include <stdexcept>

namespace plughost::adapters {

using json = nlohmann::json;

void MethodTable::register_method(const std::string& name, Method method) {
    methods_[name] = std::move(method);
}

const Method* MethodTable::find(const std::string& name) const {
    auto it = methods_.find(name);
    if (it == methods_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<std::string> MethodTable::names() const {
    std::vector<std::string> result;
    result.reserve(methods_.size());
    for (const auto& [name, method] : methods_) {
        result.push_back(name);
    }
    return result;
}

const json& arg_at(const std::vector<json>& args, size_t index) {
    static const json null_value;
    if (index >= args.size()) {
        return null_value;
    }
    return args[index];
}

std::string string_arg(const std::vector<json>& args, size_t index, const char* name) {
    const json& value = arg_at(args, index);
    if (!value.is_string()) {
        throw std::invalid_argument(std::string("Argument '") + name + "' must be a string");
    }
    return value.get<std::string>();
}

} // namespace plughost::adapters
