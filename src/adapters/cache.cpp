#include "adapters/cache.hpp"
#include <stdexcept>

namespace plughost::adapters {

using json = nlohmann::json;

void Cache::register_methods(MethodTable& table) {
    table.register_method("get", [this](const std::vector<json>& args) {
        return get(string_arg(args, 0, "key"));
    });

    table.register_method("set", [this](const std::vector<json>& args) {
        std::optional<int64_t> ttl;
        const json& ttl_arg = arg_at(args, 2);
        if (ttl_arg.is_number()) {
            ttl = ttl_arg.get<int64_t>();
        } else if (!ttl_arg.is_null()) {
            throw std::invalid_argument("Argument 'ttl' must be a number");
        }
        set(string_arg(args, 0, "key"), arg_at(args, 1), ttl);
        return json();
    });

    table.register_method("delete", [this](const std::vector<json>& args) {
        remove(string_arg(args, 0, "key"));
        return json();
    });

    table.register_method("clear", [this](const std::vector<json>& args) {
        const json& pattern = arg_at(args, 0);
        if (pattern.is_string()) {
            clear(pattern.get<std::string>());
        } else {
            clear();
        }
        return json();
    });
}

bool glob_match(const std::string& pattern, const std::string& text) {
    size_t p = 0, t = 0;
    size_t star = std::string::npos, mark = 0;

    while (t < text.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            mark = t;
        } else if (p < pattern.size() && pattern[p] == text[t]) {
            p++;
            t++;
        } else if (star != std::string::npos) {
            p = star + 1;
            t = ++mark;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        p++;
    }
    return p == pattern.size();
}

} // namespace plughost::adapters
