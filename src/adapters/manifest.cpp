#include "adapters/manifest.hpp"
#include "core/errors.hpp"
#include <cctype>

namespace plughost::adapters {

using json = nlohmann::json;

namespace {

[[noreturn]] void invalid(const std::string& id, const std::string& field, const std::string& why) {
    std::string subject = id.empty() ? "Adapter manifest" : "Adapter manifest \"" + id + "\"";
    throw ConfigurationError(subject + ": invalid field '" + field + "': " + why);
}

std::string read_string(const json& j, const char* key, const std::string& id, bool required) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        if (required) {
            invalid(id, key, "missing");
        }
        return {};
    }
    if (!it->is_string()) {
        invalid(id, key, "must be a string");
    }
    return it->get<std::string>();
}

bool read_flag(const json& j, const char* key) {
    auto it = j.find(key);
    return it != j.end() && it->is_boolean() && it->get<bool>();
}

} // anonymous namespace

const char* adapter_type_to_string(AdapterType type) {
    switch (type) {
    case AdapterType::Core:
        return "core";
    case AdapterType::Extension:
        return "extension";
    case AdapterType::Proxy:
        return "proxy";
    }
    return "core";
}

std::optional<AdapterType> adapter_type_from_string(const std::string& name) {
    if (name == "core") return AdapterType::Core;
    if (name == "extension") return AdapterType::Extension;
    if (name == "proxy") return AdapterType::Proxy;
    return std::nullopt;
}

bool is_semver(const std::string& version) {
    size_t pos = 0;
    for (int part = 0; part < 3; part++) {
        size_t start = pos;
        while (pos < version.size() && std::isdigit(static_cast<unsigned char>(version[pos]))) {
            pos++;
        }
        if (pos == start) {
            return false;
        }
        if (part < 2) {
            if (pos >= version.size() || version[pos] != '.') {
                return false;
            }
            pos++;
        }
    }
    if (pos == version.size()) {
        return true;
    }
    if (version[pos] != '-' || pos + 1 == version.size()) {
        return false;
    }
    for (pos++; pos < version.size(); pos++) {
        char c = version[pos];
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '.' && c != '-') {
            return false;
        }
    }
    return true;
}

AdapterManifest parse_manifest(const json& j) {
    if (!j.is_object()) {
        throw ConfigurationError("Adapter manifest must be a JSON object");
    }

    AdapterManifest manifest;
    manifest.id = read_string(j, "id", "", true);
    const std::string& id = manifest.id;

    std::string manifest_version = read_string(j, "manifestVersion", id, false);
    if (!manifest_version.empty()) {
        manifest.manifest_version = manifest_version;
    }
    manifest.name = read_string(j, "name", id, true);
    manifest.version = read_string(j, "version", id, true);
    manifest.description = read_string(j, "description", id, false);
    manifest.implements = read_string(j, "implements", id, true);

    std::string type = read_string(j, "type", id, false);
    if (!type.empty()) {
        auto parsed = adapter_type_from_string(type);
        if (!parsed) {
            invalid(id, "type", "must be one of core, extension, proxy (got \"" + type + "\")");
        }
        manifest.type = *parsed;
    }

    if (auto req = j.find("requires"); req != j.end() && req->is_object()) {
        if (auto deps = req->find("adapters"); deps != req->end()) {
            if (!deps->is_array()) {
                invalid(id, "requires.adapters", "must be an array");
            }
            for (const auto& dep : *deps) {
                AdapterDependency entry;
                if (dep.is_string()) {
                    entry.id = dep.get<std::string>();
                } else if (dep.is_object()) {
                    entry.id = read_string(dep, "id", id, true);
                    entry.alias = read_string(dep, "alias", id, false);
                } else {
                    invalid(id, "requires.adapters", "entries must be a token or {id, alias}");
                }
                manifest.required_adapters.push_back(std::move(entry));
            }
        }
        manifest.platform_requirement = read_string(*req, "platform", id, false);
    }

    if (auto opt = j.find("optional"); opt != j.end() && opt->is_object()) {
        if (auto deps = opt->find("adapters"); deps != opt->end()) {
            if (!deps->is_array()) {
                invalid(id, "optional.adapters", "must be an array");
            }
            for (const auto& dep : *deps) {
                if (!dep.is_string()) {
                    invalid(id, "optional.adapters", "entries must be tokens");
                }
                manifest.optional_adapters.push_back(dep.get<std::string>());
            }
        }
    }

    if (auto ext = j.find("extends"); ext != j.end() && !ext->is_null()) {
        if (!ext->is_object()) {
            invalid(id, "extends", "must be an object");
        }
        AdapterExtension extension;
        extension.adapter = read_string(*ext, "adapter", id, true);
        extension.hook = read_string(*ext, "hook", id, true);
        extension.method = read_string(*ext, "method", id, true);
        if (auto prio = ext->find("priority"); prio != ext->end() && !prio->is_null()) {
            if (!prio->is_number_integer()) {
                invalid(id, "extends.priority", "must be an integer");
            }
            extension.priority = prio->get<int>();
        }
        manifest.extends = extension;
    }

    if (auto caps = j.find("capabilities"); caps != j.end() && caps->is_object()) {
        manifest.capabilities.streaming = read_flag(*caps, "streaming");
        manifest.capabilities.batch = read_flag(*caps, "batch");
        manifest.capabilities.search = read_flag(*caps, "search");
        manifest.capabilities.transactions = read_flag(*caps, "transactions");
        if (auto custom = caps->find("custom"); custom != caps->end() && custom->is_object()) {
            manifest.capabilities.custom = *custom;
        }
    }

    validate_manifest(manifest);
    return manifest;
}

void validate_manifest(const AdapterManifest& manifest) {
    const std::string& id = manifest.id;
    if (id.empty()) {
        invalid(id, "id", "must not be empty");
    }
    if (manifest.name.empty()) {
        invalid(id, "name", "must not be empty");
    }
    if (manifest.implements.empty()) {
        invalid(id, "implements", "must not be empty");
    }
    if (!is_semver(manifest.version)) {
        invalid(id, "version", "must be MAJOR.MINOR.PATCH (got \"" + manifest.version + "\")");
    }
    if (!is_semver(manifest.manifest_version)) {
        invalid(id, "manifestVersion", "must be MAJOR.MINOR.PATCH (got \"" + manifest.manifest_version + "\")");
    }
    for (const auto& dep : manifest.required_adapters) {
        if (dep.id.empty()) {
            invalid(id, "requires.adapters", "dependency id must not be empty");
        }
    }
    for (const auto& dep : manifest.optional_adapters) {
        if (dep.empty()) {
            invalid(id, "optional.adapters", "dependency token must not be empty");
        }
    }
    if (manifest.extends) {
        if (manifest.extends->adapter.empty()) {
            invalid(id, "extends.adapter", "must not be empty");
        }
        if (manifest.extends->hook.empty()) {
            invalid(id, "extends.hook", "must not be empty");
        }
        if (manifest.extends->method.empty()) {
            invalid(id, "extends.method", "must not be empty");
        }
    }
}

json manifest_to_json(const AdapterManifest& manifest) {
    json required = json::array();
    for (const auto& dep : manifest.required_adapters) {
        if (dep.alias.empty()) {
            required.push_back(dep.id);
        } else {
            required.push_back({{"id", dep.id}, {"alias", dep.alias}});
        }
    }

    json j = {
        {"manifestVersion", manifest.manifest_version},
        {"id", manifest.id},
        {"name", manifest.name},
        {"version", manifest.version},
        {"type", adapter_type_to_string(manifest.type)},
        {"implements", manifest.implements},
        {"requires", {{"adapters", required}}},
        {"optional", {{"adapters", manifest.optional_adapters}}},
        {"capabilities", {
            {"streaming", manifest.capabilities.streaming},
            {"batch", manifest.capabilities.batch},
            {"search", manifest.capabilities.search},
            {"transactions", manifest.capabilities.transactions},
            {"custom", manifest.capabilities.custom}
        }}
    };
    if (!manifest.description.empty()) {
        j["description"] = manifest.description;
    }
    if (!manifest.platform_requirement.empty()) {
        j["requires"]["platform"] = manifest.platform_requirement;
    }
    if (manifest.extends) {
        j["extends"] = {
            {"adapter", manifest.extends->adapter},
            {"hook", manifest.extends->hook},
            {"method", manifest.extends->method},
            {"priority", manifest.extends->priority}
        };
    }
    return j;
}

} // namespace plughost::adapters
