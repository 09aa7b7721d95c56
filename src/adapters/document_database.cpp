#include "adapters/document_database.hpp"
#include <stdexcept>

namespace plughost::adapters {

using json = nlohmann::json;

namespace {

json object_arg(const std::vector<json>& args, size_t index, const char* name) {
    const json& value = arg_at(args, index);
    if (value.is_null()) {
        return json::object();
    }
    if (!value.is_object()) {
        throw std::invalid_argument(std::string("Argument '") + name + "' must be an object");
    }
    return value;
}

} // anonymous namespace

FindOptions find_options_from_json(const json& j) {
    FindOptions options;
    if (!j.is_object()) {
        return options;
    }
    if (auto it = j.find("limit"); it != j.end() && it->is_number_unsigned()) {
        options.limit = it->get<size_t>();
    } else if (it != j.end() && it->is_number_integer() && it->get<int64_t>() >= 0) {
        options.limit = static_cast<size_t>(it->get<int64_t>());
    }
    if (auto it = j.find("skip"); it != j.end() && it->is_number_integer() && it->get<int64_t>() > 0) {
        options.skip = static_cast<size_t>(it->get<int64_t>());
    }
    if (auto it = j.find("sort"); it != j.end() && it->is_object()) {
        options.sort = *it;
    }
    return options;
}

json find_options_to_json(const FindOptions& options) {
    json j = json::object();
    if (options.limit) {
        j["limit"] = *options.limit;
    }
    if (options.skip > 0) {
        j["skip"] = options.skip;
    }
    if (!options.sort.empty()) {
        j["sort"] = options.sort;
    }
    return j;
}

void DocumentDatabase::register_methods(MethodTable& table) {
    table.register_method("find", [this](const std::vector<json>& args) {
        auto docs = find(string_arg(args, 0, "collection"), object_arg(args, 1, "filter"),
                         find_options_from_json(arg_at(args, 2)));
        return json(docs);
    });

    table.register_method("findById", [this](const std::vector<json>& args) {
        return find_by_id(string_arg(args, 0, "collection"), string_arg(args, 1, "id"));
    });

    table.register_method("insertOne", [this](const std::vector<json>& args) {
        const json& document = arg_at(args, 1);
        if (!document.is_object()) {
            throw std::invalid_argument("Argument 'document' must be an object");
        }
        return insert_one(string_arg(args, 0, "collection"), document);
    });

    table.register_method("updateMany", [this](const std::vector<json>& args) {
        return json(update_many(string_arg(args, 0, "collection"), object_arg(args, 1, "filter"),
                                object_arg(args, 2, "update")));
    });

    table.register_method("updateById", [this](const std::vector<json>& args) {
        return update_by_id(string_arg(args, 0, "collection"), string_arg(args, 1, "id"),
                            object_arg(args, 2, "update"));
    });

    table.register_method("deleteMany", [this](const std::vector<json>& args) {
        return json(delete_many(string_arg(args, 0, "collection"), object_arg(args, 1, "filter")));
    });

    table.register_method("deleteById", [this](const std::vector<json>& args) {
        return json(delete_by_id(string_arg(args, 0, "collection"), string_arg(args, 1, "id")));
    });

    table.register_method("count", [this](const std::vector<json>& args) {
        return json(count(string_arg(args, 0, "collection"), object_arg(args, 1, "filter")));
    });
}

} // namespace plughost::adapters
