#include "adapters/log_store.hpp"
#include <stdexcept>

namespace plughost::adapters {

using json = nlohmann::json;

namespace {

size_t count_arg(const std::vector<json>& args, size_t index, size_t fallback) {
    const json& value = arg_at(args, index);
    return value.is_number_unsigned() ? value.get<size_t>() : fallback;
}

} // anonymous namespace

void to_json(json& j, const LogBufferStats& stats) {
    j = json{
        {"size", stats.size},
        {"maxSize", stats.max_size},
        {"totalAppended", stats.total_appended},
        {"dropped", stats.dropped}
    };
}

void from_json(const json& j, LogBufferStats& stats) {
    stats.size = j.value("size", size_t{0});
    stats.max_size = j.value("maxSize", size_t{0});
    stats.total_appended = j.value("totalAppended", uint64_t{0});
    stats.dropped = j.value("dropped", uint64_t{0});
}

void to_json(json& j, const LogPage& page) {
    j = json{{"logs", page.logs}, {"total", page.total}, {"hasMore", page.has_more}};
}

void from_json(const json& j, LogPage& page) {
    page.logs = j.value("logs", std::vector<LogRecord>());
    page.total = j.value("total", int64_t{0});
    page.has_more = j.value("hasMore", false);
}

void LogBuffer::register_methods(MethodTable& table) {
    table.register_method("query", [this](const std::vector<json>& args) {
        return json(query(log_query_from_json(arg_at(args, 0))));
    });

    table.register_method("stats", [this](const std::vector<json>&) {
        return json(stats());
    });
}

void LogStore::register_methods(MethodTable& table) {
    table.register_method("query", [this](const std::vector<json>& args) {
        return json(query(log_query_from_json(arg_at(args, 0)), count_arg(args, 1, 0)));
    });

    table.register_method("search", [this](const std::vector<json>& args) {
        return json(search(string_arg(args, 0, "text"), count_arg(args, 1, 100), count_arg(args, 2, 0)));
    });

    table.register_method("deleteOlderThan", [this](const std::vector<json>& args) {
        const json& timestamp = arg_at(args, 0);
        if (!timestamp.is_number()) {
            throw std::invalid_argument("Argument 'timestamp' must be a number");
        }
        return json(delete_older_than(timestamp.get<int64_t>()));
    });

    table.register_method("stats", [this](const std::vector<json>&) {
        return stats();
    });
}

} // namespace plughost::adapters
