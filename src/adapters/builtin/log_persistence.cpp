#include "adapters/builtin/log_persistence.hpp"
#include <algorithm>
#include <cctype>

namespace plughost::adapters::builtin {

using json = nlohmann::json;

namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// Levels at or above min, as stored strings
json levels_from(LogLevel min) {
    json levels = json::array();
    for (int l = static_cast<int>(min); l <= static_cast<int>(LogLevel::Fatal); l++) {
        levels.push_back(log_level_to_string(static_cast<LogLevel>(l)));
    }
    return levels;
}

LogPage page_of(const std::vector<json>& docs, size_t offset, std::optional<size_t> limit) {
    LogPage page;
    page.total = static_cast<int64_t>(docs.size());
    size_t end = docs.size();
    if (limit && *limit < end && offset < end - *limit) {
        end = offset + *limit;
    }
    for (size_t i = offset; i < end; i++) {
        page.logs.push_back(docs[i].get<LogRecord>());
    }
    page.has_more = end < docs.size();
    return page;
}

} // anonymous namespace

LogPersistence::LogPersistence(std::shared_ptr<DocumentDatabase> database, std::string collection)
    : database_(std::move(database)), collection_(std::move(collection)) {}

void LogPersistence::write(const LogRecord& record) {
    database_->insert_one(collection_, json(record));
}

json LogPersistence::to_filter(const LogQuery& query) const {
    json filter = json::object();
    if (query.level) {
        filter["level"] = {{"$in", levels_from(*query.level)}};
    }
    if (query.source) {
        filter["source"] = *query.source;
    }
    if (query.start_time || query.end_time) {
        json range = json::object();
        if (query.start_time) range["$gte"] = *query.start_time;
        if (query.end_time) range["$lte"] = *query.end_time;
        filter["timestamp"] = range;
    }
    return filter;
}

LogPage LogPersistence::query(const LogQuery& query, size_t offset) {
    FindOptions options;
    options.sort = {{"timestamp", -1}};
    auto docs = database_->find(collection_, to_filter(query), options);
    return page_of(docs, offset, query.limit);
}

LogPage LogPersistence::search(const std::string& text, size_t limit, size_t offset) {
    FindOptions options;
    options.sort = {{"timestamp", -1}};
    auto docs = database_->find(collection_, json::object(), options);

    std::string needle = lowercase(text);
    std::vector<json> matches;
    for (auto& doc : docs) {
        if (lowercase(doc.value("message", std::string())).find(needle) != std::string::npos) {
            matches.push_back(std::move(doc));
        }
    }
    return page_of(matches, offset, limit);
}

int64_t LogPersistence::delete_older_than(int64_t timestamp_ms) {
    return database_->delete_many(collection_, {{"timestamp", {{"$lt", timestamp_ms}}}});
}

json LogPersistence::stats() {
    json result = {{"totalLogs", database_->count(collection_, json::object())}};

    FindOptions oldest;
    oldest.sort = {{"timestamp", 1}};
    oldest.limit = 1;
    auto first = database_->find(collection_, json::object(), oldest);

    FindOptions newest;
    newest.sort = {{"timestamp", -1}};
    newest.limit = 1;
    auto last = database_->find(collection_, json::object(), newest);

    result["oldestTimestamp"] = first.empty() ? json() : first.front()["timestamp"];
    result["newestTimestamp"] = last.empty() ? json() : last.front()["timestamp"];

    json by_level = json::object();
    for (int l = 0; l <= static_cast<int>(LogLevel::Fatal); l++) {
        const char* level = log_level_to_string(static_cast<LogLevel>(l));
        by_level[level] = database_->count(collection_, {{"level", level}});
    }
    result["byLevel"] = by_level;
    return result;
}

HookCallback LogPersistence::extension_method(const std::string& name) {
    if (name != "write") {
        return nullptr;
    }
    std::weak_ptr<Adapter> weak = weak_from_this();
    return [this, weak](const json& payload) {
        if (auto self = weak.lock()) {
            write(payload.get<LogRecord>());
        }
    };
}

} // namespace plughost::adapters::builtin
