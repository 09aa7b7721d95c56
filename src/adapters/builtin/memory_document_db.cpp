#include "adapters/builtin/memory_document_db.hpp"
#include "adapters/logger.hpp"
#include <algorithm>
#include <cstdio>
#include <random>
#include <stdexcept>

namespace plughost::adapters::builtin {

using json = nlohmann::json;

namespace {

const json* lookup_field(const json& document, const std::string& path) {
    const json* current = &document;
    size_t start = 0;
    while (true) {
        if (!current->is_object()) {
            return nullptr;
        }
        size_t dot = path.find('.', start);
        std::string part = path.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        auto it = current->find(part);
        if (it == current->end()) {
            return nullptr;
        }
        current = &*it;
        if (dot == std::string::npos) {
            return current;
        }
        start = dot + 1;
    }
}

json* lookup_or_create(json& document, const std::string& path) {
    json* current = &document;
    size_t start = 0;
    while (true) {
        if (!current->is_object()) {
            *current = json::object();
        }
        size_t dot = path.find('.', start);
        std::string part = path.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        current = &(*current)[part];
        if (dot == std::string::npos) {
            return current;
        }
        start = dot + 1;
    }
}

void erase_field(json& document, const std::string& path) {
    size_t dot = path.rfind('.');
    if (dot == std::string::npos) {
        document.erase(path);
        return;
    }
    json* parent = &document;
    size_t start = 0;
    while (start <= dot) {
        size_t next = path.find('.', start);
        if (!parent->is_object()) {
            return;
        }
        auto it = parent->find(path.substr(start, next - start));
        if (it == parent->end()) {
            return;
        }
        parent = &*it;
        start = next + 1;
    }
    if (parent->is_object()) {
        parent->erase(path.substr(dot + 1));
    }
}

bool is_operator_object(const json& value) {
    if (!value.is_object() || value.empty()) {
        return false;
    }
    for (auto it = value.begin(); it != value.end(); ++it) {
        if (it.key().empty() || it.key()[0] != '$') {
            return false;
        }
    }
    return true;
}

bool values_equal(const json* field, const json& expected) {
    if (!field) {
        return expected.is_null();
    }
    if (field->is_number() && expected.is_number()) {
        return compare_values(*field, expected) == 0;
    }
    return *field == expected;
}

bool contains_value(const json* field, const json& candidates) {
    if (!candidates.is_array()) {
        throw std::invalid_argument("$in/$nin expects an array");
    }
    for (const auto& candidate : candidates) {
        if (values_equal(field, candidate)) {
            return true;
        }
    }
    return false;
}

bool ordered(const json* field, const json& bound, bool (*accept)(int)) {
    if (!field) {
        return false;
    }
    auto cmp = compare_values(*field, bound);
    return cmp && accept(*cmp);
}

bool matches_condition(const json* field, const json& condition) {
    if (!is_operator_object(condition)) {
        return values_equal(field, condition);
    }

    for (auto it = condition.begin(); it != condition.end(); ++it) {
        const std::string& op = it.key();
        const json& operand = it.value();
        bool ok;
        if (op == "$eq") {
            ok = values_equal(field, operand);
        } else if (op == "$ne") {
            ok = !values_equal(field, operand);
        } else if (op == "$gt") {
            ok = ordered(field, operand, [](int c) { return c > 0; });
        } else if (op == "$gte") {
            ok = ordered(field, operand, [](int c) { return c >= 0; });
        } else if (op == "$lt") {
            ok = ordered(field, operand, [](int c) { return c < 0; });
        } else if (op == "$lte") {
            ok = ordered(field, operand, [](int c) { return c <= 0; });
        } else if (op == "$in") {
            ok = contains_value(field, operand);
        } else if (op == "$nin") {
            ok = !contains_value(field, operand);
        } else {
            throw std::invalid_argument("Unsupported filter operator '" + op + "'");
        }
        if (!ok) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

std::optional<int> compare_values(const json& a, const json& b) {
    if (a.is_number() && b.is_number()) {
        if (a.is_number_integer() && b.is_number_integer()) {
            if (a.is_number_unsigned() && b.is_number_unsigned()) {
                auto x = a.get<uint64_t>(), y = b.get<uint64_t>();
                return x < y ? -1 : (x > y ? 1 : 0);
            }
            auto x = a.get<int64_t>(), y = b.get<int64_t>();
            return x < y ? -1 : (x > y ? 1 : 0);
        }
        double x = a.get<double>(), y = b.get<double>();
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    if (a.is_string() && b.is_string()) {
        int c = a.get_ref<const std::string&>().compare(b.get_ref<const std::string&>());
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    if (a.is_boolean() && b.is_boolean()) {
        return static_cast<int>(a.get<bool>()) - static_cast<int>(b.get<bool>());
    }
    return std::nullopt;
}

bool matches_filter(const json& document, const json& filter) {
    if (filter.is_null()) {
        return true;
    }
    if (!filter.is_object()) {
        throw std::invalid_argument("Filter must be an object");
    }
    for (auto it = filter.begin(); it != filter.end(); ++it) {
        if (!matches_condition(lookup_field(document, it.key()), it.value())) {
            return false;
        }
    }
    return true;
}

void apply_update(json& document, const json& update) {
    if (!update.is_object()) {
        throw std::invalid_argument("Update must be an object");
    }

    bool has_operators = false;
    for (auto it = update.begin(); it != update.end(); ++it) {
        if (!it.key().empty() && it.key()[0] == '$') {
            has_operators = true;
            break;
        }
    }

    auto set_fields = [&document](const json& fields) {
        if (!fields.is_object()) {
            throw std::invalid_argument("$set expects an object");
        }
        for (auto it = fields.begin(); it != fields.end(); ++it) {
            if (it.key() == "id") {
                continue;
            }
            *lookup_or_create(document, it.key()) = it.value();
        }
    };

    if (!has_operators) {
        set_fields(update);
        return;
    }

    for (auto it = update.begin(); it != update.end(); ++it) {
        const std::string& op = it.key();
        const json& operand = it.value();
        if (op == "$set") {
            set_fields(operand);
        } else if (op == "$unset") {
            if (operand.is_object()) {
                for (auto field = operand.begin(); field != operand.end(); ++field) {
                    if (field.key() != "id") {
                        erase_field(document, field.key());
                    }
                }
            } else if (operand.is_array()) {
                for (const auto& field : operand) {
                    if (field.is_string() && field.get<std::string>() != "id") {
                        erase_field(document, field.get<std::string>());
                    }
                }
            } else {
                throw std::invalid_argument("$unset expects an object or array");
            }
        } else if (op == "$inc") {
            if (!operand.is_object()) {
                throw std::invalid_argument("$inc expects an object");
            }
            for (auto field = operand.begin(); field != operand.end(); ++field) {
                if (!field.value().is_number()) {
                    throw std::invalid_argument("$inc amount for '" + field.key() + "' must be a number");
                }
                json* target = lookup_or_create(document, field.key());
                if (target->is_null()) {
                    *target = field.value();
                } else if (!target->is_number()) {
                    throw std::invalid_argument("Cannot $inc non-numeric field '" + field.key() + "'");
                } else if (target->is_number_integer() && field.value().is_number_integer()) {
                    *target = target->get<int64_t>() + field.value().get<int64_t>();
                } else {
                    *target = target->get<double>() + field.value().get<double>();
                }
            }
        } else {
            throw std::invalid_argument("Unsupported update operator '" + op + "'");
        }
    }
}

MemoryDocumentDatabase::MemoryDocumentDatabase() {
    std::random_device rd;
    char buf[9];
    snprintf(buf, sizeof(buf), "%08x", rd());
    id_prefix_ = buf;
}

std::string MemoryDocumentDatabase::generate_id() {
    return id_prefix_ + "-" + std::to_string(next_id_++);
}

std::vector<json> MemoryDocumentDatabase::find(const std::string& collection, const json& filter,
                                               const FindOptions& options) {
    std::vector<json> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = collections_.find(collection);
        if (it == collections_.end()) {
            return result;
        }
        for (const auto& doc : it->second) {
            if (matches_filter(doc, filter)) {
                result.push_back(doc);
            }
        }
    }

    if (!options.sort.empty()) {
        std::stable_sort(result.begin(), result.end(), [&options](const json& a, const json& b) {
            for (auto key = options.sort.begin(); key != options.sort.end(); ++key) {
                int direction = key.value().is_number() && key.value().get<int>() < 0 ? -1 : 1;
                const json* x = lookup_field(a, key.key());
                const json* y = lookup_field(b, key.key());
                // Missing fields sort first
                if (!x || !y) {
                    if (x == y) continue;
                    return (x == nullptr) == (direction > 0);
                }
                auto cmp = compare_values(*x, *y);
                if (!cmp || *cmp == 0) continue;
                return direction > 0 ? *cmp < 0 : *cmp > 0;
            }
            return false;
        });
    }

    if (options.skip > 0) {
        result.erase(result.begin(), result.begin() + std::min(options.skip, result.size()));
    }
    if (options.limit && result.size() > *options.limit) {
        result.resize(*options.limit);
    }
    return result;
}

json MemoryDocumentDatabase::find_by_id(const std::string& collection, const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = collections_.find(collection);
    if (it == collections_.end()) {
        return nullptr;
    }
    for (const auto& doc : it->second) {
        if (doc.value("id", std::string()) == id) {
            return doc;
        }
    }
    return nullptr;
}

json MemoryDocumentDatabase::insert_one(const std::string& collection, const json& document) {
    if (!document.is_object()) {
        throw std::invalid_argument("Document must be an object");
    }

    json stored = document;
    std::lock_guard<std::mutex> lock(mutex_);
    auto& docs = collections_[collection];

    auto id_it = stored.find("id");
    if (id_it == stored.end() || !id_it->is_string() || id_it->get<std::string>().empty()) {
        stored["id"] = generate_id();
    } else {
        const std::string id = id_it->get<std::string>();
        for (const auto& doc : docs) {
            if (doc.value("id", std::string()) == id) {
                throw std::invalid_argument("Document with id '" + id + "' already exists in " + collection);
            }
        }
    }

    int64_t now = now_ms();
    if (!stored.contains("createdAt")) {
        stored["createdAt"] = now;
    }
    stored["updatedAt"] = now;

    docs.push_back(stored);
    return stored;
}

int64_t MemoryDocumentDatabase::update_many(const std::string& collection, const json& filter,
                                            const json& update) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = collections_.find(collection);
    if (it == collections_.end()) {
        return 0;
    }

    int64_t modified = 0;
    int64_t now = now_ms();
    for (auto& doc : it->second) {
        if (matches_filter(doc, filter)) {
            json updated = doc;
            apply_update(updated, update);
            updated["updatedAt"] = now;
            doc = std::move(updated);
            modified++;
        }
    }
    return modified;
}

json MemoryDocumentDatabase::update_by_id(const std::string& collection, const std::string& id,
                                          const json& update) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = collections_.find(collection);
    if (it == collections_.end()) {
        return nullptr;
    }
    for (auto& doc : it->second) {
        if (doc.value("id", std::string()) == id) {
            // Apply to a copy so a failing operator leaves the document intact
            json updated = doc;
            apply_update(updated, update);
            updated["updatedAt"] = now_ms();
            doc = std::move(updated);
            return doc;
        }
    }
    return nullptr;
}

int64_t MemoryDocumentDatabase::delete_many(const std::string& collection, const json& filter) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = collections_.find(collection);
    if (it == collections_.end()) {
        return 0;
    }
    auto& docs = it->second;
    size_t before = docs.size();
    docs.erase(std::remove_if(docs.begin(), docs.end(),
                              [&filter](const json& doc) { return matches_filter(doc, filter); }),
               docs.end());
    return static_cast<int64_t>(before - docs.size());
}

bool MemoryDocumentDatabase::delete_by_id(const std::string& collection, const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = collections_.find(collection);
    if (it == collections_.end()) {
        return false;
    }
    auto& docs = it->second;
    for (auto doc = docs.begin(); doc != docs.end(); ++doc) {
        if (doc->value("id", std::string()) == id) {
            docs.erase(doc);
            return true;
        }
    }
    return false;
}

int64_t MemoryDocumentDatabase::count(const std::string& collection, const json& filter) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = collections_.find(collection);
    if (it == collections_.end()) {
        return 0;
    }
    return static_cast<int64_t>(std::count_if(it->second.begin(), it->second.end(),
                                              [&filter](const json& doc) { return matches_filter(doc, filter); }));
}

std::vector<std::string> MemoryDocumentDatabase::collections() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& [name, docs] : collections_) {
        names.push_back(name);
    }
    return names;
}

} // namespace plughost::adapters::builtin
