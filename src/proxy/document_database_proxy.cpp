#include "proxy/document_database_proxy.hpp"
#include "core/errors.hpp"

namespace plughost::proxy {

using json = nlohmann::json;

namespace {

int64_t as_count(const json& result, const char* method) {
    if (!result.is_number_integer()) {
        throw DeserializationError(std::string(method) + " returned a non-integer result");
    }
    return result.get<int64_t>();
}

} // anonymous namespace

DocumentDatabaseProxy::DocumentDatabaseProxy(std::shared_ptr<transport::Transport> transport,
                                             std::string adapter_token)
    : RemoteAdapter(std::move(adapter_token), std::move(transport)) {}

std::vector<json> DocumentDatabaseProxy::find(const std::string& collection, const json& filter,
                                              const adapters::FindOptions& options) {
    json result = call_remote("find", {collection, filter, adapters::find_options_to_json(options)});
    if (!result.is_array()) {
        throw DeserializationError("find returned a non-array result");
    }
    return result.get<std::vector<json>>();
}

json DocumentDatabaseProxy::find_by_id(const std::string& collection, const std::string& id) {
    return call_remote("findById", {collection, id});
}

json DocumentDatabaseProxy::insert_one(const std::string& collection, const json& document) {
    return call_remote("insertOne", {collection, document});
}

int64_t DocumentDatabaseProxy::update_many(const std::string& collection, const json& filter,
                                           const json& update) {
    return as_count(call_remote("updateMany", {collection, filter, update}), "updateMany");
}

json DocumentDatabaseProxy::update_by_id(const std::string& collection, const std::string& id,
                                         const json& update) {
    return call_remote("updateById", {collection, id, update});
}

int64_t DocumentDatabaseProxy::delete_many(const std::string& collection, const json& filter) {
    return as_count(call_remote("deleteMany", {collection, filter}), "deleteMany");
}

bool DocumentDatabaseProxy::delete_by_id(const std::string& collection, const std::string& id) {
    json result = call_remote("deleteById", {collection, id});
    return result.is_boolean() && result.get<bool>();
}

int64_t DocumentDatabaseProxy::count(const std::string& collection, const json& filter) {
    return as_count(call_remote("count", {collection, filter}), "count");
}

} // namespace plughost::proxy
