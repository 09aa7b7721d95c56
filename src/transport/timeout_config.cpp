#include "transport/timeout_config.hpp"

namespace plughost::transport {

using std::chrono::milliseconds;

TimeoutTable TimeoutTable::defaults() {
    TimeoutTable table;

    table.set("cache.get", milliseconds(5000));
    table.set("cache.set", milliseconds(5000));
    table.set("cache.delete", milliseconds(5000));
    table.set("cache.clear", milliseconds(10000));
    table.set("cache.*", milliseconds(10000));

    table.set("db.find", milliseconds(15000));
    table.set("db.findById", milliseconds(15000));
    table.set("db.count", milliseconds(15000));
    table.set("db.insertOne", milliseconds(30000));
    table.set("db.updateMany", milliseconds(30000));
    table.set("db.updateById", milliseconds(30000));
    table.set("db.deleteMany", milliseconds(30000));
    table.set("db.deleteById", milliseconds(30000));
    table.set("db.*", milliseconds(30000));

    table.set("logs.*", milliseconds(15000));
    table.set("*", FALLBACK_TIMEOUT);
    return table;
}

void TimeoutTable::set(const std::string& key, milliseconds timeout) {
    entries_[key] = timeout;
}

milliseconds TimeoutTable::lookup(const std::string& adapter, const std::string& method) const {
    auto it = entries_.find(adapter + "." + method);
    if (it != entries_.end()) {
        return it->second;
    }
    it = entries_.find(adapter + ".*");
    if (it != entries_.end()) {
        return it->second;
    }
    it = entries_.find("*");
    if (it != entries_.end()) {
        return it->second;
    }
    return FALLBACK_TIMEOUT;
}

milliseconds select_timeout(const TimeoutTable& table, const std::string& adapter,
                            const std::string& method, std::optional<milliseconds> per_call,
                            std::optional<milliseconds> configured_default) {
    if (per_call) {
        return *per_call;
    }
    if (configured_default) {
        return *configured_default;
    }
    return table.lookup(adapter, method);
}

} // namespace plughost::transport
