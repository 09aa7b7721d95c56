#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "adapters/adapter.hpp"
#include "core/diagnostics.hpp"
#include "ipc/bulk_transfer.hpp"
#include "ipc/protocol.hpp"
#include "runtime/adapter_loader.hpp"

namespace plughost::ipc {

// Routes calls to adapter methods. The token -> method table map is built
// once at construction; dispatch is safe from any number of threads as long
// as the adapters themselves are.
class AdapterDispatcher {
public:
    AdapterDispatcher(const runtime::AdapterInstances& adapters, BulkTransfer& bulk,
                      core::DiagnosticSink* diagnostics = nullptr);

    // Never throws: every failure becomes an error response
    AdapterResponse dispatch(const AdapterCall& call) const;

    bool has_adapter(const std::string& token) const { return table_.count(token) > 0; }
    std::vector<std::string> tokens() const;
    std::vector<std::string> methods(const std::string& token) const;

private:
    struct Entry {
        std::shared_ptr<adapters::Adapter> instance;
        adapters::MethodTable methods;
    };

    AdapterResponse invoke(const Entry& entry, const AdapterCall& call) const;

    std::map<std::string, Entry> table_;
    BulkTransfer& bulk_;
    core::DiagnosticSink* diagnostics_;
};

} // namespace plughost::ipc
