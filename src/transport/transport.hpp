#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "ipc/protocol.hpp"

namespace plughost::transport {

struct CallOptions {
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<ipc::CallContext> context;
};

// Caller side of the adapter RPC protocol
class Transport {
public:
    virtual ~Transport() = default;

    // Send serialized args and block until the matching response arrives.
    // Returns the response carrying a serialized result or error. Throws
    // TransportError, TimeoutError or CircuitOpenError on transport failures.
    virtual ipc::AdapterResponse send(const std::string& adapter, const std::string& method,
                                      const nlohmann::json& args,
                                      const CallOptions& options = {}) = 0;

    virtual void close() = 0;
    virtual bool is_closed() const = 0;
};

} // namespace plughost::transport
