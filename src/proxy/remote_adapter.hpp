#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "ipc/protocol.hpp"
#include "transport/transport.hpp"

namespace plughost::proxy {

// Shared plumbing of proxy stubs: marshal args, send, unmarshal the result
// or re-raise the remote error as ApplicationError.
class RemoteAdapter {
public:
    RemoteAdapter(std::string adapter_token, std::shared_ptr<transport::Transport> transport);
    virtual ~RemoteAdapter() = default;

    const std::string& adapter_token() const { return adapter_token_; }

    // Attached to every subsequent call
    void set_context(std::optional<ipc::CallContext> context) { context_ = std::move(context); }
    const std::optional<ipc::CallContext>& context() const { return context_; }

protected:
    nlohmann::json call_remote(const std::string& method, const std::vector<nlohmann::json>& args,
                               std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

private:
    std::string adapter_token_;
    std::shared_ptr<transport::Transport> transport_;
    std::optional<ipc::CallContext> context_;
};

} // namespace plughost::proxy
