#include "proxy/remote_adapter.hpp"
#include "core/errors.hpp"
#include "core/serializer.hpp"
#include <stdexcept>

namespace plughost::proxy {

using json = nlohmann::json;

RemoteAdapter::RemoteAdapter(std::string adapter_token, std::shared_ptr<transport::Transport> transport)
    : adapter_token_(std::move(adapter_token)), transport_(std::move(transport)) {
    if (!transport_) {
        throw std::invalid_argument("Proxy for \"" + adapter_token_ + "\" needs a transport");
    }
}

json RemoteAdapter::call_remote(const std::string& method, const std::vector<json>& args,
                                std::optional<std::chrono::milliseconds> timeout) const {
    transport::CallOptions options;
    options.timeout = timeout;
    options.context = context_;

    ipc::AdapterResponse response = transport_->send(adapter_token_, method, core::serialize_args(args), options);

    if (response.error) {
        core::ErrorValue error = core::deserialize_error(core::deserialize(*response.error));
        throw ApplicationError(error.name, error.message, error.code, error.stack);
    }
    if (!response.result) {
        return nullptr;
    }
    return core::deserialize(*response.result);
}

} // namespace plughost::proxy
