#include "core/errors.hpp"

namespace plughost {

bool is_retryable(const std::exception& error) {
    if (auto* e = dynamic_cast<const Error*>(&error)) {
        return e->retryable();
    }
    return false;
}

} // namespace plughost
