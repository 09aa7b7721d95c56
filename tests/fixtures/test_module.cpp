// Adapter module built as a shared library and loaded through dlopen.
#include <memory>
#include <string>
#include "adapters/module_registry.hpp"

namespace {

using plughost::adapters::Adapter;
using plughost::adapters::DependencyBundle;
using plughost::adapters::HookCallback;
using json = nlohmann::json;

class GreeterAdapter : public Adapter {
public:
    explicit GreeterAdapter(std::string greeting) : greeting_(std::move(greeting)) {}

    HookCallback extension_method(const std::string& name) override {
        if (name != "remember") {
            return nullptr;
        }
        return [this](const json& payload) { last_ = payload; };
    }

    const std::string& greeting() const { return greeting_; }

private:
    std::string greeting_;
    json last_;
};

std::shared_ptr<Adapter> create_greeter(const json& settings, const DependencyBundle& /*deps*/) {
    std::string greeting = "hello";
    if (settings.is_object() && settings.contains("greeting") && settings["greeting"].is_string()) {
        greeting = settings["greeting"].get<std::string>();
    }
    return std::make_shared<GreeterAdapter>(greeting);
}

const char* MANIFEST = R"({
    "id": "greeter",
    "name": "Greeter",
    "version": "0.3.1",
    "implements": "IGreeter",
    "capabilities": {"custom": {"languages": ["en"]}}
})";

const plughost::adapters::ModuleDescriptor DESCRIPTOR = {
    plughost::adapters::MODULE_ABI_VERSION,
    MANIFEST,
    &create_greeter
};

} // anonymous namespace

extern "C" const plughost::adapters::ModuleDescriptor* plughost_adapter_module() {
    return &DESCRIPTOR;
}
