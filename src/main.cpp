#include <spdlog/spdlog.h>
#include "core/errors.hpp"
#include "host/host.hpp"
#include "util/logger.hpp"

int main(int argc, char** argv) {
    plughost::util::init_logger();

    spdlog::info("=================================");
    spdlog::info("  plughost v0.1.0");
    spdlog::info("  Adapter host");
    spdlog::info("=================================");

    // Parse command line args
    plughost::host::Host::Config config;
    if (argc > 1) {
        try {
            config = plughost::host::load_host_config(argv[1]);
        } catch (const plughost::ConfigurationError& e) {
            spdlog::error("{}", e.what());
            return 1;
        }
    } else {
        spdlog::warn("No configuration file given, starting with an empty adapter set");
    }
    plughost::host::apply_env_overrides(config);
    plughost::util::set_log_level(plughost::util::parse_log_level(config.log_level));

    // Create and initialize host
    plughost::host::Host host(config);

    if (!host.init()) {
        spdlog::error("Failed to initialize host");
        return 1;
    }

    // Run (blocks until Ctrl+C)
    host.run();

    return 0;
}
