// Catch2 provides main via Catch2::Catch2WithMain; this listener only keeps
// runtime logging quiet while the suite runs.
#define CATCH_CONFIG_EXTERNAL_INTERFACES
#include <catch2/catch.hpp>
#include <spdlog/spdlog.h>
#include "util/logger.hpp"

namespace {

struct QuietLogging : Catch::TestEventListenerBase {
    using TestEventListenerBase::TestEventListenerBase;

    void testRunStarting(const Catch::TestRunInfo& /*info*/) override {
        plughost::util::init_logger();
        plughost::util::set_log_level(spdlog::level::err);
    }
};

} // anonymous namespace

CATCH_REGISTER_LISTENER(QuietLogging)
