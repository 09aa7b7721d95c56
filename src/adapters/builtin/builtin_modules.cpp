#include "adapters/builtin/builtin_modules.hpp"
#include "adapters/builtin/log_persistence.hpp"
#include "adapters/builtin/log_ring_buffer.hpp"
#include "adapters/builtin/memory_cache.hpp"
#include "adapters/builtin/memory_document_db.hpp"
#include "adapters/builtin/spdlog_logger.hpp"

namespace plughost::adapters::builtin {

using json = nlohmann::json;

namespace {

AdapterManifest core_manifest(const std::string& id, const std::string& name,
                              const std::string& implements) {
    AdapterManifest manifest;
    manifest.id = id;
    manifest.name = name;
    manifest.version = "1.0.0";
    manifest.type = AdapterType::Core;
    manifest.implements = implements;
    return manifest;
}

} // anonymous namespace

AdapterModule memory_cache_module() {
    AdapterModule module;
    module.manifest = core_manifest("memory-cache", "In-memory cache", "ICache");
    module.manifest.description = "Process-local key/value cache with TTL";
    module.create = [](const json& settings, const DependencyBundle&) {
        return std::make_shared<MemoryCache>(memory_cache_config_from_json(settings));
    };
    return module;
}

AdapterModule memory_document_db_module() {
    AdapterModule module;
    module.manifest = core_manifest("memory-document-db", "In-memory document database",
                                    "IDocumentDatabase");
    module.manifest.capabilities.search = true;
    module.create = [](const json&, const DependencyBundle&) {
        return std::make_shared<MemoryDocumentDatabase>();
    };
    return module;
}

AdapterModule logger_module() {
    AdapterModule module;
    module.manifest = core_manifest("logger", "spdlog logger", "ILogger");
    module.manifest.capabilities.custom = {{"hooks", json::array({SpdlogLogger::ON_LOG_HOOK})}};
    module.create = [](const json& settings, const DependencyBundle&) {
        return std::make_shared<SpdlogLogger>(spdlog_logger_config_from_json(settings));
    };
    return module;
}

AdapterModule log_ring_buffer_module() {
    AdapterModule module;
    module.manifest = core_manifest("log-ring-buffer", "Log ring buffer", "ILogBuffer");
    module.manifest.type = AdapterType::Extension;
    module.manifest.extends = AdapterExtension{"logger", SpdlogLogger::ON_LOG_HOOK, "append", 10};
    module.create = [](const json& settings, const DependencyBundle&) {
        size_t max_size = LogRingBuffer::DEFAULT_MAX_SIZE;
        if (settings.is_object()) {
            if (auto it = settings.find("maxSize"); it != settings.end() && it->is_number_unsigned()) {
                max_size = it->get<size_t>();
            }
        }
        return std::make_shared<LogRingBuffer>(max_size);
    };
    return module;
}

AdapterModule log_persistence_module() {
    AdapterModule module;
    module.manifest = core_manifest("log-persistence", "Log persistence", "ILogPersistence");
    module.manifest.type = AdapterType::Extension;
    module.manifest.required_adapters.push_back(AdapterDependency{"db", "database"});
    module.manifest.extends = AdapterExtension{"logger", SpdlogLogger::ON_LOG_HOOK, "write", 5};
    module.manifest.capabilities.search = true;
    module.create = [](const json& settings, const DependencyBundle& deps) {
        auto database = deps.require<DocumentDatabase>("database", "IDocumentDatabase");
        std::string collection = LogPersistence::DEFAULT_COLLECTION;
        if (settings.is_object()) {
            if (auto it = settings.find("collection"); it != settings.end() && it->is_string()) {
                collection = it->get<std::string>();
            }
        }
        return std::make_shared<LogPersistence>(std::move(database), collection);
    };
    return module;
}

void register_builtin_modules(ModuleRegistry& registry) {
    registry.register_module(MEMORY_CACHE_MODULE, memory_cache_module());
    registry.register_module(MEMORY_DOCUMENT_DB_MODULE, memory_document_db_module());
    registry.register_module(LOGGER_MODULE, logger_module());
    registry.register_module(LOG_RING_BUFFER_MODULE, log_ring_buffer_module());
    registry.register_module(LOG_PERSISTENCE_MODULE, log_persistence_module());
}

} // namespace plughost::adapters::builtin
