#pragma once
#include "adapters/module_registry.hpp"

namespace plughost::adapters::builtin {

// Module references of the built-in adapters
constexpr const char* MEMORY_CACHE_MODULE = "builtin:memory-cache";
constexpr const char* MEMORY_DOCUMENT_DB_MODULE = "builtin:memory-document-db";
constexpr const char* LOGGER_MODULE = "builtin:logger";
constexpr const char* LOG_RING_BUFFER_MODULE = "builtin:log-ring-buffer";
constexpr const char* LOG_PERSISTENCE_MODULE = "builtin:log-persistence";

AdapterModule memory_cache_module();
AdapterModule memory_document_db_module();
AdapterModule logger_module();
AdapterModule log_ring_buffer_module();
AdapterModule log_persistence_module();

// Register every built-in module under its reference
void register_builtin_modules(ModuleRegistry& registry);

} // namespace plughost::adapters::builtin
