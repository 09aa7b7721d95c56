#pragma once
#include <chrono>
#include <cstdint>
#include <exception>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace plughost::core {

// Tag values of the structured wire forms
constexpr const char* TYPE_KEY = "__type";
constexpr const char* BUFFER_TYPE = "Buffer";
constexpr const char* DATE_TYPE = "Date";
constexpr const char* ERROR_TYPE = "Error";
constexpr const char* BULK_TYPE = "BulkTransfer";

constexpr int MAX_NESTING_DEPTH = 256;

// Error as it travels between processes
struct ErrorValue {
    std::string name = "Error";
    std::string message;
    std::string code;
    std::string stack;
};

// Parse wire text. The top-level value is depth 0, the same counting
// serialize uses. A container below max_depth is rejected as soon as the
// parser reaches it, before any of the value is built.
// Throws DeserializationError on invalid or too deeply nested JSON.
nlohmann::json parse_wire(const std::string& text, int max_depth = MAX_NESTING_DEPTH);

// Convert an in-memory value to its wire form. Binary values become tagged
// Buffer objects. Throws SerializationError on non-finite numbers or nesting
// deeper than MAX_NESTING_DEPTH.
nlohmann::json serialize(const nlohmann::json& value);

// Inverse of serialize. Throws DeserializationError on malformed tagged values.
nlohmann::json deserialize(const nlohmann::json& wire);

nlohmann::json serialize_args(const std::vector<nlohmann::json>& args);
std::vector<nlohmann::json> deserialize_args(const nlohmann::json& wire_args);

// Errors
nlohmann::json serialize_error(const ErrorValue& error);
nlohmann::json serialize_exception(const std::exception& e);
ErrorValue deserialize_error(const nlohmann::json& wire);
bool is_error_value(const nlohmann::json& value);

// Byte buffers
nlohmann::json make_bytes(std::vector<uint8_t> bytes);
std::vector<uint8_t> as_bytes(const nlohmann::json& value);

// Timestamps are kept in their tagged form in memory
nlohmann::json make_timestamp(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point as_timestamp(const nlohmann::json& value);
bool is_timestamp(const nlohmann::json& value);

// ISO-8601 UTC with millisecond precision, e.g. 2024-01-02T03:04:05.678Z
std::string format_iso8601(std::chrono::system_clock::time_point tp);
bool parse_iso8601(const std::string& text, std::chrono::system_clock::time_point& out);

} // namespace plughost::core
