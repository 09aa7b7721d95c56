#include "core/serializer.hpp"
#include "core/base64.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <cstdio>
#include <ctime>

namespace plughost::core {

using json = nlohmann::json;

namespace {

const std::string* tag_of(const json& value) {
    if (!value.is_object()) {
        return nullptr;
    }
    auto it = value.find(TYPE_KEY);
    if (it == value.end() || !it->is_string()) {
        return nullptr;
    }
    return it->get_ptr<const std::string*>();
}

bool has_string(const json& value, const char* key) {
    auto it = value.find(key);
    return it != value.end() && it->is_string();
}

} // anonymous namespace

json parse_wire(const std::string& text, int max_depth) {
    json::parser_callback_t limit = [max_depth](int depth, json::parse_event_t event, json&) {
        if ((event == json::parse_event_t::object_start || event == json::parse_event_t::array_start) &&
            depth > max_depth) {
            throw DeserializationError("Message nesting exceeds depth " + std::to_string(max_depth));
        }
        return true;
    };
    try {
        return json::parse(text, limit);
    } catch (const json::parse_error& e) {
        throw DeserializationError(std::string("Invalid JSON: ") + e.what());
    }
}

namespace {

json serialize_value(const json& value, int depth) {
    if (depth > MAX_NESTING_DEPTH) {
        throw SerializationError("Value nesting exceeds " +
                                 std::to_string(MAX_NESTING_DEPTH) + " levels");
    }

    switch (value.type()) {
    case json::value_t::binary: {
        const auto& bytes = value.get_binary();
        return json{{TYPE_KEY, BUFFER_TYPE}, {"data", base64_encode(bytes.data(), bytes.size())}};
    }
    case json::value_t::number_float:
        if (!std::isfinite(value.get<double>())) {
            throw SerializationError("Cannot serialize non-finite number");
        }
        return value;
    case json::value_t::discarded:
        throw SerializationError("Cannot serialize a discarded value");
    case json::value_t::array: {
        json out = json::array();
        for (const auto& item : value) {
            out.push_back(serialize_value(item, depth + 1));
        }
        return out;
    }
    case json::value_t::object: {
        json out = json::object();
        for (auto it = value.begin(); it != value.end(); ++it) {
            out[it.key()] = serialize_value(it.value(), depth + 1);
        }
        return out;
    }
    default:
        return value;
    }
}

json deserialize_value(const json& wire, int depth) {
    if (depth > MAX_NESTING_DEPTH) {
        throw DeserializationError("Value nesting exceeds " +
                                   std::to_string(MAX_NESTING_DEPTH) + " levels");
    }

    if (wire.is_array()) {
        json out = json::array();
        for (const auto& item : wire) {
            out.push_back(deserialize_value(item, depth + 1));
        }
        return out;
    }

    if (!wire.is_object()) {
        return wire;
    }

    if (const std::string* tag = tag_of(wire)) {
        if (*tag == BUFFER_TYPE) {
            if (!has_string(wire, "data")) {
                throw DeserializationError("Buffer value without base64 data");
            }
            auto bytes = base64_decode(wire["data"].get<std::string>());
            if (!bytes) {
                throw DeserializationError("Buffer value with invalid base64 data");
            }
            return json::binary(std::move(*bytes));
        }
        if (*tag == DATE_TYPE) {
            std::chrono::system_clock::time_point tp;
            if (!has_string(wire, "iso") || !parse_iso8601(wire["iso"].get<std::string>(), tp)) {
                throw DeserializationError("Date value without a valid ISO-8601 timestamp");
            }
            return make_timestamp(tp);
        }
        if (*tag == ERROR_TYPE) {
            return serialize_error(deserialize_error(wire));
        }
        if (*tag == BULK_TYPE) {
            if (!has_string(wire, "path")) {
                throw DeserializationError("Bulk transfer reference without a path");
            }
            return wire;
        }
    }

    json out = json::object();
    for (auto it = wire.begin(); it != wire.end(); ++it) {
        out[it.key()] = deserialize_value(it.value(), depth + 1);
    }
    return out;
}

} // anonymous namespace

json serialize(const json& value) {
    return serialize_value(value, 0);
}

json deserialize(const json& wire) {
    return deserialize_value(wire, 0);
}

json serialize_args(const std::vector<json>& args) {
    json out = json::array();
    for (const auto& arg : args) {
        out.push_back(serialize(arg));
    }
    return out;
}

std::vector<json> deserialize_args(const json& wire_args) {
    if (wire_args.is_null()) {
        return {};
    }
    if (!wire_args.is_array()) {
        throw DeserializationError("Call arguments must be an array");
    }
    std::vector<json> args;
    args.reserve(wire_args.size());
    for (const auto& arg : wire_args) {
        args.push_back(deserialize(arg));
    }
    return args;
}

json serialize_error(const ErrorValue& error) {
    json out = {
        {TYPE_KEY, ERROR_TYPE},
        {"name", error.name.empty() ? "Error" : error.name},
        {"message", error.message}
    };
    if (!error.code.empty()) {
        out["code"] = error.code;
    }
    if (!error.stack.empty()) {
        out["stack"] = error.stack;
    }
    return out;
}

json serialize_exception(const std::exception& e) {
    ErrorValue value;
    value.message = e.what();
    if (auto* err = dynamic_cast<const Error*>(&e)) {
        value.name = err->name();
        value.code = err->code();
    }
    return serialize_error(value);
}

ErrorValue deserialize_error(const json& wire) {
    if (!wire.is_object()) {
        throw DeserializationError("Error value must be an object");
    }
    if (!has_string(wire, "message")) {
        throw DeserializationError("Error value without a message");
    }

    ErrorValue value;
    value.message = wire["message"].get<std::string>();
    if (has_string(wire, "name") && !wire["name"].get<std::string>().empty()) {
        value.name = wire["name"].get<std::string>();
    }
    if (auto it = wire.find("code"); it != wire.end()) {
        // Numeric codes (errno-style) are kept as their decimal text
        if (it->is_string()) {
            value.code = it->get<std::string>();
        } else if (it->is_number_integer()) {
            value.code = std::to_string(it->get<int64_t>());
        }
    }
    if (has_string(wire, "stack")) {
        value.stack = wire["stack"].get<std::string>();
    }
    return value;
}

bool is_error_value(const json& value) {
    const std::string* tag = tag_of(value);
    return tag && *tag == ERROR_TYPE;
}

json make_bytes(std::vector<uint8_t> bytes) {
    return json::binary(std::move(bytes));
}

std::vector<uint8_t> as_bytes(const json& value) {
    if (!value.is_binary()) {
        throw DeserializationError("Value is not a byte buffer");
    }
    const auto& bytes = value.get_binary();
    return std::vector<uint8_t>(bytes.begin(), bytes.end());
}

json make_timestamp(std::chrono::system_clock::time_point tp) {
    return json{{TYPE_KEY, DATE_TYPE}, {"iso", format_iso8601(tp)}};
}

std::chrono::system_clock::time_point as_timestamp(const json& value) {
    std::chrono::system_clock::time_point tp;
    if (!is_timestamp(value) || !parse_iso8601(value["iso"].get<std::string>(), tp)) {
        throw DeserializationError("Value is not a timestamp");
    }
    return tp;
}

bool is_timestamp(const json& value) {
    const std::string* tag = tag_of(value);
    return tag && *tag == DATE_TYPE && has_string(value, "iso");
}

std::string format_iso8601(std::chrono::system_clock::time_point tp) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    time_t seconds = static_cast<time_t>(ms / 1000);
    int millis = static_cast<int>(ms % 1000);
    if (millis < 0) {
        millis += 1000;
        seconds -= 1;
    }

    struct tm utc;
    gmtime_r(&seconds, &utc);

    char buf[32];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
             utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
             utc.tm_hour, utc.tm_min, utc.tm_sec, millis);
    return buf;
}

bool parse_iso8601(const std::string& text, std::chrono::system_clock::time_point& out) {
    int year, month, day, hour, minute, second;
    int consumed = 0;
    if (sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
               &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
        return false;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        return false;
    }

    int millis = 0;
    size_t pos = static_cast<size_t>(consumed);
    if (pos < text.size() && text[pos] == '.') {
        pos++;
        int digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 3) {
                millis = millis * 10 + (text[pos] - '0');
            }
            digits++;
            pos++;
        }
        if (digits == 0) {
            return false;
        }
        for (; digits < 3; digits++) {
            millis *= 10;
        }
    }
    if (pos + 1 != text.size() || text[pos] != 'Z') {
        return false;
    }

    struct tm utc = {};
    utc.tm_year = year - 1900;
    utc.tm_mon = month - 1;
    utc.tm_mday = day;
    utc.tm_hour = hour;
    utc.tm_min = minute;
    utc.tm_sec = second;
    time_t seconds = timegm(&utc);

    out = std::chrono::system_clock::time_point(
        std::chrono::seconds(seconds) + std::chrono::milliseconds(millis));
    return true;
}

} // namespace plughost::core
