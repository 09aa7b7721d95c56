#include "adapters/builtin/log_ring_buffer.hpp"

namespace plughost::adapters::builtin {

using json = nlohmann::json;

LogRingBuffer::LogRingBuffer(size_t max_size)
    : max_size_(max_size > 0 ? max_size : DEFAULT_MAX_SIZE) {}

void LogRingBuffer::append(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(record);
    total_appended_++;
    while (records_.size() > max_size_) {
        records_.pop_front();
        dropped_++;
    }
}

std::vector<LogRecord> LogRingBuffer::query(const LogQuery& query) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<LogRecord> result;
    for (const auto& record : records_) {
        if (query.matches(record)) {
            result.push_back(record);
        }
    }
    if (query.limit && result.size() > *query.limit) {
        result.erase(result.begin(), result.end() - static_cast<std::ptrdiff_t>(*query.limit));
    }
    return result;
}

LogBufferStats LogRingBuffer::stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    return LogBufferStats{records_.size(), max_size_, total_appended_, dropped_};
}

void LogRingBuffer::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
}

HookCallback LogRingBuffer::extension_method(const std::string& name) {
    if (name != "append") {
        return nullptr;
    }
    std::weak_ptr<Adapter> weak = weak_from_this();
    return [this, weak](const json& payload) {
        if (auto self = weak.lock()) {
            append(payload.get<LogRecord>());
        }
    };
}

} // namespace plughost::adapters::builtin
