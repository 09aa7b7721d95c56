#pragma once
#include <deque>
#include <mutex>
#include <vector>
#include "adapters/log_store.hpp"

namespace plughost::adapters::builtin {

// Bounded in-memory log history; the oldest record is dropped when full.
// Extension method: append (attached to logger.onLog).
class LogRingBuffer final : public LogBuffer {
public:
    static constexpr size_t DEFAULT_MAX_SIZE = 1000;

    explicit LogRingBuffer(size_t max_size = DEFAULT_MAX_SIZE);

    void append(const LogRecord& record);

    std::vector<LogRecord> query(const LogQuery& query) override;
    LogBufferStats stats() override;
    void clear();

    HookCallback extension_method(const std::string& name) override;

private:
    size_t max_size_;
    std::mutex mutex_;
    std::deque<LogRecord> records_;
    uint64_t total_appended_ = 0;
    uint64_t dropped_ = 0;
};

} // namespace plughost::adapters::builtin
