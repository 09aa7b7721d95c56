#pragma once
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace plughost::ipc {

// Fixed worker pool for adapter calls. Queued work is taken round-robin
// across connections so one busy client cannot starve the others.
class DispatchPool {
public:
    explicit DispatchPool(size_t threads);
    ~DispatchPool();

    DispatchPool(const DispatchPool&) = delete;
    DispatchPool& operator=(const DispatchPool&) = delete;

    // Returns false once the pool is shutting down
    bool submit(uint64_t connection_id, std::function<void()> task);

    // Stop workers; queued tasks are dropped, running ones finish
    void shutdown();

    size_t size() const { return workers_.size(); }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::unordered_map<uint64_t, std::deque<std::function<void()>>> queues_;
    std::deque<uint64_t> round_robin_;
    std::vector<std::thread> workers_;
    bool stopping_ = false;

    void worker_loop();
};

} // namespace plughost::ipc
