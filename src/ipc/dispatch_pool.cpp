#include "ipc/dispatch_pool.hpp"
#include <spdlog/spdlog.h>

namespace plughost::ipc {

DispatchPool::DispatchPool(size_t threads) {
    if (threads == 0) {
        threads = 1;
    }
    workers_.reserve(threads);
    for (size_t i = 0; i < threads; i++) {
        workers_.emplace_back(&DispatchPool::worker_loop, this);
    }
    spdlog::debug("Dispatch pool started with {} worker(s)", threads);
}

DispatchPool::~DispatchPool() {
    shutdown();
}

bool DispatchPool::submit(uint64_t connection_id, std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        auto& q = queues_[connection_id];
        bool was_empty = q.empty();
        q.push_back(std::move(task));
        if (was_empty) {
            round_robin_.push_back(connection_id);
        }
    }
    cv_.notify_one();
    return true;
}

void DispatchPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && workers_.empty()) {
            return;
        }
        stopping_ = true;
        queues_.clear();
        round_robin_.clear();
    }
    cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

void DispatchPool::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stopping_ || !round_robin_.empty(); });
            if (stopping_) {
                break;
            }

            uint64_t connection_id = round_robin_.front();
            round_robin_.pop_front();

            auto& q = queues_[connection_id];
            task = std::move(q.front());
            q.pop_front();

            if (!q.empty()) {
                round_robin_.push_back(connection_id);
            } else {
                queues_.erase(connection_id);
            }
        }

        task();
    }
}

} // namespace plughost::ipc
