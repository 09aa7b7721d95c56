#pragma once
#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <unordered_map>

namespace plughost::ipc {

// Event callback: (fd, epoll events) -> void
using EventCallback = std::function<void(int fd, uint32_t events)>;

// Task run on the reactor thread
using Task = std::function<void()>;

// epoll event loop. add/modify/remove and the callbacks belong to the loop
// thread; post() and stop() may be called from any thread.
class Reactor {
public:
    Reactor();
    ~Reactor();

    // Non-copyable
    Reactor(const Reactor&) = delete;
    Reactor& operator=(const Reactor&) = delete;

    // Create the epoll instance and the wakeup eventfd
    bool init();

    bool add(int fd, uint32_t events, EventCallback callback);

    // No-op when the interest set is unchanged
    bool modify(int fd, uint32_t events);

    bool remove(int fd);

    // Queue a task for the loop thread and wake it
    void post(Task task);

    // Wait for one batch of events, then run posted tasks.
    // timeout_ms: -1 = until woken, 0 = return immediately
    int poll(int timeout_ms = -1);

    // Loop until stop()
    void run();

    // A stopped reactor is not restarted
    void stop();

    bool is_running() const { return running_; }
    size_t watched_count() const { return watches_.size(); }

private:
    struct Watch {
        uint32_t events;
        EventCallback callback;
    };

    void wakeup();
    void drain_wakeups();
    void run_posted_tasks();

    int epoll_fd_ = -1;
    int wake_fd_ = -1;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::unordered_map<int, Watch> watches_;

    std::mutex tasks_mutex_;
    std::deque<Task> tasks_;
};

} // namespace plughost::ipc
