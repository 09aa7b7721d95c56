#include "ipc/reactor.hpp"
#include <spdlog/spdlog.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace plughost::ipc {

namespace {

constexpr int MAX_EVENTS = 64;

bool epoll_control(int epoll_fd, int op, int fd, uint32_t events) {
    struct epoll_event ev;
    memset(&ev, 0, sizeof(ev));
    ev.events = events;
    ev.data.fd = fd;
    return epoll_ctl(epoll_fd, op, fd, &ev) == 0;
}

} // anonymous namespace

Reactor::Reactor() = default;

Reactor::~Reactor() {
    if (wake_fd_ >= 0) {
        close(wake_fd_);
    }
    if (epoll_fd_ >= 0) {
        close(epoll_fd_);
    }
}

bool Reactor::init() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        spdlog::error("Failed to create epoll: {}", strerror(errno));
        return false;
    }

    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        spdlog::error("Failed to create wakeup eventfd: {}", strerror(errno));
        return false;
    }
    if (!epoll_control(epoll_fd_, EPOLL_CTL_ADD, wake_fd_, EPOLLIN)) {
        spdlog::error("Failed to watch wakeup eventfd: {}", strerror(errno));
        return false;
    }

    spdlog::debug("Reactor ready (epoll_fd={}, wake_fd={})", epoll_fd_, wake_fd_);
    return true;
}

bool Reactor::add(int fd, uint32_t events, EventCallback callback) {
    if (!epoll_control(epoll_fd_, EPOLL_CTL_ADD, fd, events)) {
        spdlog::error("Failed to watch fd {}: {}", fd, strerror(errno));
        return false;
    }
    watches_[fd] = Watch{events, std::move(callback)};
    spdlog::trace("Watching fd {} (events=0x{:x})", fd, events);
    return true;
}

bool Reactor::modify(int fd, uint32_t events) {
    auto it = watches_.find(fd);
    if (it == watches_.end()) {
        return false;
    }
    if (it->second.events == events) {
        return true;
    }
    if (!epoll_control(epoll_fd_, EPOLL_CTL_MOD, fd, events)) {
        spdlog::error("Failed to update fd {}: {}", fd, strerror(errno));
        return false;
    }
    it->second.events = events;
    return true;
}

bool Reactor::remove(int fd) {
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr) < 0) {
        // Already closed or never added
        if (errno != ENOENT && errno != EBADF) {
            spdlog::error("Failed to unwatch fd {}: {}", fd, strerror(errno));
            return false;
        }
    }
    watches_.erase(fd);
    spdlog::trace("Unwatched fd {}", fd);
    return true;
}

void Reactor::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        tasks_.push_back(std::move(task));
    }
    wakeup();
}

void Reactor::wakeup() {
    if (wake_fd_ < 0) {
        return;
    }
    uint64_t one = 1;
    if (write(wake_fd_, &one, sizeof(one)) < 0 && errno != EAGAIN) {
        spdlog::error("Failed to wake reactor: {}", strerror(errno));
    }
}

void Reactor::drain_wakeups() {
    uint64_t count;
    while (read(wake_fd_, &count, sizeof(count)) > 0) {
    }
}

void Reactor::run_posted_tasks() {
    std::deque<Task> tasks;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        tasks.swap(tasks_);
    }
    for (auto& task : tasks) {
        task();
    }
}

int Reactor::poll(int timeout_ms) {
    struct epoll_event events[MAX_EVENTS];

    int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, timeout_ms);
    if (n < 0) {
        if (errno == EINTR) {
            return 0;
        }
        spdlog::error("epoll_wait failed: {}", strerror(errno));
        return -1;
    }

    for (int i = 0; i < n; i++) {
        int fd = events[i].data.fd;
        if (fd == wake_fd_) {
            drain_wakeups();
            continue;
        }

        // Copy: the callback may remove its own fd
        auto it = watches_.find(fd);
        if (it != watches_.end()) {
            EventCallback callback = it->second.callback;
            callback(fd, events[i].events);
        }
    }

    run_posted_tasks();
    return n;
}

void Reactor::run() {
    running_ = true;
    spdlog::debug("Reactor loop started");

    while (!stop_requested_) {
        if (poll(-1) < 0) {
            break;
        }
    }

    running_ = false;
    spdlog::debug("Reactor loop stopped ({} fd(s) still watched)", watches_.size());
}

void Reactor::stop() {
    stop_requested_ = true;
    wakeup();
}

} // namespace plughost::ipc
