#ifndef PLUGHOST_TEST_HELPERS_HPP
#define PLUGHOST_TEST_HELPERS_HPP

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "adapters/adapter.hpp"
#include "core/diagnostics.hpp"
#include "core/errors.hpp"

namespace plughost::test {

// Detect if running under ThreadSanitizer
constexpr bool is_tsan_enabled() {
#if defined(__SANITIZE_THREAD__)
    return true;
#else
    return false;
#endif
}

// Scale factor for timeouts under sanitizers
constexpr int timeout_scale_factor() {
    return is_tsan_enabled() ? 10 : 1;
}

inline std::chrono::milliseconds scaled_ms(int base_ms) {
    return std::chrono::milliseconds(base_ms * timeout_scale_factor());
}

// Poll pred until it holds or the timeout passes
inline bool wait_until(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = scaled_ms(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

// Scratch directory removed on destruction
class TempDir {
public:
    TempDir() {
        std::string pattern = (std::filesystem::temp_directory_path() / "plughost-test-XXXXXX").string();
        std::vector<char> buf(pattern.begin(), pattern.end());
        buf.push_back('\0');
        if (!mkdtemp(buf.data())) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = buf.data();
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }
    std::string file(const std::string& name) const { return path_ + "/" + name; }

    size_t entry_count() const {
        size_t n = 0;
        for (const auto& entry : std::filesystem::directory_iterator(path_)) {
            (void)entry;
            n++;
        }
        return n;
    }

private:
    std::string path_;
};

// Keeps every warning for inspection
class RecordingDiagnosticSink : public core::DiagnosticSink {
public:
    void warn(const core::Warning& warning) override {
        std::lock_guard<std::mutex> lock(mutex_);
        warnings_.push_back(warning);
    }

    size_t count(core::WarningKind kind) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& w : warnings_) {
            if (w.kind == kind) n++;
        }
        return n;
    }

    std::vector<core::Warning> warnings() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return warnings_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<core::Warning> warnings_;
};

// Adapter with predictable methods for exercising the RPC path:
//   echo(x) -> x, add(a, b) -> a + b, sleep(ms) -> "slept",
//   fail(message) -> throws a named error, blob(n) -> n-char string
class TestAdapter : public adapters::Adapter {
public:
    void register_methods(adapters::MethodTable& table) override {
        table.register_method("echo", [](const std::vector<nlohmann::json>& args) {
            return adapters::arg_at(args, 0);
        });
        table.register_method("add", [](const std::vector<nlohmann::json>& args) {
            return nlohmann::json(adapters::arg_at(args, 0).get<int64_t>() +
                                  adapters::arg_at(args, 1).get<int64_t>());
        });
        table.register_method("sleep", [](const std::vector<nlohmann::json>& args) {
            std::this_thread::sleep_for(std::chrono::milliseconds(adapters::arg_at(args, 0).get<int64_t>()));
            return nlohmann::json("slept");
        });
        table.register_method("fail", [](const std::vector<nlohmann::json>& args) -> nlohmann::json {
            throw Error("QuotaExceededError", adapters::string_arg(args, 0, "message"), "E_QUOTA");
        });
        table.register_method("blob", [](const std::vector<nlohmann::json>& args) {
            return nlohmann::json(std::string(adapters::arg_at(args, 0).get<size_t>(), 'x'));
        });
    }
};

// Blocking line-oriented client speaking raw protocol text
class RawClient {
public:
    explicit RawClient(const std::string& socket_path) {
        fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd_ < 0) {
            throw std::runtime_error("socket failed");
        }
        struct sockaddr_un addr;
        memset(&addr, 0, sizeof(addr));
        addr.sun_family = AF_UNIX;
        strncpy(addr.sun_path, socket_path.c_str(), sizeof(addr.sun_path) - 1);
        if (::connect(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
            ::close(fd_);
            throw std::runtime_error("connect failed: " + std::string(strerror(errno)));
        }
    }

    ~RawClient() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    RawClient(const RawClient&) = delete;
    RawClient& operator=(const RawClient&) = delete;

    void write_raw(const std::string& data) {
        size_t sent = 0;
        while (sent < data.size()) {
            ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n < 0) {
                throw std::runtime_error("send failed");
            }
            sent += static_cast<size_t>(n);
        }
    }

    // Next complete line, or empty if none arrives in time
    std::string read_line(std::chrono::milliseconds timeout = scaled_ms(2000)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            auto pos = buffer_.find('\n');
            if (pos != std::string::npos) {
                std::string line = buffer_.substr(0, pos);
                buffer_.erase(0, pos + 1);
                return line;
            }
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                return {};
            }
            struct pollfd pfd{fd_, POLLIN, 0};
            if (::poll(&pfd, 1, static_cast<int>(remaining.count())) <= 0) {
                return {};
            }
            char buf[65536];
            ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
            if (n <= 0) {
                return {};
            }
            buffer_.append(buf, static_cast<size_t>(n));
        }
    }

    nlohmann::json read_json(std::chrono::milliseconds timeout = scaled_ms(2000)) {
        std::string line = read_line(timeout);
        if (line.empty()) {
            return nullptr;
        }
        return nlohmann::json::parse(line);
    }

private:
    int fd_ = -1;
    std::string buffer_;
};

inline nlohmann::json make_call(const std::string& request_id, const std::string& adapter,
                                const std::string& method, nlohmann::json args = nlohmann::json::array()) {
    return {
        {"type", "adapter:call"},
        {"requestId", request_id},
        {"version", 2},
        {"adapter", adapter},
        {"method", method},
        {"args", std::move(args)}
    };
}

} // namespace plughost::test

#endif // PLUGHOST_TEST_HELPERS_HPP
