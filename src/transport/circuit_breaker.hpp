#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>

namespace plughost::transport {

enum class CircuitState {
    Closed,
    Open,
    HalfOpen
};

const char* circuit_state_to_string(CircuitState state);

struct CircuitBreakerConfig {
    uint32_t failure_threshold = 5;
    std::chrono::milliseconds cooldown{30000};
};

// Counts consecutive transport-level failures. Open rejects calls until the
// cooldown has passed, then lets a single trial call through (half-open):
// success closes the circuit, failure reopens it.
class CircuitBreaker {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit CircuitBreaker(CircuitBreakerConfig config = {}, Clock clock = nullptr);

    // False if the call must be rejected
    bool allow_request();

    void record_success();
    void record_failure();

    // Give back an admitted half-open trial that ended without an outcome,
    // so the next call can try again
    void release_trial();

    CircuitState state() const;
    uint32_t consecutive_failures() const;

    // Time until a trial call is allowed; zero unless open
    std::chrono::milliseconds retry_after() const;

    void reset();

private:
    CircuitBreakerConfig config_;
    Clock clock_;
    mutable std::mutex mutex_;
    CircuitState state_ = CircuitState::Closed;
    uint32_t failures_ = 0;
    std::chrono::steady_clock::time_point opened_at_{};
    bool trial_in_flight_ = false;
};

} // namespace plughost::transport
