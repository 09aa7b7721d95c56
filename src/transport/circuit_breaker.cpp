#include "transport/circuit_breaker.hpp"
#include <spdlog/spdlog.h>

namespace plughost::transport {

const char* circuit_state_to_string(CircuitState state) {
    switch (state) {
    case CircuitState::Closed:
        return "closed";
    case CircuitState::Open:
        return "open";
    case CircuitState::HalfOpen:
        return "half-open";
    }
    return "closed";
}

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config, Clock clock)
    : config_(config), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }
    if (config_.failure_threshold == 0) {
        config_.failure_threshold = 1;
    }
}

bool CircuitBreaker::allow_request() {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (state_) {
    case CircuitState::Closed:
        return true;
    case CircuitState::Open:
        if (clock_() - opened_at_ < config_.cooldown) {
            return false;
        }
        state_ = CircuitState::HalfOpen;
        trial_in_flight_ = true;
        spdlog::info("Circuit breaker half-open, allowing a trial call");
        return true;
    case CircuitState::HalfOpen:
        if (trial_in_flight_) {
            return false;
        }
        trial_in_flight_ = true;
        return true;
    }
    return false;
}

void CircuitBreaker::record_success() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != CircuitState::Closed) {
        spdlog::info("Circuit breaker closed");
    }
    state_ = CircuitState::Closed;
    failures_ = 0;
    trial_in_flight_ = false;
}

void CircuitBreaker::record_failure() {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_++;

    if (state_ == CircuitState::HalfOpen) {
        state_ = CircuitState::Open;
        opened_at_ = clock_();
        trial_in_flight_ = false;
        spdlog::warn("Circuit breaker trial call failed, reopening");
        return;
    }

    if (state_ == CircuitState::Closed && failures_ >= config_.failure_threshold) {
        state_ = CircuitState::Open;
        opened_at_ = clock_();
        spdlog::warn("Circuit breaker opened after {} consecutive failures", failures_);
    }
}

void CircuitBreaker::release_trial() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == CircuitState::HalfOpen && trial_in_flight_) {
        trial_in_flight_ = false;
        spdlog::debug("Circuit breaker trial call abandoned");
    }
}

CircuitState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

uint32_t CircuitBreaker::consecutive_failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_;
}

std::chrono::milliseconds CircuitBreaker::retry_after() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != CircuitState::Open) {
        return std::chrono::milliseconds(0);
    }
    auto elapsed = clock_() - opened_at_;
    if (elapsed >= config_.cooldown) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(config_.cooldown - elapsed);
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = CircuitState::Closed;
    failures_ = 0;
    trial_in_flight_ = false;
}

} // namespace plughost::transport
