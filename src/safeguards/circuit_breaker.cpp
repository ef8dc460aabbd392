// src/safeguards/circuit_breaker.cpp
#include "trade_guard/safeguards/circuit_breaker.hpp"
#include "trade_guard/core/logger.hpp"
#include "trade_guard/core/time_utils.hpp"

namespace trade_guard {

std::string breaker_state_to_string(BreakerState state) {
    switch (state) {
        case BreakerState::CLOSED:
            return "CLOSED";
        case BreakerState::OPEN:
            return "OPEN";
        case BreakerState::HALF_OPEN:
            return "HALF_OPEN";
    }
    return "UNKNOWN";
}

nlohmann::json CircuitBreakerState::to_json() const {
    nlohmann::json j;
    j["state"] = breaker_state_to_string(state);
    j["is_open"] = is_open;
    j["failure_count"] = failure_count;
    j["half_open_attempts"] = half_open_attempts;
    j["last_failure"] = last_failure ? nlohmann::json(core::to_iso8601(*last_failure))
                                     : nlohmann::json(nullptr);
    j["opened_at"] =
        opened_at ? nlohmann::json(core::to_iso8601(*opened_at)) : nlohmann::json(nullptr);
    return j;
}

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config, std::shared_ptr<Clock> clock)
    : config_(std::move(config)), clock_(std::move(clock)) {}

bool CircuitBreaker::can_proceed() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_.state != BreakerState::OPEN) {
        return true;
    }

    auto now = clock_->now();
    auto elapsed = std::chrono::duration<double>(now - state_.opened_at.value_or(now)).count();
    if (elapsed < config_.timeout_seconds) {
        return false;
    }

    state_.state = BreakerState::HALF_OPEN;
    state_.is_open = false;
    state_.half_open_attempts = 0;
    INFO("Circuit breaker " << config_.name << " half-open after " << elapsed << "s");
    return true;
}

void CircuitBreaker::record_success() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_.state == BreakerState::HALF_OPEN) {
        INFO("Circuit breaker " << config_.name << " closed after successful probe");
    }
    state_.state = BreakerState::CLOSED;
    state_.is_open = false;
    state_.failure_count = 0;
    state_.half_open_attempts = 0;
    state_.opened_at.reset();
}

void CircuitBreaker::record_failure() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto now = clock_->now();
    state_.last_failure = now;
    state_.failure_count++;

    switch (state_.state) {
        case BreakerState::CLOSED:
            if (state_.failure_count >= config_.failure_threshold) {
                open_locked(now);
            }
            break;
        case BreakerState::HALF_OPEN:
            state_.half_open_attempts++;
            if (state_.half_open_attempts >= config_.half_open_max) {
                open_locked(now);
            }
            break;
        case BreakerState::OPEN:
            break;
    }
}

void CircuitBreaker::open_locked(Timestamp now) {
    state_.state = BreakerState::OPEN;
    state_.is_open = true;
    state_.opened_at = now;
    state_.half_open_attempts = 0;
    WARN("Circuit breaker " << config_.name << " opened after " << state_.failure_count
                            << " failures");
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = CircuitBreakerState();
    INFO("Circuit breaker " << config_.name << " reset");
}

BreakerState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.state;
}

CircuitBreakerState CircuitBreaker::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

}  // namespace trade_guard
