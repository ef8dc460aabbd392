// include/trade_guard/safeguards/circuit_breaker.hpp
#pragma once

#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "trade_guard/core/clock.hpp"
#include "trade_guard/core/config_base.hpp"

namespace trade_guard {

enum class BreakerState { CLOSED, OPEN, HALF_OPEN };

std::string breaker_state_to_string(BreakerState state);

/**
 * @brief Thresholds for one dependency breaker
 */
struct CircuitBreakerConfig : public ConfigBase {
    std::string name;
    int failure_threshold{3};
    double timeout_seconds{60.0};
    int half_open_max{3};  // failures tolerated while half-open before re-opening

    CircuitBreakerConfig() = default;
    CircuitBreakerConfig(std::string n, int threshold, double timeout, int half_open = 3)
        : name(std::move(n)),
          failure_threshold(threshold),
          timeout_seconds(timeout),
          half_open_max(half_open) {}

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["name"] = name;
        j["failure_threshold"] = failure_threshold;
        j["timeout_seconds"] = timeout_seconds;
        j["half_open_max"] = half_open_max;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("name"))
            name = j.at("name").get<std::string>();
        if (j.contains("failure_threshold"))
            failure_threshold = j.at("failure_threshold").get<int>();
        if (j.contains("timeout_seconds"))
            timeout_seconds = j.at("timeout_seconds").get<double>();
        if (j.contains("half_open_max"))
            half_open_max = j.at("half_open_max").get<int>();
    }

    std::vector<std::string> validate() const override {
        std::vector<std::string> problems;
        if (failure_threshold <= 0)
            problems.push_back(name + ".failure_threshold must be positive");
        if (timeout_seconds < 0.0)
            problems.push_back(name + ".timeout_seconds must not be negative");
        if (half_open_max <= 0)
            problems.push_back(name + ".half_open_max must be positive");
        return problems;
    }
};

/**
 * @brief Copy of a breaker's counters for reporting
 */
struct CircuitBreakerState {
    BreakerState state{BreakerState::CLOSED};
    int failure_count{0};
    std::optional<Timestamp> last_failure;
    bool is_open{false};
    std::optional<Timestamp> opened_at;
    int half_open_attempts{0};

    nlohmann::json to_json() const;
};

/**
 * @brief CLOSED/OPEN/HALF_OPEN state machine guarding one dependency
 *
 * CLOSED opens after failure_threshold failures. Once timeout_seconds have
 * passed, the next can_proceed() moves OPEN to HALF_OPEN and lets calls
 * through. A success while half-open closes the breaker; half_open_max
 * failures while half-open re-open it and restart the timer.
 */
class CircuitBreaker {
public:
    explicit CircuitBreaker(CircuitBreakerConfig config,
                            std::shared_ptr<Clock> clock = system_clock());

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    /**
     * @brief Gate for callers; may transition OPEN to HALF_OPEN
     */
    bool can_proceed();

    void record_success();
    void record_failure();

    /**
     * @brief Force the breaker back to CLOSED
     */
    void reset();

    BreakerState state() const;
    CircuitBreakerState snapshot() const;

    const std::string& name() const {
        return config_.name;
    }

    const CircuitBreakerConfig& config() const {
        return config_;
    }

private:
    void open_locked(Timestamp now);

    CircuitBreakerConfig config_;
    std::shared_ptr<Clock> clock_;
    CircuitBreakerState state_;
    mutable std::mutex mutex_;
};

}  // namespace trade_guard
