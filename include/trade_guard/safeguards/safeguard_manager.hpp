// include/trade_guard/safeguards/safeguard_manager.hpp
#pragma once

#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "trade_guard/core/clock.hpp"
#include "trade_guard/core/config_base.hpp"
#include "trade_guard/portfolio/portfolio_snapshot.hpp"
#include "trade_guard/safeguards/circuit_breaker.hpp"

namespace trade_guard {

/**
 * @brief Limits enforced by the safeguard layer
 */
struct SafeguardConfig : public ConfigBase {
    double max_drawdown_threshold{0.05};  // fraction of peak equity
    double max_daily_loss_pct{0.03};      // fraction of start-of-day equity
    int max_orders_per_minute{20};
    double rate_window_seconds{60.0};
    int max_concurrent_positions{10};
    double max_portfolio_leverage{3.0};  // exposure / balance
    double warning_ratio{0.8};           // warn when a limit is this close
    std::vector<CircuitBreakerConfig> breakers{
        CircuitBreakerConfig("api", 3, 60.0),
        CircuitBreakerConfig("orders", 5, 120.0),
        CircuitBreakerConfig("market_data", 3, 30.0),
    };

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
    std::vector<std::string> validate() const override;
};

/**
 * @brief Aggregate portfolio risk posture
 */
struct HeatMetrics {
    double total_exposure{0.0};
    double balance{0.0};
    size_t position_count{0};
    double daily_loss{0.0};    // signed fraction, negative when losing
    double max_drawdown{0.0};  // high-water mark, never decreases
    double current_drawdown{0.0};
    Timestamp last_updated{};

    nlohmann::json to_json() const;
};

/**
 * @brief Outcome of can_trade()
 */
struct TradeGate {
    bool allowed{true};
    bool kill_switch{false};
    bool breaker_open{false};
    std::string reason;
};

/**
 * @brief Breakers, heat limits, kill switch and order rate limiting
 */
class SafeguardManager {
public:
    explicit SafeguardManager(SafeguardConfig config,
                              std::shared_ptr<Clock> clock = system_clock());

    SafeguardManager(const SafeguardManager&) = delete;
    SafeguardManager& operator=(const SafeguardManager&) = delete;

    /**
     * @brief Breaker by dependency name
     * @return nullptr if no breaker with that name is configured
     */
    CircuitBreaker* breaker(const std::string& name) const;

    bool check_circuit_breaker(const std::string& name);
    void record_success(const std::string& name);
    void record_failure(const std::string& name);

    /**
     * @brief Recompute heat from a freshly published snapshot
     */
    void update_heat_metrics(const PortfolioSnapshot& snapshot);

    /**
     * @brief Feed the current account value for the daily-loss window
     * The first value after a reset becomes the start-of-day baseline.
     */
    void update_daily_pnl(double current_value);

    void reset_daily_metrics();

    bool check_portfolio_heat() const;

    /**
     * @brief Check drawdown and daily loss, activating the kill switch on breach
     */
    bool check_drawdown_limits();

    bool check_rate_limits();
    void record_order();

    /**
     * @brief Composite gate: kill switch, orders breaker, heat, drawdown, rate
     */
    TradeGate can_trade();

    void activate_kill_switch(const std::string& reason);

    /**
     * @brief Manual operator action; nothing in the process calls this automatically
     */
    void deactivate_kill_switch();

    bool is_kill_switch_active() const;
    std::string kill_switch_reason() const;

    HeatMetrics heat() const;
    nlohmann::json status_json() const;

    const SafeguardConfig& config() const {
        return config_;
    }

private:
    bool check_portfolio_heat_locked() const;
    bool check_drawdown_limits_locked();
    bool check_rate_limits_locked();
    void activate_kill_switch_locked(const std::string& reason);
    void prune_order_window_locked(Timestamp now);
    void warn_if_approaching_locked() const;

    SafeguardConfig config_;
    std::shared_ptr<Clock> clock_;
    std::map<std::string, std::unique_ptr<CircuitBreaker>> breakers_;

    bool kill_switch_active_{false};
    std::string kill_switch_reason_;

    HeatMetrics heat_;
    double peak_equity_{0.0};
    double daily_start_value_{0.0};
    std::deque<Timestamp> order_timestamps_;

    mutable std::mutex mutex_;
};

}  // namespace trade_guard
