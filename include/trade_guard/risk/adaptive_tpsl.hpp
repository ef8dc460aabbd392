// include/trade_guard/risk/adaptive_tpsl.hpp
#pragma once

#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include "trade_guard/core/clock.hpp"
#include "trade_guard/core/config_base.hpp"
#include "trade_guard/core/types.hpp"
#include "trade_guard/performance/market_analysis.hpp"
#include "trade_guard/performance/performance_tracker.hpp"

namespace trade_guard {

/**
 * @brief Bounds and defaults of the exit calculator
 */
struct AdaptiveTPSLConfig : public ConfigBase {
    double base_tp_pct{0.025};
    double base_sl_pct{0.015};
    double min_tp_pct{0.015};
    double max_tp_pct{0.08};
    double min_sl_pct{0.008};
    double max_sl_pct{0.04};
    double min_reward_to_risk{1.5};
    double trailing_activation_pct{0.02};
    double trailing_distance_pct{0.012};
    int min_history_trades{5};
    int atr_cache_ttl_seconds{300};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
    std::vector<std::string> validate() const override;
};

/**
 * @brief Computed exit plan for one entry
 */
struct AdaptiveTPSL {
    double tp_pct{0.0};
    double sl_pct{0.0};
    Price tp_price{0.0};
    Price sl_price{0.0};
    double trailing_activation_pct{0.0};
    double trailing_distance_pct{0.0};
    std::string reasoning;

    nlohmann::json to_json() const;
};

struct TrailingUpdate {
    Price new_stop_price;
    std::string reason;
};

/**
 * @brief Take-profit, stop-loss and trailing parameters from market context
 *
 * Starts from the base percentages and applies, in order, volatility
 * scaling, the agent's win rate on the symbol, consensus confidence and
 * the market regime, then clamps both legs and enforces the minimum
 * reward to risk by shrinking the stop.
 */
class AdaptiveTPSLCalculator {
public:
    explicit AdaptiveTPSLCalculator(AdaptiveTPSLConfig config,
                                    std::shared_ptr<PerformanceTracker> performance = nullptr,
                                    std::shared_ptr<MarketAnalysisProvider> market = nullptr,
                                    std::shared_ptr<Clock> clock = system_clock());

    /**
     * @brief Compute an exit plan
     * @param symbol Instrument
     * @param side BUY or SELL
     * @param entry_price Expected fill price, must be positive
     * @param agent_id Agent whose history adjusts the plan, if any
     * @param confidence Consensus confidence in [0, 1]
     * @param analysis Caller-supplied indicators; skips the provider lookup
     */
    AdaptiveTPSL calculate(const std::string& symbol, Side side, Price entry_price,
                           const std::optional<std::string>& agent_id = std::nullopt,
                           double confidence = 0.7,
                           const std::optional<MarketAnalysis>& analysis = std::nullopt);

    /**
     * @brief New trailing stop, or nullopt
     *
     * Only once pnl_pct has reached the activation threshold, and only when
     * the candidate stop is strictly tighter than the current one.
     * For SELL, high_water_mark is the lowest price seen.
     */
    std::optional<TrailingUpdate> adjust_for_trailing(double pnl_pct, double current_sl_pct,
                                                      Price entry_price, Price high_water_mark,
                                                      Side side, double activation,
                                                      double distance) const;

    const AdaptiveTPSLConfig& config() const {
        return config_;
    }

private:
    std::optional<double> lookup_atr(const std::string& symbol,
                                     const std::optional<MarketAnalysis>& analysis);

    AdaptiveTPSLConfig config_;
    std::shared_ptr<PerformanceTracker> performance_;
    std::shared_ptr<MarketAnalysisProvider> market_;
    std::shared_ptr<Clock> clock_;

    struct CachedAtr {
        double atr;
        Timestamp fetched_at;
    };
    std::unordered_map<std::string, CachedAtr> atr_cache_;
    std::mutex cache_mutex_;
};

}  // namespace trade_guard
