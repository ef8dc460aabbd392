// include/trade_guard/risk/risk_engine.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include "trade_guard/core/config_base.hpp"
#include "trade_guard/core/order_intent.hpp"
#include "trade_guard/portfolio/portfolio_snapshot.hpp"
#include "trade_guard/risk/risk_types.hpp"

namespace trade_guard {

/**
 * @brief Per-agent capital allocation
 *
 * An agent listed in overrides gets that amount. Otherwise, with
 * equal_split_agents > 0 the balance is split evenly, else
 * default_allocation_usd applies. The result never exceeds the balance.
 */
struct AllocationConfig : public ConfigBase {
    double default_allocation_usd{125.0};
    int equal_split_agents{0};
    std::unordered_map<std::string, double> overrides;

    double allocation_for(const std::string& agent_id, double balance) const;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
    std::vector<std::string> validate() const override;
};

/**
 * @brief Limits applied by the RiskEngine
 */
struct RiskEngineConfig : public ConfigBase {
    double max_drawdown_pct{10.0};         // percent of peak equity
    double max_per_trade_pct{10.0};        // percent of the agent allocation
    double min_margin_buffer_usdt{50.0};
    AllocationConfig allocation;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
    std::vector<std::string> validate() const override;
};

/**
 * @brief Kelly fraction max(0, w - (1 - w) / rr)
 */
double kelly_fraction(double win_rate, double reward_to_risk);

/**
 * @brief Percent decline of equity from peak, never negative
 * @return nullopt when the peak is not positive
 */
std::optional<double> drawdown_pct(double peak_balance, double balance, double unrealized_pnl);

/**
 * @brief Stateless evaluator of one intent against a snapshot
 *
 * Checks run in order and stop at the first failure: drawdown, margin
 * buffer, then per-trade exposure against the Kelly-capped share of the
 * agent allocation.
 */
class RiskEngine {
public:
    explicit RiskEngine(RiskEngineConfig config);

    RiskCheckResult evaluate(const PortfolioSnapshot& snapshot, const OrderIntent& intent,
                             const std::string& agent_id, const std::string& order_id) const;

    RiskCheckResult check_drawdown(const PortfolioSnapshot& snapshot) const;
    RiskCheckResult check_margin_buffer(const PortfolioSnapshot& snapshot) const;
    RiskCheckResult check_per_trade_exposure(const PortfolioSnapshot& snapshot,
                                             const OrderIntent& intent,
                                             const std::string& agent_id) const;

    /**
     * @brief Notional used by the per-trade check
     * quantity * reference price when both are known, else intent.notional
     */
    static double evaluated_notional(const PortfolioSnapshot& snapshot, const OrderIntent& intent);

    const RiskEngineConfig& config() const {
        return config_;
    }

private:
    RiskEngineConfig config_;
};

}  // namespace trade_guard
