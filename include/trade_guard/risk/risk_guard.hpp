// include/trade_guard/risk/risk_guard.hpp
#pragma once

#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "trade_guard/core/config_base.hpp"
#include "trade_guard/risk/risk_types.hpp"

namespace trade_guard {

/**
 * @brief Hard per-trade limits
 *
 * max_daily_loss_pct is relative to the balance passed to check_trade().
 * max_daily_loss_usd is an absolute halt fed by record_trade_result().
 * The two are independent; the safeguard layer has its own daily-loss limit.
 */
struct RiskGuardConfig : public ConfigBase {
    double max_loss_per_trade{50.0};
    double max_leverage{10.0};
    double max_position_pct{0.15};
    double max_daily_loss_pct{0.05};
    double max_daily_loss_usd{250.0};
    double min_position_size_usd{10.0};
    double default_atr_pct{0.02};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
    std::vector<std::string> validate() const override;
};

/**
 * @brief Position sizing against the max-loss-per-trade cap
 */
class RiskGuard {
public:
    explicit RiskGuard(RiskGuardConfig config);

    RiskGuard(const RiskGuard&) = delete;
    RiskGuard& operator=(const RiskGuard&) = delete;

    /**
     * @brief Check a trade and shrink it to fit the limits
     * @param stop_loss_pct Stop distance as a fraction of entry, e.g. 0.02
     * @param atr_pct ATR as a fraction of price; the configured default when absent
     *
     * Order: leverage cap, position cap, loss cap resize, volatility haircut,
     * daily loss check, minimum size check.
     */
    RiskCheckResult check_trade(double portfolio_balance, double proposed_notional,
                                double proposed_leverage, double stop_loss_pct,
                                const std::string& symbol,
                                std::optional<double> atr_pct = std::nullopt) const;

    /**
     * @brief Add a closed trade's PnL to the daily total
     * @return false once the absolute daily halt is active
     */
    bool record_trade_result(double pnl);

    /**
     * @brief Percent-of-balance daily check, halting trading on breach
     */
    bool check_daily_limit(double portfolio_balance);

    /**
     * @brief Start a new trading day and clear any halt
     */
    void reset_daily_pnl();

    bool is_trading_halted() const;
    std::optional<std::string> halt_reason() const;
    double daily_pnl() const;

    /**
     * @brief Largest notional that keeps the stop loss within max_loss_per_trade
     */
    double max_position_for_symbol(double portfolio_balance, double stop_loss_pct,
                                   double leverage) const;

    const RiskGuardConfig& config() const {
        return config_;
    }

private:
    void halt_locked(const std::string& reason);

    RiskGuardConfig config_;
    double daily_pnl_{0.0};
    bool trading_halted_{false};
    std::string halt_reason_;
    mutable std::mutex mutex_;
};

}  // namespace trade_guard
