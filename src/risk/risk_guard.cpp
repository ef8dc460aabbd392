// src/risk/risk_guard.cpp
#include "trade_guard/risk/risk_guard.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <vector>
#include "trade_guard/core/logger.hpp"

namespace trade_guard {

namespace {

std::string usd(double value, int precision = 0) {
    std::ostringstream os;
    os << "$" << std::fixed << std::setprecision(precision) << value;
    return os.str();
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::ostringstream os;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0)
            os << sep;
        os << parts[i];
    }
    return os.str();
}

}  // namespace

nlohmann::json RiskGuardConfig::to_json() const {
    nlohmann::json j;
    j["max_loss_per_trade"] = max_loss_per_trade;
    j["max_leverage"] = max_leverage;
    j["max_position_pct"] = max_position_pct;
    j["max_daily_loss_pct"] = max_daily_loss_pct;
    j["max_daily_loss_usd"] = max_daily_loss_usd;
    j["min_position_size_usd"] = min_position_size_usd;
    j["default_atr_pct"] = default_atr_pct;
    return j;
}

void RiskGuardConfig::from_json(const nlohmann::json& j) {
    if (j.contains("max_loss_per_trade"))
        max_loss_per_trade = j.at("max_loss_per_trade").get<double>();
    if (j.contains("max_leverage"))
        max_leverage = j.at("max_leverage").get<double>();
    if (j.contains("max_position_pct"))
        max_position_pct = j.at("max_position_pct").get<double>();
    if (j.contains("max_daily_loss_pct"))
        max_daily_loss_pct = j.at("max_daily_loss_pct").get<double>();
    if (j.contains("max_daily_loss_usd"))
        max_daily_loss_usd = j.at("max_daily_loss_usd").get<double>();
    if (j.contains("min_position_size_usd"))
        min_position_size_usd = j.at("min_position_size_usd").get<double>();
    if (j.contains("default_atr_pct"))
        default_atr_pct = j.at("default_atr_pct").get<double>();
}

std::vector<std::string> RiskGuardConfig::validate() const {
    std::vector<std::string> problems;
    if (max_loss_per_trade <= 0.0)
        problems.push_back("risk_guard.max_loss_per_trade must be positive");
    if (max_leverage < 1.0)
        problems.push_back("risk_guard.max_leverage must be at least 1");
    if (max_position_pct <= 0.0 || max_position_pct > 1.0)
        problems.push_back("risk_guard.max_position_pct must be in (0, 1]");
    if (max_daily_loss_pct <= 0.0 || max_daily_loss_pct >= 1.0)
        problems.push_back("risk_guard.max_daily_loss_pct must be in (0, 1)");
    if (max_daily_loss_usd <= 0.0)
        problems.push_back("risk_guard.max_daily_loss_usd must be positive");
    if (min_position_size_usd < 0.0)
        problems.push_back("risk_guard.min_position_size_usd must not be negative");
    return problems;
}

RiskGuard::RiskGuard(RiskGuardConfig config) : config_(std::move(config)) {
    INFO("RiskGuard initialized: max loss " << usd(config_.max_loss_per_trade)
                                            << ", max leverage " << config_.max_leverage << "x");
}

RiskCheckResult RiskGuard::check_trade(double portfolio_balance, double proposed_notional,
                                       double proposed_leverage, double stop_loss_pct,
                                       const std::string& symbol,
                                       std::optional<double> atr_pct) const {
    std::vector<std::string> reasons;

    if (proposed_leverage <= 0.0 || stop_loss_pct < 0.0 || proposed_notional <= 0.0) {
        return RiskCheckResult::reject("Invalid trade parameters");
    }

    double adjusted_leverage = std::min(proposed_leverage, config_.max_leverage);
    if (adjusted_leverage < proposed_leverage) {
        std::ostringstream os;
        os << std::fixed << std::setprecision(1) << "Leverage capped: " << proposed_leverage
           << "x -> " << adjusted_leverage << "x";
        reasons.push_back(os.str());
    }

    double max_notional = portfolio_balance * config_.max_position_pct;
    double adjusted_notional = std::min(proposed_notional, max_notional);
    if (adjusted_notional < proposed_notional) {
        reasons.push_back("Position capped: " + usd(proposed_notional) + " -> " +
                          usd(adjusted_notional));
    }

    double potential_loss = adjusted_notional * stop_loss_pct * adjusted_leverage;
    if (potential_loss > config_.max_loss_per_trade) {
        double safe_notional = config_.max_loss_per_trade / (stop_loss_pct * adjusted_leverage);
        if (safe_notional < adjusted_notional) {
            adjusted_notional = safe_notional;
            reasons.push_back("Size reduced for " + usd(config_.max_loss_per_trade) +
                              " loss cap: " + usd(adjusted_notional));
        }
    }

    double atr = atr_pct.value_or(config_.default_atr_pct);
    double volatility_multiplier = 1.0;
    if (atr > 0.04) {
        volatility_multiplier = 0.5;
        reasons.push_back("High volatility: size halved");
    } else if (atr > 0.025) {
        volatility_multiplier = 0.7;
        reasons.push_back("Elevated volatility: size reduced 30%");
    }
    adjusted_notional *= volatility_multiplier;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (trading_halted_) {
            return RiskCheckResult::reject("Trading halted: " + halt_reason_);
        }
        double daily_loss_limit = portfolio_balance * config_.max_daily_loss_pct;
        if (daily_pnl_ < -daily_loss_limit) {
            return RiskCheckResult::reject("Daily loss limit reached: " +
                                           usd(std::abs(daily_pnl_), 2));
        }
    }

    // The loss cap can push a trade under the minimum; it is rejected, never floored back up
    if (adjusted_notional < config_.min_position_size_usd) {
        return RiskCheckResult::reject("Position too small: " + usd(adjusted_notional, 2) +
                                       " < " + usd(config_.min_position_size_usd, 2));
    }

    RiskCheckResult result;
    result.approved = true;
    result.adjusted_size = adjusted_notional;
    result.adjusted_leverage = adjusted_leverage;
    result.max_loss_usd = adjusted_notional * stop_loss_pct * adjusted_leverage;
    result.reason = reasons.empty() ? "Approved: all risk checks passed"
                                    : "Approved with adjustments: " + join(reasons, " | ");

    INFO("RiskGuard " << symbol << ": notional=" << usd(result.adjusted_size)
                      << " lev=" << result.adjusted_leverage
                      << "x max_loss=" << usd(result.max_loss_usd, 2));
    return result;
}

void RiskGuard::halt_locked(const std::string& reason) {
    trading_halted_ = true;
    halt_reason_ = reason;
    FATAL("TRADING HALTED: " << reason);
}

bool RiskGuard::record_trade_result(double pnl) {
    std::lock_guard<std::mutex> lock(mutex_);
    daily_pnl_ += pnl;
    if (pnl < 0.0) {
        WARN("Trade loss: " << usd(pnl, 2) << " | daily PnL: " << usd(daily_pnl_, 2));
    }

    if (trading_halted_) {
        return false;
    }
    if (daily_pnl_ < -config_.max_daily_loss_usd) {
        halt_locked("Daily loss limit reached: " + usd(std::abs(daily_pnl_), 2));
        return false;
    }
    return true;
}

bool RiskGuard::check_daily_limit(double portfolio_balance) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (trading_halted_) {
        return false;
    }
    if (daily_pnl_ < -portfolio_balance * config_.max_daily_loss_pct) {
        halt_locked("Daily loss limit (" + std::to_string(config_.max_daily_loss_pct * 100.0) +
                    "%) reached: " + usd(std::abs(daily_pnl_), 2));
        return false;
    }
    return true;
}

void RiskGuard::reset_daily_pnl() {
    std::lock_guard<std::mutex> lock(mutex_);
    daily_pnl_ = 0.0;
    trading_halted_ = false;
    halt_reason_.clear();
    INFO("Daily PnL reset, trading resumed");
}

bool RiskGuard::is_trading_halted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trading_halted_;
}

std::optional<std::string> RiskGuard::halt_reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!trading_halted_) {
        return std::nullopt;
    }
    return halt_reason_;
}

double RiskGuard::daily_pnl() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return daily_pnl_;
}

double RiskGuard::max_position_for_symbol(double portfolio_balance, double stop_loss_pct,
                                          double leverage) const {
    double safe_leverage = std::min(std::max(leverage, 1.0), config_.max_leverage);
    double max_by_portfolio = portfolio_balance * config_.max_position_pct;
    if (stop_loss_pct <= 0.0) {
        return max_by_portfolio;
    }
    double max_by_loss = config_.max_loss_per_trade / (stop_loss_pct * safe_leverage);
    return std::min(max_by_loss, max_by_portfolio);
}

}  // namespace trade_guard
