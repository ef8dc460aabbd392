// src/risk/adaptive_tpsl.cpp
#include "trade_guard/risk/adaptive_tpsl.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <vector>
#include "trade_guard/core/logger.hpp"

namespace trade_guard {

namespace {

std::string pct(double value, int precision = 1) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(precision) << value * 100.0 << "%";
    return os.str();
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0)
            out += sep;
        out += parts[i];
    }
    return out;
}

}  // namespace

nlohmann::json AdaptiveTPSLConfig::to_json() const {
    nlohmann::json j;
    j["base_tp_pct"] = base_tp_pct;
    j["base_sl_pct"] = base_sl_pct;
    j["min_tp_pct"] = min_tp_pct;
    j["max_tp_pct"] = max_tp_pct;
    j["min_sl_pct"] = min_sl_pct;
    j["max_sl_pct"] = max_sl_pct;
    j["min_reward_to_risk"] = min_reward_to_risk;
    j["trailing_activation_pct"] = trailing_activation_pct;
    j["trailing_distance_pct"] = trailing_distance_pct;
    j["min_history_trades"] = min_history_trades;
    j["atr_cache_ttl_seconds"] = atr_cache_ttl_seconds;
    return j;
}

void AdaptiveTPSLConfig::from_json(const nlohmann::json& j) {
    if (j.contains("base_tp_pct"))
        base_tp_pct = j.at("base_tp_pct").get<double>();
    if (j.contains("base_sl_pct"))
        base_sl_pct = j.at("base_sl_pct").get<double>();
    if (j.contains("min_tp_pct"))
        min_tp_pct = j.at("min_tp_pct").get<double>();
    if (j.contains("max_tp_pct"))
        max_tp_pct = j.at("max_tp_pct").get<double>();
    if (j.contains("min_sl_pct"))
        min_sl_pct = j.at("min_sl_pct").get<double>();
    if (j.contains("max_sl_pct"))
        max_sl_pct = j.at("max_sl_pct").get<double>();
    if (j.contains("min_reward_to_risk"))
        min_reward_to_risk = j.at("min_reward_to_risk").get<double>();
    if (j.contains("trailing_activation_pct"))
        trailing_activation_pct = j.at("trailing_activation_pct").get<double>();
    if (j.contains("trailing_distance_pct"))
        trailing_distance_pct = j.at("trailing_distance_pct").get<double>();
    if (j.contains("min_history_trades"))
        min_history_trades = j.at("min_history_trades").get<int>();
    if (j.contains("atr_cache_ttl_seconds"))
        atr_cache_ttl_seconds = j.at("atr_cache_ttl_seconds").get<int>();
}

std::vector<std::string> AdaptiveTPSLConfig::validate() const {
    std::vector<std::string> problems;
    if (min_tp_pct <= 0.0 || min_tp_pct > max_tp_pct)
        problems.push_back("take-profit bounds must satisfy 0 < min_tp_pct <= max_tp_pct");
    if (min_sl_pct <= 0.0 || min_sl_pct > max_sl_pct)
        problems.push_back("stop-loss bounds must satisfy 0 < min_sl_pct <= max_sl_pct");
    if (min_reward_to_risk <= 0.0)
        problems.push_back("min_reward_to_risk must be positive");
    if (atr_cache_ttl_seconds < 0)
        problems.push_back("atr_cache_ttl_seconds must not be negative");
    return problems;
}

nlohmann::json AdaptiveTPSL::to_json() const {
    nlohmann::json j;
    j["tp_pct"] = tp_pct;
    j["sl_pct"] = sl_pct;
    j["tp_price"] = tp_price;
    j["sl_price"] = sl_price;
    j["trailing_activation_pct"] = trailing_activation_pct;
    j["trailing_distance_pct"] = trailing_distance_pct;
    j["reasoning"] = reasoning;
    return j;
}

AdaptiveTPSLCalculator::AdaptiveTPSLCalculator(AdaptiveTPSLConfig config,
                                               std::shared_ptr<PerformanceTracker> performance,
                                               std::shared_ptr<MarketAnalysisProvider> market,
                                               std::shared_ptr<Clock> clock)
    : config_(std::move(config)),
      performance_(std::move(performance)),
      market_(std::move(market)),
      clock_(std::move(clock)) {
    Logger::register_component("AdaptiveTPSL");
}

std::optional<double> AdaptiveTPSLCalculator::lookup_atr(
    const std::string& symbol, const std::optional<MarketAnalysis>& analysis) {
    if (analysis && analysis->atr) {
        return analysis->atr;
    }

    auto now = clock_->now();
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = atr_cache_.find(symbol);
        if (it != atr_cache_.end() &&
            now - it->second.fetched_at < std::chrono::seconds(config_.atr_cache_ttl_seconds)) {
            return it->second.atr;
        }
    }

    if (!market_) {
        return std::nullopt;
    }

    auto fetched = market_->get_market_analysis(symbol);
    if (fetched.is_error()) {
        WARN("ATR lookup failed for " << symbol << ": " << fetched.error()->what());
        return std::nullopt;
    }
    if (!fetched.value().atr) {
        return std::nullopt;
    }

    double atr = *fetched.value().atr;
    std::lock_guard<std::mutex> lock(cache_mutex_);
    atr_cache_[symbol] = CachedAtr{atr, now};
    return atr;
}

AdaptiveTPSL AdaptiveTPSLCalculator::calculate(const std::string& symbol, Side side,
                                               Price entry_price,
                                               const std::optional<std::string>& agent_id,
                                               double confidence,
                                               const std::optional<MarketAnalysis>& analysis) {
    std::vector<std::string> reasons;
    double tp_pct = config_.base_tp_pct;
    double sl_pct = config_.base_sl_pct;

    // Volatility
    double atr_multiplier = 1.0;
    auto atr = lookup_atr(symbol, analysis);
    if (!atr && market_) {
        reasons.push_back("ATR unavailable");
    }
    if (atr && *atr > 0.0 && entry_price > 0.0) {
        double atr_pct = *atr / entry_price;
        if (atr_pct > 0.02) {
            atr_multiplier = 1.5;
            reasons.push_back("High Vol (ATR " + pct(atr_pct) + ")");
        } else if (atr_pct > 0.01) {
            atr_multiplier = 1.0 + (atr_pct - 0.01) * 25.0;
            reasons.push_back("Normal Vol (ATR " + pct(atr_pct) + ")");
        } else {
            atr_multiplier = 0.8;
            reasons.push_back("Low Vol (ATR " + pct(atr_pct) + ")");
        }
    }
    tp_pct *= atr_multiplier;
    sl_pct *= atr_multiplier;

    // Agent history on this symbol
    double win_rate = 0.5;
    if (performance_ && agent_id) {
        win_rate = performance_->get_symbol_win_rate(*agent_id, symbol);
        auto stats = performance_->get_symbol_stats(*agent_id, symbol);
        int total_trades = stats ? stats->trade_count() : 0;

        if (total_trades >= config_.min_history_trades) {
            if (win_rate > 0.65) {
                tp_pct *= 0.85;
                sl_pct *= 1.1;
                reasons.push_back("High WR (" + pct(win_rate, 0) + "): Tighter TP");
            } else if (win_rate < 0.45) {
                tp_pct *= 1.2;
                sl_pct *= 0.85;
                reasons.push_back("Low WR (" + pct(win_rate, 0) + "): Wider TP, Tight SL");
            } else {
                reasons.push_back("WR: " + pct(win_rate, 0) + " (balanced)");
            }
        } else {
            reasons.push_back("History: " + std::to_string(total_trades) + " trades (learning)");
        }
    }

    // Consensus confidence
    if (confidence >= 0.85) {
        tp_pct *= 1.15;
        reasons.push_back("High Conf (" + pct(confidence, 0) + "): Aggressive TP");
    } else if (confidence < 0.65) {
        sl_pct *= 0.9;
        tp_pct *= 0.9;
        reasons.push_back("Low Conf (" + pct(confidence, 0) + "): Conservative");
    }

    // Regime
    if (analysis) {
        bool aligned = (side == Side::BUY && analysis->trend == Trend::BULLISH) ||
                       (side == Side::SELL && analysis->trend == Trend::BEARISH);
        bool counter = (side == Side::BUY && analysis->trend == Trend::BEARISH) ||
                       (side == Side::SELL && analysis->trend == Trend::BULLISH);
        if (aligned) {
            tp_pct *= 1.1;
            reasons.push_back("Trend Aligned");
        } else if (counter) {
            sl_pct *= 0.85;
            reasons.push_back("Counter-Trend");
        }

        if ((side == Side::BUY && analysis->rsi < 30.0) ||
            (side == Side::SELL && analysis->rsi > 70.0)) {
            tp_pct *= 1.2;
            std::ostringstream os;
            os << "RSI Extreme (" << std::fixed << std::setprecision(0) << analysis->rsi << ")";
            reasons.push_back(os.str());
        }
    }

    tp_pct = std::clamp(tp_pct, config_.min_tp_pct, config_.max_tp_pct);
    sl_pct = std::clamp(sl_pct, config_.min_sl_pct, config_.max_sl_pct);

    if (tp_pct / sl_pct < config_.min_reward_to_risk) {
        sl_pct = tp_pct / config_.min_reward_to_risk;
        std::ostringstream os;
        os << "R:R enforced (>=" << std::fixed << std::setprecision(1)
           << config_.min_reward_to_risk << ")";
        reasons.push_back(os.str());
    }

    AdaptiveTPSL result;
    result.tp_pct = tp_pct;
    result.sl_pct = sl_pct;
    if (side == Side::SELL) {
        result.tp_price = entry_price * (1.0 - tp_pct);
        result.sl_price = entry_price * (1.0 + sl_pct);
    } else {
        result.tp_price = entry_price * (1.0 + tp_pct);
        result.sl_price = entry_price * (1.0 - sl_pct);
    }

    result.trailing_activation_pct = config_.trailing_activation_pct;
    result.trailing_distance_pct = config_.trailing_distance_pct;
    if (atr_multiplier > 1.2) {
        result.trailing_activation_pct *= 1.3;
        result.trailing_distance_pct *= 1.3;
    }
    if (win_rate > 0.6) {
        result.trailing_distance_pct *= 0.85;
    }

    std::ostringstream reasoning;
    reasoning << "TP: " << pct(tp_pct) << " | SL: " << pct(sl_pct) << " | R:R: " << std::fixed
              << std::setprecision(1) << (sl_pct > 0.0 ? tp_pct / sl_pct : 0.0) << ". "
              << (reasons.empty() ? std::string("Default settings") : join(reasons, " | "));
    result.reasoning = reasoning.str();

    INFO("Adaptive TP/SL for " << symbol << " " << side_to_string(side) << ": "
                               << result.reasoning);
    return result;
}

std::optional<TrailingUpdate> AdaptiveTPSLCalculator::adjust_for_trailing(
    double pnl_pct, double current_sl_pct, Price entry_price, Price high_water_mark, Side side,
    double activation, double distance) const {
    if (pnl_pct < activation || entry_price <= 0.0) {
        return std::nullopt;
    }

    if (side == Side::BUY) {
        Price candidate = high_water_mark * (1.0 - distance);
        Price current = entry_price * (1.0 - current_sl_pct);
        if (candidate > current) {
            double locked = (candidate - entry_price) / entry_price;
            return TrailingUpdate{candidate, "Trailing: Locked " + pct(locked) + " profit"};
        }
    } else if (side == Side::SELL) {
        Price candidate = high_water_mark * (1.0 + distance);
        Price current = entry_price * (1.0 + current_sl_pct);
        if (candidate < current) {
            double locked = (entry_price - candidate) / entry_price;
            return TrailingUpdate{candidate, "Trailing: Locked " + pct(locked) + " profit"};
        }
    }
    return std::nullopt;
}

}  // namespace trade_guard
