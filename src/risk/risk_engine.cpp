// src/risk/risk_engine.cpp
#include "trade_guard/risk/risk_engine.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include "trade_guard/core/logger.hpp"

namespace trade_guard {

namespace {

std::string fixed(double value, int precision) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(precision) << value;
    return os.str();
}

}  // namespace

double AllocationConfig::allocation_for(const std::string& agent_id, double balance) const {
    double cap = default_allocation_usd;
    auto it = overrides.find(agent_id);
    if (it != overrides.end()) {
        cap = it->second;
    } else if (equal_split_agents > 0) {
        cap = balance / equal_split_agents;
    }
    return std::max(0.0, std::min(balance, cap));
}

nlohmann::json AllocationConfig::to_json() const {
    nlohmann::json j;
    j["default_allocation_usd"] = default_allocation_usd;
    j["equal_split_agents"] = equal_split_agents;
    j["overrides"] = overrides;
    return j;
}

void AllocationConfig::from_json(const nlohmann::json& j) {
    if (j.contains("default_allocation_usd"))
        default_allocation_usd = j.at("default_allocation_usd").get<double>();
    if (j.contains("equal_split_agents"))
        equal_split_agents = j.at("equal_split_agents").get<int>();
    if (j.contains("overrides"))
        overrides = j.at("overrides").get<std::unordered_map<std::string, double>>();
}

std::vector<std::string> AllocationConfig::validate() const {
    std::vector<std::string> problems;
    if (default_allocation_usd <= 0.0)
        problems.push_back("allocation.default_allocation_usd must be positive");
    if (equal_split_agents < 0)
        problems.push_back("allocation.equal_split_agents must not be negative");
    for (const auto& [agent, amount] : overrides) {
        if (amount <= 0.0)
            problems.push_back("allocation.overrides." + agent + " must be positive");
    }
    return problems;
}

nlohmann::json RiskEngineConfig::to_json() const {
    nlohmann::json j;
    j["max_drawdown_pct"] = max_drawdown_pct;
    j["max_per_trade_pct"] = max_per_trade_pct;
    j["min_margin_buffer_usdt"] = min_margin_buffer_usdt;
    j["allocation"] = allocation.to_json();
    return j;
}

void RiskEngineConfig::from_json(const nlohmann::json& j) {
    if (j.contains("max_drawdown_pct"))
        max_drawdown_pct = j.at("max_drawdown_pct").get<double>();
    if (j.contains("max_per_trade_pct"))
        max_per_trade_pct = j.at("max_per_trade_pct").get<double>();
    if (j.contains("min_margin_buffer_usdt"))
        min_margin_buffer_usdt = j.at("min_margin_buffer_usdt").get<double>();
    if (j.contains("allocation"))
        allocation.from_json(j.at("allocation"));
}

std::vector<std::string> RiskEngineConfig::validate() const {
    std::vector<std::string> problems;
    if (max_drawdown_pct <= 0.0 || max_drawdown_pct > 100.0)
        problems.push_back("max_drawdown_pct must be in (0, 100]");
    if (max_per_trade_pct <= 0.0 || max_per_trade_pct > 100.0)
        problems.push_back("max_per_trade_pct must be in (0, 100]");
    if (min_margin_buffer_usdt < 0.0)
        problems.push_back("min_margin_buffer_usdt must not be negative");
    auto sub = allocation.validate();
    problems.insert(problems.end(), sub.begin(), sub.end());
    return problems;
}

double kelly_fraction(double win_rate, double reward_to_risk) {
    if (reward_to_risk <= 0.0) {
        return 0.0;
    }
    return std::max(0.0, win_rate - (1.0 - win_rate) / reward_to_risk);
}

std::optional<double> drawdown_pct(double peak_balance, double balance, double unrealized_pnl) {
    double peak = std::max(peak_balance, balance);
    if (peak <= 0.0) {
        return std::nullopt;
    }
    double equity = balance + unrealized_pnl;
    return std::max(0.0, (peak - equity) / peak * 100.0);
}

RiskEngine::RiskEngine(RiskEngineConfig config) : config_(std::move(config)) {}

RiskCheckResult RiskEngine::check_drawdown(const PortfolioSnapshot& snapshot) const {
    auto dd = drawdown_pct(snapshot.peak_balance, snapshot.balance, snapshot.unrealized_pnl);
    if (!dd) {
        return RiskCheckResult::reject("Invalid peak balance");
    }
    if (*dd > config_.max_drawdown_pct) {
        return RiskCheckResult::reject("Drawdown " + fixed(*dd, 1) + "% > " +
                                       fixed(config_.max_drawdown_pct, 1) + "%");
    }
    RiskCheckResult ok;
    ok.approved = true;
    return ok;
}

RiskCheckResult RiskEngine::check_margin_buffer(const PortfolioSnapshot& snapshot) const {
    if (snapshot.balance < config_.min_margin_buffer_usdt) {
        return RiskCheckResult::reject("Balance " + fixed(snapshot.balance, 2) + " < buffer " +
                                       fixed(config_.min_margin_buffer_usdt, 2));
    }
    RiskCheckResult ok;
    ok.approved = true;
    return ok;
}

double RiskEngine::evaluated_notional(const PortfolioSnapshot& snapshot,
                                      const OrderIntent& intent) {
    if (!intent.quantity) {
        return intent.notional;
    }
    std::optional<Price> reference = intent.price;
    if (!reference) {
        reference = snapshot.last_price(intent.symbol);
    }
    if (!reference) {
        return intent.notional;
    }
    return *intent.quantity * *reference;
}

RiskCheckResult RiskEngine::check_per_trade_exposure(const PortfolioSnapshot& snapshot,
                                                     const OrderIntent& intent,
                                                     const std::string& agent_id) const {
    double notional = evaluated_notional(snapshot, intent);
    double allocation = config_.allocation.allocation_for(agent_id, snapshot.balance);
    double kelly = kelly_fraction(intent.expected_win_rate, intent.reward_to_risk);
    double fraction = std::min(kelly, config_.max_per_trade_pct / 100.0);
    double limit = allocation * fraction;

    if (notional > limit) {
        return RiskCheckResult::reject("Trade size " + fixed(notional, 2) + " > limit " +
                                       fixed(limit, 2) + " (kelly " + fixed(kelly, 3) + ", " +
                                       fixed(config_.max_per_trade_pct, 1) +
                                       "% of agent allocation $" + fixed(allocation, 0) + ")");
    }

    RiskCheckResult ok;
    ok.approved = true;
    ok.adjusted_size = notional;
    return ok;
}

RiskCheckResult RiskEngine::evaluate(const PortfolioSnapshot& snapshot, const OrderIntent& intent,
                                     const std::string& agent_id,
                                     const std::string& order_id) const {
    auto drawdown = check_drawdown(snapshot);
    if (!drawdown.approved) {
        WARN("Order rejected [" << agent_id << "]: " << drawdown.reason);
        return drawdown;
    }
    auto margin = check_margin_buffer(snapshot);
    if (!margin.approved) {
        WARN("Order rejected [" << agent_id << "]: " << margin.reason);
        return margin;
    }
    auto exposure = check_per_trade_exposure(snapshot, intent, agent_id);
    if (!exposure.approved) {
        WARN("Order rejected [" << agent_id << "]: " << exposure.reason);
        return exposure;
    }

    RiskCheckResult result;
    result.approved = true;
    result.order_id = order_id;
    result.adjusted_size = exposure.adjusted_size;
    result.adjusted_leverage = intent.leverage.value_or(1.0);
    result.max_loss_usd =
        result.adjusted_size * intent.stop_loss_pct().value_or(0.0) * result.adjusted_leverage;
    result.reason = "approved";

    INFO("Order approved [" << agent_id << "]: " << intent.symbol << " "
                            << side_to_string(intent.side) << " notional="
                            << fixed(result.adjusted_size, 2));
    return result;
}

}  // namespace trade_guard
