// src/risk/guardrails.cpp
#include "trade_guard/risk/guardrails.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include "trade_guard/risk/risk_engine.hpp"

namespace trade_guard {

namespace {

std::string fixed2(double value) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(2) << value;
    return os.str();
}

}  // namespace

nlohmann::json GuardrailConfig::to_json() const {
    nlohmann::json j;
    j["kelly_fraction_cap"] = kelly_fraction_cap;
    j["max_position_risk"] = max_position_risk;
    j["max_portfolio_leverage"] = max_portfolio_leverage;
    j["max_drawdown"] = max_drawdown;
    return j;
}

void GuardrailConfig::from_json(const nlohmann::json& j) {
    if (j.contains("kelly_fraction_cap"))
        kelly_fraction_cap = j.at("kelly_fraction_cap").get<double>();
    if (j.contains("max_position_risk"))
        max_position_risk = j.at("max_position_risk").get<double>();
    if (j.contains("max_portfolio_leverage"))
        max_portfolio_leverage = j.at("max_portfolio_leverage").get<double>();
    if (j.contains("max_drawdown"))
        max_drawdown = j.at("max_drawdown").get<double>();
}

std::vector<std::string> GuardrailConfig::validate() const {
    std::vector<std::string> problems;
    if (kelly_fraction_cap <= 0.0 || kelly_fraction_cap > 1.0)
        problems.push_back("kelly_fraction_cap must be in (0, 1]");
    if (max_position_risk <= 0.0)
        problems.push_back("max_position_risk must be positive");
    if (max_portfolio_leverage <= 0.0)
        problems.push_back("max_portfolio_leverage must be positive");
    if (max_drawdown <= 0.0 || max_drawdown >= 1.0)
        problems.push_back("max_drawdown must be in (0, 1)");
    return problems;
}

std::optional<GuardrailRejection> KellyFractionRule::check(const GuardrailContext& ctx) const {
    double kelly = std::min(kelly_fraction(ctx.intent.expected_win_rate, ctx.intent.reward_to_risk),
                            cap_);
    double limit = ctx.balance * std::max(kelly, 1e-3);
    if (ctx.notional > limit) {
        return GuardrailRejection{get_type(), code(),
                                  "Notional " + fixed2(ctx.notional) + " exceeds Kelly limit " +
                                      fixed2(limit)};
    }
    return std::nullopt;
}

std::optional<GuardrailRejection> PositionRiskRule::check(const GuardrailContext& ctx) const {
    double limit = ctx.balance * max_position_risk_;
    if (ctx.notional > limit) {
        return GuardrailRejection{get_type(), code(),
                                  "Notional " + fixed2(ctx.notional) +
                                      " exceeds position risk limit " + fixed2(limit)};
    }
    return std::nullopt;
}

std::optional<GuardrailRejection> PortfolioExposureRule::check(const GuardrailContext& ctx) const {
    double projected = ctx.snapshot.total_exposure + ctx.notional;
    double limit = ctx.balance * max_leverage_;
    if (projected > limit) {
        return GuardrailRejection{get_type(), code(),
                                  "Projected exposure " + fixed2(projected) + " exceeds " +
                                      fixed2(limit)};
    }
    return std::nullopt;
}

std::optional<GuardrailRejection> DrawdownFloorRule::check(const GuardrailContext& ctx) const {
    double risk_amount = ctx.notional * ctx.intent.stop_loss_pct().value_or(0.0);
    if (risk_amount <= 0.0) {
        return std::nullopt;
    }
    double projected = ctx.balance + ctx.snapshot.unrealized_pnl - risk_amount;
    double floor = ctx.balance * (1.0 - max_drawdown_);
    if (projected < floor) {
        return GuardrailRejection{get_type(), code(),
                                  "Equity after stop " + fixed2(projected) +
                                      " would breach floor " + fixed2(floor)};
    }
    return std::nullopt;
}

GuardrailChain GuardrailChain::standard(const GuardrailConfig& config) {
    GuardrailChain chain;
    chain.add(std::make_unique<KellyFractionRule>(config.kelly_fraction_cap));
    chain.add(std::make_unique<PositionRiskRule>(config.max_position_risk));
    chain.add(std::make_unique<PortfolioExposureRule>(config.max_portfolio_leverage));
    chain.add(std::make_unique<DrawdownFloorRule>(config.max_drawdown));
    return chain;
}

void GuardrailChain::add(std::unique_ptr<Guardrail> rule) {
    rules_.push_back(std::move(rule));
}

std::optional<GuardrailRejection> GuardrailChain::evaluate(const PortfolioSnapshot& snapshot,
                                                           const OrderIntent& intent) const {
    GuardrailContext ctx{snapshot, intent, std::max(snapshot.balance, 1.0),
                         RiskEngine::evaluated_notional(snapshot, intent)};
    for (const auto& rule : rules_) {
        auto rejection = rule->check(ctx);
        if (rejection) {
            return rejection;
        }
    }
    return std::nullopt;
}

}  // namespace trade_guard
