// include/trade_guard/risk/guardrails.hpp
#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "trade_guard/core/config_base.hpp"
#include "trade_guard/core/order_intent.hpp"
#include "trade_guard/portfolio/portfolio_snapshot.hpp"

namespace trade_guard {

/**
 * @brief Portfolio-level limits applied after the RiskEngine
 */
struct GuardrailConfig : public ConfigBase {
    double kelly_fraction_cap{0.25};
    double max_position_risk{0.10};      // notional / balance
    double max_portfolio_leverage{3.0};  // (exposure + notional) / balance
    double max_drawdown{0.20};           // equity floor after the stop is hit

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
    std::vector<std::string> validate() const override;
};

enum class GuardrailType { KELLY_FRACTION, POSITION_RISK, PORTFOLIO_EXPOSURE, DRAWDOWN_FLOOR };

/**
 * @brief Typed rejection with a stable machine code
 */
struct GuardrailRejection {
    GuardrailType type;
    std::string code;
    std::string reason;
};

/**
 * @brief Inputs every guardrail sees
 * balance is already floored at 1 to keep the ratios finite.
 */
struct GuardrailContext {
    const PortfolioSnapshot& snapshot;
    const OrderIntent& intent;
    double balance;
    double notional;
};

/**
 * @brief One named portfolio rule
 */
class Guardrail {
public:
    virtual ~Guardrail() = default;
    virtual std::optional<GuardrailRejection> check(const GuardrailContext& ctx) const = 0;
    virtual GuardrailType get_type() const = 0;
    virtual const char* code() const = 0;
};

/**
 * @brief notional must stay within balance * min(kelly, cap)
 */
class KellyFractionRule : public Guardrail {
public:
    explicit KellyFractionRule(double cap) : cap_(cap) {}
    std::optional<GuardrailRejection> check(const GuardrailContext& ctx) const override;
    GuardrailType get_type() const override {
        return GuardrailType::KELLY_FRACTION;
    }
    const char* code() const override {
        return "kelly_fraction_exceeded";
    }

private:
    double cap_;
};

class PositionRiskRule : public Guardrail {
public:
    explicit PositionRiskRule(double max_position_risk) : max_position_risk_(max_position_risk) {}
    std::optional<GuardrailRejection> check(const GuardrailContext& ctx) const override;
    GuardrailType get_type() const override {
        return GuardrailType::POSITION_RISK;
    }
    const char* code() const override {
        return "position_risk_limit";
    }

private:
    double max_position_risk_;
};

class PortfolioExposureRule : public Guardrail {
public:
    explicit PortfolioExposureRule(double max_leverage) : max_leverage_(max_leverage) {}
    std::optional<GuardrailRejection> check(const GuardrailContext& ctx) const override;
    GuardrailType get_type() const override {
        return GuardrailType::PORTFOLIO_EXPOSURE;
    }
    const char* code() const override {
        return "portfolio_exposure_limit";
    }

private:
    double max_leverage_;
};

/**
 * @brief Rejects trades whose stop would leave equity below balance * (1 - max_drawdown)
 */
class DrawdownFloorRule : public Guardrail {
public:
    explicit DrawdownFloorRule(double max_drawdown) : max_drawdown_(max_drawdown) {}
    std::optional<GuardrailRejection> check(const GuardrailContext& ctx) const override;
    GuardrailType get_type() const override {
        return GuardrailType::DRAWDOWN_FLOOR;
    }
    const char* code() const override {
        return "drawdown_guardrail";
    }

private:
    double max_drawdown_;
};

/**
 * @brief Ordered set of guardrails; the first rejection wins
 */
class GuardrailChain {
public:
    GuardrailChain() = default;

    /**
     * @brief Kelly, position risk, portfolio exposure, drawdown floor
     */
    static GuardrailChain standard(const GuardrailConfig& config);

    void add(std::unique_ptr<Guardrail> rule);

    std::optional<GuardrailRejection> evaluate(const PortfolioSnapshot& snapshot,
                                               const OrderIntent& intent) const;

    size_t size() const {
        return rules_.size();
    }

private:
    std::vector<std::unique_ptr<Guardrail>> rules_;
};

}  // namespace trade_guard
