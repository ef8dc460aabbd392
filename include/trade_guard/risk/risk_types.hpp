// include/trade_guard/risk/risk_types.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace trade_guard {

/**
 * @brief Outcome of one risk evaluation
 *
 * Approved results satisfy adjusted_size * stop_loss_pct * adjusted_leverage
 * <= max_loss_per_trade whenever a stop distance is known.
 */
struct RiskCheckResult {
    bool approved{false};
    std::string reason;
    std::string order_id;
    double adjusted_size{0.0};
    double adjusted_leverage{0.0};
    double max_loss_usd{0.0};

    static RiskCheckResult reject(std::string why) {
        RiskCheckResult r;
        r.approved = false;
        r.reason = std::move(why);
        return r;
    }

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["approved"] = approved;
        j["reason"] = reason;
        j["order_id"] = order_id;
        j["adjusted_size"] = adjusted_size;
        j["adjusted_leverage"] = adjusted_leverage;
        j["max_loss_usd"] = max_loss_usd;
        return j;
    }
};

}  // namespace trade_guard
