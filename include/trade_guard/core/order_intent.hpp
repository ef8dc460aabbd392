// include/trade_guard/core/order_intent.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "trade_guard/core/error.hpp"
#include "trade_guard/core/types.hpp"

namespace trade_guard {

/**
 * @brief A proposed trade awaiting risk clearance
 * Built once at the boundary, never mutated afterwards.
 */
struct OrderIntent {
    std::string symbol;
    Side side{Side::BUY};
    OrderType order_type{OrderType::MARKET};
    double notional{0.0};
    std::optional<Quantity> quantity;
    std::optional<Price> price;
    std::optional<Price> take_profit;
    std::optional<Price> stop_loss;
    std::optional<double> leverage;
    double expected_win_rate{0.55};
    double reward_to_risk{2.0};
    nlohmann::json client_metadata = nlohmann::json::object();

    /**
     * @brief Parse and validate a JSON body
     * @return INVALID_ARGUMENT describing the first offending field
     */
    static Result<OrderIntent> from_json(const nlohmann::json& j);

    nlohmann::json to_json() const;

    /**
     * @brief Price used to size and bound the order
     * intent.price, else client_metadata.entry_price
     */
    std::optional<Price> entry_price() const;

    /**
     * @brief Stop distance as a fraction of entry, when both are known
     */
    std::optional<double> stop_loss_pct() const;

    /**
     * @brief Loss at the stop: notional * |entry - stop| / entry, or 0 without a stop
     */
    double potential_loss() const;
};

}  // namespace trade_guard
