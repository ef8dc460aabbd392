// include/trade_guard/gateway/exchange_gateway.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "trade_guard/core/error.hpp"

namespace trade_guard {

/**
 * @brief One asset line of the account balance report
 */
struct AccountBalance {
    std::string asset;
    double balance{0.0};
    double available_balance{0.0};
};

/**
 * @brief One symbol line of the position risk report
 */
struct PositionRisk {
    std::string symbol;
    double position_amt{0.0};  // signed, negative for shorts
    double entry_price{0.0};
    double mark_price{0.0};
    double unrealized_profit{0.0};
    double leverage{1.0};
};

/**
 * @brief Boundary to the execution venue
 *
 * Implementations own transport, retries and per-call timeouts. Every call
 * reports failure through Result so callers can feed circuit breakers.
 */
class ExchangeGateway {
public:
    virtual ~ExchangeGateway() = default;

    /**
     * @brief Submit a decorated order payload
     * @return The venue acknowledgement
     */
    virtual Result<nlohmann::json> place_order(const nlohmann::json& payload) = 0;

    virtual Result<void> cancel_all_orders(const std::string& symbol) = 0;

    virtual Result<std::vector<AccountBalance>> account_balance() = 0;

    virtual Result<std::vector<PositionRisk>> position_risk() = 0;
};

}  // namespace trade_guard
