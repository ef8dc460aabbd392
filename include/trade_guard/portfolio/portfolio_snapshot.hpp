// include/trade_guard/portfolio/portfolio_snapshot.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "trade_guard/core/types.hpp"
#include "trade_guard/gateway/exchange_gateway.hpp"

namespace trade_guard {

/**
 * @brief Open position as seen in one snapshot
 */
struct PositionEntry {
    std::string symbol;
    Quantity quantity{0.0};  // signed
    Price entry_price{0.0};
    Price mark_price{0.0};
    double notional{0.0};  // |quantity * mark_price|
    double unrealized_pnl{0.0};
};

/**
 * @brief Point-in-time account state, immutable once published
 */
struct PortfolioSnapshot {
    double balance{0.0};
    double total_exposure{0.0};
    std::unordered_map<std::string, PositionEntry> positions;
    double unrealized_pnl{0.0};
    double peak_balance{0.0};
    std::unordered_map<std::string, Price> last_prices;
    Timestamp timestamp{};

    double equity() const {
        return balance + unrealized_pnl;
    }

    size_t open_position_count() const;

    std::optional<Price> last_price(const std::string& symbol) const;

    std::vector<std::string> symbols() const;

    nlohmann::json to_json() const;
};

/**
 * @brief Assemble a snapshot from raw gateway reports
 * @param previous_peak Peak carried from the previous snapshot
 *
 * Flat positions are skipped. total_exposure is the sum of absolute
 * position notionals and peak_balance never decreases.
 */
PortfolioSnapshot build_snapshot(const std::vector<AccountBalance>& balances,
                                 const std::vector<PositionRisk>& positions, double previous_peak,
                                 Timestamp now);

}  // namespace trade_guard
