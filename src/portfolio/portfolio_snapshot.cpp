// src/portfolio/portfolio_snapshot.cpp
#include "trade_guard/portfolio/portfolio_snapshot.hpp"
#include <algorithm>
#include <cmath>
#include "trade_guard/core/time_utils.hpp"

namespace trade_guard {

size_t PortfolioSnapshot::open_position_count() const {
    return static_cast<size_t>(
        std::count_if(positions.begin(), positions.end(),
                      [](const auto& entry) { return entry.second.quantity != 0.0; }));
}

std::optional<Price> PortfolioSnapshot::last_price(const std::string& symbol) const {
    auto it = last_prices.find(symbol);
    if (it == last_prices.end() || it->second <= 0.0) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> PortfolioSnapshot::symbols() const {
    std::vector<std::string> out;
    out.reserve(positions.size());
    for (const auto& [symbol, _] : positions) {
        out.push_back(symbol);
    }
    std::sort(out.begin(), out.end());
    return out;
}

nlohmann::json PortfolioSnapshot::to_json() const {
    nlohmann::json j;
    j["balance"] = balance;
    j["total_exposure"] = total_exposure;
    j["unrealized_pnl"] = unrealized_pnl;
    j["peak_balance"] = peak_balance;
    j["equity"] = equity();
    j["timestamp"] = core::to_iso8601(timestamp);

    nlohmann::json pos = nlohmann::json::object();
    for (const auto& [symbol, p] : positions) {
        pos[symbol] = {{"quantity", p.quantity},
                       {"entry_price", p.entry_price},
                       {"mark_price", p.mark_price},
                       {"notional", p.notional},
                       {"unrealized_pnl", p.unrealized_pnl}};
    }
    j["positions"] = pos;
    return j;
}

PortfolioSnapshot build_snapshot(const std::vector<AccountBalance>& balances,
                                 const std::vector<PositionRisk>& positions, double previous_peak,
                                 Timestamp now) {
    PortfolioSnapshot snapshot;
    snapshot.timestamp = now;

    for (const auto& b : balances) {
        snapshot.balance += b.balance;
    }

    for (const auto& p : positions) {
        if (p.mark_price > 0.0) {
            snapshot.last_prices[p.symbol] = p.mark_price;
        }
        if (p.position_amt == 0.0) {
            continue;
        }

        PositionEntry entry;
        entry.symbol = p.symbol;
        entry.quantity = p.position_amt;
        entry.entry_price = p.entry_price;
        entry.mark_price = p.mark_price;
        entry.notional = std::abs(p.position_amt * p.mark_price);
        entry.unrealized_pnl = p.unrealized_profit;

        snapshot.total_exposure += entry.notional;
        snapshot.unrealized_pnl += entry.unrealized_pnl;

        // Hedge-mode accounts report one line per leg
        auto existing = snapshot.positions.find(p.symbol);
        if (existing != snapshot.positions.end()) {
            existing->second.quantity += entry.quantity;
            existing->second.notional += entry.notional;
            existing->second.unrealized_pnl += entry.unrealized_pnl;
        } else {
            snapshot.positions[p.symbol] = entry;
        }
    }

    snapshot.peak_balance = std::max({previous_peak, snapshot.balance, snapshot.equity()});
    return snapshot;
}

}  // namespace trade_guard
