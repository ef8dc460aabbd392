// include/trade_guard/core/types.hpp

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace trade_guard {

/**
 * @brief Timestamp type for consistent time representation
 */
using Timestamp = std::chrono::system_clock::time_point;

using Price = double;
using Quantity = double;

/**
 * @brief Trading side enumeration
 */
enum class Side {
    BUY,
    SELL,
    NONE  // Used for invalid/undefined states
};

/**
 * @brief Order type enumeration
 */
enum class OrderType { MARKET, LIMIT, NONE };

inline std::string side_to_string(Side side) {
    switch (side) {
        case Side::BUY:
            return "BUY";
        case Side::SELL:
            return "SELL";
        default:
            return "NONE";
    }
}

inline Side side_from_string(const std::string& s) {
    if (s == "BUY" || s == "buy" || s == "LONG" || s == "long")
        return Side::BUY;
    if (s == "SELL" || s == "sell" || s == "SHORT" || s == "short")
        return Side::SELL;
    return Side::NONE;
}

inline std::string order_type_to_string(OrderType type) {
    switch (type) {
        case OrderType::MARKET:
            return "MARKET";
        case OrderType::LIMIT:
            return "LIMIT";
        default:
            return "NONE";
    }
}

inline OrderType order_type_from_string(const std::string& s) {
    if (s == "MARKET" || s == "market")
        return OrderType::MARKET;
    if (s == "LIMIT" || s == "limit")
        return OrderType::LIMIT;
    return OrderType::NONE;
}

}  // namespace trade_guard
