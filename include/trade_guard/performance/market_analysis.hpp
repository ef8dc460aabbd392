// include/trade_guard/performance/market_analysis.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "trade_guard/core/error.hpp"

namespace trade_guard {

enum class Trend { BULLISH, BEARISH, NEUTRAL };

inline std::string trend_to_string(Trend trend) {
    switch (trend) {
        case Trend::BULLISH:
            return "BULLISH";
        case Trend::BEARISH:
            return "BEARISH";
        default:
            return "NEUTRAL";
    }
}

inline Trend trend_from_string(const std::string& s) {
    if (s == "BULLISH" || s == "bullish")
        return Trend::BULLISH;
    if (s == "BEARISH" || s == "bearish")
        return Trend::BEARISH;
    return Trend::NEUTRAL;
}

/**
 * @brief Pre-computed indicators for one symbol
 * atr is in price units, not a percentage.
 */
struct MarketAnalysis {
    std::optional<double> atr;
    Trend trend{Trend::NEUTRAL};
    double rsi{50.0};

    static MarketAnalysis from_json(const nlohmann::json& j) {
        MarketAnalysis analysis;
        if (j.contains("atr") && j.at("atr").is_number())
            analysis.atr = j.at("atr").get<double>();
        if (j.contains("trend") && j.at("trend").is_string())
            analysis.trend = trend_from_string(j.at("trend").get<std::string>());
        if (j.contains("rsi") && j.at("rsi").is_number())
            analysis.rsi = j.at("rsi").get<double>();
        return analysis;
    }
};

/**
 * @brief Source of indicators when the caller supplies none
 */
class MarketAnalysisProvider {
public:
    virtual ~MarketAnalysisProvider() = default;
    virtual Result<MarketAnalysis> get_market_analysis(const std::string& symbol) = 0;
};

}  // namespace trade_guard
