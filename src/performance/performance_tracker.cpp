// src/performance/performance_tracker.cpp
#include "trade_guard/performance/performance_tracker.hpp"
#include <algorithm>
#include <cmath>
#include <tuple>
#include "trade_guard/core/logger.hpp"
#include "trade_guard/core/time_utils.hpp"

namespace trade_guard {

nlohmann::json SymbolStats::to_json() const {
    nlohmann::json j;
    j["wins"] = wins;
    j["losses"] = losses;
    j["trade_count"] = trade_count();
    j["total_pnl"] = total_pnl;
    if (last_trade)
        j["last_trade"] = core::to_iso8601(*last_trade);
    return j;
}

SeededExplorationSampler::SeededExplorationSampler(uint32_t seed) : rng_(seed) {}

std::vector<std::string> SeededExplorationSampler::sample(
    const std::vector<std::string>& candidates, size_t count) {
    std::vector<std::string> pool = candidates;
    count = std::min(count, pool.size());

    std::lock_guard<std::mutex> lock(mutex_);
    // Partial Fisher-Yates: the first count slots are the sample
    for (size_t i = 0; i < count; ++i) {
        std::uniform_int_distribution<size_t> dist(i, pool.size() - 1);
        std::swap(pool[i], pool[dist(rng_)]);
    }
    pool.resize(count);
    return pool;
}

InMemoryPerformanceTracker::InMemoryPerformanceTracker(
    std::shared_ptr<ExplorationSampler> sampler, std::shared_ptr<Clock> clock)
    : sampler_(std::move(sampler)), clock_(std::move(clock)) {}

void InMemoryPerformanceTracker::record_trade(const std::string& agent_id,
                                              const std::string& symbol, double pnl) {
    double win_rate = 0.0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        SymbolStats& stats = data_[agent_id][symbol];
        if (pnl > 0.0) {
            stats.wins++;
        } else {
            stats.losses++;
        }
        stats.total_pnl += pnl;
        stats.last_trade = clock_->now();
        win_rate = static_cast<double>(stats.wins) / stats.trade_count();
    }

    INFO("Trade recorded: " << agent_id << " | " << symbol << " | PnL: " << std::showpos
                            << pnl << std::noshowpos << " | Win rate: "
                            << std::round(win_rate * 100.0) << "%");
}

std::optional<SymbolStats> InMemoryPerformanceTracker::stats_locked(
    const std::string& agent_id, const std::string& symbol) const {
    auto agent = data_.find(agent_id);
    if (agent == data_.end()) {
        return std::nullopt;
    }
    auto it = agent->second.find(symbol);
    if (it == agent->second.end()) {
        return std::nullopt;
    }
    return it->second;
}

double InMemoryPerformanceTracker::get_symbol_win_rate(const std::string& agent_id,
                                                       const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stats = stats_locked(agent_id, symbol);
    if (!stats || stats->trade_count() == 0) {
        return 0.5;
    }
    return static_cast<double>(stats->wins) / stats->trade_count();
}

std::optional<SymbolStats> InMemoryPerformanceTracker::get_symbol_stats(
    const std::string& agent_id, const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_locked(agent_id, symbol);
}

std::vector<std::string> InMemoryPerformanceTracker::get_preferred_symbols(
    const std::string& agent_id, const std::vector<std::string>& all_symbols, int min_trades,
    double min_win_rate) const {
    std::vector<std::tuple<std::string, double, double>> preferred;
    std::vector<std::string> untested;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& symbol : all_symbols) {
            auto stats = stats_locked(agent_id, symbol);
            if (!stats || stats->trade_count() < min_trades) {
                untested.push_back(symbol);
                continue;
            }
            double win_rate = static_cast<double>(stats->wins) / stats->trade_count();
            if (win_rate >= min_win_rate) {
                preferred.emplace_back(symbol, win_rate, stats->total_pnl);
            }
        }
    }

    std::sort(preferred.begin(), preferred.end(), [](const auto& a, const auto& b) {
        if (std::get<1>(a) != std::get<1>(b))
            return std::get<1>(a) > std::get<1>(b);
        return std::get<2>(a) > std::get<2>(b);
    });

    std::vector<std::string> result;
    result.reserve(preferred.size() + untested.size());
    for (const auto& entry : preferred) {
        result.push_back(std::get<0>(entry));
    }

    if (!untested.empty() && sampler_) {
        size_t exploration_count = std::max<size_t>(4, untested.size() / 5);
        auto explored = sampler_->sample(untested, exploration_count);
        result.insert(result.end(), explored.begin(), explored.end());
    }
    return result;
}

nlohmann::json InMemoryPerformanceTracker::get_agent_summary(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json summary;
    auto agent = data_.find(agent_id);
    if (agent == data_.end()) {
        summary["total_trades"] = 0;
        summary["win_rate"] = 0.0;
        summary["total_pnl"] = 0.0;
        return summary;
    }

    int wins = 0;
    int losses = 0;
    double pnl = 0.0;
    for (const auto& [_, stats] : agent->second) {
        wins += stats.wins;
        losses += stats.losses;
        pnl += stats.total_pnl;
    }
    int total = wins + losses;
    summary["total_trades"] = total;
    summary["wins"] = wins;
    summary["losses"] = losses;
    summary["win_rate"] = total > 0 ? std::round(1000.0 * wins / total) / 1000.0 : 0.0;
    summary["total_pnl"] = std::round(pnl * 100.0) / 100.0;
    summary["symbols_traded"] = agent->second.size();
    return summary;
}

}  // namespace trade_guard
