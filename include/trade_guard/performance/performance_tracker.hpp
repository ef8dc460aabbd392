// include/trade_guard/performance/performance_tracker.hpp
#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>
#include "trade_guard/core/clock.hpp"
#include "trade_guard/core/types.hpp"

namespace trade_guard {

/**
 * @brief Trade history of one agent on one symbol
 */
struct SymbolStats {
    int wins{0};
    int losses{0};
    double total_pnl{0.0};
    std::optional<Timestamp> last_trade;

    int trade_count() const {
        return wins + losses;
    }

    nlohmann::json to_json() const;
};

/**
 * @brief Read-only trade history consumed by the AdaptiveTPSLCalculator
 */
class PerformanceTracker {
public:
    virtual ~PerformanceTracker() = default;

    /**
     * @brief Win rate in [0, 1], 0.5 when nothing was recorded
     */
    virtual double get_symbol_win_rate(const std::string& agent_id,
                                       const std::string& symbol) const = 0;

    virtual std::optional<SymbolStats> get_symbol_stats(const std::string& agent_id,
                                                        const std::string& symbol) const = 0;
};

/**
 * @brief Picks untested symbols to explore
 */
class ExplorationSampler {
public:
    virtual ~ExplorationSampler() = default;

    /**
     * @brief Choose min(count, candidates.size()) distinct symbols
     */
    virtual std::vector<std::string> sample(const std::vector<std::string>& candidates,
                                            size_t count) = 0;
};

/**
 * @brief Uniform sampling without replacement from a seeded mt19937
 */
class SeededExplorationSampler : public ExplorationSampler {
public:
    explicit SeededExplorationSampler(uint32_t seed = std::random_device{}());

    std::vector<std::string> sample(const std::vector<std::string>& candidates,
                                    size_t count) override;

private:
    std::mt19937 rng_;
    std::mutex mutex_;
};

/**
 * @brief Process-local performance tracker
 */
class InMemoryPerformanceTracker : public PerformanceTracker {
public:
    explicit InMemoryPerformanceTracker(
        std::shared_ptr<ExplorationSampler> sampler = std::make_shared<SeededExplorationSampler>(),
        std::shared_ptr<Clock> clock = system_clock());

    /**
     * @brief Record a closed trade; pnl > 0 counts as a win
     */
    void record_trade(const std::string& agent_id, const std::string& symbol, double pnl);

    double get_symbol_win_rate(const std::string& agent_id,
                               const std::string& symbol) const override;

    std::optional<SymbolStats> get_symbol_stats(const std::string& agent_id,
                                                const std::string& symbol) const override;

    /**
     * @brief Preferred symbols best first, then some untested ones
     *
     * Symbols with at least min_trades trades and a win rate of at least
     * min_win_rate are sorted by win rate then total pnl. Untested symbols
     * (fewer than min_trades) are appended, max(4, untested / 5) of them,
     * chosen by the sampler.
     */
    std::vector<std::string> get_preferred_symbols(const std::string& agent_id,
                                                   const std::vector<std::string>& all_symbols,
                                                   int min_trades = 5,
                                                   double min_win_rate = 0.6) const;

    nlohmann::json get_agent_summary(const std::string& agent_id) const;

private:
    std::optional<SymbolStats> stats_locked(const std::string& agent_id,
                                            const std::string& symbol) const;

    std::shared_ptr<ExplorationSampler> sampler_;
    std::shared_ptr<Clock> clock_;
    std::unordered_map<std::string, std::unordered_map<std::string, SymbolStats>> data_;
    mutable std::mutex mutex_;
};

}  // namespace trade_guard
