// include/trade_guard/portfolio/portfolio_state_store.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include "trade_guard/core/clock.hpp"
#include "trade_guard/core/config_base.hpp"
#include "trade_guard/core/error.hpp"
#include "trade_guard/gateway/exchange_gateway.hpp"
#include "trade_guard/portfolio/portfolio_snapshot.hpp"

namespace trade_guard {

class CircuitBreaker;

struct PortfolioStoreConfig : public ConfigBase {
    int refresh_interval_seconds{180};
    int cache_ttl_seconds{60};
    int max_backoff_seconds{900};  // ceiling for the rate-limit backoff

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
    std::vector<std::string> validate() const override;
};

/**
 * @brief Owner of the latest portfolio snapshot
 *
 * Snapshots are immutable once published; readers get a copy of the
 * current one. A failed refresh never clears the cache.
 */
class PortfolioStateStore {
public:
    using SnapshotListener = std::function<void(const PortfolioSnapshot&)>;

    PortfolioStateStore(PortfolioStoreConfig config, std::shared_ptr<ExchangeGateway> gateway,
                        std::shared_ptr<Clock> clock = system_clock());
    ~PortfolioStateStore();

    PortfolioStateStore(const PortfolioStateStore&) = delete;
    PortfolioStateStore& operator=(const PortfolioStateStore&) = delete;

    /**
     * @brief Pull balances and positions and publish a new snapshot
     * @return The published snapshot, or the gateway error
     */
    Result<PortfolioSnapshot> refresh();

    /**
     * @brief Latest snapshot, NOT_READY if none was ever published
     */
    Result<PortfolioSnapshot> get() const;

    /**
     * @brief Cached snapshot if younger than max_age, else a refresh
     *
     * Falls back to the stale snapshot when the refresh fails.
     */
    Result<PortfolioSnapshot> get_fresh(std::chrono::seconds max_age);
    Result<PortfolioSnapshot> get_fresh();

    /**
     * @brief Called after every publish, outside the store lock
     */
    void on_snapshot(SnapshotListener listener);

    /**
     * @brief Breaker the ticker consults and feeds; not owned
     */
    void attach_breaker(CircuitBreaker* breaker);

    Result<void> start();
    void stop();

    bool is_running() const {
        return running_.load();
    }

    std::chrono::seconds current_interval() const;

private:
    void run_ticker();
    void tick();

    PortfolioStoreConfig config_;
    std::shared_ptr<ExchangeGateway> gateway_;
    std::shared_ptr<Clock> clock_;
    CircuitBreaker* breaker_{nullptr};

    std::shared_ptr<const PortfolioSnapshot> current_;
    std::vector<SnapshotListener> listeners_;
    mutable std::mutex mutex_;

    // Serializes refreshes so peak tracking sees snapshots in order
    std::mutex refresh_mutex_;

    std::thread ticker_;
    std::atomic<bool> running_{false};
    std::condition_variable stop_cv_;
    std::mutex stop_mutex_;
    bool stop_requested_{false};
    std::chrono::seconds interval_;
};

}  // namespace trade_guard
