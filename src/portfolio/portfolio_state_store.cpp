// src/portfolio/portfolio_state_store.cpp
#include "trade_guard/portfolio/portfolio_state_store.hpp"
#include <algorithm>
#include <stdexcept>
#include "trade_guard/core/logger.hpp"
#include "trade_guard/core/time_utils.hpp"
#include "trade_guard/safeguards/circuit_breaker.hpp"

namespace trade_guard {

nlohmann::json PortfolioStoreConfig::to_json() const {
    nlohmann::json j;
    j["refresh_interval_seconds"] = refresh_interval_seconds;
    j["cache_ttl_seconds"] = cache_ttl_seconds;
    j["max_backoff_seconds"] = max_backoff_seconds;
    return j;
}

void PortfolioStoreConfig::from_json(const nlohmann::json& j) {
    if (j.contains("refresh_interval_seconds"))
        refresh_interval_seconds = j.at("refresh_interval_seconds").get<int>();
    if (j.contains("cache_ttl_seconds"))
        cache_ttl_seconds = j.at("cache_ttl_seconds").get<int>();
    if (j.contains("max_backoff_seconds"))
        max_backoff_seconds = j.at("max_backoff_seconds").get<int>();
}

std::vector<std::string> PortfolioStoreConfig::validate() const {
    std::vector<std::string> problems;
    if (refresh_interval_seconds <= 0)
        problems.push_back("refresh_interval_seconds must be positive");
    if (cache_ttl_seconds < 0)
        problems.push_back("cache_ttl_seconds must not be negative");
    if (max_backoff_seconds < refresh_interval_seconds)
        problems.push_back("max_backoff_seconds must be at least refresh_interval_seconds");
    return problems;
}

PortfolioStateStore::PortfolioStateStore(PortfolioStoreConfig config,
                                         std::shared_ptr<ExchangeGateway> gateway,
                                         std::shared_ptr<Clock> clock)
    : config_(std::move(config)),
      gateway_(std::move(gateway)),
      clock_(std::move(clock)),
      interval_(config_.refresh_interval_seconds) {
    Logger::register_component("PortfolioStore");
    if (!gateway_) {
        throw std::invalid_argument("PortfolioStateStore requires an exchange gateway");
    }
}

PortfolioStateStore::~PortfolioStateStore() {
    stop();
}

Result<PortfolioSnapshot> PortfolioStateStore::refresh() {
    std::lock_guard<std::mutex> refresh_lock(refresh_mutex_);

    auto balances = gateway_->account_balance();
    if (balances.is_error()) {
        return forward_error<PortfolioSnapshot>(balances);
    }
    auto positions = gateway_->position_risk();
    if (positions.is_error()) {
        return forward_error<PortfolioSnapshot>(positions);
    }

    double previous_peak = 0.0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (current_) {
            previous_peak = current_->peak_balance;
        }
    }

    auto snapshot = std::make_shared<const PortfolioSnapshot>(
        build_snapshot(balances.value(), positions.value(), previous_peak, clock_->now()));

    std::vector<SnapshotListener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = snapshot;
        listeners = listeners_;
    }

    DEBUG("Published snapshot: balance " << snapshot->balance << ", exposure "
                                         << snapshot->total_exposure << ", positions "
                                         << snapshot->open_position_count());

    for (const auto& listener : listeners) {
        try {
            listener(*snapshot);
        } catch (const std::exception& e) {
            ERROR("Snapshot listener failed: " << e.what());
        }
    }
    return *snapshot;
}

Result<PortfolioSnapshot> PortfolioStateStore::get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!current_) {
        return make_error<PortfolioSnapshot>(ErrorCode::NOT_READY,
                                             "No portfolio snapshot published yet",
                                             "PortfolioStateStore");
    }
    return *current_;
}

Result<PortfolioSnapshot> PortfolioStateStore::get_fresh(std::chrono::seconds max_age) {
    std::shared_ptr<const PortfolioSnapshot> cached;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cached = current_;
    }
    if (cached && clock_->now() - cached->timestamp < max_age) {
        return *cached;
    }

    auto refreshed = refresh();
    if (refreshed.is_ok()) {
        return refreshed;
    }

    if (cached) {
        WARN("Refresh failed, serving snapshot from " << core::to_iso8601(cached->timestamp)
                                                      << ": " << refreshed.error()->what());
        return *cached;
    }
    return make_error<PortfolioSnapshot>(
        ErrorCode::NOT_READY,
        std::string("No portfolio snapshot available: ") + refreshed.error()->what(),
        "PortfolioStateStore");
}

Result<PortfolioSnapshot> PortfolioStateStore::get_fresh() {
    return get_fresh(std::chrono::seconds(config_.cache_ttl_seconds));
}

void PortfolioStateStore::on_snapshot(SnapshotListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}

void PortfolioStateStore::attach_breaker(CircuitBreaker* breaker) {
    std::lock_guard<std::mutex> lock(mutex_);
    breaker_ = breaker;
}

std::chrono::seconds PortfolioStateStore::current_interval() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return interval_;
}

Result<void> PortfolioStateStore::start() {
    if (running_.exchange(true)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Portfolio ticker already running",
                                "PortfolioStateStore");
    }
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_requested_ = false;
    }
    ticker_ = std::thread(&PortfolioStateStore::run_ticker, this);
    INFO("Portfolio ticker started, interval " << config_.refresh_interval_seconds << "s");
    return Result<void>();
}

void PortfolioStateStore::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_requested_ = true;
    }
    stop_cv_.notify_all();
    if (ticker_.joinable()) {
        ticker_.join();
    }
    INFO("Portfolio ticker stopped");
}

void PortfolioStateStore::run_ticker() {
    Logger::register_component("PortfolioStore");
    while (true) {
        tick();

        std::unique_lock<std::mutex> lock(stop_mutex_);
        if (stop_cv_.wait_for(lock, current_interval(), [this] { return stop_requested_; })) {
            return;
        }
    }
}

void PortfolioStateStore::tick() {
    CircuitBreaker* breaker = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        breaker = breaker_;
    }

    if (breaker && !breaker->can_proceed()) {
        WARN("Skipping portfolio refresh: " << breaker->name() << " breaker is open");
        return;
    }

    auto result = refresh();
    if (result.is_ok()) {
        if (breaker)
            breaker->record_success();
        std::lock_guard<std::mutex> lock(mutex_);
        interval_ = std::chrono::seconds(config_.refresh_interval_seconds);
        return;
    }

    if (breaker)
        breaker->record_failure();

    if (result.error()->code() == ErrorCode::RATE_LIMITED) {
        std::lock_guard<std::mutex> lock(mutex_);
        interval_ = std::min(interval_ * 2, std::chrono::seconds(config_.max_backoff_seconds));
        WARN("Rate limited by venue, next portfolio refresh in " << interval_.count() << "s");
        return;
    }
    ERROR("Portfolio refresh failed: " << result.error()->to_string());
}

}  // namespace trade_guard
