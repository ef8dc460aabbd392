// src/safeguards/safeguard_manager.cpp
#include "trade_guard/safeguards/safeguard_manager.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include "trade_guard/core/logger.hpp"
#include "trade_guard/core/time_utils.hpp"

namespace trade_guard {

namespace {

std::string format_pct(double fraction) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(2) << fraction * 100.0 << "%";
    return os.str();
}

}  // namespace

nlohmann::json SafeguardConfig::to_json() const {
    nlohmann::json j;
    j["max_drawdown_threshold"] = max_drawdown_threshold;
    j["max_daily_loss_pct"] = max_daily_loss_pct;
    j["max_orders_per_minute"] = max_orders_per_minute;
    j["rate_window_seconds"] = rate_window_seconds;
    j["max_concurrent_positions"] = max_concurrent_positions;
    j["max_portfolio_leverage"] = max_portfolio_leverage;
    j["warning_ratio"] = warning_ratio;
    j["breakers"] = nlohmann::json::array();
    for (const auto& b : breakers) {
        j["breakers"].push_back(b.to_json());
    }
    return j;
}

void SafeguardConfig::from_json(const nlohmann::json& j) {
    if (j.contains("max_drawdown_threshold"))
        max_drawdown_threshold = j.at("max_drawdown_threshold").get<double>();
    if (j.contains("max_daily_loss_pct"))
        max_daily_loss_pct = j.at("max_daily_loss_pct").get<double>();
    if (j.contains("max_orders_per_minute"))
        max_orders_per_minute = j.at("max_orders_per_minute").get<int>();
    if (j.contains("rate_window_seconds"))
        rate_window_seconds = j.at("rate_window_seconds").get<double>();
    if (j.contains("max_concurrent_positions"))
        max_concurrent_positions = j.at("max_concurrent_positions").get<int>();
    if (j.contains("max_portfolio_leverage"))
        max_portfolio_leverage = j.at("max_portfolio_leverage").get<double>();
    if (j.contains("warning_ratio"))
        warning_ratio = j.at("warning_ratio").get<double>();
    if (j.contains("breakers")) {
        // Entries override the defaults by name; unknown names add a breaker
        for (const auto& entry : j.at("breakers")) {
            CircuitBreakerConfig cfg;
            cfg.from_json(entry);
            auto it = std::find_if(breakers.begin(), breakers.end(),
                                   [&](const auto& b) { return b.name == cfg.name; });
            if (it != breakers.end()) {
                it->from_json(entry);
            } else {
                breakers.push_back(cfg);
            }
        }
    }
}

std::vector<std::string> SafeguardConfig::validate() const {
    std::vector<std::string> problems;
    if (max_drawdown_threshold <= 0.0 || max_drawdown_threshold >= 1.0)
        problems.push_back("max_drawdown_threshold must be in (0, 1)");
    if (max_daily_loss_pct <= 0.0 || max_daily_loss_pct >= 1.0)
        problems.push_back("max_daily_loss_pct must be in (0, 1)");
    if (max_orders_per_minute <= 0)
        problems.push_back("max_orders_per_minute must be positive");
    if (rate_window_seconds <= 0.0)
        problems.push_back("rate_window_seconds must be positive");
    if (max_concurrent_positions <= 0)
        problems.push_back("max_concurrent_positions must be positive");
    if (max_portfolio_leverage <= 0.0)
        problems.push_back("max_portfolio_leverage must be positive");
    for (const auto& b : breakers) {
        auto sub = b.validate();
        problems.insert(problems.end(), sub.begin(), sub.end());
    }
    return problems;
}

nlohmann::json HeatMetrics::to_json() const {
    nlohmann::json j;
    j["exposure"] = total_exposure;
    j["balance"] = balance;
    j["positions"] = position_count;
    j["daily_loss"] = format_pct(daily_loss);
    j["max_drawdown"] = format_pct(max_drawdown);
    j["current_drawdown"] = format_pct(current_drawdown);
    j["last_updated"] = core::to_iso8601(last_updated);
    return j;
}

SafeguardManager::SafeguardManager(SafeguardConfig config, std::shared_ptr<Clock> clock)
    : config_(std::move(config)), clock_(std::move(clock)) {
    for (const auto& b : config_.breakers) {
        breakers_[b.name] = std::make_unique<CircuitBreaker>(b, clock_);
    }
    Logger::register_component("SafeguardManager");
}

CircuitBreaker* SafeguardManager::breaker(const std::string& name) const {
    auto it = breakers_.find(name);
    return it == breakers_.end() ? nullptr : it->second.get();
}

bool SafeguardManager::check_circuit_breaker(const std::string& name) {
    auto* b = breaker(name);
    return b == nullptr || b->can_proceed();
}

void SafeguardManager::record_success(const std::string& name) {
    if (auto* b = breaker(name)) {
        b->record_success();
    }
}

void SafeguardManager::record_failure(const std::string& name) {
    if (auto* b = breaker(name)) {
        b->record_failure();
    }
}

void SafeguardManager::update_heat_metrics(const PortfolioSnapshot& snapshot) {
    double equity = snapshot.equity();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        heat_.total_exposure = snapshot.total_exposure;
        heat_.balance = snapshot.balance;
        heat_.position_count = snapshot.open_position_count();
        heat_.last_updated = clock_->now();

        peak_equity_ = std::max({peak_equity_, snapshot.peak_balance, equity});
        if (peak_equity_ > 0.0) {
            heat_.current_drawdown = std::max(0.0, (peak_equity_ - equity) / peak_equity_);
            heat_.max_drawdown = std::max(heat_.max_drawdown, heat_.current_drawdown);
        }
    }
    update_daily_pnl(equity);

    std::lock_guard<std::mutex> lock(mutex_);
    warn_if_approaching_locked();
}

void SafeguardManager::update_daily_pnl(double current_value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (daily_start_value_ == 0.0) {
        daily_start_value_ = current_value;
    }
    if (daily_start_value_ != 0.0) {
        heat_.daily_loss = (current_value - daily_start_value_) / std::abs(daily_start_value_);
    }
}

void SafeguardManager::reset_daily_metrics() {
    std::lock_guard<std::mutex> lock(mutex_);
    daily_start_value_ = 0.0;
    heat_.daily_loss = 0.0;
    INFO("Daily safeguard metrics reset");
}

bool SafeguardManager::check_portfolio_heat() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return check_portfolio_heat_locked();
}

bool SafeguardManager::check_portfolio_heat_locked() const {
    double max_exposure = std::max(heat_.balance, 0.0) * config_.max_portfolio_leverage;
    if (heat_.total_exposure > max_exposure) {
        ERROR("Portfolio heat too high: exposure " << heat_.total_exposure << " > "
                                                   << max_exposure);
        return false;
    }
    if (heat_.position_count > static_cast<size_t>(config_.max_concurrent_positions)) {
        WARN("Too many positions: " << heat_.position_count << " > "
                                    << config_.max_concurrent_positions);
        return false;
    }
    return true;
}

bool SafeguardManager::check_drawdown_limits() {
    std::lock_guard<std::mutex> lock(mutex_);
    return check_drawdown_limits_locked();
}

bool SafeguardManager::check_drawdown_limits_locked() {
    if (heat_.max_drawdown > config_.max_drawdown_threshold) {
        ERROR("Max drawdown exceeded: " << format_pct(heat_.max_drawdown) << " > "
                                        << format_pct(config_.max_drawdown_threshold));
        activate_kill_switch_locked("Drawdown limit exceeded: " + format_pct(heat_.max_drawdown));
        return false;
    }
    if (heat_.daily_loss < -config_.max_daily_loss_pct) {
        ERROR("Daily loss limit exceeded: " << format_pct(heat_.daily_loss));
        activate_kill_switch_locked("Daily loss limit exceeded: " + format_pct(heat_.daily_loss));
        return false;
    }
    return true;
}

void SafeguardManager::prune_order_window_locked(Timestamp now) {
    auto window = std::chrono::duration_cast<std::chrono::system_clock::duration>(
        std::chrono::duration<double>(config_.rate_window_seconds));
    auto cutoff = now - window;
    while (!order_timestamps_.empty() && order_timestamps_.front() < cutoff) {
        order_timestamps_.pop_front();
    }
}

bool SafeguardManager::check_rate_limits() {
    std::lock_guard<std::mutex> lock(mutex_);
    return check_rate_limits_locked();
}

bool SafeguardManager::check_rate_limits_locked() {
    prune_order_window_locked(clock_->now());
    if (order_timestamps_.size() >= static_cast<size_t>(config_.max_orders_per_minute)) {
        WARN("Order rate limit reached: " << order_timestamps_.size() << "/min");
        return false;
    }
    return true;
}

void SafeguardManager::record_order() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_->now();
    prune_order_window_locked(now);
    order_timestamps_.push_back(now);
}

TradeGate SafeguardManager::can_trade() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (kill_switch_active_) {
            return TradeGate{false, true, false, "Kill switch active: " + kill_switch_reason_};
        }
    }

    if (!check_circuit_breaker("orders")) {
        return TradeGate{false, false, true, "Orders circuit breaker is open"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!check_portfolio_heat_locked()) {
        return TradeGate{false, false, false, "Portfolio heat limits exceeded"};
    }
    if (!check_drawdown_limits_locked()) {
        return TradeGate{false, true, false, "Drawdown limits exceeded"};
    }
    if (!check_rate_limits_locked()) {
        return TradeGate{false, false, false, "Order rate limit exceeded"};
    }
    return TradeGate{};
}

void SafeguardManager::activate_kill_switch(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    activate_kill_switch_locked(reason);
}

void SafeguardManager::activate_kill_switch_locked(const std::string& reason) {
    if (kill_switch_active_ && kill_switch_reason_ == reason) {
        return;
    }
    kill_switch_active_ = true;
    kill_switch_reason_ = reason;
    FATAL("KILL SWITCH ACTIVATED: " << reason);
}

void SafeguardManager::deactivate_kill_switch() {
    std::lock_guard<std::mutex> lock(mutex_);
    kill_switch_active_ = false;
    kill_switch_reason_.clear();
    WARN("Kill switch deactivated");
}

bool SafeguardManager::is_kill_switch_active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return kill_switch_active_;
}

std::string SafeguardManager::kill_switch_reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return kill_switch_reason_;
}

HeatMetrics SafeguardManager::heat() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return heat_;
}

void SafeguardManager::warn_if_approaching_locked() const {
    if (heat_.max_drawdown > config_.max_drawdown_threshold * config_.warning_ratio &&
        heat_.max_drawdown <= config_.max_drawdown_threshold) {
        WARN("Approaching drawdown limit: " << format_pct(heat_.max_drawdown));
    }
    if (heat_.daily_loss < -config_.max_daily_loss_pct * config_.warning_ratio &&
        heat_.daily_loss >= -config_.max_daily_loss_pct) {
        WARN("Approaching daily loss limit: " << format_pct(heat_.daily_loss));
    }
}

nlohmann::json SafeguardManager::status_json() const {
    nlohmann::json j;
    nlohmann::json breakers = nlohmann::json::object();
    for (const auto& [name, b] : breakers_) {
        breakers[name] = b->snapshot().to_json();
    }
    j["circuit_breakers"] = breakers;

    std::lock_guard<std::mutex> lock(mutex_);
    j["kill_switch"] = {{"active", kill_switch_active_}, {"reason", kill_switch_reason_}};
    j["heat_metrics"] = heat_.to_json();
    j["limits"] = {{"max_exposure_leverage", config_.max_portfolio_leverage},
                   {"max_positions", config_.max_concurrent_positions},
                   {"max_drawdown", format_pct(config_.max_drawdown_threshold)},
                   {"daily_loss_limit", format_pct(config_.max_daily_loss_pct)},
                   {"orders_per_minute", config_.max_orders_per_minute},
                   {"current_order_rate", order_timestamps_.size()}};
    return j;
}

}  // namespace trade_guard
