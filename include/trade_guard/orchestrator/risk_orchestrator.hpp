// include/trade_guard/orchestrator/risk_orchestrator.hpp
#pragma once

#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "trade_guard/core/clock.hpp"
#include "trade_guard/core/config_base.hpp"
#include "trade_guard/core/error.hpp"
#include "trade_guard/core/order_intent.hpp"
#include "trade_guard/gateway/exchange_gateway.hpp"
#include "trade_guard/messaging/message_bus.hpp"
#include "trade_guard/performance/performance_tracker.hpp"
#include "trade_guard/portfolio/portfolio_state_store.hpp"
#include "trade_guard/risk/adaptive_tpsl.hpp"
#include "trade_guard/risk/guardrails.hpp"
#include "trade_guard/risk/risk_engine.hpp"
#include "trade_guard/risk/risk_guard.hpp"
#include "trade_guard/safeguards/safeguard_manager.hpp"
#include "trade_guard/storage/idempotency_store.hpp"
#include "trade_guard/telemetry/event_sink.hpp"

namespace trade_guard {

struct OrchestratorConfig : public ConfigBase {
    std::vector<std::string> symbols{"BTCUSDT", "ETHUSDT"};
    int idempotency_ttl_seconds{120};
    bool adaptive_exits{false};
    // Empty disables query/consensus/execution broadcasts
    std::string coordination_session;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
    std::vector<std::string> validate() const override;
};

enum class SubmitStatus { SUBMITTED, DUPLICATE, REJECTED };

std::string submit_status_to_string(SubmitStatus status);

/**
 * @brief Business outcome of submit_order()
 * code is empty unless status is REJECTED
 */
struct SubmitResponse {
    SubmitStatus status{SubmitStatus::REJECTED};
    std::string order_id;
    std::string code;
    std::string reason;
    double notional{0.0};
    std::optional<AdaptiveTPSL> exits;

    nlohmann::json to_json() const;
};

/**
 * @brief Everything the orchestrator talks to
 * bus, tpsl and performance are optional; the rest are required.
 */
struct OrchestratorServices {
    std::shared_ptr<SafeguardManager> safeguards;
    std::shared_ptr<PortfolioStateStore> store;
    std::shared_ptr<IdempotencyStore> idempotency;
    std::shared_ptr<ExchangeGateway> gateway;
    std::shared_ptr<EventSink> events;
    std::shared_ptr<RiskGuard> risk_guard;
    std::shared_ptr<MessageBus> bus;
    std::shared_ptr<AdaptiveTPSLCalculator> tpsl;
    std::shared_ptr<InMemoryPerformanceTracker> performance;
    std::shared_ptr<Clock> clock = system_clock();
};

/**
 * @brief Single gate between trading agents and the exchange
 *
 * submit_order() runs the safeguard gate, fetches a portfolio snapshot,
 * deduplicates by bot and symbol, runs the risk engine, the guardrail chain
 * and position sizing, decorates the payload and forwards it to the gateway.
 * Only an approved evaluation reaches place_order().
 */
class RiskOrchestrator {
public:
    RiskOrchestrator(OrchestratorConfig config, RiskEngine engine, GuardrailChain guardrails,
                     OrchestratorServices services);

    RiskOrchestrator(const RiskOrchestrator&) = delete;
    RiskOrchestrator& operator=(const RiskOrchestrator&) = delete;

    /**
     * @brief Evaluate and forward one order intent
     * @return NOT_READY without a snapshot, SERVICE_DEGRADED when the orders
     *         breaker is open, INVALID_ORDER when no price is known, or the
     *         gateway error when placement fails
     */
    Result<SubmitResponse> submit_order(const std::string& bot_id, const OrderIntent& intent);

    /**
     * @brief Halt trading and cancel open orders on every tracked symbol
     * @return {status: "halted", cancelled, failed}
     */
    nlohmann::json emergency_stop(const std::string& reason = "Emergency stop requested");

    void resume_trading();

    /**
     * @brief Forward an agent inference record to the event sink
     * @return INVALID_ARGUMENT when bot_id or decision is missing
     */
    Result<void> register_decision(const nlohmann::json& payload);

    /**
     * @brief Feed a closed trade into the daily loss halt and the agent's history
     * @return INVALID_ARGUMENT for an empty bot or symbol, or a non-finite pnl
     */
    Result<void> record_trade_result(const std::string& bot_id, const std::string& symbol,
                                     double pnl);

    /**
     * @brief Start a new trading day for both daily-loss limits
     */
    void reset_daily();

    /**
     * @brief Agent summary and preferred symbols among the tracked ones
     * @return NOT_INITIALIZED without a performance tracker
     */
    Result<nlohmann::json> performance_summary(const std::string& bot_id) const;

    /**
     * @brief Snapshot hook: heat metrics, position event, observation broadcast
     */
    void handle_snapshot(const PortfolioSnapshot& snapshot);

    Result<PortfolioSnapshot> portfolio();

    nlohmann::json status_json() const;

    bool is_halted() const;

    const OrchestratorConfig& config() const {
        return config_;
    }

    static std::string idempotency_key(const std::string& bot_id, const std::string& symbol);

private:
    struct Evaluation {
        bool approved{false};
        std::string code;
        std::string reason;
        double requested_notional{0.0};  // before RiskGuard resizing
        double notional{0.0};
        std::optional<double> leverage;
    };

    /**
     * @brief Price used to size the order
     * intent.entry_price(), else the snapshot's last price for the symbol
     */
    static std::optional<Price> reference_price(const PortfolioSnapshot& snapshot,
                                                const OrderIntent& intent);

    std::optional<AdaptiveTPSL> adaptive_exits(const OrderIntent& intent,
                                               std::optional<Price> entry,
                                               const std::string& bot_id) const;

    Evaluation evaluate(const PortfolioSnapshot& snapshot, const OrderIntent& intent,
                        std::optional<Price> entry, const std::optional<AdaptiveTPSL>& exits,
                        const std::string& bot_id, const std::string& order_id) const;

    Result<nlohmann::json> decorate(const OrderIntent& intent, const Evaluation& evaluation,
                                    std::optional<Price> entry,
                                    const std::optional<AdaptiveTPSL>& exits,
                                    const std::string& order_id) const;

    std::vector<std::string> tracked_symbols() const;

    std::optional<std::string> lookup_pending(const std::string& key);

    std::string broadcast_query(const OrderIntent& intent, const std::string& bot_id,
                                const std::string& order_id);
    void broadcast_consensus(const std::string& reference, bool approved,
                             const std::vector<std::string>& participants,
                             const std::string& notes);
    void broadcast_execution(const std::string& order_id, const std::string& status,
                             const std::string& error = "");
    void broadcast(McpMessageType type, const nlohmann::json& payload);

    bool coordination_enabled() const {
        return services_.bus && !config_.coordination_session.empty();
    }

    OrchestratorConfig config_;
    RiskEngine engine_;
    GuardrailChain guardrails_;
    OrchestratorServices services_;
};

}  // namespace trade_guard
