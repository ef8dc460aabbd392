#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include "core/test_base.hpp"
#include "core/test_utils.hpp"
#include "trade_guard/orchestrator/risk_orchestrator.hpp"

using namespace trade_guard;
using namespace trade_guard::testing;

class RiskOrchestratorTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        clock = std::make_shared<ManualClock>();
        gateway = std::make_shared<FakeExchangeGateway>();
        events = std::make_shared<RecordingEventSink>();
        memory = std::make_shared<InMemoryIdempotencyStore>(clock);
        bus = std::make_shared<MessageBus>(MessageBusConfig(), clock);
        performance = std::make_shared<InMemoryPerformanceTracker>(
            std::make_shared<SeededExplorationSampler>(7), clock);
    }

    std::shared_ptr<RiskOrchestrator> make_orchestrator() {
        safeguards = std::make_shared<SafeguardManager>(safeguard_config, clock);
        store = std::make_shared<PortfolioStateStore>(PortfolioStoreConfig(), gateway, clock);
        risk_guard = std::make_shared<RiskGuard>(risk_guard_config);

        OrchestratorServices services;
        services.safeguards = safeguards;
        services.store = store;
        services.idempotency = memory;
        services.gateway = gateway;
        services.events = events;
        services.risk_guard = risk_guard;
        services.bus = bus;
        services.tpsl = std::make_shared<AdaptiveTPSLCalculator>(AdaptiveTPSLConfig(),
                                                                  performance, nullptr, clock);
        services.performance = performance;
        services.clock = clock;
        return std::make_shared<RiskOrchestrator>(config, RiskEngine(engine_config),
                                                  GuardrailChain::standard(guardrail_config),
                                                  services);
    }

    OrderIntent intent(double notional, const std::string& symbol = "BTCUSDT") {
        OrderIntent i;
        i.symbol = symbol;
        i.side = Side::BUY;
        i.notional = notional;
        i.price = 50000.0;
        return i;
    }

    SubmitResponse submit(RiskOrchestrator& orchestrator, const std::string& bot_id,
                          const OrderIntent& i) {
        auto result = orchestrator.submit_order(bot_id, i);
        EXPECT_TRUE(result.is_ok()) << (result.is_error() ? result.error()->to_string() : "");
        return result.is_ok() ? result.value() : SubmitResponse{};
    }

    OrchestratorConfig config;
    RiskEngineConfig engine_config;
    GuardrailConfig guardrail_config;
    RiskGuardConfig risk_guard_config;
    SafeguardConfig safeguard_config;

    std::shared_ptr<ManualClock> clock;
    std::shared_ptr<FakeExchangeGateway> gateway;
    std::shared_ptr<RecordingEventSink> events;
    std::shared_ptr<InMemoryIdempotencyStore> memory;
    std::shared_ptr<MessageBus> bus;
    std::shared_ptr<InMemoryPerformanceTracker> performance;
    std::shared_ptr<SafeguardManager> safeguards;
    std::shared_ptr<PortfolioStateStore> store;
    std::shared_ptr<RiskGuard> risk_guard;
};

TEST_F(RiskOrchestratorTest, RequiresCoreServices) {
    OrchestratorServices services;
    EXPECT_THROW(RiskOrchestrator(config, RiskEngine(engine_config),
                                  GuardrailChain::standard(guardrail_config), services),
                 std::invalid_argument);
}

TEST_F(RiskOrchestratorTest, SubmitsApprovedOrder) {
    auto orchestrator = make_orchestrator();
    auto response = submit(*orchestrator, "bot-1", intent(10.0));

    EXPECT_EQ(response.status, SubmitStatus::SUBMITTED);
    EXPECT_EQ(response.order_id.rfind("bot-1:BTCUSDT:", 0), 0u);
    EXPECT_DOUBLE_EQ(response.notional, 10.0);

    ASSERT_EQ(gateway->placed.size(), 1u);
    const auto& payload = gateway->placed[0];
    EXPECT_EQ(payload["symbol"], "BTCUSDT");
    EXPECT_EQ(payload["side"], "BUY");
    EXPECT_EQ(payload["clientOrderId"], response.order_id);
    EXPECT_DOUBLE_EQ(payload["quantity"].get<double>(), 0.0002);

    ASSERT_EQ(events->decisions.size(), 1u);
    EXPECT_EQ(events->decisions[0]["event"], "order_placed");
    EXPECT_EQ(safeguards->status_json()["limits"]["current_order_rate"], 1);
}

TEST_F(RiskOrchestratorTest, SecondSubmitIsDuplicate) {
    auto orchestrator = make_orchestrator();
    auto first = submit(*orchestrator, "bot-1", intent(10.0));
    clock->advance(std::chrono::seconds(5));
    auto second = submit(*orchestrator, "bot-1", intent(11.0));

    EXPECT_EQ(second.status, SubmitStatus::DUPLICATE);
    EXPECT_EQ(second.order_id, first.order_id);
    EXPECT_EQ(gateway->placed.size(), 1u);

    // another bot on the same symbol is independent
    auto other = submit(*orchestrator, "bot-2", intent(10.0));
    EXPECT_EQ(other.status, SubmitStatus::SUBMITTED);

    // the key expires after the ttl
    clock->advance(std::chrono::seconds(config.idempotency_ttl_seconds));
    auto later = submit(*orchestrator, "bot-1", intent(10.0));
    EXPECT_EQ(later.status, SubmitStatus::SUBMITTED);
    EXPECT_NE(later.order_id, first.order_id);
}

TEST_F(RiskOrchestratorTest, NotReadyWithoutSnapshot) {
    gateway->balance_error = ErrorCode::CONNECTION_ERROR;
    auto orchestrator = make_orchestrator();
    auto result = orchestrator->submit_order("bot-1", intent(10.0));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::NOT_READY);
    EXPECT_TRUE(gateway->placed.empty());
}

TEST_F(RiskOrchestratorTest, RejectsMissingBotId) {
    auto orchestrator = make_orchestrator();
    auto result = orchestrator->submit_order("", intent(10.0));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(RiskOrchestratorTest, RiskEngineRejection) {
    auto orchestrator = make_orchestrator();
    auto response = submit(*orchestrator, "bot-1", intent(13.0));

    EXPECT_EQ(response.status, SubmitStatus::REJECTED);
    EXPECT_EQ(response.code, "risk_check_failed");
    EXPECT_EQ(response.reason.rfind("Trade size 13.00 > limit 12.50", 0), 0u);
    EXPECT_TRUE(gateway->placed.empty());

    // a rejection leaves the key free
    EXPECT_EQ(submit(*orchestrator, "bot-1", intent(10.0)).status, SubmitStatus::SUBMITTED);
}

TEST_F(RiskOrchestratorTest, GuardrailRejectionCarriesCode) {
    engine_config.allocation.default_allocation_usd = 1000.0;
    engine_config.max_per_trade_pct = 100.0;
    auto orchestrator = make_orchestrator();

    auto response = submit(*orchestrator, "bot-1", intent(150.0));
    EXPECT_EQ(response.status, SubmitStatus::REJECTED);
    EXPECT_EQ(response.code, "position_risk_limit");

    auto j = response.to_json();
    EXPECT_EQ(j["status"], "rejected");
    EXPECT_EQ(j["detail"], "position_risk_limit");
}

TEST_F(RiskOrchestratorTest, KillSwitchRejectsBeforeAnythingElse) {
    auto orchestrator = make_orchestrator();
    safeguards->activate_kill_switch("manual");

    auto response = submit(*orchestrator, "bot-1", intent(10.0));
    EXPECT_EQ(response.status, SubmitStatus::REJECTED);
    EXPECT_EQ(response.code, "kill_switch_active");
    EXPECT_EQ(gateway->balance_call_count(), 0u);
}

TEST_F(RiskOrchestratorTest, RateLimitIsSafeguardBlock) {
    safeguard_config.max_orders_per_minute = 1;
    auto orchestrator = make_orchestrator();
    ASSERT_EQ(submit(*orchestrator, "bot-1", intent(10.0)).status, SubmitStatus::SUBMITTED);

    auto response = submit(*orchestrator, "bot-2", intent(10.0));
    EXPECT_EQ(response.status, SubmitStatus::REJECTED);
    EXPECT_EQ(response.code, "safeguard_blocked");
    EXPECT_EQ(response.reason, "Order rate limit exceeded");
}

TEST_F(RiskOrchestratorTest, GatewayFailureKeepsKeyAndFeedsBreaker) {
    gateway->place_error = ErrorCode::API_ERROR;
    auto orchestrator = make_orchestrator();

    auto result = orchestrator->submit_order("bot-1", intent(10.0));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::API_ERROR);
    EXPECT_EQ(safeguards->breaker("orders")->snapshot().failure_count, 1);
    ASSERT_EQ(events->decisions.size(), 1u);
    EXPECT_EQ(events->decisions[0]["event"], "order_failed");

    gateway->place_error = ErrorCode::NONE;
    auto retry = submit(*orchestrator, "bot-1", intent(10.0));
    EXPECT_EQ(retry.status, SubmitStatus::DUPLICATE);
}

TEST_F(RiskOrchestratorTest, OpenOrdersBreakerIsServiceDegraded) {
    auto orchestrator = make_orchestrator();
    for (int i = 0; i < 5; ++i)
        safeguards->record_failure("orders");

    auto result = orchestrator->submit_order("bot-1", intent(10.0));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::SERVICE_DEGRADED);
}

TEST_F(RiskOrchestratorTest, MissingPriceIsInvalidOrder) {
    auto orchestrator = make_orchestrator();
    OrderIntent i = intent(10.0);
    i.price.reset();

    auto result = orchestrator->submit_order("bot-1", i);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ORDER);
}

TEST_F(RiskOrchestratorTest, MissingPriceFallsBackToLastPrice) {
    gateway->set_mark("BTCUSDT", 40000.0);
    auto orchestrator = make_orchestrator();
    OrderIntent i = intent(10.0);
    i.price.reset();

    auto response = submit(*orchestrator, "bot-1", i);
    ASSERT_EQ(response.status, SubmitStatus::SUBMITTED);
    EXPECT_DOUBLE_EQ(gateway->placed[0]["quantity"].get<double>(), 0.00025);
    EXPECT_FALSE(gateway->placed[0].contains("price"));
}

TEST_F(RiskOrchestratorTest, LeverageIsCappedWithoutStopLoss) {
    auto orchestrator = make_orchestrator();
    OrderIntent i = intent(10.0);
    i.leverage = 50.0;

    auto response = submit(*orchestrator, "bot-1", i);
    ASSERT_EQ(response.status, SubmitStatus::SUBMITTED);
    ASSERT_EQ(gateway->placed.size(), 1u);
    EXPECT_DOUBLE_EQ(gateway->placed[0]["leverage"].get<double>(), 10.0);
}

TEST_F(RiskOrchestratorTest, AdaptiveStopSizesTheOrder) {
    config.adaptive_exits = true;
    engine_config.allocation.default_allocation_usd = 1000.0;
    engine_config.max_per_trade_pct = 100.0;
    risk_guard_config.max_loss_per_trade = 5.0;
    auto orchestrator = make_orchestrator();
    OrderIntent i = intent(90.0);
    i.leverage = 20.0;

    auto response = submit(*orchestrator, "bot-1", i);
    ASSERT_EQ(response.status, SubmitStatus::SUBMITTED);
    ASSERT_TRUE(response.exits.has_value());

    // the loss at the adaptive stop, at the capped leverage, stays within the cap
    double expected = 5.0 / (response.exits->sl_pct * 10.0);
    EXPECT_LT(response.notional, 90.0);
    EXPECT_NEAR(response.notional, expected, 1e-9);
    EXPECT_DOUBLE_EQ(gateway->placed[0]["leverage"].get<double>(), 10.0);
    EXPECT_NEAR(response.notional * response.exits->sl_pct * 10.0, 5.0, 1e-9);
}

TEST_F(RiskOrchestratorTest, ClientMetadataCannotOverrideOrderFields) {
    auto orchestrator = make_orchestrator();
    OrderIntent i = intent(10.0);
    i.client_metadata = {{"leverage", 100}, {"reduceOnly", true}, {"quantity", 5}, {"note", "x"}};

    auto response = submit(*orchestrator, "bot-1", i);
    ASSERT_EQ(response.status, SubmitStatus::SUBMITTED);
    const auto& payload = gateway->placed[0];
    EXPECT_FALSE(payload.contains("leverage"));
    EXPECT_FALSE(payload.contains("reduceOnly"));
    EXPECT_DOUBLE_EQ(payload["quantity"].get<double>(), 0.0002);
    EXPECT_EQ(payload["client_metadata"]["leverage"], 100);
    EXPECT_EQ(payload["client_metadata"]["note"], "x");
}

TEST_F(RiskOrchestratorTest, StopLossRunsThroughRiskGuard) {
    auto orchestrator = make_orchestrator();
    OrderIntent i = intent(12.0);
    i.price = 100.0;
    i.stop_loss = 98.0;
    auto approved = submit(*orchestrator, "bot-1", i);
    EXPECT_EQ(approved.status, SubmitStatus::SUBMITTED);
    EXPECT_DOUBLE_EQ(gateway->placed[0]["stopLossPrice"].get<double>(), 98.0);

    ASSERT_TRUE(orchestrator->record_trade_result("bot-1", "BTCUSDT", -300.0).is_ok());
    EXPECT_TRUE(risk_guard->is_trading_halted());

    auto halted = submit(*orchestrator, "bot-2", i);
    EXPECT_EQ(halted.status, SubmitStatus::REJECTED);
    EXPECT_EQ(halted.code, "risk_guard_rejected");
    EXPECT_EQ(halted.reason.rfind("Trading halted", 0), 0u);

    orchestrator->reset_daily();
    EXPECT_FALSE(risk_guard->is_trading_halted());
}

TEST_F(RiskOrchestratorTest, AdaptiveExitsDecoratePayload) {
    config.adaptive_exits = true;
    auto orchestrator = make_orchestrator();

    auto response = submit(*orchestrator, "bot-1", intent(10.0));
    ASSERT_EQ(response.status, SubmitStatus::SUBMITTED);
    ASSERT_TRUE(response.exits.has_value());
    EXPECT_GT(response.exits->tp_price, 50000.0);
    EXPECT_LT(response.exits->sl_price, 50000.0);

    const auto& payload = gateway->placed[0];
    EXPECT_TRUE(payload.contains("stopPrice"));
    EXPECT_TRUE(payload.contains("stopLossPrice"));
    EXPECT_TRUE(response.to_json().contains("adaptive_tpsl"));
}

TEST_F(RiskOrchestratorTest, EmergencyStopIsBestEffort) {
    gateway->failing_cancels = {"ETHUSDT"};
    auto orchestrator = make_orchestrator();

    auto result = orchestrator->emergency_stop("operator");
    EXPECT_EQ(result["status"], "halted");
    EXPECT_EQ(result["cancelled"], 1);
    EXPECT_EQ(result["failed"], 1);
    EXPECT_EQ(result["failed_symbols"][0], "ETHUSDT");
    EXPECT_TRUE(orchestrator->is_halted());

    ASSERT_EQ(events->reasoning.size(), 1u);
    EXPECT_EQ(events->reasoning[0]["event"], "kill_switch");

    orchestrator->resume_trading();
    EXPECT_FALSE(orchestrator->is_halted());
}

TEST_F(RiskOrchestratorTest, EmergencyStopCoversHeldSymbols) {
    gateway->set_position("SOLUSDT", 2.0, 150.0, 150.0);
    auto orchestrator = make_orchestrator();
    ASSERT_TRUE(store->refresh().is_ok());

    auto result = orchestrator->emergency_stop();
    EXPECT_EQ(result["cancelled"], 3);
    EXPECT_NE(std::find(gateway->cancelled.begin(), gateway->cancelled.end(), "SOLUSDT"),
              gateway->cancelled.end());
}

TEST_F(RiskOrchestratorTest, RegisterDecisionValidates) {
    auto orchestrator = make_orchestrator();

    EXPECT_TRUE(orchestrator->register_decision(nlohmann::json::array()).is_error());
    EXPECT_TRUE(orchestrator->register_decision({{"decision", {{"action", "buy"}}}}).is_error());
    EXPECT_TRUE(orchestrator->register_decision({{"bot_id", "bot-1"}}).is_error());
    EXPECT_TRUE(orchestrator
                    ->register_decision({{"bot_id", "bot-1"},
                                         {"decision", {{"action", "buy"}}},
                                         {"confidence", "high"}})
                    .is_error());

    auto ok = orchestrator->register_decision(
        {{"bot_id", "bot-1"}, {"decision", {{"action", "buy"}}}, {"confidence", 0.8}});
    ASSERT_TRUE(ok.is_ok());
    ASSERT_EQ(events->reasoning.size(), 1u);
    EXPECT_TRUE(events->reasoning[0]["context"].is_object());
    EXPECT_TRUE(events->reasoning[0]["reasoning"].is_array());
    EXPECT_TRUE(events->reasoning[0].contains("timestamp"));
}

TEST_F(RiskOrchestratorTest, SinkFailureDoesNotFailDecision) {
    events->fail = true;
    auto orchestrator = make_orchestrator();
    EXPECT_TRUE(
        orchestrator->register_decision({{"bot_id", "bot-1"}, {"decision", {{"a", 1}}}}).is_ok());
}

TEST_F(RiskOrchestratorTest, TradeResultsFeedPerformance) {
    auto orchestrator = make_orchestrator();
    EXPECT_TRUE(orchestrator->record_trade_result("", "BTCUSDT", 1.0).is_error());
    EXPECT_TRUE(orchestrator->record_trade_result("bot-1", "BTCUSDT", std::nan("")).is_error());

    ASSERT_TRUE(orchestrator->record_trade_result("bot-1", "BTCUSDT", 12.0).is_ok());
    ASSERT_TRUE(orchestrator->record_trade_result("bot-1", "BTCUSDT", -4.0).is_ok());
    EXPECT_DOUBLE_EQ(risk_guard->daily_pnl(), 8.0);

    auto summary = orchestrator->performance_summary("bot-1");
    ASSERT_TRUE(summary.is_ok());
    EXPECT_EQ(summary.value()["total_trades"], 2);
    EXPECT_EQ(summary.value()["agent_id"], "bot-1");
    EXPECT_TRUE(summary.value()["preferred_symbols"].is_array());
}

TEST_F(RiskOrchestratorTest, SnapshotUpdatesHeatAndPublishesPosition) {
    gateway->set_position("BTCUSDT", 0.01, 60000.0, 60000.0, 5.0);
    auto orchestrator = make_orchestrator();
    RiskOrchestrator* raw = orchestrator.get();
    store->on_snapshot([raw](const PortfolioSnapshot& s) { raw->handle_snapshot(s); });
    ASSERT_TRUE(store->refresh().is_ok());

    EXPECT_DOUBLE_EQ(safeguards->heat().total_exposure, 600.0);
    ASSERT_EQ(events->positions.size(), 1u);
    EXPECT_EQ(events->positions[0]["balance"], "1000.00");
    EXPECT_TRUE(events->positions[0]["positions"].is_string());
}

TEST_F(RiskOrchestratorTest, CoordinationBroadcasts) {
    config.coordination_session = "risk-room";
    auto orchestrator = make_orchestrator();
    auto peer = std::make_shared<RecordingConnection>("watcher");
    ASSERT_TRUE(bus->register_connection("risk-room", peer).is_ok());

    auto response = submit(*orchestrator, "bot-1", intent(10.0));
    ASSERT_EQ(response.status, SubmitStatus::SUBMITTED);

    auto queries = peer->messages_of_type("query");
    ASSERT_EQ(queries.size(), 1u);
    EXPECT_EQ(queries[0]["message"]["payload"]["reference_id"], response.order_id);

    auto consensus = peer->messages_of_type("consensus");
    ASSERT_EQ(consensus.size(), 1u);
    EXPECT_EQ(consensus[0]["message"]["payload"]["approved"], true);

    auto executions = peer->messages_of_type("execution");
    ASSERT_EQ(executions.size(), 1u);
    EXPECT_EQ(executions[0]["message"]["payload"]["status"], "submitted");

    ASSERT_TRUE(store->refresh().is_ok());
    orchestrator->handle_snapshot(store->get().value());
    EXPECT_EQ(peer->messages_of_type("observation").size(), 1u);
}

TEST_F(RiskOrchestratorTest, StatusReportsBothLayers) {
    auto orchestrator = make_orchestrator();
    auto status = orchestrator->status_json();
    EXPECT_EQ(status["idempotency_backend"], "memory");
    EXPECT_EQ(status["risk_guard"]["trading_halted"], false);
    EXPECT_EQ(status["tracked_symbols"].size(), 2u);
    EXPECT_TRUE(status.contains("kill_switch"));
}
