#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "core/test_base.hpp"
#include "core/test_utils.hpp"
#include "trade_guard/server/request_router.hpp"

using namespace trade_guard;
using namespace trade_guard::testing;

class RequestRouterTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        clock = std::make_shared<ManualClock>();
        gateway = std::make_shared<FakeExchangeGateway>();
        events = std::make_shared<RecordingEventSink>();
        bus = std::make_shared<MessageBus>(MessageBusConfig(), clock);
        registry = std::make_shared<ComponentRegistry>();
        auto performance = std::make_shared<InMemoryPerformanceTracker>(
            std::make_shared<SeededExplorationSampler>(3), clock);
        auto tpsl = std::make_shared<AdaptiveTPSLCalculator>(AdaptiveTPSLConfig(), performance,
                                                             nullptr, clock);

        OrchestratorServices services;
        services.safeguards = std::make_shared<SafeguardManager>(SafeguardConfig(), clock);
        services.store =
            std::make_shared<PortfolioStateStore>(PortfolioStoreConfig(), gateway, clock);
        services.idempotency = std::make_shared<InMemoryIdempotencyStore>(clock);
        services.gateway = gateway;
        services.events = events;
        services.risk_guard = std::make_shared<RiskGuard>(RiskGuardConfig());
        services.tpsl = tpsl;
        services.performance = performance;
        services.clock = clock;
        orchestrator = std::make_shared<RiskOrchestrator>(
            OrchestratorConfig(), RiskEngine(RiskEngineConfig()),
            GuardrailChain::standard(GuardrailConfig()), services);

        router = std::make_unique<RequestRouter>(orchestrator, bus, tpsl, registry);
    }

    HttpResponse request(const std::string& method, const std::string& target,
                         const nlohmann::json& body = nullptr) {
        return router->handle(HttpRequest{method, target, body.is_null() ? "" : body.dump()});
    }

    nlohmann::json order(double notional) {
        return {{"symbol", "BTCUSDT"}, {"side", "BUY"}, {"notional", notional}, {"price", 50000.0}};
    }

    std::shared_ptr<ManualClock> clock;
    std::shared_ptr<FakeExchangeGateway> gateway;
    std::shared_ptr<RecordingEventSink> events;
    std::shared_ptr<MessageBus> bus;
    std::shared_ptr<ComponentRegistry> registry;
    std::shared_ptr<RiskOrchestrator> orchestrator;
    std::unique_ptr<RequestRouter> router;
};

TEST_F(RequestRouterTest, SplitPathDropsPrefixAndQuery) {
    EXPECT_THAT(RequestRouter::split_path("/orchestrator/order/bot-1?x=1"),
                ::testing::ElementsAre("order", "bot-1"));
    EXPECT_THAT(RequestRouter::split_path("//healthz/"), ::testing::ElementsAre("healthz"));
    EXPECT_TRUE(RequestRouter::split_path("/").empty());
}

TEST_F(RequestRouterTest, WebsocketSessionTarget) {
    EXPECT_EQ(RequestRouter::websocket_session("/mcp/abc/ws"), std::optional<std::string>("abc"));
    EXPECT_EQ(RequestRouter::websocket_session("/orchestrator/mcp/abc/ws"),
              std::optional<std::string>("abc"));
    EXPECT_FALSE(RequestRouter::websocket_session("/mcp/abc/messages").has_value());
}

TEST_F(RequestRouterTest, SubmitThenDuplicate) {
    auto first = request("POST", "/order/bot-1", order(10.0));
    EXPECT_EQ(first.status, 200);
    EXPECT_EQ(first.body["status"], "submitted");

    auto second = request("POST", "/orchestrator/order/bot-1", order(10.0));
    EXPECT_EQ(second.status, 200);
    EXPECT_EQ(second.body["status"], "duplicate");
    EXPECT_EQ(second.body["order_id"], first.body["order_id"]);
}

TEST_F(RequestRouterTest, RejectionIs400WithDetail) {
    auto response = request("POST", "/order/bot-1", order(13.0));
    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(response.body["status"], "rejected");
    EXPECT_EQ(response.body["detail"], "risk_check_failed");
}

TEST_F(RequestRouterTest, InvalidBodiesAre422) {
    auto bad_json = router->handle(HttpRequest{"POST", "/order/bot-1", "{not json"});
    EXPECT_EQ(bad_json.status, 422);
    EXPECT_EQ(bad_json.body["detail"], "validation_error");

    auto missing_side = request("POST", "/order/bot-1", {{"symbol", "BTCUSDT"}, {"notional", 5.0}});
    EXPECT_EQ(missing_side.status, 422);
}

TEST_F(RequestRouterTest, NotReadyIs503) {
    gateway->balance_error = ErrorCode::CONNECTION_ERROR;
    auto response = request("POST", "/order/bot-1", order(10.0));
    EXPECT_EQ(response.status, 503);
    EXPECT_EQ(response.body["detail"], "portfolio_not_ready");

    auto portfolio = request("GET", "/portfolio");
    EXPECT_EQ(portfolio.status, 503);
}

TEST_F(RequestRouterTest, GatewayFailureIs502) {
    gateway->place_error = ErrorCode::API_ERROR;
    auto response = request("POST", "/order/bot-1", order(10.0));
    EXPECT_EQ(response.status, 502);
    EXPECT_EQ(response.body["detail"], "api_error");
}

TEST_F(RequestRouterTest, EmergencyStopAndResume) {
    auto stopped = request("POST", "/emergency_stop", {{"reason", "drill"}});
    EXPECT_EQ(stopped.status, 200);
    EXPECT_EQ(stopped.body["status"], "halted");
    EXPECT_EQ(stopped.body["cancelled"], 2);

    auto blocked = request("POST", "/order/bot-1", order(10.0));
    EXPECT_EQ(blocked.status, 400);
    EXPECT_EQ(blocked.body["detail"], "kill_switch_active");

    auto health = request("GET", "/healthz");
    EXPECT_EQ(health.body["kill_switch_active"], true);

    EXPECT_EQ(request("POST", "/resume").body["status"], "resumed");
    EXPECT_EQ(request("POST", "/order/bot-1", order(10.0)).status, 200);
}

TEST_F(RequestRouterTest, RegisterDecisionAndTradeResult) {
    auto decision = request("POST", "/register_decision",
                            {{"bot_id", "bot-1"}, {"decision", {{"action", "hold"}}}});
    EXPECT_EQ(decision.status, 200);
    EXPECT_EQ(events->reasoning.size(), 1u);
    EXPECT_EQ(request("POST", "/register_decision", {{"bot_id", "bot-1"}}).status, 422);

    auto result = request("POST", "/trade_result",
                          {{"bot_id", "bot-1"}, {"symbol", "BTCUSDT"}, {"pnl", 4.5}});
    EXPECT_EQ(result.status, 200);
    EXPECT_EQ(request("POST", "/trade_result", {{"bot_id", "bot-1"}}).status, 422);

    auto performance = request("GET", "/performance/bot-1");
    EXPECT_EQ(performance.status, 200);
    EXPECT_EQ(performance.body["total_trades"], 1);
}

TEST_F(RequestRouterTest, PortfolioAndSafeguards) {
    auto portfolio = request("GET", "/portfolio");
    EXPECT_EQ(portfolio.status, 200);
    EXPECT_DOUBLE_EQ(portfolio.body["balance"].get<double>(), 1000.0);

    auto status = request("GET", "/safeguards");
    EXPECT_EQ(status.status, 200);
    EXPECT_TRUE(status.body.contains("circuit_breakers"));
}

TEST_F(RequestRouterTest, HealthReflectsRegistry) {
    auto empty = request("GET", "/healthz");
    EXPECT_EQ(empty.body["status"], "degraded");

    ComponentInfo info{ComponentType::RISK_ORCHESTRATOR, ComponentState::INITIALIZED,
                       "orchestrator", "", std::chrono::system_clock::now(), {}};
    ASSERT_TRUE(registry->register_component(info).is_ok());
    ASSERT_TRUE(registry->update_state("orchestrator", ComponentState::RUNNING).is_ok());

    auto healthy = request("GET", "/healthz");
    EXPECT_EQ(healthy.body["status"], "ok");
    EXPECT_EQ(healthy.body["portfolio_ready"], true);
}

TEST_F(RequestRouterTest, TpslEndpoint) {
    auto plan = request("POST", "/tpsl",
                        {{"symbol", "ETHUSDT"}, {"side", "SELL"}, {"entry_price", 3000.0}});
    EXPECT_EQ(plan.status, 200);
    EXPECT_GT(plan.body["sl_price"].get<double>(), 3000.0);
    EXPECT_LT(plan.body["tp_price"].get<double>(), 3000.0);

    EXPECT_EQ(request("POST", "/tpsl", {{"symbol", "ETHUSDT"}, {"side", "SELL"}}).status, 422);
    EXPECT_EQ(request("POST", "/tpsl", {{"symbol", "ETHUSDT"}, {"entry_price", 1.0}}).status,
              422);
}

TEST_F(RequestRouterTest, McpSessionsAndMessages) {
    auto created = request("POST", "/mcp/sessions");
    ASSERT_EQ(created.status, 200);
    std::string session = created.body["session_id"];

    auto listed = request("GET", "/mcp/sessions");
    EXPECT_EQ(listed.body["sessions"].size(), 1u);

    auto peer = std::make_shared<RecordingConnection>("peer");
    ASSERT_TRUE(bus->register_connection(session, peer).is_ok());

    auto posted = request("POST", "/mcp/" + session + "/messages",
                          {{"sender_id", "agent-a"}, {"message_type", "observation"}});
    EXPECT_EQ(posted.status, 200);
    EXPECT_EQ(posted.body["recipients"], 1);
    EXPECT_EQ(peer->received.size(), 1u);

    auto history = request("GET", "/mcp/" + session + "/messages");
    EXPECT_EQ(history.body["messages"].size(), 1u);

    EXPECT_EQ(request("POST", "/mcp/missing/messages", {{"sender_id", "a"}}).status, 404);
    EXPECT_EQ(request("GET", "/mcp/missing/messages").body["detail"], "session_not_found");
    EXPECT_EQ(request("POST", "/mcp/" + session + "/messages", {{"sender_id", "a"}}).status,
              422);
}

TEST_F(RequestRouterTest, UnknownRoutesAndMethods) {
    EXPECT_EQ(request("GET", "/nothing").status, 404);
    EXPECT_EQ(request("GET", "/order/bot-1").status, 405);
    EXPECT_EQ(request("GET", "/").body["service"], "trade_guard");
}

TEST_F(RequestRouterTest, RequiresOrchestratorAndBus) {
    EXPECT_THROW(RequestRouter(nullptr, bus), std::invalid_argument);
}
