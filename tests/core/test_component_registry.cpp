#include <gtest/gtest.h>
#include "core/test_base.hpp"
#include "trade_guard/core/component_registry.hpp"

using namespace trade_guard;
using namespace trade_guard::testing;

class ComponentRegistryTest : public TestBase {
protected:
    ComponentInfo make_info(const std::string& id, ComponentType type) {
        return ComponentInfo{type, ComponentState::INITIALIZED, id, "",
                             std::chrono::system_clock::now(), {}};
    }

    ComponentRegistry registry;
};

TEST_F(ComponentRegistryTest, RegisterAndLookup) {
    ASSERT_TRUE(registry.register_component(make_info("bus", ComponentType::MESSAGE_BUS)).is_ok());

    auto state = registry.get_state("bus");
    ASSERT_TRUE(state.is_ok());
    EXPECT_EQ(state.value().type, ComponentType::MESSAGE_BUS);
    EXPECT_EQ(state.value().state, ComponentState::INITIALIZED);
}

TEST_F(ComponentRegistryTest, RejectsEmptyAndDuplicateIds) {
    EXPECT_TRUE(registry.register_component(make_info("", ComponentType::HTTP_SERVER)).is_error());
    ASSERT_TRUE(registry.register_component(make_info("http", ComponentType::HTTP_SERVER)).is_ok());
    auto duplicate = registry.register_component(make_info("http", ComponentType::HTTP_SERVER));
    ASSERT_TRUE(duplicate.is_error());
    EXPECT_EQ(duplicate.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(ComponentRegistryTest, UnknownComponent) {
    auto result = registry.update_state("missing", ComponentState::RUNNING);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::DATA_NOT_FOUND);
    EXPECT_TRUE(registry.get_state("missing").is_error());
    EXPECT_TRUE(registry.unregister_component("missing").is_error());
}

TEST_F(ComponentRegistryTest, LifecycleTransitions) {
    ASSERT_TRUE(
        registry.register_component(make_info("idempotency", ComponentType::IDEMPOTENCY_STORE))
            .is_ok());

    EXPECT_TRUE(registry.update_state("idempotency", ComponentState::RUNNING).is_ok());
    EXPECT_TRUE(registry
                    .update_state("idempotency", ComponentState::DEGRADED,
                                  "shared store unreachable")
                    .is_ok());
    EXPECT_EQ(registry.get_state("idempotency").value().error_message, "shared store unreachable");

    EXPECT_TRUE(registry.update_state("idempotency", ComponentState::RUNNING).is_ok());
    EXPECT_TRUE(registry.get_state("idempotency").value().error_message.empty());

    EXPECT_TRUE(registry.update_state("idempotency", ComponentState::STOPPED).is_ok());
    auto invalid = registry.update_state("idempotency", ComponentState::RUNNING);
    ASSERT_TRUE(invalid.is_error());
    EXPECT_EQ(invalid.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(ComponentRegistryTest, HealthReflectsDegradedComponents) {
    EXPECT_FALSE(registry.is_healthy());

    registry.register_component(make_info("portfolio", ComponentType::PORTFOLIO_STORE));
    registry.register_component(make_info("gateway", ComponentType::EXCHANGE_GATEWAY));
    registry.update_state("portfolio", ComponentState::RUNNING);
    registry.update_state("gateway", ComponentState::RUNNING);
    EXPECT_TRUE(registry.is_healthy());

    registry.update_state("gateway", ComponentState::DEGRADED, "api breaker open");
    EXPECT_FALSE(registry.is_healthy());
}

TEST_F(ComponentRegistryTest, JsonListsComponents) {
    registry.register_component(make_info("safeguards", ComponentType::SAFEGUARDS));
    registry.register_component(make_info("consensus", ComponentType::CONSENSUS_ENGINE));
    registry.update_metrics("safeguards", {{"daily_pnl", -12.5}});

    auto ids = registry.get_all_components();
    ASSERT_EQ(ids.size(), 2u);
    EXPECT_EQ(ids[0], "consensus");

    auto j = registry.to_json();
    EXPECT_EQ(j["safeguards"]["type"], "safeguards");
    EXPECT_EQ(j["safeguards"]["state"], "initialized");
    EXPECT_DOUBLE_EQ(j["safeguards"]["metrics"]["daily_pnl"].get<double>(), -12.5);
    EXPECT_FALSE(j["consensus"].contains("metrics"));
}
