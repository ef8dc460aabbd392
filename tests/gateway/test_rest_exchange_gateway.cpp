#include <gtest/gtest.h>
#include "core/test_base.hpp"
#include "trade_guard/gateway/rest_exchange_gateway.hpp"

using namespace trade_guard;
using namespace trade_guard::testing;

class RestExchangeGatewayTest : public TestBase {};

TEST_F(RestExchangeGatewayTest, ParsesStringEncodedBalances) {
    auto body = nlohmann::json::parse(R"([
        {"asset": "USDT", "balance": "1250.50", "availableBalance": "900.25"},
        {"asset": "BNB", "balance": 0.5, "availableBalance": 0.5}
    ])");
    auto balances = RestExchangeGateway::parse_balances(body);
    ASSERT_TRUE(balances.is_ok());
    ASSERT_EQ(balances.value().size(), 2u);
    EXPECT_EQ(balances.value()[0].asset, "USDT");
    EXPECT_DOUBLE_EQ(balances.value()[0].balance, 1250.50);
    EXPECT_DOUBLE_EQ(balances.value()[0].available_balance, 900.25);
    EXPECT_DOUBLE_EQ(balances.value()[1].balance, 0.5);
}

TEST_F(RestExchangeGatewayTest, ParsesPositionReport) {
    auto body = nlohmann::json::parse(R"([
        {"symbol": "BTCUSDT", "positionAmt": "-0.010", "entryPrice": "61000.0",
         "markPrice": "60500.0", "unRealizedProfit": "5.0", "leverage": "10"},
        {"symbol": "ETHUSDT", "positionAmt": "0", "entryPrice": "0", "markPrice": "3000.0",
         "unRealizedProfit": "0"}
    ])");
    auto positions = RestExchangeGateway::parse_positions(body);
    ASSERT_TRUE(positions.is_ok());
    ASSERT_EQ(positions.value().size(), 2u);

    const auto& btc = positions.value()[0];
    EXPECT_EQ(btc.symbol, "BTCUSDT");
    EXPECT_DOUBLE_EQ(btc.position_amt, -0.01);
    EXPECT_DOUBLE_EQ(btc.mark_price, 60500.0);
    EXPECT_DOUBLE_EQ(btc.unrealized_profit, 5.0);
    EXPECT_DOUBLE_EQ(btc.leverage, 10.0);
    EXPECT_DOUBLE_EQ(positions.value()[1].leverage, 1.0);
}

TEST_F(RestExchangeGatewayTest, RejectsMalformedReports) {
    auto not_array = RestExchangeGateway::parse_balances(nlohmann::json{{"asset", "USDT"}});
    ASSERT_TRUE(not_array.is_error());
    EXPECT_EQ(not_array.error()->code(), ErrorCode::INVALID_DATA);

    auto bad_number = RestExchangeGateway::parse_positions(
        nlohmann::json::parse(R"([{"symbol": "BTCUSDT", "positionAmt": "abc"}])"));
    ASSERT_TRUE(bad_number.is_error());
    EXPECT_EQ(bad_number.error()->code(), ErrorCode::INVALID_DATA);

    auto wrong_type = RestExchangeGateway::parse_positions(
        nlohmann::json::parse(R"([{"symbol": "BTCUSDT", "positionAmt": [1]}])"));
    ASSERT_TRUE(wrong_type.is_error());
}

TEST_F(RestExchangeGatewayTest, ConfigNeverSerializesApiKey) {
    RestGatewayConfig config;
    config.from_json({{"base_url", "https://gateway.internal"}, {"api_key", "secret"}});
    EXPECT_EQ(config.api_key, "secret");

    auto j = config.to_json();
    EXPECT_FALSE(j.contains("api_key"));
    EXPECT_EQ(j["base_url"], "https://gateway.internal");
    EXPECT_TRUE(config.validate().empty());
}

TEST_F(RestExchangeGatewayTest, ConfigValidation) {
    RestGatewayConfig config;
    config.base_url = "gateway:8080";
    config.request_timeout_ms = 0;
    EXPECT_EQ(config.validate().size(), 2u);
}

TEST_F(RestExchangeGatewayTest, UnreachableGatewayIsConnectionError) {
    RestGatewayConfig config;
    config.base_url = "http://127.0.0.1:1";
    config.connect_timeout_ms = 500;
    config.request_timeout_ms = 1000;
    RestExchangeGateway gateway(config);

    auto balances = gateway.account_balance();
    ASSERT_TRUE(balances.is_error());
    EXPECT_TRUE(balances.error()->code() == ErrorCode::CONNECTION_ERROR ||
                balances.error()->code() == ErrorCode::TIMEOUT_ERROR);

    auto cancelled = gateway.cancel_all_orders("BTCUSDT");
    EXPECT_TRUE(cancelled.is_error());
}
