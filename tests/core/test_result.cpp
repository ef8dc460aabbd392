#include <gtest/gtest.h>
#include <memory>
#include <string>
#include "trade_guard/core/error.hpp"

using namespace trade_guard;

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, SuccessfulResults) {
    Result<int> int_result(42);
    EXPECT_TRUE(int_result.is_ok());
    EXPECT_FALSE(int_result.is_error());
    EXPECT_EQ(int_result.value(), 42);

    Result<std::string> string_result("success");
    EXPECT_TRUE(string_result.is_ok());
    EXPECT_EQ(string_result.value(), "success");

    Result<double> double_result(3.14);
    EXPECT_DOUBLE_EQ(double_result.value(), 3.14);
}

TEST_F(ResultTest, ErrorCase) {
    auto error_result =
        make_error<int>(ErrorCode::NOT_READY, "Portfolio snapshot unavailable", "PortfolioStore");

    EXPECT_TRUE(error_result.is_error());
    EXPECT_FALSE(error_result.is_ok());
    EXPECT_EQ(error_result.error()->code(), ErrorCode::NOT_READY);
    EXPECT_STREQ(error_result.error()->what(), "Portfolio snapshot unavailable");
    EXPECT_EQ(error_result.error()->component(), "PortfolioStore");
}

TEST_F(ResultTest, ValueOnErrorThrows) {
    auto error_result = make_error<int>(ErrorCode::API_ERROR, "venue down", "Gateway");
    EXPECT_THROW(error_result.value(), TradeError);
}

TEST_F(ResultTest, ToStringCarriesComponentAndCodeName) {
    TradeError error(ErrorCode::SERVICE_DEGRADED, "orders breaker open", "RiskOrchestrator");
    EXPECT_EQ(error.to_string(),
              "Error in RiskOrchestrator: orders breaker open (service_degraded)");
}

TEST_F(ResultTest, ErrorCodeNames) {
    EXPECT_STREQ(error_code_name(ErrorCode::NOT_READY), "portfolio_not_ready");
    EXPECT_STREQ(error_code_name(ErrorCode::RATE_LIMITED), "rate_limited");
    EXPECT_STREQ(error_code_name(ErrorCode::SESSION_NOT_FOUND), "session_not_found");
    EXPECT_STREQ(error_code_name(ErrorCode::CUSTOM_ERROR_START), "unknown_error");
}

TEST_F(ResultTest, ForwardErrorKeepsCodeMessageAndComponent) {
    auto failed = make_error<std::string>(ErrorCode::RATE_LIMITED, "429", "RestExchangeGateway");
    auto forwarded = forward_error<void>(failed);

    ASSERT_TRUE(forwarded.is_error());
    EXPECT_EQ(forwarded.error()->code(), ErrorCode::RATE_LIMITED);
    EXPECT_STREQ(forwarded.error()->what(), "429");
    EXPECT_EQ(forwarded.error()->component(), "RestExchangeGateway");
}

TEST_F(ResultTest, MoveOnlyType) {
    auto ptr = std::make_unique<int>(42);
    Result<std::unique_ptr<int>> result(std::move(ptr));

    EXPECT_TRUE(result.is_ok());
    EXPECT_EQ(*result.value(), 42);

    Result<std::unique_ptr<int>> moved = std::move(result);
    EXPECT_TRUE(moved.is_ok());
    EXPECT_EQ(*moved.value(), 42);
}

TEST_F(ResultTest, VoidResult) {
    Result<void> success;
    EXPECT_TRUE(success.is_ok());
    EXPECT_NO_THROW(success.value());

    auto error = make_error<void>(ErrorCode::INVALID_ARGUMENT, "Void error", "Test");
    EXPECT_TRUE(error.is_error());
    EXPECT_THROW(error.value(), TradeError);
}
