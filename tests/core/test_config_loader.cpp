#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include "trade_guard/core/config_loader.hpp"

using namespace trade_guard;

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_file = std::filesystem::temp_directory_path() / "trade_guard_config_test.json";
        clear_env();
    }

    void TearDown() override {
        std::filesystem::remove(config_file);
        clear_env();
    }

    void clear_env() {
        for (const char* key : kKeys) {
            unsetenv(key);
        }
    }

    void write_config(const std::string& content) {
        std::ofstream file(config_file);
        file << content;
    }

    static constexpr const char* kKeys[] = {
        "MAX_DRAWDOWN_PCT", "MAX_PER_TRADE_PCT",   "MAX_DAILY_LOSS_USD", "PORTFOLIO_REFRESH_SECONDS",
        "HTTP_PORT",        "SYMBOLS",             "GATEWAY_URL",        "DATABASE_URL",
        "LOG_LEVEL",        "IDEMPOTENCY_TTL_SECONDS"};
    std::filesystem::path config_file;
};

TEST_F(ConfigLoaderTest, EmptyPathGivesDefaults) {
    auto result = ConfigLoader::load("");
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    const auto& config = result.value();
    EXPECT_EQ(config.server.port, 8000);
    EXPECT_DOUBLE_EQ(config.risk_engine.max_drawdown_pct, 10.0);
    EXPECT_TRUE(config.storage.database_url.empty());
    EXPECT_EQ(config.portfolio.refresh_interval_seconds, 180);
}

TEST_F(ConfigLoaderTest, FileOverridesOnlyWhatItNames) {
    write_config(R"({"server": {"port": 9100}, "risk_engine": {"max_per_trade_pct": 5.0}})");

    auto result = ConfigLoader::load(config_file);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    EXPECT_EQ(result.value().server.port, 9100);
    EXPECT_DOUBLE_EQ(result.value().risk_engine.max_per_trade_pct, 5.0);
    EXPECT_DOUBLE_EQ(result.value().risk_engine.max_drawdown_pct, 10.0);
}

TEST_F(ConfigLoaderTest, MissingFile) {
    auto result = ConfigLoader::load("/nonexistent/trade_guard.json");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_NOT_FOUND);
}

TEST_F(ConfigLoaderTest, MalformedJson) {
    write_config("{\"server\": ");
    auto result = ConfigLoader::load(config_file);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::JSON_PARSE_ERROR);
}

TEST_F(ConfigLoaderTest, WrongTypeIsInvalidData) {
    write_config(R"({"server": {"port": "eighty"}})");
    auto result = ConfigLoader::load(config_file);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(ConfigLoaderTest, ValidationProblemsNameTheSection) {
    write_config(R"({"risk_engine": {"max_drawdown_pct": 150.0}})");
    auto result = ConfigLoader::load(config_file);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
    EXPECT_THAT(result.error()->what(), ::testing::HasSubstr("risk_engine: max_drawdown_pct"));
}

TEST_F(ConfigLoaderTest, EnvironmentWinsOverFile) {
    write_config(R"({"risk_engine": {"max_drawdown_pct": 12.0}})");
    setenv("MAX_DRAWDOWN_PCT", "7.5", 1);
    setenv("SYMBOLS", "BTCUSDT, SOLUSDT", 1);
    setenv("MAX_DAILY_LOSS_USD", "400", 1);
    setenv("DATABASE_URL", "postgresql://guard@localhost/guard", 1);
    setenv("LOG_LEVEL", "DEBUG", 1);

    auto result = ConfigLoader::load(config_file);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    const auto& config = result.value();
    EXPECT_DOUBLE_EQ(config.risk_engine.max_drawdown_pct, 7.5);
    EXPECT_THAT(config.orchestrator.symbols, ::testing::ElementsAre("BTCUSDT", "SOLUSDT"));
    EXPECT_DOUBLE_EQ(config.risk_guard.max_daily_loss_usd, 400.0);
    EXPECT_EQ(config.storage.database_url, "postgresql://guard@localhost/guard");
    EXPECT_EQ(config.logging.min_level, LogLevel::DEBUG);
}

TEST_F(ConfigLoaderTest, RefreshIntervalRaisesBackoffCeiling) {
    setenv("PORTFOLIO_REFRESH_SECONDS", "1200", 1);
    auto result = ConfigLoader::load("");
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    EXPECT_EQ(result.value().portfolio.refresh_interval_seconds, 1200);
    EXPECT_EQ(result.value().portfolio.max_backoff_seconds, 1200);
}

TEST_F(ConfigLoaderTest, PortOutOfRange) {
    setenv("HTTP_PORT", "70000", 1);
    auto result = ConfigLoader::load("");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(ConfigLoaderTest, NonNumericOverrideFails) {
    setenv("MAX_PER_TRADE_PCT", "ten", 1);
    AppConfig config;
    auto result = ConfigLoader::apply_env_overrides(config);
    ASSERT_TRUE(result.is_error());
    EXPECT_DOUBLE_EQ(config.risk_engine.max_per_trade_pct, 10.0);
}

TEST_F(ConfigLoaderTest, DatabaseUrlIsNeverSerialized) {
    AppConfig config;
    config.storage.database_url = "postgresql://secret@db/guard";
    EXPECT_FALSE(config.to_json().at("storage").contains("database_url"));
}

TEST_F(ConfigLoaderTest, MergeJsonIsRecursive) {
    nlohmann::json target = {{"a", {{"x", 1}, {"y", 2}}}, {"b", 1}};
    ConfigLoader::merge_json(target, {{"a", {{"y", 3}}}, {"c", true}});
    EXPECT_EQ(target["a"]["x"], 1);
    EXPECT_EQ(target["a"]["y"], 3);
    EXPECT_EQ(target["b"], 1);
    EXPECT_EQ(target["c"], true);

    ConfigLoader::merge_json(target, {{"a", 5}});
    EXPECT_EQ(target["a"], 5);
}
