#include <gtest/gtest.h>
#include "core/test_base.hpp"
#include "core/test_utils.hpp"
#include "trade_guard/risk/adaptive_tpsl.hpp"

using namespace trade_guard;
using namespace trade_guard::testing;

namespace {

class CountingMarketProvider : public MarketAnalysisProvider {
public:
    Result<MarketAnalysis> get_market_analysis(const std::string&) override {
        ++calls;
        if (fail) {
            return make_error<MarketAnalysis>(ErrorCode::MARKET_DATA_ERROR, "no candles",
                                              "CountingMarketProvider");
        }
        MarketAnalysis analysis;
        analysis.atr = atr;
        return analysis;
    }

    int calls{0};
    double atr{0.5};
    bool fail{false};
};

}  // namespace

class AdaptiveTPSLTest : public TestBase {
protected:
    AdaptiveTPSLConfig config;
};

TEST_F(AdaptiveTPSLTest, DefaultsWithoutContext) {
    AdaptiveTPSLCalculator calc(config);
    auto plan = calc.calculate("BTCUSDT", Side::BUY, 100.0);

    EXPECT_DOUBLE_EQ(plan.tp_pct, 0.025);
    EXPECT_DOUBLE_EQ(plan.sl_pct, 0.015);
    EXPECT_DOUBLE_EQ(plan.tp_price, 102.5);
    EXPECT_DOUBLE_EQ(plan.sl_price, 98.5);
    EXPECT_DOUBLE_EQ(plan.trailing_activation_pct, 0.02);
    EXPECT_NE(plan.reasoning.find("Default settings"), std::string::npos);
}

TEST_F(AdaptiveTPSLTest, SellLegsAreMirrored) {
    AdaptiveTPSLCalculator calc(config);
    auto plan = calc.calculate("ETHUSDT", Side::SELL, 2000.0);
    EXPECT_DOUBLE_EQ(plan.tp_price, 2000.0 * (1.0 - 0.025));
    EXPECT_DOUBLE_EQ(plan.sl_price, 2000.0 * (1.0 + 0.015));
}

TEST_F(AdaptiveTPSLTest, HighVolatilityWidensBothLegsAndTrailing) {
    AdaptiveTPSLCalculator calc(config);
    MarketAnalysis analysis;
    analysis.atr = 3.0;

    auto plan = calc.calculate("BTCUSDT", Side::BUY, 100.0, std::nullopt, 0.7, analysis);
    EXPECT_NEAR(plan.tp_pct, 0.0375, 1e-12);
    EXPECT_NEAR(plan.sl_pct, 0.0225, 1e-12);
    EXPECT_NEAR(plan.trailing_activation_pct, 0.026, 1e-12);
    EXPECT_NE(plan.reasoning.find("High Vol"), std::string::npos);
}

TEST_F(AdaptiveTPSLTest, LowConfidenceIsConservative) {
    AdaptiveTPSLCalculator calc(config);
    auto plan = calc.calculate("BTCUSDT", Side::BUY, 100.0, std::nullopt, 0.5);
    EXPECT_NEAR(plan.tp_pct, 0.0225, 1e-12);
    EXPECT_NEAR(plan.sl_pct, 0.0135, 1e-12);
}

TEST_F(AdaptiveTPSLTest, StrongHistoryTightensAndEnforcesRewardToRisk) {
    auto tracker = std::make_shared<InMemoryPerformanceTracker>(
        std::make_shared<SeededExplorationSampler>(7));
    for (int i = 0; i < 5; ++i) {
        tracker->record_trade("alpha", "BTCUSDT", 10.0);
    }

    AdaptiveTPSLCalculator calc(config, tracker);
    auto plan = calc.calculate("BTCUSDT", Side::BUY, 100.0, std::string("alpha"));

    EXPECT_NEAR(plan.tp_pct, 0.02125, 1e-12);
    EXPECT_NEAR(plan.sl_pct, 0.02125 / 1.5, 1e-12);
    EXPECT_GE(plan.tp_pct / plan.sl_pct, config.min_reward_to_risk - 1e-9);
    EXPECT_NEAR(plan.trailing_distance_pct, 0.012 * 0.85, 1e-12);
    EXPECT_NE(plan.reasoning.find("R:R enforced"), std::string::npos);
}

TEST_F(AdaptiveTPSLTest, ShortHistoryIsOnlyNoted) {
    auto tracker = std::make_shared<InMemoryPerformanceTracker>();
    tracker->record_trade("alpha", "BTCUSDT", -5.0);

    AdaptiveTPSLCalculator calc(config, tracker);
    auto plan = calc.calculate("BTCUSDT", Side::BUY, 100.0, std::string("alpha"));
    EXPECT_DOUBLE_EQ(plan.tp_pct, 0.025);
    EXPECT_NE(plan.reasoning.find("History: 1 trades (learning)"), std::string::npos);
}

TEST_F(AdaptiveTPSLTest, ClampsToConfiguredBounds) {
    config.base_tp_pct = 0.2;
    config.base_sl_pct = 0.001;
    AdaptiveTPSLCalculator calc(config);

    auto plan = calc.calculate("BTCUSDT", Side::BUY, 100.0);
    EXPECT_DOUBLE_EQ(plan.tp_pct, config.max_tp_pct);
    EXPECT_DOUBLE_EQ(plan.sl_pct, config.min_sl_pct);
}

TEST_F(AdaptiveTPSLTest, AtrLookupIsCached) {
    auto clock = std::make_shared<ManualClock>();
    auto provider = std::make_shared<CountingMarketProvider>();
    AdaptiveTPSLCalculator calc(config, nullptr, provider, clock);

    calc.calculate("BTCUSDT", Side::BUY, 100.0);
    calc.calculate("BTCUSDT", Side::BUY, 100.0);
    EXPECT_EQ(provider->calls, 1);

    clock->advance(std::chrono::seconds(301));
    calc.calculate("BTCUSDT", Side::BUY, 100.0);
    EXPECT_EQ(provider->calls, 2);
}

TEST_F(AdaptiveTPSLTest, ProviderFailureFallsBackToBase) {
    auto provider = std::make_shared<CountingMarketProvider>();
    provider->fail = true;
    AdaptiveTPSLCalculator calc(config, nullptr, provider);

    auto plan = calc.calculate("BTCUSDT", Side::BUY, 100.0);
    EXPECT_DOUBLE_EQ(plan.tp_pct, 0.025);
    EXPECT_NE(plan.reasoning.find("ATR unavailable"), std::string::npos);
}

TEST_F(AdaptiveTPSLTest, TrailingStopOnlyTightens) {
    AdaptiveTPSLCalculator calc(config);

    EXPECT_FALSE(calc.adjust_for_trailing(0.01, 0.015, 100.0, 105.0, Side::BUY, 0.02, 0.012));

    auto update = calc.adjust_for_trailing(0.03, 0.015, 100.0, 105.0, Side::BUY, 0.02, 0.012);
    ASSERT_TRUE(update.has_value());
    EXPECT_NEAR(update->new_stop_price, 103.74, 1e-9);

    EXPECT_FALSE(calc.adjust_for_trailing(0.03, 0.015, 100.0, 99.0, Side::BUY, 0.02, 0.012));

    auto short_update =
        calc.adjust_for_trailing(0.05, 0.015, 100.0, 95.0, Side::SELL, 0.02, 0.012);
    ASSERT_TRUE(short_update.has_value());
    EXPECT_NEAR(short_update->new_stop_price, 96.14, 1e-9);
}
