// position_sizing_test.cpp - Tests for trust-calibrated fractional Kelly
// sizing, its caps and the cash reserve

#include <gtest/gtest.h>

#include "backtest/position_sizing.hpp"
#include "research/trading_params.hpp"

class PositionSizingTest : public ::testing::Test {
protected:
    SizingConfig cfg;
};

// ===========================================================================
// 1. Kelly arithmetic
// ===========================================================================

TEST_F(PositionSizingTest, BalancedParamsHitTheCeiling) {
    // p = min(0.65, 0.60); stop 0.0625, take 0.1125 after slippage; b = 1.8
    auto d = sizing::kelly_position(0.65, trading_params::balanced(), cfg);
    EXPECT_DOUBLE_EQ(d.calibrated_p, 0.60);
    EXPECT_NEAR(d.win_loss_ratio, 1.8, 1e-12);
    EXPECT_NEAR(d.raw_kelly, (0.60 * 1.8 - 0.40) / 1.8, 1e-12);
    EXPECT_NEAR(d.fractional_kelly, d.raw_kelly * 0.25, 1e-12);
    EXPECT_DOUBLE_EQ(d.position_pct, 0.05);
    EXPECT_EQ(d.limit, SizingLimit::CEILING);
}

TEST_F(PositionSizingTest, ParameterMaxBindsBeforeCeiling) {
    auto p = trading_params::conservative();  // max_position_size 0.05
    p.max_position_size = 0.02;
    auto d = sizing::kelly_position(0.9, p, cfg);
    EXPECT_DOUBLE_EQ(d.position_pct, 0.02);
    EXPECT_EQ(d.limit, SizingLimit::PARAM_MAX);
}

TEST_F(PositionSizingTest, SmallEdgeStaysBelowCaps) {
    TradingParams p;
    p.stop_loss = 0.04;
    p.take_profit = 0.06;  // b = 0.045 / 0.05 = 0.9
    auto d = sizing::kelly_position(0.55, p, cfg);
    double raw = (0.55 * 0.9 - 0.45) / 0.9;
    EXPECT_NEAR(d.raw_kelly, raw, 1e-12);
    EXPECT_NEAR(d.position_pct, raw * 0.25, 1e-12);
    EXPECT_EQ(d.limit, SizingLimit::KELLY);
}

TEST_F(PositionSizingTest, TrustAboveCapIsCalibratedDown) {
    auto high = sizing::kelly_position(0.99, trading_params::balanced(), cfg);
    auto capped = sizing::kelly_position(0.60, trading_params::balanced(), cfg);
    EXPECT_DOUBLE_EQ(high.raw_kelly, capped.raw_kelly);
}

// ===========================================================================
// 2. No edge
// ===========================================================================

TEST_F(PositionSizingTest, NonPositiveKellyMeansNoTrade) {
    TradingParams p;
    p.stop_loss = 0.10;
    p.take_profit = 0.05;
    auto d = sizing::kelly_position(0.60, p, cfg);
    EXPECT_FALSE(d.has_edge());
    EXPECT_EQ(d.limit, SizingLimit::NO_EDGE);
    EXPECT_DOUBLE_EQ(d.position_pct, 0.0);
    EXPECT_DOUBLE_EQ(sizing::position_value(d, 10000.0, 10000.0, cfg), 0.0);
}

// ===========================================================================
// 3. Bounds
// ===========================================================================

TEST_F(PositionSizingTest, PositionNeverExceedsCeilingOrReserve) {
    for (double trust = 0.0; trust <= 1.0; trust += 0.05) {
        for (double maxpos : {0.01, 0.05, 0.15, 0.5, 1.0}) {
            TradingParams p;
            p.max_position_size = maxpos;
            auto d = sizing::kelly_position(trust, p, cfg);
            EXPECT_LE(d.position_pct, cfg.position_ceiling + 1e-12);
            EXPECT_LE(d.position_pct, maxpos + 1e-12);
            EXPECT_GE(d.position_pct, 0.0);
        }
    }
}

TEST_F(PositionSizingTest, CashReserveLimitsPositionValue) {
    SizingConfig loose;
    loose.position_ceiling = 1.0;
    TradingParams p;
    p.max_position_size = 1.0;
    p.stop_loss = 0.01;
    p.take_profit = 1.0;
    loose.kelly_fraction = 1.0;
    loose.trust_cap = 1.0;
    auto d = sizing::kelly_position(0.99, p, loose);
    ASSERT_GT(d.position_pct, 0.95);

    double value = sizing::position_value(d, 10000.0, 10000.0, loose);
    EXPECT_NEAR(value, 9500.0, 1e-9);
}

TEST_F(PositionSizingTest, AvailableCashLimitsPositionValue) {
    auto d = sizing::kelly_position(0.65, trading_params::balanced(), cfg);
    EXPECT_NEAR(sizing::position_value(d, 10000.0, 10000.0, cfg), 500.0, 1e-9);
    EXPECT_NEAR(sizing::position_value(d, 10000.0, 200.0, cfg), 200.0, 1e-9);
    EXPECT_DOUBLE_EQ(sizing::position_value(d, 0.0, 0.0, cfg), 0.0);
}
