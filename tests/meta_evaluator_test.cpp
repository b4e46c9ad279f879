// meta_evaluator_test.cpp - Tests for scenario comparison, parameter
// sensitivity, failure boundaries and aggregate metrics

#include <gtest/gtest.h>

#include "analysis/meta_evaluator.hpp"
#include "backtest/scenario_result.hpp"
#include "research/trading_params.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

// ===========================================================================
// Helpers
// ===========================================================================
namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

ScenarioResult make_result(const std::string& scenario_id, const std::string& symbol,
                           const std::string& param_set, const TradingParams& params,
                           double ret, double sharpe = 1.0,
                           const std::string& regime_id = "low_up_normal_easing") {
    ScenarioResult r;
    r.scenario_id = scenario_id;
    r.symbol = symbol;
    r.param_set_name = param_set;
    r.params = params;
    r.regime_id = regime_id;
    r.total_return_pct = ret;
    r.sharpe_ratio = sharpe;
    r.sharpe_valid = std::isfinite(sharpe);
    r.max_drawdown_pct = 2.0;
    r.win_rate = 0.5;
    r.trade_count = 5;
    r.verified = true;
    return r;
}

TradingParams with_trust(double t) {
    TradingParams p;
    p.trust_threshold = t;
    return p;
}

bool has_observation(const DeltaMetrics& d, const std::string& needle) {
    return std::any_of(d.observations.begin(), d.observations.end(),
                       [&](const std::string& o) { return o.find(needle) != std::string::npos; });
}

}  // namespace

class MetaEvaluatorTest : public ::testing::Test {
protected:
    MetaEvaluator eval;
};

// ===========================================================================
// 1. Comparison
// ===========================================================================

TEST_F(MetaEvaluatorTest, AggregateDeltaAndObservation) {
    TradingParams p;
    std::vector<ScenarioResult> a = {make_result("a", "MSFT", "balanced", p, 1.0),
                                     make_result("a", "NVDA", "balanced", p, 2.0)};
    std::vector<ScenarioResult> b = {make_result("b", "MSFT", "balanced", p, 4.0),
                                     make_result("b", "NVDA", "balanced", p, 5.0)};
    auto d = eval.compare(a, b);
    ASSERT_TRUE(d.comparable);
    EXPECT_EQ(d.scenario_a_id, "a");
    EXPECT_EQ(d.scenario_b_id, "b");
    EXPECT_NEAR(d.aggregate.return_delta, 3.0, 1e-12);
    EXPECT_DOUBLE_EQ(d.robustness, 1.0);
    EXPECT_EQ(d.stability, "robust");
    EXPECT_TRUE(d.parameter_diffs.empty());
    EXPECT_TRUE(has_observation(d, "Average return improved by 3.00 pts"));
    EXPECT_EQ(d.by_symbol.size(), 2u);
}

TEST_F(MetaEvaluatorTest, SkippedResultsAreExcluded) {
    TradingParams p;
    auto skipped = make_result("a", "ETH-USD", "balanced", p, -50.0);
    skipped.skipped = true;
    std::vector<ScenarioResult> a = {make_result("a", "MSFT", "balanced", p, 1.0), skipped};
    std::vector<ScenarioResult> b = {make_result("b", "MSFT", "balanced", p, 1.5)};
    auto d = eval.compare(a, b);
    EXPECT_EQ(d.a.result_count, 1);
    EXPECT_NEAR(d.aggregate.return_delta, 0.5, 1e-12);
    EXPECT_FALSE(has_observation(d, "Average return"));
}

TEST_F(MetaEvaluatorTest, NothingCompletedIsNotComparable) {
    TradingParams p;
    auto skipped = make_result("a", "MSFT", "balanced", p, 0.0);
    skipped.skipped = true;
    auto d = eval.compare({skipped}, {make_result("b", "MSFT", "balanced", p, 1.0)});
    EXPECT_FALSE(d.comparable);
    ASSERT_EQ(d.observations.size(), 1u);
}

TEST_F(MetaEvaluatorTest, ParameterDiffsAreReported) {
    std::vector<ScenarioResult> a = {make_result("a", "MSFT", "balanced", with_trust(0.65), 1.0)};
    std::vector<ScenarioResult> b = {make_result("b", "MSFT", "balanced", with_trust(0.80), 3.0)};
    auto d = eval.compare(a, b);
    ASSERT_EQ(d.parameter_diffs.size(), 1u);
    EXPECT_EQ(d.parameter_diffs[0].parameter, "trust_threshold");
    EXPECT_DOUBLE_EQ(d.parameter_diffs[0].value_a, 0.65);
    EXPECT_DOUBLE_EQ(d.parameter_diffs[0].value_b, 0.80);
    EXPECT_TRUE(has_observation(d, "balanced.trust_threshold: 0.65 -> 0.8"));
}

TEST_F(MetaEvaluatorTest, DivergentSymbolsLowerRobustness) {
    TradingParams p;
    std::vector<ScenarioResult> a = {make_result("a", "MSFT", "balanced", p, 0.0),
                                     make_result("a", "NVDA", "balanced", p, 0.0)};
    std::vector<ScenarioResult> b = {make_result("b", "MSFT", "balanced", p, 5.0),
                                     make_result("b", "NVDA", "balanced", p, -1.0)};
    auto d = eval.compare(a, b);
    ASSERT_EQ(d.divergent_symbols.size(), 1u);
    EXPECT_EQ(d.divergent_symbols[0], "NVDA");
    EXPECT_DOUBLE_EQ(d.robustness, 0.5);
    EXPECT_EQ(d.stability, "regime-dependent");
    EXPECT_EQ(d.dominant_dependency, "MSFT");
    EXPECT_TRUE(has_observation(d, "NVDA moved against the aggregate"));
}

TEST_F(MetaEvaluatorTest, RegimesOfBothSidesAreRecorded) {
    TradingParams p;
    auto d = eval.compare({make_result("a", "MSFT", "balanced", p, 1.0, 1.0, "low_up_normal_easing")},
                          {make_result("b", "MSFT", "balanced", p, 4.0, 1.0,
                                       "high_down_normal_tightening")});
    EXPECT_EQ(d.regime_a_id, "low_up_normal_easing");
    EXPECT_EQ(d.regime_b_id, "high_down_normal_tightening");
    EXPECT_EQ(d.regime_ids.size(), 2u);
}

// ===========================================================================
// 2. Invalid Sharpe handling
// ===========================================================================

TEST_F(MetaEvaluatorTest, ZeroVarianceSharpeIsExcludedAndCounted) {
    TradingParams p;
    std::vector<ScenarioResult> a = {make_result("a", "MSFT", "balanced", p, 1.0, 1.0),
                                     make_result("a", "NVDA", "balanced", p, 1.0, NaN)};
    std::vector<ScenarioResult> b = {make_result("b", "MSFT", "balanced", p, 1.0, 2.0),
                                     make_result("b", "NVDA", "balanced", p, 1.0, 3.0)};
    auto d = eval.compare(a, b);
    EXPECT_DOUBLE_EQ(d.a.avg_sharpe, 1.0);
    EXPECT_EQ(d.a.invalid_sharpe_count, 1);
    EXPECT_DOUBLE_EQ(d.aggregate.sharpe_delta, 1.5);

    auto agg = eval.aggregate(a);
    EXPECT_EQ(agg.invalid_sharpe_count, 1);
    EXPECT_EQ(agg.sharpe.count, 1);
    EXPECT_DOUBLE_EQ(agg.sharpe.mean, 1.0);
}

TEST_F(MetaEvaluatorTest, InfiniteSharpeCountsAsInvalid) {
    TradingParams p;
    auto r = make_result("a", "MSFT", "balanced", p, 1.0,
                         std::numeric_limits<double>::infinity());
    auto agg = eval.aggregate({r});
    EXPECT_EQ(agg.invalid_sharpe_count, 1);
    EXPECT_TRUE(std::isnan(agg.sharpe.mean));
}

TEST_F(MetaEvaluatorTest, AggregateCountsSkips) {
    TradingParams p;
    auto skipped = make_result("a", "NVDA", "balanced", p, 0.0);
    skipped.skipped = true;
    auto agg = eval.aggregate({make_result("a", "MSFT", "balanced", p, 4.0), skipped});
    EXPECT_EQ(agg.result_count, 2);
    EXPECT_EQ(agg.completed_count, 1);
    EXPECT_EQ(agg.skipped_count, 1);
    EXPECT_DOUBLE_EQ(agg.completion_rate, 0.5);
    EXPECT_DOUBLE_EQ(agg.returns.mean, 4.0);
}

// ===========================================================================
// 3. Sensitivity
// ===========================================================================

TEST_F(MetaEvaluatorTest, TrustThresholdSensitivityIsHigh) {
    std::vector<ScenarioResult> rs = {
        make_result("s1", "MSFT", "p", with_trust(0.55), 12.0),
        make_result("s1", "NVDA", "p", with_trust(0.55), 14.0),
        make_result("s2", "MSFT", "p", with_trust(0.85), 1.0),
        make_result("s2", "NVDA", "p", with_trust(0.85), 2.0),
    };
    auto rep = eval.sensitivity(rs, "trust_threshold");
    ASSERT_TRUE(rep.sufficient_variation);
    ASSERT_EQ(rep.groups.size(), 2u);
    EXPECT_DOUBLE_EQ(rep.groups[0].value, 0.55);
    EXPECT_DOUBLE_EQ(rep.groups[0].mean_return, 13.0);
    EXPECT_DOUBLE_EQ(rep.range, 11.5);
    EXPECT_TRUE(rep.high_sensitivity);
}

TEST_F(MetaEvaluatorTest, SmallSpreadIsLowSensitivity) {
    std::vector<ScenarioResult> rs = {
        make_result("s1", "MSFT", "p", with_trust(0.55), 2.0),
        make_result("s2", "MSFT", "p", with_trust(0.85), 1.0),
    };
    auto rep = eval.sensitivity(rs, "trust_threshold");
    EXPECT_TRUE(rep.sufficient_variation);
    EXPECT_FALSE(rep.high_sensitivity);
}

TEST_F(MetaEvaluatorTest, SingleValueIsInsufficientVariation) {
    std::vector<ScenarioResult> rs = {make_result("s1", "MSFT", "p", with_trust(0.55), 2.0),
                                      make_result("s1", "NVDA", "p", with_trust(0.55), 9.0)};
    auto rep = eval.sensitivity(rs, "trust_threshold");
    EXPECT_FALSE(rep.sufficient_variation);
    EXPECT_FALSE(rep.high_sensitivity);
    EXPECT_FALSE(rep.reason.empty());
    EXPECT_TRUE(eval.sensitivity_all(rs).empty());
}

// ===========================================================================
// 4. Failure boundaries
// ===========================================================================

TEST_F(MetaEvaluatorTest, CliffAndSignChangeAreDetected) {
    std::vector<ScenarioResult> rs = {
        make_result("s", "MSFT", "p", with_trust(0.5), 10.0),
        make_result("s", "NVDA", "p", with_trust(0.5), 10.0),
        make_result("s", "MSFT", "p", with_trust(0.6), 8.0),
        make_result("s", "NVDA", "p", with_trust(0.6), 8.0),
        make_result("s", "MSFT", "p", with_trust(0.7), -5.0),
        make_result("s", "NVDA", "p", with_trust(0.7), -5.0),
    };
    auto rep = eval.failure_boundaries(rs, "trust_threshold");
    ASSERT_TRUE(rep.boundary_detected);
    ASSERT_EQ(rep.cliffs.size(), 1u);
    EXPECT_DOUBLE_EQ(rep.cliffs[0].from_value, 0.6);
    EXPECT_DOUBLE_EQ(rep.cliffs[0].to_value, 0.7);
    EXPECT_DOUBLE_EQ(rep.cliffs[0].drop, 13.0);
    EXPECT_EQ(rep.cliffs[0].direction, 1);
    ASSERT_EQ(rep.thresholds.size(), 1u);
    EXPECT_DOUBLE_EQ(rep.thresholds[0].last_positive_value, 0.6);
    EXPECT_DOUBLE_EQ(rep.thresholds[0].first_negative_value, 0.7);

}

TEST_F(MetaEvaluatorTest, BoundaryEvidenceComesFromAdjacentGroupsOnly) {
    std::vector<ScenarioResult> rs = {
        make_result("far", "MSFT", "p", with_trust(0.5), 10.0, 1.0, "high_down_normal_tightening"),
        make_result("near", "MSFT", "p", with_trust(0.6), 8.0),
        make_result("next", "MSFT", "p", with_trust(0.7), -5.0),
    };
    auto rep = eval.failure_boundaries(rs, "trust_threshold");
    ASSERT_EQ(rep.cliffs.size(), 1u);
    EXPECT_EQ(rep.cliffs[0].scenario_ids, (std::vector<std::string>{"near", "next"}));
    EXPECT_EQ(rep.cliffs[0].regime_ids, (std::vector<std::string>{"low_up_normal_easing"}));
    ASSERT_EQ(rep.thresholds.size(), 1u);
    EXPECT_EQ(rep.thresholds[0].scenario_ids, (std::vector<std::string>{"near", "next"}));
}

TEST_F(MetaEvaluatorTest, NoisyDropIsNotACliff) {
    std::vector<ScenarioResult> rs = {
        make_result("s", "MSFT", "p", with_trust(0.5), 20.0),
        make_result("s", "NVDA", "p", with_trust(0.5), -10.0),
        make_result("s", "MSFT", "p", with_trust(0.6), 14.0),
        make_result("s", "NVDA", "p", with_trust(0.6), -16.0),
    };
    auto rep = eval.failure_boundaries(rs, "trust_threshold");
    EXPECT_TRUE(rep.cliffs.empty());
    ASSERT_EQ(rep.thresholds.size(), 1u);
    EXPECT_EQ(rep.thresholds[0].direction, 1);
}

TEST_F(MetaEvaluatorTest, DropWhenDecreasingHasNegativeDirection) {
    std::vector<ScenarioResult> rs = {
        make_result("s", "MSFT", "p", with_trust(0.5), -8.0),
        make_result("s", "MSFT", "p", with_trust(0.6), 4.0),
    };
    auto rep = eval.failure_boundaries(rs, "trust_threshold");
    ASSERT_EQ(rep.cliffs.size(), 1u);
    EXPECT_EQ(rep.cliffs[0].direction, -1);
    EXPECT_DOUBLE_EQ(rep.cliffs[0].from_value, 0.6);
    EXPECT_DOUBLE_EQ(rep.cliffs[0].to_value, 0.5);
    ASSERT_EQ(rep.thresholds.size(), 1u);
    EXPECT_EQ(rep.thresholds[0].direction, -1);
}

// ===========================================================================
// 5. Failure modes and landscape
// ===========================================================================

TEST_F(MetaEvaluatorTest, FailureModesBelowThreshold) {
    TradingParams p;
    auto skipped = make_result("s", "ETH-USD", "p", p, -40.0);
    skipped.skipped = true;
    std::vector<ScenarioResult> rs = {
        make_result("s", "MSFT", "p", p, -15.0, 1.0, "high_down_normal_tightening"),
        make_result("s", "NVDA", "p", p, -5.0),
        skipped,
    };
    auto modes = eval.identify_failure_modes(rs);
    ASSERT_EQ(modes.size(), 1u);
    EXPECT_EQ(modes[0].symbol, "MSFT");
    EXPECT_EQ(modes[0].regime_id, "high_down_normal_tightening");
}

TEST_F(MetaEvaluatorTest, LandscapeCombinesSensitivityAndFailures) {
    std::vector<ScenarioResult> rs = {
        make_result("s1", "MSFT", "p", with_trust(0.55), 12.0),
        make_result("s1", "NVDA", "p", with_trust(0.55), 14.0),
        make_result("s2", "MSFT", "p", with_trust(0.85), -12.0, 1.0, "high_down_normal_tightening"),
        make_result("s2", "NVDA", "p", with_trust(0.85), -11.0, 1.0, "high_down_normal_tightening"),
    };
    auto land = eval.sensitivity_landscape(rs);
    ASSERT_EQ(land.high_sensitivity.size(), 1u);
    EXPECT_EQ(land.high_sensitivity[0].parameter, "trust_threshold");
    ASSERT_TRUE(land.boundaries.count("trust_threshold"));
    EXPECT_TRUE(land.boundaries.at("trust_threshold").boundary_detected);
    EXPECT_EQ(land.total_failures, 2);
    EXPECT_EQ(land.failures_by_regime.at("high_down_normal_tightening"), 2);
}
