// regime_ontology_test.cpp - Tests for deterministic regime classification,
// the 54-combination ontology and coverage tracking

#include <gtest/gtest.h>

#include "research/errors.hpp"
#include "research/regime_ontology.hpp"

#include <set>
#include <string>
#include <vector>

namespace {

using regime::Liquidity;
using regime::Macro;
using regime::Trend;
using regime::Volatility;

struct Tagged {
    RegimeClassification regime;
};

}  // namespace

class RegimeOntologyTest : public ::testing::Test {};

// ===========================================================================
// 1. Classification
// ===========================================================================

TEST_F(RegimeOntologyTest, NamedWindowWinsOverStartYear) {
    // Name says COVID crash, dates say 2023.
    auto rc = regime::classify("Replay of COVID Crash 2020 shape", "2023-01-01", "2023-06-30");
    EXPECT_EQ(rc.volatility, Volatility::HIGH);
    EXPECT_EQ(rc.trend, Trend::DOWN);
    EXPECT_EQ(rc.liquidity, Liquidity::STRESSED);
    EXPECT_EQ(rc.macro, Macro::EASING);
}

TEST_F(RegimeOntologyTest, FallsBackToStartYear) {
    EXPECT_EQ(regime::classify("x", "2021-03-01", "2021-04-01").regime_id(),
              "low_up_normal_easing");
    EXPECT_EQ(regime::classify("x", "2022-03-01", "2022-04-01").regime_id(),
              "high_down_normal_tightening");
    EXPECT_EQ(regime::classify("x", "2023-03-01", "2023-04-01").regime_id(),
              "medium_up_normal_neutral");
    EXPECT_EQ(regime::classify("x", "2020-03-01", "2020-04-01").regime_id(),
              "high_down_stressed_easing");
}

TEST_F(RegimeOntologyTest, UnknownYearDefaultsToMediumSideways) {
    EXPECT_EQ(regime::classify("x", "2018-01-01", "2018-12-31").regime_id(),
              "medium_sideways_normal_neutral");
}

TEST_F(RegimeOntologyTest, StressKeywordForcesStressedLiquidity) {
    auto rc = regime::classify("x", "2021-01-01", "2021-12-31", "Banking CRISIS replay");
    EXPECT_EQ(rc.liquidity, Liquidity::STRESSED);
    EXPECT_EQ(rc.volatility, Volatility::LOW);
}

TEST_F(RegimeOntologyTest, ClassificationIsDeterministic) {
    auto a = regime::classify("Bull Run 2021", "2021-01-01", "2021-12-31", "desc");
    auto b = regime::classify("Bull Run 2021", "2021-01-01", "2021-12-31", "desc");
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.regime_id(), b.regime_id());
}

TEST_F(RegimeOntologyTest, RejectsInvertedRange) {
    EXPECT_THROW(regime::classify("x", "2021-12-31", "2021-01-01"), InvalidRangeError);
}

// ===========================================================================
// 2. Ontology
// ===========================================================================

TEST_F(RegimeOntologyTest, FiftyFourDistinctCombinations) {
    auto all = regime::all_combinations();
    ASSERT_EQ(all.size(), 54u);
    std::set<std::string> ids;
    for (const auto& rc : all) ids.insert(rc.regime_id());
    EXPECT_EQ(ids.size(), 54u);
}

TEST_F(RegimeOntologyTest, RegimeIdParsesBack) {
    for (const auto& rc : regime::all_combinations()) {
        EXPECT_EQ(regime::parse_regime_id(rc.regime_id()), rc);
    }
    EXPECT_THROW(regime::parse_regime_id("tepid_up_normal_easing"), std::invalid_argument);
}

TEST_F(RegimeOntologyTest, DescriptionDoesNotAffectEquality) {
    auto a = regime::make(Volatility::LOW, Trend::UP, Liquidity::NORMAL, Macro::EASING, "one");
    auto b = regime::make(Volatility::LOW, Trend::UP, Liquidity::NORMAL, Macro::EASING, "two");
    EXPECT_EQ(a, b);
    EXPECT_FALSE(a < b);
    EXPECT_FALSE(b < a);
}

TEST_F(RegimeOntologyTest, ExtremeMeansHighVolatilityOrStressedLiquidity) {
    EXPECT_TRUE(regime::make(Volatility::HIGH, Trend::UP, Liquidity::NORMAL, Macro::EASING)
                    .is_extreme());
    EXPECT_TRUE(regime::make(Volatility::LOW, Trend::UP, Liquidity::STRESSED, Macro::EASING)
                    .is_extreme());
    EXPECT_FALSE(regime::make(Volatility::MEDIUM, Trend::UP, Liquidity::NORMAL, Macro::EASING)
                     .is_extreme());
}

TEST_F(RegimeOntologyTest, EveryCanonicalWindowClassifiesToItsOwnRegime) {
    for (const auto& w : regime::canonical_windows()) {
        auto rc = regime::classify(w.name, w.start_date, w.end_date);
        EXPECT_EQ(rc, w.regime) << w.name;
        auto found = regime::windows_for(w.regime);
        ASSERT_FALSE(found.empty());
        EXPECT_EQ(found.front().name, w.name);
    }
}

// ===========================================================================
// 3. Coverage
// ===========================================================================

TEST_F(RegimeOntologyTest, CoverageCountsAndListsUnexplored) {
    std::vector<Tagged> items = {
        {regime::classify_by_year(2021)},
        {regime::classify_by_year(2021)},
        {regime::classify_by_year(2022)},
    };
    auto cov = regime::coverage(items);
    EXPECT_EQ(cov.size(), 54u);
    EXPECT_EQ(cov[regime::classify_by_year(2021)], 2);
    EXPECT_EQ(cov[regime::classify_by_year(2022)], 1);
    EXPECT_EQ(regime::unexplored(cov).size(), 52u);
}

TEST_F(RegimeOntologyTest, JsonRoundTripKeepsAxes) {
    auto rc = regime::canonical_windows()[2].regime;
    nlohmann::json j = rc;
    EXPECT_EQ(j.at("macro").get<std::string>(), "tightening");
    EXPECT_EQ(j.get<RegimeClassification>(), rc);
}
