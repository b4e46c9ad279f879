// scenario_definition_test.cpp - Tests for content-addressed scenario identity,
// validation and strict definition decoding

#include <gtest/gtest.h>

#include "research/content_hash.hpp"
#include "research/errors.hpp"
#include "research/scenario_definition.hpp"
#include "research/trading_params.hpp"

#include <nlohmann/json.hpp>

#include <set>
#include <string>

namespace {

ScenarioDefinition make_scenario() {
    ScenarioDefinition s;
    s.name = "Identity Check";
    s.description = "Two symbols, one parameter set";
    s.start_date = "2022-01-01";
    s.end_date = "2022-06-30";
    s.symbols = {"NVDA", "BTC-USD"};
    s.param_sets = {{"balanced", trading_params::balanced()}};
    s.regime = regime::classify(s.name, s.start_date, s.end_date, s.description);
    return s;
}

}  // namespace

class ScenarioDefinitionTest : public ::testing::Test {};

// ===========================================================================
// 1. Content hash
// ===========================================================================

TEST_F(ScenarioDefinitionTest, Sha256KnownVector) {
    EXPECT_EQ(content_hash::sha256_hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(content_hash::short_id("abc"), "ba7816bf8f01cfea");
}

TEST_F(ScenarioDefinitionTest, IdIsSixteenLowercaseHexChars) {
    auto id = make_scenario().scenario_id();
    ASSERT_EQ(id.size(), 16u);
    for (char c : id) {
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << id;
    }
}

// ===========================================================================
// 2. Identity stability
// ===========================================================================

TEST_F(ScenarioDefinitionTest, SameContentSameId) {
    EXPECT_EQ(make_scenario().scenario_id(), make_scenario().scenario_id());
}

TEST_F(ScenarioDefinitionTest, SymbolOrderDoesNotChangeId) {
    auto a = make_scenario();
    auto b = make_scenario();
    b.symbols = {"BTC-USD", "NVDA"};
    EXPECT_EQ(a.scenario_id(), b.scenario_id());
}

TEST_F(ScenarioDefinitionTest, LineageDoesNotChangeId) {
    auto a = make_scenario();
    auto b = make_scenario();
    b.parent_scenario_id = "0123456789abcdef";
    EXPECT_EQ(a.scenario_id(), b.scenario_id());
}

TEST_F(ScenarioDefinitionTest, RegimeDescriptionDoesNotChangeId) {
    auto a = make_scenario();
    auto b = make_scenario();
    b.regime.description = "annotated later";
    EXPECT_EQ(a.scenario_id(), b.scenario_id());
}

TEST_F(ScenarioDefinitionTest, EveryContentFieldChangesId) {
    auto base = make_scenario();
    std::set<std::string> ids = {base.scenario_id()};

    auto s = base; s.name = "Other";                         ids.insert(s.scenario_id());
    s = base; s.description = "Other";                       ids.insert(s.scenario_id());
    s = base; s.end_date = "2022-07-01";                     ids.insert(s.scenario_id());
    s = base; s.symbols.push_back("MSFT");                   ids.insert(s.scenario_id());
    s = base; s.param_sets["balanced"].stop_loss = 0.06;     ids.insert(s.scenario_id());
    s = base; s.param_sets["extra"] = TradingParams{};       ids.insert(s.scenario_id());
    s = base; s.regime.macro = regime::Macro::EASING;        ids.insert(s.scenario_id());
    s = base; s.generator_version = "2.0.0";                 ids.insert(s.scenario_id());
    EXPECT_EQ(ids.size(), 9u);
}

TEST_F(ScenarioDefinitionTest, ThousandsOfVariantsDoNotCollide) {
    auto base = make_scenario();
    std::set<std::string> ids;
    int n = 0;
    for (int t = 0; t < 60; ++t) {
        for (int c = 0; c < 25; ++c) {
            auto s = base;
            s.param_sets["balanced"].trust_threshold = 0.40 + 0.01 * t;
            s.param_sets["balanced"].cooldown_period = c;
            ids.insert(s.scenario_id());
            ++n;
        }
    }
    EXPECT_EQ(n, 1500);
    EXPECT_EQ(ids.size(), 1500u);
}

TEST_F(ScenarioDefinitionTest, CanonicalFormSortsKeysAndSymbols) {
    auto s = make_scenario();
    auto canonical = s.canonical_serialization();
    EXPECT_LT(canonical.find("\"description\""), canonical.find("\"name\""));
    EXPECT_LT(canonical.find("BTC-USD"), canonical.find("NVDA"));
    EXPECT_EQ(canonical.find("parent_scenario_id"), std::string::npos);
}

// ===========================================================================
// 3. Validation
// ===========================================================================

TEST_F(ScenarioDefinitionTest, ValidScenarioPasses) {
    EXPECT_NO_THROW(scenario::validate(make_scenario()));
}

TEST_F(ScenarioDefinitionTest, InvertedDatesAreRangeErrors) {
    auto s = make_scenario();
    s.start_date = "2022-07-01";
    EXPECT_THROW(scenario::validate(s), InvalidRangeError);
}

TEST_F(ScenarioDefinitionTest, RangeErrorKeepsItsKind) {
    auto s = make_scenario();
    s.start_date = "2022-07-01";
    try {
        scenario::validate(s);
        FAIL() << "expected InvalidRangeError";
    } catch (const std::exception& e) {
        EXPECT_STREQ(error_kind(e), "InvalidRangeError");
    }
}

TEST_F(ScenarioDefinitionTest, StructuralProblemsAreScenarioErrors) {
    auto s = make_scenario();
    s.symbols.clear();
    EXPECT_THROW(scenario::validate(s), InvalidScenarioError);
    s = make_scenario();
    s.param_sets.clear();
    EXPECT_THROW(scenario::validate(s), InvalidScenarioError);
    s = make_scenario();
    s.name.clear();
    EXPECT_THROW(scenario::validate(s), InvalidScenarioError);
    s = make_scenario();
    s.param_sets["balanced"].take_profit = 0.0;
    EXPECT_THROW(scenario::validate(s), InvalidScenarioError);
}

// ===========================================================================
// 4. JSON
// ===========================================================================

TEST_F(ScenarioDefinitionTest, PersistedFormCarriesIdAndLineage) {
    auto s = make_scenario();
    s.parent_scenario_id = "feedfacefeedface";
    nlohmann::json j = s;
    EXPECT_EQ(j.at("scenario_id").get<std::string>(), s.scenario_id());
    EXPECT_EQ(j.at("regime_id").get<std::string>(), s.regime.regime_id());

    auto back = j.get<ScenarioDefinition>();
    EXPECT_EQ(back.scenario_id(), s.scenario_id());
    ASSERT_TRUE(back.parent_scenario_id.has_value());
    EXPECT_EQ(*back.parent_scenario_id, "feedfacefeedface");
}

TEST_F(ScenarioDefinitionTest, MissingRegimeIsClassified) {
    nlohmann::json j = {
        {"name", "Inflation Shock 2022 rerun"},
        {"start_date", "2022-01-01"},
        {"end_date", "2022-03-31"},
        {"symbols", {"MSFT"}},
        {"param_sets", {{"balanced", {{"trust_threshold", 0.7}}}}},
    };
    auto s = j.get<ScenarioDefinition>();
    EXPECT_EQ(s.regime.regime_id(), "high_down_normal_tightening");
    EXPECT_DOUBLE_EQ(s.param_sets.at("balanced").trust_threshold, 0.7);
    EXPECT_FALSE(s.parent_scenario_id.has_value());
}

TEST_F(ScenarioDefinitionTest, UnknownKeysAreRejected) {
    nlohmann::json j = make_scenario();
    j["leverage"] = 3;
    EXPECT_THROW(j.get<ScenarioDefinition>(), InvalidScenarioError);
}

TEST_F(ScenarioDefinitionTest, MissingFieldsAreRejected) {
    nlohmann::json j = make_scenario();
    j.erase("start_date");
    EXPECT_THROW(j.get<ScenarioDefinition>(), InvalidScenarioError);
    j = make_scenario();
    j.erase("param_sets");
    EXPECT_THROW(j.get<ScenarioDefinition>(), InvalidScenarioError);
}
