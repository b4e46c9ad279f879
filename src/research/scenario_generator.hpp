#pragma once

#include "research/experiment_proposal.hpp"
#include "research/regime_ontology.hpp"
#include "research/scenario_definition.hpp"
#include "research/trading_params.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// GeneratorConfig - fixed grids. Nothing here is sampled.
// ---------------------------------------------------------------------------
struct GeneratorConfig {
    std::string baseline_name = "Baseline Suite";
    std::string baseline_description =
        "Baseline across multiple market regimes with standard parameter archetypes";
    std::string baseline_start = "2021-01-01";
    std::string baseline_end = "2023-12-31";
    std::vector<std::string> baseline_symbols = {"BTC-USD", "ETH-USD", "NVDA", "MSFT"};
    std::vector<double> trust_sweep = {0.50, 0.60, 0.70, 0.80};
    int focused_steps = 2;  // grid points on each side of a hinted value
};

namespace scenario_gen {

// Step between adjacent grid points when focusing on a hinted value.
inline double focus_step(const std::string& param) {
    if (param == "trust_threshold" || param == "min_confidence") return 0.05;
    if (param == "max_position_size") return 0.025;
    if (param == "stop_loss")         return 0.01;
    if (param == "take_profit")       return 0.025;
    if (param == "cooldown_period")   return 1.0;
    throw std::invalid_argument("unknown parameter '" + param + "'");
}

// Round to 1e-6 so grid arithmetic does not leak float noise into ids.
inline double snap(double v) {
    return std::round(v * 1e6) / 1e6;
}

inline std::string format_value(const std::string& param, double v) {
    if (param == "cooldown_period") return std::to_string(std::lround(v));
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4g", v);
    return std::string(buf);
}

inline std::string param_label(const std::string& param) {
    if (param == "trust_threshold")   return "Trust";
    if (param == "min_confidence")    return "MinConf";
    if (param == "max_position_size") return "MaxPos";
    if (param == "stop_loss")         return "Stop";
    if (param == "take_profit")       return "Take";
    if (param == "cooldown_period")   return "Cooldown";
    return param;
}

inline std::map<std::string, TradingParams> with_parameter(
        const std::map<std::string, TradingParams>& sets,
        const std::string& param, double value) {
    auto out = sets;
    for (auto& [label, params] : out) {
        trading_params::set_parameter(params, param, value);
    }
    return out;
}

}  // namespace scenario_gen

// ---------------------------------------------------------------------------
// ScenarioGenerator - baseline, sweeps, regime windows and hinted variants
// ---------------------------------------------------------------------------
class ScenarioGenerator {
public:
    explicit ScenarioGenerator(const GeneratorConfig& config = GeneratorConfig{})
        : config_(config) {}

    ScenarioDefinition generate_baseline() const {
        ScenarioDefinition s;
        s.name = config_.baseline_name;
        s.description = config_.baseline_description;
        s.start_date = config_.baseline_start;
        s.end_date = config_.baseline_end;
        s.symbols = config_.baseline_symbols;
        s.param_sets = trading_params::archetypes();
        s.regime = regime::classify(s.name, s.start_date, s.end_date, s.description);
        scenario::validate(s);
        return s;
    }

    // Without hints: trust sweep plus one sibling per canonical regime window.
    // With hints: a focused grid around the hinted value plus stress tests in
    // windows whose regime the hinted insight has not covered.
    std::vector<ScenarioDefinition> generate_variants(
            const ScenarioDefinition& base,
            const std::optional<GenerationHints>& hints = std::nullopt) const {
        std::vector<ScenarioDefinition> out;
        if (hints && !hints->empty()) {
            append_focused_grid(base, *hints, out);
            append_stress_tests(base, *hints, out);
        } else {
            for (double t : config_.trust_sweep) {
                append_parameter_variant(base, "trust_threshold", t, out);
            }
            for (const auto& w : regime::canonical_windows()) {
                append_window_variant(base, w, base.param_sets, w.name, out);
            }
        }
        return dedupe(base, out);
    }

    // Translate a ranked proposal into concrete scenarios. May return an empty
    // list when no historical window matches the requested regime.
    std::vector<ScenarioDefinition> generate_from_proposal(
            const ScenarioDefinition& base, const ExperimentProposal& proposal) const {
        std::vector<ScenarioDefinition> out;
        if (proposal.target_regime) {
            for (const auto& w : regime::windows_for(*proposal.target_regime)) {
                auto sets = base.param_sets;
                std::string name = w.name;
                if (proposal.parameter_name && proposal.parameter_value) {
                    sets = scenario_gen::with_parameter(sets, *proposal.parameter_name,
                                                        *proposal.parameter_value);
                    name += " - " + scenario_gen::param_label(*proposal.parameter_name) + " "
                            + scenario_gen::format_value(*proposal.parameter_name,
                                                         *proposal.parameter_value);
                }
                append_window_variant(base, w, sets, name, out);
            }
            return dedupe(base, out);
        }
        if (proposal.parameter_name && proposal.parameter_value) {
            if (proposal.type == ProposalType::PARAMETER_GAP) {
                append_parameter_variant(base, *proposal.parameter_name,
                                         *proposal.parameter_value, out);
                return dedupe(base, out);
            }
            GenerationHints hints;
            hints.parameter_name = *proposal.parameter_name;
            hints.center_value = *proposal.parameter_value;
            hints.covered_regimes.push_back(base.regime);
            hints.insight_ids = proposal.insight_ids;
            return generate_variants(base, hints);
        }
        for (const auto& w : regime::canonical_windows()) {
            append_window_variant(base, w, base.param_sets, w.name, out);
        }
        return dedupe(base, out);
    }

    const GeneratorConfig& config() const { return config_; }

private:
    void append_parameter_variant(const ScenarioDefinition& base, const std::string& param,
                                  double value, std::vector<ScenarioDefinition>& out) const {
        auto [lo, hi] = trading_params::parameter_bounds(param);
        value = scenario_gen::snap(std::clamp(value, lo, hi));

        ScenarioDefinition s = base;
        s.name = base.name + " - " + scenario_gen::param_label(param) + " "
                 + scenario_gen::format_value(param, value);
        s.description = base.description + " (" + param + " = "
                        + scenario_gen::format_value(param, value) + ")";
        s.param_sets = scenario_gen::with_parameter(base.param_sets, param, value);
        s.parent_scenario_id = base.scenario_id();
        scenario::validate(s);
        out.push_back(s);
    }

    void append_window_variant(const ScenarioDefinition& base, const RegimeWindow& w,
                               const std::map<std::string, TradingParams>& sets,
                               const std::string& name,
                               std::vector<ScenarioDefinition>& out) const {
        ScenarioDefinition s;
        s.name = name;
        s.description = w.description;
        s.start_date = w.start_date;
        s.end_date = w.end_date;
        s.symbols = base.symbols;
        s.param_sets = sets;
        s.regime = w.regime;
        s.generator_version = base.generator_version;
        s.parent_scenario_id = base.scenario_id();
        scenario::validate(s);
        out.push_back(s);
    }

    void append_focused_grid(const ScenarioDefinition& base, const GenerationHints& hints,
                             std::vector<ScenarioDefinition>& out) const {
        double step = scenario_gen::focus_step(hints.parameter_name);
        for (int k = -config_.focused_steps; k <= config_.focused_steps; ++k) {
            append_parameter_variant(base, hints.parameter_name,
                                     hints.center_value + k * step, out);
        }
    }

    void append_stress_tests(const ScenarioDefinition& base, const GenerationHints& hints,
                             std::vector<ScenarioDefinition>& out) const {
        auto [lo, hi] = trading_params::parameter_bounds(hints.parameter_name);
        double value = scenario_gen::snap(std::clamp(hints.center_value, lo, hi));
        auto sets = scenario_gen::with_parameter(base.param_sets, hints.parameter_name, value);
        for (const auto& w : regime::canonical_windows()) {
            bool covered = std::find(hints.covered_regimes.begin(), hints.covered_regimes.end(),
                                     w.regime) != hints.covered_regimes.end();
            if (covered) continue;
            std::string name = w.name + " - " + scenario_gen::param_label(hints.parameter_name)
                               + " " + scenario_gen::format_value(hints.parameter_name, value);
            append_window_variant(base, w, sets, name, out);
        }
    }

    // Drop duplicates (and the base itself) keeping first occurrence.
    static std::vector<ScenarioDefinition> dedupe(const ScenarioDefinition& base,
                                                  const std::vector<ScenarioDefinition>& in) {
        std::set<std::string> seen = {base.scenario_id()};
        std::vector<ScenarioDefinition> out;
        for (const auto& s : in) {
            if (seen.insert(s.scenario_id()).second) out.push_back(s);
        }
        return out;
    }

    GeneratorConfig config_;
};
