#pragma once

#include "memory/insight.hpp"
#include "research/content_hash.hpp"
#include "research/experiment_proposal.hpp"
#include "research/regime_ontology.hpp"
#include "research/trading_params.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

// Tested values per parameter name.
using ParameterCoverage = std::map<std::string, std::set<double>>;

// ---------------------------------------------------------------------------
// ProposalConfig - gain bands per source tier and the parameter grid
// ---------------------------------------------------------------------------
struct ProposalConfig {
    // (a) unexplored regimes
    double regime_base = 0.90;
    double regime_testable_bonus = 0.08;
    double regime_extreme_bonus = 0.02;
    size_t untestable_regime_limit = 2;  // regimes without a historical window
    // (b) weak / preliminary insights
    double failure_probe_base = 0.80;
    double uncertainty_base = 0.70;
    double weak_tier_max = 0.89;
    // (c) parameter gaps
    double gap_base = 0.50;
    double gap_span = 0.19;
    // (d) re-verification of strong insights
    double reverify_base = 0.30;
    double reverify_span = 0.19;

    std::map<std::string, std::vector<double>> parameter_grid = {
        {"trust_threshold", {0.50, 0.55, 0.60, 0.65, 0.70, 0.75, 0.80, 0.85, 0.90}},
        {"min_confidence", {0.60, 0.70, 0.75, 0.80, 0.90}},
        {"stop_loss", {0.03, 0.05, 0.08, 0.10}},
        {"take_profit", {0.10, 0.15, 0.20, 0.30}},
    };
    ConfidenceFormula formula;
};

namespace proposal {

inline int priority_for(double gain) {
    return std::clamp(static_cast<int>(std::lround(gain * 10.0)), 1, 10);
}

inline std::string format(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%g", v);
    return std::string(buf);
}

// First canonical window regime the insight has not been observed in.
inline std::optional<RegimeClassification> uncovered_window_regime(const StrategyInsight& s) {
    const auto& covered = s.confidence_meta.regime_coverage;
    for (const auto& w : regime::canonical_windows()) {
        if (std::find(covered.begin(), covered.end(), w.regime.regime_id()) == covered.end()) {
            return w.regime;
        }
    }
    return std::nullopt;
}

}  // namespace proposal

// ---------------------------------------------------------------------------
// ProposalAgent - ranks next experiments by expected information gain.
// Expected return never enters the score.
// ---------------------------------------------------------------------------
class ProposalAgent {
public:
    explicit ProposalAgent(const ProposalConfig& config = ProposalConfig{}) : config_(config) {}

    std::vector<ExperimentProposal> generate(const std::vector<std::string>& existing_scenario_ids,
                                             const std::vector<StrategyInsight>& insights,
                                             const regime::Coverage& coverage,
                                             size_t limit,
                                             const ParameterCoverage& tested = {}) const {
        std::vector<ExperimentProposal> out;
        propose_unexplored_regimes(coverage, out);
        propose_weak_insights(insights, out);
        propose_parameter_gaps(tested, existing_scenario_ids.size(), out);
        propose_reverification(insights, out);

        std::sort(out.begin(), out.end(), [](const ExperimentProposal& a, const ExperimentProposal& b) {
            if (a.expected_info_gain != b.expected_info_gain) {
                return a.expected_info_gain > b.expected_info_gain;
            }
            return a.proposal_id < b.proposal_id;
        });
        if (out.size() > limit) out.resize(limit);
        return out;
    }

    const ProposalConfig& config() const { return config_; }

private:
    static void finish(ExperimentProposal& p, double gain) {
        p.expected_info_gain = std::clamp(gain, 0.0, 1.0);
        p.priority = proposal::priority_for(p.expected_info_gain);
        p.proposal_id = content_hash::short_id(std::string(proposal_type_str(p.type)) + "|" + p.target);
    }

    void propose_unexplored_regimes(const regime::Coverage& coverage,
                                    std::vector<ExperimentProposal>& out) const {
        auto candidates = regime::unexplored(coverage);
        std::stable_partition(candidates.begin(), candidates.end(),
                              [](const RegimeClassification& rc) { return rc.is_extreme(); });
        size_t untestable = 0;
        for (const auto& rc : candidates) {
            bool testable = !regime::windows_for(rc).empty();
            if (!testable && untestable++ >= config_.untestable_regime_limit) continue;
            ExperimentProposal p;
            p.type = ProposalType::REGIME_TEST;
            p.target = "Test parameter sets in regime " + rc.regime_id();
            p.rationale = testable ? "No scenarios cover this regime; a historical window exists"
                                   : "No scenarios cover this regime";
            p.target_regime = rc;
            double gain = config_.regime_base;
            if (testable) gain += config_.regime_testable_bonus;
            if (rc.is_extreme()) gain += config_.regime_extreme_bonus;
            finish(p, gain);
            out.push_back(p);
        }
    }

    void propose_weak_insights(const std::vector<StrategyInsight>& insights,
                               std::vector<ExperimentProposal>& out) const {
        for (const auto& s : insights) {
            bool strong = insight::evidence_status(s, config_.formula) == EvidenceStatus::STRONG;
            if (strong && !s.is_weak) continue;

            ExperimentProposal p;
            p.insight_ids = {s.insight_id};
            p.target_regime = proposal::uncovered_window_regime(s);
            if (!s.parameter_name.empty()) {
                p.parameter_name = s.parameter_name;
                p.parameter_value = s.parameter_value;
            }
            double gain;
            if (s.type == InsightType::FAILURE_MODE) {
                p.type = ProposalType::HYPOTHESIS_TEST;
                p.target = "Probe failure mode: " + s.description;
                p.rationale = "Failure mode with preliminary evidence ("
                              + std::to_string(s.confidence_meta.num_supporting_scenarios)
                              + " scenarios)";
                gain = config_.failure_probe_base + 0.09 * (1.0 - s.confidence);
            } else {
                p.type = ProposalType::UNCERTAINTY_REDUCTION;
                p.target = "Reduce uncertainty: " + s.description;
                p.rationale = "Confidence " + proposal::format(s.confidence) + " across "
                              + std::to_string(s.confidence_meta.regime_coverage.size())
                              + " regimes";
                gain = config_.uncertainty_base + 0.3 * (0.6 - s.confidence);
            }
            finish(p, std::clamp(gain, config_.uncertainty_base, config_.weak_tier_max));
            out.push_back(p);
        }
    }

    void propose_parameter_gaps(const ParameterCoverage& tested, size_t scenario_count,
                                std::vector<ExperimentProposal>& out) const {
        // Fewer experiments so far make each gap slightly more informative.
        double density = 1.0 / (1.0 + static_cast<double>(scenario_count) / 10.0);
        for (const auto& [param, grid] : config_.parameter_grid) {
            if (grid.empty()) continue;
            auto [lo, hi] = std::minmax_element(grid.begin(), grid.end());
            double span = std::max(*hi - *lo, 1e-9);
            auto it = tested.find(param);
            for (double v : grid) {
                double nearest = span;
                if (it != tested.end()) {
                    for (double t : it->second) nearest = std::min(nearest, std::abs(t - v));
                }
                if (nearest < 1e-6) continue;
                double gap_score = std::clamp(nearest / span, 0.0, 1.0);

                ExperimentProposal p;
                p.type = ProposalType::PARAMETER_GAP;
                p.target = "Test " + param + " = " + proposal::format(v);
                p.rationale = "Untested grid value; nearest tested value is "
                              + proposal::format(nearest) + " away";
                p.parameter_name = param;
                p.parameter_value = v;
                finish(p, config_.gap_base + config_.gap_span * gap_score * (0.5 + 0.5 * density));
                out.push_back(p);
            }
        }
    }

    void propose_reverification(const std::vector<StrategyInsight>& insights,
                                std::vector<ExperimentProposal>& out) const {
        for (const auto& s : insights) {
            bool strong = insight::evidence_status(s, config_.formula) == EvidenceStatus::STRONG;
            if (!strong || s.is_weak) continue;
            auto target = proposal::uncovered_window_regime(s);
            if (!target) continue;

            ExperimentProposal p;
            p.type = ProposalType::HYPOTHESIS_TEST;
            p.target = "Re-verify in " + target->regime_id() + ": " + s.description;
            p.rationale = "Strong insight not yet observed in this regime";
            p.insight_ids = {s.insight_id};
            p.target_regime = target;
            if (!s.parameter_name.empty()) {
                p.parameter_name = s.parameter_name;
                p.parameter_value = s.parameter_value;
            }
            finish(p, config_.reverify_base + config_.reverify_span * (1.0 - s.confidence));
            out.push_back(p);
        }
    }

    ProposalConfig config_;
};
