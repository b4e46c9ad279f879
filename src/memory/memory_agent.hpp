#pragma once

#include "analysis/meta_evaluator.hpp"
#include "memory/insight.hpp"
#include "memory/memory_store.hpp"
#include "research/errors.hpp"
#include "research/experiment_proposal.hpp"
#include "research/regime_ontology.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <map>
#include <optional>
#include <string>
#include <vector>

struct MemoryAgentConfig {
    ConfidenceFormula formula;
    int max_commit_attempts = 100;
    double min_return_effect = 1.0;  // pts; smaller deltas do not create insights
    int min_regime_failures = 2;     // failures in one regime before it becomes an insight
};

// ---------------------------------------------------------------------------
// MemoryAgent - turns evaluator output into confidence-scored insights.
// All writes go through MemoryStore; evidence is only ever appended.
// ---------------------------------------------------------------------------
class MemoryAgent {
public:
    explicit MemoryAgent(MemoryStore& store, const MemoryAgentConfig& config = MemoryAgentConfig{})
        : store_(store), config_(config) {}

    // New insight, or new supporting evidence for an existing one with the
    // same type and description.
    StrategyInsight add_insight(InsightType type,
                                const std::string& description,
                                const std::vector<std::string>& scenario_ids,
                                const std::vector<std::string>& regime_ids,
                                const std::map<std::string, double>& evidence_metrics = {},
                                double parameter_robustness = 0.0,
                                const std::string& parameter_name = "",
                                double parameter_value = 0.0) {
        std::string id = insight::make_id(type, description);
        return mutate(id, [&](const std::optional<StrategyInsight>& current) {
            StrategyInsight s;
            if (current) {
                s = *current;
            } else {
                s.insight_id = id;
                s.type = type;
                s.description = description;
                s.parameter_name = parameter_name;
                s.parameter_value = parameter_value;
            }
            for (const auto& sid : scenario_ids) insight::append_unique(s.supporting_scenario_ids, sid);
            for (const auto& rid : regime_ids) {
                insight::append_unique(s.confidence_meta.regime_coverage, rid);
            }
            for (const auto& [k, v] : evidence_metrics) {
                if (std::isfinite(v)) s.evidence_metrics[k] = v;
            }
            s.confidence_meta.parameter_robustness =
                std::max(s.confidence_meta.parameter_robustness,
                         std::clamp(parameter_robustness, 0.0, 1.0));
            return s;
        });
    }

    // Record one more observation. A contradiction from a new scenario
    // increments the count and records the scenario; supporting evidence is never removed. Robustness
    // keeps the largest value seen, as in add_insight. Returns nullopt for an
    // unknown id.
    std::optional<StrategyInsight> update_confidence(
            const std::string& insight_id,
            const std::string& scenario_id,
            const std::string& regime_id,
            bool contradicts,
            std::optional<double> parameter_robustness = std::nullopt) {
        if (!store_.get(insight_id)) return std::nullopt;
        return mutate(insight_id, [&](const std::optional<StrategyInsight>& current) {
            StrategyInsight s = *current;
            if (contradicts) {
                // One contradiction per scenario.
                if (insight::append_unique(s.contradicting_scenario_ids, scenario_id)) {
                    ++s.confidence_meta.contradiction_count;
                }
                s.confidence_meta.has_been_contradicted = true;
            } else {
                insight::append_unique(s.supporting_scenario_ids, scenario_id);
                insight::append_unique(s.confidence_meta.regime_coverage, regime_id);
            }
            if (parameter_robustness) {
                s.confidence_meta.parameter_robustness =
                    std::max(s.confidence_meta.parameter_robustness,
                             std::clamp(*parameter_robustness, 0.0, 1.0));
            }
            return s;
        });
    }

    EvidenceStatus evidence_status(const StrategyInsight& s) const {
        return insight::evidence_status(s, config_.formula);
    }

    std::vector<StrategyInsight> insights() const { return store_.all(); }

    std::vector<StrategyInsight> weak_insights() const {
        std::vector<StrategyInsight> out;
        for (const auto& s : store_.all()) {
            if (s.is_weak || evidence_status(s) == EvidenceStatus::PRELIMINARY) out.push_back(s);
        }
        return out;
    }

    // Directional parameter insights from a comparison. When no parameter
    // differs, a regime heuristic is recorded instead. Returns touched ids.
    std::vector<std::string> ingest_comparison(const DeltaMetrics& d) {
        std::vector<std::string> touched;
        if (!d.comparable) return touched;
        double effect = d.aggregate.return_delta;
        if (std::abs(effect) <= config_.min_return_effect) return touched;

        std::vector<std::string> scenario_ids = {d.scenario_a_id, d.scenario_b_id};
        std::map<std::string, double> metrics = {
            {"return_delta", effect},
            {"sharpe_delta", d.aggregate.sharpe_delta},
            {"drawdown_delta", d.aggregate.drawdown_delta},
            {"win_rate_delta", d.aggregate.win_rate_delta},
        };

        // Direction of change per parameter; mixed directions are ambiguous.
        std::map<std::string, int> direction;
        std::map<std::string, double> new_value;
        for (const auto& pd : d.parameter_diffs) {
            int dir = pd.value_b > pd.value_a ? 1 : -1;
            auto it = direction.find(pd.parameter);
            if (it == direction.end()) {
                direction[pd.parameter] = dir;
                new_value[pd.parameter] = pd.value_b;
            } else if (it->second != dir) {
                it->second = 0;
            }
        }

        for (const auto& [param, dir] : direction) {
            if (dir == 0) continue;
            bool improves = (dir > 0) == (effect > 0);
            std::string holds = "Raising " + param + (improves ? " improves" : " hurts") + " returns";
            std::string opposite = "Raising " + param + (improves ? " hurts" : " improves") + " returns";
            InsightType type = improves ? InsightType::WINNING_PATTERN : InsightType::FAILURE_MODE;
            InsightType opposite_type = improves ? InsightType::FAILURE_MODE
                                                 : InsightType::WINNING_PATTERN;

            std::string opposite_id = insight::make_id(opposite_type, opposite);
            auto contradicted = update_confidence(opposite_id, d.scenario_b_id, d.regime_b_id, true);
            if (contradicted) touched.push_back(opposite_id);

            auto s = add_insight(type, holds, scenario_ids, d.regime_ids, metrics,
                                 d.robustness, param, new_value[param]);
            touched.push_back(s.insight_id);
        }

        if (direction.empty() && !d.regime_a_id.empty() && d.regime_a_id != d.regime_b_id) {
            for (const auto& [label, md] : d.by_param_set) {
                if (std::abs(md.return_delta) <= config_.min_return_effect) continue;
                const std::string& better = md.return_delta > 0 ? d.regime_b_id : d.regime_a_id;
                const std::string& worse = md.return_delta > 0 ? d.regime_a_id : d.regime_b_id;
                std::string holds = label + " parameters do better in " + better + " than in " + worse;
                std::string opposite = label + " parameters do better in " + worse + " than in " + better;

                std::string opposite_id = insight::make_id(InsightType::REGIME_HEURISTIC, opposite);
                auto contradicted = update_confidence(opposite_id, d.scenario_b_id, d.regime_b_id, true);
                if (contradicted) touched.push_back(opposite_id);

                auto s = add_insight(InsightType::REGIME_HEURISTIC, holds, scenario_ids,
                                     d.regime_ids, {{"return_delta", md.return_delta}},
                                     d.robustness);
                touched.push_back(s.insight_id);
            }
        }
        return touched;
    }

    // Cliffs and sign changes become failure-mode insights anchored at the
    // parameter value where performance breaks. Each is supported only by the
    // scenarios and regimes of the two parameter groups it separates.
    std::vector<std::string> ingest_boundaries(const BoundaryReport& rep) {
        std::vector<std::string> touched;
        for (const auto& c : rep.cliffs) {
            std::string desc = "Performance cliff in " + rep.parameter + " when moving "
                               + (c.direction > 0 ? "up" : "down") + " to " + format(c.to_value);
            auto s = add_insight(InsightType::FAILURE_MODE, desc, c.scenario_ids, c.regime_ids,
                                 {{"drop", c.drop}, {"z_score", c.z_score},
                                  {"from_value", c.from_value}, {"to_value", c.to_value}},
                                 0.0, rep.parameter, c.to_value);
            touched.push_back(s.insight_id);
        }
        for (const auto& t : rep.thresholds) {
            std::string desc = "Returns turn negative when " + rep.parameter + " moves "
                               + (t.direction > 0 ? "up" : "down") + " to "
                               + format(t.first_negative_value);
            auto s = add_insight(InsightType::FAILURE_MODE, desc, t.scenario_ids, t.regime_ids,
                                 {{"last_positive_value", t.last_positive_value},
                                  {"first_negative_value", t.first_negative_value},
                                  {"first_negative_return", t.first_negative_return}},
                                 0.0, rep.parameter, t.first_negative_value);
            touched.push_back(s.insight_id);
        }
        return touched;
    }

    // Boundaries of every high-sensitivity parameter plus regimes where
    // failures cluster.
    std::vector<std::string> ingest_landscape(const SensitivityLandscape& land) {
        std::vector<std::string> touched;
        for (const auto& [param, rep] : land.boundaries) {
            auto ids = ingest_boundaries(rep);
            touched.insert(touched.end(), ids.begin(), ids.end());
        }
        for (const auto& [regime_id, count] : land.failures_by_regime) {
            if (count < config_.min_regime_failures) continue;
            std::vector<std::string> failing;
            for (const auto& f : land.failure_modes) {
                if (f.regime_id == regime_id) insight::append_unique(failing, f.scenario_id);
            }
            auto s = add_insight(InsightType::FAILURE_MODE,
                                 "Losses beyond the failure threshold cluster in " + regime_id,
                                 failing, {regime_id},
                                 {{"failure_count", static_cast<double>(count)}});
            touched.push_back(s.insight_id);
        }
        return touched;
    }

    // Hints for the generator from parameter-anchored insights, least
    // confident first.
    std::vector<GenerationHints> insights_for_generation(size_t limit = 3) const {
        auto all = store_.all();
        std::vector<const StrategyInsight*> anchored;
        for (const auto& s : all) {
            if (!s.parameter_name.empty()) anchored.push_back(&s);
        }
        std::stable_sort(anchored.begin(), anchored.end(),
                         [](const StrategyInsight* a, const StrategyInsight* b) {
                             return a->confidence < b->confidence;
                         });
        std::vector<GenerationHints> out;
        for (const auto* s : anchored) {
            if (out.size() >= limit) break;
            GenerationHints h;
            h.parameter_name = s->parameter_name;
            h.center_value = s->parameter_value;
            h.insight_ids = {s->insight_id};
            for (const auto& rid : s->confidence_meta.regime_coverage) {
                h.covered_regimes.push_back(regime::parse_regime_id(rid));
            }
            out.push_back(h);
        }
        return out;
    }

    const MemoryAgentConfig& config() const { return config_; }

private:
    static std::string format(double v) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%g", v);
        return std::string(buf);
    }

    // Optimistic read-modify-commit, retried on a concurrent writer.
    template <typename Fn>
    StrategyInsight mutate(const std::string& insight_id, Fn fn) {
        for (int attempt = 1;; ++attempt) {
            auto current = store_.get(insight_id);
            int revision = current ? current->revision : 0;
            StrategyInsight next = fn(current);
            insight::refresh(next, config_.formula);
            try {
                return store_.commit(next, revision);
            } catch (const ConcurrentMutationConflict&) {
                if (attempt >= config_.max_commit_attempts) throw;
            }
        }
    }

    MemoryStore& store_;
    MemoryAgentConfig config_;
};
