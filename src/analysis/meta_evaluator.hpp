#pragma once

#include "analysis/descriptive_stats.hpp"
#include "backtest/scenario_result.hpp"
#include "research/trading_params.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <map>
#include <set>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// EvaluatorConfig - thresholds in percentage points unless noted
// ---------------------------------------------------------------------------
struct EvaluatorConfig {
    double return_threshold = 1.0;
    double sharpe_threshold = 0.2;   // Sharpe units
    double drawdown_threshold = 2.0;
    double sensitivity_range_threshold = 10.0;
    double sensitivity_std_threshold = 5.0;
    double cliff_threshold = 5.0;
    double cliff_z_threshold = 2.0;  // applied when both sides have spread
    double failure_threshold = -10.0;
};

// ---------------------------------------------------------------------------
// Comparison types
// ---------------------------------------------------------------------------
struct MetricSnapshot {
    int result_count = 0;
    double avg_return = 0.0;
    double avg_sharpe = std::numeric_limits<double>::quiet_NaN();  // valid values only
    double avg_drawdown = 0.0;
    double avg_win_rate = 0.0;
    int trade_count = 0;
    int invalid_sharpe_count = 0;
};

struct MetricDelta {
    double return_delta = 0.0;
    double sharpe_delta = std::numeric_limits<double>::quiet_NaN();
    double drawdown_delta = 0.0;
    double win_rate_delta = 0.0;
    int trade_count_delta = 0;
};

struct ParameterDiff {
    std::string param_set;
    std::string parameter;
    double value_a = 0.0;
    double value_b = 0.0;
};

struct DeltaMetrics {
    std::string scenario_a_id;
    std::string scenario_b_id;
    MetricSnapshot a;
    MetricSnapshot b;
    MetricDelta aggregate;  // b - a
    std::map<std::string, MetricDelta> by_symbol;
    std::map<std::string, MetricDelta> by_param_set;
    std::map<std::string, MetricDelta> by_regime;
    std::vector<std::string> divergent_symbols;
    std::vector<ParameterDiff> parameter_diffs;
    std::vector<std::string> regime_ids;  // regimes present on either side
    std::string regime_a_id;              // regime of the first result on each side
    std::string regime_b_id;
    std::string dominant_dependency;      // breakdown key with the largest |return delta|
    double dominant_delta = 0.0;
    double robustness = 0.0;              // share of symbols agreeing with the aggregate sign
    std::string stability;                // robust / regime-dependent / fragile
    std::vector<std::string> observations;
    bool comparable = false;
};

// ---------------------------------------------------------------------------
// Sensitivity and boundary types
// ---------------------------------------------------------------------------
struct ParameterGroup {
    double value = 0.0;
    double mean_return = 0.0;
    double std_return = 0.0;
    int count = 0;
    std::vector<double> returns;
    std::vector<std::string> scenario_ids;  // sorted, unique
    std::vector<std::string> regime_ids;    // sorted, unique
};

struct SensitivityReport {
    std::string parameter;
    std::vector<ParameterGroup> groups;  // ascending by value
    double range = 0.0;
    double stddev = 0.0;
    bool high_sensitivity = false;
    bool sufficient_variation = false;
    std::string reason;
};

struct PerformanceCliff {
    double from_value = 0.0;
    double to_value = 0.0;
    double from_return = 0.0;
    double to_return = 0.0;
    double drop = 0.0;
    double z_score = std::numeric_limits<double>::quiet_NaN();
    int direction = 1;  // +1: drop as the parameter increases, -1: as it decreases
    std::vector<std::string> scenario_ids;  // evidence: results at from_value and to_value
    std::vector<std::string> regime_ids;
};

struct FailureThreshold {
    double last_positive_value = 0.0;
    double first_negative_value = 0.0;
    double last_positive_return = 0.0;
    double first_negative_return = 0.0;
    int direction = 1;
    std::vector<std::string> scenario_ids;
    std::vector<std::string> regime_ids;
};

struct BoundaryReport {
    std::string parameter;
    std::vector<ParameterGroup> points;
    std::vector<PerformanceCliff> cliffs;
    std::vector<FailureThreshold> thresholds;
    bool boundary_detected = false;
    std::string reason;
};

struct FailureMode {
    std::string scenario_id;
    std::string symbol;
    std::string param_set_name;
    std::string regime_id;
    TradingParams params;
    double total_return_pct = 0.0;
    double max_drawdown_pct = 0.0;
    double win_rate = 0.0;
    int trade_count = 0;
};

struct SensitivityLandscape {
    std::vector<SensitivityReport> high_sensitivity;
    std::map<std::string, BoundaryReport> boundaries;
    std::vector<FailureMode> failure_modes;
    std::map<std::string, int> failures_by_regime;
    int total_failures = 0;
};

struct AggregateMetrics {
    int result_count = 0;
    int completed_count = 0;
    int skipped_count = 0;
    double completion_rate = 0.0;
    DescriptiveStats returns;
    DescriptiveStats sharpe;
    DescriptiveStats drawdown;
    int invalid_sharpe_count = 0;
};

namespace meta_eval {

inline std::string fmt(const char* format, double v) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), format, v);
    return std::string(buf);
}

inline double snap(double v) {
    return std::round(v * 1e6) / 1e6;
}

inline std::vector<const ScenarioResult*> completed(const std::vector<ScenarioResult>& results) {
    std::vector<const ScenarioResult*> out;
    for (const auto& r : results) {
        if (!r.skipped) out.push_back(&r);
    }
    return out;
}

inline MetricSnapshot snapshot(const std::vector<const ScenarioResult*>& rs) {
    MetricSnapshot s;
    s.result_count = static_cast<int>(rs.size());
    if (rs.empty()) return s;
    std::vector<double> rets, sharpes, dds, wins;
    for (const auto* r : rs) {
        rets.push_back(r->total_return_pct);
        sharpes.push_back(backtest_util::valid_sharpe_or_nan(*r));
        dds.push_back(r->max_drawdown_pct);
        wins.push_back(r->win_rate);
        s.trade_count += r->trade_count;
    }
    auto sharpe_stats = stats::describe(sharpes);
    s.avg_return = stats::mean(rets);
    s.avg_sharpe = sharpe_stats.mean;
    s.invalid_sharpe_count = sharpe_stats.invalid_count;
    s.avg_drawdown = stats::mean(dds);
    s.avg_win_rate = stats::mean(wins);
    return s;
}

inline MetricDelta delta(const MetricSnapshot& a, const MetricSnapshot& b) {
    MetricDelta d;
    d.return_delta = b.avg_return - a.avg_return;
    d.sharpe_delta = b.avg_sharpe - a.avg_sharpe;  // NaN if either side had no valid Sharpe
    d.drawdown_delta = b.avg_drawdown - a.avg_drawdown;
    d.win_rate_delta = b.avg_win_rate - a.avg_win_rate;
    d.trade_count_delta = b.trade_count - a.trade_count;
    return d;
}

template <typename KeyFn>
std::map<std::string, MetricDelta> breakdown(const std::vector<const ScenarioResult*>& a,
                                             const std::vector<const ScenarioResult*>& b,
                                             KeyFn key) {
    std::map<std::string, std::vector<const ScenarioResult*>> ga, gb;
    for (const auto* r : a) ga[key(*r)].push_back(r);
    for (const auto* r : b) gb[key(*r)].push_back(r);
    std::map<std::string, MetricDelta> out;
    for (const auto& [k, rs] : ga) {
        auto it = gb.find(k);
        if (it == gb.end()) continue;
        out[k] = delta(snapshot(rs), snapshot(it->second));
    }
    return out;
}

// Same labels as regime stability classification: > 0.5 robust,
// >= 0.2 regime-dependent, otherwise fragile.
inline std::string classify_stability(double score) {
    if (score > 0.5) return "robust";
    if (score >= 0.2) return "regime-dependent";
    return "fragile";
}

inline void sort_unique(std::vector<std::string>& v) {
    std::sort(v.begin(), v.end());
    v.erase(std::unique(v.begin(), v.end()), v.end());
}

// Union of the scenario and regime ids behind two adjacent groups.
inline void merge_evidence(const ParameterGroup& a, const ParameterGroup& b,
                           std::vector<std::string>& scenario_ids,
                           std::vector<std::string>& regime_ids) {
    scenario_ids = a.scenario_ids;
    scenario_ids.insert(scenario_ids.end(), b.scenario_ids.begin(), b.scenario_ids.end());
    sort_unique(scenario_ids);
    regime_ids = a.regime_ids;
    regime_ids.insert(regime_ids.end(), b.regime_ids.begin(), b.regime_ids.end());
    sort_unique(regime_ids);
}

inline std::vector<ParameterGroup> group_by_parameter(
        const std::vector<const ScenarioResult*>& rs, const std::string& parameter) {
    std::map<double, ParameterGroup> groups;
    for (const auto* r : rs) {
        double v = snap(trading_params::parameter_value(r->params, parameter));
        auto& g = groups[v];
        g.value = v;
        g.returns.push_back(r->total_return_pct);
        g.scenario_ids.push_back(r->scenario_id);
        if (!r->regime_id.empty()) g.regime_ids.push_back(r->regime_id);
    }
    std::vector<ParameterGroup> out;
    for (auto& [v, g] : groups) {
        sort_unique(g.scenario_ids);
        sort_unique(g.regime_ids);
        g.count = static_cast<int>(g.returns.size());
        g.mean_return = stats::mean(g.returns);
        g.std_return = stats::population_std(g.returns);
        out.push_back(g);
    }
    return out;
}

}  // namespace meta_eval

// ---------------------------------------------------------------------------
// MetaEvaluator - read-only comparative analysis over immutable results
// ---------------------------------------------------------------------------
class MetaEvaluator {
public:
    explicit MetaEvaluator(const EvaluatorConfig& config = EvaluatorConfig{})
        : config_(config) {}

    DeltaMetrics compare(const std::vector<ScenarioResult>& results_a,
                         const std::vector<ScenarioResult>& results_b) const {
        DeltaMetrics d;
        if (!results_a.empty()) {
            d.scenario_a_id = results_a.front().scenario_id;
            d.regime_a_id = results_a.front().regime_id;
        }
        if (!results_b.empty()) {
            d.scenario_b_id = results_b.front().scenario_id;
            d.regime_b_id = results_b.front().regime_id;
        }

        auto a = meta_eval::completed(results_a);
        auto b = meta_eval::completed(results_b);
        d.a = meta_eval::snapshot(a);
        d.b = meta_eval::snapshot(b);

        std::set<std::string> regimes;
        for (const auto* r : a) regimes.insert(r->regime_id);
        for (const auto* r : b) regimes.insert(r->regime_id);
        d.regime_ids.assign(regimes.begin(), regimes.end());

        d.parameter_diffs = parameter_diffs(results_a, results_b);

        if (a.empty() || b.empty()) {
            d.observations.push_back("No completed results on one side; nothing to compare");
            return d;
        }
        d.comparable = true;
        d.aggregate = meta_eval::delta(d.a, d.b);
        d.by_symbol = meta_eval::breakdown(a, b, [](const ScenarioResult& r) { return r.symbol; });
        d.by_param_set = meta_eval::breakdown(a, b, [](const ScenarioResult& r) {
            return r.param_set_name;
        });
        d.by_regime = meta_eval::breakdown(a, b, [](const ScenarioResult& r) { return r.regime_id; });

        // Symbols moving against the aggregate, and how many agree with it.
        int agree = 0;
        for (const auto& [symbol, md] : d.by_symbol) {
            bool same_sign = (md.return_delta >= 0.0) == (d.aggregate.return_delta >= 0.0);
            if (same_sign) {
                ++agree;
            } else {
                d.divergent_symbols.push_back(symbol);
            }
        }
        if (!d.by_symbol.empty()) {
            d.robustness = static_cast<double>(agree) / static_cast<double>(d.by_symbol.size());
        }
        d.stability = meta_eval::classify_stability(d.robustness);

        for (const auto* group : {&d.by_symbol, &d.by_regime}) {
            for (const auto& [key, md] : *group) {
                if (std::abs(md.return_delta) > std::abs(d.dominant_delta)) {
                    d.dominant_delta = md.return_delta;
                    d.dominant_dependency = key;
                }
            }
        }

        d.observations = observations(d);
        return d;
    }

    SensitivityReport sensitivity(const std::vector<ScenarioResult>& results,
                                  const std::string& parameter) const {
        SensitivityReport rep;
        rep.parameter = parameter;
        rep.groups = meta_eval::group_by_parameter(meta_eval::completed(results), parameter);
        if (rep.groups.size() < 2) {
            rep.reason = "Insufficient parameter variation (need at least 2 distinct values)";
            return rep;
        }
        rep.sufficient_variation = true;
        std::vector<double> means;
        for (const auto& g : rep.groups) means.push_back(g.mean_return);
        auto [lo, hi] = std::minmax_element(means.begin(), means.end());
        rep.range = *hi - *lo;
        rep.stddev = stats::population_std(means);
        rep.high_sensitivity = rep.range > config_.sensitivity_range_threshold
                               || rep.stddev > config_.sensitivity_std_threshold;
        return rep;
    }

    // Every parameter that actually varies across the results.
    std::vector<SensitivityReport> sensitivity_all(const std::vector<ScenarioResult>& results) const {
        std::vector<SensitivityReport> out;
        for (const char* p : trading_params::PARAMETER_NAMES) {
            auto rep = sensitivity(results, p);
            if (rep.sufficient_variation) out.push_back(rep);
        }
        return out;
    }

    BoundaryReport failure_boundaries(const std::vector<ScenarioResult>& results,
                                      const std::string& parameter) const {
        BoundaryReport rep;
        rep.parameter = parameter;
        rep.points = meta_eval::group_by_parameter(meta_eval::completed(results), parameter);
        if (rep.points.size() < 2) {
            rep.reason = "Insufficient parameter variation (need at least 2 distinct values)";
            return rep;
        }

        for (size_t i = 1; i < rep.points.size(); ++i) {
            const auto& lo = rep.points[i - 1];
            const auto& hi = rep.points[i];

            double diff = hi.mean_return - lo.mean_return;
            if (std::abs(diff) > config_.cliff_threshold) {
                PerformanceCliff c;
                c.direction = diff < 0.0 ? 1 : -1;
                const auto& from = c.direction > 0 ? lo : hi;
                const auto& to = c.direction > 0 ? hi : lo;
                c.from_value = from.value;
                c.to_value = to.value;
                c.from_return = from.mean_return;
                c.to_return = to.mean_return;
                c.drop = from.mean_return - to.mean_return;
                c.z_score = stats::drop_z_score(from.returns, to.returns);
                meta_eval::merge_evidence(lo, hi, c.scenario_ids, c.regime_ids);
                if (std::isnan(c.z_score) || c.z_score > config_.cliff_z_threshold) {
                    rep.cliffs.push_back(c);
                }
            }

            bool crosses_down = lo.mean_return > 0.0 && hi.mean_return < 0.0;
            bool crosses_up = lo.mean_return < 0.0 && hi.mean_return > 0.0;
            if (crosses_down || crosses_up) {
                FailureThreshold t;
                t.direction = crosses_down ? 1 : -1;
                const auto& pos = crosses_down ? lo : hi;
                const auto& neg = crosses_down ? hi : lo;
                t.last_positive_value = pos.value;
                t.first_negative_value = neg.value;
                t.last_positive_return = pos.mean_return;
                t.first_negative_return = neg.mean_return;
                meta_eval::merge_evidence(lo, hi, t.scenario_ids, t.regime_ids);
                rep.thresholds.push_back(t);
            }
        }
        rep.boundary_detected = !rep.cliffs.empty() || !rep.thresholds.empty();
        if (!rep.boundary_detected) rep.reason = "No cliff or sign change between adjacent values";
        return rep;
    }

    std::vector<FailureMode> identify_failure_modes(const std::vector<ScenarioResult>& results) const {
        std::vector<FailureMode> out;
        for (const auto* r : meta_eval::completed(results)) {
            if (r->total_return_pct >= config_.failure_threshold) continue;
            FailureMode f;
            f.scenario_id = r->scenario_id;
            f.symbol = r->symbol;
            f.param_set_name = r->param_set_name;
            f.regime_id = r->regime_id;
            f.params = r->params;
            f.total_return_pct = r->total_return_pct;
            f.max_drawdown_pct = r->max_drawdown_pct;
            f.win_rate = r->win_rate;
            f.trade_count = r->trade_count;
            out.push_back(f);
        }
        return out;
    }

    SensitivityLandscape sensitivity_landscape(const std::vector<ScenarioResult>& results) const {
        SensitivityLandscape land;
        for (const auto& rep : sensitivity_all(results)) {
            if (!rep.high_sensitivity) continue;
            land.high_sensitivity.push_back(rep);
            land.boundaries[rep.parameter] = failure_boundaries(results, rep.parameter);
        }
        land.failure_modes = identify_failure_modes(results);
        for (const auto& f : land.failure_modes) ++land.failures_by_regime[f.regime_id];
        land.total_failures = static_cast<int>(land.failure_modes.size());
        return land;
    }

    AggregateMetrics aggregate(const std::vector<ScenarioResult>& results) const {
        AggregateMetrics agg;
        agg.result_count = static_cast<int>(results.size());
        std::vector<double> rets, sharpes, dds;
        for (const auto& r : results) {
            if (r.skipped) {
                ++agg.skipped_count;
                continue;
            }
            ++agg.completed_count;
            rets.push_back(r.total_return_pct);
            sharpes.push_back(backtest_util::valid_sharpe_or_nan(r));
            dds.push_back(r.max_drawdown_pct);
        }
        if (agg.result_count > 0) {
            agg.completion_rate = static_cast<double>(agg.completed_count) / agg.result_count;
        }
        agg.returns = stats::describe(rets);
        agg.sharpe = stats::describe(sharpes);
        agg.drawdown = stats::describe(dds);
        agg.invalid_sharpe_count = agg.sharpe.invalid_count;
        return agg;
    }

    const EvaluatorConfig& config() const { return config_; }

private:
    // Same-named parameter sets whose values differ.
    static std::vector<ParameterDiff> parameter_diffs(const std::vector<ScenarioResult>& a,
                                                      const std::vector<ScenarioResult>& b) {
        std::map<std::string, TradingParams> pa, pb;
        for (const auto& r : a) pa.emplace(r.param_set_name, r.params);
        for (const auto& r : b) pb.emplace(r.param_set_name, r.params);
        std::vector<ParameterDiff> out;
        for (const auto& [label, params_a] : pa) {
            auto it = pb.find(label);
            if (it == pb.end()) continue;
            for (const char* p : trading_params::PARAMETER_NAMES) {
                double va = trading_params::parameter_value(params_a, p);
                double vb = trading_params::parameter_value(it->second, p);
                if (meta_eval::snap(va) != meta_eval::snap(vb)) {
                    out.push_back(ParameterDiff{label, p, va, vb});
                }
            }
        }
        return out;
    }

    std::vector<std::string> observations(const DeltaMetrics& d) const {
        using meta_eval::fmt;
        std::vector<std::string> out;
        const auto& agg = d.aggregate;
        if (std::abs(agg.return_delta) > config_.return_threshold) {
            out.push_back(std::string(agg.return_delta > 0 ? "Average return improved by "
                                                            : "Average return declined by ")
                          + fmt("%.2f", std::abs(agg.return_delta)) + " pts ("
                          + fmt("%.2f", d.a.avg_return) + "% -> " + fmt("%.2f", d.b.avg_return) + "%)");
        }
        if (std::isfinite(agg.sharpe_delta) && std::abs(agg.sharpe_delta) > config_.sharpe_threshold) {
            out.push_back(std::string(agg.sharpe_delta > 0 ? "Sharpe improved by "
                                                            : "Sharpe declined by ")
                          + fmt("%.2f", std::abs(agg.sharpe_delta)));
        }
        if (std::abs(agg.drawdown_delta) > config_.drawdown_threshold) {
            out.push_back(std::string(agg.drawdown_delta > 0 ? "Max drawdown increased by "
                                                              : "Max drawdown reduced by ")
                          + fmt("%.2f", std::abs(agg.drawdown_delta)) + " pts");
        }
        for (const auto& pd : d.parameter_diffs) {
            out.push_back(pd.param_set + "." + pd.parameter + ": " + fmt("%g", pd.value_a)
                          + " -> " + fmt("%g", pd.value_b));
        }
        for (const auto& s : d.divergent_symbols) {
            out.push_back(s + " moved against the aggregate ("
                          + fmt("%+.2f", d.by_symbol.at(s).return_delta) + " pts)");
        }
        if (!d.dominant_dependency.empty()
            && std::abs(d.dominant_delta) > config_.return_threshold) {
            out.push_back("Largest return change in " + d.dominant_dependency + " ("
                          + fmt("%+.2f", d.dominant_delta) + " pts)");
        }
        return out;
    }

    EvaluatorConfig config_;
};
