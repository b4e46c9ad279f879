#pragma once

#include "analysis/meta_evaluator.hpp"
#include "backtest/deterministic_simulator.hpp"
#include "backtest/result_io.hpp"
#include "backtest/scenario_result.hpp"
#include "data/price_history.hpp"
#include "memory/memory_agent.hpp"
#include "memory/memory_store.hpp"
#include "research/errors.hpp"
#include "research/proposal_agent.hpp"
#include "research/regime_ontology.hpp"
#include "research/scenario_generator.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// ResearchLoopConfig - one iteration's limits plus every component config
// ---------------------------------------------------------------------------
struct ResearchLoopConfig {
    std::filesystem::path store_dir = "research_store";
    size_t max_proposals = 5;
    size_t max_scenarios_per_iteration = 6;
    size_t compare_window = 5;            // previous scenarios compared against new ones
    std::optional<double> time_budget_s;  // checked between scenarios only
    int threads = 1;
    bool export_parquet = true;

    SimulatorConfig simulator;
    EvaluatorConfig evaluator;
    MemoryAgentConfig memory;
    ProposalConfig proposals;
    GeneratorConfig generator;
};

struct ScenarioOutcome {
    ScenarioDefinition definition;
    CampaignSummary summary;
    bool replayed = false;  // already stored; re-run and checked for identity
};

struct ComparisonRecord {
    std::string scenario_a_id;
    std::string scenario_b_id;
    MetricDelta aggregate;
    std::vector<std::string> observations;
};

// ---------------------------------------------------------------------------
// IterationReport - everything one iteration did, persisted as an artifact
// ---------------------------------------------------------------------------
struct IterationReport {
    std::string iteration_id;
    bool success = false;
    bool aborted = false;  // time budget expired between scenarios
    std::string source;    // explicit / baseline / proposal / variants / exhausted
    std::string source_proposal_id;
    int planned_scenarios = 0;
    std::vector<ScenarioOutcome> outcomes;
    std::vector<ComparisonRecord> comparisons;
    std::vector<std::string> touched_insight_ids;
    std::vector<StrategyInsight> touched_insights;
    std::vector<ExperimentProposal> next_proposals;
    AggregateMetrics aggregate;
    std::string error_kind;
    std::string error;
    std::filesystem::path artifact_path;
};

// ---------------------------------------------------------------------------
// ResearchLoop - one iteration: plan, simulate, persist, compare, learn,
// propose. Nothing stored is ever overwritten.
// ---------------------------------------------------------------------------
class ResearchLoop {
public:
    ResearchLoop(const HistoricalDataProvider& data, const ResearchLoopConfig& config)
        : config_(config),
          store_(config.store_dir),
          memory_(store_.memory_log_path()),
          agent_(memory_, config.memory),
          simulator_(data, config.simulator),
          evaluator_(config.evaluator),
          generator_(config.generator),
          proposer_(config.proposals) {}

    IterationReport run_iteration(const std::optional<ScenarioDefinition>& scenario = std::nullopt) {
        IterationReport report;
        report.iteration_id = store_.next_iteration_id();
        try {
            execute(scenario, report);
            report.success = true;
        } catch (const std::exception& e) {
            report.success = false;
            report.error_kind = error_kind(e);
            report.error = e.what();
        }
        report.artifact_path = store_.save_iteration(report.iteration_id, artifact(report));
        return report;
    }

    // Proposals from the current store and memory, without running anything.
    std::vector<ExperimentProposal> proposals() const {
        auto stored = store_.load_all();
        return propose(stored);
    }

    ResultStore& store() { return store_; }
    MemoryAgent& memory() { return agent_; }
    const ResearchLoopConfig& config() const { return config_; }

private:
    using Clock = std::chrono::steady_clock;

    void execute(const std::optional<ScenarioDefinition>& explicit_scenario,
                 IterationReport& report) {
        auto started = Clock::now();
        auto previous = store_.load_all();

        std::vector<ScenarioDefinition> planned;
        if (explicit_scenario) {
            scenario::validate(*explicit_scenario);
            planned.push_back(*explicit_scenario);
            report.source = "explicit";
        } else {
            planned = plan(previous, report);
        }
        report.planned_scenarios = static_cast<int>(planned.size());

        run_planned(planned, started, report);

        // Compare each new scenario against the most recent stored ones.
        std::vector<const StoredScenario*> window;
        for (auto it = previous.rbegin(); it != previous.rend() && window.size() < config_.compare_window;
             ++it) {
            window.push_back(&*it);
        }
        std::vector<ScenarioResult> pooled;
        std::set<std::string> pooled_ids;
        auto pool = [&](const CampaignSummary& s) {
            if (!pooled_ids.insert(s.scenario_id).second) return;
            pooled.insert(pooled.end(), s.results.begin(), s.results.end());
        };
        for (const auto* prev : window) pool(prev->summary);

        std::vector<ScenarioResult> new_results;
        for (const auto& outcome : report.outcomes) {
            pool(outcome.summary);
            new_results.insert(new_results.end(), outcome.summary.results.begin(),
                               outcome.summary.results.end());
            if (outcome.replayed) continue;
            for (const auto* prev : window) {
                if (prev->summary.scenario_id == outcome.summary.scenario_id) continue;
                auto d = evaluator_.compare(prev->summary.results, outcome.summary.results);
                report.comparisons.push_back(
                    ComparisonRecord{d.scenario_a_id, d.scenario_b_id, d.aggregate, d.observations});
                touch(report, agent_.ingest_comparison(d));
            }
        }

        if (!report.outcomes.empty()) {
            auto landscape = evaluator_.sensitivity_landscape(pooled);
            touch(report, agent_.ingest_landscape(landscape));
        }
        for (const auto& id : report.touched_insight_ids) {
            if (auto s = memory_.get(id)) report.touched_insights.push_back(*s);
        }

        report.aggregate = evaluator_.aggregate(new_results);
        report.next_proposals = propose(store_.load_all());
    }

    // Choose scenarios: baseline first, then the best proposal that maps to
    // unseen scenarios, then plain variants of the baseline.
    std::vector<ScenarioDefinition> plan(const std::vector<StoredScenario>& stored,
                                         IterationReport& report) const {
        auto baseline = generator_.generate_baseline();
        if (!store_.has_scenario(baseline.scenario_id())) {
            report.source = "baseline";
            return {baseline};
        }

        for (const auto& p : propose(stored)) {
            auto fresh = unseen(generator_.generate_from_proposal(baseline, p));
            if (!fresh.empty()) {
                report.source = std::string("proposal:") + proposal_type_str(p.type);
                report.source_proposal_id = p.proposal_id;
                return fresh;
            }
        }

        for (const auto& hints : agent_.insights_for_generation()) {
            auto fresh = unseen(generator_.generate_variants(baseline, hints));
            if (!fresh.empty()) {
                report.source = "variants:hinted";
                return fresh;
            }
        }
        auto fresh = unseen(generator_.generate_variants(baseline));
        report.source = fresh.empty() ? "exhausted" : "variants";
        return fresh;
    }

    std::vector<ScenarioDefinition> unseen(const std::vector<ScenarioDefinition>& candidates) const {
        std::vector<ScenarioDefinition> out;
        for (const auto& s : candidates) {
            if (out.size() >= config_.max_scenarios_per_iteration) break;
            if (!store_.has_scenario(s.scenario_id())) out.push_back(s);
        }
        return out;
    }

    void run_planned(const std::vector<ScenarioDefinition>& planned, Clock::time_point started,
                     IterationReport& report) {
        if (!config_.time_budget_s && config_.threads > 1) {
            auto summaries = simulator_.run_batch(planned, config_.threads);
            for (size_t i = 0; i < planned.size(); ++i) record(planned[i], summaries[i], report);
            return;
        }
        for (size_t i = 0; i < planned.size(); ++i) {
            if (i > 0 && budget_expired(started)) {
                report.aborted = true;
                break;
            }
            record(planned[i], simulator_.run(planned[i]), report);
        }
    }

    bool budget_expired(Clock::time_point started) const {
        if (!config_.time_budget_s) return false;
        std::chrono::duration<double> elapsed = Clock::now() - started;
        return elapsed.count() >= *config_.time_budget_s;
    }

    // Persist a new scenario, or check a stored one reproduces bit for bit.
    void record(const ScenarioDefinition& def, const CampaignSummary& summary,
                IterationReport& report) {
        ScenarioOutcome outcome{def, summary, false};
        if (auto stored = store_.load_scenario(summary.scenario_id)) {
            if (stored->summary.fingerprint != summary.fingerprint) {
                throw NonDeterminismDetected("scenario " + summary.scenario_id
                                             + " reproduced different results (stored "
                                             + stored->summary.fingerprint + ", now "
                                             + summary.fingerprint + ")");
            }
            outcome.replayed = true;
        } else {
            store_.save_scenario(def, summary);
            if (config_.export_parquet) store_.export_parquet(summary);
        }
        report.outcomes.push_back(outcome);
    }

    std::vector<ExperimentProposal> propose(const std::vector<StoredScenario>& stored) const {
        std::vector<std::string> ids;
        std::vector<ScenarioDefinition> defs;
        ParameterCoverage tested;
        for (const auto& s : stored) {
            ids.push_back(s.summary.scenario_id);
            defs.push_back(s.definition);
            for (const auto& [label, params] : s.definition.param_sets) {
                for (const char* p : trading_params::PARAMETER_NAMES) {
                    tested[p].insert(meta_eval::snap(trading_params::parameter_value(params, p)));
                }
            }
        }
        return proposer_.generate(ids, agent_.insights(), regime::coverage(defs),
                                  config_.max_proposals, tested);
    }

    static void touch(IterationReport& report, const std::vector<std::string>& ids) {
        for (const auto& id : ids) insight::append_unique(report.touched_insight_ids, id);
    }

    static nlohmann::json artifact(const IterationReport& r) {
        nlohmann::json j;
        j["iteration_id"] = r.iteration_id;
        j["success"] = r.success;
        j["aborted"] = r.aborted;
        j["source"] = r.source;
        j["source_proposal_id"] = r.source_proposal_id;
        j["planned_scenarios"] = r.planned_scenarios;
        j["error_kind"] = r.error_kind;
        j["error"] = r.error;

        nlohmann::json scenarios = nlohmann::json::array();
        for (const auto& o : r.outcomes) {
            scenarios.push_back({
                {"scenario_id", o.summary.scenario_id},
                {"name", o.summary.scenario_name},
                {"regime_id", o.summary.regime_id},
                {"replayed", o.replayed},
                {"completion_rate", o.summary.completion_rate},
                {"verified", o.summary.verified},
                {"invalid_sharpe_count", o.summary.invalid_sharpe_count},
                {"fingerprint", o.summary.fingerprint},
            });
        }
        j["scenarios"] = scenarios;

        nlohmann::json comparisons = nlohmann::json::array();
        for (const auto& c : r.comparisons) {
            comparisons.push_back({
                {"scenario_a_id", c.scenario_a_id},
                {"scenario_b_id", c.scenario_b_id},
                {"return_delta", c.aggregate.return_delta},
                {"sharpe_delta", c.aggregate.sharpe_delta},
                {"drawdown_delta", c.aggregate.drawdown_delta},
                {"win_rate_delta", c.aggregate.win_rate_delta},
                {"observations", c.observations},
            });
        }
        j["comparisons"] = comparisons;
        j["insights"] = r.touched_insights;
        j["next_proposals"] = r.next_proposals;
        j["aggregate"] = {
            {"result_count", r.aggregate.result_count},
            {"completion_rate", r.aggregate.completion_rate},
            {"mean_return_pct", r.aggregate.returns.mean},
            {"median_sharpe", r.aggregate.sharpe.median},
            {"invalid_sharpe_count", r.aggregate.invalid_sharpe_count},
        };
        return j;
    }

    ResearchLoopConfig config_;
    ResultStore store_;
    MemoryStore memory_;
    MemoryAgent agent_;
    DeterministicSimulator simulator_;
    MetaEvaluator evaluator_;
    ScenarioGenerator generator_;
    ProposalAgent proposer_;
};
