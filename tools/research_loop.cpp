// research_loop.cpp - Runs one research iteration against a history file.
// Loads the price history, opens (or creates) the result store, runs the
// planned scenarios and prints the ranked next proposals.
//
// Library layer: src/research/research_loop.hpp.

#include "data/history_io.hpp"
#include "research/errors.hpp"
#include "research/research_loop.hpp"
#include "research/scenario_definition.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

namespace {

constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " --data <file> --store <dir> [options]\n"
              << "\n"
              << "  --data           Price history (.parquet or .csv)\n"
              << "  --store          Result store directory (created if missing)\n"
              << "  --scenario       Scenario definition: JSON file path or inline JSON\n"
              << "  --max-proposals  Proposals to rank for the next iteration (default 5)\n"
              << "  --time-budget-s  Stop starting new scenarios after this many seconds\n"
              << "  --threads        Worker threads for scenario batches (default 1)\n";
}

void report_error(const std::exception& e) {
    nlohmann::json err = {{"error", error_kind(e)}, {"message", e.what()}};
    std::cerr << err.dump() << "\n";
}

ScenarioDefinition load_scenario_arg(const std::string& arg) {
    nlohmann::json j;
    try {
        if (!arg.empty() && arg.front() == '{') {
            j = nlohmann::json::parse(arg);
        } else {
            std::ifstream in(arg);
            if (!in) throw InvalidScenarioError("cannot open scenario file: " + arg);
            j = nlohmann::json::parse(in);
        }
    } catch (const nlohmann::json::parse_error& e) {
        throw InvalidScenarioError(std::string("malformed scenario JSON: ") + e.what());
    }
    return j.get<ScenarioDefinition>();
}

void print_summary(const IterationReport& report) {
    std::cout << "Iteration " << report.iteration_id << " (" << report.source;
    if (!report.source_proposal_id.empty()) std::cout << " " << report.source_proposal_id;
    std::cout << ")\n";

    for (const auto& o : report.outcomes) {
        const auto& s = o.summary;
        std::printf("  %s  %-40s  %s  completed %d/%d  verified=%s%s\n",
                    s.scenario_id.c_str(), s.scenario_name.c_str(), s.regime_id.c_str(),
                    s.completed_campaigns, s.total_campaigns, s.verified ? "yes" : "no",
                    o.replayed ? "  (replayed)" : "");
        for (const auto& r : s.results) {
            if (r.skipped) {
                std::cerr << "  SKIP: " << s.scenario_id << " " << r.symbol << "/"
                          << r.param_set_name << ": " << r.skip_reason << "\n";
            }
        }
    }
    if (report.aborted) {
        std::cout << "  Time budget expired after " << report.outcomes.size() << " of "
                  << report.planned_scenarios << " scenarios\n";
    }
    std::cout << "  Comparisons: " << report.comparisons.size()
              << "  insights touched: " << report.touched_insight_ids.size() << "\n";

    std::cout << "\nNext proposals:\n";
    for (const auto& p : report.next_proposals) {
        std::printf("  [%2d] %.3f  %-22s %s\n", p.priority, p.expected_info_gain,
                    proposal_type_str(p.type), p.target.c_str());
    }
    std::cout << "\nArtifact: " << report.artifact_path.string() << "\n";
}

}  // namespace

// ===========================================================================
// Main
// ===========================================================================
int main(int argc, char* argv[]) {
    std::string data_path;
    std::string store_dir;
    std::string scenario_arg;
    ResearchLoopConfig config;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--data" && i + 1 < argc) {
                data_path = argv[++i];
            } else if (arg == "--store" && i + 1 < argc) {
                store_dir = argv[++i];
            } else if (arg == "--scenario" && i + 1 < argc) {
                scenario_arg = argv[++i];
            } else if (arg == "--max-proposals" && i + 1 < argc) {
                config.max_proposals = static_cast<size_t>(std::stoul(argv[++i]));
            } else if (arg == "--time-budget-s" && i + 1 < argc) {
                config.time_budget_s = std::stod(argv[++i]);
            } else if (arg == "--threads" && i + 1 < argc) {
                config.threads = std::stoi(argv[++i]);
            } else if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown or incomplete argument: " << arg << "\n";
                print_usage(argv[0]);
                return EXIT_USAGE;
            }
        }
    } catch (const std::logic_error& e) {
        std::cerr << "Invalid numeric argument: " << e.what() << "\n";
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    if (data_path.empty()) {
        std::cerr << "Missing required argument: --data\n";
        print_usage(argv[0]);
        return EXIT_USAGE;
    }
    if (store_dir.empty()) {
        std::cerr << "Missing required argument: --store\n";
        print_usage(argv[0]);
        return EXIT_USAGE;
    }
    if (config.threads < 1 || (config.time_budget_s && *config.time_budget_s < 0.0)) {
        std::cerr << "--threads must be >= 1 and --time-budget-s must be >= 0\n";
        print_usage(argv[0]);
        return EXIT_USAGE;
    }
    config.store_dir = store_dir;

    try {
        std::optional<ScenarioDefinition> scenario;
        if (!scenario_arg.empty()) scenario = load_scenario_arg(scenario_arg);

        std::cout << "Loading history: " << data_path << "\n";
        auto history = history_io::load_history(data_path);
        std::cout << "  " << history.symbols().size() << " symbols, " << history.bar_count()
                  << " bars\n";

        ResearchLoop loop(history, config);
        auto report = loop.run_iteration(scenario);
        if (!report.success) {
            nlohmann::json err = {{"error", report.error_kind},
                                  {"message", report.error},
                                  {"iteration_id", report.iteration_id}};
            std::cerr << err.dump() << "\n";
            return EXIT_FAILED;
        }
        print_summary(report);
    } catch (const std::exception& e) {
        report_error(e);
        return EXIT_FAILED;
    }
    return 0;
}
