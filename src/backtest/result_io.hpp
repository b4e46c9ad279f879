#pragma once

#include "backtest/scenario_result.hpp"
#include "backtest/trade_record.hpp"
#include "research/content_hash.hpp"
#include "research/scenario_definition.hpp"
#include "time_utils.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/writer.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <limits>
#include <optional>
#include <string>
#include <vector>

constexpr int RESULT_SCHEMA_VERSION = 1;

// ===========================================================================
// JSON serialization (nlohmann ADL hooks). NaN / inf Sharpe values persist as
// null next to sharpe_valid = false.
// ===========================================================================

inline void to_json(nlohmann::json& j, const TradeRecord& t) {
    j = nlohmann::json{
        {"entry_date", time_utils::format_iso_date(t.entry_date)},
        {"exit_date", time_utils::format_iso_date(t.exit_date)},
        {"entry_bar_idx", t.entry_bar_idx},
        {"exit_bar_idx", t.exit_bar_idx},
        {"entry_price", t.entry_price},
        {"exit_price", t.exit_price},
        {"shares", t.shares},
        {"position_value", t.position_value},
        {"position_size_pct", t.position_size_pct},
        {"cash_reserve_pct", t.cash_reserve_pct},
        {"calibrated_trust", t.calibrated_trust},
        {"raw_kelly", t.raw_kelly},
        {"fractional_kelly", t.fractional_kelly},
        {"pnl", t.pnl},
        {"pnl_pct", t.pnl_pct},
        {"bars_held", t.bars_held},
        {"exit_reason", exit_reason_str(t.exit_reason)},
    };
}

inline void from_json(const nlohmann::json& j, TradeRecord& t) {
    t.entry_date = time_utils::parse_iso_date(j.at("entry_date").get<std::string>());
    t.exit_date = time_utils::parse_iso_date(j.at("exit_date").get<std::string>());
    t.entry_bar_idx = j.at("entry_bar_idx").get<int>();
    t.exit_bar_idx = j.at("exit_bar_idx").get<int>();
    t.entry_price = j.at("entry_price").get<double>();
    t.exit_price = j.at("exit_price").get<double>();
    t.shares = j.at("shares").get<double>();
    t.position_value = j.at("position_value").get<double>();
    t.position_size_pct = j.at("position_size_pct").get<double>();
    t.cash_reserve_pct = j.at("cash_reserve_pct").get<double>();
    t.calibrated_trust = j.at("calibrated_trust").get<double>();
    t.raw_kelly = j.at("raw_kelly").get<double>();
    t.fractional_kelly = j.at("fractional_kelly").get<double>();
    t.pnl = j.at("pnl").get<double>();
    t.pnl_pct = j.at("pnl_pct").get<double>();
    t.bars_held = j.at("bars_held").get<int>();
    t.exit_reason = parse_exit_reason(j.at("exit_reason").get<std::string>());
}

inline void to_json(nlohmann::json& j, const ScenarioResult& r) {
    j = nlohmann::json{
        {"scenario_id", r.scenario_id},
        {"symbol", r.symbol},
        {"param_set_name", r.param_set_name},
        {"params", r.params},
        {"regime_id", r.regime_id},
        {"start_date", time_utils::format_iso_date(r.start_date)},
        {"end_date", time_utils::format_iso_date(r.end_date)},
        {"initial_balance", r.initial_balance},
        {"final_balance", r.final_balance},
        {"total_return_pct", r.total_return_pct},
        {"sharpe_valid", r.sharpe_valid},
        {"max_drawdown_pct", r.max_drawdown_pct},
        {"win_rate", r.win_rate},
        {"trade_count", r.trade_count},
        {"winning_trades", r.winning_trades},
        {"losing_trades", r.losing_trades},
        {"avg_win_pct", r.avg_win_pct},
        {"avg_loss_pct", r.avg_loss_pct},
        {"profit_factor", r.profit_factor},
        {"max_position_size_pct", r.max_position_size_pct},
        {"min_cash_reserve_pct", r.min_cash_reserve_pct},
        {"bars_processed", r.bars_processed},
        {"no_edge_entries", r.no_edge_entries},
        {"skipped", r.skipped},
        {"skip_reason", r.skip_reason},
        {"verified", r.verified},
        {"trades", r.trades},
    };
    j["sharpe_ratio"] = r.sharpe_valid ? nlohmann::json(r.sharpe_ratio) : nlohmann::json(nullptr);
}

inline void from_json(const nlohmann::json& j, ScenarioResult& r) {
    r.scenario_id = j.at("scenario_id").get<std::string>();
    r.symbol = j.at("symbol").get<std::string>();
    r.param_set_name = j.at("param_set_name").get<std::string>();
    r.params = j.at("params").get<TradingParams>();
    r.regime_id = j.at("regime_id").get<std::string>();
    r.start_date = time_utils::parse_iso_date(j.at("start_date").get<std::string>());
    r.end_date = time_utils::parse_iso_date(j.at("end_date").get<std::string>());
    r.initial_balance = j.at("initial_balance").get<double>();
    r.final_balance = j.at("final_balance").get<double>();
    r.total_return_pct = j.at("total_return_pct").get<double>();
    r.sharpe_valid = j.at("sharpe_valid").get<bool>();
    r.sharpe_ratio = j.at("sharpe_ratio").is_number()
                         ? j.at("sharpe_ratio").get<double>()
                         : std::numeric_limits<double>::quiet_NaN();
    r.max_drawdown_pct = j.at("max_drawdown_pct").get<double>();
    r.win_rate = j.at("win_rate").get<double>();
    r.trade_count = j.at("trade_count").get<int>();
    r.winning_trades = j.at("winning_trades").get<int>();
    r.losing_trades = j.at("losing_trades").get<int>();
    r.avg_win_pct = j.at("avg_win_pct").get<double>();
    r.avg_loss_pct = j.at("avg_loss_pct").get<double>();
    r.profit_factor = j.at("profit_factor").get<double>();
    r.max_position_size_pct = j.at("max_position_size_pct").get<double>();
    r.min_cash_reserve_pct = j.at("min_cash_reserve_pct").get<double>();
    r.bars_processed = j.at("bars_processed").get<int>();
    r.no_edge_entries = j.at("no_edge_entries").get<int>();
    r.skipped = j.at("skipped").get<bool>();
    r.skip_reason = j.at("skip_reason").get<std::string>();
    r.verified = j.at("verified").get<bool>();
    r.trades = j.at("trades").get<std::vector<TradeRecord>>();
}

inline void to_json(nlohmann::json& j, const CampaignSummary& s) {
    j = nlohmann::json{
        {"scenario_id", s.scenario_id},
        {"scenario_name", s.scenario_name},
        {"regime_id", s.regime_id},
        {"total_campaigns", s.total_campaigns},
        {"completed_campaigns", s.completed_campaigns},
        {"skipped_campaigns", s.skipped_campaigns},
        {"completion_rate", s.completion_rate},
        {"verified", s.verified},
        {"invalid_sharpe_count", s.invalid_sharpe_count},
        {"fingerprint", s.fingerprint},
        {"results", s.results},
    };
}

inline void from_json(const nlohmann::json& j, CampaignSummary& s) {
    s.scenario_id = j.at("scenario_id").get<std::string>();
    s.scenario_name = j.at("scenario_name").get<std::string>();
    s.regime_id = j.at("regime_id").get<std::string>();
    s.total_campaigns = j.at("total_campaigns").get<int>();
    s.completed_campaigns = j.at("completed_campaigns").get<int>();
    s.skipped_campaigns = j.at("skipped_campaigns").get<int>();
    s.completion_rate = j.at("completion_rate").get<double>();
    s.verified = j.at("verified").get<bool>();
    s.invalid_sharpe_count = j.at("invalid_sharpe_count").get<int>();
    s.fingerprint = j.at("fingerprint").get<std::string>();
    s.results = j.at("results").get<std::vector<ScenarioResult>>();
}

namespace result_io {

// SHA-256 over the canonical serialization of a result list.
inline std::string fingerprint(const std::vector<ScenarioResult>& results) {
    nlohmann::json j = results;
    return content_hash::sha256_hex(j.dump());
}

// Write through a temporary file and rename so readers never see a partial file.
inline void write_json_file(const std::filesystem::path& path, const nlohmann::json& j) {
    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream file(tmp);
        if (!file) throw std::runtime_error("cannot open " + tmp.string() + " for writing");
        file << j.dump(2) << "\n";
        if (!file) throw std::runtime_error("failed writing " + tmp.string());
    }
    std::filesystem::rename(tmp, path);
}

inline nlohmann::json read_json_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) throw std::runtime_error("cannot open " + path.string());
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("malformed JSON in " + path.string() + ": " + e.what());
    }
}

// Columnar export of a campaign for the reporting consumer. Invalid Sharpe
// values are written as nulls.
inline void write_results_parquet(const std::string& path, const CampaignSummary& summary) {
    arrow::FieldVector fields = {
        arrow::field("scenario_id", arrow::utf8()),
        arrow::field("symbol", arrow::utf8()),
        arrow::field("param_set_name", arrow::utf8()),
        arrow::field("regime_id", arrow::utf8()),
        arrow::field("trust_threshold", arrow::float64()),
        arrow::field("min_confidence", arrow::float64()),
        arrow::field("max_position_size", arrow::float64()),
        arrow::field("stop_loss", arrow::float64()),
        arrow::field("take_profit", arrow::float64()),
        arrow::field("cooldown_period", arrow::int64()),
        arrow::field("total_return_pct", arrow::float64()),
        arrow::field("sharpe_ratio", arrow::float64()),
        arrow::field("max_drawdown_pct", arrow::float64()),
        arrow::field("win_rate", arrow::float64()),
        arrow::field("trade_count", arrow::int64()),
        arrow::field("skipped", arrow::boolean()),
        arrow::field("verified", arrow::boolean()),
    };
    auto schema = arrow::schema(fields);

    arrow::StringBuilder id_b, symbol_b, set_b, regime_b;
    arrow::DoubleBuilder trust_b, conf_b, maxpos_b, stop_b, take_b;
    arrow::Int64Builder cooldown_b, trades_b;
    arrow::DoubleBuilder return_b, sharpe_b, dd_b, win_b;
    arrow::BooleanBuilder skipped_b, verified_b;

    for (const auto& r : summary.results) {
        (void)id_b.Append(r.scenario_id);
        (void)symbol_b.Append(r.symbol);
        (void)set_b.Append(r.param_set_name);
        (void)regime_b.Append(r.regime_id);
        (void)trust_b.Append(r.params.trust_threshold);
        (void)conf_b.Append(r.params.min_confidence);
        (void)maxpos_b.Append(r.params.max_position_size);
        (void)stop_b.Append(r.params.stop_loss);
        (void)take_b.Append(r.params.take_profit);
        (void)cooldown_b.Append(r.params.cooldown_period);
        (void)return_b.Append(r.total_return_pct);
        if (r.sharpe_valid) {
            (void)sharpe_b.Append(r.sharpe_ratio);
        } else {
            (void)sharpe_b.AppendNull();
        }
        (void)dd_b.Append(r.max_drawdown_pct);
        (void)win_b.Append(r.win_rate);
        (void)trades_b.Append(r.trade_count);
        (void)skipped_b.Append(r.skipped);
        (void)verified_b.Append(r.verified);
    }

    std::vector<std::shared_ptr<arrow::Array>> arrays;
    std::shared_ptr<arrow::Array> arr;
    auto finish = [&](arrow::ArrayBuilder& b) {
        (void)b.Finish(&arr);
        arrays.push_back(arr);
    };
    finish(id_b);
    finish(symbol_b);
    finish(set_b);
    finish(regime_b);
    finish(trust_b);
    finish(conf_b);
    finish(maxpos_b);
    finish(stop_b);
    finish(take_b);
    finish(cooldown_b);
    finish(return_b);
    finish(sharpe_b);
    finish(dd_b);
    finish(win_b);
    finish(trades_b);
    finish(skipped_b);
    finish(verified_b);

    auto table = arrow::Table::Make(schema, arrays);

    auto outfile_result = arrow::io::FileOutputStream::Open(path);
    if (!outfile_result.ok()) {
        throw std::runtime_error("cannot open parquet output file: " + path);
    }
    auto outfile = *outfile_result;

    auto props = parquet::WriterProperties::Builder()
        .compression(parquet::Compression::ZSTD)
        ->build();

    auto status = parquet::arrow::WriteTable(
        *table, arrow::default_memory_pool(), outfile,
        /*chunk_size=*/std::max<int64_t>(static_cast<int64_t>(summary.results.size()), 1),
        props);
    if (!status.ok()) {
        throw std::runtime_error("failed to write parquet: " + status.ToString());
    }
}

}  // namespace result_io

// ---------------------------------------------------------------------------
// StoredScenario - a persisted definition with its campaign summary
// ---------------------------------------------------------------------------
struct StoredScenario {
    int sequence = 0;  // order in which scenarios were first stored
    ScenarioDefinition definition;
    CampaignSummary summary;
};

// ---------------------------------------------------------------------------
// ResultStore - on-disk layout:
//   scenarios/scenario_<id>.json   written once, never overwritten
//   memory/insights.jsonl          append-only insight log
//   iterations/<iteration_id>.json
//   exports/<id>.parquet
// ---------------------------------------------------------------------------
class ResultStore {
public:
    explicit ResultStore(const std::filesystem::path& root) : root_(root) {
        for (const char* sub : {"scenarios", "memory", "iterations", "exports"}) {
            std::error_code ec;
            std::filesystem::create_directories(root_ / sub, ec);
            if (ec) {
                throw std::runtime_error("cannot create store directory "
                                         + (root_ / sub).string() + ": " + ec.message());
            }
        }
    }

    std::filesystem::path scenario_path(const std::string& scenario_id) const {
        return root_ / "scenarios" / ("scenario_" + scenario_id + ".json");
    }

    bool has_scenario(const std::string& scenario_id) const {
        return std::filesystem::exists(scenario_path(scenario_id));
    }

    // Returns false (and writes nothing) when the scenario is already stored.
    bool save_scenario(const ScenarioDefinition& def, const CampaignSummary& summary) {
        auto path = scenario_path(def.scenario_id());
        if (std::filesystem::exists(path)) return false;
        nlohmann::json j;
        j["schema_version"] = RESULT_SCHEMA_VERSION;
        j["sequence"] = static_cast<int>(list_scenario_files().size()) + 1;
        j["definition"] = def;
        j["summary"] = summary;
        result_io::write_json_file(path, j);
        return true;
    }

    std::optional<StoredScenario> load_scenario(const std::string& scenario_id) const {
        auto path = scenario_path(scenario_id);
        if (!std::filesystem::exists(path)) return std::nullopt;
        return parse_stored(result_io::read_json_file(path));
    }

    // All stored scenarios, oldest first.
    std::vector<StoredScenario> load_all() const {
        std::vector<StoredScenario> out;
        for (const auto& path : list_scenario_files()) {
            out.push_back(parse_stored(result_io::read_json_file(path)));
        }
        std::sort(out.begin(), out.end(), [](const StoredScenario& a, const StoredScenario& b) {
            if (a.sequence != b.sequence) return a.sequence < b.sequence;
            return a.summary.scenario_id < b.summary.scenario_id;
        });
        return out;
    }

    std::filesystem::path memory_log_path() const {
        return root_ / "memory" / "insights.jsonl";
    }

    std::string next_iteration_id() const {
        int count = 0;
        for (const auto& entry : std::filesystem::directory_iterator(root_ / "iterations")) {
            if (entry.path().extension() == ".json") ++count;
        }
        char buf[32];
        std::snprintf(buf, sizeof(buf), "iteration_%04d", count + 1);
        return std::string(buf);
    }

    std::filesystem::path save_iteration(const std::string& iteration_id,
                                         const nlohmann::json& artifact) {
        auto path = root_ / "iterations" / (iteration_id + ".json");
        result_io::write_json_file(path, artifact);
        return path;
    }

    std::filesystem::path export_parquet(const CampaignSummary& summary) {
        auto path = root_ / "exports" / (summary.scenario_id + ".parquet");
        result_io::write_results_parquet(path.string(), summary);
        return path;
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::vector<std::filesystem::path> list_scenario_files() const {
        std::vector<std::filesystem::path> files;
        for (const auto& entry : std::filesystem::directory_iterator(root_ / "scenarios")) {
            if (entry.path().extension() == ".json") files.push_back(entry.path());
        }
        std::sort(files.begin(), files.end());
        return files;
    }

    static StoredScenario parse_stored(const nlohmann::json& j) {
        StoredScenario s;
        s.sequence = j.at("sequence").get<int>();
        s.definition = j.at("definition").get<ScenarioDefinition>();
        s.summary = j.at("summary").get<CampaignSummary>();
        return s;
    }

    std::filesystem::path root_;
};
