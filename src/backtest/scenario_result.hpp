#pragma once

#include "backtest/trade_record.hpp"
#include "research/trading_params.hpp"

#include <cmath>
#include <limits>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// ScenarioResult - outcome of one (scenario, symbol, parameter set) campaign
// ---------------------------------------------------------------------------
struct ScenarioResult {
    std::string scenario_id;
    std::string symbol;
    std::string param_set_name;
    TradingParams params;
    std::string regime_id;
    int start_date = 0;
    int end_date = 0;

    double initial_balance = 0.0;
    double final_balance = 0.0;
    double total_return_pct = 0.0;
    double sharpe_ratio = std::numeric_limits<double>::quiet_NaN();
    bool sharpe_valid = false;
    double max_drawdown_pct = 0.0;
    double win_rate = 0.0;
    int trade_count = 0;
    int winning_trades = 0;
    int losing_trades = 0;
    double avg_win_pct = 0.0;
    double avg_loss_pct = 0.0;
    double profit_factor = 0.0;
    double max_position_size_pct = 0.0;  // largest position / equity over all entries
    double min_cash_reserve_pct = 1.0;   // smallest cash / equity right after an entry

    int bars_processed = 0;
    int no_edge_entries = 0;  // signals rejected because Kelly had no edge
    bool skipped = false;
    std::string skip_reason;
    bool verified = false;

    std::vector<TradeRecord> trades;
};

// ---------------------------------------------------------------------------
// CampaignSummary - all results of one scenario plus completion bookkeeping
// ---------------------------------------------------------------------------
struct CampaignSummary {
    std::string scenario_id;
    std::string scenario_name;
    std::string regime_id;
    std::vector<ScenarioResult> results;
    int total_campaigns = 0;
    int completed_campaigns = 0;
    int skipped_campaigns = 0;
    double completion_rate = 0.0;
    bool verified = false;
    int invalid_sharpe_count = 0;
    std::string fingerprint;
};

// ---------------------------------------------------------------------------
// Metric utilities shared by the simulator and the evaluator
// ---------------------------------------------------------------------------
namespace backtest_util {

// Mean / population std of per-trade pnl_pct. NaN without trades; a zero
// spread yields NaN or +-inf and the result is flagged invalid.
inline void compute_sharpe(ScenarioResult& result) {
    if (result.trades.empty()) {
        result.sharpe_ratio = std::numeric_limits<double>::quiet_NaN();
        result.sharpe_valid = false;
        return;
    }
    double n = static_cast<double>(result.trades.size());
    double sum = 0.0;
    for (const auto& t : result.trades) sum += t.pnl_pct;
    double mean = sum / n;
    double sum_sq = 0.0;
    for (const auto& t : result.trades) {
        double diff = t.pnl_pct - mean;
        sum_sq += diff * diff;
    }
    double stddev = std::sqrt(sum_sq / n);
    result.sharpe_ratio = mean / stddev;
    result.sharpe_valid = std::isfinite(result.sharpe_ratio);
}

// Win rate, average win / loss and profit factor from accumulated trades.
inline void compute_trade_stats(ScenarioResult& result) {
    result.trade_count = static_cast<int>(result.trades.size());
    result.winning_trades = 0;
    result.losing_trades = 0;
    double win_sum = 0.0;
    double loss_sum = 0.0;
    double gross_wins = 0.0;
    double gross_losses = 0.0;
    for (const auto& t : result.trades) {
        if (t.pnl > 0.0) {
            ++result.winning_trades;
            win_sum += t.pnl_pct;
            gross_wins += t.pnl;
        } else {
            ++result.losing_trades;
            loss_sum += t.pnl_pct;
            gross_losses += std::abs(t.pnl);
        }
    }
    if (result.trade_count > 0) {
        result.win_rate = static_cast<double>(result.winning_trades) / result.trade_count;
    }
    if (result.winning_trades > 0) result.avg_win_pct = win_sum / result.winning_trades;
    if (result.losing_trades > 0) result.avg_loss_pct = loss_sum / result.losing_trades;
    if (gross_losses > 0.0) result.profit_factor = gross_wins / gross_losses;
}

inline void recompute_derived(ScenarioResult& result) {
    compute_trade_stats(result);
    compute_sharpe(result);
    if (result.initial_balance > 0.0) {
        result.total_return_pct =
            (result.final_balance - result.initial_balance) / result.initial_balance * 100.0;
    }
}

// Sharpe only if valid, otherwise NaN. Used by aggregators that must skip
// invalid values explicitly.
inline double valid_sharpe_or_nan(const ScenarioResult& r) {
    return r.sharpe_valid ? r.sharpe_ratio : std::numeric_limits<double>::quiet_NaN();
}

}  // namespace backtest_util
