#pragma once

#include "backtest/position_sizing.hpp"
#include "backtest/result_io.hpp"
#include "backtest/scenario_result.hpp"
#include "backtest/trade_record.hpp"
#include "data/price_history.hpp"
#include "research/errors.hpp"
#include "research/scenario_definition.hpp"

#include <algorithm>
#include <exception>
#include <span>
#include <string>
#include <thread>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// SimulatorConfig - capital, holding limits and sizing for every campaign
// ---------------------------------------------------------------------------
struct SimulatorConfig {
    double initial_balance = 10000.0;
    int max_holding_bars = 10;
    int min_bars = 2;                 // fewer bars in the window -> skipped
    int min_bars_for_verification = 30;  // zero trades over more bars -> unverified
    SizingConfig sizing;
};

// ---------------------------------------------------------------------------
// DeterministicSimulator - walks each symbol x parameter set bar by bar.
// Pure: identical scenario and history always give identical results.
// ---------------------------------------------------------------------------
class DeterministicSimulator {
public:
    explicit DeterministicSimulator(const HistoricalDataProvider& data,
                                    const SimulatorConfig& config = SimulatorConfig{})
        : data_(data), config_(config) {}

    // Results are ordered by sorted symbol, then parameter-set name.
    CampaignSummary run(const ScenarioDefinition& scenario) const {
        scenario::validate(scenario);
        std::string scenario_id = scenario.scenario_id();

        std::vector<std::string> symbols = scenario.symbols;
        std::sort(symbols.begin(), symbols.end());
        symbols.erase(std::unique(symbols.begin(), symbols.end()), symbols.end());

        std::vector<ScenarioResult> results;
        for (const auto& symbol : symbols) {
            for (const auto& [label, params] : scenario.param_sets) {
                results.push_back(run_campaign(scenario, scenario_id, symbol, label, params));
            }
        }
        return summarize(scenario_id, scenario, std::move(results));
    }

    ScenarioResult run_campaign(const ScenarioDefinition& scenario,
                                const std::string& scenario_id,
                                const std::string& symbol,
                                const std::string& label,
                                const TradingParams& params) const {
        ScenarioResult r;
        r.scenario_id = scenario_id;
        r.symbol = symbol;
        r.param_set_name = label;
        r.params = params;
        r.regime_id = scenario.regime.regime_id();
        r.start_date = scenario.start();
        r.end_date = scenario.end();
        r.initial_balance = config_.initial_balance;
        r.final_balance = config_.initial_balance;

        std::span<const PriceBar> bars;
        try {
            bars = data_.bars(symbol, r.start_date, r.end_date);
        } catch (const DataUnavailableError& e) {
            return skip(r, e.what());
        }
        if (static_cast<int>(bars.size()) < config_.min_bars) {
            return skip(r, "Insufficient history: " + std::to_string(bars.size())
                               + " bars in window (need " + std::to_string(config_.min_bars) + ")");
        }

        walk(bars, params, r);
        backtest_util::recompute_derived(r);
        r.verified = !(r.trade_count == 0 && r.bars_processed > config_.min_bars_for_verification);
        return r;
    }

    // Independent scenarios evaluated on worker threads. Output order matches
    // input order; the first failure (in input order) is rethrown.
    std::vector<CampaignSummary> run_batch(const std::vector<ScenarioDefinition>& scenarios,
                                           int num_threads = 1) const {
        std::vector<CampaignSummary> out(scenarios.size());
        std::vector<std::exception_ptr> errors(scenarios.size());
        int workers = std::max(1, std::min<int>(num_threads, static_cast<int>(scenarios.size())));

        auto work = [&](int w) {
            for (size_t i = static_cast<size_t>(w); i < scenarios.size();
                 i += static_cast<size_t>(workers)) {
                try {
                    out[i] = run(scenarios[i]);
                } catch (const std::exception&) {
                    errors[i] = std::current_exception();
                }
            }
        };

        if (workers == 1) {
            work(0);
        } else {
            // jthread joins on destruction, including when a later spawn throws.
            std::vector<std::jthread> threads;
            threads.reserve(static_cast<size_t>(workers));
            for (int w = 0; w < workers; ++w) threads.emplace_back(work, w);
        }
        for (const auto& e : errors) {
            if (e) std::rethrow_exception(e);
        }
        return out;
    }

    static CampaignSummary summarize(const std::string& scenario_id,
                                     const ScenarioDefinition& scenario,
                                     std::vector<ScenarioResult> results) {
        CampaignSummary s;
        s.scenario_id = scenario_id;
        s.scenario_name = scenario.name;
        s.regime_id = scenario.regime.regime_id();
        s.total_campaigns = static_cast<int>(results.size());
        bool all_verified = !results.empty();
        for (const auto& r : results) {
            if (r.skipped) {
                ++s.skipped_campaigns;
            } else {
                ++s.completed_campaigns;
            }
            if (!r.sharpe_valid) ++s.invalid_sharpe_count;
            all_verified = all_verified && r.verified;
        }
        if (s.total_campaigns > 0) {
            s.completion_rate = static_cast<double>(s.completed_campaigns) / s.total_campaigns;
        }
        s.verified = all_verified;
        s.fingerprint = result_io::fingerprint(results);
        s.results = std::move(results);
        return s;
    }

    const SimulatorConfig& config() const { return config_; }

private:
    ScenarioResult& skip(ScenarioResult& r, const std::string& reason) const {
        r.skipped = true;
        r.skip_reason = reason;
        r.verified = false;
        backtest_util::recompute_derived(r);
        return r;
    }

    void walk(std::span<const PriceBar> bars, const TradingParams& params,
              ScenarioResult& r) const {
        double cash = config_.initial_balance;
        double shares = 0.0;
        bool in_position = false;
        TradeRecord open{};
        int cooldown_until = -1;
        double peak = cash;
        double max_dd_pct = 0.0;

        auto close_position = [&](const PriceBar& bar, int idx, int reason) {
            double proceeds = shares * bar.close;
            open.exit_date = bar.date;
            open.exit_bar_idx = idx;
            open.exit_price = bar.close;
            open.bars_held = idx - open.entry_bar_idx;
            open.pnl = proceeds - open.position_value;
            open.pnl_pct = (bar.close / open.entry_price - 1.0) * 100.0;
            open.exit_reason = reason;
            cash += proceeds;
            shares = 0.0;
            in_position = false;
            r.trades.push_back(open);
        };

        int n = static_cast<int>(bars.size());
        for (int i = 0; i < n; ++i) {
            const PriceBar& bar = bars[i];
            ++r.bars_processed;

            if (in_position) {
                int held = i - open.entry_bar_idx;
                int reason = -1;
                if (bar.close <= open.entry_price * (1.0 - params.stop_loss)) {
                    reason = exit_reason::STOP_LOSS;
                } else if (bar.close >= open.entry_price * (1.0 + params.take_profit)) {
                    reason = exit_reason::TAKE_PROFIT;
                } else if (held >= config_.max_holding_bars) {
                    reason = exit_reason::MAX_HOLDING;
                }
                if (reason >= 0) {
                    close_position(bar, i, reason);
                    cooldown_until = i + params.cooldown_period;
                }
            } else if (i > cooldown_until && bar.close > 0.0
                       && bar.trust_score >= params.trust_threshold
                       && bar.forecast_confidence >= params.min_confidence) {
                double equity = cash;
                auto decision = sizing::kelly_position(bar.trust_score, params, config_.sizing);
                if (!decision.has_edge()) {
                    ++r.no_edge_entries;
                } else {
                    double value = sizing::position_value(decision, equity, cash, config_.sizing);
                    if (value > 0.0) {
                        shares = value / bar.close;
                        cash -= value;
                        in_position = true;
                        open = TradeRecord{};
                        open.entry_date = bar.date;
                        open.entry_bar_idx = i;
                        open.entry_price = bar.close;
                        open.shares = shares;
                        open.position_value = value;
                        open.position_size_pct = value / equity;
                        open.cash_reserve_pct = cash / equity;
                        open.calibrated_trust = decision.calibrated_p;
                        open.raw_kelly = decision.raw_kelly;
                        open.fractional_kelly = decision.fractional_kelly;
                        r.max_position_size_pct = std::max(r.max_position_size_pct,
                                                           open.position_size_pct);
                        r.min_cash_reserve_pct = std::min(r.min_cash_reserve_pct,
                                                          open.cash_reserve_pct);
                    }
                }
            }

            double equity = cash + shares * bar.close;
            if (equity > peak) peak = equity;
            if (peak > 0.0) {
                max_dd_pct = std::max(max_dd_pct, (peak - equity) / peak * 100.0);
            }
        }

        if (in_position) {
            close_position(bars[n - 1], n - 1, exit_reason::END_OF_DATA);
        }
        r.final_balance = cash;
        r.max_drawdown_pct = max_dd_pct;
    }

    const HistoricalDataProvider& data_;
    SimulatorConfig config_;
};
