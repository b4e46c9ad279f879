#pragma once

#include "research/trading_params.hpp"

#include <algorithm>

// ---------------------------------------------------------------------------
// SizingConfig - volatility-adjusted fractional Kelly. All constants tunable.
// ---------------------------------------------------------------------------
struct SizingConfig {
    double trust_cap = 0.60;          // calibrated win probability ceiling
    double slippage_margin = 0.25;    // stop inflated / take deflated by this fraction
    double kelly_fraction = 0.25;     // quarter Kelly
    double position_ceiling = 0.05;   // hard cap on fraction of equity per position
    double min_cash_reserve = 0.05;   // equity fraction that must stay in cash
};

enum class SizingLimit { NONE, NO_EDGE, KELLY, PARAM_MAX, CEILING };

struct SizingDecision {
    double calibrated_p = 0.0;
    double win_loss_ratio = 0.0;
    double raw_kelly = 0.0;
    double fractional_kelly = 0.0;
    double position_pct = 0.0;  // fraction of equity to commit, before the cash check
    SizingLimit limit = SizingLimit::NONE;

    bool has_edge() const { return limit != SizingLimit::NO_EDGE; }
};

namespace sizing {

inline SizingDecision kelly_position(double trust_score, const TradingParams& params,
                                     const SizingConfig& cfg) {
    SizingDecision d;
    d.calibrated_p = std::clamp(std::min(trust_score, cfg.trust_cap), 0.0, 1.0);
    double q = 1.0 - d.calibrated_p;

    double eff_stop = params.stop_loss * (1.0 + cfg.slippage_margin);
    double eff_take = params.take_profit * (1.0 - cfg.slippage_margin);
    if (eff_stop <= 0.0 || eff_take <= 0.0) {
        d.limit = SizingLimit::NO_EDGE;
        return d;
    }
    d.win_loss_ratio = eff_take / eff_stop;
    d.raw_kelly = (d.calibrated_p * d.win_loss_ratio - q) / d.win_loss_ratio;
    if (d.raw_kelly <= 0.0) {
        d.limit = SizingLimit::NO_EDGE;
        return d;
    }
    d.fractional_kelly = d.raw_kelly * cfg.kelly_fraction;

    d.position_pct = d.fractional_kelly;
    d.limit = SizingLimit::KELLY;
    if (params.max_position_size < d.position_pct) {
        d.position_pct = params.max_position_size;
        d.limit = SizingLimit::PARAM_MAX;
    }
    if (cfg.position_ceiling < d.position_pct) {
        d.position_pct = cfg.position_ceiling;
        d.limit = SizingLimit::CEILING;
    }
    return d;
}

// Dollar amount to commit, honoring the cash reserve and available cash.
inline double position_value(const SizingDecision& d, double equity, double cash,
                             const SizingConfig& cfg) {
    if (!d.has_edge() || equity <= 0.0) return 0.0;
    double value = d.position_pct * equity;
    double spendable = std::min(cash, equity * (1.0 - cfg.min_cash_reserve));
    return std::clamp(value, 0.0, std::max(spendable, 0.0));
}

}  // namespace sizing
