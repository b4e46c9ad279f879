#pragma once

#include <string>

namespace exit_reason {
    constexpr int STOP_LOSS   = 0;
    constexpr int TAKE_PROFIT = 1;
    constexpr int MAX_HOLDING = 2;
    constexpr int END_OF_DATA = 3;
}  // namespace exit_reason

inline std::string exit_reason_str(int reason) {
    switch (reason) {
        case exit_reason::STOP_LOSS:   return "STOP_LOSS";
        case exit_reason::TAKE_PROFIT: return "TAKE_PROFIT";
        case exit_reason::MAX_HOLDING: return "MAX_HOLDING";
        case exit_reason::END_OF_DATA: return "END_OF_DATA";
        default: return "UNKNOWN";
    }
}

inline int parse_exit_reason(const std::string& s) {
    if (s == "STOP_LOSS")   return exit_reason::STOP_LOSS;
    if (s == "TAKE_PROFIT") return exit_reason::TAKE_PROFIT;
    if (s == "MAX_HOLDING") return exit_reason::MAX_HOLDING;
    return exit_reason::END_OF_DATA;
}

struct TradeRecord {
    int entry_date = 0;
    int exit_date = 0;
    int entry_bar_idx = 0;
    int exit_bar_idx = 0;
    double entry_price = 0.0;
    double exit_price = 0.0;
    double shares = 0.0;
    double position_value = 0.0;
    double position_size_pct = 0.0;  // position value / equity at entry
    double cash_reserve_pct = 0.0;   // cash / equity right after entry
    double calibrated_trust = 0.0;
    double raw_kelly = 0.0;
    double fractional_kelly = 0.0;
    double pnl = 0.0;
    double pnl_pct = 0.0;            // percent return on the position
    int bars_held = 0;
    int exit_reason = 0;
};
