#pragma once

#include "research/errors.hpp"
#include "time_utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <map>
#include <string>
#include <tuple>
#include <vector>

namespace regime {

enum class Volatility { LOW, MEDIUM, HIGH };
enum class Trend { UP, SIDEWAYS, DOWN };
enum class Liquidity { NORMAL, STRESSED };
enum class Macro { EASING, TIGHTENING, NEUTRAL };

inline const char* to_string(Volatility v) {
    switch (v) {
        case Volatility::LOW:    return "low";
        case Volatility::MEDIUM: return "medium";
        case Volatility::HIGH:   return "high";
    }
    return "unknown";
}

inline const char* to_string(Trend t) {
    switch (t) {
        case Trend::UP:       return "up";
        case Trend::SIDEWAYS: return "sideways";
        case Trend::DOWN:     return "down";
    }
    return "unknown";
}

inline const char* to_string(Liquidity l) {
    switch (l) {
        case Liquidity::NORMAL:   return "normal";
        case Liquidity::STRESSED: return "stressed";
    }
    return "unknown";
}

inline const char* to_string(Macro m) {
    switch (m) {
        case Macro::EASING:     return "easing";
        case Macro::TIGHTENING: return "tightening";
        case Macro::NEUTRAL:    return "neutral";
    }
    return "unknown";
}

}  // namespace regime

// ---------------------------------------------------------------------------
// RegimeClassification - volatility x trend x liquidity x macro label.
// The description is informational only; it does not take part in equality,
// ordering or identity hashing.
// ---------------------------------------------------------------------------
struct RegimeClassification {
    regime::Volatility volatility = regime::Volatility::MEDIUM;
    regime::Trend trend = regime::Trend::SIDEWAYS;
    regime::Liquidity liquidity = regime::Liquidity::NORMAL;
    regime::Macro macro = regime::Macro::NEUTRAL;
    std::string description;

    std::string regime_id() const {
        return std::string(regime::to_string(volatility)) + "_" + regime::to_string(trend)
               + "_" + regime::to_string(liquidity) + "_" + regime::to_string(macro);
    }

    bool is_extreme() const {
        return volatility == regime::Volatility::HIGH
               || liquidity == regime::Liquidity::STRESSED;
    }

    bool operator==(const RegimeClassification& o) const {
        return volatility == o.volatility && trend == o.trend
               && liquidity == o.liquidity && macro == o.macro;
    }
    bool operator!=(const RegimeClassification& o) const { return !(*this == o); }

    bool operator<(const RegimeClassification& o) const {
        return std::tie(volatility, trend, liquidity, macro)
               < std::tie(o.volatility, o.trend, o.liquidity, o.macro);
    }
};

// ---------------------------------------------------------------------------
// RegimeWindow - a named historical window with a known regime
// ---------------------------------------------------------------------------
struct RegimeWindow {
    std::string name;
    std::string start_date;
    std::string end_date;
    std::string description;
    RegimeClassification regime;
};

namespace regime {

inline RegimeClassification make(Volatility v, Trend t, Liquidity l, Macro m,
                                 const std::string& description = "") {
    RegimeClassification rc;
    rc.volatility = v;
    rc.trend = t;
    rc.liquidity = l;
    rc.macro = m;
    rc.description = description;
    return rc;
}

// Canonical windows, used both for explicit name matching and for
// regime-focused scenario variants.
inline const std::vector<RegimeWindow>& canonical_windows() {
    static const std::vector<RegimeWindow> windows = {
        {"COVID Crash 2020", "2020-02-15", "2020-04-30",
         "Pandemic crash with liquidity stress and emergency easing",
         make(Volatility::HIGH, Trend::DOWN, Liquidity::STRESSED, Macro::EASING,
              "Pandemic crash")},
        {"Bull Run 2021", "2021-01-01", "2021-12-31",
         "Strong bull market with low rates and stimulus",
         make(Volatility::LOW, Trend::UP, Liquidity::NORMAL, Macro::EASING,
              "Low-rate bull market")},
        {"Inflation Shock 2022", "2022-01-01", "2022-12-31",
         "Rising rates and high inflation drive a bear market",
         make(Volatility::HIGH, Trend::DOWN, Liquidity::NORMAL, Macro::TIGHTENING,
              "Inflationary bear market")},
        {"Recovery Rally 2023", "2023-01-01", "2023-12-31",
         "Recovery as inflation moderates",
         make(Volatility::MEDIUM, Trend::UP, Liquidity::NORMAL, Macro::NEUTRAL,
              "Post-inflation recovery")},
    };
    return windows;
}

// Regime implied by the start year when no window name matches.
inline RegimeClassification classify_by_year(int year) {
    switch (year) {
        case 2020: return make(Volatility::HIGH, Trend::DOWN, Liquidity::STRESSED, Macro::EASING);
        case 2021: return make(Volatility::LOW, Trend::UP, Liquidity::NORMAL, Macro::EASING);
        case 2022: return make(Volatility::HIGH, Trend::DOWN, Liquidity::NORMAL, Macro::TIGHTENING);
        case 2023: return make(Volatility::MEDIUM, Trend::UP, Liquidity::NORMAL, Macro::NEUTRAL);
        default:   return make(Volatility::MEDIUM, Trend::SIDEWAYS, Liquidity::NORMAL, Macro::NEUTRAL);
    }
}

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline bool mentions_liquidity_stress(const std::string& description) {
    static const char* KEYWORDS[] = {"stress", "crisis", "crash", "illiquid"};
    std::string lower = to_lower(description);
    for (const char* kw : KEYWORDS) {
        if (lower.find(kw) != std::string::npos) return true;
    }
    return false;
}

// ---------------------------------------------------------------------------
// classify - deterministic regime assignment.
// Order: named window contained in the scenario name, then start year, then
// the medium/sideways default. Stress keywords in the description force
// stressed liquidity.
// ---------------------------------------------------------------------------
inline RegimeClassification classify(const std::string& scenario_name,
                                     const std::string& start_date,
                                     const std::string& end_date,
                                     const std::string& description = "") {
    auto [start, end] = time_utils::parse_date_range(start_date, end_date);
    (void)end;

    RegimeClassification rc;
    bool matched = false;
    for (const auto& w : canonical_windows()) {
        if (scenario_name.find(w.name) != std::string::npos) {
            rc = w.regime;
            matched = true;
            break;
        }
    }
    if (!matched) {
        rc = classify_by_year(time_utils::date_year(start));
    }
    if (mentions_liquidity_stress(description)) {
        rc.liquidity = Liquidity::STRESSED;
    }
    return rc;
}

inline std::vector<RegimeClassification> all_combinations() {
    std::vector<RegimeClassification> out;
    out.reserve(54);
    for (auto v : {Volatility::LOW, Volatility::MEDIUM, Volatility::HIGH}) {
        for (auto t : {Trend::UP, Trend::SIDEWAYS, Trend::DOWN}) {
            for (auto l : {Liquidity::NORMAL, Liquidity::STRESSED}) {
                for (auto m : {Macro::EASING, Macro::TIGHTENING, Macro::NEUTRAL}) {
                    out.push_back(make(v, t, l, m));
                }
            }
        }
    }
    return out;
}

// Inverse of RegimeClassification::regime_id(). Throws on unknown labels.
inline RegimeClassification parse_regime_id(const std::string& id) {
    for (const auto& rc : all_combinations()) {
        if (rc.regime_id() == id) return rc;
    }
    throw std::invalid_argument("unknown regime id '" + id + "'");
}

// ---------------------------------------------------------------------------
// coverage - count of items per regime, with every combination present so
// unexplored regimes show up as zero. Items need a `regime` member.
// ---------------------------------------------------------------------------
using Coverage = std::map<RegimeClassification, int>;

template <typename Items>
Coverage coverage(const Items& items) {
    Coverage cov;
    for (const auto& rc : all_combinations()) cov[rc] = 0;
    for (const auto& item : items) {
        ++cov[item.regime];
    }
    return cov;
}

inline std::vector<RegimeClassification> unexplored(const Coverage& cov) {
    std::vector<RegimeClassification> out;
    for (const auto& [rc, count] : cov) {
        if (count == 0) out.push_back(rc);
    }
    return out;
}

inline std::vector<RegimeWindow> windows_for(const RegimeClassification& rc) {
    std::vector<RegimeWindow> out;
    for (const auto& w : canonical_windows()) {
        if (w.regime == rc) out.push_back(w);
    }
    return out;
}

}  // namespace regime

// nlohmann ADL hooks
inline void to_json(nlohmann::json& j, const RegimeClassification& rc) {
    j = nlohmann::json{
        {"volatility", regime::to_string(rc.volatility)},
        {"trend", regime::to_string(rc.trend)},
        {"liquidity", regime::to_string(rc.liquidity)},
        {"macro", regime::to_string(rc.macro)},
    };
}

inline void from_json(const nlohmann::json& j, RegimeClassification& rc) {
    std::string id = j.at("volatility").get<std::string>() + "_"
                     + j.at("trend").get<std::string>() + "_"
                     + j.at("liquidity").get<std::string>() + "_"
                     + j.at("macro").get<std::string>();
    rc = regime::parse_regime_id(id);
    if (j.contains("description")) rc.description = j.at("description").get<std::string>();
}
