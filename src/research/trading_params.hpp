#pragma once

#include "research/errors.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <cmath>
#include <map>
#include <string>
#include <utility>

// ---------------------------------------------------------------------------
// TradingParams - one parameter set. Defaults are the balanced archetype.
// ---------------------------------------------------------------------------
struct TradingParams {
    double trust_threshold = 0.65;
    double min_confidence = 0.75;
    double max_position_size = 0.10;
    double stop_loss = 0.05;
    double take_profit = 0.15;
    int cooldown_period = 2;  // bars blocked for re-entry after an exit

    bool operator==(const TradingParams& o) const {
        return trust_threshold == o.trust_threshold && min_confidence == o.min_confidence
               && max_position_size == o.max_position_size && stop_loss == o.stop_loss
               && take_profit == o.take_profit && cooldown_period == o.cooldown_period;
    }
    bool operator!=(const TradingParams& o) const { return !(*this == o); }
};

namespace trading_params {

constexpr std::array<const char*, 6> PARAMETER_NAMES = {
    "trust_threshold", "min_confidence", "max_position_size",
    "stop_loss", "take_profit", "cooldown_period",
};

constexpr int MAX_COOLDOWN = 365;
constexpr double MAX_TAKE_PROFIT = 10.0;

inline TradingParams aggressive() {
    return TradingParams{0.55, 0.70, 0.15, 0.08, 0.20, 2};
}

inline TradingParams balanced() {
    return TradingParams{};
}

inline TradingParams conservative() {
    return TradingParams{0.75, 0.80, 0.05, 0.03, 0.10, 2};
}

inline std::map<std::string, TradingParams> archetypes() {
    return {
        {"aggressive", aggressive()},
        {"balanced", balanced()},
        {"conservative", conservative()},
    };
}

inline bool is_parameter_name(const std::string& name) {
    for (const char* p : PARAMETER_NAMES) {
        if (name == p) return true;
    }
    return false;
}

inline double parameter_value(const TradingParams& p, const std::string& name) {
    if (name == "trust_threshold")   return p.trust_threshold;
    if (name == "min_confidence")    return p.min_confidence;
    if (name == "max_position_size") return p.max_position_size;
    if (name == "stop_loss")         return p.stop_loss;
    if (name == "take_profit")       return p.take_profit;
    if (name == "cooldown_period")   return static_cast<double>(p.cooldown_period);
    throw std::invalid_argument("unknown parameter '" + name + "'");
}

inline void set_parameter(TradingParams& p, const std::string& name, double value) {
    if (name == "trust_threshold")        p.trust_threshold = value;
    else if (name == "min_confidence")    p.min_confidence = value;
    else if (name == "max_position_size") p.max_position_size = value;
    else if (name == "stop_loss")         p.stop_loss = value;
    else if (name == "take_profit")       p.take_profit = value;
    else if (name == "cooldown_period")   p.cooldown_period = static_cast<int>(std::lround(value));
    else throw std::invalid_argument("unknown parameter '" + name + "'");
}

// Valid closed/open bounds per parameter, as [lo, hi] used for clipping grids.
inline std::pair<double, double> parameter_bounds(const std::string& name) {
    if (name == "trust_threshold" || name == "min_confidence") return {0.0, 1.0};
    if (name == "max_position_size") return {0.01, 1.0};
    if (name == "stop_loss")         return {0.005, 0.99};
    if (name == "take_profit")       return {0.005, MAX_TAKE_PROFIT};
    if (name == "cooldown_period")   return {0.0, static_cast<double>(MAX_COOLDOWN)};
    throw std::invalid_argument("unknown parameter '" + name + "'");
}

// Throws InvalidScenarioError naming the offending field.
inline void validate(const TradingParams& p, const std::string& label = "params") {
    auto fail = [&](const std::string& field, double v) {
        throw InvalidScenarioError(label + "." + field + " out of range: " + std::to_string(v));
    };
    if (!(p.trust_threshold >= 0.0 && p.trust_threshold <= 1.0))
        fail("trust_threshold", p.trust_threshold);
    if (!(p.min_confidence >= 0.0 && p.min_confidence <= 1.0))
        fail("min_confidence", p.min_confidence);
    if (!(p.max_position_size > 0.0 && p.max_position_size <= 1.0))
        fail("max_position_size", p.max_position_size);
    if (!(p.stop_loss > 0.0 && p.stop_loss < 1.0))
        fail("stop_loss", p.stop_loss);
    if (!(p.take_profit > 0.0 && p.take_profit <= MAX_TAKE_PROFIT))
        fail("take_profit", p.take_profit);
    if (p.cooldown_period < 0 || p.cooldown_period > MAX_COOLDOWN)
        fail("cooldown_period", p.cooldown_period);
}

}  // namespace trading_params

// nlohmann ADL hooks. from_json rejects unknown keys and validates ranges.
inline void to_json(nlohmann::json& j, const TradingParams& p) {
    j = nlohmann::json{
        {"trust_threshold", p.trust_threshold},
        {"min_confidence", p.min_confidence},
        {"max_position_size", p.max_position_size},
        {"stop_loss", p.stop_loss},
        {"take_profit", p.take_profit},
        {"cooldown_period", p.cooldown_period},
    };
}

inline void from_json(const nlohmann::json& j, TradingParams& p) {
    if (!j.is_object()) {
        throw InvalidScenarioError("parameter set must be an object");
    }
    TradingParams out;
    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& key = it.key();
        const auto& value = it.value();
        if (!trading_params::is_parameter_name(key)) {
            throw InvalidScenarioError("unknown parameter key '" + key + "'");
        }
        if (!value.is_number()) {
            throw InvalidScenarioError("parameter '" + key + "' must be numeric");
        }
        if (key == "cooldown_period" && !value.is_number_integer()) {
            throw InvalidScenarioError("cooldown_period must be an integer");
        }
        trading_params::set_parameter(out, key, value.get<double>());
    }
    trading_params::validate(out);
    p = out;
}
