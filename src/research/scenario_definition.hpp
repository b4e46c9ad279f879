#pragma once

#include "research/content_hash.hpp"
#include "research/errors.hpp"
#include "research/regime_ontology.hpp"
#include "research/trading_params.hpp"
#include "time_utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <map>
#include <optional>
#include <string>
#include <vector>

constexpr const char* GENERATOR_VERSION = "1.0.0";

// ---------------------------------------------------------------------------
// ScenarioDefinition - an immutable experiment: a date window, a symbol
// universe and one or more named parameter sets. Identity is the content hash
// of everything except the lineage pointer.
// ---------------------------------------------------------------------------
struct ScenarioDefinition {
    std::string name;
    std::string description;
    std::string start_date;  // YYYY-MM-DD
    std::string end_date;    // YYYY-MM-DD
    std::vector<std::string> symbols;
    std::map<std::string, TradingParams> param_sets;
    RegimeClassification regime;
    std::string generator_version = GENERATOR_VERSION;
    std::optional<std::string> parent_scenario_id;

    // Canonical form: object keys sorted, symbols sorted, parameter sets
    // ordered by name. Stable across runs and processes.
    std::string canonical_serialization() const {
        std::vector<std::string> sorted_symbols = symbols;
        std::sort(sorted_symbols.begin(), sorted_symbols.end());
        nlohmann::json j;
        j["name"] = name;
        j["description"] = description;
        j["start_date"] = start_date;
        j["end_date"] = end_date;
        j["symbols"] = sorted_symbols;
        j["param_sets"] = param_sets;
        j["regime"] = regime;
        j["generator_version"] = generator_version;
        return j.dump();
    }

    std::string scenario_id() const {
        return content_hash::short_id(canonical_serialization());
    }

    int start() const { return time_utils::parse_iso_date(start_date); }
    int end() const { return time_utils::parse_iso_date(end_date); }
};

namespace scenario {

// Throws InvalidRangeError for bad dates, InvalidScenarioError otherwise.
inline void validate(const ScenarioDefinition& s) {
    if (s.name.empty()) {
        throw InvalidScenarioError("scenario name is empty");
    }
    time_utils::parse_date_range(s.start_date, s.end_date);
    if (s.symbols.empty()) {
        throw InvalidScenarioError("scenario '" + s.name + "' has no symbols");
    }
    for (const auto& sym : s.symbols) {
        if (sym.empty()) throw InvalidScenarioError("scenario '" + s.name + "' has an empty symbol");
    }
    if (s.param_sets.empty()) {
        throw InvalidScenarioError("scenario '" + s.name + "' has no parameter sets");
    }
    for (const auto& [label, params] : s.param_sets) {
        if (label.empty()) throw InvalidScenarioError("parameter set with empty name");
        trading_params::validate(params, label);
    }
}

}  // namespace scenario

// nlohmann ADL hooks. The persisted form adds scenario_id and lineage.
inline void to_json(nlohmann::json& j, const ScenarioDefinition& s) {
    j = nlohmann::json{
        {"scenario_id", s.scenario_id()},
        {"name", s.name},
        {"description", s.description},
        {"start_date", s.start_date},
        {"end_date", s.end_date},
        {"symbols", s.symbols},
        {"param_sets", s.param_sets},
        {"regime", s.regime},
        {"regime_id", s.regime.regime_id()},
        {"generator_version", s.generator_version},
    };
    if (s.parent_scenario_id) {
        j["parent_scenario_id"] = *s.parent_scenario_id;
    } else {
        j["parent_scenario_id"] = nullptr;
    }
}

// Reads a definition document. When "regime" is absent it is classified from
// the name, dates and description.
inline void from_json(const nlohmann::json& j, ScenarioDefinition& s) {
    static const char* KNOWN_KEYS[] = {
        "scenario_id", "name", "description", "start_date", "end_date", "symbols",
        "param_sets", "regime", "regime_id", "generator_version", "parent_scenario_id",
    };
    if (!j.is_object()) throw InvalidScenarioError("scenario must be an object");
    for (auto it = j.begin(); it != j.end(); ++it) {
        bool known = false;
        for (const char* k : KNOWN_KEYS) {
            if (it.key() == k) { known = true; break; }
        }
        if (!known) throw InvalidScenarioError("unknown scenario key '" + it.key() + "'");
    }

    ScenarioDefinition out;
    try {
        out.name = j.at("name").get<std::string>();
        out.description = j.value("description", std::string());
        out.start_date = j.at("start_date").get<std::string>();
        out.end_date = j.at("end_date").get<std::string>();
        out.symbols = j.at("symbols").get<std::vector<std::string>>();
        out.generator_version = j.value("generator_version", std::string(GENERATOR_VERSION));
    } catch (const nlohmann::json::exception& e) {
        throw InvalidScenarioError(std::string("malformed scenario: ") + e.what());
    }
    if (!j.contains("param_sets") || !j.at("param_sets").is_object()) {
        throw InvalidScenarioError("scenario '" + out.name + "' needs a param_sets object");
    }
    for (auto it = j.at("param_sets").begin(); it != j.at("param_sets").end(); ++it) {
        out.param_sets[it.key()] = it.value().get<TradingParams>();
    }
    if (j.contains("regime") && !j.at("regime").is_null()) {
        out.regime = j.at("regime").get<RegimeClassification>();
    } else {
        out.regime = regime::classify(out.name, out.start_date, out.end_date, out.description);
    }
    if (j.contains("parent_scenario_id") && j.at("parent_scenario_id").is_string()) {
        out.parent_scenario_id = j.at("parent_scenario_id").get<std::string>();
    }
    s = out;
}
