#pragma once

#include "research/content_hash.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

enum class InsightType { WINNING_PATTERN, FAILURE_MODE, REGIME_HEURISTIC };
enum class EvidenceStatus { PRELIMINARY, STRONG };

inline const char* insight_type_str(InsightType t) {
    switch (t) {
        case InsightType::WINNING_PATTERN:  return "winning_pattern";
        case InsightType::FAILURE_MODE:     return "failure_mode";
        case InsightType::REGIME_HEURISTIC: return "regime_heuristic";
    }
    return "unknown";
}

inline InsightType parse_insight_type(const std::string& s) {
    if (s == "winning_pattern")  return InsightType::WINNING_PATTERN;
    if (s == "failure_mode")     return InsightType::FAILURE_MODE;
    if (s == "regime_heuristic") return InsightType::REGIME_HEURISTIC;
    throw std::invalid_argument("unknown insight type '" + s + "'");
}

inline const char* evidence_status_str(EvidenceStatus s) {
    return s == EvidenceStatus::STRONG ? "STRONG" : "PRELIMINARY";
}

// ---------------------------------------------------------------------------
// ConfidenceFormula - the single place confidence is computed. Constants are
// versioned; a change of constants must bump `version`.
// ---------------------------------------------------------------------------
struct ConfidenceFormula {
    int version = 1;
    double base_offset = 0.3;
    double per_scenario = 0.1;
    double per_regime = 0.05;
    double regime_bonus_cap = 0.2;
    double robustness_weight = 0.2;
    double per_contradiction = 0.1;
    double contradiction_cap = 0.3;
    double weak_below = 0.5;
    int strong_min_scenarios = 3;
    int strong_min_regimes = 2;
};

struct InsightConfidence {
    int num_supporting_scenarios = 0;
    std::vector<std::string> regime_coverage;
    double parameter_robustness = 0.0;
    int contradiction_count = 0;
    bool has_been_contradicted = false;
};

// ---------------------------------------------------------------------------
// StrategyInsight - one learned pattern. Evidence lists only grow; each
// mutation produces a new revision.
// ---------------------------------------------------------------------------
struct StrategyInsight {
    std::string insight_id;
    InsightType type = InsightType::WINNING_PATTERN;
    std::string description;
    std::vector<std::string> supporting_scenario_ids;
    std::vector<std::string> contradicting_scenario_ids;
    std::map<std::string, double> evidence_metrics;
    InsightConfidence confidence_meta;
    double confidence = 0.0;
    bool is_weak = true;
    int revision = 0;
    int formula_version = 1;

    // Optional structured subject used to bias generation.
    std::string parameter_name;
    double parameter_value = 0.0;
};

namespace insight {

inline std::string make_id(InsightType type, const std::string& description) {
    return content_hash::short_id(std::string(insight_type_str(type)) + "|" + description);
}

inline double compute_confidence(const InsightConfidence& c,
                                 const ConfidenceFormula& f = ConfidenceFormula{}) {
    double base = std::min(1.0, f.base_offset + f.per_scenario * c.num_supporting_scenarios);
    double regime_bonus = std::min(f.regime_bonus_cap,
                                   f.per_regime * static_cast<double>(c.regime_coverage.size()));
    double robustness_bonus = f.robustness_weight * std::clamp(c.parameter_robustness, 0.0, 1.0);
    double contradiction_penalty = std::min(f.contradiction_cap,
                                            f.per_contradiction * c.contradiction_count);
    return std::clamp(base + regime_bonus + robustness_bonus - contradiction_penalty, 0.0, 1.0);
}

inline EvidenceStatus evidence_status(const InsightConfidence& c,
                                      const ConfidenceFormula& f = ConfidenceFormula{}) {
    bool strong = c.num_supporting_scenarios >= f.strong_min_scenarios
                  && static_cast<int>(c.regime_coverage.size()) >= f.strong_min_regimes;
    return strong ? EvidenceStatus::STRONG : EvidenceStatus::PRELIMINARY;
}

inline EvidenceStatus evidence_status(const StrategyInsight& s,
                                      const ConfidenceFormula& f = ConfidenceFormula{}) {
    return evidence_status(s.confidence_meta, f);
}

inline void refresh(StrategyInsight& s, const ConfidenceFormula& f = ConfidenceFormula{}) {
    s.confidence_meta.num_supporting_scenarios =
        static_cast<int>(s.supporting_scenario_ids.size());
    s.confidence = compute_confidence(s.confidence_meta, f);
    s.is_weak = s.confidence < f.weak_below;
    s.formula_version = f.version;
}

inline bool append_unique(std::vector<std::string>& v, const std::string& item) {
    if (item.empty() || std::find(v.begin(), v.end(), item) != v.end()) return false;
    v.push_back(item);
    return true;
}

}  // namespace insight

inline void to_json(nlohmann::json& j, const InsightConfidence& c) {
    j = nlohmann::json{
        {"num_supporting_scenarios", c.num_supporting_scenarios},
        {"regime_coverage", c.regime_coverage},
        {"parameter_robustness", c.parameter_robustness},
        {"contradiction_count", c.contradiction_count},
        {"has_been_contradicted", c.has_been_contradicted},
    };
}

inline void from_json(const nlohmann::json& j, InsightConfidence& c) {
    c.num_supporting_scenarios = j.at("num_supporting_scenarios").get<int>();
    c.regime_coverage = j.at("regime_coverage").get<std::vector<std::string>>();
    c.parameter_robustness = j.at("parameter_robustness").get<double>();
    c.contradiction_count = j.at("contradiction_count").get<int>();
    c.has_been_contradicted = j.at("has_been_contradicted").get<bool>();
}

inline void to_json(nlohmann::json& j, const StrategyInsight& s) {
    j = nlohmann::json{
        {"insight_id", s.insight_id},
        {"type", insight_type_str(s.type)},
        {"description", s.description},
        {"supporting_scenario_ids", s.supporting_scenario_ids},
        {"contradicting_scenario_ids", s.contradicting_scenario_ids},
        {"evidence_metrics", s.evidence_metrics},
        {"confidence_meta", s.confidence_meta},
        {"confidence", s.confidence},
        {"is_weak", s.is_weak},
        {"evidence_status", evidence_status_str(insight::evidence_status(s))},
        {"revision", s.revision},
        {"formula_version", s.formula_version},
        {"parameter_name", s.parameter_name},
        {"parameter_value", s.parameter_value},
    };
}

inline void from_json(const nlohmann::json& j, StrategyInsight& s) {
    s.insight_id = j.at("insight_id").get<std::string>();
    s.type = parse_insight_type(j.at("type").get<std::string>());
    s.description = j.at("description").get<std::string>();
    s.supporting_scenario_ids = j.at("supporting_scenario_ids").get<std::vector<std::string>>();
    s.contradicting_scenario_ids =
        j.at("contradicting_scenario_ids").get<std::vector<std::string>>();
    s.evidence_metrics = j.at("evidence_metrics").get<std::map<std::string, double>>();
    s.confidence_meta = j.at("confidence_meta").get<InsightConfidence>();
    s.confidence = j.at("confidence").get<double>();
    s.is_weak = j.at("is_weak").get<bool>();
    s.revision = j.at("revision").get<int>();
    s.formula_version = j.at("formula_version").get<int>();
    s.parameter_name = j.value("parameter_name", std::string());
    s.parameter_value = j.value("parameter_value", 0.0);
}
