#pragma once

#include "research/regime_ontology.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

enum class ProposalType { PARAMETER_GAP, REGIME_TEST, HYPOTHESIS_TEST, UNCERTAINTY_REDUCTION };

inline const char* proposal_type_str(ProposalType t) {
    switch (t) {
        case ProposalType::PARAMETER_GAP:         return "parameter_gap";
        case ProposalType::REGIME_TEST:           return "regime_test";
        case ProposalType::HYPOTHESIS_TEST:       return "hypothesis_test";
        case ProposalType::UNCERTAINTY_REDUCTION: return "uncertainty_reduction";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// ExperimentProposal - a suggested next experiment, ranked by information gain
// ---------------------------------------------------------------------------
struct ExperimentProposal {
    std::string proposal_id;
    ProposalType type = ProposalType::REGIME_TEST;
    std::string target;
    double expected_info_gain = 0.0;
    int priority = 1;
    std::string rationale;
    std::vector<std::string> insight_ids;

    // Machine-readable target used to build scenarios from the proposal.
    std::optional<RegimeClassification> target_regime;
    std::optional<std::string> parameter_name;
    std::optional<double> parameter_value;
};

// ---------------------------------------------------------------------------
// GenerationHints - bias for the scenario generator derived from insights
// ---------------------------------------------------------------------------
struct GenerationHints {
    std::string parameter_name;  // empty when no parameter region is hinted
    double center_value = 0.0;
    std::vector<RegimeClassification> covered_regimes;
    std::vector<std::string> insight_ids;

    bool empty() const { return parameter_name.empty(); }
};

inline void to_json(nlohmann::json& j, const ExperimentProposal& p) {
    j = nlohmann::json{
        {"proposal_id", p.proposal_id},
        {"type", proposal_type_str(p.type)},
        {"target", p.target},
        {"expected_info_gain", p.expected_info_gain},
        {"priority", p.priority},
        {"rationale", p.rationale},
        {"insight_ids", p.insight_ids},
    };
    j["target_regime_id"] = p.target_regime ? nlohmann::json(p.target_regime->regime_id())
                                            : nlohmann::json(nullptr);
    j["parameter_name"] = p.parameter_name ? nlohmann::json(*p.parameter_name)
                                           : nlohmann::json(nullptr);
    j["parameter_value"] = p.parameter_value ? nlohmann::json(*p.parameter_value)
                                             : nlohmann::json(nullptr);
}
