#pragma once

#include "time_utils.hpp"

#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// Error types. Input validation errors derive from std::invalid_argument,
// environment and runtime failures from std::runtime_error.
// ---------------------------------------------------------------------------

// InvalidRangeError (malformed date or end < start) lives in time_utils.hpp.

// Scenario definition or parameter set that fails validation.
struct InvalidScenarioError : std::invalid_argument {
    explicit InvalidScenarioError(const std::string& msg) : std::invalid_argument(msg) {}
};

// A symbol or range has no usable history. Recovered locally as a skipped result.
struct DataUnavailableError : std::runtime_error {
    explicit DataUnavailableError(const std::string& msg) : std::runtime_error(msg) {}
};

// The history store itself cannot be opened or parsed.
struct DataStoreUnavailableError : std::runtime_error {
    explicit DataStoreUnavailableError(const std::string& msg) : std::runtime_error(msg) {}
};

// A memory commit raced another writer for the same insight id.
struct ConcurrentMutationConflict : std::runtime_error {
    explicit ConcurrentMutationConflict(const std::string& msg) : std::runtime_error(msg) {}
};

// Re-running a scenario id produced different results.
struct NonDeterminismDetected : std::runtime_error {
    explicit NonDeterminismDetected(const std::string& msg) : std::runtime_error(msg) {}
};

inline const char* error_kind(const std::exception& e) {
    if (dynamic_cast<const InvalidRangeError*>(&e)) return "InvalidRangeError";
    if (dynamic_cast<const InvalidScenarioError*>(&e)) return "InvalidScenarioError";
    if (dynamic_cast<const DataUnavailableError*>(&e)) return "DataUnavailableError";
    if (dynamic_cast<const DataStoreUnavailableError*>(&e)) return "DataStoreUnavailableError";
    if (dynamic_cast<const ConcurrentMutationConflict*>(&e)) return "ConcurrentMutationConflict";
    if (dynamic_cast<const NonDeterminismDetected*>(&e)) return "NonDeterminismDetected";
    return "Error";
}
