#pragma once

#include <optional>
#include <string>

#include "nlohmann/json.hpp"
#include "sandbox/sandbox.hpp"

namespace autolab::analyst {

enum class Classification {
    kSuccess,
    kPartial,
    kFailure,
    kInconclusive
};

const char* ToString(Classification classification);
std::optional<Classification> ParseClassification(const std::string& value);

struct ScoredOutcome {
    // "o-" + hypothesis id.
    std::string id;
    std::string hypothesis_id;
    std::string objective;
    std::string description;
    std::string approach;
    std::string code_hash;
    sandbox::ExecutionVerdict verdict;
    Classification classification = Classification::kInconclusive;
    // Higher is better. Only comparable between outcomes of the same objective.
    double quality = 0.0;
    std::optional<double> metric_value;
    std::string insight;
    // Free-form backend commentary; never feeds classification or quality.
    std::string interpretation;
    int iteration = 0;
    std::string scored_at;
};

std::string MakeOutcomeId(const std::string& hypothesis_id);

nlohmann::json ToJson(const ScoredOutcome& outcome);
ScoredOutcome OutcomeFromJson(const nlohmann::json& json);

}  // namespace autolab::analyst
