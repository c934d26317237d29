#include "analyst/outcome.hpp"

namespace autolab::analyst {

const char* ToString(Classification classification) {
    switch (classification) {
        case Classification::kSuccess: return "success";
        case Classification::kPartial: return "partial";
        case Classification::kFailure: return "failure";
        case Classification::kInconclusive: return "inconclusive";
    }
    return "inconclusive";
}

std::optional<Classification> ParseClassification(const std::string& value) {
    if (value == "success") {
        return Classification::kSuccess;
    }
    if (value == "partial") {
        return Classification::kPartial;
    }
    if (value == "failure") {
        return Classification::kFailure;
    }
    if (value == "inconclusive") {
        return Classification::kInconclusive;
    }
    return std::nullopt;
}

std::string MakeOutcomeId(const std::string& hypothesis_id) {
    return "o-" + hypothesis_id;
}

nlohmann::json ToJson(const ScoredOutcome& outcome) {
    nlohmann::json json = {
        {"id", outcome.id},
        {"hypothesis_id", outcome.hypothesis_id},
        {"objective", outcome.objective},
        {"description", outcome.description},
        {"approach", outcome.approach},
        {"code_hash", outcome.code_hash},
        {"verdict", sandbox::ToJson(outcome.verdict)},
        {"classification", ToString(outcome.classification)},
        {"quality", outcome.quality},
        {"insight", outcome.insight},
        {"interpretation", outcome.interpretation},
        {"iteration", outcome.iteration},
        {"scored_at", outcome.scored_at}
    };
    json["metric_value"] = outcome.metric_value ? nlohmann::json(*outcome.metric_value) : nlohmann::json(nullptr);
    return json;
}

ScoredOutcome OutcomeFromJson(const nlohmann::json& json) {
    ScoredOutcome outcome{};
    outcome.id = json.value("id", "");
    outcome.hypothesis_id = json.value("hypothesis_id", "");
    outcome.objective = json.value("objective", "");
    outcome.description = json.value("description", "");
    outcome.approach = json.value("approach", "");
    outcome.code_hash = json.value("code_hash", "");
    if (json.contains("verdict") && json["verdict"].is_object()) {
        outcome.verdict = sandbox::VerdictFromJson(json["verdict"]);
    }
    outcome.classification = ParseClassification(json.value("classification", ""))
        .value_or(Classification::kInconclusive);
    outcome.quality = json.value("quality", 0.0);
    if (json.contains("metric_value") && json["metric_value"].is_number()) {
        outcome.metric_value = json["metric_value"].get<double>();
    }
    outcome.insight = json.value("insight", "");
    outcome.interpretation = json.value("interpretation", "");
    outcome.iteration = json.value("iteration", 0);
    outcome.scored_at = json.value("scored_at", "");
    return outcome;
}

}  // namespace autolab::analyst
