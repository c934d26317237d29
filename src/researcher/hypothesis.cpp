#include "researcher/hypothesis.hpp"

#include <sstream>
#include <utility>

#include "utils/common.hpp"

namespace autolab::researcher {
namespace {

std::string ReplaceAll(std::string text, const std::string& needle, const std::string& replacement) {
    if (needle.empty()) {
        return text;
    }
    std::size_t pos = 0;
    while ((pos = text.find(needle, pos)) != std::string::npos) {
        text.replace(pos, needle.size(), replacement);
        pos += replacement.size();
    }
    return text;
}

}  // namespace

const char* ToString(EvaluationKind kind) {
    switch (kind) {
        case EvaluationKind::kJsonMetric: return "json_metric";
        case EvaluationKind::kMetricLine: return "metric_line";
        case EvaluationKind::kExitStatus: return "exit_status";
        case EvaluationKind::kOutputContains: return "output_contains";
    }
    return "json_metric";
}

const char* ToString(MetricDirection direction) {
    return direction == MetricDirection::kMinimize ? "minimize" : "maximize";
}

std::optional<EvaluationKind> ParseEvaluationKind(const std::string& value) {
    const auto lowered = utils::ToLower(utils::Trim(value));
    if (lowered == "json_metric" || lowered == "json") {
        return EvaluationKind::kJsonMetric;
    }
    if (lowered == "metric_line" || lowered == "line") {
        return EvaluationKind::kMetricLine;
    }
    if (lowered == "exit_status" || lowered == "exit") {
        return EvaluationKind::kExitStatus;
    }
    if (lowered == "output_contains" || lowered == "contains") {
        return EvaluationKind::kOutputContains;
    }
    return std::nullopt;
}

std::optional<MetricDirection> ParseMetricDirection(const std::string& value) {
    const auto lowered = utils::ToLower(utils::Trim(value));
    if (lowered.rfind("max", 0) == 0 || lowered == "higher") {
        return MetricDirection::kMaximize;
    }
    if (lowered.rfind("min", 0) == 0 || lowered == "lower") {
        return MetricDirection::kMinimize;
    }
    return std::nullopt;
}

std::string RenderProgram(const ExperimentProgram& program) {
    if (const auto* code = std::get_if<CodeExperiment>(&program)) {
        return code->code;
    }
    const auto& sweep = std::get<ParameterSweep>(program);
    const auto placeholder = "{{" + sweep.parameter + "}}";
    std::ostringstream oss;
    for (std::size_t i = 0; i < sweep.values.size(); ++i) {
        if (i > 0) {
            oss << "\n";
        }
        oss << ReplaceAll(sweep.code_template, placeholder, sweep.values[i]) << "\n";
    }
    return oss.str();
}

std::string RenderProgram(const Hypothesis& hypothesis) {
    return RenderProgram(hypothesis.program);
}

std::string ProgramHash(const ExperimentProgram& program) {
    return utils::Sha256Hex(RenderProgram(program)).substr(0, 16);
}

std::string MakeHypothesisId(const std::string& objective, const ExperimentProgram& program) {
    return "h-" + utils::Sha256Hex(objective + "\n" + RenderProgram(program)).substr(0, 16);
}

Hypothesis MakeHypothesis(std::string objective,
                          std::string description,
                          std::string approach,
                          ExperimentProgram program,
                          EvaluationProcedure evaluation,
                          std::size_t sequence) {
    Hypothesis hypothesis{};
    hypothesis.id = MakeHypothesisId(objective, program);
    hypothesis.objective = std::move(objective);
    hypothesis.description = std::move(description);
    hypothesis.approach = std::move(approach);
    hypothesis.program = std::move(program);
    hypothesis.evaluation = std::move(evaluation);
    hypothesis.created_at = utils::NowIso();
    hypothesis.sequence = sequence;
    return hypothesis;
}

}  // namespace autolab::researcher
