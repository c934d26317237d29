#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace autolab::researcher {

enum class EvaluationKind {
    kJsonMetric,
    kMetricLine,
    kExitStatus,
    kOutputContains
};

enum class MetricDirection {
    kMaximize,
    kMinimize
};

const char* ToString(EvaluationKind kind);
const char* ToString(MetricDirection direction);
std::optional<EvaluationKind> ParseEvaluationKind(const std::string& value);
std::optional<MetricDirection> ParseMetricDirection(const std::string& value);

// How the Analyst turns a completed run into a classification.
struct EvaluationProcedure {
    EvaluationKind kind = EvaluationKind::kJsonMetric;
    // Dotted path into the last JSON object on stdout, or the name of a metric line.
    std::string metric;
    MetricDirection direction = MetricDirection::kMaximize;
    std::optional<double> target;
    std::string expected_text;
    std::string description;
};

struct CodeExperiment {
    std::string code;
};

// Runs `code_template` once per value, with every "{{parameter}}" substituted.
struct ParameterSweep {
    std::string code_template;
    std::string parameter;
    std::vector<std::string> values;
};

using ExperimentProgram = std::variant<CodeExperiment, ParameterSweep>;

struct Hypothesis {
    std::string id;
    std::string objective;
    std::string description;
    std::string approach;
    ExperimentProgram program;
    EvaluationProcedure evaluation;
    std::string created_at;
    // Creation order within a batch; scoring and merging follow it.
    std::size_t sequence = 0;

    bool IsSweep() const { return std::holds_alternative<ParameterSweep>(program); }
};

// Source text handed to the interpreter. Uniform across program kinds.
std::string RenderProgram(const ExperimentProgram& program);
std::string RenderProgram(const Hypothesis& hypothesis);

// First 16 hex chars of SHA-256 over the rendered program.
std::string ProgramHash(const ExperimentProgram& program);

// Content-derived: the same program for the same objective always gets the same id.
std::string MakeHypothesisId(const std::string& objective, const ExperimentProgram& program);

// Builds a hypothesis with its id and timestamp filled in.
Hypothesis MakeHypothesis(std::string objective,
                          std::string description,
                          std::string approach,
                          ExperimentProgram program,
                          EvaluationProcedure evaluation,
                          std::size_t sequence = 0);

}  // namespace autolab::researcher
