#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "analyst/outcome.hpp"
#include "cognition/knowledge_entry.hpp"
#include "providers/reasoning_backend.hpp"
#include "researcher/hypothesis.hpp"
#include "sandbox/sandbox.hpp"

namespace autolab::analyst {

// Metric read from a completed run, before classification.
struct MetricReading {
    std::optional<double> value;
    // The program reported an "error" field in its JSON result.
    bool reported_error = false;
};

// Reads the metric named by `evaluation` from `stdout_text`. Sweeps report the best
// value by direction, plain experiments the last one printed.
MetricReading ExtractMetric(const researcher::EvaluationProcedure& evaluation,
                            const std::string& stdout_text,
                            bool is_sweep);

// System prompt for the optional interpretation backend.
const char* AnalystSystemPrompt();

class Analyst {
public:
    // `interpreter` is only consulted by Interpret(); scoring never calls it.
    explicit Analyst(std::shared_ptr<providers::ReasoningBackend> interpreter = nullptr,
                     std::string analysis_depth = "basic");

    // Pure function of its inputs: identical arguments give identical outcomes.
    ScoredOutcome Score(const researcher::Hypothesis& hypothesis,
                        const sandbox::ExecutionVerdict& verdict,
                        const std::string& objective,
                        const std::vector<cognition::KnowledgeEntry>& knowledge) const;

    bool InterpretationEnabled() const;

    // Asks the backend for commentary on `outcome` and stores it in `interpretation`.
    // Backend failures leave the outcome untouched.
    void Interpret(const researcher::Hypothesis& hypothesis, ScoredOutcome& outcome) const;

    static std::string SummarizeIteration(const std::vector<ScoredOutcome>& outcomes);

private:
    std::shared_ptr<providers::ReasoningBackend> interpreter_;
    std::string analysis_depth_;
};

}  // namespace autolab::analyst
