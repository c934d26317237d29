#include "analyst/analyst.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <regex>
#include <sstream>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace autolab::analyst {
namespace {

struct FailureAnalysis {
    std::string cause;
    std::vector<std::string> suggestions;
};

std::string FormatNumber(double value) {
    std::ostringstream oss;
    oss << std::setprecision(6) << value;
    return oss.str();
}

std::vector<std::string> SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }
    return lines;
}

std::string LastNonEmptyLine(const std::string& text) {
    const auto lines = SplitLines(text);
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        const auto trimmed = utils::Trim(*it);
        if (!trimmed.empty()) {
            return trimmed;
        }
    }
    return {};
}

std::vector<nlohmann::json> CollectJsonObjects(const std::string& stdout_text) {
    std::vector<nlohmann::json> objects;
    for (const auto& line : SplitLines(stdout_text)) {
        const auto trimmed = utils::Trim(line);
        if (trimmed.size() < 2 || trimmed.front() != '{' || trimmed.back() != '}') {
            continue;
        }
        auto parsed = nlohmann::json::parse(trimmed, nullptr, false);
        if (!parsed.is_discarded() && parsed.is_object()) {
            objects.push_back(std::move(parsed));
        }
    }
    if (objects.empty()) {
        // Pretty-printed result spanning several lines.
        auto parsed = nlohmann::json::parse(utils::Trim(stdout_text), nullptr, false);
        if (!parsed.is_discarded() && parsed.is_object()) {
            objects.push_back(std::move(parsed));
        }
    }
    return objects;
}

std::optional<double> LookupPath(const nlohmann::json& root, const std::string& dotted_path) {
    const nlohmann::json* node = &root;
    std::istringstream stream(dotted_path);
    std::string key;
    while (std::getline(stream, key, '.')) {
        if (!node->is_object() || !node->contains(key)) {
            return std::nullopt;
        }
        node = &(*node)[key];
    }
    if (!node->is_number()) {
        return std::nullopt;
    }
    return node->get<double>();
}

bool ReportsError(const nlohmann::json& object) {
    if (!object.contains("error")) {
        return false;
    }
    const auto& error = object["error"];
    if (error.is_null() || (error.is_boolean() && !error.get<bool>())) {
        return false;
    }
    return !(error.is_string() && error.get<std::string>().empty());
}

std::string EscapeRegex(const std::string& text) {
    static const std::string kSpecial = R"(\^$.|?*+()[]{})";
    std::string escaped;
    for (const char c : text) {
        if (kSpecial.find(c) != std::string::npos) {
            escaped.push_back('\\');
        }
        escaped.push_back(c);
    }
    return escaped;
}

std::vector<double> ReadMetricLines(const std::string& metric, const std::string& stdout_text) {
    std::vector<double> values;
    if (metric.empty()) {
        return values;
    }
    const std::regex pattern("(^|[^A-Za-z0-9_])" + EscapeRegex(metric)
                             + R"(\s*[:=]\s*([-+]?(?:[0-9]+\.?[0-9]*|\.[0-9]+)(?:[eE][-+]?[0-9]+)?))");
    for (const auto& line : SplitLines(stdout_text)) {
        for (auto it = std::sregex_iterator(line.begin(), line.end(), pattern); it != std::sregex_iterator(); ++it) {
            try {
                values.push_back(std::stod((*it)[2].str()));
            } catch (const std::out_of_range&) {
                continue;
            }
        }
    }
    return values;
}

bool MeetsTarget(const researcher::EvaluationProcedure& evaluation, double value) {
    if (!evaluation.target) {
        return true;
    }
    return evaluation.direction == researcher::MetricDirection::kMaximize
        ? value >= *evaluation.target
        : value <= *evaluation.target;
}

double QualityFromMetric(const researcher::EvaluationProcedure& evaluation, double value) {
    if (evaluation.direction == researcher::MetricDirection::kMaximize) {
        return value;
    }
    return 1.0 / (1.0 + std::max(value, 0.0));
}

FailureAnalysis AnalyzeFailure(const sandbox::ExecutionVerdict& verdict) {
    using sandbox::TerminatedReason;
    switch (verdict.terminated_reason) {
        case TerminatedReason::kTimeout:
            return {"algorithm complexity too high for the time limit",
                    {"reduce problem size", "optimize the algorithm", "prefer an asymptotically faster approach"}};
        case TerminatedReason::kMemoryExceeded:
            return {"excessive memory usage",
                    {"use memory-efficient data structures", "process data in chunks", "reduce data size"}};
        case TerminatedReason::kBlockedNetworkAccess:
            return {"program attempted network access",
                    {"keep experiments self-contained", "generate input data locally"}};
        case TerminatedReason::kCompleted:
        case TerminatedReason::kCrashed:
            break;
    }
    if (verdict.sandbox_fault) {
        return {"sandbox fault: " + verdict.diagnostic, {"check the sandbox configuration"}};
    }
    const auto lowered = utils::ToLower(verdict.stderr_text);
    if (lowered.find("syntaxerror") != std::string::npos || lowered.find("nameerror") != std::string::npos
        || lowered.find("indentationerror") != std::string::npos) {
        return {"code generation issue",
                {"validate generated code", "add error handling", "keep programs short and self-contained"}};
    }
    if (lowered.find("modulenotfounderror") != std::string::npos || lowered.find("importerror") != std::string::npos) {
        return {"missing module", {"restrict programs to the standard library"}};
    }
    if (!verdict.diagnostic.empty()) {
        return {verdict.diagnostic, {"simplify the experiment"}};
    }
    return {"program crashed", {"add error handling", "simplify the experiment"}};
}

std::string CompareWithKnowledge(const std::string& objective,
                                 double quality,
                                 const std::vector<cognition::KnowledgeEntry>& knowledge) {
    std::optional<double> best;
    for (const auto& entry : knowledge) {
        if (entry.objective != objective || !entry.IsActive()) {
            continue;
        }
        if (entry.classification != Classification::kSuccess && entry.classification != Classification::kPartial) {
            continue;
        }
        if (!best || entry.quality > *best) {
            best = entry.quality;
        }
    }
    if (!best) {
        return "first scored result for this objective";
    }
    if (quality > *best) {
        return "beats best known quality " + FormatNumber(*best);
    }
    if (quality == *best) {
        return "matches best known quality " + FormatNumber(*best);
    }
    return "below best known quality " + FormatNumber(*best);
}

}  // namespace

MetricReading ExtractMetric(const researcher::EvaluationProcedure& evaluation,
                            const std::string& stdout_text,
                            bool is_sweep) {
    MetricReading reading{};
    std::vector<double> values;
    if (evaluation.kind == researcher::EvaluationKind::kJsonMetric) {
        for (const auto& object : CollectJsonObjects(stdout_text)) {
            reading.reported_error = reading.reported_error || ReportsError(object);
            auto value = LookupPath(object, evaluation.metric);
            if (!value) {
                value = LookupPath(object, "output." + evaluation.metric);
            }
            if (value) {
                values.push_back(*value);
            }
        }
    } else if (evaluation.kind == researcher::EvaluationKind::kMetricLine) {
        values = ReadMetricLines(evaluation.metric, stdout_text);
    }
    values.erase(std::remove_if(values.begin(), values.end(), [](double v) { return !std::isfinite(v); }),
                 values.end());
    if (values.empty()) {
        return reading;
    }
    if (!is_sweep) {
        reading.value = values.back();
    } else if (evaluation.direction == researcher::MetricDirection::kMaximize) {
        reading.value = *std::max_element(values.begin(), values.end());
    } else {
        reading.value = *std::min_element(values.begin(), values.end());
    }
    return reading;
}

Analyst::Analyst(std::shared_ptr<providers::ReasoningBackend> interpreter, std::string analysis_depth)
    : interpreter_(std::move(interpreter))
    , analysis_depth_(std::move(analysis_depth)) {}

ScoredOutcome Analyst::Score(const researcher::Hypothesis& hypothesis,
                             const sandbox::ExecutionVerdict& verdict,
                             const std::string& objective,
                             const std::vector<cognition::KnowledgeEntry>& knowledge) const {
    using researcher::EvaluationKind;

    ScoredOutcome outcome{};
    outcome.id = MakeOutcomeId(hypothesis.id);
    outcome.hypothesis_id = hypothesis.id;
    outcome.objective = objective;
    outcome.description = hypothesis.description;
    outcome.approach = hypothesis.approach;
    outcome.code_hash = researcher::ProgramHash(hypothesis.program);
    outcome.verdict = verdict;

    std::ostringstream insight;
    if (!hypothesis.approach.empty()) {
        insight << "Approach '" << hypothesis.approach << "': ";
    }

    if (verdict.terminated_reason != sandbox::TerminatedReason::kCompleted) {
        const auto analysis = AnalyzeFailure(verdict);
        outcome.classification = Classification::kFailure;
        outcome.quality = 0.0;
        insight << "failed (" << sandbox::ToString(verdict.terminated_reason) << "): " << analysis.cause
                << ". Suggestions: " << utils::Join(analysis.suggestions, "; ") << ".";
        const auto last_error = LastNonEmptyLine(verdict.stderr_text);
        if (!last_error.empty()) {
            insight << " Last error: " << utils::Truncate(last_error, 160);
        }
        outcome.insight = insight.str();
        return outcome;
    }

    const auto& evaluation = hypothesis.evaluation;
    const bool clean_exit = verdict.exit_code == 0;
    const double time_quality = 1.0 / (1.0 + std::max(verdict.elapsed_seconds, 0.0));

    switch (evaluation.kind) {
        case EvaluationKind::kJsonMetric:
        case EvaluationKind::kMetricLine: {
            const auto reading = ExtractMetric(evaluation, verdict.stdout_text, hypothesis.IsSweep());
            if (!reading.value) {
                outcome.classification = Classification::kInconclusive;
                insight << "inconclusive: could not read metric '" << evaluation.metric
                        << "' from output (exit status " << verdict.exit_code << ").";
                const auto last_error = LastNonEmptyLine(verdict.stderr_text);
                if (!last_error.empty()) {
                    insight << " Last error: " << utils::Truncate(last_error, 160);
                }
                break;
            }
            const double value = *reading.value;
            const bool meets = MeetsTarget(evaluation, value);
            outcome.metric_value = value;
            outcome.classification = (meets && clean_exit && !reading.reported_error)
                ? Classification::kSuccess
                : Classification::kPartial;
            outcome.quality = QualityFromMetric(evaluation, value);
            insight << evaluation.metric << "=" << FormatNumber(value) << " ("
                    << researcher::ToString(evaluation.direction);
            if (evaluation.target) {
                insight << ", target " << FormatNumber(*evaluation.target) << (meets ? " met" : " missed");
            }
            insight << ")";
            if (!clean_exit) {
                insight << ", exit status " << verdict.exit_code;
            }
            if (reading.reported_error) {
                insight << ", program reported an error";
            }
            break;
        }
        case EvaluationKind::kExitStatus:
            outcome.classification = clean_exit ? Classification::kSuccess : Classification::kPartial;
            outcome.quality = time_quality;
            insight << "exit status " << verdict.exit_code << " after "
                    << FormatNumber(verdict.elapsed_seconds) << "s";
            break;
        case EvaluationKind::kOutputContains:
            if (evaluation.expected_text.empty()) {
                outcome.classification = Classification::kInconclusive;
                insight << "inconclusive: no expected output to check.";
                break;
            }
            if (verdict.stdout_text.find(evaluation.expected_text) != std::string::npos) {
                outcome.classification = clean_exit ? Classification::kSuccess : Classification::kPartial;
                insight << "output contains '" << utils::Truncate(evaluation.expected_text, 60) << "'";
            } else {
                outcome.classification = Classification::kPartial;
                insight << "output lacks '" << utils::Truncate(evaluation.expected_text, 60) << "'";
            }
            outcome.quality = time_quality;
            break;
    }

    if (outcome.classification == Classification::kPartial && outcome.quality > 0.0) {
        outcome.quality *= 0.5;
    }
    if (outcome.classification == Classification::kSuccess || outcome.classification == Classification::kPartial) {
        insight << "; quality " << FormatNumber(outcome.quality) << ", "
                << CompareWithKnowledge(objective, outcome.quality, knowledge) << ".";
    }
    outcome.insight = insight.str();
    return outcome;
}

const char* AnalystSystemPrompt() {
    return "You are a research analyst. You read the result of one computational experiment and explain "
           "briefly what it shows. Never restate the raw output.";
}

bool Analyst::InterpretationEnabled() const {
    return interpreter_ && (analysis_depth_ == "moderate" || analysis_depth_ == "deep");
}

void Analyst::Interpret(const researcher::Hypothesis& hypothesis, ScoredOutcome& outcome) const {
    if (!InterpretationEnabled()) {
        return;
    }
    std::ostringstream prompt;
    prompt << "Analyze this experimental result:\n\n"
           << "Hypothesis: " << hypothesis.description << "\n"
           << "Evaluation: " << hypothesis.evaluation.description << "\n\n"
           << "Result:\n"
           << "Classification: " << ToString(outcome.classification) << "\n"
           << "Terminated: " << sandbox::ToString(outcome.verdict.terminated_reason) << "\n"
           << "Output: " << utils::Truncate(outcome.verdict.stdout_text, 500) << "\n"
           << "Elapsed seconds: " << FormatNumber(outcome.verdict.elapsed_seconds) << "\n\n"
           << "In a few sentences give the key findings, patterns observed";
    if (analysis_depth_ == "deep") {
        prompt << ", theoretical implications";
    }
    prompt << " and suggestions for next experiments.";
    try {
        outcome.interpretation = utils::Truncate(utils::Trim(interpreter_->Complete(prompt.str(), 0.3)), 1000);
    } catch (const utils::GenerationUnavailable& ex) {
        utils::LogWarn("analyst", "interpretation unavailable", {{"outcome", outcome.id}, {"error", ex.what()}});
    }
}

std::string Analyst::SummarizeIteration(const std::vector<ScoredOutcome>& outcomes) {
    if (outcomes.empty()) {
        return "No experiments completed in this iteration.";
    }
    std::size_t counts[4] = {0, 0, 0, 0};
    const ScoredOutcome* best = nullptr;
    for (const auto& outcome : outcomes) {
        ++counts[static_cast<int>(outcome.classification)];
        if (!best || outcome.quality > best->quality) {
            best = &outcome;
        }
    }
    const auto total = outcomes.size();
    const double success_rate = 100.0 * static_cast<double>(counts[0]) / static_cast<double>(total);
    std::ostringstream oss;
    oss << "Completed " << total << " experiments (" << counts[0] << " success, " << counts[1] << " partial, "
        << counts[2] << " failure, " << counts[3] << " inconclusive) | Success rate: " << std::fixed
        << std::setprecision(1) << success_rate << "%";
    if (best && (best->classification == Classification::kSuccess
                 || best->classification == Classification::kPartial)) {
        oss << " | Best result: " << utils::Truncate(best->description, 50) << " (quality: "
            << std::setprecision(2) << best->quality << ")";
    }
    return oss.str();
}

}  // namespace autolab::analyst
