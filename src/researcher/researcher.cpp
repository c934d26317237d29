#include "researcher/researcher.hpp"

#include <algorithm>
#include <iomanip>
#include <set>
#include <utility>
#include <sstream>

#include "sandbox/network_policy.hpp"
#include "utils/common.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace autolab::researcher {
namespace {

struct ProposalFields {
    std::string description;
    std::string approach;
    std::string kind;
    std::string parameter;
    std::string values;
    std::string evaluation;
    std::string metric;
    std::string direction;
    std::string target;
    std::string expected;
};

bool IsFence(const std::string& line) {
    return utils::Trim(line).rfind("```", 0) == 0;
}

// Splits on lines consisting of "---" that sit outside fenced code.
std::vector<std::string> SplitBlocks(const std::string& response) {
    std::vector<std::string> blocks;
    std::istringstream stream(response);
    std::string line;
    std::string current;
    bool in_fence = false;
    while (std::getline(stream, line)) {
        if (IsFence(line)) {
            in_fence = !in_fence;
        }
        if (!in_fence && utils::Trim(line) == "---") {
            blocks.push_back(current);
            current.clear();
            continue;
        }
        current += line;
        current += "\n";
    }
    if (!utils::Trim(current).empty()) {
        blocks.push_back(current);
    }
    return blocks;
}

// Matches "KEY: value", tolerating markdown emphasis and list markers around the key.
bool ReadField(const std::string& line, const std::string& key, std::string& target) {
    auto trimmed = utils::Trim(line);
    const auto start = trimmed.find_first_not_of("*#- ");
    if (start == std::string::npos) {
        return false;
    }
    trimmed = trimmed.substr(start);
    if (trimmed.size() < key.size() + 1 || trimmed.compare(0, key.size(), key) != 0) {
        return false;
    }
    auto rest = trimmed.substr(key.size());
    const auto colon = rest.find_first_not_of("* ");
    if (colon == std::string::npos || rest[colon] != ':') {
        return false;
    }
    rest = rest.substr(colon + 1);
    const auto value_start = rest.find_first_not_of("* ");
    target = value_start == std::string::npos ? std::string{} : utils::Trim(rest.substr(value_start));
    return true;
}

ProposalFields ReadFields(const std::string& block) {
    ProposalFields fields{};
    const std::pair<std::string, std::string*> keys[] = {
        {"HYPOTHESIS", &fields.description},
        {"APPROACH", &fields.approach},
        {"KIND", &fields.kind},
        {"PARAMETER", &fields.parameter},
        {"VALUES", &fields.values},
        {"EVALUATION", &fields.evaluation},
        {"METRIC", &fields.metric},
        {"DIRECTION", &fields.direction},
        {"TARGET", &fields.target},
        {"EXPECTED", &fields.expected}
    };
    std::istringstream stream(block);
    std::string line;
    bool in_fence = false;
    while (std::getline(stream, line)) {
        if (IsFence(line)) {
            in_fence = !in_fence;
            continue;
        }
        if (in_fence) {
            continue;
        }
        for (const auto& [key, target] : keys) {
            if (ReadField(line, key, *target)) {
                break;
            }
        }
    }
    return fields;
}

EvaluationProcedure BuildEvaluation(const ProposalFields& fields) {
    EvaluationProcedure evaluation{};
    evaluation.metric = fields.metric;
    const auto parsed_kind = ParseEvaluationKind(fields.evaluation);
    if (parsed_kind) {
        evaluation.kind = *parsed_kind;
    } else if (!fields.metric.empty()) {
        evaluation.kind = EvaluationKind::kJsonMetric;
    } else if (!fields.expected.empty()) {
        evaluation.kind = EvaluationKind::kOutputContains;
    } else {
        evaluation.kind = EvaluationKind::kExitStatus;
    }
    evaluation.direction = ParseMetricDirection(fields.direction).value_or(MetricDirection::kMaximize);
    if (!fields.target.empty()) {
        try {
            evaluation.target = std::stod(fields.target);
        } catch (const std::exception&) {
            utils::LogDebug("researcher", "ignoring non-numeric target", {{"target", fields.target}});
        }
    }
    evaluation.expected_text = fields.expected;
    std::ostringstream description;
    description << ToString(evaluation.kind);
    if (!evaluation.metric.empty()) {
        description << " " << evaluation.metric << " (" << ToString(evaluation.direction) << ")";
    }
    if (evaluation.target) {
        description << " target " << *evaluation.target;
    }
    evaluation.description = description.str();
    return evaluation;
}

ExperimentProgram BuildProgram(const ProposalFields& fields, const std::string& code) {
    const auto kind = utils::ToLower(fields.kind);
    if (kind == "sweep" && !fields.parameter.empty()) {
        ParameterSweep sweep{};
        sweep.code_template = code;
        sweep.parameter = fields.parameter;
        sweep.values = utils::SplitCsv(fields.values);
        if (!sweep.values.empty() && code.find("{{" + sweep.parameter + "}}") != std::string::npos) {
            return sweep;
        }
    }
    return CodeExperiment{code};
}

}  // namespace

const char* ResearcherSystemPrompt() {
    return "You are an autonomous research scientist. You design small, self-contained computational "
           "experiments that test one idea each and report a measurable result.";
}

std::vector<std::string> ExtractCodeBlocks(const std::string& text) {
    std::vector<std::string> blocks;
    std::istringstream stream(text);
    std::string line;
    std::string current;
    bool in_fence = false;
    while (std::getline(stream, line)) {
        if (IsFence(line)) {
            if (in_fence) {
                blocks.push_back(current);
                current.clear();
            }
            in_fence = !in_fence;
            continue;
        }
        if (in_fence) {
            current += line;
            current += "\n";
        }
    }
    if (!blocks.empty()) {
        return blocks;
    }

    // No fences: take runs of lines indented by four spaces or a tab.
    std::istringstream indented(text);
    bool in_code = false;
    current.clear();
    while (std::getline(indented, line)) {
        if (line.rfind("    ", 0) == 0 || line.rfind("\t", 0) == 0) {
            in_code = true;
            current += line.substr(line[0] == '\t' ? 1 : 4);
            current += "\n";
        } else if (in_code && utils::Trim(line).empty()) {
            current += "\n";
        } else if (in_code) {
            blocks.push_back(current);
            current.clear();
            in_code = false;
        }
    }
    if (!current.empty()) {
        blocks.push_back(current);
    }
    return blocks;
}

std::vector<Hypothesis> ParseProposals(const std::string& response,
                                       const std::string& objective,
                                       std::size_t first_sequence) {
    std::vector<Hypothesis> hypotheses;
    for (const auto& block : SplitBlocks(response)) {
        const auto fields = ReadFields(block);
        if (fields.description.empty()) {
            continue;
        }
        const auto code_blocks = ExtractCodeBlocks(block);
        if (code_blocks.empty() || utils::Trim(code_blocks.front()).empty()) {
            utils::LogDebug("researcher", "proposal without code skipped",
                            {{"hypothesis", utils::Truncate(fields.description, 60)}});
            continue;
        }
        hypotheses.push_back(MakeHypothesis(
            objective,
            fields.description,
            fields.approach,
            BuildProgram(fields, code_blocks.front()),
            BuildEvaluation(fields),
            first_sequence + hypotheses.size()));
    }
    return hypotheses;
}

HypothesisGenerator::HypothesisGenerator(std::shared_ptr<providers::ReasoningBackend> backend,
                                         ResearcherSettings settings)
    : backend_(std::move(backend))
    , settings_(std::move(settings)) {}

std::string HypothesisGenerator::BuildPrompt(const std::string& objective,
                                             const std::vector<cognition::KnowledgeEntry>& knowledge,
                                             const std::vector<analyst::ScoredOutcome>& recent,
                                             std::size_t count) const {
    std::ostringstream prompt;
    prompt << "Research Objective: " << objective << "\n\n";

    prompt << "Relevant knowledge (most relevant first):\n";
    if (knowledge.empty()) {
        prompt << "(none yet)\n";
    }
    for (std::size_t i = 0; i < knowledge.size(); ++i) {
        const auto& entry = knowledge[i];
        prompt << i + 1 << ". [" << analyst::ToString(entry.classification) << ", quality "
               << std::setprecision(4) << entry.quality << "] " << utils::Truncate(entry.insight, 300) << "\n";
    }

    std::vector<std::string> successful;
    std::vector<std::string> failed;
    prompt << "\nRecent experiments:\n";
    if (recent.empty()) {
        prompt << "(none yet)\n";
    }
    for (const auto& outcome : recent) {
        prompt << "- [" << analyst::ToString(outcome.classification) << "] "
               << utils::Truncate(outcome.description, 120) << ": " << utils::Truncate(outcome.insight, 200) << "\n";
        const auto approach = outcome.approach.empty() ? outcome.description : outcome.approach;
        if (outcome.classification == analyst::Classification::kSuccess) {
            successful.push_back(utils::Truncate(approach, 80));
        } else if (outcome.classification == analyst::Classification::kFailure) {
            failed.push_back(utils::Truncate(approach, 80));
        }
    }
    prompt << "\nRecent patterns:\n"
           << "- Successful approaches: " << (successful.empty() ? "none" : utils::Join(successful, "; ")) << "\n"
           << "- Failed approaches: " << (failed.empty() ? "none" : utils::Join(failed, "; ")) << "\n\n";

    prompt << "Generate " << count << " specific, testable hypotheses for experiments. Each hypothesis must:\n"
           << "1. Be directly related to the research objective\n"
           << "2. Come with a complete, self-contained " << settings_.language
           << " program that uses only the standard library\n";
    if (!settings_.network_allowed) {
        prompt << "3. Never access the network\n";
    } else {
        prompt << "3. Avoid the network unless the objective requires it\n";
    }
    prompt << "4. Finish within a few seconds and print its result as one JSON object on the last line, "
           << "for example {\"accuracy\": 0.93}\n"
           << "5. Build on the knowledge above and avoid approaches that already failed\n\n"
           << "Format each hypothesis as:\n"
           << "HYPOTHESIS: [Brief description]\n"
           << "APPROACH: [Technical approach]\n"
           << "KIND: code | sweep\n"
           << "PARAMETER: [sweep only: parameter name, written as {{name}} inside the code]\n"
           << "VALUES: [sweep only: comma-separated values]\n"
           << "```python\n[complete program]\n```\n"
           << "EVALUATION: json_metric | metric_line | exit_status | output_contains\n"
           << "METRIC: [name of the reported metric]\n"
           << "DIRECTION: maximize | minimize\n"
           << "TARGET: [optional numeric goal]\n"
           << "EXPECTED: [output_contains only: text the output must contain]\n"
           << "---\n";
    return prompt.str();
}

std::vector<Hypothesis> HypothesisGenerator::Propose(const std::string& objective,
                                                     const std::vector<cognition::KnowledgeEntry>& knowledge,
                                                     const std::vector<analyst::ScoredOutcome>& recent,
                                                     std::size_t count,
                                                     std::size_t first_sequence) {
    count = std::max<std::size_t>(count, 1);
    if (!backend_) {
        throw utils::GenerationUnavailable("no reasoning backend configured");
    }
    const auto response = backend_->Complete(BuildPrompt(objective, knowledge, recent, count), settings_.temperature);
    auto candidates = ParseProposals(response, objective, first_sequence);
    if (candidates.empty()) {
        throw utils::GenerationUnavailable("backend response contained no parseable hypotheses");
    }

    std::set<std::string> failed_programs;
    std::set<std::string> failed_approaches;
    for (const auto& outcome : recent) {
        if (outcome.objective == objective && outcome.classification == analyst::Classification::kFailure) {
            failed_programs.insert(outcome.code_hash);
            if (!outcome.approach.empty()) {
                failed_approaches.insert(utils::ToLower(outcome.approach));
            }
        }
    }

    std::vector<Hypothesis> accepted;
    std::set<std::string> seen_ids;
    for (auto& candidate : candidates) {
        if (failed_programs.count(ProgramHash(candidate.program)) > 0) {
            utils::LogInfo("researcher", "dropped program that already failed", {{"hypothesis", candidate.id}});
            continue;
        }
        if (!seen_ids.insert(candidate.id).second) {
            continue;
        }
        if (!settings_.network_allowed) {
            if (const auto violation = sandbox::FindNetworkViolation(RenderProgram(candidate))) {
                utils::LogInfo("researcher", "dropped network-dependent program",
                               {{"hypothesis", candidate.id}, {"construct", *violation}});
                continue;
            }
        }
        accepted.push_back(std::move(candidate));
    }

    // Approaches that failed recently go last; otherwise keep the backend's order.
    std::stable_sort(accepted.begin(), accepted.end(), [&](const Hypothesis& lhs, const Hypothesis& rhs) {
        const bool lhs_failed = failed_approaches.count(utils::ToLower(lhs.approach)) > 0;
        const bool rhs_failed = failed_approaches.count(utils::ToLower(rhs.approach)) > 0;
        return !lhs_failed && rhs_failed;
    });
    if (accepted.size() > count) {
        accepted.resize(count);
    }
    if (accepted.empty()) {
        throw utils::GenerationUnavailable("every proposed hypothesis was filtered out");
    }
    for (std::size_t i = 0; i < accepted.size(); ++i) {
        accepted[i].sequence = first_sequence + i;
    }
    utils::LogInfo("researcher", "proposed hypotheses",
                   {{"requested", std::to_string(count)},
                    {"parsed", std::to_string(candidates.size())},
                    {"accepted", std::to_string(accepted.size())}});
    return accepted;
}

}  // namespace autolab::researcher
