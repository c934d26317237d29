#include "orchestrator/report_writer.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>

#include "utils/common.hpp"
#include "utils/errors.hpp"
#include "utils/json_utils.hpp"

namespace autolab::orchestrator {

nlohmann::json ToJson(const researcher::Hypothesis& hypothesis) {
    nlohmann::json program;
    if (const auto* code = std::get_if<researcher::CodeExperiment>(&hypothesis.program)) {
        program = {{"kind", "code"}, {"code", code->code}};
    } else {
        const auto& sweep = std::get<researcher::ParameterSweep>(hypothesis.program);
        program = {
            {"kind", "sweep"},
            {"code_template", sweep.code_template},
            {"parameter", sweep.parameter},
            {"values", sweep.values}
        };
    }
    const auto& evaluation = hypothesis.evaluation;
    nlohmann::json eval = {
        {"kind", researcher::ToString(evaluation.kind)},
        {"metric", evaluation.metric},
        {"direction", researcher::ToString(evaluation.direction)},
        {"expected_text", evaluation.expected_text},
        {"description", evaluation.description}
    };
    eval["target"] = evaluation.target ? nlohmann::json(*evaluation.target) : nlohmann::json(nullptr);
    return {
        {"id", hypothesis.id},
        {"objective", hypothesis.objective},
        {"description", hypothesis.description},
        {"approach", hypothesis.approach},
        {"program", std::move(program)},
        {"evaluation", std::move(eval)},
        {"created_at", hypothesis.created_at},
        {"sequence", hypothesis.sequence}
    };
}

void ArchiveExperiment(const std::filesystem::path& dir,
                       const researcher::Hypothesis& hypothesis,
                       const analyst::ScoredOutcome& outcome) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw utils::PersistenceFailure("cannot create experiment archive: " + ec.message());
    }
    const nlohmann::json record = {
        {"hypothesis", ToJson(hypothesis)},
        {"outcome", analyst::ToJson(outcome)}
    };
    std::ofstream out(dir / (outcome.id + ".json"), std::ios::binary | std::ios::trunc);
    out << utils::DumpJson(record, 2) << "\n";
    if (!out) {
        throw utils::PersistenceFailure("failed to archive experiment " + outcome.id);
    }
}

std::string RenderResearchReport(const Checkpoint& checkpoint,
                                 const std::vector<cognition::KnowledgeEntry>& knowledge) {
    std::ostringstream report;
    report << "RESEARCH REPORT\n"
           << std::string(60, '=') << "\n\n"
           << "Objective: " << checkpoint.objective << "\n"
           << "Status: " << ToString(checkpoint.status);
    if (!checkpoint.termination_reason.empty()) {
        report << " (" << checkpoint.termination_reason << ")";
    }
    report << "\n"
           << "Total Iterations: " << checkpoint.iteration << "\n"
           << "Total Experiments: " << checkpoint.total_experiments << "\n"
           << "Research Time: " << std::fixed << std::setprecision(1) << checkpoint.elapsed_seconds << "s\n\n";

    report << "TOP DISCOVERIES:\n" << std::string(40, '-') << "\n";
    if (checkpoint.best_results.empty()) {
        report << "(none yet)\n";
    }
    for (std::size_t i = 0; i < checkpoint.best_results.size() && i < 10; ++i) {
        const auto& result = checkpoint.best_results[i];
        report << i + 1 << ". " << result.description << " (Score: " << std::setprecision(2) << result.quality
               << ", iteration " << result.iteration << ")\n";
    }

    report << "\nKEY INSIGHTS:\n" << std::string(40, '-') << "\n";
    if (knowledge.empty()) {
        report << "(none yet)\n";
    }
    for (std::size_t i = 0; i < knowledge.size(); ++i) {
        const auto& entry = knowledge[i];
        report << i + 1 << ". [" << analyst::ToString(entry.classification) << "] "
               << utils::Truncate(entry.insight, 200) << " (" << entry.support << " experiments)\n";
    }
    return report.str();
}

void WriteResearchReport(const std::filesystem::path& path,
                         const Checkpoint& checkpoint,
                         const std::vector<cognition::KnowledgeEntry>& knowledge) {
    std::ofstream out(path, std::ios::trunc);
    out << RenderResearchReport(checkpoint, knowledge);
    if (!out) {
        throw utils::PersistenceFailure("failed to write research report " + path.string());
    }
}

}  // namespace autolab::orchestrator
