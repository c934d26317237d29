#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "analyst/outcome.hpp"
#include "cognition/knowledge_entry.hpp"
#include "orchestrator/checkpoint.hpp"
#include "researcher/hypothesis.hpp"

namespace autolab::orchestrator {

nlohmann::json ToJson(const researcher::Hypothesis& hypothesis);

// Writes <dir>/<outcome-id>.json holding the hypothesis and its scored outcome.
void ArchiveExperiment(const std::filesystem::path& dir,
                       const researcher::Hypothesis& hypothesis,
                       const analyst::ScoredOutcome& outcome);

std::string RenderResearchReport(const Checkpoint& checkpoint,
                                 const std::vector<cognition::KnowledgeEntry>& knowledge);

void WriteResearchReport(const std::filesystem::path& path,
                         const Checkpoint& checkpoint,
                         const std::vector<cognition::KnowledgeEntry>& knowledge);

}  // namespace autolab::orchestrator
