#pragma once

#include <memory>
#include <string>
#include <vector>

#include "analyst/outcome.hpp"
#include "cognition/knowledge_entry.hpp"
#include "providers/reasoning_backend.hpp"
#include "researcher/hypothesis.hpp"

namespace autolab::researcher {

struct ResearcherSettings {
    double temperature = 0.7;
    // Language the generated programs are written in; must match the sandbox interpreter.
    std::string language = "Python 3";
    bool network_allowed = false;
};

// System prompt handed to the reasoning backend for hypothesis generation.
const char* ResearcherSystemPrompt();

// Fenced ``` blocks in `text`; falls back to indented code when there are none.
std::vector<std::string> ExtractCodeBlocks(const std::string& text);

// Parses the HYPOTHESIS/APPROACH/... block format. Blocks missing a description or a
// program are skipped. Ids are derived from `objective`; sequence numbers start at
// `first_sequence` in response order.
std::vector<Hypothesis> ParseProposals(const std::string& response,
                                       const std::string& objective,
                                       std::size_t first_sequence = 0);

class HypothesisGenerator {
public:
    HypothesisGenerator(std::shared_ptr<providers::ReasoningBackend> backend, ResearcherSettings settings);

    // Up to `count` new hypotheses. Never returns a program already scored as a failure
    // in `recent`, a duplicate within the batch, or (unless allowed) one that reaches
    // for the network. Throws utils::GenerationUnavailable when nothing usable remains.
    std::vector<Hypothesis> Propose(const std::string& objective,
                                    const std::vector<cognition::KnowledgeEntry>& knowledge,
                                    const std::vector<analyst::ScoredOutcome>& recent,
                                    std::size_t count,
                                    std::size_t first_sequence = 0);

    std::string BuildPrompt(const std::string& objective,
                            const std::vector<cognition::KnowledgeEntry>& knowledge,
                            const std::vector<analyst::ScoredOutcome>& recent,
                            std::size_t count) const;

private:
    std::shared_ptr<providers::ReasoningBackend> backend_;
    ResearcherSettings settings_;
};

}  // namespace autolab::researcher
