#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "analyst/outcome.hpp"
#include "nlohmann/json.hpp"

namespace autolab::cognition {

// A generalized insight backed by one or more scored outcomes. Entries are never
// rewritten in place: merges strengthen them, consolidation supersedes them.
struct KnowledgeEntry {
    std::string id;
    std::string objective;
    analyst::Classification classification = analyst::Classification::kInconclusive;
    std::string insight;
    std::string code_hash;
    std::string approach;
    // Best quality among the supporting outcomes.
    double quality = 0.0;
    double relevance = 0.0;
    int usage_count = 0;
    std::uint64_t created_seq = 0;
    std::uint64_t updated_seq = 0;
    // Outcomes merged into this entry directly, in merge order. Outcomes behind the
    // entries it supersedes are reached through `supersedes`.
    std::vector<std::string> evidence;
    // Entries folded into this one by consolidation.
    std::vector<std::string> supersedes;
    // Outcomes supporting the entry, folded ones included.
    std::size_t support = 0;
    // Id of the consolidated entry that replaced this one; empty while active.
    std::string superseded_by;
    bool consolidated = false;

    bool IsActive() const { return superseded_by.empty(); }
};

nlohmann::json ToJson(const KnowledgeEntry& entry);

}  // namespace autolab::cognition
