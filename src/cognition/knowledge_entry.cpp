#include "cognition/knowledge_entry.hpp"

namespace autolab::cognition {

nlohmann::json ToJson(const KnowledgeEntry& entry) {
    return {
        {"id", entry.id},
        {"objective", entry.objective},
        {"classification", analyst::ToString(entry.classification)},
        {"insight", entry.insight},
        {"code_hash", entry.code_hash},
        {"approach", entry.approach},
        {"quality", entry.quality},
        {"relevance", entry.relevance},
        {"usage_count", entry.usage_count},
        {"created_seq", entry.created_seq},
        {"updated_seq", entry.updated_seq},
        {"evidence", entry.evidence},
        {"supersedes", entry.supersedes},
        {"support", entry.support},
        {"superseded_by", entry.superseded_by},
        {"consolidated", entry.consolidated}
    };
}

}  // namespace autolab::cognition
