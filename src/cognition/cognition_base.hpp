#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "analyst/outcome.hpp"
#include "cognition/knowledge_entry.hpp"
#include "nlohmann/json.hpp"
#include "sqlite3.h"

namespace autolab::cognition {

struct KnowledgeSettings {
    // Active entries per objective before the weakest are consolidated. At least 2.
    std::size_t capacity = 500;
    // Jaccard similarity of insight text at which two outcomes count as the same finding.
    double similarity_threshold = 0.8;
    // Merges after which an untouched entry's recency weight halves.
    double recency_half_life = 50.0;
};

struct MergeReport {
    std::size_t created = 0;
    std::size_t strengthened = 0;
    std::size_t redundant = 0;
    std::size_t already_known = 0;
    std::size_t consolidated = 0;
};

// Row and cache sizes, for monitoring growth.
struct StoreStats {
    std::size_t cached_entries = 0;
    std::size_t stored_entries = 0;
    std::size_t evidence_rows = 0;
    std::size_t fold_rows = 0;
    std::size_t outcomes = 0;
};

// Relevance of `entry` when the store is at merge sequence `merge_seq`.
double ComputeRelevance(const KnowledgeEntry& entry, std::uint64_t merge_seq, double half_life);

// Persistent outcome history plus the insights derived from it, kept in one SQLite
// database. Every mutation is a single transaction; an I/O error rolls it back and
// surfaces as utils::PersistenceFailure. Only active entries are cached in memory;
// superseded ones are read back from the database on demand.
class CognitionBase {
public:
    CognitionBase(std::filesystem::path db_path, KnowledgeSettings settings);
    ~CognitionBase();

    CognitionBase(const CognitionBase&) = delete;
    CognitionBase& operator=(const CognitionBase&) = delete;

    // Active entries for `objective`, most relevant first, ties by creation order.
    // Read-only. `top_k == 0` returns every active entry.
    std::vector<KnowledgeEntry> Retrieve(const std::string& objective, std::size_t top_k) const;

    // Appends `outcome` to the history and folds it into the entries. Returns the entry
    // created or strengthened; nullopt when the outcome was already known or redundant.
    std::optional<KnowledgeEntry> Merge(const analyst::ScoredOutcome& outcome);

    // Merges a whole batch in order and records `iteration` as completed, atomically.
    MergeReport MergeBatch(const std::vector<analyst::ScoredOutcome>& outcomes, int iteration);

    void MarkUsed(const std::vector<std::string>& entry_ids);

    bool HasOutcome(const std::string& outcome_id) const;
    std::optional<analyst::ScoredOutcome> GetOutcome(const std::string& outcome_id) const;
    // Newest last.
    std::vector<analyst::ScoredOutcome> RecentOutcomes(const std::string& objective, std::size_t count) const;
    // Successful or partial outcomes by descending quality.
    std::vector<analyst::ScoredOutcome> TopOutcomes(const std::string& objective, std::size_t count) const;
    std::size_t OutcomeCount(const std::string& objective) const;

    // Active or superseded.
    std::optional<KnowledgeEntry> GetEntry(const std::string& entry_id) const;
    // Every outcome behind the entry, through consolidations, in merge order.
    std::vector<std::string> Evidence(const std::string& entry_id) const;
    std::size_t ActiveEntryCount(const std::string& objective) const;
    StoreStats Stats() const;

    std::uint64_t MergeSequence() const;
    int LastCompletedIteration() const;
    const std::filesystem::path& Path() const { return db_path_; }

    nlohmann::json ExportJson(const std::string& objective) const;

private:
    void Open();
    void EnsureSchema();
    void LoadCache();
    void Exec(const std::string& sql);
    void Begin();
    void Commit();
    void RollbackAndReload();

    std::optional<KnowledgeEntry> MergeLocked(const analyst::ScoredOutcome& outcome, MergeReport& report);
    bool HasOutcomeLocked(const std::string& outcome_id) const;
    void InsertOutcome(const analyst::ScoredOutcome& outcome);
    void WriteEntry(const KnowledgeEntry& entry);
    void WriteEvidence(const std::string& entry_id, const std::string& outcome_id, std::size_t position);
    void WriteFold(const std::string& consolidated_id, const std::string& entry_id, std::size_t position);
    std::vector<KnowledgeEntry> QueryEntries(const std::string& where, const std::string& param) const;
    std::optional<KnowledgeEntry> LoadEntryLocked(const std::string& entry_id) const;
    void AttachLineage(KnowledgeEntry& entry) const;
    std::size_t CountRows(const std::string& table) const;
    void WriteMeta(const std::string& key, const std::string& value);
    void RecomputeRelevance(const std::string& objective);
    std::size_t ConsolidateIfNeeded(const std::string& objective);
    std::vector<KnowledgeEntry*> ActiveEntriesLocked(const std::string& objective);
    std::vector<analyst::ScoredOutcome> QueryOutcomes(const std::string& sql,
                                                      const std::string& objective,
                                                      std::size_t count) const;

    std::filesystem::path db_path_;
    KnowledgeSettings settings_;
    sqlite3* db_ = nullptr;
    mutable std::mutex mutex_;
    // Active entries of every objective, by id.
    std::map<std::string, KnowledgeEntry> entries_;
    std::uint64_t merge_seq_ = 0;
    std::uint64_t entry_seq_ = 0;
    int last_completed_iteration_ = 0;
};

}  // namespace autolab::cognition
