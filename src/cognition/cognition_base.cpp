#include "cognition/cognition_base.hpp"

#include <algorithm>
#include <cmath>
#include <set>

#include "utils/common.hpp"
#include "utils/errors.hpp"
#include "utils/json_utils.hpp"
#include "utils/logging.hpp"

namespace autolab::cognition {
namespace {

constexpr double kPi = 3.14159265358979323846;

std::string SafeText(const unsigned char* text) {
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

// Owns one prepared statement; any sqlite error becomes a PersistenceFailure.
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql)
        : db_(db) {
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            throw utils::PersistenceFailure("sqlite prepare failed: " + std::string(sqlite3_errmsg(db_)));
        }
    }

    ~Statement() {
        sqlite3_finalize(stmt_);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void BindText(int index, const std::string& value) {
        Check(sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT));
    }

    void BindReal(int index, double value) {
        Check(sqlite3_bind_double(stmt_, index, value));
    }

    void BindInt(int index, std::int64_t value) {
        Check(sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)));
    }

    void BindNull(int index) {
        Check(sqlite3_bind_null(stmt_, index));
    }

    // True while rows are available.
    bool Step() {
        const auto rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc == SQLITE_DONE) {
            return false;
        }
        throw utils::PersistenceFailure("sqlite step failed: " + std::string(sqlite3_errmsg(db_)));
    }

    void Reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    std::string Text(int column) const { return SafeText(sqlite3_column_text(stmt_, column)); }
    double Real(int column) const { return sqlite3_column_double(stmt_, column); }
    std::int64_t Int(int column) const { return sqlite3_column_int64(stmt_, column); }

private:
    void Check(int rc) {
        if (rc != SQLITE_OK) {
            throw utils::PersistenceFailure("sqlite bind failed: " + std::string(sqlite3_errmsg(db_)));
        }
    }

    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_ = nullptr;
};

double ClassWeight(analyst::Classification classification) {
    switch (classification) {
        case analyst::Classification::kSuccess: return 1.0;
        case analyst::Classification::kPartial: return 0.6;
        case analyst::Classification::kInconclusive: return 0.3;
        case analyst::Classification::kFailure: return 0.2;
    }
    return 0.2;
}

// Maps any quality onto (0, 1) while preserving order.
double Squash(double quality) {
    return 0.5 + std::atan(quality) / kPi;
}

bool Strengthens(analyst::Classification classification) {
    return classification == analyst::Classification::kSuccess
        || classification == analyst::Classification::kPartial;
}

constexpr const char* kEntryColumns =
    "id, objective, classification, insight, code_hash, approach, quality, relevance, usage_count, "
    "created_seq, updated_seq, superseded_by, consolidated, support";

// Expects the columns of kEntryColumns, in order.
KnowledgeEntry ReadEntryRow(const Statement& row) {
    KnowledgeEntry entry{};
    entry.id = row.Text(0);
    entry.objective = row.Text(1);
    entry.classification = analyst::ParseClassification(row.Text(2)).value_or(analyst::Classification::kInconclusive);
    entry.insight = row.Text(3);
    entry.code_hash = row.Text(4);
    entry.approach = row.Text(5);
    entry.quality = row.Real(6);
    entry.relevance = row.Real(7);
    entry.usage_count = static_cast<int>(row.Int(8));
    entry.created_seq = static_cast<std::uint64_t>(row.Int(9));
    entry.updated_seq = static_cast<std::uint64_t>(row.Int(10));
    entry.superseded_by = row.Text(11);
    entry.consolidated = row.Int(12) != 0;
    entry.support = static_cast<std::size_t>(row.Int(13));
    return entry;
}

bool RanksBefore(const KnowledgeEntry& lhs, const KnowledgeEntry& rhs) {
    if (lhs.relevance != rhs.relevance) {
        return lhs.relevance > rhs.relevance;
    }
    return lhs.created_seq < rhs.created_seq;
}

}  // namespace

double ComputeRelevance(const KnowledgeEntry& entry, std::uint64_t merge_seq, double half_life) {
    const double age = merge_seq > entry.updated_seq ? static_cast<double>(merge_seq - entry.updated_seq) : 0.0;
    const double decay = half_life > 0.0 ? std::exp(-std::log(2.0) * age / half_life) : 1.0;
    return ClassWeight(entry.classification) * Squash(entry.quality) * decay * (1.0 + 0.1 * entry.usage_count);
}

CognitionBase::CognitionBase(std::filesystem::path db_path, KnowledgeSettings settings)
    : db_path_(std::move(db_path))
    , settings_(settings) {
    settings_.capacity = std::max<std::size_t>(settings_.capacity, 2);
    Open();
    EnsureSchema();
    LoadCache();
    utils::LogInfo("knowledge", "opened knowledge store",
                   {{"path", db_path_.string()},
                    {"entries", std::to_string(entries_.size())},
                    {"merge_seq", std::to_string(merge_seq_)}});
}

CognitionBase::~CognitionBase() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void CognitionBase::Open() {
    if (db_path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(db_path_.parent_path(), ec);
        if (ec) {
            throw utils::PersistenceFailure("cannot create knowledge directory: " + ec.message());
        }
    }
    if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
        const std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw utils::PersistenceFailure("failed to open knowledge store " + db_path_.string() + ": " + message);
    }
    sqlite3_busy_timeout(db_, 5000);
}

void CognitionBase::EnsureSchema() {
    Exec("PRAGMA journal_mode=WAL;");
    Exec("PRAGMA synchronous=FULL;");
    Exec("PRAGMA foreign_keys=ON;");
    Exec("CREATE TABLE IF NOT EXISTS outcomes ("
         "id TEXT PRIMARY KEY,"
         "hypothesis_id TEXT NOT NULL,"
         "objective TEXT NOT NULL,"
         "classification TEXT NOT NULL,"
         "quality REAL NOT NULL,"
         "code_hash TEXT,"
         "iteration INTEGER,"
         "merge_seq INTEGER NOT NULL,"
         "payload TEXT NOT NULL"
         ");");
    Exec("CREATE INDEX IF NOT EXISTS idx_outcomes_objective ON outcomes(objective, merge_seq);");
    Exec("CREATE TABLE IF NOT EXISTS entries ("
         "id TEXT PRIMARY KEY,"
         "objective TEXT NOT NULL,"
         "classification TEXT NOT NULL,"
         "insight TEXT,"
         "code_hash TEXT,"
         "approach TEXT,"
         "quality REAL NOT NULL,"
         "relevance REAL NOT NULL,"
         "usage_count INTEGER NOT NULL DEFAULT 0,"
         "created_seq INTEGER NOT NULL,"
         "updated_seq INTEGER NOT NULL,"
         "superseded_by TEXT NOT NULL DEFAULT '',"
         "consolidated INTEGER NOT NULL DEFAULT 0,"
         "support INTEGER NOT NULL DEFAULT 0"
         ");");
    Exec("CREATE INDEX IF NOT EXISTS idx_entries_rank "
         "ON entries(objective, superseded_by, relevance DESC, created_seq ASC);");
    Exec("CREATE TABLE IF NOT EXISTS evidence ("
         "entry_id TEXT NOT NULL REFERENCES entries(id),"
         "outcome_id TEXT NOT NULL REFERENCES outcomes(id),"
         "position INTEGER NOT NULL,"
         "PRIMARY KEY(entry_id, outcome_id)"
         ");");
    // Entries a consolidated entry replaced; their evidence stays with them.
    Exec("CREATE TABLE IF NOT EXISTS folds ("
         "consolidated_id TEXT NOT NULL REFERENCES entries(id),"
         "entry_id TEXT NOT NULL REFERENCES entries(id),"
         "position INTEGER NOT NULL,"
         "PRIMARY KEY(consolidated_id, entry_id)"
         ");");
    Exec("CREATE TABLE IF NOT EXISTS meta ("
         "key TEXT PRIMARY KEY,"
         "value TEXT NOT NULL"
         ");");
}

void CognitionBase::LoadCache() {
    entries_.clear();
    merge_seq_ = 0;
    entry_seq_ = 0;
    last_completed_iteration_ = 0;

    for (auto& entry : QueryEntries("superseded_by = ''", "")) {
        entries_.emplace(entry.id, std::move(entry));
    }
    Statement last_entry(db_, "SELECT COALESCE(MAX(created_seq), 0) FROM entries;");
    if (last_entry.Step()) {
        entry_seq_ = static_cast<std::uint64_t>(last_entry.Int(0));
    }

    Statement meta(db_, "SELECT key, value FROM meta;");
    while (meta.Step()) {
        const auto key = meta.Text(0);
        const auto value = meta.Text(1);
        try {
            if (key == "merge_seq") {
                merge_seq_ = std::stoull(value);
            } else if (key == "last_completed_iteration") {
                last_completed_iteration_ = std::stoi(value);
            }
        } catch (const std::exception& ex) {
            throw utils::PersistenceFailure("invalid meta value for " + key + ": " + ex.what());
        }
    }
}

void CognitionBase::Exec(const std::string& sql) {
    char* err = nullptr;
    const auto rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string message = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        throw utils::PersistenceFailure("sqlite exec failed: " + message);
    }
}

void CognitionBase::Begin() {
    Exec("BEGIN IMMEDIATE;");
}

void CognitionBase::Commit() {
    Exec("COMMIT;");
}

void CognitionBase::RollbackAndReload() {
    char* err = nullptr;
    if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
        utils::LogError("knowledge", "rollback failed", {{"error", err ? err : "unknown"}});
    }
    sqlite3_free(err);
    LoadCache();
}

std::vector<KnowledgeEntry> CognitionBase::Retrieve(const std::string& objective, std::size_t top_k) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<KnowledgeEntry> ranked;
    for (const auto& [id, entry] : entries_) {
        if (entry.objective == objective) {
            ranked.push_back(entry);
        }
    }
    std::sort(ranked.begin(), ranked.end(), RanksBefore);
    if (top_k > 0 && ranked.size() > top_k) {
        ranked.resize(top_k);
    }
    return ranked;
}

std::optional<KnowledgeEntry> CognitionBase::Merge(const analyst::ScoredOutcome& outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (HasOutcomeLocked(outcome.id)) {
        return std::nullopt;
    }
    MergeReport report{};
    Begin();
    try {
        auto result = MergeLocked(outcome, report);
        WriteMeta("merge_seq", std::to_string(merge_seq_));
        Commit();
        return result;
    } catch (const utils::PersistenceFailure&) {
        RollbackAndReload();
        throw;
    }
}

MergeReport CognitionBase::MergeBatch(const std::vector<analyst::ScoredOutcome>& outcomes, int iteration) {
    std::lock_guard<std::mutex> lock(mutex_);
    MergeReport report{};
    Begin();
    try {
        for (const auto& outcome : outcomes) {
            MergeLocked(outcome, report);
        }
        WriteMeta("merge_seq", std::to_string(merge_seq_));
        if (iteration > last_completed_iteration_) {
            WriteMeta("last_completed_iteration", std::to_string(iteration));
        }
        Commit();
    } catch (const utils::PersistenceFailure&) {
        RollbackAndReload();
        throw;
    }
    last_completed_iteration_ = std::max(last_completed_iteration_, iteration);
    utils::LogInfo("knowledge", "merged batch",
                   {{"iteration", std::to_string(iteration)},
                    {"created", std::to_string(report.created)},
                    {"strengthened", std::to_string(report.strengthened)},
                    {"redundant", std::to_string(report.redundant)},
                    {"known", std::to_string(report.already_known)},
                    {"consolidated", std::to_string(report.consolidated)}});
    return report;
}

std::optional<KnowledgeEntry> CognitionBase::MergeLocked(const analyst::ScoredOutcome& outcome, MergeReport& report) {
    if (HasOutcomeLocked(outcome.id)) {
        ++report.already_known;
        return std::nullopt;
    }
    ++merge_seq_;
    InsertOutcome(outcome);

    KnowledgeEntry* match = nullptr;
    for (auto* entry : ActiveEntriesLocked(outcome.objective)) {
        if (entry->classification != outcome.classification) {
            continue;
        }
        const bool same_code = !outcome.code_hash.empty() && entry->code_hash == outcome.code_hash;
        if (same_code || utils::TextSimilarity(entry->insight, outcome.insight) >= settings_.similarity_threshold) {
            match = entry;
            break;
        }
    }

    std::optional<KnowledgeEntry> result;
    if (match && !Strengthens(outcome.classification)) {
        // A failure mode that is already on record adds nothing new.
        ++report.redundant;
        utils::LogDebug("knowledge", "redundant outcome", {{"outcome", outcome.id}, {"entry", match->id}});
    } else if (match) {
        match->evidence.push_back(outcome.id);
        ++match->support;
        match->quality = std::max(match->quality, outcome.quality);
        match->updated_seq = merge_seq_;
        WriteEntry(*match);
        WriteEvidence(match->id, outcome.id, match->evidence.size() - 1);
        ++report.strengthened;
        result = *match;
    } else {
        KnowledgeEntry entry{};
        entry.created_seq = ++entry_seq_;
        entry.id = "k-" + std::to_string(entry.created_seq);
        entry.objective = outcome.objective;
        entry.classification = outcome.classification;
        entry.insight = outcome.insight;
        entry.code_hash = outcome.code_hash;
        entry.approach = outcome.approach;
        entry.quality = outcome.quality;
        entry.updated_seq = merge_seq_;
        entry.evidence.push_back(outcome.id);
        entry.support = 1;
        WriteEntry(entry);
        WriteEvidence(entry.id, outcome.id, 0);
        ++report.created;
        result = entry;
        entries_.emplace(entry.id, std::move(entry));
    }

    RecomputeRelevance(outcome.objective);
    report.consolidated += ConsolidateIfNeeded(outcome.objective);
    if (result) {
        // The entry may have been folded by the consolidation above.
        const auto it = entries_.find(result->id);
        if (it != entries_.end()) {
            result = it->second;
        } else {
            result = LoadEntryLocked(result->id);
        }
    }
    return result;
}

void CognitionBase::MarkUsed(const std::vector<std::string>& entry_ids) {
    if (entry_ids.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    Begin();
    try {
        std::set<std::string> objectives;
        for (const auto& id : entry_ids) {
            auto it = entries_.find(id);
            if (it == entries_.end()) {
                continue;
            }
            ++it->second.usage_count;
            WriteEntry(it->second);
            objectives.insert(it->second.objective);
        }
        for (const auto& objective : objectives) {
            RecomputeRelevance(objective);
        }
        Commit();
    } catch (const utils::PersistenceFailure&) {
        RollbackAndReload();
        throw;
    }
}

bool CognitionBase::HasOutcome(const std::string& outcome_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return HasOutcomeLocked(outcome_id);
}

bool CognitionBase::HasOutcomeLocked(const std::string& outcome_id) const {
    Statement stmt(db_, "SELECT 1 FROM outcomes WHERE id = ?;");
    stmt.BindText(1, outcome_id);
    return stmt.Step();
}

std::optional<analyst::ScoredOutcome> CognitionBase::GetOutcome(const std::string& outcome_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "SELECT payload FROM outcomes WHERE id = ?;");
    stmt.BindText(1, outcome_id);
    if (!stmt.Step()) {
        return std::nullopt;
    }
    auto json = nlohmann::json::parse(stmt.Text(0), nullptr, false);
    if (json.is_discarded()) {
        throw utils::PersistenceFailure("stored outcome " + outcome_id + " is not valid JSON");
    }
    return analyst::OutcomeFromJson(json);
}

std::vector<analyst::ScoredOutcome> CognitionBase::QueryOutcomes(const std::string& sql,
                                                                 const std::string& objective,
                                                                 std::size_t count) const {
    std::vector<analyst::ScoredOutcome> outcomes;
    Statement stmt(db_, sql);
    stmt.BindText(1, objective);
    stmt.BindInt(2, static_cast<std::int64_t>(count));
    while (stmt.Step()) {
        auto json = nlohmann::json::parse(stmt.Text(0), nullptr, false);
        if (json.is_discarded()) {
            throw utils::PersistenceFailure("stored outcome is not valid JSON");
        }
        outcomes.push_back(analyst::OutcomeFromJson(json));
    }
    return outcomes;
}

std::vector<analyst::ScoredOutcome> CognitionBase::RecentOutcomes(const std::string& objective,
                                                                  std::size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto outcomes = QueryOutcomes(
        "SELECT payload FROM outcomes WHERE objective = ? ORDER BY merge_seq DESC LIMIT ?;", objective, count);
    std::reverse(outcomes.begin(), outcomes.end());
    return outcomes;
}

std::vector<analyst::ScoredOutcome> CognitionBase::TopOutcomes(const std::string& objective,
                                                               std::size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return QueryOutcomes(
        "SELECT payload FROM outcomes WHERE objective = ? AND classification IN ('success', 'partial') "
        "ORDER BY quality DESC, merge_seq ASC LIMIT ?;",
        objective, count);
}

std::size_t CognitionBase::OutcomeCount(const std::string& objective) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "SELECT COUNT(*) FROM outcomes WHERE objective = ?;");
    stmt.BindText(1, objective);
    return stmt.Step() ? static_cast<std::size_t>(stmt.Int(0)) : 0;
}

std::optional<KnowledgeEntry> CognitionBase::GetEntry(const std::string& entry_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(entry_id);
    if (it != entries_.end()) {
        return it->second;
    }
    return LoadEntryLocked(entry_id);
}

std::vector<std::string> CognitionBase::Evidence(const std::string& entry_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_,
        "WITH RECURSIVE lineage(id) AS ("
        "SELECT ? UNION SELECT folds.entry_id FROM folds JOIN lineage ON folds.consolidated_id = lineage.id) "
        "SELECT evidence.outcome_id FROM evidence "
        "JOIN lineage ON evidence.entry_id = lineage.id "
        "JOIN outcomes ON outcomes.id = evidence.outcome_id "
        "ORDER BY outcomes.merge_seq;");
    stmt.BindText(1, entry_id);
    std::vector<std::string> outcome_ids;
    while (stmt.Step()) {
        outcome_ids.push_back(stmt.Text(0));
    }
    return outcome_ids;
}

std::size_t CognitionBase::ActiveEntryCount(const std::string& objective) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(entries_.begin(), entries_.end(), [&](const auto& item) {
        return item.second.objective == objective;
    }));
}

StoreStats CognitionBase::Stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    StoreStats stats{};
    stats.cached_entries = entries_.size();
    stats.stored_entries = CountRows("entries");
    stats.evidence_rows = CountRows("evidence");
    stats.fold_rows = CountRows("folds");
    stats.outcomes = CountRows("outcomes");
    return stats;
}

std::size_t CognitionBase::CountRows(const std::string& table) const {
    Statement stmt(db_, "SELECT COUNT(*) FROM " + table + ";");
    return stmt.Step() ? static_cast<std::size_t>(stmt.Int(0)) : 0;
}

std::vector<KnowledgeEntry> CognitionBase::QueryEntries(const std::string& where, const std::string& param) const {
    std::vector<KnowledgeEntry> found;
    Statement stmt(db_, std::string("SELECT ") + kEntryColumns + " FROM entries WHERE " + where
                            + " ORDER BY created_seq;");
    if (!param.empty()) {
        stmt.BindText(1, param);
    }
    while (stmt.Step()) {
        found.push_back(ReadEntryRow(stmt));
    }
    for (auto& entry : found) {
        AttachLineage(entry);
    }
    return found;
}

std::optional<KnowledgeEntry> CognitionBase::LoadEntryLocked(const std::string& entry_id) const {
    auto found = QueryEntries("id = ?", entry_id);
    if (found.empty()) {
        return std::nullopt;
    }
    return std::move(found.front());
}

void CognitionBase::AttachLineage(KnowledgeEntry& entry) const {
    Statement evidence(db_, "SELECT outcome_id FROM evidence WHERE entry_id = ? ORDER BY position;");
    evidence.BindText(1, entry.id);
    while (evidence.Step()) {
        entry.evidence.push_back(evidence.Text(0));
    }
    if (!entry.consolidated) {
        return;
    }
    Statement folds(db_, "SELECT entry_id FROM folds WHERE consolidated_id = ? ORDER BY position;");
    folds.BindText(1, entry.id);
    while (folds.Step()) {
        entry.supersedes.push_back(folds.Text(0));
    }
}

std::uint64_t CognitionBase::MergeSequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return merge_seq_;
}

int CognitionBase::LastCompletedIteration() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_completed_iteration_;
}

nlohmann::json CognitionBase::ExportJson(const std::string& objective) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto stored = objective.empty() ? QueryEntries("1 = 1", "") : QueryEntries("objective = ?", objective);
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& entry : stored) {
        entries.push_back(ToJson(entry));
    }
    return {
        {"path", db_path_.string()},
        {"merge_seq", merge_seq_},
        {"last_completed_iteration", last_completed_iteration_},
        {"entries", std::move(entries)}
    };
}

void CognitionBase::InsertOutcome(const analyst::ScoredOutcome& outcome) {
    Statement stmt(db_,
        "INSERT INTO outcomes(id, hypothesis_id, objective, classification, quality, code_hash, iteration, "
        "merge_seq, payload) VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?);");
    stmt.BindText(1, outcome.id);
    stmt.BindText(2, outcome.hypothesis_id);
    stmt.BindText(3, outcome.objective);
    stmt.BindText(4, analyst::ToString(outcome.classification));
    stmt.BindReal(5, outcome.quality);
    stmt.BindText(6, outcome.code_hash);
    stmt.BindInt(7, outcome.iteration);
    stmt.BindInt(8, static_cast<std::int64_t>(merge_seq_));
    stmt.BindText(9, utils::DumpJson(analyst::ToJson(outcome)));
    stmt.Step();
}

void CognitionBase::WriteEntry(const KnowledgeEntry& entry) {
    Statement stmt(db_,
        "INSERT INTO entries(id, objective, classification, insight, code_hash, approach, quality, relevance, "
        "usage_count, created_seq, updated_seq, superseded_by, consolidated, support) "
        "VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(id) DO UPDATE SET quality=excluded.quality, relevance=excluded.relevance, "
        "usage_count=excluded.usage_count, updated_seq=excluded.updated_seq, "
        "superseded_by=excluded.superseded_by, support=excluded.support;");
    stmt.BindText(1, entry.id);
    stmt.BindText(2, entry.objective);
    stmt.BindText(3, analyst::ToString(entry.classification));
    stmt.BindText(4, entry.insight);
    stmt.BindText(5, entry.code_hash);
    stmt.BindText(6, entry.approach);
    stmt.BindReal(7, entry.quality);
    stmt.BindReal(8, entry.relevance);
    stmt.BindInt(9, entry.usage_count);
    stmt.BindInt(10, static_cast<std::int64_t>(entry.created_seq));
    stmt.BindInt(11, static_cast<std::int64_t>(entry.updated_seq));
    stmt.BindText(12, entry.superseded_by);
    stmt.BindInt(13, entry.consolidated ? 1 : 0);
    stmt.BindInt(14, static_cast<std::int64_t>(entry.support));
    stmt.Step();
}

void CognitionBase::WriteEvidence(const std::string& entry_id, const std::string& outcome_id, std::size_t position) {
    Statement stmt(db_, "INSERT OR IGNORE INTO evidence(entry_id, outcome_id, position) VALUES(?, ?, ?);");
    stmt.BindText(1, entry_id);
    stmt.BindText(2, outcome_id);
    stmt.BindInt(3, static_cast<std::int64_t>(position));
    stmt.Step();
}

void CognitionBase::WriteFold(const std::string& consolidated_id, const std::string& entry_id, std::size_t position) {
    Statement stmt(db_, "INSERT OR IGNORE INTO folds(consolidated_id, entry_id, position) VALUES(?, ?, ?);");
    stmt.BindText(1, consolidated_id);
    stmt.BindText(2, entry_id);
    stmt.BindInt(3, static_cast<std::int64_t>(position));
    stmt.Step();
}

void CognitionBase::WriteMeta(const std::string& key, const std::string& value) {
    Statement stmt(db_, "INSERT INTO meta(key, value) VALUES(?, ?) ON CONFLICT(key) DO UPDATE SET value=excluded.value;");
    stmt.BindText(1, key);
    stmt.BindText(2, value);
    stmt.Step();
}

std::vector<KnowledgeEntry*> CognitionBase::ActiveEntriesLocked(const std::string& objective) {
    std::vector<KnowledgeEntry*> active;
    for (auto& [id, entry] : entries_) {
        if (entry.objective == objective) {
            active.push_back(&entry);
        }
    }
    std::sort(active.begin(), active.end(), [](const KnowledgeEntry* lhs, const KnowledgeEntry* rhs) {
        return lhs->created_seq < rhs->created_seq;
    });
    return active;
}

void CognitionBase::RecomputeRelevance(const std::string& objective) {
    Statement stmt(db_, "UPDATE entries SET relevance = ? WHERE id = ?;");
    for (auto* entry : ActiveEntriesLocked(objective)) {
        entry->relevance = ComputeRelevance(*entry, merge_seq_, settings_.recency_half_life);
        stmt.BindReal(1, entry->relevance);
        stmt.BindText(2, entry->id);
        stmt.Step();
        stmt.Reset();
    }
}

std::size_t CognitionBase::ConsolidateIfNeeded(const std::string& objective) {
    auto active = ActiveEntriesLocked(objective);
    if (active.size() <= settings_.capacity) {
        return 0;
    }
    // Fold enough of the weakest entries that, with the new consolidated one, the
    // active set is back at capacity.
    const auto fold_count = active.size() - settings_.capacity + 1;
    std::sort(active.begin(), active.end(), [](const KnowledgeEntry* lhs, const KnowledgeEntry* rhs) {
        return RanksBefore(*rhs, *lhs);
    });
    std::vector<KnowledgeEntry*> folded(active.begin(), active.begin() + static_cast<std::ptrdiff_t>(fold_count));
    std::sort(folded.begin(), folded.end(), [](const KnowledgeEntry* lhs, const KnowledgeEntry* rhs) {
        return lhs->created_seq < rhs->created_seq;
    });

    KnowledgeEntry merged{};
    merged.created_seq = ++entry_seq_;
    merged.id = "k-" + std::to_string(merged.created_seq);
    merged.objective = objective;
    merged.approach = "consolidated";
    merged.consolidated = true;
    merged.updated_seq = merge_seq_;
    const KnowledgeEntry* strongest = folded.front();
    std::vector<std::string> summaries;
    for (const auto* entry : folded) {
        if (entry->quality > strongest->quality) {
            strongest = entry;
        }
        merged.usage_count += entry->usage_count;
        merged.support += entry->support;
        merged.supersedes.push_back(entry->id);
        if (summaries.size() < 3) {
            summaries.push_back(utils::Truncate(entry->insight, 80));
        }
    }
    merged.classification = strongest->classification;
    merged.quality = strongest->quality;
    merged.insight = "Consolidated " + std::to_string(folded.size()) + " insights: " + utils::Join(summaries, " | ");
    merged.relevance = ComputeRelevance(merged, merge_seq_, settings_.recency_half_life);

    WriteEntry(merged);
    for (std::size_t i = 0; i < merged.supersedes.size(); ++i) {
        WriteFold(merged.id, merged.supersedes[i], i);
    }
    for (auto* entry : folded) {
        entry->superseded_by = merged.id;
        WriteEntry(*entry);
    }
    utils::LogInfo("knowledge", "consolidated entries",
                   {{"objective", utils::Truncate(objective, 40)},
                    {"folded", std::to_string(folded.size())},
                    {"into", merged.id}});
    for (const auto& id : merged.supersedes) {
        entries_.erase(id);
    }
    entries_.emplace(merged.id, std::move(merged));
    return fold_count;
}

}  // namespace autolab::cognition
