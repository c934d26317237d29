#include <gtest/gtest.h>

#include <algorithm>
#include <fstream>
#include <set>
#include <string>
#include <vector>

#include "cognition/cognition_base.hpp"
#include "test_support.hpp"
#include "utils/errors.hpp"

namespace autolab::cognition {
namespace {

using analyst::Classification;

analyst::ScoredOutcome MakeOutcome(const std::string& id,
                                   Classification classification,
                                   double quality,
                                   const std::string& insight,
                                   const std::string& code_hash,
                                   const std::string& objective = "sort faster") {
    analyst::ScoredOutcome outcome{};
    outcome.id = id;
    outcome.hypothesis_id = "h-" + id;
    outcome.objective = objective;
    outcome.description = insight;
    outcome.approach = "direct";
    outcome.code_hash = code_hash;
    outcome.classification = classification;
    outcome.quality = quality;
    outcome.insight = insight;
    outcome.verdict.hypothesis_id = outcome.hypothesis_id;
    outcome.verdict.terminated_reason = sandbox::TerminatedReason::kCompleted;
    outcome.verdict.exit_code = 0;
    return outcome;
}

class CognitionBaseTest : public ::testing::Test {
protected:
    std::filesystem::path DbPath() const { return dir_.Path() / "knowledge.db"; }

    testing::TempDir dir_;
};

TEST_F(CognitionBaseTest, MergeIsIdempotent) {
    CognitionBase store(DbPath(), KnowledgeSettings{});
    const auto outcome = MakeOutcome("o-1", Classification::kSuccess, 0.8, "radix sort wins", "aaaa");
    ASSERT_TRUE(store.Merge(outcome).has_value());
    const auto seq = store.MergeSequence();

    EXPECT_FALSE(store.Merge(outcome).has_value());
    EXPECT_EQ(store.MergeSequence(), seq);
    EXPECT_EQ(store.OutcomeCount("sort faster"), 1u);
    EXPECT_EQ(store.ActiveEntryCount("sort faster"), 1u);
}

TEST_F(CognitionBaseTest, HigherQualityRanksFirst) {
    CognitionBase store(DbPath(), KnowledgeSettings{});
    store.Merge(MakeOutcome("o-1", Classification::kSuccess, 0.4, "insertion sort small inputs", "aaaa"));
    store.Merge(MakeOutcome("o-2", Classification::kSuccess, 0.9, "radix sort large integers", "bbbb"));

    const auto ranked = store.Retrieve("sort faster", 5);
    ASSERT_EQ(ranked.size(), 2u);
    EXPECT_DOUBLE_EQ(ranked[0].quality, 0.9);
    EXPECT_DOUBLE_EQ(ranked[1].quality, 0.4);
    EXPECT_GT(ranked[0].relevance, ranked[1].relevance);
}

TEST_F(CognitionBaseTest, RetrieveIsDeterministicAndReadOnly) {
    CognitionBase store(DbPath(), KnowledgeSettings{});
    store.Merge(MakeOutcome("o-1", Classification::kSuccess, 0.5, "alpha beta gamma", "aaaa"));
    store.Merge(MakeOutcome("o-2", Classification::kPartial, 0.5, "delta epsilon zeta", "bbbb"));
    store.Merge(MakeOutcome("o-3", Classification::kFailure, 0.0, "eta theta iota", "cccc"));
    const auto seq = store.MergeSequence();

    const auto first = store.Retrieve("sort faster", 2);
    const auto second = store.Retrieve("sort faster", 2);
    ASSERT_EQ(first.size(), 2u);
    ASSERT_EQ(second.size(), 2u);
    for (std::size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].id, second[i].id);
        EXPECT_EQ(first[i].usage_count, second[i].usage_count);
    }
    EXPECT_EQ(store.MergeSequence(), seq);
    EXPECT_TRUE(store.Retrieve("another objective", 5).empty());
    EXPECT_EQ(store.Retrieve("sort faster", 0).size(), 3u);
}

TEST_F(CognitionBaseTest, MatchingSuccessStrengthensEntry) {
    CognitionBase store(DbPath(), KnowledgeSettings{});
    const auto created = store.Merge(MakeOutcome("o-1", Classification::kSuccess, 0.5, "radix sort wins", "aaaa"));
    ASSERT_TRUE(created.has_value());
    const auto strengthened = store.Merge(
        MakeOutcome("o-2", Classification::kSuccess, 0.7, "radix sort wins again", "aaaa"));
    ASSERT_TRUE(strengthened.has_value());

    EXPECT_EQ(strengthened->id, created->id);
    EXPECT_DOUBLE_EQ(strengthened->quality, 0.7);
    EXPECT_EQ(store.Evidence(created->id), (std::vector<std::string>{"o-1", "o-2"}));
    EXPECT_EQ(store.ActiveEntryCount("sort faster"), 1u);
}

TEST_F(CognitionBaseTest, RepeatedFailureIsRedundant) {
    CognitionBase store(DbPath(), KnowledgeSettings{});
    const auto report = store.MergeBatch(
        {MakeOutcome("o-1", Classification::kFailure, 0.0, "bogosort times out", "aaaa"),
         MakeOutcome("o-2", Classification::kFailure, 0.0, "bogosort times out", "aaaa"),
         MakeOutcome("o-1", Classification::kFailure, 0.0, "bogosort times out", "aaaa")},
        1);

    EXPECT_EQ(report.created, 1u);
    EXPECT_EQ(report.redundant, 1u);
    EXPECT_EQ(report.already_known, 1u);
    EXPECT_EQ(store.OutcomeCount("sort faster"), 2u);
    EXPECT_EQ(store.ActiveEntryCount("sort faster"), 1u);
    EXPECT_TRUE(store.HasOutcome("o-2"));
}

TEST_F(CognitionBaseTest, DifferentClassificationsStayApart) {
    CognitionBase store(DbPath(), KnowledgeSettings{});
    store.Merge(MakeOutcome("o-1", Classification::kSuccess, 0.5, "radix sort wins", "aaaa"));
    store.Merge(MakeOutcome("o-2", Classification::kFailure, 0.0, "radix sort wins", "aaaa"));
    EXPECT_EQ(store.ActiveEntryCount("sort faster"), 2u);
}

TEST_F(CognitionBaseTest, StatePersistsAcrossReopen) {
    std::string entry_id;
    {
        CognitionBase store(DbPath(), KnowledgeSettings{});
        store.MergeBatch({MakeOutcome("o-1", Classification::kSuccess, 0.9, "radix sort wins", "aaaa"),
                          MakeOutcome("o-2", Classification::kPartial, 0.3, "merge sort stable", "bbbb")},
                         4);
        entry_id = store.Retrieve("sort faster", 1).front().id;
    }

    CognitionBase reopened(DbPath(), KnowledgeSettings{});
    EXPECT_EQ(reopened.LastCompletedIteration(), 4);
    EXPECT_EQ(reopened.MergeSequence(), 2u);
    EXPECT_EQ(reopened.OutcomeCount("sort faster"), 2u);
    const auto ranked = reopened.Retrieve("sort faster", 1);
    ASSERT_EQ(ranked.size(), 1u);
    EXPECT_EQ(ranked.front().id, entry_id);

    const auto stored = reopened.GetOutcome("o-1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->classification, Classification::kSuccess);
    EXPECT_DOUBLE_EQ(stored->quality, 0.9);
}

TEST_F(CognitionBaseTest, LastCompletedIterationNeverGoesBack) {
    CognitionBase store(DbPath(), KnowledgeSettings{});
    store.MergeBatch({}, 3);
    store.MergeBatch({}, 2);
    EXPECT_EQ(store.LastCompletedIteration(), 3);
}

TEST_F(CognitionBaseTest, ConsolidationKeepsActiveEntriesAtCapacity) {
    CognitionBase store(DbPath(), KnowledgeSettings{.capacity = 3});
    const std::vector<std::string> insights = {
        "alpha beta gamma", "delta epsilon zeta", "eta theta iota", "kappa lambda mu", "nu xi omicron"};
    for (std::size_t i = 0; i < insights.size(); ++i) {
        const auto id = "o-" + std::to_string(i + 1);
        store.Merge(MakeOutcome(id, Classification::kSuccess, 0.1 * static_cast<double>(i + 1), insights[i],
                                "hash" + std::to_string(i)));
        EXPECT_LE(store.ActiveEntryCount("sort faster"), 3u);
    }

    const auto active = store.Retrieve("sort faster", 0);
    ASSERT_EQ(active.size(), 3u);
    std::set<std::string> evidence;
    bool has_consolidated = false;
    for (const auto& entry : active) {
        has_consolidated = has_consolidated || entry.consolidated;
        for (const auto& outcome_id : store.Evidence(entry.id)) {
            evidence.insert(outcome_id);
        }
    }
    EXPECT_TRUE(has_consolidated);
    EXPECT_EQ(evidence, (std::set<std::string>{"o-1", "o-2", "o-3", "o-4", "o-5"}));

    const auto superseded = store.GetEntry("k-1");
    ASSERT_TRUE(superseded.has_value());
    EXPECT_FALSE(superseded->IsActive());
}

TEST_F(CognitionBaseTest, SupersededEntriesLeaveTheCacheAndKeepTheirLineage) {
    {
        CognitionBase store(DbPath(), KnowledgeSettings{.capacity = 2});
        store.Merge(MakeOutcome("o-1", Classification::kSuccess, 0.1, "alpha beta gamma", "aaaa"));
        store.Merge(MakeOutcome("o-2", Classification::kSuccess, 0.2, "delta epsilon zeta", "bbbb"));
        store.Merge(MakeOutcome("o-3", Classification::kSuccess, 0.3, "eta theta iota", "cccc"));
        EXPECT_EQ(store.Stats().cached_entries, 2u);
    }

    CognitionBase reopened(DbPath(), KnowledgeSettings{.capacity = 2});
    const auto stats = reopened.Stats();
    EXPECT_EQ(stats.cached_entries, 2u);
    EXPECT_EQ(stats.stored_entries, 4u);
    EXPECT_EQ(stats.evidence_rows, 3u);
    EXPECT_EQ(stats.fold_rows, 2u);

    const auto active = reopened.Retrieve("sort faster", 0);
    const auto consolidated = std::find_if(active.begin(), active.end(), [](const KnowledgeEntry& entry) {
        return entry.consolidated;
    });
    ASSERT_NE(consolidated, active.end());
    EXPECT_EQ(consolidated->supersedes, (std::vector<std::string>{"k-1", "k-2"}));
    EXPECT_TRUE(consolidated->evidence.empty());
    EXPECT_EQ(consolidated->support, 2u);
    EXPECT_EQ(reopened.Evidence(consolidated->id), (std::vector<std::string>{"o-1", "o-2"}));

    const auto folded = reopened.GetEntry("k-1");
    ASSERT_TRUE(folded.has_value());
    EXPECT_EQ(folded->superseded_by, consolidated->id);
    EXPECT_EQ(folded->evidence, (std::vector<std::string>{"o-1"}));
    EXPECT_EQ(reopened.ExportJson("sort faster")["entries"].size(), 4u);
}

TEST_F(CognitionBaseTest, LongRunsStayBoundedByCapacity) {
    constexpr std::size_t kCapacity = 5;
    constexpr std::size_t kOutcomes = 2000;
    constexpr std::size_t kBatch = 100;
    CognitionBase store(DbPath(), KnowledgeSettings{.capacity = kCapacity});

    std::size_t merged = 0;
    for (int iteration = 1; merged < kOutcomes; ++iteration) {
        std::vector<analyst::ScoredOutcome> batch;
        for (std::size_t i = 0; i < kBatch; ++i, ++merged) {
            const auto n = std::to_string(merged);
            batch.push_back(MakeOutcome("o-" + n, Classification::kSuccess, 0.5, "finding " + n + " holds",
                                        "hash-" + n));
        }
        store.MergeBatch(batch, iteration);
        EXPECT_LE(store.ActiveEntryCount("sort faster"), kCapacity);
        EXPECT_LE(store.Stats().cached_entries, kCapacity);
    }

    const auto stats = store.Stats();
    EXPECT_EQ(stats.outcomes, kOutcomes);
    EXPECT_EQ(stats.evidence_rows, kOutcomes);
    // Every superseded entry is linked exactly once.
    EXPECT_EQ(stats.fold_rows, stats.stored_entries - stats.cached_entries);

    std::set<std::string> evidence;
    std::size_t support = 0;
    for (const auto& entry : store.Retrieve("sort faster", 0)) {
        support += entry.support;
        for (const auto& outcome_id : store.Evidence(entry.id)) {
            evidence.insert(outcome_id);
        }
    }
    EXPECT_EQ(support, kOutcomes);
    EXPECT_EQ(evidence.size(), kOutcomes);
}

TEST_F(CognitionBaseTest, RecentOutcomesAreOldestFirst) {
    CognitionBase store(DbPath(), KnowledgeSettings{});
    store.Merge(MakeOutcome("o-1", Classification::kSuccess, 0.1, "alpha beta gamma", "aaaa"));
    store.Merge(MakeOutcome("o-2", Classification::kFailure, 0.0, "delta epsilon zeta", "bbbb"));
    store.Merge(MakeOutcome("o-3", Classification::kPartial, 0.2, "eta theta iota", "cccc"));

    const auto recent = store.RecentOutcomes("sort faster", 2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].id, "o-2");
    EXPECT_EQ(recent[1].id, "o-3");

    const auto top = store.TopOutcomes("sort faster", 5);
    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top[0].id, "o-3");
}

TEST_F(CognitionBaseTest, MarkUsedRaisesUsageAndRelevance) {
    CognitionBase store(DbPath(), KnowledgeSettings{});
    const auto entry = store.Merge(MakeOutcome("o-1", Classification::kSuccess, 0.5, "radix sort wins", "aaaa"));
    ASSERT_TRUE(entry.has_value());

    store.MarkUsed({entry->id, "k-missing"});
    const auto updated = store.GetEntry(entry->id);
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->usage_count, 1);
    EXPECT_GT(updated->relevance, entry->relevance);
}

TEST_F(CognitionBaseTest, ExportListsEntriesInCreationOrder) {
    CognitionBase store(DbPath(), KnowledgeSettings{});
    store.Merge(MakeOutcome("o-1", Classification::kSuccess, 0.1, "alpha beta gamma", "aaaa"));
    store.Merge(MakeOutcome("o-2", Classification::kSuccess, 0.9, "delta epsilon zeta", "bbbb"));

    const auto exported = store.ExportJson("sort faster");
    ASSERT_EQ(exported["entries"].size(), 2u);
    EXPECT_EQ(exported["entries"][0]["id"], "k-1");
    EXPECT_EQ(exported["merge_seq"], 2);
}

TEST_F(CognitionBaseTest, UnopenableDatabaseThrows) {
    const auto blocker = dir_.Path() / "blocker";
    std::ofstream(blocker) << "x";
    EXPECT_THROW(CognitionBase(blocker / "knowledge.db", KnowledgeSettings{}), utils::PersistenceFailure);
}

TEST(ComputeRelevanceTest, DecaysWithAge) {
    KnowledgeEntry entry{};
    entry.classification = Classification::kSuccess;
    entry.quality = 1.0;
    entry.updated_seq = 10;
    const auto fresh = ComputeRelevance(entry, 10, 50.0);
    const auto aged = ComputeRelevance(entry, 60, 50.0);
    EXPECT_NEAR(aged, fresh / 2.0, 1e-9);
}

}  // namespace
}  // namespace autolab::cognition
