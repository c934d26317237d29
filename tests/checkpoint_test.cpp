#include <gtest/gtest.h>

#include <fstream>
#include <functional>
#include <sstream>
#include <vector>

#include "nlohmann/json.hpp"
#include "orchestrator/checkpoint.hpp"
#include "utils/common.hpp"
#include "utils/errors.hpp"
#include "utils/json_utils.hpp"
#include "test_support.hpp"

namespace autolab::orchestrator {
namespace {

Checkpoint SampleCheckpoint() {
    Checkpoint checkpoint{};
    checkpoint.objective = "find a faster sort";
    checkpoint.iteration = 7;
    checkpoint.total_experiments = 19;
    checkpoint.elapsed_seconds = 123.25;
    checkpoint.knowledge_path = "ws/knowledge.db";
    checkpoint.knowledge_merge_seq = 19;
    checkpoint.last_outcome_id = "o-h-abc";
    checkpoint.status = RunStatus::kStopped;
    checkpoint.termination_reason = "stop_requested";
    checkpoint.best_results.push_back(BestResult{"o-h-1", "radix sort", 0.9, 3});
    checkpoint.started_at = "2026-10-17T10:00:00";
    checkpoint.updated_at = "2026-10-17T10:02:03";
    return checkpoint;
}

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path);
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

void WriteFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream output(path, std::ios::trunc);
    output << content;
}

TEST(CheckpointStoreTest, MissingFileLoadsAsNothing) {
    testing::TempDir dir;
    CheckpointStore store(dir.Path() / "checkpoint.json");
    EXPECT_FALSE(store.Exists());
    EXPECT_FALSE(store.Load().has_value());
}

TEST(CheckpointStoreTest, RoundTripsEveryField) {
    testing::TempDir dir;
    CheckpointStore store(dir.Path() / "checkpoint.json");
    const auto original = SampleCheckpoint();
    store.Save(original);
    ASSERT_TRUE(store.Exists());
    EXPECT_FALSE(std::filesystem::exists(dir.Path() / "checkpoint.json.tmp"));

    const auto loaded = store.Load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(ToJson(*loaded), ToJson(original));
}

TEST(CheckpointStoreTest, TamperedPayloadIsCorrupt) {
    testing::TempDir dir;
    const auto path = dir.Path() / "checkpoint.json";
    CheckpointStore store(path);
    store.Save(SampleCheckpoint());

    auto document = nlohmann::json::parse(ReadFile(path));
    document["checkpoint"]["iteration"] = 8;
    WriteFile(path, document.dump(2));
    EXPECT_THROW(store.Load(), utils::CorruptState);
}

// Rewrites the saved payload and re-signs it, so only type validation can reject it.
void ResignPayload(const std::filesystem::path& path, const std::function<void(nlohmann::json&)>& edit) {
    auto document = nlohmann::json::parse(ReadFile(path));
    edit(document["checkpoint"]);
    document["checksum"] = utils::Sha256Hex(utils::DumpJson(document["checkpoint"]));
    WriteFile(path, document.dump(2));
}

TEST(CheckpointStoreTest, WrongFieldTypesAreCorrupt) {
    testing::TempDir dir;
    const auto path = dir.Path() / "checkpoint.json";
    CheckpointStore store(path);
    const std::vector<std::function<void(nlohmann::json&)>> edits = {
        [](nlohmann::json& payload) { payload["last_outcome_id"] = 5; },
        [](nlohmann::json& payload) { payload["termination_reason"] = nlohmann::json::array(); },
        [](nlohmann::json& payload) { payload["best_results"][0]["quality"] = "high"; },
        [](nlohmann::json& payload) { payload["best_results"][0]["iteration"] = -2; },
        [](nlohmann::json& payload) { payload["best_results"] = nlohmann::json::object(); },
        [](nlohmann::json& payload) { payload["version"] = "1"; },
        [](nlohmann::json& payload) { payload.erase("version"); }
    };
    for (std::size_t i = 0; i < edits.size(); ++i) {
        store.Save(SampleCheckpoint());
        ResignPayload(path, edits[i]);
        EXPECT_THROW(store.Load(), utils::CorruptState) << "edit " << i;
    }

    store.Save(SampleCheckpoint());
    ResignPayload(path, [](nlohmann::json& payload) { payload.erase("last_outcome_id"); });
    const auto loaded = store.Load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_TRUE(loaded->last_outcome_id.empty());
}

TEST(CheckpointStoreTest, NonRegularFileIsPersistenceFailure) {
    testing::TempDir dir;
    const auto path = dir.Path() / "checkpoint.json";
    std::filesystem::create_directories(path);
    CheckpointStore store(path);
    EXPECT_THROW(store.Load(), utils::PersistenceFailure);
}

TEST(CheckpointStoreTest, GarbageIsCorrupt) {
    testing::TempDir dir;
    const auto path = dir.Path() / "checkpoint.json";
    WriteFile(path, "{not json");
    CheckpointStore store(path);
    EXPECT_THROW(store.Load(), utils::CorruptState);

    WriteFile(path, "{\"checkpoint\": {}}");
    EXPECT_THROW(store.Load(), utils::CorruptState);
}

TEST(CheckpointStoreTest, RemoveDeletesFile) {
    testing::TempDir dir;
    CheckpointStore store(dir.Path() / "checkpoint.json");
    store.Save(SampleCheckpoint());
    store.Remove();
    EXPECT_FALSE(store.Exists());
}

TEST(CheckpointStoreTest, SaveIntoMissingDirectoryFails) {
    testing::TempDir dir;
    const auto blocker = dir.Path() / "file";
    WriteFile(blocker, "x");
    CheckpointStore store(blocker / "checkpoint.json");
    EXPECT_THROW(store.Save(SampleCheckpoint()), utils::PersistenceFailure);
}

TEST(RecordBestResultTest, KeepsBestFirstAndSkipsDuplicates) {
    Checkpoint checkpoint{};
    analyst::ScoredOutcome outcome{};
    outcome.id = "o-1";
    outcome.quality = 0.4;
    RecordBestResult(checkpoint, outcome);
    outcome.id = "o-2";
    outcome.quality = 0.9;
    RecordBestResult(checkpoint, outcome);
    RecordBestResult(checkpoint, outcome);
    outcome.id = "o-3";
    outcome.quality = 0.0;
    RecordBestResult(checkpoint, outcome);

    ASSERT_EQ(checkpoint.best_results.size(), 2u);
    EXPECT_EQ(checkpoint.best_results[0].outcome_id, "o-2");
    EXPECT_EQ(checkpoint.best_results[1].outcome_id, "o-1");
}

TEST(RecordBestResultTest, CapsList) {
    Checkpoint checkpoint{};
    for (std::size_t i = 0; i < kMaxBestResults + 5; ++i) {
        analyst::ScoredOutcome outcome{};
        outcome.id = "o-" + std::to_string(i);
        outcome.quality = 1.0 + static_cast<double>(i);
        RecordBestResult(checkpoint, outcome);
    }
    ASSERT_EQ(checkpoint.best_results.size(), kMaxBestResults);
    EXPECT_EQ(checkpoint.best_results.front().outcome_id, "o-" + std::to_string(kMaxBestResults + 4));
}

}  // namespace
}  // namespace autolab::orchestrator
