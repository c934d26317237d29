#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "analyst/outcome.hpp"
#include "nlohmann/json.hpp"

namespace autolab::orchestrator {

enum class RunStatus {
    kRunning,
    kCompleted,
    kStopped,
    kFailed
};

const char* ToString(RunStatus status);
std::optional<RunStatus> ParseRunStatus(const std::string& value);

struct BestResult {
    std::string outcome_id;
    std::string description;
    double quality = 0.0;
    int iteration = 0;
};

// Everything needed to resume the loop. Plain value: the orchestrator owns the only
// live copy and persists it after every iteration.
struct Checkpoint {
    std::string objective;
    // Completed iterations.
    int iteration = 0;
    std::size_t total_experiments = 0;
    // Research wall time accumulated over every session.
    double elapsed_seconds = 0.0;
    std::string knowledge_path;
    std::uint64_t knowledge_merge_seq = 0;
    std::string last_outcome_id;
    RunStatus status = RunStatus::kRunning;
    std::string termination_reason;
    // Top results by quality, best first.
    std::vector<BestResult> best_results;
    std::string started_at;
    std::string updated_at;
};

constexpr std::size_t kMaxBestResults = 20;

// Inserts `outcome` if it scored above zero, keeping the list sorted and capped.
void RecordBestResult(Checkpoint& checkpoint, const analyst::ScoredOutcome& outcome);

nlohmann::json ToJson(const Checkpoint& checkpoint);

// Atomic JSON checkpoint file with a SHA-256 checksum over the payload.
class CheckpointStore {
public:
    explicit CheckpointStore(std::filesystem::path path);

    bool Exists() const;
    // Throws utils::PersistenceFailure on I/O errors.
    void Save(const Checkpoint& checkpoint) const;
    // nullopt when no checkpoint exists. Throws utils::CorruptState when the file does
    // not parse, fails its checksum, or misses a required field.
    std::optional<Checkpoint> Load() const;
    void Remove() const;
    const std::filesystem::path& Path() const { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace autolab::orchestrator
