#include "orchestrator/checkpoint.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <limits>

#include "utils/common.hpp"
#include "utils/errors.hpp"
#include "utils/json_utils.hpp"
#include "utils/logging.hpp"

namespace autolab::orchestrator {
namespace {

constexpr int kFormatVersion = 1;

const nlohmann::json& RequireField(const nlohmann::json& object, const char* key) {
    if (!object.contains(key)) {
        throw utils::CorruptState(std::string("checkpoint missing required field '") + key + "'");
    }
    return object[key];
}

std::string RequireString(const nlohmann::json& object, const char* key) {
    const auto& field = RequireField(object, key);
    if (!field.is_string()) {
        throw utils::CorruptState(std::string("checkpoint field '") + key + "' must be a string");
    }
    return field.get<std::string>();
}

std::uint64_t RequireUnsigned(const nlohmann::json& object, const char* key) {
    const auto& field = RequireField(object, key);
    if (!field.is_number_unsigned() && !(field.is_number_integer() && field.get<std::int64_t>() >= 0)) {
        throw utils::CorruptState(std::string("checkpoint field '") + key + "' must be a non-negative integer");
    }
    return field.get<std::uint64_t>();
}

double RequireNumber(const nlohmann::json& object, const char* key) {
    const auto& field = RequireField(object, key);
    if (!field.is_number() || field.get<double>() < 0.0) {
        throw utils::CorruptState(std::string("checkpoint field '") + key + "' must be a non-negative number");
    }
    return field.get<double>();
}

// Optional fields may be absent, but a present field of the wrong type is corruption.
std::string OptionalString(const nlohmann::json& object, const char* key) {
    if (!object.contains(key)) {
        return {};
    }
    return RequireString(object, key);
}

int OptionalInt(const nlohmann::json& object, const char* key) {
    if (!object.contains(key)) {
        return 0;
    }
    const auto value = RequireUnsigned(object, key);
    if (value > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
        throw utils::CorruptState(std::string("checkpoint field '") + key + "' out of range");
    }
    return static_cast<int>(value);
}

double OptionalNumber(const nlohmann::json& object, const char* key) {
    if (!object.contains(key)) {
        return 0.0;
    }
    return RequireNumber(object, key);
}

Checkpoint FromJson(const nlohmann::json& payload) {
    Checkpoint checkpoint{};
    checkpoint.objective = RequireString(payload, "objective");
    if (utils::Trim(checkpoint.objective).empty()) {
        throw utils::CorruptState("checkpoint objective is empty");
    }
    const auto iteration = RequireUnsigned(payload, "iteration");
    if (iteration > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
        throw utils::CorruptState("checkpoint iteration out of range");
    }
    checkpoint.iteration = static_cast<int>(iteration);
    checkpoint.total_experiments = static_cast<std::size_t>(RequireUnsigned(payload, "total_experiments"));
    checkpoint.elapsed_seconds = RequireNumber(payload, "elapsed_seconds");
    checkpoint.knowledge_path = RequireString(payload, "knowledge_path");
    checkpoint.knowledge_merge_seq = RequireUnsigned(payload, "knowledge_merge_seq");
    checkpoint.last_outcome_id = OptionalString(payload, "last_outcome_id");
    const auto status = ParseRunStatus(RequireString(payload, "status"));
    if (!status) {
        throw utils::CorruptState("checkpoint status is not recognised");
    }
    checkpoint.status = *status;
    checkpoint.termination_reason = OptionalString(payload, "termination_reason");
    checkpoint.started_at = OptionalString(payload, "started_at");
    checkpoint.updated_at = OptionalString(payload, "updated_at");
    if (payload.contains("best_results")) {
        const auto& best_results = payload["best_results"];
        if (!best_results.is_array()) {
            throw utils::CorruptState("checkpoint best_results must be an array");
        }
        for (const auto& item : best_results) {
            if (!item.is_object()) {
                throw utils::CorruptState("checkpoint best_results entry is not an object");
            }
            BestResult best{};
            best.outcome_id = OptionalString(item, "outcome_id");
            best.description = OptionalString(item, "description");
            best.quality = OptionalNumber(item, "quality");
            best.iteration = OptionalInt(item, "iteration");
            checkpoint.best_results.push_back(std::move(best));
        }
    }
    return checkpoint;
}

}  // namespace

const char* ToString(RunStatus status) {
    switch (status) {
        case RunStatus::kRunning: return "running";
        case RunStatus::kCompleted: return "completed";
        case RunStatus::kStopped: return "stopped";
        case RunStatus::kFailed: return "failed";
    }
    return "running";
}

std::optional<RunStatus> ParseRunStatus(const std::string& value) {
    if (value == "running") {
        return RunStatus::kRunning;
    }
    if (value == "completed") {
        return RunStatus::kCompleted;
    }
    if (value == "stopped") {
        return RunStatus::kStopped;
    }
    if (value == "failed") {
        return RunStatus::kFailed;
    }
    return std::nullopt;
}

void RecordBestResult(Checkpoint& checkpoint, const analyst::ScoredOutcome& outcome) {
    if (outcome.quality <= 0.0) {
        return;
    }
    auto& best = checkpoint.best_results;
    const bool known = std::any_of(best.begin(), best.end(), [&](const BestResult& item) {
        return item.outcome_id == outcome.id;
    });
    if (known) {
        return;
    }
    best.push_back(BestResult{outcome.id, outcome.description, outcome.quality, outcome.iteration});
    std::stable_sort(best.begin(), best.end(), [](const BestResult& lhs, const BestResult& rhs) {
        return lhs.quality > rhs.quality;
    });
    if (best.size() > kMaxBestResults) {
        best.resize(kMaxBestResults);
    }
}

nlohmann::json ToJson(const Checkpoint& checkpoint) {
    nlohmann::json best = nlohmann::json::array();
    for (const auto& item : checkpoint.best_results) {
        best.push_back({
            {"outcome_id", item.outcome_id},
            {"description", item.description},
            {"quality", item.quality},
            {"iteration", item.iteration}
        });
    }
    return {
        {"version", kFormatVersion},
        {"objective", checkpoint.objective},
        {"iteration", checkpoint.iteration},
        {"total_experiments", checkpoint.total_experiments},
        {"elapsed_seconds", checkpoint.elapsed_seconds},
        {"knowledge_path", checkpoint.knowledge_path},
        {"knowledge_merge_seq", checkpoint.knowledge_merge_seq},
        {"last_outcome_id", checkpoint.last_outcome_id},
        {"status", ToString(checkpoint.status)},
        {"termination_reason", checkpoint.termination_reason},
        {"best_results", std::move(best)},
        {"started_at", checkpoint.started_at},
        {"updated_at", checkpoint.updated_at}
    };
}

CheckpointStore::CheckpointStore(std::filesystem::path path)
    : path_(std::move(path)) {}

bool CheckpointStore::Exists() const {
    std::error_code ec;
    return std::filesystem::exists(path_, ec);
}

void CheckpointStore::Save(const Checkpoint& checkpoint) const {
    const auto payload = ToJson(checkpoint);
    const nlohmann::json document = {
        {"checksum", utils::Sha256Hex(utils::DumpJson(payload))},
        {"checkpoint", payload}
    };

    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw utils::PersistenceFailure("cannot create checkpoint directory: " + ec.message());
        }
    }
    const auto temp_path = std::filesystem::path(path_.string() + ".tmp");
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw utils::PersistenceFailure("failed to open checkpoint temp file " + temp_path.string());
        }
        out << utils::DumpJson(document, 2) << "\n";
        out.flush();
        if (!out) {
            throw utils::PersistenceFailure("failed to write checkpoint temp file " + temp_path.string());
        }
    }
    std::filesystem::rename(temp_path, path_, ec);
    if (ec) {
        std::filesystem::remove(temp_path, ec);
        throw utils::PersistenceFailure("failed to publish checkpoint " + path_.string());
    }
    utils::LogDebug("checkpoint", "saved",
                    {{"iteration", std::to_string(checkpoint.iteration)}, {"status", ToString(checkpoint.status)}});
}

std::optional<Checkpoint> CheckpointStore::Load() const {
    if (!Exists()) {
        return std::nullopt;
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path_, ec)) {
        throw utils::PersistenceFailure("checkpoint " + path_.string() + " is not a regular file");
    }
    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        throw utils::PersistenceFailure("unable to read checkpoint " + path_.string());
    }
    const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    const auto document = nlohmann::json::parse(text, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        throw utils::CorruptState("checkpoint " + path_.string() + " is not valid JSON");
    }
    if (!document.contains("checksum") || !document["checksum"].is_string()
        || !document.contains("checkpoint") || !document["checkpoint"].is_object()) {
        throw utils::CorruptState("checkpoint " + path_.string() + " lacks checksum or payload");
    }
    const auto& payload = document["checkpoint"];
    if (utils::Sha256Hex(utils::DumpJson(payload)) != document["checksum"].get<std::string>()) {
        throw utils::CorruptState("checkpoint " + path_.string() + " failed checksum validation");
    }
    const auto version = payload.contains("version") ? payload["version"] : nlohmann::json();
    if (!version.is_number_integer() || version.get<std::int64_t>() != kFormatVersion) {
        throw utils::CorruptState("checkpoint " + path_.string() + " has an unsupported version");
    }
    return FromJson(payload);
}

void CheckpointStore::Remove() const {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        throw utils::PersistenceFailure("failed to remove checkpoint " + path_.string() + ": " + ec.message());
    }
}

}  // namespace autolab::orchestrator
