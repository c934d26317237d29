#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "analyst/analyst.hpp"
#include "cognition/cognition_base.hpp"
#include "config/config_schema.hpp"
#include "orchestrator/checkpoint.hpp"
#include "researcher/researcher.hpp"
#include "sandbox/sandbox.hpp"

namespace autolab::orchestrator {

enum class LoopState {
    kIdle,
    kGenerating,
    kExecuting,
    kScoring,
    kUpdatingKnowledge,
    kCheckpointing,
    kTerminated
};

enum class TerminationReason {
    kNone,
    kIterationBudget,
    kTimeBudget,
    kStopRequested,
    kGenerationUnavailable,
    kPersistenceFailure,
    kObjectiveMismatch,
    kCorruptState,
    kInternalError
};

const char* ToString(LoopState state);
const char* ToString(TerminationReason reason);

struct Budgets {
    int max_iterations = 100;
    // 0 disables the wall-clock budget.
    double max_research_seconds = 0.0;
};

enum class NextAction {
    kRunIteration,
    kTerminate
};

struct Decision {
    NextAction action = NextAction::kRunIteration;
    TerminationReason reason = TerminationReason::kNone;
};

// What to do after `checkpoint`. Depends on nothing else, so a reloaded checkpoint
// yields the same decision as the one that was saved.
Decision DecideNextAction(const Checkpoint& checkpoint,
                          const Budgets& budgets,
                          double elapsed_seconds,
                          bool stop_requested);

struct LoopSettings {
    Budgets budgets;
    std::size_t experiments_per_iteration = 3;
    // 0 means hardware concurrency. Always capped at the batch size.
    std::size_t parallelism = 0;
    int generation_max_attempts = 3;
    std::chrono::milliseconds generation_backoff{5000};
    std::chrono::milliseconds iteration_delay{2000};
    std::size_t top_k = 5;
    std::size_t recent_window = 10;
    sandbox::ResourceLimits limits;
    // Holds experiments/ and research_report.txt.
    std::filesystem::path workspace;
};

LoopSettings MakeLoopSettings(const config::Config& config);

struct LoopReport {
    TerminationReason reason = TerminationReason::kNone;
    int iterations = 0;
    std::size_t total_experiments = 0;
    double elapsed_seconds = 0.0;
    std::string message;
    bool fatal = false;

    // 0 clean, 1 fatal, 2 refused objective, 3 corrupt checkpoint.
    int ExitCode() const;
};

class ResearchLoop {
public:
    using StateListener = std::function<void(LoopState)>;

    ResearchLoop(LoopSettings settings,
                 sandbox::Sandbox& sandbox,
                 researcher::HypothesisGenerator& generator,
                 const analyst::Analyst& analyst,
                 cognition::CognitionBase& store,
                 CheckpointStore& checkpoints);

    // Starts or resumes research on `objective` and blocks until termination.
    LoopReport Run(const std::string& objective);

    // Safe from any thread. Cancels in-flight runs and ends the loop after the current
    // batch has been checkpointed.
    void RequestStop();

    LoopState State() const { return state_.load(); }
    void SetStateListener(StateListener listener);

private:
    LoopReport Fail(TerminationReason reason, const std::string& message);
    bool LoadOrStart(const std::string& objective, LoopReport& refusal);
    void RollForward(const std::string& objective);
    std::optional<std::vector<researcher::Hypothesis>> Generate(
        const std::string& objective,
        const std::vector<cognition::KnowledgeEntry>& knowledge,
        const std::vector<analyst::ScoredOutcome>& recent);
    std::vector<sandbox::ExecutionVerdict> ExecuteBatch(const std::vector<researcher::Hypothesis>& batch);
    // Runs one iteration. Returns false when it was interrupted before completing.
    bool RunIteration(const std::string& objective);
    LoopReport Finish(TerminationReason reason, std::string message, bool fatal);
    void SaveCheckpoint();
    double Elapsed() const;
    bool WaitFor(std::chrono::milliseconds duration);
    void SetState(LoopState state);

    LoopSettings settings_;
    sandbox::Sandbox& sandbox_;
    researcher::HypothesisGenerator& generator_;
    const analyst::Analyst& analyst_;
    cognition::CognitionBase& store_;
    CheckpointStore& checkpoints_;

    Checkpoint checkpoint_;
    double elapsed_before_session_ = 0.0;
    std::chrono::steady_clock::time_point session_start_;

    std::atomic<LoopState> state_{LoopState::kIdle};
    std::atomic<bool> stop_requested_{false};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    std::mutex listener_mutex_;
    StateListener listener_;
};

}  // namespace autolab::orchestrator
