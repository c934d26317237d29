#include "orchestrator/research_loop.hpp"

#include <algorithm>
#include <exception>
#include <thread>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include "orchestrator/report_writer.hpp"
#include "utils/common.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace autolab::orchestrator {
namespace {

constexpr const char* kTag = "loop";

std::chrono::milliseconds BackoffFor(std::chrono::milliseconds base, int attempt) {
    auto delay = base;
    for (int i = 1; i < attempt && delay < std::chrono::minutes(10); ++i) {
        delay *= 2;
    }
    return delay;
}

RunStatus StatusFor(TerminationReason reason, bool fatal) {
    if (fatal) {
        return RunStatus::kFailed;
    }
    switch (reason) {
        case TerminationReason::kIterationBudget:
        case TerminationReason::kTimeBudget:
            return RunStatus::kCompleted;
        default:
            return RunStatus::kStopped;
    }
}

sandbox::ExecutionVerdict CancelledVerdict(const researcher::Hypothesis& hypothesis) {
    sandbox::ExecutionVerdict verdict;
    verdict.hypothesis_id = hypothesis.id;
    verdict.terminated_reason = sandbox::TerminatedReason::kCrashed;
    verdict.diagnostic = "cancelled before start";
    verdict.cancelled = true;
    return verdict;
}

}  // namespace

const char* ToString(LoopState state) {
    switch (state) {
        case LoopState::kIdle: return "idle";
        case LoopState::kGenerating: return "generating";
        case LoopState::kExecuting: return "executing";
        case LoopState::kScoring: return "scoring";
        case LoopState::kUpdatingKnowledge: return "updating_knowledge";
        case LoopState::kCheckpointing: return "checkpointing";
        case LoopState::kTerminated: return "terminated";
    }
    return "unknown";
}

const char* ToString(TerminationReason reason) {
    switch (reason) {
        case TerminationReason::kNone: return "none";
        case TerminationReason::kIterationBudget: return "iteration_budget";
        case TerminationReason::kTimeBudget: return "time_budget";
        case TerminationReason::kStopRequested: return "stop_requested";
        case TerminationReason::kGenerationUnavailable: return "generation_unavailable";
        case TerminationReason::kPersistenceFailure: return "persistence_failure";
        case TerminationReason::kObjectiveMismatch: return "objective_mismatch";
        case TerminationReason::kCorruptState: return "corrupt_state";
        case TerminationReason::kInternalError: return "internal_error";
    }
    return "unknown";
}

Decision DecideNextAction(const Checkpoint& checkpoint,
                          const Budgets& budgets,
                          double elapsed_seconds,
                          bool stop_requested) {
    if (stop_requested) {
        return {NextAction::kTerminate, TerminationReason::kStopRequested};
    }
    if (checkpoint.iteration >= budgets.max_iterations) {
        return {NextAction::kTerminate, TerminationReason::kIterationBudget};
    }
    if (budgets.max_research_seconds > 0.0 && elapsed_seconds >= budgets.max_research_seconds) {
        return {NextAction::kTerminate, TerminationReason::kTimeBudget};
    }
    return {NextAction::kRunIteration, TerminationReason::kNone};
}

LoopSettings MakeLoopSettings(const config::Config& config) {
    const auto& research = config.research;
    LoopSettings settings;
    settings.budgets.max_iterations = research.max_iterations;
    settings.budgets.max_research_seconds = static_cast<double>(research.max_research_seconds);
    settings.experiments_per_iteration = static_cast<std::size_t>(std::max(1, research.experiments_per_iteration));
    settings.parallelism = static_cast<std::size_t>(std::max(0, research.parallelism));
    settings.generation_max_attempts = std::max(1, research.generation_max_attempts);
    settings.generation_backoff = std::chrono::milliseconds(std::max(0, research.generation_backoff_ms));
    settings.iteration_delay = std::chrono::milliseconds(std::max(0, research.iteration_delay_ms));
    settings.top_k = static_cast<std::size_t>(std::max(0, config.knowledge.top_k));
    settings.recent_window = static_cast<std::size_t>(std::max(0, research.recent_window));
    settings.limits = sandbox::ResourceLimits{
        .max_wall_seconds = config.sandbox.max_wall_seconds,
        .max_memory_mb = config.sandbox.max_memory_mb,
        .network_allowed = config.sandbox.network_allowed};
    settings.workspace = config.workspace;
    return settings;
}

int LoopReport::ExitCode() const {
    if (reason == TerminationReason::kCorruptState) {
        return 3;
    }
    if (reason == TerminationReason::kObjectiveMismatch) {
        return 2;
    }
    return fatal ? 1 : 0;
}

ResearchLoop::ResearchLoop(LoopSettings settings,
                           sandbox::Sandbox& sandbox,
                           researcher::HypothesisGenerator& generator,
                           const analyst::Analyst& analyst,
                           cognition::CognitionBase& store,
                           CheckpointStore& checkpoints)
    : settings_(std::move(settings))
    , sandbox_(sandbox)
    , generator_(generator)
    , analyst_(analyst)
    , store_(store)
    , checkpoints_(checkpoints) {}

void ResearchLoop::SetStateListener(StateListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener_ = std::move(listener);
}

void ResearchLoop::SetState(LoopState state) {
    state_.store(state);
    utils::LogDebug(kTag, std::string("state ") + ToString(state));
    std::lock_guard<std::mutex> lock(listener_mutex_);
    if (listener_) {
        listener_(state);
    }
}

void ResearchLoop::RequestStop() {
    if (stop_requested_.exchange(true)) {
        return;
    }
    utils::LogInfo(kTag, "stop requested");
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
    }
    wait_cv_.notify_all();
    sandbox_.CancelAll();
}

bool ResearchLoop::WaitFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    return wait_cv_.wait_for(lock, duration, [this]() { return stop_requested_.load(); });
}

double ResearchLoop::Elapsed() const {
    const auto session = std::chrono::duration<double>(std::chrono::steady_clock::now() - session_start_);
    return elapsed_before_session_ + session.count();
}

LoopReport ResearchLoop::Fail(TerminationReason reason, const std::string& message) {
    utils::LogError(kTag, message, {{"reason", ToString(reason)}});
    SetState(LoopState::kTerminated);
    LoopReport report;
    report.reason = reason;
    report.message = message;
    report.fatal = true;
    return report;
}

bool ResearchLoop::LoadOrStart(const std::string& objective, LoopReport& refusal) {
    std::optional<Checkpoint> loaded;
    try {
        loaded = checkpoints_.Load();
    } catch (const utils::CorruptState& ex) {
        refusal = Fail(TerminationReason::kCorruptState,
                       std::string("checkpoint is corrupt, run `autolab reset`: ") + ex.what());
        return false;
    }

    if (loaded) {
        if (loaded->objective != objective) {
            refusal = Fail(TerminationReason::kObjectiveMismatch,
                           "checkpoint belongs to objective \"" + loaded->objective
                               + "\"; resume it or run `autolab reset` first");
            return false;
        }
        checkpoint_ = std::move(*loaded);
        utils::LogInfo(kTag, "resuming research",
                       {{"iteration", std::to_string(checkpoint_.iteration)},
                        {"experiments", std::to_string(checkpoint_.total_experiments)}});
    } else {
        checkpoint_ = Checkpoint{};
        checkpoint_.objective = objective;
        checkpoint_.started_at = utils::NowIso();
        utils::LogInfo(kTag, "starting research", {{"objective", objective}});
    }
    checkpoint_.knowledge_path = store_.Path().string();
    checkpoint_.status = RunStatus::kRunning;
    checkpoint_.termination_reason.clear();
    RollForward(objective);
    return true;
}

void ResearchLoop::RollForward(const std::string& objective) {
    // A crash between the knowledge commit and the checkpoint write leaves the store ahead.
    const int stored_iteration = store_.LastCompletedIteration();
    if (stored_iteration <= checkpoint_.iteration || store_.OutcomeCount(objective) == 0) {
        return;
    }
    utils::LogWarn(kTag, "knowledge store is ahead of the checkpoint, rolling forward",
                   {{"checkpoint", std::to_string(checkpoint_.iteration)},
                    {"store", std::to_string(stored_iteration)}});
    checkpoint_.iteration = stored_iteration;
    checkpoint_.total_experiments = store_.OutcomeCount(objective);
    checkpoint_.knowledge_merge_seq = store_.MergeSequence();
    checkpoint_.best_results.clear();
    for (const auto& outcome : store_.TopOutcomes(objective, kMaxBestResults)) {
        RecordBestResult(checkpoint_, outcome);
    }
    const auto recent = store_.RecentOutcomes(objective, 1);
    if (!recent.empty()) {
        checkpoint_.last_outcome_id = recent.back().id;
    }
}

LoopReport ResearchLoop::Run(const std::string& objective) {
    SetState(LoopState::kIdle);

    // Nothing has been written yet, so a failure here leaves the checkpoint as it was.
    try {
        LoopReport refusal;
        if (!LoadOrStart(objective, refusal)) {
            return refusal;
        }
    } catch (const utils::ResearchError& ex) {
        return Fail(TerminationReason::kPersistenceFailure, std::string("cannot load research state: ") + ex.what());
    } catch (const std::exception& ex) {
        return Fail(TerminationReason::kInternalError, std::string("cannot load research state: ") + ex.what());
    }
    elapsed_before_session_ = checkpoint_.elapsed_seconds;
    session_start_ = std::chrono::steady_clock::now();

    try {
        SaveCheckpoint();
        while (true) {
            const auto decision = DecideNextAction(checkpoint_, settings_.budgets, Elapsed(),
                                                   stop_requested_.load());
            if (decision.action == NextAction::kTerminate) {
                return Finish(decision.reason, "", false);
            }
            if (!RunIteration(objective)) {
                return Finish(TerminationReason::kStopRequested, "", false);
            }
            const auto next = DecideNextAction(checkpoint_, settings_.budgets, Elapsed(),
                                               stop_requested_.load());
            if (next.action == NextAction::kRunIteration && settings_.iteration_delay.count() > 0) {
                WaitFor(settings_.iteration_delay);
            }
        }
    } catch (const utils::GenerationUnavailable& ex) {
        return Finish(TerminationReason::kGenerationUnavailable,
                      std::string("hypothesis generation unavailable: ") + ex.what(), true);
    } catch (const utils::PersistenceFailure& ex) {
        return Finish(TerminationReason::kPersistenceFailure,
                      std::string("persistence failure: ") + ex.what(), true);
    } catch (const std::exception& ex) {
        return Finish(TerminationReason::kInternalError, std::string("internal error: ") + ex.what(), true);
    }
}

std::optional<std::vector<researcher::Hypothesis>> ResearchLoop::Generate(
    const std::string& objective,
    const std::vector<cognition::KnowledgeEntry>& knowledge,
    const std::vector<analyst::ScoredOutcome>& recent) {
    for (int attempt = 1;; ++attempt) {
        std::chrono::milliseconds delay{0};
        try {
            return generator_.Propose(objective, knowledge, recent, settings_.experiments_per_iteration,
                                      checkpoint_.total_experiments);
        } catch (const utils::GenerationUnavailable& ex) {
            if (attempt >= settings_.generation_max_attempts) {
                throw;
            }
            delay = BackoffFor(settings_.generation_backoff, attempt);
            utils::LogWarn(kTag, "generation failed, retrying",
                           {{"attempt", std::to_string(attempt)},
                            {"delay_ms", std::to_string(delay.count())},
                            {"error", ex.what()}});
        }
        if (WaitFor(delay)) {
            return std::nullopt;
        }
    }
}

std::vector<sandbox::ExecutionVerdict> ResearchLoop::ExecuteBatch(
    const std::vector<researcher::Hypothesis>& batch) {
    std::vector<sandbox::ExecutionVerdict> verdicts(batch.size());
    if (batch.empty()) {
        return verdicts;
    }
    std::size_t threads = settings_.parallelism;
    if (threads == 0) {
        threads = std::max<std::size_t>(1, std::thread::hardware_concurrency());
    }
    threads = std::min(threads, batch.size());

    boost::asio::thread_pool pool(threads);
    for (std::size_t i = 0; i < batch.size(); ++i) {
        boost::asio::post(pool, [this, &batch, &verdicts, i]() {
            const auto& hypothesis = batch[i];
            if (stop_requested_.load()) {
                verdicts[i] = CancelledVerdict(hypothesis);
                return;
            }
            try {
                verdicts[i] = sandbox_.Run(hypothesis, settings_.limits);
            } catch (const std::exception& ex) {
                utils::LogError("sandbox", "run threw", {{"hypothesis", hypothesis.id}, {"error", ex.what()}});
                sandbox::ExecutionVerdict verdict;
                verdict.hypothesis_id = hypothesis.id;
                verdict.terminated_reason = sandbox::TerminatedReason::kCrashed;
                verdict.diagnostic = ex.what();
                verdict.sandbox_fault = true;
                verdicts[i] = std::move(verdict);
            }
        });
    }
    pool.join();
    return verdicts;
}

bool ResearchLoop::RunIteration(const std::string& objective) {
    const int iteration = checkpoint_.iteration + 1;
    utils::LogInfo(kTag, "iteration " + std::to_string(iteration) + " started");

    SetState(LoopState::kGenerating);
    const auto knowledge = store_.Retrieve(objective, settings_.top_k);
    const auto recent = store_.RecentOutcomes(objective, settings_.recent_window);
    auto proposals = Generate(objective, knowledge, recent);
    if (!proposals) {
        return false;
    }

    std::vector<researcher::Hypothesis> batch;
    for (auto& hypothesis : *proposals) {
        if (store_.HasOutcome(analyst::MakeOutcomeId(hypothesis.id))) {
            utils::LogInfo(kTag, "skipping hypothesis with a stored outcome", {{"hypothesis", hypothesis.id}});
            continue;
        }
        batch.push_back(std::move(hypothesis));
    }
    std::stable_sort(batch.begin(), batch.end(), [](const auto& a, const auto& b) {
        return a.sequence < b.sequence;
    });

    SetState(LoopState::kExecuting);
    const auto verdicts = ExecuteBatch(batch);

    SetState(LoopState::kScoring);
    const auto archive_dir = settings_.workspace / "experiments";
    std::vector<analyst::ScoredOutcome> scored;
    std::vector<const researcher::Hypothesis*> scored_hypotheses;
    for (std::size_t i = 0; i < batch.size(); ++i) {
        if (verdicts[i].cancelled) {
            utils::LogInfo(kTag, "discarding cancelled run", {{"hypothesis", batch[i].id}});
            continue;
        }
        auto outcome = analyst_.Score(batch[i], verdicts[i], objective, knowledge);
        outcome.iteration = iteration;
        outcome.scored_at = utils::NowIso();
        if (analyst_.InterpretationEnabled() && !stop_requested_.load()) {
            analyst_.Interpret(batch[i], outcome);
        }
        try {
            ArchiveExperiment(archive_dir, batch[i], outcome);
        } catch (const utils::PersistenceFailure& ex) {
            utils::LogWarn(kTag, "experiment archive failed", {{"outcome", outcome.id}, {"error", ex.what()}});
        }
        utils::LogInfo(kTag, "scored " + outcome.id,
                       {{"classification", analyst::ToString(outcome.classification)},
                        {"quality", std::to_string(outcome.quality)},
                        {"verdict", sandbox::ToString(outcome.verdict.terminated_reason)}});
        scored.push_back(std::move(outcome));
        scored_hypotheses.push_back(&batch[i]);
    }

    const bool interrupted = stop_requested_.load();
    SetState(LoopState::kUpdatingKnowledge);
    store_.MergeBatch(scored, interrupted ? checkpoint_.iteration : iteration);
    std::vector<std::string> used;
    used.reserve(knowledge.size());
    for (const auto& entry : knowledge) {
        used.push_back(entry.id);
    }
    if (!used.empty() && !scored.empty()) {
        store_.MarkUsed(used);
    }

    SetState(LoopState::kCheckpointing);
    if (!interrupted) {
        checkpoint_.iteration = iteration;
    }
    checkpoint_.total_experiments += scored.size();
    for (const auto& outcome : scored) {
        RecordBestResult(checkpoint_, outcome);
    }
    if (!scored.empty()) {
        checkpoint_.last_outcome_id = scored.back().id;
    }
    SaveCheckpoint();

    utils::LogInfo(kTag, "iteration " + std::to_string(iteration) + ": "
                             + analyst::Analyst::SummarizeIteration(scored));
    return !interrupted;
}

void ResearchLoop::SaveCheckpoint() {
    checkpoint_.elapsed_seconds = Elapsed();
    checkpoint_.knowledge_merge_seq = store_.MergeSequence();
    checkpoint_.updated_at = utils::NowIso();
    checkpoints_.Save(checkpoint_);
}

LoopReport ResearchLoop::Finish(TerminationReason reason, std::string message, bool fatal) {
    checkpoint_.status = StatusFor(reason, fatal);
    checkpoint_.termination_reason = ToString(reason);

    if (reason != TerminationReason::kPersistenceFailure) {
        try {
            SaveCheckpoint();
        } catch (const std::exception& ex) {
            fatal = true;
            reason = TerminationReason::kPersistenceFailure;
            message = std::string("final checkpoint failed: ") + ex.what();
        }
    }
    try {
        const auto knowledge = store_.Retrieve(checkpoint_.objective, 10);
        WriteResearchReport(settings_.workspace / "research_report.txt", checkpoint_, knowledge);
    } catch (const std::exception& ex) {
        utils::LogWarn(kTag, "research report not written", {{"error", ex.what()}});
    }

    LoopReport report;
    report.reason = reason;
    report.iterations = checkpoint_.iteration;
    report.total_experiments = checkpoint_.total_experiments;
    report.elapsed_seconds = checkpoint_.elapsed_seconds;
    report.message = std::move(message);
    report.fatal = fatal;

    if (fatal) {
        utils::LogError(kTag, "research terminated: " + report.message, {{"reason", ToString(reason)}});
    } else {
        utils::LogInfo(kTag, "research terminated",
                       {{"reason", ToString(reason)},
                        {"iterations", std::to_string(report.iterations)},
                        {"experiments", std::to_string(report.total_experiments)}});
    }
    SetState(LoopState::kTerminated);
    return report;
}

}  // namespace autolab::orchestrator
