#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "analyst/analyst.hpp"
#include "cognition/cognition_base.hpp"
#include "config/config_loader.hpp"
#include "orchestrator/checkpoint.hpp"
#include "orchestrator/research_loop.hpp"
#include "providers/llm_provider.hpp"
#include "providers/reasoning_backend.hpp"
#include "researcher/researcher.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "utils/errors.hpp"
#include "utils/json_utils.hpp"
#include "utils/logging.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFatal = 1;
constexpr int kExitUsage = 2;
constexpr int kExitCorrupt = 3;

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

struct CliOptions {
    std::filesystem::path config_path;
    std::optional<std::string> workspace;
    std::string command;
    std::vector<std::string> args;
};

void PrintUsage() {
    std::cerr << "Usage: autolab [--config PATH] [--workspace DIR] <command>\n"
              << "  run \"<objective>\"   start or continue research on an objective\n"
              << "  resume              continue the objective in the checkpoint\n"
              << "  status              show checkpoint progress\n"
              << "  knowledge           dump the knowledge entries as JSON\n"
              << "  reset               delete checkpoint, knowledge store and archive" << std::endl;
}

std::optional<CliOptions> ParseArgs(int argc, char** argv) {
    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" || arg == "--workspace") {
            if (i + 1 >= argc) {
                return std::nullopt;
            }
            if (arg == "--config") {
                options.config_path = argv[++i];
            } else {
                options.workspace = argv[++i];
            }
        } else if (options.command.empty()) {
            options.command = arg;
        } else {
            options.args.push_back(arg);
        }
    }
    if (options.command.empty()) {
        return std::nullopt;
    }
    return options;
}

std::filesystem::path WorkspacePath(const autolab::config::Config& config) {
    return std::filesystem::path(config.workspace);
}

void ConfigureLogging(const autolab::config::Config& config) {
    const auto workspace = WorkspacePath(config);
    std::error_code ec;
    std::filesystem::create_directories(workspace, ec);
    autolab::utils::Logger::Instance().Configure(autolab::utils::LogConfig{
        .min_level = autolab::utils::ParseLogLevel(config.log.level),
        .file = ec ? std::string() : (workspace / "research_log.txt").string(),
        .echo_to_stderr = config.log.echo_to_stderr});
}

autolab::cognition::KnowledgeSettings MakeKnowledgeSettings(const autolab::config::Config& config) {
    return autolab::cognition::KnowledgeSettings{
        .capacity = static_cast<std::size_t>(config.knowledge.capacity),
        .similarity_threshold = config.knowledge.similarity_threshold,
        .recency_half_life = config.knowledge.recency_half_life};
}

std::string ProgramLanguage(const std::string& interpreter) {
    const auto name = std::filesystem::path(interpreter).filename().string();
    if (name.rfind("python", 0) == 0) {
        return "Python 3";
    }
    return name + " script";
}

int RunResearch(const autolab::config::Config& config, const std::string& objective) {
    const auto workspace = WorkspacePath(config);
    autolab::orchestrator::CheckpointStore checkpoints(workspace / "checkpoint.json");
    std::unique_ptr<autolab::cognition::CognitionBase> store;
    try {
        store = std::make_unique<autolab::cognition::CognitionBase>(
            workspace / "knowledge.db", MakeKnowledgeSettings(config));
    } catch (const autolab::utils::PersistenceFailure& ex) {
        std::cerr << "Cannot open knowledge store: " << ex.what() << std::endl;
        return kExitFatal;
    }

    const auto provider = autolab::providers::CreateProvider(config);
    const std::chrono::seconds timeout(config.research.generation_timeout_s);
    auto research_backend = std::make_shared<autolab::providers::ProviderBackend>(
        provider, autolab::researcher::ResearcherSystemPrompt(), config.research.max_tokens, timeout);
    auto analysis_backend = std::make_shared<autolab::providers::ProviderBackend>(
        provider, autolab::analyst::AnalystSystemPrompt(), config.research.max_tokens, timeout);

    autolab::researcher::HypothesisGenerator generator(
        research_backend,
        autolab::researcher::ResearcherSettings{
            .temperature = config.research.hypothesis_temperature,
            .language = ProgramLanguage(config.sandbox.interpreter),
            .network_allowed = config.sandbox.network_allowed});
    autolab::analyst::Analyst analyst(analysis_backend, config.research.analysis_depth);
    autolab::sandbox::ProcessSandbox sandbox(
        autolab::sandbox::MakeSandboxSettings(config.sandbox, config.workspace));

    autolab::orchestrator::ResearchLoop loop(
        autolab::orchestrator::MakeLoopSettings(config), sandbox, generator, analyst, *store, checkpoints);

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    std::cout << "autolab researching: " << objective << "\nPress Ctrl+C to stop." << std::endl;

    std::atomic<bool> finished{false};
    autolab::orchestrator::LoopReport report;
    std::thread loop_thread([&]() {
        try {
            report = loop.Run(objective);
        } catch (const std::exception& ex) {
            report = autolab::orchestrator::LoopReport{};
            report.reason = autolab::orchestrator::TerminationReason::kInternalError;
            report.fatal = true;
            report.message = std::string("research loop failed: ") + ex.what();
        }
        finished.store(true);
    });

    bool stop_forwarded = false;
    while (!finished.load()) {
        if (g_signal != 0 && !stop_forwarded) {
            stop_forwarded = true;
            std::cout << "\nStopping after the current batch..." << std::endl;
            loop.RequestStop();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    if (loop_thread.joinable()) {
        loop_thread.join();
    }

    std::cout << "Research ended (" << autolab::orchestrator::ToString(report.reason) << "): "
              << report.iterations << " iterations, " << report.total_experiments << " experiments" << std::endl;
    if (!report.message.empty()) {
        std::cerr << report.message << std::endl;
    }
    return report.ExitCode();
}

std::optional<autolab::orchestrator::Checkpoint> LoadCheckpoint(const autolab::config::Config& config, int& exit_code) {
    autolab::orchestrator::CheckpointStore checkpoints(WorkspacePath(config) / "checkpoint.json");
    try {
        exit_code = kExitOk;
        return checkpoints.Load();
    } catch (const autolab::utils::CorruptState& ex) {
        std::cerr << "Checkpoint is corrupt (" << ex.what() << "). Run `autolab reset` to start over." << std::endl;
        exit_code = kExitCorrupt;
        return std::nullopt;
    } catch (const autolab::utils::PersistenceFailure& ex) {
        std::cerr << "Cannot read checkpoint: " << ex.what() << std::endl;
        exit_code = kExitFatal;
        return std::nullopt;
    }
}

int ResumeResearch(const autolab::config::Config& config) {
    int exit_code = kExitOk;
    const auto checkpoint = LoadCheckpoint(config, exit_code);
    if (exit_code != kExitOk) {
        return exit_code;
    }
    if (!checkpoint) {
        std::cerr << "No checkpoint to resume. Start with: autolab run \"<objective>\"" << std::endl;
        return kExitUsage;
    }
    return RunResearch(config, checkpoint->objective);
}

int ShowStatus(const autolab::config::Config& config) {
    int exit_code = kExitOk;
    const auto checkpoint = LoadCheckpoint(config, exit_code);
    if (exit_code != kExitOk) {
        return exit_code;
    }
    if (!checkpoint) {
        std::cout << "No research in progress." << std::endl;
        return kExitOk;
    }
    std::cout << "Objective: " << checkpoint->objective << "\n"
              << "Status: " << autolab::orchestrator::ToString(checkpoint->status);
    if (!checkpoint->termination_reason.empty()) {
        std::cout << " (" << checkpoint->termination_reason << ")";
    }
    std::cout << "\nIterations: " << checkpoint->iteration << "\n"
              << "Experiments: " << checkpoint->total_experiments << "\n"
              << "Research time: " << std::fixed << std::setprecision(1) << checkpoint->elapsed_seconds << "s\n"
              << "Updated: " << checkpoint->updated_at << "\n";
    if (!checkpoint->best_results.empty()) {
        std::cout << "Best results:\n";
        for (std::size_t i = 0; i < checkpoint->best_results.size() && i < 5; ++i) {
            const auto& best = checkpoint->best_results[i];
            std::cout << "  " << i + 1 << ". " << best.description << " (score " << std::setprecision(2)
                      << best.quality << ")\n";
        }
    }
    std::cout.flush();
    return kExitOk;
}

int DumpKnowledge(const autolab::config::Config& config, const std::vector<std::string>& args) {
    std::string objective = args.empty() ? std::string() : args.front();
    if (objective.empty()) {
        int exit_code = kExitOk;
        const auto checkpoint = LoadCheckpoint(config, exit_code);
        if (checkpoint) {
            objective = checkpoint->objective;
        }
    }
    try {
        autolab::cognition::CognitionBase store(WorkspacePath(config) / "knowledge.db", MakeKnowledgeSettings(config));
        std::cout << autolab::utils::DumpJson(store.ExportJson(objective), 2) << std::endl;
    } catch (const autolab::utils::PersistenceFailure& ex) {
        std::cerr << "Cannot open knowledge store: " << ex.what() << std::endl;
        return kExitFatal;
    }
    return kExitOk;
}

int ResetWorkspace(const autolab::config::Config& config) {
    const auto workspace = WorkspacePath(config);
    const std::vector<std::filesystem::path> targets = {
        workspace / "checkpoint.json",
        workspace / "checkpoint.json.tmp",
        workspace / "knowledge.db",
        workspace / "knowledge.db-wal",
        workspace / "knowledge.db-shm",
        workspace / "experiments",
        workspace / "research_report.txt"
    };
    int exit_code = kExitOk;
    for (const auto& target : targets) {
        std::error_code ec;
        std::filesystem::remove_all(target, ec);
        if (ec) {
            std::cerr << "Failed to remove " << target.string() << ": " << ec.message() << std::endl;
            exit_code = kExitFatal;
        }
    }
    if (exit_code == kExitOk) {
        autolab::utils::LogInfo("cli", "workspace reset", {{"workspace", workspace.string()}});
        std::cout << "Workspace reset." << std::endl;
    }
    return exit_code;
}

}  // namespace

int main(int argc, char** argv) {
    const auto options = ParseArgs(argc, argv);
    if (!options) {
        PrintUsage();
        return kExitUsage;
    }

    auto config = autolab::config::LoadConfig(options->config_path);
    if (options->workspace) {
        config.workspace = *options->workspace;
    }
    ConfigureLogging(config);

    const auto& command = options->command;
    if (command == "run") {
        if (options->args.size() != 1 || options->args.front().empty()) {
            PrintUsage();
            return kExitUsage;
        }
        return RunResearch(config, options->args.front());
    }
    if (command == "resume") {
        return ResumeResearch(config);
    }
    if (command == "status") {
        return ShowStatus(config);
    }
    if (command == "knowledge") {
        return DumpKnowledge(config, options->args);
    }
    if (command == "reset") {
        return ResetWorkspace(config);
    }

    PrintUsage();
    return kExitUsage;
}
