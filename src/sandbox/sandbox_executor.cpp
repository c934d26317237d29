#include "sandbox/sandbox_executor.hpp"

#include <boost/version.hpp>
#if BOOST_VERSION >= 108600
#include <boost/process/v1.hpp>
#include <boost/process/v1/extend.hpp>
#else
#include <boost/process.hpp>
#include <boost/process/extend.hpp>
#endif
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <thread>
#include <vector>
#include <sched.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/time.h>
#include <sys/wait.h>
#include <unistd.h>

#include "sandbox/network_policy.hpp"
#include "sandbox/scratch_directory.hpp"
#include "utils/logging.hpp"

namespace autolab::sandbox {
#if BOOST_VERSION >= 108600
namespace bp = boost::process::v1;
#else
namespace bp = boost::process;
#endif
namespace {

// Unroutable local proxy: libraries that honour proxy variables fail fast instead of
// reaching out when namespace isolation is unavailable.
constexpr const char* kDeadProxy = "http://127.0.0.1:9";

struct ChildLimits {
    std::uint64_t memory_bytes = 0;
    std::uint64_t file_bytes = 0;
    std::uint64_t cpu_seconds = 0;
    bool isolate_network = true;
};

enum class KillCause {
    kNone,
    kTimeout,
    kMemory,
    kCancelled
};

void SetLimit(int resource, std::uint64_t value) {
    rlimit limit{};
    limit.rlim_cur = static_cast<rlim_t>(value);
    limit.rlim_max = static_cast<rlim_t>(value);
    ::setrlimit(resource, &limit);
}

// Runs in the forked child before exec. Only raw system calls here; any call that
// fails leaves the parent-side watchdog and stderr heuristics as the enforcement.
void ApplyChildLimits(const ChildLimits& limits) {
    ::setpgid(0, 0);
    if (limits.isolate_network) {
        if (::unshare(CLONE_NEWUSER | CLONE_NEWNET) != 0) {
            ::unshare(CLONE_NEWNET);
        }
    }
    SetLimit(RLIMIT_AS, limits.memory_bytes);
    SetLimit(RLIMIT_FSIZE, limits.file_bytes);
    SetLimit(RLIMIT_CPU, limits.cpu_seconds);
    SetLimit(RLIMIT_CORE, 0);
}

std::string ResolveInterpreter(const std::string& interpreter) {
    if (interpreter.find('/') != std::string::npos) {
        return ::access(interpreter.c_str(), X_OK) == 0 ? interpreter : std::string{};
    }
    return bp::search_path(interpreter).string();
}

bp::environment BuildChildEnvironment(const std::filesystem::path& work_dir, bool network_allowed) {
    bp::environment env;
    const char* path = std::getenv("PATH");
    env["PATH"] = path ? path : "/usr/local/bin:/usr/bin:/bin";
    env["HOME"] = work_dir.string();
    env["TMPDIR"] = work_dir.string();
    env["LANG"] = "C.UTF-8";
    env["PYTHONDONTWRITEBYTECODE"] = "1";
    env["PYTHONUNBUFFERED"] = "1";
    env["PYTHONHASHSEED"] = "0";
    if (!network_allowed) {
        const char* kProxyVars[] = {
            "HTTP_PROXY",
            "HTTPS_PROXY",
            "ALL_PROXY",
            "http_proxy",
            "https_proxy",
            "all_proxy"
        };
        for (const auto* key : kProxyVars) {
            env[key] = kDeadProxy;
        }
    }
    return env;
}

std::uint64_t ReadRssBytes(pid_t pid) {
    std::ifstream statm("/proc/" + std::to_string(pid) + "/statm");
    std::uint64_t total_pages = 0;
    std::uint64_t resident_pages = 0;
    if (!(statm >> total_pages >> resident_pages)) {
        return 0;
    }
    return resident_pages * static_cast<std::uint64_t>(::sysconf(_SC_PAGESIZE));
}

std::string ReadCapped(const std::filesystem::path& path, std::size_t cap, bool& truncated) {
    truncated = false;
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return {};
    }
    std::string text(cap, '\0');
    input.read(text.data(), static_cast<std::streamsize>(cap));
    text.resize(static_cast<std::size_t>(input.gcount()));
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (!ec && size > cap) {
        truncated = true;
        text += "\n[truncated " + std::to_string(size - cap) + " bytes]";
    }
    return text;
}

// SIGTERM to the whole group, then SIGKILL once the grace period runs out.
// Always reaps the child.
void TerminateGroup(pid_t pid, std::chrono::milliseconds grace, int& status, rusage& usage) {
    ::killpg(pid, SIGTERM);
    const auto grace_deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < grace_deadline) {
        const auto waited = ::wait4(pid, &status, WNOHANG, &usage);
        if (waited == pid || waited < 0) {
            ::killpg(pid, SIGKILL);
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ::killpg(pid, SIGKILL);
    ::wait4(pid, &status, 0, &usage);
}

double SecondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

ExecutionVerdict FaultVerdict(const std::string& hypothesis_id, const std::string& diagnostic) {
    ExecutionVerdict verdict{};
    verdict.hypothesis_id = hypothesis_id;
    verdict.terminated_reason = TerminatedReason::kCrashed;
    verdict.diagnostic = diagnostic;
    verdict.sandbox_fault = true;
    return verdict;
}

}  // namespace

SandboxSettings MakeSandboxSettings(const config::SandboxConfig& config, const std::string& workspace) {
    SandboxSettings settings{};
    settings.interpreter = config.interpreter;
    settings.script_name = config.script_name;
    settings.scratch_root = config.scratch_root.empty()
        ? std::filesystem::path(workspace) / "tmp"
        : std::filesystem::path(config.scratch_root);
    settings.max_output_bytes = static_cast<std::size_t>(std::max(config.max_output_bytes, 1));
    settings.max_file_bytes = static_cast<std::uint64_t>(std::max(config.max_file_mb, 1)) * 1024 * 1024;
    settings.kill_grace = std::chrono::milliseconds(std::max(config.kill_grace_ms, 0));
    return settings;
}

ProcessSandbox::ProcessSandbox(SandboxSettings settings)
    : settings_(std::move(settings)) {}

void ProcessSandbox::CancelAll() {
    cancelled_.store(true);
}

void ProcessSandbox::ResetCancellation() {
    cancelled_.store(false);
}

ExecutionVerdict ProcessSandbox::Run(const autolab::researcher::Hypothesis& hypothesis,
                                     const ResourceLimits& limits) {
    const auto program = autolab::researcher::RenderProgram(hypothesis);
    if (cancelled_.load()) {
        ExecutionVerdict verdict{};
        verdict.hypothesis_id = hypothesis.id;
        verdict.terminated_reason = TerminatedReason::kCrashed;
        verdict.cancelled = true;
        verdict.diagnostic = "cancelled by stop request";
        return verdict;
    }

    if (!limits.network_allowed) {
        if (const auto violation = FindNetworkViolation(program)) {
            ExecutionVerdict verdict{};
            verdict.hypothesis_id = hypothesis.id;
            verdict.terminated_reason = TerminatedReason::kBlockedNetworkAccess;
            verdict.diagnostic = "network access blocked by policy: " + *violation;
            utils::LogWarn("sandbox", "refused network access",
                           {{"hypothesis", hypothesis.id}, {"construct", *violation}});
            return verdict;
        }
    }
    if (const auto blocked = FindBlockedCommand(program)) {
        ExecutionVerdict verdict{};
        verdict.hypothesis_id = hypothesis.id;
        verdict.terminated_reason = TerminatedReason::kCrashed;
        verdict.diagnostic = "command blocked by policy: " + *blocked;
        utils::LogWarn("sandbox", "refused blocked command",
                       {{"hypothesis", hypothesis.id}, {"token", *blocked}});
        return verdict;
    }

    try {
        return Execute(hypothesis, program, limits);
    } catch (const bp::process_error& ex) {
        utils::LogError("sandbox", "exec failed", {{"hypothesis", hypothesis.id}, {"error", ex.what()}});
        return FaultVerdict(hypothesis.id, std::string("exec failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        utils::LogError("sandbox", "scratch space unavailable",
                        {{"hypothesis", hypothesis.id}, {"error", ex.what()}});
        return FaultVerdict(hypothesis.id, std::string("scratch space unavailable: ") + ex.what());
    } catch (const std::exception& ex) {
        utils::LogError("sandbox", "harness failure", {{"hypothesis", hypothesis.id}, {"error", ex.what()}});
        return FaultVerdict(hypothesis.id, std::string("sandbox failure: ") + ex.what());
    }
}

ExecutionVerdict ProcessSandbox::Execute(const autolab::researcher::Hypothesis& hypothesis,
                                         const std::string& program,
                                         const ResourceLimits& limits) {
    ExecutionVerdict verdict{};
    verdict.hypothesis_id = hypothesis.id;

    const auto interpreter = ResolveInterpreter(settings_.interpreter);
    if (interpreter.empty()) {
        return FaultVerdict(hypothesis.id, "interpreter not found: " + settings_.interpreter);
    }

    ScratchDirectory scratch(settings_.scratch_root, "run");
    const auto work_dir = scratch.WorkDir();
    {
        std::ofstream script(work_dir / settings_.script_name, std::ios::binary);
        script << program;
        if (!script) {
            return FaultVerdict(hypothesis.id, "failed to write program into scratch directory");
        }
    }

    const auto wall = std::chrono::seconds(std::max(limits.max_wall_seconds, 1));
    ChildLimits child_limits{};
    child_limits.memory_bytes = static_cast<std::uint64_t>(std::max(limits.max_memory_mb, 1)) * 1024 * 1024;
    child_limits.file_bytes = settings_.max_file_bytes;
    // CPU time is a backstop for the wall clock, which is enforced from here.
    child_limits.cpu_seconds = static_cast<std::uint64_t>(wall.count()) + 1;
    child_limits.isolate_network = !limits.network_allowed;

    auto env = BuildChildEnvironment(work_dir, limits.network_allowed);
    const auto start = std::chrono::steady_clock::now();
    bp::child child_process(
        bp::exe = interpreter,
        bp::args = std::vector<std::string>{settings_.script_name},
        env,
        bp::start_dir = work_dir.string(),
        bp::std_in < bp::null,
        bp::std_out > scratch.StdoutPath().string(),
        bp::std_err > scratch.StderrPath().string(),
        bp::extend::on_exec_setup = [child_limits](auto&) { ApplyChildLimits(child_limits); });

    const pid_t pid = child_process.id();
    // Mirrors the child's own setpgid so killpg cannot race the exec.
    ::setpgid(pid, pid);
    utils::LogDebug("sandbox", "spawned", {{"hypothesis", hypothesis.id}, {"pid", std::to_string(pid)}});

    const auto deadline = start + wall;
    int status = 0;
    rusage usage{};
    bool reaped = false;
    KillCause cause = KillCause::kNone;
    std::uint64_t peak_rss = 0;
    while (true) {
        const auto waited = ::wait4(pid, &status, WNOHANG, &usage);
        if (waited == pid) {
            reaped = true;
            break;
        }
        if (waited < 0) {
            break;
        }
        peak_rss = std::max(peak_rss, ReadRssBytes(pid));
        if (cancelled_.load()) {
            cause = KillCause::kCancelled;
            break;
        }
        if (peak_rss > child_limits.memory_bytes) {
            cause = KillCause::kMemory;
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            cause = KillCause::kTimeout;
            break;
        }
        std::this_thread::sleep_for(settings_.poll_interval);
    }
    if (!reaped) {
        if (cause == KillCause::kNone) {
            child_process.detach();
            return FaultVerdict(hypothesis.id, "lost track of child process");
        }
        TerminateGroup(pid, settings_.kill_grace, status, usage);
    } else {
        // Reap leftovers the program may have forked into its group.
        ::killpg(pid, SIGKILL);
    }
    child_process.detach();

    verdict.elapsed_seconds = SecondsSince(start);
    verdict.peak_memory_bytes = std::max(peak_rss, static_cast<std::uint64_t>(usage.ru_maxrss) * 1024);
    verdict.stdout_text = ReadCapped(scratch.StdoutPath(), settings_.max_output_bytes, verdict.stdout_truncated);
    verdict.stderr_text = ReadCapped(scratch.StderrPath(), settings_.max_output_bytes, verdict.stderr_truncated);
    if (WIFEXITED(status)) {
        verdict.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        verdict.signal = WTERMSIG(status);
        verdict.exit_code = 128 + verdict.signal;
    }

    switch (cause) {
        case KillCause::kCancelled:
            verdict.terminated_reason = TerminatedReason::kCrashed;
            verdict.cancelled = true;
            verdict.diagnostic = "cancelled by stop request";
            break;
        case KillCause::kTimeout:
            verdict.terminated_reason = TerminatedReason::kTimeout;
            verdict.diagnostic = "wall clock limit of " + std::to_string(wall.count()) + "s exceeded";
            break;
        case KillCause::kMemory:
            verdict.terminated_reason = TerminatedReason::kMemoryExceeded;
            verdict.diagnostic = "resident memory above " + std::to_string(limits.max_memory_mb) + " MB";
            break;
        case KillCause::kNone:
            if (verdict.signal == SIGXCPU) {
                verdict.terminated_reason = TerminatedReason::kTimeout;
                verdict.diagnostic = "cpu time limit exceeded";
            } else if (verdict.signal == SIGXFSZ) {
                verdict.terminated_reason = TerminatedReason::kCrashed;
                verdict.diagnostic = "file size limit exceeded";
            } else if ((verdict.exit_code != 0 && LooksLikeAllocationFailure(verdict.stderr_text))
                       || (verdict.signal == SIGKILL && verdict.peak_memory_bytes >= child_limits.memory_bytes)) {
                verdict.terminated_reason = TerminatedReason::kMemoryExceeded;
                verdict.diagnostic = "allocation failed under the " + std::to_string(limits.max_memory_mb)
                    + " MB limit";
            } else if (!limits.network_allowed && verdict.exit_code != 0
                       && LooksLikeNetworkFailure(verdict.stderr_text)) {
                verdict.terminated_reason = TerminatedReason::kBlockedNetworkAccess;
                verdict.diagnostic = "network access attempted and denied";
            } else if (verdict.signal != 0) {
                verdict.terminated_reason = TerminatedReason::kCrashed;
                verdict.diagnostic = "terminated by signal " + std::to_string(verdict.signal);
            } else {
                verdict.terminated_reason = TerminatedReason::kCompleted;
            }
            break;
    }

    utils::LogInfo("sandbox", "run finished",
                   {{"hypothesis", hypothesis.id},
                    {"reason", ToString(verdict.terminated_reason)},
                    {"exit_code", std::to_string(verdict.exit_code)},
                    {"elapsed", std::to_string(verdict.elapsed_seconds)}});
    return verdict;
}

}  // namespace autolab::sandbox
