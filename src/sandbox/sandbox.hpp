#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"
#include "researcher/hypothesis.hpp"

namespace autolab::sandbox {

enum class TerminatedReason {
    kCompleted,
    kTimeout,
    kMemoryExceeded,
    kCrashed,
    kBlockedNetworkAccess
};

const char* ToString(TerminatedReason reason);
std::optional<TerminatedReason> ParseTerminatedReason(const std::string& value);

struct ResourceLimits {
    int max_wall_seconds = 30;
    int max_memory_mb = 1024;
    bool network_allowed = false;
};

// Outcome of running exactly one hypothesis. Built once by the sandbox and never mutated.
struct ExecutionVerdict {
    std::string hypothesis_id;
    TerminatedReason terminated_reason = TerminatedReason::kCrashed;
    int exit_code = -1;
    int signal = 0;
    std::string stdout_text;
    std::string stderr_text;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    std::uint64_t peak_memory_bytes = 0;
    double elapsed_seconds = 0.0;
    std::string diagnostic;
    // The harness itself failed (spawn error, scratch space unavailable, ...).
    bool sandbox_fault = false;
    // Killed by CancelAll(); such verdicts are never scored.
    bool cancelled = false;
};

nlohmann::json ToJson(const ExecutionVerdict& verdict);
ExecutionVerdict VerdictFromJson(const nlohmann::json& json);

// Single capability the research loop needs from the host: run one program under limits.
// Implementations must be safe to call from several worker threads at once and must
// report every failure as a verdict instead of throwing.
class Sandbox {
public:
    virtual ~Sandbox() = default;
    virtual ExecutionVerdict Run(const autolab::researcher::Hypothesis& hypothesis,
                                 const ResourceLimits& limits) = 0;
    // Terminates every run in flight. Runs that start afterwards come back cancelled
    // without being spawned.
    virtual void CancelAll() = 0;
};

}  // namespace autolab::sandbox
