#include "sandbox/sandbox.hpp"

namespace autolab::sandbox {

const char* ToString(TerminatedReason reason) {
    switch (reason) {
        case TerminatedReason::kCompleted: return "completed";
        case TerminatedReason::kTimeout: return "timeout";
        case TerminatedReason::kMemoryExceeded: return "memory_exceeded";
        case TerminatedReason::kCrashed: return "crashed";
        case TerminatedReason::kBlockedNetworkAccess: return "blocked_network_access";
    }
    return "crashed";
}

std::optional<TerminatedReason> ParseTerminatedReason(const std::string& value) {
    if (value == "completed") {
        return TerminatedReason::kCompleted;
    }
    if (value == "timeout") {
        return TerminatedReason::kTimeout;
    }
    if (value == "memory_exceeded") {
        return TerminatedReason::kMemoryExceeded;
    }
    if (value == "crashed") {
        return TerminatedReason::kCrashed;
    }
    if (value == "blocked_network_access") {
        return TerminatedReason::kBlockedNetworkAccess;
    }
    return std::nullopt;
}

nlohmann::json ToJson(const ExecutionVerdict& verdict) {
    return {
        {"hypothesis_id", verdict.hypothesis_id},
        {"terminated_reason", ToString(verdict.terminated_reason)},
        {"exit_code", verdict.exit_code},
        {"signal", verdict.signal},
        {"stdout", verdict.stdout_text},
        {"stderr", verdict.stderr_text},
        {"stdout_truncated", verdict.stdout_truncated},
        {"stderr_truncated", verdict.stderr_truncated},
        {"peak_memory_bytes", verdict.peak_memory_bytes},
        {"elapsed_seconds", verdict.elapsed_seconds},
        {"diagnostic", verdict.diagnostic},
        {"sandbox_fault", verdict.sandbox_fault},
        {"cancelled", verdict.cancelled}
    };
}

ExecutionVerdict VerdictFromJson(const nlohmann::json& json) {
    ExecutionVerdict verdict{};
    verdict.hypothesis_id = json.value("hypothesis_id", "");
    verdict.terminated_reason = ParseTerminatedReason(json.value("terminated_reason", ""))
        .value_or(TerminatedReason::kCrashed);
    verdict.exit_code = json.value("exit_code", -1);
    verdict.signal = json.value("signal", 0);
    verdict.stdout_text = json.value("stdout", "");
    verdict.stderr_text = json.value("stderr", "");
    verdict.stdout_truncated = json.value("stdout_truncated", false);
    verdict.stderr_truncated = json.value("stderr_truncated", false);
    verdict.peak_memory_bytes = json.value("peak_memory_bytes", std::uint64_t{0});
    verdict.elapsed_seconds = json.value("elapsed_seconds", 0.0);
    verdict.diagnostic = json.value("diagnostic", "");
    verdict.sandbox_fault = json.value("sandbox_fault", false);
    verdict.cancelled = json.value("cancelled", false);
    return verdict;
}

}  // namespace autolab::sandbox
