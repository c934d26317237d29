#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

#include "config/config_schema.hpp"
#include "sandbox/sandbox.hpp"

namespace autolab::sandbox {

struct SandboxSettings {
    // Resolved through PATH when it has no slash.
    std::string interpreter = "python3";
    std::string script_name = "experiment.py";
    std::filesystem::path scratch_root;
    std::size_t max_output_bytes = 10000;
    std::uint64_t max_file_bytes = 64ull * 1024 * 1024;
    std::chrono::milliseconds kill_grace{500};
    std::chrono::milliseconds poll_interval{20};
};

SandboxSettings MakeSandboxSettings(const config::SandboxConfig& config, const std::string& workspace);

// Runs each hypothesis as a separate interpreter process inside a throwaway scratch
// directory. The child gets its own process group, rlimits for address space, file
// size and CPU, a scrubbed environment and, where the kernel allows it, an empty
// network namespace. Wall clock and RSS are enforced from the parent.
class ProcessSandbox : public Sandbox {
public:
    explicit ProcessSandbox(SandboxSettings settings);

    ExecutionVerdict Run(const autolab::researcher::Hypothesis& hypothesis,
                         const ResourceLimits& limits) override;
    void CancelAll() override;
    // Lets runs start again after CancelAll().
    void ResetCancellation();

private:
    ExecutionVerdict Execute(const autolab::researcher::Hypothesis& hypothesis,
                             const std::string& program,
                             const ResourceLimits& limits);

    SandboxSettings settings_;
    std::atomic<bool> cancelled_{false};
};

}  // namespace autolab::sandbox
