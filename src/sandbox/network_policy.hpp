#pragma once

#include <optional>
#include <string>

namespace autolab::sandbox {

// Returns the offending construct if `program` tries to reach the network
// (socket/HTTP imports, shell download tools, /dev/tcp redirects).
std::optional<std::string> FindNetworkViolation(const std::string& program);

// Returns the offending token if `program` contains a host-destructive command.
std::optional<std::string> FindBlockedCommand(const std::string& program);

// Heuristics over captured stderr, used after the run when the kernel-level
// restriction was the one that stopped the program.
bool LooksLikeNetworkFailure(const std::string& output);
bool LooksLikeAllocationFailure(const std::string& output);

}  // namespace autolab::sandbox
