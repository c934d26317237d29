#pragma once

#include <stdexcept>
#include <string>

namespace autolab::utils {

class ResearchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The reasoning backend was unreachable, timed out, or produced nothing usable.
// Transient: the orchestrator retries with backoff.
class GenerationUnavailable : public ResearchError {
public:
    using ResearchError::ResearchError;
};

// Checkpoint or knowledge store I/O failed. Always fatal.
class PersistenceFailure : public ResearchError {
public:
    using ResearchError::ResearchError;
};

// A persisted checkpoint failed validation; resuming requires an explicit reset.
class CorruptState : public ResearchError {
public:
    using ResearchError::ResearchError;
};

}  // namespace autolab::utils
