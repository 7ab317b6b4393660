#pragma once

#include <stdexcept>
#include <string>

namespace boxrun {

// Failure categories surfaced to callers
enum class ErrorKind {
    CONFIG_INVALID,              // Bad/missing request fields, unknown language
    SCAN_FAILED,                 // Dependency discovery could not read the source tree
    PROVISION_FAILED,            // Image pull, container create or start failed
    EXECUTION_WAIT_FAILED,       // Backend reported an error while waiting or fetching logs
    ARTIFACT_COLLECTION_FAILED,  // Output directory could not be harvested
    ARTIFACT_NOT_FOUND           // Unknown artifact identifier
};

// Stable name for an error kind ("ConfigInvalid", ...)
const char* error_kind_to_string(ErrorKind kind);

// Typed failure of an orchestration step
class SandboxError : public std::runtime_error {
public:
    SandboxError(ErrorKind kind, const std::string& message, std::string logs = "");

    ErrorKind kind() const { return kind_; }

    // Message without the kind prefix
    const std::string& message() const { return message_; }

    // Logs captured before the failure (set for ARTIFACT_COLLECTION_FAILED)
    const std::string& logs() const { return logs_; }

private:
    ErrorKind kind_;
    std::string message_;
    std::string logs_;
};

// Raised by container backends; callers wrap it with the failing step's kind
class BackendError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace boxrun
