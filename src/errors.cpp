#include "errors.h"

#include <utility>

namespace boxrun {

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CONFIG_INVALID: return "ConfigInvalid";
        case ErrorKind::SCAN_FAILED: return "ScanFailed";
        case ErrorKind::PROVISION_FAILED: return "ProvisionFailed";
        case ErrorKind::EXECUTION_WAIT_FAILED: return "ExecutionWaitFailed";
        case ErrorKind::ARTIFACT_COLLECTION_FAILED: return "ArtifactCollectionFailed";
        case ErrorKind::ARTIFACT_NOT_FOUND: return "ArtifactNotFound";
    }
    return "Unknown";
}

SandboxError::SandboxError(ErrorKind kind, const std::string& message, std::string logs)
    : std::runtime_error(std::string(error_kind_to_string(kind)) + ": " + message),
      kind_(kind),
      message_(message),
      logs_(std::move(logs)) {}

} // namespace boxrun
