#pragma once

#include <string>
#include <vector>
#include "artifact_store.h"
#include "config.h"
#include "container_backend.h"
#include "execution_monitor.h"
#include "runtime_profile.h"
#include "sandbox_provisioner.h"

namespace boxrun {

// Successful run of one request
struct RunResult {
    std::string execution_id;
    std::string logs;                      // Combined stdout/stderr
    int exit_code = -1;
    std::vector<std::string> artifacts;    // artifacts:// identifiers
};

// Top-level context: one per process, shared by every request
class Orchestrator {
public:
    Orchestrator(const Config& config, ContainerBackend& backend, ArtifactStore& store);

    // Validate, then resolve, provision, wait, and harvest on a worker while
    // reporting progress. Throws SandboxError.
    RunResult run(const ExecutionRequest& request, ProgressObserver* observer = nullptr,
                  const std::string& token = "");

    // Logs of a past execution, by id or containers://<id>/logs.
    // Throws SandboxError(EXECUTION_WAIT_FAILED)
    std::string execution_logs(const std::string& execution);

    // Remove the container of a finished execution (its artifacts stay); false on failure
    bool discard(const std::string& execution_id);

    ArtifactContent fetch_artifact(const std::string& uri) const { return store_.fetch(uri); }
    std::vector<ArtifactRecord> list_artifacts(const std::string& prefix) const { return store_.list(prefix); }

    // Throws SandboxError(CONFIG_INVALID) before any environment is created
    static void validate(const ExecutionRequest& request, const RuntimeProfile& profile);

private:
    RunResult execute(const ExecutionRequest& request, const RuntimeProfile& profile);

    Config config_;
    ContainerBackend& backend_;
    ArtifactStore& store_;
};

} // namespace boxrun
