#pragma once

#include <string>
#include <chrono>
#include "constants.h"

namespace boxrun {

// Process-wide orchestrator settings
struct Config {
    std::string docker_binary = "docker";
    std::string artifact_store_root;           // Durable artifact storage (default: <tmp>/boxrun-artifacts)
    std::string staging_dir;                   // Parent of ephemeral workspaces (default: <tmp>)
    std::string user_artifacts_root;           // Host ARTIFACTS_DIR bound at /user-artifacts, optional
    std::chrono::milliseconds poll_interval{DEFAULT_POLL_INTERVAL_MS};
    int progress_total = DEFAULT_PROGRESS_TOTAL;
    bool restore_index = true;                 // Rebuild the artifact index from disk at startup

    // Defaults, then the JSON file (if any), then environment variables.
    // Throws SandboxError(CONFIG_INVALID) on unreadable files or bad values.
    static Config load(const std::string& config_file = "");

    // Apply keys of a JSON document on top of this config
    void apply_json(const std::string& json_text);

    // Apply BOXRUN_* / ARTIFACTS_DIR environment overrides
    void apply_environment();

    // Throws SandboxError(CONFIG_INVALID) if a value is out of range
    void validate() const;
};

} // namespace boxrun
