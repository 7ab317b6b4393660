#pragma once

#include <cstddef>  // for size_t

namespace boxrun {

// In-sandbox layout
constexpr const char* SANDBOX_WORKDIR = "/app";                       // Source area mount point
constexpr const char* SANDBOX_ARTIFACTS_PATH = "/artifacts";          // Always-present output area
constexpr const char* SANDBOX_USER_ARTIFACTS_PATH = "/user-artifacts"; // Optional caller-controlled root
constexpr const char* SANDBOX_SHELL = "/bin/sh";

// Environment variables
constexpr const char* ARTIFACTS_ENV_VAR = "ARTIFACTS_DIR";            // Exported to sandbox, read on host
constexpr const char* USER_ARTIFACTS_ENV_VAR = "USER_ARTIFACTS_DIR";
constexpr const char* STORE_ENV_VAR = "BOXRUN_ARTIFACT_STORE";
constexpr const char* STAGING_ENV_VAR = "BOXRUN_STAGING_DIR";
constexpr const char* DOCKER_ENV_VAR = "BOXRUN_DOCKER";
constexpr const char* POLL_INTERVAL_ENV_VAR = "BOXRUN_POLL_INTERVAL_MS";

// Identifiers
constexpr const char* ARTIFACT_URI_SCHEME = "artifacts://";
constexpr const char* LOGS_URI_SCHEME = "containers://";

// Staging
constexpr const char* STAGING_PREFIX = "boxrun-sandbox-";
constexpr const char* STAGING_ARTIFACTS_SUBDIR = "artifacts";
constexpr const char* STAGING_SOURCE_STEM = "main";
constexpr const char* DEFAULT_STORE_DIRNAME = "boxrun-artifacts";

// Progress reporting
constexpr int DEFAULT_PROGRESS_TOTAL = 100;                           // Terminal progress value
constexpr int DEFAULT_POLL_INTERVAL_MS = 2000;                        // Coordinator poll cadence

// Buffer sizes
constexpr size_t PIPE_BUFFER_SIZE = 4096;                             // Read buffer size

} // namespace boxrun
