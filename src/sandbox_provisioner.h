#pragma once

#include <string>
#include <vector>
#include <memory>
#include <filesystem>
#include "config.h"
#include "container_backend.h"
#include "dependency_resolver.h"
#include "runtime_profile.h"

namespace boxrun {

// One run request; never mutated once handed to the orchestrator
struct ExecutionRequest {
    std::string language;
    std::string code;            // Inline source (inline mode)
    std::string project_dir;     // Project root (project mode)
    std::string entrypoint;      // Optional run command line, defaults to the profile's
    std::string output_dir;      // Optional extra destination for artifacts

    bool is_project() const { return !project_dir.empty(); }
};

// One step of the in-sandbox command
struct CommandStep {
    std::vector<std::string> argv;   // Rendered argument by argument, each shell-quoted
    std::string script;              // Caller-supplied command line, rendered verbatim

    std::string render() const;
};

// Install steps followed by the run step
struct CommandPlan {
    std::vector<CommandStep> install_steps;
    CommandStep run_step;

    bool has_install_step() const { return !install_steps.empty(); }

    // "<install> && ... && <run>"
    std::string render() const;

    // {"/bin/sh", "-c", render()}
    std::vector<std::string> to_argv() const;
};

// Quote a single argument for /bin/sh (unchanged if it needs no quoting)
std::string shell_quote(const std::string& arg);

// Drop byte sequences that are not valid UTF-8
std::string strip_invalid_utf8(const std::string& text);

// Build the install+run plan for a request
CommandPlan compose_command(
    const RuntimeProfile& profile,
    const ExecutionRequest& request,
    const DependencyResolution& resolution
);

// Ephemeral staging area of one run; removed (best-effort) on destruction
class SandboxWorkspace {
public:
    // Create a fresh staging root with an artifacts/ subdirectory
    // Throws SandboxError(PROVISION_FAILED)
    static std::unique_ptr<SandboxWorkspace> create(const std::filesystem::path& staging_dir);

    ~SandboxWorkspace();

    SandboxWorkspace(const SandboxWorkspace&) = delete;
    SandboxWorkspace& operator=(const SandboxWorkspace&) = delete;

    const std::filesystem::path& root() const { return root_; }
    const std::filesystem::path& source_dir() const { return source_dir_; }
    const std::filesystem::path& artifacts_dir() const { return artifacts_dir_; }

    // Bind a caller-owned project directory instead of the staging root
    void use_source_dir(const std::filesystem::path& dir) { source_dir_ = dir; }

    ContainerSpec& spec() { return spec_; }
    const ContainerSpec& spec() const { return spec_; }

private:
    explicit SandboxWorkspace(const std::filesystem::path& root);

    std::filesystem::path root_;
    std::filesystem::path source_dir_;
    std::filesystem::path artifacts_dir_;
    ContainerSpec spec_;
};

// A started execution and the workspace bound to it
struct ProvisionedSandbox {
    std::string execution_id;
    std::unique_ptr<SandboxWorkspace> workspace;
};

// Prepares and starts the isolated environment for a request
class SandboxProvisioner {
public:
    SandboxProvisioner(ContainerBackend& backend, const Config& config);

    // Image readiness, staging, command composition, mounts, create+start.
    // Throws SandboxError (PROVISION_FAILED or CONFIG_INVALID); the workspace
    // is released before the error propagates.
    ProvisionedSandbox provision(
        const ExecutionRequest& request,
        const RuntimeProfile& profile,
        const DependencyResolution& resolution
    );

    // Pull the image unless it is already present
    void ensure_image(const std::string& image);

    // Create the workspace and stage sources; prepares the output dir
    std::unique_ptr<SandboxWorkspace> stage(const ExecutionRequest& request, const RuntimeProfile& profile);

    // Fill the container spec: command, mounts and environment
    void assemble(SandboxWorkspace& workspace, const RuntimeProfile& profile, const CommandPlan& plan);

    // Create and start; returns the execution id
    std::string launch(const SandboxWorkspace& workspace);

private:
    ContainerBackend& backend_;
    Config config_;
};

} // namespace boxrun
