#include "orchestrator.h"
#include "artifact_collector.h"
#include "constants.h"
#include "dependency_resolver.h"
#include "errors.h"
#include <iostream>

namespace boxrun {

Orchestrator::Orchestrator(const Config& config, ContainerBackend& backend, ArtifactStore& store)
    : config_(config), backend_(backend), store_(store) {}

void Orchestrator::validate(const ExecutionRequest& request, const RuntimeProfile& profile) {
    if (request.language.empty()) {
        throw SandboxError(ErrorKind::CONFIG_INVALID, "language is required");
    }
    if (profile.empty()) {
        throw SandboxError(ErrorKind::CONFIG_INVALID, "unsupported language: " + request.language);
    }
    if (request.is_project() && !request.code.empty()) {
        throw SandboxError(ErrorKind::CONFIG_INVALID, "code and project directory are mutually exclusive");
    }
    if (!request.is_project() && request.code.empty()) {
        throw SandboxError(ErrorKind::CONFIG_INVALID, "code is required");
    }
}

RunResult Orchestrator::run(const ExecutionRequest& request, ProgressObserver* observer, const std::string& token) {
    RuntimeProfile profile = lookup_profile(request.language);
    validate(request, profile);

    RunResult result;
    ExecutionMonitor monitor(config_.poll_interval, config_.progress_total);
    monitor.observe([&]() { result = execute(request, profile); }, observer, token);
    return result;
}

RunResult Orchestrator::execute(const ExecutionRequest& request, const RuntimeProfile& profile) {
    DependencyResolver resolver(profile);
    DependencyResolution resolution;
    if (request.is_project()) {
        resolution = resolver.resolve_project(request.project_dir);
    } else {
        resolution.packages = resolver.resolve_source(request.code);
    }

    if (!resolution.packages.empty()) {
        std::cerr << "[Orchestrator] Dependencies:";
        for (const auto& package : resolution.packages.items()) {
            std::cerr << " " << package;
        }
        std::cerr << std::endl;
    }

    SandboxProvisioner provisioner(backend_, config_);
    ProvisionedSandbox sandbox = provisioner.provision(request, profile, resolution);

    RunResult result;
    result.execution_id = sandbox.execution_id;

    Termination termination = ExecutionMonitor::await_termination(backend_, result.execution_id);
    result.exit_code = termination.exit_code;
    result.logs = termination.logs;

    // Harvest before the workspace goes out of scope
    ArtifactCollector collector(store_);
    try {
        result.artifacts = collector.collect(result.execution_id, sandbox.workspace->artifacts_dir(),
                                             request.output_dir);
    } catch (const SandboxError& e) {
        throw SandboxError(e.kind(), e.message(), result.logs);
    }
    return result;
}

std::string Orchestrator::execution_logs(const std::string& execution) {
    std::string id = execution;
    const std::string scheme = LOGS_URI_SCHEME;
    const std::string suffix = "/logs";
    if (id.compare(0, scheme.size(), scheme) == 0) {
        id = id.substr(scheme.size());
        if (id.size() > suffix.size() && id.compare(id.size() - suffix.size(), suffix.size(), suffix) == 0) {
            id = id.substr(0, id.size() - suffix.size());
        }
    }
    if (!ArtifactStore::is_valid_name(id)) {
        throw SandboxError(ErrorKind::EXECUTION_WAIT_FAILED, "invalid execution identifier: " + execution);
    }

    try {
        return backend_.logs(id);
    } catch (const BackendError& e) {
        throw SandboxError(ErrorKind::EXECUTION_WAIT_FAILED, "failed to get logs of " + id + ": " + e.what());
    }
}

bool Orchestrator::discard(const std::string& execution_id) {
    try {
        backend_.remove(execution_id);
    } catch (const BackendError& e) {
        std::cerr << "[Orchestrator] Warning: failed to remove " << execution_id << ": " << e.what() << std::endl;
        return false;
    }
    std::cerr << "[Orchestrator] Removed " << execution_id << std::endl;
    return true;
}

} // namespace boxrun
