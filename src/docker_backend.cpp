#include "docker_backend.h"
#include "errors.h"
#include <iostream>
#include <stdexcept>
#include <utility>

namespace boxrun {

namespace {

std::string trim_output(const std::string& s) {
    size_t end = s.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) {
        return "";
    }
    size_t start = s.find_first_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // namespace

DockerBackend::DockerBackend(std::string docker_binary)
    : docker_binary_(std::move(docker_binary)) {}

ProcessResult DockerBackend::docker(const std::vector<std::string>& args, bool merge_stderr) {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(docker_binary_);
    argv.insert(argv.end(), args.begin(), args.end());

    try {
        return Process::run(argv, merge_stderr);
    } catch (const std::runtime_error& e) {
        throw BackendError("failed to run " + docker_binary_ + ": " + e.what());
    }
}

ProcessResult DockerBackend::docker_checked(const std::vector<std::string>& args, const std::string& what) {
    ProcessResult result = docker(args);
    if (result.exit_code != 0) {
        std::string detail = trim_output(result.error);
        if (detail.empty()) {
            detail = "exit code " + std::to_string(result.exit_code);
        }
        throw BackendError(what + ": " + detail);
    }
    return result;
}

bool DockerBackend::available() {
    try {
        return docker({"info", "--format", "{{.ServerVersion}}"}).exit_code == 0;
    } catch (const BackendError& e) {
        std::cerr << "[Docker] " << e.what() << std::endl;
        return false;
    }
}

bool DockerBackend::has_image(const std::string& image) {
    return docker({"image", "inspect", "--format", "{{.Id}}", image}).exit_code == 0;
}

void DockerBackend::pull_image(const std::string& image) {
    std::cerr << "[Docker] Pulling image " << image << std::endl;
    docker_checked({"pull", "--quiet", image}, "failed to pull image " + image);
}

std::vector<std::string> DockerBackend::create_arguments(const ContainerSpec& spec) {
    std::vector<std::string> args = {"create"};
    if (!spec.working_dir.empty()) {
        args.push_back("--workdir");
        args.push_back(spec.working_dir);
    }
    for (const auto& mount : spec.mounts) {
        args.push_back("--volume");
        args.push_back(mount.host_path + ":" + mount.sandbox_path + (mount.read_only ? ":ro" : ""));
    }
    for (const auto& [key, value] : spec.env) {
        args.push_back("--env");
        args.push_back(key + "=" + value);
    }
    args.push_back(spec.image);
    args.insert(args.end(), spec.command.begin(), spec.command.end());
    return args;
}

std::string DockerBackend::create(const ContainerSpec& spec) {
    ProcessResult result = docker_checked(create_arguments(spec), "failed to create container");
    std::string id = trim_output(result.output);
    if (id.empty()) {
        throw BackendError("failed to create container: no container id returned");
    }
    return id;
}

void DockerBackend::start(const std::string& id) {
    docker_checked({"start", id}, "failed to start container " + id);
}

WaitStatus DockerBackend::wait(const std::string& id) {
    ProcessResult result = docker_checked({"wait", id}, "failed to wait for container " + id);

    WaitStatus status;
    try {
        status.exit_code = std::stoi(trim_output(result.output));
    } catch (const std::exception&) {
        throw BackendError("unexpected wait status for container " + id + ": " + result.output);
    }
    return status;
}

std::string DockerBackend::logs(const std::string& id) {
    // Merged so stdout and stderr interleave as the container wrote them
    ProcessResult result = docker({"logs", id}, true);
    if (result.exit_code != 0) {
        throw BackendError("failed to get container logs for " + id + ": " + trim_output(result.output));
    }
    return result.output;
}

void DockerBackend::remove(const std::string& id) {
    docker_checked({"rm", "--force", id}, "failed to remove container " + id);
}

} // namespace boxrun
