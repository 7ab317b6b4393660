#pragma once

#include <string>
#include <vector>
#include <map>

namespace boxrun {

// Host directory bound into the isolated environment
struct Mount {
    std::string host_path;
    std::string sandbox_path;
    bool read_only = false;
};

// Everything needed to create one isolated environment
struct ContainerSpec {
    std::string image;
    std::vector<std::string> command;          // argv executed inside the sandbox
    std::string working_dir;
    std::vector<Mount> mounts;
    std::map<std::string, std::string> env;
};

// Terminal state observed by wait()
struct WaitStatus {
    int exit_code = -1;
};

// Isolated-environment backend. All operations throw BackendError on failure.
class ContainerBackend {
public:
    virtual ~ContainerBackend() = default;

    // True if the image is available locally
    virtual bool has_image(const std::string& image) = 0;

    // Fetch the image from its registry
    virtual void pull_image(const std::string& image) = 0;

    // Create (but do not start) an environment; returns its id
    virtual std::string create(const ContainerSpec& spec) = 0;

    virtual void start(const std::string& id) = 0;

    // Block until the environment is no longer running
    virtual WaitStatus wait(const std::string& id) = 0;

    // Combined stdout/stderr of the environment
    virtual std::string logs(const std::string& id) = 0;

    // Discard the environment and its logs
    virtual void remove(const std::string& id) = 0;
};

} // namespace boxrun
