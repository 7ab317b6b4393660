#pragma once

#include <string>
#include <vector>
#include "container_backend.h"
#include "process.h"

namespace boxrun {

// ContainerBackend driven through the docker command-line client
class DockerBackend : public ContainerBackend {
public:
    explicit DockerBackend(std::string docker_binary = "docker");

    bool has_image(const std::string& image) override;
    void pull_image(const std::string& image) override;
    std::string create(const ContainerSpec& spec) override;
    void start(const std::string& id) override;
    WaitStatus wait(const std::string& id) override;
    std::string logs(const std::string& id) override;
    void remove(const std::string& id) override;

    // True if the daemon answers `docker info`
    bool available();

    // Arguments of `docker create` for a spec (without the binary)
    static std::vector<std::string> create_arguments(const ContainerSpec& spec);

private:
    ProcessResult docker(const std::vector<std::string>& args, bool merge_stderr = false);

    // Run and throw BackendError("<what>: <stderr>") on a non-zero exit
    ProcessResult docker_checked(const std::vector<std::string>& args, const std::string& what);

    std::string docker_binary_;
};

} // namespace boxrun
