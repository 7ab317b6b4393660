#include "sandbox_provisioner.h"
#include "constants.h"
#include "errors.h"
#include "file_utils.h"
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>

namespace fs = std::filesystem;

namespace boxrun {

// Command composition

std::string shell_quote(const std::string& arg) {
    if (arg.empty()) {
        return "''";
    }

    bool safe = true;
    for (unsigned char c : arg) {
        if (!(std::isalnum(c) || (c != 0 && std::strchr("@%+=:,./_-", c)))) {
            safe = false;
            break;
        }
    }
    if (safe) {
        return arg;
    }

    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string CommandStep::render() const {
    if (!script.empty()) {
        return script;
    }
    std::string line;
    for (const auto& arg : argv) {
        if (!line.empty()) {
            line += " ";
        }
        line += shell_quote(arg);
    }
    return line;
}

std::string CommandPlan::render() const {
    std::string line;
    for (const auto& step : install_steps) {
        line += step.render() + " && ";
    }
    // Keep "a || b" style run commands from binding to the install chain
    if (has_install_step() && !run_step.script.empty()) {
        line += "( " + run_step.script + " )";
    } else {
        line += run_step.render();
    }
    return line;
}

std::vector<std::string> CommandPlan::to_argv() const {
    return {SANDBOX_SHELL, "-c", render()};
}

CommandPlan compose_command(
    const RuntimeProfile& profile,
    const ExecutionRequest& request,
    const DependencyResolution& resolution
) {
    CommandPlan plan;
    if (!request.entrypoint.empty()) {
        plan.run_step.script = request.entrypoint;
    } else {
        plan.run_step.argv = profile.run_command;
    }

    // The runtime resolves its own dependencies when it starts
    if (profile.implicit_install) {
        return plan;
    }

    const std::vector<std::vector<std::string>>* templates = nullptr;
    if (!resolution.manifest.empty()) {
        if (const ManifestRule* rule = profile.find_manifest(resolution.manifest)) {
            templates = &rule->install_steps;
        }
    }
    if (!templates && !resolution.packages.empty()) {
        templates = &profile.package_install_steps;
    }
    if (!templates) {
        return plan;
    }

    for (const auto& step_template : *templates) {
        CommandStep step;
        for (const auto& arg : step_template) {
            if (arg == PACKAGES_PLACEHOLDER) {
                const auto& items = resolution.packages.items();
                step.argv.insert(step.argv.end(), items.begin(), items.end());
            } else {
                step.argv.push_back(arg);
            }
        }
        plan.install_steps.push_back(step);
    }
    return plan;
}

std::string strip_invalid_utf8(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    const size_t n = text.size();
    size_t i = 0;
    auto byte = [&text](size_t pos) { return static_cast<unsigned char>(text[pos]); };
    auto cont = [&](size_t pos, unsigned char lo = 0x80, unsigned char hi = 0xBF) {
        return pos < n && byte(pos) >= lo && byte(pos) <= hi;
    };

    while (i < n) {
        unsigned char c = byte(i);
        size_t len = 0;
        if (c < 0x80) {
            len = 1;
        } else if (c >= 0xC2 && c <= 0xDF) {
            len = cont(i + 1) ? 2 : 0;
        } else if (c == 0xE0) {
            len = cont(i + 1, 0xA0, 0xBF) && cont(i + 2) ? 3 : 0;
        } else if (c == 0xED) {
            len = cont(i + 1, 0x80, 0x9F) && cont(i + 2) ? 3 : 0;
        } else if (c >= 0xE1 && c <= 0xEF) {
            len = cont(i + 1) && cont(i + 2) ? 3 : 0;
        } else if (c == 0xF0) {
            len = cont(i + 1, 0x90, 0xBF) && cont(i + 2) && cont(i + 3) ? 4 : 0;
        } else if (c >= 0xF1 && c <= 0xF3) {
            len = cont(i + 1) && cont(i + 2) && cont(i + 3) ? 4 : 0;
        } else if (c == 0xF4) {
            len = cont(i + 1, 0x80, 0x8F) && cont(i + 2) && cont(i + 3) ? 4 : 0;
        }

        if (len == 0) {
            ++i;  // Drop the invalid byte
            continue;
        }
        out.append(text, i, len);
        i += len;
    }
    return out;
}

// SandboxWorkspace

SandboxWorkspace::SandboxWorkspace(const fs::path& root)
    : root_(root),
      source_dir_(root),
      artifacts_dir_(root / STAGING_ARTIFACTS_SUBDIR) {}

std::unique_ptr<SandboxWorkspace> SandboxWorkspace::create(const fs::path& staging_dir) {
    std::string pattern = (staging_dir / (std::string(STAGING_PREFIX) + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    if (!mkdtemp(buffer.data())) {
        throw SandboxError(ErrorKind::PROVISION_FAILED,
                           "failed to create temporary directory in " + staging_dir.string() +
                           ": " + std::strerror(errno));
    }

    std::unique_ptr<SandboxWorkspace> workspace(new SandboxWorkspace(fs::path(buffer.data())));

    std::error_code ec;
    fs::create_directory(workspace->artifacts_dir_, ec);
    if (ec) {
        throw SandboxError(ErrorKind::PROVISION_FAILED,
                           "failed to create artifacts directory: " + ec.message());
    }

    // The sandbox user is not necessarily the host user
    fs::permissions(workspace->root_, fs::perms::owner_all | fs::perms::group_read |
                    fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec, ec);
    if (!ec) {
        fs::permissions(workspace->artifacts_dir_, fs::perms::all, ec);
    }
    if (ec) {
        std::cerr << "[Provisioner] Warning: failed to open up " << workspace->root_
                  << ": " << ec.message() << std::endl;
    }

    return workspace;
}

SandboxWorkspace::~SandboxWorkspace() {
    std::error_code ec;
    fs::remove_all(root_, ec);
    if (ec) {
        std::cerr << "[Provisioner] Warning: failed to remove workspace " << root_
                  << ": " << ec.message() << std::endl;
    }
}

// SandboxProvisioner

SandboxProvisioner::SandboxProvisioner(ContainerBackend& backend, const Config& config)
    : backend_(backend), config_(config) {}

void SandboxProvisioner::ensure_image(const std::string& image) {
    try {
        if (backend_.has_image(image)) {
            return;
        }
        backend_.pull_image(image);
    } catch (const BackendError& e) {
        throw SandboxError(ErrorKind::PROVISION_FAILED,
                           "failed to pull image " + image + ": " + e.what());
    }
}

std::unique_ptr<SandboxWorkspace> SandboxProvisioner::stage(
    const ExecutionRequest& request,
    const RuntimeProfile& profile
) {
    std::error_code ec;
    if (!request.output_dir.empty()) {
        // Only a copy destination; never bound into the sandbox
        if (fs::create_directories(request.output_dir, ec)) {
            std::cerr << "[Provisioner] Created output directory: " << request.output_dir << std::endl;
        } else if (ec) {
            throw SandboxError(ErrorKind::CONFIG_INVALID,
                               "failed to create output directory " + request.output_dir + ": " + ec.message());
        }
    }

    auto workspace = SandboxWorkspace::create(config_.staging_dir);

    if (request.is_project()) {
        fs::path project = fs::absolute(request.project_dir, ec);
        if (ec) {
            throw SandboxError(ErrorKind::CONFIG_INVALID,
                               "invalid project directory " + request.project_dir + ": " + ec.message());
        }
        workspace->use_source_dir(project.lexically_normal());
    } else {
        fs::path source = workspace->root() /
            (std::string(STAGING_SOURCE_STEM) + "." + profile.extension);
        if (!FileUtils::write_file(source.string(), strip_invalid_utf8(request.code))) {
            throw SandboxError(ErrorKind::PROVISION_FAILED,
                               "failed to write code to temporary file " + source.string());
        }
    }

    return workspace;
}

void SandboxProvisioner::assemble(
    SandboxWorkspace& workspace,
    const RuntimeProfile& profile,
    const CommandPlan& plan
) {
    ContainerSpec& spec = workspace.spec();
    spec.image = profile.image;
    spec.command = plan.to_argv();
    spec.working_dir = SANDBOX_WORKDIR;
    spec.mounts = {
        {workspace.source_dir().string(), SANDBOX_WORKDIR, false},
        {workspace.artifacts_dir().string(), SANDBOX_ARTIFACTS_PATH, false},
    };
    spec.env[ARTIFACTS_ENV_VAR] = SANDBOX_ARTIFACTS_PATH;

    if (!config_.user_artifacts_root.empty()) {
        std::error_code ec;
        if (fs::create_directories(config_.user_artifacts_root, ec)) {
            std::cerr << "[Provisioner] Created user artifacts directory: "
                      << config_.user_artifacts_root << std::endl;
        } else if (ec) {
            std::cerr << "[Provisioner] Warning: failed to create user artifacts directory "
                      << config_.user_artifacts_root << ": " << ec.message() << std::endl;
        }
        fs::path user_root = fs::absolute(config_.user_artifacts_root, ec);
        if (ec) {
            user_root = config_.user_artifacts_root;
        }
        spec.mounts.push_back({user_root.string(), SANDBOX_USER_ARTIFACTS_PATH, false});
        spec.env[USER_ARTIFACTS_ENV_VAR] = SANDBOX_USER_ARTIFACTS_PATH;
    }

    std::cerr << "[Provisioner] Command: " << plan.render() << std::endl;
}

std::string SandboxProvisioner::launch(const SandboxWorkspace& workspace) {
    std::string id;
    try {
        id = backend_.create(workspace.spec());
    } catch (const BackendError& e) {
        throw SandboxError(ErrorKind::PROVISION_FAILED, e.what());
    }

    try {
        backend_.start(id);
    } catch (const BackendError& e) {
        try {
            backend_.remove(id);
        } catch (const BackendError& cleanup) {
            std::cerr << "[Provisioner] Warning: " << cleanup.what() << std::endl;
        }
        throw SandboxError(ErrorKind::PROVISION_FAILED, e.what());
    }

    std::cerr << "[Provisioner] Started " << id << std::endl;
    return id;
}

ProvisionedSandbox SandboxProvisioner::provision(
    const ExecutionRequest& request,
    const RuntimeProfile& profile,
    const DependencyResolution& resolution
) {
    ensure_image(profile.image);

    ProvisionedSandbox sandbox;
    sandbox.workspace = stage(request, profile);
    assemble(*sandbox.workspace, profile, compose_command(profile, request, resolution));
    sandbox.execution_id = launch(*sandbox.workspace);
    return sandbox;
}

} // namespace boxrun
