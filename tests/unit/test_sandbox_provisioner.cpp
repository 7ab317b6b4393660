#include <gtest/gtest.h>
#include "sandbox_provisioner.h"
#include "constants.h"
#include "errors.h"
#include "fake_backend.h"
#include "file_utils.h"
#include <filesystem>
#include <random>

namespace fs = std::filesystem;

namespace boxrun {
namespace {

class SandboxProvisionerTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        base_dir = fs::temp_directory_path() / ("boxrun_provisioner_" + std::to_string(rd()));
        fs::create_directories(base_dir / "staging");
        config.staging_dir = (base_dir / "staging").string();
        config.artifact_store_root = (base_dir / "store").string();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(base_dir, ec);
    }

    size_t staged_count() const {
        size_t n = 0;
        for (const auto& entry : fs::directory_iterator(base_dir / "staging")) {
            (void)entry;
            ++n;
        }
        return n;
    }

    static ExecutionRequest inline_request(const std::string& language, const std::string& code) {
        ExecutionRequest request;
        request.language = language;
        request.code = code;
        return request;
    }

    fs::path base_dir;
    Config config;
    FakeBackend backend;
};

// ============================================================================
// Shell Quoting
// ============================================================================

TEST(ShellQuoteTest, SafeArgumentsUnchanged) {
    EXPECT_EQ(shell_quote("numpy"), "numpy");
    EXPECT_EQ(shell_quote("requirements.txt"), "requirements.txt");
    EXPECT_EQ(shell_quote("--system"), "--system");
    EXPECT_EQ(shell_quote("github.com/google/uuid@v1.6.0"), "github.com/google/uuid@v1.6.0");
}

TEST(ShellQuoteTest, MetacharactersQuoted) {
    EXPECT_EQ(shell_quote("numpy>=1.26"), "'numpy>=1.26'");
    EXPECT_EQ(shell_quote("a b"), "'a b'");
    EXPECT_EQ(shell_quote("x; rm -rf /"), "'x; rm -rf /'");
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
    EXPECT_EQ(shell_quote(""), "''");
}

// ============================================================================
// Command Composition
// ============================================================================

TEST(ComposeCommandTest, NoDependenciesMeansNoInstallStep) {
    // Given: Every supported language with nothing to install
    // Then: The command is the run step alone, still shell-wrapped
    for (const auto& language : supported_languages()) {
        RuntimeProfile profile = lookup_profile(language);
        ExecutionRequest request;
        request.language = language;
        request.code = "x";

        CommandPlan plan = compose_command(profile, request, DependencyResolution{});

        EXPECT_FALSE(plan.has_install_step()) << language;
        std::vector<std::string> argv = plan.to_argv();
        ASSERT_EQ(argv.size(), 3u);
        EXPECT_EQ(argv[0], "/bin/sh");
        EXPECT_EQ(argv[1], "-c");
        EXPECT_EQ(argv[2].find("&&"), std::string::npos) << language;
    }
}

TEST(ComposeCommandTest, PythonPackagesInstalledBeforeRun) {
    DependencyResolution resolution;
    resolution.packages = DependencySet({"numpy"});

    CommandPlan plan = compose_command(lookup_profile("python"), ExecutionRequest{}, resolution);

    ASSERT_EQ(plan.install_steps.size(), 1u);
    EXPECT_EQ(plan.render(), "uv pip install --system numpy && python3 main.py");
}

TEST(ComposeCommandTest, EachPackageQuotedIndividually) {
    DependencyResolution resolution;
    resolution.packages = DependencySet({"numpy>=1.26", "rich"});

    CommandPlan plan = compose_command(lookup_profile("python"), ExecutionRequest{}, resolution);

    EXPECT_EQ(plan.render(), "uv pip install --system 'numpy>=1.26' rich && python3 main.py");
}

TEST(ComposeCommandTest, ManifestStepWinsOverPackages) {
    DependencyResolution resolution;
    resolution.packages = DependencySet({"requests"});
    resolution.manifest = "requirements.txt";

    CommandPlan plan = compose_command(lookup_profile("python"), ExecutionRequest{}, resolution);

    EXPECT_EQ(plan.render(), "uv pip install --system -r requirements.txt && python3 main.py");
}

TEST(ComposeCommandTest, GoPackagesNeedModule) {
    DependencyResolution resolution;
    resolution.packages = DependencySet({"github.com/google/uuid"});

    CommandPlan plan = compose_command(lookup_profile("go"), ExecutionRequest{}, resolution);

    EXPECT_EQ(plan.render(),
              "go mod init sandbox && go get github.com/google/uuid && go run main.go");
}

TEST(ComposeCommandTest, BunNeverGetsInstallStep) {
    DependencyResolution resolution;
    resolution.packages = DependencySet({"lodash"});
    resolution.manifest = "package.json";

    CommandPlan plan = compose_command(lookup_profile("nodejs"), ExecutionRequest{}, resolution);

    EXPECT_FALSE(plan.has_install_step());
    EXPECT_EQ(plan.render(), "bun main.ts");
}

TEST(ComposeCommandTest, EntrypointRenderedVerbatim) {
    ExecutionRequest request;
    request.entrypoint = "python3 app/run.py --fast || echo failed";

    DependencyResolution resolution;
    resolution.manifest = "requirements.txt";

    CommandPlan plan = compose_command(lookup_profile("python"), request, resolution);
    EXPECT_EQ(plan.render(),
              "uv pip install --system -r requirements.txt && ( python3 app/run.py --fast || echo failed )");

    CommandPlan bare = compose_command(lookup_profile("python"), request, DependencyResolution{});
    EXPECT_EQ(bare.render(), "python3 app/run.py --fast || echo failed");
}

// ============================================================================
// UTF-8 Sanitation
// ============================================================================

TEST(StripInvalidUtf8Test, KeepsValidText) {
    std::string text = "print('h\xC3\xA9llo \xE2\x9C\x93 \xF0\x9F\x98\x80')";
    EXPECT_EQ(strip_invalid_utf8(text), text);
}

TEST(StripInvalidUtf8Test, DropsInvalidBytes) {
    EXPECT_EQ(strip_invalid_utf8("a\xFF" "b"), "ab");
    EXPECT_EQ(strip_invalid_utf8("a\xC3"), "a") << "Truncated sequence";
    EXPECT_EQ(strip_invalid_utf8("\xC0\xAF" "x"), "x") << "Overlong encoding";
    EXPECT_EQ(strip_invalid_utf8("\xED\xA0\x80" "y"), "y") << "Surrogate";
}

// ============================================================================
// Provisioning
// ============================================================================

TEST_F(SandboxProvisionerTest, InlineCodeStagedAndMounted) {
    SandboxProvisioner provisioner(backend, config);
    ExecutionRequest request = inline_request("python", "print('hi')\n");

    ProvisionedSandbox sandbox = provisioner.provision(request, lookup_profile("python"), DependencyResolution{});

    EXPECT_EQ(sandbox.execution_id, "fake1");
    ASSERT_TRUE(sandbox.workspace);
    std::string staged;
    ASSERT_TRUE(FileUtils::read_file((sandbox.workspace->root() / "main.py").string(), staged));
    EXPECT_EQ(staged, "print('hi')\n");
    EXPECT_TRUE(fs::is_directory(sandbox.workspace->artifacts_dir()));

    const ContainerSpec& spec = backend.specs["fake1"];
    EXPECT_EQ(spec.image, lookup_profile("python").image);
    EXPECT_EQ(spec.working_dir, "/app");
    EXPECT_EQ(FakeBackend::host_path(spec, "/app"), sandbox.workspace->root().string());
    EXPECT_EQ(FakeBackend::host_path(spec, "/artifacts"), sandbox.workspace->artifacts_dir().string());
    EXPECT_EQ(spec.env.at("ARTIFACTS_DIR"), "/artifacts");
    EXPECT_EQ(spec.env.count("USER_ARTIFACTS_DIR"), 0u);
    EXPECT_EQ(backend.count("start fake1"), 1u);
}

TEST_F(SandboxProvisionerTest, PullsMissingImageOnce) {
    SandboxProvisioner provisioner(backend, config);
    RuntimeProfile profile = lookup_profile("go");

    provisioner.ensure_image(profile.image);
    provisioner.ensure_image(profile.image);

    EXPECT_EQ(backend.count("pull_image"), 1u);
}

TEST_F(SandboxProvisionerTest, PullFailureIsProvisionFailure) {
    backend.fail_pull = true;
    SandboxProvisioner provisioner(backend, config);

    try {
        provisioner.provision(inline_request("python", "print(1)"), lookup_profile("python"), {});
        FAIL() << "Expected SandboxError";
    } catch (const SandboxError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::PROVISION_FAILED);
    }
    EXPECT_EQ(backend.count("create"), 0u);
    EXPECT_EQ(staged_count(), 0u);
}

TEST_F(SandboxProvisionerTest, StartFailureRemovesContainerAndWorkspace) {
    backend.fail_start = true;
    SandboxProvisioner provisioner(backend, config);

    try {
        provisioner.provision(inline_request("python", "print(1)"), lookup_profile("python"), {});
        FAIL() << "Expected SandboxError";
    } catch (const SandboxError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::PROVISION_FAILED);
    }
    ASSERT_EQ(backend.removed.size(), 1u);
    EXPECT_EQ(backend.removed[0], "fake1");
    EXPECT_EQ(staged_count(), 0u) << "Workspace must be released on failure";
}

TEST_F(SandboxProvisionerTest, WorkspaceRemovedOnDestruction) {
    fs::path root;
    {
        auto workspace = SandboxWorkspace::create(config.staging_dir);
        root = workspace->root();
        EXPECT_TRUE(fs::is_directory(root));
        EXPECT_EQ(root.filename().string().rfind("boxrun-sandbox-", 0), 0u);
    }
    EXPECT_FALSE(fs::exists(root));
}

TEST_F(SandboxProvisionerTest, ProjectDirectoryBoundDirectly) {
    fs::path project = base_dir / "project";
    fs::create_directories(project);
    ASSERT_TRUE(FileUtils::write_file((project / "main.py").string(), "print(1)\n"));

    ExecutionRequest request;
    request.language = "python";
    request.project_dir = project.string();

    SandboxProvisioner provisioner(backend, config);
    ProvisionedSandbox sandbox = provisioner.provision(request, lookup_profile("python"), {});

    const ContainerSpec& spec = backend.specs[sandbox.execution_id];
    EXPECT_EQ(FakeBackend::host_path(spec, "/app"), project.string());
    EXPECT_NE(FakeBackend::host_path(spec, "/artifacts").find(config.staging_dir), std::string::npos)
        << "Artifact output lives in the staging root, not the project";
    EXPECT_FALSE(fs::exists(project / "artifacts"));
}

TEST_F(SandboxProvisionerTest, OutputDirectoryCreatedButNotMounted) {
    ExecutionRequest request = inline_request("python", "print(1)");
    request.output_dir = (base_dir / "out" / "nested").string();

    SandboxProvisioner provisioner(backend, config);
    ProvisionedSandbox sandbox = provisioner.provision(request, lookup_profile("python"), {});

    EXPECT_TRUE(fs::is_directory(request.output_dir));
    for (const auto& mount : backend.specs[sandbox.execution_id].mounts) {
        EXPECT_NE(mount.host_path, request.output_dir);
    }
}

TEST_F(SandboxProvisionerTest, UncreatableOutputDirectoryIsConfigInvalid) {
    fs::path blocker = base_dir / "blocker";
    ASSERT_TRUE(FileUtils::write_file(blocker.string(), "file"));

    ExecutionRequest request = inline_request("python", "print(1)");
    request.output_dir = (blocker / "sub").string();

    SandboxProvisioner provisioner(backend, config);
    try {
        provisioner.provision(request, lookup_profile("python"), {});
        FAIL() << "Expected SandboxError";
    } catch (const SandboxError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CONFIG_INVALID);
    }
    EXPECT_EQ(backend.count("create"), 0u);
}

TEST_F(SandboxProvisionerTest, UserArtifactsRootMounted) {
    config.user_artifacts_root = (base_dir / "user-artifacts").string();

    SandboxProvisioner provisioner(backend, config);
    ProvisionedSandbox sandbox = provisioner.provision(
        inline_request("python", "print(1)"), lookup_profile("python"), {});

    const ContainerSpec& spec = backend.specs[sandbox.execution_id];
    EXPECT_TRUE(fs::is_directory(config.user_artifacts_root));
    EXPECT_EQ(FakeBackend::host_path(spec, "/user-artifacts"), config.user_artifacts_root);
    EXPECT_EQ(spec.env.at("USER_ARTIFACTS_DIR"), "/user-artifacts");
}

} // namespace
} // namespace boxrun
