#include <gtest/gtest.h>
#include "config.h"
#include "errors.h"
#include "file_utils.h"
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <random>

namespace fs = std::filesystem;

namespace boxrun {
namespace {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : kVariables) {
            unsetenv(name);
        }
        std::random_device rd;
        config_file = fs::temp_directory_path() / ("boxrun_config_" + std::to_string(rd()) + ".json");
    }

    void TearDown() override {
        for (const char* name : kVariables) {
            unsetenv(name);
        }
        std::error_code ec;
        fs::remove(config_file, ec);
    }

    void expect_invalid(const std::function<void()>& action) {
        try {
            action();
            FAIL() << "Expected ConfigInvalid";
        } catch (const SandboxError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::CONFIG_INVALID);
        }
    }

    static constexpr const char* kVariables[] = {
        "ARTIFACTS_DIR", "BOXRUN_ARTIFACT_STORE", "BOXRUN_STAGING_DIR",
        "BOXRUN_DOCKER", "BOXRUN_POLL_INTERVAL_MS",
    };

    fs::path config_file;
};

TEST_F(ConfigTest, Defaults) {
    Config config = Config::load();

    EXPECT_EQ(config.docker_binary, "docker");
    EXPECT_EQ(config.artifact_store_root, (fs::temp_directory_path() / "boxrun-artifacts").string());
    EXPECT_EQ(config.staging_dir, fs::temp_directory_path().string());
    EXPECT_TRUE(config.user_artifacts_root.empty());
    EXPECT_EQ(config.poll_interval.count(), 2000);
    EXPECT_EQ(config.progress_total, 100);
    EXPECT_TRUE(config.restore_index);
}

TEST_F(ConfigTest, JsonFile) {
    ASSERT_TRUE(FileUtils::write_file(config_file.string(), R"({
        "dockerBinary": "podman",
        "artifactStore": "/var/lib/boxrun",
        "pollIntervalMs": 250,
        "progressTotal": 20,
        "restoreIndex": false
    })"));

    Config config = Config::load(config_file.string());

    EXPECT_EQ(config.docker_binary, "podman");
    EXPECT_EQ(config.artifact_store_root, "/var/lib/boxrun");
    EXPECT_EQ(config.poll_interval.count(), 250);
    EXPECT_EQ(config.progress_total, 20);
    EXPECT_FALSE(config.restore_index);
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    ASSERT_TRUE(FileUtils::write_file(config_file.string(), R"({"artifactStore": "/from/file"})"));
    setenv("BOXRUN_ARTIFACT_STORE", "/from/env", 1);
    setenv("ARTIFACTS_DIR", "/shared/artifacts", 1);
    setenv("BOXRUN_POLL_INTERVAL_MS", "50", 1);

    Config config = Config::load(config_file.string());

    EXPECT_EQ(config.artifact_store_root, "/from/env");
    EXPECT_EQ(config.user_artifacts_root, "/shared/artifacts");
    EXPECT_EQ(config.poll_interval.count(), 50);
}

TEST_F(ConfigTest, InvalidValues) {
    expect_invalid([this]() { Config::load((config_file.parent_path() / "missing.json").string()); });

    ASSERT_TRUE(FileUtils::write_file(config_file.string(), "{ not json"));
    expect_invalid([this]() { Config::load(config_file.string()); });

    ASSERT_TRUE(FileUtils::write_file(config_file.string(), R"({"pollIntervalMs": "fast"})"));
    expect_invalid([this]() { Config::load(config_file.string()); });

    ASSERT_TRUE(FileUtils::write_file(config_file.string(), R"({"progressTotal": 0})"));
    expect_invalid([this]() { Config::load(config_file.string()); });

    fs::remove(config_file);
    setenv("BOXRUN_POLL_INTERVAL_MS", "soon", 1);
    expect_invalid([]() { Config::load(); });
}

} // namespace
} // namespace boxrun
