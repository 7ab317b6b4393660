#include "config.h"
#include "errors.h"
#include "file_utils.h"
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <json/json.h>

namespace fs = std::filesystem;

namespace boxrun {

namespace {

std::string get_env(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string read_string(const Json::Value& root, const char* key, const std::string& fallback) {
    if (!root.isMember(key)) {
        return fallback;
    }
    if (!root[key].isString()) {
        throw SandboxError(ErrorKind::CONFIG_INVALID, std::string("config key '") + key + "' must be a string");
    }
    return root[key].asString();
}

} // namespace

Config Config::load(const std::string& config_file) {
    Config config;
    config.artifact_store_root = (fs::temp_directory_path() / DEFAULT_STORE_DIRNAME).string();
    config.staging_dir = fs::temp_directory_path().string();

    if (!config_file.empty()) {
        std::string content;
        if (!FileUtils::read_file(config_file, content)) {
            throw SandboxError(ErrorKind::CONFIG_INVALID, "cannot read config file " + config_file);
        }
        config.apply_json(content);
    }

    config.apply_environment();
    config.validate();
    return config;
}

void Config::apply_json(const std::string& json_text) {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    if (!reader->parse(json_text.data(), json_text.data() + json_text.size(), &root, &errors)) {
        throw SandboxError(ErrorKind::CONFIG_INVALID, "invalid config JSON: " + errors);
    }
    if (!root.isObject()) {
        throw SandboxError(ErrorKind::CONFIG_INVALID, "config JSON must be an object");
    }

    docker_binary = read_string(root, "dockerBinary", docker_binary);
    artifact_store_root = read_string(root, "artifactStore", artifact_store_root);
    staging_dir = read_string(root, "stagingDir", staging_dir);
    user_artifacts_root = read_string(root, "userArtifactsDir", user_artifacts_root);

    if (root.isMember("pollIntervalMs")) {
        if (!root["pollIntervalMs"].isInt()) {
            throw SandboxError(ErrorKind::CONFIG_INVALID, "config key 'pollIntervalMs' must be an integer");
        }
        poll_interval = std::chrono::milliseconds(root["pollIntervalMs"].asInt());
    }
    if (root.isMember("progressTotal")) {
        if (!root["progressTotal"].isInt()) {
            throw SandboxError(ErrorKind::CONFIG_INVALID, "config key 'progressTotal' must be an integer");
        }
        progress_total = root["progressTotal"].asInt();
    }
    if (root.isMember("restoreIndex")) {
        if (!root["restoreIndex"].isBool()) {
            throw SandboxError(ErrorKind::CONFIG_INVALID, "config key 'restoreIndex' must be a boolean");
        }
        restore_index = root["restoreIndex"].asBool();
    }
}

void Config::apply_environment() {
    std::string value = get_env(ARTIFACTS_ENV_VAR);
    if (!value.empty()) {
        user_artifacts_root = value;
    }
    value = get_env(STORE_ENV_VAR);
    if (!value.empty()) {
        artifact_store_root = value;
    }
    value = get_env(STAGING_ENV_VAR);
    if (!value.empty()) {
        staging_dir = value;
    }
    value = get_env(DOCKER_ENV_VAR);
    if (!value.empty()) {
        docker_binary = value;
    }
    value = get_env(POLL_INTERVAL_ENV_VAR);
    if (!value.empty()) {
        try {
            poll_interval = std::chrono::milliseconds(std::stoi(value));
        } catch (const std::exception&) {
            throw SandboxError(ErrorKind::CONFIG_INVALID,
                               std::string(POLL_INTERVAL_ENV_VAR) + " is not an integer: " + value);
        }
    }
}

void Config::validate() const {
    if (docker_binary.empty()) {
        throw SandboxError(ErrorKind::CONFIG_INVALID, "docker binary must not be empty");
    }
    if (artifact_store_root.empty()) {
        throw SandboxError(ErrorKind::CONFIG_INVALID, "artifact store root must not be empty");
    }
    if (staging_dir.empty()) {
        throw SandboxError(ErrorKind::CONFIG_INVALID, "staging directory must not be empty");
    }
    if (poll_interval.count() <= 0) {
        throw SandboxError(ErrorKind::CONFIG_INVALID, "poll interval must be positive");
    }
    if (progress_total < 1) {
        throw SandboxError(ErrorKind::CONFIG_INVALID, "progress total must be at least 1");
    }
}

} // namespace boxrun
