#include "runtime_profile.h"

namespace boxrun {

const ManifestRule* RuntimeProfile::find_manifest(const std::string& filename) const {
    for (const auto& rule : manifests) {
        if (rule.filename == filename) {
            return &rule;
        }
    }
    return nullptr;
}

namespace {

const std::vector<RuntimeProfile>& profile_table() {
    static const std::vector<RuntimeProfile> table = {
        BuiltInProfiles::python(),
        BuiltInProfiles::nodejs(),
        BuiltInProfiles::go(),
    };
    return table;
}

} // namespace

RuntimeProfile lookup_profile(const std::string& language) {
    for (const auto& profile : profile_table()) {
        if (profile.language == language) {
            return profile;
        }
    }
    return RuntimeProfile{};
}

std::vector<std::string> supported_languages() {
    std::vector<std::string> names;
    for (const auto& profile : profile_table()) {
        names.push_back(profile.language);
    }
    return names;
}

// Built-in profiles implementation

namespace BuiltInProfiles {

RuntimeProfile python() {
    RuntimeProfile profile;
    profile.language = "python";
    profile.image = "ghcr.io/astral-sh/uv:python3.12-bookworm-slim";
    profile.run_command = {"python3", "main.py"};
    profile.extension = "py";
    profile.comment_prefix = "#";
    profile.import_syntax = ImportSyntax::PYTHON;
    profile.manifests = {
        {"requirements.txt", {{"uv", "pip", "install", "--system", "-r", "requirements.txt"}}},
        {"pyproject.toml", {{"uv", "pip", "install", "--system", "."}}},
        {"setup.py", {{"uv", "pip", "install", "--system", "."}}},
    };
    profile.canonical_manifest = "requirements.txt";
    profile.package_install_steps = {
        {"uv", "pip", "install", "--system", PACKAGES_PLACEHOLDER},
    };
    return profile;
}

RuntimeProfile nodejs() {
    RuntimeProfile profile;
    profile.language = "nodejs";
    profile.image = "oven/bun:latest";
    profile.run_command = {"bun", "main.ts"};
    profile.extension = "ts";
    profile.comment_prefix = "//";
    profile.import_syntax = ImportSyntax::NODE;
    profile.manifests = {
        {"package.json", {{"bun", "install"}}},
    };
    profile.package_install_steps = {
        {"bun", "add", PACKAGES_PLACEHOLDER},
    };
    profile.implicit_install = true;  // Bun auto-installs on run
    return profile;
}

RuntimeProfile go() {
    RuntimeProfile profile;
    profile.language = "go";
    profile.image = "docker.io/library/golang:1.22-alpine";
    profile.run_command = {"go", "run", "main.go"};
    profile.extension = "go";
    profile.comment_prefix = "//";
    profile.import_syntax = ImportSyntax::GO;
    profile.manifests = {
        {"go.mod", {{"go", "mod", "download"}}},
    };
    // A module is needed before "go get" can record anything
    profile.package_install_steps = {
        {"go", "mod", "init", "sandbox"},
        {"go", "get", PACKAGES_PLACEHOLDER},
    };
    return profile;
}

} // namespace BuiltInProfiles

} // namespace boxrun
