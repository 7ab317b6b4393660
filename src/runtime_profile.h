#pragma once

#include <string>
#include <vector>

namespace boxrun {

// Lexical import convention used when inferring packages from source text
enum class ImportSyntax {
    NONE,
    PYTHON,     // import x / from x import y
    NODE,       // require('x') / import ... from 'x'
    GO          // import "host/path" / import ( ... )
};

// Placeholder in install step templates, expanded to one argument per package
constexpr const char* PACKAGES_PLACEHOLDER = "{packages}";

// A dependency manifest recognized in a project root and how to install it
struct ManifestRule {
    std::string filename;                              // e.g., "requirements.txt"
    std::vector<std::vector<std::string>> install_steps;
};

// Static per-language runtime configuration
struct RuntimeProfile {
    std::string language;                              // e.g., "python"
    std::string image;                                 // Container image reference
    std::vector<std::string> run_command;              // Default run step (argv)
    std::string extension;                             // Source file extension, without dot
    std::string comment_prefix;                        // Line comment marker, e.g., "#"
    ImportSyntax import_syntax = ImportSyntax::NONE;
    std::vector<ManifestRule> manifests;               // Checked in order
    std::string canonical_manifest;                    // Plain list manifest materialized from comments
    std::vector<std::vector<std::string>> package_install_steps;  // Install explicit specifiers
    bool implicit_install = false;                     // Runtime resolves dependencies itself

    // Empty image means "unsupported language"
    bool empty() const { return image.empty(); }

    // Manifest rule for a filename, nullptr if not recognized
    const ManifestRule* find_manifest(const std::string& filename) const;
};

// Look up a profile; unknown languages yield an empty profile
RuntimeProfile lookup_profile(const std::string& language);

// Language identifiers with a profile, in table order
std::vector<std::string> supported_languages();

// Built-in runtime profiles
namespace BuiltInProfiles {
    // Python via uv on a slim Debian image
    RuntimeProfile python();

    // TypeScript/JavaScript on Bun (installs imports on first run)
    RuntimeProfile nodejs();

    // Go modules toolchain
    RuntimeProfile go();
}

} // namespace boxrun
