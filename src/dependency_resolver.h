#pragma once

#include <string>
#include <vector>
#include <set>
#include <initializer_list>
#include <filesystem>
#include "runtime_profile.h"

namespace boxrun {

// Ordered set of package specifiers; insertion order drives install order
class DependencySet {
public:
    DependencySet() = default;
    DependencySet(std::initializer_list<std::string> specifiers);

    // Append if not already present (exact string match); returns true if added
    bool add(const std::string& specifier);

    bool contains(const std::string& specifier) const { return seen_.count(specifier) > 0; }
    bool empty() const { return items_.empty(); }
    size_t size() const { return items_.size(); }
    const std::vector<std::string>& items() const { return items_; }

    bool operator==(const DependencySet& other) const { return items_ == other.items_; }
    bool operator!=(const DependencySet& other) const { return !(*this == other); }

private:
    std::vector<std::string> items_;
    std::set<std::string> seen_;
};

// Outcome of project-mode resolution
struct DependencyResolution {
    DependencySet packages;
    std::string manifest;        // Manifest file the install step consumes, empty if none
    bool materialized = false;   // Manifest was written from in-source markers
};

class DependencyResolver {
public:
    explicit DependencyResolver(const RuntimeProfile& profile);

    // Infer external packages from a single source text
    DependencySet resolve_source(const std::string& code) const;

    // Resolve dependencies of a project directory (may write the canonical manifest)
    // Throws SandboxError(SCAN_FAILED) if the root cannot be read
    DependencyResolution resolve_project(const std::filesystem::path& project_dir) const;

    // Specifiers from "<comment> requirements: a, b" lines
    static std::vector<std::string> parse_requirement_markers(
        const std::string& text,
        const std::string& comment_prefix
    );

    // Top-level external imports, standard library and relative imports removed
    static std::vector<std::string> parse_python_imports(const std::string& code);
    static std::vector<std::string> parse_node_imports(const std::string& code);
    static std::vector<std::string> parse_go_imports(const std::string& code);

    // Normalized package name of a specifier ("Flask_Login>=1.0" -> "flask-login")
    static std::string requirement_name(const std::string& specifier);

    // Existing entries first and verbatim; discovered ones appended unless
    // an entry with the same package name is already present
    static std::vector<std::string> merge_requirements(
        const std::vector<std::string>& existing,
        const std::vector<std::string>& discovered
    );

    // Non-empty, non-comment, non-option lines of a requirements file
    static std::vector<std::string> parse_manifest_entries(const std::string& content);

private:
    std::vector<std::string> infer_imports(const std::string& code) const;

    // Marker specifiers across all source files under root (sorted walk)
    std::vector<std::string> scan_markers(const std::filesystem::path& root) const;

    RuntimeProfile profile_;
};

} // namespace boxrun
