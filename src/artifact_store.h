#pragma once

#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <utility>
#include <filesystem>

namespace boxrun {

// One harvested file, keyed by (execution_id, file_name)
struct ArtifactRecord {
    std::string execution_id;
    std::string file_name;
    std::string path;            // Durable copy
    std::string category;        // image, pdf, text, audio, video, binary
    size_t size_bytes = 0;
    std::string sha256;          // Digest of the durable copy at registration

    // artifacts://<execution id>/<file name>
    std::string uri() const;
};

// Fetched artifact bytes
struct ArtifactContent {
    std::string uri;
    std::string file_name;
    std::string category;
    std::string mime_type;
    std::string data;            // Raw bytes
};

// Durable artifact storage plus the index that makes it addressable.
// Layout: <root>/<execution id>/<file name>
class ArtifactStore {
public:
    explicit ArtifactStore(const std::string& root);

    const std::filesystem::path& root() const { return root_; }

    // Directory holding durable copies for one execution (not created)
    std::filesystem::path execution_dir(const std::string& execution_id) const;

    // Insert or replace the record for (execution_id, file_name)
    void register_artifact(const ArtifactRecord& record);

    // Resolve artifacts://<id>/<name>; throws SandboxError(ARTIFACT_NOT_FOUND)
    ArtifactContent fetch(const std::string& uri) const;

    // Records whose key starts with the prefix, in key order; a bare id (or artifacts://<id>) lists that execution only
    std::vector<ArtifactRecord> list(const std::string& prefix) const;

    // Drop every record of an execution and delete its durable copies; returns records removed
    size_t purge(const std::string& execution_id);

    // Re-register every file found under the root; returns records indexed
    size_t rebuild_index();

    size_t size() const;

    // Split artifacts://<id>/<name>; false for malformed identifiers
    static bool parse_uri(const std::string& uri, std::string& execution_id, std::string& file_name);

    // Usable as a single path component (no '/', not "." or "..")
    static bool is_valid_name(const std::string& name);

    // artifacts://<id>/<name>
    static std::string make_uri(const std::string& execution_id, const std::string& file_name);

private:
    std::filesystem::path root_;
    mutable std::mutex mutex_;
    std::map<std::pair<std::string, std::string>, ArtifactRecord> records_;
};

} // namespace boxrun
