#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "artifact_store.h"

namespace boxrun {

// Harvests the files an execution left in its artifact-output directory
class ArtifactCollector {
public:
    explicit ArtifactCollector(ArtifactStore& store);

    // Copy every regular file of artifacts_dir (non-recursive, name order) into
    // durable storage, optionally also into destination, and register it.
    // Returns the artifacts:// identifiers of the registered files.
    // Throws SandboxError(ARTIFACT_COLLECTION_FAILED) if the directory cannot be listed.
    std::vector<std::string> collect(
        const std::string& execution_id,
        const std::filesystem::path& artifacts_dir,
        const std::string& destination = ""
    );

private:
    ArtifactStore& store_;
};

} // namespace boxrun
