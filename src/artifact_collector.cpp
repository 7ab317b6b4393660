#include "artifact_collector.h"
#include "errors.h"
#include "file_utils.h"
#include <algorithm>
#include <iostream>

namespace fs = std::filesystem;

namespace boxrun {

ArtifactCollector::ArtifactCollector(ArtifactStore& store) : store_(store) {}

std::vector<std::string> ArtifactCollector::collect(
    const std::string& execution_id,
    const fs::path& artifacts_dir,
    const std::string& destination
) {
    if (!ArtifactStore::is_valid_name(execution_id)) {
        throw SandboxError(ErrorKind::ARTIFACT_COLLECTION_FAILED, "invalid execution id: " + execution_id);
    }

    // Phase 1: list the output directory
    std::error_code ec;
    fs::directory_iterator listing(artifacts_dir, ec);
    if (ec) {
        throw SandboxError(ErrorKind::ARTIFACT_COLLECTION_FAILED,
                           "failed to read artifacts directory " + artifacts_dir.string() + ": " + ec.message());
    }

    std::vector<fs::path> files;
    for (; listing != fs::directory_iterator(); listing.increment(ec)) {
        std::error_code type_ec;
        fs::file_status status = listing->symlink_status(type_ec);
        if (type_ec) {
            std::cerr << "[Collector] Warning: skipping " << listing->path().filename()
                      << ": " << type_ec.message() << std::endl;
        } else if (fs::is_symlink(status)) {
            std::cerr << "[Collector] Warning: skipping symlink " << listing->path().filename() << std::endl;
        } else if (fs::is_regular_file(status)) {
            files.push_back(listing->path());
        }
    }
    if (ec) {
        throw SandboxError(ErrorKind::ARTIFACT_COLLECTION_FAILED,
                           "failed to read artifacts directory " + artifacts_dir.string() + ": " + ec.message());
    }

    std::vector<std::string> uris;
    if (files.empty()) {
        std::cerr << "[Collector] No artifacts found for " << execution_id << std::endl;
        return uris;
    }
    std::sort(files.begin(), files.end());

    // Phase 2: durable per-execution directory
    fs::path durable_dir = store_.execution_dir(execution_id);
    fs::create_directories(durable_dir, ec);
    if (ec) {
        throw SandboxError(ErrorKind::ARTIFACT_COLLECTION_FAILED,
                           "failed to create artifact directory " + durable_dir.string() + ": " + ec.message());
    }

    bool destination_ready = false;
    if (!destination.empty()) {
        fs::create_directories(destination, ec);
        if (ec) {
            std::cerr << "[Collector] Warning: failed to create target directory " << destination
                      << ": " << ec.message() << std::endl;
        } else {
            destination_ready = true;
        }
    }

    // Phase 3: copy and register each file
    for (const auto& source : files) {
        std::string file_name = source.filename().string();

        // Opened without following links, in case one was swapped in after listing
        std::string data;
        if (!FileUtils::read_regular_file(source.string(), data)) {
            std::cerr << "[Collector] Warning: failed to read artifact " << file_name << std::endl;
            continue;
        }

        fs::path durable_path = durable_dir / file_name;
        if (!FileUtils::write_file(durable_path.string(), data)) {
            std::cerr << "[Collector] Warning: failed to write artifact to persistent storage: "
                      << durable_path << std::endl;
            continue;
        }

        if (destination_ready) {
            fs::path target = fs::path(destination) / file_name;
            if (FileUtils::write_file(target.string(), data)) {
                std::cerr << "[Collector] Artifact copied to " << target << std::endl;
            } else {
                std::cerr << "[Collector] Warning: failed to write artifact to " << target << std::endl;
            }
        }

        ArtifactRecord record;
        record.execution_id = execution_id;
        record.file_name = file_name;
        record.path = durable_path.string();
        record.category = FileUtils::category_to_string(FileUtils::detect_category(file_name));
        record.size_bytes = data.size();
        record.sha256 = FileUtils::sha256_string(data);
        store_.register_artifact(record);

        uris.push_back(record.uri());
    }

    std::cerr << "[Collector] Collected " << uris.size() << " of " << files.size()
              << " artifacts for " << execution_id << std::endl;
    return uris;
}

} // namespace boxrun
