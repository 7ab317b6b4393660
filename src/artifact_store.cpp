#include "artifact_store.h"
#include "constants.h"
#include "errors.h"
#include "file_utils.h"
#include <iostream>

namespace fs = std::filesystem;

namespace boxrun {

std::string ArtifactRecord::uri() const {
    return ArtifactStore::make_uri(execution_id, file_name);
}

ArtifactStore::ArtifactStore(const std::string& root) : root_(root) {
    std::error_code ec;
    if (fs::create_directories(root_, ec)) {
        std::cerr << "[ArtifactStore] Created persistent artifacts directory: " << root_ << std::endl;
    } else if (ec) {
        std::cerr << "[ArtifactStore] Warning: failed to create " << root_
                  << ": " << ec.message() << std::endl;
    }
}

bool ArtifactStore::is_valid_name(const std::string& name) {
    return !name.empty() && name != "." && name != ".." &&
           name.find('/') == std::string::npos && name.find('\0') == std::string::npos;
}

std::string ArtifactStore::make_uri(const std::string& execution_id, const std::string& file_name) {
    return std::string(ARTIFACT_URI_SCHEME) + execution_id + "/" + file_name;
}

bool ArtifactStore::parse_uri(const std::string& uri, std::string& execution_id, std::string& file_name) {
    const std::string scheme = ARTIFACT_URI_SCHEME;
    if (uri.compare(0, scheme.size(), scheme) != 0) {
        return false;
    }
    std::string rest = uri.substr(scheme.size());
    size_t slash = rest.find('/');
    if (slash == std::string::npos) {
        return false;
    }
    std::string id = rest.substr(0, slash);
    std::string name = rest.substr(slash + 1);
    if (!is_valid_name(id) || !is_valid_name(name)) {
        return false;
    }
    execution_id = id;
    file_name = name;
    return true;
}

fs::path ArtifactStore::execution_dir(const std::string& execution_id) const {
    return root_ / execution_id;
}

void ArtifactStore::register_artifact(const ArtifactRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_[{record.execution_id, record.file_name}] = record;
}

ArtifactContent ArtifactStore::fetch(const std::string& uri) const {
    std::string execution_id;
    std::string file_name;
    if (!parse_uri(uri, execution_id, file_name)) {
        throw SandboxError(ErrorKind::ARTIFACT_NOT_FOUND, "malformed artifact identifier: " + uri);
    }

    ArtifactRecord record;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find({execution_id, file_name});
        if (it == records_.end()) {
            throw SandboxError(ErrorKind::ARTIFACT_NOT_FOUND, "artifact not found: " + execution_id + "/" + file_name);
        }
        record = it->second;
    }

    ArtifactContent content;
    if (!FileUtils::read_file(record.path, content.data)) {
        throw SandboxError(ErrorKind::ARTIFACT_NOT_FOUND, "failed to read artifact: " + record.path);
    }
    content.uri = uri;
    content.file_name = record.file_name;
    content.category = record.category;
    content.mime_type = FileUtils::get_mime_type(record.file_name);
    return content;
}

std::vector<ArtifactRecord> ArtifactStore::list(const std::string& prefix) const {
    std::string key_prefix = prefix;
    const std::string scheme = ARTIFACT_URI_SCHEME;
    if (key_prefix.compare(0, scheme.size(), scheme) == 0) {
        key_prefix = key_prefix.substr(scheme.size());
    }
    // A bare execution id names that execution only
    if (!key_prefix.empty() && key_prefix.find('/') == std::string::npos) {
        key_prefix += "/";
    }

    std::vector<ArtifactRecord> matches;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, record] : records_) {
        std::string composite = key.first + "/" + key.second;
        if (composite.compare(0, key_prefix.size(), key_prefix) == 0) {
            matches.push_back(record);
        }
    }
    return matches;
}

size_t ArtifactStore::purge(const std::string& execution_id) {
    size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.lower_bound({execution_id, ""});
        while (it != records_.end() && it->first.first == execution_id) {
            it = records_.erase(it);
            ++removed;
        }
    }

    if (is_valid_name(execution_id)) {
        std::error_code ec;
        fs::remove_all(execution_dir(execution_id), ec);
        if (ec) {
            std::cerr << "[ArtifactStore] Warning: failed to delete artifacts of "
                      << execution_id << ": " << ec.message() << std::endl;
        }
    }
    return removed;
}

size_t ArtifactStore::rebuild_index() {
    std::error_code ec;
    fs::directory_iterator executions(root_, ec);
    if (ec) {
        std::cerr << "[ArtifactStore] Warning: cannot read " << root_ << ": " << ec.message() << std::endl;
        return 0;
    }

    size_t indexed = 0;
    for (; executions != fs::directory_iterator(); executions.increment(ec)) {
        const fs::directory_entry& execution = *executions;
        std::error_code entry_ec;
        if (!execution.is_directory(entry_ec)) {
            continue;
        }
        fs::directory_iterator files(execution.path(), entry_ec);
        if (entry_ec) {
            std::cerr << "[ArtifactStore] Warning: skipping " << execution.path()
                      << ": " << entry_ec.message() << std::endl;
            continue;
        }
        for (; files != fs::directory_iterator(); files.increment(entry_ec)) {
            const fs::directory_entry& file = *files;
            std::error_code file_ec;
            if (!file.is_regular_file(file_ec)) {
                continue;
            }
            ArtifactRecord record;
            record.execution_id = execution.path().filename().string();
            record.file_name = file.path().filename().string();
            record.path = file.path().string();
            record.category = FileUtils::category_to_string(FileUtils::detect_category(record.file_name));
            auto size = file.file_size(file_ec);
            record.size_bytes = file_ec ? 0 : static_cast<size_t>(size);
            record.sha256 = FileUtils::sha256_file(record.path);
            register_artifact(record);
            ++indexed;
        }
        if (entry_ec) {
            std::cerr << "[ArtifactStore] Warning: stopped reading " << execution.path()
                      << ": " << entry_ec.message() << std::endl;
        }
    }
    if (ec) {
        std::cerr << "[ArtifactStore] Warning: stopped reading " << root_ << ": " << ec.message() << std::endl;
    }

    std::cerr << "[ArtifactStore] Indexed " << indexed << " artifacts from " << root_ << std::endl;
    return indexed;
}

size_t ArtifactStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

} // namespace boxrun
