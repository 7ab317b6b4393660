#include "file_utils.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace boxrun {

// Extension to ContentCategory mapping
const std::map<std::string, ContentCategory> FileUtils::extension_map_ = {
    // Images
    {".png", ContentCategory::IMAGE},
    {".jpg", ContentCategory::IMAGE},
    {".jpeg", ContentCategory::IMAGE},
    {".gif", ContentCategory::IMAGE},
    {".svg", ContentCategory::IMAGE},
    {".webp", ContentCategory::IMAGE},

    // Documents
    {".pdf", ContentCategory::PDF},

    // Text
    {".txt", ContentCategory::TEXT},
    {".md", ContentCategory::TEXT},
    {".json", ContentCategory::TEXT},
    {".yaml", ContentCategory::TEXT},
    {".yml", ContentCategory::TEXT},
    {".csv", ContentCategory::TEXT},
    {".tsv", ContentCategory::TEXT},

    // Audio
    {".mp3", ContentCategory::AUDIO},
    {".wav", ContentCategory::AUDIO},
    {".ogg", ContentCategory::AUDIO},
    {".flac", ContentCategory::AUDIO},

    // Videos
    {".mp4", ContentCategory::VIDEO},
    {".webm", ContentCategory::VIDEO},
    {".avi", ContentCategory::VIDEO},
    {".mov", ContentCategory::VIDEO},
};

const std::map<ContentCategory, std::string> FileUtils::category_name_map_ = {
    {ContentCategory::IMAGE, "image"},
    {ContentCategory::PDF, "pdf"},
    {ContentCategory::TEXT, "text"},
    {ContentCategory::AUDIO, "audio"},
    {ContentCategory::VIDEO, "video"},
    {ContentCategory::BINARY, "binary"},
};

const std::map<std::string, std::string> FileUtils::mime_type_map_ = {
    // Images
    {".png", "image/png"},
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".gif", "image/gif"},
    {".webp", "image/webp"},
    {".svg", "image/svg+xml"},

    // Videos
    {".mp4", "video/mp4"},
    {".avi", "video/x-msvideo"},
    {".mov", "video/quicktime"},
    {".webm", "video/webm"},

    // Audio
    {".mp3", "audio/mpeg"},
    {".wav", "audio/wav"},
    {".ogg", "audio/ogg"},
    {".flac", "audio/flac"},

    // Text
    {".csv", "text/csv"},
    {".tsv", "text/tab-separated-values"},
    {".json", "application/json"},
    {".yaml", "application/yaml"},
    {".yml", "application/yaml"},
    {".txt", "text/plain"},
    {".md", "text/markdown"},
    {".log", "text/plain"},

    // Documents
    {".pdf", "application/pdf"},
};

std::string FileUtils::lowercase_extension(const std::string& filename) {
    std::string ext = std::filesystem::path(filename).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

ContentCategory FileUtils::detect_category(const std::string& filename) {
    auto it = extension_map_.find(lowercase_extension(filename));
    if (it != extension_map_.end()) {
        return it->second;
    }

    return ContentCategory::BINARY;
}

std::string FileUtils::category_to_string(ContentCategory category) {
    auto it = category_name_map_.find(category);
    if (it != category_name_map_.end()) {
        return it->second;
    }
    return "binary";
}

std::string FileUtils::get_mime_type(const std::string& filename) {
    auto it = mime_type_map_.find(lowercase_extension(filename));
    if (it != mime_type_map_.end()) {
        return it->second;
    }

    return "application/octet-stream";
}

bool FileUtils::read_file(const std::string& filepath, std::string& content) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }

    content.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return !file.bad();
}

bool FileUtils::read_regular_file(const std::string& filepath, std::string& content) {
    int fd = open(filepath.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC);
    if (fd < 0) {
        return false;
    }

    struct stat info;
    if (fstat(fd, &info) != 0 || !S_ISREG(info.st_mode)) {
        close(fd);
        return false;
    }

    content.clear();
    char buffer[8192];
    ssize_t count;
    while ((count = read(fd, buffer, sizeof(buffer))) != 0) {
        if (count < 0) {
            if (errno == EINTR) {
                continue;
            }
            close(fd);
            return false;
        }
        content.append(buffer, static_cast<size_t>(count));
    }
    close(fd);
    return true;
}

bool FileUtils::write_file(const std::string& filepath, const std::string& content) {
    std::ofstream file(filepath, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }

    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.close();
    return !file.fail();
}

// Hash utilities implementation

std::string FileUtils::bytes_to_hex(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string FileUtils::sha256_string(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return bytes_to_hex(hash, SHA256_DIGEST_LENGTH);
}

std::string FileUtils::sha256_file(const std::string& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        return "";  // Return empty string on error
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        return "";
    }
    EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr);

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        EVP_DigestUpdate(ctx, buffer, static_cast<size_t>(file.gcount()));
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    EVP_DigestFinal_ex(ctx, hash, &hash_len);
    EVP_MD_CTX_free(ctx);

    return bytes_to_hex(hash, hash_len);
}

std::string FileUtils::base64_encode(const std::string& data) {
    if (data.empty()) {
        return "";
    }

    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* bio = BIO_new(BIO_s_mem());
    bio = BIO_push(b64, bio);

    BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL);
    BIO_write(bio, data.data(), static_cast<int>(data.size()));
    BIO_flush(bio);

    BUF_MEM* bufferPtr;
    BIO_get_mem_ptr(bio, &bufferPtr);

    std::string result(bufferPtr->data, bufferPtr->length);
    BIO_free_all(bio);

    return result;
}

} // namespace boxrun
