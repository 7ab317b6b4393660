#pragma once

#include <string>
#include <map>

namespace boxrun {

// Coarse content categories reported for harvested artifacts
enum class ContentCategory {
    IMAGE,      // .png, .jpg, .jpeg, .gif, .svg, .webp
    PDF,        // .pdf
    TEXT,       // .txt, .md, .json, .yaml, .yml, .csv, .tsv
    AUDIO,      // .mp3, .wav, .ogg, .flac
    VIDEO,      // .mp4, .webm, .avi, .mov
    BINARY      // Unknown/other types
};

class FileUtils {
public:
    // Detect content category based on extension (case-insensitive)
    static ContentCategory detect_category(const std::string& filename);

    // Get category name ("image", "pdf", "text", "audio", "video", "binary")
    static std::string category_to_string(ContentCategory category);

    // Get MIME type for file
    static std::string get_mime_type(const std::string& filename);

    // Read whole file as raw bytes; false if it cannot be opened or read
    static bool read_file(const std::string& filepath, std::string& content);

    // Like read_file, but refuses symlinks and anything that is not a regular file
    static bool read_regular_file(const std::string& filepath, std::string& content);

    // Write raw bytes, replacing any existing file; false on failure
    static bool write_file(const std::string& filepath, const std::string& content);

    // Hash utilities (for round-trip verification of artifacts)
    static std::string sha256_file(const std::string& filepath);
    static std::string sha256_string(const std::string& data);
    static std::string bytes_to_hex(const unsigned char* data, size_t len);

    // Encode bytes to base64 (no line breaks)
    static std::string base64_encode(const std::string& data);

private:
    static std::string lowercase_extension(const std::string& filename);

    static const std::map<std::string, ContentCategory> extension_map_;
    static const std::map<ContentCategory, std::string> category_name_map_;
    static const std::map<std::string, std::string> mime_type_map_;
};

} // namespace boxrun
