#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>

namespace runbox {

// File metadata with hash (for output manifests)
struct FileMetadata {
    std::string path;
    size_t size_bytes = 0;
    std::string sha256_hash;
    std::filesystem::file_time_type modified{};
};

class FileUtils {
public:
    // Format file size as human-readable string
    static std::string format_file_size(size_t bytes);

    // Hash utilities
    static std::string sha256_file(const std::string& filepath);
    static std::string sha256_string(const std::string& data);
    static std::string bytes_to_hex(const unsigned char* data, size_t len);

    // Cryptographically random hex string of 2 * num_bytes characters.
    // Throws std::runtime_error if the RNG fails.
    static std::string random_hex(size_t num_bytes);

    // Get file metadata with hash
    static FileMetadata get_file_metadata(const std::string& filepath);

    // Get metadata for all regular files in directory (recursive).
    // Symlinks are not followed. Keys are paths relative to dirpath.
    static std::map<std::string, FileMetadata> hash_directory(const std::string& dirpath);
};

} // namespace runbox
