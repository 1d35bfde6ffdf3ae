#include "file_utils.h"
#include "constants.h"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace runbox {

std::string FileUtils::format_file_size(size_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit_index < 4) {
        size /= 1024.0;
        unit_index++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << size << " " << units[unit_index];
    return oss.str();
}

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

    SHA256_CTX ctx;
    SHA256_Init(&ctx);

    char buffer[FILE_HASH_CHUNK];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        SHA256_Update(&ctx, buffer, static_cast<size_t>(file.gcount()));
    }

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_Final(hash, &ctx);

    return bytes_to_hex(hash, SHA256_DIGEST_LENGTH);
}

std::string FileUtils::random_hex(size_t num_bytes) {
    std::vector<unsigned char> bytes(num_bytes);
    if (num_bytes > 0 && RAND_bytes(bytes.data(), static_cast<int>(num_bytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return bytes_to_hex(bytes.data(), bytes.size());
}

FileMetadata FileUtils::get_file_metadata(const std::string& filepath) {
    FileMetadata metadata;
    metadata.path = filepath;

    namespace fs = std::filesystem;
    std::error_code ec;

    if (!fs::is_regular_file(fs::symlink_status(filepath, ec))) {
        return metadata;
    }

    auto size = fs::file_size(filepath, ec);
    metadata.size_bytes = ec ? 0 : static_cast<size_t>(size);
    auto modified = fs::last_write_time(filepath, ec);
    if (!ec) {
        metadata.modified = modified;
    }
    metadata.sha256_hash = sha256_file(filepath);

    return metadata;
}

std::map<std::string, FileMetadata> FileUtils::hash_directory(const std::string& dirpath) {
    std::map<std::string, FileMetadata> result;
    namespace fs = std::filesystem;
    std::error_code ec;

    if (!fs::is_directory(fs::symlink_status(dirpath, ec))) {
        return result;
    }

    fs::recursive_directory_iterator it(dirpath, fs::directory_options::skip_permission_denied, ec);
    fs::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        // Programs control output/, so never follow links they leave behind
        if (!it->is_regular_file(ec) || it->is_symlink(ec)) {
            continue;
        }

        std::string relpath = fs::relative(it->path(), dirpath, ec).generic_string();
        if (ec || relpath.empty()) {
            ec.clear();
            continue;
        }

        FileMetadata metadata = get_file_metadata(it->path().string());
        metadata.path = relpath;  // Store relative path
        result[relpath] = metadata;
    }

    return result;
}

} // namespace runbox
