#pragma once

#include "result.h"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace runbox {

enum class WorkspaceArea {
    Code,       // Mounted read-only
    Data,       // Mounted read-only
    Output      // The only writable mount
};

// <root>/<session_key>/{code,data,output}
struct Workspace {
    std::string session_key;
    std::string root;
    std::string code;
    std::string data;
    std::string output;

    const std::string& path(WorkspaceArea area) const;
};

struct WorkspaceFile {
    std::string path;           // Relative to the area
    uint64_t size_bytes = 0;
    std::string sha256;
    std::filesystem::file_time_type modified{};
};

// Maps session keys to persistent directory triples. Never deletes anything.
class WorkspaceStore {
public:
    // Creates the root if needed; throws ConfigError if it cannot
    explicit WorkspaceStore(const std::string& root);

    // Lowercase, runs of non-alphanumerics become one '_', empty becomes
    // "default". Deterministic; the result never contains '/' or '.'.
    static std::string normalize_key(const std::string& session);

    // Idempotent and safe to call concurrently for the same key
    Result<Workspace> open(const std::string& session) const;

    // Paths are relative to the area and may not contain "." or ".." components.
    // Symlinks are never followed.
    Status write_file(const Workspace& workspace, WorkspaceArea area,
                      const std::string& relative_path, const std::string& content) const;
    Result<std::string> read_file(const Workspace& workspace, WorkspaceArea area,
                                  const std::string& relative_path) const;
    bool file_exists(const Workspace& workspace, WorkspaceArea area,
                     const std::string& relative_path) const;
    std::vector<WorkspaceFile> list_files(const Workspace& workspace, WorkspaceArea area) const;

    const std::string& root() const { return root_; }

    // Validation error for empty, absolute or escaping relative paths
    static Status check_relative_path(const std::string& relative_path);

private:
    std::string root_;
};

} // namespace runbox
