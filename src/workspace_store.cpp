#include "workspace_store.h"
#include "constants.h"
#include "file_utils.h"
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <sstream>

namespace runbox {

namespace {

std::vector<std::string> split_components(const std::string& relative_path) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream iss(relative_path);
    while (std::getline(iss, part, '/')) {
        parts.push_back(part);
    }
    return parts;
}

// mkdir that tolerates an existing directory but never a symlink or file
Status ensure_directory(const std::string& path, bool* created = nullptr) {
    if (mkdir(path.c_str(), 0755) == 0) {
        if (created) {
            *created = true;
        }
        return Status::success();
    }
    if (errno != EEXIST) {
        return make_error(ErrorKind::Infrastructure,
                          "mkdir " + path + ": " + std::strerror(errno));
    }
    struct stat st;
    if (lstat(path.c_str(), &st) != 0) {
        return make_error(ErrorKind::Infrastructure,
                          "lstat " + path + ": " + std::strerror(errno));
    }
    if (!S_ISDIR(st.st_mode)) {
        return make_error(ErrorKind::Infrastructure, path + " exists and is not a directory");
    }
    return Status::success();
}

// Walk every intermediate component, refusing symlinks. Creates missing
// directories when asked to.
Result<std::string> resolve_inside(const std::string& base, const std::string& relative_path,
                                   bool create_parents) {
    Status valid = WorkspaceStore::check_relative_path(relative_path);
    if (!valid) {
        return valid.error();
    }

    auto parts = split_components(relative_path);
    std::string current = base;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        current += "/" + parts[i];
        if (create_parents) {
            Status status = ensure_directory(current);
            if (!status) {
                return status.error();
            }
            continue;
        }
        struct stat st;
        if (lstat(current.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
            return make_error(ErrorKind::Validation, "No such directory: " + relative_path);
        }
    }
    return current + "/" + parts.back();
}

} // namespace

const std::string& Workspace::path(WorkspaceArea area) const {
    switch (area) {
        case WorkspaceArea::Code: return code;
        case WorkspaceArea::Data: return data;
        case WorkspaceArea::Output: return output;
    }
    return output;
}

WorkspaceStore::WorkspaceStore(const std::string& root) {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) {
        throw ConfigError("cannot create workspace root " + root + ": " + ec.message());
    }
    fs::path canonical = fs::canonical(root, ec);
    if (ec) {
        throw ConfigError("cannot resolve workspace root " + root + ": " + ec.message());
    }
    root_ = canonical.string();
}

std::string WorkspaceStore::normalize_key(const std::string& session) {
    std::string key;
    bool last_was_separator = false;
    for (unsigned char c : session) {
        if (std::isalnum(c) && c < 0x80) {
            key += static_cast<char>(std::tolower(c));
            last_was_separator = false;
        } else if (!last_was_separator) {
            key += '_';
            last_was_separator = true;
        }
    }

    if (key.empty()) {
        return "default";
    }

    // Keep long keys distinct after truncation
    if (key.size() > MAX_SESSION_KEY_LENGTH) {
        std::string digest = FileUtils::sha256_string(key).substr(0, 8);
        key = key.substr(0, MAX_SESSION_KEY_LENGTH - digest.size() - 1) + "_" + digest;
    }
    return key;
}

Result<Workspace> WorkspaceStore::open(const std::string& session) const {
    Workspace workspace;
    workspace.session_key = normalize_key(session);
    workspace.root = root_ + "/" + workspace.session_key;
    workspace.code = workspace.root + "/code";
    workspace.data = workspace.root + "/data";
    workspace.output = workspace.root + "/output";

    bool created = false;
    for (const auto* path : {&workspace.root, &workspace.code, &workspace.data,
                             &workspace.output}) {
        Status status = ensure_directory(*path, &created);
        if (!status) {
            std::cerr << "[Workspace] " << status.error().message << std::endl;
            return status.error();
        }
    }

    namespace fs = std::filesystem;
    std::error_code ec;
    std::string resolved = fs::canonical(workspace.root, ec).string();
    if (ec || resolved.compare(0, root_.size() + 1, root_ + "/") != 0) {
        return make_error(ErrorKind::Infrastructure,
                          "workspace " + workspace.session_key + " escapes " + root_);
    }

    if (created) {
        std::cout << "[Workspace] Created workspace: " << workspace.session_key << std::endl;
    }
    return workspace;
}

Status WorkspaceStore::check_relative_path(const std::string& relative_path) {
    if (relative_path.empty()) {
        return make_error(ErrorKind::Validation, "File name must not be empty");
    }
    if (relative_path.size() > MAX_FILE_NAME_LENGTH) {
        return make_error(ErrorKind::Validation, "File name is too long");
    }
    if (relative_path.front() == '/') {
        return make_error(ErrorKind::Validation, "File name must be relative: " + relative_path);
    }
    if (relative_path.find('\0') != std::string::npos ||
        relative_path.find('\\') != std::string::npos) {
        return make_error(ErrorKind::Validation, "File name contains an invalid character");
    }
    for (const auto& part : split_components(relative_path)) {
        if (part.empty() || part == "." || part == "..") {
            return make_error(ErrorKind::Validation,
                              "File name must not contain empty, '.' or '..' components: " +
                              relative_path);
        }
    }
    if (relative_path.back() == '/') {
        return make_error(ErrorKind::Validation, "File name must not end with '/'");
    }
    return Status::success();
}

Status WorkspaceStore::write_file(const Workspace& workspace, WorkspaceArea area,
                                  const std::string& relative_path,
                                  const std::string& content) const {
    auto target = resolve_inside(workspace.path(area), relative_path, true);
    if (!target) {
        return target.error();
    }

    int fd = ::open(target->c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW | O_CLOEXEC, 0644);
    if (fd < 0) {
        return make_error(ErrorKind::Infrastructure,
                          "open " + *target + ": " + std::strerror(errno));
    }

    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            int saved = errno;
            close(fd);
            return make_error(ErrorKind::Infrastructure,
                              "write " + *target + ": " + std::strerror(saved));
        }
        written += static_cast<size_t>(n);
    }

    if (close(fd) != 0) {
        return make_error(ErrorKind::Infrastructure,
                          "close " + *target + ": " + std::strerror(errno));
    }
    return Status::success();
}

Result<std::string> WorkspaceStore::read_file(const Workspace& workspace, WorkspaceArea area,
                                              const std::string& relative_path) const {
    auto target = resolve_inside(workspace.path(area), relative_path, false);
    if (!target) {
        return target.error();
    }

    int fd = ::open(target->c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT) {
            return make_error(ErrorKind::Validation, "No such file: " + relative_path);
        }
        return make_error(ErrorKind::Infrastructure,
                          "open " + *target + ": " + std::strerror(errno));
    }

    struct stat st;
    if (fstat(fd, &st) != 0 || !S_ISREG(st.st_mode)) {
        close(fd);
        return make_error(ErrorKind::Validation, "Not a regular file: " + relative_path);
    }

    std::string content;
    char buffer[FILE_HASH_CHUNK];
    while (true) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            int saved = errno;
            close(fd);
            return make_error(ErrorKind::Infrastructure,
                              "read " + *target + ": " + std::strerror(saved));
        }
        if (n == 0) {
            break;
        }
        content.append(buffer, static_cast<size_t>(n));
        if (content.size() > MAX_UNIT_FILE_SIZE) {
            close(fd);
            return make_error(ErrorKind::Validation, "File too large: " + relative_path);
        }
    }
    close(fd);
    return content;
}

bool WorkspaceStore::file_exists(const Workspace& workspace, WorkspaceArea area,
                                 const std::string& relative_path) const {
    auto target = resolve_inside(workspace.path(area), relative_path, false);
    if (!target) {
        return false;
    }
    struct stat st;
    return lstat(target->c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

std::vector<WorkspaceFile> WorkspaceStore::list_files(const Workspace& workspace,
                                                      WorkspaceArea area) const {
    std::vector<WorkspaceFile> files;
    for (const auto& [path, metadata] : FileUtils::hash_directory(workspace.path(area))) {
        WorkspaceFile file;
        file.path = path;
        file.size_bytes = metadata.size_bytes;
        file.sha256 = metadata.sha256_hash;
        file.modified = metadata.modified;
        files.push_back(file);
    }
    return files;
}

} // namespace runbox
