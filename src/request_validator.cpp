#include "request_validator.h"
#include "constants.h"
#include "file_utils.h"
#include "reference_constants.h"
#include <cmath>
#include <iostream>

namespace runbox {

namespace {

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

RequestValidator::RequestValidator(const LanguageRegistry& languages,
                                   const WorkspaceStore& workspaces,
                                   const SecurityPolicy& policy)
    : languages_(languages), workspaces_(workspaces), policy_(policy) {}

Result<std::string> RequestValidator::resolve_file_name(const std::string& requested,
                                                        const LanguageDescriptor& language) {
    const std::string extension = "." + language.file_extension;
    if (requested.empty()) {
        return "script_" + FileUtils::random_hex(4) + extension;
    }

    if (requested.find('/') != std::string::npos) {
        return make_error(ErrorKind::Validation,
                          "File name must not contain '/': " + requested);
    }
    Status valid = WorkspaceStore::check_relative_path(requested);
    if (!valid) {
        return valid.error();
    }
    // Would be read as an option by the interpreter or compiler
    if (requested.front() == '-') {
        return make_error(ErrorKind::Validation,
                          "File name must not start with '-': " + requested);
    }

    std::string file_name = ends_with(requested, extension) ? requested : requested + extension;
    if (file_name.size() > MAX_FILE_NAME_LENGTH) {
        return make_error(ErrorKind::Validation, "File name is too long");
    }
    return file_name;
}

Result<ExecutionRequest> RequestValidator::check(const SubmitRequest& raw,
                                                 const LanguageDescriptor& language) const {
    ExecutionRequest request;
    request.language = language.id;

    if (raw.use_existing_file) {
        if (raw.file_name.empty()) {
            return make_error(ErrorKind::Validation,
                              "A file name is required to run an existing file");
        }
    } else if (raw.source.empty()) {
        return make_error(ErrorKind::Validation, "Source must not be empty");
    } else if (raw.source.size() > MAX_UNIT_FILE_SIZE) {
        return make_error(ErrorKind::Validation,
                          "Source is " + FileUtils::format_file_size(raw.source.size()) +
                          ", limit is " + FileUtils::format_file_size(MAX_UNIT_FILE_SIZE));
    }
    request.source = raw.source;

    int timeout = raw.timeout_seconds.value_or(policy_.default_timeout_seconds);
    if (timeout <= 0 || timeout > policy_.max_timeout_seconds) {
        return make_error(ErrorKind::Validation,
                          "Timeout must be in (0, " + std::to_string(policy_.max_timeout_seconds) +
                          "] seconds, got " + std::to_string(timeout));
    }
    request.timeout = std::chrono::seconds(timeout);

    request.memory_limit_bytes = raw.memory_limit_bytes.value_or(policy_.memory_limit_bytes);
    if (request.memory_limit_bytes == 0 || request.memory_limit_bytes > policy_.memory_limit_bytes) {
        return make_error(ErrorKind::Validation,
                          "Memory limit must be in (0, " +
                          std::to_string(policy_.memory_limit_bytes) + "] bytes");
    }

    request.cpu_limit = raw.cpu_limit.value_or(policy_.cpu_limit);
    if (!std::isfinite(request.cpu_limit) || request.cpu_limit <= 0 ||
        request.cpu_limit > policy_.cpu_limit) {
        return make_error(ErrorKind::Validation,
                          "CPU limit must be in (0, " + std::to_string(policy_.cpu_limit) +
                          "] cores");
    }

    if (!raw.verify_constant.empty()) {
        const ReferenceConstant* constant = find_reference_constant(raw.verify_constant);
        if (!constant) {
            return make_error(ErrorKind::Validation,
                              "Unknown reference constant: " + raw.verify_constant);
        }
        request.verify_constant = constant->name;
    }

    auto file_name = resolve_file_name(raw.file_name, language);
    if (!file_name) {
        return file_name.error();
    }
    request.file_name = *file_name;
    request.session = WorkspaceStore::normalize_key(raw.session);
    return request;
}

Result<ValidatedRequest> RequestValidator::validate(const SubmitRequest& raw) const {
    auto language = languages_.resolve(raw.language);
    if (!language) {
        return language.error();
    }

    auto request = check(raw, *language);
    if (!request) {
        return request.error();
    }

    auto workspace = workspaces_.open(raw.session);
    if (!workspace) {
        return workspace.error();
    }

    ExecutionRequest& resolved = *request;
    if (raw.use_existing_file) {
        auto existing = workspaces_.read_file(*workspace, WorkspaceArea::Code, resolved.file_name);
        if (!existing) {
            return existing.error();
        }
        resolved.source = *existing;
    } else {
        // Persist before execution so the code survives a failed run
        Status written = workspaces_.write_file(*workspace, WorkspaceArea::Code,
                                                resolved.file_name, resolved.source);
        if (!written) {
            std::cerr << "[Workspace] Failed to store source: " << written.error().message
                      << std::endl;
            return written.error();
        }
    }
    resolved.source_sha256 = FileUtils::sha256_string(resolved.source);

    return ValidatedRequest{resolved, *language, *workspace};
}

} // namespace runbox
