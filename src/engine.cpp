#include "engine.h"
#include "constants.h"
#include "container_runtime.h"
#include "docker_runtime.h"
#include "execution_driver.h"
#include "execution_registry.h"
#include "image_provisioner.h"
#include "local_runtime.h"
#include "request_validator.h"
#include <chrono>
#include <filesystem>
#include <iostream>

namespace runbox {

namespace {

const char* const RESULT_TRANSCRIPT_PREFIX = "result_";
const char* const ERROR_TRANSCRIPT_PREFIX = "error_";
const char* const TRANSCRIPT_SUFFIX = ".json";

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

// result_<id>.json / error_<id>.json at the top of output/
bool is_transcript(const std::string& path) {
    const std::string suffix = TRANSCRIPT_SUFFIX;
    if (path.find('/') != std::string::npos || path.size() < suffix.size() ||
        path.compare(path.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return false;
    }
    return starts_with(path, std::string(RESULT_TRANSCRIPT_PREFIX) + "exec_") ||
           starts_with(path, std::string(ERROR_TRANSCRIPT_PREFIX) + "exec_");
}

} // namespace

std::unique_ptr<ContainerRuntime> make_runtime(const RuntimeSettings& settings) {
    switch (settings.kind) {
        case RuntimeKind::Docker:
            return std::make_unique<DockerRuntime>(settings.docker_binary);
        case RuntimeKind::Local:
            return std::make_unique<LocalRuntime>(settings.scratch_root,
                                                  settings.strict_isolation);
    }
    throw std::runtime_error("unknown runtime kind");
}

struct ExecutionEngine::Impl {
    EngineConfig config;
    WorkspaceStore workspaces;
    std::unique_ptr<ContainerRuntime> runtime;
    ExecutionRegistry registry;
    ImageProvisioner images;
    RequestValidator validator;
    ExecutionDriver driver;

    Impl(EngineConfig cfg, std::unique_ptr<ContainerRuntime> rt)
        : config(std::move(cfg)),
          workspaces(config.workspace_root),
          runtime(std::move(rt)),
          registry(config.policy.retained_executions),
          images(*runtime),
          validator(config.languages, workspaces, config.policy),
          driver(*runtime, images, registry, config.policy) {}
};

ExecutionEngine::ExecutionEngine(EngineConfig config)
    : ExecutionEngine(config, make_runtime(config.runtime)) {}

ExecutionEngine::ExecutionEngine(EngineConfig config, std::unique_ptr<ContainerRuntime> runtime) {
    if (!runtime) {
        throw std::invalid_argument("ExecutionEngine needs a container runtime");
    }
    config.policy.validate();
    if (config.languages.size() == 0) {
        throw ConfigError("no languages configured");
    }
    impl_ = std::make_unique<Impl>(std::move(config), std::move(runtime));

    size_t reaped = impl_->runtime->reap_orphans();
    if (reaped > 0) {
        std::cout << "[Engine] Removed " << reaped << " units left by a previous run"
                  << std::endl;
    }
    std::cout << "[Engine] Ready: runtime " << impl_->runtime->name() << ", "
              << impl_->config.languages.size() << " languages, workspaces in "
              << impl_->workspaces.root() << std::endl;
}

ExecutionEngine::~ExecutionEngine() = default;

Result<ExecutionResult> ExecutionEngine::submit(const SubmitRequest& request) {
    Result<ValidatedRequest> validated = impl_->validator.validate(request);
    if (!validated) {
        const Error& error = validated.error();
        if (error.kind == ErrorKind::Validation) {
            std::cerr << "[Engine] Rejected request: " << error.message << std::endl;
            return error;
        }
        // The request was fine but its workspace could not be prepared
        ExecutionRequest failed;
        failed.language = request.language;
        failed.session = WorkspaceStore::normalize_key(request.session);
        failed.file_name = request.file_name;
        failed.verify_constant = request.verify_constant;
        return impl_->driver.fail_before_start(failed, error.message);
    }

    const ValidatedRequest& ready = *validated;
    const auto run_started = std::filesystem::file_time_type::clock::now() -
                             std::chrono::milliseconds(OUTPUT_MTIME_SLACK_MS);
    ExecutionResult result = impl_->driver.execute(ready.request, ready.language, ready.workspace);

    for (const auto& file : impl_->workspaces.list_files(ready.workspace, WorkspaceArea::Output)) {
        // Files from earlier runs in the session are not this run's output
        if (file.modified < run_started || is_transcript(file.path)) {
            continue;
        }
        OutputFile output;
        output.path = file.path;
        output.size_bytes = file.size_bytes;
        output.sha256 = file.sha256;
        result.output_files.push_back(std::move(output));
    }

    store_transcript(ready.workspace, result);
    return result;
}

void ExecutionEngine::store_transcript(const Workspace& workspace, ExecutionResult& result) {
    const std::string name = std::string(result.status == ExecutionStatus::Completed
                                             ? RESULT_TRANSCRIPT_PREFIX
                                             : ERROR_TRANSCRIPT_PREFIX) +
                             result.execution_id + TRANSCRIPT_SUFFIX;
    result.transcript_file = name;
    Status written = impl_->workspaces.write_file(workspace, WorkspaceArea::Output, name,
                                                  result.to_json());
    if (!written) {
        std::cerr << "[Engine] Could not store transcript for " << result.execution_id << ": "
                  << written.error().message << std::endl;
        result.transcript_file.clear();
    }
}

std::vector<ExecutionSummary> ExecutionEngine::list() const {
    return impl_->registry.list();
}

std::optional<ExecutionSummary> ExecutionEngine::get(const std::string& execution_id) const {
    return impl_->registry.get(execution_id);
}

bool ExecutionEngine::cancel(const std::string& execution_id) {
    bool issued = impl_->registry.cancel(execution_id);
    if (issued) {
        std::cout << "[Engine] Cancellation requested for " << execution_id << std::endl;
    }
    return issued;
}

const EngineConfig& ExecutionEngine::config() const {
    return impl_->config;
}

const LanguageRegistry& ExecutionEngine::languages() const {
    return impl_->config.languages;
}

const WorkspaceStore& ExecutionEngine::workspaces() const {
    return impl_->workspaces;
}

ContainerRuntime& ExecutionEngine::runtime() {
    return *impl_->runtime;
}

} // namespace runbox
