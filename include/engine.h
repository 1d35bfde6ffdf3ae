#pragma once

#include "config.h"
#include "execution_types.h"
#include "language_registry.h"
#include "result.h"
#include "workspace_store.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace runbox {

class ContainerRuntime;

// Runtime named by the settings. Throws std::runtime_error when it cannot be set up.
std::unique_ptr<ContainerRuntime> make_runtime(const RuntimeSettings& settings);

// Entry point for the orchestrating caller.
//
// submit() blocks until the execution reaches a terminal status. Only
// ValidationError comes back as an Error; every sandboxed outcome, including
// infrastructure failures, is an ExecutionResult. Safe to use from several
// threads at once.
class ExecutionEngine {
public:
    // Uses make_runtime(config.runtime). Throws ConfigError or std::runtime_error.
    explicit ExecutionEngine(EngineConfig config);
    ExecutionEngine(EngineConfig config, std::unique_ptr<ContainerRuntime> runtime);
    ~ExecutionEngine();

    ExecutionEngine(const ExecutionEngine&) = delete;
    ExecutionEngine& operator=(const ExecutionEngine&) = delete;

    Result<ExecutionResult> submit(const SubmitRequest& request);

    std::vector<ExecutionSummary> list() const;
    std::optional<ExecutionSummary> get(const std::string& execution_id) const;

    // True if a live execution was found and cancellation was issued
    bool cancel(const std::string& execution_id);

    const EngineConfig& config() const;
    const LanguageRegistry& languages() const;
    const WorkspaceStore& workspaces() const;
    ContainerRuntime& runtime();

private:
    // Writes output/result_<id>.json, or error_<id>.json for any other status
    void store_transcript(const Workspace& workspace, ExecutionResult& result);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace runbox
