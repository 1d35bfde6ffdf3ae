#pragma once

#include "config.h"
#include "container_runtime.h"
#include "execution_registry.h"
#include "execution_types.h"
#include "image_provisioner.h"
#include "language_registry.h"
#include "result_analyzer.h"
#include "workspace_store.h"

namespace runbox {

// Runs one validated request as an isolated unit and always tears the unit
// down again. The only blocking step is waiting for the unit to exit, the
// timeout to fire or a cancellation to arrive.
class ExecutionDriver {
public:
    ExecutionDriver(ContainerRuntime& runtime, ImageProvisioner& images,
                    ExecutionRegistry& registry, const SecurityPolicy& policy);

    ExecutionResult execute(const ExecutionRequest& request, const LanguageDescriptor& language,
                            const Workspace& workspace);

    // Records an execution that failed before a unit could be created
    ExecutionResult fail_before_start(const ExecutionRequest& request, const std::string& message);

    static UnitSpec build_unit_spec(const ExecutionRequest& request,
                                    const LanguageDescriptor& language,
                                    const Workspace& workspace, const std::string& image,
                                    const SecurityPolicy& policy);

private:
    RawCapture run_unit(const std::string& execution_id, const ExecutionRequest& request,
                        const LanguageDescriptor& language, const Workspace& workspace);

    // TERM, grace period, KILL. Returns once the unit is gone or the kill wait expires.
    void terminate(const std::string& execution_id, const std::string& unit);

    ExecutionResult finalize(const std::string& execution_id, const RawCapture& raw,
                             const ExecutionRequest& request);

    ContainerRuntime& runtime_;
    ImageProvisioner& images_;
    ExecutionRegistry& registry_;
    const SecurityPolicy& policy_;
    ResultAnalyzer analyzer_;
};

} // namespace runbox
