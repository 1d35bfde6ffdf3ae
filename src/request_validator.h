#pragma once

#include "config.h"
#include "execution_types.h"
#include "language_registry.h"
#include "result.h"
#include "workspace_store.h"

namespace runbox {

// Everything the driver needs, resolved
struct ValidatedRequest {
    ExecutionRequest request;
    LanguageDescriptor language;
    Workspace workspace;
};

// Rejects bad requests before any sandbox resource exists, then opens the
// workspace and persists the source into code/.
//
// Errors of kind Validation come from the request itself. Errors of kind
// Infrastructure mean the workspace could not be prepared.
class RequestValidator {
public:
    RequestValidator(const LanguageRegistry& languages, const WorkspaceStore& workspaces,
                     const SecurityPolicy& policy);

    Result<ValidatedRequest> validate(const SubmitRequest& raw) const;

    // Side-effect free part of validate()
    Result<ExecutionRequest> check(const SubmitRequest& raw,
                                   const LanguageDescriptor& language) const;

    // Generated when empty; the language extension is appended when missing
    static Result<std::string> resolve_file_name(const std::string& requested,
                                                 const LanguageDescriptor& language);

private:
    const LanguageRegistry& languages_;
    const WorkspaceStore& workspaces_;
    const SecurityPolicy& policy_;
};

} // namespace runbox
