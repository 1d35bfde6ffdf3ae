#pragma once

#include "container_runtime.h"
#include "language_registry.h"
#include "result.h"
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace runbox {

// Resolves the image a language runs in. Languages with extra packages get a
// derived image (FROM runtime_image, RUN install_command packages...) that is
// built once and reused for the life of the process.
class ImageProvisioner {
public:
    explicit ImageProvisioner(ContainerRuntime& runtime);

    // Image tag for the unit. Infrastructure error when the build fails.
    Result<std::string> prepare(const LanguageDescriptor& language);

    // "runbox-<id>:<12 hex>", stable for the same image, installer and packages
    static std::string derived_tag(const LanguageDescriptor& language);

private:
    std::shared_ptr<std::mutex> build_lock(const std::string& tag);

    ContainerRuntime& runtime_;

    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<std::mutex>> build_locks_;
    std::set<std::string> built_;
};

} // namespace runbox
