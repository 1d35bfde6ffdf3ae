#include "image_provisioner.h"
#include "file_utils.h"
#include "process_utils.h"
#include <iostream>

namespace runbox {

ImageProvisioner::ImageProvisioner(ContainerRuntime& runtime) : runtime_(runtime) {}

std::string ImageProvisioner::derived_tag(const LanguageDescriptor& language) {
    std::string fingerprint = language.runtime_image + "\n" +
                              join_argv(language.install_command) + "\n" +
                              join_argv(language.extra_packages);
    return "runbox-" + language.id + ":" + FileUtils::sha256_string(fingerprint).substr(0, 12);
}

std::shared_ptr<std::mutex> ImageProvisioner::build_lock(const std::string& tag) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = build_locks_[tag];
    if (!slot) {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

Result<std::string> ImageProvisioner::prepare(const LanguageDescriptor& language) {
    if (language.extra_packages.empty()) {
        return language.runtime_image;
    }

    std::string tag = derived_tag(language);

    // One build per tag; other languages keep provisioning in parallel
    auto tag_lock = build_lock(tag);
    std::lock_guard<std::mutex> building(*tag_lock);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (built_.count(tag) > 0) {
            return tag;
        }
    }

    std::vector<std::string> install_argv = language.install_command;
    install_argv.insert(install_argv.end(), language.extra_packages.begin(),
                        language.extra_packages.end());

    std::cout << "[Images] Building " << tag << " from " << language.runtime_image << " ("
              << language.extra_packages.size() << " packages)" << std::endl;
    Status status = runtime_.build_image(tag, language.runtime_image, install_argv);
    if (!status) {
        std::cerr << "[Images] Build of " << tag << " failed: " << status.error().message
                  << std::endl;
        return make_error(ErrorKind::Infrastructure,
                          "provisioning " + language.id + " packages failed: " +
                              status.error().message);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    built_.insert(tag);
    std::cout << "[Images] Built " << tag << std::endl;
    return tag;
}

} // namespace runbox
