#pragma once

#include "result.h"
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace Json {
class Value;
}

namespace runbox {

// One supported language. Immutable once the registry is built.
//
// Commands are argv lists. "{file}" must be a whole element and is replaced
// by the source file name (relative to the working directory /code).
// "{stem}" may appear inside an element and is replaced by the file name
// without its extension.
struct LanguageDescriptor {
    std::string id;
    std::string runtime_image;
    std::string file_extension;                  // Without the dot
    std::vector<std::string> compile_command;    // Empty for interpreted languages
    std::vector<std::string> run_command;
    std::vector<std::string> install_command;    // Package names are appended
    std::vector<std::string> extra_packages;
    std::map<std::string, std::string> env;

    bool two_stage() const { return !compile_command.empty(); }

    // Final argv for the execution unit
    std::vector<std::string> build_argv(const std::string& file_name) const;
};

class LanguageRegistry {
public:
    LanguageRegistry() = default;

    // Validates every descriptor; throws ConfigError on the first bad one
    explicit LanguageRegistry(std::vector<LanguageDescriptor> languages);

    // python, javascript, go, sh, c, cpp, rust
    static LanguageRegistry builtin();

    // Parse a "languages" table: {"<id>": {"image": ..., "file_ext": ...,
    // "cmd": ..., "install_cmd": ..., "packages": [...]}}.
    // Throws ConfigError for missing or mistyped fields.
    static LanguageRegistry from_json(const Json::Value& table);

    Result<LanguageDescriptor> resolve(const std::string& id) const;
    bool contains(const std::string& id) const;
    std::vector<std::string> ids() const;
    size_t size() const { return languages_.size(); }

private:
    std::map<std::string, LanguageDescriptor> languages_;
};

// Throws ConfigError when the descriptor cannot be used
void validate_descriptor(const LanguageDescriptor& language);

} // namespace runbox
