#include "language_registry.h"
#include "constants.h"
#include <cctype>
#include <sstream>
#include <json/json.h>

namespace runbox {

namespace {

const char* const FILE_PLACEHOLDER = "{file}";
const char* const STEM_PLACEHOLDER = "{stem}";

std::string file_stem(const std::string& file_name) {
    size_t dot = file_name.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        return file_name;
    }
    return file_name.substr(0, dot);
}

std::string substitute(const std::string& element, const std::string& file_name,
                       const std::string& stem) {
    if (element == FILE_PLACEHOLDER) {
        return file_name;
    }
    std::string out = element;
    const std::string placeholder = STEM_PLACEHOLDER;
    size_t pos = 0;
    while ((pos = out.find(placeholder, pos)) != std::string::npos) {
        out.replace(pos, placeholder.size(), stem);
        pos += stem.size();
    }
    return out;
}

// Every {...} token must be a known placeholder and {file} must stand alone
void check_placeholders(const std::string& id, const std::vector<std::string>& argv) {
    for (const auto& element : argv) {
        size_t pos = 0;
        while ((pos = element.find('{', pos)) != std::string::npos) {
            size_t close = element.find('}', pos);
            if (close == std::string::npos) {
                throw ConfigError("language '" + id + "': unterminated placeholder in '" +
                                  element + "'");
            }
            std::string token = element.substr(pos, close - pos + 1);
            if (token == FILE_PLACEHOLDER) {
                if (element != FILE_PLACEHOLDER) {
                    throw ConfigError("language '" + id +
                                      "': {file} must be a whole argument, got '" + element + "'");
                }
            } else if (token != STEM_PLACEHOLDER) {
                throw ConfigError("language '" + id + "': unknown placeholder " + token);
            }
            pos = close + 1;
        }
    }
}

bool contains_file_placeholder(const std::vector<std::string>& argv) {
    for (const auto& element : argv) {
        if (element == FILE_PLACEHOLDER) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> split_whitespace(const std::string& text) {
    std::vector<std::string> parts;
    std::istringstream iss(text);
    std::string part;
    while (iss >> part) {
        parts.push_back(part);
    }
    return parts;
}

std::string read_string(const Json::Value& entry, const std::string& id, const char* key,
                        bool required) {
    if (!entry.isMember(key)) {
        if (required) {
            throw ConfigError("language '" + id + "': missing required field '" + key + "'");
        }
        return "";
    }
    const Json::Value& value = entry[key];
    if (!value.isString()) {
        throw ConfigError("language '" + id + "': field '" + key + "' must be a string");
    }
    return value.asString();
}

std::vector<std::string> read_string_list(const Json::Value& value, const std::string& id,
                                          const char* key) {
    if (!value.isArray()) {
        throw ConfigError("language '" + id + "': field '" + key + "' must be an array");
    }
    std::vector<std::string> items;
    for (const auto& item : value) {
        if (!item.isString()) {
            throw ConfigError("language '" + id + "': field '" + key +
                              "' must contain only strings");
        }
        items.push_back(item.asString());
    }
    return items;
}

// Commands are given either as an argv array or as a legacy "go run" string
std::vector<std::string> read_command(const Json::Value& entry, const std::string& id,
                                      const char* key, bool required) {
    if (!entry.isMember(key)) {
        if (required) {
            throw ConfigError("language '" + id + "': missing required field '" + key + "'");
        }
        return {};
    }
    const Json::Value& value = entry[key];
    if (value.isString()) {
        return split_whitespace(value.asString());
    }
    return read_string_list(value, id, key);
}

} // namespace

std::vector<std::string> LanguageDescriptor::build_argv(const std::string& file_name) const {
    const std::string stem = file_stem(file_name);

    std::vector<std::string> run;
    for (const auto& element : run_command) {
        run.push_back(substitute(element, file_name, stem));
    }
    if (!two_stage()) {
        return run;
    }

    // sh only ever sees positional references; arguments are never re-parsed
    std::vector<std::string> argv = {"sh", "-c", "", "sh"};
    std::ostringstream script;
    size_t position = 1;
    for (size_t i = 0; i < compile_command.size(); ++i, ++position) {
        script << (i == 0 ? "" : " ") << "\"${" << position << "}\"";
        argv.push_back(substitute(compile_command[i], file_name, stem));
    }
    script << " || { echo '" << COMPILE_FAILURE_MARKER << "' >&2; exit 1; }; exec";
    for (const auto& element : run) {
        script << " \"${" << position++ << "}\"";
        argv.push_back(element);
    }
    argv[2] = script.str();
    return argv;
}

void validate_descriptor(const LanguageDescriptor& language) {
    const std::string& id = language.id;
    if (id.empty()) {
        throw ConfigError("language id must not be empty");
    }
    for (char c : id) {
        if (!(std::islower(static_cast<unsigned char>(c)) ||
              std::isdigit(static_cast<unsigned char>(c)) || c == '_' || c == '-')) {
            throw ConfigError("language id '" + id +
                              "' may only contain lowercase letters, digits, '_' and '-'");
        }
    }

    if (language.runtime_image.empty()) {
        throw ConfigError("language '" + id + "': image must not be empty");
    }
    for (char c : language.runtime_image) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            throw ConfigError("language '" + id + "': image must not contain whitespace");
        }
    }

    if (language.file_extension.empty()) {
        throw ConfigError("language '" + id + "': file_ext must not be empty");
    }
    for (char c : language.file_extension) {
        if (!std::isalnum(static_cast<unsigned char>(c))) {
            throw ConfigError("language '" + id + "': file_ext must be alphanumeric");
        }
    }

    if (language.run_command.empty()) {
        throw ConfigError("language '" + id + "': cmd must not be empty");
    }
    check_placeholders(id, language.run_command);
    check_placeholders(id, language.compile_command);

    const auto& first_stage = language.two_stage() ? language.compile_command
                                                   : language.run_command;
    if (!contains_file_placeholder(first_stage)) {
        throw ConfigError("language '" + id + "': " +
                          (language.two_stage() ? "compile" : "cmd") +
                          " must reference {file}");
    }

    if (!language.extra_packages.empty() && language.install_command.empty()) {
        throw ConfigError("language '" + id + "': packages require install_cmd");
    }
    for (const auto& package : language.extra_packages) {
        if (package.empty()) {
            throw ConfigError("language '" + id + "': package names must not be empty");
        }
    }
}

LanguageRegistry::LanguageRegistry(std::vector<LanguageDescriptor> languages) {
    for (auto& language : languages) {
        validate_descriptor(language);
        std::string id = language.id;
        if (!languages_.emplace(id, std::move(language)).second) {
            throw ConfigError("duplicate language '" + id + "'");
        }
    }
}

LanguageRegistry LanguageRegistry::builtin() {
    std::vector<LanguageDescriptor> languages;

    LanguageDescriptor python;
    python.id = "python";
    python.runtime_image = "python:3.11-slim";
    python.file_extension = "py";
    python.run_command = {"python", "{file}"};
    python.install_command = {"pip", "install", "--no-cache-dir"};
    python.env = {{"PYTHONDONTWRITEBYTECODE", "1"}, {"PYTHONUNBUFFERED", "1"}};
    languages.push_back(python);

    LanguageDescriptor javascript;
    javascript.id = "javascript";
    javascript.runtime_image = "node:18-slim";
    javascript.file_extension = "js";
    javascript.run_command = {"node", "{file}"};
    javascript.install_command = {"npm", "install", "-g"};
    javascript.env = {{"NODE_PATH", "/usr/local/lib/node_modules"}};
    languages.push_back(javascript);

    LanguageDescriptor go;
    go.id = "go";
    go.runtime_image = "golang:1.20-alpine";
    go.file_extension = "go";
    go.run_command = {"go", "run", "{file}"};
    go.install_command = {"go", "install"};
    go.env = {{"GOCACHE", "/tmp/go-cache"}, {"GOPATH", "/tmp/go"}, {"CGO_ENABLED", "0"}};
    languages.push_back(go);

    LanguageDescriptor sh;
    sh.id = "sh";
    sh.runtime_image = "alpine:3.19";
    sh.file_extension = "sh";
    sh.run_command = {"sh", "{file}"};
    sh.install_command = {"apk", "add", "--no-cache"};
    languages.push_back(sh);

    LanguageDescriptor c;
    c.id = "c";
    c.runtime_image = "gcc:13";
    c.file_extension = "c";
    c.compile_command = {"gcc", "-O2", "-o", "/tmp/{stem}", "{file}", "-lm"};
    c.run_command = {"/tmp/{stem}"};
    languages.push_back(c);

    LanguageDescriptor cpp;
    cpp.id = "cpp";
    cpp.runtime_image = "gcc:13";
    cpp.file_extension = "cpp";
    cpp.compile_command = {"g++", "-std=c++17", "-O2", "-o", "/tmp/{stem}", "{file}"};
    cpp.run_command = {"/tmp/{stem}"};
    languages.push_back(cpp);

    LanguageDescriptor rust;
    rust.id = "rust";
    rust.runtime_image = "rust:1.75-slim";
    rust.file_extension = "rs";
    rust.compile_command = {"rustc", "-O", "-o", "/tmp/{stem}", "{file}"};
    rust.run_command = {"/tmp/{stem}"};
    languages.push_back(rust);

    return LanguageRegistry(std::move(languages));
}

LanguageRegistry LanguageRegistry::from_json(const Json::Value& table) {
    if (!table.isObject()) {
        throw ConfigError("'languages' must be an object keyed by language id");
    }

    std::vector<LanguageDescriptor> languages;
    for (const auto& id : table.getMemberNames()) {
        const Json::Value& entry = table[id];
        if (!entry.isObject()) {
            throw ConfigError("language '" + id + "' must be an object");
        }

        LanguageDescriptor language;
        language.id = id;
        language.runtime_image = read_string(entry, id, "image", true);
        language.file_extension = read_string(entry, id, "file_ext", true);
        if (!language.file_extension.empty() && language.file_extension[0] == '.') {
            language.file_extension.erase(0, 1);
        }
        language.run_command = read_command(entry, id, "cmd", true);
        language.compile_command = read_command(entry, id, "compile", false);
        language.install_command = read_command(entry, id, "install_cmd", false);
        // Legacy string commands ("go run") name only the interpreter; the file goes last
        if (entry["cmd"].isString() && !language.two_stage() && !language.run_command.empty() &&
            !contains_file_placeholder(language.run_command)) {
            language.run_command.push_back(FILE_PLACEHOLDER);
        }
        if (entry.isMember("packages")) {
            language.extra_packages = read_string_list(entry["packages"], id, "packages");
        }
        if (entry.isMember("env")) {
            const Json::Value& env = entry["env"];
            if (!env.isObject()) {
                throw ConfigError("language '" + id + "': field 'env' must be an object");
            }
            for (const auto& name : env.getMemberNames()) {
                if (!env[name].isString()) {
                    throw ConfigError("language '" + id + "': env '" + name +
                                      "' must be a string");
                }
                language.env[name] = env[name].asString();
            }
        }
        languages.push_back(std::move(language));
    }

    return LanguageRegistry(std::move(languages));
}

Result<LanguageDescriptor> LanguageRegistry::resolve(const std::string& id) const {
    auto it = languages_.find(id);
    if (it == languages_.end()) {
        return make_error(ErrorKind::Validation, "Unsupported language: " + id);
    }
    return it->second;
}

bool LanguageRegistry::contains(const std::string& id) const {
    return languages_.count(id) > 0;
}

std::vector<std::string> LanguageRegistry::ids() const {
    std::vector<std::string> result;
    for (const auto& [id, language] : languages_) {
        result.push_back(id);
    }
    return result;
}

} // namespace runbox
