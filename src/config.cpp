#include "config.h"
#include "constants.h"
#include <fstream>
#include <iostream>
#include <json/json.h>

namespace runbox {

namespace {

const Json::Value* optional_member(const Json::Value& object, const char* key) {
    if (!object.isMember(key) || object[key].isNull()) {
        return nullptr;
    }
    return &object[key];
}

void read_int(const Json::Value& object, const char* section, const char* key, int& out) {
    if (auto* value = optional_member(object, key)) {
        if (!value->isInt()) {
            throw ConfigError(std::string(section) + "." + key + " must be an integer");
        }
        out = value->asInt();
    }
}

void read_uint64(const Json::Value& object, const char* section, const char* key,
                 uint64_t& out) {
    if (auto* value = optional_member(object, key)) {
        if (!value->isUInt64()) {
            throw ConfigError(std::string(section) + "." + key +
                              " must be a non-negative integer");
        }
        out = value->asUInt64();
    }
}

void read_double(const Json::Value& object, const char* section, const char* key,
                 double& out) {
    if (auto* value = optional_member(object, key)) {
        if (!value->isNumeric()) {
            throw ConfigError(std::string(section) + "." + key + " must be a number");
        }
        out = value->asDouble();
    }
}

void read_bool(const Json::Value& object, const char* section, const char* key, bool& out) {
    if (auto* value = optional_member(object, key)) {
        if (!value->isBool()) {
            throw ConfigError(std::string(section) + "." + key + " must be a boolean");
        }
        out = value->asBool();
    }
}

void read_string(const Json::Value& object, const char* section, const char* key,
                 std::string& out) {
    if (auto* value = optional_member(object, key)) {
        if (!value->isString() || value->asString().empty()) {
            throw ConfigError(std::string(section) + "." + key +
                              " must be a non-empty string");
        }
        out = value->asString();
    }
}

RuntimeKind parse_runtime_kind(const std::string& name) {
    if (name == "docker") {
        return RuntimeKind::Docker;
    }
    if (name == "local") {
        return RuntimeKind::Local;
    }
    throw ConfigError("runtime must be \"docker\" or \"local\", got \"" + name + "\"");
}

RuntimeSettings parse_runtime_settings(const Json::Value& runtime) {
    RuntimeSettings settings;
    if (runtime.isString()) {
        settings.kind = parse_runtime_kind(runtime.asString());
        return settings;
    }
    if (!runtime.isObject()) {
        throw ConfigError("runtime must be a string or an object");
    }

    std::string kind = runtime_kind_to_string(settings.kind);
    read_string(runtime, "runtime", "kind", kind);
    settings.kind = parse_runtime_kind(kind);
    read_string(runtime, "runtime", "docker_binary", settings.docker_binary);
    read_string(runtime, "runtime", "scratch_root", settings.scratch_root);
    read_bool(runtime, "runtime", "strict_isolation", settings.strict_isolation);
    return settings;
}

} // namespace

SecurityPolicy::SecurityPolicy()
    : default_timeout_seconds(DEFAULT_TIMEOUT_SECONDS),
      max_timeout_seconds(MAX_TIMEOUT_SECONDS),
      memory_limit_bytes(DEFAULT_MEMORY_LIMIT_BYTES),
      cpu_limit(DEFAULT_CPU_LIMIT),
      pids_limit(DEFAULT_PIDS_LIMIT),
      grace_period(DEFAULT_GRACE_PERIOD_MS),
      max_output_bytes(MAX_OUTPUT_SIZE),
      verification_tolerance(DEFAULT_VERIFICATION_TOLERANCE),
      verification_auto_detect(true),
      retained_executions(DEFAULT_RETAINED_EXECUTIONS) {}

void SecurityPolicy::validate() const {
    if (max_timeout_seconds <= 0) {
        throw ConfigError("policy.max_timeout_seconds must be positive");
    }
    if (default_timeout_seconds <= 0 || default_timeout_seconds > max_timeout_seconds) {
        throw ConfigError("policy.default_timeout_seconds must be in (0, " +
                          std::to_string(max_timeout_seconds) + "]");
    }
    if (memory_limit_bytes < 4ULL * 1024 * 1024) {
        throw ConfigError("policy.memory_limit_bytes must be at least 4MiB");
    }
    if (!(cpu_limit > 0)) {
        throw ConfigError("policy.cpu_limit must be positive");
    }
    if (pids_limit <= 0) {
        throw ConfigError("policy.pids_limit must be positive");
    }
    if (grace_period.count() < 0) {
        throw ConfigError("policy.grace_period_ms must not be negative");
    }
    if (max_output_bytes == 0) {
        throw ConfigError("policy.max_output_bytes must be positive");
    }
    if (!(verification_tolerance >= 0)) {
        throw ConfigError("policy.verification_tolerance must not be negative");
    }
    if (retained_executions == 0) {
        throw ConfigError("policy.retained_executions must be positive");
    }
}

const char* runtime_kind_to_string(RuntimeKind kind) {
    switch (kind) {
        case RuntimeKind::Docker: return "docker";
        case RuntimeKind::Local: return "local";
    }
    return "unknown";
}

SecurityPolicy parse_security_policy(const Json::Value& policy) {
    if (!policy.isObject()) {
        throw ConfigError("policy must be an object");
    }

    SecurityPolicy result;
    read_int(policy, "policy", "default_timeout_seconds", result.default_timeout_seconds);
    read_int(policy, "policy", "max_timeout_seconds", result.max_timeout_seconds);
    read_uint64(policy, "policy", "memory_limit_bytes", result.memory_limit_bytes);
    read_double(policy, "policy", "cpu_limit", result.cpu_limit);
    read_int(policy, "policy", "pids_limit", result.pids_limit);

    int grace_ms = static_cast<int>(result.grace_period.count());
    read_int(policy, "policy", "grace_period_ms", grace_ms);
    result.grace_period = std::chrono::milliseconds(grace_ms);

    uint64_t max_output = result.max_output_bytes;
    read_uint64(policy, "policy", "max_output_bytes", max_output);
    result.max_output_bytes = static_cast<size_t>(max_output);

    read_double(policy, "policy", "verification_tolerance", result.verification_tolerance);
    read_bool(policy, "policy", "verification_auto_detect", result.verification_auto_detect);

    uint64_t retained = result.retained_executions;
    read_uint64(policy, "policy", "retained_executions", retained);
    result.retained_executions = static_cast<size_t>(retained);

    result.validate();
    return result;
}

EngineConfig parse_engine_config(const Json::Value& root) {
    if (!root.isObject()) {
        throw ConfigError("top level must be an object");
    }

    EngineConfig config;
    read_string(root, "config", "workspace_root", config.workspace_root);
    if (auto* runtime = optional_member(root, "runtime")) {
        config.runtime = parse_runtime_settings(*runtime);
    }
    if (auto* policy = optional_member(root, "policy")) {
        config.policy = parse_security_policy(*policy);
    }
    if (auto* languages = optional_member(root, "languages")) {
        config.languages = LanguageRegistry::from_json(*languages);
        if (config.languages.size() == 0) {
            throw ConfigError("languages must define at least one language");
        }
    }
    return config;
}

EngineConfig load_engine_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot open " + path);
    }

    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &root, &errors)) {
        throw ConfigError("failed to parse " + path + ": " + errors);
    }

    EngineConfig config = parse_engine_config(root);
    std::cout << "[Config] Loaded " << path << ": " << config.languages.size()
              << " languages, runtime=" << runtime_kind_to_string(config.runtime.kind)
              << ", workspace_root=" << config.workspace_root << std::endl;
    return config;
}

} // namespace runbox
