#pragma once

#include "language_registry.h"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace runbox {

// Ceilings applied to every execution. Requests may only narrow them.
struct SecurityPolicy {
    // Built-in defaults
    SecurityPolicy();

    int default_timeout_seconds;
    int max_timeout_seconds;
    uint64_t memory_limit_bytes;
    double cpu_limit;                                   // Cores
    int pids_limit;
    std::chrono::milliseconds grace_period;             // TERM -> KILL
    size_t max_output_bytes;                            // Per stream
    double verification_tolerance;                      // Absolute
    bool verification_auto_detect;                      // Trigger on stdout markers
    size_t retained_executions;                         // Terminal registry entries

    // Throws ConfigError when a value is out of range
    void validate() const;
};

enum class RuntimeKind {
    Docker,     // docker CLI
    Local       // Host process with namespaces, rlimits and seccomp
};

struct RuntimeSettings {
    RuntimeKind kind = RuntimeKind::Docker;
    std::string docker_binary = "docker";
    std::string scratch_root = "/tmp/runbox_units";        // Local runtime only
    bool strict_isolation = true;                           // Local runtime only
};

struct EngineConfig {
    std::string workspace_root = "./workspaces";
    RuntimeSettings runtime;
    SecurityPolicy policy;
    LanguageRegistry languages = LanguageRegistry::builtin();
};

// Read and validate a JSON configuration file. Throws ConfigError.
EngineConfig load_engine_config(const std::string& path);

// Validate an already parsed document. Absent sections keep their defaults.
EngineConfig parse_engine_config(const Json::Value& root);

SecurityPolicy parse_security_policy(const Json::Value& policy);

const char* runtime_kind_to_string(RuntimeKind kind);

} // namespace runbox
