#pragma once

#include <cstddef>  // for size_t
#include <cstdint>

namespace runbox {

// Memory limits
constexpr uint64_t DEFAULT_MEMORY_LIMIT_BYTES = 256ULL * 1024 * 1024;  // 256MiB
constexpr size_t MAX_OUTPUT_SIZE = 1024 * 1024;                       // 1MiB per stream
constexpr uint64_t MAX_UNIT_FILE_SIZE = 64ULL * 1024 * 1024;          // 64MiB per written file
constexpr uint64_t TMPFS_SIZE_BYTES = 256ULL * 1024 * 1024;           // Scratch /tmp, holds build caches
constexpr size_t MAX_CLI_OUTPUT = 4 * 1024 * 1024;                    // Runtime CLI replies

// CPU and process limits
constexpr double DEFAULT_CPU_LIMIT = 0.5;                             // Cores
constexpr int DEFAULT_PIDS_LIMIT = 50;
constexpr int MAX_OPEN_FILES = 256;

// Time limits
constexpr int DEFAULT_TIMEOUT_SECONDS = 10;
constexpr int MAX_TIMEOUT_SECONDS = 60;                               // Hard ceiling
constexpr int DEFAULT_GRACE_PERIOD_MS = 2000;                         // TERM -> KILL
constexpr int KILL_WAIT_MS = 5000;                                    // KILL -> reaped
constexpr int WAIT_POLL_INTERVAL_MS = 25;
constexpr int RUNTIME_COMMAND_TIMEOUT_SECONDS = 30;
constexpr int IMAGE_PULL_TIMEOUT_SECONDS = 120;
constexpr int IMAGE_BUILD_TIMEOUT_SECONDS = 600;

// Output analysis
constexpr double DEFAULT_VERIFICATION_TOLERANCE = 1e-4;
constexpr size_t MAX_SIGNATURE_LINE = 512;                            // Bytes of a stderr line searched

// Registry
constexpr size_t DEFAULT_RETAINED_EXECUTIONS = 256;

// Workspace
constexpr int OUTPUT_MTIME_SLACK_MS = 1000;                           // Coarse file timestamps
constexpr size_t MAX_SESSION_KEY_LENGTH = 100;
constexpr size_t MAX_FILE_NAME_LENGTH = 200;

// Buffer sizes
constexpr size_t PIPE_BUFFER_SIZE = 4096;
constexpr size_t FILE_HASH_CHUNK = 8192;

// Paths inside the execution unit
constexpr const char* UNIT_CODE_DIR = "/code";
constexpr const char* UNIT_DATA_DIR = "/data";
constexpr const char* UNIT_OUTPUT_DIR = "/output";
constexpr const char* UNIT_TMP_DIR = "/tmp";

// Written to stderr by two-stage commands when the compile stage fails
constexpr const char* COMPILE_FAILURE_MARKER = "runbox: compilation failed";

// Container labels
constexpr const char* UNIT_LABEL_MANAGED = "runbox.managed";
constexpr const char* UNIT_LABEL_OWNER = "runbox.owner";

} // namespace runbox
