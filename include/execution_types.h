#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace runbox {

enum class ExecutionStatus {
    Pending,
    Running,
    Completed,
    TimedOut,
    Failed,
    Killed
};

enum class ErrorClassification {
    None,
    SyntaxError,
    RuntimeException,
    ResourceViolation,
    InfrastructureError
};

const char* status_to_string(ExecutionStatus status);
const char* classification_to_string(ErrorClassification classification);
bool is_terminal(ExecutionStatus status);

// What the orchestrator hands us, before validation
struct SubmitRequest {
    std::string language;
    std::string source;
    std::string session;                     // Raw chat/session name
    std::string file_name;                   // Inside code/, generated when empty
    std::optional<int> timeout_seconds;      // Policy default when absent
    std::optional<uint64_t> memory_limit_bytes;
    std::optional<double> cpu_limit;         // In cores
    std::string verify_constant;             // e.g. "pi"; empty disables tagging
    bool use_existing_file = false;          // Run code/<file_name> as already stored
};

// Validated request; every field is resolved
struct ExecutionRequest {
    std::string language;
    std::string source;
    std::string session;                     // Normalized workspace key
    std::string file_name;
    std::chrono::seconds timeout{0};
    uint64_t memory_limit_bytes = 0;
    double cpu_limit = 0;
    std::string verify_constant;
    std::string source_sha256;
};

struct ExecutionSummary {
    std::string execution_id;
    ExecutionStatus status = ExecutionStatus::Pending;
    std::chrono::system_clock::time_point started_at;
    std::string language;
    std::string session;
    std::string file_name;
};

struct Verification {
    std::string constant;
    double expected = 0;
    std::optional<double> actual;            // Absent when stdout had no number
    double tolerance = 0;
    bool within_tolerance = false;
};

struct OutputFile {
    std::string path;                        // Relative to output/
    uint64_t size_bytes = 0;
    std::string sha256;
};

struct ExecutionResult {
    std::string execution_id;
    std::string language;
    std::string file_name;
    ExecutionStatus status = ExecutionStatus::Failed;
    std::optional<int> exit_code;            // Absent for TimedOut/Killed
    std::string stdout_text;
    std::string stderr_text;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    std::chrono::milliseconds duration{0};
    ErrorClassification error_classification = ErrorClassification::None;
    std::string error_message;
    std::optional<Verification> verification;
    std::vector<OutputFile> output_files;    // Written or touched during this run
    std::string source_sha256;
    std::string transcript_file;             // Relative to output/, empty if not stored

    // Serialize to JSON
    std::string to_json() const;
};

} // namespace runbox
