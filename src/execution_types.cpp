#include "execution_types.h"
#include "result.h"
#include <json/json.h>

namespace runbox {

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "ValidationError";
        case ErrorKind::Infrastructure: return "InfrastructureError";
        case ErrorKind::SyntaxError: return "SyntaxError";
        case ErrorKind::RuntimeException: return "RuntimeException";
        case ErrorKind::ResourceViolation: return "ResourceViolation";
        case ErrorKind::TimedOut: return "TimedOut";
        case ErrorKind::Killed: return "Killed";
    }
    return "Unknown";
}

const char* status_to_string(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::Pending: return "pending";
        case ExecutionStatus::Running: return "running";
        case ExecutionStatus::Completed: return "completed";
        case ExecutionStatus::TimedOut: return "timed_out";
        case ExecutionStatus::Failed: return "failed";
        case ExecutionStatus::Killed: return "killed";
    }
    return "unknown";
}

const char* classification_to_string(ErrorClassification classification) {
    switch (classification) {
        case ErrorClassification::None: return "none";
        case ErrorClassification::SyntaxError: return "syntax_error";
        case ErrorClassification::RuntimeException: return "runtime_exception";
        case ErrorClassification::ResourceViolation: return "resource_violation";
        case ErrorClassification::InfrastructureError: return "infrastructure_error";
    }
    return "unknown";
}

bool is_terminal(ExecutionStatus status) {
    return status != ExecutionStatus::Pending && status != ExecutionStatus::Running;
}

std::string ExecutionResult::to_json() const {
    Json::Value json;
    json["execution_id"] = execution_id;
    json["language"] = language;
    json["file_name"] = file_name;
    json["status"] = status_to_string(status);
    json["exit_code"] = exit_code ? Json::Value(*exit_code) : Json::Value(Json::nullValue);
    json["stdout"] = stdout_text;
    json["stderr"] = stderr_text;
    json["stdout_truncated"] = stdout_truncated;
    json["stderr_truncated"] = stderr_truncated;
    json["duration_ms"] = static_cast<Json::Int64>(duration.count());
    json["error_classification"] = error_classification == ErrorClassification::None
        ? Json::Value(Json::nullValue)
        : Json::Value(classification_to_string(error_classification));
    if (!error_message.empty()) {
        json["error_message"] = error_message;
    }

    if (verification) {
        Json::Value v;
        v["constant"] = verification->constant;
        v["expected"] = verification->expected;
        v["actual"] = verification->actual ? Json::Value(*verification->actual)
                                           : Json::Value(Json::nullValue);
        v["tolerance"] = verification->tolerance;
        v["within_tolerance"] = verification->within_tolerance;
        json["verification"] = v;
    } else {
        json["verification"] = Json::Value(Json::nullValue);
    }

    Json::Value files(Json::arrayValue);
    for (const auto& file : output_files) {
        Json::Value f;
        f["path"] = file.path;
        f["size_bytes"] = static_cast<Json::UInt64>(file.size_bytes);
        f["sha256"] = file.sha256;
        files.append(f);
    }
    json["output_files"] = files;
    json["source_sha256"] = source_sha256;
    json["transcript_file"] = transcript_file.empty() ? Json::Value(Json::nullValue)
                                                      : Json::Value(transcript_file);

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, json);
}

} // namespace runbox
