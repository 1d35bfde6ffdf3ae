#pragma once

#include "config.h"
#include "container_runtime.h"
#include "execution_types.h"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace runbox {

// What the driver observed, before interpretation
struct RawCapture {
    ExecutionStatus status = ExecutionStatus::Failed;
    std::optional<UnitExit> unit_exit;       // Absent when the unit never exited on its own
    UnitLogs logs;
    std::chrono::milliseconds duration{0};
    bool infrastructure_failure = false;
    std::string error_message;               // Driver-side explanation, if any
};

// Turns a RawCapture into an ExecutionResult: classifies the failure, pulls
// the relevant error line out of stderr, bounds captured output and runs the
// verification pass. Never changes the status decided by the driver.
class ResultAnalyzer {
public:
    explicit ResultAnalyzer(const SecurityPolicy& policy);

    ExecutionResult analyze(const RawCapture& raw, const ExecutionRequest& request) const;

    ErrorClassification classify(const RawCapture& raw, const std::string& language) const;

    // Most relevant stderr line for the classification, empty if none
    static std::string extract_error(const std::string& stderr_text, const std::string& language);

    // constant_tag may be empty; auto-detection then decides
    std::optional<Verification> verify(const std::string& stdout_text,
                                       const std::string& constant_tag) const;

    // Every decimal or scientific number in text, in order
    static std::vector<double> numeric_tokens(const std::string& text);

private:
    size_t max_output_bytes_;
    double tolerance_;
    bool auto_detect_;
};

} // namespace runbox
