#include "execution_driver.h"
#include "constants.h"
#include <algorithm>
#include <iostream>

namespace runbox {

namespace {

using Clock = std::chrono::steady_clock;

// Removes the unit on every path out of run_unit
class UnitGuard {
public:
    UnitGuard(ContainerRuntime& runtime, std::string unit)
        : runtime_(runtime), unit_(std::move(unit)) {}

    ~UnitGuard() {
        Status removed = runtime_.remove(unit_);
        if (!removed) {
            std::cerr << "[Driver] Failed to remove " << unit_ << ": "
                      << removed.error().message << std::endl;
        }
    }

    UnitGuard(const UnitGuard&) = delete;
    UnitGuard& operator=(const UnitGuard&) = delete;

private:
    ContainerRuntime& runtime_;
    std::string unit_;
};

std::chrono::milliseconds elapsed_since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

} // namespace

ExecutionDriver::ExecutionDriver(ContainerRuntime& runtime, ImageProvisioner& images,
                                 ExecutionRegistry& registry, const SecurityPolicy& policy)
    : runtime_(runtime), images_(images), registry_(registry), policy_(policy),
      analyzer_(policy) {}

UnitSpec ExecutionDriver::build_unit_spec(const ExecutionRequest& request,
                                          const LanguageDescriptor& language,
                                          const Workspace& workspace, const std::string& image,
                                          const SecurityPolicy& policy) {
    UnitSpec spec;
    spec.image = image;
    spec.command = language.build_argv(request.file_name);
    spec.mounts = {
        {workspace.code, UNIT_CODE_DIR, true},
        {workspace.data, UNIT_DATA_DIR, true},
        {workspace.output, UNIT_OUTPUT_DIR, false},
    };
    spec.env = language.env;
    spec.env["CODE_DIR"] = UNIT_CODE_DIR;
    spec.env["DATA_DIR"] = UNIT_DATA_DIR;
    spec.env["OUTPUT_DIR"] = UNIT_OUTPUT_DIR;
    spec.env["HOME"] = UNIT_TMP_DIR;
    spec.working_dir = UNIT_CODE_DIR;
    spec.memory_limit_bytes = request.memory_limit_bytes;
    spec.cpu_limit = request.cpu_limit;
    spec.pids_limit = policy.pids_limit;
    spec.cpu_time_backstop = request.timeout + std::chrono::seconds(1);
    return spec;
}

ExecutionResult ExecutionDriver::execute(const ExecutionRequest& request,
                                         const LanguageDescriptor& language,
                                         const Workspace& workspace) {
    std::string id = registry_.create(request);
    std::cout << "[Driver] " << id << " accepted: " << request.language << " "
              << request.file_name << " in " << request.session << " (timeout "
              << request.timeout.count() << "s)" << std::endl;

    RawCapture raw;
    try {
        raw = run_unit(id, request, language, workspace);
    } catch (const std::exception& e) {
        std::cerr << "[Driver] " << id << " aborted: " << e.what() << std::endl;
        raw = RawCapture();
        raw.status = ExecutionStatus::Failed;
        raw.infrastructure_failure = true;
        raw.error_message = e.what();
    }
    return finalize(id, raw, request);
}

ExecutionResult ExecutionDriver::fail_before_start(const ExecutionRequest& request,
                                                   const std::string& message) {
    std::string id = registry_.create(request);
    std::cerr << "[Driver] " << id << " failed before start: " << message << std::endl;

    RawCapture raw;
    raw.status = ExecutionStatus::Failed;
    raw.infrastructure_failure = true;
    raw.error_message = message;
    return finalize(id, raw, request);
}

ExecutionResult ExecutionDriver::finalize(const std::string& execution_id, const RawCapture& raw,
                                          const ExecutionRequest& request) {
    registry_.finish(execution_id, raw.status);

    ExecutionResult result;
    try {
        result = analyzer_.analyze(raw, request);
    } catch (const std::exception& e) {
        // Keep the record even when analysis fails
        std::cerr << "[Driver] " << execution_id << " analysis failed: " << e.what() << std::endl;
        result = ExecutionResult();
        result.language = request.language;
        result.file_name = request.file_name;
        result.source_sha256 = request.source_sha256;
        result.status = raw.status;
        if (raw.unit_exit && raw.status != ExecutionStatus::TimedOut &&
            raw.status != ExecutionStatus::Killed) {
            result.exit_code = raw.unit_exit->exit_code;
        }
        result.stdout_text = raw.logs.stdout_text;
        result.stderr_text = raw.logs.stderr_text;
        result.stdout_truncated = raw.logs.stdout_truncated;
        result.stderr_truncated = raw.logs.stderr_truncated;
        result.duration = raw.duration;
        result.error_classification = ErrorClassification::None;
        result.error_message = raw.error_message;
    }
    result.execution_id = execution_id;

    std::ostream& log = result.status == ExecutionStatus::Completed ? std::cout : std::cerr;
    log << "[Driver] " << execution_id << " " << status_to_string(result.status);
    if (result.exit_code) {
        log << " (exit " << *result.exit_code << ")";
    }
    if (result.error_classification != ErrorClassification::None) {
        log << " [" << classification_to_string(result.error_classification) << "]";
    }
    log << " in " << result.duration.count() << "ms" << std::endl;
    return result;
}

RawCapture ExecutionDriver::run_unit(const std::string& execution_id,
                                     const ExecutionRequest& request,
                                     const LanguageDescriptor& language,
                                     const Workspace& workspace) {
    RawCapture raw;
    auto infrastructure = [&raw, &execution_id](const std::string& message) {
        std::cerr << "[Driver] " << execution_id << " infrastructure error: " << message
                  << std::endl;
        raw.status = ExecutionStatus::Failed;
        raw.infrastructure_failure = true;
        raw.error_message = message;
        return raw;
    };
    auto cancelled_before_start = [&raw]() {
        raw.status = ExecutionStatus::Killed;
        raw.error_message = "Execution cancelled before start";
        return raw;
    };

    Result<std::string> image = images_.prepare(language);
    if (!image) {
        return infrastructure(image.error().message);
    }
    if (registry_.cancel_requested(execution_id)) {
        return cancelled_before_start();
    }

    UnitSpec spec = build_unit_spec(request, language, workspace, *image, policy_);
    spec.name = "runbox_" + execution_id;

    Result<std::string> created = runtime_.create(spec);
    if (!created) {
        return infrastructure(created.error().message);
    }
    const std::string unit = *created;
    UnitGuard guard(runtime_, unit);

    if (!registry_.mark_running(execution_id)) {
        return cancelled_before_start();
    }

    Clock::time_point started = Clock::now();
    Status start = runtime_.start(unit);
    if (!start) {
        raw.duration = elapsed_since(started);
        return infrastructure(start.error().message);
    }

    // Sole suspension point: exit, timeout or cancellation
    const Clock::time_point deadline = started + request.timeout;
    std::optional<UnitExit> unit_exit;
    bool timed_out = false;
    bool cancelled = false;
    while (true) {
        Clock::time_point now = Clock::now();
        if (now >= deadline) {
            timed_out = true;
            break;
        }
        if (registry_.cancel_requested(execution_id)) {
            cancelled = true;
            break;
        }
        auto slice = std::min<Clock::duration>(deadline - now,
                                               std::chrono::milliseconds(WAIT_POLL_INTERVAL_MS));
        auto waited = runtime_.wait_for_exit(
            unit, std::chrono::duration_cast<std::chrono::milliseconds>(slice));
        if (!waited) {
            raw.duration = elapsed_since(started);
            return infrastructure(waited.error().message);
        }
        if (*waited) {
            unit_exit = **waited;
            break;
        }
    }
    raw.duration = elapsed_since(started);

    if (timed_out || cancelled) {
        std::cout << "[Driver] " << execution_id
                  << (timed_out ? " exceeded its timeout" : " cancelled") << ", terminating"
                  << std::endl;
        terminate(execution_id, unit);
        raw.status = timed_out ? ExecutionStatus::TimedOut : ExecutionStatus::Killed;
        raw.error_message = timed_out ? "Execution exceeded the " +
                                            std::to_string(request.timeout.count()) +
                                            "s timeout"
                                      : "Execution cancelled";
    } else {
        raw.unit_exit = unit_exit;
        raw.status = unit_exit->exit_code == 0 ? ExecutionStatus::Completed
                                               : ExecutionStatus::Failed;
    }

    Result<UnitLogs> logs = runtime_.capture_logs(unit, policy_.max_output_bytes);
    if (logs) {
        raw.logs = *logs;
    } else if (raw.unit_exit) {
        return infrastructure("capturing output failed: " + logs.error().message);
    } else {
        std::cerr << "[Driver] " << execution_id << " output unavailable: "
                  << logs.error().message << std::endl;
    }
    return raw;
}

void ExecutionDriver::terminate(const std::string& execution_id, const std::string& unit) {
    Status sent = runtime_.signal(unit, UnitSignal::Terminate);
    if (!sent) {
        std::cerr << "[Driver] " << execution_id << " SIGTERM failed: " << sent.error().message
                  << std::endl;
    } else {
        auto waited = runtime_.wait_for_exit(unit, policy_.grace_period);
        if (waited && *waited) {
            return;
        }
    }

    std::cout << "[Driver] " << execution_id << " still running after "
              << policy_.grace_period.count() << "ms, sending SIGKILL" << std::endl;
    sent = runtime_.signal(unit, UnitSignal::Kill);
    if (!sent) {
        std::cerr << "[Driver] " << execution_id << " SIGKILL failed: " << sent.error().message
                  << std::endl;
    }
    auto waited = runtime_.wait_for_exit(unit, std::chrono::milliseconds(KILL_WAIT_MS));
    if (!waited || !*waited) {
        // remove() force-kills whatever is left
        std::cerr << "[Driver] " << execution_id << " did not exit after SIGKILL" << std::endl;
    }
}

} // namespace runbox
