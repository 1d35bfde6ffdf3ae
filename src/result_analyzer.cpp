#include "result_analyzer.h"
#include "constants.h"
#include "reference_constants.h"
#include <signal.h>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <map>
#include <regex>
#include <sstream>

namespace runbox {

namespace {

struct Signatures {
    std::vector<std::regex> syntax;
    std::vector<std::regex> runtime;
};

std::regex pattern(const char* expression) {
    return std::regex(expression, std::regex::ECMAScript | std::regex::optimize);
}

// Failure signatures per language; stderr is matched line by line
const std::map<std::string, Signatures>& signature_table() {
    static const std::map<std::string, Signatures> table = [] {
        std::map<std::string, Signatures> t;
        t["python"] = {
            {pattern(R"(^\s*(SyntaxError|IndentationError|TabError)(:|$))")},
            {pattern(R"(^(\w+\.)*\w*(Error|Exception|Exit|Interrupt)(:|$))"),
             pattern(R"(^Traceback \(most recent call last\):)")}};
        t["javascript"] = {
            {pattern(R"(^SyntaxError:)")},
            {pattern(R"(^(Uncaught )?\w*(Error|Exception)(:|$))"),
             pattern(R"(^\s+at .+:\d+:\d+\)?$)")}};
        t["go"] = {
            {pattern(R"(^\S+\.go:\d+:\d+: )")},
            {pattern(R"(^panic: )"), pattern(R"(^fatal error: )"),
             pattern(R"(^goroutine \d+ \[)")}};
        t["sh"] = {
            {pattern(R"([Ss]yntax error)")},
            {pattern(R"(: not found$)"), pattern(R"(: [Pp]ermission denied$)"),
             pattern(R"(: No such file or directory$)")}};
        Signatures native = {
            {pattern(R"(^\S+:\d+:\d+: (fatal )?error: )")},
            {pattern(R"(Segmentation fault)"), pattern(R"(^terminate called after)"),
             pattern(R"(Assertion .* failed)")}};
        t["c"] = native;
        t["cpp"] = native;
        t["rust"] = {
            {pattern(R"(^error(\[E\d+\])?: )")},
            {pattern(R"(^thread '.*' panicked at)")}};
        return t;
    }();
    return table;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

// Last line matching any of the patterns; empty if none does. Only the head
// of a line is searched, std::regex recursion grows with the input length.
std::string last_match(const std::vector<std::string>& lines, const std::vector<std::regex>& patterns) {
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        const std::string head = it->size() > MAX_SIGNATURE_LINE
            ? it->substr(0, MAX_SIGNATURE_LINE) : *it;
        for (const auto& re : patterns) {
            if (std::regex_search(head, re)) {
                return *it;
            }
        }
    }
    return "";
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

size_t skip_digits(const std::string& text, size_t pos) {
    while (pos < text.size() && is_digit(text[pos])) {
        ++pos;
    }
    return pos;
}

bool is_limit_signal(int sig) {
    return sig == SIGKILL || sig == SIGXCPU || sig == SIGXFSZ;
}

std::string bounded(const std::string& text, size_t max_bytes, bool& truncated) {
    if (text.size() <= max_bytes) {
        return text;
    }
    truncated = true;
    return text.substr(0, max_bytes);
}

} // namespace

ResultAnalyzer::ResultAnalyzer(const SecurityPolicy& policy)
    : max_output_bytes_(policy.max_output_bytes),
      tolerance_(policy.verification_tolerance),
      auto_detect_(policy.verification_auto_detect) {}

ErrorClassification ResultAnalyzer::classify(const RawCapture& raw,
                                             const std::string& language) const {
    if (raw.infrastructure_failure) {
        return ErrorClassification::InfrastructureError;
    }
    if (raw.status == ExecutionStatus::TimedOut || raw.status == ExecutionStatus::Killed) {
        return ErrorClassification::None;
    }

    if (raw.unit_exit) {
        if (raw.unit_exit->oom_killed || is_limit_signal(raw.unit_exit->term_signal)) {
            return ErrorClassification::ResourceViolation;
        }
    }

    const std::string& err = raw.logs.stderr_text;
    if (err.find(COMPILE_FAILURE_MARKER) != std::string::npos) {
        return ErrorClassification::SyntaxError;
    }

    auto table = signature_table().find(language);
    if (table != signature_table().end()) {
        auto lines = split_lines(err);
        if (!last_match(lines, table->second.syntax).empty()) {
            return ErrorClassification::SyntaxError;
        }
        if (!last_match(lines, table->second.runtime).empty()) {
            return ErrorClassification::RuntimeException;
        }
    }

    if (raw.unit_exit && raw.unit_exit->exit_code != 0) {
        return ErrorClassification::RuntimeException;
    }
    return ErrorClassification::None;
}

std::string ResultAnalyzer::extract_error(const std::string& stderr_text,
                                          const std::string& language) {
    auto lines = split_lines(stderr_text);
    auto table = signature_table().find(language);
    if (table != signature_table().end()) {
        std::string line = last_match(lines, table->second.syntax);
        // Patterns are ordered by how much they say about the failure
        for (size_t i = 0; line.empty() && i < table->second.runtime.size(); ++i) {
            line = last_match(lines, {table->second.runtime[i]});
        }
        if (!line.empty()) {
            return line;
        }
    }
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        if (it->find_first_not_of(" \t") != std::string::npos &&
            it->find(COMPILE_FAILURE_MARKER) == std::string::npos) {
            return *it;
        }
    }
    return "";
}

// [-+]?(digits.digits?|.digits|digits)([eE][-+]?digits)?, scanned left to right
std::vector<double> ResultAnalyzer::numeric_tokens(const std::string& text) {
    std::vector<double> values;
    size_t pos = 0;
    while (pos < text.size()) {
        const size_t start = pos;
        size_t end = pos;
        if (text[end] == '+' || text[end] == '-') {
            ++end;
        }
        const size_t int_end = skip_digits(text, end);
        bool has_digits = int_end > end;
        end = int_end;
        if (end < text.size() && text[end] == '.') {
            const size_t frac_end = skip_digits(text, end + 1);
            if (has_digits || frac_end > end + 1) {
                has_digits = true;
                end = frac_end;
            }
        }
        if (!has_digits) {
            pos = start + 1;
            continue;
        }
        if (end < text.size() && (text[end] == 'e' || text[end] == 'E')) {
            size_t exponent = end + 1;
            if (exponent < text.size() && (text[exponent] == '+' || text[exponent] == '-')) {
                ++exponent;
            }
            const size_t exponent_end = skip_digits(text, exponent);
            if (exponent_end > exponent) {
                end = exponent_end;
            }
        }

        const std::string token = text.substr(start, end - start);
        char* parsed_end = nullptr;
        double value = std::strtod(token.c_str(), &parsed_end);
        if (parsed_end != token.c_str() && std::isfinite(value)) {
            values.push_back(value);
        }
        pos = end;
    }
    return values;
}

std::optional<Verification> ResultAnalyzer::verify(const std::string& stdout_text,
                                                   const std::string& constant_tag) const {
    const ReferenceConstant* constant = nullptr;
    if (!constant_tag.empty()) {
        constant = find_reference_constant(constant_tag);
    } else if (auto_detect_) {
        constant = detect_reference_constant(stdout_text);
    }
    if (!constant) {
        return std::nullopt;
    }

    Verification verification;
    verification.constant = constant->name;
    verification.expected = constant->value;
    verification.tolerance = tolerance_;

    // The printed value closest to the reference is the candidate answer
    for (double value : numeric_tokens(stdout_text)) {
        if (!verification.actual ||
            std::fabs(value - constant->value) < std::fabs(*verification.actual - constant->value)) {
            verification.actual = value;
        }
    }
    verification.within_tolerance =
        verification.actual && std::fabs(*verification.actual - constant->value) <= tolerance_;
    return verification;
}

ExecutionResult ResultAnalyzer::analyze(const RawCapture& raw,
                                        const ExecutionRequest& request) const {
    ExecutionResult result;
    result.language = request.language;
    result.file_name = request.file_name;
    result.source_sha256 = request.source_sha256;
    result.status = raw.status;
    result.duration = raw.duration;

    result.stdout_truncated = raw.logs.stdout_truncated;
    result.stderr_truncated = raw.logs.stderr_truncated;
    result.stdout_text = bounded(raw.logs.stdout_text, max_output_bytes_, result.stdout_truncated);
    result.stderr_text = bounded(raw.logs.stderr_text, max_output_bytes_, result.stderr_truncated);

    if (raw.unit_exit && raw.status != ExecutionStatus::TimedOut &&
        raw.status != ExecutionStatus::Killed) {
        result.exit_code = raw.unit_exit->exit_code;
    }

    result.error_classification = classify(raw, request.language);
    result.error_message = raw.error_message;
    if (result.error_message.empty()) {
        switch (result.error_classification) {
            case ErrorClassification::ResourceViolation:
                if (raw.unit_exit->oom_killed) {
                    result.error_message = "Killed: out of memory";
                } else {
                    result.error_message = "Killed by signal " +
                                           std::to_string(raw.unit_exit->term_signal) +
                                           " (resource limit exceeded)";
                }
                break;
            case ErrorClassification::SyntaxError:
            case ErrorClassification::RuntimeException:
                result.error_message = extract_error(result.stderr_text, request.language);
                break;
            default:
                break;
        }
    }

    if (!raw.infrastructure_failure) {
        result.verification = verify(result.stdout_text, request.verify_constant);
    }
    return result;
}

} // namespace runbox
