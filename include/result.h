#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace runbox {

// Closed set of failure kinds surfaced by the engine
enum class ErrorKind {
    Validation,         // Rejected before any sandbox resource was allocated
    Infrastructure,     // Engine-side failure (runtime, image, mount, filesystem)
    SyntaxError,        // Program failed to parse or compile
    RuntimeException,   // Program failed while running
    ResourceViolation,  // Program killed for exceeding memory/CPU/file limits
    TimedOut,
    Killed
};

const char* error_kind_to_string(ErrorKind kind);

struct Error {
    ErrorKind kind;
    std::string message;
};

inline Error make_error(ErrorKind kind, std::string message) {
    return Error{kind, std::move(message)};
}

// Either a value or an Error. Used at every per-request seam.
template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error error) : data_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    T& value() {
        if (!ok()) {
            throw std::logic_error("Result holds an error: " + error().message);
        }
        return std::get<T>(data_);
    }

    const T& value() const {
        if (!ok()) {
            throw std::logic_error("Result holds an error: " + error().message);
        }
        return std::get<T>(data_);
    }

    const Error& error() const { return std::get<Error>(data_); }

    T& operator*() { return value(); }
    const T& operator*() const { return value(); }
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

private:
    std::variant<T, Error> data_;
};

// Result without a value
class Status {
public:
    Status() = default;
    Status(Error error) : error_(std::move(error)), ok_(false) {}

    static Status success() { return Status(); }

    bool ok() const { return ok_; }
    explicit operator bool() const { return ok_; }
    const Error& error() const { return error_; }

private:
    Error error_{ErrorKind::Infrastructure, ""};
    bool ok_ = true;
};

// Thrown at startup for malformed configuration; never thrown per request
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error("Configuration error: " + message) {}
};

} // namespace runbox
