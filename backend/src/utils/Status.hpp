#pragma once
#include <string>
#include <utility>

enum class ErrorKind {
    None = 0,
    Validation,     // missing or malformed command argument
    Configuration,  // config directory or catalog file missing
    NotFound,       // unknown player or card id
    MalformedData,  // catalog, progress or settings file has the wrong shape
    Storage         // progress file could not be read or written
};

// Result of an operation that can fail. Values travel through out-parameters.
class Status {
public:
    Status() = default;

    static Status ok() { return Status(); }
    static Status error(ErrorKind kind, std::string message) {
        return Status(kind, std::move(message));
    }

    bool isOk() const { return err_kind == ErrorKind::None; }
    explicit operator bool() const { return isOk(); }

    ErrorKind kind() const { return err_kind; }
    const std::string& message() const { return err_message; }

private:
    Status(ErrorKind kind, std::string message)
        : err_kind(kind), err_message(std::move(message)) {}

    ErrorKind err_kind = ErrorKind::None;
    std::string err_message;
};

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None: return "ok";
    case ErrorKind::Validation: return "validation error";
    case ErrorKind::Configuration: return "configuration error";
    case ErrorKind::NotFound: return "not found";
    case ErrorKind::MalformedData: return "malformed data";
    case ErrorKind::Storage: return "storage error";
    }
    return "unknown error";
}

// Process exit code for a failed command.
inline int exitCodeFor(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None: return 0;
    case ErrorKind::Validation: return 2;
    case ErrorKind::Configuration: return 3;
    case ErrorKind::NotFound: return 4;
    case ErrorKind::MalformedData: return 5;
    case ErrorKind::Storage: return 6;
    }
    return 1;
}
