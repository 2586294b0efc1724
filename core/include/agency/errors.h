#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace agency {

enum class ErrorKind {
    TRANSIENT_PROVIDER,
    TRANSIENT_TOOL,
    UNRECOVERABLE,
    STORAGE,
    CONFIGURATION,
    COMPENSATION_FAILED,
    INTERRUPTED,        // step found InProgress after a crash
    NOT_FOUND,
    BUSY,               // another executor owns the workflow
    REJECTED,           // operation not allowed in this state or config
};

const char* error_kind_to_str(ErrorKind k);
std::optional<ErrorKind> error_kind_from_str(const std::string& s);

// Opaque error record kept in step runtime state and workflow failure.
struct ErrorRecord {
    ErrorKind kind{ErrorKind::UNRECOVERABLE};
    std::string message;
    int step{-1};

    bool operator==(const ErrorRecord& o) const {
        return kind == o.kind && message == o.message && step == o.step;
    }
};

class AgencyError : public std::runtime_error {
public:
    AgencyError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}
    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Snapshot write/read failure.
class StorageError : public AgencyError {
public:
    explicit StorageError(const std::string& what) : AgencyError(ErrorKind::STORAGE, what) {}
};

// put() with a version other than last+1.
class VersionConflictError : public StorageError {
public:
    VersionConflictError(const std::string& workflow_id, int64_t expected, int64_t got)
        : StorageError("version conflict for '" + workflow_id + "': expected " +
                       std::to_string(expected) + ", got " + std::to_string(got)),
          expected_(expected), got_(got) {}
    int64_t expected() const { return expected_; }
    int64_t got() const { return got_; }

private:
    int64_t expected_;
    int64_t got_;
};

class ConfigurationError : public AgencyError {
public:
    explicit ConfigurationError(const std::string& what) : AgencyError(ErrorKind::CONFIGURATION, what) {}
};

class NotFoundError : public AgencyError {
public:
    explicit NotFoundError(const std::string& what) : AgencyError(ErrorKind::NOT_FOUND, what) {}
};

class WorkflowBusyError : public AgencyError {
public:
    explicit WorkflowBusyError(const std::string& what) : AgencyError(ErrorKind::BUSY, what) {}
};

class OperationRejectedError : public AgencyError {
public:
    explicit OperationRejectedError(const std::string& what) : AgencyError(ErrorKind::REJECTED, what) {}
};

} // namespace agency
