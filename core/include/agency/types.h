#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace agency {

inline constexpr const char* kAgencyVersion = "0.4.1";

// Workflow lifecycle.
// Pending -> Running -> {Completed | Compensating -> {Compensated | Failed}}
// Suspended is reachable only from Running and resumes back to Running.
enum class WorkflowStatus {
    PENDING,
    RUNNING,
    SUSPENDED,
    COMPENSATING,
    COMPLETED,
    COMPENSATED,
    FAILED,
};

// Per-step runtime status.
enum class StepStatus {
    NOT_STARTED,
    IN_PROGRESS,
    SUCCEEDED,
    FAILED,
    COMPENSATED,
    COMPENSATION_FAILED,
};

// How one reasoning loop invocation ended.
enum class TerminatedBy {
    FINAL_ANSWER,
    STEP_LIMIT_REACHED,
    UNRECOVERABLE_ERROR,
};

// Result classification for collaborator calls (model, tool).
enum class CallStatus {
    OK,
    TRANSIENT_ERROR,
    PERMANENT_ERROR,
};

const char* workflow_status_to_str(WorkflowStatus s);
std::optional<WorkflowStatus> workflow_status_from_str(const std::string& s);

const char* step_status_to_str(StepStatus s);
std::optional<StepStatus> step_status_from_str(const std::string& s);

const char* terminated_by_to_str(TerminatedBy t);

const char* call_status_to_str(CallStatus s);

// Completed, Compensated and Failed never change again.
bool is_terminal(WorkflowStatus s);

// Wall clock in epoch milliseconds.
int64_t now_ms();

// ISO-8601 UTC ("2026-01-02T03:04:05Z") for an epoch-ms timestamp.
std::string iso_utc(int64_t epoch_ms);

} // namespace agency
