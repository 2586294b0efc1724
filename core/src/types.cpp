#include "agency/types.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace agency {

const char* workflow_status_to_str(WorkflowStatus s) {
    switch (s) {
        case WorkflowStatus::PENDING:      return "Pending";
        case WorkflowStatus::RUNNING:      return "Running";
        case WorkflowStatus::SUSPENDED:    return "Suspended";
        case WorkflowStatus::COMPENSATING: return "Compensating";
        case WorkflowStatus::COMPLETED:    return "Completed";
        case WorkflowStatus::COMPENSATED:  return "Compensated";
        case WorkflowStatus::FAILED:       return "Failed";
    }
    return "Failed";
}

std::optional<WorkflowStatus> workflow_status_from_str(const std::string& s) {
    if (s == "Pending") return WorkflowStatus::PENDING;
    if (s == "Running") return WorkflowStatus::RUNNING;
    if (s == "Suspended") return WorkflowStatus::SUSPENDED;
    if (s == "Compensating") return WorkflowStatus::COMPENSATING;
    if (s == "Completed") return WorkflowStatus::COMPLETED;
    if (s == "Compensated") return WorkflowStatus::COMPENSATED;
    if (s == "Failed") return WorkflowStatus::FAILED;
    return std::nullopt;
}

const char* step_status_to_str(StepStatus s) {
    switch (s) {
        case StepStatus::NOT_STARTED:         return "NotStarted";
        case StepStatus::IN_PROGRESS:         return "InProgress";
        case StepStatus::SUCCEEDED:           return "Succeeded";
        case StepStatus::FAILED:              return "Failed";
        case StepStatus::COMPENSATED:         return "Compensated";
        case StepStatus::COMPENSATION_FAILED: return "CompensationFailed";
    }
    return "Failed";
}

std::optional<StepStatus> step_status_from_str(const std::string& s) {
    if (s == "NotStarted") return StepStatus::NOT_STARTED;
    if (s == "InProgress") return StepStatus::IN_PROGRESS;
    if (s == "Succeeded") return StepStatus::SUCCEEDED;
    if (s == "Failed") return StepStatus::FAILED;
    if (s == "Compensated") return StepStatus::COMPENSATED;
    if (s == "CompensationFailed") return StepStatus::COMPENSATION_FAILED;
    return std::nullopt;
}

const char* terminated_by_to_str(TerminatedBy t) {
    switch (t) {
        case TerminatedBy::FINAL_ANSWER:        return "FinalAnswer";
        case TerminatedBy::STEP_LIMIT_REACHED:  return "StepLimitReached";
        case TerminatedBy::UNRECOVERABLE_ERROR: return "UnrecoverableError";
    }
    return "UnrecoverableError";
}

const char* call_status_to_str(CallStatus s) {
    switch (s) {
        case CallStatus::OK:              return "OK";
        case CallStatus::TRANSIENT_ERROR: return "TRANSIENT_ERROR";
        case CallStatus::PERMANENT_ERROR: return "PERMANENT_ERROR";
    }
    return "PERMANENT_ERROR";
}

bool is_terminal(WorkflowStatus s) {
    return s == WorkflowStatus::COMPLETED ||
           s == WorkflowStatus::COMPENSATED ||
           s == WorkflowStatus::FAILED;
}

int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string iso_utc(int64_t epoch_ms) {
    std::time_t t = static_cast<std::time_t>(epoch_ms / 1000);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace agency
