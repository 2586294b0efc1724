#pragma once
#include "action.h"
#include "errors.h"
#include "types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agency {

// Mutable execution record of one step, indexed like Workflow::steps.
struct StepRuntime {
    StepStatus status{StepStatus::NOT_STARTED};
    int attempt_count{0};
    std::string output;
    bool truncated{false};
    std::optional<ErrorRecord> error;
    int64_t started_ms{0};
    int64_t finished_ms{0};
    std::string compensation_output;

    bool operator==(const StepRuntime& o) const {
        return status == o.status && attempt_count == o.attempt_count && output == o.output &&
               truncated == o.truncated && error == o.error && started_ms == o.started_ms &&
               finished_ms == o.finished_ms && compensation_output == o.compensation_output;
    }
};

struct Workflow {
    std::string workflow_id;
    std::vector<StepDescriptor> steps;   // fixed at creation
    std::vector<StepRuntime> runtime;    // same length as steps
    WorkflowStatus status{WorkflowStatus::PENDING};
    int64_t created_at_ms{0};
    int64_t updated_at_ms{0};
    int max_thinking_steps{5};
    int64_t version{0};                  // last persisted snapshot version, 0 = never persisted
    std::string initial_message;
    std::string suspend_reason;
    std::optional<ErrorRecord> failure;
    int failed_step{-1};
    int compensation_cursor{-1};         // next step to consider while compensating

    // Index of the step currently InProgress, or -1.
    int in_progress_index() const;

    // Output of the last succeeded step ("" if none).
    std::string final_output() const;

    // Number of steps that reached Succeeded at some point (including later compensated ones).
    int executed_steps() const;
};

// Creates a Pending workflow with one NotStarted runtime record per step.
Workflow make_workflow(const std::string& workflow_id,
                       std::vector<StepDescriptor> steps,
                       int max_thinking_steps);

// Durable capture of a workflow at one version. body_json is the serialized workflow.
struct Snapshot {
    std::string workflow_id;
    int64_t version{0};
    WorkflowStatus status{WorkflowStatus::PENDING};
    int64_t timestamp_ms{0};
    std::string body_json;
};

struct SnapshotSummary {
    std::string workflow_id;
    int64_t version{0};
    WorkflowStatus status{WorkflowStatus::PENDING};
    int64_t timestamp_ms{0};
};

} // namespace agency
