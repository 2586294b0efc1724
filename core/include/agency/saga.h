#pragma once
#include "reasoning.h"
#include "snapshot_store.h"
#include "workflow.h"

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace agency {

class TrajectoryLog;

// Cooperative suspend request, honored at the next step boundary.
class SuspendSignal {
public:
    void request(const std::string& reason);
    void clear();
    bool requested() const { return requested_.load(); }
    std::string reason() const;

private:
    std::atomic<bool> requested_{false};
    mutable std::mutex mu_;
    std::string reason_;
};

enum class StepOutcome {
    STARTED,               // Pending -> Running persisted
    STEP_SUCCEEDED,
    STEP_FAILED,           // workflow moved to Compensating
    STEP_COMPENSATED,
    COMPENSATION_FAILED,   // workflow moved to Failed
    SUSPENDED,
    FINISHED,              // workflow reached a terminal status in this call
    TERMINAL,              // workflow was already terminal, nothing done
};

const char* step_outcome_to_str(StepOutcome o);

// Drives one workflow through its saga.
//
// Every transition is staged on a WorkflowTx, persisted as the next snapshot
// version and only then committed to the caller's Workflow. When the put
// fails the caller's Workflow keeps its last persisted state and the
// StorageError propagates; the executor never moves past an unpersisted
// boundary.
//
// One executor may serve many workflows, but each Workflow must be advanced
// by one thread at a time (the Workflow Manager's lock guarantees this).
class SagaExecutor {
public:
    SagaExecutor(ISnapshotStore& store, const ReasoningLoop& loop, TrajectoryLog* trajectory = nullptr);

    // Persists version 1 of a freshly created workflow.
    void persist_initial(Workflow& wf);

    // Performs exactly one transition.
    StepOutcome advance(Workflow& wf, SuspendSignal* signal = nullptr);

    // Advances until the workflow is terminal or suspended.
    WorkflowStatus run_to_completion(Workflow& wf, SuspendSignal* signal = nullptr);

    // Immediate suspension of a workflow no executor is running.
    // Pending workflows pass through Running first. Throws
    // OperationRejectedError when the workflow is terminal, compensating or
    // has a step InProgress.
    void suspend(Workflow& wf, const std::string& reason);

    // Makes a loaded workflow runnable again: Suspended goes back to Running,
    // and a step left InProgress by a crash is marked Failed (Interrupted)
    // and compensation starts. The interrupted action is never re-run.
    void prepare_resume(Workflow& wf);

    // Called after every committed transition.
    void set_boundary_hook(std::function<void(const Workflow&)> hook) { boundary_hook_ = std::move(hook); }

    const ReasoningLoop& loop() const { return loop_; }

private:
    ISnapshotStore& store_;
    const ReasoningLoop& loop_;
    TrajectoryLog* trajectory_;
    std::function<void(const Workflow&)> boundary_hook_;

    template <typename Fn>
    void commit_transition(Workflow& wf, Fn&& mutate);

    StepOutcome start(Workflow& wf);
    StepOutcome forward_step(Workflow& wf, int idx);
    StepOutcome compensate_next(Workflow& wf);
    void mark_interrupted(Workflow& wf, int idx);

    ReasoningResult execute(const Workflow& wf, int idx, const ActionRef& action, const std::string& context_json);
    void trace(const Workflow& wf, int step, const std::string& event, const std::string& payload_json);
};

// Context handed to a step's action: workflow id, step identity and the
// outputs of previously succeeded steps.
std::string step_context_json(const Workflow& wf, int idx, bool compensating);

// Latest persisted state of a workflow, or nullopt when the store has none.
// Throws StorageError when the snapshot cannot be decoded.
std::optional<Workflow> load_latest_workflow(ISnapshotStore& store, const std::string& workflow_id);

} // namespace agency
