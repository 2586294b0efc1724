#include "agency/saga.h"
#include "agency/json_mini.h"
#include "agency/log.h"
#include "agency/serialization.h"
#include "agency/tx.h"

#include <json-c/json.h>

#include <iostream>

namespace agency {

void SuspendSignal::request(const std::string& reason) {
    std::lock_guard<std::mutex> lk(mu_);
    reason_ = reason;
    requested_ = true;
}

void SuspendSignal::clear() {
    std::lock_guard<std::mutex> lk(mu_);
    reason_.clear();
    requested_ = false;
}

std::string SuspendSignal::reason() const {
    std::lock_guard<std::mutex> lk(mu_);
    return reason_;
}

const char* step_outcome_to_str(StepOutcome o) {
    switch (o) {
        case StepOutcome::STARTED: return "started";
        case StepOutcome::STEP_SUCCEEDED: return "step_succeeded";
        case StepOutcome::STEP_FAILED: return "step_failed";
        case StepOutcome::STEP_COMPENSATED: return "step_compensated";
        case StepOutcome::COMPENSATION_FAILED: return "compensation_failed";
        case StepOutcome::SUSPENDED: return "suspended";
        case StepOutcome::FINISHED: return "finished";
        case StepOutcome::TERMINAL: return "terminal";
    }
    return "unknown";
}

std::string step_context_json(const Workflow& wf, int idx, bool compensating) {
    json_object* o = json_object_new_object();
    json_add_string(o, "workflow_id", wf.workflow_id);
    json_object_object_add(o, "step", json_object_new_int(idx));
    json_add_string(o, "step_name", wf.steps[(size_t)idx].name);
    if (compensating) {
        json_object_object_add(o, "compensating", json_object_new_boolean(1));
        json_add_string(o, "forward_output", wf.runtime[(size_t)idx].output);
    }
    json_object* prev = json_object_new_array();
    for (int i = 0; i < idx; i++) {
        const auto& rt = wf.runtime[(size_t)i];
        if (rt.status != StepStatus::SUCCEEDED) continue;
        json_object* p = json_object_new_object();
        json_object_object_add(p, "step", json_object_new_int(i));
        json_add_string(p, "name", wf.steps[(size_t)i].name);
        json_add_string(p, "output", rt.output);
        json_object_array_add(prev, p);
    }
    json_object_object_add(o, "previous_outputs", prev);
    return json_mini::to_string_put(o);
}

std::optional<Workflow> load_latest_workflow(ISnapshotStore& store, const std::string& workflow_id) {
    auto snap = store.get_latest(workflow_id);
    if (!snap) return std::nullopt;
    Workflow wf;
    std::string err;
    if (!workflow_from_snapshot(*snap, &wf, &err)) {
        throw StorageError("cannot decode snapshot " + workflow_id + " v" + std::to_string(snap->version) + ": " + err);
    }
    return wf;
}

static std::string iteration_json(const Iteration& it) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "iteration", json_object_new_int(it.index));
    json_object_object_add(o, "prompt_messages", json_object_new_int((int)it.prompt_messages));
    json_object_object_add(o, "retries", json_object_new_int(it.retries));
    const char* reply = it.reply == ReplyKind::FINAL ? "final" : it.reply == ReplyKind::THOUGHT ? "thought" : "tool_call";
    json_object_object_add(o, "reply", json_object_new_string(reply));
    if (!it.text.empty()) json_add_string(o, "text", it.text);
    if (!it.tool.empty()) {
        json_add_string(o, "tool", it.tool);
        json_object_object_add(o, "args", json_from_text_or_string(it.tool_args_json));
        json_object_object_add(o, "observation", json_from_text_or_string(it.observation));
    }
    return json_mini::to_string_put(o);
}

static std::string status_payload(const Workflow& wf) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "status", json_object_new_string(workflow_status_to_str(wf.status)));
    json_object_object_add(o, "version", json_object_new_int64(wf.version));
    if (wf.failure) json_object_object_add(o, "failure", error_record_to_json(*wf.failure));
    if (!wf.suspend_reason.empty()) json_add_string(o, "reason", wf.suspend_reason);
    return json_mini::to_string_put(o);
}

SagaExecutor::SagaExecutor(ISnapshotStore& store, const ReasoningLoop& loop, TrajectoryLog* trajectory)
    : store_(store), loop_(loop), trajectory_(trajectory) {}

void SagaExecutor::trace(const Workflow& wf, int step, const std::string& event, const std::string& payload_json) {
    if (!trajectory_) return;
    std::string err = trajectory_->event(wf.workflow_id, step, event, payload_json);
    if (!err.empty()) std::cerr << "[saga] [WARN] trajectory " << wf.workflow_id << ": " << err << "\n";
}

template <typename Fn>
void SagaExecutor::commit_transition(Workflow& wf, Fn&& mutate) {
    WorkflowTx tx(wf);
    Workflow& s = tx.staged();
    mutate(s);
    s.version = wf.version + 1;
    s.updated_at_ms = now_ms();
    try {
        store_.put(snapshot_of(s));
    } catch (const StorageError& e) {
        const std::string patch = tx.patch_json();
        tx.rollback();
        json_object* p = json_object_new_object();
        json_add_string(p, "error", e.what());
        json_object_object_add(p, "version", json_object_new_int64(wf.version + 1));
        json_object_object_add(p, "patch", json_from_text_or_string(patch));
        trace(wf, wf.in_progress_index(), "persist_failed", json_mini::to_string_put(p));
        std::cerr << "[saga] persist failed for " << wf.workflow_id << " v" << (wf.version + 1)
                  << ": " << e.what() << "\n";
        throw;
    }
    tx.commit(wf);
    if (boundary_hook_) boundary_hook_(wf);
}

void SagaExecutor::persist_initial(Workflow& wf) {
    if (wf.version != 0) throw StorageError("workflow " + wf.workflow_id + " is already persisted");
    commit_transition(wf, [](Workflow&) {});
}

StepOutcome SagaExecutor::start(Workflow& wf) {
    commit_transition(wf, [](Workflow& s) { s.status = WorkflowStatus::RUNNING; });
    json_object* p = json_object_new_object();
    json_object_object_add(p, "steps", json_object_new_int((int)wf.steps.size()));
    json_object_object_add(p, "max_thinking_steps", json_object_new_int(wf.max_thinking_steps));
    trace(wf, -1, "workflow_start", json_mini::to_string_put(p));
    return StepOutcome::STARTED;
}

namespace {

struct ActionDispatch {
    const ReasoningLoop& loop;
    const std::string& context;
    int default_steps;
    const IterationObserver& observer;

    ReasoningResult operator()(const NoopAction&) const {
        ReasoningResult r;
        r.terminated_by = TerminatedBy::FINAL_ANSWER;
        return r;
    }
    ReasoningResult operator()(const ReasoningAction& a) const {
        return loop.run(a, context, a.max_thinking_steps > 0 ? a.max_thinking_steps : default_steps, observer);
    }
    ReasoningResult operator()(const ToolAction& a) const {
        return loop.run_tool(a, observer);
    }
};

} // namespace

ReasoningResult SagaExecutor::execute(const Workflow& wf, int idx, const ActionRef& action,
                                      const std::string& context_json) {
    IterationObserver obs = [this, &wf, idx](const Iteration& it) {
        trace(wf, idx, "iteration", iteration_json(it));
    };
    return std::visit(ActionDispatch{loop_, context_json, wf.max_thinking_steps, obs}, action.kind);
}

StepOutcome SagaExecutor::forward_step(Workflow& wf, int idx) {
    const StepDescriptor& sd = wf.steps[(size_t)idx];

    // Checkpoint before any side effect of the action.
    commit_transition(wf, [idx](Workflow& s) {
        auto& rt = s.runtime[(size_t)idx];
        rt.status = StepStatus::IN_PROGRESS;
        rt.started_ms = now_ms();
    });
    {
        json_object* p = json_object_new_object();
        json_add_string(p, "name", sd.name);
        json_add_string(p, "action", sd.forward.name);
        json_object_object_add(p, "kind", json_object_new_string(action_kind_name(sd.forward.kind)));
        trace(wf, idx, "step_begin", json_mini::to_string_put(p));
    }

    ReasoningResult res = execute(wf, idx, sd.forward, step_context_json(wf, idx, false));

    std::optional<ErrorRecord> failure = res.error;
    if (res.ok() && res.truncated && !sd.accept_truncated) {
        failure = ErrorRecord{ErrorKind::UNRECOVERABLE, "step limit reached without a final answer", idx};
    }
    if (failure) failure->step = idx;

    if (!failure) {
        commit_transition(wf, [&](Workflow& s) {
            auto& rt = s.runtime[(size_t)idx];
            rt.status = StepStatus::SUCCEEDED;
            rt.output = res.output;
            rt.truncated = res.truncated;
            rt.attempt_count += res.retries;
            rt.finished_ms = now_ms();
        });
    } else {
        commit_transition(wf, [&](Workflow& s) {
            auto& rt = s.runtime[(size_t)idx];
            rt.status = StepStatus::FAILED;
            rt.output = res.output;
            rt.error = failure;
            rt.attempt_count += res.retries;
            rt.finished_ms = now_ms();
            s.failure = failure;
            s.failed_step = idx;
            s.status = WorkflowStatus::COMPENSATING;
            s.compensation_cursor = idx - 1;
        });
    }

    json_object* p = json_object_new_object();
    json_object_object_add(p, "status", json_object_new_string(step_status_to_str(wf.runtime[(size_t)idx].status)));
    json_object_object_add(p, "terminated_by", json_object_new_string(terminated_by_to_str(res.terminated_by)));
    json_object_object_add(p, "iterations", json_object_new_int((int)res.iterations.size()));
    json_object_object_add(p, "truncated", json_object_new_boolean(res.truncated ? 1 : 0));
    if (failure) json_object_object_add(p, "error", error_record_to_json(*failure));
    trace(wf, idx, "step_end", json_mini::to_string_put(p));

    if (failure) {
        std::cerr << "[saga] " << wf.workflow_id << " step " << idx << " (" << sd.name << ") failed: "
                  << failure->message << "\n";
        return StepOutcome::STEP_FAILED;
    }
    return StepOutcome::STEP_SUCCEEDED;
}

StepOutcome SagaExecutor::compensate_next(Workflow& wf) {
    // Succeeded steps without a compensation action are passed over.
    int j = wf.compensation_cursor;
    while (j >= 0) {
        const auto& rt = wf.runtime[(size_t)j];
        if (rt.status == StepStatus::SUCCEEDED && wf.steps[(size_t)j].compensation) break;
        j--;
    }

    if (j < 0) {
        commit_transition(wf, [](Workflow& s) {
            s.status = WorkflowStatus::COMPENSATED;
            s.compensation_cursor = -1;
        });
        trace(wf, -1, "workflow_end", status_payload(wf));
        return StepOutcome::FINISHED;
    }

    const StepDescriptor& sd = wf.steps[(size_t)j];
    {
        json_object* p = json_object_new_object();
        json_add_string(p, "name", sd.name);
        json_add_string(p, "action", sd.compensation->name);
        trace(wf, j, "compensation_begin", json_mini::to_string_put(p));
    }

    ReasoningResult res = execute(wf, j, *sd.compensation, step_context_json(wf, j, true));

    StepOutcome outcome;
    if (res.ok()) {
        commit_transition(wf, [&](Workflow& s) {
            auto& rt = s.runtime[(size_t)j];
            rt.status = StepStatus::COMPENSATED;
            rt.compensation_output = res.output;
            rt.attempt_count += res.retries;
            s.compensation_cursor = j - 1;
        });
        outcome = StepOutcome::STEP_COMPENSATED;
    } else {
        ErrorRecord step_err = *res.error;
        step_err.step = j;
        ErrorRecord wf_err{ErrorKind::COMPENSATION_FAILED,
                           "compensation of step " + std::to_string(j) + " '" + sd.name + "' failed: " + step_err.message,
                           j};
        commit_transition(wf, [&](Workflow& s) {
            auto& rt = s.runtime[(size_t)j];
            rt.status = StepStatus::COMPENSATION_FAILED;
            rt.error = step_err;
            rt.attempt_count += res.retries;
            s.failure = wf_err;
            s.status = WorkflowStatus::FAILED;
            s.compensation_cursor = -1;
        });
        std::cerr << "[saga] " << wf.workflow_id << ": " << wf_err.message << "\n";
        outcome = StepOutcome::COMPENSATION_FAILED;
    }

    json_object* p = json_object_new_object();
    json_object_object_add(p, "status", json_object_new_string(step_status_to_str(wf.runtime[(size_t)j].status)));
    if (res.error) json_object_object_add(p, "error", error_record_to_json(*res.error));
    trace(wf, j, "compensation_end", json_mini::to_string_put(p));
    if (outcome == StepOutcome::COMPENSATION_FAILED) trace(wf, -1, "workflow_end", status_payload(wf));
    return outcome;
}

void SagaExecutor::mark_interrupted(Workflow& wf, int idx) {
    ErrorRecord err{ErrorKind::INTERRUPTED, "step was in progress when execution stopped; outcome unknown", idx};
    commit_transition(wf, [&](Workflow& s) {
        auto& rt = s.runtime[(size_t)idx];
        rt.status = StepStatus::FAILED;
        rt.error = err;
        rt.finished_ms = now_ms();
        s.failure = err;
        s.failed_step = idx;
        s.status = WorkflowStatus::COMPENSATING;
        s.compensation_cursor = idx - 1;
        s.suspend_reason.clear();
    });
    json_object* p = json_object_new_object();
    json_add_string(p, "name", wf.steps[(size_t)idx].name);
    trace(wf, idx, "recovered_in_progress", json_mini::to_string_put(p));
    std::cerr << "[saga] " << wf.workflow_id << " step " << idx << " was InProgress; compensating\n";
}

StepOutcome SagaExecutor::advance(Workflow& wf, SuspendSignal* signal) {
    if (wf.steps.empty() || wf.runtime.size() != wf.steps.size()) {
        throw ConfigurationError("workflow " + wf.workflow_id + " has no steps or mismatched runtime state");
    }

    switch (wf.status) {
        case WorkflowStatus::COMPLETED:
        case WorkflowStatus::COMPENSATED:
        case WorkflowStatus::FAILED:
            return StepOutcome::TERMINAL;

        case WorkflowStatus::SUSPENDED:
            return StepOutcome::SUSPENDED;

        case WorkflowStatus::PENDING:
            return start(wf);

        case WorkflowStatus::COMPENSATING:
            return compensate_next(wf);

        case WorkflowStatus::RUNNING:
            break;
    }

    if (int ip = wf.in_progress_index(); ip >= 0) {
        mark_interrupted(wf, ip);
        return StepOutcome::STEP_FAILED;
    }

    if (signal && signal->requested()) {
        const std::string reason = signal->reason();
        commit_transition(wf, [&](Workflow& s) {
            s.status = WorkflowStatus::SUSPENDED;
            s.suspend_reason = reason;
        });
        trace(wf, -1, "suspended", status_payload(wf));
        return StepOutcome::SUSPENDED;
    }

    for (size_t i = 0; i < wf.runtime.size(); i++) {
        if (wf.runtime[i].status == StepStatus::NOT_STARTED) return forward_step(wf, (int)i);
    }

    commit_transition(wf, [](Workflow& s) { s.status = WorkflowStatus::COMPLETED; });
    trace(wf, -1, "workflow_end", status_payload(wf));
    return StepOutcome::FINISHED;
}

WorkflowStatus SagaExecutor::run_to_completion(Workflow& wf, SuspendSignal* signal) {
    while (true) {
        StepOutcome o = advance(wf, signal);
        if (o == StepOutcome::TERMINAL || o == StepOutcome::FINISHED || o == StepOutcome::SUSPENDED) break;
    }
    return wf.status;
}

void SagaExecutor::suspend(Workflow& wf, const std::string& reason) {
    if (is_terminal(wf.status)) {
        throw OperationRejectedError("workflow " + wf.workflow_id + " is " + workflow_status_to_str(wf.status));
    }
    if (wf.status == WorkflowStatus::SUSPENDED) return;
    if (wf.status == WorkflowStatus::COMPENSATING) {
        throw OperationRejectedError("workflow " + wf.workflow_id + " is compensating and cannot be suspended");
    }
    if (wf.in_progress_index() >= 0) {
        throw OperationRejectedError("workflow " + wf.workflow_id + " has a step in progress; resume it to recover");
    }
    if (wf.status == WorkflowStatus::PENDING) start(wf);

    commit_transition(wf, [&](Workflow& s) {
        s.status = WorkflowStatus::SUSPENDED;
        s.suspend_reason = reason;
    });
    trace(wf, -1, "suspended", status_payload(wf));
}

void SagaExecutor::prepare_resume(Workflow& wf) {
    if (wf.status == WorkflowStatus::SUSPENDED) {
        commit_transition(wf, [](Workflow& s) {
            s.status = WorkflowStatus::RUNNING;
            s.suspend_reason.clear();
        });
        trace(wf, -1, "resumed", status_payload(wf));
    }
    if (wf.status == WorkflowStatus::RUNNING) {
        if (int ip = wf.in_progress_index(); ip >= 0) mark_interrupted(wf, ip);
    }
}

} // namespace agency
