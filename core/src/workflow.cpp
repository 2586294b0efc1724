#include "agency/workflow.h"

namespace agency {

const char* action_kind_name(const ActionKind& k) {
    struct Namer {
        const char* operator()(const NoopAction&) const { return "noop"; }
        const char* operator()(const ReasoningAction&) const { return "reasoning"; }
        const char* operator()(const ToolAction&) const { return "tool"; }
    };
    return std::visit(Namer{}, k);
}

StepDescriptor make_message_step(const std::string& message, int max_thinking_steps) {
    ReasoningAction ra;
    ra.instruction = message;
    ra.max_thinking_steps = max_thinking_steps;

    StepDescriptor sd;
    sd.name = "respond";
    sd.forward.name = "respond";
    sd.forward.kind = ra;
    return sd;
}

int Workflow::in_progress_index() const {
    for (size_t i = 0; i < runtime.size(); i++) {
        if (runtime[i].status == StepStatus::IN_PROGRESS) return (int)i;
    }
    return -1;
}

std::string Workflow::final_output() const {
    for (size_t i = runtime.size(); i > 0; i--) {
        if (runtime[i - 1].status == StepStatus::SUCCEEDED) return runtime[i - 1].output;
    }
    return "";
}

int Workflow::executed_steps() const {
    int n = 0;
    for (const auto& r : runtime) {
        if (r.status == StepStatus::SUCCEEDED || r.status == StepStatus::COMPENSATED ||
            r.status == StepStatus::COMPENSATION_FAILED) {
            n++;
        }
    }
    return n;
}

Workflow make_workflow(const std::string& workflow_id,
                       std::vector<StepDescriptor> steps,
                       int max_thinking_steps) {
    Workflow wf;
    wf.workflow_id = workflow_id;
    wf.steps = std::move(steps);
    wf.runtime.assign(wf.steps.size(), StepRuntime{});
    wf.status = WorkflowStatus::PENDING;
    wf.created_at_ms = now_ms();
    wf.updated_at_ms = wf.created_at_ms;
    wf.max_thinking_steps = max_thinking_steps;
    return wf;
}

} // namespace agency
