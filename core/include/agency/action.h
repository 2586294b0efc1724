#pragma once
#include <optional>
#include <string>
#include <variant>

namespace agency {

// Does nothing and succeeds with empty output.
struct NoopAction {};

// Runs the reasoning loop over an instruction.
struct ReasoningAction {
    std::string instruction;
    std::string context_json{"{}"};  // extra caller context, passed through to the prompt
    int max_thinking_steps{0};       // 0 = workflow default
};

// Invokes one named tool directly, without the model.
struct ToolAction {
    std::string tool;
    std::string args_json{"{}"};
};

// Closed set of action kinds; executors handle it with std::visit.
using ActionKind = std::variant<NoopAction, ReasoningAction, ToolAction>;

struct ActionRef {
    std::string name;
    ActionKind kind{NoopAction{}};
};

const char* action_kind_name(const ActionKind& k);

// Immutable definition of one saga step.
struct StepDescriptor {
    std::string name;
    ActionRef forward;
    std::optional<ActionRef> compensation;
    bool accept_truncated{true};  // StepLimitReached counts as success
};

// One-step descriptor list for a single-message task.
StepDescriptor make_message_step(const std::string& message, int max_thinking_steps);

} // namespace agency
