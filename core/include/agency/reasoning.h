#pragma once
#include "action.h"
#include "errors.h"
#include "provider.h"
#include "types.h"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace agency {

class IMemory;
class ToolRunner;

// Transient-error budget per iteration.
struct RetryPolicy {
    int max_retries{3};
    int64_t base_ms{100};
    int64_t mult{2};
    int64_t max_ms{5000};
};

struct LoopOptions {
    RetryPolicy retry;
    int max_history{20};          // messages kept besides the pinned task messages
    bool use_tools{true};
    bool use_memory{true};
    size_t memory_fetch{3};
    std::string memory_stream{"observations"};
    // Replaced in tests to avoid real backoff sleeps.
    std::function<void(int64_t)> sleep_fn;
};

// One think/act/observe cycle.
struct Iteration {
    int index{0};
    size_t prompt_messages{0};    // messages sent to the model
    int retries{0};               // transient errors absorbed in this iteration
    ReplyKind reply{ReplyKind::FINAL};
    std::string text;             // final answer or thought
    std::string tool;             // set for tool calls
    std::string tool_args_json;
    std::string observation;      // tool output fed back to the model
};

using IterationObserver = std::function<void(const Iteration&)>;

struct ReasoningResult {
    TerminatedBy terminated_by{TerminatedBy::FINAL_ANSWER};
    std::string output;
    bool truncated{false};
    std::optional<ErrorRecord> error;  // set iff terminated_by == UNRECOVERABLE_ERROR
    std::vector<Iteration> iterations;
    int retries{0};                    // transient errors absorbed in total

    bool ok() const { return terminated_by != TerminatedBy::UNRECOVERABLE_ERROR; }
};

// Bounded reasoning loop for one action.
//
// The two external calls (model completion and tool invocation) are the only
// suspension points; both block the calling thread only. The loop never
// touches workflow state, it only returns a result.
//
// Thread-safe if the model, tools and memory collaborators are.
class ReasoningLoop {
public:
    ReasoningLoop(IModelProvider& model, ToolRunner* tools, IMemory* memory, LoopOptions opts);

    // At most max_thinking_steps model iterations. Reaching the limit without
    // a final answer returns the last thought as a truncated StepLimitReached
    // result, not an error.
    ReasoningResult run(const ReasoningAction& action,
                        const std::string& context_json,
                        int max_thinking_steps,
                        const IterationObserver& observer = {}) const;

    // Invokes one tool directly under the same retry policy.
    ReasoningResult run_tool(const ToolAction& action, const IterationObserver& observer = {}) const;

    const LoopOptions& options() const { return opts_; }

private:
    IModelProvider& model_;
    ToolRunner* tools_;
    IMemory* memory_;
    LoopOptions opts_;

    void backoff(int attempt) const;
};

// Prompt preamble sent as ModelRequest::system.
std::string reasoning_system_prompt(bool tools_enabled);

} // namespace agency
