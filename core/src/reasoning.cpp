#include "agency/reasoning.h"
#include "agency/memory.h"
#include "agency/tools.h"
#include "agency/util.h"

#include <iostream>

namespace agency {

std::string reasoning_system_prompt(bool tools_enabled) {
    std::string s =
        "You execute one step of a multi-step workflow. Reply with exactly one JSON object per turn: "
        "{\"type\":\"final\",\"content\":...} when the step is done, or "
        "{\"type\":\"thought\",\"content\":...} to keep thinking.";
    if (tools_enabled) s += " To use a tool reply {\"type\":\"tool_call\",\"tool\":...,\"args\":{...}}.";
    return s;
}

ReasoningLoop::ReasoningLoop(IModelProvider& model, ToolRunner* tools, IMemory* memory, LoopOptions opts)
    : model_(model), tools_(tools), memory_(memory), opts_(std::move(opts)) {
    if (opts_.retry.max_retries < 0) opts_.retry.max_retries = 0;
    if (opts_.max_history < 2) opts_.max_history = 2;
}

void ReasoningLoop::backoff(int attempt) const {
    int64_t d = backoff_delay_ms(attempt, opts_.retry.base_ms, opts_.retry.mult, opts_.retry.max_ms, 0);
    if (opts_.sleep_fn) opts_.sleep_fn(d);
    else sleep_ms(d);
}

static ErrorRecord unrecoverable(const std::string& msg) {
    return ErrorRecord{ErrorKind::UNRECOVERABLE, msg, -1};
}

ReasoningResult ReasoningLoop::run(const ReasoningAction& action,
                                   const std::string& context_json,
                                   int max_thinking_steps,
                                   const IterationObserver& observer) const {
    ReasoningResult res;
    const int limit = max_thinking_steps < 1 ? 1 : max_thinking_steps;
    const bool tools_on = opts_.use_tools && tools_ != nullptr;
    const bool memory_on = opts_.use_memory && memory_ != nullptr;

    // Pinned messages survive history trimming.
    std::vector<ChatMessage> pinned;
    std::string task = action.instruction;
    if (!context_json.empty() && context_json != "{}") task += "\n\nContext:\n" + context_json;
    if (!action.context_json.empty() && action.context_json != "{}") task += "\n\nParameters:\n" + action.context_json;
    pinned.push_back({"user", task});

    if (memory_on) {
        auto hits = memory_->fetch_context(action.instruction, opts_.memory_fetch);
        if (!hits.empty()) {
            std::string mem = "Relevant memory:";
            for (const auto& h : hits) mem += "\n- " + h.text;
            pinned.push_back({"user", mem});
        }
    }

    std::vector<ChatMessage> history;
    std::string partial;

    auto finish_error = [&](const std::string& msg) {
        res.terminated_by = TerminatedBy::UNRECOVERABLE_ERROR;
        res.error = unrecoverable(msg);
        res.output = partial;
        return res;
    };

    for (int iter = 0; iter < limit; iter++) {
        ModelRequest req;
        req.system = reasoning_system_prompt(tools_on);
        req.messages = pinned;
        size_t from = history.size() > (size_t)opts_.max_history ? history.size() - (size_t)opts_.max_history : 0;
        req.messages.insert(req.messages.end(), history.begin() + (long)from, history.end());
        if (tools_on) req.tools = tools_->names();
        req.iteration = iter;

        Iteration it;
        it.index = iter;
        it.prompt_messages = req.messages.size();

        // (suspension point) model invocation, retried on transient errors
        ModelResponse resp;
        while (true) {
            resp = model_.complete(req);
            if (resp.status != CallStatus::TRANSIENT_ERROR) break;
            it.retries++;
            res.retries++;
            if (it.retries > opts_.retry.max_retries) {
                res.iterations.push_back(it);
                if (observer) observer(it);
                return finish_error("transient provider error budget exhausted: " + resp.error);
            }
            backoff(it.retries);
        }
        if (resp.status == CallStatus::PERMANENT_ERROR) {
            res.iterations.push_back(it);
            if (observer) observer(it);
            return finish_error("model error: " + resp.error);
        }

        it.reply = resp.kind;
        if (resp.kind == ReplyKind::FINAL) {
            it.text = resp.text;
            res.iterations.push_back(it);
            if (observer) observer(it);
            res.terminated_by = TerminatedBy::FINAL_ANSWER;
            res.output = resp.text;
            if (memory_on) {
                std::string err = memory_->store_observation(opts_.memory_stream, resp.text);
                if (!err.empty()) std::cerr << "[reasoning] [WARN] memory store failed: " << err << "\n";
            }
            return res;
        }

        if (resp.kind == ReplyKind::THOUGHT) {
            it.text = resp.text;
            partial = resp.text;
            history.push_back({"assistant", resp.text});
            res.iterations.push_back(it);
            if (observer) observer(it);
            continue;
        }

        // TOOL_CALL
        it.tool = resp.tool;
        it.tool_args_json = resp.tool_args_json;
        history.push_back({"assistant", "tool_call " + resp.tool + " " + resp.tool_args_json});

        if (!tools_on) {
            it.observation = "{\"error\":\"tool use is disabled\"}";
        } else {
            // (suspension point) tool invocation
            ToolResult tr;
            int tool_retries = 0;
            while (true) {
                tr = tools_->run(resp.tool, resp.tool_args_json);
                if (tr.status != CallStatus::TRANSIENT_ERROR) break;
                tool_retries++;
                it.retries++;
                res.retries++;
                if (tool_retries > opts_.retry.max_retries) {
                    res.iterations.push_back(it);
                    if (observer) observer(it);
                    return finish_error("transient tool error budget exhausted: " + tr.error);
                }
                backoff(tool_retries);
            }
            if (tr.status == CallStatus::PERMANENT_ERROR) {
                res.iterations.push_back(it);
                if (observer) observer(it);
                return finish_error("tool '" + resp.tool + "' failed: " + tr.error);
            }
            it.observation = tr.output_json;
        }
        history.push_back({"tool", it.observation});
        res.iterations.push_back(it);
        if (observer) observer(it);
    }

    res.terminated_by = TerminatedBy::STEP_LIMIT_REACHED;
    res.output = partial;
    res.truncated = true;
    return res;
}

ReasoningResult ReasoningLoop::run_tool(const ToolAction& action, const IterationObserver& observer) const {
    ReasoningResult res;
    Iteration it;
    it.reply = ReplyKind::TOOL_CALL;
    it.tool = action.tool;
    it.tool_args_json = action.args_json;

    auto fail = [&](const std::string& msg) {
        res.iterations.push_back(it);
        if (observer) observer(it);
        res.terminated_by = TerminatedBy::UNRECOVERABLE_ERROR;
        res.error = unrecoverable(msg);
        return res;
    };

    if (!tools_) return fail("no tool runner configured");
    if (!opts_.use_tools) return fail("tool use is disabled: " + action.tool);

    ToolResult tr;
    while (true) {
        tr = tools_->run(action.tool, action.args_json);
        if (tr.status != CallStatus::TRANSIENT_ERROR) break;
        it.retries++;
        res.retries++;
        if (it.retries > opts_.retry.max_retries) {
            return fail("transient tool error budget exhausted: " + tr.error);
        }
        backoff(it.retries);
    }
    if (tr.status == CallStatus::PERMANENT_ERROR) return fail("tool '" + action.tool + "' failed: " + tr.error);

    it.observation = tr.output_json;
    res.iterations.push_back(it);
    if (observer) observer(it);
    res.terminated_by = TerminatedBy::FINAL_ANSWER;
    res.output = tr.output_json;
    return res;
}

} // namespace agency
