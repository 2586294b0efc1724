#include "test_common.h"
#include "test_fakes.h"

#include "agency/json_mini.h"
#include "agency/memory.h"
#include "agency/reasoning.h"
#include "agency/tools.h"

#include <vector>

using namespace agency;
using namespace agency_test;

static LoopOptions fast_options(std::vector<int64_t>* sleeps) {
    LoopOptions o;
    o.retry.max_retries = 2;
    o.retry.base_ms = 10;
    o.retry.mult = 2;
    o.retry.max_ms = 100;
    o.sleep_fn = [sleeps](int64_t d) {
        if (sleeps) sleeps->push_back(d);
    };
    return o;
}

static ReasoningAction task(const std::string& instruction) {
    ReasoningAction a;
    a.instruction = instruction;
    return a;
}

int main() {
    ToolRunner tools;
    int echo_calls = 0;
    tools.registerTool("echo", [&](const std::string& args) -> ToolResult {
        echo_calls++;
        return {CallStatus::OK, args, ""};
    });
    int flaky_left = 2;
    tools.registerTool("flaky", [&](const std::string&) -> ToolResult {
        if (flaky_left-- > 0) return {CallStatus::TRANSIENT_ERROR, "{}", "busy"};
        return {CallStatus::OK, "{\"ok\":true}", ""};
    });

    // A final answer on the first iteration ends the loop and is remembered.
    {
        ScriptedProvider model({final_reply("42")});
        EphemeralMemory mem;
        ReasoningLoop loop(model, &tools, &mem, fast_options(nullptr));
        int observed = 0;
        ReasoningResult r = loop.run(task("answer the question"), "{}", 5, [&](const Iteration&) { observed++; });
        expect_true(r.ok(), "final answer is ok");
        expect_true(r.terminated_by == TerminatedBy::FINAL_ANSWER, "terminated by final answer");
        expect_true(r.output == "42", "output");
        expect_true(!r.truncated, "not truncated");
        expect_eq_ll((long long)r.iterations.size(), 1, "one iteration");
        expect_eq_ll(observed, 1, "observer called once");
        expect_eq_ll((long long)mem.size(), 1, "final answer stored to memory");

        ModelRequest req = model.request(0);
        expect_true(req.messages[0].role == "user", "task is a user message");
        expect_true(req.messages[0].content == "answer the question", "empty context not appended");
        expect_true(req.tools.size() == 2, "tool names offered");
        expect_true(req.system.find("tool_call") != std::string::npos, "system prompt mentions tools");
    }

    // Thoughts until the limit: truncated partial result, not an error.
    {
        ScriptedProvider model({}, thought_reply("still thinking"));
        ReasoningLoop loop(model, &tools, nullptr, fast_options(nullptr));
        ReasoningResult r = loop.run(task("ponder"), "", 3);
        expect_true(r.ok(), "step limit is not an error");
        expect_true(r.terminated_by == TerminatedBy::STEP_LIMIT_REACHED, "step limit reached");
        expect_true(r.truncated, "truncated");
        expect_true(r.output == "still thinking", "partial answer is the last thought");
        expect_eq_ll((long long)model.calls(), 3, "exactly max_thinking_steps model calls");

        ScriptedProvider once({}, thought_reply("t"));
        ReasoningLoop loop1(once, &tools, nullptr, fast_options(nullptr));
        (void)loop1.run(task("x"), "", 0);
        expect_eq_ll((long long)once.calls(), 1, "limit below 1 is treated as 1");
    }

    // Context and parameters are pinned; history is trimmed to max_history.
    {
        ScriptedProvider model({}, thought_reply("hmm"));
        LoopOptions o = fast_options(nullptr);
        o.max_history = 2;
        ReasoningLoop loop(model, &tools, nullptr, o);
        ReasoningAction a = task("plan the trip");
        a.context_json = "{\"budget\":100}";
        (void)loop.run(a, "{\"workflow_id\":\"w\"}", 6);
        for (size_t i = 0; i < model.calls(); i++) {
            ModelRequest req = model.request(i);
            expect_true(req.messages.size() <= 3, "pinned task plus at most two history messages");
            expect_true(req.messages[0].content.find("plan the trip") == 0, "task pinned first");
            expect_true(req.messages[0].content.find("Context:") != std::string::npos, "workflow context");
            expect_true(req.messages[0].content.find("Parameters:") != std::string::npos, "action parameters");
            expect_eq_ll(req.iteration, (long long)i, "iteration index");
        }
    }

    // Relevant memory is pinned after the task.
    {
        ScriptedProvider model({final_reply("ok")});
        EphemeralMemory mem;
        expect_true(mem.store_observation("notes", "the oslo hotel is booked").empty(), "seed memory");
        ReasoningLoop loop(model, &tools, &mem, fast_options(nullptr));
        (void)loop.run(task("check the oslo hotel"), "", 2);
        ModelRequest req = model.request(0);
        expect_true(req.messages.size() == 2, "task plus memory");
        expect_true(req.messages[1].content.find("Relevant memory:") == 0, "memory header");
        expect_true(req.messages[1].content.find("oslo hotel is booked") != std::string::npos, "memory hit");

        LoopOptions off = fast_options(nullptr);
        off.use_memory = false;
        ScriptedProvider model2({final_reply("ok")});
        ReasoningLoop loop2(model2, &tools, &mem, off);
        (void)loop2.run(task("check the oslo hotel"), "", 2);
        expect_eq_ll((long long)model2.request(0).messages.size(), 1, "memory disabled: no memory message");
        expect_eq_ll((long long)mem.size(), 1, "memory disabled: answer not stored");
    }

    // Transient provider errors are retried with backoff.
    {
        std::vector<int64_t> sleeps;
        ScriptedProvider model({transient_reply("429"), transient_reply("503"), final_reply("fine")});
        ReasoningLoop loop(model, &tools, nullptr, fast_options(&sleeps));
        ReasoningResult r = loop.run(task("x"), "", 3);
        expect_true(r.ok() && r.output == "fine", "recovered after transient errors");
        expect_eq_ll(r.retries, 2, "retries counted");
        expect_eq_ll((long long)sleeps.size(), 2, "one backoff per retry");
        expect_true(sleeps[1] >= sleeps[0], "backoff does not shrink");
    }
    {
        ScriptedProvider model({}, transient_reply("down"));
        ReasoningLoop loop(model, &tools, nullptr, fast_options(nullptr));
        ReasoningResult r = loop.run(task("x"), "", 3);
        expect_true(!r.ok(), "budget exhausted is unrecoverable");
        expect_true(r.error && r.error->kind == ErrorKind::UNRECOVERABLE, "error kind");
        expect_true(r.error->message.find("budget exhausted") != std::string::npos, "error message");
        expect_eq_ll((long long)model.calls(), 3, "initial call plus max_retries");
    }

    // Permanent provider errors stop immediately and keep the partial answer.
    {
        ScriptedProvider model({thought_reply("half"), permanent_reply("bad request")});
        ReasoningLoop loop(model, &tools, nullptr, fast_options(nullptr));
        ReasoningResult r = loop.run(task("x"), "", 5);
        expect_true(r.terminated_by == TerminatedBy::UNRECOVERABLE_ERROR, "permanent error");
        expect_true(r.output == "half", "partial output kept");
        expect_eq_ll((long long)model.calls(), 2, "no retry after permanent error");
    }

    // Tool calls feed the observation back to the model.
    {
        ScriptedProvider model({tool_reply("echo", "{\"city\":\"Oslo\"}"), final_reply("booked")});
        ReasoningLoop loop(model, &tools, nullptr, fast_options(nullptr));
        const int before = echo_calls;
        ReasoningResult r = loop.run(task("book"), "", 4);
        expect_true(r.ok() && r.output == "booked", "final after tool call");
        expect_eq_ll(echo_calls - before, 1, "tool ran once");
        expect_true(r.iterations[0].tool == "echo", "iteration records tool");
        expect_true(json_mini::get_string(r.iterations[0].observation, "city").value_or("") == "Oslo", "observation");
        ModelRequest second = model.request(1);
        expect_true(second.messages.back().role == "tool", "observation sent as tool message");
    }
    {
        flaky_left = 2;
        ScriptedProvider model({tool_reply("flaky", "{}"), final_reply("ok")});
        ReasoningLoop loop(model, &tools, nullptr, fast_options(nullptr));
        ReasoningResult r = loop.run(task("x"), "", 4);
        expect_true(r.ok(), "transient tool errors retried");
        expect_eq_ll(r.retries, 2, "tool retries counted");
    }
    {
        ScriptedProvider model({tool_reply("nope", "{}")});
        ReasoningLoop loop(model, &tools, nullptr, fast_options(nullptr));
        ReasoningResult r = loop.run(task("x"), "", 4);
        expect_true(!r.ok(), "missing tool is unrecoverable");
        expect_true(r.error->message.find("MISSING_TOOL") != std::string::npos, "missing tool message");
    }
    {
        LoopOptions o = fast_options(nullptr);
        o.use_tools = false;
        ScriptedProvider model({tool_reply("echo", "{}"), final_reply("without tools")});
        ReasoningLoop loop(model, &tools, nullptr, o);
        const int before = echo_calls;
        ReasoningResult r = loop.run(task("x"), "", 4);
        expect_true(r.ok() && r.output == "without tools", "disabled tool call is observed, not fatal");
        expect_eq_ll(echo_calls - before, 0, "disabled tool never runs");
        expect_true(model.request(0).tools.empty(), "no tools offered");
        expect_true(r.iterations[0].observation.find("disabled") != std::string::npos, "disabled observation");
    }

    // Direct tool actions.
    {
        ScriptedProvider model;
        ReasoningLoop loop(model, &tools, nullptr, fast_options(nullptr));
        ReasoningResult r = loop.run_tool(ToolAction{"echo", "{\"n\":1}"});
        expect_true(r.ok(), "run_tool ok");
        expect_eq_ll(json_mini::get_int(r.output, "n").value_or(0), 1, "run_tool output");
        expect_eq_ll((long long)model.calls(), 0, "run_tool never calls the model");

        flaky_left = 5;
        r = loop.run_tool(ToolAction{"flaky", "{}"});
        expect_true(!r.ok(), "run_tool transient budget exhausted");
        expect_eq_ll(r.retries, 3, "run_tool retries until budget");

        LoopOptions o = fast_options(nullptr);
        o.use_tools = false;
        ReasoningLoop disabled(model, &tools, nullptr, o);
        r = disabled.run_tool(ToolAction{"echo", "{}"});
        expect_true(!r.ok() && r.error->message == "tool use is disabled: echo", "run_tool with tools disabled");

        ReasoningLoop no_runner(model, nullptr, nullptr, fast_options(nullptr));
        r = no_runner.run_tool(ToolAction{"echo", "{}"});
        expect_true(!r.ok() && r.error->message == "no tool runner configured", "run_tool without runner");
    }

    std::cerr << "test_reasoning_loop: ALL PASSED" << std::endl;
    return 0;
}
