#include "test_common.h"

#include "../tools/builtin/builtin_tools.h"
#include "agency/json_mini.h"
#include "agency/memory.h"
#include "agency/proc.h"
#include "agency/tools.h"
#include "agency/types.h"

#include <unistd.h>

using namespace agency;

int main() {
    // Command splitting.
    {
        auto argv = split_argv_quoted("run 'two words' \"say \\\"hi\\\"\" plain");
        expect_eq_ll((long long)argv.size(), 4, "argv size");
        expect_true(argv[1] == "two words", "single quotes");
        expect_true(argv[2] == "say \"hi\"", "escaped double quotes");
        expect_true(split_argv_quoted("broken 'quote").empty(), "unbalanced quotes");
    }

    // Subprocess capture.
    {
        ProcLimits lim;
        lim.timeout_ms = 5000;
        ProcResult pr;
        expect_true(proc_run_capture({"/bin/cat"}, "", "{\"x\":1}", lim, &pr), "cat starts");
        expect_eq_ll(pr.exit_code, 0, "cat exit");
        expect_true(pr.out == "{\"x\":1}", "stdin echoed");

        ProcResult bad;
        expect_true(proc_run_capture({"/bin/sh", "-c", "echo oops >&2; exit 3"}, "", "", lim, &bad), "sh starts");
        expect_eq_ll(bad.exit_code, 3, "exit code kept");
        expect_true(bad.err.find("oops") != std::string::npos, "stderr captured separately");
        expect_true(bad.out.empty(), "stdout empty");

        lim.timeout_ms = 200;
        ProcResult slow;
        (void)proc_run_capture({"/bin/sleep", "5"}, "", "", lim, &slow);
        expect_true(slow.timed_out, "timeout detected");

        lim.timeout_ms = 5000;
        lim.stdout_max_bytes = 16;
        ProcResult big;
        expect_true(proc_run_capture({"/bin/sh", "-c", "head -c 4096 /dev/zero | tr '\\0' a"}, "", "", lim, &big),
                    "big output starts");
        expect_true(big.output_truncated, "output truncated");
        expect_true(big.out.size() <= 16, "stdout capped");
    }

    // Registry and command tools.
    {
        ToolRunner runner;
        ProcLimits lim;
        lim.timeout_ms = 5000;
        runner.registerCommandTool("echo_args", "/bin/cat", lim);
        runner.registerCommandTool("say", "/bin/echo hello there", lim);
        runner.registerCommandTool("fail", "/bin/sh -c 'exit 4'", lim);
        runner.registerCommandTool("ghost", "/nonexistent/agency-tool", lim);
        runner.registerCommandTool("garbled", "'unbalanced", lim);
        ProcLimits short_lim;
        short_lim.timeout_ms = 200;
        runner.registerCommandTool("sleepy", "/bin/sleep 5", short_lim);

        auto names = runner.names();
        expect_true(names.front() == "echo_args" && names.back() == "sleepy", "sorted names");
        expect_true(runner.has("say") && !runner.has("nope"), "has()");

        ToolResult r = runner.run("echo_args", "{\"city\":\"Oslo\"}");
        expect_true(r.status == CallStatus::OK, "cat tool ok");
        expect_true(json_mini::get_string(r.output_json, "city").value_or("") == "Oslo", "object output passed through");

        r = runner.run("say", "{}");
        expect_true(r.status == CallStatus::OK, "echo tool ok");
        expect_true(json_mini::get_string(r.output_json, "output").value_or("") == "hello there", "text output wrapped");

        r = runner.run("fail", "{}");
        expect_true(r.status == CallStatus::PERMANENT_ERROR, "non-zero exit is permanent");
        expect_true(r.error.find("exit 4") != std::string::npos, "exit code in error");

        r = runner.run("ghost", "{}");
        expect_true(r.status == CallStatus::TRANSIENT_ERROR, "exec failure is transient");

        r = runner.run("garbled", "{}");
        expect_true(r.status == CallStatus::PERMANENT_ERROR, "unparseable command is permanent");

        r = runner.run("sleepy", "{}");
        expect_true(r.status == CallStatus::TRANSIENT_ERROR, "timeout is transient");
        expect_true(r.error.find("timed out") != std::string::npos, "timeout message");

        r = runner.run("nope", "{}");
        expect_true(r.status == CallStatus::PERMANENT_ERROR, "missing tool is permanent");
        expect_true(r.error == "MISSING_TOOL: nope", "missing tool message");

        runner.registerTool("say", [](const std::string&) -> ToolResult { return {CallStatus::OK, "{\"v\":2}", ""}; });
        expect_eq_ll(json_mini::get_int(runner.run("say", "{}").output_json, "v").value_or(0), 2,
                     "re-registration replaces the tool");
    }

    // Built-in tools.
    {
        ToolResult r = tool_datetime("{}");
        expect_true(r.status == CallStatus::OK, "datetime ok");
        int64_t now = now_ms();
        int64_t got = json_mini::get_int(r.output_json, "epoch_ms").value_or(0);
        expect_true(got > now - 60000 && got <= now, "datetime is now");
        expect_true(json_mini::get_string(r.output_json, "utc").value_or("").ends_with("Z"), "iso utc");

        r = tool_datetime("{\"offset_ms\":3600000}");
        got = json_mini::get_int(r.output_json, "epoch_ms").value_or(0);
        expect_true(got >= now + 3600000 - 60000, "offset applied");

        r = tool_system_info("{}");
        expect_true(r.status == CallStatus::OK, "system_info ok");
        expect_eq_ll(json_mini::get_int(r.output_json, "pid").value_or(0), (long long)getpid(), "pid");
        expect_true(json_mini::get_string(r.output_json, "version").value_or("") == kAgencyVersion, "version");

        EphemeralMemory mem;
        r = tool_memory_store(mem, "{\"stream\":\"notes\",\"text\":\"flight AB123 booked\"}");
        expect_true(r.status == CallStatus::OK, "memory_store ok");
        r = tool_memory_store(mem, "{\"stream\":\"notes\"}");
        expect_true(r.status == CallStatus::PERMANENT_ERROR, "memory_store without text");
        r = tool_memory_search(mem, "{\"query\":\"flight booked\",\"limit\":3}");
        expect_eq_ll(json_mini::get_int(r.output_json, "count").value_or(-1), 1, "memory_search count");
        expect_true(r.output_json.find("AB123") != std::string::npos, "memory_search match");

        ToolRunner with_mem;
        register_builtin_tools(with_mem, &mem);
        expect_eq_ll((long long)with_mem.names().size(), 4, "four built-ins with memory");
        ToolRunner without_mem;
        register_builtin_tools(without_mem, nullptr);
        expect_true(without_mem.has("datetime") && !without_mem.has("memory_store"), "memory tools need memory");
    }

    std::cerr << "test_tools: ALL PASSED" << std::endl;
    return 0;
}
