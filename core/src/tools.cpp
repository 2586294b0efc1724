#include "agency/tools.h"
#include "agency/json_mini.h"
#include "agency/serialization.h"
#include "agency/util.h"

#include <json-c/json.h>

#include <algorithm>

namespace agency {

void ToolRunner::registerTool(const std::string& name, ToolFn fn) {
    fns_[name] = std::move(fn);
}

ToolResult ToolRunner::run(const std::string& name, const std::string& args_json) const {
    auto it = fns_.find(name);
    if (it == fns_.end()) {
        // A missing tool never becomes available by retrying.
        return {CallStatus::PERMANENT_ERROR, "{}", "MISSING_TOOL: " + name};
    }
    return it->second(args_json);
}

std::vector<std::string> ToolRunner::names() const {
    std::vector<std::string> out;
    out.reserve(fns_.size());
    for (const auto& kv : fns_) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

void ToolRunner::registerCommandTool(const std::string& name, const std::string& cmd, const ProcLimits& lim) {
    std::vector<std::string> argv = split_argv_quoted(cmd);
    registerTool(name, [name, cmd, argv, lim](const std::string& args_json) -> ToolResult {
        if (argv.empty()) {
            return {CallStatus::PERMANENT_ERROR, "{}", "tool '" + name + "' has unparseable command: " + cmd};
        }
        ProcResult pr;
        bool started = proc_run_capture(argv, "", args_json.empty() ? "{}" : args_json, lim, &pr);
        if (!started) {
            return {CallStatus::TRANSIENT_ERROR, "{}", "tool '" + name + "' launch failed: " + pr.error};
        }
        if (pr.timed_out) {
            return {CallStatus::TRANSIENT_ERROR, "{}", "tool '" + name + "' timed out"};
        }
        if (pr.exit_code == kExecFailedExit) {
            return {CallStatus::TRANSIENT_ERROR, "{}", "tool '" + name + "' exec failed: " + trim_ws(pr.err)};
        }
        if (pr.exit_code != 0) {
            return {CallStatus::PERMANENT_ERROR, "{}",
                    "tool '" + name + "' exit " + std::to_string(pr.exit_code) + ": " + trim_ws(pr.err)};
        }

        std::string out = trim_ws(pr.out);
        if (json_mini::is_object_text(out)) return {CallStatus::OK, out, ""};

        json_object* wrap = json_object_new_object();
        json_add_string(wrap, "output", out);
        if (pr.output_truncated) json_object_object_add(wrap, "truncated", json_object_new_boolean(1));
        return {CallStatus::OK, json_mini::to_string_put(wrap), ""};
    });
}

} // namespace agency
