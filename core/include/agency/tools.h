#pragma once
#include "proc.h"
#include "types.h"

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace agency {

struct ToolResult {
    CallStatus status{CallStatus::OK};
    std::string output_json{"{}"};
    std::string error;
};

using ToolFn = std::function<ToolResult(const std::string& args_json)>;

// Registry of named tools. Registration happens at startup; run() may be
// called concurrently afterwards.
class ToolRunner {
public:
    void registerTool(const std::string& name, ToolFn fn);

    // Runs `cmd` as a subprocess with the args JSON on stdin. A timeout or
    // exec failure is transient, any other non-zero exit is permanent.
    // stdout must be a JSON object (or is wrapped as {"output":...}).
    void registerCommandTool(const std::string& name, const std::string& cmd, const ProcLimits& lim);

    ToolResult run(const std::string& name, const std::string& args_json) const;

    bool has(const std::string& name) const { return fns_.count(name) > 0; }

    // Sorted tool names.
    std::vector<std::string> names() const;

private:
    std::unordered_map<std::string, ToolFn> fns_;
};

} // namespace agency
