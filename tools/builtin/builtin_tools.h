#pragma once

#include <string>

namespace agency {

class IMemory;
class ToolRunner;
struct ToolResult;

// system_info: process and host facts (pid, RSS, threads, cpu count).
ToolResult tool_system_info(const std::string& args_json);

// datetime: current UTC time, {"offset_ms":N} shifts it.
ToolResult tool_datetime(const std::string& args_json);

// memory_store {"stream","text"} and memory_search {"query","limit"}.
ToolResult tool_memory_store(IMemory& memory, const std::string& args_json);
ToolResult tool_memory_search(IMemory& memory, const std::string& args_json);

// Registers the built-ins. The memory tools are only registered when
// memory is non-null.
void register_builtin_tools(ToolRunner& runner, IMemory* memory);

} // namespace agency
