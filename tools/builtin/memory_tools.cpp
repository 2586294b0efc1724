#include "builtin_tools.h"

#include "agency/json_mini.h"
#include "agency/memory.h"
#include "agency/serialization.h"
#include "agency/tools.h"

#include <json-c/json.h>

namespace agency {

ToolResult tool_memory_store(IMemory& memory, const std::string& args_json) {
    auto stream = json_mini::get_string(args_json, "stream").value_or("notes");
    auto text = json_mini::get_string(args_json, "text").value_or("");
    if (text.empty()) return {CallStatus::PERMANENT_ERROR, "{}", "memory_store: missing text"};

    std::string err = memory.store_observation(stream, text);
    // An unwritable memory directory may recover (disk full, permissions fixed).
    if (!err.empty()) return {CallStatus::TRANSIENT_ERROR, "{}", "memory_store: " + err};
    return {CallStatus::OK, "{\"ok\":true}", ""};
}

ToolResult tool_memory_search(IMemory& memory, const std::string& args_json) {
    auto query = json_mini::get_string(args_json, "query").value_or("");
    int64_t limit = json_mini::get_int(args_json, "limit").value_or(5);
    if (limit < 1) limit = 1;
    if (limit > 50) limit = 50;

    auto hits = memory.fetch_context(query, (size_t)limit);
    json_object* o = json_object_new_object();
    json_object* arr = json_object_new_array();
    for (const auto& h : hits) {
        json_object* m = json_object_new_object();
        json_add_string(m, "stream", h.stream);
        json_add_string(m, "text", h.text);
        json_object_object_add(m, "ts_ms", json_object_new_int64(h.ts_ms));
        json_object_array_add(arr, m);
    }
    json_object_object_add(o, "matches", arr);
    json_object_object_add(o, "count", json_object_new_int((int)hits.size()));
    return {CallStatus::OK, json_mini::to_string_put(o), ""};
}

} // namespace agency
