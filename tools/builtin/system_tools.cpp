#include "builtin_tools.h"

#include "agency/json_mini.h"
#include "agency/serialization.h"
#include "agency/tools.h"
#include "agency/types.h"

#include <json-c/json.h>

#include <fstream>
#include <string>
#include <thread>

#include <sys/utsname.h>
#include <unistd.h>

namespace agency {

static long long parse_first_integer(const std::string& s) {
    long long v = 0;
    bool saw = false;
    for (char c : s) {
        if (c >= '0' && c <= '9') {
            saw = true;
            v = v * 10 + (c - '0');
        } else if (saw) {
            break;
        }
    }
    return saw ? v : 0;
}

ToolResult tool_system_info(const std::string& /*args_json*/) {
    long long rss_kb = 0;
    long long threads = 0;
    {
        std::ifstream f("/proc/self/status");
        std::string line;
        while (std::getline(f, line)) {
            if (line.starts_with("VmRSS:")) rss_kb = parse_first_integer(line);
            else if (line.starts_with("Threads:")) threads = parse_first_integer(line);
        }
    }

    json_object* o = json_object_new_object();
    json_add_string(o, "version", kAgencyVersion);
    json_object_object_add(o, "pid", json_object_new_int((int)getpid()));
    json_object_object_add(o, "rss_kb", json_object_new_int64(rss_kb));
    json_object_object_add(o, "threads", json_object_new_int64(threads));
    json_object_object_add(o, "cpus", json_object_new_int((int)std::thread::hardware_concurrency()));

    struct utsname u{};
    if (uname(&u) == 0) {
        json_add_string(o, "sysname", u.sysname);
        json_add_string(o, "release", u.release);
        json_add_string(o, "machine", u.machine);
    }
    char host[256] = {0};
    if (gethostname(host, sizeof(host) - 1) == 0) json_add_string(o, "hostname", host);

    return {CallStatus::OK, json_mini::to_string_put(o), ""};
}

ToolResult tool_datetime(const std::string& args_json) {
    int64_t offset = json_mini::get_int(args_json, "offset_ms").value_or(0);
    const int64_t ms = now_ms() + offset;

    json_object* o = json_object_new_object();
    json_add_string(o, "utc", iso_utc(ms));
    json_object_object_add(o, "epoch_ms", json_object_new_int64(ms));
    return {CallStatus::OK, json_mini::to_string_put(o), ""};
}

void register_builtin_tools(ToolRunner& runner, IMemory* memory) {
    runner.registerTool("system_info", tool_system_info);
    runner.registerTool("datetime", tool_datetime);
    if (memory) {
        runner.registerTool("memory_store", [memory](const std::string& a) { return tool_memory_store(*memory, a); });
        runner.registerTool("memory_search", [memory](const std::string& a) { return tool_memory_search(*memory, a); });
    }
}

} // namespace agency
