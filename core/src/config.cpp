#include "agency/config.h"
#include "agency/errors.h"
#include "agency/json_mini.h"
#include "agency/util.h"

#include <json-c/json.h>

#include <cstdlib>
#include <limits>

namespace agency {

Profile detect_profile() {
    auto v = getenv_str("AGENCY_PROFILE");
    if (!v) return Profile::DEV;
    std::string val = lower_ascii(trim_ws(*v));
    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    constexpr int NO_OVERWRITE = 0;
    switch (p) {
        case Profile::DEV:
            setenv("AGENCY_SNAPSHOT_FSYNC",     "0", NO_OVERWRITE);
            setenv("AGENCY_JOURNAL_FSYNC",      "0", NO_OVERWRITE);
            setenv("AGENCY_REQUIRE_API_TOKEN",  "0", NO_OVERWRITE);
            break;
        case Profile::PROD:
            setenv("AGENCY_SNAPSHOT_FSYNC",     "1", NO_OVERWRITE);
            setenv("AGENCY_JOURNAL_FSYNC",      "1", NO_OVERWRITE);
            setenv("AGENCY_REQUIRE_API_TOKEN",  "1", NO_OVERWRITE);
            break;
    }
}

// ---- typed section readers; a present key with the wrong type is an error ----

namespace {

struct Section {
    json_object* obj{nullptr};
    std::string name;

    json_object* get(const char* key) const {
        if (!obj) return nullptr;
        json_object* v = nullptr;
        if (!json_object_object_get_ex(obj, key, &v)) return nullptr;
        return v;
    }

    [[noreturn]] void type_error(const char* key, const char* want) const {
        throw ConfigurationError("config: " + name + "." + key + " must be " + want);
    }

    void read(const char* key, bool& out) const {
        json_object* v = get(key);
        if (!v) return;
        if (!json_object_is_type(v, json_type_boolean)) type_error(key, "a boolean");
        out = json_object_get_boolean(v) != 0;
    }

    void read(const char* key, int64_t& out) const {
        json_object* v = get(key);
        if (!v) return;
        if (!json_object_is_type(v, json_type_int)) type_error(key, "an integer");
        out = json_object_get_int64(v);
    }

    void read(const char* key, int& out) const {
        int64_t v = out;
        read(key, v);
        if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
            type_error(key, "a 32-bit integer");
        }
        out = (int)v;
    }

    void read(const char* key, size_t& out) const {
        int64_t v = (int64_t)out;
        read(key, v);
        if (v < 0) type_error(key, "a non-negative integer");
        out = (size_t)v;
    }

    void read(const char* key, std::string& out) const {
        json_object* v = get(key);
        if (!v) return;
        if (!json_object_is_type(v, json_type_string)) type_error(key, "a string");
        out = json_object_get_string(v);
    }

    void read(const char* key, std::filesystem::path& out) const {
        std::string s;
        json_object* v = get(key);
        if (!v) return;
        read(key, s);
        out = s;
    }
};

Section section(json_object* root, const char* name) {
    Section s;
    s.name = name;
    json_object* v = nullptr;
    if (json_object_object_get_ex(root, name, &v)) {
        if (!json_object_is_type(v, json_type_object)) {
            throw ConfigurationError(std::string("config: section '") + name + "' must be an object");
        }
        s.obj = v;
    }
    return s;
}

} // namespace

void apply_config_json(AgencyConfig& cfg, const std::string& json_text) {
    json_mini::Doc d = json_mini::parse(json_text);
    if (!d) throw ConfigurationError("config: not valid JSON");
    if (!d.is_object()) throw ConfigurationError("config: top level must be an object");

    Section storage = section(d.root, "storage");
    storage.read("data_dir", cfg.data_dir);

    Section memory = section(d.root, "memory");
    memory.read("persistent", cfg.memory_persistent);
    memory.read("dir", cfg.memory_dir);

    Section agent = section(d.root, "agent");
    agent.read("use_memory", cfg.use_memory);
    agent.read("use_tools", cfg.use_tools);
    agent.read("max_thinking_steps", cfg.max_thinking_steps);
    agent.read("max_history_length", cfg.max_history_length);

    Section workflow = section(d.root, "workflow");
    workflow.read("enable_suspend_resume", cfg.enable_suspend_resume);
    workflow.read("max_snapshots", cfg.max_snapshots);
    workflow.read("snapshot_retention_days", cfg.snapshot_retention_days);
    workflow.read("workers", cfg.workers);
    workflow.read("max_queued", cfg.max_queued);

    Section llm = section(d.root, "llm");
    llm.read("command", cfg.model_cmd);
    llm.read("timeout_ms", cfg.model_timeout_ms);
    llm.read("max_retries", cfg.max_retries);
    llm.read("backoff_base_ms", cfg.backoff_base_ms);
    llm.read("backoff_mult", cfg.backoff_mult);
    llm.read("backoff_max_ms", cfg.backoff_max_ms);
    llm.read("fail_threshold", cfg.fail_threshold);
    llm.read("cooldown_ms", cfg.cooldown_ms);

    Section tools = section(d.root, "tools");
    tools.read("timeout_ms", cfg.tool_timeout_ms);
    if (json_object* cmds = tools.get("commands")) {
        if (!json_object_is_type(cmds, json_type_object)) tools.type_error("commands", "an object");
        json_object_object_foreach(cmds, name, v) {
            if (!json_object_is_type(v, json_type_string)) {
                throw ConfigurationError(std::string("config: tools.commands.") + name + " must be a string");
            }
            cfg.tool_commands[name] = json_object_get_string(v);
        }
    }

    Section server = section(d.root, "server");
    server.read("host", cfg.host);
    server.read("port", cfg.port);
    server.read("api_token", cfg.api_token);
    server.read("max_body_bytes", cfg.max_body_bytes);
}

void apply_env_overrides(AgencyConfig& cfg) {
    if (auto v = getenv_str("AGENCY_DATA_DIR")) cfg.data_dir = *v;
    cfg.memory_persistent = getenv_bool("AGENCY_MEMORY_PERSISTENT", cfg.memory_persistent);
    cfg.use_memory = getenv_bool("AGENCY_USE_MEMORY", cfg.use_memory);
    cfg.use_tools = getenv_bool("AGENCY_USE_TOOLS", cfg.use_tools);
    cfg.max_thinking_steps = getenv_int("AGENCY_MAX_THINKING_STEPS", cfg.max_thinking_steps);
    cfg.enable_suspend_resume = getenv_bool("AGENCY_ENABLE_SUSPEND_RESUME", cfg.enable_suspend_resume);
    if (auto v = getenv_str("AGENCY_MODEL_CMD")) cfg.model_cmd = *v;
    if (auto v = getenv_str("AGENCY_API_TOKEN")) cfg.api_token = *v;
    cfg.snapshot_fsync = getenv_bool("AGENCY_SNAPSHOT_FSYNC", cfg.snapshot_fsync);
    cfg.journal_fsync = getenv_bool("AGENCY_JOURNAL_FSYNC", cfg.journal_fsync);
    cfg.require_api_token = getenv_bool("AGENCY_REQUIRE_API_TOKEN", cfg.require_api_token);
}

void validate_config(const AgencyConfig& cfg) {
    auto bad = [](const std::string& m) { throw ConfigurationError("config: " + m); };
    if (cfg.data_dir.empty()) bad("storage.data_dir must not be empty");
    if (cfg.max_thinking_steps < 1) bad("agent.max_thinking_steps must be >= 1");
    if (cfg.max_history_length < 2) bad("agent.max_history_length must be >= 2");
    if (cfg.max_snapshots < 1) bad("workflow.max_snapshots must be >= 1");
    if (cfg.snapshot_retention_days < 0) bad("workflow.snapshot_retention_days must be >= 0");
    if (cfg.workers < 1 || cfg.workers > 64) bad("workflow.workers must be in 1..64");
    if (cfg.max_queued < 0) bad("workflow.max_queued must be >= 0");
    if (cfg.model_timeout_ms < 1) bad("llm.timeout_ms must be >= 1");
    if (cfg.max_retries < 0) bad("llm.max_retries must be >= 0");
    if (cfg.backoff_base_ms < 0 || cfg.backoff_max_ms < 0) bad("llm backoff values must be >= 0");
    if (cfg.backoff_mult < 1) bad("llm.backoff_mult must be >= 1");
    if (cfg.fail_threshold < 1) bad("llm.fail_threshold must be >= 1");
    if (cfg.tool_timeout_ms < 1) bad("tools.timeout_ms must be >= 1");
    for (const auto& [name, cmd] : cfg.tool_commands) {
        if (name.empty()) bad("tools.commands has an empty tool name");
        if (trim_ws(cmd).empty()) bad("tools.commands." + name + " is empty");
    }
    if (cfg.port < 1 || cfg.port > 65535) bad("server.port must be in 1..65535");
    if (cfg.max_body_bytes < 1024) bad("server.max_body_bytes must be >= 1024");
}

AgencyConfig load_config(const std::string& path) {
    AgencyConfig cfg;
    cfg.profile = detect_profile();
    if (!path.empty()) {
        auto text = slurp_file(path);
        if (!text) throw ConfigurationError("config: cannot read " + path);
        apply_config_json(cfg, *text);
    }
    apply_env_overrides(cfg);
    validate_config(cfg);
    return cfg;
}

} // namespace agency
