#include "test_common.h"
#include "test_fakes.h"

#include "agency/config.h"
#include "agency/errors.h"

#include <cstdlib>
#include <fstream>

using namespace agency;

static const char* kEnvVars[] = {
    "AGENCY_PROFILE", "AGENCY_DATA_DIR", "AGENCY_MEMORY_PERSISTENT", "AGENCY_USE_MEMORY",
    "AGENCY_USE_TOOLS", "AGENCY_MAX_THINKING_STEPS", "AGENCY_ENABLE_SUSPEND_RESUME",
    "AGENCY_MODEL_CMD", "AGENCY_API_TOKEN", "AGENCY_SNAPSHOT_FSYNC", "AGENCY_JOURNAL_FSYNC",
    "AGENCY_REQUIRE_API_TOKEN",
};

static void clear_env() {
    for (const char* k : kEnvVars) unsetenv(k);
}

static bool rejects(const std::string& json) {
    AgencyConfig cfg;
    try {
        apply_config_json(cfg, json);
        validate_config(cfg);
    } catch (const ConfigurationError&) {
        return true;
    }
    return false;
}

int main() {
    clear_env();

    // Profiles
    expect_true(detect_profile() == Profile::DEV, "default should be DEV");
    setenv("AGENCY_PROFILE", "Production", 1);
    expect_true(detect_profile() == Profile::PROD, "should detect PROD case-insensitive");
    expect_true(std::string(profile_name(Profile::PROD)) == "prod", "prod name");

    setenv("AGENCY_JOURNAL_FSYNC", "0", 1);  // pre-existing
    apply_profile_defaults(Profile::PROD);
    expect_true(std::string(std::getenv("AGENCY_JOURNAL_FSYNC")) == "0", "should NOT override pre-existing env var");
    expect_true(std::string(std::getenv("AGENCY_SNAPSHOT_FSYNC")) == "1", "PROD sets snapshot fsync");
    expect_true(std::string(std::getenv("AGENCY_REQUIRE_API_TOKEN")) == "1", "PROD requires api token");
    clear_env();

    // Defaults
    {
        AgencyConfig cfg = load_config("");
        expect_true(cfg.memory_persistent, "memory.persistent default");
        expect_true(cfg.use_memory && cfg.use_tools, "agent defaults");
        expect_eq_ll(cfg.max_thinking_steps, 5, "max_thinking_steps default");
        expect_eq_ll(cfg.max_history_length, 20, "max_history_length default");
        expect_true(!cfg.enable_suspend_resume, "suspend/resume off by default");
        expect_eq_ll(cfg.max_snapshots, 10, "max_snapshots default");
        expect_eq_ll(cfg.snapshot_retention_days, 7, "retention default");
        expect_eq_ll(cfg.workers, 2, "workers default");
        expect_eq_ll(cfg.max_queued, 256, "max_queued default");
        expect_eq_ll(cfg.max_retries, 3, "max_retries default");
        expect_eq_ll(cfg.backoff_base_ms, 100, "backoff base default");
        expect_eq_ll(cfg.backoff_mult, 2, "backoff mult default");
        expect_eq_ll(cfg.backoff_max_ms, 5000, "backoff cap default");
        expect_true(cfg.host == "127.0.0.1" && cfg.port == 8080, "server defaults");
        expect_true(cfg.data_dir == "./data", "data_dir default");
        expect_true(cfg.model_cmd.empty(), "no model command by default");
        expect_true(cfg.journal_path() == std::filesystem::path("./data/journal/manager.jsonl"), "journal path");
        expect_true(cfg.effective_memory_dir() == std::filesystem::path("./data/memory"), "memory dir follows data dir");
    }

    // File overrides defaults, environment overrides the file.
    agency_test::TempDir tmp("config");
    const std::string path = (tmp.path() / "agency.json").string();
    {
        std::ofstream out(path);
        out << "{\n"
               "  \"storage\": {\"data_dir\": \"/var/lib/agency\"},\n"
               "  \"memory\": {\"persistent\": false},\n"
               "  \"agent\": {\"max_thinking_steps\": 9, \"use_tools\": false},\n"
               "  \"workflow\": {\"enable_suspend_resume\": true, \"max_snapshots\": 4, \"workers\": 3, \"max_queued\": 0},\n"
               "  \"llm\": {\"command\": \"/usr/bin/driver --fast\", \"max_retries\": 1},\n"
               "  \"tools\": {\"timeout_ms\": 500, \"commands\": {\"lookup\": \"/bin/cat\"}},\n"
               "  \"server\": {\"port\": 9090, \"api_token\": \"file-token\"}\n"
               "}\n";
    }
    {
        AgencyConfig cfg = load_config(path);
        expect_true(cfg.data_dir == "/var/lib/agency", "file data_dir");
        expect_true(!cfg.memory_persistent, "file memory.persistent");
        expect_eq_ll(cfg.max_thinking_steps, 9, "file max_thinking_steps");
        expect_true(!cfg.use_tools, "file use_tools");
        expect_true(cfg.use_memory, "untouched key keeps default");
        expect_true(cfg.enable_suspend_resume, "file suspend/resume");
        expect_eq_ll(cfg.max_snapshots, 4, "file max_snapshots");
        expect_eq_ll(cfg.workers, 3, "file workers");
        expect_eq_ll(cfg.max_queued, 0, "file max_queued (unbounded)");
        expect_true(cfg.model_cmd == "/usr/bin/driver --fast", "file llm.command");
        expect_eq_ll(cfg.max_retries, 1, "file max_retries");
        expect_eq_ll(cfg.tool_timeout_ms, 500, "file tools.timeout_ms");
        expect_true(cfg.tool_commands.count("lookup") == 1, "file tool command");
        expect_eq_ll(cfg.port, 9090, "file port");
        expect_true(cfg.api_token == "file-token", "file api token");
    }
    {
        setenv("AGENCY_DATA_DIR", "/tmp/agency-env", 1);
        setenv("AGENCY_MAX_THINKING_STEPS", "2", 1);
        setenv("AGENCY_ENABLE_SUSPEND_RESUME", "false", 1);
        setenv("AGENCY_USE_TOOLS", "1", 1);
        setenv("AGENCY_API_TOKEN", "env-token", 1);
        setenv("AGENCY_SNAPSHOT_FSYNC", "1", 1);
        AgencyConfig cfg = load_config(path);
        expect_true(cfg.data_dir == "/tmp/agency-env", "env data_dir wins");
        expect_eq_ll(cfg.max_thinking_steps, 2, "env max_thinking_steps wins");
        expect_true(!cfg.enable_suspend_resume, "env suspend/resume wins");
        expect_true(cfg.use_tools, "env use_tools wins");
        expect_true(cfg.api_token == "env-token", "env token wins");
        expect_true(cfg.snapshot_fsync, "env snapshot fsync");
        expect_eq_ll(cfg.max_snapshots, 4, "file value without env override stays");
        clear_env();
    }

    // Validation
    expect_true(rejects("not json"), "malformed file");
    expect_true(rejects("[1,2]"), "top level must be an object");
    expect_true(rejects("{\"agent\": []}"), "section must be an object");
    expect_true(rejects("{\"agent\": {\"max_thinking_steps\": \"5\"}}"), "wrong type");
    expect_true(rejects("{\"agent\": {\"use_memory\": 1}}"), "int where bool expected");
    expect_true(rejects("{\"agent\": {\"max_thinking_steps\": 0}}"), "max_thinking_steps < 1");
    expect_true(rejects("{\"workflow\": {\"max_snapshots\": 0}}"), "max_snapshots < 1");
    expect_true(rejects("{\"workflow\": {\"workers\": 65}}"), "workers > 64");
    expect_true(rejects("{\"workflow\": {\"max_queued\": -1}}"), "negative max_queued");
    expect_true(rejects("{\"server\": {\"port\": 70000}}"), "port out of range");
    expect_true(rejects("{\"tools\": {\"commands\": {\"x\": \"  \"}}}"), "empty tool command");
    expect_true(rejects("{\"tools\": {\"commands\": {\"x\": 5}}}"), "tool command must be a string");
    expect_true(!rejects("{\"workflow\": {\"snapshot_retention_days\": 0}}"), "0 days = no age limit is valid");

    bool threw = false;
    try {
        (void)load_config((tmp.path() / "missing.json").string());
    } catch (const ConfigurationError&) {
        threw = true;
    }
    expect_true(threw, "unreadable file is a ConfigurationError");

    std::cerr << "test_config: ALL PASSED" << std::endl;
    return 0;
}
