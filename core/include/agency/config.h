#pragma once
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

namespace agency {

enum class Profile { DEV, PROD };

// Detect profile from AGENCY_PROFILE env var. Default: DEV.
Profile detect_profile();

const char* profile_name(Profile p);

// Sets durability env defaults that are not already set.
// DEV: no fsync, API token optional. PROD: fsync on, API token required.
// Must run before worker threads start (setenv is not thread-safe).
void apply_profile_defaults(Profile p);

struct AgencyConfig {
    Profile profile{Profile::DEV};

    // storage
    std::filesystem::path data_dir{"./data"};
    bool snapshot_fsync{false};
    bool journal_fsync{false};

    // memory
    bool memory_persistent{true};
    std::filesystem::path memory_dir;      // empty = <data_dir>/memory

    // agent
    bool use_memory{true};
    bool use_tools{true};
    int max_thinking_steps{5};
    int max_history_length{20};

    // workflow
    bool enable_suspend_resume{false};
    int max_snapshots{10};
    int snapshot_retention_days{7};
    int workers{2};
    int max_queued{256};                  // pending jobs; 0 = unbounded

    // llm driver
    std::string model_cmd;                 // empty = offline provider
    int model_timeout_ms{30000};
    int max_retries{3};
    int64_t backoff_base_ms{100};
    int64_t backoff_mult{2};
    int64_t backoff_max_ms{5000};
    int fail_threshold{5};
    int64_t cooldown_ms{30000};

    // tools
    int tool_timeout_ms{30000};
    std::map<std::string, std::string> tool_commands;

    // server
    std::string host{"127.0.0.1"};
    int port{8080};
    std::string api_token;
    bool require_api_token{false};
    size_t max_body_bytes{2 * 1024 * 1024};

    std::filesystem::path snapshots_dir() const { return data_dir / "snapshots"; }
    std::filesystem::path trajectories_dir() const { return data_dir / "trajectories"; }
    std::filesystem::path journal_path() const { return data_dir / "journal" / "manager.jsonl"; }
    std::filesystem::path effective_memory_dir() const {
        return memory_dir.empty() ? data_dir / "memory" : memory_dir;
    }
};

// Merges a JSON config document into cfg. Throws ConfigurationError on
// malformed JSON or wrong value types.
void apply_config_json(AgencyConfig& cfg, const std::string& json_text);

// AGENCY_* environment overrides.
void apply_env_overrides(AgencyConfig& cfg);

// Throws ConfigurationError on out-of-range values.
void validate_config(const AgencyConfig& cfg);

// defaults < file (when path is non-empty) < environment, then validated.
AgencyConfig load_config(const std::string& path);

} // namespace agency
