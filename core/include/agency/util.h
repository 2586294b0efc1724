#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace agency {

// Environment helpers. Unparseable values fall back to defv.
int getenv_int(const char* k, int defv);
int64_t getenv_i64(const char* k, int64_t defv);
bool getenv_bool(const char* k, bool defv);
std::optional<std::string> getenv_str(const char* k);

void sleep_ms(int64_t ms);

// Delay before retry number `attempt` (1-based): base * mult^(attempt-1),
// capped at max_ms, plus up to jitter_ms of pseudo-random jitter.
int64_t backoff_delay_ms(int attempt, int64_t base_ms, int64_t mult, int64_t max_ms, int64_t jitter_ms);

// Reads the whole file. nullopt if it cannot be opened.
std::optional<std::string> slurp_file(const std::filesystem::path& p);

// Writes body to dst.tmp, optionally fsyncs it, then renames over dst and
// (with sync_parent) fsyncs the directory. Readers see either the old or the
// new file. Returns empty string on success.
std::string write_atomic_file(const std::filesystem::path& dst, const std::string& body, bool do_fsync,
                              bool sync_parent = true);

// fsync of a directory, making completed renames in it durable.
std::string fsync_dir(const std::filesystem::path& dir);

// Maps an arbitrary id onto [A-Za-z0-9_.-], "default" when empty.
std::string sanitize_component(const std::string& s);

// Trims ASCII whitespace on both ends.
std::string trim_ws(std::string s);

std::string lower_ascii(std::string s);

} // namespace agency
