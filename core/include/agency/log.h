#pragma once
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_map>

namespace agency {

// Per-workflow trajectory log.
//
// Appends one canonical (sorted keys) JSON line per event to
// <dir>/<sanitized workflow id>.jsonl:
//   {"event":...,"payload":{...},"seq":N,"step":i,"ts":"...","workflow_id":...}
// Resumed workflows keep appending to the same file; seq continues from the
// number of lines already present.
class TrajectoryLog {
public:
    explicit TrajectoryLog(std::filesystem::path dir);

    // Returns empty string on success.
    std::string event(const std::string& workflow_id,
                      int step,
                      const std::string& name,
                      const std::string& payload_json);

    std::filesystem::path path_for(const std::string& workflow_id) const;
    const std::filesystem::path& dir() const { return dir_; }

private:
    std::filesystem::path dir_;
    std::mutex mu_;
    std::unordered_map<std::string, int64_t> seq_;
};

// Deterministic JSON: object keys sorted recursively. Input that does not
// parse is returned unchanged.
std::string canonicalize_json(const std::string& raw);

} // namespace agency
