#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace agency {

// Segment rotation and retention for the manager journal.
struct JournalPolicy {
    int64_t max_segment_bytes{16 * 1024 * 1024};
    int max_segment_age_sec{3600};
    int max_segments{10};                          // including the active one
    int64_t max_total_bytes{256 * 1024 * 1024};
};

// Journal: append-only JSONL record of manager lifecycle events.
//
// One line per record: {"t":<event>,"ms":<epoch ms>,"workflow_id":...,<fields>}.
// The active segment lives at `path`; full or old segments are renamed to
// <stem>.<epoch_ms>.jsonl and pruned by the policy.
//
// Thread-safe, with optional fsync per append. Errors are returned as
// strings (empty on success) so that a broken journal never stops a workflow.
class Journal {
public:
    explicit Journal(std::filesystem::path path);
    ~Journal();

    Journal(const Journal&) = delete;
    Journal& operator=(const Journal&) = delete;

    void set_fsync(bool enable);
    void set_policy(const JournalPolicy& policy);

    std::string open();
    bool is_open() const;

    // fields_json: a JSON object whose members are merged into the record.
    std::string record(const std::string& event,
                       const std::string& workflow_id,
                       const std::string& fields_json = "{}");

    // Appends one raw line (a trailing newline is added when missing).
    std::string append_line(const std::string& line);

    long long size_bytes() const;

    std::string rotate_now();
    int enforce_retention();

    // Rotated segments oldest-first, then the active segment.
    std::vector<std::filesystem::path> list_segments() const;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    int fd_{-1};
    bool fsync_{false};
    mutable std::mutex mu_;
    JournalPolicy policy_;
    int64_t segment_open_sec_{0};
    int64_t current_size_{0};

    std::string open_locked();
    std::string rotate_locked();
    bool needs_rotation_locked() const;
    int enforce_retention_locked();
    std::vector<std::filesystem::path> rotated_segments_locked() const;
};

} // namespace agency
