#pragma once
#include "workflow.h"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace agency {

struct RetentionPolicy {
    int max_snapshots{10};        // newest N versions kept per workflow
    int max_age_days{7};          // 0 = no age limit
};

// Persistence contract for workflow snapshots.
//
// put() is atomic per snapshot and accepts exactly last_version + 1
// (1 for an unknown workflow). Violations throw VersionConflictError,
// I/O failures throw StorageError.
class ISnapshotStore {
public:
    virtual ~ISnapshotStore() = default;

    virtual void put(const Snapshot& s) = 0;
    virtual std::optional<Snapshot> get_latest(const std::string& workflow_id) = 0;
    virtual std::optional<Snapshot> get(const std::string& workflow_id, int64_t version) = 0;

    // Every stored snapshot, ordered by workflow id then version.
    virtual std::vector<SnapshotSummary> list() = 0;

    // Deletes all versions. The next put for this id must be version 1.
    virtual int remove(const std::string& workflow_id) = 0;

    // Applies retention to one workflow. The latest version is never removed.
    virtual int prune(const std::string& workflow_id, const RetentionPolicy& policy) = 0;
};

// Process-local store; used for ad-hoc runs and tests.
class MemorySnapshotStore : public ISnapshotStore {
public:
    void put(const Snapshot& s) override;
    std::optional<Snapshot> get_latest(const std::string& workflow_id) override;
    std::optional<Snapshot> get(const std::string& workflow_id, int64_t version) override;
    std::vector<SnapshotSummary> list() override;
    int remove(const std::string& workflow_id) override;
    int prune(const std::string& workflow_id, const RetentionPolicy& policy) override;

private:
    std::mutex mu_;
    std::map<std::string, std::vector<Snapshot>> by_id_;  // versions ascending
};

// One JSON file per version:
//   <root>/<sanitized-id>.<hash8>/<version, 12 digits>.json
// written through a temp file and rename, fsynced when enabled.
class FileSnapshotStore : public ISnapshotStore {
public:
    explicit FileSnapshotStore(std::filesystem::path root, bool do_fsync = false);

    void put(const Snapshot& s) override;
    std::optional<Snapshot> get_latest(const std::string& workflow_id) override;
    std::optional<Snapshot> get(const std::string& workflow_id, int64_t version) override;
    std::vector<SnapshotSummary> list() override;
    int remove(const std::string& workflow_id) override;
    int prune(const std::string& workflow_id, const RetentionPolicy& policy) override;

    const std::filesystem::path& root() const { return root_; }
    std::filesystem::path dir_for(const std::string& workflow_id) const;

protected:
    // Runs after a snapshot file is renamed into place (fsync enabled only).
    // A failure is logged; the version is already committed.
    virtual std::string sync_directory(const std::filesystem::path& dir);

private:
    std::filesystem::path root_;
    bool fsync_;
    std::mutex mu_;
    std::unordered_map<std::string, int64_t> last_version_;  // cache, filled lazily

    std::filesystem::path file_for(const std::string& workflow_id, int64_t version) const;
    std::vector<int64_t> versions_locked(const std::string& workflow_id) const;
    int64_t last_version_locked(const std::string& workflow_id);
    Snapshot read_file_locked(const std::filesystem::path& p) const;
};

// File envelope used by FileSnapshotStore.
std::string encode_snapshot_file(const Snapshot& s);
bool decode_snapshot_file(const std::string& text, Snapshot* out, std::string* err);

} // namespace agency
