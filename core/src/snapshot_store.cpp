#include "agency/snapshot_store.h"
#include "agency/errors.h"
#include "agency/hash.h"
#include "agency/json_mini.h"
#include "agency/serialization.h"
#include "agency/util.h"

#include <json-c/json.h>

#include <algorithm>
#include <cstdio>
#include <iostream>

namespace agency {

namespace fs = std::filesystem;

static constexpr int64_t kDayMs = 24LL * 3600 * 1000;

static void check_put_args(const Snapshot& s) {
    if (s.workflow_id.empty()) throw StorageError("snapshot without workflow_id");
    if (s.version < 1) throw StorageError("snapshot version must be >= 1");
}

// Versions (ascending) selected for deletion by the retention policy.
template <typename AgeOf>
static std::vector<int64_t> select_pruned(const std::vector<int64_t>& versions,
                                          const RetentionPolicy& policy,
                                          AgeOf timestamp_of) {
    std::vector<int64_t> out;
    if (versions.size() <= 1) return out;
    const int64_t latest = versions.back();
    const int64_t cutoff = policy.max_age_days > 0 ? now_ms() - policy.max_age_days * kDayMs : 0;
    const size_t keep = policy.max_snapshots > 0 ? (size_t)policy.max_snapshots : versions.size();
    for (size_t i = 0; i < versions.size(); i++) {
        const int64_t v = versions[i];
        if (v == latest) continue;
        const bool too_many = (versions.size() - i) > keep;
        const bool too_old = cutoff > 0 && timestamp_of(v) < cutoff;
        if (too_many || too_old) out.push_back(v);
    }
    return out;
}

// ---------------- MemorySnapshotStore ----------------

void MemorySnapshotStore::put(const Snapshot& s) {
    check_put_args(s);
    std::lock_guard<std::mutex> lk(mu_);
    auto& vec = by_id_[s.workflow_id];
    const int64_t last = vec.empty() ? 0 : vec.back().version;
    if (s.version != last + 1) {
        if (vec.empty()) by_id_.erase(s.workflow_id);
        throw VersionConflictError(s.workflow_id, last + 1, s.version);
    }
    vec.push_back(s);
}

std::optional<Snapshot> MemorySnapshotStore::get_latest(const std::string& workflow_id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = by_id_.find(workflow_id);
    if (it == by_id_.end() || it->second.empty()) return std::nullopt;
    return it->second.back();
}

std::optional<Snapshot> MemorySnapshotStore::get(const std::string& workflow_id, int64_t version) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = by_id_.find(workflow_id);
    if (it == by_id_.end()) return std::nullopt;
    for (const auto& s : it->second) {
        if (s.version == version) return s;
    }
    return std::nullopt;
}

std::vector<SnapshotSummary> MemorySnapshotStore::list() {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<SnapshotSummary> out;
    for (const auto& [id, vec] : by_id_) {
        for (const auto& s : vec) out.push_back({id, s.version, s.status, s.timestamp_ms});
    }
    return out;
}

int MemorySnapshotStore::remove(const std::string& workflow_id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = by_id_.find(workflow_id);
    if (it == by_id_.end()) return 0;
    int n = (int)it->second.size();
    by_id_.erase(it);
    return n;
}

int MemorySnapshotStore::prune(const std::string& workflow_id, const RetentionPolicy& policy) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = by_id_.find(workflow_id);
    if (it == by_id_.end()) return 0;
    auto& vec = it->second;

    std::vector<int64_t> versions;
    for (const auto& s : vec) versions.push_back(s.version);
    auto ts_of = [&](int64_t v) -> int64_t {
        for (const auto& s : vec) if (s.version == v) return s.timestamp_ms;
        return 0;
    };
    auto doomed = select_pruned(versions, policy, ts_of);
    vec.erase(std::remove_if(vec.begin(), vec.end(), [&](const Snapshot& s) {
        return std::find(doomed.begin(), doomed.end(), s.version) != doomed.end();
    }), vec.end());
    return (int)doomed.size();
}

// ---------------- file envelope ----------------

std::string encode_snapshot_file(const Snapshot& s) {
    json_object* o = json_object_new_object();
    json_add_string(o, "workflow_id", s.workflow_id);
    json_object_object_add(o, "version", json_object_new_int64(s.version));
    json_object_object_add(o, "status", json_object_new_string(workflow_status_to_str(s.status)));
    json_object_object_add(o, "timestamp_ms", json_object_new_int64(s.timestamp_ms));
    json_object_object_add(o, "checksum", json_object_new_string(hash::digest_hex(s.body_json).c_str()));
    // Body is kept as text so the checksum covers exactly the bytes written.
    json_add_string(o, "body", s.body_json);
    return json_mini::to_string_put(o) + "\n";
}

bool decode_snapshot_file(const std::string& text, Snapshot* out, std::string* err) {
    auto fail = [&](const std::string& m) {
        if (err) *err = m;
        return false;
    };
    json_mini::Doc d = json_mini::parse(text);
    if (!d.is_object()) return fail("not a JSON object");

    Snapshot s;
    std::string status, checksum;
    if (!json_get_string(d.root, "workflow_id", &s.workflow_id)) return fail("workflow_id missing");
    if (!json_get_int64(d.root, "version", &s.version)) return fail("version missing");
    if (!json_get_string(d.root, "status", &status)) return fail("status missing");
    auto st = workflow_status_from_str(status);
    if (!st) return fail("unknown status " + status);
    s.status = *st;
    json_get_int64(d.root, "timestamp_ms", &s.timestamp_ms);
    if (!json_get_string(d.root, "body", &s.body_json)) return fail("body missing");
    if (!json_get_string(d.root, "checksum", &checksum)) return fail("checksum missing");
    if (checksum != hash::digest_hex(s.body_json)) return fail("checksum mismatch");

    *out = std::move(s);
    return true;
}

// ---------------- FileSnapshotStore ----------------

FileSnapshotStore::FileSnapshotStore(fs::path root, bool do_fsync)
    : root_(std::move(root)), fsync_(do_fsync) {}

fs::path FileSnapshotStore::dir_for(const std::string& workflow_id) const {
    // The hash suffix keeps ids that sanitize to the same name apart.
    const std::string h = hash::digest_hex(workflow_id).substr(0, 8);
    return root_ / (sanitize_component(workflow_id) + "." + h);
}

fs::path FileSnapshotStore::file_for(const std::string& workflow_id, int64_t version) const {
    char name[32];
    std::snprintf(name, sizeof(name), "%012lld.json", (long long)version);
    return dir_for(workflow_id) / name;
}

std::vector<int64_t> FileSnapshotStore::versions_locked(const std::string& workflow_id) const {
    std::vector<int64_t> out;
    std::error_code ec;
    fs::path dir = dir_for(workflow_id);
    if (!fs::exists(dir, ec)) return out;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file()) continue;
        const std::string name = entry.path().filename().string();
        if (name.size() != 17 || !name.ends_with(".json")) continue;  // skips *.tmp
        try {
            out.push_back((int64_t)std::stoll(name.substr(0, 12)));
        } catch (const std::exception&) {
            continue;
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

int64_t FileSnapshotStore::last_version_locked(const std::string& workflow_id) {
    auto it = last_version_.find(workflow_id);
    if (it != last_version_.end()) return it->second;
    auto versions = versions_locked(workflow_id);
    int64_t last = versions.empty() ? 0 : versions.back();
    last_version_[workflow_id] = last;
    return last;
}

Snapshot FileSnapshotStore::read_file_locked(const fs::path& p) const {
    auto text = slurp_file(p);
    if (!text) throw StorageError("cannot read snapshot " + p.string());
    Snapshot s;
    std::string err;
    if (!decode_snapshot_file(*text, &s, &err)) {
        throw StorageError("corrupt snapshot " + p.string() + ": " + err);
    }
    return s;
}

void FileSnapshotStore::put(const Snapshot& s) {
    check_put_args(s);
    std::lock_guard<std::mutex> lk(mu_);
    const int64_t last = last_version_locked(s.workflow_id);
    if (s.version != last + 1) throw VersionConflictError(s.workflow_id, last + 1, s.version);

    const fs::path dst = file_for(s.workflow_id, s.version);
    std::string err = write_atomic_file(dst, encode_snapshot_file(s), fsync_, false);
    if (!err.empty()) {
        throw StorageError("snapshot write failed for '" + s.workflow_id + "' v" +
                           std::to_string(s.version) + ": " + err);
    }
    // Renamed into place: readers and a restart already see this version.
    last_version_[s.workflow_id] = s.version;
    if (fsync_) {
        err = sync_directory(dst.parent_path());
        if (!err.empty()) {
            std::cerr << "[store] [WARN] " << s.workflow_id << " v" << s.version
                      << " written but directory not synced: " << err << "\n";
        }
    }
}

std::string FileSnapshotStore::sync_directory(const fs::path& dir) {
    return fsync_dir(dir);
}

std::optional<Snapshot> FileSnapshotStore::get_latest(const std::string& workflow_id) {
    std::lock_guard<std::mutex> lk(mu_);
    const int64_t last = last_version_locked(workflow_id);
    if (last == 0) return std::nullopt;
    return read_file_locked(file_for(workflow_id, last));
}

std::optional<Snapshot> FileSnapshotStore::get(const std::string& workflow_id, int64_t version) {
    std::lock_guard<std::mutex> lk(mu_);
    fs::path p = file_for(workflow_id, version);
    std::error_code ec;
    if (!fs::exists(p, ec)) return std::nullopt;
    return read_file_locked(p);
}

std::vector<SnapshotSummary> FileSnapshotStore::list() {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<SnapshotSummary> out;
    std::error_code ec;
    if (!fs::exists(root_, ec)) return out;
    for (const auto& dir : fs::directory_iterator(root_, ec)) {
        if (!dir.is_directory()) continue;
        for (const auto& entry : fs::directory_iterator(dir.path(), ec)) {
            const std::string name = entry.path().filename().string();
            if (!entry.is_regular_file() || name.size() != 17 || !name.ends_with(".json")) continue;
            auto text = slurp_file(entry.path());
            Snapshot s;
            std::string err;
            if (!text || !decode_snapshot_file(*text, &s, &err)) {
                std::cerr << "[store] [WARN] skipping unreadable snapshot " << entry.path().string()
                          << (err.empty() ? "" : ": " + err) << "\n";
                continue;
            }
            out.push_back({s.workflow_id, s.version, s.status, s.timestamp_ms});
        }
    }
    std::sort(out.begin(), out.end(), [](const SnapshotSummary& a, const SnapshotSummary& b) {
        if (a.workflow_id != b.workflow_id) return a.workflow_id < b.workflow_id;
        return a.version < b.version;
    });
    return out;
}

int FileSnapshotStore::remove(const std::string& workflow_id) {
    std::lock_guard<std::mutex> lk(mu_);
    const int n = (int)versions_locked(workflow_id).size();
    std::error_code ec;
    fs::remove_all(dir_for(workflow_id), ec);
    if (ec) throw StorageError("cannot remove snapshots of '" + workflow_id + "': " + ec.message());
    last_version_.erase(workflow_id);
    return n;
}

int FileSnapshotStore::prune(const std::string& workflow_id, const RetentionPolicy& policy) {
    std::lock_guard<std::mutex> lk(mu_);
    auto versions = versions_locked(workflow_id);
    auto ts_of = [&](int64_t v) -> int64_t {
        auto text = slurp_file(file_for(workflow_id, v));
        Snapshot s;
        if (!text || !decode_snapshot_file(*text, &s, nullptr)) return 0;
        return s.timestamp_ms;
    };
    int removed = 0;
    for (int64_t v : select_pruned(versions, policy, ts_of)) {
        std::error_code ec;
        if (fs::remove(file_for(workflow_id, v), ec)) removed++;
    }
    return removed;
}

} // namespace agency
