#include "agency/journal.h"
#include "agency/json_mini.h"
#include "agency/serialization.h"
#include "agency/types.h"

#include <json-c/json.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace agency {

namespace fs = std::filesystem;

static int64_t epoch_sec() { return now_ms() / 1000; }

Journal::Journal(fs::path path) : path_(std::move(path)) {}

Journal::~Journal() {
    std::lock_guard<std::mutex> lk(mu_);
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void Journal::set_fsync(bool enable) {
    std::lock_guard<std::mutex> lk(mu_);
    fsync_ = enable;
}

void Journal::set_policy(const JournalPolicy& policy) {
    std::lock_guard<std::mutex> lk(mu_);
    policy_ = policy;
}

std::string Journal::open() {
    std::lock_guard<std::mutex> lk(mu_);
    return open_locked();
}

std::string Journal::open_locked() {
    if (fd_ >= 0) return "";
    std::error_code ec;
    if (!path_.parent_path().empty()) {
        fs::create_directories(path_.parent_path(), ec);
        if (ec) return "create_directories: " + ec.message();
    }
    fd_ = ::open(path_.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644);
    if (fd_ < 0) return std::string("open: ") + std::strerror(errno);

    segment_open_sec_ = epoch_sec();
    struct stat st{};
    current_size_ = (::fstat(fd_, &st) == 0) ? (int64_t)st.st_size : 0;
    return "";
}

bool Journal::is_open() const {
    std::lock_guard<std::mutex> lk(mu_);
    return fd_ >= 0;
}

std::string Journal::record(const std::string& event,
                            const std::string& workflow_id,
                            const std::string& fields_json) {
    json_object* rec = json_object_new_object();
    json_add_string(rec, "t", event);
    json_object_object_add(rec, "ms", json_object_new_int64(now_ms()));
    if (!workflow_id.empty()) json_add_string(rec, "workflow_id", workflow_id);

    json_mini::Doc extra = json_mini::parse(fields_json);
    if (extra.is_object()) {
        json_object_object_foreach(extra.root, k, v) {
            json_object_object_add(rec, k, json_object_get(v));
        }
    }
    return append_line(json_mini::to_string_put(rec));
}

std::string Journal::append_line(const std::string& line_in) {
    std::lock_guard<std::mutex> lk(mu_);
    std::string err = open_locked();
    if (!err.empty()) return err;

    if (needs_rotation_locked()) {
        // A failed rotation keeps appending to the current segment.
        std::string rerr = rotate_locked();
        if (!rerr.empty()) std::cerr << "[journal] [WARN] rotation failed: " << rerr << "\n";
    }

    std::string line = line_in;
    if (line.empty() || line.back() != '\n') line.push_back('\n');

    size_t off = 0;
    while (off < line.size()) {
        ssize_t w = ::write(fd_, line.data() + off, line.size() - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            return std::string("write: ") + std::strerror(errno);
        }
        off += (size_t)w;
    }
    current_size_ += (int64_t)line.size();

    if (fsync_ && ::fsync(fd_) != 0) return std::string("fsync: ") + std::strerror(errno);
    return "";
}

long long Journal::size_bytes() const {
    std::lock_guard<std::mutex> lk(mu_);
    if (fd_ >= 0) return current_size_;
    std::error_code ec;
    if (!fs::exists(path_, ec)) return 0;
    auto sz = fs::file_size(path_, ec);
    return ec ? 0 : (long long)sz;
}

bool Journal::needs_rotation_locked() const {
    if (policy_.max_segment_bytes > 0 && current_size_ >= policy_.max_segment_bytes) return true;
    if (policy_.max_segment_age_sec > 0 && current_size_ > 0 &&
        epoch_sec() - segment_open_sec_ >= policy_.max_segment_age_sec) {
        return true;
    }
    return false;
}

std::string Journal::rotate_now() {
    std::lock_guard<std::mutex> lk(mu_);
    return rotate_locked();
}

std::string Journal::rotate_locked() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    std::error_code ec;
    if (fs::exists(path_, ec) && fs::file_size(path_, ec) > 0) {
        fs::path rotated = path_.parent_path() /
            (path_.stem().string() + "." + std::to_string(now_ms()) + ".jsonl");
        // Two rotations within one millisecond must not overwrite each other.
        for (int i = 1; fs::exists(rotated, ec) && i < 1000; i++) {
            rotated = path_.parent_path() /
                (path_.stem().string() + "." + std::to_string(now_ms()) + "-" + std::to_string(i) + ".jsonl");
        }
        fs::rename(path_, rotated, ec);
        if (ec) {
            std::string err = "rename: " + ec.message();
            std::string oerr = open_locked();
            if (!oerr.empty()) err += "; reopen: " + oerr;
            return err;
        }
    }
    current_size_ = 0;
    std::string err = open_locked();
    if (!err.empty()) return err;
    // Retention runs on every rotation.
    (void)enforce_retention_locked();
    return "";
}

std::vector<fs::path> Journal::rotated_segments_locked() const {
    std::vector<fs::path> out;
    fs::path parent = path_.parent_path().empty() ? fs::path(".") : path_.parent_path();
    const std::string stem = path_.stem().string();
    const std::string active = path_.filename().string();
    std::error_code ec;
    if (!fs::exists(parent, ec)) return out;
    for (const auto& entry : fs::directory_iterator(parent, ec)) {
        if (!entry.is_regular_file()) continue;
        const std::string name = entry.path().filename().string();
        if (name == active) continue;
        if (name.starts_with(stem + ".") && name.ends_with(".jsonl")) out.push_back(entry.path());
    }
    std::sort(out.begin(), out.end());
    return out;
}

int Journal::enforce_retention() {
    std::lock_guard<std::mutex> lk(mu_);
    return enforce_retention_locked();
}

int Journal::enforce_retention_locked() {
    auto segs = rotated_segments_locked();
    std::error_code ec;
    int deleted = 0;
    int64_t total = current_size_;
    std::vector<int64_t> sizes;
    for (const auto& p : segs) {
        int64_t sz = (int64_t)fs::file_size(p, ec);
        sizes.push_back(ec ? 0 : sz);
        total += sizes.back();
    }
    size_t i = 0;
    while (i < segs.size() &&
           ((policy_.max_segments > 0 && (int)(segs.size() - i + 1) > policy_.max_segments) ||
            (policy_.max_total_bytes > 0 && total > policy_.max_total_bytes))) {
        if (fs::remove(segs[i], ec)) deleted++;
        total -= sizes[i];
        i++;
    }
    return deleted;
}

std::vector<fs::path> Journal::list_segments() const {
    std::lock_guard<std::mutex> lk(mu_);
    auto out = rotated_segments_locked();
    std::error_code ec;
    if (fs::exists(path_, ec)) out.push_back(path_);
    return out;
}

} // namespace agency
