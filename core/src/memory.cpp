#include "agency/memory.h"
#include "agency/config.h"
#include "agency/json_mini.h"
#include "agency/serialization.h"
#include "agency/types.h"
#include "agency/util.h"

#include <json-c/json.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <iterator>
#include <unordered_set>

namespace agency {

namespace fs = std::filesystem;

std::vector<std::string> tokenize_lower(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    auto flush = [&]() {
        if (cur.size() >= 2) out.push_back(cur);
        cur.clear();
    };
    for (unsigned char uc : s) {
        if (std::isalpha(uc)) cur.push_back((char)std::tolower(uc));
        else if (std::isdigit(uc)) cur.push_back((char)uc);
        else flush();
        if (cur.size() > 64) flush();
    }
    flush();
    return out;
}

std::vector<MemoryEntry> rank_entries(std::vector<MemoryEntry> entries, const std::string& query, size_t limit) {
    auto q = tokenize_lower(query);
    std::unordered_set<std::string> qset(q.begin(), q.end());

    std::vector<std::pair<double, MemoryEntry>> scored;
    scored.reserve(entries.size());
    for (auto& e : entries) {
        double score = 0.0;
        if (!qset.empty()) {
            std::unordered_set<std::string> seen;
            for (const auto& t : tokenize_lower(e.text)) {
                if (qset.count(t) && seen.insert(t).second) score += 1.0;
            }
            score /= (double)qset.size();
            if (score <= 0.0) continue;
        }
        scored.emplace_back(score, std::move(e));
    }
    std::stable_sort(scored.begin(), scored.end(), [](const auto& a, const auto& b) {
        if (a.first != b.first) return a.first > b.first;
        return a.second.ts_ms > b.second.ts_ms;
    });

    std::vector<MemoryEntry> out;
    for (auto& entry : scored) {
        if (out.size() >= limit) break;
        out.push_back(std::move(entry.second));
    }
    return out;
}

// ---- FileMemory ----

FileMemory::FileMemory(fs::path root, size_t rotate_bytes, size_t max_scan_bytes)
    : root_(std::move(root)), rotate_bytes_(rotate_bytes), max_scan_bytes_(max_scan_bytes) {}

void FileMemory::maybe_rotate_locked(const fs::path& file) {
    if (rotate_bytes_ == 0) return;
    std::error_code ec;
    if (!fs::exists(file, ec)) return;
    auto sz = fs::file_size(file, ec);
    if (ec || sz < rotate_bytes_) return;
    fs::path rotated = file.parent_path() / (file.filename().string() + "." + std::to_string(now_ms()) + ".rotated");
    fs::rename(file, rotated, ec);
    if (ec) std::cerr << "[memory] [WARN] rotate failed for " << file << ": " << ec.message() << "\n";
}

std::string FileMemory::store_observation(const std::string& stream_in, const std::string& text) {
    const std::string stream = sanitize_component(stream_in);
    json_object* rec = json_object_new_object();
    json_add_string(rec, "stream", stream);
    json_add_string(rec, "text", text);
    json_object_object_add(rec, "ts_ms", json_object_new_int64(now_ms()));
    const std::string line = json_mini::to_string_put(rec);

    std::lock_guard<std::mutex> lk(mu_);
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) return "create_directories: " + ec.message();

    const fs::path file = root_ / (stream + ".jsonl");
    maybe_rotate_locked(file);
    std::ofstream out(file, std::ios::out | std::ios::app | std::ios::binary);
    if (!out) return "cannot open " + file.string();
    out << line << "\n";
    out.flush();
    if (!out) return "write failed: " + file.string();
    return "";
}

static std::vector<std::string> tail_lines(const fs::path& file, size_t max_bytes) {
    std::vector<std::string> lines;
    std::ifstream in(file, std::ios::binary);
    if (!in) return lines;
    in.seekg(0, std::ios::end);
    std::streamoff end = in.tellg();
    std::streamoff start = end - (std::streamoff)max_bytes;
    bool partial_first = start > 0;
    if (start < 0) start = 0;
    in.seekg(start, std::ios::beg);

    std::string buf((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    std::string cur;
    for (char c : buf) {
        if (c == '\n') {
            // first line of a tail window is usually cut in half
            if (!partial_first && !cur.empty()) lines.push_back(cur);
            partial_first = false;
            cur.clear();
        } else if (c != '\r') {
            cur.push_back(c);
        }
    }
    if (!cur.empty() && !partial_first) lines.push_back(cur);
    return lines;
}

std::vector<MemoryEntry> FileMemory::fetch_context(const std::string& query, size_t limit) {
    std::vector<MemoryEntry> entries;
    {
        std::lock_guard<std::mutex> lk(mu_);
        std::error_code ec;
        if (!fs::is_directory(root_, ec)) return {};

        std::vector<fs::path> files;
        for (const auto& ent : fs::directory_iterator(root_, ec)) {
            if (!ent.is_regular_file()) continue;
            const std::string name = ent.path().filename().string();
            if (name.ends_with(".jsonl") || name.ends_with(".rotated")) files.push_back(ent.path());
        }
        for (const auto& f : files) {
            for (const auto& line : tail_lines(f, max_scan_bytes_)) {
                json_mini::Doc d = json_mini::parse(line);
                if (!d.is_object()) continue;
                MemoryEntry e;
                if (!json_get_string(d.root, "text", &e.text)) continue;
                (void)json_get_string(d.root, "stream", &e.stream);
                (void)json_get_int64(d.root, "ts_ms", &e.ts_ms);
                entries.push_back(std::move(e));
            }
        }
    }
    return rank_entries(std::move(entries), query, limit);
}

// ---- EphemeralMemory ----

EphemeralMemory::EphemeralMemory(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

std::string EphemeralMemory::store_observation(const std::string& stream, const std::string& text) {
    std::lock_guard<std::mutex> lk(mu_);
    entries_.push_back(MemoryEntry{stream, text, now_ms()});
    while (entries_.size() > capacity_) entries_.pop_front();
    return "";
}

std::vector<MemoryEntry> EphemeralMemory::fetch_context(const std::string& query, size_t limit) {
    std::vector<MemoryEntry> copy;
    {
        std::lock_guard<std::mutex> lk(mu_);
        copy.assign(entries_.rbegin(), entries_.rend());  // newest first
    }
    return rank_entries(std::move(copy), query, limit);
}

size_t EphemeralMemory::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return entries_.size();
}

std::unique_ptr<IMemory> make_memory(const AgencyConfig& cfg) {
    if (cfg.memory_persistent) return std::make_unique<FileMemory>(cfg.effective_memory_dir());
    return std::make_unique<EphemeralMemory>();
}

} // namespace agency
