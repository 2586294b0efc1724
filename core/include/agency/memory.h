#pragma once

#include <cstdint>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace agency {

struct AgencyConfig;

struct MemoryEntry {
    std::string stream;
    std::string text;
    int64_t ts_ms{0};
};

// Knowledge/memory collaborator as seen by the reasoning loop.
class IMemory {
public:
    virtual ~IMemory() = default;

    // Up to `limit` entries relevant to query, best first.
    virtual std::vector<MemoryEntry> fetch_context(const std::string& query, size_t limit) = 0;

    // Returns empty string on success.
    virtual std::string store_observation(const std::string& stream, const std::string& text) = 0;

    virtual std::string name() const = 0;
};

// Durable memory: one JSONL file per stream under root,
//   {"stream":...,"text":...,"ts_ms":...}
// rotated to <stream>.jsonl.<ms>.rotated once it exceeds rotate_bytes.
// Queries scan the tail (max_scan_bytes) of the newest files.
class FileMemory final : public IMemory {
public:
    explicit FileMemory(std::filesystem::path root,
                        size_t rotate_bytes = 64ull * 1024ull * 1024ull,
                        size_t max_scan_bytes = 2 * 1024 * 1024);

    std::vector<MemoryEntry> fetch_context(const std::string& query, size_t limit) override;
    std::string store_observation(const std::string& stream, const std::string& text) override;
    std::string name() const override { return "file"; }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
    size_t rotate_bytes_;
    size_t max_scan_bytes_;
    std::mutex mu_;

    void maybe_rotate_locked(const std::filesystem::path& file);
};

// Bounded in-process ring; contents are lost at exit.
class EphemeralMemory final : public IMemory {
public:
    explicit EphemeralMemory(size_t capacity = 1000);

    std::vector<MemoryEntry> fetch_context(const std::string& query, size_t limit) override;
    std::string store_observation(const std::string& stream, const std::string& text) override;
    std::string name() const override { return "ephemeral"; }

    size_t size() const;

private:
    size_t capacity_;
    mutable std::mutex mu_;
    std::deque<MemoryEntry> entries_;
};

// Lowercased alphanumeric tokens of length >= 2.
std::vector<std::string> tokenize_lower(const std::string& s);

// Ranks by the share of query tokens present in the entry, newest first on
// ties. Entries with no overlap are dropped unless the query has no tokens,
// in which case the newest entries are returned.
std::vector<MemoryEntry> rank_entries(std::vector<MemoryEntry> entries, const std::string& query, size_t limit);

std::unique_ptr<IMemory> make_memory(const AgencyConfig& cfg);

} // namespace agency
