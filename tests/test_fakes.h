#pragma once

// Shared fakes for the agency tests: a scripted model provider, a gated
// provider that blocks until released, a snapshot store decorator that fails
// chosen puts, and a scratch directory.

#include "agency/errors.h"
#include "agency/provider.h"
#include "agency/snapshot_store.h"

#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

namespace agency_test {

inline agency::ModelResponse final_reply(const std::string& text) {
    agency::ModelResponse r;
    r.kind = agency::ReplyKind::FINAL;
    r.text = text;
    return r;
}

inline agency::ModelResponse thought_reply(const std::string& text) {
    agency::ModelResponse r;
    r.kind = agency::ReplyKind::THOUGHT;
    r.text = text;
    return r;
}

inline agency::ModelResponse tool_reply(const std::string& tool, const std::string& args_json) {
    agency::ModelResponse r;
    r.kind = agency::ReplyKind::TOOL_CALL;
    r.tool = tool;
    r.tool_args_json = args_json;
    return r;
}

inline agency::ModelResponse transient_reply(const std::string& why) {
    agency::ModelResponse r;
    r.status = agency::CallStatus::TRANSIENT_ERROR;
    r.error = why;
    return r;
}

inline agency::ModelResponse permanent_reply(const std::string& why) {
    agency::ModelResponse r;
    r.status = agency::CallStatus::PERMANENT_ERROR;
    r.error = why;
    return r;
}

// Plays back a fixed list of replies; once exhausted it keeps answering with
// `fallback` (a final answer by default).
class ScriptedProvider : public agency::IModelProvider {
public:
    explicit ScriptedProvider(std::vector<agency::ModelResponse> script = {},
                              agency::ModelResponse fallback = final_reply("done"))
        : script_(std::move(script)), fallback_(std::move(fallback)) {}

    agency::ModelResponse complete(const agency::ModelRequest& req) override {
        std::lock_guard<std::mutex> lk(mu_);
        requests_.push_back(req);
        if (next_ < script_.size()) return script_[next_++];
        return fallback_;
    }
    std::string name() const override { return "scripted"; }

    size_t calls() const {
        std::lock_guard<std::mutex> lk(mu_);
        return requests_.size();
    }
    agency::ModelRequest request(size_t i) const {
        std::lock_guard<std::mutex> lk(mu_);
        return requests_.at(i);
    }
    // First message text of every request, in call order.
    std::vector<std::string> tasks() const {
        std::lock_guard<std::mutex> lk(mu_);
        std::vector<std::string> out;
        for (const auto& r : requests_) out.push_back(r.messages.empty() ? "" : r.messages[0].content);
        return out;
    }

private:
    mutable std::mutex mu_;
    std::vector<agency::ModelResponse> script_;
    agency::ModelResponse fallback_;
    size_t next_{0};
    std::vector<agency::ModelRequest> requests_;
};

// Blocks every completion until open() is called. entered() counts callers
// that reached the gate.
class GatedProvider : public agency::IModelProvider {
public:
    agency::ModelResponse complete(const agency::ModelRequest& req) override {
        std::unique_lock<std::mutex> lk(mu_);
        entered_++;
        cv_.notify_all();
        cv_.wait(lk, [&] { return open_; });
        std::string task = req.messages.empty() ? "" : req.messages[0].content;
        return final_reply("gated: " + task.substr(0, task.find('\n')));
    }
    std::string name() const override { return "gated"; }

    void open() {
        std::lock_guard<std::mutex> lk(mu_);
        open_ = true;
        cv_.notify_all();
    }
    // Waits until at least n callers are blocked at (or went through) the gate.
    void wait_entered(int n) {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait(lk, [&] { return entered_ >= n; });
    }

private:
    std::mutex mu_;
    std::condition_variable cv_;
    bool open_{false};
    int entered_{0};
};

// Forwards to an inner store; the put numbered fail_on_put (1-based, counted
// across all workflows) throws StorageError instead. 0 = never fail.
class FailingStore : public agency::ISnapshotStore {
public:
    explicit FailingStore(agency::ISnapshotStore& inner, int fail_on_put = 0)
        : inner_(inner), fail_on_put_(fail_on_put) {}

    void put(const agency::Snapshot& s) override {
        int n = ++puts_;
        if (fail_on_put_ > 0 && n == fail_on_put_) {
            throw agency::StorageError("injected failure on put " + std::to_string(n));
        }
        inner_.put(s);
    }
    std::optional<agency::Snapshot> get_latest(const std::string& id) override { return inner_.get_latest(id); }
    std::optional<agency::Snapshot> get(const std::string& id, int64_t v) override { return inner_.get(id, v); }
    std::vector<agency::SnapshotSummary> list() override { return inner_.list(); }
    int remove(const std::string& id) override { return inner_.remove(id); }
    int prune(const std::string& id, const agency::RetentionPolicy& p) override { return inner_.prune(id, p); }

    void fail_on(int put_number) { fail_on_put_ = put_number; }
    int puts() const { return puts_.load(); }

private:
    agency::ISnapshotStore& inner_;
    std::atomic<int> fail_on_put_;
    std::atomic<int> puts_{0};
};

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& name) {
        path_ = std::filesystem::temp_directory_path() /
                ("agency_test_" + name + "_" + std::to_string(::getpid()));
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        std::filesystem::create_directories(path_, ec);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace agency_test
