#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <queue>
#include <utility>
#include <vector>

namespace agency {

// Scheduling class of a queued workflow job. Lower values pop first.
enum class JobPriority : int32_t {
    RESUME = 0,
    RUN = 1,
};

enum class PushResult {
    QUEUED,
    FULL,
    CLOSED,
};

// Job queue feeding the manager's worker pool.
//
// Ordered by JobPriority, FIFO within a priority. Holds at most `capacity`
// jobs (0 = unbounded). pop() blocks until a job arrives or shutdown();
// jobs queued before shutdown() are still handed out unless drain() took them.
template <typename T>
class WorkQueue {
public:
    struct Item {
        JobPriority priority{JobPriority::RUN};
        uint64_t seq{0};
        T value;
    };

    explicit WorkQueue(size_t capacity = 0) : capacity_(capacity) {}

    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    PushResult push(JobPriority priority, T value) {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_) return PushResult::CLOSED;
        if (capacity_ > 0 && q_.size() >= capacity_) return PushResult::FULL;
        q_.push(Item{priority, seq_++, std::move(value)});
        cv_.notify_one();
        return PushResult::QUEUED;
    }

    // False once shut down and empty.
    bool pop(Item& out) {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait(lk, [&] { return closed_ || !q_.empty(); });
        if (q_.empty()) return false;
        out = q_.top();
        q_.pop();
        return true;
    }

    void shutdown() {
        std::lock_guard<std::mutex> lk(mu_);
        closed_ = true;
        cv_.notify_all();
    }

    // Everything still queued, in pop order.
    std::vector<T> drain() {
        std::lock_guard<std::mutex> lk(mu_);
        std::vector<T> out;
        out.reserve(q_.size());
        while (!q_.empty()) {
            out.push_back(q_.top().value);
            q_.pop();
        }
        return out;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return q_.size();
    }

    size_t capacity() const { return capacity_; }

    bool closed() const {
        std::lock_guard<std::mutex> lk(mu_);
        return closed_;
    }

private:
    struct Later {
        bool operator()(const Item& a, const Item& b) const {
            if (a.priority != b.priority) return a.priority > b.priority;
            return a.seq > b.seq;
        }
    };

    const size_t capacity_;
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::priority_queue<Item, std::vector<Item>, Later> q_;
    uint64_t seq_{0};
    bool closed_{false};
};

} // namespace agency
