#include "test_common.h"

#include "agency/work_queue.h"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using agency::JobPriority;
using agency::PushResult;
using agency::WorkQueue;

static constexpr JobPriority RUN = JobPriority::RUN;
static constexpr JobPriority RESUME = JobPriority::RESUME;

int main() {
    WorkQueue<std::string> q;

    // Resumes (priority 0) go ahead of runs (priority 1).
    q.push(RUN, "run-a");
    q.push(RESUME, "resume-x");
    q.push(RUN, "run-b");
    q.push(RESUME, "resume-y");
    expect_eq_ll((long long)q.size(), 4, "size");

    WorkQueue<std::string>::Item it;
    std::vector<std::string> order;
    for (int i = 0; i < 4; i++) {
        expect_true(q.pop(it), "pop should succeed");
        order.push_back(it.value);
    }
    // For equal priority, seq enforces FIFO
    expect_true(order[0] == "resume-x" && order[1] == "resume-y", "resumes first, FIFO");
    expect_true(order[2] == "run-a" && order[3] == "run-b", "runs after, FIFO");

    // drain() hands back what is left, in pop order.
    q.push(RUN, "left-1");
    q.push(RESUME, "left-0");
    auto rest = q.drain();
    expect_true(rest.size() == 2 && rest[0] == "left-0" && rest[1] == "left-1", "drain order");
    expect_eq_ll((long long)q.size(), 0, "drained");

    // Items queued before shutdown are still handed out; pushes after it are refused.
    q.push(RUN, "before");
    q.shutdown();
    expect_true(q.closed(), "closed");
    expect_true(q.push(RUN, "after") == PushResult::CLOSED, "push after shutdown refused");
    expect_true(q.pop(it) && it.value == "before", "queued item still popped");
    expect_true(!q.pop(it), "closed and empty");

    // Bounded queue: full until a job is popped.
    WorkQueue<int> small(2);
    expect_eq_ll((long long)small.capacity(), 2, "capacity");
    expect_true(small.push(RUN, 1) == PushResult::QUEUED, "first queued");
    expect_true(small.push(RUN, 2) == PushResult::QUEUED, "second queued");
    expect_true(small.push(RESUME, 3) == PushResult::FULL, "full regardless of priority");
    WorkQueue<int>::Item got;
    expect_true(small.pop(got) && got.value == 1, "pop frees a slot");
    expect_true(small.push(RESUME, 3) == PushResult::QUEUED, "room again");
    expect_true(small.pop(got) && got.value == 3 && got.priority == RESUME, "resume jumps the queue");

    // Blocking pop should unblock on shutdown
    WorkQueue<int> q2;
    bool popped = true;
    std::thread t([&] {
        WorkQueue<int>::Item it2;
        popped = q2.pop(it2);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    q2.shutdown();
    t.join();
    expect_true(!popped, "pop should return false after shutdown on empty queue");

    // Several consumers see every item exactly once.
    WorkQueue<int> q3;
    std::atomic<int> sum{0};
    std::vector<std::thread> consumers;
    for (int c = 0; c < 4; c++) {
        consumers.emplace_back([&] {
            WorkQueue<int>::Item item;
            while (q3.pop(item)) sum += item.value;
        });
    }
    for (int i = 1; i <= 100; i++) q3.push(i % 2 ? RUN : RESUME, i);
    q3.shutdown();
    for (auto& c : consumers) c.join();
    expect_eq_ll(sum.load(), 5050, "every item consumed once");

    std::cerr << "test_work_queue: ALL PASSED" << std::endl;
    return 0;
}
