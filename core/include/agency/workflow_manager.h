#pragma once
#include "saga.h"
#include "snapshot_store.h"
#include "work_queue.h"
#include "workflow.h"

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <json-c/json.h>

namespace agency {

class Journal;
class TrajectoryLog;

struct ManagerOptions {
    bool enable_suspend_resume{false};
    int default_max_thinking_steps{5};
    RetentionPolicy retention;
    int workers{2};
    int max_queued{256};                // 0 = unbounded
    bool schedule_pending{true};        // recover() queues Pending workflows
};

// Read-only copy of a workflow's state for callers.
struct WorkflowView {
    std::string workflow_id;
    WorkflowStatus status{WorkflowStatus::PENDING};
    int64_t version{0};
    std::string output;                 // output of the last succeeded step
    bool truncated{false};
    int steps_total{0};
    int steps_executed{0};
    std::optional<ErrorRecord> failure;
    std::string suspend_reason;
    bool running{false};                // an executor owns it right now
    bool suspend_requested{false};
    bool abandoned{false};              // mid-flight at startup with suspend/resume disabled
    int64_t created_at_ms{0};
    int64_t updated_at_ms{0};
    std::vector<std::string> step_names;
    std::vector<StepRuntime> runtime;
};

json_object* workflow_view_to_json(const WorkflowView& v, bool with_steps);

struct ProcessResult {
    std::string response;
    int steps_executed{0};
    bool completed{false};
    bool truncated{false};
    WorkflowStatus status{WorkflowStatus::PENDING};
    std::optional<ErrorRecord> failure;
};

// Process-scoped owner of all live workflows.
//
// Lifecycle: construct, recover() from the store, start() the worker pool,
// serve requests, shutdown(). At most one executor advances a workflow at a
// time; a second concurrent run/resume is rejected with WorkflowBusyError.
// Different workflows run independently on the pool or in callers' threads.
class WorkflowManager {
public:
    WorkflowManager(ISnapshotStore& store,
                    const ReasoningLoop& loop,
                    ManagerOptions opts,
                    TrajectoryLog* trajectory = nullptr,
                    Journal* journal = nullptr);
    ~WorkflowManager();

    WorkflowManager(const WorkflowManager&) = delete;
    WorkflowManager& operator=(const WorkflowManager&) = delete;

    // Loads the latest snapshot of every stored workflow. Returns the number
    // registered. Pending workflows are queued to run.
    int recover();

    void start();

    // Stops accepting work, asks running workflows to suspend (when enabled)
    // and joins the workers. Workflows still queued stay persisted as they are.
    void shutdown();

    // Single-message workflow. max_steps 0 = configured default.
    WorkflowView create(const std::string& workflow_id, const std::string& initial_message, int max_steps);

    // Pre-built multi-step saga.
    WorkflowView create_with_steps(const std::string& workflow_id,
                                   std::vector<StepDescriptor> steps,
                                   int max_steps,
                                   const std::string& initial_message = "");

    // Runs in the caller's thread until terminal or suspended.
    WorkflowView run(const std::string& workflow_id);

    // Queues the workflow for the worker pool.
    WorkflowView schedule(const std::string& workflow_id);

    WorkflowView get(const std::string& workflow_id) const;
    std::vector<WorkflowView> list() const;

    WorkflowView suspend(const std::string& workflow_id, const std::string& reason);
    WorkflowView resume(const std::string& workflow_id);
    WorkflowView resume_async(const std::string& workflow_id);

    // Blocks until no executor owns the workflow or timeout_ms passes.
    WorkflowView wait(const std::string& workflow_id, int64_t timeout_ms) const;

    // Ad-hoc single-step run on a scratch in-memory store.
    ProcessResult process(const std::string& message, int max_steps);

    std::vector<SnapshotSummary> list_snapshots();
    std::optional<Snapshot> latest_snapshot(const std::string& workflow_id);

    // Removes every stored version of a terminal (or unknown) workflow.
    int delete_snapshots(const std::string& workflow_id);

    size_t size() const;
    bool suspend_resume_enabled() const { return opts_.enable_suspend_resume; }
    const ManagerOptions& options() const { return opts_; }

private:
    struct Entry {
        std::mutex exec_mu;             // held while an executor advances the workflow
        SuspendSignal signal;
        mutable std::mutex state_mu;    // guards the fields below
        mutable std::condition_variable idle_cv;
        Workflow wf;                    // last committed state
        bool claimed{false};            // queued or executing
        bool abandoned{false};
    };

    struct Job {
        std::string workflow_id;
        bool resuming{false};
    };

    ISnapshotStore& store_;
    const ReasoningLoop& loop_;
    ManagerOptions opts_;
    TrajectoryLog* trajectory_;
    Journal* journal_;

    mutable std::mutex mu_;             // guards entries_
    std::map<std::string, std::shared_ptr<Entry>> entries_;

    WorkQueue<Job> queue_;
    std::vector<std::thread> workers_;
    std::atomic<bool> accepting_{true};
    std::atomic<bool> started_{false};
    std::atomic<uint64_t> adhoc_seq_{0};

    std::shared_ptr<Entry> find(const std::string& workflow_id) const;
    std::shared_ptr<Entry> require(const std::string& workflow_id) const;
    void ensure_accepting() const;
    void ensure_suspend_resume(const char* op) const;

    void claim(Entry& e, const std::string& workflow_id);
    void release(Entry& e);
    void execute(const std::shared_ptr<Entry>& e, bool resuming);
    void enqueue(Entry& e, const std::string& workflow_id, JobPriority priority);
    void worker_loop();
    void prune(const std::string& workflow_id);
    void journal(const std::string& event, const std::string& workflow_id, const std::string& fields_json = "{}");

    static WorkflowView view_of(const Entry& e);
};

} // namespace agency
