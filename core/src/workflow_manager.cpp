#include "agency/workflow_manager.h"
#include "agency/journal.h"
#include "agency/json_mini.h"
#include "agency/log.h"
#include "agency/serialization.h"
#include "agency/util.h"

#include <chrono>
#include <iostream>
#include <set>

namespace agency {

json_object* workflow_view_to_json(const WorkflowView& v, bool with_steps) {
    json_object* o = json_object_new_object();
    json_add_string(o, "workflow_id", v.workflow_id);
    json_object_object_add(o, "status", json_object_new_string(workflow_status_to_str(v.status)));
    json_object_object_add(o, "version", json_object_new_int64(v.version));
    json_add_string(o, "output", v.output);
    json_object_object_add(o, "truncated", json_object_new_boolean(v.truncated ? 1 : 0));
    json_object_object_add(o, "steps_total", json_object_new_int(v.steps_total));
    json_object_object_add(o, "steps_executed", json_object_new_int(v.steps_executed));
    json_object_object_add(o, "running", json_object_new_boolean(v.running ? 1 : 0));
    if (v.suspend_requested) json_object_object_add(o, "suspend_requested", json_object_new_boolean(1));
    if (v.abandoned) json_object_object_add(o, "abandoned", json_object_new_boolean(1));
    if (!v.suspend_reason.empty()) json_add_string(o, "suspend_reason", v.suspend_reason);
    if (v.failure) json_object_object_add(o, "failure", error_record_to_json(*v.failure));
    json_add_string(o, "created_at", iso_utc(v.created_at_ms));
    json_add_string(o, "updated_at", iso_utc(v.updated_at_ms));
    if (with_steps) {
        json_object* arr = json_object_new_array();
        for (size_t i = 0; i < v.runtime.size(); i++) {
            json_object* s = step_runtime_to_json(v.runtime[i]);
            json_add_string(s, "name", i < v.step_names.size() ? v.step_names[i] : "");
            json_object_array_add(arr, s);
        }
        json_object_object_add(o, "steps", arr);
    }
    return o;
}

WorkflowManager::WorkflowManager(ISnapshotStore& store,
                                 const ReasoningLoop& loop,
                                 ManagerOptions opts,
                                 TrajectoryLog* trajectory,
                                 Journal* journal)
    : store_(store), loop_(loop), opts_(std::move(opts)), trajectory_(trajectory), journal_(journal),
      queue_(opts_.max_queued > 0 ? (size_t)opts_.max_queued : 0) {
    if (opts_.workers < 1) opts_.workers = 1;
    if (opts_.default_max_thinking_steps < 1) opts_.default_max_thinking_steps = 1;
}

WorkflowManager::~WorkflowManager() {
    shutdown();
}

void WorkflowManager::journal(const std::string& event, const std::string& workflow_id, const std::string& fields_json) {
    if (!journal_) return;
    std::string err = journal_->record(event, workflow_id, fields_json);
    if (!err.empty()) std::cerr << "[manager] [WARN] journal " << event << ": " << err << "\n";
}

WorkflowView WorkflowManager::view_of(const Entry& e) {
    std::lock_guard<std::mutex> lk(e.state_mu);
    const Workflow& wf = e.wf;
    WorkflowView v;
    v.workflow_id = wf.workflow_id;
    v.status = wf.status;
    v.version = wf.version;
    v.output = wf.final_output();
    for (size_t i = wf.runtime.size(); i > 0; i--) {
        if (wf.runtime[i - 1].status == StepStatus::SUCCEEDED) {
            v.truncated = wf.runtime[i - 1].truncated;
            break;
        }
    }
    v.steps_total = (int)wf.steps.size();
    v.steps_executed = wf.executed_steps();
    v.failure = wf.failure;
    v.suspend_reason = wf.suspend_reason;
    v.running = e.claimed;
    v.suspend_requested = e.signal.requested();
    v.abandoned = e.abandoned;
    v.created_at_ms = wf.created_at_ms;
    v.updated_at_ms = wf.updated_at_ms;
    for (const auto& s : wf.steps) v.step_names.push_back(s.name);
    v.runtime = wf.runtime;
    return v;
}

std::shared_ptr<WorkflowManager::Entry> WorkflowManager::find(const std::string& workflow_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = entries_.find(workflow_id);
    return it == entries_.end() ? nullptr : it->second;
}

std::shared_ptr<WorkflowManager::Entry> WorkflowManager::require(const std::string& workflow_id) const {
    auto e = find(workflow_id);
    if (!e) throw NotFoundError("workflow '" + workflow_id + "' not found");
    return e;
}

void WorkflowManager::ensure_accepting() const {
    if (!accepting_) throw OperationRejectedError("manager is shutting down");
}

void WorkflowManager::ensure_suspend_resume(const char* op) const {
    if (!opts_.enable_suspend_resume) {
        throw OperationRejectedError(std::string(op) + " rejected: workflow.enable_suspend_resume is false");
    }
}

void WorkflowManager::claim(Entry& e, const std::string& workflow_id) {
    std::lock_guard<std::mutex> lk(e.state_mu);
    if (e.claimed) throw WorkflowBusyError("workflow '" + workflow_id + "' is already executing");
    e.claimed = true;
    // Claimed after shutdown() swept the entries.
    if (!accepting_.load() && opts_.enable_suspend_resume) e.signal.request("shutdown");
}

void WorkflowManager::release(Entry& e) {
    {
        std::lock_guard<std::mutex> lk(e.state_mu);
        e.claimed = false;
    }
    e.idle_cv.notify_all();
}

// ---- creation ----

WorkflowView WorkflowManager::create(const std::string& workflow_id, const std::string& initial_message, int max_steps) {
    if (trim_ws(initial_message).empty()) throw ConfigurationError("initial_message must not be empty");
    int steps = max_steps == 0 ? opts_.default_max_thinking_steps : max_steps;
    std::vector<StepDescriptor> sd;
    sd.push_back(make_message_step(initial_message, max_steps < 0 ? 0 : steps));
    return create_with_steps(workflow_id, std::move(sd), max_steps, initial_message);
}

WorkflowView WorkflowManager::create_with_steps(const std::string& workflow_id,
                                                std::vector<StepDescriptor> steps,
                                                int max_steps,
                                                const std::string& initial_message) {
    ensure_accepting();
    if (workflow_id.empty()) throw ConfigurationError("workflow_id must not be empty");
    if (steps.empty()) throw ConfigurationError("workflow '" + workflow_id + "' has no steps");
    if (max_steps < 0) throw ConfigurationError("max_steps must be >= 0");
    std::set<std::string> names;
    for (const auto& s : steps) {
        if (s.name.empty()) throw ConfigurationError("workflow '" + workflow_id + "' has a step without a name");
        if (!names.insert(s.name).second) {
            throw ConfigurationError("workflow '" + workflow_id + "' has duplicate step name '" + s.name + "'");
        }
    }

    auto e = std::make_shared<Entry>();
    {
        // Held across the first put so two creates of one id cannot interleave.
        std::lock_guard<std::mutex> lk(mu_);
        if (entries_.count(workflow_id) || store_.get_latest(workflow_id)) {
            throw ConfigurationError("workflow '" + workflow_id + "' already exists");
        }

        Workflow wf = make_workflow(workflow_id, std::move(steps),
                                    max_steps == 0 ? opts_.default_max_thinking_steps : max_steps);
        wf.initial_message = initial_message;
        SagaExecutor ex(store_, loop_, trajectory_);
        ex.persist_initial(wf);
        e->wf = std::move(wf);
        entries_[workflow_id] = e;
    }

    json_object* f = json_object_new_object();
    json_object_object_add(f, "steps", json_object_new_int((int)e->wf.steps.size()));
    journal("CREATE", workflow_id, json_mini::to_string_put(f));
    return view_of(*e);
}

// ---- execution ----

void WorkflowManager::prune(const std::string& workflow_id) {
    try {
        int n = store_.prune(workflow_id, opts_.retention);
        if (n > 0) std::cerr << "[manager] pruned " << n << " snapshot(s) of " << workflow_id << "\n";
    } catch (const StorageError& err) {
        std::cerr << "[manager] [WARN] prune " << workflow_id << ": " << err.what() << "\n";
    }
}

void WorkflowManager::execute(const std::shared_ptr<Entry>& e, bool resuming) {
    struct ClaimGuard {
        WorkflowManager* m;
        Entry& e;
        ~ClaimGuard() {
            e.signal.clear();
            m->release(e);
        }
    } guard{this, *e};

    Workflow work;
    {
        std::lock_guard<std::mutex> lk(e->state_mu);
        work = e->wf;
    }
    const std::string id = work.workflow_id;

    std::unique_lock<std::mutex> exec(e->exec_mu, std::try_to_lock);
    if (!exec.owns_lock()) throw WorkflowBusyError("workflow '" + id + "' is already executing");

    SagaExecutor ex(store_, loop_, trajectory_);
    ex.set_boundary_hook([&e](const Workflow& w) {
        std::lock_guard<std::mutex> lk(e->state_mu);
        e->wf = w;
    });

    journal("RUN_BEGIN", id, resuming ? "{\"resume\":true}" : "{}");
    try {
        if (resuming) ex.prepare_resume(work);
        ex.run_to_completion(work, opts_.enable_suspend_resume ? &e->signal : nullptr);
    } catch (const AgencyError& err) {
        json_object* f = json_object_new_object();
        json_add_string(f, "error", err.what());
        json_add_string(f, "kind", error_kind_to_str(err.kind()));
        journal("RUN_END", id, json_mini::to_string_put(f));
        throw;
    }

    json_object* f = json_object_new_object();
    json_object_object_add(f, "status", json_object_new_string(workflow_status_to_str(work.status)));
    json_object_object_add(f, "version", json_object_new_int64(work.version));
    journal("RUN_END", id, json_mini::to_string_put(f));

    prune(id);
}

WorkflowView WorkflowManager::run(const std::string& workflow_id) {
    ensure_accepting();
    auto e = require(workflow_id);
    {
        std::lock_guard<std::mutex> lk(e->state_mu);
        if (e->abandoned) throw OperationRejectedError("workflow '" + workflow_id + "' was abandoned");
        if (e->wf.status == WorkflowStatus::SUSPENDED) {
            throw OperationRejectedError("workflow '" + workflow_id + "' is suspended; resume it");
        }
    }
    claim(*e, workflow_id);
    execute(e, false);
    return view_of(*e);
}

WorkflowView WorkflowManager::schedule(const std::string& workflow_id) {
    ensure_accepting();
    auto e = require(workflow_id);
    {
        std::lock_guard<std::mutex> lk(e->state_mu);
        if (e->abandoned) throw OperationRejectedError("workflow '" + workflow_id + "' was abandoned");
        if (e->wf.status == WorkflowStatus::SUSPENDED) {
            throw OperationRejectedError("workflow '" + workflow_id + "' is suspended; resume it");
        }
    }
    if (is_terminal(view_of(*e).status)) return view_of(*e);

    claim(*e, workflow_id);
    enqueue(*e, workflow_id, JobPriority::RUN);
    return view_of(*e);
}

// Expects e to be claimed; releases the claim when the job is not queued.
void WorkflowManager::enqueue(Entry& e, const std::string& workflow_id, JobPriority priority) {
    switch (queue_.push(priority, Job{workflow_id, priority == JobPriority::RESUME})) {
    case PushResult::QUEUED:
        return;
    case PushResult::FULL:
        release(e);
        throw WorkflowBusyError("work queue is full (" + std::to_string(queue_.capacity()) + " jobs)");
    case PushResult::CLOSED:
        release(e);
        throw OperationRejectedError("manager is shutting down");
    }
}

void WorkflowManager::worker_loop() {
    WorkQueue<Job>::Item item;
    while (queue_.pop(item)) {
        auto e = find(item.value.workflow_id);
        if (!e) continue;
        try {
            execute(e, item.value.resuming);
        } catch (const AgencyError& err) {
            std::cerr << "[manager] run " << item.value.workflow_id << " failed: "
                      << error_kind_to_str(err.kind()) << ": " << err.what() << "\n";
        } catch (const std::exception& err) {
            std::cerr << "[manager] run " << item.value.workflow_id << " failed: " << err.what() << "\n";
        }
    }
}

void WorkflowManager::start() {
    bool expected = false;
    if (!started_.compare_exchange_strong(expected, true)) return;
    for (int i = 0; i < opts_.workers; i++) {
        workers_.emplace_back([this] { worker_loop(); });
    }
    std::cerr << "[manager] started " << opts_.workers << " worker(s)"
              << (opts_.enable_suspend_resume ? ", suspend/resume enabled" : "") << "\n";
}

void WorkflowManager::shutdown() {
    bool was_accepting = accepting_.exchange(false);
    if (!was_accepting && workers_.empty()) return;

    queue_.shutdown();
    // Queued runs that never started stay persisted as they are.
    for (const auto& job : queue_.drain()) {
        if (auto e = find(job.workflow_id)) release(*e);
    }

    if (opts_.enable_suspend_resume) {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto& kv : entries_) {
            std::lock_guard<std::mutex> slk(kv.second->state_mu);
            if (kv.second->claimed) kv.second->signal.request("shutdown");
        }
    }

    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();
    if (was_accepting) journal("SHUTDOWN", "");
}

// ---- suspend / resume ----

WorkflowView WorkflowManager::suspend(const std::string& workflow_id, const std::string& reason) {
    ensure_suspend_resume("suspend");
    auto e = require(workflow_id);
    bool deferred = false;
    {
        std::lock_guard<std::mutex> lk(e->state_mu);
        if (is_terminal(e->wf.status)) {
            throw OperationRejectedError("workflow '" + workflow_id + "' is already " +
                                         workflow_status_to_str(e->wf.status));
        }
        if (e->wf.status == WorkflowStatus::COMPENSATING) {
            throw OperationRejectedError("workflow '" + workflow_id + "' is compensating; it cannot be suspended");
        }
        if (e->claimed) {
            // Honored by the executor at its next step boundary.
            e->signal.request(reason);
            deferred = true;
        }
    }
    json_object* f = json_object_new_object();
    json_add_string(f, "reason", reason);
    if (deferred) json_object_object_add(f, "deferred", json_object_new_boolean(1));
    journal("SUSPEND_REQ", workflow_id, json_mini::to_string_put(f));

    if (deferred) return view_of(*e);

    // Idle: apply the suspension directly.
    claim(*e, workflow_id);
    struct ReleaseGuard {
        WorkflowManager* m;
        Entry& e;
        ~ReleaseGuard() { m->release(e); }
    } guard{this, *e};

    std::unique_lock<std::mutex> exec(e->exec_mu, std::try_to_lock);
    if (!exec.owns_lock()) throw WorkflowBusyError("workflow '" + workflow_id + "' is already executing");

    Workflow work;
    {
        std::lock_guard<std::mutex> lk(e->state_mu);
        work = e->wf;
    }
    SagaExecutor ex(store_, loop_, trajectory_);
    ex.set_boundary_hook([&e](const Workflow& w) {
        std::lock_guard<std::mutex> lk(e->state_mu);
        e->wf = w;
    });
    ex.suspend(work, reason);
    return view_of(*e);
}

WorkflowView WorkflowManager::resume(const std::string& workflow_id) {
    ensure_suspend_resume("resume");
    ensure_accepting();
    auto e = require(workflow_id);
    {
        std::lock_guard<std::mutex> lk(e->state_mu);
        if (e->abandoned && !is_terminal(e->wf.status)) {
            throw OperationRejectedError("workflow '" + workflow_id + "' was abandoned");
        }
    }
    // Finished workflows are reported, never re-executed.
    if (is_terminal(view_of(*e).status)) return view_of(*e);

    claim(*e, workflow_id);
    journal("RESUME", workflow_id);
    execute(e, true);
    return view_of(*e);
}

WorkflowView WorkflowManager::resume_async(const std::string& workflow_id) {
    ensure_suspend_resume("resume");
    ensure_accepting();
    auto e = require(workflow_id);
    {
        std::lock_guard<std::mutex> lk(e->state_mu);
        if (e->abandoned && !is_terminal(e->wf.status)) {
            throw OperationRejectedError("workflow '" + workflow_id + "' was abandoned");
        }
    }
    if (is_terminal(view_of(*e).status)) return view_of(*e);

    claim(*e, workflow_id);
    journal("RESUME", workflow_id, "{\"async\":true}");
    enqueue(*e, workflow_id, JobPriority::RESUME);
    return view_of(*e);
}

WorkflowView WorkflowManager::wait(const std::string& workflow_id, int64_t timeout_ms) const {
    auto e = require(workflow_id);
    {
        std::unique_lock<std::mutex> lk(e->state_mu);
        e->idle_cv.wait_for(lk, std::chrono::milliseconds(timeout_ms), [&] { return !e->claimed; });
    }
    return view_of(*e);
}

// ---- queries ----

WorkflowView WorkflowManager::get(const std::string& workflow_id) const {
    return view_of(*require(workflow_id));
}

std::vector<WorkflowView> WorkflowManager::list() const {
    std::vector<std::shared_ptr<Entry>> all;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto& kv : entries_) all.push_back(kv.second);
    }
    std::vector<WorkflowView> out;
    out.reserve(all.size());
    for (const auto& e : all) out.push_back(view_of(*e));
    return out;
}

size_t WorkflowManager::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return entries_.size();
}

std::vector<SnapshotSummary> WorkflowManager::list_snapshots() {
    return store_.list();
}

std::optional<Snapshot> WorkflowManager::latest_snapshot(const std::string& workflow_id) {
    return store_.get_latest(workflow_id);
}

int WorkflowManager::delete_snapshots(const std::string& workflow_id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = entries_.find(workflow_id);
    if (it != entries_.end()) {
        std::lock_guard<std::mutex> slk(it->second->state_mu);
        if (it->second->claimed) throw WorkflowBusyError("workflow '" + workflow_id + "' is executing");
        if (!is_terminal(it->second->wf.status) && !it->second->abandoned) {
            throw OperationRejectedError("workflow '" + workflow_id + "' is " +
                                         workflow_status_to_str(it->second->wf.status) +
                                         "; only finished workflows can be deleted");
        }
    } else if (!store_.get_latest(workflow_id)) {
        throw NotFoundError("no snapshots for '" + workflow_id + "'");
    }

    int n = store_.remove(workflow_id);
    if (it != entries_.end()) entries_.erase(it);

    json_object* f = json_object_new_object();
    json_object_object_add(f, "removed", json_object_new_int(n));
    journal("DELETE", workflow_id, json_mini::to_string_put(f));
    return n;
}

// ---- ad-hoc ----

ProcessResult WorkflowManager::process(const std::string& message, int max_steps) {
    ensure_accepting();
    if (trim_ws(message).empty()) throw ConfigurationError("message must not be empty");
    if (max_steps < 0) throw ConfigurationError("max_steps must be >= 0");
    const int steps = max_steps == 0 ? opts_.default_max_thinking_steps : max_steps;

    MemorySnapshotStore scratch;
    std::vector<StepDescriptor> sd;
    sd.push_back(make_message_step(message, steps));
    Workflow wf = make_workflow("process-" + std::to_string(now_ms()) + "-" + std::to_string(++adhoc_seq_),
                                std::move(sd), steps);
    wf.initial_message = message;

    SagaExecutor ex(scratch, loop_, nullptr);
    ex.persist_initial(wf);
    ex.run_to_completion(wf, nullptr);

    ProcessResult r;
    r.status = wf.status;
    r.completed = wf.status == WorkflowStatus::COMPLETED;
    r.steps_executed = wf.executed_steps();
    r.failure = wf.failure;
    if (r.completed) {
        r.response = wf.runtime[0].output;
        r.truncated = wf.runtime[0].truncated;
    }
    return r;
}

// ---- startup ----

int WorkflowManager::recover() {
    std::vector<SnapshotSummary> all = store_.list();
    std::set<std::string> ids;
    for (const auto& s : all) ids.insert(s.workflow_id);

    int registered = 0;
    std::vector<std::string> pending;
    for (const auto& id : ids) {
        if (find(id)) continue;
        std::optional<Workflow> wf;
        try {
            wf = load_latest_workflow(store_, id);
        } catch (const StorageError& err) {
            std::cerr << "[manager] [WARN] skipping " << id << ": " << err.what() << "\n";
            continue;
        }
        if (!wf) continue;

        auto e = std::make_shared<Entry>();
        const WorkflowStatus st = wf->status;
        const bool mid_flight = st == WorkflowStatus::RUNNING || st == WorkflowStatus::COMPENSATING;
        e->wf = std::move(*wf);
        if (mid_flight && !opts_.enable_suspend_resume) {
            e->abandoned = true;
            std::cerr << "[manager] [WARN] " << id << " was " << workflow_status_to_str(st)
                      << " at shutdown; suspend/resume disabled, abandoned\n";
        } else if (mid_flight) {
            std::cerr << "[manager] " << id << " was " << workflow_status_to_str(st) << "; resumable\n";
        }
        {
            std::lock_guard<std::mutex> lk(mu_);
            entries_[id] = e;
        }
        registered++;

        json_object* f = json_object_new_object();
        json_object_object_add(f, "status", json_object_new_string(workflow_status_to_str(st)));
        json_object_object_add(f, "version", json_object_new_int64(e->wf.version));
        if (e->abandoned) json_object_object_add(f, "abandoned", json_object_new_boolean(1));
        journal("RECOVER", id, json_mini::to_string_put(f));

        prune(id);
        if (st == WorkflowStatus::PENDING && opts_.schedule_pending) pending.push_back(id);
    }

    for (const auto& id : pending) {
        try {
            schedule(id);
        } catch (const AgencyError& err) {
            std::cerr << "[manager] [WARN] cannot queue " << id << ": " << err.what() << "\n";
        }
    }
    if (registered > 0) std::cerr << "[manager] recovered " << registered << " workflow(s)\n";
    return registered;
}

} // namespace agency
