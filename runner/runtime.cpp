#include "runtime.h"

#include "../tools/builtin/builtin_tools.h"

#include <filesystem>
#include <iostream>
#include <system_error>

namespace agency {

Runtime::~Runtime() {
    if (manager) manager->shutdown();
}

LoopOptions loop_options_from(const AgencyConfig& cfg) {
    LoopOptions o;
    o.retry.max_retries = cfg.max_retries;
    o.retry.base_ms = cfg.backoff_base_ms;
    o.retry.mult = cfg.backoff_mult;
    o.retry.max_ms = cfg.backoff_max_ms;
    o.max_history = cfg.max_history_length;
    o.use_tools = cfg.use_tools;
    o.use_memory = cfg.use_memory;
    return o;
}

ManagerOptions manager_options_from(const AgencyConfig& cfg) {
    ManagerOptions o;
    o.enable_suspend_resume = cfg.enable_suspend_resume;
    o.default_max_thinking_steps = cfg.max_thinking_steps;
    o.retention.max_snapshots = cfg.max_snapshots;
    o.retention.max_age_days = cfg.snapshot_retention_days;
    o.workers = cfg.workers;
    o.max_queued = cfg.max_queued;
    return o;
}

void register_configured_tools(ToolRunner& runner, const AgencyConfig& cfg, IMemory* memory) {
    register_builtin_tools(runner, cfg.use_memory ? memory : nullptr);

    ProcLimits lim;
    lim.timeout_ms = cfg.tool_timeout_ms;
    for (const auto& kv : cfg.tool_commands) {
        if (runner.has(kv.first)) {
            std::cerr << "[config] [WARN] tool '" << kv.first << "' overrides a built-in\n";
        }
        runner.registerCommandTool(kv.first, kv.second, lim);
    }
}

std::unique_ptr<Runtime> build_runtime(const AgencyConfig& cfg, bool daemon) {
    auto rt = std::make_unique<Runtime>();
    rt->cfg = cfg;

    std::error_code ec;
    std::filesystem::create_directories(cfg.snapshots_dir(), ec);
    if (ec) throw StorageError("cannot create " + cfg.snapshots_dir().string() + ": " + ec.message());
    std::filesystem::create_directories(cfg.trajectories_dir(), ec);
    if (ec) throw StorageError("cannot create " + cfg.trajectories_dir().string() + ": " + ec.message());

    rt->store = std::make_unique<FileSnapshotStore>(cfg.snapshots_dir(), cfg.snapshot_fsync);
    rt->memory = make_memory(cfg);
    register_configured_tools(rt->tools, cfg, rt->memory.get());
    rt->model = make_model_provider(cfg);
    rt->loop = std::make_unique<ReasoningLoop>(*rt->model, &rt->tools, rt->memory.get(), loop_options_from(cfg));

    rt->journal = std::make_unique<Journal>(cfg.journal_path());
    rt->journal->set_fsync(cfg.journal_fsync);
    std::string jerr = rt->journal->open();
    if (!jerr.empty()) {
        // The manager still runs; lifecycle events are just not recorded.
        std::cerr << "[config] [WARN] journal disabled: " << jerr << "\n";
    }

    rt->trajectory = std::make_unique<TrajectoryLog>(cfg.trajectories_dir());
    ManagerOptions mo = manager_options_from(cfg);
    mo.schedule_pending = daemon;
    rt->manager = std::make_unique<WorkflowManager>(*rt->store, *rt->loop, mo,
                                                    rt->trajectory.get(),
                                                    rt->journal->is_open() ? rt->journal.get() : nullptr);

    std::cerr << "[config] profile=" << profile_name(cfg.profile)
              << " data_dir=" << cfg.data_dir.string()
              << " model=" << rt->model->name()
              << " memory=" << (cfg.use_memory ? rt->memory->name() : "off")
              << " tools=" << rt->tools.names().size()
              << " suspend_resume=" << (cfg.enable_suspend_resume ? "on" : "off") << "\n";
    return rt;
}

} // namespace agency
