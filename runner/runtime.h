#pragma once

#include "agency/config.h"
#include "agency/journal.h"
#include "agency/log.h"
#include "agency/memory.h"
#include "agency/provider.h"
#include "agency/reasoning.h"
#include "agency/snapshot_store.h"
#include "agency/tools.h"
#include "agency/workflow_manager.h"

#include <memory>

namespace agency {

// Everything a daemon or CLI command needs, built from one config.
// Members are declared in dependency order so destruction runs manager first.
struct Runtime {
    AgencyConfig cfg;
    std::unique_ptr<ISnapshotStore> store;
    std::unique_ptr<IMemory> memory;
    ToolRunner tools;
    std::unique_ptr<IModelProvider> model;
    std::unique_ptr<ReasoningLoop> loop;
    std::unique_ptr<Journal> journal;
    std::unique_ptr<TrajectoryLog> trajectory;
    std::unique_ptr<WorkflowManager> manager;

    Runtime() = default;
    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;
    ~Runtime();
};

LoopOptions loop_options_from(const AgencyConfig& cfg);
ManagerOptions manager_options_from(const AgencyConfig& cfg);

// Built-ins plus the configured command tools.
void register_configured_tools(ToolRunner& runner, const AgencyConfig& cfg, IMemory* memory);

// Wires store, memory, tools, model, loop, journal and manager. Does not
// recover or start workers. A non-daemon runtime leaves recovered Pending
// workflows unscheduled. Throws StorageError when the data directory cannot
// be prepared.
std::unique_ptr<Runtime> build_runtime(const AgencyConfig& cfg, bool daemon = true);

} // namespace agency
