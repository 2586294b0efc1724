#pragma once
#include "workflow.h"

#include <string>

namespace agency {

// Staged workflow transition: base -> staged -> commit/rollback.
//
// The executor mutates staged(), persists it, and only then commits it into
// the caller-visible workflow. A failed persist rolls back, so the caller
// keeps observing the last persisted state.
//
// Not thread-safe; the caller must own the target workflow exclusively.
class WorkflowTx {
public:
    explicit WorkflowTx(const Workflow& base);

    WorkflowTx(const WorkflowTx&) = delete;
    WorkflowTx& operator=(const WorkflowTx&) = delete;

    Workflow& staged();
    const Workflow& base() const { return base_; }

    void commit(Workflow& target);
    void rollback();
    bool active() const { return active_; }

    // RFC6902-like list of "replace" ops for lifecycle fields that differ
    // between base and staged (workflow status, step statuses).
    std::string patch_json() const;

private:
    Workflow base_;
    Workflow staged_;
    bool active_{true};
};

} // namespace agency
