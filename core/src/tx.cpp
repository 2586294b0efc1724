#include "agency/tx.h"
#include "agency/json_mini.h"

#include <json-c/json.h>

#include <algorithm>
#include <stdexcept>

namespace agency {

WorkflowTx::WorkflowTx(const Workflow& base) : base_(base), staged_(base) {}

Workflow& WorkflowTx::staged() {
    if (!active_) throw std::logic_error("WorkflowTx: staged() after commit/rollback");
    return staged_;
}

void WorkflowTx::commit(Workflow& target) {
    if (!active_) throw std::logic_error("WorkflowTx: double commit");
    target = staged_;
    active_ = false;
}

void WorkflowTx::rollback() {
    staged_ = base_;
    active_ = false;
}

static void add_replace(json_object* arr, const std::string& path, const char* from, const char* to) {
    json_object* op = json_object_new_object();
    json_object_object_add(op, "op", json_object_new_string("replace"));
    json_object_object_add(op, "path", json_object_new_string(path.c_str()));
    json_object_object_add(op, "from", json_object_new_string(from));
    json_object_object_add(op, "value", json_object_new_string(to));
    json_object_array_add(arr, op);
}

std::string WorkflowTx::patch_json() const {
    json_object* arr = json_object_new_array();
    if (base_.status != staged_.status) {
        add_replace(arr, "/status", workflow_status_to_str(base_.status), workflow_status_to_str(staged_.status));
    }
    const size_t n = std::min(base_.runtime.size(), staged_.runtime.size());
    for (size_t i = 0; i < n; i++) {
        if (base_.runtime[i].status != staged_.runtime[i].status) {
            add_replace(arr, "/runtime/" + std::to_string(i) + "/status",
                        step_status_to_str(base_.runtime[i].status),
                        step_status_to_str(staged_.runtime[i].status));
        }
    }
    return json_mini::to_string_put(arr);
}

} // namespace agency
