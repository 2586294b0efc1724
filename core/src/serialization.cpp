#include "agency/serialization.h"
#include "agency/json_mini.h"

#include <limits>

namespace agency {

// --- JSON helpers ---

bool json_get_string(json_object* o, const char* k, std::string* out) {
    if (!o || !out) return false;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v || !json_object_is_type(v, json_type_string)) return false;
    *out = std::string(json_object_get_string(v), (size_t)json_object_get_string_len(v));
    return true;
}

bool json_get_bool(json_object* o, const char* k, bool* out) {
    if (!o || !out) return false;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v) return false;
    if (!json_object_is_type(v, json_type_boolean)) return false;
    *out = (json_object_get_boolean(v) != 0);
    return true;
}

bool json_get_int64(json_object* o, const char* k, int64_t* out) {
    if (!o || !out) return false;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v) return false;
    if (!json_object_is_type(v, json_type_int)) return false;
    *out = json_object_get_int64(v);
    return true;
}

bool json_get_int(json_object* o, const char* k, int* out) {
    int64_t v = 0;
    if (!out || !json_get_int64(o, k, &v)) return false;
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) return false;
    *out = (int)v;
    return true;
}

void json_add_string(json_object* o, const char* k, const std::string& v) {
    json_object_object_add(o, k, json_object_new_string_len(v.c_str(), (int)v.size()));
}

json_object* json_from_text_or_string(const std::string& raw) {
    json_mini::Doc d = json_mini::parse(raw);
    if (d) return d.release();
    return json_object_new_string_len(raw.c_str(), (int)raw.size());
}

// Object members are kept as raw JSON text; strings are unwrapped.
static std::string member_as_json_text(json_object* o, const char* k, const char* defv) {
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v) return defv;
    if (json_object_is_type(v, json_type_string)) return json_object_get_string(v);
    return json_mini::to_string(v);
}

// --- Actions ---

json_object* action_to_json(const ActionRef& a) {
    json_object* o = json_object_new_object();
    json_add_string(o, "name", a.name);
    json_object_object_add(o, "kind", json_object_new_string(action_kind_name(a.kind)));

    if (const auto* ra = std::get_if<ReasoningAction>(&a.kind)) {
        json_add_string(o, "instruction", ra->instruction);
        json_object_object_add(o, "context", json_from_text_or_string(ra->context_json));
        json_object_object_add(o, "max_thinking_steps", json_object_new_int(ra->max_thinking_steps));
    } else if (const auto* ta = std::get_if<ToolAction>(&a.kind)) {
        json_add_string(o, "tool", ta->tool);
        json_object_object_add(o, "args", json_from_text_or_string(ta->args_json));
    }
    return o;
}

bool action_from_json(json_object* o, ActionRef* out, std::string* err) {
    auto fail = [&](const std::string& m) {
        if (err) *err = m;
        return false;
    };
    if (!o || !json_object_is_type(o, json_type_object) || !out) return fail("action must be an object");

    ActionRef a;
    json_get_string(o, "name", &a.name);

    std::string kind;
    if (!json_get_string(o, "kind", &kind)) return fail("action.kind missing");

    if (kind == "noop") {
        a.kind = NoopAction{};
    } else if (kind == "reasoning") {
        ReasoningAction ra;
        if (!json_get_string(o, "instruction", &ra.instruction) || ra.instruction.empty()) {
            return fail("reasoning action needs a non-empty instruction");
        }
        ra.context_json = member_as_json_text(o, "context", "{}");
        json_get_int(o, "max_thinking_steps", &ra.max_thinking_steps);
        if (ra.max_thinking_steps < 0) return fail("max_thinking_steps must be >= 0");
        a.kind = ra;
    } else if (kind == "tool") {
        ToolAction ta;
        if (!json_get_string(o, "tool", &ta.tool) || ta.tool.empty()) {
            return fail("tool action needs a tool name");
        }
        ta.args_json = member_as_json_text(o, "args", "{}");
        a.kind = ta;
    } else {
        return fail("unknown action kind: " + kind);
    }

    *out = std::move(a);
    return true;
}

json_object* step_descriptor_to_json(const StepDescriptor& s) {
    json_object* o = json_object_new_object();
    json_add_string(o, "name", s.name);
    json_object_object_add(o, "forward", action_to_json(s.forward));
    if (s.compensation) json_object_object_add(o, "compensation", action_to_json(*s.compensation));
    json_object_object_add(o, "accept_truncated", json_object_new_boolean(s.accept_truncated ? 1 : 0));
    return o;
}

bool step_descriptor_from_json(json_object* o, StepDescriptor* out, std::string* err) {
    if (!o || !json_object_is_type(o, json_type_object) || !out) {
        if (err) *err = "step must be an object";
        return false;
    }
    StepDescriptor s;
    json_get_string(o, "name", &s.name);

    json_object* fw = nullptr;
    if (!json_object_object_get_ex(o, "forward", &fw)) {
        if (err) *err = "step '" + s.name + "' has no forward action";
        return false;
    }
    if (!action_from_json(fw, &s.forward, err)) return false;
    if (s.forward.name.empty()) s.forward.name = s.name;

    json_object* comp = nullptr;
    if (json_object_object_get_ex(o, "compensation", &comp) && comp &&
        !json_object_is_type(comp, json_type_null)) {
        ActionRef c;
        if (!action_from_json(comp, &c, err)) return false;
        if (c.name.empty()) c.name = s.name + ".compensate";
        s.compensation = std::move(c);
    }
    json_get_bool(o, "accept_truncated", &s.accept_truncated);

    *out = std::move(s);
    return true;
}

bool step_descriptors_from_json(json_object* arr, std::vector<StepDescriptor>* out, std::string* err) {
    if (!arr || !json_object_is_type(arr, json_type_array) || !out) {
        if (err) *err = "steps must be an array";
        return false;
    }
    std::vector<StepDescriptor> steps;
    const size_t n = json_object_array_length(arr);
    for (size_t i = 0; i < n; i++) {
        StepDescriptor s;
        if (!step_descriptor_from_json(json_object_array_get_idx(arr, i), &s, err)) return false;
        if (s.name.empty()) s.name = "step" + std::to_string(i + 1);
        if (s.forward.name.empty()) s.forward.name = s.name;
        steps.push_back(std::move(s));
    }
    *out = std::move(steps);
    return true;
}

// --- Runtime state ---

json_object* error_record_to_json(const ErrorRecord& e) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "kind", json_object_new_string(error_kind_to_str(e.kind)));
    json_add_string(o, "message", e.message);
    json_object_object_add(o, "step", json_object_new_int(e.step));
    return o;
}

bool error_record_from_json(json_object* o, ErrorRecord* out) {
    if (!o || !json_object_is_type(o, json_type_object) || !out) return false;
    ErrorRecord e;
    std::string kind;
    if (!json_get_string(o, "kind", &kind)) return false;
    auto k = error_kind_from_str(kind);
    if (!k) return false;
    e.kind = *k;
    json_get_string(o, "message", &e.message);
    json_get_int(o, "step", &e.step);
    *out = std::move(e);
    return true;
}

json_object* step_runtime_to_json(const StepRuntime& r) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "status", json_object_new_string(step_status_to_str(r.status)));
    json_object_object_add(o, "attempt_count", json_object_new_int(r.attempt_count));
    json_add_string(o, "output", r.output);
    json_object_object_add(o, "truncated", json_object_new_boolean(r.truncated ? 1 : 0));
    if (r.error) json_object_object_add(o, "error", error_record_to_json(*r.error));
    json_object_object_add(o, "started_ms", json_object_new_int64(r.started_ms));
    json_object_object_add(o, "finished_ms", json_object_new_int64(r.finished_ms));
    if (!r.compensation_output.empty()) json_add_string(o, "compensation_output", r.compensation_output);
    return o;
}

bool step_runtime_from_json(json_object* o, StepRuntime* out) {
    if (!o || !json_object_is_type(o, json_type_object) || !out) return false;
    StepRuntime r;
    std::string st;
    if (!json_get_string(o, "status", &st)) return false;
    auto s = step_status_from_str(st);
    if (!s) return false;
    r.status = *s;
    json_get_int(o, "attempt_count", &r.attempt_count);
    json_get_string(o, "output", &r.output);
    json_get_bool(o, "truncated", &r.truncated);
    json_object* e = nullptr;
    if (json_object_object_get_ex(o, "error", &e) && e) {
        ErrorRecord rec;
        if (!error_record_from_json(e, &rec)) return false;
        r.error = std::move(rec);
    }
    json_get_int64(o, "started_ms", &r.started_ms);
    json_get_int64(o, "finished_ms", &r.finished_ms);
    json_get_string(o, "compensation_output", &r.compensation_output);
    *out = std::move(r);
    return true;
}

json_object* workflow_to_json(const Workflow& wf) {
    json_object* o = json_object_new_object();
    json_add_string(o, "workflow_id", wf.workflow_id);
    json_object_object_add(o, "status", json_object_new_string(workflow_status_to_str(wf.status)));
    json_object_object_add(o, "version", json_object_new_int64(wf.version));
    json_object_object_add(o, "created_at_ms", json_object_new_int64(wf.created_at_ms));
    json_object_object_add(o, "updated_at_ms", json_object_new_int64(wf.updated_at_ms));
    json_object_object_add(o, "max_thinking_steps", json_object_new_int(wf.max_thinking_steps));
    json_add_string(o, "initial_message", wf.initial_message);
    if (!wf.suspend_reason.empty()) json_add_string(o, "suspend_reason", wf.suspend_reason);
    if (wf.failure) json_object_object_add(o, "failure", error_record_to_json(*wf.failure));
    json_object_object_add(o, "failed_step", json_object_new_int(wf.failed_step));
    json_object_object_add(o, "compensation_cursor", json_object_new_int(wf.compensation_cursor));

    json_object* steps = json_object_new_array();
    for (const auto& s : wf.steps) json_object_array_add(steps, step_descriptor_to_json(s));
    json_object_object_add(o, "steps", steps);

    json_object* rt = json_object_new_array();
    for (const auto& r : wf.runtime) json_object_array_add(rt, step_runtime_to_json(r));
    json_object_object_add(o, "runtime", rt);
    return o;
}

bool workflow_from_json(json_object* o, Workflow* out, std::string* err) {
    auto fail = [&](const std::string& m) {
        if (err) *err = m;
        return false;
    };
    if (!o || !json_object_is_type(o, json_type_object) || !out) return fail("workflow must be an object");

    Workflow wf;
    if (!json_get_string(o, "workflow_id", &wf.workflow_id) || wf.workflow_id.empty()) {
        return fail("workflow_id missing");
    }
    std::string st;
    if (!json_get_string(o, "status", &st)) return fail("status missing");
    auto s = workflow_status_from_str(st);
    if (!s) return fail("unknown workflow status: " + st);
    wf.status = *s;

    json_get_int64(o, "version", &wf.version);
    json_get_int64(o, "created_at_ms", &wf.created_at_ms);
    json_get_int64(o, "updated_at_ms", &wf.updated_at_ms);
    json_get_int(o, "max_thinking_steps", &wf.max_thinking_steps);
    json_get_string(o, "initial_message", &wf.initial_message);
    json_get_string(o, "suspend_reason", &wf.suspend_reason);
    json_get_int(o, "failed_step", &wf.failed_step);
    json_get_int(o, "compensation_cursor", &wf.compensation_cursor);

    json_object* f = nullptr;
    if (json_object_object_get_ex(o, "failure", &f) && f) {
        ErrorRecord rec;
        if (!error_record_from_json(f, &rec)) return fail("bad failure record");
        wf.failure = std::move(rec);
    }

    json_object* steps = nullptr;
    if (!json_object_object_get_ex(o, "steps", &steps)) return fail("steps missing");
    if (!step_descriptors_from_json(steps, &wf.steps, err)) return false;

    json_object* rt = nullptr;
    if (!json_object_object_get_ex(o, "runtime", &rt) || !json_object_is_type(rt, json_type_array)) {
        return fail("runtime missing");
    }
    const size_t n = json_object_array_length(rt);
    if (n != wf.steps.size()) return fail("runtime length does not match steps");
    wf.runtime.resize(n);
    for (size_t i = 0; i < n; i++) {
        if (!step_runtime_from_json(json_object_array_get_idx(rt, i), &wf.runtime[i])) {
            return fail("bad runtime record at step " + std::to_string(i));
        }
    }

    *out = std::move(wf);
    return true;
}

// --- Snapshots ---

Snapshot snapshot_of(const Workflow& wf) {
    Snapshot s;
    s.workflow_id = wf.workflow_id;
    s.version = wf.version;
    s.status = wf.status;
    s.timestamp_ms = wf.updated_at_ms;
    s.body_json = json_mini::to_string_put(workflow_to_json(wf));
    return s;
}

bool workflow_from_snapshot(const Snapshot& s, Workflow* out, std::string* err) {
    json_mini::Doc d = json_mini::parse(s.body_json);
    if (!d) {
        if (err) *err = "snapshot body is not valid JSON";
        return false;
    }
    Workflow wf;
    if (!workflow_from_json(d.root, &wf, err)) return false;
    if (wf.workflow_id != s.workflow_id) {
        if (err) *err = "snapshot body belongs to '" + wf.workflow_id + "'";
        return false;
    }
    wf.version = s.version;
    *out = std::move(wf);
    return true;
}

json_object* snapshot_summary_to_json(const SnapshotSummary& s) {
    json_object* o = json_object_new_object();
    json_add_string(o, "workflow_id", s.workflow_id);
    json_object_object_add(o, "version", json_object_new_int64(s.version));
    json_object_object_add(o, "status", json_object_new_string(workflow_status_to_str(s.status)));
    json_object_object_add(o, "timestamp", json_object_new_string(iso_utc(s.timestamp_ms).c_str()));
    json_object_object_add(o, "timestamp_ms", json_object_new_int64(s.timestamp_ms));
    return o;
}

} // namespace agency
