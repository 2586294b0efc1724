#include "api_router.h"
#include "serve_http.h"

#include "agency/json_mini.h"
#include "agency/serialization.h"
#include "agency/types.h"
#include "agency/workflow_manager.h"

#include <json-c/json.h>

#include <iostream>
#include <sstream>

namespace agency {

namespace {

const std::string kWorkflows = "/api/v1/workflows";
const std::string kSnapshots = "/api/v1/workflows/snapshots";

HttpResponse json_reply(int code, json_object* o) {
    return HttpResponse{code, json_mini::to_string_put(o)};
}

HttpResponse error_reply(int code, const std::string& kind, const std::string& msg) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "ok", json_object_new_boolean(0));
    json_add_string(o, "error", msg);
    json_add_string(o, "kind", kind);
    return json_reply(code, o);
}

bool trim_body_empty(const std::string& body) {
    for (char c : body) {
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n') return false;
    }
    return true;
}

// Empty body reads as {}. Anything else must be a JSON object.
json_mini::Doc parse_body(const std::string& body) {
    if (trim_body_empty(body)) return json_mini::Doc{json_object_new_object()};
    json_mini::Doc d = json_mini::parse(body);
    if (!d.is_object()) throw ConfigurationError("request body must be a JSON object");
    return d;
}

int optional_int(json_object* o, const char* key, int defv) {
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, key, &v) || json_object_is_type(v, json_type_null)) return defv;
    if (!json_object_is_type(v, json_type_int)) throw ConfigurationError(std::string(key) + " must be an integer");
    return json_object_get_int(v);
}

bool optional_bool(json_object* o, const char* key, bool defv) {
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, key, &v) || json_object_is_type(v, json_type_null)) return defv;
    if (!json_object_is_type(v, json_type_boolean)) throw ConfigurationError(std::string(key) + " must be a boolean");
    return json_object_get_boolean(v) != 0;
}

std::string optional_string(json_object* o, const char* key) {
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, key, &v) || json_object_is_type(v, json_type_null)) return "";
    if (!json_object_is_type(v, json_type_string)) throw ConfigurationError(std::string(key) + " must be a string");
    return json_object_get_string(v);
}

// {workflow_id, status, response, completed, steps_executed, truncated, failure?}
json_object* run_summary_json(const WorkflowView& v) {
    json_object* o = json_object_new_object();
    json_add_string(o, "workflow_id", v.workflow_id);
    json_object_object_add(o, "status", json_object_new_string(workflow_status_to_str(v.status)));
    json_add_string(o, "response", v.output);
    json_object_object_add(o, "completed", json_object_new_boolean(v.status == WorkflowStatus::COMPLETED ? 1 : 0));
    json_object_object_add(o, "steps_executed", json_object_new_int(v.steps_executed));
    json_object_object_add(o, "truncated", json_object_new_boolean(v.truncated ? 1 : 0));
    json_object_object_add(o, "version", json_object_new_int64(v.version));
    if (!v.suspend_reason.empty()) json_add_string(o, "suspend_reason", v.suspend_reason);
    if (v.failure) json_object_object_add(o, "failure", error_record_to_json(*v.failure));
    return o;
}

json_object* short_status_json(const WorkflowView& v) {
    json_object* o = json_object_new_object();
    json_add_string(o, "workflow_id", v.workflow_id);
    json_object_object_add(o, "status", json_object_new_string(workflow_status_to_str(v.status)));
    json_object_object_add(o, "running", json_object_new_boolean(v.running ? 1 : 0));
    return o;
}

} // namespace

HttpRequest make_http_request(const std::string& head, const std::string& body) {
    HttpRequest req;
    std::istringstream iss(head);
    std::string ver;
    iss >> req.method >> req.path >> ver;
    auto q = req.path.find('?');
    if (q != std::string::npos) req.path.resize(q);
    while (req.path.size() > 1 && req.path.back() == '/') req.path.pop_back();
    req.head = head;
    req.body = body;
    return req;
}

int http_status_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CONFIGURATION: return 400;
        case ErrorKind::NOT_FOUND:     return 404;
        case ErrorKind::BUSY:
        case ErrorKind::REJECTED:      return 409;
        default:                       return 500;
    }
}

ApiRouter::ApiRouter(WorkflowManager& mgr, RouterOptions opts, std::function<void()> on_shutdown)
    : mgr_(mgr), opts_(std::move(opts)), on_shutdown_(std::move(on_shutdown)) {}

HttpResponse ApiRouter::handle(const HttpRequest& req) {
    const bool mutating = req.method == "POST" || req.method == "DELETE";

    if (req.method == "POST" && req.path == "/shutdown") {
        // Fail-closed: without a token nobody may stop the daemon over HTTP.
        if (opts_.api_token.empty()) return error_reply(403, "Forbidden", "shutdown disabled: no api token configured");
        if (!api_token_ok(req.head, opts_.api_token)) return error_reply(401, "Unauthorized", "unauthorized");
        if (on_shutdown_) on_shutdown_();
        json_object* o = json_object_new_object();
        json_object_object_add(o, "ok", json_object_new_boolean(1));
        json_add_string(o, "status", "shutting_down");
        return json_reply(200, o);
    }

    if (mutating) {
        if (opts_.api_token.empty()) {
            if (opts_.require_api_token) {
                return error_reply(403, "Forbidden", "api token required but not configured");
            }
        } else if (!api_token_ok(req.head, opts_.api_token)) {
            return error_reply(401, "Unauthorized", "unauthorized");
        }
    }

    try {
        return dispatch(req);
    } catch (const AgencyError& e) {
        const int code = http_status_for(e.kind());
        if (code >= 500) std::cerr << "[serve] " << req.method << " " << req.path << ": " << e.what() << "\n";
        return error_reply(code, error_kind_to_str(e.kind()), e.what());
    } catch (const std::exception& e) {
        std::cerr << "[serve] " << req.method << " " << req.path << ": " << e.what() << "\n";
        return error_reply(500, "Internal", e.what());
    }
}

HttpResponse ApiRouter::dispatch(const HttpRequest& req) {
    const std::string& m = req.method;
    const std::string& p = req.path;

    if (p == "/health" && m == "GET") return health();
    if (p == "/api/v1/agent/process" && m == "POST") return process(req.body);

    if (p == kSnapshots && m == "GET") return list_snapshots();
    if (p.starts_with(kSnapshots + "/")) {
        const std::string id = p.substr(kSnapshots.size() + 1);
        if (id.empty() || id.find('/') != std::string::npos) return error_reply(404, "NotFound", "not found");
        if (m == "GET") return get_snapshot(id);
        if (m == "DELETE") return delete_snapshot(id);
        return error_reply(405, "MethodNotAllowed", "method not allowed");
    }

    if (p == kWorkflows + "/resume" && m == "POST") {
        json_mini::Doc d = parse_body(req.body);
        const std::string id = optional_string(d.root, "workflow_id");
        if (id.empty()) throw ConfigurationError("workflow_id is required");
        return resume(id, req.body);
    }

    if (p == kWorkflows) {
        if (m == "GET") return list_workflows();
        if (m == "POST") return create_workflow(req.body);
        return error_reply(405, "MethodNotAllowed", "method not allowed");
    }

    if (p.starts_with(kWorkflows + "/")) {
        std::string rest = p.substr(kWorkflows.size() + 1);
        auto slash = rest.find('/');
        const std::string id = rest.substr(0, slash);
        const std::string action = slash == std::string::npos ? "" : rest.substr(slash + 1);
        if (id.empty()) return error_reply(404, "NotFound", "not found");
        if (action.empty() && m == "GET") return get_workflow(id);
        if (action == "suspend" && m == "POST") return suspend(id, req.body);
        if (action == "resume" && m == "POST") return resume(id, req.body);
    }

    return error_reply(404, "NotFound", "not found");
}

HttpResponse ApiRouter::health() {
    json_object* o = json_object_new_object();
    json_add_string(o, "status", "ok");
    json_add_string(o, "version", kAgencyVersion);
    json_object_object_add(o, "workflows", json_object_new_int64((int64_t)mgr_.size()));
    json_object_object_add(o, "suspend_resume", json_object_new_boolean(mgr_.suspend_resume_enabled() ? 1 : 0));
    return json_reply(200, o);
}

HttpResponse ApiRouter::process(const std::string& body) {
    json_mini::Doc d = parse_body(body);
    const std::string message = optional_string(d.root, "message");
    const int max_steps = optional_int(d.root, "max_steps", 0);

    ProcessResult r = mgr_.process(message, max_steps);

    json_object* o = json_object_new_object();
    json_add_string(o, "response", r.response);
    json_object_object_add(o, "steps_executed", json_object_new_int(r.steps_executed));
    json_object_object_add(o, "completed", json_object_new_boolean(r.completed ? 1 : 0));
    json_object_object_add(o, "truncated", json_object_new_boolean(r.truncated ? 1 : 0));
    json_object_object_add(o, "status", json_object_new_string(workflow_status_to_str(r.status)));
    if (r.failure) json_object_object_add(o, "failure", error_record_to_json(*r.failure));
    return json_reply(200, o);
}

HttpResponse ApiRouter::create_workflow(const std::string& body) {
    json_mini::Doc d = parse_body(body);
    const std::string id = optional_string(d.root, "workflow_id");
    const std::string message = optional_string(d.root, "initial_message");
    const int max_steps = optional_int(d.root, "max_steps", 0);
    const bool wait = optional_bool(d.root, "wait", false);

    json_object* steps = nullptr;
    const bool has_steps = json_object_object_get_ex(d.root, "steps", &steps) &&
                           !json_object_is_type(steps, json_type_null);

    WorkflowView v;
    if (has_steps) {
        if (!json_object_is_type(steps, json_type_array)) throw ConfigurationError("steps must be an array");
        std::vector<StepDescriptor> sd;
        std::string err;
        if (!step_descriptors_from_json(steps, &sd, &err)) throw ConfigurationError("invalid steps: " + err);
        v = mgr_.create_with_steps(id, std::move(sd), max_steps, message);
    } else {
        v = mgr_.create(id, message, max_steps);
    }

    if (wait) return json_reply(200, run_summary_json(mgr_.run(v.workflow_id)));
    return json_reply(202, short_status_json(mgr_.schedule(v.workflow_id)));
}

HttpResponse ApiRouter::list_workflows() {
    json_object* arr = json_object_new_array();
    for (const auto& v : mgr_.list()) json_object_array_add(arr, workflow_view_to_json(v, false));
    json_object* o = json_object_new_object();
    json_object_object_add(o, "workflows", arr);
    return json_reply(200, o);
}

HttpResponse ApiRouter::get_workflow(const std::string& id) {
    return json_reply(200, workflow_view_to_json(mgr_.get(id), true));
}

HttpResponse ApiRouter::suspend(const std::string& id, const std::string& body) {
    json_mini::Doc d = parse_body(body);
    std::string reason = optional_string(d.root, "reason");
    if (reason.empty()) reason = "api request";
    WorkflowView v = mgr_.suspend(id, reason);
    json_object* o = short_status_json(v);
    json_object_object_add(o, "suspend_requested", json_object_new_boolean(v.suspend_requested ? 1 : 0));
    return json_reply(200, o);
}

HttpResponse ApiRouter::resume(const std::string& id, const std::string& body) {
    json_mini::Doc d = parse_body(body);
    const bool wait = optional_bool(d.root, "wait", false);
    if (wait) return json_reply(200, run_summary_json(mgr_.resume(id)));
    WorkflowView v = mgr_.resume_async(id);
    // Terminal workflows are not queued; report them as they are.
    if (is_terminal(v.status)) return json_reply(200, run_summary_json(v));
    return json_reply(202, short_status_json(v));
}

HttpResponse ApiRouter::list_snapshots() {
    json_object* arr = json_object_new_array();
    for (const auto& s : mgr_.list_snapshots()) json_object_array_add(arr, snapshot_summary_to_json(s));
    return json_reply(200, arr);
}

HttpResponse ApiRouter::get_snapshot(const std::string& id) {
    auto s = mgr_.latest_snapshot(id);
    if (!s) throw NotFoundError("no snapshots for '" + id + "'");
    json_object* o = snapshot_summary_to_json(SnapshotSummary{s->workflow_id, s->version, s->status, s->timestamp_ms});
    json_object_object_add(o, "body", json_from_text_or_string(s->body_json));
    return json_reply(200, o);
}

HttpResponse ApiRouter::delete_snapshot(const std::string& id) {
    const int n = mgr_.delete_snapshots(id);
    json_object* o = json_object_new_object();
    json_add_string(o, "workflow_id", id);
    json_object_object_add(o, "deleted", json_object_new_int(n));
    return json_reply(200, o);
}

} // namespace agency
