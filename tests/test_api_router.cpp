#include "test_common.h"
#include "test_fakes.h"

#include "../runner/api_router.h"
#include "../runner/serve_http.h"
#include "agency/json_mini.h"
#include "agency/snapshot_store.h"
#include "agency/workflow_manager.h"

using namespace agency;
using namespace agency_test;

static HttpRequest request(const std::string& method, const std::string& path, const std::string& body = "",
                           const std::string& auth_header = "") {
    std::string head = method + " " + path + " HTTP/1.1\r\nHost: localhost\r\n";
    if (!auth_header.empty()) head += auth_header + "\r\n";
    head += "\r\n";
    return make_http_request(head, body);
}

static const std::string kToken = "X-API-Token: s3cret";

static std::string str(const HttpResponse& r, const char* key) {
    return json_mini::get_string(r.body, key).value_or("");
}

static void expect_code(const HttpResponse& r, int code, const std::string& msg) {
    if (r.code != code) die(msg + " (got " + std::to_string(r.code) + ": " + r.body + ")");
}

static LoopOptions quiet_options() {
    LoopOptions o;
    o.retry.max_retries = 1;
    o.use_memory = false;
    o.sleep_fn = [](int64_t) {};
    return o;
}

int main() {
    // Request line parsing and error mapping.
    {
        HttpRequest r = make_http_request("GET /api/v1/workflows/?limit=5 HTTP/1.1\r\nHost: x\r\n\r\n", "");
        expect_true(r.method == "GET" && r.path == "/api/v1/workflows", "query and trailing slash stripped");
        expect_eq_ll(http_status_for(ErrorKind::CONFIGURATION), 400, "400");
        expect_eq_ll(http_status_for(ErrorKind::NOT_FOUND), 404, "404");
        expect_eq_ll(http_status_for(ErrorKind::BUSY), 409, "409 busy");
        expect_eq_ll(http_status_for(ErrorKind::REJECTED), 409, "409 rejected");
        expect_eq_ll(http_status_for(ErrorKind::STORAGE), 500, "500");

        expect_true(api_token_ok("GET / HTTP/1.1\r\nAuthorization: Bearer abc\r\n\r\n", "abc"), "bearer token");
        expect_true(!api_token_ok("GET / HTTP/1.1\r\nx-api-token: abd\r\n\r\n", "abc"), "wrong token");
        expect_true(api_token_ok("GET / HTTP/1.1\r\n\r\n", ""), "no token configured");
    }

    MemorySnapshotStore store;
    ScriptedProvider model;
    ReasoningLoop loop(model, nullptr, nullptr, quiet_options());
    ManagerOptions mo;
    mo.enable_suspend_resume = true;
    mo.workers = 2;
    WorkflowManager mgr(store, loop, mo);
    mgr.start();

    int shutdowns = 0;
    RouterOptions ro;
    ro.api_token = "s3cret";
    ApiRouter api(mgr, ro, [&] { shutdowns++; });

    // Health and auth.
    {
        HttpResponse r = api.handle(request("GET", "/health"));
        expect_code(r, 200, "health");
        expect_true(str(r, "status") == "ok", "health status");
        expect_true(str(r, "version") == kAgencyVersion, "health version");
        expect_true(json_mini::get_bool(r.body, "suspend_resume").value_or(false), "suspend_resume flag");

        expect_code(api.handle(request("POST", "/api/v1/workflows", "{}")), 401, "mutation without token");
        expect_code(api.handle(request("POST", "/api/v1/workflows", "{}", "X-API-Token: wrong")), 401, "wrong token");
        expect_code(api.handle(request("GET", "/api/v1/workflows")), 200, "reads are open");

        expect_code(api.handle(request("POST", "/shutdown", "", "X-API-Token: wrong")), 401, "shutdown bad token");
        expect_eq_ll(shutdowns, 0, "no shutdown yet");
        HttpResponse s = api.handle(request("POST", "/shutdown", "", "Authorization: Bearer s3cret"));
        expect_code(s, 200, "shutdown with token");
        expect_true(str(s, "status") == "shutting_down", "shutdown status");
        expect_eq_ll(shutdowns, 1, "shutdown callback invoked");
    }

    // Fail-closed without a token.
    {
        RouterOptions open;
        ApiRouter anon(mgr, open);
        expect_code(anon.handle(request("POST", "/shutdown")), 403, "shutdown needs a configured token");
        expect_code(anon.handle(request("POST", "/api/v1/agent/process", "{\"message\":\"hi\"}")), 200,
                    "mutations allowed when no token is configured");

        RouterOptions strict;
        strict.require_api_token = true;
        ApiRouter locked(mgr, strict);
        HttpResponse r = locked.handle(request("POST", "/api/v1/agent/process", "{\"message\":\"hi\"}"));
        expect_code(r, 403, "token required but missing");
        expect_true(str(r, "kind") == "Forbidden", "forbidden kind");
        expect_code(locked.handle(request("GET", "/health")), 200, "reads still open");
    }

    // Ad-hoc processing.
    {
        HttpResponse r = api.handle(request("POST", "/api/v1/agent/process", "{\"message\":\"hello\",\"max_steps\":2}", kToken));
        expect_code(r, 200, "process");
        expect_true(str(r, "response") == "done", "process response");
        expect_true(json_mini::get_bool(r.body, "completed").value_or(false), "process completed");
        expect_true(str(r, "status") == "Completed", "process status");

        r = api.handle(request("POST", "/api/v1/agent/process", "{\"message\":\"\"}", kToken));
        expect_code(r, 400, "empty message");
        expect_true(str(r, "kind") == "Configuration", "configuration kind");
        expect_true(!json_mini::get_bool(r.body, "ok").value_or(true), "ok false");

        expect_code(api.handle(request("POST", "/api/v1/agent/process", "{\"message\":\"x\",\"max_steps\":\"2\"}", kToken)),
                    400, "wrong field type");
        expect_code(api.handle(request("POST", "/api/v1/agent/process", "[1]", kToken)), 400, "non-object body");
        expect_code(api.handle(request("POST", "/api/v1/agent/process", "{oops", kToken)), 400, "malformed body");
    }

    // Workflow creation, synchronous and queued.
    {
        HttpResponse r = api.handle(request("POST", "/api/v1/workflows",
                                            "{\"workflow_id\":\"sync\",\"initial_message\":\"plan\",\"wait\":true}", kToken));
        expect_code(r, 200, "create and wait");
        expect_true(str(r, "status") == "Completed" && str(r, "response") == "done", "synchronous result");
        expect_eq_ll(json_mini::get_int(r.body, "steps_executed").value_or(0), 1, "steps executed");

        r = api.handle(request("POST", "/api/v1/workflows",
                               "{\"workflow_id\":\"sync\",\"initial_message\":\"again\"}", kToken));
        expect_code(r, 400, "duplicate id");

        r = api.handle(request("POST", "/api/v1/workflows",
                               "{\"workflow_id\":\"queued\",\"initial_message\":\"later\"}", kToken));
        expect_code(r, 202, "create queued");
        expect_true(str(r, "workflow_id") == "queued", "queued id");
        expect_true(mgr.wait("queued", 5000).status == WorkflowStatus::COMPLETED, "queued run completes");

        r = api.handle(request("POST", "/api/v1/workflows",
            "{\"workflow_id\":\"multi\",\"wait\":true,\"steps\":["
            "{\"name\":\"one\",\"forward\":{\"kind\":\"reasoning\",\"instruction\":\"first\"}},"
            "{\"name\":\"two\",\"forward\":{\"kind\":\"noop\"}}]}", kToken));
        expect_code(r, 200, "multi-step create");
        expect_eq_ll(json_mini::get_int(r.body, "steps_executed").value_or(0), 2, "both steps executed");

        r = api.handle(request("POST", "/api/v1/workflows",
            "{\"workflow_id\":\"bad\",\"steps\":[{\"forward\":{\"kind\":\"warp\"}}]}", kToken));
        expect_code(r, 400, "invalid steps");
        expect_code(api.handle(request("POST", "/api/v1/workflows", "{\"workflow_id\":\"bad\",\"steps\":{}}", kToken)),
                    400, "steps must be an array");
    }

    // Queries.
    {
        HttpResponse r = api.handle(request("GET", "/api/v1/workflows/multi"));
        expect_code(r, 200, "get workflow");
        expect_true(str(r, "status") == "Completed", "workflow status");
        expect_true(r.body.find("\"steps\":[") != std::string::npos, "steps listed");

        r = api.handle(request("GET", "/api/v1/workflows/ghost"));
        expect_code(r, 404, "unknown workflow");
        expect_true(str(r, "kind") == "NotFound", "not found kind");

        r = api.handle(request("GET", "/api/v1/workflows"));
        json_mini::Doc d = json_mini::parse(r.body);
        json_object* arr = json_mini::member(d, "workflows");
        expect_true(arr && json_object_array_length(arr) == 3, "three workflows listed");

        expect_code(api.handle(request("PUT", "/api/v1/workflows", "", kToken)), 405, "method not allowed");
        expect_code(api.handle(request("GET", "/nowhere")), 404, "unknown route");
    }

    // Suspend and resume.
    {
        mgr.create("idle", "not yet", 0);
        HttpResponse r = api.handle(request("POST", "/api/v1/workflows/idle/suspend", "{\"reason\":\"hold\"}", kToken));
        expect_code(r, 200, "suspend");
        expect_true(str(r, "status") == "Suspended", "suspended");
        expect_true(mgr.get("idle").suspend_reason == "hold", "reason stored");

        r = api.handle(request("POST", "/api/v1/workflows/sync/suspend", "", kToken));
        expect_code(r, 409, "suspend finished workflow");
        expect_true(str(r, "kind") == "Rejected", "rejected kind");

        r = api.handle(request("POST", "/api/v1/workflows/resume", "{\"workflow_id\":\"idle\",\"wait\":true}", kToken));
        expect_code(r, 200, "resume and wait");
        expect_true(str(r, "status") == "Completed", "resumed to completion");

        r = api.handle(request("POST", "/api/v1/workflows/idle/resume", "", kToken));
        expect_code(r, 200, "resume of finished workflow reports it");
        expect_true(json_mini::get_bool(r.body, "completed").value_or(false), "already completed");

        mgr.create("later", "resume me", 0);
        expect_code(api.handle(request("POST", "/api/v1/workflows/later/suspend", "{}", kToken)), 200, "suspend later");
        r = api.handle(request("POST", "/api/v1/workflows/later/resume", "{}", kToken));
        expect_code(r, 202, "async resume accepted");
        expect_true(mgr.wait("later", 5000).status == WorkflowStatus::COMPLETED, "async resume completes");

        expect_code(api.handle(request("POST", "/api/v1/workflows/resume", "{}", kToken)), 400, "resume needs an id");
        expect_code(api.handle(request("POST", "/api/v1/workflows/ghost/resume", "{}", kToken)), 404, "resume unknown");
    }

    // Snapshots.
    {
        HttpResponse r = api.handle(request("GET", "/api/v1/workflows/snapshots"));
        expect_code(r, 200, "list snapshots");
        json_mini::Doc d = json_mini::parse(r.body);
        expect_true(d.root && json_object_is_type(d.root, json_type_array) && json_object_array_length(d.root) > 0,
                    "snapshot summaries");

        r = api.handle(request("GET", "/api/v1/workflows/snapshots/sync"));
        expect_code(r, 200, "latest snapshot");
        expect_true(str(r, "status") == "Completed", "snapshot status");
        expect_true(json_mini::has_key(r.body, "body"), "snapshot body included");

        mgr.create("pending", "keep", 0);
        r = api.handle(request("DELETE", "/api/v1/workflows/snapshots/pending", "", kToken));
        expect_code(r, 409, "pending workflow cannot be deleted");

        expect_code(api.handle(request("DELETE", "/api/v1/workflows/snapshots/sync")), 401, "delete needs token");
        r = api.handle(request("DELETE", "/api/v1/workflows/snapshots/sync", "", kToken));
        expect_code(r, 200, "delete snapshots");
        expect_true(json_mini::get_int(r.body, "deleted").value_or(0) >= 1, "deleted count");
        expect_code(api.handle(request("GET", "/api/v1/workflows/snapshots/sync")), 404, "snapshot gone");
        expect_code(api.handle(request("DELETE", "/api/v1/workflows/snapshots/sync", "", kToken)), 404, "delete twice");
    }

    // Suspend/resume disabled.
    {
        MemorySnapshotStore store2;
        ManagerOptions off;
        WorkflowManager mgr2(store2, loop, off);
        mgr2.create("w", "x", 0);
        ApiRouter api2(mgr2, RouterOptions{});
        HttpResponse r = api2.handle(request("POST", "/api/v1/workflows/w/suspend", "{}"));
        expect_code(r, 409, "suspend disabled");
        expect_code(api2.handle(request("POST", "/api/v1/workflows/w/resume", "{}")), 409, "resume disabled");
        mgr2.shutdown();
    }

    mgr.shutdown();
    std::cerr << "test_api_router: ALL PASSED" << std::endl;
    return 0;
}
