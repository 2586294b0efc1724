#pragma once

#include "agency/errors.h"

#include <functional>
#include <string>

namespace agency {

class WorkflowManager;

struct HttpRequest {
    std::string method;
    std::string path;       // without query string
    std::string head;       // raw request line and headers
    std::string body;
};

struct HttpResponse {
    int code{200};
    std::string body;
};

struct RouterOptions {
    std::string api_token;
    bool require_api_token{false};
};

// Parses the request line of `head` into method and path.
HttpRequest make_http_request(const std::string& head, const std::string& body);

// HTTP status for an error kind: 400 configuration, 404 not found,
// 409 busy/rejected, 500 otherwise.
int http_status_for(ErrorKind kind);

// Routes the daemon's JSON API onto a WorkflowManager.
//
// GET routes are open. POST and DELETE routes need the API token when one
// is configured; with require_api_token and no token they are refused (403).
// POST /shutdown is refused unless a token is configured.
class ApiRouter {
public:
    ApiRouter(WorkflowManager& mgr, RouterOptions opts, std::function<void()> on_shutdown = {});

    HttpResponse handle(const HttpRequest& req);

private:
    WorkflowManager& mgr_;
    RouterOptions opts_;
    std::function<void()> on_shutdown_;

    HttpResponse dispatch(const HttpRequest& req);
    HttpResponse health();
    HttpResponse process(const std::string& body);
    HttpResponse create_workflow(const std::string& body);
    HttpResponse list_workflows();
    HttpResponse get_workflow(const std::string& id);
    HttpResponse suspend(const std::string& id, const std::string& body);
    HttpResponse resume(const std::string& id, const std::string& body);
    HttpResponse list_snapshots();
    HttpResponse get_snapshot(const std::string& id);
    HttpResponse delete_snapshot(const std::string& id);
};

} // namespace agency
