#include "agency/provider.h"
#include "agency/config.h"
#include "agency/json_mini.h"
#include "agency/serialization.h"
#include "agency/util.h"

#include <json-c/json.h>

#include <sstream>

namespace agency {

std::string model_request_to_json(const ModelRequest& req) {
    json_object* root = json_object_new_object();
    json_add_string(root, "system", req.system);

    json_object* msgs = json_object_new_array();
    for (const auto& m : req.messages) {
        json_object* o = json_object_new_object();
        json_add_string(o, "role", m.role);
        json_add_string(o, "content", m.content);
        json_object_array_add(msgs, o);
    }
    json_object_object_add(root, "messages", msgs);

    json_object* tools = json_object_new_array();
    for (const auto& t : req.tools) json_object_array_add(tools, json_object_new_string(t.c_str()));
    json_object_object_add(root, "tools", tools);
    json_object_object_add(root, "iteration", json_object_new_int(req.iteration));
    return json_mini::to_string_put(root);
}

std::string first_json_line(const std::string& output) {
    std::istringstream iss(output);
    std::string line;
    while (std::getline(iss, line)) {
        auto p = line.find('{');
        if (p != std::string::npos && line.rfind('}') != std::string::npos) {
            return trim_ws(line.substr(p));
        }
    }
    return trim_ws(output);
}

ModelResponse parse_model_reply(const std::string& line) {
    ModelResponse r;
    json_mini::Doc d = json_mini::parse(line);
    if (!d.is_object()) {
        r.status = CallStatus::PERMANENT_ERROR;
        r.error = "malformed driver reply";
        return r;
    }
    std::string type;
    if (!json_get_string(d.root, "type", &type)) {
        r.status = CallStatus::PERMANENT_ERROR;
        r.error = "driver reply missing type";
        return r;
    }

    if (type == "final" || type == "thought") {
        r.kind = (type == "final") ? ReplyKind::FINAL : ReplyKind::THOUGHT;
        if (!json_get_string(d.root, "content", &r.text)) {
            r.status = CallStatus::PERMANENT_ERROR;
            r.error = "driver reply missing content";
        }
        return r;
    }
    if (type == "tool_call") {
        r.kind = ReplyKind::TOOL_CALL;
        if (!json_get_string(d.root, "tool", &r.tool) || r.tool.empty()) {
            r.status = CallStatus::PERMANENT_ERROR;
            r.error = "tool_call without tool";
            return r;
        }
        json_object* args = json_mini::member(d, "args");
        if (args) {
            if (!json_object_is_type(args, json_type_object)) {
                r.status = CallStatus::PERMANENT_ERROR;
                r.error = "tool_call args must be an object";
                return r;
            }
            r.tool_args_json = json_mini::to_string(args);
        }
        return r;
    }
    if (type == "error") {
        bool transient = false;
        (void)json_get_bool(d.root, "transient", &transient);
        r.status = transient ? CallStatus::TRANSIENT_ERROR : CallStatus::PERMANENT_ERROR;
        if (!json_get_string(d.root, "error", &r.error) || r.error.empty()) r.error = "driver error";
        return r;
    }

    r.status = CallStatus::PERMANENT_ERROR;
    r.error = "unknown driver reply type: " + type;
    return r;
}

ProcessModelProvider::ProcessModelProvider(std::string cmd, ProcLimits lim, int fail_threshold, int64_t cooldown_ms)
    : cmd_(std::move(cmd)), lim_(lim), fail_threshold_(fail_threshold < 1 ? 1 : fail_threshold),
      cooldown_ms_(cooldown_ms < 0 ? 0 : cooldown_ms) {
    argv_ = split_argv_quoted(cmd_);
}

bool ProcessModelProvider::breaker_open() const {
    return disabled_until_ms_.load() > now_ms();
}

ModelResponse ProcessModelProvider::mark_failure(CallStatus st, const std::string& why) {
    if (++consecutive_fail_ >= fail_threshold_) {
        disabled_until_ms_ = now_ms() + cooldown_ms_;
    }
    ModelResponse r;
    r.status = st;
    r.error = why;
    return r;
}

ModelResponse ProcessModelProvider::complete(const ModelRequest& req) {
    if (argv_.empty()) {
        ModelResponse r;
        r.status = CallStatus::PERMANENT_ERROR;
        r.error = "model command is empty or unparseable: " + cmd_;
        return r;
    }
    // Breaker open: do not spawn, let the caller back off.
    if (breaker_open()) {
        ModelResponse r;
        r.status = CallStatus::TRANSIENT_ERROR;
        r.error = "model driver circuit open";
        return r;
    }

    ProcResult pr;
    bool started = proc_run_capture(argv_, "", model_request_to_json(req), lim_, &pr);
    if (!started) return mark_failure(CallStatus::TRANSIENT_ERROR, "driver not started: " + pr.error);
    if (pr.timed_out) return mark_failure(CallStatus::TRANSIENT_ERROR, "driver timed out");
    if (pr.exit_code == kExecFailedExit) {
        return mark_failure(CallStatus::TRANSIENT_ERROR, "driver exec failed: " + trim_ws(pr.err));
    }
    if (pr.exit_code == kDriverTempFailExit) {
        return mark_failure(CallStatus::TRANSIENT_ERROR, "driver temporary failure: " + trim_ws(pr.err));
    }
    if (pr.exit_code != 0) {
        return mark_failure(CallStatus::PERMANENT_ERROR,
                            "driver exit_code=" + std::to_string(pr.exit_code) + ": " + trim_ws(pr.err));
    }

    ModelResponse r = parse_model_reply(first_json_line(pr.out));
    if (r.status != CallStatus::OK) return mark_failure(r.status, r.error);

    consecutive_fail_ = 0;
    disabled_until_ms_ = 0;
    return r;
}

ModelResponse OfflineModelProvider::complete(const ModelRequest& req) {
    std::string task;
    for (const auto& m : req.messages) {
        if (m.role == "user") {
            task = m.content;
            break;
        }
    }
    ModelResponse r;
    r.kind = ReplyKind::FINAL;
    r.text = "Processed: " + task;
    return r;
}

std::unique_ptr<IModelProvider> make_model_provider(const AgencyConfig& cfg) {
    if (trim_ws(cfg.model_cmd).empty()) return std::make_unique<OfflineModelProvider>();
    ProcLimits lim;
    lim.timeout_ms = cfg.model_timeout_ms;
    lim.stdout_max_bytes = 1024 * 1024;
    lim.rlimit_as_mb = 0;     // drivers may load large runtimes
    lim.rlimit_nofile = 256;
    return std::make_unique<ProcessModelProvider>(cfg.model_cmd, lim, cfg.fail_threshold, cfg.cooldown_ms);
}

} // namespace agency
