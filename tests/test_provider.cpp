#include "test_common.h"
#include "test_fakes.h"

#include "agency/config.h"
#include "agency/json_mini.h"
#include "agency/provider.h"
#include "agency/util.h"

#include <fstream>

using namespace agency;
namespace fs = std::filesystem;

static std::string write_script(const fs::path& dir, const std::string& name, const std::string& body) {
    fs::path p = dir / name;
    std::ofstream out(p);
    out << "#!/bin/sh\n" << body << "\n";
    return p.string();
}

static ModelRequest sample_request() {
    ModelRequest req;
    req.system = "be brief";
    req.messages.push_back({"user", "what time is it?"});
    req.messages.push_back({"assistant", "let me check"});
    req.tools = {"datetime"};
    req.iteration = 1;
    return req;
}

static ProcLimits limits(int timeout_ms = 5000) {
    ProcLimits lim;
    lim.timeout_ms = timeout_ms;
    return lim;
}

int main() {
    // Reply parsing.
    {
        ModelResponse r = parse_model_reply("{\"type\":\"final\",\"content\":\"done\"}");
        expect_true(r.status == CallStatus::OK && r.kind == ReplyKind::FINAL && r.text == "done", "final");
        r = parse_model_reply("{\"type\":\"thought\",\"content\":\"hmm\"}");
        expect_true(r.kind == ReplyKind::THOUGHT && r.text == "hmm", "thought");
        r = parse_model_reply("{\"type\":\"tool_call\",\"tool\":\"datetime\",\"args\":{\"offset_ms\":5}}");
        expect_true(r.kind == ReplyKind::TOOL_CALL && r.tool == "datetime", "tool call");
        expect_eq_ll(json_mini::get_int(r.tool_args_json, "offset_ms").value_or(0), 5, "tool args");
        r = parse_model_reply("{\"type\":\"tool_call\",\"tool\":\"datetime\"}");
        expect_true(r.status == CallStatus::OK && r.tool_args_json == "{}", "tool args default");

        r = parse_model_reply("{\"type\":\"error\",\"transient\":true,\"error\":\"rate limited\"}");
        expect_true(r.status == CallStatus::TRANSIENT_ERROR && r.error == "rate limited", "transient error");
        r = parse_model_reply("{\"type\":\"error\"}");
        expect_true(r.status == CallStatus::PERMANENT_ERROR && r.error == "driver error", "permanent by default");

        expect_true(parse_model_reply("not json").status == CallStatus::PERMANENT_ERROR, "malformed");
        expect_true(parse_model_reply("{\"content\":\"x\"}").status == CallStatus::PERMANENT_ERROR, "missing type");
        expect_true(parse_model_reply("{\"type\":\"final\"}").status == CallStatus::PERMANENT_ERROR, "missing content");
        expect_true(parse_model_reply("{\"type\":\"tool_call\",\"tool\":\"x\",\"args\":[1]}").status ==
                        CallStatus::PERMANENT_ERROR, "array args");
        r = parse_model_reply("{\"type\":\"sing\"}");
        expect_true(r.error.find("sing") != std::string::npos, "unknown type named");

        expect_true(first_json_line("loading model...\n{\"type\":\"final\"}\ntrailer\n") == "{\"type\":\"final\"}",
                    "first JSON line wins");
        expect_true(first_json_line("  plain  ") == "plain", "no JSON: trimmed output");
    }

    // Request wire format.
    {
        std::string text = model_request_to_json(sample_request());
        json_mini::Doc d = json_mini::parse(text);
        expect_true(d.is_object(), "request is an object");
        expect_true(json_mini::get_string(text, "system").value_or("") == "be brief", "system");
        expect_eq_ll(json_mini::get_int(text, "iteration").value_or(-1), 1, "iteration");
        json_object* msgs = json_mini::member(d, "messages");
        expect_true(msgs && json_object_array_length(msgs) == 2, "messages");
        json_object* tools = json_mini::member(d, "tools");
        expect_true(tools && json_object_array_length(tools) == 1, "tools");
    }

    agency_test::TempDir tmp("provider");
    const std::string req_file = (tmp.path() / "request.json").string();

    // A driver that logs to stdout before answering.
    {
        std::string script = write_script(tmp.path(), "ok.sh",
            "cat > \"$1\"\n"
            "echo 'driver warming up'\n"
            "echo '{\"type\":\"final\",\"content\":\"It is noon.\"}'");
        ProcessModelProvider p("/bin/sh " + script + " " + req_file, limits(), 3, 1000);
        ModelResponse r = p.complete(sample_request());
        expect_true(r.status == CallStatus::OK, "driver ok: " + r.error);
        expect_true(r.text == "It is noon.", "driver answer");
        auto sent = slurp_file(req_file);
        expect_true(sent && json_mini::get_string(*sent, "system").value_or("") == "be brief", "request on stdin");
    }

    // Exit code classification.
    {
        std::string tempfail = write_script(tmp.path(), "tempfail.sh", "cat >/dev/null\necho busy >&2\nexit 75");
        ProcessModelProvider p("/bin/sh " + tempfail, limits(), 10, 1000);
        ModelResponse r = p.complete(sample_request());
        expect_true(r.status == CallStatus::TRANSIENT_ERROR, "exit 75 is transient");

        std::string perm = write_script(tmp.path(), "perm.sh", "cat >/dev/null\necho 'bad key' >&2\nexit 2");
        ProcessModelProvider p2("/bin/sh " + perm, limits(), 10, 1000);
        r = p2.complete(sample_request());
        expect_true(r.status == CallStatus::PERMANENT_ERROR, "exit 2 is permanent");
        expect_true(r.error.find("bad key") != std::string::npos, "stderr in error");

        std::string garbage = write_script(tmp.path(), "garbage.sh", "cat >/dev/null\necho 'no json here'");
        ProcessModelProvider p3("/bin/sh " + garbage, limits(), 10, 1000);
        expect_true(p3.complete(sample_request()).status == CallStatus::PERMANENT_ERROR, "malformed output");

        std::string slow = write_script(tmp.path(), "slow.sh", "sleep 5");
        ProcessModelProvider p4("/bin/sh " + slow, limits(200), 10, 1000);
        r = p4.complete(sample_request());
        expect_true(r.status == CallStatus::TRANSIENT_ERROR && r.error == "driver timed out", "timeout is transient");

        ProcessModelProvider p5("/nonexistent/driver", limits(), 10, 1000);
        expect_true(p5.complete(sample_request()).status == CallStatus::TRANSIENT_ERROR, "exec failure is transient");

        ProcessModelProvider p6("'unbalanced", limits(), 10, 1000);
        expect_true(p6.complete(sample_request()).status == CallStatus::PERMANENT_ERROR, "unparseable command");
    }

    // Consecutive failures open the breaker; no spawn until the cooldown ends.
    {
        const std::string marker = (tmp.path() / "spawned").string();
        std::string script = write_script(tmp.path(), "count.sh",
            "cat >/dev/null\necho x >> \"$1\"\nexit 75");
        ProcessModelProvider p("/bin/sh " + script + " " + marker, limits(), 2, 60000);
        (void)p.complete(sample_request());
        expect_true(!p.breaker_open(), "one failure keeps the breaker closed");
        (void)p.complete(sample_request());
        expect_true(p.breaker_open(), "threshold opens the breaker");
        ModelResponse r = p.complete(sample_request());
        expect_true(r.status == CallStatus::TRANSIENT_ERROR && r.error == "model driver circuit open", "open breaker");
        auto spawned = slurp_file(marker);
        expect_true(spawned && spawned->size() == 4, "driver spawned only twice");
    }

    // Offline provider and factory.
    {
        OfflineModelProvider off;
        ModelResponse r = off.complete(sample_request());
        expect_true(r.kind == ReplyKind::FINAL && r.text == "Processed: what time is it?", "offline echo");

        AgencyConfig cfg;
        expect_true(make_model_provider(cfg)->name() == "offline", "no command: offline");
        cfg.model_cmd = "/bin/true";
        expect_true(make_model_provider(cfg)->name() == "process", "command: process driver");
    }

    std::cerr << "test_provider: ALL PASSED" << std::endl;
    return 0;
}
