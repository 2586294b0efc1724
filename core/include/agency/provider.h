#pragma once
#include "proc.h"
#include "types.h"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace agency {

struct AgencyConfig;

struct ChatMessage {
    std::string role;     // system | user | assistant | tool
    std::string content;
};

struct ModelRequest {
    std::string system;
    std::vector<ChatMessage> messages;
    std::vector<std::string> tools;   // names the model may call; empty = none
    int iteration{0};
};

enum class ReplyKind { FINAL, THOUGHT, TOOL_CALL };

struct ModelResponse {
    CallStatus status{CallStatus::OK};
    ReplyKind kind{ReplyKind::FINAL};
    std::string text;                 // FINAL / THOUGHT content
    std::string tool;                 // TOOL_CALL
    std::string tool_args_json{"{}"};
    std::string error;                // set when status != OK
};

// Model provider seam. Implementations never throw; failures are reported
// through ModelResponse::status.
class IModelProvider {
public:
    virtual ~IModelProvider() = default;
    virtual ModelResponse complete(const ModelRequest& req) = 0;
    virtual std::string name() const = 0;
};

// Driver exit code for "try again later".
constexpr int kDriverTempFailExit = 75;

// Runs an external driver per request.
//
// stdin:  {"system":...,"messages":[{"role","content"}],"tools":[...],"iteration":N}
// stdout: first JSON object line, one of
//   {"type":"final","content":...}
//   {"type":"thought","content":...}
//   {"type":"tool_call","tool":...,"args":{...}}
//   {"type":"error","transient":bool,"error":...}
//
// Spawn failure, timeout and exit 75 are transient; other failures are
// permanent. After fail_threshold consecutive failures the provider answers
// TRANSIENT_ERROR without spawning until cooldown_ms has elapsed.
class ProcessModelProvider final : public IModelProvider {
public:
    ProcessModelProvider(std::string cmd, ProcLimits lim, int fail_threshold, int64_t cooldown_ms);

    ModelResponse complete(const ModelRequest& req) override;
    std::string name() const override { return "process"; }

    bool breaker_open() const;

private:
    std::string cmd_;
    std::vector<std::string> argv_;
    ProcLimits lim_;
    int fail_threshold_;
    int64_t cooldown_ms_;
    std::atomic<int> consecutive_fail_{0};
    std::atomic<int64_t> disabled_until_ms_{0};

    ModelResponse mark_failure(CallStatus st, const std::string& why);
};

// Used when no driver command is configured: always returns a final answer
// echoing the task.
class OfflineModelProvider final : public IModelProvider {
public:
    ModelResponse complete(const ModelRequest& req) override;
    std::string name() const override { return "offline"; }
};

// Serializes the driver request.
std::string model_request_to_json(const ModelRequest& req);

// Picks the first line of driver output that holds a JSON object.
std::string first_json_line(const std::string& output);

// Parses one driver reply line. Malformed replies yield PERMANENT_ERROR.
ModelResponse parse_model_reply(const std::string& line);

std::unique_ptr<IModelProvider> make_model_provider(const AgencyConfig& cfg);

} // namespace agency
