#include "cmds.h"
#include "runtime.h"

#include "agency/json_mini.h"
#include "agency/serialization.h"
#include "agency/util.h"

#include <json-c/json.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace agency;

namespace {

struct CliArgs {
    std::string config_path;
    int max_steps{0};
    std::vector<std::string> positional;
};

// Flags may appear anywhere after the subcommand.
bool parse_cli(int argc, char** argv, CliArgs* out) {
    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) { out->config_path = argv[++i]; continue; }
        if (a == "--max-steps" && i + 1 < argc) { out->max_steps = std::atoi(argv[++i]); continue; }
        if (a.rfind("--", 0) == 0) return false;
        out->positional.push_back(a);
    }
    return true;
}

// One-shot runtime: no worker pool, Pending workflows are left alone.
std::unique_ptr<Runtime> open_runtime(const std::string& config_path) {
    apply_profile_defaults(detect_profile());
    AgencyConfig cfg = load_config(config_path);
    return build_runtime(cfg, false);
}

void print_json(json_object* o) {
    std::cout << json_object_to_json_string_ext(o, JSON_C_TO_STRING_PRETTY) << "\n";
    json_object_put(o);
}

int exit_code_for(const WorkflowView& v) {
    if (v.status == WorkflowStatus::COMPLETED) return 0;
    if (v.status == WorkflowStatus::SUSPENDED) return 3;
    return 1;
}

template <typename Fn>
int guarded(const char* cmd, Fn&& fn) {
    try {
        return fn();
    } catch (const ConfigurationError& e) {
        std::cerr << "[" << cmd << "] " << e.what() << "\n";
        return 2;
    } catch (const AgencyError& e) {
        std::cerr << "[" << cmd << "] " << error_kind_to_str(e.kind()) << ": " << e.what() << "\n";
        return 1;
    }
}

} // namespace

int cmd_process(int argc, char** argv) {
    CliArgs args;
    if (!parse_cli(argc, argv, &args) || args.positional.size() != 1) {
        std::cerr << "usage: agency_cli process <message> [--max-steps N] [--config F]\n";
        return 2;
    }
    return guarded("process", [&] {
        auto rt = open_runtime(args.config_path);
        ProcessResult r = rt->manager->process(args.positional[0], args.max_steps);

        json_object* o = json_object_new_object();
        json_add_string(o, "response", r.response);
        json_object_object_add(o, "steps_executed", json_object_new_int(r.steps_executed));
        json_object_object_add(o, "completed", json_object_new_boolean(r.completed ? 1 : 0));
        json_object_object_add(o, "truncated", json_object_new_boolean(r.truncated ? 1 : 0));
        json_object_object_add(o, "status", json_object_new_string(workflow_status_to_str(r.status)));
        if (r.failure) json_object_object_add(o, "failure", error_record_to_json(*r.failure));
        print_json(o);
        return r.completed ? 0 : 1;
    });
}

// Workflow file: {"workflow_id", "initial_message" | "steps":[...], "max_steps"}
int cmd_run(int argc, char** argv) {
    CliArgs args;
    if (!parse_cli(argc, argv, &args) || args.positional.size() != 1) {
        std::cerr << "usage: agency_cli run <workflow.json> [--config F]\n";
        return 2;
    }
    return guarded("run", [&] {
        auto text = slurp_file(args.positional[0]);
        if (!text) throw ConfigurationError("cannot read " + args.positional[0]);
        json_mini::Doc d = json_mini::parse(*text);
        if (!d.is_object()) throw ConfigurationError(args.positional[0] + " is not a JSON object");

        std::string id;
        std::string message;
        int max_steps = args.max_steps;
        json_get_string(d.root, "workflow_id", &id);
        json_get_string(d.root, "initial_message", &message);
        json_get_int(d.root, "max_steps", &max_steps);

        auto rt = open_runtime(args.config_path);
        rt->manager->recover();

        json_object* steps = json_mini::member(d, "steps");
        if (steps) {
            std::vector<StepDescriptor> sd;
            std::string err;
            if (!step_descriptors_from_json(steps, &sd, &err)) throw ConfigurationError("invalid steps: " + err);
            rt->manager->create_with_steps(id, std::move(sd), max_steps, message);
        } else {
            rt->manager->create(id, message, max_steps);
        }
        WorkflowView v = rt->manager->run(id);
        print_json(workflow_view_to_json(v, true));
        return exit_code_for(v);
    });
}

int cmd_resume(int argc, char** argv) {
    CliArgs args;
    if (!parse_cli(argc, argv, &args) || args.positional.size() != 1) {
        std::cerr << "usage: agency_cli resume <workflow_id> [--config F]\n";
        return 2;
    }
    return guarded("resume", [&] {
        auto rt = open_runtime(args.config_path);
        rt->manager->recover();
        WorkflowView v = rt->manager->resume(args.positional[0]);
        print_json(workflow_view_to_json(v, true));
        return exit_code_for(v);
    });
}

// Without an id: every stored snapshot. With an id: the latest one in full.
int cmd_snapshots(int argc, char** argv) {
    CliArgs args;
    if (!parse_cli(argc, argv, &args) || args.positional.size() > 1) {
        std::cerr << "usage: agency_cli snapshots [workflow_id] [--config F]\n";
        return 2;
    }
    return guarded("snapshots", [&] {
        auto rt = open_runtime(args.config_path);
        if (args.positional.empty()) {
            json_object* arr = json_object_new_array();
            for (const auto& s : rt->manager->list_snapshots()) json_object_array_add(arr, snapshot_summary_to_json(s));
            print_json(arr);
            return 0;
        }
        auto s = rt->manager->latest_snapshot(args.positional[0]);
        if (!s) throw NotFoundError("no snapshots for '" + args.positional[0] + "'");
        json_object* o = snapshot_summary_to_json(SnapshotSummary{s->workflow_id, s->version, s->status, s->timestamp_ms});
        json_object_object_add(o, "body", json_from_text_or_string(s->body_json));
        print_json(o);
        return 0;
    });
}
