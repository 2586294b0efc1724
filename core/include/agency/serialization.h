#pragma once

#include "workflow.h"

#include <json-c/json.h>

#include <string>
#include <vector>

namespace agency {

// --- JSON helpers (json-c wrappers) ---

bool json_get_string(json_object* o, const char* k, std::string* out);
bool json_get_bool(json_object* o, const char* k, bool* out);
bool json_get_int64(json_object* o, const char* k, int64_t* out);
bool json_get_int(json_object* o, const char* k, int* out);

// Adds a string member, keeping embedded NULs.
void json_add_string(json_object* o, const char* k, const std::string& v);

// Parses raw JSON into a new reference, falling back to a JSON string
// when the text is not valid JSON. Never returns nullptr.
json_object* json_from_text_or_string(const std::string& raw);

// --- Actions and step descriptors ---
//
// Action wire form:
//   {"name":"...","kind":"reasoning","instruction":"...","context":{...},"max_thinking_steps":0}
//   {"name":"...","kind":"tool","tool":"...","args":{...}}
//   {"name":"...","kind":"noop"}

json_object* action_to_json(const ActionRef& a);
bool action_from_json(json_object* o, ActionRef* out, std::string* err);

json_object* step_descriptor_to_json(const StepDescriptor& s);
bool step_descriptor_from_json(json_object* o, StepDescriptor* out, std::string* err);

// Parses a JSON array of step descriptors.
bool step_descriptors_from_json(json_object* arr, std::vector<StepDescriptor>* out, std::string* err);

// --- Runtime state ---

json_object* error_record_to_json(const ErrorRecord& e);
bool error_record_from_json(json_object* o, ErrorRecord* out);

json_object* step_runtime_to_json(const StepRuntime& r);
bool step_runtime_from_json(json_object* o, StepRuntime* out);

// Full workflow: descriptors + runtime + lifecycle fields.
json_object* workflow_to_json(const Workflow& wf);
bool workflow_from_json(json_object* o, Workflow* out, std::string* err);

// --- Snapshots ---

// Captures wf at wf.version.
Snapshot snapshot_of(const Workflow& wf);

// Rebuilds the workflow stored in a snapshot. The snapshot's version wins
// over any version recorded in the body.
bool workflow_from_snapshot(const Snapshot& s, Workflow* out, std::string* err);

json_object* snapshot_summary_to_json(const SnapshotSummary& s);

} // namespace agency
