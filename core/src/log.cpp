#include "agency/log.h"
#include "agency/hash.h"
#include "agency/json_mini.h"
#include "agency/types.h"
#include "agency/util.h"

#include <json-c/json.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace agency {

static void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) {
        out << "null";
        return;
    }
    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());
        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            json_object* ks = json_object_new_string(keys[i].c_str());
            out << json_object_to_json_string_ext(ks, JSON_C_TO_STRING_PLAIN);
            json_object_put(ks);
            out << ":";
            json_object* val = nullptr;
            json_object_object_get_ex(obj, keys[i].c_str(), &val);
            canonical_serialize(val, out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        const size_t len = json_object_array_length(obj);
        for (size_t i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_serialize(json_object_array_get_idx(obj, i), out);
        }
        out << "]";
        break;
    }
    default:
        out << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
        break;
    }
}

std::string canonicalize_json(const std::string& raw) {
    json_mini::Doc d = json_mini::parse(raw);
    if (!d) return raw;
    std::ostringstream out;
    canonical_serialize(d.root, out);
    return out.str();
}

static int64_t count_lines(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in) return 0;
    int64_t n = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) n++;
    }
    return n;
}

TrajectoryLog::TrajectoryLog(std::filesystem::path dir) : dir_(std::move(dir)) {}

std::filesystem::path TrajectoryLog::path_for(const std::string& workflow_id) const {
    return dir_ / (sanitize_component(workflow_id) + "." + hash::digest_hex(workflow_id).substr(0, 8) + ".jsonl");
}

std::string TrajectoryLog::event(const std::string& workflow_id,
                                 int step,
                                 const std::string& name,
                                 const std::string& payload_json) {
    std::lock_guard<std::mutex> lk(mu_);
    const auto path = path_for(workflow_id);

    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) return "create_directories: " + ec.message();

    auto it = seq_.find(workflow_id);
    if (it == seq_.end()) it = seq_.emplace(workflow_id, count_lines(path)).first;
    const int64_t seq = ++it->second;

    json_object* rec = json_object_new_object();
    json_object_object_add(rec, "event", json_object_new_string(name.c_str()));
    json_mini::Doc payload = json_mini::parse(payload_json);
    json_object_object_add(rec, "payload",
        payload ? payload.release() : json_object_new_string_len(payload_json.c_str(), (int)payload_json.size()));
    json_object_object_add(rec, "seq", json_object_new_int64(seq));
    json_object_object_add(rec, "step", json_object_new_int(step));
    json_object_object_add(rec, "ts", json_object_new_string(iso_utc(now_ms()).c_str()));
    json_object_object_add(rec, "workflow_id",
        json_object_new_string_len(workflow_id.c_str(), (int)workflow_id.size()));

    std::ostringstream line;
    canonical_serialize(rec, line);
    json_object_put(rec);

    std::ofstream out(path, std::ios::out | std::ios::app | std::ios::binary);
    if (!out) return "cannot open " + path.string();
    out << line.str() << "\n";
    out.flush();
    if (!out) return "write failed: " + path.string();
    return "";
}

} // namespace agency
