#pragma once

// json_mini.h
//
// Small helpers over json-c for the daemon: an owning document handle,
// typed member lookups on raw JSON text, and plain serialization.

#include <json-c/json.h>

#include <algorithm>
#include <climits>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

namespace agency::json_mini {

// Owns one json-c reference.
struct Doc {
    json_object* root{nullptr};

    Doc() = default;
    explicit Doc(json_object* r) : root(r) {}
    Doc(const Doc&) = delete;
    Doc& operator=(const Doc&) = delete;

    Doc(Doc&& other) noexcept : root(other.root) { other.root = nullptr; }
    Doc& operator=(Doc&& other) noexcept {
        if (this != &other) {
            if (root) json_object_put(root);
            root = other.root;
            other.root = nullptr;
        }
        return *this;
    }

    ~Doc() {
        if (root) json_object_put(root);
    }

    // Releases ownership to the caller.
    json_object* release() {
        json_object* r = root;
        root = nullptr;
        return r;
    }

    bool is_object() const { return root && json_object_is_type(root, json_type_object); }

    explicit operator bool() const { return root != nullptr; }
};

inline Doc parse(const std::string& json) {
    json_tokener* tok = json_tokener_new();
    if (!tok) return Doc{};
    json_object* obj = json_tokener_parse_ex(tok, json.c_str(),
        static_cast<int>(std::min(json.size(), static_cast<size_t>(INT_MAX))));
    json_tokener_error jerr = json_tokener_get_error(tok);
    json_tokener_free(tok);
    if (jerr != json_tokener_success) {
        if (obj) json_object_put(obj);
        return Doc{};
    }
    return Doc{obj};
}

// Plain (compact) serialization of a borrowed object. nullptr gives "null".
inline std::string to_string(json_object* o) {
    if (!o) return "null";
    return std::string(json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN));
}

// Serializes and drops the caller's reference.
inline std::string to_string_put(json_object* o) {
    std::string s = to_string(o);
    if (o) json_object_put(o);
    return s;
}

// Borrowed member of a parsed object, or nullptr.
inline json_object* member(const Doc& d, const char* key) {
    if (!d.is_object()) return nullptr;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(d.root, key, &v)) return nullptr;
    return v;
}

inline bool is_object_text(const std::string& json) {
    return parse(json).is_object();
}

inline bool has_key(const std::string& json, const std::string& key) {
    Doc d = parse(json);
    if (!d.is_object()) return false;
    json_object* v = nullptr;
    return json_object_object_get_ex(d.root, key.c_str(), &v);
}

inline std::optional<std::string> get_string(const std::string& json, const std::string& key) {
    Doc d = parse(json);
    json_object* v = member(d, key.c_str());
    if (!v || !json_object_is_type(v, json_type_string)) return std::nullopt;
    return std::string(json_object_get_string(v));
}

inline std::optional<int64_t> get_int(const std::string& json, const std::string& key) {
    Doc d = parse(json);
    json_object* v = member(d, key.c_str());
    if (!v || !json_object_is_type(v, json_type_int)) return std::nullopt;
    return static_cast<int64_t>(json_object_get_int64(v));
}

inline std::optional<bool> get_bool(const std::string& json, const std::string& key) {
    Doc d = parse(json);
    json_object* v = member(d, key.c_str());
    if (!v || !json_object_is_type(v, json_type_boolean)) return std::nullopt;
    return json_object_get_boolean(v) != 0;
}

// Raw text of an object or array member.
inline std::optional<std::string> get_object_raw(const std::string& json, const std::string& key) {
    Doc d = parse(json);
    json_object* v = member(d, key.c_str());
    if (!v) return std::nullopt;
    if (!json_object_is_type(v, json_type_object) && !json_object_is_type(v, json_type_array)) return std::nullopt;
    return to_string(v);
}

inline std::vector<std::string> parse_array_objects_raw(const std::string& array_json_raw) {
    std::vector<std::string> out;
    Doc d = parse(array_json_raw);
    if (!d || !json_object_is_type(d.root, json_type_array)) return out;
    const size_t n = json_object_array_length(d.root);
    out.reserve(n);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(d.root, i);
        if (el && json_object_is_type(el, json_type_object)) out.push_back(to_string(el));
    }
    return out;
}

// Escape for embedding inside a JSON string literal (no surrounding quotes).
inline std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", (unsigned)(unsigned char)c);
                    out += buf;
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    return out;
}

} // namespace agency::json_mini
