#pragma once

// HTTP/1.1 plumbing for the daemon: request read, JSON reply, header lookup
// and token check. One request per connection.

#include <cstdint>
#include <sstream>
#include <string>

#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace agency {

// Set socket recv/send timeouts for Slowloris defense
inline void set_socket_timeouts(int fd, int timeout_sec = 10) {
    struct timeval tv;
    tv.tv_sec = timeout_sec;
    tv.tv_usec = 0;
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

// max_body: Content-Length above this is rejected without reading the body.
inline bool read_http_request(int fd, std::string& head, std::string& body, size_t max_body) {
    head.clear();
    body.clear();
    std::string buf;
    buf.resize(8192);
    std::string all;

    while (all.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = ::recv(fd, buf.data(), buf.size(), 0);
        if (n <= 0) return false; // timeout or disconnect
        all.append(buf.data(), (size_t)n);
        if (all.size() > 64 * 1024) return false; // header cap
    }

    size_t p = all.find("\r\n\r\n");
    head = all.substr(0, p + 4);
    std::string rest = all.substr(p + 4);

    size_t cl = 0;
    {
        int cl_count = 0;
        std::istringstream iss(head);
        std::string line;
        while (std::getline(iss, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            std::string low = line;
            for (char& c : low) if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
            if (low.rfind("content-length:", 0) == 0) {
                cl_count++;
                if (cl_count > 1) return false; // duplicate Content-Length: request smuggling
                std::string v = line.substr(15);
                while (!v.empty() && (v[0] == ' ' || v[0] == '\t')) v.erase(0, 1);
                try {
                    cl = (size_t)std::stoull(v);
                } catch (const std::exception&) {
                    return false;
                }
            }
        }
    }

    if (cl > max_body) return false;

    body = rest;
    while (body.size() < cl) {
        ssize_t n = ::recv(fd, buf.data(), buf.size(), 0);
        if (n <= 0) return false;
        body.append(buf.data(), (size_t)n);
        if (body.size() > max_body) return false;
    }
    if (body.size() > cl) body.resize(cl);
    return true;
}

inline const char* http_reason(int code) {
    switch (code) {
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 413: return "Payload Too Large";
        case 503: return "Service Unavailable";
        default: return code >= 500 ? "Internal Server Error" : "Error";
    }
}

inline void send_json(int fd, int code, const std::string& json) {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << code << " " << http_reason(code) << "\r\n";
    oss << "Content-Type: application/json\r\n";
    oss << "Content-Length: " << json.size() << "\r\n";
    oss << "Connection: close\r\n\r\n";
    oss << json;
    auto s = oss.str();
    size_t sent = 0;
    while (sent < s.size()) {
        ssize_t n = ::send(fd, s.data() + sent, s.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) break;
        sent += (size_t)n;
    }
}

inline std::string header_value_ci(const std::string& head, const std::string& key_lower) {
    std::istringstream iss(head);
    std::string line;
    std::getline(iss, line);
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        auto c = line.find(':');
        if (c == std::string::npos) continue;
        std::string k = line.substr(0, c);
        for (char& ch : k) if (ch >= 'A' && ch <= 'Z') ch = (char)(ch - 'A' + 'a');
        if (k == key_lower) {
            std::string v = line.substr(c + 1);
            while (!v.empty() && (v[0] == ' ' || v[0] == '\t')) v.erase(0, 1);
            return v;
        }
    }
    return "";
}

// Length-independent timing for equal-length inputs.
inline bool constant_time_eq(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    unsigned char acc = 0;
    for (size_t i = 0; i < a.size(); i++) acc |= (unsigned char)(a[i] ^ b[i]);
    return acc == 0;
}

// X-API-Token or Authorization: Bearer. An empty expected token accepts all.
inline bool api_token_ok(const std::string& head, const std::string& expected_token) {
    if (expected_token.empty()) return true;
    std::string x = header_value_ci(head, "x-api-token");
    if (!x.empty() && constant_time_eq(x, expected_token)) return true;
    std::string auth = header_value_ci(head, "authorization");
    const std::string pfx = "Bearer ";
    if (auth.rfind(pfx, 0) == 0) {
        std::string t = auth.substr(pfx.size());
        return constant_time_eq(t, expected_token);
    }
    return false;
}

} // namespace agency
