#include "agency/util.h"
#include "agency/types.h"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <unistd.h>

namespace agency {

int getenv_int(const char* k, int defv) {
    if (const char* e = std::getenv(k)) {
        try { return std::stoi(e); } catch (const std::exception&) { return defv; }
    }
    return defv;
}

int64_t getenv_i64(const char* k, int64_t defv) {
    if (const char* e = std::getenv(k)) {
        try { return (int64_t)std::stoll(e); } catch (const std::exception&) { return defv; }
    }
    return defv;
}

bool getenv_bool(const char* k, bool defv) {
    const char* e = std::getenv(k);
    if (!e) return defv;
    std::string s = lower_ascii(trim_ws(e));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return defv;
}

std::optional<std::string> getenv_str(const char* k) {
    if (const char* e = std::getenv(k)) return std::string(e);
    return std::nullopt;
}

void sleep_ms(int64_t ms) {
    if (ms <= 0) return;
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

int64_t backoff_delay_ms(int attempt, int64_t base_ms, int64_t mult, int64_t max_ms, int64_t jitter_ms) {
    if (base_ms < 0) base_ms = 0;
    if (mult < 1) mult = 1;
    if (max_ms < 0) max_ms = 0;
    if (jitter_ms < 0) jitter_ms = 0;
    int exp = attempt - 1;
    if (exp < 0) exp = 0;
    long double d = (long double)base_ms;
    for (int i = 0; i < exp; i++) {
        d *= (long double)mult;
        if (max_ms > 0 && d > (long double)max_ms) break;
    }
    int64_t delay = (int64_t)d;
    if (max_ms > 0 && delay > max_ms) delay = max_ms;
    if (jitter_ms > 0) {
        uint64_t seed = (uint64_t)now_ms();
        seed ^= (seed << 13);
        seed ^= (seed >> 7);
        seed ^= (seed << 17);
        delay += (int64_t)(seed % (uint64_t)(jitter_ms + 1));
    }
    return delay;
}

std::optional<std::string> slurp_file(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in) return std::nullopt;
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static std::string fsync_path(const std::filesystem::path& p, int flags) {
    int fd = ::open(p.c_str(), flags);
    if (fd < 0) return std::string("open for fsync: ") + std::strerror(errno);
    std::string err;
    if (::fsync(fd) != 0) err = std::string("fsync: ") + std::strerror(errno);
    ::close(fd);
    return err;
}

std::string fsync_dir(const std::filesystem::path& dir) {
    return fsync_path(dir, O_RDONLY | O_DIRECTORY);
}

std::string write_atomic_file(const std::filesystem::path& dst, const std::string& body, bool do_fsync,
                              bool sync_parent) {
    std::error_code ec;
    if (!dst.parent_path().empty()) {
        std::filesystem::create_directories(dst.parent_path(), ec);
        if (ec) return "create_directories: " + ec.message();
    }
    auto tmp = dst;
    tmp += ".tmp";
    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f) return "cannot write " + tmp.string();
        f << body;
        f.flush();
        if (!f) {
            f.close();
            std::filesystem::remove(tmp, ec);
            return "short write to " + tmp.string();
        }
    }
    if (do_fsync) {
        std::string err = fsync_path(tmp, O_RDONLY);
        if (!err.empty()) {
            std::filesystem::remove(tmp, ec);
            return err;
        }
    }
    std::filesystem::rename(tmp, dst, ec);
    if (ec) {
        std::error_code ec2;
        std::filesystem::remove(tmp, ec2);
        return "rename failed: " + ec.message();
    }
    if (do_fsync && sync_parent && !dst.parent_path().empty()) {
        return fsync_dir(dst.parent_path());
    }
    return "";
}

std::string sanitize_component(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
            c == '_' || c == '-' || c == '.') {
            out.push_back(c);
        } else {
            out.push_back('_');
        }
    }
    if (out.empty() || out == "." || out == "..") out = "default";
    if (out.size() > 64) out.resize(64);
    return out;
}

std::string trim_ws(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ' || s.back() == '\t')) s.pop_back();
    size_t i = 0;
    while (i < s.size() && (s[i] == '\n' || s[i] == '\r' || s[i] == ' ' || s[i] == '\t')) i++;
    if (i) s.erase(0, i);
    return s;
}

std::string lower_ascii(std::string s) {
    for (char& c : s) {
        if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
    }
    return s;
}

} // namespace agency
