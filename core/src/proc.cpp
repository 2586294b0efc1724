#include "agency/proc.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __linux__
  #include <sys/prctl.h>
#endif

namespace agency {

std::vector<std::string> split_argv_quoted(const std::string& cmd) {
    std::vector<std::string> out;
    std::string cur;
    bool have_token = false;
    enum { NORM, SQ, DQ } st = NORM;
    bool esc = false;

    auto flush = [&]() {
        if (have_token) {
            out.push_back(cur);
            cur.clear();
            have_token = false;
        }
    };

    for (char c : cmd) {
        if (st == NORM) {
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                flush();
                continue;
            }
            have_token = true;
            if (c == '\'') { st = SQ; continue; }
            if (c == '"') { st = DQ; esc = false; continue; }
            cur.push_back(c);
        } else if (st == SQ) {
            if (c == '\'') { st = NORM; continue; }
            cur.push_back(c);
        } else {
            if (esc) {
                cur.push_back(c);
                esc = false;
                continue;
            }
            if (c == '\\') { esc = true; continue; }
            if (c == '"') { st = NORM; continue; }
            cur.push_back(c);
        }
    }
    if (st != NORM) return {};
    flush();
    return out;
}

static void set_rlimit(int resource, rlim_t v) {
    struct rlimit rl;
    rl.rlim_cur = v;
    rl.rlim_max = v;
    (void)setrlimit(resource, &rl);
}

static void set_nonblock(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

static void close_pair(int p[2]) {
    if (p[0] >= 0) close(p[0]);
    if (p[1] >= 0) close(p[1]);
}

namespace {

struct Capture {
    int fd{-1};
    std::string* buf{nullptr};
    size_t cap{0};
    bool* truncated{nullptr};

    // Returns false on EOF.
    bool drain() {
        char tmp[4096];
        while (true) {
            ssize_t n = read(fd, tmp, sizeof(tmp));
            if (n > 0) {
                size_t can = cap > buf->size() ? cap - buf->size() : 0;
                size_t take = std::min(can, (size_t)n);
                if (take < (size_t)n) *truncated = true;
                buf->append(tmp, take);
                continue;
            }
            if (n == 0) return false;
            if (errno == EINTR) continue;
            return errno == EAGAIN || errno == EWOULDBLOCK;
        }
    }
};

} // namespace

bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const std::string& stdin_data,
                      const ProcLimits& lim,
                      ProcResult* res) {
    if (!res) return false;
    *res = ProcResult{};
    if (argv.empty() || argv[0].empty()) {
        res->error = "empty argv";
        return false;
    }

    int in_pipe[2] = {-1, -1}, out_pipe[2] = {-1, -1}, err_pipe[2] = {-1, -1};
    if (pipe(in_pipe) != 0 || pipe(out_pipe) != 0 || pipe(err_pipe) != 0) {
        res->error = std::string("pipe failed: ") + std::strerror(errno);
        close_pair(in_pipe); close_pair(out_pipe); close_pair(err_pipe);
        return false;
    }

    pid_t pid = fork();
    if (pid < 0) {
        res->error = std::string("fork failed: ") + std::strerror(errno);
        close_pair(in_pipe); close_pair(out_pipe); close_pair(err_pipe);
        return false;
    }

    if (pid == 0) {
        (void)dup2(in_pipe[0], STDIN_FILENO);
        (void)dup2(out_pipe[1], STDOUT_FILENO);
        (void)dup2(err_pipe[1], STDERR_FILENO);

        // own process group so a timeout kills the whole subtree
        (void)setpgid(0, 0);
        (void)umask(077);

        long maxfd = sysconf(_SC_OPEN_MAX);
        if (maxfd < 256) maxfd = 256;
        for (int fd = 3; fd < maxfd; fd++) (void)close(fd);

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) _exit(kExecFailedExit);

        unsetenv("LD_PRELOAD");
        unsetenv("LD_LIBRARY_PATH");

#ifdef __linux__
        if (lim.no_new_privs) (void)prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
        (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif
        if (lim.rlimit_cpu_sec > 0) set_rlimit(RLIMIT_CPU, (rlim_t)lim.rlimit_cpu_sec);
        if (lim.rlimit_as_mb > 0) set_rlimit(RLIMIT_AS, (rlim_t)lim.rlimit_as_mb * 1024ULL * 1024ULL);
        if (lim.rlimit_nofile > 0) set_rlimit(RLIMIT_NOFILE, (rlim_t)lim.rlimit_nofile);

        std::vector<char*> cargv;
        cargv.reserve(argv.size() + 1);
        for (const auto& s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
        cargv.push_back(nullptr);
        execvp(cargv[0], cargv.data());
        _exit(kExecFailedExit);
    }

    (void)setpgid(pid, pid);
    close(in_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[1]);

    int in_fd = in_pipe[1];
    if (stdin_data.empty()) {
        close(in_fd);
        in_fd = -1;
    } else {
        set_nonblock(in_fd);
    }
    set_nonblock(out_pipe[0]);
    set_nonblock(err_pipe[0]);

    Capture cout_{out_pipe[0], &res->out, lim.stdout_max_bytes, &res->output_truncated};
    Capture cerr_{err_pipe[0], &res->err, lim.stderr_max_bytes, &res->output_truncated};
    bool out_open = true, err_open = true;
    size_t write_off = 0;

    const auto start = std::chrono::steady_clock::now();
    bool child_exited = false;
    int status = 0;

    // stdin writes are interleaved with reads; a large payload would otherwise
    // deadlock against a child blocked on a full stdout pipe.
    while (true) {
        struct pollfd fds[3];
        int nfds = 0, in_idx = -1, out_idx = -1, err_idx = -1;
        if (in_fd >= 0) { in_idx = nfds; fds[nfds++] = {in_fd, POLLOUT, 0}; }
        if (out_open) { out_idx = nfds; fds[nfds++] = {out_pipe[0], POLLIN, 0}; }
        if (err_open) { err_idx = nfds; fds[nfds++] = {err_pipe[0], POLLIN, 0}; }

        int elapsed = (int)std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        int slice = 50;
        if (lim.timeout_ms > 0) {
            int remaining = lim.timeout_ms - elapsed;
            if (remaining <= 0) {
                res->timed_out = true;
                (void)kill(-pid, SIGKILL);
                (void)kill(pid, SIGKILL);
                (void)waitpid(pid, &status, 0);
                child_exited = true;
                break;
            }
            slice = std::min(slice, remaining);
        }

        if (nfds > 0) {
            int pr = poll(fds, (nfds_t)nfds, slice);
            if (pr < 0 && errno == EINTR) continue;
        } else {
            usleep((useconds_t)slice * 1000);
        }

        if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
            while (write_off < stdin_data.size()) {
                ssize_t n = write(in_fd, stdin_data.data() + write_off, stdin_data.size() - write_off);
                if (n > 0) { write_off += (size_t)n; continue; }
                if (n < 0 && errno == EINTR) continue;
                if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
                write_off = stdin_data.size(); // child closed stdin
                break;
            }
            if (write_off >= stdin_data.size()) {
                close(in_fd);
                in_fd = -1;
            }
        }
        if (out_idx >= 0 && fds[out_idx].revents) out_open = cout_.drain();
        if (err_idx >= 0 && fds[err_idx].revents) err_open = cerr_.drain();

        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            child_exited = true;
            break;
        }
    }

    if (in_fd >= 0) close(in_fd);
    if (out_open) (void)cout_.drain();
    if (err_open) (void)cerr_.drain();
    close(out_pipe[0]);
    close(err_pipe[0]);

    if (!child_exited) res->exit_code = 128;
    else if (WIFEXITED(status)) res->exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) res->exit_code = 128 + WTERMSIG(status);
    else res->exit_code = 128;
    return true;
}

} // namespace agency
