#include "cmds.h"
#include "api_router.h"
#include "runtime.h"
#include "serve_http.h"

#include "agency/util.h"

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace agency;

namespace {

std::atomic<bool> g_stop{false};

void on_stop_signal(int) {
    g_stop.store(true);
}

struct Conn {
    std::thread t;
    std::shared_ptr<std::atomic<bool>> done;
};

void join_finished(std::vector<Conn>& conns, bool all) {
    for (auto it = conns.begin(); it != conns.end();) {
        if (all || it->done->load()) {
            if (it->t.joinable()) it->t.join();
            it = conns.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace

int cmd_serve(int argc, char** argv) {
    // Ignore SIGPIPE: writing to disconnected clients should not crash the server
    ::signal(SIGPIPE, SIG_IGN);

    std::string config_path;
    std::string host_arg;
    int port_arg = 0;
    std::string log_file;
    std::string pid_file;
    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) { config_path = argv[++i]; continue; }
        if (a == "--host" && i + 1 < argc) { host_arg = argv[++i]; continue; }
        if (a == "--port" && i + 1 < argc) { port_arg = std::atoi(argv[++i]); continue; }
        if (a == "--log-file" && i + 1 < argc) { log_file = argv[++i]; continue; }
        if (a == "--pid-file" && i + 1 < argc) { pid_file = argv[++i]; continue; }
        std::cerr << "usage: agency_cli serve [--config F] [--host H] [--port P] [--log-file F] [--pid-file F]\n";
        return 2;
    }

    if (!log_file.empty()) {
        if (!std::freopen(log_file.c_str(), "a", stderr)) {
            std::cerr << "[serve] cannot open log file " << log_file << "\n";
            return 2;
        }
        std::setvbuf(stderr, nullptr, _IOLBF, 0);
    }

    apply_profile_defaults(detect_profile());
    AgencyConfig cfg;
    try {
        cfg = load_config(config_path);
        if (!host_arg.empty()) cfg.host = host_arg;
        if (port_arg != 0) cfg.port = port_arg;
        validate_config(cfg);
    } catch (const ConfigurationError& e) {
        std::cerr << "[config] " << e.what() << "\n";
        return 2;
    }

    // Create server socket BEFORE starting worker threads, so that failures here
    // don't leave running threads dangling.
    int sfd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (sfd < 0) { std::cerr << "[serve] socket failed\n"; return 2; }
    {
        int one = 1;
        ::setsockopt(sfd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons((uint16_t)cfg.port);
    if (::inet_pton(AF_INET, cfg.host.c_str(), &addr.sin_addr) <= 0) {
        std::cerr << "[serve] bad host " << cfg.host << "\n";
        ::close(sfd);
        return 2;
    }
    if (::bind(sfd, (sockaddr*)&addr, sizeof(addr)) < 0) {
        std::cerr << "[serve] bind failed on " << cfg.host << ":" << cfg.port << "\n";
        ::close(sfd);
        return 2;
    }
    if (::listen(sfd, 64) < 0) {
        std::cerr << "[serve] listen failed\n";
        ::close(sfd);
        return 2;
    }

    std::unique_ptr<Runtime> rt;
    try {
        rt = build_runtime(cfg);
        rt->manager->recover();
    } catch (const AgencyError& e) {
        std::cerr << "[serve] startup failed: " << e.what() << "\n";
        ::close(sfd);
        return 1;
    }
    rt->manager->start();

    if (!pid_file.empty()) {
        std::string err = write_atomic_file(pid_file, std::to_string(::getpid()) + "\n", false);
        if (!err.empty()) std::cerr << "[serve] [WARN] pid file " << pid_file << ": " << err << "\n";
    }

    struct sigaction sa{};
    sa.sa_handler = on_stop_signal;
    sigemptyset(&sa.sa_mask);
    ::sigaction(SIGINT, &sa, nullptr);
    ::sigaction(SIGTERM, &sa, nullptr);

    if (cfg.api_token.empty()) {
        if (cfg.require_api_token) {
            std::cerr << "[WARN] AGENCY_REQUIRE_API_TOKEN=1 but no api token is set; mutating routes will be refused.\n";
        } else {
            std::cerr << "[WARN] no api token configured; mutating routes are open and /shutdown is disabled.\n";
        }
    }

    ApiRouter router(*rt->manager, RouterOptions{cfg.api_token, cfg.require_api_token},
                     [] { g_stop.store(true); });

    constexpr int max_http_conns = 32;
    std::atomic<int> active_conns{0};
    std::vector<Conn> conns;
    const size_t max_body = cfg.max_body_bytes;

    std::cerr << "[serve] http://" << cfg.host << ":" << cfg.port
              << " workflows=" << rt->manager->size() << "\n";

    while (!g_stop.load()) {
        join_finished(conns, false);

        pollfd pfd{sfd, POLLIN, 0};
        int pr = ::poll(&pfd, 1, 250);
        if (pr <= 0) continue;   // timeout or EINTR; re-check the stop flag

        sockaddr_in caddr{}; socklen_t clen = sizeof(caddr);
        int cfd = ::accept(sfd, (sockaddr*)&caddr, &clen);
        if (cfd < 0) continue;
        if (active_conns.load() >= max_http_conns) {
            send_json(cfd, 503, "{\"ok\":false,\"error\":\"too many connections\",\"kind\":\"Busy\"}");
            ::close(cfd);
            continue;
        }
        active_conns.fetch_add(1);
        set_socket_timeouts(cfd, 10);

        auto done = std::make_shared<std::atomic<bool>>(false);
        std::thread t([&router, &active_conns, cfd, done, max_body]() {
            struct ConnGuard {
                std::atomic<int>& c;
                std::atomic<bool>& d;
                int fd;
                ~ConnGuard() { ::close(fd); c.fetch_sub(1); d.store(true); }
            } cg{active_conns, *done, cfd};

            std::string head, body;
            if (!read_http_request(cfd, head, body, max_body)) {
                send_json(cfd, 400, "{\"ok\":false,\"error\":\"bad request\",\"kind\":\"Configuration\"}");
                return;
            }
            HttpResponse resp = router.handle(make_http_request(head, body));
            send_json(cfd, resp.code, resp.body);
        });
        conns.push_back(Conn{std::move(t), done});
    }

    std::cerr << "[serve] stopping\n";
    ::close(sfd);
    // Suspend requests reach synchronous runs held by connection threads too,
    // so the join below returns at their next step boundary.
    rt->manager->shutdown();
    join_finished(conns, true);
    if (!pid_file.empty()) ::unlink(pid_file.c_str());
    std::cerr << "[serve] bye\n";
    return 0;
}
