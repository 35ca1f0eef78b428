#pragma once

// ============================================================
// server_app.hpp -- minftp server: accept loop + dispatch
//
// Concurrency model (chosen at startup, protocol identical):
//   ITERATIVE -> accept, run the session to CLOSED, accept next
//   THREADED  -> accept, one std::thread per session
//   FORKED    -> accept, fork(); the child serves the session and
//                exits, the parent goes straight back to accept()
// ============================================================

#include "../common/platform.hpp"
#include "../common/socket.hpp"
#include "../common/file_io.hpp"
#include "control_session.hpp"
#include <string>
#include <list>
#include <memory>
#include <set>
#include <atomic>
#include <thread>
#include <mutex>

enum class ServerMode : u8 {
    ITERATIVE = 0,
    THREADED  = 1,
    FORKED    = 2,
};

const char* server_mode_str(ServerMode m);

// Accepts "iterative" / "threaded" / "forked" or the numeric 0 / 1 / 2
bool parse_server_mode(const std::string& s, ServerMode& out);

struct ServerConfig {
    std::string    root_dir{"."};
    std::string    listen_ip{"0.0.0.0"};
    u16            listen_port{2121};
    ServerMode     mode{ServerMode::ITERATIVE};
    SessionOptions session;
    std::string    log_file;
};

class ServerApp {
public:
    explicit ServerApp(ServerConfig config);
    ~ServerApp();

    // Bind and listen. Called by run() if not done already; call it
    // directly to learn the port before serving (listen_port 0).
    void listen();

    u16 port() const { return bound_port_; }

    // Blocks until stop() is called. Returns the process exit code.
    int run();

    // Stop accepting and interrupt live sessions. Call from a signal
    // handler or another thread to shut down.
    void stop();

private:
    struct Worker {
        std::thread                        thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    ServerConfig             config_;
    file_io::DirectoryStore  store_;
    TcpSocket                listen_sock_;
    u16                      bound_port_{0};
    bool                     listening_{false};
    std::atomic<bool>        stopping_{false};

    // Sessions currently being served in this process
    std::set<ControlSession*> live_sessions_;
    std::mutex                live_mutex_;

    // THREADED mode workers
    std::list<Worker>         workers_;
    std::mutex                workers_mutex_;

    void accept_loop();

    // Run one session to completion in the calling thread/process
    void serve(TcpSocket sock);

    void dispatch_threaded(TcpSocket sock);
    void dispatch_forked(TcpSocket sock);

    // Join finished workers; with wait_all, join every worker
    void reap_workers(bool wait_all);

    void interrupt_sessions();
};
