// ============================================================
// server_app.cpp -- minftp server dispatcher implementation
// ============================================================

#include "server_app.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <utility>

#include <sys/wait.h>

const char* server_mode_str(ServerMode m) {
    switch (m) {
        case ServerMode::ITERATIVE: return "iterative";
        case ServerMode::THREADED:  return "threaded";
        case ServerMode::FORKED:    return "forked";
    }
    return "?";
}

bool parse_server_mode(const std::string& s, ServerMode& out) {
    if (s == "iterative" || s == "0") { out = ServerMode::ITERATIVE; return true; }
    if (s == "threaded"  || s == "1") { out = ServerMode::THREADED;  return true; }
    if (s == "forked"    || s == "2") { out = ServerMode::FORKED;    return true; }
    return false;
}

// Reap every exited session child so none linger as zombies
static void reap_children(int /*sig*/) {
    int saved_errno = errno;
    while (::waitpid(-1, nullptr, WNOHANG) > 0) {}
    errno = saved_errno;
}

// ============================================================
// ServerApp
// ============================================================

ServerApp::ServerApp(ServerConfig config)
    : config_(std::move(config))
    , store_(config_.root_dir)
{}

ServerApp::~ServerApp() {
    stop();
    reap_workers(true);
}

void ServerApp::listen() {
    if (listening_) return;
    listen_sock_.bind_and_listen(config_.listen_ip, config_.listen_port);
    bound_port_ = listen_sock_.local_port();
    listening_  = true;
}

int ServerApp::run() {
    listen();

    if (config_.mode == ServerMode::FORKED) {
        std::signal(SIGCHLD, reap_children);
    }

    LOG_INFO("minftp server listening on " + config_.listen_ip + ":" +
             std::to_string(bound_port_) + " (" + server_mode_str(config_.mode) +
             " mode, root '" + store_.root().string() + "')");

    accept_loop();

    listen_sock_.close();
    interrupt_sessions();
    reap_workers(true);

    LOG_INFO("minftp server stopped");
    return 0;
}

void ServerApp::stop() {
    stopping_.store(true);
    listen_sock_.shutdown();

    // try_lock: stop() may run in a signal handler that interrupted a
    // thread holding live_mutex_. run() interrupts again after the loop.
    std::unique_lock<std::mutex> lk(live_mutex_, std::try_to_lock);
    if (lk.owns_lock()) {
        for (ControlSession* s : live_sessions_) s->interrupt();
    }
}

// ---------------------------------------------------------------
// accept_loop
//   Blocks in accept(); every connection is handed to the
//   configured execution model. stop() shuts the listening socket
//   down, which makes accept() fail and ends the loop.
// ---------------------------------------------------------------
void ServerApp::accept_loop() {
    while (!stopping_.load()) {
        try {
            TcpSocket sock = listen_sock_.accept();
            if (stopping_.load()) break;
            sock.tune();

            LOG_INFO("New client accepted " + sock.peer_addr());

            switch (config_.mode) {
                case ServerMode::ITERATIVE: serve(std::move(sock));             break;
                case ServerMode::THREADED:  dispatch_threaded(std::move(sock)); break;
                case ServerMode::FORKED:    dispatch_forked(std::move(sock));   break;
            }

            reap_workers(false);

        } catch (const std::exception& e) {
            if (stopping_.load()) break;
            LOG_ERROR("accept_loop: " + std::string(e.what()));
            // e.g. EMFILE: back off instead of spinning
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }
}

void ServerApp::serve(TcpSocket sock) {
    ControlSession session(std::move(sock), store_, config_.session);
    {
        std::lock_guard<std::mutex> lk(live_mutex_);
        live_sessions_.insert(&session);
    }
    if (stopping_.load()) session.interrupt();

    session.run();

    {
        std::lock_guard<std::mutex> lk(live_mutex_);
        live_sessions_.erase(&session);
    }
    LOG_DEBUG(session.peer() + " session " + session_state_str(session.state()));
}

void ServerApp::dispatch_threaded(TcpSocket sock) {
    std::string peer = sock.peer_addr();
    auto done = std::make_shared<std::atomic<bool>>(false);

    Worker w;
    w.done = done;
    w.thread = std::thread([this, done, s = std::move(sock)]() mutable {
        serve(std::move(s));
        done->store(true);
    });
    {
        std::lock_guard<std::mutex> lk(workers_mutex_);
        workers_.push_back(std::move(w));
    }
    LOG_DEBUG("New thread created for " + peer);
}

// ---------------------------------------------------------------
// dispatch_forked
//   The child owns the accepted socket and nothing else: it drops
//   the listening socket, serves one session, and exits. The parent
//   closes its copy of the accepted socket and returns to accept().
// ---------------------------------------------------------------
void ServerApp::dispatch_forked(TcpSocket sock) {
    std::string peer = sock.peer_addr();

    // Anything still buffered would be written again by the child
    std::cout.flush();
    std::cerr.flush();
    std::fflush(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        LOG_ERROR("fork() failed for " + peer + ": " + socket_error_str(errno));
        return;
    }
    if (pid == 0) {
        listen_sock_.close();
        std::signal(SIGCHLD, SIG_DFL);
        serve(std::move(sock));
        std::cout.flush();
        std::cerr.flush();
        ::_exit(0);
    }
    LOG_DEBUG("Child process " + std::to_string(pid) + " was created for " + peer);
}

void ServerApp::reap_workers(bool wait_all) {
    std::lock_guard<std::mutex> lk(workers_mutex_);
    for (auto it = workers_.begin(); it != workers_.end(); ) {
        if (wait_all || it->done->load()) {
            if (it->thread.joinable()) it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void ServerApp::interrupt_sessions() {
    std::lock_guard<std::mutex> lk(live_mutex_);
    for (ControlSession* s : live_sessions_) s->interrupt();
}
