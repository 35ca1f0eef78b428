#pragma once

// ============================================================
// control_session.hpp -- One client's control channel
//
// State machine:
//
//   AWAITING_COMMAND --frame--> DISPATCHING --ls/help/error--> AWAITING_COMMAND
//                                   |
//                                   +--get/put--> AWAITING_DATA_CONN --> AWAITING_COMMAND
//                                   |
//                                   +--quit--> CLOSED
//
// End of stream or a framing error on the control socket also
// leads to CLOSED. Every command gets exactly one response frame,
// except put: after the port offer it also reports whether the
// upload was stored.
// The session only touches its own socket and the FileStore it is
// given, so the dispatcher can run it inline, on a thread, or in a
// forked child.
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/socket.hpp"
#include "../common/command.hpp"
#include "../common/data_channel.hpp"
#include "../common/file_io.hpp"
#include <atomic>
#include <mutex>
#include <string>

enum class SessionState : u8 {
    AWAITING_COMMAND,
    DISPATCHING,
    AWAITING_DATA_CONN,
    CLOSED,
};

const char* session_state_str(SessionState s);

struct SessionOptions {
    int  accept_timeout_ms{DEFAULT_ACCEPT_TIMEOUT_MS};
    int  transfer_timeout_ms{DEFAULT_TRANSFER_TIMEOUT_MS};
    // Refuse data connections that do not come from the control peer's IP
    bool check_data_peer{true};
};

class ControlSession {
public:
    ControlSession(TcpSocket sock, file_io::FileStore& store,
                   SessionOptions opts = SessionOptions());

    ControlSession(const ControlSession&) = delete;
    ControlSession& operator=(const ControlSession&) = delete;

    // Serve commands until CLOSED. Never throws.
    void run();

    // Read and execute one command. Returns false once CLOSED.
    bool step();

    SessionState state() const { return state_.load(); }
    const std::string& peer() const { return peer_; }

    // Unblock a session waiting on the control socket, a data connection
    // or a transfer in progress (server shutdown). Safe to call from
    // another thread.
    void interrupt();

private:
    TcpSocket                 sock_;
    std::mutex                sock_mutex_;  // guards close vs interrupt
    PendingTransfer*          pending_{nullptr};  // under sock_mutex_
    TcpSocket*                data_{nullptr};     // under sock_mutex_
    bool                      interrupted_{false};
    file_io::FileStore&       store_;
    SessionOptions            opts_;
    std::string               peer_;
    std::atomic<SessionState> state_{SessionState::AWAITING_COMMAND};

    void do_ls(const std::string& msg);
    void do_get(const std::string& name, const std::string& msg);
    void do_put(const std::string& name, const std::string& msg);
    void do_quit(const std::string& msg);

    // Publish (or clear, with nullptr) what interrupt() must also wake
    void track_pending(PendingTransfer* pending);
    void track_data(TcpSocket* data);

    void reply(const std::string& payload);
    void reply_error(const std::string& what);
    void close_control();
};
