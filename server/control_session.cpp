// ============================================================
// control_session.cpp -- Control channel state machine
// ============================================================

#include "control_session.hpp"
#include "../common/data_channel.hpp"
#include "../common/errors.hpp"
#include "../common/hash.hpp"
#include "../common/logger.hpp"
#include "../common/transfer.hpp"
#include "../common/utils.hpp"
#include <memory>
#include <utility>
#include <vector>

const char* session_state_str(SessionState s) {
    switch (s) {
        case SessionState::AWAITING_COMMAND:   return "AWAITING_COMMAND";
        case SessionState::DISPATCHING:        return "DISPATCHING";
        case SessionState::AWAITING_DATA_CONN: return "AWAITING_DATA_CONN";
        case SessionState::CLOSED:             return "CLOSED";
    }
    return "?";
}

ControlSession::ControlSession(TcpSocket sock, file_io::FileStore& store,
                               SessionOptions opts)
    : sock_(std::move(sock))
    , store_(store)
    , opts_(opts)
{
    peer_ = sock_.peer_addr();
}

void ControlSession::run() {
    try {
        while (step()) {}
    } catch (const std::exception& e) {
        LOG_ERROR(peer_ + " session aborted: " + e.what());
        close_control();
    }
}

// ---------------------------------------------------------------
// step
//   AWAITING_COMMAND: block for one frame.
//   DISPATCHING:      parse and run it, reply once.
//   Errors local to the command become "error: ..." replies; only
//   a broken control channel ends the session.
// ---------------------------------------------------------------
bool ControlSession::step() {
    if (state_.load() == SessionState::CLOSED) return false;
    state_.store(SessionState::AWAITING_COMMAND);

    std::string line;
    try {
        if (!sock_.read_frame(line, MAX_COMMAND_LEN)) {
            LOG_DEBUG(peer_ + " connection closed by client");
            close_control();
            return false;
        }
    } catch (const FtpError& e) {
        LOG_WARN(peer_ + " " + e.what() + ", dropping session");
        close_control();
        return false;
    }

    state_.store(SessionState::DISPATCHING);
    std::string msg = peer_ + "\t" + line;
    LOG_DEBUG("EXECUTE " + msg);

    try {
        Command cmd;
        try {
            cmd = parse_command(line);
        } catch (const UnknownCommand& e) {
            LOG_INFO("Unknown command " + msg);
            reply_error(e.what());
            return true;
        }

        switch (cmd.verb) {
            case Verb::LS:   do_ls(msg);            break;
            case Verb::GET:  do_get(cmd.arg, msg);  break;
            case Verb::PUT:  do_put(cmd.arg, msg);  break;
            case Verb::HELP:
                reply(HELP_TEXT);
                LOG_INFO("SUCCESS " + msg);
                break;
            case Verb::QUIT:
                do_quit(msg);
                return false;
        }
    } catch (const FtpError& e) {
        // Only control-socket failures get here; the handlers deal with
        // storage and data-channel errors themselves.
        LOG_WARN(peer_ + " " + e.what() + ", dropping session");
        close_control();
        return false;
    }

    if (state_.load() != SessionState::CLOSED) {
        state_.store(SessionState::AWAITING_COMMAND);
    }
    return state_.load() != SessionState::CLOSED;
}

void ControlSession::do_ls(const std::string& msg) {
    std::vector<std::string> names;
    try {
        names = store_.list();
    } catch (const FileIoError& e) {
        reply_error(e.what());
        LOG_INFO("FAILURE " + msg + " (" + e.what() + ")");
        return;
    }
    reply(utils::join(names, "\n"));
    LOG_INFO("SUCCESS " + msg);
}

// ---------------------------------------------------------------
// do_get
//   Reply with an error instead of a port if the file cannot be
//   served; otherwise offer a port, wait for the data connection,
//   and stream the file as one frame.
// ---------------------------------------------------------------
void ControlSession::do_get(const std::string& name, const std::string& msg) {
    std::unique_ptr<file_io::FileReader> reader;
    std::unique_ptr<PendingTransfer> pending;
    try {
        reader = store_.open_read(name);
        if (reader->size() > MAX_FRAME_PAYLOAD) {
            throw PayloadTooLarge("'" + name + "' exceeds the maximum transfer size");
        }
        pending = std::make_unique<PendingTransfer>(
            data_channel::offer_port(sock_.local_ip(), TransferDirection::SEND, name));
    } catch (const FtpError& e) {
        reply_error(e.what());
        LOG_INFO("FAILURE get failed. " + std::string(e.what()));
        return;
    }
    if (opts_.check_data_peer) pending->set_expected_peer(sock_.peer_ip());
    track_pending(pending.get());

    std::string port = std::to_string(pending->port());
    try {
        reply(port);
    } catch (const FtpError&) {
        track_pending(nullptr);
        throw;
    }
    state_.store(SessionState::AWAITING_DATA_CONN);

    // Outlives the try block so interrupt() never sees a dead socket
    TcpSocket data(INVALID_SOCKET_VAL);
    try {
        data = pending->accept_transfer_connection(opts_.accept_timeout_ms);
        track_pending(nullptr);
        track_data(&data);
        data.set_send_timeout_ms(opts_.transfer_timeout_ms);
        TransferResult res = transfer::send_file(data, *reader);
        track_data(nullptr);
        LOG_INFO("SUCCESS sent '" + name + "' to " + peer_ + " via port " + port +
                 " (" + utils::format_bytes(res.bytes) + ", " +
                 utils::format_speed(res.bytes, res.elapsed_ms) +
                 ", xxh3=" + hash::to_hex(res.digest) + ")");
    } catch (const FtpError& e) {
        track_pending(nullptr);
        track_data(nullptr);
        LOG_INFO("FAILURE did not send all of '" + name + "' to " + peer_ +
                 " via port " + port + ": " + e.what());
    }
    LOG_DEBUG("Closed data socket " + port + " for " + peer_);
}

// ---------------------------------------------------------------
// do_put
//   The upload is staged in a private temporary and renamed over
//   the destination only after the whole frame arrived. The outcome
//   is reported on the control channel after the port offer.
// ---------------------------------------------------------------
void ControlSession::do_put(const std::string& name, const std::string& msg) {
    std::unique_ptr<file_io::FileWriter> writer;
    std::unique_ptr<PendingTransfer> pending;
    try {
        writer = store_.open_write(name);
        pending = std::make_unique<PendingTransfer>(
            data_channel::offer_port(sock_.local_ip(), TransferDirection::RECEIVE, name));
    } catch (const FtpError& e) {
        reply_error(e.what());
        LOG_INFO("FAILURE put failed. " + std::string(e.what()));
        return;
    }
    if (opts_.check_data_peer) pending->set_expected_peer(sock_.peer_ip());
    track_pending(pending.get());

    std::string port = std::to_string(pending->port());
    try {
        reply(port);
    } catch (const FtpError&) {
        track_pending(nullptr);
        throw;
    }
    state_.store(SessionState::AWAITING_DATA_CONN);

    std::string outcome;
    TcpSocket data(INVALID_SOCKET_VAL);
    try {
        data = pending->accept_transfer_connection(opts_.accept_timeout_ms);
        track_pending(nullptr);
        track_data(&data);
        data.set_recv_timeout_ms(opts_.transfer_timeout_ms);
        TransferResult res = transfer::receive_file(data, *writer);
        track_data(nullptr);
        writer->commit();
        outcome = PUT_STORED_PREFIX + std::to_string(res.bytes);
        LOG_INFO("SUCCESS retrieved '" + name + "' from " + peer_ + " via port " + port +
                 " (" + utils::format_bytes(res.bytes) + ", " +
                 utils::format_speed(res.bytes, res.elapsed_ms) +
                 ", xxh3=" + hash::to_hex(res.digest) + ")");
    } catch (const FtpError& e) {
        track_pending(nullptr);
        track_data(nullptr);
        writer->abort();
        outcome = std::string(ERROR_PREFIX) + e.what();
        LOG_INFO("FAILURE did not retrieve all of '" + name + "' from " + peer_ +
                 " via port " + port + ": " + e.what());
    }
    LOG_DEBUG("Closed data socket " + port + " for " + peer_);
    reply(outcome);
}

void ControlSession::do_quit(const std::string& msg) {
    try {
        reply(QUIT_ACK);
    } catch (const ConnectionClosed& e) {
        LOG_DEBUG(peer_ + " quit acknowledgement not delivered: " + e.what());
    }
    close_control();
    LOG_INFO("SUCCESS " + msg);
}

void ControlSession::reply(const std::string& payload) {
    sock_.write_frame(payload);
}

void ControlSession::reply_error(const std::string& what) {
    reply(std::string(ERROR_PREFIX) + what);
}

void ControlSession::close_control() {
    std::lock_guard<std::mutex> lk(sock_mutex_);
    sock_.close();
    state_.store(SessionState::CLOSED);
}

void ControlSession::track_pending(PendingTransfer* pending) {
    std::lock_guard<std::mutex> lk(sock_mutex_);
    pending_ = pending;
    if (pending_ && interrupted_) pending_->cancel();
}

void ControlSession::track_data(TcpSocket* data) {
    std::lock_guard<std::mutex> lk(sock_mutex_);
    data_ = data;
    if (data_ && interrupted_) data_->shutdown();
}

void ControlSession::interrupt() {
    std::lock_guard<std::mutex> lk(sock_mutex_);
    interrupted_ = true;
    sock_.shutdown();
    if (pending_) pending_->cancel();
    if (data_) data_->shutdown();
}
