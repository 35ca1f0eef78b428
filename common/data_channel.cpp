// ============================================================
// data_channel.cpp -- Data connection negotiation
// ============================================================

#include "data_channel.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "utils.hpp"
#include <chrono>
#include <utility>

PendingTransfer::PendingTransfer(const std::string& bind_ip,
                                 TransferDirection direction,
                                 std::string filename)
    : direction_(direction)
    , filename_(std::move(filename))
{
    // Backlog 1: exactly one connection is expected per offer
    listener_.bind_and_listen(bind_ip, 0, 1);
    port_ = listener_.local_port();
    LOG_DEBUG("Opened data socket " + std::to_string(port_) + " to " +
              direction_str(direction_) + " '" + filename_ + "'");
}

TcpSocket PendingTransfer::accept_transfer_connection(int timeout_ms) {
    u64 deadline = utils::now_ms() + (u64)(timeout_ms > 0 ? timeout_ms : 0);

    for (;;) {
        u64 now  = utils::now_ms();
        int left = now >= deadline ? 0 : (int)(deadline - now);

        if (!listener_.wait_readable(left)) {
            close_listener();
            throw NegotiationTimeout("No data connection on port " + std::to_string(port_) +
                                     " within " + std::to_string(timeout_ms) + " ms");
        }

        TcpSocket conn = listener_.accept();
        if (!expected_peer_.empty() && conn.peer_ip() != expected_peer_) {
            LOG_WARN("Rejected data connection on port " + std::to_string(port_) +
                     " from " + conn.peer_addr() + " (expected " + expected_peer_ + ")");
            continue;
        }

        close_listener();
        conn.tune();
        LOG_DEBUG("Connected data socket " + std::to_string(port_) +
                  " through " + conn.peer_addr());
        return conn;
    }
}

void PendingTransfer::cancel() {
    std::lock_guard<std::mutex> lk(*listener_mutex_);
    listener_.shutdown();
}

void PendingTransfer::close_listener() {
    std::lock_guard<std::mutex> lk(*listener_mutex_);
    listener_.close();
}

PendingTransfer data_channel::offer_port(const std::string& bind_ip,
                                         TransferDirection direction,
                                         const std::string& filename) {
    return PendingTransfer(bind_ip, direction, filename);
}

TcpSocket data_channel::connect_to_offered_port(const std::string& host, u16 port) {
    TcpSocket sock;
    sock.connect(host, port);
    return sock;
}

bool data_channel::parse_port_offer(const std::string& response, u16& port) {
    if (!utils::all_digits(response) || response.size() > 5) return false;
    int v = std::stoi(response);
    if (!utils::validate_port(v)) return false;
    port = (u16)v;
    return true;
}
