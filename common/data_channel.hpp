#pragma once

// ============================================================
// data_channel.hpp -- Per-transfer data connection handshake
//
//   server                                 client
//   ------                                 ------
//   offer_port()  -> listen on :0
//   "54321" over the control channel  -->
//                                     <--  connect_to_offered_port()
//   accept_transfer_connection()
//     (listener closed right after the single accept)
//   one frame carrying the file, in the direction of the command
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include "socket.hpp"
#include <memory>
#include <mutex>
#include <string>

class PendingTransfer {
public:
    // Bind a listening socket to an OS-assigned port on bind_ip.
    PendingTransfer(const std::string& bind_ip,
                    TransferDirection direction,
                    std::string filename);

    PendingTransfer(const PendingTransfer&) = delete;
    PendingTransfer& operator=(const PendingTransfer&) = delete;
    PendingTransfer(PendingTransfer&&) = default;
    PendingTransfer& operator=(PendingTransfer&&) = default;

    u16 port() const { return port_; }
    TransferDirection direction() const { return direction_; }
    const std::string& filename() const { return filename_; }

    // Only accept data connections from this IP (normally the control
    // peer). Empty accepts any peer.
    void set_expected_peer(const std::string& ip) { expected_peer_ = ip; }

    // Wait up to timeout_ms for the single data connection. The listening
    // socket is closed before returning, whether a connection arrived or
    // not. Throws NegotiationTimeout.
    TcpSocket accept_transfer_connection(int timeout_ms);

    // Wake a thread blocked in accept_transfer_connection(); it fails
    // instead of waiting out the timeout. Safe to call from another thread.
    void cancel();

    // True while the ephemeral port is still held
    bool is_listening() const { return listener_.is_valid(); }

private:
    void close_listener();

    TcpSocket         listener_;
    // Serialises cancel() against the listener being closed
    std::unique_ptr<std::mutex> listener_mutex_{new std::mutex};
    u16               port_{0};
    TransferDirection direction_;
    std::string       filename_;
    std::string       expected_peer_;
};

namespace data_channel {

// Server side: open a PendingTransfer whose port the session announces
PendingTransfer offer_port(const std::string& bind_ip,
                           TransferDirection direction,
                           const std::string& filename);

// Client side: open the data connection to the announced port.
// Throws ConnectionRefused.
TcpSocket connect_to_offered_port(const std::string& host, u16 port);

// Parse a control response as a port offer. Returns false (and leaves
// port untouched) if the response is not a decimal port number.
bool parse_port_offer(const std::string& response, u16& port);

} // namespace data_channel
