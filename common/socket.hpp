#pragma once

// ============================================================
// socket.hpp -- RAII TCP socket wrapper
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include <string>
#include <vector>

class TcpSocket {
public:
    TcpSocket();
    explicit TcpSocket(socket_t fd);
    ~TcpSocket();

    // Non-copyable
    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    // Movable
    TcpSocket(TcpSocket&& o) noexcept;
    TcpSocket& operator=(TcpSocket&& o) noexcept;

    // Client: resolve host (name or IPv4 literal) and connect.
    // Throws ConnectionRefused.
    void connect(const std::string& host, u16 port);

    // Server: bind + listen. Port 0 asks the OS for an ephemeral port.
    void bind_and_listen(const std::string& ip, u16 port, int backlog = 16);

    // Accept one connection (blocking)
    TcpSocket accept();

    // Wait up to timeout_ms for a pending connection.
    // Returns false on timeout.
    bool wait_readable(int timeout_ms);

    // Send exactly 'len' bytes; throws on error
    void send_all(const void* buf, size_t len);

    // Receive exactly 'len' bytes. Returns false if the peer closed
    // before the first byte; throws ConnectionClosed if it closed
    // (or the receive timeout fired) part way through.
    bool recv_all(void* buf, size_t len);

    // Receive up to 'len' bytes; returns 0 on clean close.
    size_t recv_some(void* buf, size_t len);

    // Send a complete frame (size field + payload)
    void write_frame(const void* payload, u64 payload_len);
    void write_frame(const std::string& payload);

    // Send only the size field; the caller streams the payload.
    void write_frame_size(u64 payload_len);

    // Read the next frame into 'payload'. Returns false on clean close
    // between frames. Throws MalformedLength, ConnectionClosed, or
    // PayloadTooLarge if the declared size exceeds max_len.
    bool read_frame(std::string& payload, u64 max_len);

    // Read only the size field; the caller streams the payload.
    // Throws ConnectionClosed if the peer closes first.
    u64 read_frame_size();

    void tune();

    bool is_valid() const { return fd_ != INVALID_SOCKET_VAL; }
    socket_t native() const { return fd_; }

    void close();

    // Disable further sends/receives without releasing the descriptor;
    // unblocks a thread sitting in accept() or recv().
    void shutdown();

    // Address strings "ip:port" / parts
    std::string peer_addr() const;
    std::string peer_ip() const;
    std::string local_ip() const;
    u16 local_port() const;

    // Set receive/send timeouts in milliseconds (0 = infinite).
    // An expired timeout surfaces as ConnectionClosed.
    void set_recv_timeout_ms(int ms);
    void set_send_timeout_ms(int ms);

private:
    socket_t fd_{INVALID_SOCKET_VAL};
};
