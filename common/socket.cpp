// ============================================================
// socket.cpp -- TcpSocket implementation
// ============================================================

#include "socket.hpp"
#include "protocol_io.hpp"
#include "errors.hpp"
#include <cstring>
#include <string>
#include <vector>
#include <algorithm>
#include <chrono>

#include <sys/uio.h>
#include <poll.h>

TcpSocket::TcpSocket() {
    fd_ = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (fd_ == INVALID_SOCKET_VAL) {
        throw FtpError("socket() failed: " + socket_error_str(last_socket_error()));
    }
}

TcpSocket::TcpSocket(socket_t fd) : fd_(fd) {}

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& o) noexcept : fd_(o.fd_) {
    o.fd_ = INVALID_SOCKET_VAL;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& o) noexcept {
    if (this != &o) {
        close();
        fd_ = o.fd_;
        o.fd_ = INVALID_SOCKET_VAL;
    }
    return *this;
}

void TcpSocket::tune() {
    // Control frames are small request/response pairs; don't let Nagle
    // hold the size field back waiting for the payload ACK.
    int nodelay = 1;
    int keepalive = 1;
    setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY,  &nodelay,   sizeof(nodelay));
    setsockopt(fd_, SOL_SOCKET,  SO_KEEPALIVE, &keepalive, sizeof(keepalive));
}

void TcpSocket::connect(const std::string& host, u16 port) {
    addrinfo hints{};
    hints.ai_family   = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    int rc = ::getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res);
    if (rc != 0 || !res) {
        throw ConnectionRefused("Cannot resolve host '" + host + "': " + gai_strerror(rc));
    }
    int err = 0;
    bool ok = false;
    for (addrinfo* ai = res; ai; ai = ai->ai_next) {
        if (::connect(fd_, ai->ai_addr, ai->ai_addrlen) == 0) {
            ok = true;
            break;
        }
        err = last_socket_error();
    }
    ::freeaddrinfo(res);
    if (!ok) {
        throw ConnectionRefused("connect() to " + host + ":" + std::to_string(port) +
                                " failed: " + socket_error_str(err));
    }
    tune();
}

void TcpSocket::bind_and_listen(const std::string& ip, u16 port, int backlog) {
    int on = 1;
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (ip.empty() || ip == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        throw FtpError("Invalid IP address: " + ip);
    }
    if (::bind(fd_, (sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR_VAL) {
        throw FtpError("bind() failed: " + socket_error_str(last_socket_error()));
    }
    if (::listen(fd_, backlog) == SOCKET_ERROR_VAL) {
        throw FtpError("listen() failed: " + socket_error_str(last_socket_error()));
    }
}

TcpSocket TcpSocket::accept() {
    sockaddr_in peer{};
    socklen_t peer_len = sizeof(peer);
    socket_t client;
    do {
        client = ::accept(fd_, (sockaddr*)&peer, &peer_len);
    } while (client == INVALID_SOCKET_VAL && last_socket_error() == EINTR);
    if (client == INVALID_SOCKET_VAL) {
        throw FtpError("accept() failed: " + socket_error_str(last_socket_error()));
    }
    return TcpSocket(client);
}

bool TcpSocket::wait_readable(int timeout_ms) {
    using clock = std::chrono::steady_clock;
    auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms);
    for (;;) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                        deadline - clock::now()).count();
        if (left < 0) left = 0;

        pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;
        int rc = ::poll(&pfd, 1, (int)left);
        if (rc > 0) return true;
        if (rc == 0) return false;
        if (errno != EINTR) {
            throw FtpError("poll() failed: " + socket_error_str(errno));
        }
    }
}

void TcpSocket::send_all(const void* buf, size_t len) {
    const char* p = static_cast<const char*>(buf);
    size_t remaining = len;
    while (remaining > 0) {
        ssize_t sent = ::send(fd_, p, remaining, MSG_NOSIGNAL);
        if (sent < 0) {
            int err = last_socket_error();
            if (err == EINTR) continue;
            if (would_block(err)) {
                // SO_SNDTIMEO expired
                throw ConnectionClosed("Send timed out");
            }
            if (err == EPIPE || err == ECONNRESET) {
                throw ConnectionClosed("Connection closed during send: " + socket_error_str(err));
            }
            throw FtpError("send() failed: " + socket_error_str(err));
        }
        p += sent;
        remaining -= static_cast<size_t>(sent);
    }
}

bool TcpSocket::recv_all(void* buf, size_t len) {
    char* p = static_cast<char*>(buf);
    size_t remaining = len;
    while (remaining > 0) {
        ssize_t received = ::recv(fd_, p, remaining, 0);
        if (received == 0) {
            if (remaining == len) return false; // clean close
            throw ConnectionClosed("Connection closed after " +
                                   std::to_string(len - remaining) + " of " +
                                   std::to_string(len) + " bytes");
        }
        if (received < 0) {
            int err = last_socket_error();
            if (err == EINTR) continue;
            if (would_block(err)) {
                // SO_RCVTIMEO expired
                throw ConnectionClosed("Receive timed out");
            }
            if (err == ECONNRESET) {
                throw ConnectionClosed("Connection reset by peer");
            }
            throw FtpError("recv() failed: " + socket_error_str(err));
        }
        p += received;
        remaining -= static_cast<size_t>(received);
    }
    return true;
}

size_t TcpSocket::recv_some(void* buf, size_t len) {
    for (;;) {
        ssize_t received = ::recv(fd_, buf, len, 0);
        if (received >= 0) return static_cast<size_t>(received);
        int err = last_socket_error();
        if (err == EINTR) continue;
        if (would_block(err)) throw ConnectionClosed("Receive timed out");
        if (err == ECONNRESET) throw ConnectionClosed("Connection reset by peer");
        throw FtpError("recv() failed: " + socket_error_str(err));
    }
}

void TcpSocket::write_frame(const void* payload, u64 payload_len) {
    char hdr_buf[FRAME_SIZE_FIELD_LEN];
    proto::encode_size_field(payload_len, hdr_buf);

    if (payload_len == 0 || !payload) {
        send_all(hdr_buf, FRAME_SIZE_FIELD_LEN);
        return;
    }

    // sendmsg: size field + payload in one syscall (MSG_NOSIGNAL), handle partial sends
    size_t total = FRAME_SIZE_FIELD_LEN + (size_t)payload_len;
    size_t sent_total = 0;
    while (sent_total < total) {
        // Rebuild iovec from remaining data
        struct iovec cur[2];
        int cur_cnt = 0;
        size_t skip = sent_total;
        for (int i = 0; i < 2; ++i) {
            size_t seg_len = (i == 0) ? FRAME_SIZE_FIELD_LEN : (size_t)payload_len;
            const char* seg_base = (i == 0) ? hdr_buf : static_cast<const char*>(payload);
            if (skip >= seg_len) { skip -= seg_len; continue; }
            cur[cur_cnt].iov_base = const_cast<char*>(seg_base + skip);
            cur[cur_cnt].iov_len  = seg_len - skip;
            skip = 0;
            ++cur_cnt;
        }
        msghdr msg{};
        msg.msg_iov    = cur;
        msg.msg_iovlen = (size_t)cur_cnt;
        ssize_t n = ::sendmsg(fd_, &msg, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (would_block(errno)) throw ConnectionClosed("Send timed out");
            if (errno == EPIPE || errno == ECONNRESET) {
                throw ConnectionClosed("Connection closed during send: " + socket_error_str(errno));
            }
            throw FtpError("sendmsg failed: " + socket_error_str(errno));
        }
        sent_total += (size_t)n;
    }
}

void TcpSocket::write_frame(const std::string& payload) {
    write_frame(payload.data(), (u64)payload.size());
}

void TcpSocket::write_frame_size(u64 payload_len) {
    char hdr_buf[FRAME_SIZE_FIELD_LEN];
    proto::encode_size_field(payload_len, hdr_buf);
    send_all(hdr_buf, FRAME_SIZE_FIELD_LEN);
}

bool TcpSocket::read_frame(std::string& payload, u64 max_len) {
    char hdr_buf[FRAME_SIZE_FIELD_LEN];
    if (!recv_all(hdr_buf, FRAME_SIZE_FIELD_LEN)) return false;
    u64 len = proto::decode_size_field(hdr_buf);
    if (len > max_len) {
        throw PayloadTooLarge("Declared frame size " + std::to_string(len) +
                              " exceeds limit " + std::to_string(max_len));
    }
    payload.resize((size_t)len);
    if (len > 0 && !recv_all(&payload[0], (size_t)len)) {
        throw ConnectionClosed("Connection closed before " + std::to_string(len) +
                               " payload bytes arrived");
    }
    return true;
}

u64 TcpSocket::read_frame_size() {
    char hdr_buf[FRAME_SIZE_FIELD_LEN];
    if (!recv_all(hdr_buf, FRAME_SIZE_FIELD_LEN)) {
        throw ConnectionClosed("Connection closed before frame size field");
    }
    return proto::decode_size_field(hdr_buf);
}

void TcpSocket::close() {
    if (fd_ != INVALID_SOCKET_VAL) {
        CLOSE_SOCKET(fd_);
        fd_ = INVALID_SOCKET_VAL;
    }
}

void TcpSocket::shutdown() {
    if (fd_ != INVALID_SOCKET_VAL) {
        ::shutdown(fd_, SHUT_RDWR);
    }
}

std::string TcpSocket::peer_addr() const {
    sockaddr_in peer{};
    socklen_t len = sizeof(peer);
    if (getpeername(fd_, (sockaddr*)&peer, &len) == 0) {
        char buf[INET_ADDRSTRLEN] = {0};
        if (inet_ntop(AF_INET, &peer.sin_addr, buf, sizeof(buf))) {
            return std::string(buf) + ":" + std::to_string(ntohs(peer.sin_port));
        }
    }
    return "unknown";
}

std::string TcpSocket::peer_ip() const {
    sockaddr_in peer{};
    socklen_t len = sizeof(peer);
    char buf[INET_ADDRSTRLEN] = {0};
    if (getpeername(fd_, (sockaddr*)&peer, &len) == 0 &&
        inet_ntop(AF_INET, &peer.sin_addr, buf, sizeof(buf))) {
        return buf;
    }
    return "";
}

std::string TcpSocket::local_ip() const {
    sockaddr_in self{};
    socklen_t len = sizeof(self);
    char buf[INET_ADDRSTRLEN] = {0};
    if (getsockname(fd_, (sockaddr*)&self, &len) == 0 &&
        inet_ntop(AF_INET, &self.sin_addr, buf, sizeof(buf))) {
        return buf;
    }
    return "";
}

u16 TcpSocket::local_port() const {
    sockaddr_in self{};
    socklen_t len = sizeof(self);
    if (getsockname(fd_, (sockaddr*)&self, &len) != 0) {
        throw FtpError("getsockname() failed: " + socket_error_str(last_socket_error()));
    }
    return ntohs(self.sin_port);
}

void TcpSocket::set_recv_timeout_ms(int ms) {
    struct timeval tv;
    tv.tv_sec  = ms / 1000;
    tv.tv_usec = (ms % 1000) * 1000;
    if (setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0) {
        throw FtpError("setsockopt(SO_RCVTIMEO) failed: " +
                       socket_error_str(last_socket_error()));
    }
}

void TcpSocket::set_send_timeout_ms(int ms) {
    struct timeval tv;
    tv.tv_sec  = ms / 1000;
    tv.tv_usec = (ms % 1000) * 1000;
    if (setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) {
        throw FtpError("setsockopt(SO_SNDTIMEO) failed: " +
                       socket_error_str(last_socket_error()));
    }
}
