#pragma once

// ============================================================
// platform.hpp -- POSIX socket/OS abstraction
//
// minftp relies on fork() for the process-per-connection server
// mode, so only POSIX targets are supported.
// ============================================================

#include <string>
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <csignal>

#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <netdb.h>

using socket_t = int;
#define INVALID_SOCKET_VAL (-1)
#define SOCKET_ERROR_VAL   (-1)
#define CLOSE_SOCKET(s)    ::close(s)

inline int last_socket_error() { return errno; }
inline bool would_block(int err) { return err == EAGAIN || err == EWOULDBLOCK; }
inline std::string socket_error_str(int err) {
    return std::string(strerror(err)) + " (errno=" + std::to_string(err) + ")";
}

namespace platform {

// Writing to a socket the peer already closed must surface as EPIPE,
// not kill the process.
inline void ignore_sigpipe() {
    std::signal(SIGPIPE, SIG_IGN);
}

inline int current_pid() {
    return (int)::getpid();
}

} // namespace platform

// ---- Portable types ----
using u8  = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;
