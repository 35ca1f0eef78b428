#pragma once

// protocol.hpp -- Wire protocol definitions for minftp
//
// Every socket (control and data) carries frames:
//
//   [10 ASCII decimal digits, zero padded][payload]
//
// The size field counts payload bytes only.

#include "platform.hpp"

static constexpr size_t FRAME_SIZE_FIELD_LEN = 10;
static constexpr u64    MAX_FRAME_PAYLOAD    = 9999999999ull;

// Largest command frame the server will buffer; a bigger declared size
// is treated as a framing violation.
static constexpr u64    MAX_COMMAND_LEN      = 4u * 1024u;
// Largest control response the client will buffer (directory listings).
static constexpr u64    MAX_RESPONSE_LEN     = 64u * 1024u * 1024u;

// File data is streamed in chunks of this size on the data channel.
static constexpr size_t TRANSFER_CHUNK_SIZE  = 64u * 1024u;

static constexpr int    DEFAULT_ACCEPT_TIMEOUT_MS   = 30 * 1000;
static constexpr int    DEFAULT_TRANSFER_TIMEOUT_MS = 60 * 1000;

// ---- Control-channel responses ----
static constexpr const char* ERROR_PREFIX = "error: ";
static constexpr const char* QUIT_ACK     = "goodbye";

// put is answered twice: the port offer, then once the upload has been
// committed (or given up) either "stored <bytes>" or an error.
static constexpr const char* PUT_STORED_PREFIX = "stored ";

static constexpr const char* HELP_TEXT =
    "The FTP server accepts the following commands:\n"
    "\tget <file name> - downloads file <file name> from the server\n"
    "\tput <file name> - uploads file <file name> to the server\n"
    "\tls - lists files on the server\n"
    "\thelp - prints this help text\n"
    "\tquit - disconnects";

// Direction of one data-channel transfer, seen from the server
enum class TransferDirection : u8 {
    SEND    = 0,   // get: server -> client
    RECEIVE = 1,   // put: client -> server
};

inline const char* direction_str(TransferDirection d) {
    return d == TransferDirection::SEND ? "send" : "receive";
}
