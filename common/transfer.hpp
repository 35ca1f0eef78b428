#pragma once

// ============================================================
// transfer.hpp -- Moves one file across a data connection
//
// A transfer is exactly one frame: the size field declares the
// file length, the payload is streamed in TRANSFER_CHUNK_SIZE
// pieces so memory use does not grow with the file.
// ============================================================

#include "platform.hpp"
#include "socket.hpp"
#include "file_io.hpp"
#include "hash.hpp"
#include <string>

struct TransferResult {
    u64           bytes{0};       // payload bytes moved
    u64           declared{0};    // size field on the wire
    hash::Hash128 digest{};       // xxh3_128 of the payload
    u64           elapsed_ms{0};
};

namespace transfer {

// Send the whole file as one frame. Throws PayloadTooLarge before
// writing anything if the file exceeds MAX_FRAME_PAYLOAD, FileIoError if
// the file cannot be read or shrinks during the transfer.
TransferResult send_file(TcpSocket& sock, file_io::FileReader& reader);

// Receive one frame into writer. The writer is left uncommitted; the
// caller decides whether to commit. Throws MalformedLength,
// ConnectionClosed, FileIoError.
TransferResult receive_file(TcpSocket& sock, file_io::FileWriter& writer);

// Receive one frame into a new file at destination_path, committed only
// once the whole payload has arrived
TransferResult receive_file(TcpSocket& sock, const std::string& destination_path);

} // namespace transfer
