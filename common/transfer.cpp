// ============================================================
// transfer.cpp -- Transfer engine
// ============================================================

#include "transfer.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "utils.hpp"
#include <algorithm>
#include <vector>

TransferResult transfer::send_file(TcpSocket& sock, file_io::FileReader& reader) {
    TransferResult res;
    u64 start = utils::now_ms();

    // Declared size is fixed at open time
    const u64 size = reader.size();
    if (size > MAX_FRAME_PAYLOAD) {
        throw PayloadTooLarge("'" + reader.path() + "' is " + std::to_string(size) +
                              " bytes, frame maximum is " + std::to_string(MAX_FRAME_PAYLOAD));
    }
    sock.write_frame_size(size);
    res.declared = size;

    hash::StreamHasher128 hasher;
    std::vector<char> buf(TRANSFER_CHUNK_SIZE);

    while (res.bytes < size) {
        size_t want = (size_t)std::min<u64>(buf.size(), size - res.bytes);
        size_t got  = reader.read(buf.data(), want);
        if (got == 0) {
            throw FileIoError("'" + reader.path() + "' shrank during transfer: " +
                              std::to_string(res.bytes) + " of " +
                              std::to_string(size) + " bytes sent");
        }
        sock.send_all(buf.data(), got);
        hasher.update(buf.data(), got);
        res.bytes += got;
    }

    res.digest     = hasher.digest();
    res.elapsed_ms = utils::now_ms() - start;
    return res;
}

TransferResult transfer::receive_file(TcpSocket& sock, file_io::FileWriter& writer) {
    TransferResult res;
    u64 start = utils::now_ms();

    const u64 size = sock.read_frame_size();
    res.declared = size;

    hash::StreamHasher128 hasher;
    std::vector<char> buf(TRANSFER_CHUNK_SIZE);

    while (res.bytes < size) {
        size_t want = (size_t)std::min<u64>(buf.size(), size - res.bytes);
        size_t got  = sock.recv_some(buf.data(), want);
        if (got == 0) {
            throw ConnectionClosed("Sender closed after " + std::to_string(res.bytes) +
                                   " of " + std::to_string(size) + " bytes");
        }
        writer.write(buf.data(), got);
        hasher.update(buf.data(), got);
        res.bytes += got;
    }

    res.digest     = hasher.digest();
    res.elapsed_ms = utils::now_ms() - start;
    return res;
}

TransferResult transfer::receive_file(TcpSocket& sock, const std::string& destination_path) {
    file_io::FileWriter writer(destination_path);
    TransferResult res = receive_file(sock, writer);
    writer.commit();
    return res;
}
