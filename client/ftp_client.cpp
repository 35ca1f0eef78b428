// ============================================================
// ftp_client.cpp -- minftp protocol client
// ============================================================

#include "ftp_client.hpp"
#include "../common/command.hpp"
#include "../common/data_channel.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/protocol.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>
#include <utility>

FtpClient::FtpClient(std::string host, u16 port)
    : host_(std::move(host))
    , port_(port)
{}

// ---------------------------------------------------------------
// connect
// ---------------------------------------------------------------
void FtpClient::connect(int retry_secs) {
    using clock = std::chrono::steady_clock;
    auto deadline = clock::now() + std::chrono::seconds(retry_secs > 0 ? retry_secs : 0);

    int delay_ms = 500;
    const int max_delay_ms = 8000;

    for (;;) {
        try {
            TcpSocket s;
            s.connect(host_, port_);
            sock_ = std::move(s);
            LOG_DEBUG("Control connection established to " + host_ + ":" + std::to_string(port_));
            return;
        } catch (const ConnectionRefused& e) {
            if (clock::now() >= deadline) throw;
            LOG_WARN("server not ready (" + std::string(e.what()) + "), retry in " +
                     std::to_string(delay_ms) + " ms");
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
            delay_ms = std::min(delay_ms * 2, max_delay_ms);
        }
    }
}

std::string FtpClient::request(const std::string& line) {
    if (!sock_.is_valid()) {
        throw ConnectionClosed("Not connected");
    }
    try {
        sock_.write_frame(line);
    } catch (const FtpError&) {
        sock_.close();
        throw;
    }
    return read_response();
}

std::string FtpClient::read_response() {
    std::string resp;
    try {
        if (!sock_.read_frame(resp, MAX_RESPONSE_LEN)) {
            throw ConnectionClosed("Server closed the control connection");
        }
    } catch (const FtpError&) {
        // A broken control channel cannot be resynchronised
        sock_.close();
        throw;
    }
    return resp;
}

static bool is_error_response(const std::string& resp) {
    return resp.compare(0, std::char_traits<char>::length(ERROR_PREFIX), ERROR_PREFIX) == 0;
}

static std::string strip_error_prefix(const std::string& resp) {
    return resp.substr(std::char_traits<char>::length(ERROR_PREFIX));
}

std::string FtpClient::list() {
    std::string resp = request(format_command(Command{Verb::LS, ""}));
    if (is_error_response(resp)) throw ServerError(strip_error_prefix(resp));
    return resp;
}

std::string FtpClient::help() {
    return request(format_command(Command{Verb::HELP, ""}));
}

u16 FtpClient::negotiate(const Command& cmd) {
    std::string line = format_command(cmd);
    std::string resp = request(line);
    u16 data_port = 0;
    if (data_channel::parse_port_offer(resp, data_port)) return data_port;
    if (is_error_response(resp)) throw ServerError(strip_error_prefix(resp));
    throw FtpError("Unexpected response to '" + line + "': " + resp);
}

// ---------------------------------------------------------------
// get
// ---------------------------------------------------------------
TransferResult FtpClient::get(const std::string& remote_name,
                              const fs::path& local_dir,
                              fs::path* saved_as) {
    u16 data_port = negotiate(Command{Verb::GET, remote_name});

    TcpSocket data = data_channel::connect_to_offered_port(host_, data_port);
    data.set_recv_timeout_ms(transfer_timeout_ms_);

    fs::path target = file_io::unique_local_path(local_dir, remote_name);
    TransferResult res = transfer::receive_file(data, target.string());

    LOG_DEBUG("Retrieved '" + remote_name + "' as '" + target.string() + "' xxh3=" +
              hash::to_hex(res.digest));
    if (saved_as) *saved_as = target;
    return res;
}

// ---------------------------------------------------------------
// put
//   The local file is opened before the command is sent, so a missing
//   or unreadable file never makes the server open a port. After the
//   upload the server sends one more frame saying whether the file was
//   stored; it arrives even when the upload failed on this side.
// ---------------------------------------------------------------
TransferResult FtpClient::put(const fs::path& local_path) {
    std::error_code ec;
    if (!fs::is_regular_file(local_path, ec)) {
        throw FileNotFound("'" + local_path.string() + "' is not a valid file");
    }
    file_io::FileReader reader(local_path.string());
    if (reader.size() > MAX_FRAME_PAYLOAD) {
        throw PayloadTooLarge("'" + local_path.string() + "' exceeds the maximum transfer size");
    }

    std::string remote_name = local_path.filename().string();
    u16 data_port = negotiate(Command{Verb::PUT, remote_name});

    TransferResult res;
    try {
        TcpSocket data = data_channel::connect_to_offered_port(host_, data_port);
        data.set_send_timeout_ms(transfer_timeout_ms_);
        res = transfer::send_file(data, reader);
    } catch (const FtpError& e) {
        // Consume the server's verdict so the next command lines up
        std::string outcome = read_response();
        LOG_DEBUG("put '" + remote_name + "' failed locally (" + e.what() +
                  "), server said: " + outcome);
        throw;
    }

    std::string outcome = read_response();
    if (is_error_response(outcome)) throw ServerError(strip_error_prefix(outcome));
    if (outcome.compare(0, std::char_traits<char>::length(PUT_STORED_PREFIX),
                        PUT_STORED_PREFIX) != 0) {
        throw FtpError("Unexpected response to '" + format_command(Command{Verb::PUT, remote_name}) +
                       "': " + outcome);
    }

    LOG_DEBUG("Sent '" + local_path.string() + "' xxh3=" + hash::to_hex(res.digest));
    return res;
}

void FtpClient::quit() {
    if (!sock_.is_valid()) return;
    try {
        std::string resp = request(format_command(Command{Verb::QUIT, ""}));
        if (resp != QUIT_ACK) {
            LOG_WARN("Unexpected quit response: " + resp);
        }
    } catch (const ConnectionClosed& e) {
        LOG_DEBUG(std::string("quit: ") + e.what());
    }
    sock_.close();
}
