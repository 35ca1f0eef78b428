#pragma once

// ============================================================
// ftp_client.hpp -- Client side of the minftp protocol
//
// One control connection; every call sends one command frame and
// reads one response frame. get/put open a data connection to the
// port the server offers and move the file as one frame.
// ============================================================

#include "../common/platform.hpp"
#include "../common/command.hpp"
#include "../common/socket.hpp"
#include "../common/transfer.hpp"
#include <string>
#include <filesystem>

namespace fs = std::filesystem;

class FtpClient {
public:
    FtpClient(std::string host, u16 port);

    // Connect the control channel. With retry_secs > 0 keep retrying
    // with exponential back-off until the deadline.
    // Throws ConnectionRefused.
    void connect(int retry_secs = 0);

    bool is_connected() const { return sock_.is_valid(); }

    // Send one raw command line, return the response payload.
    // Throws ConnectionClosed if the server hangs up.
    std::string request(const std::string& line);

    // Server directory listing, one name per line. Throws ServerError.
    std::string list();

    std::string help();

    // Download remote_name into local_dir without overwriting anything
    // there: an existing name gets a "(1)", "(2)", ... suffix.
    // Throws ServerError, ConnectionRefused, ConnectionClosed, FileIoError.
    TransferResult get(const std::string& remote_name,
                       const fs::path& local_dir,
                       fs::path* saved_as = nullptr);

    // Upload a local file under its own file name. A missing local file
    // throws FileNotFound before anything is sent to the server; a server
    // that could not store the upload throws ServerError.
    TransferResult put(const fs::path& local_path);

    // Send quit, wait for the acknowledgement, close the connection
    void quit();

    // Idle limit on data connections (default DEFAULT_TRANSFER_TIMEOUT_MS)
    void set_transfer_timeout_ms(int ms) { transfer_timeout_ms_ = ms; }

    const std::string& host() const { return host_; }
    u16 port() const { return port_; }

private:
    std::string host_;
    u16         port_;
    TcpSocket   sock_{INVALID_SOCKET_VAL};
    int         transfer_timeout_ms_{DEFAULT_TRANSFER_TIMEOUT_MS};

    // Issue get/put and turn the response into a port number
    u16 negotiate(const Command& cmd);

    // Read one response frame; a dead control channel is closed
    std::string read_response();
};
