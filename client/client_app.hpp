#pragma once

// ============================================================
// client_app.hpp -- minftp interactive client
//
// Reads one command per line at the "ftp> " prompt, checks it
// locally, and drives FtpClient. get/put resolve local files
// against the client's working directory.
// ============================================================

#include "../common/platform.hpp"
#include "ftp_client.hpp"
#include <string>
#include <istream>
#include <ostream>
#include <filesystem>

namespace fs = std::filesystem;

static constexpr const char* CLIENT_PROMPT = "ftp> ";

class ClientApp {
public:
    ClientApp(const std::string& server_host,
              u16 server_port,
              const std::string& local_dir = ".",
              int retry_secs = 0);
    ~ClientApp();

    // Connect, then serve the prompt until quit or end of input.
    // Returns 0 on a clean quit, nonzero if the connection failed.
    int run(std::istream& in, std::ostream& out);

    // Execute one input line. Returns false once the session is over.
    bool execute(const std::string& line, std::ostream& out);

    FtpClient& client() { return client_; }

private:
    FtpClient client_;
    fs::path  local_dir_;
    int       retry_secs_;

    void do_get(const std::string& name, std::ostream& out);
    void do_put(const std::string& name, std::ostream& out);
    void do_lls(std::ostream& out);
};
