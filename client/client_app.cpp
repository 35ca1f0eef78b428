// ============================================================
// client_app.cpp -- minftp interactive client
// ============================================================

#include "client_app.hpp"
#include "../common/command.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/protocol.hpp"
#include "../common/utils.hpp"
#include <iostream>

static constexpr const char* LOCAL_HELP_TEXT =
    "\tlls - lists files in the local directory";

static std::string lowercase(std::string s) {
    for (auto& c : s) {
        if (c >= 'A' && c <= 'Z') c = (char)(c + 32);
    }
    return s;
}

ClientApp::ClientApp(const std::string& server_host,
                     u16 server_port,
                     const std::string& local_dir,
                     int retry_secs)
    : client_(server_host, server_port)
    , local_dir_(local_dir)
    , retry_secs_(retry_secs)
{}

ClientApp::~ClientApp() {
    try {
        client_.quit();
    } catch (const std::exception& e) {
        LOG_DEBUG(std::string("~ClientApp: ") + e.what());
    }
}

int ClientApp::run(std::istream& in, std::ostream& out) {
    LOG_INFO("Connecting to server " + client_.host() + ":" +
             std::to_string(client_.port()));
    try {
        client_.connect(retry_secs_);
    } catch (const FtpError& e) {
        LOG_ERROR("Failed to connect to server: " + std::string(e.what()));
        return 1;
    }
    out << "Connected to " << client_.host() << ":" << client_.port() << "\n";

    std::string line;
    for (;;) {
        out << CLIENT_PROMPT << std::flush;
        if (!std::getline(in, line)) {
            // End of input behaves like quit
            out << "\n";
            execute("quit", out);
            break;
        }
        if (!execute(line, out)) break;
    }
    return client_.is_connected() ? 1 : 0;
}

// ---------------------------------------------------------------
// execute
//   Commands are validated before anything is sent, so a typo costs
//   no round trip. A lost control connection ends the session; any
//   other failure is reported and the prompt comes back.
// ---------------------------------------------------------------
bool ClientApp::execute(const std::string& line, std::ostream& out) {
    std::vector<std::string> tokens = utils::split_ws(line);
    if (tokens.empty()) return true;

    if (lowercase(tokens[0]) == "lls") {
        do_lls(out);
        return true;
    }

    Command cmd;
    try {
        cmd = parse_command(line);
    } catch (const UnknownCommand& e) {
        out << ERROR_PREFIX << e.what() << "\n" << HELP_TEXT << "\n"
            << LOCAL_HELP_TEXT << "\n";
        return true;
    }

    try {
        switch (cmd.verb) {
            case Verb::GET:
                do_get(cmd.arg, out);
                break;
            case Verb::PUT:
                do_put(cmd.arg, out);
                break;
            case Verb::LS: {
                std::string listing = client_.list();
                if (!listing.empty()) out << listing << "\n";
                break;
            }
            case Verb::HELP:
                out << client_.help() << "\n" << LOCAL_HELP_TEXT << "\n";
                break;
            case Verb::QUIT:
                client_.quit();
                out << QUIT_ACK << "\n";
                return false;
        }
    } catch (const FtpError& e) {
        out << ERROR_PREFIX << e.what() << "\n";
        if (!client_.is_connected()) {
            LOG_ERROR("Control connection lost: " + std::string(e.what()));
            return false;
        }
    }
    return true;
}

void ClientApp::do_get(const std::string& name, std::ostream& out) {
    fs::path saved;
    TransferResult res = client_.get(name, local_dir_, &saved);
    out << "Received '" << name << "' as '" << saved.filename().string() << "' ("
        << utils::format_bytes(res.bytes) << ", "
        << utils::format_speed(res.bytes, res.elapsed_ms) << ")\n";
}

void ClientApp::do_put(const std::string& name, std::ostream& out) {
    fs::path local = fs::path(name).is_absolute() ? fs::path(name) : local_dir_ / name;
    TransferResult res = client_.put(local);
    out << "Sent '" << local.filename().string() << "' ("
        << utils::format_bytes(res.bytes) << ", "
        << utils::format_speed(res.bytes, res.elapsed_ms) << ")\n";
}

void ClientApp::do_lls(std::ostream& out) {
    try {
        file_io::DirectoryStore local(local_dir_);
        for (const auto& name : local.list()) out << name << "\n";
    } catch (const FileIoError& e) {
        out << ERROR_PREFIX << e.what() << "\n";
    }
}
