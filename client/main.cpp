// ============================================================
// client/main.cpp -- minftp client entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "client_app.hpp"
#include <iostream>
#include <string>
#include <cstring>

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <host> <port> [options]\n"
        << "\n"
        << "  host            minftp_server host name or IP address\n"
        << "  port            control port (e.g. 2121)\n"
        << "\nOptions:\n"
        << "  --retry N       seconds to retry connecting if server not ready (default: 0)\n"
        << "  --dir DIR       local directory for get/put/lls (default: current directory)\n"
        << "  --verbose       enable debug logging\n"
        << "\nExamples:\n"
        << "  " << prog << " 127.0.0.1 2121\n"
        << "  " << prog << " ftp.example.net 2121 --dir /home/user/data --retry 30\n";
}

int main(int argc, char* argv[]) {
    platform::ignore_sigpipe();

    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    std::string host = argv[1];
    int port_int     = 0;
    int retry_secs   = 0;
    std::string dir  = ".";

    if (!utils::parse_int(argv[2], port_int) || !utils::validate_port(port_int)) {
        std::cerr << "ERROR: Invalid port: " << argv[2] << "\n";
        return 1;
    }

    // The prompt owns stdout; only warnings and errors by default
    Logger::get().set_level(LogLevel::WARN);

    for (int i = 3; i < argc; ++i) {
        if (std::strcmp(argv[i], "--retry") == 0 && i + 1 < argc) {
            if (!utils::parse_int(argv[++i], retry_secs) || retry_secs < 0) {
                std::cerr << "ERROR: Invalid retry: " << argv[i] << "\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--dir") == 0 && i + 1 < argc) {
            dir = argv[++i];
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            Logger::get().set_level(LogLevel::DEBUG);
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (host.empty()) {
        std::cerr << "ERROR: Invalid host\n";
        return 1;
    }
    if (!utils::validate_path(dir)) {
        std::cerr << "ERROR: Invalid directory: " << dir << "\n";
        return 1;
    }

    try {
        ClientApp app(host, (u16)port_int, dir, retry_secs);
        return app.run(std::cin, std::cout);
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
