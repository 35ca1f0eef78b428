// ============================================================
// server/main.cpp -- minftp server entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "server_app.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <csignal>

static ServerApp* g_app = nullptr;

static void sig_handler(int /*sig*/) {
    if (g_app) g_app->stop();
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <port> [options]\n"
        << "\n"
        << "  port                   TCP port for the control channel (e.g. 2121)\n"
        << "\nOptions:\n"
        << "  --mode M               iterative | threaded | forked (default: iterative)\n"
        << "  -t N                   same as --mode: 0 iterative, 1 threaded, 2 forked\n"
        << "  --root DIR             directory to serve (default: current directory)\n"
        << "  --bind IP              address to listen on (default: 0.0.0.0)\n"
        << "  --accept-timeout SEC   wait for a data connection (default: 30)\n"
        << "  --transfer-timeout SEC idle limit on a data connection (default: 60)\n"
        << "  --log-file PATH        also append log lines to PATH\n"
        << "  --verbose              enable debug logging\n"
        << "\nExample:\n"
        << "  " << prog << " 2121 --mode threaded --root /srv/files --log-file server.log\n";
}

int main(int argc, char* argv[]) {
    platform::ignore_sigpipe();

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    ServerConfig cfg;
    int port_int = 0;
    if (!utils::parse_int(argv[1], port_int) || !utils::validate_port(port_int)) {
        std::cerr << "ERROR: Invalid port: " << argv[1] << "\n";
        return 1;
    }

    int accept_secs   = DEFAULT_ACCEPT_TIMEOUT_MS / 1000;
    int transfer_secs = DEFAULT_TRANSFER_TIMEOUT_MS / 1000;

    for (int i = 2; i < argc; ++i) {
        if ((std::strcmp(argv[i], "--mode") == 0 || std::strcmp(argv[i], "-t") == 0) && i + 1 < argc) {
            if (!parse_server_mode(argv[++i], cfg.mode)) {
                std::cerr << "ERROR: Invalid mode: " << argv[i] << "\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--root") == 0 && i + 1 < argc) {
            cfg.root_dir = argv[++i];
        } else if (std::strcmp(argv[i], "--bind") == 0 && i + 1 < argc) {
            cfg.listen_ip = argv[++i];
        } else if (std::strcmp(argv[i], "--accept-timeout") == 0 && i + 1 < argc) {
            if (!utils::parse_int(argv[++i], accept_secs)) accept_secs = -1;
        } else if (std::strcmp(argv[i], "--transfer-timeout") == 0 && i + 1 < argc) {
            if (!utils::parse_int(argv[++i], transfer_secs)) transfer_secs = -1;
        } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            cfg.log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            Logger::get().set_level(LogLevel::DEBUG);
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!utils::validate_path(cfg.root_dir)) {
        std::cerr << "ERROR: Invalid root directory\n";
        return 1;
    }
    if (cfg.listen_ip != "0.0.0.0" && !utils::validate_ip(cfg.listen_ip)) {
        std::cerr << "ERROR: Invalid IP address: " << cfg.listen_ip << "\n";
        return 1;
    }
    if (accept_secs < 1 || accept_secs > 3600) {
        std::cerr << "ERROR: --accept-timeout must be 1-3600\n";
        return 1;
    }
    if (transfer_secs < 1 || transfer_secs > 3600) {
        std::cerr << "ERROR: --transfer-timeout must be 1-3600\n";
        return 1;
    }
    if (!cfg.log_file.empty() && !Logger::get().set_log_file(cfg.log_file)) {
        std::cerr << "ERROR: Cannot open log file: " << cfg.log_file << "\n";
        return 1;
    }

    cfg.listen_port                 = (u16)port_int;
    cfg.session.accept_timeout_ms   = accept_secs * 1000;
    cfg.session.transfer_timeout_ms = transfer_secs * 1000;

    try {
        ServerApp app(std::move(cfg));
        g_app = &app;

        std::signal(SIGINT,  sig_handler);
        std::signal(SIGTERM, sig_handler);

        int rc = app.run();
        g_app = nullptr;
        return rc;
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
