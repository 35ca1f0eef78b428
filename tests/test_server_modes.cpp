// ============================================================
// test_server_modes.cpp -- Iterative, threaded and forked dispatch
// ============================================================

#include "server/server_app.hpp"
#include "client/ftp_client.hpp"
#include "common/data_channel.hpp"
#include "common/protocol.hpp"
#include "test_support.hpp"
#include "test_server.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <thread>
#include <vector>

#include <fcntl.h>

#include <sys/wait.h>
#include <unistd.h>

using namespace testing_support;

// Runs a ServerApp in a forked child; SIGTERM stops it. The child
// binds the port itself and reports it back over a pipe.
class ForkedServer {
public:
    ForkedServer(const fs::path& root, ServerMode mode, bool console = false) {
        int fds[2];
        if (::pipe(fds) != 0) return;

        std::fflush(nullptr);
        pid_ = ::fork();
        if (pid_ == 0) {
            ::close(fds[0]);
            if (console) Logger::get().set_console(true);
            try {
                ServerApp app(make_config(root, mode));
                app.listen();
                u16 port = app.port();
                if (::write(fds[1], &port, sizeof(port)) != (ssize_t)sizeof(port)) ::_exit(1);
                ::close(fds[1]);

                s_app = &app;
                std::signal(SIGTERM, [](int) { if (s_app) s_app->stop(); });
                app.run();
            } catch (const std::exception&) {
                ::_exit(1);
            }
            ::_exit(0);
        }

        ::close(fds[1]);
        if (pid_ > 0 && ::read(fds[0], &port_, sizeof(port_)) != (ssize_t)sizeof(port_)) {
            port_ = 0;
        }
        ::close(fds[0]);
    }
    ~ForkedServer() {
        if (pid_ > 0) {
            ::kill(pid_, SIGTERM);
            int status = 0;
            ::waitpid(pid_, &status, 0);
        }
    }

    u16 port() const { return port_; }
    pid_t pid() const { return pid_; }

private:
    static ServerApp* s_app;
    pid_t pid_{-1};
    u16   port_{0};
};

ServerApp* ForkedServer::s_app = nullptr;

class ServerModeTest : public ::testing::Test {
protected:
    static constexpr int kClients = 8;

    void SetUp() override {
        quiet_logs();
        for (int i = 0; i < kClients; ++i) {
            write_file(root_ / file_name(i), payload(i));
        }
    }

    static std::string file_name(int id) { return "file-" + std::to_string(id) + ".bin"; }
    static std::string payload(int id) { return make_payload(256 * 1024, (unsigned)id + 1); }

    // One client: list, download its own file, compare, upload, quit
    bool fetch_and_verify(u16 port, int id) {
        TempDir local;
        FtpClient client("127.0.0.1", port);
        client.connect(5);
        std::string listing = client.list();
        if (listing.find(file_name(id)) == std::string::npos) return false;

        fs::path saved;
        TransferResult res = client.get(file_name(id), local.path(), &saved);
        const std::string expected = payload(id);
        bool ok = res.bytes == expected.size() && read_file(saved) == expected;

        // Each client leaves a file of its own behind
        fs::path mine = local / ("client-" + std::to_string(id) + ".txt");
        write_file(mine, "from client " + std::to_string(id));
        client.put(mine);

        client.quit();
        return ok;
    }

    void run_concurrent_clients(u16 port, int n) {
        std::atomic<int> good{0};
        std::vector<std::thread> clients;
        for (int i = 0; i < n; ++i) {
            clients.emplace_back([&, i] {
                try {
                    if (fetch_and_verify(port, i)) good.fetch_add(1);
                } catch (const std::exception& e) {
                    ADD_FAILURE() << "client " << i << ": " << e.what();
                }
            });
        }
        for (auto& t : clients) t.join();
        EXPECT_EQ(good.load(), n);

        // Every upload is visible to a fresh session
        FtpClient check("127.0.0.1", port);
        check.connect(5);
        std::string listing = check.list();
        for (int i = 0; i < n; ++i) {
            EXPECT_NE(listing.find("client-" + std::to_string(i) + ".txt"), std::string::npos)
                << listing;
            EXPECT_EQ(read_file(root_ / ("client-" + std::to_string(i) + ".txt")),
                      "from client " + std::to_string(i));
        }
        check.quit();
    }

    TempDir root_;
};

TEST_F(ServerModeTest, IterativeServesClientsOneAfterAnother) {
    InProcessServer server(root_.path(), ServerMode::ITERATIVE);
    EXPECT_TRUE(fetch_and_verify(server.port(), 0));
    EXPECT_TRUE(fetch_and_verify(server.port(), 1));
}

TEST_F(ServerModeTest, IterativeQueuesSecondClientUntilFirstQuits) {
    InProcessServer server(root_.path(), ServerMode::ITERATIVE);

    FtpClient first("127.0.0.1", server.port());
    first.connect(5);
    first.list();

    std::atomic<bool> second_done{false};
    std::thread second([&] {
        try {
            FtpClient c("127.0.0.1", server.port());
            c.connect(5);
            c.list();
            second_done.store(true);
            c.quit();
        } catch (const std::exception& e) {
            ADD_FAILURE() << "second client: " << e.what();
        }
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    EXPECT_FALSE(second_done.load());

    first.quit();
    second.join();
    EXPECT_TRUE(second_done.load());
}

TEST_F(ServerModeTest, ThreadedServesConcurrentClients) {
    InProcessServer server(root_.path(), ServerMode::THREADED);
    run_concurrent_clients(server.port(), kClients);
}

TEST_F(ServerModeTest, ThreadedIdleClientDoesNotBlockOthers) {
    InProcessServer server(root_.path(), ServerMode::THREADED);

    FtpClient idle("127.0.0.1", server.port());
    idle.connect(5);
    idle.list();

    EXPECT_TRUE(fetch_and_verify(server.port(), 0));
    idle.quit();
}

TEST_F(ServerModeTest, ThreadedStopInterruptsLiveSessions) {
    FtpClient idle("127.0.0.1", 0);
    {
        InProcessServer server(root_.path(), ServerMode::THREADED);
        idle = FtpClient("127.0.0.1", server.port());
        idle.connect(5);
        idle.list();
        // Leaving scope stops the server with the session still open
    }
    EXPECT_THROW(idle.list(), ConnectionClosed);
    EXPECT_FALSE(idle.is_connected());
}

TEST_F(ServerModeTest, ForkedServesConcurrentClients) {
    ForkedServer server(root_.path(), ServerMode::FORKED);
    ASSERT_GT(server.pid(), 0);
    ASSERT_NE(server.port(), 0);
    run_concurrent_clients(server.port(), kClients);
}

TEST_F(ServerModeTest, ThreadedStopAbandonsPendingDataConnection) {
    ServerConfig cfg = make_config(root_.path(), ServerMode::THREADED);
    cfg.session.accept_timeout_ms = 20000;
    ServerApp app(cfg);
    app.listen();
    std::thread runner([&] { app.run(); });

    TcpSocket ctrl;
    ctrl.connect("127.0.0.1", app.port());
    ctrl.write_frame("put late.txt");
    std::string resp;
    EXPECT_TRUE(ctrl.read_frame(resp, MAX_RESPONSE_LEN));
    u16 data_port = 0;
    EXPECT_TRUE(data_channel::parse_port_offer(resp, data_port)) << resp;

    // The session is now waiting for a data connection that never comes
    auto start = std::chrono::steady_clock::now();
    app.stop();
    runner.join();
    auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    EXPECT_LT(waited, 5000);
    EXPECT_FALSE(fs::exists(root_ / "late.txt"));
}

TEST_F(ServerModeTest, ForkedIdleClientDoesNotBlockOthers) {
    ForkedServer server(root_.path(), ServerMode::FORKED);
    ASSERT_GT(server.pid(), 0);
    ASSERT_NE(server.port(), 0);

    FtpClient idle("127.0.0.1", server.port());
    idle.connect(5);
    idle.list();

    EXPECT_TRUE(fetch_and_verify(server.port(), 0));
    idle.quit();
}

// Every line reaches stdout once, even with session processes forked
// off a parent that has logged before
TEST_F(ServerModeTest, ForkedLogLinesAreNotRepeated) {
    TempDir out_dir;
    const fs::path captured = out_dir / "stdout.log";
    int fd = ::open(captured.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
    ASSERT_GE(fd, 0);

    std::fflush(nullptr);
    int saved = ::dup(1);
    ASSERT_GE(saved, 0);
    ::dup2(fd, 1);
    ::close(fd);

    {
        ForkedServer server(root_.path(), ServerMode::FORKED, true);
        if (server.port() != 0) {
            for (int i = 0; i < 3; ++i) {
                try {
                    FtpClient client("127.0.0.1", server.port());
                    client.connect(5);
                    client.list();
                    client.quit();
                } catch (const std::exception& e) {
                    ADD_FAILURE() << "client " << i << ": " << e.what();
                }
            }
        }
    }

    std::fflush(nullptr);
    ::dup2(saved, 1);
    ::close(saved);

    const std::string text = read_file(captured);
    auto count = [&](const std::string& needle) {
        size_t n = 0;
        for (size_t pos = text.find(needle); pos != std::string::npos;
             pos = text.find(needle, pos + needle.size())) {
            ++n;
        }
        return n;
    };
    EXPECT_EQ(count("minftp server listening"), 1u) << text;
    EXPECT_EQ(count("New client accepted"), 3u) << text;
}

TEST(ServerMode, ParsesNamesAndNumbers) {
    ServerMode m = ServerMode::ITERATIVE;
    EXPECT_TRUE(parse_server_mode("threaded", m));
    EXPECT_EQ(m, ServerMode::THREADED);
    EXPECT_TRUE(parse_server_mode("2", m));
    EXPECT_EQ(m, ServerMode::FORKED);
    EXPECT_TRUE(parse_server_mode("0", m));
    EXPECT_EQ(m, ServerMode::ITERATIVE);
    EXPECT_FALSE(parse_server_mode("pooled", m));
    EXPECT_STREQ(server_mode_str(ServerMode::FORKED), "forked");
}

TEST(ServerApp, RejectsMissingRoot) {
    TempDir dir;
    ServerConfig cfg = make_config(dir / "missing", ServerMode::ITERATIVE);
    EXPECT_THROW({ ServerApp app(cfg); }, FileIoError);
}
