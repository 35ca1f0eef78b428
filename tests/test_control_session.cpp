// ============================================================
// test_control_session.cpp -- Control channel state machine
//
// The client side is driven by hand with raw frames so every
// response can be checked exactly as it appears on the wire.
// ============================================================

#include "server/control_session.hpp"
#include "common/data_channel.hpp"
#include "common/protocol.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <thread>

using namespace testing_support;

class ControlSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        quiet_logs();
        store_ = std::make_unique<file_io::DirectoryStore>(dir_.path());

        TcpSocket listener;
        listener.bind_and_listen("127.0.0.1", 0, 1);
        client_.connect("127.0.0.1", listener.local_port());
        TcpSocket server_side = listener.accept();

        SessionOptions opts;
        opts.accept_timeout_ms   = 300;
        opts.transfer_timeout_ms = 2000;
        session_ = std::make_unique<ControlSession>(std::move(server_side), *store_, opts);
        thread_  = std::thread([this] { session_->run(); });
    }

    void TearDown() override {
        client_.close();
        if (thread_.joinable()) thread_.join();
    }

    std::string send(const std::string& line) {
        client_.write_frame(line);
        return next_response();
    }

    std::string next_response() {
        std::string resp;
        EXPECT_TRUE(client_.read_frame(resp, MAX_RESPONSE_LEN));
        return resp;
    }

    static bool is_error(const std::string& resp) {
        return resp.rfind(ERROR_PREFIX, 0) == 0;
    }

    // Wait for the session thread to finish
    void finish() {
        if (thread_.joinable()) thread_.join();
    }

    TempDir                                  dir_;
    std::unique_ptr<file_io::DirectoryStore> store_;
    TcpSocket                                client_;
    std::unique_ptr<ControlSession>          session_;
    std::thread                              thread_;
};

TEST_F(ControlSessionTest, LsOnEmptyDirectoryIsEmptyPayload) {
    EXPECT_EQ(send("ls"), "");
}

TEST_F(ControlSessionTest, LsListsFilesOnePerLine) {
    write_file(dir_ / "b.txt", "b");
    write_file(dir_ / "a.txt", "a");
    EXPECT_EQ(send("ls"), "a.txt\nb.txt");
}

TEST_F(ControlSessionTest, HelpReturnsCommandSummary) {
    EXPECT_EQ(send("help"), HELP_TEXT);
}

TEST_F(ControlSessionTest, UnknownCommandKeepsSessionOpen) {
    std::string resp = send("frobnicate");
    EXPECT_TRUE(is_error(resp)) << resp;
    EXPECT_NE(session_->state(), SessionState::CLOSED);

    EXPECT_TRUE(is_error(send("get")));
    EXPECT_TRUE(is_error(send("ls extra")));
    EXPECT_EQ(send("ls"), "");
}

TEST_F(ControlSessionTest, GetStreamsFileOverOfferedPort) {
    const std::string content = make_payload(100000, 3);
    write_file(dir_ / "data.bin", content);

    std::string resp = send("get data.bin");
    u16 port = 0;
    ASSERT_TRUE(data_channel::parse_port_offer(resp, port)) << resp;

    TcpSocket data = data_channel::connect_to_offered_port("127.0.0.1", port);
    std::string payload;
    ASSERT_TRUE(data.read_frame(payload, MAX_FRAME_PAYLOAD));
    EXPECT_EQ(payload, content);

    // The transfer ends with the data connection closed
    std::string extra;
    EXPECT_FALSE(data.read_frame(extra, 16));

    EXPECT_EQ(send("ls"), "data.bin");
}

TEST_F(ControlSessionTest, GetMissingFileIsAnErrorNotAPort) {
    std::string resp = send("get nope.txt");
    EXPECT_TRUE(is_error(resp)) << resp;
    u16 port = 0;
    EXPECT_FALSE(data_channel::parse_port_offer(resp, port));
    EXPECT_EQ(send("ls"), "");
}

TEST_F(ControlSessionTest, GetOutsideWorkingDirectoryIsRefused) {
    EXPECT_TRUE(is_error(send("get ../secret")));
    EXPECT_TRUE(is_error(send("get .")));
}

TEST_F(ControlSessionTest, PutStoresUploadedFile) {
    const std::string content = make_payload(250000, 9);

    std::string resp = send("put upload.bin");
    u16 port = 0;
    ASSERT_TRUE(data_channel::parse_port_offer(resp, port)) << resp;

    {
        TcpSocket data = data_channel::connect_to_offered_port("127.0.0.1", port);
        data.write_frame(content);
    }

    EXPECT_EQ(next_response(), std::string(PUT_STORED_PREFIX) + "250000");
    EXPECT_EQ(send("ls"), "upload.bin");
    EXPECT_EQ(read_file(dir_ / "upload.bin"), content);
}

TEST_F(ControlSessionTest, PutWithoutDataConnectionLeavesNoFile) {
    std::string resp = send("put ghost.txt");
    u16 port = 0;
    ASSERT_TRUE(data_channel::parse_port_offer(resp, port)) << resp;

    // Never connect: the accept timeout runs out and the session recovers
    resp = next_response();
    EXPECT_TRUE(is_error(resp)) << resp;
    EXPECT_EQ(send("ls"), "");
    EXPECT_TRUE(fs::is_empty(dir_.path()));
    EXPECT_THROW(data_channel::connect_to_offered_port("127.0.0.1", port), ConnectionRefused);
}

TEST_F(ControlSessionTest, TruncatedUploadIsDiscarded) {
    write_file(dir_ / "doc.txt", "original");

    std::string resp = send("put doc.txt");
    u16 port = 0;
    ASSERT_TRUE(data_channel::parse_port_offer(resp, port)) << resp;
    {
        TcpSocket data = data_channel::connect_to_offered_port("127.0.0.1", port);
        const std::string partial = "0000001000only-part-of-it";
        data.send_all(partial.data(), partial.size());
    }

    resp = next_response();
    EXPECT_TRUE(is_error(resp)) << resp;
    EXPECT_EQ(send("ls"), "doc.txt");
    EXPECT_EQ(read_file(dir_ / "doc.txt"), "original");
}

TEST_F(ControlSessionTest, PutThatCannotBeCommittedIsReported) {
    std::string resp = send("put x.txt");
    u16 port = 0;
    ASSERT_TRUE(data_channel::parse_port_offer(resp, port)) << resp;

    // A directory now occupies the target name, so the rename fails
    fs::create_directories(dir_ / "x.txt" / "inner");
    {
        TcpSocket data = data_channel::connect_to_offered_port("127.0.0.1", port);
        data.write_frame("hello");
    }

    resp = next_response();
    EXPECT_TRUE(is_error(resp)) << resp;
    EXPECT_TRUE(fs::is_directory(dir_ / "x.txt"));
    EXPECT_EQ(send("ls"), "");
}

TEST_F(ControlSessionTest, LsOfVanishedRootIsAnError) {
    fs::remove_all(dir_.path());
    std::string resp = send("ls");
    EXPECT_TRUE(is_error(resp)) << resp;
    EXPECT_EQ(send("help"), HELP_TEXT);
}

TEST_F(ControlSessionTest, QuitAcknowledgesAndCloses) {
    EXPECT_EQ(send("quit"), QUIT_ACK);

    std::string resp;
    EXPECT_FALSE(client_.read_frame(resp, MAX_RESPONSE_LEN));
    finish();
    EXPECT_EQ(session_->state(), SessionState::CLOSED);
}

TEST_F(ControlSessionTest, ClientHangUpClosesSession) {
    client_.close();
    finish();
    EXPECT_EQ(session_->state(), SessionState::CLOSED);
}

TEST_F(ControlSessionTest, MalformedFrameClosesSession) {
    const std::string junk = "not-digitsls";
    client_.send_all(junk.data(), junk.size());
    finish();
    EXPECT_EQ(session_->state(), SessionState::CLOSED);
}

TEST_F(ControlSessionTest, OversizedCommandFrameClosesSession) {
    client_.write_frame(std::string(MAX_COMMAND_LEN + 1, 'a'));
    finish();
    EXPECT_EQ(session_->state(), SessionState::CLOSED);
}

TEST_F(ControlSessionTest, InterruptUnblocksIdleSession) {
    EXPECT_EQ(send("ls"), "");
    session_->interrupt();
    finish();
    EXPECT_EQ(session_->state(), SessionState::CLOSED);
}
