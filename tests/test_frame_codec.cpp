// ============================================================
// test_frame_codec.cpp -- 10-digit size field and frame I/O
// ============================================================

#include "common/protocol_io.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace testing_support;

TEST(SizeField, ZeroPadsToTenDigits) {
    EXPECT_EQ(proto::encode_size_field(0), "0000000000");
    EXPECT_EQ(proto::encode_size_field(42), "0000000042");
    EXPECT_EQ(proto::encode_size_field(1234567890), "1234567890");
    EXPECT_EQ(proto::encode_size_field(MAX_FRAME_PAYLOAD), "9999999999");
}

TEST(SizeField, RejectsPayloadAboveMaximum) {
    EXPECT_THROW(proto::encode_size_field(MAX_FRAME_PAYLOAD + 1), PayloadTooLarge);
}

TEST(SizeField, DecodesDigits) {
    EXPECT_EQ(proto::decode_size_field("0000000042"), 42u);
    EXPECT_EQ(proto::decode_size_field("0000000000"), 0u);
    EXPECT_EQ(proto::decode_size_field("9999999999"), MAX_FRAME_PAYLOAD);
}

TEST(SizeField, RejectsNonDigits) {
    EXPECT_THROW(proto::decode_size_field("00000004x2"), MalformedLength);
    EXPECT_THROW(proto::decode_size_field(" 000000042"), MalformedLength);
    EXPECT_THROW(proto::decode_size_field("-000000042"), MalformedLength);
}

TEST(SizeField, EncodeFramePrefixesPayload) {
    EXPECT_EQ(proto::encode_frame("ls"), "0000000002ls");
    EXPECT_EQ(proto::encode_frame(""), "0000000000");
}

class FrameSocketTest : public ::testing::Test {
protected:
    void SetUp() override {
        quiet_logs();
        auto pair = loopback_pair();
        a_ = std::move(pair.first);
        b_ = std::move(pair.second);
    }

    TcpSocket a_{INVALID_SOCKET_VAL};
    TcpSocket b_{INVALID_SOCKET_VAL};
};

TEST_F(FrameSocketTest, FrameCrossesTheWireIntact) {
    a_.write_frame("get report.txt");
    std::string payload;
    ASSERT_TRUE(b_.read_frame(payload, MAX_COMMAND_LEN));
    EXPECT_EQ(payload, "get report.txt");
}

TEST_F(FrameSocketTest, EmptyPayloadIsAValidFrame) {
    a_.write_frame("");
    std::string payload = "stale";
    ASSERT_TRUE(b_.read_frame(payload, MAX_COMMAND_LEN));
    EXPECT_TRUE(payload.empty());
}

TEST_F(FrameSocketTest, FramesArriveInOrder) {
    a_.write_frame("first");
    a_.write_frame("second");
    std::string p1, p2;
    ASSERT_TRUE(b_.read_frame(p1, MAX_COMMAND_LEN));
    ASSERT_TRUE(b_.read_frame(p2, MAX_COMMAND_LEN));
    EXPECT_EQ(p1, "first");
    EXPECT_EQ(p2, "second");
}

TEST_F(FrameSocketTest, CleanCloseBetweenFramesReturnsFalse) {
    a_.close();
    std::string payload;
    EXPECT_FALSE(b_.read_frame(payload, MAX_COMMAND_LEN));
}

TEST_F(FrameSocketTest, CloseInsideSizeFieldIsConnectionClosed) {
    a_.send_all("00000", 5);
    a_.close();
    std::string payload;
    EXPECT_THROW(b_.read_frame(payload, MAX_COMMAND_LEN), ConnectionClosed);
}

TEST_F(FrameSocketTest, TruncatedPayloadIsConnectionClosed) {
    const std::string wire = "0000000010abc";
    a_.send_all(wire.data(), wire.size());
    a_.close();
    std::string payload;
    EXPECT_THROW(b_.read_frame(payload, MAX_COMMAND_LEN), ConnectionClosed);
}

TEST_F(FrameSocketTest, MalformedSizeFieldOnTheWire) {
    const std::string wire = "abcdefghijpayload";
    a_.send_all(wire.data(), wire.size());
    std::string payload;
    EXPECT_THROW(b_.read_frame(payload, MAX_COMMAND_LEN), MalformedLength);
}

TEST_F(FrameSocketTest, ReaderLimitRejectsOversizedFrame) {
    a_.write_frame(std::string(MAX_COMMAND_LEN + 1, 'x'));
    std::string payload;
    EXPECT_THROW(b_.read_frame(payload, MAX_COMMAND_LEN), PayloadTooLarge);
}

TEST_F(FrameSocketTest, WriteFrameRejectsOversizedLength) {
    char byte = 0;
    EXPECT_THROW(a_.write_frame(&byte, MAX_FRAME_PAYLOAD + 1), PayloadTooLarge);
}
