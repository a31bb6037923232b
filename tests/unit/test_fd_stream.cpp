#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <vector>

#include <sys/socket.h>
#include <unistd.h>

#include "wirehdr/io/fd_stream.hpp"
#include "wirehdr/proto/codec.hpp"
#include "wirehdr/utils/posix_wrapper.hpp"

using namespace wirehdr;
using namespace wirehdr::proto;
using wirehdr::io::FdStream;
using wirehdr::utils::PosixWrapper;

class FdStreamTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    }

    void TearDown() override {
        for (int& fd : fds) {
            if (fd >= 0) PosixWrapper::closeFd(fd);
            fd = -1;
        }
    }

    void close_writer() {
        PosixWrapper::closeFd(fds[1]);
        fds[1] = -1;
    }

    static WireHeader sample() {
        WireHeader h{};
        h.provider = 3;
        h.session = 0x1122334455667788ULL;
        h.content_type = 1;
        h.accept_type = 1;
        h.body_len = 512;
        h.auth_len = 16;
        h.opcode = 0x0101;
        return h;
    }

    int fds[2] = {-1, -1};
};

// ソケット越しの往復
TEST_F(FdStreamTest, FrameRoundTripOverSocket) {
    FdStream writer(fds[1]);
    FdStream reader(fds[0]);
    ASSERT_FALSE(write_to_stream(sample(), writer));

    auto res = read_from_stream(reader);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value(), sample());
}

// 途中で切断された場合は接続エラー
TEST_F(FdStreamTest, PeerCloseMidFrameIsConnectionError) {
    auto frame = encode_frame(sample());
    ASSERT_TRUE(frame.has_value());
    FdStream writer(fds[1]);
    ASSERT_FALSE(writer.write_all(std::span<const uint8_t>(frame.value()).first(12)));
    close_writer();

    FdStream reader(fds[0]);
    auto res = read_from_stream(reader);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), make_error_code(WireErrc::connection_error));
}

TEST_F(FdStreamTest, EndOfStreamIsConnectionReset) {
    close_writer();
    FdStream reader(fds[0]);
    std::array<uint8_t, 4> buf{};
    EXPECT_EQ(reader.read_exact(buf), std::make_error_code(std::errc::connection_reset));
}

// 相手が閉じたソケットへの書き込みはプロセスを落とさず接続エラーを返す
TEST_F(FdStreamTest, WriteToClosedPeerIsConnectionError) {
    PosixWrapper::closeFd(fds[0]);
    fds[0] = -1;

    FdStream writer(fds[1]);
    auto frame = encode_frame(sample());
    ASSERT_TRUE(frame.has_value());
    auto ec = writer.write_all(frame.value());
    EXPECT_TRUE(ec == std::errc::broken_pipe);

    EXPECT_EQ(write_to_stream(WireHeader{}, writer), make_error_code(WireErrc::connection_error));
}

// 受信タイムアウトは接続エラーとして表面化する
TEST_F(FdStreamTest, ReceiveTimeoutIsConnectionError) {
    FdStream reader(fds[0]);
    ASSERT_FALSE(reader.set_timeout(std::chrono::milliseconds{50}));

    std::array<uint8_t, 4> buf{};
    EXPECT_EQ(reader.read_exact(buf), std::make_error_code(std::errc::timed_out));

    auto res = read_from_stream(reader);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), make_error_code(WireErrc::connection_error));
}

TEST_F(FdStreamTest, NegativeTimeoutRejected) {
    FdStream reader(fds[0]);
    EXPECT_EQ(reader.set_timeout(std::chrono::milliseconds{-1}),
              std::make_error_code(std::errc::invalid_argument));
}

// パイプはソケットではないのでタイムアウト設定は失敗する
TEST_F(FdStreamTest, TimeoutOnPipeFails) {
    int p[2];
    ASSERT_EQ(::pipe(p), 0);
    FdStream reader(p[0]);
    EXPECT_TRUE(reader.set_timeout(std::chrono::milliseconds{10}));
    PosixWrapper::closeFd(p[0]);
    PosixWrapper::closeFd(p[1]);
}

// 宣言長が不正なフレームを読み飛ばした後も次のフレームを正しく読める
TEST_F(FdStreamTest, StreamStaysAlignedAfterLengthMismatch) {
    std::vector<uint8_t> bad = {0x10, 0xA7, 0xC0, 0x5E, 0x19, 0x00};
    bad.resize(bad.size() + 25, 0x00);

    FdStream writer(fds[1]);
    ASSERT_FALSE(writer.write_all(bad));
    ASSERT_FALSE(write_to_stream(sample(), writer));

    FdStream reader(fds[0]);
    auto first = read_from_stream(reader);
    ASSERT_FALSE(first.has_value());
    EXPECT_EQ(first.error(), make_error_code(WireErrc::invalid_header));

    auto second = read_from_stream(reader);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second.value(), sample());
}
