#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <vector>

#include "wirehdr/io/memory_stream.hpp"

using namespace wirehdr::io;

class MemoryStreamTest : public ::testing::Test {
protected:
    std::vector<uint8_t> data = {1, 2, 3, 4, 5, 6};
};

TEST_F(MemoryStreamTest, ReadExactAdvances) {
    MemoryReader reader(data);
    std::array<uint8_t, 4> a{};
    EXPECT_FALSE(reader.read_exact(a));
    EXPECT_EQ(a[0], 1);
    EXPECT_EQ(a[3], 4);
    EXPECT_EQ(reader.consumed(), 4u);
    EXPECT_EQ(reader.remaining(), 2u);

    std::array<uint8_t, 2> b{};
    EXPECT_FALSE(reader.read_exact(b));
    EXPECT_EQ(b[1], 6);
    EXPECT_EQ(reader.remaining(), 0u);
}

// 要求長に満たない読み込みは残りを消費してエラー
TEST_F(MemoryStreamTest, ShortReadFailsAndDrains) {
    MemoryReader reader(data);
    std::array<uint8_t, 8> buf{};
    auto ec = reader.read_exact(buf);
    EXPECT_TRUE(ec);
    EXPECT_EQ(reader.consumed(), data.size());

    std::array<uint8_t, 1> one{};
    EXPECT_TRUE(reader.read_exact(one));
}

TEST_F(MemoryStreamTest, EmptyReadSucceeds) {
    MemoryReader reader(std::span<const uint8_t>{});
    std::vector<uint8_t> none;
    EXPECT_FALSE(reader.read_exact(none));
}

TEST_F(MemoryStreamTest, WriterAppends) {
    MemoryWriter writer;
    EXPECT_FALSE(writer.write_all(std::span<const uint8_t>(data).first(3)));
    EXPECT_FALSE(writer.write_all(std::span<const uint8_t>(data).subspan(3)));
    EXPECT_EQ(writer.data(), data);

    auto taken = writer.take();
    EXPECT_EQ(taken, data);
}

// 容量制限を超える書き込みは入る分だけ書いてエラー
TEST_F(MemoryStreamTest, WriterCapacityLimit) {
    MemoryWriter writer(4);
    auto ec = writer.write_all(data);
    EXPECT_EQ(ec, std::make_error_code(std::errc::no_buffer_space));
    EXPECT_EQ(writer.data().size(), 4u);

    EXPECT_TRUE(writer.write_all(data));
    EXPECT_EQ(writer.data().size(), 4u);
}
