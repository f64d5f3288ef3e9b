#include <gtest/gtest.h>
#include "netbackup/protocol/byte_order.hpp"
#include <vector>

using namespace netbackup::protocol;

TEST(ByteOrderTest, WritesBigEndian) {
    std::vector<uint8_t> output;
    ByteWriter writer(output);

    writer.write_int<uint16_t>(0x1234);
    writer.write_int<uint32_t>(0x12345678);
    writer.write_int<uint64_t>(0x1234567890ABCDEF);

    std::vector<uint8_t> expected = {
        0x12, 0x34,
        0x12, 0x34, 0x56, 0x78,
        0x12, 0x34, 0x56, 0x78, 0x90, 0xAB, 0xCD, 0xEF
    };
    EXPECT_EQ(output, expected);
}

TEST(ByteOrderTest, DifferentTypes) {
    std::vector<uint8_t> output;
    ByteWriter writer(output);
    writer.write_int<uint16_t>(0xBEEF);
    writer.write_int<uint32_t>(0xFFFFFFFF);
    writer.write_int<uint64_t>(1);
    writer.write_u8(0x7F);

    ByteReader reader(output);
    EXPECT_EQ(reader.read_int<uint16_t>(), 0xBEEF);
    EXPECT_EQ(reader.read_int<uint32_t>(), 0xFFFFFFFFu);
    EXPECT_EQ(reader.read_int<uint64_t>(), 1u);
    EXPECT_EQ(reader.read_u8(), 0x7F);
    EXPECT_EQ(reader.remaining(), 0u);
}

TEST(ByteOrderTest, SizedStrings) {
    std::vector<uint8_t> output;
    ByteWriter writer(output);
    writer.write_string("hello");
    writer.write_string("");

    ASSERT_EQ(output.size(), 4u + 5u + 4u);

    ByteReader reader(output);
    EXPECT_EQ(reader.read_string(255), "hello");
    EXPECT_EQ(reader.read_string(255), "");
}

TEST(ByteOrderTest, UnderrunThrows) {
    std::vector<uint8_t> input = {0x00, 0x01};
    ByteReader reader(input);
    EXPECT_THROW(reader.read_int<uint32_t>(), PayloadError);

    // A declared size past the end of the buffer
    std::vector<uint8_t> sized = {0x00, 0x00, 0x00, 0x10, 'a', 'b'};
    ByteReader sized_reader(sized);
    EXPECT_THROW(sized_reader.read_sized(255), PayloadError);
}

TEST(ByteOrderTest, SizeLimitCheckedBeforeRead) {
    std::vector<uint8_t> input = {0x00, 0x00, 0x01, 0x00};
    ByteReader reader(input);
    EXPECT_THROW(reader.read_string(255), PayloadError);
}
