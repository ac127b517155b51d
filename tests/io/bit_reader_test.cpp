// =============================================================================
// cramdec - Bit Cursor Tests
// =============================================================================
// Unit tests for the MSB-first core bit reader and writer.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <cstdint>
#include <vector>

#include "cramdec/io/bit_reader.h"

namespace cramdec::io::test {

// =============================================================================
// BitReader Tests
// =============================================================================

TEST(BitReaderTest, ReadsMostSignificantBitFirst) {
    const std::vector<std::uint8_t> data = {0b10100000};
    BitReader reader(data);

    EXPECT_EQ(*reader.readBit(), 1);
    EXPECT_EQ(*reader.readBit(), 0);
    EXPECT_EQ(*reader.readBit(), 1);
    EXPECT_EQ(reader.bitPosition(), 3U);
    EXPECT_EQ(reader.remainingBits(), 5U);
}

TEST(BitReaderTest, ReadBitsSpansBytes) {
    const std::vector<std::uint8_t> data = {0x0F, 0xF0};
    BitReader reader(data);

    ASSERT_EQ(*reader.readBits(4), 0x0U);
    EXPECT_EQ(*reader.readBits(8), 0xFFU);
    EXPECT_EQ(*reader.readBits(4), 0x0U);
    EXPECT_TRUE(reader.isExhausted());
}

TEST(BitReaderTest, ZeroBitsYieldZero) {
    BitReader reader;
    auto value = reader.readBits(0);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 0U);
}

TEST(BitReaderTest, ExhaustedReportsUnexpectedEof) {
    const std::vector<std::uint8_t> data = {0xFF};
    BitReader reader(data);

    auto tooMany = reader.readBits(9);
    ASSERT_FALSE(tooMany.has_value());
    EXPECT_EQ(tooMany.error().code(), ErrorCode::kUnexpectedEof);

    ASSERT_TRUE(reader.readBits(8).has_value());
    auto bit = reader.readBit();
    ASSERT_FALSE(bit.has_value());
    EXPECT_EQ(bit.error().code(), ErrorCode::kUnexpectedEof);
}

TEST(BitWriterTest, PadsFinalByteWithZeros) {
    BitWriter writer;
    ASSERT_TRUE(writer.writeBits(0b101, 3).has_value());
    EXPECT_EQ(writer.bitCount(), 3U);
    EXPECT_EQ(writer.finish(), std::vector<std::uint8_t>{0b10100000});
    EXPECT_EQ(writer.bitCount(), 0U);
}

TEST(BitWriterTest, RejectsValueWiderThanCount) {
    BitWriter writer;
    auto result = writer.writeBits(4, 2);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kInvalidData);
}

RC_GTEST_PROP(BitWriterProperty, ReaderReturnsWrittenBits, ()) {
    const auto width = *rc::gen::inRange<std::uint32_t>(1, 33);
    const auto value = *rc::gen::arbitrary<std::uint32_t>();
    const std::uint32_t masked = width == 32 ? value : value & ((1U << width) - 1);

    BitWriter writer;
    writer.writeBit(true);
    RC_ASSERT(writer.writeBits(masked, width).has_value());
    const auto bytes = writer.finish();

    BitReader reader(bytes);
    RC_ASSERT(*reader.readBit() == 1);
    RC_ASSERT(*reader.readBits(width) == masked);
}

}  // namespace cramdec::io::test
