// =============================================================================
// cramdec - Byte Cursor Tests
// =============================================================================
// External block byte reader plus ITF8/LTF8 properties.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <cstdint>
#include <vector>

#include "cramdec/io/byte_reader.h"

namespace cramdec::io::test {

// =============================================================================
// ByteReader Tests
// =============================================================================

TEST(ByteReaderTest, ReadUntilConsumesStopByte) {
    const std::vector<std::uint8_t> data = {'a', 'b', 0x09, 'c'};
    ByteReader reader(data);

    auto first = reader.readUntil(0x09);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->size(), 2U);
    EXPECT_EQ((*first)[1], 'b');
    EXPECT_EQ(reader.position(), 3U);

    auto missing = reader.readUntil(0x09);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code(), ErrorCode::kUnexpectedEof);
}

TEST(ByteReaderTest, Itf8KnownEncodings) {
    const std::vector<std::uint8_t> data = {
        0x0d,                          // 13
        0x80, 0x80,                    // 128
        0xC0, 0x40, 0x00,              // 16384
        0xFF, 0xFF, 0xFF, 0xFF, 0x0F,  // -1
    };
    ByteReader reader(data);

    EXPECT_EQ(*reader.readItf8(), 13);
    EXPECT_EQ(*reader.readItf8(), 128);
    EXPECT_EQ(*reader.readItf8(), 16384);
    EXPECT_EQ(*reader.readItf8(), -1);
    EXPECT_TRUE(reader.isExhausted());
}

TEST(ByteReaderTest, TruncatedItf8) {
    const std::vector<std::uint8_t> data = {0xC0, 0x01};
    ByteReader reader(data);
    auto value = reader.readItf8();
    ASSERT_FALSE(value.has_value());
    EXPECT_EQ(value.error().code(), ErrorCode::kUnexpectedEof);
}

RC_GTEST_PROP(Itf8Property, EncodedValuesReadBack, (std::int32_t value)) {
    std::vector<std::uint8_t> buffer;
    const auto written = writeItf8(buffer, value);
    RC_ASSERT(written == buffer.size());
    RC_ASSERT(written == itf8Size(value));
    RC_ASSERT(written <= kMaxItf8Size);

    ByteReader reader(buffer);
    RC_ASSERT(*reader.readItf8() == value);
    RC_ASSERT(reader.isExhausted());
}

RC_GTEST_PROP(Ltf8Property, EncodedValuesReadBack, (std::int64_t value)) {
    std::vector<std::uint8_t> buffer;
    const auto written = writeLtf8(buffer, value);
    RC_ASSERT(written == buffer.size());
    RC_ASSERT(written <= kMaxLtf8Size);

    ByteReader reader(buffer);
    RC_ASSERT(*reader.readLtf8() == value);
}

}  // namespace cramdec::io::test
