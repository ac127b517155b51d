// =============================================================================
// cramdec - Integer Codec Tests
// =============================================================================
// Decode and encode behaviour of the integer codec variants against core and
// external streams.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <cstdint>
#include <vector>

#include "cramdec/codec/encoding.h"
#include "cramdec/io/bit_reader.h"
#include "cramdec/io/external_data.h"

namespace cramdec::codec::test {

namespace {

[[nodiscard]] IntegerEncoding makeEncoding(IntegerCodec codec) {
    auto encoding = IntegerEncoding::create(std::move(codec));
    EXPECT_TRUE(encoding.has_value());
    return std::move(*encoding);
}

}  // namespace

// =============================================================================
// External
// =============================================================================

TEST(ExternalIntegerCodecTest, DecodesItf8FromBlock) {
    const auto encoding = makeEncoding(integer::External{1});
    const std::vector<std::uint8_t> block = {0x0d};

    io::BitReader core;
    io::ExternalDataReaders external;
    external.insert(1, block);

    auto value = encoding.decode(core, external);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 13);
    EXPECT_EQ(core.bitPosition(), 0U);
}

TEST(ExternalIntegerCodecTest, EncodeWritesOnlyToExternalStream) {
    const auto encoding = makeEncoding(integer::External{1});

    io::BitWriter core;
    io::ExternalDataWriters external;
    ASSERT_TRUE(encoding.encode(core, external, 13).has_value());

    ASSERT_NE(external.find(1), nullptr);
    EXPECT_EQ(*external.find(1), std::vector<std::uint8_t>{0x0d});
    EXPECT_EQ(core.bitCount(), 0U);
}

TEST(ExternalIntegerCodecTest, MissingBlock) {
    const auto encoding = makeEncoding(integer::External{42});
    io::BitReader core;
    io::ExternalDataReaders external;

    auto value = encoding.decode(core, external);
    ASSERT_FALSE(value.has_value());
    EXPECT_EQ(value.error().code(), ErrorCode::kMissingExternalBlock);
    EXPECT_EQ(value.error().context()->contentId, 42);
}

// =============================================================================
// Beta
// =============================================================================

TEST(BetaCodecTest, SubtractsOffset) {
    const auto encoding = makeEncoding(integer::Beta{1, 3});
    const std::vector<std::uint8_t> data = {0b10000000};
    io::BitReader core(data);
    io::ExternalDataReaders external;

    EXPECT_EQ(*encoding.decode(core, external), 3);
    EXPECT_EQ(core.bitPosition(), 3U);
}

TEST(BetaCodecTest, RejectsLengthAbove32) {
    auto encoding = IntegerEncoding::create(integer::Beta{0, 33});
    ASSERT_FALSE(encoding.has_value());
    EXPECT_EQ(encoding.error().code(), ErrorCode::kInvalidData);
}

RC_GTEST_PROP(BetaCodecProperty, DecodesValuePlusOffset, ()) {
    const auto len = *rc::gen::inRange<std::uint32_t>(1, 31);
    const auto offset = *rc::gen::inRange<std::int32_t>(-1000, 1000);
    const auto raw = *rc::gen::inRange<std::uint32_t>(0, 1U << len);
    const std::int32_t value = static_cast<std::int32_t>(raw) - offset;

    io::BitWriter writer;
    RC_ASSERT(writer.writeBits(raw, len).has_value());
    const auto bytes = writer.finish();

    const auto encoding = makeEncoding(integer::Beta{offset, len});
    io::BitReader core(bytes);
    io::ExternalDataReaders external;
    RC_ASSERT(*encoding.decode(core, external) == value);
    RC_ASSERT(core.bitPosition() == len);

    io::BitWriter reencoded;
    io::ExternalDataWriters blocks;
    RC_ASSERT(encoding.encode(reencoded, blocks, value).has_value());
    RC_ASSERT(reencoded.finish() == bytes);
}

// =============================================================================
// Gamma
// =============================================================================

TEST(GammaCodecTest, DecodesKnownVector) {
    const auto encoding = makeEncoding(integer::Gamma{5});
    const std::vector<std::uint8_t> data = {0b00011010};
    io::BitReader core(data);
    io::ExternalDataReaders external;

    EXPECT_EQ(*encoding.decode(core, external), 8);
    EXPECT_EQ(core.bitPosition(), 7U);
}

TEST(GammaCodecTest, EncodeMatchesKnownVector) {
    const auto encoding = makeEncoding(integer::Gamma{5});
    io::BitWriter core;
    io::ExternalDataWriters external;

    ASSERT_TRUE(encoding.encode(core, external, 8).has_value());
    EXPECT_EQ(core.bitCount(), 7U);
    EXPECT_EQ(core.finish(), std::vector<std::uint8_t>{0b00011010});
}

TEST(GammaCodecTest, EncodeRejectsNonPositiveRaw) {
    const auto encoding = makeEncoding(integer::Gamma{0});
    io::BitWriter core;
    io::ExternalDataWriters external;

    auto result = encoding.encode(core, external, 0);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kInvalidData);
}

TEST(GammaCodecTest, AllZeroStreamFails) {
    const auto encoding = makeEncoding(integer::Gamma{0});
    const std::vector<std::uint8_t> data = {0x00, 0x00};
    io::BitReader core(data);
    io::ExternalDataReaders external;

    auto value = encoding.decode(core, external);
    ASSERT_FALSE(value.has_value());
    EXPECT_EQ(value.error().code(), ErrorCode::kUnexpectedEof);
}

// =============================================================================
// Subexp
// =============================================================================

TEST(SubexpCodecTest, DecodesBothPrefixForms) {
    const auto encoding = makeEncoding(integer::Subexp{0, 2});
    // "0 11" -> 3, "10 01" -> 4 + 1 = 5, "110 010" -> 8 + 2 = 10
    const std::vector<std::uint8_t> data = {0b01110011, 0b10010000};
    io::BitReader core(data);
    io::ExternalDataReaders external;

    EXPECT_EQ(*encoding.decode(core, external), 3);
    EXPECT_EQ(*encoding.decode(core, external), 5);
    EXPECT_EQ(*encoding.decode(core, external), 10);
    EXPECT_EQ(core.bitPosition(), 13U);
}

TEST(SubexpCodecTest, RejectsNegativeOrder) {
    auto encoding = IntegerEncoding::create(integer::Subexp{0, -1});
    ASSERT_FALSE(encoding.has_value());
    EXPECT_EQ(encoding.error().code(), ErrorCode::kInvalidData);
}

// =============================================================================
// Unimplemented Codecs
// =============================================================================

TEST(GolombCodecTest, DecodeIsNotImplemented) {
    const std::vector<std::uint8_t> data = {0xFF};
    io::ExternalDataReaders external;

    for (const IntegerCodec& codec :
         {IntegerCodec{integer::Golomb{0, 4}}, IntegerCodec{integer::GolombRice{0, 2}}}) {
        const auto encoding = makeEncoding(codec);
        io::BitReader core(data);
        auto value = encoding.decode(core, external);
        ASSERT_FALSE(value.has_value());
        EXPECT_EQ(value.error().code(), ErrorCode::kNotImplemented);
        EXPECT_EQ(core.bitPosition(), 0U);
    }
}

TEST(HuffmanIntegerCodecTest, EncodeIsNotImplemented) {
    const auto encoding = makeEncoding(integer::Huffman{{1, 2}, {1, 1}});
    io::BitWriter core;
    io::ExternalDataWriters external;

    auto result = encoding.encode(core, external, 1);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kNotImplemented);
    EXPECT_EQ(encoding.codecId(), CodecId::kHuffman);
}

}  // namespace cramdec::codec::test
