// =============================================================================
// cramdec - Canonical Huffman Tests
// =============================================================================
// Table construction, canonical code assignment and decoding, including the
// zero-bit singleton alphabet.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <cstdint>
#include <vector>

#include "cramdec/codec/encoding.h"
#include "cramdec/codec/huffman.h"
#include "cramdec/io/bit_reader.h"

namespace cramdec::codec::test {

// =============================================================================
// Construction
// =============================================================================

TEST(CanonicalHuffmanTest, AssignsCanonicalCodes) {
    // Lengths: 'A'=1, 'C'=2, 'G'=3, 'T'=3 -> 0, 10, 110, 111.
    auto table = CanonicalHuffmanDecoder::build({'T', 'A', 'G', 'C'}, {3, 1, 3, 2});
    ASSERT_TRUE(table.has_value()) << table.error().describe();

    const auto& codes = table->codes();
    ASSERT_EQ(codes.size(), 4U);
    EXPECT_EQ(codes[0].symbol, 'A');
    EXPECT_EQ(codes[0].code, 0b0U);
    EXPECT_EQ(codes[1].symbol, 'C');
    EXPECT_EQ(codes[1].code, 0b10U);
    EXPECT_EQ(codes[2].symbol, 'G');
    EXPECT_EQ(codes[2].code, 0b110U);
    EXPECT_EQ(codes[3].symbol, 'T');
    EXPECT_EQ(codes[3].code, 0b111U);
}

TEST(CanonicalHuffmanTest, DecodesBitStream) {
    auto table = CanonicalHuffmanDecoder::build({'A', 'C', 'G', 'T'}, {1, 2, 3, 3});
    ASSERT_TRUE(table.has_value());

    // 10 0 111 110 -> C A T G
    const std::vector<std::uint8_t> data = {0b10011111, 0b00000000};
    io::BitReader reader(data);
    EXPECT_EQ(*table->decode(reader), 'C');
    EXPECT_EQ(*table->decode(reader), 'A');
    EXPECT_EQ(*table->decode(reader), 'T');
    EXPECT_EQ(*table->decode(reader), 'G');
    EXPECT_EQ(reader.bitPosition(), 9U);
}

TEST(CanonicalHuffmanTest, UnassignedCodeIsInvalidData) {
    // 0 -> 1, 10 -> 2; 11 matches nothing.
    auto table = CanonicalHuffmanDecoder::build({1, 2}, {1, 2});
    ASSERT_TRUE(table.has_value());

    const std::vector<std::uint8_t> data = {0b11000000};
    io::BitReader reader(data);
    auto symbol = table->decode(reader);
    ASSERT_FALSE(symbol.has_value());
    EXPECT_EQ(symbol.error().code(), ErrorCode::kInvalidData);
}

TEST(CanonicalHuffmanTest, TruncatedStreamIsUnexpectedEof) {
    auto table = CanonicalHuffmanDecoder::build({1, 2, 3}, {1, 2, 2});
    ASSERT_TRUE(table.has_value());

    io::BitReader reader;
    auto symbol = table->decode(reader);
    ASSERT_FALSE(symbol.has_value());
    EXPECT_EQ(symbol.error().code(), ErrorCode::kUnexpectedEof);
}

TEST(CanonicalHuffmanTest, RejectsInvalidTables) {
    struct Case {
        std::vector<std::int32_t> alphabet;
        std::vector<std::uint32_t> lengths;
    };
    const std::vector<Case> cases = {
        {{}, {}},                      // empty alphabet
        {{1, 2}, {1}},                 // size mismatch
        {{1, 1}, {1, 1}},              // duplicate symbol
        {{1, 2}, {0, 1}},              // zero length in a multi-symbol alphabet
        {{1, 2, 3}, {1, 1, 1}},        // over-subscribed
        {{1, 2}, {1, 32}},             // longer than the maximum
    };

    for (const auto& c : cases) {
        auto table = CanonicalHuffmanDecoder::build(c.alphabet, c.lengths);
        ASSERT_FALSE(table.has_value());
        EXPECT_EQ(table.error().code(), ErrorCode::kInvalidData);
    }
}

TEST(CanonicalHuffmanTest, EncodingCreationRejectsInvalidTable) {
    auto encoding = IntegerEncoding::create(integer::Huffman{{1, 2, 3}, {1, 1, 1}});
    ASSERT_FALSE(encoding.has_value());
    EXPECT_EQ(encoding.error().code(), ErrorCode::kInvalidData);
}

// =============================================================================
// Properties
// =============================================================================

RC_GTEST_PROP(CanonicalHuffmanProperty, SingletonConsumesNoBits, (std::int32_t symbol)) {
    auto encoding = IntegerEncoding::create(integer::Huffman{{symbol}, {0}});
    RC_ASSERT(encoding.has_value());

    const auto data = *rc::gen::container<std::vector<std::uint8_t>>(
        rc::gen::arbitrary<std::uint8_t>());
    io::BitReader core(data);
    io::ExternalDataReaders external;

    const auto decodes = *rc::gen::inRange(1, 16);
    for (int i = 0; i < decodes; ++i) {
        auto value = encoding->decode(core, external);
        RC_ASSERT(value.has_value());
        RC_ASSERT(*value == symbol);
    }
    RC_ASSERT(core.bitPosition() == 0U);
}

RC_GTEST_PROP(CanonicalHuffmanProperty, DecodesEveryCodeOfAFixedWidthTable, ()) {
    // 2^width symbols of equal length form a complete code.
    const auto width = *rc::gen::inRange<std::uint32_t>(1, 6);
    const std::uint32_t size = 1U << width;

    std::vector<std::int32_t> alphabet;
    std::vector<std::uint32_t> lengths(size, width);
    for (std::uint32_t i = 0; i < size; ++i) {
        alphabet.push_back(static_cast<std::int32_t>(i) * 3 - 7);
    }
    auto table = CanonicalHuffmanDecoder::build(alphabet, lengths);
    RC_ASSERT(table.has_value());

    const auto index = *rc::gen::inRange<std::uint32_t>(0, size);
    io::BitWriter writer;
    RC_ASSERT(writer.writeBits(index, width).has_value());
    const auto bytes = writer.finish();

    io::BitReader reader(bytes);
    RC_ASSERT(*table->decode(reader) == alphabet[index]);
    RC_ASSERT(reader.bitPosition() == width);
}

}  // namespace cramdec::codec::test
