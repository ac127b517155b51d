// =============================================================================
// cramdec - Slice Batch Decoder Tests
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <cstdint>
#include <deque>
#include <vector>

#include "cramdec/slice/slice_decoder.h"
#include "slice_builder.h"

namespace cramdec::slice::test {

namespace {

/// @brief Slices of mapped records with distinct read lengths and starts.
class SliceBatch {
public:
    explicit SliceBatch(const std::vector<std::size_t>& recordCounts) {
        RecordId id = 0;
        for (std::size_t s = 0; s < recordCounts.size(); ++s) {
            auto& data = data_.emplace_back();
            for (std::size_t r = 0; r < recordCounts[s]; ++r) {
                data.integer(DataSeries::kBamFlags, 0);
                data.integer(DataSeries::kCramFlags, 0);
                data.integer(DataSeries::kReadLengths, static_cast<std::int32_t>(10 + s));
                data.integer(DataSeries::kAlignmentStarts, static_cast<std::int32_t>(r + 1));
                data.integer(DataSeries::kReadGroupIds, static_cast<std::int32_t>(s));
                data.integer(DataSeries::kTagSetIds, 0);
                data.integer(DataSeries::kFeatureCounts, 0);
                data.integer(DataSeries::kMappingQualities, 30);
            }

            SliceInput input;
            input.externalData = data.readers();
            input.referenceContext = ReferenceSequenceContext::some(s, 1);
            input.recordCount = recordCounts[s];
            input.initialId = id;
            inputs_.push_back(std::move(input));
            id += recordCounts[s];
        }
    }

    /// @brief Make slice @p index fail on its first record.
    void breakSlice(std::size_t index) { inputs_[index].externalData = io::ExternalDataReaders{}; }

    [[nodiscard]] const std::vector<SliceInput>& inputs() const { return inputs_; }

private:
    // Stable addresses: readers borrow these blocks.
    std::deque<SliceData> data_;
    std::vector<SliceInput> inputs_;
};

}  // namespace

// =============================================================================
// Options
// =============================================================================

TEST(SliceDecodeOptionsTest, Validation) {
    SliceDecodeOptions options;
    EXPECT_TRUE(options.validate().has_value());

    options.grainSize = 0;
    auto grain = options.validate();
    ASSERT_FALSE(grain.has_value());
    EXPECT_EQ(grain.error().code(), ErrorCode::kInvalidArgument);

    options.grainSize = 4;
    options.threads = kMaxThreads + 1;
    auto threads = options.validate();
    ASSERT_FALSE(threads.has_value());
    EXPECT_EQ(threads.error().code(), ErrorCode::kInvalidArgument);
}

TEST(SliceDecoderTest, InvalidOptionsDecodeNothing) {
    const auto header = makeHeader(false);
    const SliceBatch batch({1});
    SliceDecodeOptions options;
    options.grainSize = 0;

    auto result = decodeSlices(header, batch.inputs(), options);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kInvalidArgument);
}

// =============================================================================
// Decoding
// =============================================================================

TEST(SliceDecoderTest, SingleSlice) {
    const auto header = makeHeader(false);
    const SliceBatch batch({3});

    auto records = decodeSlice(header, batch.inputs()[0]);
    ASSERT_TRUE(records.has_value()) << records.error().describe();
    ASSERT_EQ(records->size(), 3U);
    EXPECT_EQ((*records)[0].alignmentStart, 2);
    EXPECT_EQ((*records)[2].alignmentStart, 7);
    EXPECT_EQ((*records)[2].id, 2U);
}

TEST(SliceDecoderTest, EmptyBatch) {
    const auto header = makeHeader(false);
    auto result = decodeSlices(header, {});
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->empty());
}

TEST(SliceDecoderTest, ReportsFirstFailingSliceInInputOrder) {
    const auto header = makeHeader(false);
    SliceBatch batch({2, 2, 2, 2, 2});
    batch.breakSlice(3);
    batch.breakSlice(1);

    SliceDecodeOptions options;
    options.threads = 4;
    auto result = decodeSlices(header, batch.inputs(), options);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kMissingExternalBlock);
    ASSERT_TRUE(result.error().context().has_value());
    // Slice 1 starts at record id 2.
    EXPECT_EQ(result.error().context()->recordId, 2U);
}

RC_GTEST_PROP(SliceDecoderProperty, ConcurrentMatchesSerial, ()) {
    const auto counts = *rc::gen::container<std::vector<std::size_t>>(
        rc::gen::inRange<std::size_t>(0, 20));
    const auto threads = *rc::gen::inRange<std::size_t>(0, 9);
    const auto grainSize = *rc::gen::inRange<std::size_t>(1, 4);

    const auto header = makeHeader(false);
    const SliceBatch batch(counts);

    SliceDecodeOptions options;
    options.threads = threads;
    options.grainSize = grainSize;
    auto concurrent = decodeSlices(header, batch.inputs(), options);
    RC_ASSERT(concurrent.has_value());
    RC_ASSERT(concurrent->size() == counts.size());

    for (std::size_t i = 0; i < counts.size(); ++i) {
        auto serial = decodeSlice(header, batch.inputs()[i]);
        RC_ASSERT(serial.has_value());
        RC_ASSERT((*concurrent)[i] == *serial);
        RC_ASSERT(serial->size() == counts[i]);
    }
}

}  // namespace cramdec::slice::test
