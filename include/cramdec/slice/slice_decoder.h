// =============================================================================
// cramdec - Slice Batch Decoder
// =============================================================================
// Decodes a batch of slices that share one compression header on a oneTBB
// task arena, one RecordReader per slice. Records are returned per slice in
// input order; slice outcomes never depend on scheduling.
//
// Usage:
//   SliceDecodeOptions options;
//   options.threads = 4;
//   auto records = decodeSlices(header, slices, options);
// =============================================================================

#ifndef CRAMDEC_SLICE_SLICE_DECODER_H
#define CRAMDEC_SLICE_SLICE_DECODER_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "cramdec/common/error.h"
#include "cramdec/common/types.h"
#include "cramdec/format/compression_header.h"
#include "cramdec/io/external_data.h"
#include "cramdec/record/record.h"

namespace cramdec::slice {

// =============================================================================
// Options
// =============================================================================

/// @brief Upper bound accepted for SliceDecodeOptions::threads.
inline constexpr std::size_t kMaxThreads = 256;

struct SliceDecodeOptions {
    /// @brief Worker threads (0 = let oneTBB decide).
    std::size_t threads = 0;

    /// @brief Slices per task.
    std::size_t grainSize = 1;

    /// @brief Validate options.
    /// @return kInvalidArgument for a zero grain size or too many threads.
    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// Slice Input
// =============================================================================

/// @brief Decompressed blocks and slice header fields of one slice.
/// @note Borrowed buffers must outlive the decode call.
struct SliceInput {
    std::span<const std::uint8_t> coreData;
    io::ExternalDataReaders externalData;
    ReferenceSequenceContext referenceContext;
    std::size_t recordCount = 0;
    RecordId initialId = 0;
};

// =============================================================================
// Decoding
// =============================================================================

/// @brief Decode every record of one slice.
[[nodiscard]] Result<std::vector<record::Record>> decodeSlice(
    const format::CompressionHeader& header, const SliceInput& slice);

/// @brief Decode @p slices concurrently.
/// @return Records per slice in input order, or the error of the first failing
///         slice in input order.
[[nodiscard]] Result<std::vector<std::vector<record::Record>>> decodeSlices(
    const format::CompressionHeader& header,
    std::span<const SliceInput> slices,
    const SliceDecodeOptions& options = {});

}  // namespace cramdec::slice

#endif  // CRAMDEC_SLICE_SLICE_DECODER_H
