// =============================================================================
// cramdec - Slice Batch Decoder Implementation
// =============================================================================

#include "cramdec/slice/slice_decoder.h"

#include <optional>
#include <utility>

#include <fmt/format.h>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

#include "cramdec/common/logger.h"
#include "cramdec/slice/record_reader.h"

namespace cramdec::slice {

VoidResult SliceDecodeOptions::validate() const {
    if (grainSize == 0) {
        return makeVoidError(ErrorCode::kInvalidArgument, "grain size must be > 0");
    }
    if (threads > kMaxThreads) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("thread count {} exceeds {}", threads, kMaxThreads));
    }
    return makeVoidSuccess();
}

Result<std::vector<record::Record>> decodeSlice(const format::CompressionHeader& header,
                                                const SliceInput& slice) {
    RecordReader reader(header, slice.coreData, slice.externalData, slice.referenceContext,
                        slice.recordCount, slice.initialId);

    std::vector<record::Record> records;
    records.reserve(slice.recordCount);

    record::Record record;
    while (true) {
        auto n = reader.readRecord(record);
        if (!n) {
            return std::unexpected(std::move(n).error());
        }
        if (*n == 0) {
            break;
        }
        records.push_back(record);
    }
    return records;
}

Result<std::vector<std::vector<record::Record>>> decodeSlices(
    const format::CompressionHeader& header,
    std::span<const SliceInput> slices,
    const SliceDecodeOptions& options) {
    if (auto valid = options.validate(); !valid) {
        return std::unexpected(std::move(valid).error());
    }

    std::vector<std::vector<record::Record>> results(slices.size());
    std::vector<std::optional<Error>> errors(slices.size());

    CRAMDEC_LOG_DEBUG("decoding {} slices, threads={}, grain={}", slices.size(),
                      options.threads, options.grainSize);

    const int concurrency = options.threads == 0 ? tbb::task_arena::automatic
                                                 : static_cast<int>(options.threads);
    tbb::task_arena arena(concurrency);

    // Each slice writes only its own result and error slots.
    arena.execute([&] {
        tbb::parallel_for(
            tbb::blocked_range<std::size_t>(0, slices.size(), options.grainSize),
            [&](const tbb::blocked_range<std::size_t>& range) {
                for (std::size_t i = range.begin(); i < range.end(); ++i) {
                    auto records = decodeSlice(header, slices[i]);
                    if (records) {
                        results[i] = std::move(*records);
                    } else {
                        errors[i] = std::move(records).error();
                    }
                }
            });
    });

    for (std::size_t i = 0; i < errors.size(); ++i) {
        if (errors[i].has_value()) {
            CRAMDEC_LOG_WARNING("slice {} of {} failed: {}", i, slices.size(),
                                errors[i]->describe());
            return std::unexpected(std::move(*errors[i]));
        }
    }

    return results;
}

}  // namespace cramdec::slice
