// =============================================================================
// cramdec - Decoded Record
// =============================================================================
// One CRAM record as produced by slice::RecordReader. The caller owns the
// Record and passes it back on every call; buffers keep their capacity across
// records.
// =============================================================================

#ifndef CRAMDEC_RECORD_RECORD_H
#define CRAMDEC_RECORD_RECORD_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "cramdec/common/types.h"
#include "cramdec/record/feature.h"
#include "cramdec/record/tag.h"

namespace cramdec::record {

struct Record {
    /// @brief Sequential id within the decoding run.
    RecordId id = 0;

    /// @brief BAM flags, with mate flags folded in for detached records.
    std::uint16_t bamFlags = 0;
    CramFlags cramFlags;

    std::optional<std::size_t> referenceSequenceId;
    std::size_t readLength = 0;

    /// @brief Resolved 1-based start, absent for unplaced unmapped records.
    std::optional<Position> alignmentStart;
    std::optional<std::size_t> readGroupId;

    /// @brief Read name; empty when absent or not yet decoded.
    std::string name;

    MateFlags mateFlags;
    std::optional<std::size_t> mateReferenceSequenceId;
    std::optional<Position> mateAlignmentStart;
    std::int32_t templateLength = 0;

    /// @brief Raw distance to the downstream mate record.
    std::optional<std::size_t> mateDistance;

    std::vector<Tag> tags;
    std::vector<Feature> features;

    /// @brief Mapping quality, absent when stored as 255.
    std::optional<std::uint8_t> mappingQuality;

    /// @brief Read bases of an unmapped record.
    ByteBuffer sequence;

    /// @brief Quality scores; empty when not stored.
    ByteBuffer qualityScores;

    [[nodiscard]] bool isUnmapped() const noexcept {
        return (bamFlags & bam_flags::kUnmapped) != 0;
    }

    /// @brief Reset every field, keeping buffer capacity.
    void clear() noexcept;

    friend bool operator==(const Record&, const Record&) = default;
};

}  // namespace cramdec::record

#endif  // CRAMDEC_RECORD_RECORD_H
