// =============================================================================
// cramdec - Compression Header
// =============================================================================
// The per-container compression header shared read-only by every slice decoded
// against it:
//
// - PreservationMap:      record-shape flags, substitution matrix, tag sets
// - DataSeriesEncodings:  one optional Encoding per data series
// - TagEncodings:         tag content id -> byte array Encoding
//
// parseCompressionHeader() reads the decompressed body of a compression header
// block. Block framing (block header, compression method, CRC) is handled by
// the caller.
//
// Body layout, three maps in order, each "ITF8 byte size, ITF8 entry count,
// entries":
//   preservation map   2-byte key + value (RN/AP/RR bool, SM 5 bytes,
//                      TD ITF8 length + NUL-separated 3-byte tag key lists)
//   data series map    2-byte series key + encoding descriptor
//   tag encoding map   ITF8 tag content id + encoding descriptor
// An encoding descriptor is "ITF8 codec id, ITF8 argument length, arguments".
// =============================================================================

#ifndef CRAMDEC_FORMAT_COMPRESSION_HEADER_H
#define CRAMDEC_FORMAT_COMPRESSION_HEADER_H

#include <cstdint>
#include <span>
#include <unordered_map>
#include <vector>

#include "cramdec/codec/encoding.h"
#include "cramdec/common/error.h"
#include "cramdec/format/data_series.h"
#include "cramdec/format/substitution_matrix.h"
#include "cramdec/io/byte_reader.h"
#include "cramdec/record/tag.h"

namespace cramdec::format {

// =============================================================================
// Preservation Map
// =============================================================================

/// @brief Ordered tag keys of one tag set.
using TagSet = std::vector<record::TagKey>;

struct PreservationMap {
    /// @brief RN: records carry read names.
    bool recordsHaveNames = true;

    /// @brief AP: alignment starts are deltas from the previous record.
    bool alignmentStartsAreDeltas = true;

    /// @brief RR: a reference sequence is required to rebuild bases.
    bool referenceRequired = true;

    /// @brief SM
    SubstitutionMatrix substitutionMatrix;

    /// @brief TD, indexed by tag set id.
    std::vector<TagSet> tagSets;

    /// @brief Tag set for @p id.
    /// @return kMissingTagSet if @p id is out of range.
    [[nodiscard]] Result<const TagSet*> tagSet(std::int32_t id) const;
};

// =============================================================================
// Compression Header
// =============================================================================

/// @brief Tag content id -> encoding of the tag's value bytes.
using TagEncodings = std::unordered_map<std::int32_t, codec::ByteArrayEncoding>;

struct CompressionHeader {
    PreservationMap preservationMap;
    DataSeriesEncodings dataSeriesEncodings;
    TagEncodings tagEncodings;
};

// =============================================================================
// Parsing
// =============================================================================

/// @brief Parse the decompressed compression header body.
[[nodiscard]] Result<CompressionHeader> parseCompressionHeader(
    std::span<const std::uint8_t> data);

[[nodiscard]] Result<PreservationMap> parsePreservationMap(io::ByteReader& reader);

/// @brief Parse the TD value: NUL-separated lists of 3-byte tag keys.
[[nodiscard]] Result<std::vector<TagSet>> parseTagSets(std::span<const std::uint8_t> data);

[[nodiscard]] Result<DataSeriesEncodings> parseDataSeriesEncodings(io::ByteReader& reader);

[[nodiscard]] Result<TagEncodings> parseTagEncodings(io::ByteReader& reader);

/// @brief Parse one encoding descriptor for an integer series.
[[nodiscard]] Result<codec::IntegerEncoding> parseIntegerEncoding(io::ByteReader& reader);

/// @brief Parse one encoding descriptor for a byte series.
[[nodiscard]] Result<codec::ByteEncoding> parseByteEncoding(io::ByteReader& reader);

/// @brief Parse one encoding descriptor for a byte array series.
[[nodiscard]] Result<codec::ByteArrayEncoding> parseByteArrayEncoding(io::ByteReader& reader);

}  // namespace cramdec::format

#endif  // CRAMDEC_FORMAT_COMPRESSION_HEADER_H
