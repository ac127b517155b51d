// =============================================================================
// cramdec - Data Series Encoding Table
// =============================================================================
// The fixed set of per-record data series, their two-letter keys and value
// kinds, and the table holding one optional Encoding per series.
//
// A series absent from the table is legal as long as no record in the slice
// needs it; the decoding engine reports kMissingDataSeriesEncoding naming the
// series at the point of first use.
// =============================================================================

#ifndef CRAMDEC_FORMAT_DATA_SERIES_H
#define CRAMDEC_FORMAT_DATA_SERIES_H

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

#include "cramdec/codec/encoding.h"
#include "cramdec/common/error.h"

namespace cramdec::format {

// =============================================================================
// Data Series
// =============================================================================

/// @brief Per-record data series.
enum class DataSeries : std::uint8_t {
    kBamFlags = 0,              ///< BF
    kCramFlags,                 ///< CF
    kReferenceSequenceIds,      ///< RI
    kReadLengths,               ///< RL
    kAlignmentStarts,           ///< AP
    kReadGroupIds,              ///< RG
    kNames,                     ///< RN
    kMateFlags,                 ///< MF
    kMateReferenceSequenceIds,  ///< NS
    kMateAlignmentStarts,       ///< NP
    kTemplateLengths,           ///< TS
    kMateDistances,             ///< NF
    kTagSetIds,                 ///< TL
    kFeatureCounts,             ///< FN
    kFeatureCodes,              ///< FC
    kFeaturePositionDeltas,     ///< FP
    kDeletionLengths,           ///< DL
    kStretchesOfBases,          ///< BB
    kStretchesOfQualityScores,  ///< QQ
    kBaseSubstitutionCodes,     ///< BS
    kInsertionBases,            ///< IN
    kReferenceSkipLengths,      ///< RS
    kPaddingLengths,            ///< PD
    kHardClipLengths,           ///< HC
    kSoftClipBases,             ///< SC
    kMappingQualities,          ///< MQ
    kBases,                     ///< BA
    kQualityScores              ///< QS
};

inline constexpr std::size_t kDataSeriesCount = 28;

/// @brief Value kind a series is decoded as.
enum class ValueKind : std::uint8_t {
    kInteger = 0,
    kByte,
    kByteArray
};

/// @brief Two-letter key of @p series.
[[nodiscard]] std::string_view dataSeriesKey(DataSeries series) noexcept;

/// @brief Value kind of @p series.
[[nodiscard]] ValueKind dataSeriesKind(DataSeries series) noexcept;

/// @brief Series for a two-letter key, nullopt for unknown keys.
[[nodiscard]] std::optional<DataSeries> dataSeriesFromKey(std::array<char, 2> key) noexcept;

[[nodiscard]] constexpr std::string_view valueKindToString(ValueKind kind) noexcept {
    switch (kind) {
        case ValueKind::kInteger:
            return "integer";
        case ValueKind::kByte:
            return "byte";
        case ValueKind::kByteArray:
            return "byte array";
    }
    return "unknown";
}

/// @brief kMissingDataSeriesEncoding error naming @p series.
[[nodiscard]] Error missingDataSeriesEncoding(DataSeries series);

// =============================================================================
// DataSeriesEncodings
// =============================================================================

/// @brief One optional Encoding per data series.
struct DataSeriesEncodings {
    std::optional<codec::IntegerEncoding> bamFlags;
    std::optional<codec::IntegerEncoding> cramFlags;
    std::optional<codec::IntegerEncoding> referenceSequenceIds;
    std::optional<codec::IntegerEncoding> readLengths;
    std::optional<codec::IntegerEncoding> alignmentStarts;
    std::optional<codec::IntegerEncoding> readGroupIds;
    std::optional<codec::ByteArrayEncoding> names;
    std::optional<codec::IntegerEncoding> mateFlags;
    std::optional<codec::IntegerEncoding> mateReferenceSequenceIds;
    std::optional<codec::IntegerEncoding> mateAlignmentStarts;
    std::optional<codec::IntegerEncoding> templateLengths;
    std::optional<codec::IntegerEncoding> mateDistances;
    std::optional<codec::IntegerEncoding> tagSetIds;
    std::optional<codec::IntegerEncoding> featureCounts;
    std::optional<codec::ByteEncoding> featureCodes;
    std::optional<codec::IntegerEncoding> featurePositionDeltas;
    std::optional<codec::IntegerEncoding> deletionLengths;
    std::optional<codec::ByteArrayEncoding> stretchesOfBases;
    std::optional<codec::ByteArrayEncoding> stretchesOfQualityScores;
    std::optional<codec::ByteEncoding> baseSubstitutionCodes;
    std::optional<codec::ByteArrayEncoding> insertionBases;
    std::optional<codec::IntegerEncoding> referenceSkipLengths;
    std::optional<codec::IntegerEncoding> paddingLengths;
    std::optional<codec::IntegerEncoding> hardClipLengths;
    std::optional<codec::ByteArrayEncoding> softClipBases;
    std::optional<codec::IntegerEncoding> mappingQualities;
    std::optional<codec::ByteEncoding> bases;
    std::optional<codec::ByteEncoding> qualityScores;

    /// @brief Integer encoding slot for @p series, nullptr if the series is not an integer series.
    [[nodiscard]] std::optional<codec::IntegerEncoding>* integerSlot(DataSeries series) noexcept;

    /// @brief Byte encoding slot for @p series, nullptr if the series is not a byte series.
    [[nodiscard]] std::optional<codec::ByteEncoding>* byteSlot(DataSeries series) noexcept;

    /// @brief Byte array encoding slot, nullptr if the series is not a byte array series.
    [[nodiscard]] std::optional<codec::ByteArrayEncoding>* byteArraySlot(
        DataSeries series) noexcept;

    [[nodiscard]] const std::optional<codec::IntegerEncoding>* integerSlot(
        DataSeries series) const noexcept;
    [[nodiscard]] const std::optional<codec::ByteEncoding>* byteSlot(
        DataSeries series) const noexcept;
    [[nodiscard]] const std::optional<codec::ByteArrayEncoding>* byteArraySlot(
        DataSeries series) const noexcept;

    /// @brief Whether an encoding is declared for @p series.
    [[nodiscard]] bool contains(DataSeries series) const noexcept;
};

}  // namespace cramdec::format

#endif  // CRAMDEC_FORMAT_DATA_SERIES_H
