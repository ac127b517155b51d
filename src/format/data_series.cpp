// =============================================================================
// cramdec - Data Series Encoding Table Implementation
// =============================================================================

#include "cramdec/format/data_series.h"

#include <fmt/format.h>

namespace cramdec::format {

namespace {

struct SeriesInfo {
    DataSeries series;
    std::string_view key;
    ValueKind kind;
};

/// @brief Indexed by DataSeries.
constexpr std::array<SeriesInfo, kDataSeriesCount> kSeriesTable = {{
    {DataSeries::kBamFlags, "BF", ValueKind::kInteger},
    {DataSeries::kCramFlags, "CF", ValueKind::kInteger},
    {DataSeries::kReferenceSequenceIds, "RI", ValueKind::kInteger},
    {DataSeries::kReadLengths, "RL", ValueKind::kInteger},
    {DataSeries::kAlignmentStarts, "AP", ValueKind::kInteger},
    {DataSeries::kReadGroupIds, "RG", ValueKind::kInteger},
    {DataSeries::kNames, "RN", ValueKind::kByteArray},
    {DataSeries::kMateFlags, "MF", ValueKind::kInteger},
    {DataSeries::kMateReferenceSequenceIds, "NS", ValueKind::kInteger},
    {DataSeries::kMateAlignmentStarts, "NP", ValueKind::kInteger},
    {DataSeries::kTemplateLengths, "TS", ValueKind::kInteger},
    {DataSeries::kMateDistances, "NF", ValueKind::kInteger},
    {DataSeries::kTagSetIds, "TL", ValueKind::kInteger},
    {DataSeries::kFeatureCounts, "FN", ValueKind::kInteger},
    {DataSeries::kFeatureCodes, "FC", ValueKind::kByte},
    {DataSeries::kFeaturePositionDeltas, "FP", ValueKind::kInteger},
    {DataSeries::kDeletionLengths, "DL", ValueKind::kInteger},
    {DataSeries::kStretchesOfBases, "BB", ValueKind::kByteArray},
    {DataSeries::kStretchesOfQualityScores, "QQ", ValueKind::kByteArray},
    {DataSeries::kBaseSubstitutionCodes, "BS", ValueKind::kByte},
    {DataSeries::kInsertionBases, "IN", ValueKind::kByteArray},
    {DataSeries::kReferenceSkipLengths, "RS", ValueKind::kInteger},
    {DataSeries::kPaddingLengths, "PD", ValueKind::kInteger},
    {DataSeries::kHardClipLengths, "HC", ValueKind::kInteger},
    {DataSeries::kSoftClipBases, "SC", ValueKind::kByteArray},
    {DataSeries::kMappingQualities, "MQ", ValueKind::kInteger},
    {DataSeries::kBases, "BA", ValueKind::kByte},
    {DataSeries::kQualityScores, "QS", ValueKind::kByte},
}};

constexpr bool tableIsIndexed() {
    for (std::size_t i = 0; i < kSeriesTable.size(); ++i) {
        if (static_cast<std::size_t>(kSeriesTable[i].series) != i) {
            return false;
        }
    }
    return true;
}

static_assert(tableIsIndexed(), "series table must be ordered by DataSeries value");

}  // namespace

std::string_view dataSeriesKey(DataSeries series) noexcept {
    return kSeriesTable[static_cast<std::size_t>(series)].key;
}

ValueKind dataSeriesKind(DataSeries series) noexcept {
    return kSeriesTable[static_cast<std::size_t>(series)].kind;
}

std::optional<DataSeries> dataSeriesFromKey(std::array<char, 2> key) noexcept {
    const std::string_view wanted(key.data(), key.size());
    for (const auto& info : kSeriesTable) {
        if (info.key == wanted) {
            return info.series;
        }
    }
    return std::nullopt;
}

Error missingDataSeriesEncoding(DataSeries series) {
    ErrorContext context;
    context.withSeries(std::string(dataSeriesKey(series)));
    return Error{ErrorCode::kMissingDataSeriesEncoding,
                 fmt::format("no encoding for data series {}", dataSeriesKey(series)),
                 std::move(context)};
}

// =============================================================================
// DataSeriesEncodings
// =============================================================================

namespace {

template <typename Self>
auto integerSlotOf(Self& self, DataSeries series) noexcept -> decltype(&self.bamFlags) {
    switch (series) {
        case DataSeries::kBamFlags:
            return &self.bamFlags;
        case DataSeries::kCramFlags:
            return &self.cramFlags;
        case DataSeries::kReferenceSequenceIds:
            return &self.referenceSequenceIds;
        case DataSeries::kReadLengths:
            return &self.readLengths;
        case DataSeries::kAlignmentStarts:
            return &self.alignmentStarts;
        case DataSeries::kReadGroupIds:
            return &self.readGroupIds;
        case DataSeries::kMateFlags:
            return &self.mateFlags;
        case DataSeries::kMateReferenceSequenceIds:
            return &self.mateReferenceSequenceIds;
        case DataSeries::kMateAlignmentStarts:
            return &self.mateAlignmentStarts;
        case DataSeries::kTemplateLengths:
            return &self.templateLengths;
        case DataSeries::kMateDistances:
            return &self.mateDistances;
        case DataSeries::kTagSetIds:
            return &self.tagSetIds;
        case DataSeries::kFeatureCounts:
            return &self.featureCounts;
        case DataSeries::kFeaturePositionDeltas:
            return &self.featurePositionDeltas;
        case DataSeries::kDeletionLengths:
            return &self.deletionLengths;
        case DataSeries::kReferenceSkipLengths:
            return &self.referenceSkipLengths;
        case DataSeries::kPaddingLengths:
            return &self.paddingLengths;
        case DataSeries::kHardClipLengths:
            return &self.hardClipLengths;
        case DataSeries::kMappingQualities:
            return &self.mappingQualities;
        default:
            return nullptr;
    }
}

template <typename Self>
auto byteSlotOf(Self& self, DataSeries series) noexcept -> decltype(&self.featureCodes) {
    switch (series) {
        case DataSeries::kFeatureCodes:
            return &self.featureCodes;
        case DataSeries::kBaseSubstitutionCodes:
            return &self.baseSubstitutionCodes;
        case DataSeries::kBases:
            return &self.bases;
        case DataSeries::kQualityScores:
            return &self.qualityScores;
        default:
            return nullptr;
    }
}

template <typename Self>
auto byteArraySlotOf(Self& self, DataSeries series) noexcept -> decltype(&self.names) {
    switch (series) {
        case DataSeries::kNames:
            return &self.names;
        case DataSeries::kStretchesOfBases:
            return &self.stretchesOfBases;
        case DataSeries::kStretchesOfQualityScores:
            return &self.stretchesOfQualityScores;
        case DataSeries::kInsertionBases:
            return &self.insertionBases;
        case DataSeries::kSoftClipBases:
            return &self.softClipBases;
        default:
            return nullptr;
    }
}

}  // namespace

std::optional<codec::IntegerEncoding>* DataSeriesEncodings::integerSlot(
    DataSeries series) noexcept {
    return integerSlotOf(*this, series);
}

std::optional<codec::ByteEncoding>* DataSeriesEncodings::byteSlot(DataSeries series) noexcept {
    return byteSlotOf(*this, series);
}

std::optional<codec::ByteArrayEncoding>* DataSeriesEncodings::byteArraySlot(
    DataSeries series) noexcept {
    return byteArraySlotOf(*this, series);
}

const std::optional<codec::IntegerEncoding>* DataSeriesEncodings::integerSlot(
    DataSeries series) const noexcept {
    return integerSlotOf(*this, series);
}

const std::optional<codec::ByteEncoding>* DataSeriesEncodings::byteSlot(
    DataSeries series) const noexcept {
    return byteSlotOf(*this, series);
}

const std::optional<codec::ByteArrayEncoding>* DataSeriesEncodings::byteArraySlot(
    DataSeries series) const noexcept {
    return byteArraySlotOf(*this, series);
}

bool DataSeriesEncodings::contains(DataSeries series) const noexcept {
    switch (dataSeriesKind(series)) {
        case ValueKind::kInteger:
            return integerSlotOf(*this, series)->has_value();
        case ValueKind::kByte:
            return byteSlotOf(*this, series)->has_value();
        case ValueKind::kByteArray:
            return byteArraySlotOf(*this, series)->has_value();
    }
    return false;
}

}  // namespace cramdec::format
