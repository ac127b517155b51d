// =============================================================================
// cramdec - Record Reader Implementation
// =============================================================================

#include "cramdec/slice/record_reader.h"

#include <algorithm>
#include <limits>
#include <string_view>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

#include "cramdec/common/logger.h"

namespace cramdec::slice {

namespace {

using format::DataSeries;

/// @brief Name stored for records without one.
constexpr std::string_view kMissingName = "*";

template <typename T>
Result<T> narrowTo(std::int32_t value, DataSeries series) {
    if (value < static_cast<std::int64_t>(std::numeric_limits<T>::min()) ||
        value > static_cast<std::int64_t>(std::numeric_limits<T>::max())) {
        ErrorContext context;
        context.withSeries(std::string(format::dataSeriesKey(series)));
        return makeError<T>(ErrorCode::kInvalidData,
                            fmt::format("{} value {} out of range",
                                        format::dataSeriesKey(series), value),
                            std::move(context));
    }
    return static_cast<T>(value);
}

}  // namespace

RecordReader::RecordReader(const format::CompressionHeader& header,
                           std::span<const std::uint8_t> coreData,
                           io::ExternalDataReaders externalData,
                           ReferenceSequenceContext referenceContext,
                           std::size_t recordCount,
                           RecordId initialId)
    : header_(header),
      core_(coreData),
      external_(std::move(externalData)),
      referenceContext_(referenceContext),
      recordCount_(recordCount),
      id_(initialId),
      previousAlignmentStart_(referenceContext.kind == ReferenceContextKind::kSome
                                  ? referenceContext.alignmentStart
                                  : 0) {
    CRAMDEC_LOG_DEBUG("slice: {} records from id {}, reference context {}, {} external blocks",
                      recordCount_, id_, referenceContextKindToString(referenceContext_.kind),
                      external_.size());
}

// =============================================================================
// Record Decode
// =============================================================================

Result<std::size_t> RecordReader::readRecord(record::Record& record) {
    if (recordsRead_ >= recordCount_) {
        return std::size_t{0};
    }

    record.clear();
    record.id = id_;

    auto decodeSections = [&]() -> VoidResult {
        if (auto r = readFlags(record); !r) {
            return r;
        }
        if (auto r = readPositions(record); !r) {
            return r;
        }
        if (auto r = readName(record); !r) {
            return r;
        }
        if (auto r = readMate(record); !r) {
            return r;
        }
        if (auto r = readTags(record); !r) {
            return r;
        }
        return record.isUnmapped() ? readUnmappedRead(record) : readMappedRead(record);
    };

    if (auto result = decodeSections(); !result) {
        Error error = std::move(result).error();
        error.withRecord(id_);
        CRAMDEC_LOG_DEBUG("record {} failed: {}", id_, error.describe());
        return std::unexpected(std::move(error));
    }

    CRAMDEC_LOG_TRACE("record {}: flags {:#x}, read length {}, {} features, {} tags", id_,
                      record.bamFlags, record.readLength, record.features.size(),
                      record.tags.size());

    previousAlignmentStart_ = record.alignmentStart.value_or(0);
    ++id_;
    ++recordsRead_;
    if (recordsRead_ == recordCount_) {
        CRAMDEC_LOG_DEBUG("slice done: {} records, {} core bits left", recordCount_,
                          core_.remainingBits());
    }
    return std::size_t{1};
}

VoidResult RecordReader::readFlags(record::Record& record) {
    auto bamFlags = decodeInteger(DataSeries::kBamFlags);
    if (!bamFlags) {
        return std::unexpected(std::move(bamFlags).error());
    }
    auto bamBits = narrowTo<std::uint16_t>(*bamFlags, DataSeries::kBamFlags);
    if (!bamBits) {
        return std::unexpected(std::move(bamBits).error());
    }
    record.bamFlags = *bamBits;

    auto cramFlags = decodeInteger(DataSeries::kCramFlags);
    if (!cramFlags) {
        return std::unexpected(std::move(cramFlags).error());
    }
    auto cramBits = narrowTo<std::uint8_t>(*cramFlags, DataSeries::kCramFlags);
    if (!cramBits) {
        return std::unexpected(std::move(cramBits).error());
    }
    record.cramFlags = CramFlags{*cramBits};

    return makeVoidSuccess();
}

VoidResult RecordReader::readPositions(record::Record& record) {
    switch (referenceContext_.kind) {
        case ReferenceContextKind::kSome:
            record.referenceSequenceId = referenceContext_.referenceSequenceId;
            break;
        case ReferenceContextKind::kNone:
            record.referenceSequenceId.reset();
            break;
        case ReferenceContextKind::kMany: {
            auto id = decodeOptionalId(DataSeries::kReferenceSequenceIds);
            if (!id) {
                return std::unexpected(std::move(id).error());
            }
            record.referenceSequenceId = *id;
            break;
        }
    }

    auto readLength = decodeLength(DataSeries::kReadLengths);
    if (!readLength) {
        return std::unexpected(std::move(readLength).error());
    }
    record.readLength = *readLength;

    auto alignmentStart = readAlignmentStart(record.isUnmapped());
    if (!alignmentStart) {
        return std::unexpected(std::move(alignmentStart).error());
    }
    if (*alignmentStart > 0) {
        record.alignmentStart = *alignmentStart;
    }

    auto readGroupId = decodeOptionalId(DataSeries::kReadGroupIds);
    if (!readGroupId) {
        return std::unexpected(std::move(readGroupId).error());
    }
    record.readGroupId = *readGroupId;

    return makeVoidSuccess();
}

Result<Position> RecordReader::readAlignmentStart(bool isUnmapped) {
    auto raw = decodeInteger(DataSeries::kAlignmentStarts);
    if (!raw) {
        return std::unexpected(std::move(raw).error());
    }

    const std::int64_t resolved = header_.preservationMap.alignmentStartsAreDeltas
                                      ? std::int64_t{previousAlignmentStart_} + *raw
                                      : std::int64_t{*raw};

    // Unplaced unmapped records store 0.
    const bool valid = isUnmapped ? resolved >= 0 : resolved > 0;
    if (!valid || resolved > std::numeric_limits<Position>::max()) {
        ErrorContext context;
        context.withSeries(std::string(format::dataSeriesKey(DataSeries::kAlignmentStarts)));
        return makeError<Position>(
            ErrorCode::kInvalidData,
            fmt::format("invalid alignment start {} (previous {}, stored {})", resolved,
                        previousAlignmentStart_, *raw),
            std::move(context));
    }
    return static_cast<Position>(resolved);
}


VoidResult RecordReader::readName(record::Record& record) {
    if (!header_.preservationMap.recordsHaveNames) {
        return makeVoidSuccess();
    }
    return decodeName(record);
}

VoidResult RecordReader::decodeName(record::Record& record) {
    if (auto result = decodeByteArray(DataSeries::kNames, scratch_); !result) {
        return result;
    }
    const std::string_view name(reinterpret_cast<const char*>(scratch_.data()), scratch_.size());
    if (name != kMissingName) {
        record.name.assign(name);
    }
    return makeVoidSuccess();
}

VoidResult RecordReader::readMate(record::Record& record) {
    if (record.cramFlags.isDetached()) {
        auto mateFlags = decodeInteger(DataSeries::kMateFlags);
        if (!mateFlags) {
            return std::unexpected(std::move(mateFlags).error());
        }
        auto mateBits = narrowTo<std::uint8_t>(*mateFlags, DataSeries::kMateFlags);
        if (!mateBits) {
            return std::unexpected(std::move(mateBits).error());
        }
        record.mateFlags = MateFlags{*mateBits};

        if (record.mateFlags.isOnNegativeStrand()) {
            record.bamFlags |= bam_flags::kMateReverseComplemented;
        }
        if (record.mateFlags.isUnmapped()) {
            record.bamFlags |= bam_flags::kMateUnmapped;
        }

        // Without RN, names are only stored for detached records.
        if (!header_.preservationMap.recordsHaveNames) {
            if (auto result = decodeName(record); !result) {
                return result;
            }
        }

        auto mateReferenceSequenceId = decodeOptionalId(DataSeries::kMateReferenceSequenceIds);
        if (!mateReferenceSequenceId) {
            return std::unexpected(std::move(mateReferenceSequenceId).error());
        }
        record.mateReferenceSequenceId = *mateReferenceSequenceId;

        auto mateAlignmentStart = decodeLength(DataSeries::kMateAlignmentStarts);
        if (!mateAlignmentStart) {
            return std::unexpected(std::move(mateAlignmentStart).error());
        }
        if (*mateAlignmentStart > 0) {
            record.mateAlignmentStart = static_cast<Position>(*mateAlignmentStart);
        }

        auto templateLength = decodeInteger(DataSeries::kTemplateLengths);
        if (!templateLength) {
            return std::unexpected(std::move(templateLength).error());
        }
        record.templateLength = *templateLength;
    } else if (record.cramFlags.mateIsDownstream()) {
        auto mateDistance = decodeLength(DataSeries::kMateDistances);
        if (!mateDistance) {
            return std::unexpected(std::move(mateDistance).error());
        }
        record.mateDistance = *mateDistance;
    }

    return makeVoidSuccess();
}

VoidResult RecordReader::readTags(record::Record& record) {
    auto tagSetId = decodeLength(DataSeries::kTagSetIds);
    if (!tagSetId) {
        return std::unexpected(std::move(tagSetId).error());
    }

    auto tagSet = header_.preservationMap.tagSet(static_cast<std::int32_t>(*tagSetId));
    if (!tagSet) {
        return std::unexpected(std::move(tagSet).error());
    }

    record.tags.reserve((*tagSet)->size());
    for (const auto& key : **tagSet) {
        const auto it = header_.tagEncodings.find(key.contentId());
        if (it == header_.tagEncodings.end()) {
            ErrorContext context;
            context.withTag(key.toString()).withContentId(key.contentId());
            return makeVoidError(ErrorCode::kMissingTagEncoding,
                                 fmt::format("no encoding for tag {}", key.toString()),
                                 std::move(context));
        }

        if (auto result = it->second.decodeInto(core_, external_, scratch_); !result) {
            return result;
        }

        auto value = record::parseTagValue(key.type, scratch_);
        if (!value) {
            Error error = std::move(value).error();
            ErrorContext context = error.context().value_or(ErrorContext{});
            context.withTag(key.toString());
            return std::unexpected(Error{error.code(), error.message(), std::move(context)});
        }
        record.tags.push_back(record::Tag{key, std::move(*value)});
    }

    return makeVoidSuccess();
}

VoidResult RecordReader::readUnmappedRead(record::Record& record) {
    if (auto result = decodeBytes(DataSeries::kBases, record.readLength, record.sequence);
        !result) {
        return result;
    }
    if (record.cramFlags.qualityScoresAreStoredAsArray()) {
        return readQualityScores(record);
    }
    return makeVoidSuccess();
}

VoidResult RecordReader::readMappedRead(record::Record& record) {
    auto featureCount = decodeLength(DataSeries::kFeatureCounts);
    if (!featureCount) {
        return std::unexpected(std::move(featureCount).error());
    }

    Position previousPosition = 0;
    for (std::uint32_t i = 0; i < *featureCount; ++i) {
        auto feature = readFeature(previousPosition);
        if (!feature) {
            return std::unexpected(std::move(feature).error());
        }
        previousPosition = record::featurePosition(*feature);
        record.features.push_back(std::move(*feature));
    }

    auto mappingQuality = decodeInteger(DataSeries::kMappingQualities);
    if (!mappingQuality) {
        return std::unexpected(std::move(mappingQuality).error());
    }
    auto quality = narrowTo<std::uint8_t>(*mappingQuality, DataSeries::kMappingQualities);
    if (!quality) {
        return std::unexpected(std::move(quality).error());
    }
    if (*quality != kMissingMappingQuality) {
        record.mappingQuality = *quality;
    }

    if (record.cramFlags.qualityScoresAreStoredAsArray()) {
        return readQualityScores(record);
    }
    return makeVoidSuccess();
}

VoidResult RecordReader::readQualityScores(record::Record& record) {
    auto& scores = record.qualityScores;
    if (auto result = decodeBytes(DataSeries::kQualityScores, record.readLength, scores);
        !result) {
        return result;
    }
    if (std::all_of(scores.begin(), scores.end(),
                    [](std::uint8_t q) { return q == kMissingQualityScore; })) {
        scores.clear();
    }
    return makeVoidSuccess();
}

// =============================================================================
// Features
// =============================================================================

Result<record::Feature> RecordReader::readFeature(Position previousPosition) {
    using namespace record::feature;
    using record::FeatureCode;

    auto codeByte = decodeByte(DataSeries::kFeatureCodes);
    if (!codeByte) {
        return std::unexpected(std::move(codeByte).error());
    }
    const auto code = record::featureCodeFromByte(*codeByte);
    if (!code.has_value()) {
        return makeError<record::Feature>(
            ErrorCode::kInvalidData, fmt::format("invalid feature code 0x{:02x}", *codeByte));
    }

    auto delta = decodeLength(DataSeries::kFeaturePositionDeltas);
    if (!delta) {
        return std::unexpected(std::move(delta).error());
    }
    const std::int64_t resolved = std::int64_t{previousPosition} + *delta;
    if (resolved < 1 || resolved > std::numeric_limits<Position>::max()) {
        return makeError<record::Feature>(
            ErrorCode::kInvalidData,
            fmt::format("invalid {} feature position {}", record::featureCodeToString(*code),
                        resolved));
    }
    const auto position = static_cast<Position>(resolved);

    // Byte payloads decode straight into the feature's buffer.
    auto withBytes = [&]<typename F>(DataSeries series) -> Result<record::Feature> {
        F feature{position, {}};
        VoidResult result;
        if constexpr (std::is_same_v<F, Scores>) {
            result = decodeByteArray(series, feature.qualityScores);
        } else {
            result = decodeByteArray(series, feature.bases);
        }
        if (!result) {
            return std::unexpected(std::move(result).error());
        }
        return record::Feature{std::move(feature)};
    };

    auto withLength = [&]<typename F>(DataSeries series) -> Result<record::Feature> {
        auto length = decodeLength(series);
        if (!length) {
            return std::unexpected(std::move(length).error());
        }
        return record::Feature{F{position, *length}};
    };

    switch (*code) {
        case FeatureCode::kBases:
            return withBytes.template operator()<Bases>(DataSeries::kStretchesOfBases);
        case FeatureCode::kScores:
            return withBytes.template operator()<Scores>(DataSeries::kStretchesOfQualityScores);
        case FeatureCode::kReadBase: {
            auto base = decodeByte(DataSeries::kBases);
            if (!base) {
                return std::unexpected(std::move(base).error());
            }
            auto qualityScore = decodeByte(DataSeries::kQualityScores);
            if (!qualityScore) {
                return std::unexpected(std::move(qualityScore).error());
            }
            return record::Feature{ReadBase{position, *base, *qualityScore}};
        }
        case FeatureCode::kSubstitution: {
            auto substitutionCode = decodeByte(DataSeries::kBaseSubstitutionCodes);
            if (!substitutionCode) {
                return std::unexpected(std::move(substitutionCode).error());
            }
            return record::Feature{Substitution{position, *substitutionCode}};
        }
        case FeatureCode::kInsertion:
            return withBytes.template operator()<Insertion>(DataSeries::kInsertionBases);
        case FeatureCode::kDeletion:
            return withLength.template operator()<Deletion>(DataSeries::kDeletionLengths);
        case FeatureCode::kInsertBase: {
            auto base = decodeByte(DataSeries::kBases);
            if (!base) {
                return std::unexpected(std::move(base).error());
            }
            return record::Feature{InsertBase{position, *base}};
        }
        case FeatureCode::kQualityScore: {
            auto qualityScore = decodeByte(DataSeries::kQualityScores);
            if (!qualityScore) {
                return std::unexpected(std::move(qualityScore).error());
            }
            return record::Feature{QualityScore{position, *qualityScore}};
        }
        case FeatureCode::kReferenceSkip:
            return withLength.template operator()<ReferenceSkip>(
                DataSeries::kReferenceSkipLengths);
        case FeatureCode::kSoftClip:
            return withBytes.template operator()<SoftClip>(DataSeries::kSoftClipBases);
        case FeatureCode::kPadding:
            return withLength.template operator()<Padding>(DataSeries::kPaddingLengths);
        case FeatureCode::kHardClip:
            return withLength.template operator()<HardClip>(DataSeries::kHardClipLengths);
    }

    return makeError<record::Feature>(ErrorCode::kInvalidData, "unhandled feature code");
}

// =============================================================================
// Series Accessors
// =============================================================================

Result<std::int32_t> RecordReader::decodeInteger(DataSeries series) {
    const auto* slot = header_.dataSeriesEncodings.integerSlot(series);
    if (slot == nullptr || !slot->has_value()) {
        return std::unexpected(format::missingDataSeriesEncoding(series));
    }
    return (*slot)->decode(core_, external_);
}

Result<std::uint8_t> RecordReader::decodeByte(DataSeries series) {
    const auto* slot = header_.dataSeriesEncodings.byteSlot(series);
    if (slot == nullptr || !slot->has_value()) {
        return std::unexpected(format::missingDataSeriesEncoding(series));
    }
    return (*slot)->decode(core_, external_);
}

VoidResult RecordReader::decodeByteArray(DataSeries series, ByteBuffer& out) {
    const auto* slot = header_.dataSeriesEncodings.byteArraySlot(series);
    if (slot == nullptr || !slot->has_value()) {
        return std::unexpected(format::missingDataSeriesEncoding(series));
    }
    return (*slot)->decodeInto(core_, external_, out);
}

VoidResult RecordReader::decodeBytes(DataSeries series, std::size_t count, ByteBuffer& out) {
    const auto* slot = header_.dataSeriesEncodings.byteSlot(series);
    if (slot == nullptr || !slot->has_value()) {
        return std::unexpected(format::missingDataSeriesEncoding(series));
    }
    return (*slot)->decodeTake(core_, external_, count, out);
}

Result<std::uint32_t> RecordReader::decodeLength(DataSeries series) {
    auto value = decodeInteger(series);
    if (!value) {
        return std::unexpected(std::move(value).error());
    }
    return narrowTo<std::uint32_t>(*value, series);
}

Result<std::optional<std::size_t>> RecordReader::decodeOptionalId(DataSeries series) {
    auto value = decodeInteger(series);
    if (!value) {
        return std::unexpected(std::move(value).error());
    }
    if (*value == kMissingId) {
        return std::optional<std::size_t>{};
    }
    auto id = narrowTo<std::uint32_t>(*value, series);
    if (!id) {
        return std::unexpected(std::move(id).error());
    }
    return std::optional<std::size_t>{*id};
}

}  // namespace cramdec::slice
