// =============================================================================
// cramdec - Record and Feature Implementation
// =============================================================================

#include "cramdec/record/record.h"

#include <type_traits>

namespace cramdec::record {

// =============================================================================
// Feature
// =============================================================================

std::optional<FeatureCode> featureCodeFromByte(std::uint8_t code) noexcept {
    switch (code) {
        case 'b':
        case 'q':
        case 'B':
        case 'X':
        case 'I':
        case 'D':
        case 'i':
        case 'Q':
        case 'N':
        case 'S':
        case 'P':
        case 'H':
            return static_cast<FeatureCode>(code);
        default:
            return std::nullopt;
    }
}

Position featurePosition(const Feature& feature) noexcept {
    return std::visit([](const auto& f) { return f.position; }, feature);
}

FeatureCode featureCode(const Feature& feature) noexcept {
    return std::visit(
        [](const auto& f) -> FeatureCode {
            using T = std::decay_t<decltype(f)>;
            if constexpr (std::is_same_v<T, feature::Bases>) {
                return FeatureCode::kBases;
            } else if constexpr (std::is_same_v<T, feature::Scores>) {
                return FeatureCode::kScores;
            } else if constexpr (std::is_same_v<T, feature::ReadBase>) {
                return FeatureCode::kReadBase;
            } else if constexpr (std::is_same_v<T, feature::Substitution>) {
                return FeatureCode::kSubstitution;
            } else if constexpr (std::is_same_v<T, feature::Insertion>) {
                return FeatureCode::kInsertion;
            } else if constexpr (std::is_same_v<T, feature::Deletion>) {
                return FeatureCode::kDeletion;
            } else if constexpr (std::is_same_v<T, feature::InsertBase>) {
                return FeatureCode::kInsertBase;
            } else if constexpr (std::is_same_v<T, feature::QualityScore>) {
                return FeatureCode::kQualityScore;
            } else if constexpr (std::is_same_v<T, feature::ReferenceSkip>) {
                return FeatureCode::kReferenceSkip;
            } else if constexpr (std::is_same_v<T, feature::SoftClip>) {
                return FeatureCode::kSoftClip;
            } else if constexpr (std::is_same_v<T, feature::Padding>) {
                return FeatureCode::kPadding;
            } else {
                static_assert(std::is_same_v<T, feature::HardClip>);
                return FeatureCode::kHardClip;
            }
        },
        feature);
}

// =============================================================================
// Record
// =============================================================================

void Record::clear() noexcept {
    id = 0;
    bamFlags = 0;
    cramFlags = CramFlags{};
    referenceSequenceId.reset();
    readLength = 0;
    alignmentStart.reset();
    readGroupId.reset();
    name.clear();
    mateFlags = MateFlags{};
    mateReferenceSequenceId.reset();
    mateAlignmentStart.reset();
    templateLength = 0;
    mateDistance.reset();
    tags.clear();
    features.clear();
    mappingQuality.reset();
    sequence.clear();
    qualityScores.clear();
}

}  // namespace cramdec::record
