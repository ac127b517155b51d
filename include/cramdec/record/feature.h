// =============================================================================
// cramdec - Read Features
// =============================================================================
// Differences between a mapped read and the reference, one variant per CRAM
// feature code. Every feature carries the 1-based read position it applies at.
//
//   code  feature        payload series
//   'b'   Bases          BB
//   'q'   Scores         QQ
//   'B'   ReadBase       BA + QS
//   'X'   Substitution   BS
//   'I'   Insertion      IN
//   'D'   Deletion       DL
//   'i'   InsertBase     BA
//   'Q'   QualityScore   QS
//   'N'   ReferenceSkip  RS
//   'S'   SoftClip       SC
//   'P'   Padding        PD
//   'H'   HardClip       HC
// =============================================================================

#ifndef CRAMDEC_RECORD_FEATURE_H
#define CRAMDEC_RECORD_FEATURE_H

#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

#include "cramdec/common/types.h"

namespace cramdec::record {

namespace feature {

/// @brief Stretch of read bases aligned to the reference.
struct Bases {
    Position position = 0;
    ByteBuffer bases;

    friend bool operator==(const Bases&, const Bases&) = default;
};

/// @brief Stretch of quality scores.
struct Scores {
    Position position = 0;
    ByteBuffer qualityScores;

    friend bool operator==(const Scores&, const Scores&) = default;
};

/// @brief Single read base and its quality score.
struct ReadBase {
    Position position = 0;
    std::uint8_t base = 0;
    std::uint8_t qualityScore = 0;

    friend bool operator==(const ReadBase&, const ReadBase&) = default;
};

/// @brief Base substitution, resolved through the substitution matrix.
struct Substitution {
    Position position = 0;
    std::uint8_t code = 0;

    friend bool operator==(const Substitution&, const Substitution&) = default;
};

struct Insertion {
    Position position = 0;
    ByteBuffer bases;

    friend bool operator==(const Insertion&, const Insertion&) = default;
};

struct Deletion {
    Position position = 0;
    std::uint32_t length = 0;

    friend bool operator==(const Deletion&, const Deletion&) = default;
};

/// @brief Single inserted base.
struct InsertBase {
    Position position = 0;
    std::uint8_t base = 0;

    friend bool operator==(const InsertBase&, const InsertBase&) = default;
};

struct QualityScore {
    Position position = 0;
    std::uint8_t qualityScore = 0;

    friend bool operator==(const QualityScore&, const QualityScore&) = default;
};

struct ReferenceSkip {
    Position position = 0;
    std::uint32_t length = 0;

    friend bool operator==(const ReferenceSkip&, const ReferenceSkip&) = default;
};

struct SoftClip {
    Position position = 0;
    ByteBuffer bases;

    friend bool operator==(const SoftClip&, const SoftClip&) = default;
};

struct Padding {
    Position position = 0;
    std::uint32_t length = 0;

    friend bool operator==(const Padding&, const Padding&) = default;
};

struct HardClip {
    Position position = 0;
    std::uint32_t length = 0;

    friend bool operator==(const HardClip&, const HardClip&) = default;
};

}  // namespace feature

using Feature = std::variant<feature::Bases, feature::Scores, feature::ReadBase,
                             feature::Substitution, feature::Insertion, feature::Deletion,
                             feature::InsertBase, feature::QualityScore,
                             feature::ReferenceSkip, feature::SoftClip, feature::Padding,
                             feature::HardClip>;

/// @brief Feature kinds, valued by their code byte.
enum class FeatureCode : std::uint8_t {
    kBases = 'b',
    kScores = 'q',
    kReadBase = 'B',
    kSubstitution = 'X',
    kInsertion = 'I',
    kDeletion = 'D',
    kInsertBase = 'i',
    kQualityScore = 'Q',
    kReferenceSkip = 'N',
    kSoftClip = 'S',
    kPadding = 'P',
    kHardClip = 'H'
};

/// @brief Feature code for a code byte, nullopt for unknown bytes.
[[nodiscard]] std::optional<FeatureCode> featureCodeFromByte(std::uint8_t code) noexcept;

[[nodiscard]] Position featurePosition(const Feature& feature) noexcept;

[[nodiscard]] FeatureCode featureCode(const Feature& feature) noexcept;

[[nodiscard]] constexpr std::string_view featureCodeToString(FeatureCode code) noexcept {
    switch (code) {
        case FeatureCode::kBases:
            return "bases";
        case FeatureCode::kScores:
            return "scores";
        case FeatureCode::kReadBase:
            return "read base";
        case FeatureCode::kSubstitution:
            return "substitution";
        case FeatureCode::kInsertion:
            return "insertion";
        case FeatureCode::kDeletion:
            return "deletion";
        case FeatureCode::kInsertBase:
            return "insert base";
        case FeatureCode::kQualityScore:
            return "quality score";
        case FeatureCode::kReferenceSkip:
            return "reference skip";
        case FeatureCode::kSoftClip:
            return "soft clip";
        case FeatureCode::kPadding:
            return "padding";
        case FeatureCode::kHardClip:
            return "hard clip";
    }
    return "unknown";
}

}  // namespace cramdec::record

#endif  // CRAMDEC_RECORD_FEATURE_H
