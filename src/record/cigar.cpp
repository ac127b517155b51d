// =============================================================================
// cramdec - CIGAR Conversion Implementation
// =============================================================================

#include "cramdec/record/cigar.h"

#include <type_traits>

#include <fmt/format.h>

namespace cramdec::record {

namespace {

void push(Cigar& cigar, CigarOpKind kind, std::uint64_t length) {
    if (length == 0) {
        return;
    }
    if (!cigar.empty() && cigar.back().kind == kind) {
        cigar.back().length += static_cast<std::uint32_t>(length);
    } else {
        cigar.push_back(CigarOp{kind, static_cast<std::uint32_t>(length)});
    }
}

/// @brief CIGAR op and number of read bases consumed by one feature.
struct FeatureOp {
    CigarOpKind kind = CigarOpKind::kMatch;
    std::uint64_t length = 0;
    std::uint64_t readBases = 0;
};

std::optional<FeatureOp> toOp(const Feature& feature) {
    return std::visit(
        [](const auto& f) -> std::optional<FeatureOp> {
            using T = std::decay_t<decltype(f)>;
            if constexpr (std::is_same_v<T, feature::Bases>) {
                return FeatureOp{CigarOpKind::kMatch, f.bases.size(), f.bases.size()};
            } else if constexpr (std::is_same_v<T, feature::ReadBase> ||
                                 std::is_same_v<T, feature::Substitution>) {
                return FeatureOp{CigarOpKind::kMatch, 1, 1};
            } else if constexpr (std::is_same_v<T, feature::Insertion>) {
                return FeatureOp{CigarOpKind::kInsertion, f.bases.size(), f.bases.size()};
            } else if constexpr (std::is_same_v<T, feature::InsertBase>) {
                return FeatureOp{CigarOpKind::kInsertion, 1, 1};
            } else if constexpr (std::is_same_v<T, feature::SoftClip>) {
                return FeatureOp{CigarOpKind::kSoftClip, f.bases.size(), f.bases.size()};
            } else if constexpr (std::is_same_v<T, feature::Deletion>) {
                return FeatureOp{CigarOpKind::kDeletion, f.length, 0};
            } else if constexpr (std::is_same_v<T, feature::ReferenceSkip>) {
                return FeatureOp{CigarOpKind::kSkip, f.length, 0};
            } else if constexpr (std::is_same_v<T, feature::Padding>) {
                return FeatureOp{CigarOpKind::kPadding, f.length, 0};
            } else if constexpr (std::is_same_v<T, feature::HardClip>) {
                return FeatureOp{CigarOpKind::kHardClip, f.length, 0};
            } else {
                // Scores and QualityScore only carry quality data.
                return std::nullopt;
            }
        },
        feature);
}

}  // namespace

Result<Cigar> featuresToCigar(std::span<const Feature> features, std::size_t readLength) {
    Cigar cigar;
    // Next read position (1-based) not yet covered by an op.
    std::uint64_t readPosition = 1;
    const std::uint64_t end = static_cast<std::uint64_t>(readLength) + 1;

    for (const auto& feature : features) {
        const auto position = static_cast<std::uint64_t>(featurePosition(feature));
        if (position == 0 || position > end) {
            return makeError<Cigar>(
                ErrorCode::kInvalidData,
                fmt::format("{} feature at position {} outside read of length {}",
                            featureCodeToString(featureCode(feature)), position, readLength));
        }

        const auto op = toOp(feature);
        if (!op.has_value()) {
            continue;
        }

        if (position < readPosition) {
            if (op->readBases > 0) {
                return makeError<Cigar>(
                    ErrorCode::kInvalidData,
                    fmt::format("{} feature at position {} overlaps the previous feature",
                                featureCodeToString(featureCode(feature)), position));
            }
        } else {
            push(cigar, CigarOpKind::kMatch, position - readPosition);
            readPosition = position;
        }

        push(cigar, op->kind, op->length);
        readPosition += op->readBases;

        if (readPosition > end) {
            return makeError<Cigar>(
                ErrorCode::kInvalidData,
                fmt::format("{} feature at position {} runs past read length {}",
                            featureCodeToString(featureCode(feature)), position, readLength));
        }
    }

    push(cigar, CigarOpKind::kMatch, end - readPosition);
    return cigar;
}

std::string cigarToString(const Cigar& cigar) {
    if (cigar.empty()) {
        return "*";
    }
    std::string out;
    for (const auto& op : cigar) {
        out += fmt::format("{}{}", op.length, cigarOpKindToChar(op.kind));
    }
    return out;
}

}  // namespace cramdec::record
