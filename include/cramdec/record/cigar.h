// =============================================================================
// cramdec - CIGAR Conversion
// =============================================================================
// Builds the CIGAR of a mapped record from its read features. CRAM does not
// store matches: every read position not covered by a feature is an alignment
// match.
// =============================================================================

#ifndef CRAMDEC_RECORD_CIGAR_H
#define CRAMDEC_RECORD_CIGAR_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "cramdec/common/error.h"
#include "cramdec/record/feature.h"

namespace cramdec::record {

enum class CigarOpKind : std::uint8_t {
    kMatch = 0,     ///< M
    kInsertion,     ///< I
    kDeletion,      ///< D
    kSkip,          ///< N
    kSoftClip,      ///< S
    kHardClip,      ///< H
    kPadding        ///< P
};

struct CigarOp {
    CigarOpKind kind = CigarOpKind::kMatch;
    std::uint32_t length = 0;

    friend bool operator==(const CigarOp&, const CigarOp&) = default;
};

using Cigar = std::vector<CigarOp>;

[[nodiscard]] constexpr char cigarOpKindToChar(CigarOpKind kind) noexcept {
    switch (kind) {
        case CigarOpKind::kMatch:
            return 'M';
        case CigarOpKind::kInsertion:
            return 'I';
        case CigarOpKind::kDeletion:
            return 'D';
        case CigarOpKind::kSkip:
            return 'N';
        case CigarOpKind::kSoftClip:
            return 'S';
        case CigarOpKind::kHardClip:
            return 'H';
        case CigarOpKind::kPadding:
            return 'P';
    }
    return '?';
}

/// @brief CIGAR of a mapped record.
/// @param features Features in read order.
/// @param readLength Record read length.
/// @return kInvalidData if features overlap or run past the read length.
[[nodiscard]] Result<Cigar> featuresToCigar(std::span<const Feature> features,
                                            std::size_t readLength);

/// @brief SAM text form, "*" for an empty CIGAR.
[[nodiscard]] std::string cigarToString(const Cigar& cigar);

}  // namespace cramdec::record

#endif  // CRAMDEC_RECORD_CIGAR_H
