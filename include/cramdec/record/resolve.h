// =============================================================================
// cramdec - Read Base Resolution
// =============================================================================
// Rebuilds the read bases of a mapped record from the reference sequence and
// the record's features. The reference is supplied by the caller; this
// library never loads reference files.
// =============================================================================

#ifndef CRAMDEC_RECORD_RESOLVE_H
#define CRAMDEC_RECORD_RESOLVE_H

#include <cstddef>
#include <cstdint>
#include <span>

#include "cramdec/common/error.h"
#include "cramdec/common/types.h"
#include "cramdec/format/substitution_matrix.h"
#include "cramdec/record/feature.h"

namespace cramdec::record {

/// @brief Read bases of a mapped record.
/// @param reference Reference sequence bases; reference[0] is position 1.
/// @param alignmentStart 1-based alignment start of the record.
/// @param readLength Record read length.
/// @param features Features in read order.
/// @param substitutionMatrix Matrix resolving Substitution features.
/// @return kInvalidData if the read runs off the reference or the features do
///         not add up to @p readLength.
[[nodiscard]] Result<ByteBuffer> resolveBases(std::span<const std::uint8_t> reference,
                                              Position alignmentStart,
                                              std::size_t readLength,
                                              std::span<const Feature> features,
                                              const format::SubstitutionMatrix& substitutionMatrix);

}  // namespace cramdec::record

#endif  // CRAMDEC_RECORD_RESOLVE_H
