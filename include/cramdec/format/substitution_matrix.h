// =============================================================================
// cramdec - Substitution Matrix
// =============================================================================
// Maps (reference base, 2-bit substitution code) to the read base of an 'X'
// feature. Stored as five bytes, one per reference base in ACGTN order; each
// byte packs the codes of the four other bases (in ACGTN order) two bits at a
// time, high bits first.
// =============================================================================

#ifndef CRAMDEC_FORMAT_SUBSTITUTION_MATRIX_H
#define CRAMDEC_FORMAT_SUBSTITUTION_MATRIX_H

#include <array>
#include <cstdint>
#include <span>

#include "cramdec/common/error.h"

namespace cramdec::format {

/// @brief Encoded size of a substitution matrix.
inline constexpr std::size_t kSubstitutionMatrixSize = 5;

class SubstitutionMatrix {
public:
    /// @brief Matrix where codes 0..3 name the other bases in ACGTN order (every byte 0x1B).
    SubstitutionMatrix() noexcept;

    /// @brief Parse the five encoded bytes.
    /// @return kInvalidData if a row assigns one code to two bases.
    [[nodiscard]] static Result<SubstitutionMatrix> fromBytes(
        std::span<const std::uint8_t, kSubstitutionMatrixSize> bytes);

    /// @brief Read base for @p referenceBase and @p code.
    /// @param referenceBase Reference base; anything outside ACGT (either case) counts as N.
    /// @return kInvalidData for a code above 3.
    [[nodiscard]] Result<std::uint8_t> get(std::uint8_t referenceBase, std::uint8_t code) const;

    /// @brief Encoded form.
    [[nodiscard]] std::array<std::uint8_t, kSubstitutionMatrixSize> toBytes() const noexcept;

private:
    // table_[reference index][code] = read base.
    std::array<std::array<std::uint8_t, 4>, kSubstitutionMatrixSize> table_{};
};

}  // namespace cramdec::format

#endif  // CRAMDEC_FORMAT_SUBSTITUTION_MATRIX_H
