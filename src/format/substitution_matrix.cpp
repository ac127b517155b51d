// =============================================================================
// cramdec - Substitution Matrix Implementation
// =============================================================================

#include "cramdec/format/substitution_matrix.h"

#include <fmt/format.h>

namespace cramdec::format {

namespace {

constexpr std::array<std::uint8_t, kSubstitutionMatrixSize> kBases = {'A', 'C', 'G', 'T', 'N'};

std::size_t baseIndex(std::uint8_t base) noexcept {
    switch (base) {
        case 'A':
        case 'a':
            return 0;
        case 'C':
        case 'c':
            return 1;
        case 'G':
        case 'g':
            return 2;
        case 'T':
        case 't':
            return 3;
        default:
            return 4;
    }
}

}  // namespace

SubstitutionMatrix::SubstitutionMatrix() noexcept {
    for (std::size_t ref = 0; ref < kSubstitutionMatrixSize; ++ref) {
        std::size_t code = 0;
        for (std::size_t read = 0; read < kSubstitutionMatrixSize; ++read) {
            if (read != ref) {
                table_[ref][code++] = kBases[read];
            }
        }
    }
}

Result<SubstitutionMatrix> SubstitutionMatrix::fromBytes(
    std::span<const std::uint8_t, kSubstitutionMatrixSize> bytes) {
    SubstitutionMatrix matrix;

    for (std::size_t ref = 0; ref < kSubstitutionMatrixSize; ++ref) {
        std::array<bool, 4> assigned{};
        std::size_t slot = 0;
        for (std::size_t read = 0; read < kSubstitutionMatrixSize; ++read) {
            if (read == ref) {
                continue;
            }
            const auto code = static_cast<std::uint8_t>((bytes[ref] >> (6 - 2 * slot)) & 0x03);
            ++slot;
            if (assigned[code]) {
                return makeError<SubstitutionMatrix>(
                    ErrorCode::kInvalidData,
                    fmt::format("substitution matrix row {} reuses code {}",
                                static_cast<char>(kBases[ref]), code));
            }
            assigned[code] = true;
            matrix.table_[ref][code] = kBases[read];
        }
    }

    return matrix;
}

Result<std::uint8_t> SubstitutionMatrix::get(std::uint8_t referenceBase,
                                              std::uint8_t code) const {
    if (code > 3) {
        return makeError<std::uint8_t>(ErrorCode::kInvalidData,
                                       fmt::format("invalid substitution code {}", code));
    }
    return table_[baseIndex(referenceBase)][code];
}

std::array<std::uint8_t, kSubstitutionMatrixSize> SubstitutionMatrix::toBytes() const noexcept {
    std::array<std::uint8_t, kSubstitutionMatrixSize> out{};
    for (std::size_t ref = 0; ref < kSubstitutionMatrixSize; ++ref) {
        std::size_t slot = 0;
        for (std::size_t read = 0; read < kSubstitutionMatrixSize; ++read) {
            if (read == ref) {
                continue;
            }
            for (std::uint8_t code = 0; code < 4; ++code) {
                if (table_[ref][code] == kBases[read]) {
                    out[ref] |= static_cast<std::uint8_t>(code << (6 - 2 * slot));
                }
            }
            ++slot;
        }
    }
    return out;
}

}  // namespace cramdec::format
