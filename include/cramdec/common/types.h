// =============================================================================
// cramdec - Common Type Definitions
// =============================================================================
// Core type aliases, flag constants and the reference sequence context shared
// by every module.
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef CRAMDEC_COMMON_TYPES_H
#define CRAMDEC_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>
#include <vector>

namespace cramdec {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Content id of an external block.
using ContentId = std::int32_t;

/// @brief Sequential record id within a decoding run.
using RecordId = std::uint64_t;

/// @brief 1-based alignment or read position.
/// @note Valid positions are always >= 1.
using Position = std::int32_t;

/// @brief Raw byte buffer.
using ByteBuffer = std::vector<std::uint8_t>;

// =============================================================================
// BAM Flags
// =============================================================================

namespace bam_flags {

inline constexpr std::uint16_t kPaired = 0x0001;
inline constexpr std::uint16_t kProperlyPaired = 0x0002;
inline constexpr std::uint16_t kUnmapped = 0x0004;
inline constexpr std::uint16_t kMateUnmapped = 0x0008;
inline constexpr std::uint16_t kReverseComplemented = 0x0010;
inline constexpr std::uint16_t kMateReverseComplemented = 0x0020;
inline constexpr std::uint16_t kFirstSegment = 0x0040;
inline constexpr std::uint16_t kLastSegment = 0x0080;
inline constexpr std::uint16_t kSecondary = 0x0100;
inline constexpr std::uint16_t kQcFail = 0x0200;
inline constexpr std::uint16_t kDuplicate = 0x0400;
inline constexpr std::uint16_t kSupplementary = 0x0800;

}  // namespace bam_flags

// =============================================================================
// CRAM Record Flags
// =============================================================================

/// @brief Per-record CRAM flags (the CF data series).
class CramFlags {
public:
    static constexpr std::uint8_t kQualityScoresAreStoredAsArray = 0x01;
    static constexpr std::uint8_t kIsDetached = 0x02;
    static constexpr std::uint8_t kMateIsDownstream = 0x04;

    constexpr CramFlags() noexcept = default;
    constexpr explicit CramFlags(std::uint8_t bits) noexcept : bits_(bits) {}

    [[nodiscard]] constexpr std::uint8_t bits() const noexcept { return bits_; }

    [[nodiscard]] constexpr bool qualityScoresAreStoredAsArray() const noexcept {
        return (bits_ & kQualityScoresAreStoredAsArray) != 0;
    }
    [[nodiscard]] constexpr bool isDetached() const noexcept {
        return (bits_ & kIsDetached) != 0;
    }
    [[nodiscard]] constexpr bool mateIsDownstream() const noexcept {
        return (bits_ & kMateIsDownstream) != 0;
    }

    friend constexpr bool operator==(CramFlags, CramFlags) noexcept = default;

private:
    std::uint8_t bits_ = 0;
};

/// @brief Mate flags of a detached record (the MF data series).
class MateFlags {
public:
    static constexpr std::uint8_t kOnNegativeStrand = 0x01;
    static constexpr std::uint8_t kIsUnmapped = 0x02;

    constexpr MateFlags() noexcept = default;
    constexpr explicit MateFlags(std::uint8_t bits) noexcept : bits_(bits) {}

    [[nodiscard]] constexpr std::uint8_t bits() const noexcept { return bits_; }
    [[nodiscard]] constexpr bool isOnNegativeStrand() const noexcept {
        return (bits_ & kOnNegativeStrand) != 0;
    }
    [[nodiscard]] constexpr bool isUnmapped() const noexcept {
        return (bits_ & kIsUnmapped) != 0;
    }

    friend constexpr bool operator==(MateFlags, MateFlags) noexcept = default;

private:
    std::uint8_t bits_ = 0;
};

// =============================================================================
// Reference Sequence Context
// =============================================================================

/// @brief How a slice binds its records to reference sequences.
enum class ReferenceContextKind : std::uint8_t {
    /// @brief All records map to one reference sequence.
    kSome = 0,
    /// @brief All records are unplaced.
    kNone = 1,
    /// @brief Each record carries its own reference id (RI series).
    kMany = 2
};

/// @brief Slice-level reference context supplied by the slice header.
struct ReferenceSequenceContext {
    ReferenceContextKind kind = ReferenceContextKind::kNone;

    /// @brief Reference sequence id, meaningful for kSome.
    std::size_t referenceSequenceId = 0;

    /// @brief Slice alignment start, meaningful for kSome.
    Position alignmentStart = 0;

    [[nodiscard]] static constexpr ReferenceSequenceContext some(std::size_t id,
                                                                 Position start) noexcept {
        return ReferenceSequenceContext{ReferenceContextKind::kSome, id, start};
    }
    [[nodiscard]] static constexpr ReferenceSequenceContext none() noexcept {
        return ReferenceSequenceContext{ReferenceContextKind::kNone, 0, 0};
    }
    [[nodiscard]] static constexpr ReferenceSequenceContext many() noexcept {
        return ReferenceSequenceContext{ReferenceContextKind::kMany, 0, 0};
    }
};

// =============================================================================
// Constants
// =============================================================================

/// @brief Raw reference/read-group id meaning "none".
inline constexpr std::int32_t kMissingId = -1;

/// @brief Mapping quality meaning "unavailable".
inline constexpr std::uint8_t kMissingMappingQuality = 0xFF;

/// @brief Quality byte meaning "no quality stored".
inline constexpr std::uint8_t kMissingQualityScore = 0xFF;

[[nodiscard]] constexpr std::string_view referenceContextKindToString(
    ReferenceContextKind kind) noexcept {
    switch (kind) {
        case ReferenceContextKind::kSome:
            return "some";
        case ReferenceContextKind::kNone:
            return "none";
        case ReferenceContextKind::kMany:
            return "many";
    }
    return "unknown";
}

}  // namespace cramdec

#endif  // CRAMDEC_COMMON_TYPES_H
