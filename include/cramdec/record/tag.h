// =============================================================================
// cramdec - Auxiliary Tags
// =============================================================================
// Tag keys, typed tag values and the parser that turns a decoded tag byte
// string into a value according to the key's declared type.
//
// Value bytes use the BAM binary layout: little-endian integers and floats,
// NUL-terminated strings, and arrays as (subtype, u32 count, elements).
// =============================================================================

#ifndef CRAMDEC_RECORD_TAG_H
#define CRAMDEC_RECORD_TAG_H

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include "cramdec/common/error.h"

namespace cramdec::record {

// =============================================================================
// Tag Key
// =============================================================================

/// @brief Two-character tag plus its one-character value type.
struct TagKey {
    std::array<char, 2> tag{};
    char type = 0;

    /// @brief Tag encoding map key: (tag[0] << 16) | (tag[1] << 8) | type.
    [[nodiscard]] constexpr std::int32_t contentId() const noexcept {
        return (static_cast<std::int32_t>(static_cast<std::uint8_t>(tag[0])) << 16) |
               (static_cast<std::int32_t>(static_cast<std::uint8_t>(tag[1])) << 8) |
               static_cast<std::int32_t>(static_cast<std::uint8_t>(type));
    }

    /// @brief Three-character form, e.g. "NMi".
    [[nodiscard]] std::string toString() const { return std::string{tag[0], tag[1], type}; }

    friend constexpr bool operator==(const TagKey&, const TagKey&) noexcept = default;
};

/// @brief Key with the given tag and type characters.
[[nodiscard]] constexpr TagKey makeTagKey(char a, char b, char type) noexcept {
    return TagKey{{a, b}, type};
}

// =============================================================================
// Tag Value
// =============================================================================

/// @brief 'H' values: hex-encoded byte array kept as text.
struct HexString {
    std::string value;

    friend bool operator==(const HexString&, const HexString&) = default;
};

/// @brief 'B' values.
using TagArray = std::variant<std::vector<std::int8_t>, std::vector<std::uint8_t>,
                              std::vector<std::int16_t>, std::vector<std::uint16_t>,
                              std::vector<std::int32_t>, std::vector<std::uint32_t>,
                              std::vector<float>>;

/// @brief Typed tag value.
/// @note char = 'A', std::string = 'Z'.
using TagValue = std::variant<char, std::int8_t, std::uint8_t, std::int16_t, std::uint16_t,
                              std::int32_t, std::uint32_t, float, std::string, HexString,
                              TagArray>;

/// @brief One decoded tag.
struct Tag {
    TagKey key;
    TagValue value;

    friend bool operator==(const Tag&, const Tag&) = default;
};

/// @brief Parse the bytes of one tag value.
/// @param type Declared value type character.
/// @param data Encoded bytes starting with the value; bytes after it are ignored.
/// @return kUnexpectedEof for short input, kInvalidData for unknown types or
///         an unterminated string.
[[nodiscard]] Result<TagValue> parseTagValue(char type, std::span<const std::uint8_t> data);

}  // namespace cramdec::record

#endif  // CRAMDEC_RECORD_TAG_H
