// =============================================================================
// cramdec - Canonical Huffman Decoder
// =============================================================================
// Canonical Huffman code table built from (alphabet, bit length) pairs.
//
// Codes are assigned in (length, symbol) order: the first code is 0, each
// following code is the previous one plus 1, left-shifted by the length
// increase. Decoding reads one bit at a time from the core stream until the
// accumulated prefix matches a code of the current length.
//
// A single-symbol alphabet decodes without consuming bits.
// =============================================================================

#ifndef CRAMDEC_CODEC_HUFFMAN_H
#define CRAMDEC_CODEC_HUFFMAN_H

#include <cstdint>
#include <vector>

#include "cramdec/common/error.h"
#include "cramdec/io/bit_reader.h"

namespace cramdec::codec {

/// @brief Longest code length accepted.
inline constexpr std::uint32_t kMaxHuffmanCodeLength = 31;

/// @brief One (symbol, length, code) row of the canonical table.
struct HuffmanCode {
    std::int32_t symbol = 0;
    std::uint32_t length = 0;
    std::uint32_t code = 0;
};

/// @brief Canonical Huffman table, immutable once built.
class CanonicalHuffmanDecoder {
public:
    /// @brief Build the table.
    /// @param alphabet Symbols.
    /// @param bitLengths Code length per symbol, parallel to @p alphabet.
    /// @return kInvalidData for an empty alphabet, mismatched sizes, duplicate
    ///         symbols, zero or oversized lengths in a multi-symbol alphabet,
    ///         or lengths that over-subscribe the code space.
    [[nodiscard]] static Result<CanonicalHuffmanDecoder> build(
        const std::vector<std::int32_t>& alphabet, const std::vector<std::uint32_t>& bitLengths);

    /// @brief Decode one symbol from the core stream.
    [[nodiscard]] Result<std::int32_t> decode(io::BitReader& reader) const;

    /// @brief Table rows in canonical order.
    [[nodiscard]] const std::vector<HuffmanCode>& codes() const noexcept { return codes_; }

    [[nodiscard]] bool isSingleton() const noexcept { return codes_.size() == 1; }

private:
    CanonicalHuffmanDecoder() = default;

    std::vector<HuffmanCode> codes_;

    // Per length L: first canonical code, count of codes and index of the
    // first row with that length.
    std::vector<std::uint32_t> firstCode_;
    std::vector<std::uint32_t> count_;
    std::vector<std::uint32_t> firstIndex_;
    std::uint32_t maxLength_ = 0;
};

}  // namespace cramdec::codec

#endif  // CRAMDEC_CODEC_HUFFMAN_H
