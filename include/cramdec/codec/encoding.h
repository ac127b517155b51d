// =============================================================================
// cramdec - Entropy Codec Set
// =============================================================================
// Closed sets of codec variants for the three data series value kinds, and the
// Encoding<C> wrapper that pairs a codec with its prebuilt decode state.
//
// - IntegerCodec:   External, Golomb, Huffman, Beta, Subexp, GolombRice, Gamma
// - ByteCodec:      External, Huffman
// - ByteArrayCodec: ByteArrayLength, ByteArrayStop
//
// Every variant shares one contract: decode(core, external) -> value. Core
// encoded codecs read bits from the shared core stream, External codecs read
// from the external block selected by their content id.
//
// Golomb and GolombRice exist so compression headers that declare them parse,
// but decoding them reports kNotImplemented.
// =============================================================================

#ifndef CRAMDEC_CODEC_ENCODING_H
#define CRAMDEC_CODEC_ENCODING_H

#include <concepts>
#include <cstdint>
#include <memory>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "cramdec/codec/huffman.h"
#include "cramdec/common/error.h"
#include "cramdec/common/types.h"
#include "cramdec/io/bit_reader.h"
#include "cramdec/io/external_data.h"

namespace cramdec::codec {

// =============================================================================
// Codec Identifiers
// =============================================================================

/// @brief Codec ids as stored in encoding descriptors.
enum class CodecId : std::int32_t {
    kNull = 0,
    kExternal = 1,
    kGolomb = 2,
    kHuffman = 3,
    kByteArrayLength = 4,
    kByteArrayStop = 5,
    kBeta = 6,
    kSubexp = 7,
    kGolombRice = 8,
    kGamma = 9
};

[[nodiscard]] constexpr std::string_view codecIdToString(CodecId id) noexcept {
    switch (id) {
        case CodecId::kNull:
            return "null";
        case CodecId::kExternal:
            return "external";
        case CodecId::kGolomb:
            return "golomb";
        case CodecId::kHuffman:
            return "huffman";
        case CodecId::kByteArrayLength:
            return "byte array length";
        case CodecId::kByteArrayStop:
            return "byte array stop";
        case CodecId::kBeta:
            return "beta";
        case CodecId::kSubexp:
            return "subexp";
        case CodecId::kGolombRice:
            return "golomb-rice";
        case CodecId::kGamma:
            return "gamma";
    }
    return "unknown";
}

// =============================================================================
// Integer Codecs
// =============================================================================

namespace integer {

/// @brief ITF8 values from an external block.
struct External {
    ContentId contentId = 0;
};

struct Golomb {
    std::int32_t offset = 0;
    std::int32_t m = 0;
};

/// @brief Canonical Huffman over an alphabet of integers.
struct Huffman {
    std::vector<std::int32_t> alphabet;
    std::vector<std::uint32_t> bitLens;
};

/// @brief Fixed-width binary: value = bits(len) - offset.
struct Beta {
    std::int32_t offset = 0;
    std::uint32_t len = 0;
};

/// @brief Subexponential code with order k.
struct Subexp {
    std::int32_t offset = 0;
    std::int32_t k = 0;
};

struct GolombRice {
    std::int32_t offset = 0;
    std::int32_t log2M = 0;
};

/// @brief Elias gamma: value = (1 << n) + bits(n) - offset after n zero bits and a one bit.
struct Gamma {
    std::int32_t offset = 0;
};

}  // namespace integer

using IntegerCodec = std::variant<integer::External, integer::Golomb, integer::Huffman,
                                  integer::Beta, integer::Subexp, integer::GolombRice,
                                  integer::Gamma>;

// =============================================================================
// Byte Codecs
// =============================================================================

namespace byte {

/// @brief Raw bytes from an external block.
struct External {
    ContentId contentId = 0;
};

/// @brief Canonical Huffman over byte symbols.
struct Huffman {
    std::vector<std::int32_t> alphabet;
    std::vector<std::uint32_t> bitLens;
};

}  // namespace byte

using ByteCodec = std::variant<byte::External, byte::Huffman>;

// =============================================================================
// Byte Array Codecs (forward declarations)
// =============================================================================

namespace byte_array {
struct ByteArrayLength;
struct ByteArrayStop;
}  // namespace byte_array

using ByteArrayCodec = std::variant<byte_array::ByteArrayLength, byte_array::ByteArrayStop>;

// =============================================================================
// Codec Dispatch
// =============================================================================

/// @brief Decoded value type per codec set.
template <typename C>
struct CodecValue;

template <>
struct CodecValue<IntegerCodec> {
    using type = std::int32_t;
};

template <>
struct CodecValue<ByteCodec> {
    using type = std::uint8_t;
};

template <>
struct CodecValue<ByteArrayCodec> {
    using type = ByteBuffer;
};

namespace detail {

using HuffmanTable = std::shared_ptr<const CanonicalHuffmanDecoder>;

[[nodiscard]] CodecId codecId(const IntegerCodec& codec) noexcept;
[[nodiscard]] CodecId codecId(const ByteCodec& codec) noexcept;
[[nodiscard]] CodecId codecId(const ByteArrayCodec& codec) noexcept;

/// @brief Validate parameters and build the Huffman table, if any.
[[nodiscard]] Result<HuffmanTable> prepare(const IntegerCodec& codec);
[[nodiscard]] Result<HuffmanTable> prepare(const ByteCodec& codec);
[[nodiscard]] Result<HuffmanTable> prepare(const ByteArrayCodec& codec);

[[nodiscard]] Result<std::int32_t> decode(const IntegerCodec& codec,
                                          const CanonicalHuffmanDecoder* huffman,
                                          io::BitReader& core,
                                          io::ExternalDataReaders& external);
[[nodiscard]] Result<std::uint8_t> decode(const ByteCodec& codec,
                                          const CanonicalHuffmanDecoder* huffman,
                                          io::BitReader& core,
                                          io::ExternalDataReaders& external);
[[nodiscard]] Result<ByteBuffer> decode(const ByteArrayCodec& codec,
                                        const CanonicalHuffmanDecoder* huffman,
                                        io::BitReader& core,
                                        io::ExternalDataReaders& external);

/// @brief Decode @p count bytes into @p out (replacing its contents).
[[nodiscard]] VoidResult decodeTake(const ByteCodec& codec,
                                    const CanonicalHuffmanDecoder* huffman,
                                    io::BitReader& core,
                                    io::ExternalDataReaders& external,
                                    std::size_t count,
                                    ByteBuffer& out);

/// @brief Decode one byte string into @p out (replacing its contents).
[[nodiscard]] VoidResult decodeInto(const ByteArrayCodec& codec,
                                    io::BitReader& core,
                                    io::ExternalDataReaders& external,
                                    ByteBuffer& out);

[[nodiscard]] VoidResult encode(const IntegerCodec& codec, io::BitWriter& core,
                                io::ExternalDataWriters& external, std::int32_t value);
[[nodiscard]] VoidResult encode(const ByteCodec& codec, io::BitWriter& core,
                                io::ExternalDataWriters& external, std::uint8_t value);
[[nodiscard]] VoidResult encode(const ByteArrayCodec& codec, io::BitWriter& core,
                                io::ExternalDataWriters& external, const ByteBuffer& value);

}  // namespace detail

// =============================================================================
// Encoding
// =============================================================================

/// @brief Immutable codec plus its prebuilt decode state.
/// @tparam C IntegerCodec, ByteCodec or ByteArrayCodec.
/// @note Copies share the Huffman table; an Encoding is safe to use from
///       several threads at once.
template <typename C>
class Encoding {
public:
    using Codec = C;
    using Value = typename CodecValue<C>::type;

    /// @brief Validate @p codec and build its decode state.
    /// @return kInvalidData for an invalid Huffman table or codec parameters.
    [[nodiscard]] static Result<Encoding> create(C codec) {
        auto table = detail::prepare(codec);
        if (!table) {
            return std::unexpected(std::move(table).error());
        }
        return Encoding(std::move(codec), std::move(*table));
    }

    [[nodiscard]] const C& codec() const noexcept { return codec_; }

    [[nodiscard]] CodecId codecId() const noexcept { return detail::codecId(codec_); }

    /// @brief Decode one value.
    [[nodiscard]] Result<Value> decode(io::BitReader& core,
                                       io::ExternalDataReaders& external) const {
        return detail::decode(codec_, huffman_.get(), core, external);
    }

    /// @brief Decode @p count bytes into @p out.
    [[nodiscard]] VoidResult decodeTake(io::BitReader& core,
                                        io::ExternalDataReaders& external,
                                        std::size_t count,
                                        ByteBuffer& out) const
        requires std::same_as<C, ByteCodec>
    {
        return detail::decodeTake(codec_, huffman_.get(), core, external, count, out);
    }

    /// @brief Decode one byte string into @p out, reusing its storage.
    [[nodiscard]] VoidResult decodeInto(io::BitReader& core,
                                        io::ExternalDataReaders& external,
                                        ByteBuffer& out) const
        requires std::same_as<C, ByteArrayCodec>
    {
        return detail::decodeInto(codec_, core, external, out);
    }

    /// @brief Encode one value.
    /// @return kNotImplemented for codecs without an encoder.
    [[nodiscard]] VoidResult encode(io::BitWriter& core,
                                    io::ExternalDataWriters& external,
                                    const Value& value) const {
        return detail::encode(codec_, core, external, value);
    }

private:
    Encoding(C codec, detail::HuffmanTable huffman)
        : codec_(std::move(codec)), huffman_(std::move(huffman)) {}

    C codec_;
    detail::HuffmanTable huffman_;
};

using IntegerEncoding = Encoding<IntegerCodec>;
using ByteEncoding = Encoding<ByteCodec>;
using ByteArrayEncoding = Encoding<ByteArrayCodec>;

// =============================================================================
// Byte Array Codecs
// =============================================================================

namespace byte_array {

/// @brief Length from an integer encoding, then that many bytes from a byte encoding.
struct ByteArrayLength {
    IntegerEncoding lenEncoding;
    ByteEncoding valueEncoding;
};

/// @brief External bytes up to a stop byte.
struct ByteArrayStop {
    std::uint8_t stopByte = 0;
    ContentId contentId = 0;
};

}  // namespace byte_array

}  // namespace cramdec::codec

#endif  // CRAMDEC_CODEC_ENCODING_H
