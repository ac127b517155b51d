// =============================================================================
// cramdec - Integer Codec Implementation
// =============================================================================

#include <bit>
#include <limits>
#include <type_traits>

#include <fmt/format.h>

#include "cramdec/codec/encoding.h"
#include "cramdec/io/byte_reader.h"

namespace cramdec::codec::detail {

namespace {

/// @brief Longest run of unary prefix bits accepted by Gamma and Subexp.
constexpr std::uint32_t kMaxPrefixBits = 32;

Result<std::int32_t> narrow(std::int64_t value, std::string_view codecName) {
    if (value < std::numeric_limits<std::int32_t>::min() ||
        value > std::numeric_limits<std::int32_t>::max()) {
        return makeError<std::int32_t>(
            ErrorCode::kInvalidData,
            fmt::format("{} value {} does not fit in 32 bits", codecName, value));
    }
    return static_cast<std::int32_t>(value);
}

Result<std::int32_t> decodeExternal(const integer::External& codec,
                                    io::ExternalDataReaders& external) {
    auto reader = external.get(codec.contentId);
    if (!reader) {
        return std::unexpected(std::move(reader).error());
    }
    return (*reader)->readItf8();
}

Result<std::int32_t> decodeBeta(const integer::Beta& codec, io::BitReader& core) {
    auto bits = core.readBits(codec.len);
    if (!bits) {
        return std::unexpected(std::move(bits).error());
    }
    return narrow(static_cast<std::int64_t>(*bits) - codec.offset, "beta");
}

Result<std::int32_t> decodeGamma(const integer::Gamma& codec, io::BitReader& core) {
    // n zero bits, then the terminating one bit.
    std::uint32_t n = 0;
    while (true) {
        auto bit = core.readBit();
        if (!bit) {
            return std::unexpected(std::move(bit).error());
        }
        if (*bit == 1) {
            break;
        }
        if (++n >= kMaxPrefixBits) {
            return makeError<std::int32_t>(ErrorCode::kInvalidData, "gamma prefix too long");
        }
    }

    auto m = core.readBits(n);
    if (!m) {
        return std::unexpected(std::move(m).error());
    }
    const std::int64_t value = (std::int64_t{1} << n) + *m;
    return narrow(value - codec.offset, "gamma");
}

Result<std::int32_t> decodeSubexp(const integer::Subexp& codec, io::BitReader& core) {
    // i one bits, then the terminating zero bit.
    std::uint32_t i = 0;
    while (true) {
        auto bit = core.readBit();
        if (!bit) {
            return std::unexpected(std::move(bit).error());
        }
        if (*bit == 0) {
            break;
        }
        if (++i >= kMaxPrefixBits) {
            return makeError<std::int32_t>(ErrorCode::kInvalidData, "subexp prefix too long");
        }
    }

    const std::int64_t b = i == 0 ? codec.k : static_cast<std::int64_t>(i) + codec.k - 1;
    if (b < 0 || b > 31) {
        return makeError<std::int32_t>(ErrorCode::kInvalidData,
                                       fmt::format("subexp width {} out of range", b));
    }

    auto n = core.readBits(static_cast<std::uint32_t>(b));
    if (!n) {
        return std::unexpected(std::move(n).error());
    }
    std::int64_t value = *n;
    if (i != 0) {
        value += std::int64_t{1} << b;
    }
    return narrow(value - codec.offset, "subexp");
}

}  // namespace

// =============================================================================
// Identification and Preparation
// =============================================================================

CodecId codecId(const IntegerCodec& codec) noexcept {
    return std::visit(
        [](const auto& c) -> CodecId {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, integer::External>) {
                return CodecId::kExternal;
            } else if constexpr (std::is_same_v<T, integer::Golomb>) {
                return CodecId::kGolomb;
            } else if constexpr (std::is_same_v<T, integer::Huffman>) {
                return CodecId::kHuffman;
            } else if constexpr (std::is_same_v<T, integer::Beta>) {
                return CodecId::kBeta;
            } else if constexpr (std::is_same_v<T, integer::Subexp>) {
                return CodecId::kSubexp;
            } else if constexpr (std::is_same_v<T, integer::GolombRice>) {
                return CodecId::kGolombRice;
            } else {
                return CodecId::kGamma;
            }
        },
        codec);
}

Result<HuffmanTable> prepare(const IntegerCodec& codec) {
    if (const auto* huffman = std::get_if<integer::Huffman>(&codec)) {
        auto table = CanonicalHuffmanDecoder::build(huffman->alphabet, huffman->bitLens);
        if (!table) {
            return std::unexpected(std::move(table).error());
        }
        return std::make_shared<const CanonicalHuffmanDecoder>(std::move(*table));
    }
    if (const auto* beta = std::get_if<integer::Beta>(&codec); beta != nullptr && beta->len > 32) {
        return makeError<HuffmanTable>(ErrorCode::kInvalidData,
                                       fmt::format("beta length {} exceeds 32 bits", beta->len));
    }
    if (const auto* subexp = std::get_if<integer::Subexp>(&codec);
        subexp != nullptr && subexp->k < 0) {
        return makeError<HuffmanTable>(ErrorCode::kInvalidData,
                                       fmt::format("subexp order {} is negative", subexp->k));
    }
    return HuffmanTable{};
}

// =============================================================================
// Decode
// =============================================================================

Result<std::int32_t> decode(const IntegerCodec& codec,
                            const CanonicalHuffmanDecoder* huffman,
                            io::BitReader& core,
                            io::ExternalDataReaders& external) {
    return std::visit(
        [&](const auto& c) -> Result<std::int32_t> {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, integer::External>) {
                return decodeExternal(c, external);
            } else if constexpr (std::is_same_v<T, integer::Huffman>) {
                return huffman->decode(core);
            } else if constexpr (std::is_same_v<T, integer::Beta>) {
                return decodeBeta(c, core);
            } else if constexpr (std::is_same_v<T, integer::Gamma>) {
                return decodeGamma(c, core);
            } else if constexpr (std::is_same_v<T, integer::Subexp>) {
                return decodeSubexp(c, core);
            } else {
                return makeError<std::int32_t>(
                    ErrorCode::kNotImplemented,
                    fmt::format("{} decoding is not implemented",
                                codecIdToString(codecId(IntegerCodec{c}))));
            }
        },
        codec);
}

// =============================================================================
// Encode
// =============================================================================

VoidResult encode(const IntegerCodec& codec, io::BitWriter& core,
                  io::ExternalDataWriters& external, std::int32_t value) {
    return std::visit(
        [&](const auto& c) -> VoidResult {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, integer::External>) {
                io::writeItf8(external.get(c.contentId), value);
                return makeVoidSuccess();
            } else if constexpr (std::is_same_v<T, integer::Beta>) {
                const std::int64_t raw = static_cast<std::int64_t>(value) + c.offset;
                if (raw < 0 || raw > std::numeric_limits<std::uint32_t>::max()) {
                    return makeVoidError(ErrorCode::kInvalidData,
                                         fmt::format("beta cannot encode {}", value));
                }
                return core.writeBits(static_cast<std::uint32_t>(raw), c.len);
            } else if constexpr (std::is_same_v<T, integer::Gamma>) {
                const std::int64_t raw = static_cast<std::int64_t>(value) + c.offset;
                if (raw < 1 || raw > std::numeric_limits<std::uint32_t>::max()) {
                    return makeVoidError(ErrorCode::kInvalidData,
                                         fmt::format("gamma cannot encode {}", value));
                }
                const auto x = static_cast<std::uint32_t>(raw);
                const auto n = static_cast<std::uint32_t>(std::bit_width(x) - 1);
                for (std::uint32_t i = 0; i < n; ++i) {
                    core.writeBit(false);
                }
                core.writeBit(true);
                return core.writeBits(static_cast<std::uint32_t>(x & ((std::uint64_t{1} << n) - 1)), n);
            } else {
                return makeVoidError(
                    ErrorCode::kNotImplemented,
                    fmt::format("{} encoding is not implemented",
                                codecIdToString(codecId(IntegerCodec{c}))));
            }
        },
        codec);
}

}  // namespace cramdec::codec::detail
