// =============================================================================
// cramdec - Byte Codec Implementation
// =============================================================================

#include <algorithm>
#include <type_traits>

#include <fmt/format.h>

#include "cramdec/codec/encoding.h"

namespace cramdec::codec::detail {

namespace {

Result<std::uint8_t> toByte(std::int32_t symbol) {
    if (symbol < 0 || symbol > 0xFF) {
        return makeError<std::uint8_t>(ErrorCode::kInvalidData,
                                       fmt::format("symbol {} is not a byte", symbol));
    }
    return static_cast<std::uint8_t>(symbol);
}

}  // namespace

CodecId codecId(const ByteCodec& codec) noexcept {
    return std::holds_alternative<byte::External>(codec) ? CodecId::kExternal
                                                         : CodecId::kHuffman;
}

Result<HuffmanTable> prepare(const ByteCodec& codec) {
    const auto* huffman = std::get_if<byte::Huffman>(&codec);
    if (huffman == nullptr) {
        return HuffmanTable{};
    }

    for (const auto symbol : huffman->alphabet) {
        if (auto valid = toByte(symbol); !valid) {
            return std::unexpected(std::move(valid).error());
        }
    }

    auto table = CanonicalHuffmanDecoder::build(huffman->alphabet, huffman->bitLens);
    if (!table) {
        return std::unexpected(std::move(table).error());
    }
    return std::make_shared<const CanonicalHuffmanDecoder>(std::move(*table));
}

Result<std::uint8_t> decode(const ByteCodec& codec,
                            const CanonicalHuffmanDecoder* huffman,
                            io::BitReader& core,
                            io::ExternalDataReaders& external) {
    if (const auto* ext = std::get_if<byte::External>(&codec)) {
        auto reader = external.get(ext->contentId);
        if (!reader) {
            return std::unexpected(std::move(reader).error());
        }
        return (*reader)->readU8();
    }

    auto symbol = huffman->decode(core);
    if (!symbol) {
        return std::unexpected(std::move(symbol).error());
    }
    return toByte(*symbol);
}

VoidResult decodeTake(const ByteCodec& codec,
                      const CanonicalHuffmanDecoder* huffman,
                      io::BitReader& core,
                      io::ExternalDataReaders& external,
                      std::size_t count,
                      ByteBuffer& out) {
    if (const auto* ext = std::get_if<byte::External>(&codec)) {
        auto reader = external.get(ext->contentId);
        if (!reader) {
            return std::unexpected(std::move(reader).error());
        }
        auto bytes = (*reader)->readBytes(count);
        if (!bytes) {
            return std::unexpected(std::move(bytes).error());
        }
        out.assign(bytes->begin(), bytes->end());
        return makeVoidSuccess();
    }

    if (huffman->isSingleton()) {
        auto symbol = toByte(huffman->codes().front().symbol);
        if (!symbol) {
            return std::unexpected(std::move(symbol).error());
        }
        out.assign(count, *symbol);
        return makeVoidSuccess();
    }

    out.clear();
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        auto symbol = huffman->decode(core);
        if (!symbol) {
            return std::unexpected(std::move(symbol).error());
        }
        auto value = toByte(*symbol);
        if (!value) {
            return std::unexpected(std::move(value).error());
        }
        out.push_back(*value);
    }
    return makeVoidSuccess();
}

VoidResult encode(const ByteCodec& codec, io::BitWriter& /*core*/,
                  io::ExternalDataWriters& external, std::uint8_t value) {
    if (const auto* ext = std::get_if<byte::External>(&codec)) {
        external.get(ext->contentId).push_back(value);
        return makeVoidSuccess();
    }
    return makeVoidError(ErrorCode::kNotImplemented, "huffman encoding is not implemented");
}

}  // namespace cramdec::codec::detail
