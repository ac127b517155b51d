// =============================================================================
// cramdec - Byte Array Codec Implementation
// =============================================================================

#include <algorithm>
#include <limits>

#include <fmt/format.h>

#include "cramdec/codec/encoding.h"

namespace cramdec::codec::detail {

CodecId codecId(const ByteArrayCodec& codec) noexcept {
    return std::holds_alternative<byte_array::ByteArrayLength>(codec) ? CodecId::kByteArrayLength
                                                                      : CodecId::kByteArrayStop;
}

Result<HuffmanTable> prepare(const ByteArrayCodec& /*codec*/) {
    // Nested encodings are validated when they are created.
    return HuffmanTable{};
}

VoidResult decodeInto(const ByteArrayCodec& codec,
                      io::BitReader& core,
                      io::ExternalDataReaders& external,
                      ByteBuffer& out) {
    if (const auto* stop = std::get_if<byte_array::ByteArrayStop>(&codec)) {
        auto reader = external.get(stop->contentId);
        if (!reader) {
            return std::unexpected(std::move(reader).error());
        }
        auto bytes = (*reader)->readUntil(stop->stopByte);
        if (!bytes) {
            return std::unexpected(std::move(bytes).error());
        }
        out.assign(bytes->begin(), bytes->end());
        return makeVoidSuccess();
    }

    const auto& length = std::get<byte_array::ByteArrayLength>(codec);
    auto len = length.lenEncoding.decode(core, external);
    if (!len) {
        return std::unexpected(std::move(len).error());
    }
    if (*len < 0) {
        return makeVoidError(ErrorCode::kInvalidData,
                             fmt::format("negative byte array length {}", *len));
    }
    return length.valueEncoding.decodeTake(core, external, static_cast<std::size_t>(*len), out);
}

Result<ByteBuffer> decode(const ByteArrayCodec& codec,
                          const CanonicalHuffmanDecoder* /*huffman*/,
                          io::BitReader& core,
                          io::ExternalDataReaders& external) {
    ByteBuffer out;
    if (auto status = decodeInto(codec, core, external, out); !status) {
        return std::unexpected(std::move(status).error());
    }
    return out;
}

VoidResult encode(const ByteArrayCodec& codec, io::BitWriter& core,
                  io::ExternalDataWriters& external, const ByteBuffer& value) {
    if (const auto* stop = std::get_if<byte_array::ByteArrayStop>(&codec)) {
        if (std::find(value.begin(), value.end(), stop->stopByte) != value.end()) {
            return makeVoidError(
                ErrorCode::kInvalidData,
                fmt::format("value contains the stop byte 0x{:02x}", stop->stopByte));
        }
        auto& block = external.get(stop->contentId);
        block.insert(block.end(), value.begin(), value.end());
        block.push_back(stop->stopByte);
        return makeVoidSuccess();
    }

    const auto& length = std::get<byte_array::ByteArrayLength>(codec);
    if (value.size() > static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max())) {
        return makeVoidError(ErrorCode::kInvalidData, "byte array too long to encode");
    }
    if (auto status = length.lenEncoding.encode(core, external,
                                                static_cast<std::int32_t>(value.size()));
        !status) {
        return status;
    }
    for (const auto b : value) {
        if (auto status = length.valueEncoding.encode(core, external, b); !status) {
            return status;
        }
    }
    return makeVoidSuccess();
}

}  // namespace cramdec::codec::detail
