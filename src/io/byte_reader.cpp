// =============================================================================
// cramdec - External Data Byte Cursor Implementation
// =============================================================================

#include "cramdec/io/byte_reader.h"

#include <algorithm>
#include <array>
#include <bit>

#include <fmt/format.h>

namespace cramdec::io {

namespace {

/// @brief Value bits of the first ITF8 byte, indexed by extra byte count.
constexpr std::array<std::uint8_t, 5> kItf8FirstByteMask = {0x7F, 0x3F, 0x1F, 0x0F, 0x0F};

}  // namespace

// =============================================================================
// ByteReader Implementation
// =============================================================================

Result<std::uint8_t> ByteReader::readU8() {
    if (pos_ >= data_.size()) {
        return makeError<std::uint8_t>(ErrorCode::kUnexpectedEof, "external data exhausted");
    }
    return data_[pos_++];
}

Result<std::span<const std::uint8_t>> ByteReader::readBytes(std::size_t count) {
    if (count > remaining()) {
        return makeError<std::span<const std::uint8_t>>(
            ErrorCode::kUnexpectedEof,
            fmt::format("external data exhausted: need {} bytes, {} left", count, remaining()));
    }
    auto out = data_.subspan(pos_, count);
    pos_ += count;
    return out;
}

Result<std::span<const std::uint8_t>> ByteReader::readUntil(std::uint8_t stop) {
    const auto rest = data_.subspan(pos_);
    const auto it = std::find(rest.begin(), rest.end(), stop);
    if (it == rest.end()) {
        return makeError<std::span<const std::uint8_t>>(
            ErrorCode::kUnexpectedEof,
            fmt::format("stop byte 0x{:02x} not found in external data", stop));
    }
    const auto length = static_cast<std::size_t>(it - rest.begin());
    pos_ += length + 1;
    return rest.first(length);
}

Result<std::int32_t> ByteReader::readItf8() {
    auto first = readU8();
    if (!first) {
        return std::unexpected(first.error());
    }

    const int extra = std::countl_one(static_cast<std::uint8_t>(*first & 0xF0));
    if (static_cast<std::size_t>(extra) > remaining()) {
        return makeError<std::int32_t>(ErrorCode::kUnexpectedEof, "truncated ITF8 value");
    }

    auto value = static_cast<std::uint32_t>(*first & kItf8FirstByteMask[extra]);
    for (int i = 1; i < extra; ++i) {
        value = (value << 8) | data_[pos_++];
    }
    if (extra == 4) {
        value = (value << 4) | (data_[pos_++] & 0x0F);
    } else if (extra > 0) {
        value = (value << 8) | data_[pos_++];
    }
    return static_cast<std::int32_t>(value);
}

Result<std::int64_t> ByteReader::readLtf8() {
    auto first = readU8();
    if (!first) {
        return std::unexpected(first.error());
    }

    const int extra = std::countl_one(*first);
    if (static_cast<std::size_t>(extra) > remaining()) {
        return makeError<std::int64_t>(ErrorCode::kUnexpectedEof, "truncated LTF8 value");
    }

    // With 7 or 8 leading ones the first byte carries no value bits.
    std::uint64_t value = extra >= 7 ? 0 : (*first & (0xFFU >> (extra + 1)));
    for (int i = 0; i < extra; ++i) {
        value = (value << 8) | data_[pos_++];
    }
    return static_cast<std::int64_t>(value);
}

// =============================================================================
// Variable-Length Integer Encoding
// =============================================================================

std::size_t itf8Size(std::int32_t value) noexcept {
    const auto v = static_cast<std::uint32_t>(value);
    if (v < 0x80U) {
        return 1;
    }
    if (v < 0x4000U) {
        return 2;
    }
    if (v < 0x200000U) {
        return 3;
    }
    if (v < 0x10000000U) {
        return 4;
    }
    return 5;
}

std::size_t writeItf8(std::vector<std::uint8_t>& out, std::int32_t value) {
    const auto v = static_cast<std::uint32_t>(value);
    const std::size_t size = itf8Size(value);
    switch (size) {
        case 1:
            out.push_back(static_cast<std::uint8_t>(v));
            break;
        case 2:
            out.push_back(static_cast<std::uint8_t>(0x80 | (v >> 8)));
            out.push_back(static_cast<std::uint8_t>(v));
            break;
        case 3:
            out.push_back(static_cast<std::uint8_t>(0xC0 | (v >> 16)));
            out.push_back(static_cast<std::uint8_t>(v >> 8));
            out.push_back(static_cast<std::uint8_t>(v));
            break;
        case 4:
            out.push_back(static_cast<std::uint8_t>(0xE0 | (v >> 24)));
            out.push_back(static_cast<std::uint8_t>(v >> 16));
            out.push_back(static_cast<std::uint8_t>(v >> 8));
            out.push_back(static_cast<std::uint8_t>(v));
            break;
        default:
            out.push_back(static_cast<std::uint8_t>(0xF0 | ((v >> 28) & 0x0F)));
            out.push_back(static_cast<std::uint8_t>(v >> 20));
            out.push_back(static_cast<std::uint8_t>(v >> 12));
            out.push_back(static_cast<std::uint8_t>(v >> 4));
            out.push_back(static_cast<std::uint8_t>(v & 0x0F));
            break;
    }
    return size;
}

std::size_t writeLtf8(std::vector<std::uint8_t>& out, std::int64_t value) {
    const auto v = static_cast<std::uint64_t>(value);

    // Extra bytes needed: n extra bytes hold 8n bits plus (7 - n) bits of the
    // first byte, until n reaches 7 and the first byte holds nothing.
    std::size_t extra = 0;
    while (extra < 8) {
        const std::size_t firstBits = extra >= 7 ? 0 : 7 - extra;
        const std::size_t bits = 8 * extra + firstBits;
        if (bits >= 64 || (v >> bits) == 0) {
            break;
        }
        ++extra;
    }

    const auto prefix = static_cast<std::uint8_t>(extra == 0 ? 0 : (0xFF00U >> extra) & 0xFF);
    const std::uint8_t firstValue =
        extra >= 7 ? 0 : static_cast<std::uint8_t>((v >> (8 * extra)) & (0x7FU >> extra));
    out.push_back(static_cast<std::uint8_t>(prefix | firstValue));
    for (std::size_t i = extra; i > 0; --i) {
        out.push_back(static_cast<std::uint8_t>(v >> (8 * (i - 1))));
    }
    return extra + 1;
}

}  // namespace cramdec::io
