// =============================================================================
// cramdec - Core Data Bit Cursor Implementation
// =============================================================================

#include "cramdec/io/bit_reader.h"

#include <fmt/format.h>

namespace cramdec::io {

// =============================================================================
// BitReader Implementation
// =============================================================================

Result<std::uint8_t> BitReader::readBit() {
    if (bitPos_ >= data_.size() * 8) {
        return makeError<std::uint8_t>(ErrorCode::kUnexpectedEof, "core data exhausted");
    }
    const std::uint8_t byte = data_[bitPos_ >> 3];
    const auto shift = static_cast<unsigned>(7 - (bitPos_ & 7));
    ++bitPos_;
    return static_cast<std::uint8_t>((byte >> shift) & 1U);
}

Result<std::uint32_t> BitReader::readBits(std::uint32_t count) {
    if (count > 32) {
        return makeError<std::uint32_t>(ErrorCode::kInvalidData,
                                        fmt::format("cannot read {} bits at once", count));
    }
    if (count > remainingBits()) {
        return makeError<std::uint32_t>(
            ErrorCode::kUnexpectedEof,
            fmt::format("core data exhausted: need {} bits, {} left", count, remainingBits()));
    }

    std::uint64_t value = 0;
    for (std::uint32_t i = 0; i < count; ++i) {
        const std::uint8_t byte = data_[bitPos_ >> 3];
        const auto shift = static_cast<unsigned>(7 - (bitPos_ & 7));
        value = (value << 1) | ((byte >> shift) & 1U);
        ++bitPos_;
    }
    return static_cast<std::uint32_t>(value);
}

// =============================================================================
// BitWriter Implementation
// =============================================================================

void BitWriter::writeBit(bool bit) {
    if ((bitCount_ & 7) == 0) {
        buffer_.push_back(0);
    }
    if (bit) {
        buffer_.back() |= static_cast<std::uint8_t>(1U << (7 - (bitCount_ & 7)));
    }
    ++bitCount_;
}

VoidResult BitWriter::writeBits(std::uint32_t value, std::uint32_t count) {
    if (count > 32) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("cannot write {} bits at once", count));
    }
    if (count < 32 && (static_cast<std::uint64_t>(value) >> count) != 0) {
        return makeVoidError(ErrorCode::kInvalidData,
                             fmt::format("value {} does not fit in {} bits", value, count));
    }
    for (std::uint32_t i = count; i > 0; --i) {
        writeBit(((value >> (i - 1)) & 1U) != 0);
    }
    return makeVoidSuccess();
}

std::vector<std::uint8_t> BitWriter::finish() {
    std::vector<std::uint8_t> out = std::move(buffer_);
    buffer_.clear();
    bitCount_ = 0;
    return out;
}

}  // namespace cramdec::io
