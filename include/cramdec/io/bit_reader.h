// =============================================================================
// cramdec - Core Data Bit Cursor
// =============================================================================
// Bit-addressable reader and writer over the core data block.
//
// Bits are consumed most-significant-bit first within each byte. The reader
// never rewinds; it advances monotonically within one slice.
// =============================================================================

#ifndef CRAMDEC_IO_BIT_READER_H
#define CRAMDEC_IO_BIT_READER_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "cramdec/common/error.h"

namespace cramdec::io {

// =============================================================================
// BitReader
// =============================================================================

/// @brief MSB-first bit reader over a borrowed byte buffer.
/// @note The buffer must outlive the reader.
class BitReader {
public:
    BitReader() noexcept = default;

    explicit BitReader(std::span<const std::uint8_t> data) noexcept : data_(data) {}

    /// @brief Read a single bit.
    /// @return 0 or 1, or kUnexpectedEof.
    [[nodiscard]] Result<std::uint8_t> readBit();

    /// @brief Read @p count bits as an unsigned big-endian value.
    /// @param count Number of bits, 0..32. Reading 0 bits yields 0.
    [[nodiscard]] Result<std::uint32_t> readBits(std::uint32_t count);

    /// @brief Total bits consumed so far.
    [[nodiscard]] std::size_t bitPosition() const noexcept { return bitPos_; }

    /// @brief Bits left in the buffer.
    [[nodiscard]] std::size_t remainingBits() const noexcept {
        return data_.size() * 8 - bitPos_;
    }

    [[nodiscard]] bool isExhausted() const noexcept { return remainingBits() == 0; }

private:
    std::span<const std::uint8_t> data_;
    std::size_t bitPos_ = 0;
};

// =============================================================================
// BitWriter
// =============================================================================

/// @brief MSB-first bit writer, the encode-side twin of BitReader.
class BitWriter {
public:
    /// @brief Append a single bit.
    void writeBit(bool bit);

    /// @brief Append the low @p count bits of @p value, most significant first.
    /// @param count Number of bits, 0..32.
    [[nodiscard]] VoidResult writeBits(std::uint32_t value, std::uint32_t count);

    /// @brief Number of bits written.
    [[nodiscard]] std::size_t bitCount() const noexcept { return bitCount_; }

    /// @brief Bytes written so far; a partial final byte is zero-padded.
    [[nodiscard]] const std::vector<std::uint8_t>& data() const noexcept { return buffer_; }

    /// @brief Release the buffer and reset the writer.
    [[nodiscard]] std::vector<std::uint8_t> finish();

private:
    std::vector<std::uint8_t> buffer_;
    std::size_t bitCount_ = 0;
};

}  // namespace cramdec::io

#endif  // CRAMDEC_IO_BIT_READER_H
