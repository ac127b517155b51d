// =============================================================================
// cramdec - External Data Byte Cursor
// =============================================================================
// Byte reader over one decompressed external block, with the CRAM
// variable-length integer encodings:
//
// - ITF8: 1-5 bytes, big-endian. The number of leading one bits in the first
//   byte gives the number of extra bytes. The 5-byte form carries 4 bits of
//   the first byte and only the low 4 bits of the last byte.
// - LTF8: 1-9 bytes, same scheme extended to 64-bit values.
// =============================================================================

#ifndef CRAMDEC_IO_BYTE_READER_H
#define CRAMDEC_IO_BYTE_READER_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "cramdec/common/error.h"

namespace cramdec::io {

/// @brief Maximum encoded size of an ITF8 value.
inline constexpr std::size_t kMaxItf8Size = 5;

/// @brief Maximum encoded size of an LTF8 value.
inline constexpr std::size_t kMaxLtf8Size = 9;

// =============================================================================
// ByteReader
// =============================================================================

/// @brief Forward-only reader over a borrowed byte buffer.
/// @note The buffer must outlive the reader and every span it returns.
class ByteReader {
public:
    ByteReader() noexcept = default;

    explicit ByteReader(std::span<const std::uint8_t> data) noexcept : data_(data) {}

    [[nodiscard]] Result<std::uint8_t> readU8();

    /// @brief Take the next @p count bytes.
    [[nodiscard]] Result<std::span<const std::uint8_t>> readBytes(std::size_t count);

    /// @brief Take bytes up to (excluding) @p stop and consume the stop byte.
    /// @return kUnexpectedEof if the stop byte never appears.
    [[nodiscard]] Result<std::span<const std::uint8_t>> readUntil(std::uint8_t stop);

    [[nodiscard]] Result<std::int32_t> readItf8();

    [[nodiscard]] Result<std::int64_t> readLtf8();

    [[nodiscard]] std::size_t position() const noexcept { return pos_; }

    [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - pos_; }

    [[nodiscard]] bool isExhausted() const noexcept { return pos_ >= data_.size(); }

private:
    std::span<const std::uint8_t> data_;
    std::size_t pos_ = 0;
};

// =============================================================================
// Variable-Length Integer Encoding
// =============================================================================

/// @brief Append the ITF8 encoding of @p value.
/// @return Number of bytes written.
std::size_t writeItf8(std::vector<std::uint8_t>& out, std::int32_t value);

/// @brief Append the LTF8 encoding of @p value.
/// @return Number of bytes written.
std::size_t writeLtf8(std::vector<std::uint8_t>& out, std::int64_t value);

/// @brief Encoded size of @p value in ITF8.
[[nodiscard]] std::size_t itf8Size(std::int32_t value) noexcept;

}  // namespace cramdec::io

#endif  // CRAMDEC_IO_BYTE_READER_H
