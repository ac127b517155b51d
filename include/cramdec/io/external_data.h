// =============================================================================
// cramdec - External Stream Table
// =============================================================================
// Content-id keyed tables of external data cursors (decode side) and growing
// byte buffers (encode side). One table is populated per slice from its
// decompressed external blocks and is owned by a single decoding engine.
// =============================================================================

#ifndef CRAMDEC_IO_EXTERNAL_DATA_H
#define CRAMDEC_IO_EXTERNAL_DATA_H

#include <cstdint>
#include <map>
#include <span>
#include <vector>

#include "cramdec/common/error.h"
#include "cramdec/common/types.h"
#include "cramdec/io/byte_reader.h"

namespace cramdec::io {

/// @brief Content id -> independent byte cursor.
class ExternalDataReaders {
public:
    ExternalDataReaders() = default;

    /// @brief Register the block for @p contentId, replacing any earlier one.
    /// @note The buffer must outlive this table.
    void insert(ContentId contentId, std::span<const std::uint8_t> data);

    /// @brief Cursor for @p contentId.
    /// @return kMissingExternalBlock if no block was registered.
    [[nodiscard]] Result<ByteReader*> get(ContentId contentId);

    [[nodiscard]] bool contains(ContentId contentId) const noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return readers_.size(); }

private:
    std::map<ContentId, ByteReader> readers_;
};

/// @brief Content id -> output buffer, filled by codec encode paths.
class ExternalDataWriters {
public:
    /// @brief Buffer for @p contentId, created empty on first use.
    [[nodiscard]] std::vector<std::uint8_t>& get(ContentId contentId) {
        return writers_[contentId];
    }

    /// @brief Buffer for @p contentId, nullptr if nothing was written to it.
    [[nodiscard]] const std::vector<std::uint8_t>* find(ContentId contentId) const noexcept;

    [[nodiscard]] const std::map<ContentId, std::vector<std::uint8_t>>& blocks() const noexcept {
        return writers_;
    }

private:
    std::map<ContentId, std::vector<std::uint8_t>> writers_;
};

}  // namespace cramdec::io

#endif  // CRAMDEC_IO_EXTERNAL_DATA_H
