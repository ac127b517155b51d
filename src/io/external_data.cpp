// =============================================================================
// cramdec - External Stream Table Implementation
// =============================================================================

#include "cramdec/io/external_data.h"

#include <fmt/format.h>

namespace cramdec::io {

void ExternalDataReaders::insert(ContentId contentId, std::span<const std::uint8_t> data) {
    readers_.insert_or_assign(contentId, ByteReader{data});
}

Result<ByteReader*> ExternalDataReaders::get(ContentId contentId) {
    const auto it = readers_.find(contentId);
    if (it == readers_.end()) {
        ErrorContext context;
        context.withContentId(contentId);
        return makeError<ByteReader*>(ErrorCode::kMissingExternalBlock,
                                      fmt::format("no external block with content id {}",
                                                  contentId),
                                      std::move(context));
    }
    return &it->second;
}

bool ExternalDataReaders::contains(ContentId contentId) const noexcept {
    return readers_.contains(contentId);
}

const std::vector<std::uint8_t>* ExternalDataWriters::find(ContentId contentId) const noexcept {
    const auto it = writers_.find(contentId);
    return it == writers_.end() ? nullptr : &it->second;
}

}  // namespace cramdec::io
