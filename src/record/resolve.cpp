// =============================================================================
// cramdec - Read Base Resolution Implementation
// =============================================================================

#include "cramdec/record/resolve.h"

#include <type_traits>

#include <fmt/format.h>

namespace cramdec::record {

namespace {

/// @brief Walks the reference while appending read bases.
class BaseResolver {
public:
    BaseResolver(std::span<const std::uint8_t> reference, std::size_t start,
                 std::size_t readLength)
        : reference_(reference), referenceIndex_(start) {
        out_.reserve(readLength);
    }

    VoidResult copyMatches(std::size_t count) {
        if (count > reference_.size() || referenceIndex_ > reference_.size() - count) {
            return offReference();
        }
        const auto first = reference_.begin() + static_cast<std::ptrdiff_t>(referenceIndex_);
        out_.insert(out_.end(), first, first + static_cast<std::ptrdiff_t>(count));
        referenceIndex_ += count;
        return makeVoidSuccess();
    }

    Result<std::uint8_t> referenceBase() {
        if (referenceIndex_ >= reference_.size()) {
            return std::unexpected(offReference().error());
        }
        return reference_[referenceIndex_];
    }

    void append(std::span<const std::uint8_t> bases) {
        out_.insert(out_.end(), bases.begin(), bases.end());
    }

    void append(std::uint8_t base) { out_.push_back(base); }

    void skipReference(std::size_t count) noexcept { referenceIndex_ += count; }

    [[nodiscard]] std::size_t size() const noexcept { return out_.size(); }

    ByteBuffer take() noexcept { return std::move(out_); }

private:
    VoidResult offReference() const {
        return makeVoidError(ErrorCode::kInvalidData,
                             fmt::format("read runs off the reference at index {} (length {})",
                                         referenceIndex_, reference_.size()));
    }

    std::span<const std::uint8_t> reference_;
    std::size_t referenceIndex_ = 0;
    ByteBuffer out_;
};

}  // namespace

Result<ByteBuffer> resolveBases(std::span<const std::uint8_t> reference, Position alignmentStart,
                                std::size_t readLength, std::span<const Feature> features,
                                const format::SubstitutionMatrix& substitutionMatrix) {
    if (alignmentStart < 1) {
        return makeError<ByteBuffer>(ErrorCode::kInvalidData,
                                     fmt::format("invalid alignment start {}", alignmentStart));
    }

    BaseResolver resolver(reference, static_cast<std::size_t>(alignmentStart) - 1, readLength);

    for (const auto& feature : features) {
        const auto position = static_cast<std::size_t>(featurePosition(feature));
        const auto next = resolver.size() + 1;

        if (position > next) {
            if (auto result = resolver.copyMatches(position - next); !result) {
                return std::unexpected(std::move(result).error());
            }
        }

        VoidResult applied = std::visit(
            [&](const auto& f) -> VoidResult {
                using T = std::decay_t<decltype(f)>;
                constexpr bool consumesRead =
                    std::is_same_v<T, feature::Bases> || std::is_same_v<T, feature::ReadBase> ||
                    std::is_same_v<T, feature::Substitution> ||
                    std::is_same_v<T, feature::Insertion> ||
                    std::is_same_v<T, feature::InsertBase> ||
                    std::is_same_v<T, feature::SoftClip>;

                if constexpr (consumesRead) {
                    if (position < next) {
                        return makeVoidError(
                            ErrorCode::kInvalidData,
                            fmt::format("{} feature at position {} overlaps the previous feature",
                                        featureCodeToString(featureCode(feature)), position));
                    }
                }

                if constexpr (std::is_same_v<T, feature::Bases>) {
                    resolver.append(f.bases);
                    resolver.skipReference(f.bases.size());
                } else if constexpr (std::is_same_v<T, feature::ReadBase>) {
                    resolver.append(f.base);
                    resolver.skipReference(1);
                } else if constexpr (std::is_same_v<T, feature::Substitution>) {
                    auto referenceBase = resolver.referenceBase();
                    if (!referenceBase) {
                        return std::unexpected(std::move(referenceBase).error());
                    }
                    auto base = substitutionMatrix.get(*referenceBase, f.code);
                    if (!base) {
                        return std::unexpected(std::move(base).error());
                    }
                    resolver.append(*base);
                    resolver.skipReference(1);
                } else if constexpr (std::is_same_v<T, feature::Insertion> ||
                                     std::is_same_v<T, feature::SoftClip>) {
                    resolver.append(f.bases);
                } else if constexpr (std::is_same_v<T, feature::InsertBase>) {
                    resolver.append(f.base);
                } else if constexpr (std::is_same_v<T, feature::Deletion> ||
                                     std::is_same_v<T, feature::ReferenceSkip>) {
                    resolver.skipReference(f.length);
                }
                return makeVoidSuccess();
            },
            feature);

        if (!applied) {
            return std::unexpected(std::move(applied).error());
        }
    }

    if (resolver.size() > readLength) {
        return makeError<ByteBuffer>(
            ErrorCode::kInvalidData,
            fmt::format("features yield {} bases for a read of length {}", resolver.size(),
                        readLength));
    }
    if (auto result = resolver.copyMatches(readLength - resolver.size()); !result) {
        return std::unexpected(std::move(result).error());
    }

    return resolver.take();
}

}  // namespace cramdec::record
