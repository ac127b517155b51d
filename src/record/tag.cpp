// =============================================================================
// cramdec - Auxiliary Tags Implementation
// =============================================================================

#include "cramdec/record/tag.h"

#include <algorithm>
#include <bit>
#include <type_traits>

#include <fmt/format.h>

namespace cramdec::record {

namespace {

/// @brief Little-endian cursor over a tag value buffer.
class ValueReader {
public:
    explicit ValueReader(std::span<const std::uint8_t> data) noexcept : data_(data) {}

    template <typename T>
    Result<T> read() {
        if (sizeof(T) > data_.size() - pos_) {
            return makeError<T>(ErrorCode::kUnexpectedEof, "tag value truncated");
        }
        std::uint64_t raw = 0;
        for (std::size_t i = 0; i < sizeof(T); ++i) {
            raw |= static_cast<std::uint64_t>(data_[pos_ + i]) << (8 * i);
        }
        pos_ += sizeof(T);

        if constexpr (std::is_same_v<T, float>) {
            return std::bit_cast<float>(static_cast<std::uint32_t>(raw));
        } else {
            using U = std::make_unsigned_t<T>;
            return static_cast<T>(static_cast<U>(raw));
        }
    }

    Result<std::string> readString() {
        const auto rest = data_.subspan(pos_);
        const auto nul = std::find(rest.begin(), rest.end(), std::uint8_t{0});
        if (nul == rest.end()) {
            return makeError<std::string>(ErrorCode::kInvalidData,
                                          "tag string is not NUL-terminated");
        }
        std::string out(rest.begin(), nul);
        pos_ += out.size() + 1;
        return out;
    }

    template <typename T>
    Result<TagArray> readArray(std::uint32_t count) {
        if (static_cast<std::uint64_t>(count) * sizeof(T) > data_.size() - pos_) {
            return makeError<TagArray>(
                ErrorCode::kUnexpectedEof,
                fmt::format("tag array of {} elements truncated", count));
        }
        std::vector<T> values;
        values.reserve(count);
        for (std::uint32_t i = 0; i < count; ++i) {
            auto value = read<T>();
            if (!value) {
                return std::unexpected(std::move(value).error());
            }
            values.push_back(*value);
        }
        return TagArray{std::move(values)};
    }

private:
    std::span<const std::uint8_t> data_;
    std::size_t pos_ = 0;
};

template <typename T>
Result<TagValue> readScalar(ValueReader& reader) {
    auto value = reader.read<T>();
    if (!value) {
        return std::unexpected(std::move(value).error());
    }
    return TagValue{std::in_place_type<T>, *value};
}

Result<TagValue> readArrayValue(ValueReader& reader) {
    auto subtype = reader.read<std::uint8_t>();
    if (!subtype) {
        return std::unexpected(std::move(subtype).error());
    }
    auto count = reader.read<std::uint32_t>();
    if (!count) {
        return std::unexpected(std::move(count).error());
    }

    Result<TagArray> array = [&]() -> Result<TagArray> {
        switch (static_cast<char>(*subtype)) {
            case 'c':
                return reader.readArray<std::int8_t>(*count);
            case 'C':
                return reader.readArray<std::uint8_t>(*count);
            case 's':
                return reader.readArray<std::int16_t>(*count);
            case 'S':
                return reader.readArray<std::uint16_t>(*count);
            case 'i':
                return reader.readArray<std::int32_t>(*count);
            case 'I':
                return reader.readArray<std::uint32_t>(*count);
            case 'f':
                return reader.readArray<float>(*count);
            default:
                return makeError<TagArray>(
                    ErrorCode::kInvalidData,
                    fmt::format("invalid tag array subtype 0x{:02x}", *subtype));
        }
    }();

    if (!array) {
        return std::unexpected(std::move(array).error());
    }
    return TagValue{std::move(*array)};
}

}  // namespace

Result<TagValue> parseTagValue(char type, std::span<const std::uint8_t> data) {
    ValueReader reader(data);

    switch (type) {
        case 'A': {
            auto c = reader.read<std::uint8_t>();
            if (!c) {
                return std::unexpected(std::move(c).error());
            }
            return TagValue{static_cast<char>(*c)};
        }
        case 'c':
            return readScalar<std::int8_t>(reader);
        case 'C':
            return readScalar<std::uint8_t>(reader);
        case 's':
            return readScalar<std::int16_t>(reader);
        case 'S':
            return readScalar<std::uint16_t>(reader);
        case 'i':
            return readScalar<std::int32_t>(reader);
        case 'I':
            return readScalar<std::uint32_t>(reader);
        case 'f':
            return readScalar<float>(reader);
        case 'Z': {
            auto s = reader.readString();
            if (!s) {
                return std::unexpected(std::move(s).error());
            }
            return TagValue{std::move(*s)};
        }
        case 'H': {
            auto s = reader.readString();
            if (!s) {
                return std::unexpected(std::move(s).error());
            }
            return TagValue{HexString{std::move(*s)}};
        }
        case 'B':
            return readArrayValue(reader);
        default:
            return makeError<TagValue>(ErrorCode::kInvalidData,
                                       fmt::format("invalid tag type 0x{:02x}",
                                                   static_cast<std::uint8_t>(type)));
    }
}

}  // namespace cramdec::record
