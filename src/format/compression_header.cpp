// =============================================================================
// cramdec - Compression Header Implementation
// =============================================================================

#include "cramdec/format/compression_header.h"

#include <algorithm>
#include <array>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "cramdec/common/logger.h"

namespace cramdec::format {

namespace {

/// @brief Take the next "ITF8 size + body" region as its own reader.
Result<io::ByteReader> readSizedRegion(io::ByteReader& reader, std::string_view what) {
    auto size = reader.readItf8();
    if (!size) {
        return std::unexpected(std::move(size).error());
    }
    if (*size < 0) {
        return makeError<io::ByteReader>(ErrorCode::kInvalidData,
                                         fmt::format("negative {} size {}", what, *size));
    }
    auto body = reader.readBytes(static_cast<std::size_t>(*size));
    if (!body) {
        return std::unexpected(std::move(body).error());
    }
    return io::ByteReader{*body};
}

Result<std::int32_t> readCount(io::ByteReader& reader, std::string_view what) {
    auto count = reader.readItf8();
    if (!count) {
        return std::unexpected(std::move(count).error());
    }
    if (*count < 0) {
        return makeError<std::int32_t>(ErrorCode::kInvalidData,
                                       fmt::format("negative {} count {}", what, *count));
    }
    return *count;
}

Result<std::array<char, 2>> readKey(io::ByteReader& reader) {
    auto bytes = reader.readBytes(2);
    if (!bytes) {
        return std::unexpected(std::move(bytes).error());
    }
    return std::array<char, 2>{static_cast<char>((*bytes)[0]), static_cast<char>((*bytes)[1])};
}

Result<bool> readBool(io::ByteReader& reader) {
    auto value = reader.readU8();
    if (!value) {
        return std::unexpected(std::move(value).error());
    }
    return *value != 0;
}

/// @brief ITF8 count followed by that many ITF8 values.
Result<std::vector<std::int32_t>> readItf8Array(io::ByteReader& reader) {
    auto count = readCount(reader, "array");
    if (!count) {
        return std::unexpected(std::move(count).error());
    }
    std::vector<std::int32_t> values;
    values.reserve(static_cast<std::size_t>(std::min(*count, 4096)));
    for (std::int32_t i = 0; i < *count; ++i) {
        auto value = reader.readItf8();
        if (!value) {
            return std::unexpected(std::move(value).error());
        }
        values.push_back(*value);
    }
    return values;
}

Result<std::vector<std::uint32_t>> readBitLengths(io::ByteReader& reader) {
    auto raw = readItf8Array(reader);
    if (!raw) {
        return std::unexpected(std::move(raw).error());
    }
    std::vector<std::uint32_t> lengths;
    lengths.reserve(raw->size());
    for (const auto length : *raw) {
        if (length < 0) {
            return makeError<std::vector<std::uint32_t>>(
                ErrorCode::kInvalidData, fmt::format("negative huffman code length {}", length));
        }
        lengths.push_back(static_cast<std::uint32_t>(length));
    }
    return lengths;
}

/// @brief Codec id and argument region of one descriptor.
struct Descriptor {
    codec::CodecId id = codec::CodecId::kNull;
    io::ByteReader args;
};

Result<Descriptor> readDescriptor(io::ByteReader& reader) {
    auto rawId = reader.readItf8();
    if (!rawId) {
        return std::unexpected(std::move(rawId).error());
    }
    auto args = readSizedRegion(reader, "encoding argument");
    if (!args) {
        return std::unexpected(std::move(args).error());
    }
    if (*rawId < 0 || *rawId > static_cast<std::int32_t>(codec::CodecId::kGamma)) {
        return makeError<Descriptor>(ErrorCode::kInvalidData,
                                     fmt::format("unknown codec id {}", *rawId));
    }
    return Descriptor{static_cast<codec::CodecId>(*rawId), *args};
}

/// @brief @p N consecutive ITF8 codec parameters.
template <std::size_t N>
Result<std::array<std::int32_t, N>> readParameters(io::ByteReader& reader) {
    std::array<std::int32_t, N> values{};
    for (auto& value : values) {
        auto v = reader.readItf8();
        if (!v) {
            return std::unexpected(std::move(v).error());
        }
        value = *v;
    }
    return values;
}

Error wrongKind(codec::CodecId id, std::string_view kind) {
    return Error{ErrorCode::kInvalidData,
                 fmt::format("{} codec cannot encode {} values", codec::codecIdToString(id),
                             kind)};
}

template <typename Codec>
Result<codec::Encoding<Codec>> finish(Codec codec) {
    return codec::Encoding<Codec>::create(std::move(codec));
}

/// @brief Huffman alphabet and code lengths of a descriptor.
template <typename HuffmanCodec>
Result<HuffmanCodec> readHuffman(io::ByteReader& args) {
    auto alphabet = readItf8Array(args);
    if (!alphabet) {
        return std::unexpected(std::move(alphabet).error());
    }
    auto bitLens = readBitLengths(args);
    if (!bitLens) {
        return std::unexpected(std::move(bitLens).error());
    }
    return HuffmanCodec{std::move(*alphabet), std::move(*bitLens)};
}

Result<codec::IntegerCodec> readIntegerCodec(Descriptor& d) {
    using codec::CodecId;
    switch (d.id) {
        case CodecId::kExternal: {
            auto p = readParameters<1>(d.args);
            if (!p) {
                return std::unexpected(std::move(p).error());
            }
            return codec::integer::External{(*p)[0]};
        }
        case CodecId::kGolomb: {
            auto p = readParameters<2>(d.args);
            if (!p) {
                return std::unexpected(std::move(p).error());
            }
            return codec::integer::Golomb{(*p)[0], (*p)[1]};
        }
        case CodecId::kHuffman: {
            auto huffman = readHuffman<codec::integer::Huffman>(d.args);
            if (!huffman) {
                return std::unexpected(std::move(huffman).error());
            }
            return std::move(*huffman);
        }
        case CodecId::kBeta: {
            auto p = readParameters<2>(d.args);
            if (!p) {
                return std::unexpected(std::move(p).error());
            }
            const auto [offset, len] = *p;
            if (len < 0) {
                return makeError<codec::IntegerCodec>(
                    ErrorCode::kInvalidData, fmt::format("negative beta length {}", len));
            }
            return codec::integer::Beta{offset, static_cast<std::uint32_t>(len)};
        }
        case CodecId::kSubexp: {
            auto p = readParameters<2>(d.args);
            if (!p) {
                return std::unexpected(std::move(p).error());
            }
            return codec::integer::Subexp{(*p)[0], (*p)[1]};
        }
        case CodecId::kGolombRice: {
            auto p = readParameters<2>(d.args);
            if (!p) {
                return std::unexpected(std::move(p).error());
            }
            return codec::integer::GolombRice{(*p)[0], (*p)[1]};
        }
        case CodecId::kGamma: {
            auto p = readParameters<1>(d.args);
            if (!p) {
                return std::unexpected(std::move(p).error());
            }
            return codec::integer::Gamma{(*p)[0]};
        }
        default:
            return std::unexpected(wrongKind(d.id, "integer"));
    }
}

Result<codec::ByteCodec> readByteCodec(Descriptor& d) {
    using codec::CodecId;
    switch (d.id) {
        case CodecId::kExternal: {
            auto contentId = d.args.readItf8();
            if (!contentId) {
                return std::unexpected(std::move(contentId).error());
            }
            return codec::byte::External{*contentId};
        }
        case CodecId::kHuffman: {
            auto huffman = readHuffman<codec::byte::Huffman>(d.args);
            if (!huffman) {
                return std::unexpected(std::move(huffman).error());
            }
            return std::move(*huffman);
        }
        default:
            return std::unexpected(wrongKind(d.id, "byte"));
    }
}

}  // namespace

// =============================================================================
// PreservationMap
// =============================================================================

Result<const TagSet*> PreservationMap::tagSet(std::int32_t id) const {
    if (id < 0 || static_cast<std::size_t>(id) >= tagSets.size()) {
        ErrorContext context;
        context.withTagSet(id);
        return makeError<const TagSet*>(
            ErrorCode::kMissingTagSet,
            fmt::format("tag set {} not in preservation map ({} sets)", id, tagSets.size()),
            std::move(context));
    }
    return &tagSets[static_cast<std::size_t>(id)];
}

// =============================================================================
// Encoding Descriptors
// =============================================================================

Result<codec::IntegerEncoding> parseIntegerEncoding(io::ByteReader& reader) {
    auto descriptor = readDescriptor(reader);
    if (!descriptor) {
        return std::unexpected(std::move(descriptor).error());
    }
    auto c = readIntegerCodec(*descriptor);
    if (!c) {
        return std::unexpected(std::move(c).error());
    }
    return finish(std::move(*c));
}

Result<codec::ByteEncoding> parseByteEncoding(io::ByteReader& reader) {
    auto descriptor = readDescriptor(reader);
    if (!descriptor) {
        return std::unexpected(std::move(descriptor).error());
    }
    auto c = readByteCodec(*descriptor);
    if (!c) {
        return std::unexpected(std::move(c).error());
    }
    return finish(std::move(*c));
}

Result<codec::ByteArrayEncoding> parseByteArrayEncoding(io::ByteReader& reader) {
    auto descriptor = readDescriptor(reader);
    if (!descriptor) {
        return std::unexpected(std::move(descriptor).error());
    }
    auto& args = descriptor->args;

    switch (descriptor->id) {
        case codec::CodecId::kByteArrayLength: {
            auto lenEncoding = parseIntegerEncoding(args);
            if (!lenEncoding) {
                return std::unexpected(std::move(lenEncoding).error());
            }
            auto valueEncoding = parseByteEncoding(args);
            if (!valueEncoding) {
                return std::unexpected(std::move(valueEncoding).error());
            }
            return finish(codec::ByteArrayCodec{codec::byte_array::ByteArrayLength{
                std::move(*lenEncoding), std::move(*valueEncoding)}});
        }
        case codec::CodecId::kByteArrayStop: {
            auto stopByte = args.readU8();
            if (!stopByte) {
                return std::unexpected(std::move(stopByte).error());
            }
            auto contentId = args.readItf8();
            if (!contentId) {
                return std::unexpected(std::move(contentId).error());
            }
            return finish(codec::ByteArrayCodec{
                codec::byte_array::ByteArrayStop{*stopByte, *contentId}});
        }
        default:
            return std::unexpected(wrongKind(descriptor->id, "byte array"));
    }
}

// =============================================================================
// Maps
// =============================================================================

Result<std::vector<TagSet>> parseTagSets(std::span<const std::uint8_t> data) {
    std::vector<TagSet> sets;
    TagSet current;
    std::size_t i = 0;

    while (i < data.size()) {
        if (data[i] == 0) {
            sets.push_back(std::move(current));
            current = TagSet{};
            ++i;
            continue;
        }
        if (data.size() - i < 3) {
            return makeError<std::vector<TagSet>>(ErrorCode::kUnexpectedEof,
                                                  "truncated tag key in tag set dictionary");
        }
        current.push_back(record::makeTagKey(static_cast<char>(data[i]),
                                             static_cast<char>(data[i + 1]),
                                             static_cast<char>(data[i + 2])));
        i += 3;
    }

    if (!current.empty()) {
        return makeError<std::vector<TagSet>>(ErrorCode::kInvalidData,
                                              "tag set dictionary is not NUL-terminated");
    }
    return sets;
}

Result<PreservationMap> parsePreservationMap(io::ByteReader& reader) {
    auto body = readSizedRegion(reader, "preservation map");
    if (!body) {
        return std::unexpected(std::move(body).error());
    }
    auto count = readCount(*body, "preservation map");
    if (!count) {
        return std::unexpected(std::move(count).error());
    }

    PreservationMap map;
    for (std::int32_t i = 0; i < *count; ++i) {
        auto key = readKey(*body);
        if (!key) {
            return std::unexpected(std::move(key).error());
        }
        const std::string_view k(key->data(), key->size());

        if (k == "RN" || k == "AP" || k == "RR") {
            auto value = readBool(*body);
            if (!value) {
                return std::unexpected(std::move(value).error());
            }
            if (k == "RN") {
                map.recordsHaveNames = *value;
            } else if (k == "AP") {
                map.alignmentStartsAreDeltas = *value;
            } else {
                map.referenceRequired = *value;
            }
        } else if (k == "SM") {
            auto bytes = body->readBytes(kSubstitutionMatrixSize);
            if (!bytes) {
                return std::unexpected(std::move(bytes).error());
            }
            auto matrix = SubstitutionMatrix::fromBytes(bytes->first<kSubstitutionMatrixSize>());
            if (!matrix) {
                return std::unexpected(std::move(matrix).error());
            }
            map.substitutionMatrix = *matrix;
        } else if (k == "TD") {
            auto length = body->readItf8();
            if (!length) {
                return std::unexpected(std::move(length).error());
            }
            if (*length < 0) {
                return makeError<PreservationMap>(
                    ErrorCode::kInvalidData, fmt::format("negative tag dictionary size {}", *length));
            }
            auto bytes = body->readBytes(static_cast<std::size_t>(*length));
            if (!bytes) {
                return std::unexpected(std::move(bytes).error());
            }
            auto sets = parseTagSets(*bytes);
            if (!sets) {
                return std::unexpected(std::move(sets).error());
            }
            map.tagSets = std::move(*sets);
        } else {
            return makeError<PreservationMap>(
                ErrorCode::kInvalidData, fmt::format("invalid preservation map key \"{}\"", k));
        }
    }

    CRAMDEC_LOG_DEBUG("preservation map: RN={} AP={} RR={} tag sets={}", map.recordsHaveNames,
                      map.alignmentStartsAreDeltas, map.referenceRequired, map.tagSets.size());
    return map;
}

Result<DataSeriesEncodings> parseDataSeriesEncodings(io::ByteReader& reader) {
    auto body = readSizedRegion(reader, "data series encoding map");
    if (!body) {
        return std::unexpected(std::move(body).error());
    }
    auto count = readCount(*body, "data series encoding map");
    if (!count) {
        return std::unexpected(std::move(count).error());
    }

    DataSeriesEncodings encodings;
    for (std::int32_t i = 0; i < *count; ++i) {
        auto key = readKey(*body);
        if (!key) {
            return std::unexpected(std::move(key).error());
        }
        const auto series = dataSeriesFromKey(*key);

        if (!series.has_value()) {
            auto skipped = readDescriptor(*body);
            if (!skipped) {
                return std::unexpected(std::move(skipped).error());
            }
            CRAMDEC_LOG_WARNING("skipping unknown data series {}{} (codec {})", (*key)[0],
                                (*key)[1], codec::codecIdToString(skipped->id));
            continue;
        }

        auto withSeries = [&](Error error) {
            ErrorContext context = error.context().value_or(ErrorContext{});
            context.withSeries(std::string(dataSeriesKey(*series)));
            return std::unexpected(Error{error.code(), error.message(), std::move(context)});
        };

        switch (dataSeriesKind(*series)) {
            case ValueKind::kInteger: {
                auto encoding = parseIntegerEncoding(*body);
                if (!encoding) {
                    return withSeries(std::move(encoding).error());
                }
                encodings.integerSlot(*series)->emplace(std::move(*encoding));
                break;
            }
            case ValueKind::kByte: {
                auto encoding = parseByteEncoding(*body);
                if (!encoding) {
                    return withSeries(std::move(encoding).error());
                }
                encodings.byteSlot(*series)->emplace(std::move(*encoding));
                break;
            }
            case ValueKind::kByteArray: {
                auto encoding = parseByteArrayEncoding(*body);
                if (!encoding) {
                    return withSeries(std::move(encoding).error());
                }
                encodings.byteArraySlot(*series)->emplace(std::move(*encoding));
                break;
            }
        }
    }

    return encodings;
}

Result<TagEncodings> parseTagEncodings(io::ByteReader& reader) {
    auto body = readSizedRegion(reader, "tag encoding map");
    if (!body) {
        return std::unexpected(std::move(body).error());
    }
    auto count = readCount(*body, "tag encoding map");
    if (!count) {
        return std::unexpected(std::move(count).error());
    }

    TagEncodings encodings;
    for (std::int32_t i = 0; i < *count; ++i) {
        auto key = body->readItf8();
        if (!key) {
            return std::unexpected(std::move(key).error());
        }
        auto encoding = parseByteArrayEncoding(*body);
        if (!encoding) {
            return std::unexpected(std::move(encoding).error());
        }
        encodings.insert_or_assign(*key, std::move(*encoding));
    }
    return encodings;
}

Result<CompressionHeader> parseCompressionHeader(std::span<const std::uint8_t> data) {
    io::ByteReader reader(data);

    auto preservationMap = parsePreservationMap(reader);
    if (!preservationMap) {
        return std::unexpected(std::move(preservationMap).error());
    }
    auto dataSeriesEncodings = parseDataSeriesEncodings(reader);
    if (!dataSeriesEncodings) {
        return std::unexpected(std::move(dataSeriesEncodings).error());
    }
    auto tagEncodings = parseTagEncodings(reader);
    if (!tagEncodings) {
        return std::unexpected(std::move(tagEncodings).error());
    }

    CRAMDEC_LOG_DEBUG("compression header: {} tag encodings, {} trailing bytes",
                      tagEncodings->size(), reader.remaining());

    return CompressionHeader{std::move(*preservationMap), std::move(*dataSeriesEncodings),
                             std::move(*tagEncodings)};
}

}  // namespace cramdec::format
