// =============================================================================
// cramdec - Canonical Huffman Decoder Implementation
// =============================================================================

#include "cramdec/codec/huffman.h"

#include <algorithm>
#include <set>

#include <fmt/format.h>

namespace cramdec::codec {

Result<CanonicalHuffmanDecoder> CanonicalHuffmanDecoder::build(
    const std::vector<std::int32_t>& alphabet, const std::vector<std::uint32_t>& bitLengths) {
    using R = Result<CanonicalHuffmanDecoder>;

    if (alphabet.empty()) {
        return makeError<CanonicalHuffmanDecoder>(ErrorCode::kInvalidData,
                                                  "huffman alphabet is empty");
    }
    if (alphabet.size() != bitLengths.size()) {
        return makeError<CanonicalHuffmanDecoder>(
            ErrorCode::kInvalidData,
            fmt::format("huffman alphabet has {} symbols but {} bit lengths", alphabet.size(),
                        bitLengths.size()));
    }

    std::set<std::int32_t> seen;
    for (const auto symbol : alphabet) {
        if (!seen.insert(symbol).second) {
            return makeError<CanonicalHuffmanDecoder>(
                ErrorCode::kInvalidData, fmt::format("duplicate huffman symbol {}", symbol));
        }
    }

    CanonicalHuffmanDecoder decoder;

    if (alphabet.size() == 1) {
        decoder.codes_.push_back({alphabet.front(), 0, 0});
        return R{std::move(decoder)};
    }

    decoder.codes_.reserve(alphabet.size());
    for (std::size_t i = 0; i < alphabet.size(); ++i) {
        const std::uint32_t length = bitLengths[i];
        if (length == 0 || length > kMaxHuffmanCodeLength) {
            return makeError<CanonicalHuffmanDecoder>(
                ErrorCode::kInvalidData,
                fmt::format("invalid huffman code length {} for symbol {}", length, alphabet[i]));
        }
        decoder.codes_.push_back({alphabet[i], length, 0});
    }

    std::sort(decoder.codes_.begin(), decoder.codes_.end(),
              [](const HuffmanCode& a, const HuffmanCode& b) {
                  return a.length != b.length ? a.length < b.length : a.symbol < b.symbol;
              });

    decoder.maxLength_ = decoder.codes_.back().length;
    decoder.firstCode_.assign(decoder.maxLength_ + 1, 0);
    decoder.count_.assign(decoder.maxLength_ + 1, 0);
    decoder.firstIndex_.assign(decoder.maxLength_ + 1, 0);

    std::uint64_t code = 0;
    std::uint32_t prevLength = decoder.codes_.front().length;
    for (std::size_t i = 0; i < decoder.codes_.size(); ++i) {
        auto& entry = decoder.codes_[i];
        code <<= (entry.length - prevLength);
        prevLength = entry.length;

        if (code >= (std::uint64_t{1} << entry.length)) {
            return makeError<CanonicalHuffmanDecoder>(
                ErrorCode::kInvalidData, "huffman code lengths over-subscribe the code space");
        }

        entry.code = static_cast<std::uint32_t>(code);
        if (decoder.count_[entry.length] == 0) {
            decoder.firstCode_[entry.length] = entry.code;
            decoder.firstIndex_[entry.length] = static_cast<std::uint32_t>(i);
        }
        ++decoder.count_[entry.length];
        ++code;
    }

    return R{std::move(decoder)};
}

Result<std::int32_t> CanonicalHuffmanDecoder::decode(io::BitReader& reader) const {
    if (codes_.size() == 1) {
        return codes_.front().symbol;
    }

    std::uint32_t code = 0;
    for (std::uint32_t length = 1; length <= maxLength_; ++length) {
        auto bit = reader.readBit();
        if (!bit) {
            return std::unexpected(bit.error());
        }
        code = (code << 1) | *bit;

        const std::uint32_t count = count_[length];
        if (count != 0 && code >= firstCode_[length] && code - firstCode_[length] < count) {
            return codes_[firstIndex_[length] + (code - firstCode_[length])].symbol;
        }
    }

    return makeError<std::int32_t>(
        ErrorCode::kInvalidData,
        fmt::format("no huffman code matches after {} bits", maxLength_));
}

}  // namespace cramdec::codec
