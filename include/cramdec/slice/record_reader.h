// =============================================================================
// cramdec - Record Reader
// =============================================================================
// Decodes the records of one slice, one per readRecord() call, from the
// slice's core bit stream and external blocks under a shared compression
// header.
//
// Per record, in order:
//   BF CF | RI RL AP RG | RN | MF (RN) NS NP TS or NF | TL + tags |
//   unmapped: BA x read length, QS x read length
//   mapped:   FN, FN x (FC FP payload), MQ, QS x read length
//
// Optional parts depend on the preservation map, the CRAM flags and the BAM
// unmapped flag. A series needed by a record but absent from the header is
// reported as kMissingDataSeriesEncoding naming it.
//
// Thread Safety:
// - The compression header may be shared by readers on any number of threads
// - A RecordReader itself must be used from one thread at a time
// =============================================================================

#ifndef CRAMDEC_SLICE_RECORD_READER_H
#define CRAMDEC_SLICE_RECORD_READER_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

#include "cramdec/common/error.h"
#include "cramdec/common/types.h"
#include "cramdec/format/compression_header.h"
#include "cramdec/io/bit_reader.h"
#include "cramdec/io/external_data.h"
#include "cramdec/record/record.h"

namespace cramdec::slice {

class RecordReader {
public:
    /// @brief Create a reader over one slice.
    /// @param header Compression header; must outlive the reader.
    /// @param coreData Decompressed core block; must outlive the reader.
    /// @param externalData External block readers keyed by content id.
    /// @param referenceContext Reference context from the slice header.
    /// @param recordCount Number of records in the slice.
    /// @param initialId Id of the slice's first record.
    RecordReader(const format::CompressionHeader& header,
                 std::span<const std::uint8_t> coreData,
                 io::ExternalDataReaders externalData,
                 ReferenceSequenceContext referenceContext,
                 std::size_t recordCount,
                 RecordId initialId);

    /// @brief Decode the next record into @p record.
    /// @return 1 if a record was decoded, 0 once every record has been read.
    /// @note On error @p record is left partially filled, and the reader
    ///       should be discarded.
    [[nodiscard]] Result<std::size_t> readRecord(record::Record& record);

    /// @brief Id the next record will get.
    [[nodiscard]] RecordId nextId() const noexcept { return id_; }

    [[nodiscard]] std::size_t recordsRemaining() const noexcept {
        return recordCount_ - recordsRead_;
    }

private:
    // Record sections, in decode order.
    VoidResult readFlags(record::Record& record);
    VoidResult readPositions(record::Record& record);
    VoidResult readName(record::Record& record);
    VoidResult readMate(record::Record& record);
    VoidResult readTags(record::Record& record);
    VoidResult readMappedRead(record::Record& record);
    VoidResult readUnmappedRead(record::Record& record);

    VoidResult decodeName(record::Record& record);
    Result<record::Feature> readFeature(Position previousPosition);
    Result<Position> readAlignmentStart(bool isUnmapped);
    VoidResult readQualityScores(record::Record& record);

    // Series accessors.
    Result<std::int32_t> decodeInteger(format::DataSeries series);
    Result<std::uint8_t> decodeByte(format::DataSeries series);
    VoidResult decodeByteArray(format::DataSeries series, ByteBuffer& out);
    VoidResult decodeBytes(format::DataSeries series, std::size_t count, ByteBuffer& out);

    /// @brief Decode a non-negative integer.
    Result<std::uint32_t> decodeLength(format::DataSeries series);

    /// @brief Decode an id where -1 means "none".
    Result<std::optional<std::size_t>> decodeOptionalId(format::DataSeries series);

    const format::CompressionHeader& header_;
    io::BitReader core_;
    io::ExternalDataReaders external_;
    ReferenceSequenceContext referenceContext_;

    std::size_t recordCount_ = 0;
    std::size_t recordsRead_ = 0;
    RecordId id_ = 0;
    Position previousAlignmentStart_ = 0;

    // Reused across records.
    ByteBuffer scratch_;
};

}  // namespace cramdec::slice

#endif  // CRAMDEC_SLICE_RECORD_READER_H
