#include "fastxls/biff/RecordDecoders.hpp"
#include "fastxls/utils/ModuleLoggers.hpp"

#include <cstring>

namespace fastxls {
namespace biff {

namespace {

constexpr uint8_t kHighByteFlag = 0x01;
constexpr uint16_t kFormulaSpecialMarker = 0xFFFF;

bool isBiff8(BiffVersion version) {
    return version == BiffVersion::Biff8;
}

std::string readCharacters(core::ByteView bytes, size_t pos, size_t count, bool high_byte) {
    if (high_byte) {
        return TextEncoding::decodeUtf16(bytes.subspan(pos, count * 2));
    }
    return TextEncoding::decodeLatin1(bytes.subspan(pos, count));
}

/**
 * @brief BIFF2单元格：3字节属性，XF在第一个属性字节低6位
 */
CellRef readCellRef(const Record& record, BiffVersion version) {
    CellRef ref;
    ref.row = record.u16(0);
    ref.col = record.u16(2);
    ref.xf = (version == BiffVersion::Biff2) ? static_cast<uint16_t>(record.u8(4) & 0x3F)
                                             : record.u16(4);
    return ref;
}

// BIFF2 的值从偏移7开始，其余版本从偏移6开始
size_t valueOffset(const Record& record) {
    switch (record.id) {
        case RecordType::BOOLERR_V2:
        case RecordType::INTEGER_V2:
        case RecordType::NUMBER_V2:
        case RecordType::LABEL_V2:
            return 7;
        default:
            return 6;
    }
}

std::string decodeLabelText(const Record& record, BiffVersion version, const TextEncoding& encoding) {
    if (record.id == RecordType::LABEL_V2) {
        return readByteString(record.payload, 7, 1, encoding);
    }
    if (isBiff8(version)) {
        return readUnicodeString(record.payload, 6);
    }
    return readByteString(record.payload, 6, 2, encoding);
}

FormulaResult decodeFormulaResult(const Record& record, BiffVersion version) {
    const size_t result_pos = (version == BiffVersion::Biff2 && record.id == RecordType::FORMULA) ? 7 : 6;
    if (record.u16(result_pos + 6) != kFormulaSpecialMarker) {
        return record.f64(result_pos);
    }
    switch (record.u8(result_pos)) {
        case 0:
            return FormulaStringPending{};
        case 1:
            return record.u8(result_pos + 2) != 0;
        case 2:
            return FormulaError{record.u8(result_pos + 2)};
        case 3:
            return std::string();
        default:
            BIFF_DEBUG("Unknown formula result type {} at {}", record.u8(result_pos), record.offset);
            return FormulaError{0xFF};
    }
}

MulRkCell decodeMulRk(const Record& record) {
    MulRkCell cell;
    cell.row = record.u16(0);
    cell.first_col = record.u16(2);
    const size_t count = record.size() >= 6 ? (record.size() - 6) / 6 : 0;
    cell.values.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        const size_t pos = 4 + i * 6;
        cell.values.push_back(RkEntry{record.u16(pos), decodeRk(record.u32(pos + 2))});
    }
    cell.last_col = record.u16(record.size() >= 2 ? record.size() - 2 : 0);
    return cell;
}

} // namespace

// ========== 字符串 ==========

std::string readUnicodeString(core::ByteView bytes, size_t pos) {
    const uint16_t count = utils::readU16(bytes, pos);
    const uint8_t flags = utils::readU8(bytes, pos + 2);
    return readCharacters(bytes, pos + 3, count, (flags & kHighByteFlag) != 0);
}

std::string readShortUnicodeString(core::ByteView bytes, size_t pos) {
    const uint8_t count = utils::readU8(bytes, pos);
    const uint8_t flags = utils::readU8(bytes, pos + 1);
    return readCharacters(bytes, pos + 2, count, (flags & kHighByteFlag) != 0);
}

std::string readByteString(core::ByteView bytes, size_t pos, size_t length_bytes, const TextEncoding& encoding) {
    const size_t count = (length_bytes == 1) ? utils::readU8(bytes, pos) : utils::readU16(bytes, pos);
    return encoding.decode(bytes.subspan(pos + length_bytes, count));
}

// ========== 结构记录 ==========

BofInfo decodeBof(const Record& record) {
    BofInfo info;
    info.raw_version = record.u16(0);
    info.raw_type = record.u16(2);
    info.type = static_cast<SubstreamType>(info.raw_type);

    switch (record.id) {
        case RecordType::BOF_V2:
            info.version = BiffVersion::Biff2;
            break;
        case RecordType::BOF_V3:
            info.version = BiffVersion::Biff3;
            break;
        case RecordType::BOF_V4:
            info.version = BiffVersion::Biff4;
            break;
        default:
            info.version = info.raw_version >= 0x0600 ? BiffVersion::Biff8 : BiffVersion::Biff5;
            break;
    }
    return info;
}

BoundSheetInfo decodeBoundSheet(const Record& record, BiffVersion version, const TextEncoding& encoding) {
    BoundSheetInfo info;
    info.offset = record.u32(0);
    info.visibility = static_cast<SheetVisibility>(record.u8(4) & 0x03);
    info.sheet_type = record.u8(5);
    info.name = isBiff8(version) ? readShortUnicodeString(record.payload, 6)
                                 : readByteString(record.payload, 6, 1, encoding);
    return info;
}

IndexInfo decodeIndex(const Record& record, BiffVersion version) {
    IndexInfo info;
    size_t pos = 0;
    if (isBiff8(version)) {
        info.first_row = record.u32(4);
        info.last_row = record.u32(8);
        pos = 16;
    } else {
        info.first_row = record.u16(4);
        info.last_row = record.u16(6);
        pos = 12;
    }
    for (; pos + 4 <= record.size(); pos += 4) {
        info.dbcell_offsets.push_back(record.u32(pos));
    }
    return info;
}

DimensionsInfo decodeDimensions(const Record& record, BiffVersion version) {
    DimensionsInfo info;
    if (record.id == RecordType::DIMENSIONS && isBiff8(version)) {
        info.first_row = record.u32(0);
        info.last_row = record.u32(4);
        info.first_col = record.u16(8);
        info.last_col = record.u16(10);
    } else {
        info.first_row = record.u16(0);
        info.last_row = record.u16(2);
        info.first_col = record.u16(4);
        info.last_col = record.u16(6);
    }
    return info;
}

RowInfo decodeRow(const Record& record) {
    return RowInfo{record.u16(0), record.u16(2), record.u16(4)};
}

uint32_t decodeDbCell(const Record& record) {
    return record.u32(0);
}

FontInfo decodeFont(const Record& record, BiffVersion version, const TextEncoding& encoding) {
    FontInfo font;
    font.height = record.u16(0);
    const uint16_t options = record.u16(2);
    font.italic = (options & 0x0002) != 0;

    switch (version) {
        case BiffVersion::Biff2:
            font.bold = (options & 0x0001) != 0;
            font.name = readByteString(record.payload, 4, 1, encoding);
            break;
        case BiffVersion::Biff3:
        case BiffVersion::Biff4:
            font.bold = (options & 0x0001) != 0;
            font.name = readByteString(record.payload, 6, 1, encoding);
            break;
        case BiffVersion::Biff5:
            font.bold = record.u16(6) >= 700;
            font.name = readByteString(record.payload, 14, 1, encoding);
            break;
        case BiffVersion::Biff8:
            font.bold = record.u16(6) >= 700;
            font.name = readShortUnicodeString(record.payload, 14);
            break;
    }
    return font;
}

FormatInfo decodeFormat(const Record& record, BiffVersion version, const TextEncoding& encoding,
                        uint16_t implicit_index) {
    FormatInfo info;
    if (record.id == RecordType::FORMAT_V23) {
        info.index = implicit_index;
        info.pattern = readByteString(record.payload, 0, 1, encoding);
        return info;
    }
    info.index = record.u16(0);
    info.pattern = isBiff8(version) ? readUnicodeString(record.payload, 2)
                                    : readByteString(record.payload, 2, 1, encoding);
    return info;
}

std::string decodeStringRecord(const Record& record, BiffVersion version, const TextEncoding& encoding) {
    if (record.id == RecordType::STRING_V2) {
        return readByteString(record.payload, 0, 1, encoding);
    }
    if (isBiff8(version)) {
        return readUnicodeString(record.payload, 0);
    }
    return readByteString(record.payload, 0, 2, encoding);
}

// ========== 单元格 ==========

double decodeRk(uint32_t rk) {
    double value = 0.0;
    if (rk & 0x02) {
        value = static_cast<double>(static_cast<int32_t>(rk) >> 2);
    } else {
        const uint64_t bits = static_cast<uint64_t>(rk & 0xFFFFFFFCu) << 32;
        std::memcpy(&value, &bits, sizeof(value));
    }
    if (rk & 0x01) {
        value /= 100.0;
    }
    return value;
}

std::optional<CellRecord> decodeCell(const Record& record, BiffVersion version, const TextEncoding& encoding) {
    switch (record.id) {
        case RecordType::BLANK:
        case RecordType::BLANK_V2:
            return CellRecord(BlankCell{readCellRef(record, version)});

        case RecordType::MULBLANK: {
            MulBlankCell cell;
            cell.row = record.u16(0);
            cell.first_col = record.u16(2);
            cell.last_col = record.u16(record.size() >= 2 ? record.size() - 2 : 0);
            return CellRecord(cell);
        }

        case RecordType::BOOLERR:
        case RecordType::BOOLERR_V2: {
            const size_t pos = valueOffset(record);
            BoolErrCell cell;
            cell.ref = readCellRef(record, version);
            cell.value = record.u8(pos);
            cell.is_error = record.u8(pos + 1) != 0;
            return CellRecord(cell);
        }

        case RecordType::INTEGER:
        case RecordType::INTEGER_V2:
            return CellRecord(NumberCell{readCellRef(record, version),
                                         static_cast<double>(record.u16(valueOffset(record)))});

        case RecordType::NUMBER:
        case RecordType::NUMBER_V2:
            return CellRecord(NumberCell{readCellRef(record, version), record.f64(valueOffset(record))});

        case RecordType::RK:
            return CellRecord(NumberCell{readCellRef(record, version), decodeRk(record.u32(6))});

        case RecordType::MULRK:
            return CellRecord(decodeMulRk(record));

        case RecordType::LABEL:
        case RecordType::LABEL_V2:
        case RecordType::RSTRING:
            return CellRecord(LabelCell{readCellRef(record, version), decodeLabelText(record, version, encoding)});

        case RecordType::LABELSST:
            return CellRecord(LabelSstCell{readCellRef(record, version), record.u32(6)});

        case RecordType::FORMULA:
        case RecordType::FORMULA_V3:
        case RecordType::FORMULA_V4: {
            FormulaCell cell;
            cell.ref = readCellRef(record, version);
            cell.result = decodeFormulaResult(record, version);
            return CellRecord(std::move(cell));
        }

        default:
            return std::nullopt;
    }
}

}} // namespace fastxls::biff
