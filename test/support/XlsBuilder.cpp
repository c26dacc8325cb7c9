#include "XlsBuilder.hpp"

#include <algorithm>
#include <cstring>

namespace fastxls {
namespace test {

namespace RecordType = biff::RecordType;

// ========== ByteWriter ==========

ByteWriter& ByteWriter::u8(uint8_t value) {
    data_.push_back(value);
    return *this;
}

ByteWriter& ByteWriter::u16(uint16_t value) {
    data_.push_back(static_cast<uint8_t>(value & 0xFF));
    data_.push_back(static_cast<uint8_t>(value >> 8));
    return *this;
}

ByteWriter& ByteWriter::u32(uint32_t value) {
    u16(static_cast<uint16_t>(value & 0xFFFF));
    return u16(static_cast<uint16_t>(value >> 16));
}

ByteWriter& ByteWriter::f64(double value) {
    uint64_t bits = 0;
    std::memcpy(&bits, &value, sizeof(bits));
    u32(static_cast<uint32_t>(bits & 0xFFFFFFFFu));
    return u32(static_cast<uint32_t>(bits >> 32));
}

ByteWriter& ByteWriter::bytes(const Bytes& data) {
    data_.insert(data_.end(), data.begin(), data.end());
    return *this;
}

ByteWriter& ByteWriter::zeros(size_t count) {
    data_.insert(data_.end(), count, 0);
    return *this;
}

ByteWriter& ByteWriter::utf16(const std::u16string& text) {
    for (char16_t c : text) {
        u16(static_cast<uint16_t>(c));
    }
    return *this;
}

ByteWriter& ByteWriter::unicodeString(const std::string& latin1) {
    u16(static_cast<uint16_t>(latin1.size()));
    u8(0);
    data_.insert(data_.end(), latin1.begin(), latin1.end());
    return *this;
}

ByteWriter& ByteWriter::shortUnicodeString(const std::string& latin1) {
    u8(static_cast<uint8_t>(latin1.size()));
    u8(0);
    data_.insert(data_.end(), latin1.begin(), latin1.end());
    return *this;
}

// ========== RecordWriter ==========

size_t RecordWriter::record(uint16_t id, const Bytes& payload) {
    return rawRecord(id, static_cast<uint16_t>(payload.size()), payload);
}

size_t RecordWriter::rawRecord(uint16_t id, uint16_t declared_size, const Bytes& payload) {
    const size_t offset = data_.size();
    ByteWriter header;
    header.u16(id).u16(declared_size);
    data_.insert(data_.end(), header.data().begin(), header.data().end());
    data_.insert(data_.end(), payload.begin(), payload.end());
    return offset;
}

void RecordWriter::patchU32(size_t offset, uint32_t value) {
    for (size_t i = 0; i < 4 && offset + i < data_.size(); ++i) {
        data_[offset + i] = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
    }
}

// ========== 记录负载 ==========

Bytes bofPayload(biff::SubstreamType type, uint16_t version) {
    ByteWriter w;
    w.u16(version).u16(static_cast<uint16_t>(type)).u16(0x0DBB).u16(0x07CC);
    if (version >= 0x0600) {
        w.u32(0).u32(0x06);
    }
    return w.take();
}

Bytes boundSheetPayload(uint32_t offset, const std::string& name, uint8_t visibility, uint8_t sheet_type) {
    ByteWriter w;
    w.u32(offset).u8(visibility).u8(sheet_type).shortUnicodeString(name);
    return w.take();
}

Bytes indexPayload(uint32_t first_row, uint32_t last_row, const std::vector<uint32_t>& dbcells) {
    ByteWriter w;
    w.u32(0).u32(first_row).u32(last_row).u32(0);
    for (uint32_t address : dbcells) {
        w.u32(address);
    }
    return w.take();
}

Bytes dimensionsPayload(uint32_t first_row, uint32_t last_row, uint16_t first_col, uint16_t last_col) {
    ByteWriter w;
    w.u32(first_row).u32(last_row).u16(first_col).u16(last_col).u16(0);
    return w.take();
}

Bytes rowPayload(uint16_t row, uint16_t first_col, uint16_t last_col) {
    ByteWriter w;
    w.u16(row).u16(first_col).u16(last_col).u16(0x00FF).u16(0).u16(0).u32(0x0100);
    return w.take();
}

Bytes dbcellPayload(uint32_t back_offset) {
    ByteWriter w;
    w.u32(back_offset);
    return w.take();
}

Bytes numberPayload(uint16_t row, uint16_t col, uint16_t xf, double value) {
    ByteWriter w;
    w.u16(row).u16(col).u16(xf).f64(value);
    return w.take();
}

Bytes rkPayload(uint16_t row, uint16_t col, uint16_t xf, uint32_t rk) {
    ByteWriter w;
    w.u16(row).u16(col).u16(xf).u32(rk);
    return w.take();
}

Bytes mulrkPayload(uint16_t row, uint16_t first_col, const std::vector<std::pair<uint16_t, uint32_t>>& values) {
    ByteWriter w;
    w.u16(row).u16(first_col);
    for (const auto& value : values) {
        w.u16(value.first).u32(value.second);
    }
    w.u16(static_cast<uint16_t>(first_col + values.size() - 1));
    return w.take();
}

Bytes mulblankPayload(uint16_t row, uint16_t first_col, uint16_t last_col) {
    ByteWriter w;
    w.u16(row).u16(first_col);
    for (uint16_t c = first_col; c <= last_col; ++c) {
        w.u16(0);
    }
    w.u16(last_col);
    return w.take();
}

Bytes labelPayload(uint16_t row, uint16_t col, uint16_t xf, const std::string& text) {
    ByteWriter w;
    w.u16(row).u16(col).u16(xf).unicodeString(text);
    return w.take();
}

Bytes labelSstPayload(uint16_t row, uint16_t col, uint16_t xf, uint32_t index) {
    ByteWriter w;
    w.u16(row).u16(col).u16(xf).u32(index);
    return w.take();
}

Bytes boolErrPayload(uint16_t row, uint16_t col, uint16_t xf, uint8_t value, bool is_error) {
    ByteWriter w;
    w.u16(row).u16(col).u16(xf).u8(value).u8(is_error ? 1 : 0);
    return w.take();
}

Bytes blankPayload(uint16_t row, uint16_t col, uint16_t xf) {
    ByteWriter w;
    w.u16(row).u16(col).u16(xf);
    return w.take();
}

Bytes formulaNumberPayload(uint16_t row, uint16_t col, uint16_t xf, double value) {
    ByteWriter w;
    w.u16(row).u16(col).u16(xf).f64(value).u16(0).u32(0).u16(0);
    return w.take();
}

Bytes formulaSpecialPayload(uint16_t row, uint16_t col, uint16_t xf, uint8_t type, uint8_t value) {
    ByteWriter w;
    w.u16(row).u16(col).u16(xf);
    w.u8(type).u8(0).u8(value).u8(0).u16(0).u16(0xFFFF);
    w.u16(0).u32(0).u16(0);
    return w.take();
}

Bytes stringPayload(const std::string& text) {
    ByteWriter w;
    w.unicodeString(text);
    return w.take();
}

Bytes xfPayload(uint16_t format_code, bool format_used) {
    ByteWriter w;
    w.u16(0).u16(format_code).u16(0x0001).u8(0x20).u8(0).u8(0);
    w.u8(format_used ? 0x04 : 0x00);
    w.zeros(10);
    return w.take();
}

Bytes formatPayload(uint16_t index, const std::string& pattern) {
    ByteWriter w;
    w.u16(index).unicodeString(pattern);
    return w.take();
}

Bytes fontPayload(const std::string& name, uint16_t height, bool bold, bool italic) {
    ByteWriter w;
    w.u16(height).u16(italic ? 0x0002 : 0x0000).u16(0x7FFF).u16(bold ? 700 : 400);
    w.u16(0).u8(0).u8(0).u8(0).u8(0);
    w.shortUnicodeString(name);
    return w.take();
}

Bytes sstPayload(const std::vector<std::string>& strings) {
    ByteWriter w;
    w.u32(static_cast<uint32_t>(strings.size())).u32(static_cast<uint32_t>(strings.size()));
    for (const auto& text : strings) {
        w.unicodeString(text);
    }
    return w.take();
}

Bytes hlinkUrlPayload(uint16_t row, uint16_t col, const std::string& url) {
    static const Bytes kStdLink = {0xD0, 0xC9, 0xEA, 0x79, 0xF9, 0xBA, 0xCE, 0x11,
                                   0x8C, 0x82, 0x00, 0xAA, 0x00, 0x4B, 0xA9, 0x0B};
    static const Bytes kUrlMoniker = {0xE0, 0xC9, 0xEA, 0x79, 0xF9, 0xBA, 0xCE, 0x11,
                                      0x8C, 0x82, 0x00, 0xAA, 0x00, 0x4B, 0xA9, 0x0B};
    ByteWriter w;
    w.u16(row).u16(row).u16(col).u16(col);
    w.bytes(kStdLink).u32(2).u32(0x03);
    w.bytes(kUrlMoniker).u32(static_cast<uint32_t>((url.size() + 1) * 2));
    for (char c : url) {
        w.u16(static_cast<uint8_t>(c));
    }
    w.u16(0);
    return w.take();
}

uint32_t rkInteger(int32_t value) {
    return (static_cast<uint32_t>(value) << 2) | 0x02;
}

// ========== WorkbookWriter ==========

WorkbookWriter::WorkbookWriter(uint16_t version)
    : version_(version) {
    writer_.record(RecordType::BOF, bofPayload(biff::SubstreamType::WorkbookGlobals, version_));
}

size_t WorkbookWriter::declareSheet(const std::string& name, uint8_t visibility, uint8_t sheet_type) {
    Bytes payload;
    if (version_ >= 0x0600) {
        payload = boundSheetPayload(0, name, visibility, sheet_type);
    } else {
        ByteWriter w;
        w.u32(0).u8(visibility).u8(sheet_type).u8(static_cast<uint8_t>(name.size()));
        w.bytes(Bytes(name.begin(), name.end()));
        payload = w.take();
    }
    boundsheet_offsets_.push_back(writer_.record(RecordType::BOUNDSHEET, payload));
    return boundsheet_offsets_.size() - 1;
}

void WorkbookWriter::endGlobals() {
    writer_.record(RecordType::EOF_RECORD);
}

void WorkbookWriter::beginSheet(size_t sheet) {
    writer_.patchU32(boundsheet_offsets_.at(sheet) + 4, static_cast<uint32_t>(writer_.position()));
    writer_.record(RecordType::BOF, bofPayload(biff::SubstreamType::Worksheet, version_));
}

void WorkbookWriter::endSheet() {
    writer_.record(RecordType::EOF_RECORD);
}

size_t writeNumberBlock(RecordWriter& writer, uint16_t first_row, uint16_t end_row, uint16_t columns) {
    const size_t first_row_offset = writer.position();
    for (uint16_t r = first_row; r < end_row; ++r) {
        writer.record(RecordType::ROW, rowPayload(r, 0, columns));
    }
    for (uint16_t r = first_row; r < end_row; ++r) {
        for (uint16_t c = 0; c < columns; ++c) {
            writer.record(RecordType::NUMBER, numberPayload(r, c, 0, r * 100.0 + c));
        }
    }
    const size_t dbcell = writer.position();
    writer.record(RecordType::DBCELL, dbcellPayload(static_cast<uint32_t>(dbcell - first_row_offset)));
    return dbcell;
}

// ========== 复合文档 ==========

namespace {

constexpr size_t kSectorSize = 512;
constexpr size_t kMiniSectorSize = 64;
constexpr size_t kMiniCutoff = 4096;
constexpr uint32_t kFree = 0xFFFFFFFFu;
constexpr uint32_t kEnd = 0xFFFFFFFEu;
constexpr uint32_t kFatMark = 0xFFFFFFFDu;
constexpr uint32_t kNoStream = 0xFFFFFFFFu;

void putU16(Bytes& out, size_t pos, uint16_t value) {
    out[pos] = static_cast<uint8_t>(value & 0xFF);
    out[pos + 1] = static_cast<uint8_t>(value >> 8);
}

void putU32(Bytes& out, size_t pos, uint32_t value) {
    for (size_t i = 0; i < 4; ++i) {
        out[pos + i] = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
    }
}

class SectorAllocator {
public:
    // 追加数据并按512字节分扇区，返回起始扇区
    uint32_t place(const Bytes& data) {
        if (data.empty()) {
            return kEnd;
        }
        const size_t count = (data.size() + kSectorSize - 1) / kSectorSize;
        const uint32_t start = static_cast<uint32_t>(sectors_.size());
        for (size_t i = 0; i < count; ++i) {
            Bytes sector(kSectorSize, 0);
            const size_t begin = i * kSectorSize;
            const size_t len = std::min(kSectorSize, data.size() - begin);
            std::copy(data.begin() + begin, data.begin() + begin + len, sector.begin());
            sectors_.push_back(std::move(sector));
            fat_.push_back(i + 1 < count ? start + static_cast<uint32_t>(i) + 1 : kEnd);
        }
        return start;
    }

    // 追加FAT扇区，返回FAT扇区编号列表
    std::vector<uint32_t> finishFat() {
        const size_t per_sector = kSectorSize / 4;
        size_t fat_sectors = 1;
        while (fat_sectors * per_sector < fat_.size() + fat_sectors) {
            ++fat_sectors;
        }
        std::vector<uint32_t> ids;
        for (size_t i = 0; i < fat_sectors; ++i) {
            ids.push_back(static_cast<uint32_t>(fat_.size()));
            fat_.push_back(kFatMark);
        }
        fat_.resize(fat_sectors * per_sector, kFree);
        for (size_t i = 0; i < fat_sectors; ++i) {
            Bytes sector(kSectorSize, 0);
            for (size_t j = 0; j < per_sector; ++j) {
                putU32(sector, j * 4, fat_[i * per_sector + j]);
            }
            sectors_.push_back(std::move(sector));
        }
        return ids;
    }

    const std::vector<Bytes>& sectors() const { return sectors_; }

private:
    std::vector<Bytes> sectors_;
    std::vector<uint32_t> fat_;
};

Bytes directoryEntry(const std::string& name, uint8_t type, uint32_t right, uint32_t child,
                     uint32_t start, uint32_t size) {
    Bytes entry(128, 0);
    const size_t chars = std::min<size_t>(name.size(), 31);
    for (size_t i = 0; i < chars; ++i) {
        putU16(entry, i * 2, static_cast<uint8_t>(name[i]));
    }
    putU16(entry, 0x40, static_cast<uint16_t>((chars + 1) * 2));
    entry[0x42] = type;
    entry[0x43] = 1;
    putU32(entry, 0x44, kNoStream);
    putU32(entry, 0x48, right);
    putU32(entry, 0x4C, child);
    putU32(entry, 0x74, start);
    putU32(entry, 0x78, size);
    return entry;
}

} // namespace

Bytes buildCompoundFile(const std::vector<CompoundEntry>& entries) {
    SectorAllocator allocator;

    // 小流放入迷你流
    Bytes mini_stream;
    std::vector<uint32_t> mini_fat;
    std::vector<uint32_t> starts(entries.size(), kEnd);
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& entry = entries[i];
        if (entry.is_storage || entry.data.empty() || entry.data.size() >= kMiniCutoff) {
            continue;
        }
        const size_t count = (entry.data.size() + kMiniSectorSize - 1) / kMiniSectorSize;
        const uint32_t start = static_cast<uint32_t>(mini_fat.size());
        for (size_t s = 0; s < count; ++s) {
            mini_fat.push_back(s + 1 < count ? start + static_cast<uint32_t>(s) + 1 : kEnd);
        }
        starts[i] = start;
        mini_stream.insert(mini_stream.end(), entry.data.begin(), entry.data.end());
        mini_stream.resize(static_cast<size_t>(start + count) * kMiniSectorSize, 0);
    }

    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& entry = entries[i];
        if (!entry.is_storage && entry.data.size() >= kMiniCutoff) {
            starts[i] = allocator.place(entry.data);
        }
    }

    const uint32_t mini_stream_start = allocator.place(mini_stream);

    Bytes mini_fat_bytes(mini_fat.size() * 4, 0);
    for (size_t i = 0; i < mini_fat.size(); ++i) {
        putU32(mini_fat_bytes, i * 4, mini_fat[i]);
    }
    const size_t mini_fat_sectors = (mini_fat_bytes.size() + kSectorSize - 1) / kSectorSize;
    if (!mini_fat_bytes.empty()) {
        mini_fat_bytes.resize(mini_fat_sectors * kSectorSize, 0xFF);
    }
    const uint32_t mini_fat_start = allocator.place(mini_fat_bytes);

    Bytes directory;
    const uint32_t root_child = entries.empty() ? kNoStream : 1;
    Bytes root = directoryEntry("Root Entry", 5, kNoStream, root_child, mini_stream_start,
                                static_cast<uint32_t>(mini_stream.size()));
    directory.insert(directory.end(), root.begin(), root.end());
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& entry = entries[i];
        const uint32_t right = (i + 1 < entries.size()) ? static_cast<uint32_t>(i + 2) : kNoStream;
        Bytes dir = directoryEntry(entry.name, entry.is_storage ? 1 : 2, right, kNoStream,
                                   entry.is_storage ? kEnd : starts[i],
                                   entry.is_storage ? 0 : static_cast<uint32_t>(entry.data.size()));
        directory.insert(directory.end(), dir.begin(), dir.end());
    }
    const uint32_t directory_start = allocator.place(directory);

    const std::vector<uint32_t> fat_ids = allocator.finishFat();

    Bytes header(kSectorSize, 0);
    const uint8_t signature[8] = {0xD0, 0xCF, 0x11, 0xE0, 0xA1, 0xB1, 0x1A, 0xE1};
    std::copy(signature, signature + 8, header.begin());
    putU16(header, 0x18, 0x003E);
    putU16(header, 0x1A, 0x0003);
    putU16(header, 0x1C, 0xFFFE);
    putU16(header, 0x1E, 9);
    putU16(header, 0x20, 6);
    putU32(header, 0x2C, static_cast<uint32_t>(fat_ids.size()));
    putU32(header, 0x30, directory_start);
    putU32(header, 0x38, static_cast<uint32_t>(kMiniCutoff));
    putU32(header, 0x3C, mini_fat.empty() ? kEnd : mini_fat_start);
    putU32(header, 0x40, static_cast<uint32_t>(mini_fat_sectors));
    putU32(header, 0x44, kEnd);
    putU32(header, 0x48, 0);
    for (size_t i = 0; i < 109; ++i) {
        putU32(header, 0x4C + i * 4, i < fat_ids.size() ? fat_ids[i] : kFree);
    }

    Bytes file = header;
    for (const auto& sector : allocator.sectors()) {
        file.insert(file.end(), sector.begin(), sector.end());
    }
    return file;
}

Bytes wrapWorkbook(const Bytes& workbook_stream, const std::string& stream_name) {
    return buildCompoundFile({CompoundEntry{stream_name, workbook_stream, false}});
}

}} // namespace fastxls::test
