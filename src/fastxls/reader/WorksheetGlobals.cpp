#include "fastxls/reader/WorksheetGlobals.hpp"
#include "fastxls/utils/ModuleLoggers.hpp"

namespace fastxls {
namespace reader {

namespace RecordType = biff::RecordType;
using biff::Record;

namespace {

constexpr uint32_t kBiff8MaxRows = 65536;
constexpr uint32_t kLegacyMaxRows = 16384;

using SkipSheet = std::optional<SheetLayout>;

} // namespace

core::Result<std::optional<SheetLayout>> loadWorksheetGlobals(biff::RecordStream& stream,
                                                              const WorksheetDescriptor& sheet,
                                                              const core::ReaderOptions& options) {
    stream.seek(sheet.data_offset);

    auto bof = stream.readNext();
    if (!bof) {
        return bof.error();
    }
    if (!bof.value() || !biff::isBofRecord(bof.value()->id) ||
        biff::decodeBof(*bof.value()).type != biff::SubstreamType::Worksheet) {
        READER_WARN("Sheet '{}' at offset {} does not start with a worksheet BOF", sheet.name, sheet.data_offset);
        return SkipSheet{};
    }

    SheetLayout layout;

    // INDEX 紧跟 BOF，前面可能有一条 UNCALCED
    auto next = stream.readNext();
    if (!next) {
        return next.error();
    }
    if (!next.value()) {
        return SkipSheet{};
    }
    if (next.value()->id == RecordType::UNCALCED) {
        next = stream.readNext();
        if (!next) {
            return next.error();
        }
        if (!next.value()) {
            return SkipSheet{};
        }
    }
    if (next.value()->id == RecordType::INDEX) {
        layout.index = biff::decodeIndex(*next.value(), sheet.version);
    } else {
        stream.seek(next.value()->offset);
    }

    // DIMENSIONS 可能出现在第一条ROW之后，遇到ROW就停止
    std::optional<Record> row_record;
    bool sheet_ended = false;
    while (true) {
        auto rec = stream.readNext();
        if (!rec) {
            return rec.error();
        }
        if (!rec.value() || rec.value()->id == RecordType::EOF_RECORD) {
            sheet_ended = true;
            break;
        }
        if (biff::isDimensionsRecord(rec.value()->id)) {
            layout.dimensions = biff::decodeDimensions(*rec.value(), sheet.version);
            break;
        }
        if (biff::isRowRecord(rec.value()->id)) {
            row_record = *rec.value();
            break;
        }
    }

    // 不能越过本表的EOF读到下一张表
    while (!row_record && !sheet_ended) {
        auto rec = stream.readNext();
        if (!rec) {
            return rec.error();
        }
        if (!rec.value() || rec.value()->id == RecordType::EOF_RECORD) {
            break;
        }
        if (biff::isRowRecord(rec.value()->id)) {
            row_record = *rec.value();
        }
    }

    if (row_record) {
        layout.first_row = biff::decodeRow(*row_record);
        layout.first_row_offset = row_record->offset;
    }

    if (layout.dimensions) {
        layout.max_row = layout.dimensions->last_row;
        layout.max_col = layout.dimensions->last_col;
        if (layout.max_col == 0 && row_record) {
            layout.max_col = layout.first_row.last_col;
        }
    } else {
        layout.max_col = options.default_column_count;
        if (layout.index) {
            layout.max_row = layout.index->last_row;
        } else {
            layout.max_row = (sheet.version == biff::BiffVersion::Biff8) ? kBiff8MaxRows : kLegacyMaxRows;
        }
    }

    if (layout.index && layout.index->last_row <= layout.index->first_row) {
        READER_DEBUG("Sheet '{}' index reports an empty row range", sheet.name);
        return SkipSheet{};
    }
    if (!row_record) {
        READER_DEBUG("Sheet '{}' has no ROW record", sheet.name);
        return SkipSheet{};
    }

    if (options.attach_hyperlinks) {
        bool found = false;
        while (true) {
            auto rec = stream.readNext();
            if (!rec) {
                return rec.error();
            }
            if (!rec.value() || rec.value()->id == RecordType::EOF_RECORD) {
                break;
            }
            if (rec.value()->id == RecordType::HLINK) {
                layout.hyperlinks.add(biff::decodeHyperlink(*rec.value()));
                found = true;
            } else if (found && rec.value()->id != RecordType::HLINKTOOLTIP) {
                break;
            }
        }
    }

    READER_DEBUG("Sheet '{}': {} rows x {} cols, {}, {} hyperlinks", sheet.name, layout.max_row, layout.max_col,
                 layout.index ? "indexed" : "sequential", layout.hyperlinks.size());
    return std::optional<SheetLayout>(std::move(layout));
}

}} // namespace fastxls::reader
