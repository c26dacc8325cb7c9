#include "fastxls/reader/SheetTraversal.hpp"
#include "fastxls/utils/ModuleLoggers.hpp"

namespace fastxls {
namespace reader {

namespace RecordType = biff::RecordType;
using biff::Record;

SheetTraversal::SheetTraversal(biff::RecordStream& stream, const SheetLayout& layout,
                               const CellValueDecoder& decoder)
    : stream_(stream)
    , layout_(layout)
    , decoder_(decoder) {
}

core::VoidResult SheetTraversal::run(core::DataTable& table) {
    state_ = TraversalState{};
    if (layout_.hasIndex()) {
        state_.mode = TraversalMode::Indexed;
        state_.block_addresses = layout_.index->dbcell_offsets;
        return runIndexed(table);
    }
    state_.mode = TraversalMode::Sequential;
    state_.row_record_offset = layout_.first_row_offset;
    return runSequential(table);
}

void SheetTraversal::appendEmptyRow(core::DataTable& table) {
    table.addRow(core::Row(layout_.max_col));
    ++state_.depth;
}

core::Result<SheetTraversal::RowEnd> SheetTraversal::readRow(core::Row& buffer) {
    buffer.assign(layout_.max_col, std::nullopt);
    RowEnd end = RowEnd::EndOfSheet;

    while (true) {
        auto next = stream_.readAt(state_.cell_offset);
        if (!next) {
            return next.error();
        }
        if (!next.value()) {
            end = RowEnd::EndOfSheet;
            break;
        }
        const Record& rec = *next.value();
        state_.cell_offset = rec.endOffset();

        if (rec.id == RecordType::DBCELL) {
            end = RowEnd::EndOfBlock;
            break;
        }
        if (rec.id == RecordType::EOF_RECORD) {
            end = RowEnd::EndOfSheet;
            break;
        }
        if (!biff::isCellRecord(rec.id)) {
            continue;
        }

        const uint16_t row = biff::cellRowOf(rec);
        if (row > state_.depth) {
            // 属于后面的行，回退让下一行从这里开始
            state_.cell_offset = rec.offset;
            end = RowEnd::NextRow;
            break;
        }
        if (row < state_.depth) {
            READER_TRACE("Skipping stale cell record for row {} at depth {}", row, state_.depth);
            continue;
        }

        auto decoded = decoder_.decode(rec, buffer);
        if (!decoded) {
            return decoded.error();
        }
    }

    ++state_.depth;
    return end;
}

core::Result<std::optional<size_t>> SheetTraversal::locateBlockData(uint32_t address) const {
    size_t offset = address;
    std::optional<Record> dbcell;
    while (!dbcell) {
        auto next = stream_.readAt(offset);
        if (!next) {
            return next.error();
        }
        if (!next.value() || next.value()->id == RecordType::EOF_RECORD) {
            return core::makeError(core::ErrorCode::MissingBlockBoundary,
                                   core::toString(core::ErrorCode::MissingBlockBoundary),
                                   fmt::format("index address {}", address));
        }
        if (next.value()->id == RecordType::DBCELL) {
            dbcell = *next.value();
        } else {
            offset = next.value()->endOffset();
        }
    }

    const uint32_t back = biff::decodeDbCell(*dbcell);
    if (back > dbcell->offset) {
        return core::makeError(core::ErrorCode::MissingBlockBoundary,
                               fmt::format("DBCELL at {} points {} bytes before the stream", dbcell->offset, back));
    }

    size_t row_offset = dbcell->offset - back;
    bool found_row = false;
    while (true) {
        auto next = stream_.readAt(row_offset);
        if (!next) {
            return next.error();
        }
        if (!next.value() || !biff::isRowRecord(next.value()->id)) {
            break;
        }
        found_row = true;
        row_offset = next.value()->endOffset();
    }

    if (!found_row) {
        return std::optional<size_t>{};
    }
    return std::optional<size_t>(row_offset);
}

core::VoidResult SheetTraversal::runIndexed(core::DataTable& table) {
    core::Row buffer;
    for (; state_.block_cursor < state_.block_addresses.size() && !exhausted(); ++state_.block_cursor) {
        const uint32_t address = state_.block_addresses[state_.block_cursor];
        auto located = locateBlockData(address);
        if (!located) {
            return located.error();
        }
        if (!located.value()) {
            READER_DEBUG("No ROW record after block {}, end of data", state_.block_cursor);
            return {};
        }
        state_.cell_offset = *located.value();

        while (!exhausted()) {
            auto end = readRow(buffer);
            if (!end) {
                return end.error();
            }
            table.addRow(buffer);
            if (end.value() == RowEnd::EndOfBlock) {
                break;
            }
            if (end.value() == RowEnd::EndOfSheet) {
                return {};
            }
        }
    }
    return {};
}

core::VoidResult SheetTraversal::runSequential(core::DataTable& table) {
    core::Row buffer;
    size_t scan = state_.row_record_offset;

    while (!exhausted()) {
        // 下一条行号不小于当前深度的ROW记录
        std::optional<Record> row_record;
        for (size_t offset = scan; !row_record;) {
            auto next = stream_.readAt(offset);
            if (!next) {
                return next.error();
            }
            if (!next.value() || next.value()->id == RecordType::EOF_RECORD) {
                break;
            }
            if (biff::isRowRecord(next.value()->id) && biff::decodeRow(*next.value()).row >= state_.depth) {
                row_record = *next.value();
            } else {
                offset = next.value()->endOffset();
            }
        }
        if (!row_record) {
            return {};
        }

        state_.row_record_offset = row_record->offset;
        scan = row_record->endOffset();

        const uint16_t target_row = biff::decodeRow(*row_record).row;
        while (state_.depth < target_row && !exhausted()) {
            appendEmptyRow(table);
        }
        if (exhausted()) {
            break;
        }

        // 该行的第一条单元格记录
        std::optional<Record> first_cell;
        for (size_t offset = scan; !first_cell;) {
            auto next = stream_.readAt(offset);
            if (!next) {
                return next.error();
            }
            if (!next.value() || next.value()->id == RecordType::EOF_RECORD) {
                break;
            }
            if (biff::isCellRecord(next.value()->id) && biff::cellRowOf(*next.value()) >= state_.depth) {
                first_cell = *next.value();
            } else {
                offset = next.value()->endOffset();
            }
        }
        if (!first_cell) {
            return {};
        }
        if (biff::cellRowOf(*first_cell) > state_.depth) {
            // ROW记录存在但该行没有单元格
            appendEmptyRow(table);
            continue;
        }

        state_.cell_offset = first_cell->offset;
        auto end = readRow(buffer);
        if (!end) {
            return end.error();
        }
        table.addRow(buffer);
        if (end.value() == RowEnd::EndOfSheet) {
            return {};
        }
    }
    return {};
}

}} // namespace fastxls::reader
