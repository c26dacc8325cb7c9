#include "fastxls/reader/CellValueDecoder.hpp"
#include "fastxls/utils/ModuleLoggers.hpp"

namespace fastxls {
namespace reader {

namespace RecordType = biff::RecordType;

CellValueDecoder::CellValueDecoder(const biff::RecordStream& stream,
                                   const WorkbookGlobals& globals,
                                   const HyperlinkIndex& hyperlinks,
                                   const core::ReaderOptions& options)
    : stream_(stream)
    , globals_(globals)
    , hyperlinks_(hyperlinks)
    , options_(options)
    , reclassifier_(globals) {
}

void CellValueDecoder::write(core::Row& row, uint16_t row_index, uint16_t col, core::CellValue value) const {
    if (col >= row.size()) {
        return;
    }
    if (options_.attach_hyperlinks && !hyperlinks_.empty()) {
        auto target = hyperlinks_.find(row_index, col);
        if (target) {
            value.setHyperlink(std::move(*target));
        }
    }
    row[col] = std::move(value);
}

void CellValueDecoder::writeNumber(core::Row& row, uint16_t row_index, uint16_t col, double value,
                                   uint16_t xf) const {
    if (col >= row.size()) {
        return;
    }
    if (options_.convert_dates) {
        write(row, row_index, col, reclassifier_.reclassify(value, xf));
    } else {
        write(row, row_index, col, core::CellValue(value));
    }
}

core::Result<std::optional<std::string>> CellValueDecoder::readFormulaString(const biff::Record& formula) const {
    size_t offset = formula.endOffset();
    while (true) {
        auto next = stream_.readAt(offset);
        if (!next) {
            return next.error();
        }
        if (!next.value()) {
            return std::optional<std::string>{};
        }
        const biff::Record& rec = *next.value();
        switch (rec.id) {
            case RecordType::SHRFMLA:
            case RecordType::ARRAY:
            case RecordType::TABLEOP:
                offset = rec.endOffset();
                continue;
            case RecordType::STRING:
            case RecordType::STRING_V2:
                return std::optional<std::string>(biff::decodeStringRecord(rec, globals_.version, globals_.encoding));
            default:
                BIFF_DEBUG("Formula at {} has a string result but no STRING record", formula.offset);
                return std::optional<std::string>{};
        }
    }
}

core::VoidResult CellValueDecoder::decode(const biff::Record& record, core::Row& row) const {
    auto cell = biff::decodeCell(record, globals_.version, globals_.encoding);
    if (!cell) {
        return {};
    }

    if (std::holds_alternative<biff::BlankCell>(*cell) || std::holds_alternative<biff::MulBlankCell>(*cell)) {
        return {};
    }

    if (auto* boolerr = std::get_if<biff::BoolErrCell>(&*cell)) {
        if (!boolerr->is_error) {
            write(row, boolerr->ref.row, boolerr->ref.col, core::CellValue(boolerr->value != 0));
        }
        return {};
    }

    if (auto* number = std::get_if<biff::NumberCell>(&*cell)) {
        writeNumber(row, number->ref.row, number->ref.col, number->value, number->ref.xf);
        return {};
    }

    if (auto* label = std::get_if<biff::LabelCell>(&*cell)) {
        write(row, label->ref.row, label->ref.col, core::CellValue(std::move(label->text)));
        return {};
    }

    if (auto* sst = std::get_if<biff::LabelSstCell>(&*cell)) {
        if (sst->ref.col >= row.size()) {
            return {};
        }
        auto text = globals_.shared_strings.getString(sst->sst_index);
        if (!text) {
            READER_WARN("Cell ({}, {}): {}", sst->ref.row, sst->ref.col, text.error().message);
            return {};
        }
        write(row, sst->ref.row, sst->ref.col, core::CellValue(std::move(text).value()));
        return {};
    }

    if (auto* mulrk = std::get_if<biff::MulRkCell>(&*cell)) {
        for (size_t i = 0; i < mulrk->values.size(); ++i) {
            const size_t col = static_cast<size_t>(mulrk->first_col) + i;
            if (col >= row.size()) {
                break;
            }
            writeNumber(row, mulrk->row, static_cast<uint16_t>(col), mulrk->values[i].value, mulrk->values[i].xf);
        }
        return {};
    }

    if (auto* formula = std::get_if<biff::FormulaCell>(&*cell)) {
        const biff::CellRef& ref = formula->ref;
        if (auto* number = std::get_if<double>(&formula->result)) {
            writeNumber(row, ref.row, ref.col, *number, ref.xf);
        } else if (auto* flag = std::get_if<bool>(&formula->result)) {
            write(row, ref.row, ref.col, core::CellValue(*flag));
        } else if (auto* text = std::get_if<std::string>(&formula->result)) {
            write(row, ref.row, ref.col, core::CellValue(*text));
        } else if (std::holds_alternative<biff::FormulaStringPending>(formula->result)) {
            if (ref.col >= row.size()) {
                return {};
            }
            auto text_result = readFormulaString(record);
            if (!text_result) {
                return text_result.error();
            }
            if (text_result.value()) {
                write(row, ref.row, ref.col, core::CellValue(std::move(*text_result.value())));
            }
        }
        // FormulaError：不写入
        return {};
    }

    return {};
}

}} // namespace fastxls::reader
