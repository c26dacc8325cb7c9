#pragma once

#include "fastxls/biff/RecordDecoders.hpp"
#include "fastxls/biff/RecordStream.hpp"
#include "fastxls/core/DataTable.hpp"
#include "fastxls/core/Expected.hpp"
#include "fastxls/core/ReaderOptions.hpp"
#include "fastxls/reader/DateReclassifier.hpp"
#include "fastxls/reader/HyperlinkIndex.hpp"
#include "fastxls/reader/WorkbookGlobals.hpp"

namespace fastxls {
namespace reader {

/**
 * @brief 把单元格记录写入行缓冲区
 *
 * 列号超出行缓冲区长度的值被丢弃；空白、错误值和未知记录不写入。
 * 写入后按 (行, 列) 查找超链接并附加到值上。
 */
class CellValueDecoder {
public:
    CellValueDecoder(const biff::RecordStream& stream,
                     const WorkbookGlobals& globals,
                     const HyperlinkIndex& hyperlinks,
                     const core::ReaderOptions& options);

    /**
     * @brief 解码一条记录并写入 row
     *
     * 公式的字符串结果在后续 STRING 记录中，需要窥视流；
     * Strict 模式下窥视遇到的截断错误向上传递。
     */
    core::VoidResult decode(const biff::Record& record, core::Row& row) const;

    const DateReclassifier& reclassifier() const { return reclassifier_; }

private:
    core::Result<std::optional<std::string>> readFormulaString(const biff::Record& formula) const;

    void writeNumber(core::Row& row, uint16_t row_index, uint16_t col, double value, uint16_t xf) const;
    void write(core::Row& row, uint16_t row_index, uint16_t col, core::CellValue value) const;

    const biff::RecordStream& stream_;
    const WorkbookGlobals& globals_;
    const HyperlinkIndex& hyperlinks_;
    const core::ReaderOptions& options_;
    DateReclassifier reclassifier_;
};

}} // namespace fastxls::reader
