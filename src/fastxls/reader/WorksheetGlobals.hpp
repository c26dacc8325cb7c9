#pragma once

#include "fastxls/biff/RecordDecoders.hpp"
#include "fastxls/biff/RecordStream.hpp"
#include "fastxls/core/Expected.hpp"
#include "fastxls/core/ReaderOptions.hpp"
#include "fastxls/reader/HyperlinkIndex.hpp"
#include "fastxls/reader/WorkbookGlobals.hpp"

#include <optional>

namespace fastxls {
namespace reader {

/**
 * @brief 工作表头部解析结果
 */
struct SheetLayout {
    uint32_t max_row = 0;       // 不含
    uint16_t max_col = 0;       // 不含
    std::optional<biff::IndexInfo> index;
    std::optional<biff::DimensionsInfo> dimensions;
    biff::RowInfo first_row;
    size_t first_row_offset = 0;
    HyperlinkIndex hyperlinks;

    bool hasIndex() const { return index.has_value(); }
};

/**
 * @brief 解析工作表头部：BOF、INDEX、DIMENSIONS、第一条ROW、超链接
 *
 * @return 空表（INDEX 行范围为空或找不到ROW记录）或子流不是工作表时返回 std::nullopt，
 *         调用方应跳过该表；Strict 模式下的截断错误向上传递
 */
core::Result<std::optional<SheetLayout>> loadWorksheetGlobals(biff::RecordStream& stream,
                                                              const WorksheetDescriptor& sheet,
                                                              const core::ReaderOptions& options);

}} // namespace fastxls::reader
