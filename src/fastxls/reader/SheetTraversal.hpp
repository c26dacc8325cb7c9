#pragma once

#include "fastxls/biff/RecordStream.hpp"
#include "fastxls/core/DataTable.hpp"
#include "fastxls/core/Expected.hpp"
#include "fastxls/reader/CellValueDecoder.hpp"
#include "fastxls/reader/WorksheetGlobals.hpp"

#include <optional>
#include <vector>

namespace fastxls {
namespace reader {

enum class TraversalMode : uint8_t {
    Indexed,        // 通过 INDEX / DBCELL 定位每个行块
    Sequential      // 顺序扫描 ROW 记录
};

/**
 * @brief 单张工作表遍历期间的可变状态，每张表重新构造
 */
struct TraversalState {
    uint32_t depth = 0;                 // 当前行号（只增不减）
    size_t cell_offset = 0;             // 下一条单元格记录的位置
    TraversalMode mode = TraversalMode::Sequential;

    // Indexed
    std::vector<uint32_t> block_addresses;
    size_t block_cursor = 0;

    // Sequential
    size_t row_record_offset = 0;       // 最近一条ROW记录的位置
};

/**
 * @brief 行/单元格遍历引擎
 *
 * 两种模式共用同一个行循环，输出稠密的行序列：
 * 没有单元格的行以空行补齐，行号与输出序号一致。
 */
class SheetTraversal {
public:
    enum class RowEnd : uint8_t {
        NextRow,        // 遇到下一行的单元格（未消费）
        EndOfBlock,     // 遇到 DBCELL
        EndOfSheet      // 遇到 EOF 或流结束
    };

    SheetTraversal(biff::RecordStream& stream, const SheetLayout& layout, const CellValueDecoder& decoder);

    /**
     * @brief 遍历整张表并把行追加到 table
     *
     * 错误：Strict 模式截断（RecordTruncated），
     * INDEX 指向的位置找不到 DBCELL（MissingBlockBoundary）。
     */
    core::VoidResult run(core::DataTable& table);

    const TraversalState& state() const { return state_; }

private:
    core::VoidResult runIndexed(core::DataTable& table);
    core::VoidResult runSequential(core::DataTable& table);

    /**
     * @brief 读取一行：从 state_.cell_offset 起直到行结束，depth 加一
     */
    core::Result<RowEnd> readRow(core::Row& buffer);

    /**
     * @brief 定位行块第一条单元格记录的位置
     * @return 块后没有ROW记录（可用数据结束）时返回 std::nullopt
     */
    core::Result<std::optional<size_t>> locateBlockData(uint32_t address) const;

    void appendEmptyRow(core::DataTable& table);
    bool exhausted() const { return state_.depth >= layout_.max_row; }

    biff::RecordStream& stream_;
    const SheetLayout& layout_;
    const CellValueDecoder& decoder_;
    TraversalState state_;
};

}} // namespace fastxls::reader
