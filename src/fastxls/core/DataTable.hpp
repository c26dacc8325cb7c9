#pragma once

#include "fastxls/core/CellValue.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fastxls {
namespace core {

/**
 * @brief 一行数据，长度等于工作表的列数，缺失单元格为 std::nullopt
 */
using Row = std::vector<std::optional<CellValue>>;

/**
 * @brief 单个工作表的表格结果
 *
 * 列名为从0开始的列序号字符串（"0", "1", ...）。
 */
class DataTable {
public:
    explicit DataTable(std::string name, size_t column_count = 0);

    const std::string& getName() const { return name_; }

    size_t getColumnCount() const { return column_names_.size(); }
    const std::vector<std::string>& getColumnNames() const { return column_names_; }

    size_t getRowCount() const { return rows_.size(); }
    const std::vector<Row>& getRows() const { return rows_; }
    const Row& getRow(size_t index) const { return rows_.at(index); }

    /**
     * @brief 读取单元格；行号越界抛 std::out_of_range，列越界返回空
     */
    const std::optional<CellValue>& getCell(size_t row, size_t column) const;

    /**
     * @brief 追加一行，长度按列数补齐或截断
     */
    void addRow(Row row);

private:
    std::string name_;
    std::vector<std::string> column_names_;
    std::vector<Row> rows_;
};

/**
 * @brief 工作簿的全部表格结果，顺序与工作表在文档中的顺序一致
 */
class DataSet {
public:
    DataSet() = default;

    void addTable(DataTable table) { tables_.push_back(std::move(table)); }

    size_t getTableCount() const { return tables_.size(); }
    const std::vector<DataTable>& getTables() const { return tables_; }
    const DataTable& getTable(size_t index) const { return tables_.at(index); }

    // 按名称查找，未找到返回nullptr
    const DataTable* findTable(const std::string& name) const;

private:
    std::vector<DataTable> tables_;
};

}} // namespace fastxls::core
