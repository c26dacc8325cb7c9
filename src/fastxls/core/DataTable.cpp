#include "fastxls/core/DataTable.hpp"

namespace fastxls {
namespace core {

DataTable::DataTable(std::string name, size_t column_count)
    : name_(std::move(name)) {
    column_names_.reserve(column_count);
    for (size_t i = 0; i < column_count; ++i) {
        column_names_.push_back(std::to_string(i));
    }
}

const std::optional<CellValue>& DataTable::getCell(size_t row, size_t column) const {
    static const std::optional<CellValue> empty;
    const Row& r = rows_.at(row);
    if (column >= r.size()) {
        return empty;
    }
    return r[column];
}

void DataTable::addRow(Row row) {
    row.resize(column_names_.size());
    rows_.push_back(std::move(row));
}

const DataTable* DataSet::findTable(const std::string& name) const {
    for (const auto& table : tables_) {
        if (table.getName() == name) {
            return &table;
        }
    }
    return nullptr;
}

}} // namespace fastxls::core
