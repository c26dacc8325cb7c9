#pragma once

#include "fastxls/biff/Hyperlink.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fastxls {
namespace reader {

/**
 * @brief 单张工作表的超链接索引：(行, 列) -> 目标
 *
 * 单单元格链接放入精确映射，区域链接按范围顺序查找。先添加的链接优先。
 */
class HyperlinkIndex {
public:
    void add(const biff::Hyperlink& link);

    std::optional<std::string> find(uint16_t row, uint16_t col) const;

    size_t size() const { return cells_.size() + ranges_.size(); }
    bool empty() const { return cells_.empty() && ranges_.empty(); }

private:
    std::map<std::pair<uint16_t, uint16_t>, std::string> cells_;
    std::vector<biff::Hyperlink> ranges_;
};

}} // namespace fastxls::reader
