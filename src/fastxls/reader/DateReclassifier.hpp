#pragma once

#include "fastxls/biff/FormatClassifier.hpp"
#include "fastxls/core/CellValue.hpp"
#include "fastxls/reader/WorkbookGlobals.hpp"

#include <optional>
#include <string>

namespace fastxls {
namespace reader {

/**
 * @brief 根据单元格的XF判断数值是否为日期/时间
 *
 * 解析顺序：XF索引 -> 数字格式代码 -> 内置格式表 / 自定义格式串。
 * XF 索引超出 XF 表时直接把索引当作格式代码。
 */
class DateReclassifier {
public:
    explicit DateReclassifier(const WorkbookGlobals& globals);

    /**
     * @brief 解析格式代码
     * @return XF 未设置"使用数字格式"标志时返回 std::nullopt
     */
    std::optional<uint16_t> resolveFormatCode(uint16_t xf_index) const;

    /**
     * @brief 格式代码分类；无法解析的自定义格式按数值处理
     */
    biff::FormatClass classify(uint16_t format_code) const;

    /**
     * @brief 数值入口：返回数值、日期或文本形式的单元格值
     */
    core::CellValue reclassify(double value, uint16_t xf_index) const;

    /**
     * @brief 字符串入口：先按浮点数解析，失败时原样返回文本
     */
    core::CellValue reclassify(const std::string& text, uint16_t xf_index) const;

private:
    const WorkbookGlobals& globals_;
};

}} // namespace fastxls::reader
