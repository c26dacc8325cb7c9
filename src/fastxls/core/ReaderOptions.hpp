#pragma once

#include <cstdint>

namespace fastxls {
namespace core {

/**
 * @brief 记录截断处理模式
 *
 * Strict：记录声明长度超出流末尾时报错；
 * Loose：截断为剩余字节继续读取（部分报表工具生成的文件需要）。
 */
enum class ReadMode : uint8_t {
    Strict = 0,
    Loose = 1
};

/**
 * @brief 读取器选项配置结构体，构造时确定，之后不可修改
 */
struct ReaderOptions {
    ReadMode mode = ReadMode::Strict;      // 截断处理模式
    bool convert_dates = true;             // 按格式把数字转换为日期
    bool attach_hyperlinks = true;         // 为单元格附加超链接
    bool include_hidden_sheets = true;     // 是否输出隐藏工作表
    uint16_t default_column_count = 256;   // 缺少DIMENSIONS记录时的列宽
};

}} // namespace fastxls::core
