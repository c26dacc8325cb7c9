#pragma once

#include "fastxls/biff/Record.hpp"

#include <cstdint>
#include <string>

namespace fastxls {
namespace biff {

/**
 * @brief HLINK 记录解码结果
 */
struct Hyperlink {
    uint16_t first_row = 0;
    uint16_t last_row = 0;
    uint16_t first_col = 0;
    uint16_t last_col = 0;

    std::string display_name;
    std::string frame;
    std::string url;            // URL或文件路径
    std::string location;       // 文档内位置（#后的部分）

    bool contains(uint16_t row, uint16_t col) const {
        return row >= first_row && row <= last_row && col >= first_col && col <= last_col;
    }

    /**
     * @brief 链接目标：url、url#location 或单独的 location
     */
    std::string target() const;
};

/**
 * @brief 解码 HLINK 记录
 *
 * 支持 URL 名字对象、文件名字对象、以字符串保存的名字对象以及位置字符串；
 * 无法识别的名字对象只保留位置部分。
 */
Hyperlink decodeHyperlink(const Record& record);

}} // namespace fastxls::biff
