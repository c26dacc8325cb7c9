#pragma once

#include "fastxls/core/span.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace fastxls {
namespace biff {

/**
 * @brief 工作簿的文本编码（由 CODEPAGE 记录决定）
 *
 * 所有解码结果统一为 UTF-8。非Unicode代码页通过 iconv 转换，
 * UTF-16 数据通过 utf8cpp 转换。
 */
class TextEncoding {
public:
    static constexpr uint16_t kDefaultCodePage = 1252;

    /**
     * @brief 默认编码 CP1252
     */
    TextEncoding();

    /**
     * @brief 按代码页构造
     * @return 代码页未知或 iconv 不支持时返回 std::nullopt
     */
    static std::optional<TextEncoding> fromCodePage(uint16_t code_page);

    uint16_t codePage() const { return code_page_; }
    const std::string& iconvName() const { return iconv_name_; }

    /**
     * @brief 将代码页字节解码为 UTF-8
     *
     * iconv 打开失败时按 Latin-1 解码，无效字节序列以 U+FFFD 替代。
     */
    std::string decode(core::ByteView bytes) const;

    static std::string decodeLatin1(core::ByteView bytes);
    static std::string decodeUtf16(core::ByteView bytes);

    /**
     * @brief 代码页到 iconv 编码名；未知代码页返回 nullptr
     */
    static const char* iconvNameFor(uint16_t code_page);

private:
    TextEncoding(uint16_t code_page, std::string iconv_name);

    uint16_t code_page_;
    std::string iconv_name_;
};

}} // namespace fastxls::biff
