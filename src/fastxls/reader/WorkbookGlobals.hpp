#pragma once

#include "fastxls/biff/ExtendedFormat.hpp"
#include "fastxls/biff/RecordDecoders.hpp"
#include "fastxls/biff/RecordStream.hpp"
#include "fastxls/biff/SharedStringTable.hpp"
#include "fastxls/biff/TextEncoding.hpp"
#include "fastxls/core/Expected.hpp"

#include <map>
#include <string>
#include <vector>

namespace fastxls {
namespace reader {

/**
 * @brief 工作簿目录中的一张工作表
 */
struct WorksheetDescriptor {
    size_t index = 0;               // 在工作表目录中的序号
    std::string name;
    uint32_t data_offset = 0;       // 工作表BOF在工作簿流中的位置
    biff::SheetVisibility visibility = biff::SheetVisibility::Visible;
    biff::BiffVersion version = biff::BiffVersion::Biff8;

    bool isHidden() const { return visibility != biff::SheetVisibility::Visible; }
};

/**
 * @brief 工作簿全局数据，全局区解析完成后只读
 */
struct WorkbookGlobals {
    biff::BiffVersion version = biff::BiffVersion::Biff8;
    std::vector<WorksheetDescriptor> sheets;
    biff::SharedStringTable shared_strings;
    std::vector<biff::ExtendedFormat> extended_formats;
    std::map<uint16_t, std::string> custom_formats;     // 格式代码 -> 格式串（代码可不连续）
    std::vector<biff::FontInfo> fonts;
    biff::TextEncoding encoding;
    bool date1904 = false;
    bool is_protected = false;

    /**
     * @brief 按格式代码查找自定义格式串
     */
    const std::string* findCustomFormat(uint16_t code) const {
        auto it = custom_formats.find(code);
        return it != custom_formats.end() ? &it->second : nullptr;
    }

    // 第一条FONT记录为工作簿默认字体
    const biff::FontInfo* defaultFont() const {
        return fonts.empty() ? nullptr : &fonts.front();
    }
};

/**
 * @brief 从流起点解析工作簿全局区，直到全局区 EOF
 *
 * 失败情况：首条记录不是全局区BOF（InvalidWorkbookGlobals），
 * 遇到 FILEPASS（EncryptedWorkbook），Strict 模式下记录截断（RecordTruncated）。
 */
core::Result<WorkbookGlobals> loadWorkbookGlobals(biff::RecordStream& stream);

}} // namespace fastxls::reader
