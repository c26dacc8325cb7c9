#pragma once

#include "fastxls/biff/Record.hpp"
#include "fastxls/biff/RecordType.hpp"
#include "fastxls/biff/TextEncoding.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace fastxls {
namespace biff {

// ========== 结构记录 ==========

struct BofInfo {
    BiffVersion version = BiffVersion::Biff8;
    SubstreamType type = SubstreamType::WorkbookGlobals;
    uint16_t raw_version = 0;
    uint16_t raw_type = 0;
};

enum class SheetVisibility : uint8_t {
    Visible = 0,
    Hidden = 1,
    VeryHidden = 2
};

struct BoundSheetInfo {
    uint32_t offset = 0;            // 工作表BOF在工作簿流中的位置
    SheetVisibility visibility = SheetVisibility::Visible;
    uint8_t sheet_type = 0;         // 0 = 工作表, 2 = 图表, 6 = VBA模块
    std::string name;

    bool isWorksheet() const { return sheet_type == 0; }
};

struct IndexInfo {
    uint32_t first_row = 0;         // rwMic
    uint32_t last_row = 0;          // rwMac，最后一行+1
    std::vector<uint32_t> dbcell_offsets;
};

struct DimensionsInfo {
    uint32_t first_row = 0;
    uint32_t last_row = 0;          // 不含
    uint16_t first_col = 0;
    uint16_t last_col = 0;          // 不含
};

struct RowInfo {
    uint16_t row = 0;
    uint16_t first_col = 0;
    uint16_t last_col = 0;          // 最后一列+1
};

struct FontInfo {
    uint16_t height = 0;            // 1/20 磅
    bool italic = false;
    bool bold = false;
    std::string name;
};

struct FormatInfo {
    uint16_t index = 0;
    std::string pattern;
};

BofInfo decodeBof(const Record& record);
BoundSheetInfo decodeBoundSheet(const Record& record, BiffVersion version, const TextEncoding& encoding);
IndexInfo decodeIndex(const Record& record, BiffVersion version);
DimensionsInfo decodeDimensions(const Record& record, BiffVersion version);
RowInfo decodeRow(const Record& record);

/**
 * @brief DBCELL 中第一个ROW记录相对本记录的回溯距离
 */
uint32_t decodeDbCell(const Record& record);

FontInfo decodeFont(const Record& record, BiffVersion version, const TextEncoding& encoding);

/**
 * @brief 解码 FORMAT / FORMAT_V23
 * @param implicit_index FORMAT_V23 不带索引，按出现顺序编号
 */
FormatInfo decodeFormat(const Record& record, BiffVersion version, const TextEncoding& encoding,
                        uint16_t implicit_index);

/**
 * @brief 解码公式后紧随的 STRING / STRING_V2 记录
 */
std::string decodeStringRecord(const Record& record, BiffVersion version, const TextEncoding& encoding);

// ========== 字符串辅助 ==========

/**
 * @brief BIFF8 XLUnicodeString：u16 字符数 + 选项字节 + 字符
 */
std::string readUnicodeString(core::ByteView bytes, size_t pos);

/**
 * @brief BIFF8 ShortXLUnicodeString：u8 字符数 + 选项字节 + 字符
 */
std::string readShortUnicodeString(core::ByteView bytes, size_t pos);

/**
 * @brief BIFF2~BIFF5 字节字符串，长度前缀为 length_bytes（1或2）字节
 */
std::string readByteString(core::ByteView bytes, size_t pos, size_t length_bytes, const TextEncoding& encoding);

// ========== 单元格记录 ==========

struct CellRef {
    uint16_t row = 0;
    uint16_t col = 0;
    uint16_t xf = 0;
};

struct BlankCell { CellRef ref; };

struct BoolErrCell {
    CellRef ref;
    uint8_t value = 0;
    bool is_error = false;
};

struct NumberCell {
    CellRef ref;
    double value = 0.0;
};

struct LabelCell {
    CellRef ref;
    std::string text;
};

struct LabelSstCell {
    CellRef ref;
    uint32_t sst_index = 0;
};

struct RkEntry {
    uint16_t xf = 0;
    double value = 0.0;
};

struct MulRkCell {
    uint16_t row = 0;
    uint16_t first_col = 0;
    uint16_t last_col = 0;
    std::vector<RkEntry> values;
};

struct MulBlankCell {
    uint16_t row = 0;
    uint16_t first_col = 0;
    uint16_t last_col = 0;
};

/// 公式缓存结果：字符串在下一条 STRING 记录中
struct FormulaStringPending {};

/// 公式缓存结果为错误值
struct FormulaError {
    uint8_t code = 0;
};

using FormulaResult = std::variant<double, std::string, bool, FormulaError, FormulaStringPending>;

struct FormulaCell {
    CellRef ref;
    FormulaResult result;
};

using CellRecord = std::variant<BlankCell, BoolErrCell, NumberCell, LabelCell, LabelSstCell,
                                MulRkCell, MulBlankCell, FormulaCell>;

/**
 * @brief 将单元格记录解码为封闭变体
 * @return 非单元格记录返回 std::nullopt
 */
std::optional<CellRecord> decodeCell(const Record& record, BiffVersion version, const TextEncoding& encoding);

/**
 * @brief 所有单元格记录的行号都位于负载偏移0
 */
inline uint16_t cellRowOf(const Record& record) { return record.u16(0); }

/**
 * @brief RK压缩数值解码
 */
double decodeRk(uint32_t rk);

}} // namespace fastxls::biff
