#pragma once

#include <cstdint>

namespace fastxls {
namespace biff {

/**
 * @brief BIFF记录标识
 *
 * 带 _V2/_V34 后缀的是BIFF2~BIFF4的旧布局；无后缀的是BIFF5/BIFF8布局。
 */
namespace RecordType {
    // 子流边界
    constexpr uint16_t BOF = 0x0809;
    constexpr uint16_t BOF_V4 = 0x0409;
    constexpr uint16_t BOF_V3 = 0x0209;
    constexpr uint16_t BOF_V2 = 0x0009;
    constexpr uint16_t EOF_RECORD = 0x000A;  // EOF 与 <cstdio> 宏冲突

    // 工作簿全局
    constexpr uint16_t BOUNDSHEET = 0x0085;
    constexpr uint16_t CODEPAGE = 0x0042;
    constexpr uint16_t DATEMODE = 0x0022;
    constexpr uint16_t FONT = 0x0031;
    constexpr uint16_t FONT_V34 = 0x0231;
    constexpr uint16_t FORMAT = 0x041E;
    constexpr uint16_t FORMAT_V23 = 0x001E;
    constexpr uint16_t XF = 0x00E0;
    constexpr uint16_t XF_V4 = 0x0443;
    constexpr uint16_t XF_V3 = 0x0243;
    constexpr uint16_t XF_V2 = 0x0043;
    constexpr uint16_t SST = 0x00FC;
    constexpr uint16_t CONTINUE = 0x003C;
    constexpr uint16_t EXTSST = 0x00FF;
    constexpr uint16_t FILEPASS = 0x002F;
    constexpr uint16_t PROTECT = 0x0012;
    constexpr uint16_t PASSWORD = 0x0013;
    constexpr uint16_t PROT4REVPASSWORD = 0x01BC;

    // 工作表结构
    constexpr uint16_t INDEX = 0x020B;
    constexpr uint16_t UNCALCED = 0x005E;
    constexpr uint16_t DIMENSIONS = 0x0200;
    constexpr uint16_t DIMENSIONS_V2 = 0x0000;
    constexpr uint16_t ROW = 0x0208;
    constexpr uint16_t ROW_V2 = 0x0008;
    constexpr uint16_t DBCELL = 0x00D7;
    constexpr uint16_t HLINK = 0x01B8;
    constexpr uint16_t HLINKTOOLTIP = 0x0800;

    // 单元格
    constexpr uint16_t BLANK = 0x0201;
    constexpr uint16_t BLANK_V2 = 0x0001;
    constexpr uint16_t MULBLANK = 0x00BE;
    constexpr uint16_t BOOLERR = 0x0205;
    constexpr uint16_t BOOLERR_V2 = 0x0005;
    constexpr uint16_t INTEGER = 0x0202;
    constexpr uint16_t INTEGER_V2 = 0x0002;
    constexpr uint16_t NUMBER = 0x0203;
    constexpr uint16_t NUMBER_V2 = 0x0003;
    constexpr uint16_t LABEL = 0x0204;
    constexpr uint16_t LABEL_V2 = 0x0004;
    constexpr uint16_t RSTRING = 0x00D6;
    constexpr uint16_t LABELSST = 0x00FD;
    constexpr uint16_t RK = 0x027E;
    constexpr uint16_t MULRK = 0x00BD;
    constexpr uint16_t FORMULA = 0x0006;
    constexpr uint16_t FORMULA_V3 = 0x0206;
    constexpr uint16_t FORMULA_V4 = 0x0406;
    constexpr uint16_t STRING = 0x0207;
    constexpr uint16_t STRING_V2 = 0x0007;
    constexpr uint16_t SHRFMLA = 0x04BC;
    constexpr uint16_t ARRAY = 0x0221;
    constexpr uint16_t TABLEOP = 0x0236;
}

/**
 * @brief BOF记录中的子流类型
 */
enum class SubstreamType : uint16_t {
    WorkbookGlobals = 0x0005,
    VisualBasic = 0x0006,
    Worksheet = 0x0010,
    Chart = 0x0020,
    MacroSheet = 0x0040,
    Workspace = 0x0100
};

/**
 * @brief BIFF版本
 */
enum class BiffVersion : uint8_t {
    Biff2 = 2,
    Biff3 = 3,
    Biff4 = 4,
    Biff5 = 5,
    Biff8 = 8
};

inline bool isBofRecord(uint16_t id) {
    return id == RecordType::BOF || id == RecordType::BOF_V4 ||
           id == RecordType::BOF_V3 || id == RecordType::BOF_V2;
}

inline bool isRowRecord(uint16_t id) {
    return id == RecordType::ROW || id == RecordType::ROW_V2;
}

inline bool isDimensionsRecord(uint16_t id) {
    return id == RecordType::DIMENSIONS || id == RecordType::DIMENSIONS_V2;
}

/**
 * @brief 是否为携带行列号的单元格记录
 */
inline bool isCellRecord(uint16_t id) {
    switch (id) {
        case RecordType::BLANK:
        case RecordType::BLANK_V2:
        case RecordType::MULBLANK:
        case RecordType::BOOLERR:
        case RecordType::BOOLERR_V2:
        case RecordType::INTEGER:
        case RecordType::INTEGER_V2:
        case RecordType::NUMBER:
        case RecordType::NUMBER_V2:
        case RecordType::LABEL:
        case RecordType::LABEL_V2:
        case RecordType::RSTRING:
        case RecordType::LABELSST:
        case RecordType::RK:
        case RecordType::MULRK:
        case RecordType::FORMULA:
        case RecordType::FORMULA_V3:
        case RecordType::FORMULA_V4:
            return true;
        default:
            return false;
    }
}

}} // namespace fastxls::biff
