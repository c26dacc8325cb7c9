#pragma once

#include "fastxls/biff/Record.hpp"
#include "fastxls/biff/RecordType.hpp"

#include <array>
#include <cstdint>
#include <optional>

namespace fastxls {
namespace biff {

/**
 * @brief XF记录的字节布局
 */
enum class XfLayout : uint8_t {
    V2,     // XF_V2 (BIFF2)
    V3,     // XF_V3 (BIFF3)
    V4,     // XF_V4 (BIFF4)
    V5,     // XF (BIFF5/7)
    V8      // XF (BIFF8)
};

/**
 * @brief 扩展格式记录（只保留数字格式解析需要的前若干字节）
 */
class ExtendedFormat {
public:
    static constexpr size_t kKeptBytes = 12;

    /**
     * @brief 从 XF / XF_V2 / XF_V3 / XF_V4 记录构造
     * @param version 工作簿BOF版本，决定 XF 记录按 BIFF5 还是 BIFF8 解释
     */
    static ExtendedFormat fromRecord(const Record& record, BiffVersion version);

    XfLayout layout() const { return layout_; }
    uint16_t fontIndex() const;

    /**
     * @brief 解析数字格式代码
     * @return "使用非默认数字格式"标志未设置时返回 std::nullopt，数值保持原样
     */
    std::optional<uint16_t> formatCode() const;

private:
    uint8_t byteAt(size_t pos) const { return pos < bytes_.size() ? bytes_[pos] : 0; }

    XfLayout layout_ = XfLayout::V8;
    std::array<uint8_t, kKeptBytes> bytes_{};
};

}} // namespace fastxls::biff
