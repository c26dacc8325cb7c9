#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace fastxls {
namespace biff {

/**
 * @brief 数字格式的分类结果
 */
enum class FormatClass : uint8_t {
    Numeric,    // 保持数值
    Date,       // 按OA日期转换
    Text        // "@"：按十进制字符串输出
};

/**
 * @brief 数字格式分类器
 *
 * 内置格式按固定表分类；自定义格式通过扫描格式串中的日期/时间记号判断。
 */
class FormatClassifier {
public:
    static constexpr uint16_t kGeneral = 0;
    static constexpr uint16_t kDefaultDate = 14;
    static constexpr uint16_t kText = 49;

    /**
     * @brief 内置格式分类
     * @return 不属于内置表（需要查自定义格式）时返回 std::nullopt
     */
    static std::optional<FormatClass> builtinClass(uint16_t code);

    /**
     * @brief 判断自定义格式串是否为日期/时间格式
     *
     * 只检查第一节（第一个未转义的分号之前）；引号文本、反斜杠转义、
     * _x / *x 占位以及方括号内的颜色、区域设置被忽略，
     * 但 [h] [mm] [ss] 这类经过时间记号视为时间。
     */
    static bool isDatePattern(const std::string& pattern);
};

}} // namespace fastxls::biff
