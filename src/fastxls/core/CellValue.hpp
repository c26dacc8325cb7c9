#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace fastxls {
namespace core {

/**
 * @brief 由OA日期序列号换算出的日历时间
 */
struct DateTime {
    int year = 1899;
    int month = 12;
    int day = 30;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int millisecond = 0;

    /**
     * @brief 格式化为 "YYYY-MM-DD HH:MM:SS"，毫秒非零时追加 ".mmm"
     */
    std::string toString() const;

    bool operator==(const DateTime& other) const {
        return year == other.year && month == other.month && day == other.day &&
               hour == other.hour && minute == other.minute && second == other.second &&
               millisecond == other.millisecond;
    }
    bool operator!=(const DateTime& other) const { return !(*this == other); }
};

/**
 * @brief 单元格类型
 */
enum class CellType : uint8_t {
    Boolean,
    Number,
    Text,
    DateTime
};

/**
 * @brief 单元格值：布尔、数字、文本或日期，外加可选的超链接目标
 *
 * 公式错误与布尔错误哨兵不会构造出 CellValue，对应列保持为空。
 */
class CellValue {
public:
    using Storage = std::variant<bool, double, std::string, DateTime>;

    CellValue() : value_(0.0) {}
    explicit CellValue(bool value) : value_(value) {}
    explicit CellValue(double value) : value_(value) {}
    explicit CellValue(std::string value) : value_(std::move(value)) {}
    explicit CellValue(const char* value) : value_(std::string(value)) {}
    explicit CellValue(const DateTime& value) : value_(value) {}

    CellType getType() const noexcept;

    bool isBoolean() const noexcept { return std::holds_alternative<bool>(value_); }
    bool isNumber() const noexcept { return std::holds_alternative<double>(value_); }
    bool isText() const noexcept { return std::holds_alternative<std::string>(value_); }
    bool isDateTime() const noexcept { return std::holds_alternative<DateTime>(value_); }

    // 调用前需先确认类型，类型不符时抛出 std::bad_variant_access
    bool asBoolean() const { return std::get<bool>(value_); }
    double asNumber() const { return std::get<double>(value_); }
    const std::string& asText() const { return std::get<std::string>(value_); }
    const DateTime& asDateTime() const { return std::get<DateTime>(value_); }

    const Storage& storage() const noexcept { return value_; }

    /**
     * @brief 替换主值，保留已附加的超链接
     */
    void setValue(Storage value) { value_ = std::move(value); }

    bool hasHyperlink() const noexcept { return hyperlink_.has_value(); }
    const std::optional<std::string>& getHyperlink() const noexcept { return hyperlink_; }
    void setHyperlink(std::string target) { hyperlink_ = std::move(target); }

    /**
     * @brief 调试输出用的文本形式
     */
    std::string toString() const;

    bool operator==(const CellValue& other) const {
        return value_ == other.value_ && hyperlink_ == other.hyperlink_;
    }
    bool operator!=(const CellValue& other) const { return !(*this == other); }

private:
    Storage value_;
    std::optional<std::string> hyperlink_;
};

}} // namespace fastxls::core
