#include "fastxls/core/CellValue.hpp"
#include <fmt/format.h>

namespace fastxls {
namespace core {

std::string DateTime::toString() const {
    if (millisecond != 0) {
        return fmt::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}.{:03d}",
                           year, month, day, hour, minute, second, millisecond);
    }
    return fmt::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}",
                       year, month, day, hour, minute, second);
}

CellType CellValue::getType() const noexcept {
    switch (value_.index()) {
        case 0: return CellType::Boolean;
        case 1: return CellType::Number;
        case 2: return CellType::Text;
        default: return CellType::DateTime;
    }
}

std::string CellValue::toString() const {
    struct Visitor {
        std::string operator()(bool v) const { return v ? "TRUE" : "FALSE"; }
        std::string operator()(double v) const { return fmt::format("{}", v); }
        std::string operator()(const std::string& v) const { return v; }
        std::string operator()(const DateTime& v) const { return v.toString(); }
    };
    return std::visit(Visitor{}, value_);
}

}} // namespace fastxls::core
