#include "fastxls/reader/DateReclassifier.hpp"
#include "fastxls/utils/TimeUtils.hpp"

#include <fast_float/fast_float.h>
#include <fmt/format.h>

#include <system_error>

namespace fastxls {
namespace reader {

DateReclassifier::DateReclassifier(const WorkbookGlobals& globals)
    : globals_(globals) {
}

std::optional<uint16_t> DateReclassifier::resolveFormatCode(uint16_t xf_index) const {
    if (xf_index < globals_.extended_formats.size()) {
        return globals_.extended_formats[xf_index].formatCode();
    }
    return xf_index;
}

biff::FormatClass DateReclassifier::classify(uint16_t format_code) const {
    auto builtin = biff::FormatClassifier::builtinClass(format_code);
    if (builtin) {
        return *builtin;
    }
    const std::string* pattern = globals_.findCustomFormat(format_code);
    if (pattern != nullptr && biff::FormatClassifier::isDatePattern(*pattern)) {
        return biff::FormatClass::Date;
    }
    return biff::FormatClass::Numeric;
}

core::CellValue DateReclassifier::reclassify(double value, uint16_t xf_index) const {
    auto code = resolveFormatCode(xf_index);
    if (!code) {
        return core::CellValue(value);
    }

    switch (classify(*code)) {
        case biff::FormatClass::Date: {
            const double serial = globals_.date1904 ? value + utils::TimeUtils::kDate1904Offset : value;
            auto date = utils::TimeUtils::fromOADate(serial);
            if (date) {
                return core::CellValue(*date);
            }
            // 超出OA日期范围，保留数值
            return core::CellValue(value);
        }
        case biff::FormatClass::Text:
            return core::CellValue(fmt::format("{}", value));
        case biff::FormatClass::Numeric:
        default:
            return core::CellValue(value);
    }
}

core::CellValue DateReclassifier::reclassify(const std::string& text, uint16_t xf_index) const {
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    while (begin < end && (*begin == ' ' || *begin == '\t')) {
        ++begin;
    }
    while (end > begin && (end[-1] == ' ' || end[-1] == '\t')) {
        --end;
    }

    double value = 0.0;
    auto result = fast_float::from_chars(begin, end, value);
    if (begin == end || result.ec != std::errc{} || result.ptr != end) {
        return core::CellValue(text);
    }
    return reclassify(value, xf_index);
}

}} // namespace fastxls::reader
