#include "fastxls/biff/FormatClassifier.hpp"

#include <algorithm>
#include <cctype>

namespace fastxls {
namespace biff {

namespace {

char lower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

bool isDateToken(char c) {
    switch (lower(c)) {
        case 'y':
        case 'm':
        case 'd':
        case 'h':
        case 's':
            return true;
        default:
            return false;
    }
}

// [h] [hh] [mm] [ss]：同一个时间字母重复
bool isElapsedToken(const std::string& content) {
    if (content.empty()) {
        return false;
    }
    const char first = lower(content.front());
    if (first != 'h' && first != 'm' && first != 's') {
        return false;
    }
    return std::all_of(content.begin(), content.end(), [first](char c) { return lower(c) == first; });
}

} // namespace

std::optional<FormatClass> FormatClassifier::builtinClass(uint16_t code) {
    if (code <= 13 || (code >= 37 && code <= 44) || code == 48) {
        return FormatClass::Numeric;
    }
    if ((code >= 14 && code <= 22) || (code >= 45 && code <= 47)) {
        return FormatClass::Date;
    }
    if (code == kText) {
        return FormatClass::Text;
    }
    return std::nullopt;
}

bool FormatClassifier::isDatePattern(const std::string& pattern) {
    std::string lowered(pattern);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), lower);
    if (lowered == "general") {
        return false;
    }

    for (size_t i = 0; i < pattern.size(); ++i) {
        const char c = pattern[i];
        switch (c) {
            case ';':
                return false;
            case '"': {
                const size_t close = pattern.find('"', i + 1);
                if (close == std::string::npos) {
                    return false;
                }
                i = close;
                break;
            }
            case '\\':
            case '_':
            case '*':
                ++i;
                break;
            case '[': {
                const size_t close = pattern.find(']', i + 1);
                if (close == std::string::npos) {
                    return false;
                }
                if (isElapsedToken(pattern.substr(i + 1, close - i - 1))) {
                    return true;
                }
                i = close;
                break;
            }
            default:
                if (isDateToken(c)) {
                    return true;
                }
                break;
        }
    }
    return false;
}

}} // namespace fastxls::biff
