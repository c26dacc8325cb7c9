/**
 * @file Exception.cpp
 * @brief FastXLS异常类实现
 */

#include "Exception.hpp"
#include <fmt/format.h>

namespace fastxls {
namespace core {

FastXLSException::FastXLSException(const std::string& message,
                                   ErrorCode code,
                                   const char* file,
                                   int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

std::string FastXLSException::getDetailedMessage() const {
    if (file_ && line_ > 0) {
        return fmt::format("[{}] {} (at {}:{})", toString(error_code_), what(), file_, line_);
    }
    return fmt::format("[{}] {}", toString(error_code_), what());
}

FileException::FileException(const std::string& message, const std::string& filename,
                             ErrorCode code, const char* file, int line)
    : FastXLSException(fmt::format("{} (file: {})", message, filename), code, file, line)
    , filename_(filename) {
}

}} // namespace fastxls::core
