/**
 * @file Exception.hpp
 * @brief FastXLS异常类定义
 */

#pragma once

#include <stdexcept>
#include <string>
#include "ErrorCode.hpp"

namespace fastxls {
namespace core {

/**
 * @brief FastXLS基础异常类
 */
class FastXLSException : public std::runtime_error {
public:
    /**
     * @brief 构造函数
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的文件名
     * @param line 发生错误的行号
     */
    FastXLSException(const std::string& message,
                     ErrorCode code = ErrorCode::InternalError,
                     const char* file = nullptr,
                     int line = 0);

    ErrorCode getErrorCode() const noexcept { return error_code_; }

    /**
     * @brief 获取详细错误信息（含错误码与源码位置）
     */
    std::string getDetailedMessage() const;

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
};

/**
 * @brief 文件相关异常
 */
class FileException : public FastXLSException {
public:
    FileException(const std::string& message, const std::string& filename,
                  ErrorCode code = ErrorCode::FileNotFound,
                  const char* file = nullptr, int line = 0);

    const std::string& getFilename() const { return filename_; }

private:
    std::string filename_;
};

}} // namespace fastxls::core
