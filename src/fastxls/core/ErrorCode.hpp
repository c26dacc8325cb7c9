#pragma once

#include <cstdint>
#include <string>
#include <fmt/format.h>

namespace fastxls {
namespace core {

/**
 * @brief FastXLS统一错误码
 *
 * 底层解析全部使用错误码传递，只有打开文件失败时抛出 FileException。
 */
enum class ErrorCode : uint8_t {
    // 成功
    Ok = 0,

    // 通用错误 (1-19)
    InvalidArgument = 1,
    OutOfMemory = 2,
    InternalError = 3,

    // 文件与字节源错误 (20-39)
    FileNotFound = 20,
    FileAccessDenied = 21,
    FileReadError = 22,
    SourceClosed = 23,

    // OLE2复合文档错误 (40-59)
    NotCompoundFile = 40,
    CorruptedContainer = 41,
    StreamNotFound = 42,
    NotAStream = 43,

    // BIFF记录错误 (60-79)
    InvalidWorkbookGlobals = 60,
    UnsupportedVersion = 61,
    EncryptedWorkbook = 62,
    RecordTruncated = 63,
    MissingBlockBoundary = 64,
    InvalidSharedStringIndex = 65,
    SharedStringsNotReady = 66,

    // 读取器状态 (80-89)
    ReaderInvalid = 80,
    ReaderClosed = 81
};

/**
 * @brief 错误信息结构
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;  // 额外上下文信息

    Error() : code(ErrorCode::Ok) {}

    explicit Error(ErrorCode c);

    Error(ErrorCode c, const std::string& msg) : code(c), message(msg) {}

    Error(ErrorCode c, const std::string& msg, const std::string& ctx)
        : code(c), message(msg), context(ctx) {}

    bool isOk() const noexcept { return code == ErrorCode::Ok; }
    bool isError() const noexcept { return code != ErrorCode::Ok; }

    std::string fullMessage() const {
        if (context.empty()) {
            return message;
        }
        return fmt::format("{} (Context: {})", message, context);
    }
};

/**
 * @brief 错误码转字符串
 */
const char* toString(ErrorCode code) noexcept;

inline Error makeError(ErrorCode code) {
    return Error(code);
}

inline Error makeError(ErrorCode code, const std::string& message) {
    return Error(code, message);
}

inline Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    return Error(code, message, context);
}

inline Error success() {
    return Error(ErrorCode::Ok);
}

}} // namespace fastxls::core
