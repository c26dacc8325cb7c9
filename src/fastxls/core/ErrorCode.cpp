#include "fastxls/core/ErrorCode.hpp"

namespace fastxls {
namespace core {

Error::Error(ErrorCode c) : code(c), message(toString(c)) {}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:
            return "Success";

        // 通用错误
        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::OutOfMemory:
            return "Out of memory";
        case ErrorCode::InternalError:
            return "Internal error";

        // 文件与字节源
        case ErrorCode::FileNotFound:
            return "File not found";
        case ErrorCode::FileAccessDenied:
            return "File access denied";
        case ErrorCode::FileReadError:
            return "File read error";
        case ErrorCode::SourceClosed:
            return "Byte source already closed";

        // OLE2
        case ErrorCode::NotCompoundFile:
            return "Not an OLE2 compound file";
        case ErrorCode::CorruptedContainer:
            return "Corrupted compound file structure";
        case ErrorCode::StreamNotFound:
            return "Workbook stream not found";
        case ErrorCode::NotAStream:
            return "Workbook entry is not a stream";

        // BIFF
        case ErrorCode::InvalidWorkbookGlobals:
            return "Invalid workbook globals data";
        case ErrorCode::UnsupportedVersion:
            return "Unsupported BIFF version";
        case ErrorCode::EncryptedWorkbook:
            return "Workbook is encrypted";
        case ErrorCode::RecordTruncated:
            return "Record extends past end of stream";
        case ErrorCode::MissingBlockBoundary:
            return "Badly formed binary file. Has INDEX but no DBCELL";
        case ErrorCode::InvalidSharedStringIndex:
            return "Shared string index out of range";
        case ErrorCode::SharedStringsNotReady:
            return "Shared string table not materialized";

        // 读取器状态
        case ErrorCode::ReaderInvalid:
            return "Reader is invalid";
        case ErrorCode::ReaderClosed:
            return "Reader is closed";

        default:
            return "Unknown error";
    }
}

}} // namespace fastxls::core
