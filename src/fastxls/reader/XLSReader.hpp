#pragma once

#include "fastxls/biff/RecordStream.hpp"
#include "fastxls/core/DataTable.hpp"
#include "fastxls/core/ErrorCode.hpp"
#include "fastxls/core/Expected.hpp"
#include "fastxls/core/ReaderOptions.hpp"
#include "fastxls/ole/ByteSource.hpp"
#include "fastxls/reader/WorkbookGlobals.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fastxls {
namespace reader {

/**
 * @brief XLS（OLE2/BIFF）工作簿读取器
 *
 * 使用流程：
 * @code
 * reader::XLSReader reader;
 * if (reader.open("book.xls")) {
 *     auto data = reader.readAll();
 * }
 * @endcode
 *
 * 致命错误（流缺失、全局区无效、Strict 模式截断、块边界缺失）使读取器永久失效：
 * 之后 readAll() 返回 nullptr，不会再次读取字节源；错误通过 lastError() 查询。
 * 字节源在完整读取后或首次致命错误时释放，重复释放无副作用。
 */
class XLSReader {
public:
    explicit XLSReader(core::ReaderOptions options = core::ReaderOptions{});
    ~XLSReader();

    XLSReader(const XLSReader&) = delete;
    XLSReader& operator=(const XLSReader&) = delete;

    /**
     * @brief 打开字节源并解析工作簿全局区，当前工作表设为第0张
     */
    core::VoidResult open(std::unique_ptr<ole::ByteSource> source);

    /**
     * @brief 打开文件；文件无法打开时返回 FileNotFound / FileAccessDenied
     */
    core::VoidResult open(const std::string& filename);

    /**
     * @brief 读取全部工作表
     * @return 每张至少有一行的工作表对应一个表；失效时返回 nullptr；重复调用返回缓存结果
     */
    std::shared_ptr<const core::DataSet> readAll();

    /**
     * @brief 释放字节源，可重复调用
     */
    void close();

    bool isValid() const { return valid_; }
    bool isClosed() const { return closed_; }
    const core::Error& lastError() const { return last_error_; }

    std::vector<std::string> getSheetNames() const;
    size_t getSheetCount() const;
    std::string currentSheetName() const;

    /**
     * @brief 工作簿全局数据；未成功打开时返回 nullptr
     */
    const WorkbookGlobals* globals() const { return globals_.get(); }

    core::ReadMode readMode() const { return options_.mode; }
    const core::ReaderOptions& options() const { return options_; }

private:
    core::Error fail(core::Error error);
    void releaseSource();

    core::Result<std::vector<uint8_t>> loadWorkbookStream(ole::ByteSource& source);
    core::Result<std::optional<core::DataTable>> readSheet(const WorksheetDescriptor& sheet);

    core::ReaderOptions options_;
    std::unique_ptr<ole::ByteSource> source_;
    std::unique_ptr<biff::RecordStream> stream_;
    std::unique_ptr<WorkbookGlobals> globals_;
    std::shared_ptr<const core::DataSet> result_;
    core::Error last_error_;
    size_t current_sheet_ = 0;
    bool valid_ = false;
    bool closed_ = false;
    bool read_done_ = false;
};

}} // namespace fastxls::reader
