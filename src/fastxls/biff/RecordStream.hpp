#pragma once

#include "fastxls/biff/Record.hpp"
#include "fastxls/core/Expected.hpp"
#include "fastxls/core/ReaderOptions.hpp"

#include <optional>
#include <vector>

namespace fastxls {
namespace biff {

/**
 * @brief 工作簿流上的可定位记录游标
 *
 * - readNext()：读取当前位置的记录并前进；
 * - readAt()：在任意偏移处窥视一条记录，不移动游标；
 * - 剩余不足4字节视为流结束（返回 std::nullopt）；
 * - 记录声明长度超出流末尾：Loose 模式截断，Strict 模式返回 RecordTruncated。
 */
class RecordStream {
public:
    RecordStream(std::vector<uint8_t> data, core::ReadMode mode);

    RecordStream(const RecordStream&) = delete;
    RecordStream& operator=(const RecordStream&) = delete;

    core::Result<std::optional<Record>> readNext();
    core::Result<std::optional<Record>> readAt(size_t offset) const;

    void seek(size_t offset) { position_ = offset; }
    size_t position() const { return position_; }
    size_t size() const { return data_.size(); }
    bool atEnd() const { return position_ >= data_.size(); }

    core::ReadMode mode() const { return mode_; }

private:
    std::vector<uint8_t> data_;
    size_t position_ = 0;
    core::ReadMode mode_;
};

}} // namespace fastxls::biff
