#include "fastxls/ole/ByteSource.hpp"
#include "fastxls/utils/ModuleLoggers.hpp"

#include <algorithm>
#include <cstring>

namespace fastxls {
namespace ole {

FileByteSource::FileByteSource(const std::string& filename)
    : file_(filename, "rb") {
    const int64_t total = file_.size();
    size_ = total > 0 ? static_cast<uint64_t>(total) : 0;
    OLE_DEBUG("Opened {} ({} bytes)", filename, size_);
}

core::Result<size_t> FileByteSource::readAt(uint64_t offset, void* buffer, size_t length) {
    if (!file_.isOpen()) {
        return core::makeError(core::ErrorCode::SourceClosed);
    }
    const int64_t got = file_.readAt(offset, buffer, length);
    if (got < 0) {
        return core::makeError(core::ErrorCode::FileReadError,
                               fmt::format("read of {} bytes at {} failed", length, offset),
                               file_.getFilename());
    }
    return static_cast<size_t>(got);
}

void FileByteSource::close() {
    if (file_.isOpen()) {
        OLE_DEBUG("Closing {}", file_.getFilename());
        file_.close();
    }
}

MemoryByteSource::MemoryByteSource(std::vector<uint8_t> data)
    : data_(std::move(data)) {
}

core::Result<size_t> MemoryByteSource::readAt(uint64_t offset, void* buffer, size_t length) {
    if (closed_) {
        return core::makeError(core::ErrorCode::SourceClosed);
    }
    if (offset >= data_.size()) {
        return size_t{0};
    }
    const size_t count = std::min<uint64_t>(length, data_.size() - offset);
    std::memcpy(buffer, data_.data() + offset, count);
    return count;
}

void MemoryByteSource::close() {
    closed_ = true;
    std::vector<uint8_t>().swap(data_);
}

}} // namespace fastxls::ole
