#pragma once

#include "fastxls/core/Expected.hpp"
#include "fastxls/utils/FileWrapper.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace fastxls {
namespace ole {

/**
 * @brief 随机访问字节源接口
 *
 * 读取器在整个生命周期内独占字节源，close() 可重复调用。
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /**
     * @brief 从 offset 读取最多 length 字节到 buffer
     * @return 实际读取的字节数；字节源已关闭或底层读失败时返回错误
     */
    virtual core::Result<size_t> readAt(uint64_t offset, void* buffer, size_t length) = 0;

    virtual uint64_t size() const = 0;

    virtual void close() = 0;
    virtual bool isClosed() const = 0;
};

/**
 * @brief 基于文件的字节源
 */
class FileByteSource : public ByteSource {
public:
    /**
     * @throws core::FileException 文件无法打开时
     */
    explicit FileByteSource(const std::string& filename);

    core::Result<size_t> readAt(uint64_t offset, void* buffer, size_t length) override;
    uint64_t size() const override { return size_; }
    void close() override;
    bool isClosed() const override { return !file_.isOpen(); }

private:
    utils::FileWrapper file_;
    uint64_t size_ = 0;
};

/**
 * @brief 内存字节源，持有数据的副本
 */
class MemoryByteSource : public ByteSource {
public:
    explicit MemoryByteSource(std::vector<uint8_t> data);

    core::Result<size_t> readAt(uint64_t offset, void* buffer, size_t length) override;
    uint64_t size() const override { return data_.size(); }
    void close() override;
    bool isClosed() const override { return closed_; }

private:
    std::vector<uint8_t> data_;
    bool closed_ = false;
};

}} // namespace fastxls::ole
