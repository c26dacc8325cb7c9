/**
 * @file FileWrapper.hpp
 * @brief RAII文件句柄包装器，提供异常安全的文件管理
 */

#pragma once

#include <cstdio>
#include <cstdint>
#include <memory>
#include <string>

namespace fastxls {
namespace utils {

/**
 * @brief RAII文件句柄包装器
 *
 * 析构时自动关闭文件；close() 可重复调用。
 */
class FileWrapper {
public:
    /**
     * @brief 构造函数，打开文件
     * @param filename 文件名
     * @param mode 文件打开模式（"rb"、"wb"等）
     * @throws core::FileException 文件打开失败时
     */
    FileWrapper(const std::string& filename, const char* mode);

    FileWrapper(FileWrapper&& other) noexcept = default;
    FileWrapper& operator=(FileWrapper&& other) noexcept = default;

    FileWrapper(const FileWrapper&) = delete;
    FileWrapper& operator=(const FileWrapper&) = delete;

    FILE* get() const noexcept { return file_.get(); }
    bool isOpen() const noexcept { return file_ != nullptr; }
    explicit operator bool() const noexcept { return isOpen(); }

    const std::string& getFilename() const noexcept { return filename_; }

    /**
     * @brief 文件总字节数，失败返回 -1
     */
    int64_t size() const;

    /**
     * @brief 从指定偏移读取，返回实际读到的字节数，出错返回 -1
     */
    int64_t readAt(uint64_t offset, void* buffer, size_t length) const;

    /**
     * @brief 写入全部字节，返回是否成功
     */
    bool write(const void* data, size_t length);

    void flush();

    /**
     * @brief 关闭文件，已关闭时无操作
     */
    void close() noexcept;

private:
    struct Closer {
        void operator()(FILE* f) const noexcept {
            if (f) std::fclose(f);
        }
    };

    std::string filename_;
    std::unique_ptr<FILE, Closer> file_;
};

/**
 * @brief 临时文件包装器
 *
 * 在析构时自动删除临时文件。
 */
class TempFileWrapper {
public:
    TempFileWrapper(const std::string& prefix = "fastxls_temp_",
                    const std::string& suffix = ".tmp");
    ~TempFileWrapper();

    TempFileWrapper(const TempFileWrapper&) = delete;
    TempFileWrapper& operator=(const TempFileWrapper&) = delete;

    FileWrapper& getFile() { return file_; }
    const std::string& getPath() const { return temp_path_; }

private:
    static std::string generateTempPath(const std::string& prefix, const std::string& suffix);

    std::string temp_path_;
    FileWrapper file_;
};

}} // namespace fastxls::utils
