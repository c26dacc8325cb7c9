#pragma once

// FastXLS库 - 旧版二进制Excel（XLS / BIFF2~BIFF8）读取库

#include <memory>
#include <string>

#include "fastxls/core/CellValue.hpp"
#include "fastxls/core/DataTable.hpp"
#include "fastxls/core/ErrorCode.hpp"
#include "fastxls/core/Expected.hpp"
#include "fastxls/core/ReaderOptions.hpp"
#include "fastxls/reader/XLSReader.hpp"

// 版本信息
#define FASTXLS_VERSION_MAJOR 1
#define FASTXLS_VERSION_MINOR 0
#define FASTXLS_VERSION_PATCH 0
#define FASTXLS_VERSION_STRING "1.0.0"

// 平台检测
#ifdef _WIN32
    #define FASTXLS_WINDOWS
#elif defined(__linux__)
    #define FASTXLS_LINUX
#elif defined(__APPLE__)
    #define FASTXLS_MACOS
#endif

// 导出宏定义
#ifdef FASTXLS_WINDOWS
    #ifdef FASTXLS_SHARED
        #ifdef FASTXLS_EXPORTS
            #define FASTXLS_API __declspec(dllexport)
        #else
            #define FASTXLS_API __declspec(dllimport)
        #endif
    #else
        #define FASTXLS_API
    #endif
#else
    #define FASTXLS_API
#endif

namespace fastxls {

inline std::string getVersion() {
    return FASTXLS_VERSION_STRING;
}

/**
 * @brief 初始化FastXLS库（日志系统）
 * @param log_file_path 日志文件路径，为空时只输出到控制台
 * @param enable_console 是否启用控制台日志
 * @return 初始化是否成功
 */
FASTXLS_API bool initialize(const std::string& log_file_path = "logs/fastxls.log",
                            bool enable_console = true);

/**
 * @brief 清理FastXLS库资源
 */
FASTXLS_API void cleanup();

/**
 * @brief 打开XLS文件并解析工作簿全局区
 * @return 打开成功的读取器；失败返回错误
 */
FASTXLS_API core::Result<std::unique_ptr<reader::XLSReader>> openXLS(
    const std::string& filename,
    const core::ReaderOptions& options = core::ReaderOptions{});

/**
 * @brief 一次性读取文件中的全部工作表
 * @return 失败时返回 nullptr
 */
FASTXLS_API std::shared_ptr<const core::DataSet> readXLS(
    const std::string& filename,
    const core::ReaderOptions& options = core::ReaderOptions{});

} // namespace fastxls
