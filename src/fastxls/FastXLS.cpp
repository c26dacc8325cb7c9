#include "fastxls/FastXLS.hpp"
#include "fastxls/utils/Logger.hpp"

#include <iostream>

namespace fastxls {

FASTXLS_API bool initialize(const std::string& log_file_path, bool enable_console) {
    try {
        Logger::getInstance().initialize(log_file_path, Logger::Level::INFO, enable_console);
        FASTXLS_LOG_INFO("FastXLS library initialized, version {}", getVersion());
        return true;
    } catch (const std::exception& e) {
        if (enable_console) {
            std::cerr << "Failed to initialize FastXLS: " << e.what() << std::endl;
        }
        return false;
    }
}

FASTXLS_API void cleanup() {
    FASTXLS_LOG_INFO("FastXLS library cleanup completed");
    Logger::getInstance().flush();
}

FASTXLS_API core::Result<std::unique_ptr<reader::XLSReader>> openXLS(const std::string& filename,
                                                                     const core::ReaderOptions& options) {
    auto xls = std::make_unique<reader::XLSReader>(options);
    auto opened = xls->open(filename);
    if (!opened) {
        return opened.error();
    }
    return std::move(xls);
}

FASTXLS_API std::shared_ptr<const core::DataSet> readXLS(const std::string& filename,
                                                         const core::ReaderOptions& options) {
    reader::XLSReader xls(options);
    if (!xls.open(filename)) {
        return nullptr;
    }
    return xls.readAll();
}

} // namespace fastxls
