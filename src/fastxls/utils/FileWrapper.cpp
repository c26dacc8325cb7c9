#include "FileWrapper.hpp"
#include "fastxls/core/Exception.hpp"
#include "fastxls/utils/Logger.hpp"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <random>
#include <sys/types.h>

namespace fastxls {
namespace utils {

FileWrapper::FileWrapper(const std::string& filename, const char* mode)
    : filename_(filename)
    , file_(std::fopen(filename.c_str(), mode)) {
    if (!file_) {
        const int err = errno;
        throw core::FileException(
            fmt::format("Failed to open file: {}", std::strerror(err)),
            filename,
            err == EACCES ? core::ErrorCode::FileAccessDenied : core::ErrorCode::FileNotFound,
            __FILE__, __LINE__);
    }
}

int64_t FileWrapper::size() const {
    if (!file_) return -1;
    if (fseeko(file_.get(), 0, SEEK_END) != 0) {
        return -1;
    }
    return static_cast<int64_t>(ftello(file_.get()));
}

int64_t FileWrapper::readAt(uint64_t offset, void* buffer, size_t length) const {
    if (!file_) return -1;
    if (fseeko(file_.get(), static_cast<off_t>(offset), SEEK_SET) != 0) {
        return -1;
    }
    const size_t got = std::fread(buffer, 1, length, file_.get());
    if (got < length && std::ferror(file_.get())) {
        std::clearerr(file_.get());
        return -1;
    }
    return static_cast<int64_t>(got);
}

bool FileWrapper::write(const void* data, size_t length) {
    if (!file_) return false;
    return std::fwrite(data, 1, length, file_.get()) == length;
}

void FileWrapper::flush() {
    if (file_) {
        std::fflush(file_.get());
    }
}

void FileWrapper::close() noexcept {
    file_.reset();
}

TempFileWrapper::TempFileWrapper(const std::string& prefix, const std::string& suffix)
    : temp_path_(generateTempPath(prefix, suffix))
    , file_(temp_path_, "wb") {
    FASTXLS_LOG_DEBUG("Created temporary file: {}", temp_path_);
}

TempFileWrapper::~TempFileWrapper() {
    file_.close();
    std::error_code ec;
    std::filesystem::remove(temp_path_, ec);
    if (ec) {
        FASTXLS_LOG_WARN("Failed to delete temporary file {}: {}", temp_path_, ec.message());
    }
}

std::string TempFileWrapper::generateTempPath(const std::string& prefix, const std::string& suffix) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(1000, 9999);

    const auto timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    const std::string filename = prefix + std::to_string(timestamp) + "_" + std::to_string(dis(gen)) + suffix;
    return (std::filesystem::temp_directory_path() / filename).string();
}

}} // namespace fastxls::utils
