#include "Logger.hpp"
#include <filesystem>
#include <iostream>
#include <sstream>
#include <thread>
#include <chrono>
#include <fmt/chrono.h>

namespace fastxls {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_file_path,
                        Level level,
                        bool enable_console,
                        size_t max_file_size,
                        size_t max_files,
                        WriteMode write_mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_.load() || shutting_down_.load()) {
        return;
    }

    current_level_.store(level);
    enable_console_.store(enable_console);
    log_file_path_ = log_file_path;
    max_file_size_ = max_file_size;
    max_files_ = max_files;

    if (!log_file_path_.empty()) {
        std::error_code ec;
        const std::filesystem::path log_dir = std::filesystem::path(log_file_path_).parent_path();
        if (!log_dir.empty()) {
            std::filesystem::create_directories(log_dir, ec);
        }
        if (ec) {
            std::cerr << "Logger: cannot create log directory " << log_dir << ": " << ec.message() << std::endl;
        }

        const auto open_mode = (write_mode == WriteMode::APPEND)
                                   ? (std::ios::out | std::ios::app)
                                   : (std::ios::out | std::ios::trunc);
        file_stream_.open(log_file_path_, open_mode);
        current_file_size_ = 0;
        if (file_stream_.is_open() && write_mode == WriteMode::APPEND) {
            file_stream_.seekp(0, std::ios::end);
            current_file_size_ = static_cast<size_t>(file_stream_.tellp());
        }
    }

    initialized_.store(true);
}

bool Logger::shouldLog(Level level) const {
    return static_cast<int>(level) >= static_cast<int>(current_level_.load()) &&
           !shutting_down_.load();
}

void Logger::log(Level level, const std::string& message) {
    if (!shouldLog(level)) return;

    if (!initialized_.load()) {
        initialize();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_.load()) return;

    const std::string formatted = formatMessage(level, message);
    if (enable_console_.load()) {
        writeConsole(level, formatted);
    }
    writeFile(formatted);

    // 警告及以上立即刷新
    if (level >= Level::WARN && file_stream_.is_open()) {
        file_stream_.flush();
    }
}

void Logger::writeConsole(Level level, const std::string& message) {
    const char* color_code = "\033[0m";
    switch (level) {
        case Level::TRACE:    color_code = "\033[37m"; break; // 白色
        case Level::DEBUG:    color_code = "\033[36m"; break; // 青色
        case Level::INFO:     color_code = "\033[32m"; break; // 绿色
        case Level::WARN:     color_code = "\033[33m"; break; // 黄色
        case Level::ERROR:    color_code = "\033[31m"; break; // 红色
        case Level::CRITICAL: color_code = "\033[35m"; break; // 紫色
        default: break;
    }
    std::ostream& out = (level >= Level::WARN) ? std::cerr : std::cout;
    out << color_code << message << "\033[0m" << '\n';
}

void Logger::writeFile(const std::string& message) {
    if (!file_stream_.is_open()) {
        return;
    }
    rotateIfNeeded();
    file_stream_ << message << '\n';
    current_file_size_ += message.size() + 1;
}

void Logger::rotateIfNeeded() {
    if (current_file_size_ < max_file_size_ || max_files_ == 0) {
        return;
    }

    file_stream_.close();

    std::error_code ec;
    for (size_t i = max_files_ - 1; i > 0; --i) {
        const std::string older = (i == 1) ? log_file_path_ : fmt::format("{}.{}", log_file_path_, i - 1);
        const std::string newer = fmt::format("{}.{}", log_file_path_, i);
        if (std::filesystem::exists(older, ec)) {
            std::filesystem::rename(older, newer, ec);
        }
    }

    file_stream_.open(log_file_path_, std::ios::out | std::ios::trunc);
    current_file_size_ = 0;
}

std::string Logger::formatMessage(Level level, const std::string& message) const {
    std::ostringstream tid;
    tid << std::this_thread::get_id();
    return fmt::format("[{:%Y-%m-%d %H:%M:%S}] [{}] [{}] {}",
                       fmt::localtime(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now())),
                       levelName(level), tid.str(), message);
}

const char* Logger::levelName(Level level) {
    switch (level) {
        case Level::TRACE:    return "TRACE";
        case Level::DEBUG:    return "DEBUG";
        case Level::INFO:     return "INFO ";
        case Level::WARN:     return "WARN ";
        case Level::ERROR:    return "ERROR";
        case Level::CRITICAL: return "CRIT ";
        default:              return "UNKN ";
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_stream_.is_open()) {
        file_stream_.flush();
    }
    std::cout.flush();
}

void Logger::shutdown() {
    shutting_down_.store(true);

    std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return;
    }
    if (file_stream_.is_open()) {
        file_stream_.flush();
        file_stream_.close();
    }
    initialized_.store(false);
}

Logger::~Logger() {
    shutdown();
}

} // namespace fastxls
