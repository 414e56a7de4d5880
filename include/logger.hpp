#pragma once

#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <unistd.h>

namespace logger {

enum class Level {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

struct LogConfig {
    std::string log_dir = "/tmp/.mini_iter_log";
    bool use_stdout = false;
    Level min_level = Level::INFO;
    size_t max_file_size = 4 * 1024 * 1024;  // 4MB
    size_t max_files = 3;
};

inline const char* LevelName(Level level) {
    switch (level) {
        case Level::DEBUG: return "DEBUG";
        case Level::INFO: return "INFO";
        case Level::WARNING: return "WARNING";
        case Level::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

/**
 * @brief Process-wide logger writing to a rotated file or to stdout.
 *
 * Writes are synchronous; the mutex only serializes concurrent callers.
 */
class Logger {
public:
    static Logger& instance() {
        static Logger instance;
        return instance;
    }

    void configure(const LogConfig& config) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_ = config;
        init();
    }

    LogConfig config() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return config_;
    }

    void log(Level level, const char* file, const char* func, int line, const char* fmt, ...) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < config_.min_level) return;
        if (!init_success_) return;

        char buffer[256];
        va_list args;
        va_start(args, fmt);
        vsnprintf(buffer, sizeof(buffer), fmt, args);
        va_end(args);

        write_log(format_log(level, file, func, line, buffer));
    }

    // Path of the active log file; empty when logging to stdout.
    std::filesystem::path current_path() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return config_.use_stdout ? std::filesystem::path() : current_log_path_;
    }

private:
    Logger() { init(); }

    void init() {
        namespace fs = std::filesystem;

        file_stream_.reset();
        try {
            if (config_.use_stdout) {
                init_success_ = true;
                return;
            }

            if (!fs::exists(config_.log_dir)) {
                fs::create_directories(config_.log_dir);
            }
            open_new_log_file();
        } catch (const std::exception& e) {
            init_success_ = false;
            std::cerr << "Logger initialization failed: " << e.what() << std::endl;
        }
    }

    void rotate_log_files() {
        namespace fs = std::filesystem;

        file_stream_->close();
        for (int i = static_cast<int>(config_.max_files) - 1; i >= 0; --i) {
            auto old_path = get_log_path(i);
            if (!fs::exists(old_path)) continue;
            if (i == static_cast<int>(config_.max_files) - 1) {
                fs::remove(old_path);
            } else {
                fs::rename(old_path, get_log_path(i + 1));
            }
        }
        open_new_log_file();
    }

    std::filesystem::path get_log_path(int index) const {
        namespace fs = std::filesystem;
        auto base_name = std::to_string(getpid()) + ".log";
        if (index == 0) return fs::path(config_.log_dir) / base_name;
        return fs::path(config_.log_dir) / (base_name + "." + std::to_string(index));
    }

    void open_new_log_file() {
        current_log_path_ = get_log_path(0);
        file_stream_ = std::make_unique<std::ofstream>(
            current_log_path_, std::ios::out | std::ios::app);
        init_success_ = file_stream_->is_open();
    }

    std::string format_log(Level level, const char* file, const char* func, int line,
                           const std::string& message) const {
        auto now = std::chrono::system_clock::now();
        std::time_t t = std::chrono::system_clock::to_time_t(now);
        char time_str[20];
        std::strftime(time_str, sizeof(time_str), "%Y%m%d%H%M%S", std::localtime(&t));

        std::ostringstream oss;
        oss << "[" << time_str << "] "
            << "[" << LevelName(level) << "] "
            << "[" << std::filesystem::path(file).filename().string() << ":"
            << func << ":" << line << "] "
            << message << "\n";
        return oss.str();
    }

    void write_log(const std::string& log_entry) {
        if (config_.use_stdout) {
            std::cout << log_entry;
            return;
        }

        if (!file_stream_ || !file_stream_->is_open()) return;

        *file_stream_ << log_entry;
        file_stream_->flush();

        std::error_code ec;
        auto size = std::filesystem::file_size(current_log_path_, ec);
        if (!ec && size >= config_.max_file_size && config_.max_files > 0) {
            rotate_log_files();
        }
    }

    LogConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    bool init_success_ = false;
    mutable std::mutex mutex_;
    std::filesystem::path current_log_path_;
};

} // namespace logger

#define LOG_DEBUG(fmt, ...) \
    logger::Logger::instance().log(logger::Level::DEBUG, __FILE__, __FUNCTION__, __LINE__, fmt, ## __VA_ARGS__)

#define LOG_INFO(fmt, ...) \
    logger::Logger::instance().log(logger::Level::INFO, __FILE__, __FUNCTION__, __LINE__, fmt, ## __VA_ARGS__)

#define LOG_WARNING(fmt, ...) \
    logger::Logger::instance().log(logger::Level::WARNING, __FILE__, __FUNCTION__, __LINE__, fmt, ## __VA_ARGS__)

#define LOG_ERROR(fmt, ...) \
    logger::Logger::instance().log(logger::Level::ERROR, __FILE__, __FUNCTION__, __LINE__, fmt, ## __VA_ARGS__)
