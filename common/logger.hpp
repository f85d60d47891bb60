#pragma once

// ============================================================
// logger.hpp -- Process-wide logger
//
// INFO/DEBUG lines go to stdout, WARN/ERROR to stderr. Every line
// can be mirrored into a log file; per-file failures can also be
// collected in a separate error log.
// ============================================================

#include "platform.hpp"
#include <string>
#include <mutex>
#include <fstream>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>

enum class LogLevel {
    DEBUG = 0,
    INFO  = 1,
    WARN  = 2,
    ERR   = 3,
};

class Logger {
public:
    static Logger& get() {
        static Logger instance;
        return instance;
    }

    void set_level(LogLevel lvl) {
        std::lock_guard<std::mutex> lk(mutex_);
        level_ = lvl;
    }

    LogLevel level() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return level_;
    }

    bool set_log_file(const std::string& path) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (file_.is_open()) file_.close();
        file_.open(path, std::ios::app);
        return file_.is_open();
    }

    bool set_error_log(const std::string& path) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (error_file_.is_open()) error_file_.close();
        error_file_.open(path, std::ios::app);
        return error_file_.is_open();
    }

    void log(LogLevel lvl, const std::string& msg) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (lvl < level_) return;
        write_locked(lvl, format_line(lvl, msg));
    }

    void info(const std::string& msg)  { log(LogLevel::INFO, msg); }
    void warn(const std::string& msg)  { log(LogLevel::WARN, msg); }
    void error(const std::string& msg) { log(LogLevel::ERR,  msg); }
    void debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }

    // A single file failed; the run goes on. Always emitted, and
    // appended to the error log when one is configured.
    void file_error(const std::string& msg) {
        std::string line = format_line(LogLevel::ERR, "[FILE] " + msg);
        std::lock_guard<std::mutex> lk(mutex_);
        write_locked(LogLevel::ERR, line);
        if (error_file_.is_open()) {
            error_file_ << line << "\n";
            error_file_.flush();
        }
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() : level_(LogLevel::INFO) {}

    void write_locked(LogLevel lvl, const std::string& line) {
        if (lvl >= LogLevel::WARN) {
            std::cerr << line << "\n";
        } else {
            std::cout << line << "\n";
        }
        if (file_.is_open()) {
            file_ << line << "\n";
            file_.flush();
        }
    }

    static std::string format_line(LogLevel lvl, const std::string& msg) {
        auto now = std::chrono::system_clock::now();
        auto t   = std::chrono::system_clock::to_time_t(now);
        auto ms  = std::chrono::duration_cast<std::chrono::milliseconds>(
                       now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&t, &tm_buf);

        std::ostringstream ss;
        ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        ss << " [" << level_str(lvl) << "] " << msg;
        return ss.str();
    }

    static const char* level_str(LogLevel lvl) {
        switch (lvl) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERR:   return "ERROR";
        }
        return "?????";
    }

    mutable std::mutex mutex_;
    LogLevel      level_;
    std::ofstream file_;
    std::ofstream error_file_;
};

// Convenience macros
#define LOG_INFO(msg)       Logger::get().info(msg)
#define LOG_WARN(msg)       Logger::get().warn(msg)
#define LOG_ERROR(msg)      Logger::get().error(msg)
#define LOG_DEBUG(msg)      Logger::get().debug(msg)
#define LOG_FILE_ERROR(msg) Logger::get().file_error(msg)
