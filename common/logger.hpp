#pragma once

// ============================================================
// logger.hpp -- Thread-safe logger
// ============================================================

#include "platform.hpp"
#include <string>
#include <mutex>
#include <fstream>
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <memory>

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

    // While set, lines below WARN skip the console (the progress display
    // owns stdout) but still reach the log file.
    void set_console_muted(bool muted) {
        std::lock_guard<std::mutex> lk(mutex_);
        console_muted_ = muted;
    }

    bool console_muted() {
        std::lock_guard<std::mutex> lk(mutex_);
        return console_muted_;
    }

    // Empty path closes the log file
    void set_log_file(const std::string& path) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (file_.is_open()) file_.close();
        if (!path.empty()) file_.open(path, std::ios::app);
    }

    // Security events go to their own file; opened lazily on first event
    void set_security_log_file(const std::string& path) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (security_file_.is_open()) security_file_.close();
        security_path_ = path;
    }

    void log(LogLevel lvl, const std::string& msg) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (lvl < level_) return;
        std::string line = format_line(lvl, msg);
        if (lvl >= LogLevel::WARN) {
            std::cerr << line << "\n";
        } else if (!console_muted_) {
            std::cout << line << "\n";
        }
        if (file_.is_open()) {
            file_ << line << "\n";
            file_.flush();
        }
    }

    void info(const std::string& msg)  { log(LogLevel::INFO, msg); }
    void warn(const std::string& msg)  { log(LogLevel::WARN, msg); }
    void error(const std::string& msg) { log(LogLevel::ERR,  msg); }
    void debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }

    // Path-safety violations and other security-relevant events.
    // Never filtered by level.
    void security(const std::string& msg) {
        std::string line = format_line(LogLevel::ERR, "[SECURITY] " + msg);
        std::lock_guard<std::mutex> lk(mutex_);
        std::cerr << line << "\n";
        if (file_.is_open()) {
            file_ << line << "\n";
            file_.flush();
        }
        if (!security_file_.is_open() && !security_path_.empty()) {
            security_file_.open(security_path_, std::ios::app);
        }
        if (security_file_.is_open()) {
            security_file_ << line << "\n";
            security_file_.flush();
        }
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() : level_(LogLevel::INFO), security_path_("security_events.log") {}

    static std::string format_line(LogLevel lvl, const std::string& msg) {
        auto now = std::chrono::system_clock::now();
        auto t   = std::chrono::system_clock::to_time_t(now);
        auto ms  = std::chrono::duration_cast<std::chrono::milliseconds>(
                       now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &t);
#else
        localtime_r(&t, &tm_buf);
#endif
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

    std::mutex    mutex_;
    LogLevel      level_;
    bool          console_muted_{false};
    std::ofstream file_;
    std::string   security_path_;
    std::ofstream security_file_;
};

// Convenience macros
#define LOG_INFO(msg)     Logger::get().info(msg)
#define LOG_WARN(msg)     Logger::get().warn(msg)
#define LOG_ERROR(msg)    Logger::get().error(msg)
#define LOG_DEBUG(msg)    Logger::get().debug(msg)
#define LOG_SECURITY(msg) Logger::get().security(msg)
