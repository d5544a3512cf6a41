#pragma once

#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace notwords {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Four-letter tag written on every line
constexpr const char* log_level_tag(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::DEBUG: return "DEBG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "EROR";
    }
    return "UNKN";
}

// Parse "debug" / "info" / "warn" / "error" (lowercase); returns false on anything else
inline bool parse_log_level(const std::string& name, LogLevel& out) noexcept {
    static constexpr struct { const char* name; LogLevel level; } LEVELS[] = {
        {"debug", LogLevel::DEBUG},
        {"info",  LogLevel::INFO},
        {"warn",  LogLevel::WARN},
        {"error", LogLevel::ERROR},
    };
    for (const auto& entry : LEVELS) {
        if (name == entry.name) {
            out = entry.level;
            return true;
        }
    }
    return false;
}

/**
 * Process-wide line logger.
 *
 *   [2024-01-01 12:00:00.123] WARN wordlist.cpp:42 load() - message
 *
 * Lines below the current level are dropped before their arguments are formatted.
 */
class Logger {
public:
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = level;
    }

    LogLevel level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return level_;
    }

    bool enabled(LogLevel level) const {
        return level >= this->level();
    }

    // The stream must outlive every later log call
    void setOutput(std::ostream& stream) {
        std::lock_guard<std::mutex> lock(mutex_);
        output_ = &stream;
    }

    template<typename... Args>
    void log(LogLevel level, const char* file, int line, const char* func, Args&&... args) {
        std::ostringstream msg;
        msg << "[" << timestamp() << "] " << log_level_tag(level) << " "
            << basename(file) << ":" << line << " " << func << "() - ";
        (msg << ... << std::forward<Args>(args));

        std::lock_guard<std::mutex> lock(mutex_);
        if (level < level_) return;
        *output_ << msg.str() << std::endl;
    }

private:
    Logger() : level_(LogLevel::WARN), output_(&std::cerr) {}
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static std::string timestamp() {
        const auto now = std::chrono::system_clock::now();
        const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local_tm{};
#ifdef _WIN32
        localtime_s(&local_tm, &seconds);
#else
        localtime_r(&seconds, &local_tm);
#endif
        std::ostringstream ss;
        ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
           << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

    static const char* basename(const char* path) {
        const char* slash = std::strrchr(path, '/');
        if (!slash) slash = std::strrchr(path, '\\');
        return slash ? slash + 1 : path;
    }

    LogLevel level_;
    std::ostream* output_;
    mutable std::mutex mutex_;
};

#define NOTWORDS_LOG(level, ...) \
    do { \
        if (notwords::Logger::getInstance().enabled(level)) { \
            notwords::Logger::getInstance().log(level, __FILE__, __LINE__, __func__, __VA_ARGS__); \
        } \
    } while (0)

#define LOG_DEBUG(...) NOTWORDS_LOG(notwords::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INFO(...)  NOTWORDS_LOG(notwords::LogLevel::INFO,  __VA_ARGS__)
#define LOG_WARN(...)  NOTWORDS_LOG(notwords::LogLevel::WARN,  __VA_ARGS__)
#define LOG_ERROR(...) NOTWORDS_LOG(notwords::LogLevel::ERROR, __VA_ARGS__)

inline void set_log_level(LogLevel level) {
    Logger::getInstance().setLevel(level);
}

inline void set_log_output(std::ostream& stream) {
    Logger::getInstance().setOutput(stream);
}

} // namespace notwords
