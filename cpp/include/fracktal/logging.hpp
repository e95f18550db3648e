#pragma once

#include <iostream>
#include <string>
#include <string_view>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <mutex>
#include <optional>
#include <cstring>
#include <cstdlib>
#include <ctime>

namespace fracktal {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    FATAL = 4
};

// "debug", "info", "warn", "error", "fatal" (case-sensitive)
inline std::optional<LogLevel> parse_log_level(std::string_view name) {
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warn") return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    if (name == "fatal") return LogLevel::FATAL;
    return std::nullopt;
}

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

    void setOutput(std::ostream& stream) {
        std::lock_guard<std::mutex> lock(mutex_);
        output_ = &stream;
    }

    bool enabled(LogLevel level) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return level >= level_;
    }

    template<typename... Args>
    void log(LogLevel level, const char* file, int line, const char* func, Args&&... args) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < level_) return;

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local_tm{};
        localtime_r(&time_t, &local_tm);

        std::stringstream msg;
        msg << "[" << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count() << "] "
            << level_tag(level) << " "
            << basename(file) << ":" << line << " " << func << "() - ";
        (msg << ... << std::forward<Args>(args));

        *output_ << msg.str() << std::endl;

        if (level == LogLevel::FATAL) {
            *output_ << std::flush;
            std::abort();
        }
    }

private:
    // Library default is quiet; hosts raise it through FRACKTAL_LOG_LEVEL
    Logger() : level_(LogLevel::WARN), output_(&std::cerr) {
        const char* env = std::getenv("FRACKTAL_LOG_LEVEL");
        if (env) {
            if (auto parsed = parse_log_level(env)) level_ = *parsed;
        }
    }
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static const char* level_tag(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBG";
            case LogLevel::INFO:  return "INFO";
            case LogLevel::WARN:  return "WARN";
            case LogLevel::ERROR: return "EROR";
            case LogLevel::FATAL: return "FATL";
        }
        return "UNKN";
    }

    static const char* basename(const char* file) {
        const char* slash = std::strrchr(file, '/');
        if (!slash) slash = std::strrchr(file, '\\');
        return slash ? slash + 1 : file;
    }

    LogLevel level_;
    std::ostream* output_;
    mutable std::mutex mutex_;
};

#define LOG_DEBUG(...) fracktal::Logger::getInstance().log(fracktal::LogLevel::DEBUG, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_INFO(...)  fracktal::Logger::getInstance().log(fracktal::LogLevel::INFO,  __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_WARN(...)  fracktal::Logger::getInstance().log(fracktal::LogLevel::WARN,  __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_ERROR(...) fracktal::Logger::getInstance().log(fracktal::LogLevel::ERROR, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_FATAL(...) fracktal::Logger::getInstance().log(fracktal::LogLevel::FATAL, __FILE__, __LINE__, __func__, __VA_ARGS__)

inline void set_log_level(LogLevel level) {
    Logger::getInstance().setLevel(level);
}

inline void set_log_output(std::ostream& stream) {
    Logger::getInstance().setOutput(stream);
}

} // namespace fracktal
