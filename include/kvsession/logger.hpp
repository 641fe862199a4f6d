#pragma once

#include <string>
#include <sstream>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <mutex>
#include <unistd.h>

namespace kvsession {
namespace log {

enum class Level {
    FATAL = 0,
    ERROR = 1,
    WARNING = 2,
    INFO = 3,
    DEBUG = 4,
    VERBOSE = 5
};

inline const char* level_to_string(Level level) {
    switch (level) {
        case Level::FATAL:   return "FATAL";
        case Level::ERROR:   return "ERROR";
        case Level::WARNING: return "WARNING";
        case Level::INFO:    return "INFO";
        case Level::DEBUG:   return "DEBUG";
        case Level::VERBOSE: return "VERBOSE";
        default:             return "UNKNOWN";
    }
}

// Accepts the lower-case names used in config files; unknown names map to INFO.
inline Level level_from_string(const std::string& name) {
    if (name == "fatal")   return Level::FATAL;
    if (name == "error")   return Level::ERROR;
    if (name == "warning") return Level::WARNING;
    if (name == "debug")   return Level::DEBUG;
    if (name == "verbose") return Level::VERBOSE;
    return Level::INFO;
}

// Process-wide ceiling applied on top of each logger's own level.
inline Level& global_level() {
    static Level level = Level::INFO;
    return level;
}

inline void set_global_level(Level level) {
    global_level() = level;
}

class Logger {
public:
    Logger(const std::string& component, Level max_level = Level::VERBOSE)
        : component_(component)
        , max_level_(max_level)
        , pid_(getpid()) {}

    void set_level(Level level) {
        max_level_ = level;
    }

    Level get_level() const {
        return max_level_;
    }

    void log(Level level, const std::string& message) const {
        if (level > max_level_ || level > global_level()) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local{};
        localtime_r(&time_t, &local);

        std::ostringstream oss;
        oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << " [" << component_ << "]"
            << " [" << pid_ << "]"
            << " [" << level_to_string(level) << "]"
            << " " << message;

        static std::mutex out_mtx;
        std::lock_guard<std::mutex> lock(out_mtx);
        std::cout << oss.str() << std::endl;
    }

    void fatal(const std::string& message) const   { log(Level::FATAL, message); }
    void error(const std::string& message) const   { log(Level::ERROR, message); }
    void warning(const std::string& message) const { log(Level::WARNING, message); }
    void info(const std::string& message) const    { log(Level::INFO, message); }
    void debug(const std::string& message) const   { log(Level::DEBUG, message); }
    void verbose(const std::string& message) const { log(Level::VERBOSE, message); }

private:
    std::string component_;
    Level max_level_;
    pid_t pid_;
};

} // namespace log
} // namespace kvsession
