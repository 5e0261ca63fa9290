#pragma once
#include <iostream>
#include <mutex>
#include <string>

namespace ansi {
    const std::string reset   = "\033[0m";
    const std::string bold    = "\033[1m";
    const std::string cyan    = "\033[36m";
    const std::string red     = "\033[31m";
    const std::string yellow  = "\033[33m";
    const std::string green   = "\033[32m";
    const std::string magenta = "\033[35m";
    const std::string white   = "\033[37m";
    const std::string gray    = "\033[90m";
}
enum class LogLevel {
    NONE,
    ERROR,
    WARN,
    INFO,
    DEBUG
};

// Scans run on worker threads, so every line is written under one lock.
class Logger {
public:
    static LogLevel level;

    static void setLevel(LogLevel newLevel) {
        std::lock_guard<std::mutex> lock(mutex());
        level = newLevel;
    }

    static void debug(const std::string& msg) {
        write(LogLevel::DEBUG, ansi::gray, "[DEBUG] ", msg);
    }

    static void info(const std::string& msg) {
        write(LogLevel::INFO, ansi::white, "[INFO] ", msg);
    }

    static void warn(const std::string& msg) {
        write(LogLevel::WARN, ansi::yellow, "[WARN] ", msg);
    }

    static void error(const std::string& msg) {
        write(LogLevel::ERROR, ansi::red, "[ERROR] ", msg);
    }

private:
    static std::mutex& mutex() {
        static std::mutex m;
        return m;
    }

    static void write(LogLevel msgLevel, const std::string& color, const char* tag, const std::string& msg) {
        std::lock_guard<std::mutex> lock(mutex());
        if (level >= msgLevel) {
            std::cerr << color << tag << msg << ansi::reset << "\n";
        }
    }
};
