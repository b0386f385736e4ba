#pragma once

#include <atomic>
#include <string>
#include <cstdarg>
#include "config_manager.hpp"

class Logger {
public:
    enum Level { DEBUG, INFO, WARN, ERROR };
    static void begin(const LoggingConfig& cfg);
    static void log(Level level, const char* fmt, ...);
    static void debug(const char* fmt, ...);
    static void info(const char* fmt, ...);
    static void warn(const char* fmt, ...);
    static void error(const char* fmt, ...);
    static Level level();
    static Level parseLevel(const std::string& name, Level fallback = INFO);
    static void flush();
    static void shutdown();
private:
    static std::atomic<int> min_level_;
    static std::string log_file_;
    static bool flush_on_write_;
    static void write_log(Level level, const char* fmt, va_list args);
};
