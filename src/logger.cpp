#include "../include/logger.hpp"
#include <stdarg.h>
#include <string.h>
#include <cstdio>
#include <chrono>
#include <ctime>
#include <mutex>

namespace {
std::mutex g_log_mutex;
}

std::atomic<int> Logger::min_level_(Logger::INFO);
std::string Logger::log_file_ = "";
bool Logger::flush_on_write_ = true;

Logger::Level Logger::parseLevel(const std::string& name, Level fallback) {
    if (strcmp(name.c_str(), "DEBUG") == 0) return Logger::DEBUG;
    if (strcmp(name.c_str(), "INFO") == 0) return Logger::INFO;
    if (strcmp(name.c_str(), "WARN") == 0) return Logger::WARN;
    if (strcmp(name.c_str(), "ERROR") == 0) return Logger::ERROR;
    return fallback;
}

void Logger::begin(const LoggingConfig& cfg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    Level level = Logger::INFO;
    if (!cfg.log_level.empty()) {
        level = parseLevel(cfg.log_level);
    }
    min_level_.store(level);
    log_file_ = cfg.log_file;
    flush_on_write_ = cfg.flush_on_write;
}

Logger::Level Logger::level() {
    return (Level)min_level_.load();
}

void Logger::write_log(Level level, const char* fmt, va_list args) {
    if ((int)level < min_level_.load()) return;
    char buf[256];
    (void)vsnprintf(buf, sizeof(buf), fmt, args);
    const char* level_str = "INFO";
    switch (level) {
        case Logger::DEBUG: level_str = "DEBUG"; break;
        case Logger::INFO:  level_str = "INFO"; break;
        case Logger::WARN:  level_str = "WARN"; break;
        case Logger::ERROR: level_str = "ERROR"; break;
    }
    // [YYYY-MM-DD HH:MM:SS.mmm] [LEVEL] message
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now();
    std::time_t secs = std::chrono::system_clock::to_time_t(now);
    long ms = (long)(std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()).count() % 1000);
    std::tm tm_buf;
    localtime_r(&secs, &tm_buf);
    char time_buf[32];
    size_t n = strftime(time_buf, sizeof(time_buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    snprintf(time_buf + n, sizeof(time_buf) - n, ".%03ld", ms);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    printf("[%s] [%s] %s\n", time_buf, level_str, buf);

    if (!log_file_.empty()) {
        FILE* fh = fopen(log_file_.c_str(), "a");
        if (fh) {
            fprintf(fh, "[%s] [%s] %s\n", time_buf, level_str, buf);
            if (flush_on_write_) fflush(fh);
            fclose(fh);
        }
    }
}

void Logger::log(Level level, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_log(level, fmt, args);
    va_end(args);
}

void Logger::debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_log(DEBUG, fmt, args);
    va_end(args);
}

void Logger::info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_log(INFO, fmt, args);
    va_end(args);
}

void Logger::warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_log(WARN, fmt, args);
    va_end(args);
}

void Logger::error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_log(ERROR, fmt, args);
    va_end(args);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    fflush(stdout);
}

void Logger::shutdown() {
    // Log file is reopened per line, nothing to close
    flush();
}
