#include <Arduino.h>

#include "../include/logger.hpp"
#include <stdarg.h>
#include <string.h>
#include <cstdio>


Logger::Level Logger::min_level_ = Logger::INFO;

bool Logger::parseLevel(const std::string& name, Level& out) {
    if (strcasecmp(name.c_str(), "DEBUG") == 0) out = Logger::DEBUG;
    else if (strcasecmp(name.c_str(), "INFO") == 0) out = Logger::INFO;
    else if (strcasecmp(name.c_str(), "WARN") == 0) out = Logger::WARN;
    else if (strcasecmp(name.c_str(), "ERROR") == 0) out = Logger::ERROR;
    else return false;
    return true;
}

void Logger::begin(const LoggingConfig& cfg) {
    min_level_ = Logger::INFO;
    if (!cfg.log_level.empty()) {
        Level level;
        if (parseLevel(cfg.log_level, level)) {
            min_level_ = level;
        } else {
            Logger::warn("[Logger] Unknown log level '%s', using INFO", cfg.log_level.c_str());
        }
    }
}

void Logger::write_log(Level level, const char* fmt, va_list args) {
    if (level < min_level_) return;
    char buf[192];
    (void)vsnprintf(buf, sizeof(buf), fmt, args);
    const char* level_str = "INFO";
    switch (level) {
        case Logger::DEBUG: level_str = "DEBUG"; break;
        case Logger::INFO:  level_str = "INFO"; break;
        case Logger::WARN:  level_str = "WARN"; break;
        case Logger::ERROR: level_str = "ERROR"; break;
    }
    // No RTC on the gateway: uptime as [d HH:MM:SS.mmm]
    unsigned long ms = millis();
    unsigned long seconds = ms / 1000;
    unsigned long minutes = seconds / 60;
    unsigned long hours = minutes / 60;
    unsigned long days = hours / 24;
    char time_buf[32];
    snprintf(time_buf, sizeof(time_buf), "%lud %02lu:%02lu:%02lu.%03lu",
             days, hours % 24, minutes % 60, seconds % 60, ms % 1000);

    printf("[%s] [%s] %s\n", time_buf, level_str, buf);
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
    fflush(stdout);
}
