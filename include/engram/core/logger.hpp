#ifndef ENGRAM_CORE_LOGGER_HPP
#define ENGRAM_CORE_LOGGER_HPP

#include <string>
#include <cstdio>
#include <ctime>
#include <cstdarg>
#include <mutex>

namespace engram {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

class Logger {
public:
    static Logger& instance();
    
    void set_level(LogLevel level);
    LogLevel level() const;
    
    // "debug", "info", "warn"/"warning", "error"; anything else is INFO
    static LogLevel parse_level(const std::string& name);
    
    void debug(const char* fmt, ...);
    void info(const char* fmt, ...);
    void warn(const char* fmt, ...);
    void error(const char* fmt, ...);

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);
    
    void log_impl(const char* level_str, const char* fmt, va_list args);
    
    LogLevel level_;
    std::mutex mutex_;
};

// Convenience macros
#define LOG_DEBUG(...) engram::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...)  engram::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...)  engram::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...) engram::Logger::instance().error(__VA_ARGS__)

} // namespace engram

#endif // ENGRAM_CORE_LOGGER_HPP
