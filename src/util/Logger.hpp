#pragma once

#include <mutex>
#include <string>

namespace gitpulse {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/**
 * @brief Process-wide leveled logger
 *
 * Level comes from the GITPULSE_LOG environment variable
 * (error|warn|info|debug or 0..3) and defaults to info.
 * Every level writes to stderr so stdout stays free for JSON output.
 * Safe to call from the worker and batch threads.
 */
class Logger {
public:
    static Logger& instance();
    void setLevel(LogLevel level);
    LogLevel level() const;
    void error(const std::string& msg) const;
    void warn(const std::string& msg) const;
    void info(const std::string& msg) const;
    void debug(const std::string& msg) const;

private:
    Logger();
    void write(LogLevel level, const char* tag, const std::string& msg) const;

    LogLevel currentLevel;
    mutable std::mutex mtx;
};

}
