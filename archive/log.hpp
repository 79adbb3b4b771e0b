#ifndef LOG_HPP
#define LOG_HPP

#include <string>

enum class LogLevel {
    Info = 0,
    Warn = 1,
    Error = 2,
    Off = 3
};

// Minimum level printed; process-wide, safe to change from any thread.
void setLogLevel(LogLevel level);
LogLevel getLogLevel();

void logInfo(const std::string& message);
void logWarn(const std::string& message);
void logError(const std::string& message);

#endif
