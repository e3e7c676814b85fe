#ifndef LOG_HPP
#define LOG_HPP

#include <string>

enum class LogLevel {
    Debug = 0,
    Info,
    Warn,
    Error
};

void setLogLevel(LogLevel level);
LogLevel logLevel();

// Lines are written as "[Tag] [LEVEL] message"; INFO and DEBUG go to stdout,
// WARN and ERROR to stderr.
void logDebug(const std::string& tag, const std::string& msg);
void logInfo(const std::string& tag, const std::string& msg);
void logWarn(const std::string& tag, const std::string& msg);
void logError(const std::string& tag, const std::string& msg);

#endif
