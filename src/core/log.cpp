#include "core/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_mutex;

void write(LogLevel level, const char* label, const std::string& tag, const std::string& msg) {
    if (static_cast<int>(level) < g_level.load()) return;

    std::lock_guard<std::mutex> lock(g_mutex);
    std::ostream& out = (level >= LogLevel::Warn) ? std::cerr : std::cout;
    out << "[" << tag << "] [" << label << "] " << msg << std::endl;
}

}

void setLogLevel(LogLevel level) { g_level.store(static_cast<int>(level)); }

LogLevel logLevel() { return static_cast<LogLevel>(g_level.load()); }

void logDebug(const std::string& tag, const std::string& msg) { write(LogLevel::Debug, "DEBUG", tag, msg); }
void logInfo(const std::string& tag, const std::string& msg) { write(LogLevel::Info, "INFO", tag, msg); }
void logWarn(const std::string& tag, const std::string& msg) { write(LogLevel::Warn, "WARN", tag, msg); }
void logError(const std::string& tag, const std::string& msg) { write(LogLevel::Error, "ERROR", tag, msg); }
