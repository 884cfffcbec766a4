#pragma once
#include <string>

// Plain stdout/stderr logging shared by the reader thread, the supervisor
// thread and callers. Debug/Info go to stdout, Warn/Error to stderr.
enum class LogLevel
{
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

void setLogLevel(LogLevel level);
LogLevel logLevel();
bool parseLogLevel(const std::string &text, LogLevel &out);

void logMessage(LogLevel level, const std::string &message);

inline void logDebug(const std::string &message) { logMessage(LogLevel::Debug, message); }
inline void logInfo(const std::string &message) { logMessage(LogLevel::Info, message); }
inline void logWarn(const std::string &message) { logMessage(LogLevel::Warn, message); }
inline void logError(const std::string &message) { logMessage(LogLevel::Error, message); }
