#include "log.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

static std::atomic<int> gLogLevel{static_cast<int>(LogLevel::Info)};
static std::mutex gLogMutex;

void setLogLevel(LogLevel level)
{
    gLogLevel.store(static_cast<int>(level));
}

LogLevel logLevel()
{
    return static_cast<LogLevel>(gLogLevel.load());
}

bool parseLogLevel(const std::string &text, LogLevel &out)
{
    std::string u = text;
    std::transform(u.begin(), u.end(), u.begin(), [](unsigned char c){ return std::toupper(c); });
    if (u == "DEBUG") { out = LogLevel::Debug; return true; }
    if (u == "INFO") { out = LogLevel::Info; return true; }
    if (u == "WARN" || u == "WARNING") { out = LogLevel::Warn; return true; }
    if (u == "ERROR") { out = LogLevel::Error; return true; }
    return false;
}

void logMessage(LogLevel level, const std::string &message)
{
    if (static_cast<int>(level) < gLogLevel.load())
        return;

    std::lock_guard<std::mutex> lock(gLogMutex);
    switch (level)
    {
    case LogLevel::Debug:
        std::cout << "DEBUG: " << message << "\n";
        break;
    case LogLevel::Info:
        std::cout << message << "\n";
        break;
    case LogLevel::Warn:
        std::cerr << "WARN: " << message << "\n";
        break;
    case LogLevel::Error:
        std::cerr << "ERROR: " << message << "\n";
        break;
    }
}
