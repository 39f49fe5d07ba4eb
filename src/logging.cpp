///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "logging.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>


///////////////////////////
///       STATE         ///
///////////////////////////
static std::atomic<int> gLogLevel{(int)LogLevel::INFO};
static std::mutex gLogMutex;

static const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::OFF:     return "OFF";
    }
    return "?";
}


///////////////////////////
///       LOGGING       ///
///////////////////////////
void setLogLevel(LogLevel level) {
    gLogLevel = (int)level;
}

LogLevel logLevel() {
    return (LogLevel)gLogLevel.load();
}

void logMessage(LogLevel level, const std::string& message) {
    if (level == LogLevel::OFF || (int)level < gLogLevel.load()) return;

    auto now = std::chrono::system_clock::now();
    std::time_t secs = std::chrono::system_clock::to_time_t(now);
    int millis = (int)(std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000);

    std::tm local{};
    localtime_r(&secs, &local);

    // Format outside the lock; only the write is serialized.
    std::ostringstream line;
    line << "[" << std::put_time(&local, "%H:%M:%S") << "."
         << std::setw(3) << std::setfill('0') << millis << "] "
         << "[" << levelName(level) << "] " << message << "\n";

    std::lock_guard<std::mutex> lock(gLogMutex);
    std::clog << line.str();
}
