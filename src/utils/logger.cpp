/**
 * @file logger.cpp
 * @brief Logging utilities
 */

#include "utils/logger.h"
#include "utils/text_utils.h"

#include <atomic>
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace hud_advisor {

namespace {

std::atomic<LogLevel> g_minLogLevel{LogLevel::INFO};
std::mutex g_logMutex;

std::string getTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&time, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

} // namespace

void setLogLevel(LogLevel level) {
    g_minLogLevel.store(level);
}

LogLevel logLevel() {
    return g_minLogLevel.load();
}

bool parseLogLevel(const std::string& name, LogLevel& level) {
    const std::string up = text::toUpperAscii(text::trim(name));
    if (up == "DEBUG") level = LogLevel::DEBUG;
    else if (up == "INFO") level = LogLevel::INFO;
    else if (up == "WARNING" || up == "WARN") level = LogLevel::WARNING;
    else if (up == "ERROR") level = LogLevel::ERROR;
    else return false;
    return true;
}

void log(LogLevel level, const std::string& message) {
    if (level < g_minLogLevel.load()) return;

    const char* levelStr = "";
    switch (level) {
        case LogLevel::DEBUG:   levelStr = "[DEBUG]"; break;
        case LogLevel::INFO:    levelStr = "[INFO]"; break;
        case LogLevel::WARNING: levelStr = "[WARN]"; break;
        case LogLevel::ERROR:   levelStr = "[ERROR]"; break;
    }

    const std::string stamp = getTimestamp();
    std::lock_guard<std::mutex> lock(g_logMutex);
    std::cout << stamp << " " << levelStr << " " << message << std::endl;
}

void logDebug(const std::string& message) { log(LogLevel::DEBUG, message); }
void logInfo(const std::string& message) { log(LogLevel::INFO, message); }
void logWarning(const std::string& message) { log(LogLevel::WARNING, message); }
void logError(const std::string& message) { log(LogLevel::ERROR, message); }

} // namespace hud_advisor
