#include "scoreflow/utils/logging.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace scoreflow {
namespace utils {

namespace {
    std::atomic<int> currentLevel{SFLOG_LEVEL_INFO};
    std::mutex outputMutex;

    const char* levelTag(int level) {
        switch (level) {
            case SFLOG_LEVEL_DEBUG: return "DEBUG";
            case SFLOG_LEVEL_INFO:  return "INFO";
            case SFLOG_LEVEL_WARN:  return "WARN";
            default:                return "ERROR";
        }
    }
}

void setLogLevel(int level) {
    currentLevel = level;
}

int getLogLevel() {
    return currentLevel;
}

int parseLogLevel(const std::string& name) {
    if (name == "debug") return SFLOG_LEVEL_DEBUG;
    if (name == "info") return SFLOG_LEVEL_INFO;
    if (name == "warn") return SFLOG_LEVEL_WARN;
    if (name == "error") return SFLOG_LEVEL_ERROR;
    if (name == "off") return SFLOG_LEVEL_OFF;
    return -1;
}

bool shouldLog(int level) {
    return level >= currentLevel.load();
}

void writeLog(int level, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::lock_guard<std::mutex> lock(outputMutex);
    std::clog << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ")
              << " [" << levelTag(level) << "] " << message << std::endl;
}

} // namespace utils
} // namespace scoreflow
