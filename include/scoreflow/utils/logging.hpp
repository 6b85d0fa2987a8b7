#ifndef SCOREFLOW_UTILS_LOGGING_HPP
#define SCOREFLOW_UTILS_LOGGING_HPP

#include <sstream>
#include <string>

#define SFLOG_LEVEL_DEBUG 0
#define SFLOG_LEVEL_INFO  1
#define SFLOG_LEVEL_WARN  2
#define SFLOG_LEVEL_ERROR 3
#define SFLOG_LEVEL_OFF   4

#define SFLOG(level, message) \
    do { \
        if (::scoreflow::utils::shouldLog(level)) { \
            std::ostringstream sflog_stream_; \
            sflog_stream_ << message; \
            ::scoreflow::utils::writeLog(level, sflog_stream_.str()); \
        } \
    } while (false)

#define SFLOG_DEBUG(message)    SFLOG(SFLOG_LEVEL_DEBUG, message)
#define SFLOG_INFO(message)     SFLOG(SFLOG_LEVEL_INFO, message)
#define SFLOG_WARN(message)     SFLOG(SFLOG_LEVEL_WARN, message)
#define SFLOG_ERROR(message)    SFLOG(SFLOG_LEVEL_ERROR, message)

namespace scoreflow {
namespace utils {

/**
 * @brief Sets the minimum level written by the SFLOG_* macros.
 *
 * Accepts one of the SFLOG_LEVEL_* values. Defaults to SFLOG_LEVEL_INFO.
 */
void setLogLevel(int level);
int getLogLevel();

/**
 * @brief Parses "debug", "info", "warn", "error" or "off".
 * @return The matching SFLOG_LEVEL_* value, or -1 for an unknown name.
 */
int parseLogLevel(const std::string& name);

bool shouldLog(int level);
void writeLog(int level, const std::string& message);

} // namespace utils
} // namespace scoreflow

#endif // SCOREFLOW_UTILS_LOGGING_HPP
