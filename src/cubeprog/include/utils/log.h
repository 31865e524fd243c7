#ifndef CUBEPROG_UTILS_LOG_H
#define CUBEPROG_UTILS_LOG_H

#include <iostream>
#include <iomanip>
#include <chrono>
#include <sstream>
#include <ctime>
#include <functional>
#include <mutex>
#include <string>

namespace cubeprog {
namespace utils {

enum class LogLevel {
    VERBOSE,
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    FATAL
};

// Default log level - can be overridden at compile time
// Example: -DCUBEPROG_LOG_LEVEL_DEFAULT=::cubeprog::utils::LogLevel::INFO
#ifndef CUBEPROG_LOG_LEVEL_DEFAULT
    #define CUBEPROG_LOG_LEVEL_DEFAULT ::cubeprog::utils::LogLevel::INFO
#endif

/**
 * @brief Receives formatted log lines instead of the console
 */
using LogSink = std::function<void(LogLevel level, const std::string& line)>;

struct LogState {
    LogLevel maxLevel = CUBEPROG_LOG_LEVEL_DEFAULT;
    LogSink sink;
    std::mutex mutex;
};

// One instance per process, shared by every translation unit
inline LogState& logState() {
    static LogState state;
    return state;
}

inline void setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(logState().mutex);
    logState().maxLevel = level;
}

inline LogLevel getLogLevel() {
    std::lock_guard<std::mutex> lock(logState().mutex);
    return logState().maxLevel;
}

/**
 * @brief Redirect log output, or restore the console with an empty sink
 */
inline void setLogSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(logState().mutex);
    logState().sink = std::move(sink);
}

inline const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::VERBOSE: return "VERBOSE";
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::FATAL:   return "FATAL";
        default:                return "UNKNOWN";
    }
}

inline std::string getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    #ifdef _WIN32
        localtime_s(&tm_buf, &now_time_t);
    #else
        localtime_r(&now_time_t, &tm_buf);
    #endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << now_ms.count();
    return oss.str();
}

inline const char* extractFilename(const char* path) {
    const char* filename = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/' || *p == '\\') {
            filename = p + 1;
        }
    }
    return filename;
}

/**
 * @brief Emit one line tagged with an arbitrary origin instead of file:line
 */
inline void logTagged(LogLevel level, const std::string& tag, const std::string& message) {
    LogLevel maxLevel;
    LogSink sink;
    {
        // The sink runs unlocked so it may log or change settings itself
        std::lock_guard<std::mutex> lock(logState().mutex);
        maxLevel = logState().maxLevel;
        sink = logState().sink;
    }

    if (level < maxLevel) {
        return;
    }

    std::ostringstream oss;
    oss << "[" << getCurrentTimestamp() << "] "
        << "[" << logLevelToString(level) << "] "
        << "[" << tag << "] "
        << message;

    if (sink) {
        sink(level, oss.str());
    } else if (level == LogLevel::ERROR || level == LogLevel::FATAL) {
        std::cerr << oss.str() << std::endl;
    } else {
        std::cout << oss.str() << std::endl;
    }
}

inline void log(LogLevel level, const char* file, int line, const std::string& message) {
    std::ostringstream tag;
    tag << extractFilename(file) << ":" << line;
    logTagged(level, tag.str(), message);
}

} // namespace utils
} // namespace cubeprog

/**
 * @brief Log Level Filtering
 *
 * 1. Compile time (in CMakeLists.txt):
 *    add_definitions(-DCUBEPROG_LOG_LEVEL_DEFAULT=::cubeprog::utils::LogLevel::DEBUG)
 *
 * 2. Run time:
 *    cubeprog::utils::setLogLevel(cubeprog::utils::LogLevel::WARNING);
 *
 * Log levels (from lowest to highest):
 *   VERBOSE < DEBUG < INFO < WARNING < ERROR < FATAL
 */

#define LOGV(msg) ::cubeprog::utils::log(::cubeprog::utils::LogLevel::VERBOSE, __FILE__, __LINE__, msg)
#define LOGD(msg) ::cubeprog::utils::log(::cubeprog::utils::LogLevel::DEBUG, __FILE__, __LINE__, msg)
#define LOGI(msg) ::cubeprog::utils::log(::cubeprog::utils::LogLevel::INFO, __FILE__, __LINE__, msg)
#define LOGW(msg) ::cubeprog::utils::log(::cubeprog::utils::LogLevel::WARNING, __FILE__, __LINE__, msg)
#define LOGE(msg) ::cubeprog::utils::log(::cubeprog::utils::LogLevel::ERROR, __FILE__, __LINE__, msg)
#define LOGF(msg) ::cubeprog::utils::log(::cubeprog::utils::LogLevel::FATAL, __FILE__, __LINE__, msg)

// Stream-style formatting
#define LOGV_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGV(_oss.str()); }
#define LOGD_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGD(_oss.str()); }
#define LOGI_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGI(_oss.str()); }
#define LOGW_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGW(_oss.str()); }
#define LOGE_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGE(_oss.str()); }
#define LOGF_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGF(_oss.str()); }

#endif // CUBEPROG_UTILS_LOG_H
