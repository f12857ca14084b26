#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

/**
 * Process logger with levels: DEBUG, INFO, WARNING, ERROR
 *
 * Usage:
 *   Logger::setLevel(LogLevel::INFO);
 *   LOG_DEBUG("Decoded " << n << " chunks");
 *   LOG_WARNING("Codec stage failed: " << stage);
 *
 * Archive system notes are not routed here; they live in the HAR comment.
 * ERROR goes to the error stream, everything else to the output stream.
 * LOG_DEBUG is compiled out with -DNDEBUG.
 */

enum class LogLevel
{
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3,
    NONE = 4  // Disable all logging
};

class Logger
{
   public:
    static void setLevel(LogLevel level) { current_level_.store(level, std::memory_order_relaxed); }
    static LogLevel getLevel() { return current_level_.load(std::memory_order_relaxed); }

    static void setShowTimestamp(bool show) { show_timestamp_.store(show, std::memory_order_relaxed); }

    // Redirect output (tests capture into string streams). nullptr restores std::cout/std::cerr.
    static void setStreams(std::ostream* out, std::ostream* err);

    static bool isEnabled(LogLevel level) { return level >= getLevel(); }

    // Accepts "debug", "info", "warning"/"warn", "error", "none" or a digit 0-4.
    // Returns false and leaves out untouched for anything else.
    static bool parseLevel(const std::string& text, LogLevel& out);

    // file/line are printed for DEBUG and ERROR only
    static void log(LogLevel level, const std::string& message, const char* file = nullptr,
                    int line = 0);

   private:
    static const char* levelToString(LogLevel level);

    // the autosave thread logs too
    static std::atomic<LogLevel> current_level_;
    static std::atomic<bool> show_timestamp_;
    static std::ostream* out_;
    static std::ostream* err_;
    static std::mutex mutex_;
};

#define LOG_DEBUG(msg) \
    do { \
        if (Logger::isEnabled(LogLevel::DEBUG)) { \
            std::ostringstream oss; \
            oss << msg; \
            Logger::log(LogLevel::DEBUG, oss.str(), __FILE__, __LINE__); \
        } \
    } while(0)

#define LOG_INFO(msg) \
    do { \
        if (Logger::isEnabled(LogLevel::INFO)) { \
            std::ostringstream oss; \
            oss << msg; \
            Logger::log(LogLevel::INFO, oss.str()); \
        } \
    } while(0)

#define LOG_WARNING(msg) \
    do { \
        if (Logger::isEnabled(LogLevel::WARNING)) { \
            std::ostringstream oss; \
            oss << msg; \
            Logger::log(LogLevel::WARNING, oss.str()); \
        } \
    } while(0)

#define LOG_ERROR(msg) \
    do { \
        if (Logger::isEnabled(LogLevel::ERROR)) { \
            std::ostringstream oss; \
            oss << msg; \
            Logger::log(LogLevel::ERROR, oss.str(), __FILE__, __LINE__); \
        } \
    } while(0)

#ifdef NDEBUG
#undef LOG_DEBUG
#define LOG_DEBUG(msg) do {} while(0)
#endif

#endif  // LOGGER_HPP
