#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>

std::atomic<LogLevel> Logger::current_level_{LogLevel::WARNING};
std::atomic<bool> Logger::show_timestamp_{false};
std::ostream* Logger::out_ = &std::cout;
std::ostream* Logger::err_ = &std::cerr;
std::mutex Logger::mutex_;

void Logger::setStreams(std::ostream* out, std::ostream* err)
{
    std::lock_guard<std::mutex> lock(mutex_);
    out_ = out != nullptr ? out : &std::cout;
    err_ = err != nullptr ? err : &std::cerr;
}

bool Logger::parseLevel(const std::string& text, LogLevel& out)
{
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug" || lower == "0")
    {
        out = LogLevel::DEBUG;
    }
    else if (lower == "info" || lower == "1")
    {
        out = LogLevel::INFO;
    }
    else if (lower == "warning" || lower == "warn" || lower == "2")
    {
        out = LogLevel::WARNING;
    }
    else if (lower == "error" || lower == "3")
    {
        out = LogLevel::ERROR;
    }
    else if (lower == "none" || lower == "4")
    {
        out = LogLevel::NONE;
    }
    else
    {
        return false;
    }
    return true;
}

void Logger::log(LogLevel level, const std::string& message, const char* file, int line)
{
    if (!isEnabled(level) || level == LogLevel::NONE)
    {
        return;
    }

    std::ostringstream oss;
    if (show_timestamp_.load(std::memory_order_relaxed))
    {
        time_t now = time(nullptr);
        struct tm local_tm;
        localtime_r(&now, &local_tm);
        char buf[32];
        strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local_tm);
        oss << "[" << buf << "] ";
    }

    oss << "[" << levelToString(level) << "] ";
    if ((level == LogLevel::DEBUG || level == LogLevel::ERROR) && file)
    {
        oss << file << ":" << line << " - ";
    }
    oss << message << "\n";

    std::lock_guard<std::mutex> lock(mutex_);
    if (level >= LogLevel::ERROR)
    {
        *err_ << oss.str() << std::flush;
    }
    else
    {
        *out_ << oss.str() << std::flush;
    }
}

const char* Logger::levelToString(LogLevel level)
{
    switch (level)
    {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR:   return "ERROR";
        default:                return "UNKNOWN";
    }
}
