#include <doctest/doctest.h>

#include <sstream>

#include "logger.hpp"

namespace
{

// Restores the process-wide logger after each test
struct CapturedLog
{
    std::ostringstream out;
    std::ostringstream err;
    LogLevel saved = Logger::getLevel();

    CapturedLog() { Logger::setStreams(&out, &err); }
    ~CapturedLog()
    {
        Logger::setStreams(nullptr, nullptr);
        Logger::setLevel(saved);
    }
};

}  // namespace

TEST_CASE("Messages below the level are dropped")
{
    CapturedLog log;
    Logger::setLevel(LogLevel::WARNING);

    LOG_INFO("hidden " << 1);
    LOG_WARNING("shown " << 2);

    CHECK(log.out.str() == "[WARN] shown 2\n");
    CHECK(log.err.str().empty());
}

TEST_CASE("Errors go to the error stream with their location")
{
    CapturedLog log;
    Logger::setLevel(LogLevel::INFO);

    LOG_INFO("archive saved");
    LOG_ERROR("write failed");

    CHECK(log.out.str() == "[INFO] archive saved\n");
    CHECK(log.err.str().rfind("[ERROR] ", 0) == 0);
    CHECK(log.err.str().find("test_logger.cpp:") != std::string::npos);
    CHECK(log.err.str().find(" - write failed\n") != std::string::npos);
}

TEST_CASE("NONE silences every level")
{
    CapturedLog log;
    Logger::setLevel(LogLevel::NONE);

    LOG_ERROR("nothing");
    CHECK(log.err.str().empty());
}

TEST_CASE("Levels parse from names and digits")
{
    LogLevel level = LogLevel::ERROR;
    CHECK(Logger::parseLevel("Debug", level));
    CHECK(level == LogLevel::DEBUG);
    CHECK(Logger::parseLevel("warn", level));
    CHECK(level == LogLevel::WARNING);
    CHECK(Logger::parseLevel("4", level));
    CHECK(level == LogLevel::NONE);

    CHECK_FALSE(Logger::parseLevel("verbose", level));
    CHECK(level == LogLevel::NONE);
}
