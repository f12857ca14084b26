#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "archive_capture_app.hpp"
#include "archive_config.hpp"
#include "logger.hpp"

int main(int argc, char** argv)
{
    if (argc == 1)
    {
        print_usage(argv[0], std::cerr);
        return 1;
    }

    ArchiveConfig config;
    std::vector<std::string> args(argv + 1, argv + argc);
    switch (parse_arguments(args, config, std::cerr))
    {
        case ParseOutcome::Help:
            print_usage(argv[0], std::cout);
            return 0;
        case ParseOutcome::Error:
            print_usage(argv[0], std::cerr);
            return 1;
        case ParseOutcome::Run:
            break;
    }
    config.applyEnvironment();

    Logger::setLevel(config.logLevel);
    Logger::setShowTimestamp(config.showTimestamp);

    LOG_INFO("HTTP traffic archiver starting...");
    LOG_INFO("Source: " << (config.pcapFile.empty() ? config.interface : config.pcapFile));
    LOG_INFO("Filter: " << config.filter);
    LOG_INFO("Archive: " << config.archivePath());
    LOG_DEBUG("Log level: " << static_cast<int>(config.logLevel));

    try
    {
        ArchiveCaptureApp app(config);
        int rc = app.run();
        LOG_INFO("HTTP traffic archiver stopped");
        return rc;
    }
    catch (const std::runtime_error& e)
    {
        LOG_ERROR(e.what());
        return 1;
    }
}
