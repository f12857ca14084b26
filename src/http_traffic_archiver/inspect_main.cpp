#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "archive_inspector.hpp"
#include "logger.hpp"

int main(int argc, char** argv)
{
    InspectOptions options;
    std::vector<std::string> args(argv + 1, argv + argc);
    switch (parse_inspect_arguments(args, options, std::cerr))
    {
        case InspectParse::Help:
            print_inspect_usage(argv[0], std::cout);
            return 0;
        case InspectParse::Error:
            print_inspect_usage(argv[0], std::cerr);
            return 1;
        case InspectParse::Run:
            break;
    }

    try
    {
        ArchiveInspector inspector = ArchiveInspector::load(options.filePath);
        if (options.jsonFormat)
            inspector.printJson(options, std::cout);
        else
            inspector.printTable(options, std::cout);
    }
    catch (const std::runtime_error& e)
    {
        LOG_ERROR("Error loading HAR file: " << e.what());
        return 1;
    }
    catch (const std::exception& e)
    {
        LOG_ERROR("Error printing HAR file: " << e.what());
        return 1;
    }
    return 0;
}
