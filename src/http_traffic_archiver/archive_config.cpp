#include "archive_config.hpp"

#include <cstdlib>
#include <ostream>

static std::string default_archive_name()
{
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
    return "http-archive-" + std::to_string(millis) + ".har";
}

void ArchiveConfig::applyEnvironment()
{
    const char* dir = std::getenv(OUTPUT_DIR_ENV);
    if (dir != nullptr && dir[0] != '\0')
    {
        outputDir = dir;
    }
}

std::string ArchiveConfig::archivePath()
{
    if (archiveFile.empty())
    {
        archiveFile = default_archive_name();
    }
    if (outputDir.empty())
    {
        return archiveFile;
    }
    if (outputDir.back() == '/')
    {
        return outputDir + archiveFile;
    }
    return outputDir + "/" + archiveFile;
}

std::string ArchiveConfig::validate() const
{
    if (interface.empty() && pcapFile.empty())
    {
        return "Interface or capture file not specified.";
    }
    if (!interface.empty() && !pcapFile.empty())
    {
        return "Use either -i or -r, not both.";
    }
    if (autosaveInterval.count() < 0)
    {
        return "Autosave interval must not be negative.";
    }
    return "";
}

void print_usage(const char* prog, std::ostream& out)
{
    out << "Usage: " << prog
        << " (-i <interface> | -r <file.pcap>) [-f <filter>] [-o <dir>] [-v <level>] [--quiet]\n";
    out << "  -i <interface>     Network interface to capture on\n";
    out << "  -r <file.pcap>     Read packets from a capture file instead\n";
    out << "  -f <filter>        BPF filter (default: \"tcp port 80\")\n";
    out << "  -o <dir>           Directory for the .har archive (default: current directory,\n";
    out << "                     overridden by " << OUTPUT_DIR_ENV << ")\n";
    out << "  -v <level>         Log level: 0=DEBUG, 1=INFO, 2=WARNING, 3=ERROR (default: 2)\n";
    out << "  --quiet            Disable all logging\n";
    out << "  --timestamp        Show timestamps in logs\n";
    out << "  --autosave-ms <n>  Snapshot interval in milliseconds, 0 disables (default: 5000)\n";
}

ParseOutcome parse_arguments(const std::vector<std::string>& args, ArchiveConfig& config,
                             std::ostream& err)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        const std::string& arg = args[i];
        const bool has_value = i + 1 < args.size();

        if (arg == "-h" || arg == "--help")
        {
            return ParseOutcome::Help;
        }
        else if (arg == "-i" && has_value)
        {
            config.interface = args[++i];
        }
        else if (arg == "-r" && has_value)
        {
            config.pcapFile = args[++i];
        }
        else if (arg == "-f" && has_value)
        {
            config.filter = args[++i];
        }
        else if (arg == "-o" && has_value)
        {
            config.outputDir = args[++i];
        }
        else if (arg == "-v" && has_value)
        {
            if (!Logger::parseLevel(args[++i], config.logLevel))
            {
                err << "Invalid log level. Use 0-3.\n";
                return ParseOutcome::Error;
            }
        }
        else if (arg == "--quiet")
        {
            config.logLevel = LogLevel::NONE;
        }
        else if (arg == "--timestamp")
        {
            config.showTimestamp = true;
        }
        else if (arg == "--autosave-ms" && has_value)
        {
            const std::string& value = args[++i];
            char* end = nullptr;
            long ms = std::strtol(value.c_str(), &end, 10);
            if (value.empty() || end == nullptr || *end != '\0' || ms < 0)
            {
                err << "Invalid autosave interval: " << value << "\n";
                return ParseOutcome::Error;
            }
            config.autosaveInterval = std::chrono::milliseconds(ms);
        }
        else
        {
            err << "Unknown or incomplete option: " << arg << "\n";
            return ParseOutcome::Error;
        }
    }

    const std::string problem = config.validate();
    if (!problem.empty())
    {
        err << problem << "\n";
        return ParseOutcome::Error;
    }
    return ParseOutcome::Run;
}
