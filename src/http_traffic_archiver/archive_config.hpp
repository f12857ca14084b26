#ifndef ARCHIVE_CONFIG_HPP
#define ARCHIVE_CONFIG_HPP

#include <chrono>
#include <string>
#include <vector>

#include "logger.hpp"

constexpr const char* OUTPUT_DIR_ENV = "HTTP_ARCHIVE_DIR";

struct ArchiveConfig
{
    std::string outputDir{"."};
    std::string archiveFile;  // generated on first use when empty
    std::chrono::milliseconds autosaveInterval{5000};
    std::string creatorName{"http_traffic_archiver"};
    std::string creatorVersion;
    LogLevel logLevel{LogLevel::WARNING};
    bool showTimestamp{false};

    // capture source: exactly one of interface / pcapFile
    std::string interface;
    std::string pcapFile;
    std::string filter{"tcp port 80"};

    // HTTP_ARCHIVE_DIR overrides outputDir when set and non-empty
    void applyEnvironment();

    // outputDir joined with archiveFile ("http-archive-<millis>.har" by default)
    std::string archivePath();

    // Empty when the configuration is usable
    std::string validate() const;
};

enum class ParseOutcome
{
    Run,
    Help,
    Error
};

// Hand-rolled argv parsing: -i -r -f -o -v --quiet --timestamp --autosave-ms.
// Diagnostics for Error go to err.
ParseOutcome parse_arguments(const std::vector<std::string>& args, ArchiveConfig& config,
                             std::ostream& err);

void print_usage(const char* prog, std::ostream& out);

#endif  // ARCHIVE_CONFIG_HPP
