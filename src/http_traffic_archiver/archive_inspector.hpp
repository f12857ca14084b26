#ifndef ARCHIVE_INSPECTOR_HPP
#define ARCHIVE_INSPECTOR_HPP

#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "content_formatter.hpp"

enum class StreamDisplay
{
    Reconstructed,
    Raw,
    Events,
    Summary
};

struct InspectOptions
{
    std::string filePath;
    bool summary{false};
    bool jsonFormat{false};
    std::string filter;  // glob, '*' matches anything, case-insensitive
    StreamDisplay streamDisplay{StreamDisplay::Reconstructed};
};

enum class InspectParse
{
    Run,
    Help,
    Error
};

InspectParse parse_inspect_arguments(const std::vector<std::string>& args, InspectOptions& options,
                                     std::ostream& err);
void print_inspect_usage(const char* prog, std::ostream& out);

// Read-only view over a saved archive
class ArchiveInspector
{
   public:
    explicit ArchiveInspector(nlohmann::json document);

    // Throws std::runtime_error when the file is missing or not a HAR document
    static ArchiveInspector load(const std::string& path);

    // Entries whose request URL matches the filter, in archive order
    std::vector<const nlohmann::json*> entries(const std::string& filter) const;

    void printTable(const InspectOptions& options, std::ostream& out) const;
    void printJson(const InspectOptions& options, std::ostream& out) const;

    static bool urlMatchesFilter(const std::string& url, const std::string& pattern);
    static std::string formatSize(int64_t bytes);
    static std::string formatTime(double millis);

   private:
    void printResponseBody(const nlohmann::json& entry, StreamDisplay mode, std::ostream& out) const;
    void printReconstructed(const nlohmann::json& message, std::ostream& out) const;
    std::string indentBody(const std::string& text, const std::string& mimeType) const;

    nlohmann::json m_doc;
    ContentFormatter m_formatter;
};

#endif  // ARCHIVE_INSPECTOR_HPP
