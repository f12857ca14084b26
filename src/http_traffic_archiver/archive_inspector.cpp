#include "archive_inspector.hpp"

#include <string_view>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <type_traits>

#include "event_stream_reconstructor.hpp"
#include "har_fields.hpp"
#include "logger.hpp"

using nlohmann::json;

namespace
{

std::string pad_end(const std::string& s, size_t width)
{
    if (s.size() >= width)
    {
        return s;
    }
    return s + std::string(width - s.size(), ' ');
}

std::string string_field(const json& obj, const char* key, const std::string& fallback = "")
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string())
    {
        return fallback;
    }
    return it->get<std::string>();
}

// Integers only for integral T; anything else, or a missing key, gives fallback
template <class T>
T number_field(const json& obj, const char* key, T fallback)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return fallback;
    }
    if (std::is_integral<T>::value ? !it->is_number_integer() : !it->is_number())
    {
        return fallback;
    }
    return it->get<T>();
}

const json& object_field(const json& obj, const char* key)
{
    static const json empty = json::object();
    auto it = obj.find(key);
    return it != obj.end() && it->is_object() ? *it : empty;
}

std::string indent_lines(const std::string& text, const std::string& prefix)
{
    std::string out = prefix;
    for (char c : text)
    {
        out += c;
        if (c == '\n')
        {
            out += prefix;
        }
    }
    return out;
}

bool glob_match_at(const std::string& text, size_t ti, const std::string& pattern, size_t pi)
{
    while (pi < pattern.size())
    {
        if (pattern[pi] == '*')
        {
            for (size_t k = ti; k <= text.size(); ++k)
            {
                if (glob_match_at(text, k, pattern, pi + 1))
                {
                    return true;
                }
            }
            return false;
        }
        if (ti >= text.size() || text[ti] != pattern[pi])
        {
            return false;
        }
        ++ti;
        ++pi;
    }
    return true;
}

}  // namespace

void print_inspect_usage(const char* prog, std::ostream& out)
{
    out << "Usage: " << prog << " <har-file> [options]\n";
    out << "  --summary                Show only the request table\n";
    out << "  --format=<table|json>    Output format (default: table)\n";
    out << "  --filter=<pattern>       Only URLs matching the pattern ('*' wildcard)\n";
    out << "  --stream-display=<mode>  reconstructed, raw, events or summary (default: reconstructed)\n";
    out << "  -v <level>               Log level 0-3\n";
}

InspectParse parse_inspect_arguments(const std::vector<std::string>& args, InspectOptions& options,
                                     std::ostream& err)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        const std::string& arg = args[i];
        if (arg == "--help" || arg == "-h")
        {
            return InspectParse::Help;
        }
        else if (arg == "--summary")
        {
            options.summary = true;
        }
        else if (arg.rfind("--format=", 0) == 0)
        {
            const std::string format = arg.substr(9);
            if (format != "json" && format != "table")
            {
                err << "Unknown format: " << format << "\n";
                return InspectParse::Error;
            }
            options.jsonFormat = format == "json";
        }
        else if (arg.rfind("--filter=", 0) == 0)
        {
            options.filter = arg.substr(9);
        }
        else if (arg.rfind("--stream-display=", 0) == 0)
        {
            const std::string mode = arg.substr(17);
            if (mode == "reconstructed")
                options.streamDisplay = StreamDisplay::Reconstructed;
            else if (mode == "raw")
                options.streamDisplay = StreamDisplay::Raw;
            else if (mode == "events")
                options.streamDisplay = StreamDisplay::Events;
            else if (mode == "summary")
                options.streamDisplay = StreamDisplay::Summary;
            else
            {
                err << "Unknown stream display mode: " << mode << "\n";
                return InspectParse::Error;
            }
        }
        else if (arg == "-v" && i + 1 < args.size())
        {
            LogLevel level;
            if (!Logger::parseLevel(args[++i], level))
            {
                err << "Invalid log level. Use 0-3.\n";
                return InspectParse::Error;
            }
            Logger::setLevel(level);
        }
        else if (!arg.empty() && arg[0] != '-' && options.filePath.empty())
        {
            options.filePath = arg;
        }
        else
        {
            err << "Unknown option: " << arg << "\n";
            return InspectParse::Error;
        }
    }

    if (options.filePath.empty())
    {
        err << "No archive file given.\n";
        return InspectParse::Error;
    }
    return InspectParse::Run;
}

ArchiveInspector::ArchiveInspector(json document) : m_doc(std::move(document)) {}

ArchiveInspector ArchiveInspector::load(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
    {
        throw std::runtime_error("File not found: " + path);
    }

    json doc = json::parse(in, nullptr, false);
    if (doc.is_discarded())
    {
        throw std::runtime_error("Not valid JSON: " + path);
    }
    auto log = doc.find("log");
    if (log == doc.end() || !log->is_object() || !log->contains("entries") ||
        !(*log)["entries"].is_array())
    {
        throw std::runtime_error("Not an HTTP archive (missing log.entries): " + path);
    }
    LOG_DEBUG("Loaded " << (*log)["entries"].size() << " entries from " << path);
    return ArchiveInspector(std::move(doc));
}

std::vector<const json*> ArchiveInspector::entries(const std::string& filter) const
{
    std::vector<const json*> out;
    const json& log = object_field(m_doc, "log");
    auto all = log.find("entries");
    if (all == log.end() || !all->is_array())
    {
        return out;
    }
    for (const auto& entry : *all)
    {
        if (urlMatchesFilter(string_field(object_field(entry, "request"), "url"), filter))
        {
            out.push_back(&entry);
        }
    }
    return out;
}

bool ArchiveInspector::urlMatchesFilter(const std::string& url, const std::string& pattern)
{
    if (pattern.empty())
    {
        return true;
    }
    // unanchored, like a substring search with wildcards
    const std::string text = to_lower(url);
    const std::string glob = "*" + to_lower(pattern) + "*";
    return glob_match_at(text, 0, glob, 0);
}

std::string ArchiveInspector::formatSize(int64_t bytes)
{
    if (bytes < 0)
    {
        return "unknown";
    }
    std::ostringstream oss;
    if (bytes < 1024)
    {
        oss << bytes << " B";
    }
    else if (bytes < 1024 * 1024)
    {
        oss << std::fixed << std::setprecision(1) << static_cast<double>(bytes) / 1024 << " KB";
    }
    else
    {
        oss << std::fixed << std::setprecision(1) << static_cast<double>(bytes) / (1024 * 1024) << " MB";
    }
    return oss.str();
}

std::string ArchiveInspector::formatTime(double millis)
{
    std::ostringstream oss;
    if (millis < 10)
    {
        oss << std::fixed << std::setprecision(1) << millis << "ms";
    }
    else if (millis < 1000)
    {
        oss << static_cast<int64_t>(millis + 0.5) << "ms";
    }
    else
    {
        oss << std::fixed << std::setprecision(2) << millis / 1000 << "s";
    }
    return oss.str();
}

std::string ArchiveInspector::indentBody(const std::string& text, const std::string& mimeType) const
{
    return indent_lines(m_formatter.formatContent(text, mimeType), "  ");
}

void ArchiveInspector::printTable(const InspectOptions& options, std::ostream& out) const
{
    const json& log = object_field(m_doc, "log");
    const json& creator = object_field(log, "creator");
    const auto selected = entries(options.filter);
    const size_t total = entries("").size();

    out << "\nHAR File: " << options.filePath << "\n";
    out << "Creator: " << string_field(creator, "name", "unknown") << " v"
        << string_field(creator, "version", "?") << "\n";
    out << "Entries: " << total << "\n\n";
    out << "Showing " << selected.size() << " of " << total << " requests\n\n";

    out << pad_end("#", 4) << " " << pad_end("Method", 7) << " " << pad_end("Status", 8) << " "
        << pad_end("Type", 20) << " " << pad_end("Size", 10) << " " << pad_end("Time", 10) << " URL\n";
    out << std::string(120, '-') << "\n";

    size_t index = 0;
    for (const json* entry : selected)
    {
        const json& request = object_field(*entry, "request");
        const json& response = object_field(*entry, "response");
        const json& content = object_field(response, "content");

        const std::string mime = string_field(content, "mimeType");
        std::string content_type(trim(std::string_view(mime).substr(0, mime.find(';'))));
        if (content_type.empty())
        {
            content_type = "unknown";
        }
        std::string short_type = content_type.substr(content_type.rfind('/') + 1);
        if (EventStreamReconstructor::detect(response))
        {
            short_type += " (stream)";
        }

        const int64_t status = number_field<int64_t>(response, "status", 0);
        const int64_t size = number_field<int64_t>(content, "size", -1);
        const double time = number_field<double>(*entry, "time", 0.0);

        out << pad_end(std::to_string(++index), 4) << " " << pad_end(string_field(request, "method"), 7) << " "
            << pad_end(std::to_string(status), 8) << " " << pad_end(short_type, 20) << " "
            << pad_end(formatSize(size), 10) << " " << pad_end(formatTime(time), 10) << " "
            << string_field(request, "url") << "\n";

        if (options.summary)
        {
            continue;
        }

        auto post = request.find("postData");
        if (post != request.end() && post->is_object() && !string_field(*post, "text").empty())
        {
            out << "  Request Body:\n";
            out << indentBody(string_field(*post, "text"), string_field(*post, "mimeType")) << "\n";
        }
        if (!string_field(content, "text").empty())
        {
            printResponseBody(*entry, options.streamDisplay, out);
        }
        out << "\n";
    }

    const std::string comment = string_field(log, "comment");
    if (!options.summary && !comment.empty())
    {
        out << "Notes:\n" << indent_lines(comment, "  ") << "\n";
    }
}

void ArchiveInspector::printResponseBody(const json& entry, StreamDisplay mode, std::ostream& out) const
{
    const json& response = object_field(entry, "response");
    const json& content = object_field(response, "content");
    const std::string text = string_field(content, "text");

    if (!EventStreamReconstructor::detect(response))
    {
        out << "  Response Body:\n";
        out << indentBody(text, string_field(content, "mimeType")) << "\n";
        return;
    }

    out << "  Response Body: (Server-Sent Event Stream)\n";
    const ParsedStream parsed = EventStreamReconstructor::parse(text);
    switch (mode)
    {
        case StreamDisplay::Raw:
            out << indent_lines(text, "  ") << "\n";
            break;
        case StreamDisplay::Events:
            out << "  Events:\n";
            for (size_t i = 0; i < parsed.events.size(); ++i)
            {
                const StreamEvent& event = parsed.events[i];
                out << "  [" << i << "] " << event.type << ":\n";
                out << indent_lines(m_formatter.formatJson(event.data), "    ") << "\n";
            }
            break;
        case StreamDisplay::Summary:
        {
            const EventSummary summary = EventStreamReconstructor::summarize(parsed.events);
            out << "  Total Events: " << summary.total << "\n";
            for (const auto& [type, count] : summary.byType)
            {
                out << "  - " << type << ": " << count << "\n";
            }
            break;
        }
        case StreamDisplay::Reconstructed:
            printReconstructed(parsed.message.toJson(), out);
            break;
    }
}

void ArchiveInspector::printReconstructed(const json& message, std::ostream& out) const
{
    const std::string prefix = "  ";
    out << prefix << "Reconstructed Message:\n";
    if (message.contains("id") && message["id"].is_string())
        out << prefix << "ID: " << message["id"].get<std::string>() << "\n";
    if (message.contains("role") && message["role"].is_string())
        out << prefix << "Role: " << message["role"].get<std::string>() << "\n";
    if (message.contains("model") && message["model"].is_string())
        out << prefix << "Model: " << message["model"].get<std::string>() << "\n";

    const json content = message.contains("content") ? message["content"] : json::array();
    for (size_t i = 0; i < content.size(); ++i)
    {
        const json& block = content[i];
        if (!block.is_object())
        {
            continue;
        }
        const std::string type = string_field(block, "type", "unknown");
        out << "\n" << prefix << "[Content Block " << i << "] " << type << "\n";
        if (type == "text")
        {
            out << indent_lines(string_field(block, "text"), prefix) << "\n";
        }
        else if (type == "thinking")
        {
            out << indent_lines(string_field(block, "thinking"), prefix) << "\n";
        }
        else
        {
            out << indent_lines(m_formatter.formatJson(block), prefix) << "\n";
        }
    }

    if (message.contains("stop_reason") && message["stop_reason"].is_string())
    {
        out << "\n" << prefix << "Stop reason: " << message["stop_reason"].get<std::string>() << "\n";
    }
    if (message.contains("usage") && !message["usage"].is_null())
    {
        out << prefix << "Tokens: " << m_formatter.formatJson(message["usage"]) << "\n";
    }
    if (message.contains("error") && !message["error"].is_null())
    {
        out << prefix << "Error: " << m_formatter.formatJson(message["error"]) << "\n";
    }
    if (message.contains("errors") && message["errors"].is_array() && !message["errors"].empty())
    {
        out << prefix << "Processing Errors: " << message["errors"].size() << "\n";
        size_t n = 0;
        for (const auto& err : message["errors"])
        {
            out << prefix << "- Error " << ++n << ": " << string_field(err, "error", "Unknown error")
                << " (in " << string_field(err, "event_type", "unknown") << " event)\n";
        }
    }
}

void ArchiveInspector::printJson(const InspectOptions& options, std::ostream& out) const
{
    json result = json::array();
    size_t index = 0;
    for (const json* entry : entries(options.filter))
    {
        const json& request = object_field(*entry, "request");
        const json& response = object_field(*entry, "response");
        const json& content = object_field(response, "content");
        const bool stream = EventStreamReconstructor::detect(response);

        if (options.summary)
        {
            result.push_back({{"index", ++index},
                              {"url", string_field(request, "url")},
                              {"method", string_field(request, "method")},
                              {"status", number_field<int64_t>(response, "status", 0)},
                              {"contentType", string_field(content, "mimeType")},
                              {"isStream", stream},
                              {"size", number_field<int64_t>(content, "size", -1)},
                              {"time", number_field<double>(*entry, "time", 0.0)}});
            continue;
        }

        json copy = *entry;
        if (stream && !string_field(content, "text").empty())
        {
            const ParsedStream parsed = EventStreamReconstructor::parse(string_field(content, "text"));
            if (options.streamDisplay == StreamDisplay::Events)
            {
                json events = json::array();
                for (const auto& event : parsed.events)
                {
                    events.push_back({{"type", event.type}, {"data", event.data}});
                }
                copy["stream_events"] = std::move(events);
            }
            else if (options.streamDisplay == StreamDisplay::Summary)
            {
                copy["stream_summary"] = EventStreamReconstructor::summarize(parsed.events).toJson();
            }
            else if (options.streamDisplay == StreamDisplay::Reconstructed)
            {
                copy["reconstructed_message"] = parsed.message.toJson();
            }
        }
        result.push_back(std::move(copy));
    }
    out << result.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
}
