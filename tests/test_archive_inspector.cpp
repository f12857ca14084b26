#include <doctest/doctest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "archive_inspector.hpp"

using nlohmann::json;

namespace
{

const char* STREAM_BODY =
    "event: message_start\n"
    "data: {\"type\":\"message_start\",\"message\":{\"id\":\"m1\",\"role\":\"assistant\",\"model\":\"x-1\",\"content\":[]}}\n\n"
    "event: content_block_start\n"
    "data: {\"type\":\"content_block_start\",\"index\":0,\"content_block\":{\"type\":\"text\",\"text\":\"\"}}\n\n"
    "event: content_block_delta\n"
    "data: {\"type\":\"content_block_delta\",\"index\":0,\"delta\":{\"type\":\"text_delta\",\"text\":\"Hel\"}}\n\n"
    "event: content_block_delta\n"
    "data: {\"type\":\"content_block_delta\",\"index\":0,\"delta\":{\"type\":\"text_delta\",\"text\":\"lo\"}}\n\n"
    "event: content_block_stop\n"
    "data: {\"type\":\"content_block_stop\",\"index\":0}\n\n"
    "event: message_stop\n"
    "data: {\"type\":\"message_stop\"}\n\n";

json make_entry(const std::string& method, const std::string& url, int status,
                const std::string& mime, const std::string& text, double time)
{
    return {{"startedDateTime", "2024-01-02T03:04:05.678Z"},
            {"time", time},
            {"request", {{"method", method}, {"url", url}, {"headers", json::array()}}},
            {"response",
             {{"status", status},
              {"headers", json::array({{{"name", "Content-Type"}, {"value", mime}}})},
              {"content", {{"size", static_cast<int64_t>(text.size())}, {"mimeType", mime}, {"text", text}}}}}};
}

json sample_archive()
{
    json entries = json::array();
    entries.push_back(make_entry("GET", "http://example.com/api/users", 200, "application/json; charset=utf-8",
                                 R"({"users":[1,2]})", 42.4));
    entries.push_back(make_entry("POST", "http://Example.com/v1/messages", 200, "text/event-stream",
                                 STREAM_BODY, 1234));
    entries.push_back(make_entry("GET", "http://cdn.example.net/logo.png", 304, "", "", 3.5));
    entries[1]["request"]["postData"] = {{"mimeType", "application/json"}, {"text", R"({"stream":true})"}};

    return {{"log",
             {{"version", "1.2"},
              {"creator", {{"name", "http_traffic_archiver"}, {"version", "0.1.0"}}},
              {"entries", entries},
              {"comment", "2024-01-02T03:04:05.678Z - Orphaned request: GET http://x/ (ID: r1)\n"}}}};
}

std::string table(const ArchiveInspector& inspector, InspectOptions options)
{
    std::ostringstream out;
    inspector.printTable(options, out);
    return out.str();
}

}  // namespace

TEST_CASE("URL filters are case-insensitive unanchored globs")
{
    CHECK(ArchiveInspector::urlMatchesFilter("http://a/b", ""));
    CHECK(ArchiveInspector::urlMatchesFilter("http://Example.com/v1/messages", "example.com"));
    CHECK(ArchiveInspector::urlMatchesFilter("http://example.com/api/users", "api/*s"));
    CHECK(ArchiveInspector::urlMatchesFilter("http://example.com/api/users", "*USERS"));
    CHECK_FALSE(ArchiveInspector::urlMatchesFilter("http://example.com/api/users", "orders"));
}

TEST_CASE("Sizes and times are humanized")
{
    CHECK(ArchiveInspector::formatSize(-1) == "unknown");
    CHECK(ArchiveInspector::formatSize(0) == "0 B");
    CHECK(ArchiveInspector::formatSize(1023) == "1023 B");
    CHECK(ArchiveInspector::formatSize(1536) == "1.5 KB");
    CHECK(ArchiveInspector::formatSize(3 * 1024 * 1024) == "3.0 MB");

    CHECK(ArchiveInspector::formatTime(3.5) == "3.5ms");
    CHECK(ArchiveInspector::formatTime(42.4) == "42ms");
    CHECK(ArchiveInspector::formatTime(1234) == "1.23s");
}

TEST_CASE("Entries are filtered in archive order")
{
    ArchiveInspector inspector(sample_archive());

    CHECK(inspector.entries("").size() == 3);
    auto selected = inspector.entries("example.com");
    REQUIRE(selected.size() == 2);
    CHECK((*selected[1])["request"]["method"] == "POST");
}

TEST_CASE("The summary table lists one row per request")
{
    ArchiveInspector inspector(sample_archive());
    InspectOptions options;
    options.filePath = "capture.har";
    options.summary = true;

    const std::string out = table(inspector, options);
    CHECK(out.find("HAR File: capture.har") != std::string::npos);
    CHECK(out.find("Creator: http_traffic_archiver v0.1.0") != std::string::npos);
    CHECK(out.find("Showing 3 of 3 requests") != std::string::npos);
    CHECK(out.find("json") != std::string::npos);
    CHECK(out.find("event-stream (stream)") != std::string::npos);
    CHECK(out.find("unknown") != std::string::npos);
    CHECK(out.find("Response Body") == std::string::npos);
    CHECK(out.find("Notes:") == std::string::npos);
}

TEST_CASE("The detailed table shows bodies, the reconstructed stream and notes")
{
    ArchiveInspector inspector(sample_archive());
    InspectOptions options;
    options.filePath = "capture.har";

    const std::string out = table(inspector, options);
    CHECK(out.find("  Request Body:") != std::string::npos);
    CHECK(out.find("\"users\": [1, 2]") != std::string::npos);
    CHECK(out.find("Response Body: (Server-Sent Event Stream)") != std::string::npos);
    CHECK(out.find("Reconstructed Message:") != std::string::npos);
    CHECK(out.find("ID: m1") != std::string::npos);
    CHECK(out.find("Hello") != std::string::npos);
    CHECK(out.find("Notes:") != std::string::npos);
    CHECK(out.find("Orphaned request: GET http://x/ (ID: r1)") != std::string::npos);
}

TEST_CASE("Stream display modes change how event streams print")
{
    ArchiveInspector inspector(sample_archive());
    InspectOptions options;
    options.filter = "messages";

    options.streamDisplay = StreamDisplay::Raw;
    CHECK(table(inspector, options).find("event: content_block_delta") != std::string::npos);

    options.streamDisplay = StreamDisplay::Events;
    const std::string events = table(inspector, options);
    CHECK(events.find("[0] message_start:") != std::string::npos);
    CHECK(events.find("[5] message_stop:") != std::string::npos);

    options.streamDisplay = StreamDisplay::Summary;
    const std::string summary = table(inspector, options);
    CHECK(summary.find("Total Events: 6") != std::string::npos);
    CHECK(summary.find("- content_block_delta: 2") != std::string::npos);
}

TEST_CASE("JSON output carries summaries or full entries")
{
    ArchiveInspector inspector(sample_archive());
    InspectOptions options;
    options.jsonFormat = true;

    SUBCASE("summary")
    {
        options.summary = true;
        std::ostringstream out;
        inspector.printJson(options, out);
        json rows = json::parse(out.str());
        REQUIRE(rows.size() == 3);
        CHECK(rows[0]["index"] == 1);
        CHECK(rows[1]["isStream"] == true);
        CHECK(rows[2]["status"] == 304);
    }
    SUBCASE("full entries with a reconstructed stream")
    {
        options.filter = "messages";
        std::ostringstream out;
        inspector.printJson(options, out);
        json rows = json::parse(out.str());
        REQUIRE(rows.size() == 1);
        CHECK(rows[0]["reconstructed_message"]["id"] == "m1");
        CHECK(rows[0]["reconstructed_message"]["content"][0]["text"] == "Hello");
    }
    SUBCASE("full entries with stream events")
    {
        options.filter = "messages";
        options.streamDisplay = StreamDisplay::Events;
        std::ostringstream out;
        inspector.printJson(options, out);
        json rows = json::parse(out.str());
        CHECK(rows[0]["stream_events"].size() == 6);
        CHECK_FALSE(rows[0].contains("reconstructed_message"));
    }
}

TEST_CASE("Fields of the wrong type fall back instead of failing")
{
    json archive = sample_archive();
    json& entries = archive["log"]["entries"];
    entries[0]["response"]["status"] = "200";
    entries[0]["response"]["content"]["size"] = "x";
    entries[0]["time"] = nullptr;
    entries[1]["response"]["status"] = 200.5;
    entries[2]["response"]["content"] = "none";
    entries.push_back(7);
    archive["log"]["comment"] = json::array();
    ArchiveInspector inspector(archive);

    InspectOptions options;
    std::string out;
    CHECK_NOTHROW(out = table(inspector, options));
    CHECK(out.find("Showing 4 of 4 requests") != std::string::npos);
    CHECK(out.find("http://example.com/api/users") != std::string::npos);

    options.summary = true;
    CHECK_NOTHROW(table(inspector, options));

    options.jsonFormat = true;
    std::ostringstream json_out;
    CHECK_NOTHROW(inspector.printJson(options, json_out));
    json rows = json::parse(json_out.str());
    REQUIRE(rows.size() == 4);
    CHECK(rows[0]["status"] == 0);
    CHECK(rows[0]["size"] == -1);
    CHECK(rows[0]["time"] == 0.0);
    CHECK(rows[1]["status"] == 0);
    CHECK(rows[2]["size"] == -1);
    CHECK(rows[3]["url"] == "");
}

TEST_CASE("Loading rejects missing files and non-archives")
{
    const auto dir = std::filesystem::temp_directory_path();
    CHECK_THROWS_WITH_AS(ArchiveInspector::load((dir / "does-not-exist.har").string()),
                         doctest::Contains("File not found"), std::runtime_error);

    const std::string bad = (dir / "inspector_bad.har").string();
    std::ofstream(bad) << "{not json";
    CHECK_THROWS_WITH_AS(ArchiveInspector::load(bad), doctest::Contains("Not valid JSON"), std::runtime_error);

    std::ofstream(bad, std::ios::trunc) << R"({"log":{"version":"1.2"}})";
    CHECK_THROWS_WITH_AS(ArchiveInspector::load(bad), doctest::Contains("missing log.entries"),
                         std::runtime_error);

    std::ofstream(bad, std::ios::trunc) << sample_archive().dump();
    CHECK(ArchiveInspector::load(bad).entries("").size() == 3);
    std::filesystem::remove(bad);
}

TEST_CASE("Inspector arguments")
{
    std::ostringstream err;

    InspectOptions options;
    CHECK(parse_inspect_arguments({"a.har", "--summary", "--format=json", "--filter=api",
                                   "--stream-display=events"},
                                  options, err) == InspectParse::Run);
    CHECK(options.filePath == "a.har");
    CHECK(options.summary);
    CHECK(options.jsonFormat);
    CHECK(options.filter == "api");
    CHECK(options.streamDisplay == StreamDisplay::Events);

    InspectOptions none;
    CHECK(parse_inspect_arguments({}, none, err) == InspectParse::Error);
    InspectOptions bad_format;
    CHECK(parse_inspect_arguments({"a.har", "--format=xml"}, bad_format, err) == InspectParse::Error);
    InspectOptions bad_mode;
    CHECK(parse_inspect_arguments({"a.har", "--stream-display=pretty"}, bad_mode, err) == InspectParse::Error);
    InspectOptions help;
    CHECK(parse_inspect_arguments({"--help"}, help, err) == InspectParse::Help);
}
