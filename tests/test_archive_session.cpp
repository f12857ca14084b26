#include <doctest/doctest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

#include "archive_session.hpp"
#include "test_support.hpp"

using nlohmann::json;

namespace
{

std::string read_file(const std::string& path)
{
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

}  // namespace

TEST_CASE("Two identical requests give two entries and the second is flagged")
{
    ManualClock clock;
    ArchiveSession session("", ArchiveCreator(), clock);

    OpenResult first = session.open("a", "GET", "http://h/x", {}, std::nullopt, false, "pcap");
    OpenResult second = session.open("b", "GET", "http://h/x", {}, std::nullopt, false, "pcap");

    CHECK_FALSE(first.duplicate);
    CHECK(second.duplicate);
    CHECK(session.builder().entryCount() == 2);
    CHECK(session.store().pendingCount() == 2);
}

TEST_CASE("Closing resolves the pending exchange")
{
    ManualClock clock;
    ArchiveSession session("", ArchiveCreator(), clock);
    session.open("a", "GET", "http://h/x", {}, std::nullopt, false, "pcap");

    auto entry = session.close("a", 200, "OK", {}, std::string("ok"));
    REQUIRE(entry.has_value());
    CHECK(entry->response.status == 200);
    CHECK(session.store().pendingCount() == 0);

    CHECK_FALSE(session.close("a", 200, "OK", {}, std::string("ok")).has_value());
}

TEST_CASE("A response without a request becomes a note")
{
    ManualClock clock;
    ArchiveSession session("", ArchiveCreator(), clock);

    CHECK_FALSE(session.close("ghost", 200, "OK", {}, std::nullopt).has_value());
    CHECK(session.builder().comment().find("No matching request found for response with ID ghost") !=
          std::string::npos);
    CHECK(session.builder().entryCount() == 0);
}

TEST_CASE("Tracking tokens resolve to the primary id")
{
    ArchiveSession session("");
    session.registerTrackingToken("tok", "req-1");
    CHECK(session.resolveTrackingToken("tok") == std::optional<std::string>("req-1"));
    CHECK_FALSE(session.resolveTrackingToken("other").has_value());
}

TEST_CASE("Shutdown notes orphans once and writes the archive")
{
    ManualClock clock;
    const std::string path =
        (std::filesystem::temp_directory_path() / "archive_session_test.har").string();
    std::filesystem::remove(path);

    ArchiveSession session(path, ArchiveCreator(), clock);
    session.open("done", "GET", "http://h/done", {}, std::nullopt, false, "pcap");
    session.open("lost", "POST", "http://h/lost", {}, std::nullopt, false, "pcap");
    session.close("done", 200, "OK", {}, std::nullopt);

    CHECK(session.shutdown());
    CHECK(session.shutdown());

    const std::string comment = session.builder().comment();
    CHECK(comment.find("WARNING: Found 1 requests without matching responses") != std::string::npos);
    CHECK(comment.find("Orphaned request: POST http://h/lost (ID: lost)") != std::string::npos);
    CHECK(comment.find("Orphaned request", comment.find("Orphaned request") + 1) == std::string::npos);

    json doc = json::parse(read_file(path));
    CHECK(doc["log"]["entries"].size() == 2);
    CHECK(doc["log"]["entries"][1]["response"]["status"] == 0);
    CHECK(doc["log"]["comment"] == comment);
    std::filesystem::remove(path);
}

TEST_CASE("A memory-only session flushes without touching disk")
{
    ArchiveSession session("");
    session.startAutosave(std::chrono::milliseconds(5));
    CHECK(session.flush());
    CHECK(session.shutdown());
}

TEST_CASE("Autosave writes snapshots while the session is open")
{
    const std::string path =
        (std::filesystem::temp_directory_path() / "archive_session_autosave.har").string();
    std::filesystem::remove(path);

    ArchiveSession session(path);
    session.open("a", "GET", "http://h/a", {}, std::nullopt, false, "pcap");
    session.startAutosave(std::chrono::milliseconds(10));

    for (int i = 0; i < 100 && !std::filesystem::exists(path); ++i)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    REQUIRE(std::filesystem::exists(path));
    CHECK(json::parse(read_file(path))["log"]["entries"].size() == 1);

    session.shutdown();
    std::filesystem::remove(path);
}
