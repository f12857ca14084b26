#ifndef ARCHIVE_BUILDER_HPP
#define ARCHIVE_BUILDER_HPP

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "archive_types.hpp"
#include "content_codec.hpp"
#include "note_sink.hpp"

#ifndef HTTP_TRAFFIC_ARCHIVER_VERSION
#define HTTP_TRAFFIC_ARCHIVER_VERSION "0.1.0"
#endif

// closeEntry() for an identifier that was never opened
class CorrelationMiss : public std::runtime_error
{
   public:
    explicit CorrelationMiss(const std::string& id)
        : std::runtime_error("No matching request found for response with ID " + id), m_id(id)
    {
    }

    const std::string& id() const { return m_id; }

   private:
    std::string m_id;
};

struct ArchiveCreator
{
    std::string name{"http_traffic_archiver"};
    std::string version{HTTP_TRAFFIC_ARCHIVER_VERSION};
};

enum class TimingPhase
{
    Blocked = 0,
    Dns,
    Connect,
    Ssl,
    Send,
    Wait,
    Receive
};

// Owns the HAR 1.2 document. Entries are appended at open and completed at close;
// snapshots copy the document under the lock and serialize outside it, so a timer
// thread may call serializeSnapshot()/writeSnapshot() while exchanges are recorded.
class ArchiveBuilder : public NoteSink
{
   public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit ArchiveBuilder(ArchiveCreator creator = ArchiveCreator(), Clock clock = nullptr);
    ~ArchiveBuilder() override = default;

    ArchiveBuilder(const ArchiveBuilder&) = delete;
    ArchiveBuilder& operator=(const ArchiveBuilder&) = delete;

    // Creates the entry with a placeholder response (status 0). Opening an id twice
    // keeps the first entry and notes the conflict.
    ArchiveEntry openEntry(const std::string& id, const std::string& method, const std::string& url,
                           const RawHeaders& headers, const std::optional<std::string>& body,
                           bool isSecure, const std::string& sourceTag,
                           const std::string& httpVersion = "HTTP/1.1");

    // Completes the entry. Throws CorrelationMiss for unknown ids without touching
    // the document. A second close for the same id is noted and ignored.
    ArchiveEntry closeEntry(const std::string& id, int statusCode, const std::string& statusText,
                            const RawHeaders& headers, const std::optional<std::string>& body,
                            const std::string& httpVersion = "HTTP/1.1");

    // Authoritative duration for one phase; phases left unset are apportioned at close
    void recordTiming(const std::string& id, TimingPhase phase, int64_t millis);

    void recordServerAddress(const std::string& id, const std::string& address);

    // Timestamped line in log.comment
    void appendSystemNote(const std::string& message) override;

    // Returns the page id. An empty id gets a generated one.
    std::string addPage(const std::string& id, const std::string& title);

    void setBrowser(const std::string& name, const std::string& version);

    std::string serializeSnapshot() const;

    // One entry as compact JSON, empty when the id is unknown
    std::string entryAsJsonLine(const std::string& id) const;

    bool validateSchema() const;

    // Writes path.tmp and renames it over path. Returns false (and logs) on I/O errors.
    bool writeSnapshot(const std::string& path) const;

    nlohmann::ordered_json snapshot() const;

    size_t entryCount() const;
    std::optional<ArchiveEntry> findEntry(const std::string& id) const;
    std::string comment() const;
    const std::string& defaultPageId() const { return m_default_page; }

   private:
    struct Timing
    {
        std::chrono::system_clock::time_point started;
        std::array<std::optional<int64_t>, 7> phases;
    };

    std::chrono::system_clock::time_point now() const;
    nlohmann::ordered_json toJsonLocked() const;

    mutable std::mutex m_mutex;
    mutable std::mutex m_write_mutex;
    ArchiveCreator m_creator;
    Clock m_clock;
    std::optional<std::pair<std::string, std::string>> m_browser;
    std::vector<ArchivePage> m_pages;
    std::string m_default_page;
    std::vector<ArchiveEntry> m_entries;
    std::unordered_map<std::string, size_t> m_index;
    std::unordered_map<std::string, Timing> m_timings;
    std::string m_comment;
    ContentCodec m_codec;
};

nlohmann::ordered_json entry_to_json(const ArchiveEntry& entry);

#endif  // ARCHIVE_BUILDER_HPP
