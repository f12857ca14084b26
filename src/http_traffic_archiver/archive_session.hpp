#ifndef ARCHIVE_SESSION_HPP
#define ARCHIVE_SESSION_HPP

#include <chrono>
#include <optional>
#include <string>

#include "archive_builder.hpp"
#include "correlation_store.hpp"
#include "persistence_scheduler.hpp"

struct OpenResult
{
    ArchiveEntry entry;
    bool duplicate{false};
};

// Lifecycle owner for one archive: correlation state, the document and the
// autosave timer. Observers call open/close/note from a single thread; only
// the timer runs concurrently.
class ArchiveSession
{
   public:
    // An empty archivePath keeps the document in memory only
    explicit ArchiveSession(std::string archivePath, ArchiveCreator creator = ArchiveCreator(),
                            ArchiveBuilder::Clock clock = nullptr);
    ~ArchiveSession();

    ArchiveSession(const ArchiveSession&) = delete;
    ArchiveSession& operator=(const ArchiveSession&) = delete;

    void startAutosave(std::chrono::milliseconds interval);

    std::string issueIdentifier() { return m_store.issueIdentifier(); }

    OpenResult open(const std::string& id, const std::string& method, const std::string& url,
                    const RawHeaders& headers, const std::optional<std::string>& body,
                    bool isSecure, const std::string& sourceTag,
                    const std::string& httpVersion = "HTTP/1.1");

    // nullopt when the response was a duplicate or no request matched (noted)
    std::optional<ArchiveEntry> close(const std::string& id, int statusCode,
                                      const std::string& statusText, const RawHeaders& headers,
                                      const std::optional<std::string>& body,
                                      const std::string& httpVersion = "HTTP/1.1");

    void note(const std::string& message);

    // Instrumented clients tag requests with X-Request-Tracking-ID
    void registerTrackingToken(const std::string& token, const std::string& id);
    std::optional<std::string> resolveTrackingToken(const std::string& token) const;

    // Stops autosave, notes every orphan, writes the final snapshot. Only the
    // first call does anything. Returns false when the final write failed.
    bool shutdown();

    bool flush();

    const std::string& archivePath() const { return m_path; }
    ArchiveBuilder& builder() { return m_builder; }
    const CorrelationStore& store() const { return m_store; }

   private:
    std::string m_path;
    CorrelationStore m_store;
    ArchiveBuilder m_builder;
    PersistenceScheduler m_scheduler;
    bool m_shut_down{false};
};

#endif  // ARCHIVE_SESSION_HPP
