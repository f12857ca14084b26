#include "archive_session.hpp"

#include "har_fields.hpp"
#include "logger.hpp"

ArchiveSession::ArchiveSession(std::string archivePath, ArchiveCreator creator,
                               ArchiveBuilder::Clock clock)
    : m_path(std::move(archivePath)),
      m_builder(std::move(creator), std::move(clock)),
      m_scheduler([this] { flush(); })
{
}

ArchiveSession::~ArchiveSession()
{
    shutdown();
}

void ArchiveSession::startAutosave(std::chrono::milliseconds interval)
{
    if (m_path.empty())
    {
        LOG_DEBUG("No archive path, autosave not started");
        return;
    }
    m_scheduler.start(interval);
}

OpenResult ArchiveSession::open(const std::string& id, const std::string& method,
                                const std::string& url, const RawHeaders& headers,
                                const std::optional<std::string>& body, bool isSecure,
                                const std::string& sourceTag, const std::string& httpVersion)
{
    const UrlParts parts = split_url(url);

    OpenResult result;
    result.duplicate = m_store.isDuplicateRequest(method, parts.host, parts.path);
    if (result.duplicate)
    {
        LOG_DEBUG("ID: " << id << " (duplicate of previous request " << method << " " << url << ")");
    }

    m_store.registerPending(id, url, method);
    result.entry = m_builder.openEntry(id, method, url, headers, body, isSecure, sourceTag, httpVersion);
    LOG_INFO(method << " " << url << " [" << sourceTag << "] ID: " << id);
    return result;
}

std::optional<ArchiveEntry> ArchiveSession::close(const std::string& id, int statusCode,
                                                  const std::string& statusText,
                                                  const RawHeaders& headers,
                                                  const std::optional<std::string>& body,
                                                  const std::string& httpVersion)
{
    if (m_store.isDuplicateResponse(id, statusCode))
    {
        LOG_DEBUG("Duplicate response " << statusCode << " for ID " << id << " ignored");
        return std::nullopt;
    }

    try
    {
        ArchiveEntry entry = m_builder.closeEntry(id, statusCode, statusText, headers, body, httpVersion);
        m_store.resolvePending(id);
        LOG_INFO(statusCode << " " << statusText << " " << entry.request.url << " ID: " << id << " ("
                            << entry.time << "ms)");
        return entry;
    }
    catch (const CorrelationMiss& e)
    {
        m_builder.appendSystemNote(e.what());
        return std::nullopt;
    }
}

void ArchiveSession::note(const std::string& message)
{
    m_builder.appendSystemNote(message);
}

void ArchiveSession::registerTrackingToken(const std::string& token, const std::string& id)
{
    m_store.registerSecondaryToken(token, id);
}

std::optional<std::string> ArchiveSession::resolveTrackingToken(const std::string& token) const
{
    return m_store.lookupSecondaryToken(token);
}

bool ArchiveSession::flush()
{
    if (m_path.empty())
    {
        return true;
    }
    return m_builder.writeSnapshot(m_path);
}

bool ArchiveSession::shutdown()
{
    if (m_shut_down)
    {
        return true;
    }
    m_shut_down = true;

    m_scheduler.stop();

    const auto orphans = m_store.orphans();
    if (!orphans.empty())
    {
        LOG_WARNING("Found " << orphans.size() << " requests without matching responses");
        m_builder.appendSystemNote("WARNING: Found " + std::to_string(orphans.size()) +
                                   " requests without matching responses");
        for (const auto& orphan : orphans)
        {
            const RequestInfo info = m_store.requestInfo(orphan.id);
            m_builder.appendSystemNote("Orphaned request: " + info.method + " " + info.url +
                                       " (ID: " + orphan.id + ")");
        }
    }

    const bool written = flush();
    if (written && !m_path.empty())
    {
        LOG_INFO("Archive saved: " << m_path << " (" << m_builder.entryCount() << " entries)");
    }
    return written;
}
