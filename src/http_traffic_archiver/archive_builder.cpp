#include "archive_builder.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <fstream>

#include "har_fields.hpp"
#include "logger.hpp"

using nlohmann::ordered_json;

constexpr const char* HAR_VERSION = "1.2";
constexpr double SEND_SHARE = 0.1;
constexpr double WAIT_SHARE = 0.7;
constexpr double RECEIVE_SHARE = 0.2;

namespace
{

int64_t millis_since_epoch(std::chrono::system_clock::time_point tp)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

ordered_json name_values_to_json(const std::vector<NameValue>& list)
{
    ordered_json out = ordered_json::array();
    for (const auto& nv : list)
    {
        out.push_back({{"name", nv.name}, {"value", nv.value}});
    }
    return out;
}

ordered_json cookies_to_json(const std::vector<Cookie>& cookies)
{
    ordered_json out = ordered_json::array();
    for (const auto& c : cookies)
    {
        ordered_json j = {{"name", c.name}, {"value", c.value}};
        if (c.path) j["path"] = *c.path;
        if (c.domain) j["domain"] = *c.domain;
        if (c.expires) j["expires"] = *c.expires;
        if (c.httpOnly) j["httpOnly"] = *c.httpOnly;
        if (c.secure) j["secure"] = *c.secure;
        out.push_back(std::move(j));
    }
    return out;
}

int64_t apportion(int64_t total, double share)
{
    return static_cast<int64_t>(std::llround(static_cast<double>(total) * share));
}

}  // namespace

ordered_json entry_to_json(const ArchiveEntry& entry)
{
    const HarRequest& req = entry.request;
    const HarResponse& res = entry.response;

    ordered_json request = {
        {"method", req.method},
        {"url", req.url},
        {"httpVersion", req.httpVersion},
        {"cookies", cookies_to_json(req.cookies)},
        {"headers", name_values_to_json(req.headers)},
        {"queryString", name_values_to_json(req.queryString)},
    };
    if (req.postData)
    {
        ordered_json post = {{"mimeType", req.postData->mimeType}, {"text", req.postData->text}};
        if (!req.postData->params.empty())
        {
            post["params"] = name_values_to_json(req.postData->params);
        }
        request["postData"] = std::move(post);
    }
    request["headersSize"] = req.headersSize;
    request["bodySize"] = req.bodySize;

    ordered_json response = {
        {"status", res.status},
        {"statusText", res.statusText},
        {"httpVersion", res.httpVersion},
        {"cookies", cookies_to_json(res.cookies)},
        {"headers", name_values_to_json(res.headers)},
        {"content",
         {{"size", res.content.size},
          {"compression", res.content.compression},
          {"mimeType", res.content.mimeType},
          {"text", res.content.text}}},
        {"redirectURL", res.redirectURL},
        {"headersSize", res.headersSize},
        {"bodySize", res.bodySize},
    };

    const HarTimings& t = entry.timings;
    ordered_json out = {
        {"pageref", entry.pageref},
        {"startedDateTime", entry.startedDateTime},
        {"time", entry.time},
        {"request", std::move(request)},
        {"response", std::move(response)},
        {"cache", ordered_json::object()},
        {"timings",
         {{"blocked", t.blocked},
          {"dns", t.dns},
          {"connect", t.connect},
          {"ssl", t.ssl},
          {"send", t.send},
          {"wait", t.wait},
          {"receive", t.receive}}},
        {"serverIPAddress", entry.serverIPAddress},
    };
    out["_securityDetails"] = entry.secure ? ordered_json{{"protocol", "TLS"}} : ordered_json(nullptr);
    out["_meta"] = {{"interceptorType", entry.sourceTag}, {"requestId", entry.id}};
    return out;
}

ArchiveBuilder::ArchiveBuilder(ArchiveCreator creator, Clock clock)
    : m_creator(std::move(creator)),
      m_clock(std::move(clock)),
      m_codec(this)
{
    m_default_page = addPage("page_" + std::to_string(millis_since_epoch(now())),
                             "HTTP Traffic Log - " + iso8601(now()));
}

std::chrono::system_clock::time_point ArchiveBuilder::now() const
{
    return m_clock ? m_clock() : std::chrono::system_clock::now();
}

std::string ArchiveBuilder::addPage(const std::string& id, const std::string& title)
{
    ArchivePage page;
    page.id = id.empty() ? "page_" + std::to_string(millis_since_epoch(now())) : id;
    page.title = title.empty() ? "Untitled Page" : title;
    page.startedDateTime = iso8601(now());

    std::lock_guard<std::mutex> lock(m_mutex);
    m_pages.push_back(page);
    return page.id;
}

void ArchiveBuilder::setBrowser(const std::string& name, const std::string& version)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_browser = std::make_pair(name, version);
}

ArchiveEntry ArchiveBuilder::openEntry(const std::string& id, const std::string& method,
                                       const std::string& url, const RawHeaders& headers,
                                       const std::optional<std::string>& body, bool isSecure,
                                       const std::string& sourceTag,
                                       const std::string& httpVersion)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto existing = m_index.find(id);
        if (existing != m_index.end())
        {
            LOG_WARNING("Entry " << id << " already open, keeping the first one");
            ArchiveEntry kept = m_entries[existing->second];
            m_comment += iso8601(now()) + " - Ignoring second request for ID " + id + "\n";
            return kept;
        }
    }

    const auto started = now();

    ArchiveEntry entry;
    entry.id = id;
    entry.pageref = m_default_page;
    entry.startedDateTime = iso8601(started);
    entry.secure = isSecure;
    entry.sourceTag = sourceTag;

    HarRequest& req = entry.request;
    req.method = method;
    req.url = url;
    req.httpVersion = httpVersion;
    req.headers = normalize_headers(headers);
    req.headersSize = headers_size(req.headers);

    try
    {
        req.cookies = parse_request_cookies(headers);
    }
    catch (const std::exception& e)
    {
        appendSystemNote("Could not parse request cookies for " + id + ": " + e.what());
    }

    try
    {
        req.queryString = parse_query_string(url);
    }
    catch (const std::exception& e)
    {
        appendSystemNote("Could not parse query string for " + id + ": " + e.what());
    }

    if (body && !body->empty())
    {
        req.bodySize = static_cast<int64_t>(body->size());

        const std::string content_type = header_value(headers, "content-type");
        const std::string text = m_codec.decompress(*body, header_value(headers, "content-encoding"));

        PostData post;
        post.mimeType = content_type;
        post.text = text;
        if (to_lower(content_type).find("application/x-www-form-urlencoded") != std::string::npos)
        {
            try
            {
                post.params = parse_form_params(text);
            }
            catch (const std::exception& e)
            {
                appendSystemNote("Could not parse form body for " + id + ": " + e.what());
            }
        }
        req.postData = std::move(post);
    }

    // visible before completion
    entry.response = HarResponse();

    std::lock_guard<std::mutex> lock(m_mutex);
    m_index.emplace(id, m_entries.size());
    m_entries.push_back(entry);
    m_timings[id] = Timing{started, {}};

    LOG_DEBUG("Opened entry " << id << ": " << method << " " << url);
    return entry;
}

ArchiveEntry ArchiveBuilder::closeEntry(const std::string& id, int statusCode,
                                        const std::string& statusText, const RawHeaders& headers,
                                        const std::optional<std::string>& body,
                                        const std::string& httpVersion)
{
    Timing timing;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_index.find(id);
        if (it == m_index.end())
        {
            LOG_ERROR("No matching request found for response with ID " << id);
            throw CorrelationMiss(id);
        }
        if (m_entries[it->second].closed)
        {
            LOG_WARNING("Entry " << id << " already has a response, ignoring status " << statusCode);
            m_comment += iso8601(now()) + " - Ignoring second response for ID " + id + "\n";
            return m_entries[it->second];
        }
        auto t = m_timings.find(id);
        timing = t != m_timings.end() ? t->second : Timing{now(), {}};
    }

    HarResponse res;
    res.status = statusCode;
    res.statusText = statusText;
    res.httpVersion = httpVersion;
    res.headers = normalize_headers(headers);
    res.headersSize = headers_size(res.headers);

    try
    {
        res.cookies = parse_set_cookies(headers);
    }
    catch (const std::exception& e)
    {
        appendSystemNote("Could not parse Set-Cookie for " + id + ": " + e.what());
    }

    const std::string content_type = header_value(headers, "content-type");
    const std::string content_encoding = header_value(headers, "content-encoding");
    res.content.mimeType = content_type.empty() ? "text/plain" : content_type;
    res.bodySize = body ? static_cast<int64_t>(body->size()) : 0;
    if (body && !body->empty())
    {
        res.content.text = m_codec.decompress(*body, content_encoding);
    }
    res.content.size = static_cast<int64_t>(res.content.text.size());
    if (!content_encoding.empty() && res.content.size > res.bodySize)
    {
        res.content.compression = res.content.size - res.bodySize;
    }

    if (statusCode >= 300 && statusCode < 400)
    {
        res.redirectURL = header_value(headers, "location");
    }

    const int64_t total =
        std::max<int64_t>(0, std::chrono::duration_cast<std::chrono::milliseconds>(now() - timing.started).count());
    auto phase = [&](TimingPhase p, int64_t fallback) {
        const auto& recorded = timing.phases[static_cast<size_t>(p)];
        return recorded ? *recorded : fallback;
    };

    HarTimings timings;
    timings.blocked = phase(TimingPhase::Blocked, -1);
    timings.dns = phase(TimingPhase::Dns, -1);
    timings.connect = phase(TimingPhase::Connect, -1);
    timings.ssl = phase(TimingPhase::Ssl, -1);
    timings.send = phase(TimingPhase::Send, apportion(total, SEND_SHARE));
    timings.wait = phase(TimingPhase::Wait, apportion(total, WAIT_SHARE));
    timings.receive = phase(TimingPhase::Receive, apportion(total, RECEIVE_SHARE));

    int64_t sum = 0;
    for (int64_t v : {timings.blocked, timings.dns, timings.connect, timings.ssl, timings.send,
                      timings.wait, timings.receive})
    {
        if (v >= 0)
        {
            sum += v;
        }
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    ArchiveEntry& entry = m_entries[m_index.at(id)];
    entry.response = std::move(res);
    entry.timings = timings;
    entry.time = std::max<int64_t>(1, sum);
    entry.closed = true;
    m_timings.erase(id);

    LOG_DEBUG("Closed entry " << id << ": status=" << statusCode << " time=" << entry.time << "ms");
    return entry;
}

void ArchiveBuilder::recordTiming(const std::string& id, TimingPhase phase, int64_t millis)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_timings.find(id);
    if (it == m_timings.end())
    {
        LOG_DEBUG("Timing for unknown or closed entry " << id << " dropped");
        return;
    }
    it->second.phases[static_cast<size_t>(phase)] = millis;
}

void ArchiveBuilder::recordServerAddress(const std::string& id, const std::string& address)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_index.find(id);
    if (it != m_index.end())
    {
        m_entries[it->second].serverIPAddress = address;
    }
}

void ArchiveBuilder::appendSystemNote(const std::string& message)
{
    if (message.empty())
    {
        return;
    }
    LOG_DEBUG("note: " << message);
    std::lock_guard<std::mutex> lock(m_mutex);
    m_comment += iso8601(now()) + " - " + message + "\n";
}

ordered_json ArchiveBuilder::toJsonLocked() const
{
    ordered_json log = {
        {"version", HAR_VERSION},
        {"creator", {{"name", m_creator.name}, {"version", m_creator.version}}},
    };
    if (m_browser)
    {
        log["browser"] = {{"name", m_browser->first}, {"version", m_browser->second}};
    }

    ordered_json pages = ordered_json::array();
    for (const auto& page : m_pages)
    {
        pages.push_back({{"startedDateTime", page.startedDateTime},
                         {"id", page.id},
                         {"title", page.title},
                         {"pageTimings", {{"onContentLoad", -1}, {"onLoad", -1}}}});
    }
    log["pages"] = std::move(pages);

    ordered_json entries = ordered_json::array();
    for (const auto& entry : m_entries)
    {
        entries.push_back(entry_to_json(entry));
    }
    log["entries"] = std::move(entries);

    if (!m_comment.empty())
    {
        log["comment"] = m_comment;
    }
    return ordered_json{{"log", std::move(log)}};
}

ordered_json ArchiveBuilder::snapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return toJsonLocked();
}

std::string ArchiveBuilder::serializeSnapshot() const
{
    ordered_json doc = snapshot();
    return doc.dump(2, ' ', false, ordered_json::error_handler_t::replace);
}

std::string ArchiveBuilder::entryAsJsonLine(const std::string& id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_index.find(id);
    if (it == m_index.end())
    {
        return "";
    }
    return entry_to_json(m_entries[it->second]).dump(-1, ' ', false, ordered_json::error_handler_t::replace);
}

bool ArchiveBuilder::validateSchema() const
{
    ordered_json doc = snapshot();
    auto log = doc.find("log");
    if (log == doc.end() || !log->is_object())
    {
        return false;
    }
    auto version = log->find("version");
    auto creator = log->find("creator");
    auto entries = log->find("entries");
    return version != log->end() && version->is_string() && !version->get<std::string>().empty() &&
           creator != log->end() && creator->is_object() && creator->contains("name") &&
           entries != log->end() && entries->is_array();
}

bool ArchiveBuilder::writeSnapshot(const std::string& path) const
{
    std::lock_guard<std::mutex> lock(m_write_mutex);
    // serialized under the write lock so a slower writer never replaces a newer snapshot
    const std::string data = serializeSnapshot();
    const std::string tmp = path + ".tmp";

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            LOG_ERROR("Failed to open archive file for writing: " << tmp);
            return false;
        }
        out << data;
        out.close();
        if (!out)
        {
            LOG_ERROR("Failed to write archive file: " << tmp);
            std::remove(tmp.c_str());
            return false;
        }
    }

    if (std::rename(tmp.c_str(), path.c_str()) != 0)
    {
        LOG_ERROR("Failed to replace archive file: " << path);
        std::remove(tmp.c_str());
        return false;
    }
    LOG_DEBUG("Archive written: " << path << " (" << data.size() << " bytes)");
    return true;
}

size_t ArchiveBuilder::entryCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

std::optional<ArchiveEntry> ArchiveBuilder::findEntry(const std::string& id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_index.find(id);
    if (it == m_index.end())
    {
        return std::nullopt;
    }
    return m_entries[it->second];
}

std::string ArchiveBuilder::comment() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_comment;
}
