#include "correlation_store.hpp"

#include <chrono>

#include "logger.hpp"

namespace
{

constexpr char BASE36_DIGITS[] = "0123456789abcdefghijklmnopqrstuvwxyz";
constexpr size_t ID_SUFFIX_LENGTH = 5;

std::string to_base36(uint64_t value)
{
    if (value == 0)
    {
        return "0";
    }
    std::string out;
    while (value > 0)
    {
        out.insert(out.begin(), BASE36_DIGITS[value % 36]);
        value /= 36;
    }
    return out;
}

}  // namespace

CorrelationStore::CorrelationStore() : m_rng(std::random_device{}()) {}

std::string CorrelationStore::randomSuffix(size_t length)
{
    std::uniform_int_distribution<int> digit(0, 35);
    std::string out;
    out.reserve(length);
    for (size_t i = 0; i < length; ++i)
    {
        out.push_back(BASE36_DIGITS[digit(m_rng)]);
    }
    return out;
}

std::string CorrelationStore::issueIdentifier()
{
    using namespace std::chrono;
    const auto millis = static_cast<uint64_t>(
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());

    std::string id;
    do
    {
        id = "req-" + to_base36(millis) + "-" + randomSuffix(ID_SUFFIX_LENGTH);
    } while (!m_issued.insert(id).second);
    return id;
}

void CorrelationStore::registerPending(const std::string& id, const std::string& url,
                                       const std::string& method)
{
    m_requests[id] = RequestInfo{method, url};
    if (m_pending_seq.count(id) != 0)
    {
        return;
    }
    uint64_t seq = m_next_seq++;
    m_pending.emplace(seq, id);
    m_pending_seq.emplace(id, seq);
}

void CorrelationStore::resolvePending(const std::string& id)
{
    auto it = m_pending_seq.find(id);
    if (it == m_pending_seq.end())
    {
        return;
    }
    m_pending.erase(it->second);
    m_pending_seq.erase(it);
}

bool CorrelationStore::isPending(const std::string& id) const
{
    return m_pending_seq.count(id) != 0;
}

bool CorrelationStore::isDuplicateRequest(const std::string& method, const std::string& host,
                                          const std::string& path)
{
    bool inserted = m_request_keys.insert(method + ":" + host + ":" + path).second;
    if (!inserted)
    {
        LOG_DEBUG("Duplicate request key " << method << " " << host << path);
    }
    return !inserted;
}

bool CorrelationStore::isDuplicateResponse(const std::string& id, int status)
{
    return !m_response_keys.insert(id + ":" + std::to_string(status)).second;
}

void CorrelationStore::registerSecondaryToken(const std::string& token, const std::string& id)
{
    if (token.empty())
    {
        return;
    }
    m_tokens[token] = id;
}

std::optional<std::string> CorrelationStore::lookupSecondaryToken(const std::string& token) const
{
    auto it = m_tokens.find(token);
    if (it == m_tokens.end())
    {
        return std::nullopt;
    }
    return it->second;
}

RequestInfo CorrelationStore::requestInfo(const std::string& id) const
{
    auto it = m_requests.find(id);
    if (it == m_requests.end())
    {
        return RequestInfo{"unknown method", "unknown URL"};
    }
    return it->second;
}

std::vector<PendingExchange> CorrelationStore::orphans() const
{
    std::vector<PendingExchange> out;
    out.reserve(m_pending.size());
    for (const auto& [seq, id] : m_pending)
    {
        (void)seq;
        RequestInfo info = requestInfo(id);
        out.push_back(PendingExchange{id, info.method, info.url});
    }
    return out;
}
