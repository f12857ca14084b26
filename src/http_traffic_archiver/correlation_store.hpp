#ifndef CORRELATION_STORE_HPP
#define CORRELATION_STORE_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

struct RequestInfo
{
    std::string method;
    std::string url;
};

struct PendingExchange
{
    std::string id;
    std::string method;
    std::string url;
};

// Tracks exchanges between open and close: identifiers, pending set,
// duplicate detection and secondary correlation tokens.
// Owned by one logical caller; not synchronized.
class CorrelationStore
{
   public:
    CorrelationStore();
    ~CorrelationStore() = default;

    // "req-<base36 millis>-<5 base36 chars>", never handed out twice
    std::string issueIdentifier();

    void registerPending(const std::string& id, const std::string& url, const std::string& method);

    // No-op for unknown ids
    void resolvePending(const std::string& id);

    bool isPending(const std::string& id) const;

    size_t pendingCount() const { return m_pending.size(); }

    // True from the second time the (method, host, path) tuple is seen. Coarse on
    // purpose: two distinct requests to one endpoint are both flagged after the first.
    bool isDuplicateRequest(const std::string& method, const std::string& host,
                            const std::string& path);

    // True when (id, status) was already applied
    bool isDuplicateResponse(const std::string& id, int status);

    // Token issued by an instrumented client (X-Request-Tracking-ID)
    void registerSecondaryToken(const std::string& token, const std::string& id);
    std::optional<std::string> lookupSecondaryToken(const std::string& token) const;

    // Method and url as registered, "unknown method" / "unknown URL" otherwise
    RequestInfo requestInfo(const std::string& id) const;

    // Still pending exchanges in registration order
    std::vector<PendingExchange> orphans() const;

   private:
    std::string randomSuffix(size_t length);

    std::unordered_set<std::string> m_issued;
    std::unordered_map<std::string, RequestInfo> m_requests;
    std::map<uint64_t, std::string> m_pending;  // registration sequence -> id
    std::unordered_map<std::string, uint64_t> m_pending_seq;
    uint64_t m_next_seq{0};
    std::unordered_set<std::string> m_request_keys;
    std::unordered_set<std::string> m_response_keys;
    std::unordered_map<std::string, std::string> m_tokens;
    std::mt19937_64 m_rng;
};

#endif  // CORRELATION_STORE_HPP
