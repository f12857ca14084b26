#ifndef HTTP_EXCHANGE_ASSEMBLER_HPP
#define HTTP_EXCHANGE_ASSEMBLER_HPP

#include <pcap.h>

#include <atomic>
#include <cstdint>
#include <deque>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>

#include "archive_session.hpp"
#include "sniffer_utils.hpp"

constexpr const char* TRACKING_HEADER = "X-Request-Tracking-ID";
constexpr const char* CAPTURE_SOURCE_TAG = "pcap";

// Turns captured TCP segments into HTTP/1.x exchanges and reports them to the
// session: one open() per parsed request, one close() per parsed response,
// pipelined responses paired with requests in FIFO order.
class HttpExchangeAssembler
{
   public:
    // packetClock, when given, receives the timestamp of every packet in milliseconds
    explicit HttpExchangeAssembler(ArchiveSession& session,
                                   std::atomic<uint64_t>* packetClock = nullptr);
    ~HttpExchangeAssembler() = default;

    // Requests go to this port, responses come from it
    void setServerPort(uint16_t port) { m_server_port = port; }
    uint16_t serverPort() const { return m_server_port; }

    void onPacketReceived(const struct pcap_pkthdr* h, const u_char* bytes);

    // In-order stream bytes of one connection
    void onClientData(const FlowKey& flow, std::string_view data, uint64_t ts_ms);
    void onServerData(const FlowKey& flow, std::string_view data, uint64_t ts_ms);

    // Server side closed: completes a response delimited by connection close
    void onConnectionClosed(const FlowKey& flow, uint64_t ts_ms);

    // End of capture: notes partially received messages and forgets all flows
    void finish();

    size_t activeFlows() const { return m_flows.size(); }

   private:
    // In-order delivery for one direction of a connection
    struct TcpDirection
    {
        bool seq_set{false};
        uint32_t next_seq{0};
        std::map<uint32_t, std::string> held;  // out-of-order segments by seq
        bool closed{false};

        // Appends whatever becomes contiguous to out
        void accept(uint32_t seq, std::string_view data, std::string& out);
    };

    struct PendingRequest
    {
        std::string id;
        std::string method;
        uint64_t first_ms{0};
        uint64_t sent_ms{0};
    };

    struct FlowState
    {
        std::string server_addr;
        uint16_t server_port{0};
        TcpDirection client_dir;
        TcpDirection server_dir;
        std::string client_buf;
        std::string server_buf;
        uint64_t client_first_ms{0};
        uint64_t server_first_ms{0};
        std::deque<PendingRequest> pending;
        bool upgraded{false};
    };

    FlowState& flowFor(const FlowKey& flow);
    void parseRequests(FlowState& st, uint64_t ts_ms);
    void parseResponses(FlowState& st, uint64_t ts_ms, bool closed);
    std::string describe(const FlowState& st) const;

    ArchiveSession& m_session;
    std::atomic<uint64_t>* m_packet_clock;
    uint16_t m_server_port{0};
    std::unordered_map<FlowKey, FlowState, FlowKeyHash> m_flows;
};

#endif  // HTTP_EXCHANGE_ASSEMBLER_HPP
