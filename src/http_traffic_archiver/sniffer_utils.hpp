#ifndef SNIFFER_UTILS_HPP
#define SNIFFER_UTILS_HPP

#include <arpa/inet.h>
#include <net/ethernet.h>
#include <netinet/ip.h>
#include <netinet/tcp.h>
#include <pcap.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>

struct PayloadInfo
{
    size_t payload_offset{0};
    size_t payload_len{0};
    uint32_t seq{0};
    bool syn{false};
    bool fin{false};
    bool rst{false};
    char src[INET_ADDRSTRLEN];
    char dst[INET_ADDRSTRLEN];
    uint16_t srcport{0};
    uint16_t dstport{0};
};

// Direction-normalized TCP connection identity: the lower ip:port pair is
// always endpoint 1, so both directions of a connection map to one key.
struct FlowKey
{
    std::string ip1;
    uint16_t port1{0};
    std::string ip2;
    uint16_t port2{0};

    bool operator==(const FlowKey& other) const
    {
        return port1 == other.port1 && port2 == other.port2 && ip1 == other.ip1 && ip2 == other.ip2;
    }
};

struct FlowKeyHash
{
    size_t operator()(const FlowKey& key) const noexcept
    {
        size_t h1 = std::hash<std::string>{}(key.ip1);
        size_t h2 = std::hash<std::string>{}(key.ip2);
        size_t h3 = ((size_t)key.port1 << 16) ^ (size_t)key.port2;
        return (h1 * 1315423911u) ^ (h2 << 1) ^ h3;
    }
};

FlowKey make_flow_key(const std::string& src, uint16_t srcport, const std::string& dst,
                      uint16_t dstport);
FlowKey make_flow_key(const PayloadInfo& pi);

// Returns true if the packet contains a full Ethernet->IPv4->TCP frame (VLAN handled)
// and fills out the PayloadInfo structure. Use h->caplen for bounds checks.
bool get_payload_info(const struct pcap_pkthdr* h, const u_char* bytes, PayloadInfo& out);

uint64_t ts_to_ms(const struct timeval& tv);

#endif  // SNIFFER_UTILS_HPP
