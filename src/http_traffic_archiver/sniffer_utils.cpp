#include "sniffer_utils.hpp"

#include <cstring>

constexpr uint64_t MS_PER_SECOND = 1000;
constexpr size_t VLAN_TAG_LEN = 4;

FlowKey make_flow_key(const std::string& src, uint16_t srcport, const std::string& dst,
                      uint16_t dstport)
{
    FlowKey key{src, srcport, dst, dstport};
    int cmp = src.compare(dst);
    if (cmp > 0 || (cmp == 0 && srcport > dstport))
    {
        std::swap(key.ip1, key.ip2);
        std::swap(key.port1, key.port2);
    }
    return key;
}

FlowKey make_flow_key(const PayloadInfo& pi)
{
    return make_flow_key(pi.src, pi.srcport, pi.dst, pi.dstport);
}

uint64_t ts_to_ms(const struct timeval& tv)
{
    return static_cast<uint64_t>(tv.tv_sec) * MS_PER_SECOND +
           static_cast<uint64_t>(tv.tv_usec) / MS_PER_SECOND;
}

bool get_payload_info(const struct pcap_pkthdr* h, const u_char* bytes, PayloadInfo& out)
{
    const size_t caplen = h->caplen;
    if (caplen < sizeof(struct ether_header))
    {
        return false;
    }
    const struct ether_header* eth = reinterpret_cast<const struct ether_header*>(bytes);
    uint16_t eth_type = ntohs(eth->ether_type);
    size_t offset = sizeof(struct ether_header);

    // VLAN
    if (eth_type == ETHERTYPE_VLAN)
    {
        if (caplen < offset + VLAN_TAG_LEN)
        {
            return false;
        }
        uint16_t inner;
        std::memcpy(&inner, bytes + offset + 2, sizeof(inner));
        eth_type = ntohs(inner);
        offset += VLAN_TAG_LEN;
    }
    if (eth_type != ETHERTYPE_IP)
    {
        return false;
    }
    if (caplen < offset + sizeof(struct ip))
    {
        return false;
    }

    const struct ip* ip = reinterpret_cast<const struct ip*>(bytes + offset);
    if (ip->ip_v != 4 || ip->ip_p != IPPROTO_TCP)
    {
        return false;
    }

    uint16_t ip_off = ntohs(ip->ip_off);
    if ((ip_off & 0x1fff) != 0)
    {
        return false;  // fragmented
    }

    size_t ip_header_len = ip->ip_hl * 4u;
    if (ip_header_len < 20)
    {
        return false;
    }
    if (caplen < offset + ip_header_len + sizeof(struct tcphdr))
    {
        return false;
    }

    const struct tcphdr* tcp = reinterpret_cast<const struct tcphdr*>(bytes + offset + ip_header_len);
    size_t tcp_header_len = tcp->th_off * 4u;
    if (tcp_header_len < 20 || caplen < offset + ip_header_len + tcp_header_len)
    {
        return false;
    }

    // trailing Ethernet padding is not payload
    size_t ip_total = ntohs(ip->ip_len);
    size_t frame_end = caplen;
    if (ip_total >= ip_header_len + tcp_header_len && offset + ip_total < caplen)
    {
        frame_end = offset + ip_total;
    }

    out.payload_offset = offset + ip_header_len + tcp_header_len;
    out.payload_len = frame_end - out.payload_offset;
    out.seq = ntohl(tcp->th_seq);
    out.syn = (tcp->th_flags & TH_SYN) != 0;
    out.fin = (tcp->th_flags & TH_FIN) != 0;
    out.rst = (tcp->th_flags & TH_RST) != 0;
    out.srcport = ntohs(tcp->th_sport);
    out.dstport = ntohs(tcp->th_dport);

    std::memset(out.src, 0, sizeof(out.src));
    std::memset(out.dst, 0, sizeof(out.dst));
    inet_ntop(AF_INET, &ip->ip_src, out.src, sizeof(out.src));
    inet_ntop(AF_INET, &ip->ip_dst, out.dst, sizeof(out.dst));

    return true;
}
