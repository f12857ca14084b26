#include "http_exchange_assembler.hpp"

#include <algorithm>
#include <cstdlib>
#include <utility>
#include <vector>

#include "chunked_body_decoder.hpp"
#include "har_fields.hpp"
#include "logger.hpp"
#include "picohttpparser.h"

constexpr size_t MAX_HEADERS = 100;
constexpr uint16_t DEFAULT_HTTP_PORT = 80;

namespace
{

using HeaderLines = std::vector<std::pair<std::string, std::string>>;

HeaderLines to_lines(const phr_header* headers, size_t num_headers)
{
    HeaderLines lines;
    lines.reserve(num_headers);
    for (size_t i = 0; i < num_headers; ++i)
    {
        // continuation lines come back with a null name
        if (headers[i].name == nullptr)
        {
            if (!lines.empty())
            {
                lines.back().second += " " + std::string(headers[i].value, headers[i].value_len);
            }
            continue;
        }
        lines.emplace_back(std::string(headers[i].name, headers[i].name_len),
                           std::string(headers[i].value, headers[i].value_len));
    }
    return lines;
}

enum class BodyFraming
{
    None,
    Length,
    Chunked,
    UntilClose
};

// Content-Length with a single decimal value; anything else counts as absent
bool content_length(const RawHeaders& headers, size_t& out)
{
    const RawHeader* h = find_header(headers, "content-length");
    if (h == nullptr || h->values.empty())
    {
        return false;
    }
    const std::string value(trim(h->values.front()));
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos)
    {
        return false;
    }
    char* end = nullptr;
    unsigned long long n = std::strtoull(value.c_str(), &end, 10);
    out = static_cast<size_t>(n);
    return true;
}

// Length of the body starting at data, 0 when more bytes are needed and framing
// needs them. Sets complete accordingly.
size_t body_extent(BodyFraming framing, size_t declared, std::string_view data, bool closed,
                   bool& complete)
{
    complete = false;
    switch (framing)
    {
        case BodyFraming::None:
            complete = true;
            return 0;
        case BodyFraming::Length:
            complete = data.size() >= declared;
            return complete ? declared : 0;
        case BodyFraming::Chunked:
        {
            size_t n = ChunkedBodyDecoder::framedLength(data);
            complete = n != 0;
            return n;
        }
        case BodyFraming::UntilClose:
            complete = closed;
            return closed ? data.size() : 0;
    }
    return 0;
}

std::string http_version(int minor_version)
{
    return "HTTP/1." + std::to_string(minor_version < 0 ? 1 : minor_version);
}

int64_t elapsed(uint64_t from, uint64_t to)
{
    return to > from ? static_cast<int64_t>(to - from) : 0;
}

}  // namespace

void HttpExchangeAssembler::TcpDirection::accept(uint32_t seq, std::string_view data, std::string& out)
{
    if (!seq_set)
    {
        next_seq = seq;
        seq_set = true;
    }

    int32_t diff = static_cast<int32_t>(seq - next_seq);
    if (diff > 0)
    {
        held.emplace(seq, std::string(data));
        return;
    }
    size_t overlap = static_cast<size_t>(-static_cast<int64_t>(diff));
    if (overlap < data.size())
    {
        out.append(data.substr(overlap));
        next_seq += static_cast<uint32_t>(data.size() - overlap);
    }

    bool progressed = true;
    while (progressed && !held.empty())
    {
        progressed = false;
        for (auto it = held.begin(); it != held.end(); ++it)
        {
            int32_t d = static_cast<int32_t>(it->first - next_seq);
            if (d > 0)
            {
                continue;
            }
            size_t skip = static_cast<size_t>(-static_cast<int64_t>(d));
            if (skip < it->second.size())
            {
                out.append(it->second, skip, std::string::npos);
                next_seq += static_cast<uint32_t>(it->second.size() - skip);
            }
            held.erase(it);
            progressed = true;
            break;
        }
    }
}

HttpExchangeAssembler::HttpExchangeAssembler(ArchiveSession& session,
                                             std::atomic<uint64_t>* packetClock)
    : m_session(session), m_packet_clock(packetClock)
{
}

void HttpExchangeAssembler::onPacketReceived(const struct pcap_pkthdr* hdr, const u_char* bytes)
{
    PayloadInfo info;
    if (!get_payload_info(hdr, bytes, info))
    {
        return;
    }

    uint64_t ts_ms = ts_to_ms(hdr->ts);
    if (m_packet_clock != nullptr)
    {
        m_packet_clock->store(ts_ms, std::memory_order_relaxed);
    }

    const bool from_client = info.dstport == m_server_port;
    const bool from_server = info.srcport == m_server_port;
    if (!from_client && !from_server)
    {
        return;
    }

    const FlowKey key = make_flow_key(info);
    FlowState& st = flowFor(key);
    TcpDirection& dir = from_client ? st.client_dir : st.server_dir;

    if (info.syn)
    {
        dir.next_seq = info.seq + 1;
        dir.seq_set = true;
    }

    std::string_view payload(reinterpret_cast<const char*>(bytes + info.payload_offset),
                             info.payload_len);
    if (!payload.empty())
    {
        std::string in_order;
        dir.accept(info.seq, payload, in_order);
        if (!in_order.empty())
        {
            if (from_client)
                onClientData(key, in_order, ts_ms);
            else
                onServerData(key, in_order, ts_ms);
        }
    }

    if (info.fin || info.rst)
    {
        dir.closed = true;
        if (from_server || info.rst)
        {
            onConnectionClosed(key, ts_ms);
        }
        auto it = m_flows.find(key);
        if (it != m_flows.end() && (info.rst || (it->second.client_dir.closed && it->second.server_dir.closed)))
        {
            LOG_DEBUG("Connection " << key.ip1 << ":" << key.port1 << " <-> " << key.ip2 << ":"
                                    << key.port2 << " finished");
            m_flows.erase(it);
        }
    }
}

HttpExchangeAssembler::FlowState& HttpExchangeAssembler::flowFor(const FlowKey& flow)
{
    auto it = m_flows.find(flow);
    if (it != m_flows.end())
    {
        return it->second;
    }

    FlowState st;
    if (flow.port1 == m_server_port)
    {
        st.server_addr = flow.ip1;
        st.server_port = flow.port1;
    }
    else
    {
        st.server_addr = flow.ip2;
        st.server_port = flow.port2;
    }
    return m_flows.emplace(flow, std::move(st)).first->second;
}

void HttpExchangeAssembler::onClientData(const FlowKey& flow, std::string_view data, uint64_t ts_ms)
{
    FlowState& st = flowFor(flow);
    if (st.upgraded)
    {
        return;
    }
    if (st.client_buf.empty())
    {
        st.client_first_ms = ts_ms;
    }
    st.client_buf.append(data);
    parseRequests(st, ts_ms);
}

void HttpExchangeAssembler::onServerData(const FlowKey& flow, std::string_view data, uint64_t ts_ms)
{
    FlowState& st = flowFor(flow);
    if (st.upgraded)
    {
        return;
    }
    if (st.server_buf.empty())
    {
        st.server_first_ms = ts_ms;
    }
    st.server_buf.append(data);
    parseResponses(st, ts_ms, false);
}

void HttpExchangeAssembler::onConnectionClosed(const FlowKey& flow, uint64_t ts_ms)
{
    auto it = m_flows.find(flow);
    if (it == m_flows.end() || it->second.upgraded)
    {
        return;
    }
    parseResponses(it->second, ts_ms, true);
}

void HttpExchangeAssembler::parseRequests(FlowState& st, uint64_t ts_ms)
{
    while (!st.client_buf.empty())
    {
        const char* method = nullptr;
        size_t method_len = 0;
        const char* path = nullptr;
        size_t path_len = 0;
        int minor_version = -1;
        phr_header headers[MAX_HEADERS];
        size_t num_headers = MAX_HEADERS;

        int ret = phr_parse_request(st.client_buf.data(), st.client_buf.size(), &method, &method_len,
                                    &path, &path_len, &minor_version, headers, &num_headers, 0);
        if (ret == -2)
        {
            LOG_DEBUG("HTTP request incomplete (need more bytes)");
            return;
        }
        if (ret < 0)
        {
            LOG_WARNING("HTTP request parse error on " << describe(st));
            m_session.note("Unparseable request data on " + describe(st) + ", " +
                           std::to_string(st.client_buf.size()) + " bytes discarded");
            st.client_buf.clear();
            return;
        }

        const std::string method_str(method, method_len);
        const std::string target(path, path_len);
        const RawHeaders raw = group_header_lines(to_lines(headers, num_headers));

        BodyFraming framing = BodyFraming::None;
        size_t declared = 0;
        if (ChunkedBodyDecoder::detect(raw))
        {
            framing = BodyFraming::Chunked;
        }
        else if (content_length(raw, declared) && declared > 0)
        {
            framing = BodyFraming::Length;
        }

        const size_t head_len = static_cast<size_t>(ret);
        bool complete = false;
        const size_t body_len = body_extent(framing, declared,
                                            std::string_view(st.client_buf).substr(head_len), false, complete);
        if (!complete)
        {
            return;
        }

        std::string body = st.client_buf.substr(head_len, body_len);
        if (framing == BodyFraming::Chunked)
        {
            try
            {
                body = ChunkedBodyDecoder::decode(body).body;
            }
            catch (const StructuralDecodeError& e)
            {
                m_session.note(std::string("Request body on ") + describe(st) + ": " + e.what());
            }
        }
        st.client_buf.erase(0, head_len + body_len);

        std::string url = target;
        if (target.rfind("http://", 0) != 0 && target.rfind("https://", 0) != 0)
        {
            std::string host = header_value(raw, "host");
            if (host.empty())
            {
                host = st.server_addr;
                if (st.server_port != DEFAULT_HTTP_PORT)
                {
                    host += ":" + std::to_string(st.server_port);
                }
            }
            url = "http://" + host + target;
        }

        const std::string id = m_session.issueIdentifier();
        const std::string token = header_value(raw, TRACKING_HEADER);
        if (!token.empty())
        {
            if (m_session.resolveTrackingToken(token))
            {
                m_session.note("Tracking ID " + token + " reused by request " + id);
            }
            m_session.registerTrackingToken(token, id);
        }

        std::optional<std::string> request_body;
        if (!body.empty())
        {
            request_body = std::move(body);
        }
        m_session.open(id, method_str, url, raw, request_body, false, CAPTURE_SOURCE_TAG,
                       http_version(minor_version));
        m_session.builder().recordServerAddress(id, st.server_addr);

        st.pending.push_back(PendingRequest{id, method_str, st.client_first_ms, ts_ms});
        st.client_first_ms = ts_ms;
    }
}

void HttpExchangeAssembler::parseResponses(FlowState& st, uint64_t ts_ms, bool closed)
{
    while (!st.server_buf.empty())
    {
        int minor_version = -1;
        int status = 0;
        const char* msg = nullptr;
        size_t msg_len = 0;
        phr_header headers[MAX_HEADERS];
        size_t num_headers = MAX_HEADERS;

        int ret = phr_parse_response(st.server_buf.data(), st.server_buf.size(), &minor_version,
                                     &status, &msg, &msg_len, headers, &num_headers, 0);
        if (ret == -2)
        {
            LOG_DEBUG("HTTP response incomplete (need more bytes)");
            return;
        }
        if (ret < 0)
        {
            LOG_WARNING("HTTP response parse error on " << describe(st));
            m_session.note("Unparseable response data on " + describe(st) + ", " +
                           std::to_string(st.server_buf.size()) + " bytes discarded");
            st.server_buf.clear();
            return;
        }

        const size_t head_len = static_cast<size_t>(ret);

        // interim responses carry no body and do not answer the request
        if (status >= 100 && status < 200 && status != 101)
        {
            LOG_DEBUG("Interim response " << status << " on " << describe(st));
            st.server_buf.erase(0, head_len);
            st.server_first_ms = ts_ms;
            continue;
        }

        const RawHeaders raw = group_header_lines(to_lines(headers, num_headers));
        const bool head_request = !st.pending.empty() && iequals(st.pending.front().method, "HEAD");

        BodyFraming framing = BodyFraming::UntilClose;
        size_t declared = 0;
        if (head_request || status == 101 || status == 204 || status == 304)
        {
            framing = BodyFraming::None;
        }
        else if (ChunkedBodyDecoder::detect(raw))
        {
            framing = BodyFraming::Chunked;
        }
        else if (content_length(raw, declared))
        {
            framing = declared > 0 ? BodyFraming::Length : BodyFraming::None;
        }

        bool complete = false;
        const size_t body_len = body_extent(framing, declared,
                                            std::string_view(st.server_buf).substr(head_len), closed, complete);
        if (!complete)
        {
            return;
        }

        std::string body = st.server_buf.substr(head_len, body_len);
        if (framing == BodyFraming::Chunked)
        {
            try
            {
                body = ChunkedBodyDecoder::decode(body).body;
            }
            catch (const StructuralDecodeError& e)
            {
                m_session.note(std::string("Response body on ") + describe(st) + ": " + e.what());
            }
        }
        st.server_buf.erase(0, head_len + body_len);
        const uint64_t first_ms = st.server_first_ms;
        st.server_first_ms = ts_ms;

        if (st.pending.empty())
        {
            LOG_WARNING("Response " << status << " on " << describe(st) << " without a captured request");
            m_session.note("Response " + std::to_string(status) + " on " + describe(st) +
                           " without a captured request");
            continue;
        }

        PendingRequest request = std::move(st.pending.front());
        st.pending.pop_front();

        ArchiveBuilder& builder = m_session.builder();
        builder.recordTiming(request.id, TimingPhase::Send, elapsed(request.first_ms, request.sent_ms));
        builder.recordTiming(request.id, TimingPhase::Wait, elapsed(request.sent_ms, first_ms));
        builder.recordTiming(request.id, TimingPhase::Receive, elapsed(first_ms, ts_ms));

        std::optional<std::string> response_body;
        if (!body.empty())
        {
            response_body = std::move(body);
        }
        m_session.close(request.id, status, std::string(msg, msg_len), raw, response_body,
                        http_version(minor_version));

        if (status == 101)
        {
            LOG_INFO("Protocol switched on " << describe(st) << ", no longer parsed as HTTP");
            st.upgraded = true;
            st.server_buf.clear();
            st.client_buf.clear();
            return;
        }
    }
}

void HttpExchangeAssembler::finish()
{
    for (auto& [key, st] : m_flows)
    {
        if (!st.upgraded && !st.server_buf.empty())
        {
            parseResponses(st, st.server_first_ms, true);
        }
        if (!st.client_buf.empty())
        {
            m_session.note("Incomplete request on " + describe(st) + ", " +
                           std::to_string(st.client_buf.size()) + " bytes discarded");
        }
        if (!st.server_buf.empty())
        {
            m_session.note("Incomplete response on " + describe(st) + ", " +
                           std::to_string(st.server_buf.size()) + " bytes discarded");
        }
    }
    LOG_INFO("Capture finished with " << m_flows.size() << " open connections");
    m_flows.clear();
}

std::string HttpExchangeAssembler::describe(const FlowState& st) const
{
    return "connection to " + st.server_addr + ":" + std::to_string(st.server_port);
}
