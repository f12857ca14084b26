#include "capture_engine.hpp"

#include <cctype>
#include <stdexcept>

#include "logger.hpp"

constexpr auto PCAP_BUFFER_SIZE = 128 * 1024 * 1024; // 128MB
constexpr auto PCAP_TIMEOUT = 1000; // 1 second
constexpr auto PCAP_SNAPLEN = 262144; // full frames, bodies are archived

struct CallbackData
{
    HttpExchangeAssembler* assembler;
    std::atomic<bool>* stop_flag;
    pcap_t* handle;
};

extern "C" void pkt_handler(u_char* user, const struct pcap_pkthdr* hdr, const u_char* bytes)
{
    CallbackData* data = reinterpret_cast<CallbackData*>(user);

    if (data->stop_flag != nullptr && data->stop_flag->load(std::memory_order_acquire))
    {
        pcap_breakloop(data->handle);
        return;
    }

    data->assembler->onPacketReceived(hdr, bytes);
}

CaptureEngine::CaptureEngine(const std::string& source, Source kind) : m_handle(nullptr), m_kind(kind)
{
    if (kind == Source::File)
    {
        char errbuf[PCAP_ERRBUF_SIZE];
        m_handle = pcap_open_offline(source.c_str(), errbuf);
        if (m_handle == nullptr)
        {
            throw std::runtime_error(std::string("pcap_open_offline failed: ") + errbuf);
        }
        LOG_INFO("Reading packets from " << source);
    }
    else
    {
        openLive(source);
    }

    if (pcap_datalink(m_handle) != DLT_EN10MB)
    {
        LOG_WARNING("Link type " << pcap_datalink_val_to_name(pcap_datalink(m_handle))
                                 << " is not Ethernet, packets will not be decoded");
    }
}

void CaptureEngine::openLive(const std::string& interface)
{
    char errbuf[PCAP_ERRBUF_SIZE];

    m_handle = pcap_create(interface.c_str(), errbuf);
    if (m_handle == nullptr)
    {
        throw std::runtime_error(std::string("pcap_create failed: ") + errbuf);
    }

    if (pcap_set_snaplen(m_handle, PCAP_SNAPLEN) != 0)
    {
        pcap_close(m_handle);
        throw std::runtime_error("Failed to set snaplen");
    }

    if (pcap_set_promisc(m_handle, 1) != 0)
    {
        pcap_close(m_handle);
        throw std::runtime_error("Failed to set promisc mode");
    }

    if (pcap_set_timeout(m_handle, PCAP_TIMEOUT) != 0)
    {
        pcap_close(m_handle);
        throw std::runtime_error("Failed to set timeout");
    }

    // must happen before activation
    if (pcap_set_buffer_size(m_handle, PCAP_BUFFER_SIZE) != 0)
    {
        pcap_close(m_handle);
        throw std::runtime_error("Failed to set buffer size");
    }

    int status = pcap_activate(m_handle);
    if (status != 0)
    {
        if (status > 0)
        {
            LOG_WARNING("pcap_activate warning: " << pcap_geterr(m_handle));
        }
        else
        {
            std::string error = std::string("pcap_activate failed: ") + pcap_geterr(m_handle);
            pcap_close(m_handle);
            throw std::runtime_error(error);
        }
    }

    LOG_INFO("Capturing on " << interface << " with 128MB buffer, snaplen=" << PCAP_SNAPLEN);
}

CaptureEngine::~CaptureEngine()
{
    if (m_handle != nullptr)
    {
        pcap_close(m_handle);
    }
}

uint16_t CaptureEngine::extractPortFromFilter(const std::string& filter)
{
    // "port 8080", "tcp port 80", "host x and port 8000"
    size_t port_pos = filter.find("port");
    if (port_pos == std::string::npos)
    {
        return 0;
    }

    size_t num_start = port_pos + 4;
    while (num_start < filter.length() && std::isspace(static_cast<unsigned char>(filter[num_start])))
    {
        ++num_start;
    }

    size_t num_end = num_start;
    while (num_end < filter.length() && std::isdigit(static_cast<unsigned char>(filter[num_end])))
    {
        ++num_end;
    }
    if (num_end == num_start || num_end - num_start > 5)
    {
        return 0;
    }

    unsigned long port = std::stoul(filter.substr(num_start, num_end - num_start));
    if (port > 0 && port <= 65535)
    {
        return static_cast<uint16_t>(port);
    }
    return 0;
}

bool CaptureEngine::addFilter(const std::string& filter)
{
    if (m_handle == nullptr)
    {
        return false;
    }

    m_filter_port = extractPortFromFilter(filter);

    struct bpf_program bfp;
    if (pcap_compile(m_handle, &bfp, filter.c_str(), 0, PCAP_NETMASK_UNKNOWN) == -1)
    {
        LOG_ERROR("pcap_compile failed: " << pcap_geterr(m_handle));
        return false;
    }

    if (pcap_setfilter(m_handle, &bfp) == -1)
    {
        LOG_ERROR("pcap_setfilter failed: " << pcap_geterr(m_handle));
        pcap_freecode(&bfp);
        return false;
    }
    pcap_freecode(&bfp);
    return true;
}

void CaptureEngine::run(HttpExchangeAssembler& assembler, std::atomic<bool>* stop_flag)
{
    CallbackData data;
    data.assembler = &assembler;
    data.stop_flag = stop_flag;
    data.handle = m_handle;

    int result = pcap_loop(m_handle, -1, pkt_handler, reinterpret_cast<u_char*>(&data));

    if (result == PCAP_ERROR_BREAK)
    {
        LOG_INFO("Capture loop terminated by breakloop");
    }
    else if (result == PCAP_ERROR)
    {
        LOG_ERROR("Error in pcap_loop: " << pcap_geterr(m_handle));
    }
    else
    {
        LOG_INFO("End of capture file");
    }

    if (m_kind != Source::Interface)
    {
        return;
    }

    struct pcap_stat stats;
    if (pcap_stats(m_handle, &stats) == 0)
    {
        LOG_INFO("Packets received by filter: " << stats.ps_recv);
        LOG_INFO("Packets dropped by kernel: " << stats.ps_drop);
        if (stats.ps_drop > 0)
        {
            LOG_WARNING(stats.ps_drop << " packets were dropped, archived bodies may be incomplete");
        }
    }
}

void CaptureEngine::stop()
{
    if (m_handle != nullptr)
    {
        pcap_breakloop(m_handle);
    }
}
