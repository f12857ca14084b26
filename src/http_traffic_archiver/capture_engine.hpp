#ifndef CAPTURE_ENGINE_HPP
#define CAPTURE_ENGINE_HPP

#include <pcap.h>

#include <atomic>
#include <string>

#include "http_exchange_assembler.hpp"

class CaptureEngine
{
   public:
    enum class Source
    {
        Interface,
        File
    };

    // Opens a live interface or a saved capture file. Throws std::runtime_error.
    CaptureEngine(const std::string& source, Source kind);
    ~CaptureEngine();

    CaptureEngine(const CaptureEngine&) = delete;
    CaptureEngine& operator=(const CaptureEngine&) = delete;

    bool addFilter(const std::string& filter);
    void stop();

    // Get the server port extracted from the filter (0 if not found)
    uint16_t getFilterPort() const { return m_filter_port; }

    // Returns when the file is exhausted, stop() was called or stop_flag was raised
    void run(HttpExchangeAssembler& assembler, std::atomic<bool>* stop_flag = nullptr);

    // Extract port from BPF filter string
    static uint16_t extractPortFromFilter(const std::string& filter);

   private:
    void openLive(const std::string& interface);

    pcap_t* m_handle;
    Source m_kind;
    uint16_t m_filter_port{0};
};

#endif  // CAPTURE_ENGINE_HPP
