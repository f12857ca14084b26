#ifndef ARCHIVE_CAPTURE_APP_HPP
#define ARCHIVE_CAPTURE_APP_HPP

#include <atomic>
#include <cstdint>
#include <string>

#include "archive_config.hpp"
#include "archive_session.hpp"
#include "capture_engine.hpp"
#include "http_exchange_assembler.hpp"

class ArchiveCaptureApp
{
  public:
    explicit ArchiveCaptureApp(ArchiveConfig config);
    ~ArchiveCaptureApp();

    // Captures until stopped or the file ends, then shuts the session down.
    // Returns the process exit code.
    int run();
    void stop();

  private:
    ArchiveConfig config_;
    std::atomic<uint64_t> packet_ms_{0};
    ArchiveSession session_;
    CaptureEngine capture_engine_;
    HttpExchangeAssembler assembler_;
    std::atomic<bool> stop_flag_{false};
};

#endif // ARCHIVE_CAPTURE_APP_HPP
