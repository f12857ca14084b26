#include "archive_capture_app.hpp"

#include "logger.hpp"
#include "shutdown_signals.hpp"

static ArchiveCreator creator_from(const ArchiveConfig& config)
{
    ArchiveCreator creator;
    if (!config.creatorName.empty())
        creator.name = config.creatorName;
    if (!config.creatorVersion.empty())
        creator.version = config.creatorVersion;
    return creator;
}

ArchiveCaptureApp::ArchiveCaptureApp(ArchiveConfig config)
    : config_(std::move(config)),
      session_(config_.archivePath(), creator_from(config_),
               [this] {
                   // capture time once packets flow, wall time before that
                   uint64_t ms = packet_ms_.load(std::memory_order_relaxed);
                   if (ms == 0)
                       return std::chrono::system_clock::now();
                   return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
               }),
      capture_engine_(config_.pcapFile.empty() ? config_.interface : config_.pcapFile,
                      config_.pcapFile.empty() ? CaptureEngine::Source::Interface
                                               : CaptureEngine::Source::File),
      assembler_(session_, &packet_ms_)
{
    if (!capture_engine_.addFilter(config_.filter))
    {
        throw std::runtime_error("Invalid capture filter: " + config_.filter);
    }
}

ArchiveCaptureApp::~ArchiveCaptureApp() = default;

int ArchiveCaptureApp::run()
{
    uint16_t server_port = capture_engine_.getFilterPort();
    if (server_port == 0)
    {
        LOG_ERROR("Could not extract server port from filter: '" << config_.filter << "'");
        LOG_ERROR("Filter must contain 'port NNNN' pattern (e.g., 'tcp port 8080')");
        return 1;
    }

    LOG_INFO("Server port extracted from filter: " << server_port);
    assembler_.setServerPort(server_port);

    session_.note("Capture started on " +
                  (config_.pcapFile.empty() ? "interface " + config_.interface : "file " + config_.pcapFile) +
                  " with filter '" + config_.filter + "'");
    session_.startAutosave(config_.autosaveInterval);

    {
        ShutdownSignals<ArchiveCaptureApp> signals(this);
        capture_engine_.run(assembler_, &stop_flag_);
    }

    assembler_.finish();
    if (!session_.shutdown())
    {
        LOG_ERROR("Final archive write failed: " << session_.archivePath());
        return 1;
    }
    return 0;
}

void ArchiveCaptureApp::stop()
{
    stop_flag_.store(true, std::memory_order_release);
    capture_engine_.stop();
}
