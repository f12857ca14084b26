#ifndef SHUTDOWN_SIGNALS_HPP
#define SHUTDOWN_SIGNALS_HPP

#include <signal.h>

#include <atomic>

// Routes SIGINT/SIGTERM to AppT::stop() while the guard is alive and puts the
// previous dispositions back on destruction. One guard per AppT at a time.
// AppT::stop() runs inside the handler: raise a flag, break the pcap loop, nothing else.
template <typename AppT>
class ShutdownSignals
{
  public:
    explicit ShutdownSignals(AppT* app)
    {
        target_.store(app);

        struct sigaction action;
        sigemptyset(&action.sa_mask);
        action.sa_flags = 0;
        action.sa_handler = &ShutdownSignals::onSignal;
        sigaction(SIGINT, &action, &previous_int_);
        sigaction(SIGTERM, &action, &previous_term_);
    }

    ~ShutdownSignals()
    {
        sigaction(SIGINT, &previous_int_, nullptr);
        sigaction(SIGTERM, &previous_term_, nullptr);
        target_.store(nullptr);
    }

    ShutdownSignals(const ShutdownSignals&) = delete;
    ShutdownSignals& operator=(const ShutdownSignals&) = delete;

  private:
    static void onSignal(int)
    {
        AppT* app = target_.load();
        if (app)
            app->stop();
    }

    inline static std::atomic<AppT*> target_{nullptr};

    struct sigaction previous_int_;
    struct sigaction previous_term_;
};

#endif // SHUTDOWN_SIGNALS_HPP
