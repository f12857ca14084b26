#ifndef PERSISTENCE_SCHEDULER_HPP
#define PERSISTENCE_SCHEDULER_HPP

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

// Periodically runs a snapshot callback on its own thread.
// stop() wakes the thread immediately and joins it.
class PersistenceScheduler
{
   public:
    using Callback = std::function<void()>;

    explicit PersistenceScheduler(Callback callback);
    ~PersistenceScheduler();

    PersistenceScheduler(const PersistenceScheduler&) = delete;
    PersistenceScheduler& operator=(const PersistenceScheduler&) = delete;

    // Restarts the timer when already running. A zero interval disables it.
    void start(std::chrono::milliseconds interval);
    void stop();

    // Runs the callback once on the calling thread
    void flushNow();

    bool running() const;

   private:
    void loop(std::chrono::milliseconds interval);
    void invoke();

    Callback m_callback;
    mutable std::mutex m_mutex;
    std::mutex m_run_mutex;
    std::condition_variable m_cv;
    std::thread m_thread;
    bool m_stop_requested{false};
};

#endif  // PERSISTENCE_SCHEDULER_HPP
