#include "persistence_scheduler.hpp"

#include <exception>

#include "logger.hpp"

PersistenceScheduler::PersistenceScheduler(Callback callback) : m_callback(std::move(callback)) {}

PersistenceScheduler::~PersistenceScheduler()
{
    stop();
}

void PersistenceScheduler::start(std::chrono::milliseconds interval)
{
    stop();
    if (interval.count() <= 0)
    {
        LOG_INFO("Autosave disabled");
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stop_requested = false;
    }
    m_thread = std::thread(&PersistenceScheduler::loop, this, interval);
    LOG_DEBUG("Autosave every " << interval.count() << "ms");
}

void PersistenceScheduler::stop()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stop_requested = true;
    }
    m_cv.notify_all();
    if (m_thread.joinable())
    {
        m_thread.join();
    }
}

void PersistenceScheduler::flushNow()
{
    invoke();
}

bool PersistenceScheduler::running() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_thread.joinable() && !m_stop_requested;
}

void PersistenceScheduler::loop(std::chrono::milliseconds interval)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    while (!m_stop_requested)
    {
        if (m_cv.wait_for(lock, interval, [this] { return m_stop_requested; }))
        {
            break;
        }
        lock.unlock();
        invoke();
        lock.lock();
    }
}

void PersistenceScheduler::invoke()
{
    if (!m_callback)
    {
        return;
    }
    // timer tick and flushNow() never overlap
    std::lock_guard<std::mutex> lock(m_run_mutex);
    try
    {
        m_callback();
    }
    catch (const std::exception& e)
    {
        LOG_ERROR("Snapshot failed: " << e.what());
    }
}
