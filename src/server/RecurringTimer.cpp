#include "server/RecurringTimer.hpp"

namespace blockfall::server {

RecurringTimer::~RecurringTimer()
{
    cancel();
}

void RecurringTimer::start(Duration quantum, Callback callback)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_control) return;

    m_control = std::make_shared<Control>();
    m_thread  = std::thread(&RecurringTimer::run, m_control, quantum, std::move(callback));
}

void RecurringTimer::cancel()
{
    std::thread thread;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_control) return;

        {
            std::lock_guard<std::mutex> controlLock(m_control->mutex);
            m_control->cancelled = true;
        }
        m_control->cv.notify_all();
        m_control.reset();
        thread = std::move(m_thread);
    }

    if (!thread.joinable()) return;
    if (thread.get_id() == std::this_thread::get_id()) {
        // Cancelled from inside the callback; the loop sees the flag.
        thread.detach();
    } else {
        thread.join();
    }
}

bool RecurringTimer::isRunning() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_control != nullptr;
}

void RecurringTimer::run(std::shared_ptr<Control> control, Duration quantum, Callback callback)
{
    auto next = std::chrono::steady_clock::now() + quantum;
    while (true) {
        {
            std::unique_lock<std::mutex> lock(control->mutex);
            if (control->cv.wait_until(lock, next, [&] { return control->cancelled; })) {
                return;
            }
        }

        callback();

        next += quantum;
        const auto now = std::chrono::steady_clock::now();
        if (next < now) {
            // Fell behind: skip the missed slots instead of bursting
            next = now + quantum;
        }
    }
}

} // namespace blockfall::server
