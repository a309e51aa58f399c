#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace blockfall::server {

/// Runs a callback every `quantum` on its own thread until cancelled.
/// cancel() may be called from inside the callback.
class RecurringTimer {
public:
    using Callback = std::function<void()>;
    using Duration = std::chrono::milliseconds;

    RecurringTimer() = default;
    ~RecurringTimer();

    RecurringTimer(const RecurringTimer&) = delete;
    RecurringTimer& operator=(const RecurringTimer&) = delete;

    /// No-op if already running.
    void start(Duration quantum, Callback callback);

    /// Stop scheduling. The callback is not invoked again once this returns,
    /// except for a run that is already in progress on another thread.
    void cancel();

    bool isRunning() const;

private:
    // Shared with the thread so a detached thread never touches a
    // destroyed timer.
    struct Control {
        std::mutex mutex;
        std::condition_variable cv;
        bool cancelled{false};
    };

    mutable std::mutex m_mutex;
    std::shared_ptr<Control> m_control;
    std::thread m_thread;

    static void run(std::shared_ptr<Control> control, Duration quantum, Callback callback);
};

} // namespace blockfall::server
