#include "network/Outbox.hpp"

#include <stdexcept>
#include <utility>

namespace blockfall::net {

Outbox::Outbox(std::size_t capacity)
    : m_capacity(capacity)
{
    if (m_capacity == 0) {
        throw std::invalid_argument("Outbox: capacity must be positive");
    }
}

Outbox::PushResult Outbox::push(std::string frame)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) return PushResult::Closed;
        if (m_frames.size() >= m_capacity) return PushResult::Full;
        m_frames.push_back(std::move(frame));
    }
    m_cv.notify_one();
    return PushResult::Queued;
}

std::optional<std::string> Outbox::pop()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait(lock, [this] { return !m_frames.empty() || m_closed; });
    if (m_frames.empty()) {
        return std::nullopt;
    }

    std::string frame = std::move(m_frames.front());
    m_frames.pop_front();
    return frame;
}

void Outbox::close()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
    }
    m_cv.notify_all();
}

void Outbox::discard()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
        m_frames.clear();
    }
    m_cv.notify_all();
}

std::size_t Outbox::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_frames.size();
}

} // namespace blockfall::net
