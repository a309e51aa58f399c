#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace blockfall::net {

/// Bounded FIFO of outbound frames between the senders of a connection and
/// its writer thread. A peer that stops reading fills it up; the owner then
/// drops the connection instead of buffering without limit.
class Outbox {
public:
    enum class PushResult {
        Queued,
        Full,    // frame dropped, capacity reached
        Closed   // frame dropped, no more frames accepted
    };

    /// Throws std::invalid_argument for a zero capacity.
    explicit Outbox(std::size_t capacity);

    PushResult push(std::string frame);

    /// Blocks until a frame is available. Empty once the outbox is closed
    /// and drained, or discarded.
    std::optional<std::string> pop();

    /// Refuse new frames; the queued ones are still handed out.
    void close();

    /// Refuse new frames and drop the queued ones.
    void discard();

    std::size_t size() const;
    std::size_t capacity() const noexcept { return m_capacity; }

private:
    const std::size_t m_capacity;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<std::string> m_frames;
    bool m_closed{false};
};

} // namespace blockfall::net
