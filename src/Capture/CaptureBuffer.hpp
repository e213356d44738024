#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

#include "Capture/AudioChunk.hpp"

namespace voice_search {

// Unbounded FIFO between the capture thread and the drain.
// An empty optional is the end-of-capture sentinel; at most one is ever
// queued and nothing can be pushed after it.
class CaptureBuffer {
public:
    using Item = std::optional<AudioChunk>;

    CaptureBuffer() : _closed(false) {}

    CaptureBuffer(const CaptureBuffer&) = delete;
    CaptureBuffer& operator=(const CaptureBuffer&) = delete;

    // Returns false if the sentinel was already pushed; the chunk is dropped.
    bool Push(AudioChunk&& chunk);

    // Returns false if the sentinel was already pushed.
    bool PushSentinel();

    // Blocks until an item is available.
    Item Pop();

    // Non-blocking; returns false when the queue is empty.
    bool TryPop(Item& item);

    size_t Size() const;
    bool IsClosed() const;

private:
    mutable std::mutex _mutex;
    std::condition_variable _cv_pop;
    std::deque<Item> _queue;
    bool _closed;
};

} // namespace voice_search
