#include "Capture/CaptureBuffer.hpp"

namespace voice_search {

bool CaptureBuffer::Push(AudioChunk&& chunk) {
    std::unique_lock<std::mutex> lock(_mutex);
    if (_closed) {
        return false;
    }

    _queue.emplace_back(std::move(chunk));
    _cv_pop.notify_one();
    return true;
}

bool CaptureBuffer::PushSentinel() {
    std::unique_lock<std::mutex> lock(_mutex);
    if (_closed) {
        return false;
    }

    _closed = true;
    _queue.emplace_back(std::nullopt);
    _cv_pop.notify_all();
    return true;
}

CaptureBuffer::Item CaptureBuffer::Pop() {
    std::unique_lock<std::mutex> lock(_mutex);
    _cv_pop.wait(lock, [this] { return !_queue.empty(); });

    Item item = std::move(_queue.front());
    _queue.pop_front();
    return item;
}

bool CaptureBuffer::TryPop(Item& item) {
    std::unique_lock<std::mutex> lock(_mutex);
    if (_queue.empty()) {
        return false;
    }

    item = std::move(_queue.front());
    _queue.pop_front();
    return true;
}

size_t CaptureBuffer::Size() const {
    std::unique_lock<std::mutex> lock(_mutex);
    return _queue.size();
}

bool CaptureBuffer::IsClosed() const {
    std::unique_lock<std::mutex> lock(_mutex);
    return _closed;
}

} // namespace voice_search
