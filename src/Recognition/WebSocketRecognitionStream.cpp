#include "Recognition/WebSocketRecognitionStream.hpp"
#include "voice_search/debug_log.hpp"

#include <iostream>
#include <variant>

namespace voice_search {

WebSocketRecognitionStream::WebSocketRecognitionStream(const std::string& url, RequestEncoder& encoder,
                                                       std::chrono::seconds deadline)
    : _url(url)
    , _encoder(encoder)
    , _deadline(deadline)
    , _open(false)
    , _closed(false)
    , _cancelled(false) {
    static_assert(std::atomic<bool>::is_always_lock_free, "Cancel() relies on a lock-free flag");
}

WebSocketRecognitionStream::~WebSocketRecognitionStream() {
    Close();
    _ws.reset();
}

void WebSocketRecognitionStream::SetUpCallbacks() {
    _ws->onOpen([this]() {
        VOICE_SEARCH_DEBUG_LOG("Recognizer connection open" << VOICE_SEARCH_DEBUG_LOG_ENDL);
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _open = true;
        }
        _cv.notify_all();
    });

    _ws->onClosed([this]() {
        VOICE_SEARCH_DEBUG_LOG("Recognizer connection closed" << VOICE_SEARCH_DEBUG_LOG_ENDL);
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _closed = true;
        }
        _cv.notify_all();
    });

    _ws->onError([this](const std::string& error) {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _error = error;
        }
        _cv.notify_all();
    });

    _ws->onMessage([this](rtc::message_variant data) {
        if (!std::holds_alternative<std::string>(data)) {
            VOICE_SEARCH_DEBUG_LOG("Ignoring binary frame from recognizer" << VOICE_SEARCH_DEBUG_LOG_ENDL);
            return;
        }
        OnText(std::get<std::string>(data));
    });
}

void WebSocketRecognitionStream::OnText(const std::string& text) {
    try {
        StreamingResponse response = DecodeResponseFrame(text);
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _responses.push_back(std::move(response));
        }
    } catch (const nlohmann::json::exception& e) {
        std::lock_guard<std::mutex> lock(_mutex);
        _error = std::string("Malformed response: ") + e.what();
    }
    _cv.notify_all();
}

void WebSocketRecognitionStream::Start(std::chrono::milliseconds connectTimeout) {
    if (_ws) {
        return;
    }

    rtc::WebSocket::Configuration config;
    config.connectionTimeout = connectTimeout;
    _ws = std::make_shared<rtc::WebSocket>(config);
    SetUpCallbacks();

    _deadlineTime = std::chrono::steady_clock::now() + _deadline;
    _ws->open(_url);

    {
        std::unique_lock<std::mutex> lock(_mutex);
        bool settled = _cv.wait_for(lock, connectTimeout, [this] {
            return _open || _closed || !_error.empty();
        });
        if (!_open) {
            std::string reason = !_error.empty() ? _error : (settled ? "connection closed" : "timed out");
            lock.unlock();
            _ws->resetCallbacks();
            _ws->close();
            throw RecognitionStreamException("Could not connect to " + _url + ": " + reason);
        }
    }

    _senderThread = std::make_unique<std::thread>(&WebSocketRecognitionStream::SenderThread, this);
}

void WebSocketRecognitionStream::SenderThread() {
    StreamingRequest request;
    size_t audioRequests = 0;

    while (_encoder.Next(request)) {
        if (_cancelled.load() || !_ws->isOpen()) {
            // Keep pulling so the drain reaches its sentinel, but stop sending.
            continue;
        }

        // send() returning false only means the frame was queued.
        try {
            if (request.IsConfig()) {
                (void)_ws->send(EncodeConfigFrame(*request.streamingConfig));
            } else if (!request.audioContent.empty()) {
                (void)_ws->send(request.audioContent);
                ++audioRequests;
            }
        } catch (const std::exception& e) {
            std::lock_guard<std::mutex> lock(_mutex);
            if (_error.empty()) {
                _error = std::string("Send failed: ") + e.what();
            }
            _cv.notify_all();
        }
    }

    if (!_cancelled.load() && _ws->isOpen()) {
        try {
            (void)_ws->send(EncodeEndOfStreamFrame());
        } catch (const std::exception& e) {
            std::cerr << "Could not send end of stream: " << e.what() << std::endl;
        }
    }

    VOICE_SEARCH_DEBUG_LOG("Sender finished after " << audioRequests << " audio requests"
                           << VOICE_SEARCH_DEBUG_LOG_ENDL);
}

bool WebSocketRecognitionStream::Read(StreamingResponse& response) {
    std::unique_lock<std::mutex> lock(_mutex);
    while (true) {
        if (_cancelled.load()) {
            lock.unlock();
            if (_ws) {
                _ws->close();
            }
            throw StreamCancelledException();
        }

        if (!_responses.empty()) {
            response = std::move(_responses.front());
            _responses.pop_front();
            return true;
        }

        if (!_error.empty()) {
            throw RecognitionStreamException(_error);
        }

        if (_closed) {
            return false;
        }

        if (std::chrono::steady_clock::now() >= _deadlineTime) {
            throw RecognitionStreamException("Deadline exceeded");
        }

        // Cancel() cannot notify from a signal handler, so poll for it.
        _cv.wait_for(lock, POLL_INTERVAL);
    }
}

void WebSocketRecognitionStream::Cancel() noexcept {
    _cancelled.store(true);
}

void WebSocketRecognitionStream::Close() {
    if (_ws) {
        // Callbacks capture this; none may run once Close() returns.
        _ws->resetCallbacks();
        if (!_ws->isClosed()) {
            _ws->close();
        }
    }

    if (_senderThread && _senderThread->joinable()) {
        _senderThread->join();
    }
}

} // namespace voice_search
