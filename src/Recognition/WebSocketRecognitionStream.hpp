#pragma once

#include <rtc/rtc.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "Recognition/IRecognitionStream.hpp"
#include "Recognition/RequestEncoder.hpp"

namespace voice_search {

// Streaming recognizer session over a WebSocket: config and end-of-stream
// as JSON text frames, audio as binary frames, responses as JSON text.
//
// Requests are pulled from the encoder on a sender thread owned by the
// stream. That thread only returns once the encoder runs dry, so capture
// must be stopped before Close().
class WebSocketRecognitionStream : public IRecognitionStream {
public:
    WebSocketRecognitionStream(const std::string& url, RequestEncoder& encoder,
                               std::chrono::seconds deadline);
    ~WebSocketRecognitionStream() override;

    WebSocketRecognitionStream(const WebSocketRecognitionStream&) = delete;
    WebSocketRecognitionStream& operator=(const WebSocketRecognitionStream&) = delete;

    // Connects and starts sending. Throws RecognitionStreamException.
    void Start(std::chrono::milliseconds connectTimeout = std::chrono::milliseconds(10000));

    bool Read(StreamingResponse& response) override;
    void Cancel() noexcept override;

    // Closes the socket and joins the sender.
    void Close() override;

    bool IsCancelled() const { return _cancelled.load(); }

    static constexpr std::chrono::milliseconds POLL_INTERVAL{50};

private:
    void SetUpCallbacks();
    void SenderThread();
    void OnText(const std::string& text);

    std::string _url;
    RequestEncoder& _encoder;
    std::chrono::seconds _deadline;
    std::chrono::steady_clock::time_point _deadlineTime;

    std::mutex _mutex;
    std::condition_variable _cv;
    std::deque<StreamingResponse> _responses;
    std::string _error;
    bool _open;
    bool _closed;

    std::atomic<bool> _cancelled;

    // Declared after the state its callbacks touch.
    std::shared_ptr<rtc::WebSocket> _ws;
    std::unique_ptr<std::thread> _senderThread;
};

} // namespace voice_search
