#pragma once

#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "Capture/CaptureBuffer.hpp"
#include "Capture/StopSignal.hpp"

namespace voice_search {

class IAudioSource;

// Background thread moving chunks from the audio source into the buffer
// until the stop signal is set or the source ends or fails. Exactly one
// sentinel is pushed when the thread finishes, whatever the reason.
class CaptureLoop {
public:
    CaptureLoop(IAudioSource& source, CaptureBuffer& buffer, StopSignal& stop);
    ~CaptureLoop();

    CaptureLoop(const CaptureLoop&) = delete;
    CaptureLoop& operator=(const CaptureLoop&) = delete;

    void Start();

    // Sets the stop signal and waits for the thread. Safe to call twice.
    void Stop();

    bool IsRunning() const { return _thread && _thread->joinable(); }

    // Device failure that ended capture, if any. Valid after Stop().
    const std::optional<std::string>& GetFailure() const { return _failure; }

    size_t GetChunksCaptured() const { return _chunksCaptured; }

private:
    void Run();

    IAudioSource& _source;
    CaptureBuffer& _buffer;
    StopSignal& _stop;
    std::unique_ptr<std::thread> _thread;
    std::optional<std::string> _failure;
    size_t _chunksCaptured;
};

} // namespace voice_search
