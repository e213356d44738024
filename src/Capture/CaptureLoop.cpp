#include "Capture/CaptureLoop.hpp"
#include "AudioSource/IAudioSource.hpp"
#include "voice_search/debug_log.hpp"

#include <iostream>

namespace voice_search {

CaptureLoop::CaptureLoop(IAudioSource& source, CaptureBuffer& buffer, StopSignal& stop)
    : _source(source)
    , _buffer(buffer)
    , _stop(stop)
    , _chunksCaptured(0) {
}

CaptureLoop::~CaptureLoop() {
    Stop();
}

void CaptureLoop::Start() {
    if (_thread) {
        return;
    }
    _thread = std::make_unique<std::thread>(&CaptureLoop::Run, this);
}

void CaptureLoop::Stop() {
    _stop.Set();
    if (_thread && _thread->joinable()) {
        _thread->join();
        VOICE_SEARCH_DEBUG_LOG("Capture thread joined after " << _chunksCaptured << " chunks"
                               << VOICE_SEARCH_DEBUG_LOG_ENDL);
    }
}

void CaptureLoop::Run() {
    try {
        AudioChunk chunk;
        while (!_stop.IsSet()) {
            if (!_source.Read(chunk)) {
                VOICE_SEARCH_DEBUG_LOG("Audio source exhausted" << VOICE_SEARCH_DEBUG_LOG_ENDL);
                break;
            }
            _buffer.Push(std::move(chunk));
            chunk = AudioChunk();
            ++_chunksCaptured;
        }
    } catch (const std::exception& e) {
        // A failing device ends capture like a stop request.
        _failure = e.what();
        std::cerr << "Audio capture stopped: " << e.what() << std::endl;
    }

    _buffer.PushSentinel();
}

} // namespace voice_search
