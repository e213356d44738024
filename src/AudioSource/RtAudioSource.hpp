#pragma once

#include <RtAudio.h>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>

#include "AudioSource/IAudioSource.hpp"

namespace voice_search {

// Microphone capture through RtAudio. The stream callback runs on the
// RtAudio thread and only appends to _pending; Read() hands out whole chunks.
class RtAudioSource : public IAudioSource {
public:
    // An empty device_id selects the default input device.
    RtAudioSource(unsigned int sampleRate, unsigned int chunkFrames,
                  const std::string& deviceId = "");
    ~RtAudioSource() override;

    bool Read(AudioChunk& chunk) override;
    void Close() override;

    unsigned int GetSampleRate() const override { return _sampleRate; }

    static void ListDevices();

    static constexpr std::chrono::milliseconds READ_TIMEOUT{2000};

private:
    static int OnInput(void* outputBuffer, void* inputBuffer, unsigned int nBufferFrames,
                       double streamTime, RtAudioStreamStatus status, void* userData);

    void OnError(RtAudioErrorType type, const std::string& errorText);
    unsigned int SelectDevice(const std::string& deviceId);

    unsigned int _sampleRate;
    unsigned int _chunkFrames;

    // Declared before _audio: the error callback may fire while it is constructed.
    std::mutex _mutex;
    std::condition_variable _cv_data;
    std::deque<int16_t> _pending;
    std::string _error;
    bool _closed;

    RtAudio _audio;
    RtAudio::StreamParameters _parameters;
};

} // namespace voice_search
