#pragma once

#include <chrono>
#include <string>

#include "AudioSource/IAudioSource.hpp"

struct SNDFILE_tag;

namespace voice_search {

// Plays a mono 16-bit WAV file into the pipeline in place of a microphone.
class WavFileSource : public IAudioSource {
public:
    WavFileSource(const std::string& filename, unsigned int sampleRate,
                  unsigned int chunkFrames, bool realtime = true);
    ~WavFileSource() override;

    bool Read(AudioChunk& chunk) override;
    void Close() override;

    unsigned int GetSampleRate() const override { return _sampleRate; }

private:
    std::string _filename;
    SNDFILE_tag* _file;
    unsigned int _sampleRate;
    unsigned int _chunkFrames;
    bool _realtime;
    std::chrono::steady_clock::time_point _nextChunkTime;
};

} // namespace voice_search
