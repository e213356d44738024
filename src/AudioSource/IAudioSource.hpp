#pragma once

#include <stdexcept>
#include <string>

#include "Capture/AudioChunk.hpp"

namespace voice_search {

class AudioSourceException : public std::runtime_error {
public:
    explicit AudioSourceException(const std::string& message)
        : std::runtime_error(message) {}
};

// Produces fixed-size LINEAR16 mono chunks at the session sample rate.
class IAudioSource {
public:
    virtual ~IAudioSource() = default;

    // Blocks until one chunk is captured. Returns false at end of input,
    // throws AudioSourceException when the device fails.
    virtual bool Read(AudioChunk& chunk) = 0;

    // Releases the device. Safe to call more than once.
    virtual void Close() = 0;

    // Rate the chunks are captured at, announced to the recognizer.
    virtual unsigned int GetSampleRate() const = 0;
};

} // namespace voice_search
