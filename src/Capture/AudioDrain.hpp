#pragma once

#include "Capture/AudioChunk.hpp"
#include "Capture/CaptureBuffer.hpp"

namespace voice_search {

// Pull-based view over the capture buffer. Each Next() blocks for the first
// item, then takes whatever else is already queued and joins it into one
// block. The block that contains the sentinel is still returned (possibly
// empty); every later call returns false.
class AudioDrain {
public:
    explicit AudioDrain(CaptureBuffer& buffer) : _buffer(buffer), _finished(false) {}

    AudioDrain(const AudioDrain&) = delete;
    AudioDrain& operator=(const AudioDrain&) = delete;

    bool Next(AudioBlock& block);

    bool IsFinished() const { return _finished; }

private:
    static void Append(AudioBlock& block, const AudioChunk& chunk);

    CaptureBuffer& _buffer;
    bool _finished;
};

} // namespace voice_search
