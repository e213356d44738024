#include "Capture/AudioDrain.hpp"

namespace voice_search {

void AudioDrain::Append(AudioBlock& block, const AudioChunk& chunk) {
    block.insert(block.end(), chunk.begin(), chunk.end());
}

bool AudioDrain::Next(AudioBlock& block) {
    if (_finished) {
        return false;
    }

    block.clear();

    CaptureBuffer::Item item = _buffer.Pop();
    if (!item) {
        _finished = true;
        return true;
    }
    Append(block, *item);

    while (_buffer.TryPop(item)) {
        if (!item) {
            // Sentinel is always last, nothing can follow it.
            _finished = true;
            break;
        }
        Append(block, *item);
    }
    return true;
}

} // namespace voice_search
