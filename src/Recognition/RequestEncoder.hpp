#pragma once

#include "Capture/AudioDrain.hpp"
#include "Recognition/RecognitionMessages.hpp"

namespace voice_search {

// Turns the drained audio into the outbound request sequence: one config
// request first, then one audio request per drained block.
class RequestEncoder {
public:
    RequestEncoder(AudioDrain& drain, const StreamingConfig& config);

    RequestEncoder(const RequestEncoder&) = delete;
    RequestEncoder& operator=(const RequestEncoder&) = delete;

    // Blocks while the drain blocks. Returns false once the drain is done.
    bool Next(StreamingRequest& request);

private:
    AudioDrain& _drain;
    StreamingConfig _config;
    bool _configSent;
};

} // namespace voice_search
