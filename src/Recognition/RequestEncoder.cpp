#include "Recognition/RequestEncoder.hpp"

namespace voice_search {

RequestEncoder::RequestEncoder(AudioDrain& drain, const StreamingConfig& config)
    : _drain(drain)
    , _config(config)
    , _configSent(false) {
}

bool RequestEncoder::Next(StreamingRequest& request) {
    if (!_configSent) {
        _configSent = true;
        request.streamingConfig = _config;
        request.audioContent.clear();
        return true;
    }

    request.streamingConfig.reset();
    return _drain.Next(request.audioContent);
}

} // namespace voice_search
