#include "AudioSource/RtAudioSource.hpp"
#include "voice_search/debug_log.hpp"

#include <algorithm>
#include <iostream>
#include <vector>

namespace voice_search {

RtAudioSource::RtAudioSource(unsigned int sampleRate, unsigned int chunkFrames,
                             const std::string& deviceId)
    : _sampleRate(sampleRate)
    , _chunkFrames(chunkFrames)
    , _closed(false)
    , _audio(RtAudio::UNSPECIFIED,
             [this](RtAudioErrorType type, const std::string& errorText) { OnError(type, errorText); }) {
    _parameters.deviceId = SelectDevice(deviceId);
    _parameters.nChannels = 1;
    _parameters.firstChannel = 0;

    unsigned int bufferFrames = _chunkFrames;

    VOICE_SEARCH_DEBUG_LOG("Opening input stream:" << VOICE_SEARCH_DEBUG_LOG_ENDL);
    VOICE_SEARCH_DEBUG_LOG("  Sample rate: " << _sampleRate << VOICE_SEARCH_DEBUG_LOG_ENDL);
    VOICE_SEARCH_DEBUG_LOG("  Buffer frames: " << bufferFrames << VOICE_SEARCH_DEBUG_LOG_ENDL);
    VOICE_SEARCH_DEBUG_LOG("  Format: SINT16" << VOICE_SEARCH_DEBUG_LOG_ENDL);

    if (_audio.openStream(nullptr, &_parameters, RTAUDIO_SINT16,
                          _sampleRate, &bufferFrames, &RtAudioSource::OnInput, this)) {
        throw AudioSourceException("Error opening stream: " + _audio.getErrorText());
    }

    if (_audio.startStream()) {
        std::string error = _audio.getErrorText();
        _audio.closeStream();
        throw AudioSourceException("Error starting stream: " + error);
    }
}

RtAudioSource::~RtAudioSource() {
    Close();
}

unsigned int RtAudioSource::SelectDevice(const std::string& deviceId) {
    std::vector<unsigned int> deviceIds = _audio.getDeviceIds();
    if (deviceIds.empty()) {
        throw AudioSourceException("No audio devices found");
    }

    if (!deviceId.empty()) {
        unsigned int requested = 0;
        try {
            requested = static_cast<unsigned int>(std::stoul(deviceId));
        } catch (const std::exception&) {
            throw AudioSourceException("Invalid device id: " + deviceId);
        }
        for (unsigned int id : deviceIds) {
            if (id == requested && _audio.getDeviceInfo(id).inputChannels > 0) {
                return id;
            }
        }
        throw AudioSourceException("Device " + deviceId + " has no input channels");
    }

    unsigned int defaultDevice = _audio.getDefaultInputDevice();
    RtAudio::DeviceInfo defaultInfo = _audio.getDeviceInfo(defaultDevice);
    VOICE_SEARCH_DEBUG_LOG("Default input device: " << defaultInfo.name << VOICE_SEARCH_DEBUG_LOG_ENDL);

    if (defaultInfo.inputChannels > 0) {
        return defaultDevice;
    }

    VOICE_SEARCH_DEBUG_LOG("Default device has no input channels! Searching for alternative..."
                           << VOICE_SEARCH_DEBUG_LOG_ENDL);
    for (unsigned int id : deviceIds) {
        RtAudio::DeviceInfo info = _audio.getDeviceInfo(id);
        if (info.inputChannels > 0) {
            VOICE_SEARCH_DEBUG_LOG("Using device: " << info.name << VOICE_SEARCH_DEBUG_LOG_ENDL);
            return id;
        }
    }

    throw AudioSourceException("No input devices found!");
}

int RtAudioSource::OnInput(void* /*outputBuffer*/, void* inputBuffer, unsigned int nBufferFrames,
                           double /*streamTime*/, RtAudioStreamStatus status, void* userData) {
    auto* self = static_cast<RtAudioSource*>(userData);

    if (status & RTAUDIO_INPUT_OVERFLOW) {
        VOICE_SEARCH_DEBUG_LOG("Stream overflow detected!" << VOICE_SEARCH_DEBUG_LOG_ENDL);
    }

    if (!inputBuffer) {
        return 0;
    }

    const auto* samples = static_cast<const int16_t*>(inputBuffer);
    {
        std::lock_guard<std::mutex> lock(self->_mutex);
        self->_pending.insert(self->_pending.end(), samples, samples + nBufferFrames);
    }
    self->_cv_data.notify_one();
    return 0;
}

void RtAudioSource::OnError(RtAudioErrorType type, const std::string& errorText) {
    if (type == RTAUDIO_WARNING) {
        VOICE_SEARCH_DEBUG_LOG("RtAudio warning: " << errorText << VOICE_SEARCH_DEBUG_LOG_ENDL);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(_mutex);
        _error = errorText;
    }
    _cv_data.notify_all();
}

bool RtAudioSource::Read(AudioChunk& chunk) {
    std::unique_lock<std::mutex> lock(_mutex);
    bool ready = _cv_data.wait_for(lock, READ_TIMEOUT, [this] {
        return _closed || !_error.empty() || _pending.size() >= _chunkFrames;
    });

    if (!_error.empty()) {
        throw AudioSourceException("Device error: " + _error);
    }
    if (_closed) {
        return false;
    }
    if (!ready) {
        throw AudioSourceException("Device read timed out");
    }

    chunk.resize(_chunkFrames * sizeof(int16_t));
    auto* out = reinterpret_cast<int16_t*>(chunk.data());
    std::copy(_pending.begin(), _pending.begin() + _chunkFrames, out);
    _pending.erase(_pending.begin(), _pending.begin() + _chunkFrames);
    return true;
}

void RtAudioSource::Close() {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_closed) {
            return;
        }
        _closed = true;
    }
    _cv_data.notify_all();

    if (_audio.isStreamRunning()) {
        _audio.stopStream();
    }
    if (_audio.isStreamOpen()) {
        _audio.closeStream();
    }
    VOICE_SEARCH_DEBUG_LOG("Input stream closed" << VOICE_SEARCH_DEBUG_LOG_ENDL);
}

void RtAudioSource::ListDevices() {
    RtAudio audio;
    std::vector<unsigned int> deviceIds = audio.getDeviceIds();
    unsigned int defaultDevice = audio.getDefaultInputDevice();

    std::cout << "Available input devices:" << std::endl;
    for (unsigned int id : deviceIds) {
        RtAudio::DeviceInfo info = audio.getDeviceInfo(id);
        if (info.inputChannels < 1) {
            continue;
        }
        std::cout << "  " << id << ": " << info.name
                  << (id == defaultDevice ? " (default)" : "") << std::endl;
        std::cout << "     Input channels: " << info.inputChannels << std::endl;
        std::cout << "     Supported sample rates: ";
        for (unsigned int sr : info.sampleRates) {
            std::cout << sr << " ";
        }
        std::cout << std::endl;
    }
}

} // namespace voice_search
