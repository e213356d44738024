#include "AudioSource/WavFileSource.hpp"
#include "voice_search/debug_log.hpp"

#include <sndfile.h>

#include <cstdint>
#include <thread>

namespace voice_search {

WavFileSource::WavFileSource(const std::string& filename, unsigned int sampleRate,
                             unsigned int chunkFrames, bool realtime)
    : _filename(filename)
    , _file(nullptr)
    , _sampleRate(sampleRate)
    , _chunkFrames(chunkFrames)
    , _realtime(realtime) {
    SF_INFO sfinfo{};
    _file = sf_open(_filename.c_str(), SFM_READ, &sfinfo);
    if (!_file) {
        throw AudioSourceException("Could not open input file " + _filename + ": " + sf_strerror(nullptr));
    }

    if (sfinfo.channels != 1) {
        sf_close(_file);
        _file = nullptr;
        throw AudioSourceException("Input file must be mono: " + _filename);
    }
    if (static_cast<unsigned int>(sfinfo.samplerate) != _sampleRate) {
        sf_close(_file);
        _file = nullptr;
        throw AudioSourceException("Input file sample rate " + std::to_string(sfinfo.samplerate) +
                                   " does not match " + std::to_string(_sampleRate));
    }

    VOICE_SEARCH_DEBUG_LOG("Reading " << sfinfo.frames << " frames from " << _filename
                           << VOICE_SEARCH_DEBUG_LOG_ENDL);
    _nextChunkTime = std::chrono::steady_clock::now();
}

WavFileSource::~WavFileSource() {
    Close();
}

bool WavFileSource::Read(AudioChunk& chunk) {
    if (!_file) {
        return false;
    }

    if (_realtime) {
        std::this_thread::sleep_until(_nextChunkTime);
        _nextChunkTime += std::chrono::microseconds(1000000ull * _chunkFrames / _sampleRate);
    }

    chunk.resize(_chunkFrames * sizeof(int16_t));
    sf_count_t framesRead = sf_readf_short(_file, reinterpret_cast<short*>(chunk.data()), _chunkFrames);
    if (sf_error(_file) != SF_ERR_NO_ERROR) {
        throw AudioSourceException("Error reading " + _filename + ": " + sf_strerror(_file));
    }
    if (framesRead <= 0) {
        return false;
    }

    chunk.resize(static_cast<size_t>(framesRead) * sizeof(int16_t));
    return true;
}

void WavFileSource::Close() {
    if (_file) {
        sf_close(_file);
        _file = nullptr;
    }
}

} // namespace voice_search
