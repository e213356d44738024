#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "Config/SessionConfig.hpp"
#include "Recognition/IRecognitionStream.hpp"
#include "Session/SessionState.hpp"

namespace voice_search {

class IAudioSource;
class ISearchProvider;
class ISpeechOutput;
class RequestEncoder;

// One listen-and-search session: microphone capture on a background thread,
// audio streamed to the recognizer, responses turned into searches and
// spoken results. Every exit path stops capture, cancels and closes the
// stream and closes the audio source before Run() returns or throws.
class SpeechSearchSession {
public:
    enum class Outcome {
        VoiceExit,
        Interrupted,
        StreamEnded,
        DeviceFailure
    };

    // Creates a started stream that pulls its requests from the encoder.
    using StreamFactory = std::function<std::unique_ptr<IRecognitionStream>(RequestEncoder&)>;

    SpeechSearchSession(const SessionConfig& config, IAudioSource& source,
                        ISearchProvider& search, ISpeechOutput& speech,
                        StreamFactory streamFactory);

    // Throws ServerErrorException, RecognitionStreamException and whatever
    // the stream factory throws.
    Outcome Run();

    // Handlers are off in tests that drive the session from one process.
    void SetInstallSignalHandlers(bool install) { _installSignalHandlers = install; }

    const SessionState& GetState() const { return _state; }
    const std::optional<std::string>& GetDeviceFailure() const { return _deviceFailure; }
    size_t GetChunksCaptured() const { return _chunksCaptured; }

    static const char* OutcomeName(Outcome outcome);

private:
    SessionConfig _config;
    IAudioSource& _source;
    ISearchProvider& _search;
    ISpeechOutput& _speech;
    StreamFactory _streamFactory;
    bool _installSignalHandlers;

    SessionState _state;
    std::optional<std::string> _deviceFailure;
    size_t _chunksCaptured;
};

} // namespace voice_search
