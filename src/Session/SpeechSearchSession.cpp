#include "Session/SpeechSearchSession.hpp"
#include "AudioSource/IAudioSource.hpp"
#include "Capture/AudioDrain.hpp"
#include "Capture/CaptureBuffer.hpp"
#include "Capture/CaptureLoop.hpp"
#include "Capture/StopSignal.hpp"
#include "Recognition/RequestEncoder.hpp"
#include "Session/ResponseDispatcher.hpp"
#include "Session/ShutdownCoordinator.hpp"
#include "voice_search/debug_log.hpp"

#include <iostream>

namespace voice_search {

SpeechSearchSession::SpeechSearchSession(const SessionConfig& config, IAudioSource& source,
                                         ISearchProvider& search, ISpeechOutput& speech,
                                         StreamFactory streamFactory)
    : _config(config)
    , _source(source)
    , _search(search)
    , _speech(speech)
    , _streamFactory(std::move(streamFactory))
    , _installSignalHandlers(true)
    , _chunksCaptured(0) {
}

SpeechSearchSession::Outcome SpeechSearchSession::Run() {
    StopSignal stop;
    CaptureBuffer buffer;
    AudioDrain drain(buffer);

    StreamingConfig streamingConfig;
    streamingConfig.config.encoding = _config.encoding;
    streamingConfig.config.sampleRateHertz = _source.GetSampleRate();
    streamingConfig.config.languageCode = _config.languageCode;
    streamingConfig.interimResults = _config.interimResults;
    RequestEncoder encoder(drain, streamingConfig);

    ShutdownCoordinator coordinator(stop);
    CaptureLoop capture(_source, buffer, stop);
    std::unique_ptr<IRecognitionStream> stream;

    // Both the voice path and the interrupt path end up here.
    auto shutdown = [&]() {
        coordinator.RestoreSignalHandlers();
        coordinator.RequestStop();
        coordinator.CancelStream();
        capture.Stop();
        if (stream) {
            stream->Close();
        }
        coordinator.SetCancelTarget(nullptr);
        _source.Close();
        _chunksCaptured = capture.GetChunksCaptured();
        _deviceFailure = capture.GetFailure();
    };

    Outcome outcome = Outcome::StreamEnded;
    try {
        capture.Start();

        stream = _streamFactory(encoder);
        coordinator.SetCancelTarget(stream.get());
        if (_installSignalHandlers) {
            coordinator.InstallSignalHandlers();
        }

        ResponseDispatcher dispatcher(_state, _search, _speech, stop, _config.numResults);
        if (dispatcher.Run(*stream) == ResponseDispatcher::State::ExitRequested) {
            outcome = Outcome::VoiceExit;
        }
        VOICE_SEARCH_DEBUG_LOG("Handled " << dispatcher.GetResponsesHandled() << " responses"
                               << VOICE_SEARCH_DEBUG_LOG_ENDL);
    } catch (const StreamCancelledException&) {
        VOICE_SEARCH_DEBUG_LOG("Recognition stream cancelled" << VOICE_SEARCH_DEBUG_LOG_ENDL);
        outcome = Outcome::Interrupted;
    } catch (...) {
        shutdown();
        throw;
    }

    shutdown();

    if (outcome == Outcome::StreamEnded && _deviceFailure) {
        outcome = Outcome::DeviceFailure;
    }
    return outcome;
}

const char* SpeechSearchSession::OutcomeName(Outcome outcome) {
    switch (outcome) {
        case Outcome::VoiceExit: return "voice exit";
        case Outcome::Interrupted: return "interrupted";
        case Outcome::StreamEnded: return "stream ended";
        case Outcome::DeviceFailure: return "device failure";
    }
    return "unknown";
}

} // namespace voice_search
