#include "Recognition/RequestEncoder.hpp"
#include "Session/SpeechSearchSession.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <signal.h>

#include <chrono>
#include <memory>
#include <thread>

using namespace voice_search;
using namespace std::chrono_literals;
using test_utils::MakeChunk;
using test_utils::MakeResults;
using test_utils::MakeTranscript;
using test_utils::ScriptedAudioSource;
using test_utils::ScriptedRecognitionStream;

namespace {

// What a RecordingTransport saw; outlives the transport, which the session
// destroys before Run() returns.
struct TransportLog {
    int configRequests = 0;
    bool configFirst = false;
    unsigned int configSampleRate = 0;
    int audioRequests = 0;
    AudioBlock audio;
};

// Consumes the whole request sequence before answering, like a recognizer
// that only replies once the client half-closes.
class RecordingTransport : public IRecognitionStream {
public:
    RecordingTransport(RequestEncoder& encoder, std::vector<StreamingResponse> responses, TransportLog& log)
        : _encoder(encoder), _responses(std::move(responses)), _log(log) {}

    bool Read(StreamingResponse& response) override {
        if (!_drained) {
            StreamingRequest request;
            while (_encoder.Next(request)) {
                if (request.IsConfig()) {
                    ++_log.configRequests;
                    _log.configFirst = _log.audioRequests == 0;
                    _log.configSampleRate = request.streamingConfig->config.sampleRateHertz;
                } else {
                    ++_log.audioRequests;
                    _log.audio.insert(_log.audio.end(), request.audioContent.begin(),
                                      request.audioContent.end());
                }
            }
            _drained = true;
        }
        if (_next >= _responses.size()) {
            return false;
        }
        response = _responses[_next++];
        return true;
    }

    void Cancel() noexcept override {}
    void Close() override {}

private:
    RequestEncoder& _encoder;
    std::vector<StreamingResponse> _responses;
    TransportLog& _log;
    size_t _next = 0;
    bool _drained = false;
};

class SpeechSearchSessionTest : public ::testing::Test {
protected:
    SessionConfig _config;
    test_utils::RecordingSearchProvider _search;
    test_utils::RecordingSpeechOutput _speech;
};

} // namespace

TEST_F(SpeechSearchSessionTest, VoiceExitReleasesEverything) {
    _search.defaultResults = MakeResults({"Sunny all day."});
    ScriptedAudioSource source({}, ScriptedAudioSource::AfterScript::Repeat);

    SpeechSearchSession session(_config, source, _search, _speech,
        [](RequestEncoder&) -> std::unique_ptr<IRecognitionStream> {
            return std::make_unique<ScriptedRecognitionStream>(std::vector<StreamingResponse>{
                MakeTranscript("weather today"),
                MakeTranscript("weather today"),
                MakeTranscript("exit"),
                MakeTranscript("never handled"),
            });
        });
    session.SetInstallSignalHandlers(false);

    EXPECT_EQ(session.Run(), SpeechSearchSession::Outcome::VoiceExit);

    EXPECT_EQ(source.closeCount.load(), 1);
    EXPECT_EQ(_search.queries, std::vector<std::string>{"weather today"});
    EXPECT_EQ(_speech.spoken, std::vector<std::string>{"Sunny all day."});
    EXPECT_EQ(session.GetState().GetLastQuery(), "weather today");
    EXPECT_FALSE(session.GetDeviceFailure().has_value());
}

TEST_F(SpeechSearchSessionTest, ServerErrorPropagatesAfterCleanup) {
    ScriptedAudioSource source({}, ScriptedAudioSource::AfterScript::Repeat);
    int streamCloses = 0;

    class ClosingStream : public ScriptedRecognitionStream {
    public:
        ClosingStream(int& closes)
            : ScriptedRecognitionStream({test_utils::MakeErrorResponse(StatusCode::Internal, "boom")})
            , _closes(closes) {}
        void Close() override { ++_closes; }
    private:
        int& _closes;
    };

    SpeechSearchSession session(_config, source, _search, _speech,
        [&streamCloses](RequestEncoder&) -> std::unique_ptr<IRecognitionStream> {
            return std::make_unique<ClosingStream>(streamCloses);
        });
    session.SetInstallSignalHandlers(false);

    EXPECT_THROW(session.Run(), ServerErrorException);
    EXPECT_EQ(source.closeCount.load(), 1);
    EXPECT_EQ(streamCloses, 1);
    EXPECT_TRUE(_search.queries.empty());
}

TEST_F(SpeechSearchSessionTest, StreamFactoryFailureStillStopsCapture) {
    ScriptedAudioSource source({}, ScriptedAudioSource::AfterScript::Repeat);

    SpeechSearchSession session(_config, source, _search, _speech,
        [](RequestEncoder&) -> std::unique_ptr<IRecognitionStream> {
            throw RecognitionStreamException("Could not connect");
        });
    session.SetInstallSignalHandlers(false);

    EXPECT_THROW(session.Run(), RecognitionStreamException);
    EXPECT_EQ(source.closeCount.load(), 1);
}

TEST_F(SpeechSearchSessionTest, InterruptEndsSessionQuietly) {
    ScriptedAudioSource source({}, ScriptedAudioSource::AfterScript::Repeat);

    SpeechSearchSession session(_config, source, _search, _speech,
        [](RequestEncoder&) -> std::unique_ptr<IRecognitionStream> {
            return std::make_unique<ScriptedRecognitionStream>(std::vector<StreamingResponse>{}, true);
        });

    std::thread interrupter([]() {
        // Wait until the session owns SIGINT before raising it.
        for (int i = 0; i < 400; ++i) {
            struct sigaction current;
            if (sigaction(SIGINT, nullptr, &current) == 0 && current.sa_handler != SIG_DFL) {
                raise(SIGINT);
                return;
            }
            std::this_thread::sleep_for(5ms);
        }
    });

    SpeechSearchSession::Outcome outcome = session.Run();
    interrupter.join();

    EXPECT_EQ(outcome, SpeechSearchSession::Outcome::Interrupted);
    EXPECT_EQ(source.closeCount.load(), 1);

    struct sigaction current;
    ASSERT_EQ(sigaction(SIGINT, nullptr, &current), 0);
    EXPECT_EQ(current.sa_handler, SIG_DFL);
}

TEST_F(SpeechSearchSessionTest, AudioReachesTransportInCaptureOrder) {
    ScriptedAudioSource source({MakeChunk({1, 2}), MakeChunk({3, 4}), MakeChunk({5, 6})});
    TransportLog log;

    SpeechSearchSession session(_config, source, _search, _speech,
        [&log](RequestEncoder& encoder) -> std::unique_ptr<IRecognitionStream> {
            return std::make_unique<RecordingTransport>(encoder, std::vector<StreamingResponse>{}, log);
        });
    session.SetInstallSignalHandlers(false);

    EXPECT_EQ(session.Run(), SpeechSearchSession::Outcome::StreamEnded);
    EXPECT_EQ(log.configRequests, 1);
    EXPECT_TRUE(log.configFirst);
    EXPECT_EQ(log.audio, MakeChunk({1, 2, 3, 4, 5, 6}));
    EXPECT_EQ(session.GetChunksCaptured(), 3u);
}

TEST_F(SpeechSearchSessionTest, RecognizerIsToldTheSourceRate) {
    ScriptedAudioSource source({MakeChunk({1, 2})});
    source.sampleRate = 8000;
    TransportLog log;

    SpeechSearchSession session(_config, source, _search, _speech,
        [&log](RequestEncoder& encoder) -> std::unique_ptr<IRecognitionStream> {
            return std::make_unique<RecordingTransport>(encoder, std::vector<StreamingResponse>{}, log);
        });
    session.SetInstallSignalHandlers(false);

    EXPECT_EQ(session.Run(), SpeechSearchSession::Outcome::StreamEnded);
    EXPECT_EQ(log.configSampleRate, 8000u);
}

TEST(SpeechSearchSessionOutcomeTest, OutcomesHaveReadableNames) {
    EXPECT_STREQ(SpeechSearchSession::OutcomeName(SpeechSearchSession::Outcome::VoiceExit), "voice exit");
    EXPECT_STREQ(SpeechSearchSession::OutcomeName(SpeechSearchSession::Outcome::Interrupted), "interrupted");
    EXPECT_STREQ(SpeechSearchSession::OutcomeName(SpeechSearchSession::Outcome::StreamEnded), "stream ended");
    EXPECT_STREQ(SpeechSearchSession::OutcomeName(SpeechSearchSession::Outcome::DeviceFailure),
                 "device failure");
}

TEST_F(SpeechSearchSessionTest, DeviceFailureIsReported) {
    ScriptedAudioSource source({MakeChunk({1}), MakeChunk({2})}, ScriptedAudioSource::AfterScript::Fail);
    TransportLog log;

    SpeechSearchSession session(_config, source, _search, _speech,
        [&log](RequestEncoder& encoder) -> std::unique_ptr<IRecognitionStream> {
            return std::make_unique<RecordingTransport>(encoder, std::vector<StreamingResponse>{}, log);
        });
    session.SetInstallSignalHandlers(false);

    EXPECT_EQ(session.Run(), SpeechSearchSession::Outcome::DeviceFailure);
    ASSERT_TRUE(session.GetDeviceFailure().has_value());
    EXPECT_EQ(source.closeCount.load(), 1);
}
