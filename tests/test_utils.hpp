#pragma once

#include "AudioSource/IAudioSource.hpp"
#include "Recognition/IRecognitionStream.hpp"
#include "Search/ISearchProvider.hpp"
#include "Speech/ISpeechOutput.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <initializer_list>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace test_utils {

using namespace voice_search;

inline AudioChunk MakeChunk(std::initializer_list<int> bytes) {
    AudioChunk chunk;
    for (int b : bytes) {
        chunk.push_back(static_cast<std::byte>(b));
    }
    return chunk;
}

// One result per inner list, one alternative per string.
inline StreamingResponse MakeResponse(const std::vector<std::vector<std::string>>& results) {
    StreamingResponse response;
    for (const auto& alternatives : results) {
        RecognitionResult result;
        for (const auto& transcript : alternatives) {
            result.alternatives.push_back({transcript, 0.9f});
        }
        response.results.push_back(result);
    }
    return response;
}

inline StreamingResponse MakeTranscript(const std::string& transcript) {
    return MakeResponse({{transcript}});
}

inline StreamingResponse MakeErrorResponse(StatusCode code, const std::string& message) {
    StreamingResponse response;
    response.error.code = code;
    response.error.message = message;
    return response;
}

inline std::vector<SearchResult> MakeResults(const std::vector<std::string>& snippets) {
    std::vector<SearchResult> results;
    for (size_t i = 0; i < snippets.size(); ++i) {
        results.push_back({"Result " + std::to_string(i), "https://example.com/" + std::to_string(i), snippets[i]});
    }
    return results;
}

// Hands out the scripted chunks, then either ends, fails, or keeps
// producing silence at roughly real-time pace like a live microphone.
class ScriptedAudioSource : public IAudioSource {
public:
    enum class AfterScript { End, Fail, Repeat };

    explicit ScriptedAudioSource(std::vector<AudioChunk> chunks, AfterScript after = AfterScript::End)
        : _chunks(std::move(chunks)), _after(after) {}

    bool Read(AudioChunk& chunk) override {
        if (_next < _chunks.size()) {
            chunk = _chunks[_next++];
            ++reads;
            return true;
        }
        switch (_after) {
            case AfterScript::End:
                return false;
            case AfterScript::Fail:
                throw AudioSourceException("Input overflow");
            case AfterScript::Repeat:
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
                chunk = AudioChunk(32, std::byte{0});
                ++reads;
                return true;
        }
        return false;
    }

    void Close() override { ++closeCount; }

    unsigned int GetSampleRate() const override { return sampleRate; }

    unsigned int sampleRate = 16000;
    std::atomic<size_t> reads{0};
    std::atomic<int> closeCount{0};

private:
    std::vector<AudioChunk> _chunks;
    size_t _next = 0;
    AfterScript _after;
};

// Replays scripted responses. When the script runs out it either ends the
// stream or waits for Cancel() like an idle recognizer.
class ScriptedRecognitionStream : public IRecognitionStream {
public:
    explicit ScriptedRecognitionStream(std::vector<StreamingResponse> responses, bool waitForCancel = false)
        : _responses(responses.begin(), responses.end()), _waitForCancel(waitForCancel) {}

    bool Read(StreamingResponse& response) override {
        while (true) {
            if (cancelled.load()) {
                throw StreamCancelledException();
            }
            {
                std::lock_guard<std::mutex> lock(_mutex);
                if (!_responses.empty()) {
                    response = _responses.front();
                    _responses.pop_front();
                    ++reads;
                    return true;
                }
            }
            if (!_waitForCancel) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    void Cancel() noexcept override {
        cancelled.store(true);
        ++cancelCount;
    }

    void Close() override { ++closeCount; }

    size_t Remaining() {
        std::lock_guard<std::mutex> lock(_mutex);
        return _responses.size();
    }

    std::atomic<bool> cancelled{false};
    std::atomic<int> cancelCount{0};
    std::atomic<int> closeCount{0};
    std::atomic<size_t> reads{0};

private:
    std::mutex _mutex;
    std::deque<StreamingResponse> _responses;
    bool _waitForCancel;
};

class RecordingSearchProvider : public ISearchProvider {
public:
    std::optional<std::vector<SearchResult>> Search(const std::string& query, unsigned int num) override {
        queries.push_back(query);
        lastNum = num;
        if (fail) {
            throw SearchException("Search request returned HTTP 500");
        }
        if (browserMode) {
            return std::nullopt;
        }
        auto it = resultsByQuery.find(query);
        if (it != resultsByQuery.end()) {
            return it->second;
        }
        return defaultResults;
    }

    std::vector<std::string> queries;
    std::map<std::string, std::vector<SearchResult>> resultsByQuery;
    std::vector<SearchResult> defaultResults;
    unsigned int lastNum = 0;
    bool browserMode = false;
    bool fail = false;
};

class RecordingSpeechOutput : public ISpeechOutput {
public:
    void Say(const std::string& text) override { spoken.push_back(text); }

    std::vector<std::string> spoken;
};

} // namespace test_utils
