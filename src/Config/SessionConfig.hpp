#pragma once

#include <stdexcept>
#include <string>

namespace voice_search {

class ConfigException : public std::runtime_error {
public:
    explicit ConfigException(const std::string& message)
        : std::runtime_error(message) {}
};

struct SessionConfig {
    // Audio
    unsigned int sampleRate = 16000;
    unsigned int chunkFrames = 0;          // 0 = sampleRate / 10 (100 ms)
    std::string deviceId;                  // empty = default input device
    std::string inputFile;                 // WAV file instead of the microphone

    // Recognizer
    std::string endpoint = "ws://localhost:8080/v1/speech:streamingRecognize";
    std::string apiKey;
    std::string encoding = "LINEAR16";
    std::string languageCode = "en-US";
    bool interimResults = true;
    // 60 s of audio per utterance plus time to finish transcribing.
    unsigned int deadlineSeconds = 60 * 3 + 6;
    unsigned int connectTimeoutMs = 10000;
    std::string transportLogLevel = "warning";

    // Search
    std::string cseKey;
    std::string cseId;
    unsigned int numResults = 10;
    bool useBrowser = false;
    std::string browserCommand = "xdg-open";

    // Speech output
    std::string ttsCommand = "espeak --stdin";

    unsigned int GetChunkFrames() const { return chunkFrames ? chunkFrames : sampleRate / 10; }
    bool IsSearchConfigured() const { return !cseKey.empty() && !cseId.empty(); }

    // Endpoint with the API key appended as a query parameter.
    std::string GetRecognizerUrl() const;

    // Throws ConfigException on values the pipeline cannot run with.
    void Validate() const;
};

// Overrides the fields present in a JSON file. Throws ConfigException.
void LoadConfigFile(const std::string& path, SessionConfig& config);

// Applies VOICE_SEARCH_ENDPOINT, VOICE_SEARCH_API_KEY, VOICE_SEARCH_CSE_KEY
// and VOICE_SEARCH_CSE_ID when set.
void ApplyEnvironment(SessionConfig& config);

} // namespace voice_search
