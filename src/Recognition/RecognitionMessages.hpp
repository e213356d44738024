#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

#include "Capture/AudioChunk.hpp"

namespace voice_search {

// google.rpc.Code numbering, the subset the recognizer reports.
enum class StatusCode : int {
    Ok = 0,
    Cancelled = 1,
    Unknown = 2,
    InvalidArgument = 3,
    DeadlineExceeded = 4,
    ResourceExhausted = 8,
    Internal = 13,
    Unavailable = 14,
    Unauthenticated = 16
};

struct RecognitionConfig {
    std::string encoding = "LINEAR16";
    unsigned int sampleRateHertz = 16000;
    std::string languageCode = "en-US";
};

struct StreamingConfig {
    RecognitionConfig config;
    bool interimResults = true;
};

// Either the one-time configuration or one block of audio, never both.
struct StreamingRequest {
    std::optional<StreamingConfig> streamingConfig;
    AudioBlock audioContent;

    bool IsConfig() const { return streamingConfig.has_value(); }
};

struct Status {
    StatusCode code = StatusCode::Ok;
    std::string message;

    bool IsOk() const { return code == StatusCode::Ok; }
};

struct SpeechAlternative {
    std::string transcript;
    float confidence = 0.0f;
};

struct RecognitionResult {
    std::vector<SpeechAlternative> alternatives;
    bool isFinal = false;
    float stability = 0.0f;
};

struct StreamingResponse {
    Status error;
    std::vector<RecognitionResult> results;
};

void to_json(nlohmann::json& j, const RecognitionConfig& config);
void to_json(nlohmann::json& j, const StreamingConfig& config);

void from_json(const nlohmann::json& j, Status& status);
void from_json(const nlohmann::json& j, SpeechAlternative& alternative);
void from_json(const nlohmann::json& j, RecognitionResult& result);
void from_json(const nlohmann::json& j, StreamingResponse& response);

// Text frame carrying the configuration request.
std::string EncodeConfigFrame(const StreamingConfig& config);

// Text frame sent once the request sequence is exhausted.
std::string EncodeEndOfStreamFrame();

// Throws nlohmann::json::exception on malformed input.
StreamingResponse DecodeResponseFrame(const std::string& text);

const char* StatusCodeName(StatusCode code);

} // namespace voice_search
