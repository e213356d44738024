#include "Recognition/RecognitionMessages.hpp"

namespace voice_search {

using json = nlohmann::json;

void to_json(json& j, const RecognitionConfig& config) {
    j = json{
        {"encoding", config.encoding},
        {"sampleRateHertz", config.sampleRateHertz},
        {"languageCode", config.languageCode}
    };
}

void to_json(json& j, const StreamingConfig& config) {
    j = json{
        {"config", config.config},
        {"interimResults", config.interimResults}
    };
}

void from_json(const json& j, Status& status) {
    status.code = static_cast<StatusCode>(j.value("code", 0));
    status.message = j.value("message", "");
}

void from_json(const json& j, SpeechAlternative& alternative) {
    alternative.transcript = j.value("transcript", "");
    alternative.confidence = j.value("confidence", 0.0f);
}

void from_json(const json& j, RecognitionResult& result) {
    if (j.contains("alternatives")) {
        j.at("alternatives").get_to(result.alternatives);
    }
    result.isFinal = j.value("isFinal", false);
    result.stability = j.value("stability", 0.0f);
}

void from_json(const json& j, StreamingResponse& response) {
    // A missing error object means the server reported no error.
    if (j.contains("error")) {
        j.at("error").get_to(response.error);
    }
    if (j.contains("results")) {
        j.at("results").get_to(response.results);
    }
}

std::string EncodeConfigFrame(const StreamingConfig& config) {
    json message = {{"streamingConfig", config}};
    return message.dump();
}

std::string EncodeEndOfStreamFrame() {
    json message = {{"endOfStream", true}};
    return message.dump();
}

StreamingResponse DecodeResponseFrame(const std::string& text) {
    return json::parse(text).get<StreamingResponse>();
}

const char* StatusCodeName(StatusCode code) {
    switch (code) {
        case StatusCode::Ok: return "OK";
        case StatusCode::Cancelled: return "CANCELLED";
        case StatusCode::Unknown: return "UNKNOWN";
        case StatusCode::InvalidArgument: return "INVALID_ARGUMENT";
        case StatusCode::DeadlineExceeded: return "DEADLINE_EXCEEDED";
        case StatusCode::ResourceExhausted: return "RESOURCE_EXHAUSTED";
        case StatusCode::Internal: return "INTERNAL";
        case StatusCode::Unavailable: return "UNAVAILABLE";
        case StatusCode::Unauthenticated: return "UNAUTHENTICATED";
    }
    return "UNRECOGNIZED";
}

} // namespace voice_search
