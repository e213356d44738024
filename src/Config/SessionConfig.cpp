#include "Config/SessionConfig.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>

namespace voice_search {

using json = nlohmann::json;

namespace {

void ApplyEnv(const char* name, std::string& field) {
    const char* value = std::getenv(name);
    if (value && *value) {
        field = value;
    }
}

} // namespace

std::string SessionConfig::GetRecognizerUrl() const {
    if (apiKey.empty()) {
        return endpoint;
    }
    char separator = endpoint.find('?') == std::string::npos ? '?' : '&';
    return endpoint + separator + "key=" + apiKey;
}

void SessionConfig::Validate() const {
    if (sampleRate < 8000 || sampleRate > 48000) {
        throw ConfigException("sampleRate must be between 8000 and 48000");
    }
    if (GetChunkFrames() == 0) {
        throw ConfigException("chunkFrames must be positive");
    }
    if (endpoint.rfind("ws://", 0) != 0 && endpoint.rfind("wss://", 0) != 0) {
        throw ConfigException("endpoint must be a ws:// or wss:// URL: " + endpoint);
    }
    if (deadlineSeconds == 0) {
        throw ConfigException("deadlineSeconds must be positive");
    }
    if (numResults == 0) {
        throw ConfigException("numResults must be positive");
    }
}

void LoadConfigFile(const std::string& path, SessionConfig& config) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigException("Could not open config file: " + path);
    }

    try {
        json j = json::parse(file);

        config.sampleRate = j.value("sampleRate", config.sampleRate);
        config.chunkFrames = j.value("chunkFrames", config.chunkFrames);
        config.deviceId = j.value("deviceId", config.deviceId);
        config.inputFile = j.value("inputFile", config.inputFile);

        config.endpoint = j.value("endpoint", config.endpoint);
        config.apiKey = j.value("apiKey", config.apiKey);
        config.encoding = j.value("encoding", config.encoding);
        config.languageCode = j.value("languageCode", config.languageCode);
        config.interimResults = j.value("interimResults", config.interimResults);
        config.deadlineSeconds = j.value("deadlineSeconds", config.deadlineSeconds);
        config.connectTimeoutMs = j.value("connectTimeoutMs", config.connectTimeoutMs);
        config.transportLogLevel = j.value("transportLogLevel", config.transportLogLevel);

        config.cseKey = j.value("cseKey", config.cseKey);
        config.cseId = j.value("cseId", config.cseId);
        config.numResults = j.value("numResults", config.numResults);
        config.useBrowser = j.value("useBrowser", config.useBrowser);
        config.browserCommand = j.value("browserCommand", config.browserCommand);

        config.ttsCommand = j.value("ttsCommand", config.ttsCommand);
    } catch (const json::exception& e) {
        throw ConfigException("Invalid config file " + path + ": " + e.what());
    }
}

void ApplyEnvironment(SessionConfig& config) {
    ApplyEnv("VOICE_SEARCH_ENDPOINT", config.endpoint);
    ApplyEnv("VOICE_SEARCH_API_KEY", config.apiKey);
    ApplyEnv("VOICE_SEARCH_CSE_KEY", config.cseKey);
    ApplyEnv("VOICE_SEARCH_CSE_ID", config.cseId);
}

} // namespace voice_search
