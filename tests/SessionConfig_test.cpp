#include "Config/CommandLine.hpp"
#include "Config/SessionConfig.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

using namespace voice_search;

namespace {

std::string WriteTempFile(const std::string& name, const std::string& contents) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream file(path);
    file << contents;
    return path;
}

} // namespace

TEST(SessionConfigTest, DefaultsMatchStreamingLimits) {
    SessionConfig config;
    EXPECT_EQ(config.sampleRate, 16000u);
    EXPECT_EQ(config.GetChunkFrames(), 1600u);
    EXPECT_EQ(config.deadlineSeconds, 186u);
    EXPECT_EQ(config.languageCode, "en-US");
    EXPECT_EQ(config.encoding, "LINEAR16");
    EXPECT_TRUE(config.interimResults);
    EXPECT_EQ(config.numResults, 10u);
    EXPECT_FALSE(config.IsSearchConfigured());
    EXPECT_NO_THROW(config.Validate());
}

TEST(SessionConfigTest, FileOverridesOnlyPresentKeys) {
    std::string path = WriteTempFile("voice_search_config.json", R"({
        "languageCode": "de-DE",
        "cseKey": "abc",
        "cseId": "123:xyz",
        "chunkFrames": 800
    })");

    SessionConfig config;
    LoadConfigFile(path, config);
    std::remove(path.c_str());

    EXPECT_EQ(config.languageCode, "de-DE");
    EXPECT_EQ(config.GetChunkFrames(), 800u);
    EXPECT_TRUE(config.IsSearchConfigured());
    EXPECT_EQ(config.sampleRate, 16000u);
}

TEST(SessionConfigTest, InvalidFileThrows) {
    std::string path = WriteTempFile("voice_search_bad.json", "{ not json");
    SessionConfig config;
    EXPECT_THROW(LoadConfigFile(path, config), ConfigException);
    std::remove(path.c_str());

    EXPECT_THROW(LoadConfigFile("/nonexistent/voice_search.json", config), ConfigException);
}

TEST(SessionConfigTest, EnvironmentOverridesFile) {
    setenv("VOICE_SEARCH_ENDPOINT", "wss://speech.test/stream", 1);
    setenv("VOICE_SEARCH_API_KEY", "k1", 1);

    SessionConfig config;
    ApplyEnvironment(config);

    unsetenv("VOICE_SEARCH_ENDPOINT");
    unsetenv("VOICE_SEARCH_API_KEY");

    EXPECT_EQ(config.endpoint, "wss://speech.test/stream");
    EXPECT_EQ(config.GetRecognizerUrl(), "wss://speech.test/stream?key=k1");
}

TEST(SessionConfigTest, ValidateRejectsUnusableValues) {
    SessionConfig config;
    config.endpoint = "http://speech.test";
    EXPECT_THROW(config.Validate(), ConfigException);

    config = SessionConfig();
    config.sampleRate = 1000;
    EXPECT_THROW(config.Validate(), ConfigException);
}

TEST(CommandLineTest, ParsesFlags) {
    const char* argv[] = {"voice_search", "--usebrowser", "--input", "query.wav", "--device", "3"};
    CommandLineOptions options = ParseCommandLine(6, argv);

    EXPECT_TRUE(options.useBrowser);
    EXPECT_EQ(options.inputFile, "query.wav");
    EXPECT_EQ(options.deviceId, "3");
    EXPECT_FALSE(options.listDevices);

    SessionConfig config;
    ApplyCommandLine(options, config);
    EXPECT_TRUE(config.useBrowser);
    EXPECT_EQ(config.inputFile, "query.wav");
    EXPECT_EQ(config.deviceId, "3");
}

TEST(CommandLineTest, RejectsUnknownAndIncompleteFlags) {
    const char* unknown[] = {"voice_search", "--loud"};
    EXPECT_THROW(ParseCommandLine(2, unknown), ConfigException);

    const char* missing[] = {"voice_search", "--config"};
    EXPECT_THROW(ParseCommandLine(2, missing), ConfigException);
}
