#include <rtc/rtc.hpp>

#include <iostream>
#include <memory>
#include <string>

#include "AudioSource/RtAudioSource.hpp"
#include "AudioSource/WavFileSource.hpp"
#include "Config/CommandLine.hpp"
#include "Config/SessionConfig.hpp"
#include "Recognition/WebSocketRecognitionStream.hpp"
#include "Search/BrowserSearchProvider.hpp"
#include "Search/CustomSearchProvider.hpp"
#include "Session/SpeechSearchSession.hpp"
#include "Speech/CommandSpeechOutput.hpp"

using namespace voice_search;

namespace {

rtc::LogLevel ParseLogLevel(const std::string& level) {
    if (level == "none") return rtc::LogLevel::None;
    if (level == "fatal") return rtc::LogLevel::Fatal;
    if (level == "error") return rtc::LogLevel::Error;
    if (level == "info") return rtc::LogLevel::Info;
    if (level == "debug") return rtc::LogLevel::Debug;
    if (level == "verbose") return rtc::LogLevel::Verbose;
    return rtc::LogLevel::Warning;
}

std::unique_ptr<IAudioSource> CreateAudioSource(const SessionConfig& config) {
    if (!config.inputFile.empty()) {
        return std::make_unique<WavFileSource>(config.inputFile, config.sampleRate, config.GetChunkFrames());
    }
    return std::make_unique<RtAudioSource>(config.sampleRate, config.GetChunkFrames(), config.deviceId);
}

std::unique_ptr<ISearchProvider> CreateSearchProvider(const SessionConfig& config) {
    if (config.useBrowser) {
        return std::make_unique<BrowserSearchProvider>(config.browserCommand);
    }
    return std::make_unique<CustomSearchProvider>(config.cseKey, config.cseId);
}

} // namespace

int main(int argc, char* argv[]) {
    SessionConfig config;
    CommandLineOptions options;

    try {
        options = ParseCommandLine(argc, argv);
        if (options.help) {
            PrintUsage(argv[0]);
            return 0;
        }
        if (options.listDevices) {
            RtAudioSource::ListDevices();
            return 0;
        }

        if (!options.configPath.empty()) {
            LoadConfigFile(options.configPath, config);
        }
        ApplyEnvironment(config);
        ApplyCommandLine(options, config);
        config.Validate();
    } catch (const ConfigException& e) {
        std::cerr << e.what() << std::endl;
        PrintUsage(argv[0]);
        return 1;
    }

    if (options.useBrowser) {
        std::cout << "Opening results in your default browser." << std::endl;
    } else if (!config.useBrowser && !config.IsSearchConfigured()) {
        std::cout << "Search not configured, opening in default browser." << std::endl;
        config.useBrowser = true;
    }

    rtc::InitLogger(ParseLogLevel(config.transportLogLevel));

    try {
        std::unique_ptr<IAudioSource> source = CreateAudioSource(config);
        std::unique_ptr<ISearchProvider> search = CreateSearchProvider(config);
        CommandSpeechOutput speech(config.ttsCommand);

        auto streamFactory = [&config](RequestEncoder& encoder) -> std::unique_ptr<IRecognitionStream> {
            auto stream = std::make_unique<WebSocketRecognitionStream>(
                config.GetRecognizerUrl(), encoder, std::chrono::seconds(config.deadlineSeconds));
            stream->Start(std::chrono::milliseconds(config.connectTimeoutMs));
            return stream;
        };

        SpeechSearchSession session(config, *source, *search, speech, streamFactory);
        std::cout << "Listening... say \"exit\" or \"quit\" to stop." << std::endl;

        SpeechSearchSession::Outcome outcome = session.Run();
        std::cout << "Session ended: " << SpeechSearchSession::OutcomeName(outcome) << std::endl;
        if (outcome == SpeechSearchSession::Outcome::DeviceFailure) {
            std::cerr << "Audio device failed: " << session.GetDeviceFailure().value_or("unknown error")
                      << std::endl;
            return 1;
        }
        return 0;
    } catch (const AudioSourceException& e) {
        std::cerr << "Audio error: " << e.what() << std::endl;
    } catch (const ServerErrorException& e) {
        std::cerr << e.what() << " (" << StatusCodeName(e.GetCode()) << ")" << std::endl;
    } catch (const RecognitionStreamException& e) {
        std::cerr << "Recognition stream error: " << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
    }
    return 1;
}
