#include "Config/CommandLine.hpp"
#include "Config/SessionConfig.hpp"

#include <iostream>

namespace voice_search {

CommandLineOptions ParseCommandLine(int argc, const char* const argv[]) {
    CommandLineOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw ConfigException("Missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "--usebrowser") {
            options.useBrowser = true;
        } else if (arg == "--config") {
            options.configPath = value();
        } else if (arg == "--input") {
            options.inputFile = value();
        } else if (arg == "--device") {
            options.deviceId = value();
        } else if (arg == "--list-devices") {
            options.listDevices = true;
        } else if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else {
            throw ConfigException("Unknown argument: " + arg);
        }
    }
    return options;
}

void ApplyCommandLine(const CommandLineOptions& options, SessionConfig& config) {
    if (options.useBrowser) {
        config.useBrowser = true;
    }
    if (!options.inputFile.empty()) {
        config.inputFile = options.inputFile;
    }
    if (!options.deviceId.empty()) {
        config.deviceId = options.deviceId;
    }
}

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]" << std::endl;
    std::cout << "Speak a query to search for it; say \"next\" for the next result, "
                 "\"exit\" or \"quit\" to stop." << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --usebrowser       Open results in the default browser" << std::endl;
    std::cout << "  --config <path>    JSON configuration file" << std::endl;
    std::cout << "  --input <file>     Stream a mono 16-bit WAV file instead of the microphone" << std::endl;
    std::cout << "  --device <id>      Input device id (see --list-devices)" << std::endl;
    std::cout << "  --list-devices     List input devices and exit" << std::endl;
    std::cout << "  --help             Show this help" << std::endl;
}

} // namespace voice_search
