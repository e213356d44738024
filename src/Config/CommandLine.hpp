#pragma once

#include <string>

namespace voice_search {

struct SessionConfig;

struct CommandLineOptions {
    std::string configPath;
    std::string inputFile;
    std::string deviceId;
    bool useBrowser = false;
    bool listDevices = false;
    bool help = false;
};

// Throws ConfigException on unknown flags or missing values.
CommandLineOptions ParseCommandLine(int argc, const char* const argv[]);

// Flags win over the config file and the environment.
void ApplyCommandLine(const CommandLineOptions& options, SessionConfig& config);

void PrintUsage(const char* program);

} // namespace voice_search
