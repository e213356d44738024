#pragma once

#include <string>

#include "Speech/ISpeechOutput.hpp"

namespace voice_search {

// Pipes text into an external synthesizer ("espeak --stdin", "say", ...)
// and waits for it to exit.
class CommandSpeechOutput : public ISpeechOutput {
public:
    explicit CommandSpeechOutput(const std::string& command = "espeak --stdin");

    void Say(const std::string& text) override;

private:
    std::string _command;
};

} // namespace voice_search
