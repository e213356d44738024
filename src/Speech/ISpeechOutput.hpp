#pragma once

#include <string>

namespace voice_search {

class ISpeechOutput {
public:
    virtual ~ISpeechOutput() = default;

    // Blocks until the text has been spoken.
    virtual void Say(const std::string& text) = 0;
};

} // namespace voice_search
