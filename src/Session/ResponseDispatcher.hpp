#pragma once

#include <regex>
#include <string>

#include "Recognition/IRecognitionStream.hpp"
#include "Recognition/RecognitionMessages.hpp"

namespace voice_search {

class SessionState;
class ISearchProvider;
class ISpeechOutput;
class StopSignal;

// Applies the voice commands to each recognition response in arrival order:
// "exit"/"quit" stops the session, "next" reads the next result, anything
// else becomes a new search when the top transcript changed.
class ResponseDispatcher {
public:
    enum class State {
        Listening,
        ExitRequested
    };

    ResponseDispatcher(SessionState& session, ISearchProvider& search, ISpeechOutput& speech,
                       StopSignal& stop, unsigned int numResults = 10);

    // Throws ServerErrorException when the response carries a non-ok status.
    State Dispatch(const StreamingResponse& response);

    // Reads until exit is requested or the stream ends. Exceptions from the
    // stream and from Dispatch() propagate.
    State Run(IRecognitionStream& stream);

    State GetState() const { return _state; }
    size_t GetResponsesHandled() const { return _responsesHandled; }

    static bool ContainsExitCommand(const StreamingResponse& response);
    static bool ContainsNextCommand(const StreamingResponse& response);

private:
    static bool AnyAlternativeMatches(const StreamingResponse& response, const std::regex& pattern);

    void SpeakCurrentResult();
    void UpdateSearch(const std::string& transcript);

    SessionState& _session;
    ISearchProvider& _search;
    ISpeechOutput& _speech;
    StopSignal& _stop;
    unsigned int _numResults;
    State _state;
    size_t _responsesHandled;
};

} // namespace voice_search
