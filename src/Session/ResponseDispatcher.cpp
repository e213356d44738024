#include "Session/ResponseDispatcher.hpp"
#include "Capture/StopSignal.hpp"
#include "Search/ISearchProvider.hpp"
#include "Session/SessionState.hpp"
#include "Speech/ISpeechOutput.hpp"
#include "voice_search/debug_log.hpp"

#include <iostream>
#include <optional>
#include <vector>

namespace voice_search {

namespace {

const std::regex EXIT_PATTERN(R"(\b(exit|quit)\b)", std::regex::icase);
const std::regex NEXT_PATTERN(R"(\bnext\b)", std::regex::icase);

} // namespace

ResponseDispatcher::ResponseDispatcher(SessionState& session, ISearchProvider& search,
                                       ISpeechOutput& speech, StopSignal& stop,
                                       unsigned int numResults)
    : _session(session)
    , _search(search)
    , _speech(speech)
    , _stop(stop)
    , _numResults(numResults)
    , _state(State::Listening)
    , _responsesHandled(0) {
}

bool ResponseDispatcher::AnyAlternativeMatches(const StreamingResponse& response,
                                               const std::regex& pattern) {
    for (const auto& result : response.results) {
        for (const auto& alternative : result.alternatives) {
            if (std::regex_search(alternative.transcript, pattern)) {
                return true;
            }
        }
    }
    return false;
}

bool ResponseDispatcher::ContainsExitCommand(const StreamingResponse& response) {
    return AnyAlternativeMatches(response, EXIT_PATTERN);
}

bool ResponseDispatcher::ContainsNextCommand(const StreamingResponse& response) {
    return AnyAlternativeMatches(response, NEXT_PATTERN);
}

ResponseDispatcher::State ResponseDispatcher::Dispatch(const StreamingResponse& response) {
    if (_state == State::ExitRequested) {
        return _state;
    }
    ++_responsesHandled;

    if (!response.error.IsOk()) {
        throw ServerErrorException(response.error.code, response.error.message);
    }

    if (response.results.empty()) {
        return _state;
    }

    if (ContainsExitCommand(response)) {
        std::cout << "Exiting.." << std::endl;
        _stop.Set();
        _state = State::ExitRequested;
        return _state;
    }

    if (ContainsNextCommand(response)) {
        std::cout << ">>> Next result" << std::endl;
        _session.AdvanceIndex();
        SpeakCurrentResult();
        return _state;
    }

    const auto& alternatives = response.results.front().alternatives;
    std::string transcript = alternatives.empty() ? std::string() : alternatives.front().transcript;
    if (transcript != _session.GetLastQuery()) {
        UpdateSearch(transcript);
    }
    return _state;
}

void ResponseDispatcher::UpdateSearch(const std::string& transcript) {
    _session.SetLastQuery(transcript);
    std::cout << "Searching for: " << transcript << std::endl;

    std::optional<std::vector<SearchResult>> results;
    try {
        results = _search.Search(transcript, _numResults);
    } catch (const SearchException& e) {
        std::cerr << e.what() << std::endl;
        // Stale results must not be read back for the new query.
        results.emplace();
    }

    if (!results) {
        // Opened in the browser; the result list belongs to the last search.
        return;
    }

    _session.ReplaceResults(std::move(*results));
    if (!transcript.empty()) {
        SpeakCurrentResult();
    }
}

void ResponseDispatcher::SpeakCurrentResult() {
    const SearchResult* result = _session.CurrentResult();
    if (!result) {
        VOICE_SEARCH_DEBUG_LOG("No result at index " << _session.GetIndex() << VOICE_SEARCH_DEBUG_LOG_ENDL);
        return;
    }
    if (result->snippet.empty()) {
        return;
    }

    std::cout << "Saying: " << result->snippet << std::endl;
    _speech.Say(result->snippet);
}

ResponseDispatcher::State ResponseDispatcher::Run(IRecognitionStream& stream) {
    StreamingResponse response;
    while (_state == State::Listening && stream.Read(response)) {
        Dispatch(response);
    }
    return _state;
}

} // namespace voice_search
