#include "Session/SessionState.hpp"

namespace voice_search {

void SessionState::ReplaceResults(std::vector<SearchResult> results) {
    _results = std::move(results);
    _index = 0;
}

const SearchResult* SessionState::CurrentResult() const {
    if (_index >= _results.size()) {
        return nullptr;
    }
    return &_results[_index];
}

} // namespace voice_search
