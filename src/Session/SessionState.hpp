#pragma once

#include <string>
#include <vector>

#include "Search/ISearchProvider.hpp"

namespace voice_search {

// Results of the last search, the read position in them, and the query
// that produced them. Only touched from the thread reading responses.
class SessionState {
public:
    SessionState() : _index(0) {}

    // Replaces the whole result set and rewinds to the first entry.
    void ReplaceResults(std::vector<SearchResult> results);


    // No wraparound: the index may move past the last entry.
    void AdvanceIndex() { ++_index; }

    // nullptr when the index is outside the result set.
    const SearchResult* CurrentResult() const;

    size_t GetIndex() const { return _index; }
    const std::vector<SearchResult>& GetResults() const { return _results; }

    const std::string& GetLastQuery() const { return _lastQuery; }
    void SetLastQuery(const std::string& query) { _lastQuery = query; }

private:
    std::vector<SearchResult> _results;
    size_t _index;
    std::string _lastQuery;
};

} // namespace voice_search
