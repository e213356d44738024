#pragma once

#include <string>

#include "Search/ISearchProvider.hpp"

namespace voice_search {

// Custom Search JSON API client.
class CustomSearchProvider : public ISearchProvider {
public:
    CustomSearchProvider(const std::string& apiKey, const std::string& engineId,
                         const std::string& endpoint = DEFAULT_ENDPOINT);

    std::optional<std::vector<SearchResult>> Search(const std::string& query,
                                                    unsigned int num) override;

    // Parses the "items" array of a Custom Search response body.
    static std::vector<SearchResult> ParseResponse(const std::string& body);

    static constexpr const char* DEFAULT_ENDPOINT = "https://www.googleapis.com/customsearch/v1";
    static constexpr unsigned int MAX_RESULTS = 10;
    static constexpr int TIMEOUT_MS = 10000;

private:
    std::string _apiKey;
    std::string _engineId;
    std::string _endpoint;
};

} // namespace voice_search
