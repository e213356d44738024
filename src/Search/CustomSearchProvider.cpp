#include "Search/CustomSearchProvider.hpp"
#include "voice_search/debug_log.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

#include <algorithm>

namespace voice_search {

using json = nlohmann::json;

CustomSearchProvider::CustomSearchProvider(const std::string& apiKey, const std::string& engineId,
                                           const std::string& endpoint)
    : _apiKey(apiKey)
    , _engineId(engineId)
    , _endpoint(endpoint) {
}

std::optional<std::vector<SearchResult>> CustomSearchProvider::Search(const std::string& query,
                                                                      unsigned int num) {
    // The API rejects num outside 1..10.
    unsigned int count = std::max(1u, std::min(num, MAX_RESULTS));

    auto r = cpr::Get(cpr::Url{_endpoint},
                      cpr::Parameters{{"key", _apiKey},
                                      {"cx", _engineId},
                                      {"q", query},
                                      {"num", std::to_string(count)}},
                      cpr::Timeout{TIMEOUT_MS});

    if (r.error) {
        throw SearchException("Search request failed: " + r.error.message);
    }
    if (r.status_code != 200) {
        throw SearchException("Search request returned HTTP " + std::to_string(r.status_code));
    }

    std::vector<SearchResult> results = ParseResponse(r.text);
    VOICE_SEARCH_DEBUG_LOG("Search returned " << results.size() << " results" << VOICE_SEARCH_DEBUG_LOG_ENDL);
    return results;
}

std::vector<SearchResult> CustomSearchProvider::ParseResponse(const std::string& body) {
    std::vector<SearchResult> results;
    try {
        json response = json::parse(body);
        // No "items" key means zero hits.
        if (!response.contains("items")) {
            return results;
        }
        for (const auto& item : response.at("items")) {
            SearchResult result;
            result.title = item.value("title", "");
            result.link = item.value("link", "");
            result.snippet = item.value("snippet", "");
            results.push_back(std::move(result));
        }
    } catch (const json::exception& e) {
        throw SearchException(std::string("Malformed search response: ") + e.what());
    }
    return results;
}

} // namespace voice_search
