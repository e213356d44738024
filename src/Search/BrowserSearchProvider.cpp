#include "Search/BrowserSearchProvider.hpp"
#include "voice_search/debug_log.hpp"

#include <cpr/util.h>

#include <cstdlib>

namespace voice_search {

BrowserSearchProvider::BrowserSearchProvider(const std::string& browserCommand)
    : _browserCommand(browserCommand) {
}

std::string BrowserSearchProvider::BuildUrl(const std::string& query) {
    auto encoded = cpr::util::urlEncode(query);
    return "https://google.com/#q=" + std::string(encoded.begin(), encoded.end());
}

std::optional<std::vector<SearchResult>> BrowserSearchProvider::Search(const std::string& query,
                                                                       unsigned int /*num*/) {
    // The URL is percent-encoded, so quoting it is enough for the shell.
    std::string cmd = _browserCommand + " '" + BuildUrl(query) + "' >/dev/null 2>&1";
    VOICE_SEARCH_DEBUG_LOG("Running: " << cmd << VOICE_SEARCH_DEBUG_LOG_ENDL);

    int ret = std::system(cmd.c_str());
    if (ret != 0) {
        throw SearchException("Browser command failed with status " + std::to_string(ret));
    }
    return std::nullopt;
}

} // namespace voice_search
