#pragma once

#include <string>

#include "Search/ISearchProvider.hpp"

namespace voice_search {

// Opens the query in the user's browser instead of fetching results.
class BrowserSearchProvider : public ISearchProvider {
public:
    explicit BrowserSearchProvider(const std::string& browserCommand = "xdg-open");

    std::optional<std::vector<SearchResult>> Search(const std::string& query,
                                                    unsigned int num) override;

    static std::string BuildUrl(const std::string& query);

private:
    std::string _browserCommand;
};

} // namespace voice_search
