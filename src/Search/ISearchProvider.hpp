#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace voice_search {

struct SearchResult {
    std::string title;
    std::string link;
    std::string snippet;
};

class SearchException : public std::runtime_error {
public:
    explicit SearchException(const std::string& message)
        : std::runtime_error(message) {}
};

class ISearchProvider {
public:
    virtual ~ISearchProvider() = default;

    // Returns std::nullopt when the provider presents results itself
    // (e.g. in a browser) and there is nothing to read back.
    // Throws SearchException on failure.
    virtual std::optional<std::vector<SearchResult>> Search(const std::string& query,
                                                            unsigned int num) = 0;
};

} // namespace voice_search
