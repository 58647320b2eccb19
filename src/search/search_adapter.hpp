#pragma once

/**
 * Interface for the web search capability used by the tool loop.
 */

#include <stdexcept>
#include <string>

namespace mllm::search {

/**
 * Thrown when a search provider answers with an error or an unreadable body.
 */
class SearchError : public std::runtime_error {
public:
    explicit SearchError(const std::string& message)
        : std::runtime_error(message) {}
};

class ISearchAdapter {
public:
    virtual ~ISearchAdapter() = default;

    /**
     * Runs a query against the named provider and returns the results as
     * free-form text, or a "No results found" marker.
     *
     * Callers truncate the query to 400 characters first. Throws SearchError
     * or transport::TransportError on failure.
     */
    virtual std::string search(const std::string& query,
                               const std::string& api_key,
                               const std::string& provider_name) = 0;
};

} // namespace mllm::search
