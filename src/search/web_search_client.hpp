#pragma once

/**
 * Web search over Brave, Tavily or Synthetic.
 *
 * Each provider returns up to five results, formatted as a numbered
 * title/URL/snippet listing that is handed to the model as a tool result.
 */

#include "search_adapter.hpp"
#include "../transport/transport.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mllm::search {

enum class SearchProvider {
    Brave,
    Tavily,
    Synthetic
};

// Maps "brave", "tavily" or "synthetic". Anything else is Brave.
SearchProvider parse_search_provider(const std::string& name);

std::string get_provider_label(SearchProvider provider);

/**
 * One search hit, normalized across providers.
 */
struct SearchResult {
    std::optional<std::string> title;
    std::optional<std::string> url;
    std::optional<std::string> snippet;
    std::optional<std::string> published;
};

/**
 * Formats results as the tool output text. Empty input gives the
 * "No results found" marker.
 */
std::string format_results(const std::vector<SearchResult>& results);

// Message for a failed search HTTP status.
std::string http_error_message(long status);

class WebSearchClient : public ISearchAdapter {
public:
    explicit WebSearchClient(transport::ITransport& transport);

    std::string search(const std::string& query,
                       const std::string& api_key,
                       const std::string& provider_name) override;

private:
    transport::ITransport& transport_;

    std::string search_brave(const std::string& query, const std::string& api_key);
    std::string search_tavily(const std::string& query, const std::string& api_key);
    std::string search_synthetic(const std::string& query, const std::string& api_key);

    // Sends the request and checks the status. Returns nullopt for an empty body.
    std::optional<nlohmann::json> fetch(SearchProvider provider, const transport::HttpRequest& request);
};

} // namespace mllm::search
