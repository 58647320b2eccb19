#include "web_search_client.hpp"
#include "../config.hpp"
#include "../verbose.hpp"
#include <sstream>

namespace mllm::search {

using json = nlohmann::json;
using transport::HttpRequest;

SearchProvider parse_search_provider(const std::string& name) {
    if (name == "tavily") return SearchProvider::Tavily;
    if (name == "synthetic") return SearchProvider::Synthetic;
    return SearchProvider::Brave;
}

std::string get_provider_label(SearchProvider provider) {
    switch (provider) {
        case SearchProvider::Brave:
            return "Brave Search";
        case SearchProvider::Tavily:
            return "Tavily";
        case SearchProvider::Synthetic:
            return "Synthetic Search";
    }
    return "Brave Search";
}

std::string http_error_message(long status) {
    switch (status) {
        case 401:
            return "Invalid API key (HTTP 401)";
        case 403:
            return "Access forbidden (HTTP 403)";
        case 429:
            return "Rate limit exceeded, try again later (HTTP 429)";
        default:
            return "HTTP error " + std::to_string(status);
    }
}

static bool is_blank(const std::optional<std::string>& value) {
    return !value || value->find_first_not_of(" \t\r\n") == std::string::npos;
}

static std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

std::string format_results(const std::vector<SearchResult>& results) {
    if (results.empty()) {
        return NO_RESULTS_MARKER;
    }

    std::ostringstream out;
    for (size_t i = 0; i < results.size(); ++i) {
        const auto& result = results[i];
        if (i > 0) {
            out << "\n\n";
        }
        out << (i + 1) << ". " << result.title.value_or("No title") << "\n";
        out << "   URL: " << result.url.value_or("No URL");
        if (!is_blank(result.snippet)) {
            out << "\n   " << *result.snippet;
        }
        if (!is_blank(result.published)) {
            out << "\n   Published: " << *result.published;
        }
    }
    return trim(out.str());
}

static std::optional<std::string> string_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

// Reads results[] entries, mapping provider field names onto SearchResult.
static std::vector<SearchResult> read_results(const json& results,
                                              const char* snippet_key,
                                              const char* published_key) {
    std::vector<SearchResult> out;
    if (!results.is_array()) {
        return out;
    }
    for (const auto& entry : results) {
        if (!entry.is_object()) {
            continue;
        }
        SearchResult result;
        result.title = string_field(entry, "title");
        result.url = string_field(entry, "url");
        result.snippet = string_field(entry, snippet_key);
        result.published = string_field(entry, published_key);
        out.push_back(std::move(result));
    }
    return out;
}

WebSearchClient::WebSearchClient(transport::ITransport& transport) : transport_(transport) {}

std::string WebSearchClient::search(const std::string& query,
                                    const std::string& api_key,
                                    const std::string& provider_name) {
    SearchProvider provider = parse_search_provider(provider_name);
    verbose_log("SEARCH", get_provider_label(provider) + ": " + truncate(query, 120));

    switch (provider) {
        case SearchProvider::Tavily:
            return search_tavily(query, api_key);
        case SearchProvider::Synthetic:
            return search_synthetic(query, api_key);
        case SearchProvider::Brave:
            break;
    }
    return search_brave(query, api_key);
}

std::optional<json> WebSearchClient::fetch(SearchProvider provider, const HttpRequest& request) {
    transport::HttpResponse response = transport_.send(request);

    if (!response.ok()) {
        verbose_err("SEARCH", "HTTP " + std::to_string(response.status));
        throw SearchError(get_provider_label(provider) + ": " + http_error_message(response.status));
    }
    if (response.body.empty()) {
        return std::nullopt;
    }

    try {
        return json::parse(response.body);
    } catch (const json::exception& e) {
        throw SearchError("Failed to parse " + get_provider_label(provider) + " results: " + e.what());
    }
}

std::string WebSearchClient::search_brave(const std::string& query, const std::string& api_key) {
    HttpRequest request;
    request.method = "GET";
    request.url = std::string(BRAVE_SEARCH_URL) + "?q=" + transport_.url_encode(query) +
                  "&count=" + std::to_string(SEARCH_RESULT_COUNT);
    request.headers = {
        {"X-Subscription-Token", api_key},
        {"Accept", "application/json"}
    };
    request.connect_timeout_seconds = SEARCH_CONNECT_TIMEOUT_SECONDS;
    request.read_timeout_seconds = SEARCH_READ_TIMEOUT_SECONDS;

    auto body = fetch(SearchProvider::Brave, request);
    if (!body || !body->is_object()) {
        return NO_RESULTS_MARKER;
    }

    auto web = body->find("web");
    if (web == body->end() || !web->is_object() || !web->contains("results")) {
        return NO_RESULTS_MARKER;
    }
    return format_results(read_results((*web)["results"], "description", "page_age"));
}

std::string WebSearchClient::search_tavily(const std::string& query, const std::string& api_key) {
    HttpRequest request;
    request.method = "POST";
    request.url = TAVILY_SEARCH_URL;
    request.headers = {{"Content-Type", "application/json"}};
    request.body = json{
        {"api_key", api_key},
        {"query", query},
        {"search_depth", "basic"},
        {"max_results", SEARCH_RESULT_COUNT}
    }.dump();
    request.connect_timeout_seconds = SEARCH_CONNECT_TIMEOUT_SECONDS;
    request.read_timeout_seconds = SEARCH_READ_TIMEOUT_SECONDS;

    auto body = fetch(SearchProvider::Tavily, request);
    if (!body || !body->is_object() || !body->contains("results")) {
        return NO_RESULTS_MARKER;
    }
    return format_results(read_results((*body)["results"], "content", "published_date"));
}

std::string WebSearchClient::search_synthetic(const std::string& query, const std::string& api_key) {
    HttpRequest request;
    request.method = "POST";
    request.url = SYNTHETIC_SEARCH_URL;
    request.headers = {
        {"Authorization", "Bearer " + api_key},
        {"Content-Type", "application/json"}
    };
    request.body = json{{"query", query}}.dump();
    request.connect_timeout_seconds = SEARCH_CONNECT_TIMEOUT_SECONDS;
    request.read_timeout_seconds = SEARCH_READ_TIMEOUT_SECONDS;

    auto body = fetch(SearchProvider::Synthetic, request);
    if (!body || !body->is_object() || !body->contains("results")) {
        return NO_RESULTS_MARKER;
    }
    return format_results(read_results((*body)["results"], "text", "published"));
}

} // namespace mllm::search
