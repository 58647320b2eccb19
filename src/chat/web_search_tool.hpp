#pragma once

/**
 * Definition of the web_search function tool offered to the model, and
 * extraction of its query argument.
 *
 * Chat Completions uses the nested tool format:
 *   {"type": "function", "function": {"name": "...", "parameters": {...}}}
 */

#include "../config.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace mllm::chat {

inline nlohmann::json web_search_tool_definition() {
    return {
        {"type", "function"},
        {"function", {
            {"name", WEB_SEARCH_TOOL_NAME},
            {"description", "Search the web for current information. Use this when the user asks "
                            "about recent events, facts you are unsure of, or anything that needs "
                            "up-to-date information."},
            {"parameters", {
                {"type", "object"},
                {"properties", {
                    {"query", {
                        {"type", "string"},
                        {"description", "The search query (max 400 characters)"}
                    }}
                }},
                {"required", nlohmann::json::array({"query"})}
            }}
        }}
    };
}

inline nlohmann::json web_search_tools() {
    return nlohmann::json::array({web_search_tool_definition()});
}

/**
 * Returns the search query from a web_search argument string.
 *
 * Uses the "query" member when the arguments are a JSON object holding a
 * non-blank string there, and the raw argument string otherwise.
 */
inline std::string extract_search_query(const std::string& arguments) {
    try {
        auto args = nlohmann::json::parse(arguments);
        if (args.is_object()) {
            auto query = args.find("query");
            if (query != args.end() && query->is_string()) {
                std::string value = query->get<std::string>();
                if (value.find_first_not_of(" \t\r\n") != std::string::npos) {
                    return value;
                }
            }
        }
    } catch (const nlohmann::json::exception&) {
        // Not JSON; the model sent the query as plain text.
    }
    return arguments;
}

/**
 * Cuts a query to at most limit characters (UTF-8 code points).
 */
inline std::string truncate_query(const std::string& query, size_t limit = WEB_SEARCH_QUERY_LIMIT) {
    size_t chars = 0;
    for (size_t i = 0; i < query.size(); ++i) {
        // Continuation bytes belong to the previous character.
        if ((static_cast<unsigned char>(query[i]) & 0xC0) == 0x80) {
            continue;
        }
        if (chars == limit) {
            return query.substr(0, i);
        }
        ++chars;
    }
    return query;
}

} // namespace mllm::chat
