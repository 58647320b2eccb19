#pragma once

/**
 * Application configuration constants.
 *
 * Defaults for the completion API, request timeouts, tool-loop limits and the
 * search providers used by mllm-chat.
 */

#include <string>

namespace mllm {

// ========== File Paths ==========

constexpr const char* SETTINGS_FILE = ".mllm.json";  // Local settings file.

// ========== Environment ==========

constexpr const char* API_KEY_ENV = "OPENAI_API_KEY";
constexpr const char* SEARCH_API_KEY_ENV = "MLLM_SEARCH_API_KEY";

// ========== Completion API ==========

constexpr const char* DEFAULT_API_BASE = "https://api.openai.com/v1";
constexpr const char* DEFAULT_MODEL = "gpt-4";

constexpr long API_CONNECT_TIMEOUT_SECONDS = 30;
constexpr long API_READ_TIMEOUT_SECONDS = 60;

// Prompt and limits for the one-shot reachability check.
constexpr const char* CONNECTION_TEST_PROMPT =
    "Say 'Connection successful!' in exactly those words.";
constexpr const char* CONNECTION_TEST_FALLBACK = "Connection successful!";
constexpr float CONNECTION_TEST_TEMPERATURE = 0.1f;
constexpr int CONNECTION_TEST_MAX_TOKENS = 20;

// ========== Tool Loop ==========

constexpr int MAX_TOOL_ROUNDS = 5;
constexpr const char* WEB_SEARCH_TOOL_NAME = "web_search";
constexpr size_t WEB_SEARCH_QUERY_LIMIT = 400;

// ========== Search Providers ==========

constexpr const char* DEFAULT_SEARCH_PROVIDER = "brave";
constexpr long SEARCH_CONNECT_TIMEOUT_SECONDS = 30;
constexpr long SEARCH_READ_TIMEOUT_SECONDS = 30;
constexpr int SEARCH_RESULT_COUNT = 5;
constexpr const char* NO_RESULTS_MARKER = "No results found";

constexpr const char* BRAVE_SEARCH_URL = "https://api.search.brave.com/res/v1/web/search";
constexpr const char* TAVILY_SEARCH_URL = "https://api.tavily.com/search";
constexpr const char* SYNTHETIC_SEARCH_URL = "https://api.synthetic.new/v2/search";

} // namespace mllm
