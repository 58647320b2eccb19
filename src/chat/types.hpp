#pragma once

/**
 * Common types for the chat-completion client.
 *
 * Messages and tool calls as they travel to the API, the events a streaming
 * call produces, and the outcome type of one-shot calls.
 */

#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace mllm::chat {

enum class Role {
    System,
    User,
    Assistant,
    Tool
};

std::string to_string(Role role);

// Parses "system", "user", "assistant" or "tool". Returns nullopt otherwise.
std::optional<Role> parse_role(const std::string& name);

/**
 * A finalized tool call. Immutable once built.
 */
struct ToolCall {
    std::string id;
    std::string function_name;
    std::string arguments;  // JSON-encoded argument object.

    bool operator==(const ToolCall& other) const {
        return id == other.id && function_name == other.function_name && arguments == other.arguments;
    }
};

/**
 * A message in the running conversation sent to the API.
 *
 * Tool-role messages always carry tool_call_id. Assistant messages that
 * request tools carry tool_calls and may have no content.
 */
struct ChatMessage {
    Role role = Role::User;
    std::optional<std::string> content;
    std::optional<std::string> tool_call_id;
    std::optional<std::vector<ToolCall>> tool_calls;
    std::optional<std::string> name;

    static ChatMessage system(const std::string& text);
    static ChatMessage user(const std::string& text);
    static ChatMessage assistant(const std::string& text);
    static ChatMessage assistant_tool_calls(std::vector<ToolCall> calls, std::optional<std::string> text);
    static ChatMessage tool_result(const std::string& tool_call_id, const std::string& text);

    // Request JSON; absent optionals are omitted.
    nlohmann::json to_json() const;
};

/**
 * A prior conversation message as the caller stores it.
 */
struct HistoryMessage {
    std::string role;     // "system", "user" or "assistant"; anything else is sent as "user".
    std::string content;
};

// Converts stored history to request messages. Unknown roles are sent as user.
std::vector<ChatMessage> to_chat_messages(const std::vector<HistoryMessage>& history);

// ========== Stream Events ==========

namespace events {

struct Content {
    std::string text;
};

struct Reasoning {
    std::string text;
};

struct Error {
    std::string message;
    std::optional<int> code;  // HTTP status when the error came from one.
};

struct ToolCallRequested {
    std::string id;
    std::string name;
    std::string arguments;
};

struct WebSearchStarted {};

struct Done {};

} // namespace events

/**
 * One event of a streaming call. Exactly one Done or one terminal Error
 * ends a call.
 */
using StreamEvent = std::variant<
    events::Content,
    events::Reasoning,
    events::Error,
    events::ToolCallRequested,
    events::WebSearchStarted,
    events::Done
>;

// Receives events in arrival order.
using EventCallback = std::function<void(const StreamEvent&)>;

// Returns true if the operation should be cancelled.
using CancelCallback = std::function<bool()>;

// Helper for std::visit with a set of lambdas.
template <typename... Fs>
struct overloaded : Fs... {
    using Fs::operator()...;
};
template <typename... Fs>
overloaded(Fs...) -> overloaded<Fs...>;

// Short description of an event for logs and test failure messages.
std::string describe(const StreamEvent& event);

// ========== One-shot Results ==========

struct ApiError {
    std::string message;
    std::optional<int> code;
};

/**
 * Outcome of a one-shot API call: the value or an error.
 */
template <typename T>
using ApiResult = std::variant<T, ApiError>;

template <typename T>
bool is_ok(const ApiResult<T>& result) {
    return std::holds_alternative<T>(result);
}

// ========== Configuration ==========

/**
 * Connection settings for one OpenAI-compatible provider.
 */
struct ApiConfig {
    std::string base_url = "https://api.openai.com/v1";
    std::string api_key;
    std::string model = "gpt-4";
    std::string system_prompt;
    std::optional<float> temperature;
    std::optional<int> max_tokens;
    std::string provider_name;

    bool is_configured() const;

    // base_url without trailing slashes.
    std::string normalized_base_url() const;
};

/**
 * Settings for the web_search tool.
 */
struct WebSearchConfig {
    bool enabled = false;
    std::string api_key;
    std::string provider = "brave";

    bool is_usable() const { return enabled && !api_key.empty(); }
};

} // namespace mllm::chat
