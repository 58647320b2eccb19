#include "tool_loop.hpp"
#include "error_classifier.hpp"
#include "web_search_tool.hpp"
#include "../verbose.hpp"

namespace mllm::chat {

using json = nlohmann::json;

static bool is_cancelled(const CancelCallback& cancel_check) {
    return cancel_check && cancel_check();
}

ToolLoop::ToolLoop(ChatClient& client, search::ISearchAdapter& search, int max_rounds)
    : client_(client), search_(search), max_rounds_(max_rounds) {}

std::vector<ChatMessage> ToolLoop::run(const ApiConfig& config,
                                       const WebSearchConfig& search_config,
                                       std::vector<ChatMessage> messages,
                                       const EventCallback& emit,
                                       const CancelCallback& cancel_check) {
    for (int round = 1; round <= max_rounds_; ++round) {
        RoundStatus status = run_round(config, search_config, messages, emit, cancel_check, round);

        if (status == RoundStatus::Stopped) {
            return messages;
        }
        if (status == RoundStatus::Resolved) {
            emit(events::Done{});
            return messages;
        }
    }

    // TODO: decide with product whether exhausting the rounds should raise a
    // distinct "max iterations exceeded" error instead of a plain Done.
    verbose_log("LOOP", "Stopping after " + std::to_string(max_rounds_) + " tool rounds");
    emit(events::Done{});
    return messages;
}

ToolLoop::RoundStatus ToolLoop::run_round(const ApiConfig& config,
                                          const WebSearchConfig& search_config,
                                          std::vector<ChatMessage>& messages,
                                          const EventCallback& emit,
                                          const CancelCallback& cancel_check,
                                          int round) {
    verbose_log("LOOP", "Round " + std::to_string(round) + " with " +
                std::to_string(messages.size()) + " messages");

    json tools = search_config.is_usable() ? web_search_tools() : json::array();

    std::string round_text;
    std::vector<ToolCall> tool_calls;
    bool failed = false;

    client_.stream_chat_completion(config, messages, tools, [&](const StreamEvent& event) {
        std::visit(overloaded{
            [&](const events::Content& e) {
                round_text += e.text;
                emit(event);
            },
            [&](const events::Reasoning&) {
                emit(event);
            },
            [&](const events::Error&) {
                failed = true;
                emit(event);
            },
            [&](const events::ToolCallRequested& e) {
                tool_calls.push_back({e.id, e.name, e.arguments});
            },
            [&](const events::WebSearchStarted&) {
                emit(event);
            },
            [&](const events::Done&) {
                // The loop decides when the turn is done.
            }
        }, event);
    }, cancel_check);

    if (is_cancelled(cancel_check)) {
        verbose_log("LOOP", "Cancelled during round " + std::to_string(round));
        return RoundStatus::Stopped;
    }
    if (failed) {
        verbose_err("LOOP", "Round " + std::to_string(round) + " failed; abandoning the turn");
        return RoundStatus::Stopped;
    }
    if (tool_calls.empty()) {
        return RoundStatus::Resolved;
    }

    std::optional<std::string> content;
    if (!round_text.empty()) {
        content = round_text;
    }
    messages.push_back(ChatMessage::assistant_tool_calls(tool_calls, content));

    for (const auto& call : tool_calls) {
        if (is_cancelled(cancel_check)) {
            verbose_log("LOOP", "Cancelled before tool call " + call.id);
            return RoundStatus::Stopped;
        }
        if (!execute_tool_call(call, search_config, messages, emit, cancel_check)) {
            return RoundStatus::Stopped;
        }
    }

    return RoundStatus::ToolsExecuted;
}

bool ToolLoop::execute_tool_call(const ToolCall& call,
                                 const WebSearchConfig& search_config,
                                 std::vector<ChatMessage>& messages,
                                 const EventCallback& emit,
                                 const CancelCallback& cancel_check) {
    if (call.function_name != WEB_SEARCH_TOOL_NAME) {
        verbose_err("LOOP", "Model requested unknown tool: " + call.function_name);
        messages.push_back(ChatMessage::tool_result(call.id, "Error: unknown tool '" + call.function_name + "'"));
        return true;
    }

    if (!search_config.is_usable()) {
        verbose_err("LOOP", "web_search requested while search is not configured");
        messages.push_back(ChatMessage::tool_result(call.id, "Error: web search is not enabled"));
        return true;
    }

    std::string query = truncate_query(extract_search_query(call.arguments));
    emit(events::WebSearchStarted{});

    std::string result;
    try {
        result = search_.search(query, search_config.api_key, search_config.provider);
    } catch (const search::SearchError& e) {
        emit(events::Error{WEB_SEARCH_FAILED_PREFIX + std::string(e.what()), std::nullopt});
        return false;
    } catch (const std::exception& e) {
        emit(events::Error{WEB_SEARCH_FAILED_PREFIX + describe_exception(e), std::nullopt});
        return false;
    }

    // A result that arrives after cancellation is dropped.
    if (is_cancelled(cancel_check)) {
        verbose_log("LOOP", "Discarding search result for " + call.id + " after cancellation");
        return false;
    }

    verbose_log("LOOP", "Search for " + call.id + " returned " + std::to_string(result.size()) + " bytes");
    messages.push_back(ChatMessage::tool_result(call.id, result));
    return true;
}

} // namespace mllm::chat
