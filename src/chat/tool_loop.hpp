#pragma once

/**
 * Multi-round tool orchestration.
 *
 * Streams a completion, and when the model asks for tools runs them one at a
 * time, appends the results to the conversation and asks again, for at most
 * MAX_TOOL_ROUNDS rounds. Content, reasoning and errors are relayed to the
 * caller as they arrive; tool-call requests stay internal.
 */

#include "chat_client.hpp"
#include "types.hpp"
#include "../config.hpp"
#include "../search/search_adapter.hpp"
#include <string>
#include <vector>

namespace mllm::chat {

constexpr const char* WEB_SEARCH_FAILED_PREFIX = "Web search failed: ";

class ToolLoop {
public:
    ToolLoop(ChatClient& client, search::ISearchAdapter& search, int max_rounds = MAX_TOOL_ROUNDS);

    /**
     * Runs the loop for one conversational turn.
     *
     * Ends with exactly one Done, or with the first Error (after which no
     * further round or tool call starts). Hitting the round cap also ends
     * with Done. A cancelled turn emits nothing further and leaves no
     * tool result behind.
     *
     * Returns the running message list as it stood when the loop stopped.
     */
    std::vector<ChatMessage> run(
        const ApiConfig& config,
        const WebSearchConfig& search_config,
        std::vector<ChatMessage> messages,
        const EventCallback& emit,
        const CancelCallback& cancel_check = nullptr
    );

    int max_rounds() const { return max_rounds_; }

private:
    ChatClient& client_;
    search::ISearchAdapter& search_;
    int max_rounds_;

    enum class RoundStatus {
        Resolved,       // No tools requested; the answer is complete.
        ToolsExecuted,  // Tool results appended; another round is needed.
        Stopped         // Error or cancellation; nothing more to do.
    };

    RoundStatus run_round(
        const ApiConfig& config,
        const WebSearchConfig& search_config,
        std::vector<ChatMessage>& messages,
        const EventCallback& emit,
        const CancelCallback& cancel_check,
        int round
    );

    // Runs one tool call. Returns false if the turn has to stop.
    bool execute_tool_call(
        const ToolCall& call,
        const WebSearchConfig& search_config,
        std::vector<ChatMessage>& messages,
        const EventCallback& emit,
        const CancelCallback& cancel_check
    );
};

} // namespace mllm::chat
