#pragma once

/**
 * Entry point for one conversational turn.
 *
 * Takes the stored history and the active provider settings and starts the
 * tool loop (or a plain stream) on a background thread, returning a
 * ChatStream to read events from. The caller owns persistence and display.
 */

#include "chat_client.hpp"
#include "chat_stream.hpp"
#include "tool_loop.hpp"
#include "types.hpp"
#include "../search/search_adapter.hpp"
#include <memory>
#include <vector>

namespace mllm::chat {

class ChatService {
public:
    // The client and search adapter must outlive every stream started here.
    ChatService(ChatClient& client, search::ISearchAdapter& search);

    // Streams a turn through the tool loop.
    std::unique_ptr<ChatStream> start_turn(
        const ApiConfig& config,
        const WebSearchConfig& search_config,
        const std::vector<HistoryMessage>& history
    );

    // Streams a single completion without tools.
    std::unique_ptr<ChatStream> start_plain(
        const ApiConfig& config,
        const std::vector<HistoryMessage>& history
    );

private:
    ChatClient& client_;
    search::ISearchAdapter& search_;
};

/**
 * Derives a conversation title from its first message: whitespace collapsed
 * to single spaces, at most 50 characters including a "..." suffix.
 */
std::string generate_title(const std::string& content);

} // namespace mllm::chat
