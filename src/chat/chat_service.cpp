#include "chat_service.hpp"
#include <cctype>

namespace mllm::chat {

ChatService::ChatService(ChatClient& client, search::ISearchAdapter& search)
    : client_(client), search_(search) {}

std::unique_ptr<ChatStream> ChatService::start_turn(const ApiConfig& config,
                                                    const WebSearchConfig& search_config,
                                                    const std::vector<HistoryMessage>& history) {
    auto messages = to_chat_messages(history);
    return std::make_unique<ChatStream>(
        [this, config, search_config, messages](const EventCallback& emit, const CancelCallback& cancel_check) {
            ToolLoop loop(client_, search_);
            loop.run(config, search_config, messages, emit, cancel_check);
        });
}

std::unique_ptr<ChatStream> ChatService::start_plain(const ApiConfig& config,
                                                     const std::vector<HistoryMessage>& history) {
    return std::make_unique<ChatStream>(
        [this, config, history](const EventCallback& emit, const CancelCallback& cancel_check) {
            client_.stream_history(config, history, emit, cancel_check);
        });
}

std::string generate_title(const std::string& content) {
    const size_t max_length = 50;

    std::string collapsed;
    bool pending_space = false;
    for (unsigned char c : content) {
        if (std::isspace(c)) {
            pending_space = !collapsed.empty();
            continue;
        }
        if (pending_space) {
            collapsed += ' ';
            pending_space = false;
        }
        collapsed += static_cast<char>(c);
    }

    if (collapsed.size() <= max_length) {
        return collapsed;
    }
    return collapsed.substr(0, max_length - 3) + "...";
}

} // namespace mllm::chat
