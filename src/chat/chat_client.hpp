#pragma once

/**
 * Client for OpenAI-compatible chat-completion APIs.
 *
 * Streams completions over Server-Sent Events and performs the one-shot
 * calls (connection test, model listing). All HTTP goes through an
 * ITransport; all failures come back as Error events or ApiError values.
 */

#include "types.hpp"
#include "../transport/transport.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mllm::chat {

class ChatClient {
public:
    explicit ChatClient(transport::ITransport& transport);

    ChatClient(const ChatClient&) = delete;
    ChatClient& operator=(const ChatClient&) = delete;

    /**
     * Streams one completion for the given messages.
     *
     * Events are delivered through emit on the calling thread, in arrival
     * order. The call returns once the stream is finished, has failed or was
     * cancelled; the connection is closed by then. A cancelled call emits
     * nothing further.
     *
     * If tools is a non-empty array it is sent with tool_choice "auto".
     */
    void stream_chat_completion(
        const ApiConfig& config,
        const std::vector<ChatMessage>& messages,
        const nlohmann::json& tools,
        const EventCallback& emit,
        const CancelCallback& cancel_check = nullptr
    );

    // Streams a completion for stored history, without tools.
    void stream_history(
        const ApiConfig& config,
        const std::vector<HistoryMessage>& history,
        const EventCallback& emit,
        const CancelCallback& cancel_check = nullptr
    );

    /**
     * Sends a short non-streaming completion to check reachability and
     * authentication. Returns the model's reply.
     */
    ApiResult<std::string> test_connection(const ApiConfig& config);

    // Lists the ids of the provider's models, sorted.
    ApiResult<std::vector<std::string>> fetch_models(const ApiConfig& config);

    /**
     * Builds the chat/completions request body. A non-blank system prompt
     * from the config is placed before the messages.
     */
    static nlohmann::json build_request_body(
        const ApiConfig& config,
        const std::vector<ChatMessage>& messages,
        const nlohmann::json& tools,
        bool stream
    );

private:
    transport::ITransport& transport_;

    transport::HttpRequest make_request(const ApiConfig& config,
                                        const std::string& method,
                                        const std::string& path) const;
};

} // namespace mllm::chat
