#include "chat_client.hpp"
#include "delta_accumulator.hpp"
#include "error_classifier.hpp"
#include "../config.hpp"
#include "../verbose.hpp"
#include <algorithm>

namespace mllm::chat {

using json = nlohmann::json;
using transport::HttpRequest;
using transport::TransportError;

ChatClient::ChatClient(transport::ITransport& transport) : transport_(transport) {}

HttpRequest ChatClient::make_request(const ApiConfig& config,
                                     const std::string& method,
                                     const std::string& path) const {
    HttpRequest request;
    request.method = method;
    request.url = config.normalized_base_url() + path;
    request.headers = {
        {"Authorization", "Bearer " + config.api_key},
        {"Content-Type", "application/json"}
    };
    request.connect_timeout_seconds = API_CONNECT_TIMEOUT_SECONDS;
    request.read_timeout_seconds = API_READ_TIMEOUT_SECONDS;
    return request;
}

json ChatClient::build_request_body(const ApiConfig& config,
                                    const std::vector<ChatMessage>& messages,
                                    const json& tools,
                                    bool stream) {
    json all_messages = json::array();

    if (config.system_prompt.find_first_not_of(" \t\r\n") != std::string::npos) {
        all_messages.push_back(ChatMessage::system(config.system_prompt).to_json());
    }
    for (const auto& msg : messages) {
        all_messages.push_back(msg.to_json());
    }

    json body = {
        {"model", config.model},
        {"messages", all_messages},
        {"stream", stream}
    };

    if (config.temperature) {
        body["temperature"] = *config.temperature;
    }
    if (config.max_tokens) {
        body["max_tokens"] = *config.max_tokens;
    }
    if (tools.is_array() && !tools.empty()) {
        body["tools"] = tools;
        body["tool_choice"] = "auto";
    }

    return body;
}

void ChatClient::stream_chat_completion(const ApiConfig& config,
                                        const std::vector<ChatMessage>& messages,
                                        const json& tools,
                                        const EventCallback& emit,
                                        const CancelCallback& cancel_check) {
    HttpRequest request = make_request(config, "POST", "/chat/completions");
    request.headers.emplace_back("Accept", "text/event-stream");
    request.body = build_request_body(config, messages, tools, true).dump();

    verbose_log("CHAT", "Streaming " + config.model + " with " + std::to_string(messages.size()) +
                " messages, key " + mask_secret(config.api_key));

    DeltaAccumulator accumulator(emit);

    transport::StreamOutcome outcome;
    try {
        outcome = transport_.stream_lines(request, [&](const std::string& line) {
            if (!line.empty()) {
                verbose_in("SSE", truncate(line, 300));
            }
            return accumulator.on_line(line);
        }, cancel_check);
    } catch (const TransportError& e) {
        emit(events::Error{describe_transport_error(e), std::nullopt});
        return;
    }

    if (outcome.cancelled) {
        return;
    }

    if (!outcome.ok()) {
        ApiError error = classify_http_status(outcome.status, outcome.error_body);
        verbose_err("CHAT", "HTTP " + std::to_string(outcome.status) + ": " + error.message);
        emit(events::Error{error.message, error.code});
        return;
    }

    // The body ended without [DONE] or a finish_reason.
    if (!accumulator.finished()) {
        verbose_log("SSE", "Stream ended without a terminator");
        emit(events::Done{});
    }
}

void ChatClient::stream_history(const ApiConfig& config,
                                const std::vector<HistoryMessage>& history,
                                const EventCallback& emit,
                                const CancelCallback& cancel_check) {
    stream_chat_completion(config, to_chat_messages(history), json::array(), emit, cancel_check);
}

ApiResult<std::string> ChatClient::test_connection(const ApiConfig& config) {
    ApiConfig probe = config;
    probe.system_prompt.clear();
    probe.temperature = CONNECTION_TEST_TEMPERATURE;
    probe.max_tokens = CONNECTION_TEST_MAX_TOKENS;

    HttpRequest request = make_request(config, "POST", "/chat/completions");
    request.body = build_request_body(
        probe, {ChatMessage::user(CONNECTION_TEST_PROMPT)}, json::array(), false).dump();

    transport::HttpResponse response;
    try {
        response = transport_.send(request);
    } catch (const TransportError& e) {
        return ApiError{describe_transport_error(e), std::nullopt};
    }

    if (!response.ok()) {
        return classify_http_status(response.status, response.body);
    }

    try {
        json j = json::parse(response.body);
        const auto& content = j.at("choices").at(0).at("message").at("content");
        if (content.is_string()) {
            return content.get<std::string>();
        }
    } catch (const json::exception& e) {
        verbose_err("CHAT", std::string("Unreadable connection test reply: ") + e.what());
    }
    return std::string(CONNECTION_TEST_FALLBACK);
}

ApiResult<std::vector<std::string>> ChatClient::fetch_models(const ApiConfig& config) {
    HttpRequest request = make_request(config, "GET", "/models");

    transport::HttpResponse response;
    try {
        response = transport_.send(request);
    } catch (const TransportError& e) {
        return ApiError{describe_transport_error(e), std::nullopt};
    }

    if (!response.ok()) {
        return classify_http_status(response.status, response.body, Endpoint::Models);
    }

    try {
        json j = json::parse(response.body);
        std::vector<std::string> models;
        for (const auto& model : j.at("data")) {
            models.push_back(model.at("id").get<std::string>());
        }
        std::sort(models.begin(), models.end());
        return models;
    } catch (const json::exception& e) {
        return ApiError{std::string("Failed to parse models response: ") + e.what(), std::nullopt};
    }
}

} // namespace mllm::chat
