#include "types.hpp"
#include <algorithm>
#include <cctype>

namespace mllm::chat {

using json = nlohmann::json;

std::string to_string(Role role) {
    switch (role) {
        case Role::System:
            return "system";
        case Role::User:
            return "user";
        case Role::Assistant:
            return "assistant";
        case Role::Tool:
            return "tool";
    }
    return "user";
}

std::optional<Role> parse_role(const std::string& name) {
    if (name == "system") return Role::System;
    if (name == "user") return Role::User;
    if (name == "assistant") return Role::Assistant;
    if (name == "tool") return Role::Tool;
    return std::nullopt;
}

ChatMessage ChatMessage::system(const std::string& text) {
    ChatMessage msg;
    msg.role = Role::System;
    msg.content = text;
    return msg;
}

ChatMessage ChatMessage::user(const std::string& text) {
    ChatMessage msg;
    msg.role = Role::User;
    msg.content = text;
    return msg;
}

ChatMessage ChatMessage::assistant(const std::string& text) {
    ChatMessage msg;
    msg.role = Role::Assistant;
    msg.content = text;
    return msg;
}

ChatMessage ChatMessage::assistant_tool_calls(std::vector<ToolCall> calls, std::optional<std::string> text) {
    ChatMessage msg;
    msg.role = Role::Assistant;
    msg.content = std::move(text);
    msg.tool_calls = std::move(calls);
    return msg;
}

ChatMessage ChatMessage::tool_result(const std::string& tool_call_id, const std::string& text) {
    ChatMessage msg;
    msg.role = Role::Tool;
    msg.content = text;
    msg.tool_call_id = tool_call_id;
    return msg;
}

json ChatMessage::to_json() const {
    json j = {{"role", to_string(role)}};

    if (content) {
        j["content"] = *content;
    }
    if (tool_call_id) {
        j["tool_call_id"] = *tool_call_id;
    }
    if (tool_calls) {
        json calls = json::array();
        for (const auto& call : *tool_calls) {
            calls.push_back({
                {"id", call.id},
                {"type", "function"},
                {"function", {
                    {"name", call.function_name},
                    {"arguments", call.arguments}
                }}
            });
        }
        j["tool_calls"] = calls;
    }
    if (name) {
        j["name"] = *name;
    }

    return j;
}

std::vector<ChatMessage> to_chat_messages(const std::vector<HistoryMessage>& history) {
    std::vector<ChatMessage> messages;
    messages.reserve(history.size());
    for (const auto& entry : history) {
        // Tool results need a tool_call_id, which prior history cannot carry.
        switch (parse_role(entry.role).value_or(Role::User)) {
            case Role::System:
                messages.push_back(ChatMessage::system(entry.content));
                break;
            case Role::Assistant:
                messages.push_back(ChatMessage::assistant(entry.content));
                break;
            case Role::User:
            case Role::Tool:
                messages.push_back(ChatMessage::user(entry.content));
                break;
        }
    }
    return messages;
}

std::string describe(const StreamEvent& event) {
    return std::visit(overloaded{
        [](const events::Content& e) { return "Content(" + e.text + ")"; },
        [](const events::Reasoning& e) { return "Reasoning(" + e.text + ")"; },
        [](const events::Error& e) {
            std::string s = "Error(" + e.message;
            if (e.code) {
                s += ", " + std::to_string(*e.code);
            }
            return s + ")";
        },
        [](const events::ToolCallRequested& e) {
            return "ToolCallRequested(" + e.id + ", " + e.name + ", " + e.arguments + ")";
        },
        [](const events::WebSearchStarted&) { return std::string("WebSearchStarted"); },
        [](const events::Done&) { return std::string("Done"); }
    }, event);
}

bool ApiConfig::is_configured() const {
    auto blank = [](const std::string& s) {
        return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    };
    return !blank(base_url) && !blank(api_key) && !blank(model);
}

std::string ApiConfig::normalized_base_url() const {
    std::string url = base_url;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

} // namespace mllm::chat
