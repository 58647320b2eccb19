#include "sse_parser.hpp"
#include "../verbose.hpp"

namespace mllm::chat {

using json = nlohmann::json;

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

// Returns the string at key, treating absent, null and non-string values as unset.
static std::optional<std::string> optional_string(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

static ToolCallDelta parse_tool_call_delta(const json& entry) {
    ToolCallDelta delta;

    auto index = entry.find("index");
    if (index != entry.end() && index->is_number_integer()) {
        delta.index = index->get<int>();
    }

    delta.id = optional_string(entry, "id");

    auto function = entry.find("function");
    if (function != entry.end() && function->is_object()) {
        delta.name = optional_string(*function, "name");
        delta.arguments = optional_string(*function, "arguments");
    }

    return delta;
}

ChatChunk parse_chunk(const json& chunk) {
    ChatChunk result;

    auto choices = chunk.find("choices");
    if (choices == chunk.end() || !choices->is_array() || choices->empty()) {
        return result;
    }

    const json& choice = choices->front();
    if (!choice.is_object()) {
        return result;
    }

    auto delta = choice.find("delta");
    if (delta != choice.end() && delta->is_object()) {
        result.content = optional_string(*delta, "content");
        result.reasoning_content = optional_string(*delta, "reasoning_content");

        auto tool_calls = delta->find("tool_calls");
        if (tool_calls != delta->end() && tool_calls->is_array()) {
            for (const auto& entry : *tool_calls) {
                if (entry.is_object()) {
                    result.tool_calls.push_back(parse_tool_call_delta(entry));
                }
            }
        }
    }

    // Some servers send the literal string "null" rather than JSON null.
    auto finish_reason = optional_string(choice, "finish_reason");
    if (finish_reason && *finish_reason != "null") {
        result.finish_reason = finish_reason;
    }

    return result;
}

SseLine parse_sse_line(const std::string& line) {
    SseLine parsed;

    if (line.compare(0, 6, SSE_DATA_PREFIX) != 0) {
        return parsed;
    }

    std::string payload = trim(line.substr(6));
    if (payload == SSE_DONE_SENTINEL) {
        parsed.kind = SseLineKind::Done;
        return parsed;
    }

    try {
        json j = json::parse(payload);
        if (!j.is_object()) {
            parsed.kind = SseLineKind::Malformed;
            return parsed;
        }
        parsed.chunk = parse_chunk(j);
        parsed.kind = SseLineKind::Chunk;
    } catch (const json::exception& e) {
        verbose_err("SSE", std::string("Skipping malformed chunk: ") + e.what());
        parsed.kind = SseLineKind::Malformed;
    }

    return parsed;
}

} // namespace mllm::chat
