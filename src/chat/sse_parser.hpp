#pragma once

/**
 * Server-Sent Events decoding for the chat-completions stream.
 *
 * Each line of the response body is classified on its own. Only lines with
 * the "data: " prefix carry anything; a "[DONE]" payload ends the stream and
 * any other payload is one chat.completion.chunk JSON object, of which only
 * the first choice is read.
 */

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mllm::chat {

/**
 * One entry of delta.tool_calls. The index ties fragments of the same call
 * together; the id and name usually arrive only on the first fragment.
 */
struct ToolCallDelta {
    int index = 0;
    std::optional<std::string> id;
    std::optional<std::string> name;
    std::optional<std::string> arguments;
};

/**
 * The parts of a chunk's first choice that the client acts on.
 */
struct ChatChunk {
    std::optional<std::string> content;
    std::optional<std::string> reasoning_content;
    std::vector<ToolCallDelta> tool_calls;
    std::optional<std::string> finish_reason;  // Unset while generation continues.
};

enum class SseLineKind {
    Ignored,    // Not a data line (comment, event name, blank keep-alive).
    Done,       // The [DONE] sentinel.
    Chunk,      // A decoded chunk.
    Malformed   // A data line whose payload is not a JSON object.
};

struct SseLine {
    SseLineKind kind = SseLineKind::Ignored;
    ChatChunk chunk;
};

constexpr const char* SSE_DATA_PREFIX = "data: ";
constexpr const char* SSE_DONE_SENTINEL = "[DONE]";

// Classifies and decodes one line of the event stream.
SseLine parse_sse_line(const std::string& line);

// Decodes a parsed chunk object. Missing or null fields are left unset.
ChatChunk parse_chunk(const nlohmann::json& chunk);

} // namespace mllm::chat
