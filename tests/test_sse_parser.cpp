#include <catch2/catch.hpp>
#include "chat/sse_parser.hpp"
#include "test_helpers.hpp"

using namespace mllm::chat;
using mllm::testing::json;

TEST_CASE("Lines without the data prefix are ignored", "[sse]") {
    REQUIRE(parse_sse_line("").kind == SseLineKind::Ignored);
    REQUIRE(parse_sse_line(": keep-alive").kind == SseLineKind::Ignored);
    REQUIRE(parse_sse_line("event: message").kind == SseLineKind::Ignored);
    REQUIRE(parse_sse_line("id: 42").kind == SseLineKind::Ignored);
    REQUIRE(parse_sse_line("data:[DONE]").kind == SseLineKind::Ignored);
}

TEST_CASE("DONE sentinel is recognized with surrounding whitespace", "[sse]") {
    REQUIRE(parse_sse_line("data: [DONE]").kind == SseLineKind::Done);
    REQUIRE(parse_sse_line("data: [DONE]  ").kind == SseLineKind::Done);
    REQUIRE(parse_sse_line("data:  [DONE]\r").kind == SseLineKind::Done);
}

TEST_CASE("Content delta is decoded", "[sse]") {
    auto parsed = parse_sse_line(mllm::testing::content_line("Hello"));

    REQUIRE(parsed.kind == SseLineKind::Chunk);
    REQUIRE(parsed.chunk.content == std::optional<std::string>("Hello"));
    REQUIRE_FALSE(parsed.chunk.reasoning_content.has_value());
    REQUIRE(parsed.chunk.tool_calls.empty());
    REQUIRE_FALSE(parsed.chunk.finish_reason.has_value());
}

TEST_CASE("Reasoning delta is kept apart from content", "[sse]") {
    auto parsed = parse_sse_line(mllm::testing::reasoning_line("thinking"));

    REQUIRE(parsed.kind == SseLineKind::Chunk);
    REQUIRE_FALSE(parsed.chunk.content.has_value());
    REQUIRE(parsed.chunk.reasoning_content == std::optional<std::string>("thinking"));
}

TEST_CASE("Tool call fragments carry index, id, name and arguments", "[sse]") {
    SECTION("First fragment") {
        auto parsed = parse_sse_line(mllm::testing::tool_call_line(1, "call_abc", "web_search", ""));
        REQUIRE(parsed.kind == SseLineKind::Chunk);
        REQUIRE(parsed.chunk.tool_calls.size() == 1);

        const auto& delta = parsed.chunk.tool_calls[0];
        REQUIRE(delta.index == 1);
        REQUIRE(delta.id == std::optional<std::string>("call_abc"));
        REQUIRE(delta.name == std::optional<std::string>("web_search"));
        REQUIRE_FALSE(delta.arguments.has_value());
    }

    SECTION("Argument fragment") {
        auto parsed = parse_sse_line(mllm::testing::tool_call_line(0, "", "", "{\"qu"));
        REQUIRE(parsed.chunk.tool_calls.size() == 1);

        const auto& delta = parsed.chunk.tool_calls[0];
        REQUIRE(delta.index == 0);
        REQUIRE_FALSE(delta.id.has_value());
        REQUIRE_FALSE(delta.name.has_value());
        REQUIRE(delta.arguments == std::optional<std::string>("{\"qu"));
    }
}

TEST_CASE("finish_reason null and \"null\" are both unset", "[sse]") {
    auto null_reason = parse_sse_line(mllm::testing::content_line("x"));
    REQUIRE_FALSE(null_reason.chunk.finish_reason.has_value());

    auto string_null = parse_sse_line(mllm::testing::finish_line("null"));
    REQUIRE_FALSE(string_null.chunk.finish_reason.has_value());

    auto stop = parse_sse_line(mllm::testing::finish_line("stop"));
    REQUIRE(stop.chunk.finish_reason == std::optional<std::string>("stop"));
}

TEST_CASE("Only the first choice is read", "[sse]") {
    json chunk = {{"choices", {
        {{"index", 0}, {"delta", {{"content", "first"}}}},
        {{"index", 1}, {"delta", {{"content", "second"}}}}
    }}};

    auto parsed = parse_chunk(chunk);
    REQUIRE(parsed.content == std::optional<std::string>("first"));
}

TEST_CASE("Chunks without choices decode to nothing", "[sse]") {
    auto parsed = parse_sse_line(R"(data: {"id":"chatcmpl-1","choices":[]})");
    REQUIRE(parsed.kind == SseLineKind::Chunk);
    REQUIRE_FALSE(parsed.chunk.content.has_value());
    REQUIRE_FALSE(parsed.chunk.finish_reason.has_value());

    auto usage_only = parse_sse_line(R"(data: {"usage":{"total_tokens":12}})");
    REQUIRE(usage_only.kind == SseLineKind::Chunk);
    REQUIRE(usage_only.chunk.tool_calls.empty());
}

TEST_CASE("Undecodable payloads are malformed", "[sse]") {
    REQUIRE(parse_sse_line("data: {not json").kind == SseLineKind::Malformed);
    REQUIRE(parse_sse_line("data: 42").kind == SseLineKind::Malformed);
    REQUIRE(parse_sse_line("data: [1, 2]").kind == SseLineKind::Malformed);
}

TEST_CASE("Non-string fields are treated as absent", "[sse]") {
    auto parsed = parse_sse_line(R"(data: {"choices":[{"delta":{"content":null,"reasoning_content":7}}]})");
    REQUIRE(parsed.kind == SseLineKind::Chunk);
    REQUIRE_FALSE(parsed.chunk.content.has_value());
    REQUIRE_FALSE(parsed.chunk.reasoning_content.has_value());
}
