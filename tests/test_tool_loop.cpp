#include <catch2/catch.hpp>
#include "chat/tool_loop.hpp"
#include "test_helpers.hpp"

using namespace mllm::chat;
using namespace mllm::testing;
using mllm::search::SearchError;

static std::vector<ChatMessage> ask(const std::string& text) {
    return {ChatMessage::user(text)};
}

TEST_CASE("A turn without tool calls relays content and ends with Done", "[loop]") {
    FakeTransport transport;
    transport.streams.push_back(ScriptedStream::of({content_line("Hello"), content_line("!"), done_line()}));
    ChatClient client(transport);
    FakeSearch search;
    ToolLoop loop(client, search);

    EventLog log;
    loop.run(test_config(), search_enabled(), ask("Hi"), log.callback());

    REQUIRE(transport.requests.size() == 1);
    REQUIRE(log.content() == "Hello!");
    REQUIRE(log.count<events::Done>() == 1);
    REQUIRE(std::holds_alternative<events::Done>(log.events.back()));
    REQUIRE(search.queries.empty());
}

TEST_CASE("The web_search tool is offered only when search is usable", "[loop]") {
    FakeTransport transport;
    transport.streams.push_back(ScriptedStream::of({content_line("a"), done_line()}));
    transport.streams.push_back(ScriptedStream::of({content_line("b"), done_line()}));
    ChatClient client(transport);
    FakeSearch search;
    ToolLoop loop(client, search);

    EventLog log;
    loop.run(test_config(), search_enabled(), ask("x"), log.callback());

    WebSearchConfig no_key = search_enabled();
    no_key.api_key.clear();
    loop.run(test_config(), no_key, ask("y"), log.callback());

    REQUIRE(transport.request_body(0)["tools"][0]["function"]["name"] == "web_search");
    REQUIRE(transport.request_body(0)["tool_choice"] == "auto");
    REQUIRE_FALSE(transport.request_body(1).contains("tools"));
}

TEST_CASE("A search round feeds results back and the second round answers", "[loop]") {
    FakeTransport transport;
    transport.streams.push_back(ScriptedStream::of(search_round("call_1", "rust release")));
    transport.streams.push_back(ScriptedStream::of({content_line("Rust 2.0 is out."), done_line()}));
    ChatClient client(transport);
    FakeSearch search;
    search.handler = [](const std::string&) { return std::string("1. Rust blog\n   URL: https://blog.rust-lang.org"); };
    ToolLoop loop(client, search);

    EventLog log;
    auto messages = loop.run(test_config(), search_enabled(), ask("What's new in Rust?"), log.callback());

    REQUIRE(search.queries == std::vector<std::string>{"rust release"});
    REQUIRE(search.providers == std::vector<std::string>{"brave"});
    REQUIRE(transport.requests.size() == 2);

    // Events: WebSearchStarted, Content, Done.
    REQUIRE(log.events.size() == 3);
    REQUIRE(std::holds_alternative<events::WebSearchStarted>(log.events[0]));
    REQUIRE(log.content() == "Rust 2.0 is out.");
    REQUIRE(std::holds_alternative<events::Done>(log.events[2]));
    REQUIRE(log.count<events::ToolCallRequested>() == 0);

    json second = transport.request_body(1)["messages"];
    REQUIRE(second.size() == 3);
    REQUIRE(second[1]["role"] == "assistant");
    REQUIRE(second[1]["tool_calls"][0]["id"] == "call_1");
    REQUIRE(second[1]["tool_calls"][0]["type"] == "function");
    REQUIRE(second[1]["tool_calls"][0]["function"]["name"] == "web_search");
    REQUIRE(second[1]["tool_calls"][0]["function"]["arguments"] == "{\"query\":\"rust release\"}");
    REQUIRE_FALSE(second[1].contains("content"));
    REQUIRE(second[2]["role"] == "tool");
    REQUIRE(second[2]["tool_call_id"] == "call_1");
    REQUIRE(second[2]["content"] == "1. Rust blog\n   URL: https://blog.rust-lang.org");

    REQUIRE(messages.size() == 3);
    REQUIRE(messages[2].role == Role::Tool);
}

TEST_CASE("Text streamed alongside tool calls is kept on the assistant message", "[loop]") {
    FakeTransport transport;
    auto round = search_round("call_1", "weather");
    round.insert(round.begin(), content_line("Let me check."));
    transport.streams.push_back(ScriptedStream::of(round));
    transport.streams.push_back(ScriptedStream::of({content_line("Sunny."), done_line()}));
    ChatClient client(transport);
    FakeSearch search;
    ToolLoop loop(client, search);

    EventLog log;
    loop.run(test_config(), search_enabled(), ask("Weather?"), log.callback());

    json second = transport.request_body(1)["messages"];
    REQUIRE(second[1]["content"] == "Let me check.");
    REQUIRE(log.content() == "Let me check.Sunny.");
}

TEST_CASE("Every tool call of a round gets its own result in order", "[loop]") {
    FakeTransport transport;
    transport.streams.push_back(ScriptedStream::of({
        tool_call_line(0, "call_a", "web_search", "{\"query\":\"first\"}"),
        tool_call_line(1, "call_b", "web_search", "{\"query\":\"second\"}"),
        finish_line("tool_calls")
    }));
    transport.streams.push_back(ScriptedStream::of({content_line("Both done."), done_line()}));
    ChatClient client(transport);
    FakeSearch search;
    search.handler = [](const std::string& query) { return "result for " + query; };
    ToolLoop loop(client, search);

    EventLog log;
    loop.run(test_config(), search_enabled(), ask("x"), log.callback());

    REQUIRE(search.queries == std::vector<std::string>{"first", "second"});
    REQUIRE(log.count<events::WebSearchStarted>() == 2);

    json second = transport.request_body(1)["messages"];
    REQUIRE(second.size() == 4);
    REQUIRE(second[1]["tool_calls"].size() == 2);
    REQUIRE(second[2]["tool_call_id"] == "call_a");
    REQUIRE(second[2]["content"] == "result for first");
    REQUIRE(second[3]["tool_call_id"] == "call_b");
    REQUIRE(second[3]["content"] == "result for second");
}

TEST_CASE("A failing search ends the turn after one WebSearchStarted", "[loop]") {
    FakeTransport transport;
    transport.streams.push_back(ScriptedStream::of(search_round("call_1", "anything")));
    transport.streams.push_back(ScriptedStream::of({content_line("never"), done_line()}));
    ChatClient client(transport);
    FakeSearch search;
    search.handler = [](const std::string&) -> std::string {
        throw SearchError("Brave Search: Invalid API key (HTTP 401)");
    };
    ToolLoop loop(client, search);

    EventLog log;
    loop.run(test_config(), search_enabled(), ask("x"), log.callback());

    REQUIRE(log.events.size() == 2);
    REQUIRE(std::holds_alternative<events::WebSearchStarted>(log.events[0]));
    auto errors = log.all<events::Error>();
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].message == "Web search failed: Brave Search: Invalid API key (HTTP 401)");
    REQUIRE(log.count<events::Done>() == 0);
    REQUIRE(transport.requests.size() == 1);
}

TEST_CASE("A transport failure during search is reported the same way", "[loop]") {
    FakeTransport transport;
    transport.streams.push_back(ScriptedStream::of(search_round("call_1", "anything")));
    ChatClient client(transport);
    FakeSearch search;
    search.handler = [](const std::string&) -> std::string {
        throw mllm::transport::TransportError(mllm::transport::TransportFailure::Timeout, "Timeout was reached");
    };
    ToolLoop loop(client, search);

    EventLog log;
    loop.run(test_config(), search_enabled(), ask("x"), log.callback());

    auto errors = log.all<events::Error>();
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].message ==
            "Web search failed: Connection timed out. Please check your internet connection and try again.");
    REQUIRE(transport.requests.size() == 1);
}

TEST_CASE("An API error in a round stops the loop", "[loop]") {
    FakeTransport transport;
    transport.streams.push_back(ScriptedStream::of(search_round("call_1", "q")));
    transport.streams.push_back(ScriptedStream::http_error(500, R"({"error":{"message":"overloaded"}})"));
    transport.streams.push_back(ScriptedStream::of({content_line("never"), done_line()}));
    ChatClient client(transport);
    FakeSearch search;
    ToolLoop loop(client, search);

    EventLog log;
    loop.run(test_config(), search_enabled(), ask("x"), log.callback());

    REQUIRE(transport.requests.size() == 2);
    auto errors = log.all<events::Error>();
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].message == "overloaded");
    REQUIRE(errors[0].code == std::optional<int>(500));
    REQUIRE(log.count<events::Done>() == 0);
}

TEST_CASE("Rounds are capped and the turn still ends with Done", "[loop]") {
    FakeTransport transport;
    for (int i = 0; i < 4; ++i) {
        transport.streams.push_back(ScriptedStream::of(search_round("call_" + std::to_string(i), "again")));
    }
    ChatClient client(transport);
    FakeSearch search;
    ToolLoop loop(client, search, 3);

    EventLog log;
    loop.run(test_config(), search_enabled(), ask("loop forever"), log.callback());

    REQUIRE(transport.requests.size() == 3);
    REQUIRE(search.queries.size() == 3);
    REQUIRE(log.count<events::WebSearchStarted>() == 3);
    REQUIRE(log.count<events::Done>() == 1);
    REQUIRE(std::holds_alternative<events::Done>(log.events.back()));
}

TEST_CASE("The default cap is five rounds", "[loop]") {
    FakeTransport transport;
    ChatClient client(transport);
    FakeSearch search;
    ToolLoop loop(client, search);
    REQUIRE(loop.max_rounds() == 5);
}

TEST_CASE("An unknown tool gets an error result and the loop continues", "[loop]") {
    FakeTransport transport;
    transport.streams.push_back(ScriptedStream::of({
        tool_call_line(0, "call_calc", "calculator", "{\"expr\":\"1+1\"}"),
        finish_line("tool_calls")
    }));
    transport.streams.push_back(ScriptedStream::of({content_line("2"), done_line()}));
    ChatClient client(transport);
    FakeSearch search;
    ToolLoop loop(client, search);

    EventLog log;
    loop.run(test_config(), search_enabled(), ask("1+1"), log.callback());

    REQUIRE(search.queries.empty());
    REQUIRE(log.count<events::WebSearchStarted>() == 0);
    REQUIRE(log.count<events::Done>() == 1);

    json second = transport.request_body(1)["messages"];
    REQUIRE(second[2]["role"] == "tool");
    REQUIRE(second[2]["tool_call_id"] == "call_calc");
    REQUIRE(second[2]["content"] == "Error: unknown tool 'calculator'");
}

TEST_CASE("web_search while search is disabled gets an error result", "[loop]") {
    FakeTransport transport;
    transport.streams.push_back(ScriptedStream::of(search_round("call_1", "q")));
    transport.streams.push_back(ScriptedStream::of({content_line("ok"), done_line()}));
    ChatClient client(transport);
    FakeSearch search;
    ToolLoop loop(client, search);

    EventLog log;
    loop.run(test_config(), WebSearchConfig{}, ask("x"), log.callback());

    REQUIRE(search.queries.empty());
    json second = transport.request_body(1)["messages"];
    REQUIRE(second[2]["content"] == "Error: web search is not enabled");
}

TEST_CASE("Search queries are cut to 400 characters", "[loop]") {
    std::string long_query(450, 'q');

    FakeTransport transport;
    transport.streams.push_back(ScriptedStream::of(search_round("call_1", long_query)));
    transport.streams.push_back(ScriptedStream::of({done_line()}));
    ChatClient client(transport);
    FakeSearch search;
    ToolLoop loop(client, search);

    EventLog log;
    loop.run(test_config(), search_enabled(), ask("x"), log.callback());

    REQUIRE(search.queries.size() == 1);
    REQUIRE(search.queries[0] == std::string(400, 'q'));
}

TEST_CASE("A search result arriving after cancellation is discarded", "[loop]") {
    FakeTransport transport;
    transport.streams.push_back(ScriptedStream::of(search_round("call_1", "slow")));
    ChatClient client(transport);

    bool cancelled = false;
    FakeSearch search;
    search.handler = [&](const std::string&) {
        cancelled = true;
        return std::string("late result");
    };
    ToolLoop loop(client, search);

    EventLog log;
    auto messages = loop.run(test_config(), search_enabled(), ask("x"), log.callback(),
                             [&]() { return cancelled; });

    REQUIRE(transport.requests.size() == 1);
    REQUIRE(log.count<events::Done>() == 0);
    REQUIRE(log.count<events::Error>() == 0);
    for (const auto& message : messages) {
        REQUIRE(message.role != Role::Tool);
    }
}

TEST_CASE("Cancelling during a search skips the remaining calls of the round", "[loop]") {
    FakeTransport transport;
    transport.streams.push_back(ScriptedStream::of({
        tool_call_line(0, "call_a", "web_search", "{\"query\":\"first\"}"),
        tool_call_line(1, "call_b", "web_search", "{\"query\":\"second\"}"),
        finish_line("tool_calls")
    }));
    transport.streams.push_back(ScriptedStream::of({content_line("never"), done_line()}));
    ChatClient client(transport);

    bool cancelled = false;
    FakeSearch search;
    search.handler = [&](const std::string& query) {
        cancelled = true;
        return "result for " + query;
    };
    ToolLoop loop(client, search);

    EventLog log;
    auto messages = loop.run(test_config(), search_enabled(), ask("x"), log.callback(),
                             [&]() { return cancelled; });

    REQUIRE(search.queries == std::vector<std::string>{"first"});
    REQUIRE(log.count<events::WebSearchStarted>() == 1);
    REQUIRE(transport.requests.size() == 1);
    REQUIRE(log.count<events::Done>() == 0);
    REQUIRE(log.count<events::Error>() == 0);
    for (const auto& message : messages) {
        REQUIRE(message.role != Role::Tool);
    }
}

TEST_CASE("Cancelling during a round stops without Done", "[loop]") {
    FakeTransport transport;
    transport.streams.push_back(ScriptedStream::of({content_line("one"), content_line("two"), done_line()}));
    ChatClient client(transport);
    FakeSearch search;
    ToolLoop loop(client, search);

    bool cancelled = false;
    EventLog log;
    auto emit = [&](const StreamEvent& event) {
        log.events.push_back(event);
        cancelled = true;
    };
    loop.run(test_config(), search_enabled(), ask("x"), emit, [&]() { return cancelled; });

    REQUIRE(log.content() == "one");
    REQUIRE(log.count<events::Done>() == 0);
}
