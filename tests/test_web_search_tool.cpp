#include <catch2/catch.hpp>
#include "chat/web_search_tool.hpp"

using namespace mllm::chat;
using json = nlohmann::json;

TEST_CASE("Tool definition uses the nested function format", "[tool]") {
    json tool = web_search_tool_definition();

    REQUIRE(tool["type"] == "function");
    REQUIRE(tool["function"]["name"] == "web_search");
    REQUIRE(tool["function"]["parameters"]["type"] == "object");
    REQUIRE(tool["function"]["parameters"]["properties"]["query"]["type"] == "string");
    REQUIRE(tool["function"]["parameters"]["required"] == json::array({"query"}));
    REQUIRE(web_search_tools().size() == 1);
}

TEST_CASE("Query is read from the argument object", "[tool]") {
    REQUIRE(extract_search_query(R"({"query":"best pizza in Naples"})") == "best pizza in Naples");
}

TEST_CASE("Raw arguments are used when there is no usable query", "[tool]") {
    REQUIRE(extract_search_query("plain text query") == "plain text query");
    REQUIRE(extract_search_query(R"({"query":"   "})") == R"({"query":"   "})");
    REQUIRE(extract_search_query(R"({"q":"other"})") == R"({"q":"other"})");
    REQUIRE(extract_search_query(R"({"query":5})") == R"({"query":5})");
}

TEST_CASE("Queries are truncated by character, not byte", "[tool]") {
    REQUIRE(truncate_query("short") == "short");
    REQUIRE(truncate_query(std::string(400, 'a')) == std::string(400, 'a'));
    REQUIRE(truncate_query(std::string(401, 'a')) == std::string(400, 'a'));

    std::string accented;
    for (int i = 0; i < 401; ++i) {
        accented += "\xC3\xA9";  // é
    }
    std::string cut = truncate_query(accented);
    REQUIRE(cut.size() == 800);
    REQUIRE(cut == accented.substr(0, 800));

    REQUIRE(truncate_query("abcdef", 3) == "abc");
}
