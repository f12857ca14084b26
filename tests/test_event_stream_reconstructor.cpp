#include <doctest/doctest.h>

#include <variant>

#include "event_stream_reconstructor.hpp"

using nlohmann::json;

static std::string sse(const std::string& type, const std::string& data)
{
    return "event: " + type + "\ndata: " + data + "\n\n";
}

TEST_CASE("Text deltas fold into one message")
{
    std::string stream = sse("message_start", R"({"type":"message_start","message":{"id":"m1","role":"assistant"}})") +
                         sse("content_block_start", R"({"index":0,"content_block":{"type":"text","text":""}})") +
                         sse("content_block_delta", R"({"index":0,"delta":{"type":"text_delta","text":"Hel"}})") +
                         sse("content_block_delta", R"({"index":0,"delta":{"type":"text_delta","text":"lo"}})") +
                         sse("message_stop", R"({"type":"message_stop"})");

    ParsedStream parsed = EventStreamReconstructor::parse(stream);

    CHECK(parsed.events.size() == 5);
    REQUIRE(parsed.message.id.has_value());
    CHECK(*parsed.message.id == "m1");
    CHECK(*parsed.message.role == "assistant");

    json message = parsed.message.toJson();
    CHECK(message["id"] == "m1");
    CHECK(message["content"][0]["type"] == "text");
    CHECK(message["content"][0]["text"] == "Hello");
}

TEST_CASE("CRLF framing and multi-line data are accepted")
{
    std::string stream = "event: message_start\r\ndata: {\"message\":\r\ndata: {\"id\":\"m2\"}}\r\n\r\n";

    ParsedStream parsed = EventStreamReconstructor::parse(stream);

    REQUIRE(parsed.events.size() == 1);
    CHECK_FALSE(parsed.events[0].parseError);
    CHECK(*parsed.message.id == "m2");
}

TEST_CASE("Tool use and thinking blocks keep their own payloads")
{
    std::string stream =
        sse("content_block_start", R"({"index":0,"content_block":{"type":"thinking"}})") +
        sse("content_block_delta", R"({"index":0,"delta":{"type":"thinking_delta","thinking":"Let me "}})") +
        sse("content_block_delta", R"({"index":0,"delta":{"type":"thinking_delta","thinking":"see"}})") +
        sse("content_block_start", R"({"index":1,"content_block":{"type":"tool_use"}})") +
        sse("content_block_delta", R"({"index":1,"delta":{"type":"tool_use_delta","tool_use":{"name":"search"}}})") +
        sse("content_block_delta", R"({"index":1,"delta":{"type":"tool_use_delta","tool_use":{"input":{"q":"x"}}}})");

    ParsedStream parsed = EventStreamReconstructor::parse(stream);

    REQUIRE(parsed.message.content.size() == 2);
    const auto* thinking = std::get_if<ThinkingBlock>(&parsed.message.content.at(0));
    REQUIRE(thinking != nullptr);
    CHECK(thinking->thinking == "Let me see");

    const auto* tool = std::get_if<ToolUseBlock>(&parsed.message.content.at(1));
    REQUIRE(tool != nullptr);
    CHECK(tool->fields["name"] == "search");
    CHECK(tool->fields["input"]["q"] == "x");
    CHECK(parsed.message.errors.empty());
}

TEST_CASE("Deltas for blocks never started create unknown blocks")
{
    std::string stream = sse("content_block_delta", R"({"index":2,"delta":{"type":"text_delta","text":"orphan"}})");

    ParsedStream parsed = EventStreamReconstructor::parse(stream);

    REQUIRE(parsed.message.content.count(2) == 1);
    CHECK(std::holds_alternative<UnknownBlock>(parsed.message.content.at(2)));

    json message = parsed.message.toJson();
    REQUIRE(message["content"].size() == 3);
    CHECK(message["content"][0].is_null());
    CHECK(message["content"][1].is_null());
    CHECK(message["content"][2]["type"] == "unknown");
    CHECK(message["content"][2]["text"] == "orphan");
}

TEST_CASE("Later message deltas override stop fields and merge usage")
{
    std::string stream =
        sse("message_start", R"({"message":{"id":"m","usage":{"input_tokens":10,"output_tokens":1}}})") +
        sse("message_delta", R"({"delta":{"stop_reason":"max_tokens"},"usage":{"output_tokens":5}})") +
        sse("message_delta", R"({"delta":{"stop_reason":"end_turn","stop_sequence":null}})");

    ParsedStream parsed = EventStreamReconstructor::parse(stream);

    CHECK(*parsed.message.stopReason == "end_turn");
    CHECK_FALSE(parsed.message.stopSequence.has_value());
    REQUIRE(parsed.message.usage.has_value());
    CHECK((*parsed.message.usage)["input_tokens"] == 10);
    CHECK((*parsed.message.usage)["output_tokens"] == 5);
}

TEST_CASE("Bad payloads are kept as marked events and do not stop folding")
{
    std::string stream = sse("content_block_start", R"({"index":0,"content_block":{"type":"text"}})") +
                         sse("content_block_delta", "{not json") +
                         sse("ping", "{}") +
                         sse("error", R"({"type":"error","error":{"type":"overloaded_error"}})") +
                         sse("custom_event", R"({"x":1})") +
                         sse("content_block_delta", R"({"index":0,"delta":{"type":"text_delta","text":"ok"}})");

    ParsedStream parsed = EventStreamReconstructor::parse(stream);

    REQUIRE(parsed.events.size() == 6);
    CHECK(parsed.events[1].parseError);
    CHECK(parsed.events[1].data["raw"] == "{not json");
    CHECK(parsed.events[1].data.contains("parse_error"));
    CHECK(parsed.events[4].type == "custom_event");
    REQUIRE(parsed.message.error.has_value());
    CHECK((*parsed.message.error)["error"]["type"] == "overloaded_error");
    CHECK(parsed.message.toJson()["content"][0]["text"] == "ok");
}

TEST_CASE("Deltas of another kind than their block are kept on that block")
{
    std::string stream = sse("content_block_start", R"({"index":0,"content_block":{"type":"text"}})") +
                         sse("content_block_delta", R"({"index":0,"delta":{"type":"text_delta","text":"answer"}})") +
                         sse("content_block_delta", R"({"index":0,"delta":{"type":"thinking_delta","thinking":"x"}})") +
                         sse("content_block_delta", R"({"index":0,"delta":{"type":"tool_use_delta","tool_use":{"id":"t"}}})") +
                         sse("content_block_delta", R"({"delta":{"type":"text_delta"}})");

    ParsedStream parsed = EventStreamReconstructor::parse(stream);

    const auto* text = std::get_if<TextBlock>(&parsed.message.content.at(0));
    REQUIRE(text != nullptr);
    CHECK(text->text == "answer");
    CHECK(text->thinking == "x");

    json message = parsed.message.toJson();
    CHECK(message["content"][0]["type"] == "text");
    CHECK(message["content"][0]["text"] == "answer");
    CHECK(message["content"][0]["thinking"] == "x");
    CHECK(message["content"][0]["tool_use"]["id"] == "t");

    // only the delta without an index fails to fold
    REQUIRE(parsed.message.errors.size() == 1);
    CHECK(parsed.message.errors[0]["event_type"] == "content_block_delta");
    CHECK(message["errors"].size() == 1);
}

TEST_CASE("Block indexes outside the accepted range are recorded as errors")
{
    std::string stream =
        sse("content_block_start", R"({"index":-1,"content_block":{"type":"text"}})") +
        sse("content_block_delta", R"({"index":-1,"delta":{"type":"text_delta","text":"a"}})") +
        sse("content_block_start", R"({"index":18446744073709551615,"content_block":{"type":"text"}})") +
        sse("content_block_delta", R"({"index":1000000000000,"delta":{"type":"text_delta","text":"b"}})") +
        sse("content_block_delta", R"({"index":1.5,"delta":{"type":"text_delta","text":"c"}})") +
        sse("content_block_delta", R"({"index":"0","delta":{"type":"text_delta","text":"d"}})") +
        sse("content_block_delta", R"({"index":1,"delta":{"type":"text_delta","text":"kept"}})");

    ParsedStream parsed = EventStreamReconstructor::parse(stream);

    CHECK(parsed.events.size() == 7);
    CHECK(parsed.message.errors.size() == 6);
    REQUIRE(parsed.message.content.size() == 1);

    json message = parsed.message.toJson();
    REQUIRE(message["content"].size() == 2);
    CHECK(message["content"][0].is_null());
    CHECK(message["content"][1]["text"] == "kept");
}

TEST_CASE("The largest accepted block index renders with null holes before it")
{
    std::string stream = sse("content_block_delta", "{\"index\":" + std::to_string(MAX_BLOCK_INDEX) +
                                                        ",\"delta\":{\"type\":\"text_delta\",\"text\":\"end\"}}");

    ParsedStream parsed = EventStreamReconstructor::parse(stream);

    CHECK(parsed.message.errors.empty());
    json message = parsed.message.toJson();
    REQUIRE(message["content"].size() == MAX_BLOCK_INDEX + 1);
    CHECK(message["content"][MAX_BLOCK_INDEX]["text"] == "end");
}

TEST_CASE("Empty or unframed input gives an empty message")
{
    for (const std::string& input : {std::string(), std::string("just some text"), std::string("data: {}\n\n")})
    {
        ParsedStream parsed = EventStreamReconstructor::parse(input);
        CHECK(parsed.events.empty());
        json message = parsed.message.toJson();
        CHECK(message["content"] == json::array());
        CHECK(message.size() == 1);
    }
}

TEST_CASE("Streams are detected by media type or by their markers")
{
    CHECK(EventStreamReconstructor::detect("text/event-stream; charset=utf-8", ""));
    CHECK(EventStreamReconstructor::detect("text/plain",
                                           "event: message_start\ndata: {}\n\nevent: message_stop\ndata: {}\n\n"));
    CHECK_FALSE(EventStreamReconstructor::detect("application/json", "{\"event\":1}"));

    json response = {{"status", 200},
                     {"headers", json::array({{{"name", "Content-Type"}, {"value", "text/event-stream"}}})},
                     {"content", {{"text", ""}}}};
    CHECK(EventStreamReconstructor::detect(response));
    CHECK_FALSE(EventStreamReconstructor::detect(json::object()));
    CHECK_FALSE(EventStreamReconstructor::detect(json("text")));
}

TEST_CASE("Summaries count events by type")
{
    ParsedStream parsed = EventStreamReconstructor::parse(sse("ping", "{}") + sse("ping", "{}") +
                                                          sse("message_stop", "{}"));
    EventSummary summary = EventStreamReconstructor::summarize(parsed.events);

    CHECK(summary.total == 3);
    CHECK(summary.byType["ping"] == 2);
    CHECK(summary.toJson()["by_type"]["message_stop"] == 1);
}
