#include <doctest/doctest.h>

#include "content_formatter.hpp"
#include "test_support.hpp"

using nlohmann::json;

TEST_CASE("Arrays print on one line and objects one member per line")
{
    ContentFormatter formatter;
    json value = json::parse(R"({"a":[1,2,"x"],"b":{"c":true},"d":{}})");

    CHECK(formatter.formatJson(value) ==
          "{\n"
          "  \"a\": [1, 2, \"x\"],\n"
          "  \"b\": {\n"
          "    \"c\": true\n"
          "  },\n"
          "  \"d\": {}\n"
          "}");
    CHECK(formatter.formatJson(json::array()) == "[]");
    CHECK(formatter.formatJson(json("plain")) == "\"plain\"");
}

TEST_CASE("A node that contains itself prints the sentinel")
{
    ContentFormatter formatter;
    ContentNodePtr node = ContentNode::object();
    node->set("name", ContentNode::scalar("loop"));
    node->set("self", node);

    std::string out = formatter.format(node);

    CHECK(out == "{\n  \"name\": \"loop\",\n  \"self\": \"[Circular reference]\"\n}");
    node->clear();
}

TEST_CASE("Cycles through arrays are cut at the repeated node")
{
    ContentFormatter formatter;
    ContentNodePtr list = ContentNode::array();
    ContentNodePtr holder = ContentNode::object();
    holder->set("list", list);
    list->push(ContentNode::scalar(1));
    list->push(holder);

    CHECK(formatter.format(list) == "[1, {\n  \"list\": \"[Circular reference]\"\n}]");
    list->clear();
}

TEST_CASE("Shared siblings that are not cycles print in full")
{
    ContentFormatter formatter;
    ContentNodePtr shared = ContentNode::array();
    shared->push(ContentNode::scalar("v"));
    ContentNodePtr root = ContentNode::array();
    root->push(shared);
    root->push(shared);

    CHECK(formatter.format(root) == "[[\"v\"], [\"v\"]]");
}

TEST_CASE("Long strings and deep nesting are not truncated")
{
    ContentFormatter formatter;
    std::string long_text(10000, 'x');
    json deep = long_text;
    for (int i = 0; i < 50; ++i)
    {
        deep = json::array({deep});
    }

    std::string out = formatter.formatJson(deep);
    CHECK(out.find(long_text) != std::string::npos);
    CHECK(out.substr(0, 50) == std::string(50, '['));
}

TEST_CASE("JSON content is pretty-printed by type or by shape")
{
    ContentFormatter formatter;

    CHECK(formatter.formatContent(R"({"a":1})", "application/json") == "{\n  \"a\": 1\n}");
    CHECK(formatter.formatContent(R"([1,2])", "") == "[1, 2]");
    CHECK(formatter.formatContent("a=1&b=2", "application/x-www-form-urlencoded") == "a=1&b=2");
    CHECK(formatter.formatContent("", "application/json") == "");
}

TEST_CASE("Declared JSON that does not parse degrades to the raw text")
{
    RecordingNotes notes;
    ContentFormatter formatter(&notes);

    CHECK(formatter.formatContent("{broken", "application/json") == "{broken");
    CHECK(notes.contains("Could not pretty-print application/json"));

    notes.notes.clear();
    CHECK(formatter.formatContent("{broken", "text/plain") == "{broken");
    CHECK(notes.notes.empty());
}

TEST_CASE("Bodies nested past the depth limit degrade to the raw text")
{
    RecordingNotes notes;
    ContentFormatter formatter(&notes);
    const std::string deep = std::string(200000, '[') + std::string(200000, ']');

    CHECK(formatter.formatContent(deep, "application/json") == deep);
    REQUIRE(notes.notes.size() == 1);
    CHECK(notes.contains("Could not pretty-print application/json"));
    CHECK(notes.contains("nesting deeper than"));

    notes.notes.clear();
    CHECK(formatter.formatContent(deep, "") == deep);
    CHECK(notes.notes.empty());
    CHECK_FALSE(ContentFormatter::isLikelyJson(deep));

    // brackets inside strings do not count
    const std::string quoted = "{\"k\": \"" + std::string(1000, '[') + "\"}";
    CHECK(formatter.formatContent(quoted, "application/json") ==
          "{\n  \"k\": \"" + std::string(1000, '[') + "\"\n}");
}

TEST_CASE("Values and graphs past the depth limit print an error instead")
{
    RecordingNotes notes;
    ContentFormatter formatter(&notes);

    json deep = 1;
    ContentNodePtr chain = ContentNode::scalar(1);
    for (size_t i = 0; i <= ContentFormatter::MAX_NESTING_DEPTH; ++i)
    {
        deep = json::array({deep});
        ContentNodePtr parent = ContentNode::array();
        parent->push(chain);
        chain = parent;
    }

    CHECK(formatter.formatJson(deep).rfind("[Error formatting content: nesting deeper than", 0) == 0);
    CHECK(formatter.format(chain).rfind("[Error formatting content: nesting deeper than", 0) == 0);
    CHECK(notes.notes.size() == 2);

    json shallow = 1;
    for (size_t i = 0; i < ContentFormatter::MAX_NESTING_DEPTH; ++i)
    {
        shallow = json::array({shallow});
    }
    CHECK(formatter.formatJson(shallow) ==
          std::string(ContentFormatter::MAX_NESTING_DEPTH, '[') + "1" +
              std::string(ContentFormatter::MAX_NESTING_DEPTH, ']'));
}

TEST_CASE("JSON shape heuristic")
{
    CHECK(ContentFormatter::isLikelyJson("  {\"a\": [1]}  "));
    CHECK(ContentFormatter::isLikelyJson("[]"));
    CHECK_FALSE(ContentFormatter::isLikelyJson("\"string\""));
    CHECK_FALSE(ContentFormatter::isLikelyJson("{oops}"));
    CHECK_FALSE(ContentFormatter::isLikelyJson(""));
}
