#ifndef EVENT_STREAM_RECONSTRUCTOR_HPP
#define EVENT_STREAM_RECONSTRUCTOR_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

// Every block keeps all three kinds of delta. The variant records the started type,
// the other members collect deltas that arrive for a block of a different type.
struct TextBlock
{
    std::string text;
    std::string thinking;
    nlohmann::json fields = nlohmann::json::object();
};

struct ToolUseBlock
{
    nlohmann::json fields = nlohmann::json::object();
    std::string text;
    std::string thinking;
};

struct ThinkingBlock
{
    std::string thinking;
    std::string text;
    nlohmann::json fields = nlohmann::json::object();
};

// Created for unrecognized block types and for deltas whose index was never started
struct UnknownBlock
{
    std::string declaredType;
    std::string text;
    std::string thinking;
    nlohmann::json fields = nlohmann::json::object();
};

using ContentBlock = std::variant<TextBlock, ToolUseBlock, ThinkingBlock, UnknownBlock>;

const char* content_block_type(const ContentBlock& block);

constexpr size_t MAX_BLOCK_INDEX = 4096;

// One logical response folded from a message event stream
struct ReconstructedMessage
{
    std::optional<std::string> id;
    std::optional<std::string> role;
    std::optional<std::string> model;
    std::optional<nlohmann::json> usage;
    std::optional<std::string> stopReason;
    std::optional<std::string> stopSequence;
    std::map<size_t, ContentBlock> content;  // sparse, keyed by block index up to MAX_BLOCK_INDEX
    std::optional<nlohmann::json> error;
    std::vector<nlohmann::json> errors;  // events that could not be folded

    // Returns the block at index, creating an UnknownBlock when none exists
    ContentBlock& upsertBlock(size_t index);

    // Replaces whatever is stored at index
    void startBlock(size_t index, ContentBlock block);

    // content renders as an array; indexes never started render as null
    nlohmann::json toJson() const;
};

struct StreamEvent
{
    std::string type;
    nlohmann::json data;     // {"raw": ..., "parse_error": ...} when parseError is set
    bool parseError{false};
};

struct ParsedStream
{
    std::vector<StreamEvent> events;
    ReconstructedMessage message;
};

struct EventSummary
{
    size_t total{0};
    std::map<std::string, size_t> byType;

    nlohmann::json toJson() const;
};

// Server-sent event streams of the message_start / content_block_* / message_stop kind.
// Never throws: broken payloads become marked events, broken folds land in message.errors.
class EventStreamReconstructor
{
   public:
    static ParsedStream parse(const std::string& text);

    // contentType: the response Content-Type value; body: the response text
    static bool detect(const std::string& contentType, const std::string& body);

    // HAR response object with "headers" and "content.text"
    static bool detect(const nlohmann::json& response);

    static EventSummary summarize(const std::vector<StreamEvent>& events);

    // Applies one event to message. Throws nlohmann::json::exception on unusable payloads
    // and std::out_of_range for block indexes that are not integers in [0, MAX_BLOCK_INDEX].
    static void applyEvent(const std::string& type, const nlohmann::json& data,
                           ReconstructedMessage& message);
};

#endif  // EVENT_STREAM_RECONSTRUCTOR_HPP
