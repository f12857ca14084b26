#ifndef CONTENT_FORMATTER_HPP
#define CONTENT_FORMATTER_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "note_sink.hpp"

class ContentNode;
using ContentNodePtr = std::shared_ptr<ContentNode>;

// Structured value whose children are shared references, so a graph may
// contain the same node twice or point back at one of its ancestors.
class ContentNode
{
   public:
    enum class Kind
    {
        Scalar,
        Array,
        Object
    };

    static ContentNodePtr scalar(nlohmann::json value);
    static ContentNodePtr array();
    static ContentNodePtr object();
    // Throws std::length_error when value nests deeper than maxDepth
    static ContentNodePtr fromJson(const nlohmann::json& value, size_t maxDepth = SIZE_MAX);

    Kind kind() const { return m_kind; }
    const nlohmann::json& value() const { return m_value; }
    const std::vector<ContentNodePtr>& items() const { return m_items; }
    const std::vector<std::pair<std::string, ContentNodePtr>>& members() const { return m_members; }

    void push(ContentNodePtr item);

    // Replaces an existing member of the same name, otherwise appends
    void set(const std::string& key, ContentNodePtr child);

    // Drops all children; breaks reference cycles before release
    void clear();

   private:
    explicit ContentNode(Kind kind) : m_kind(kind) {}

    static ContentNodePtr fromJson(const nlohmann::json& value, size_t depth, size_t maxDepth);

    Kind m_kind;
    nlohmann::json m_value;
    std::vector<ContentNodePtr> m_items;
    std::vector<std::pair<std::string, ContentNodePtr>> m_members;
};

// Pretty printer for audit output: arrays on one line, objects one member per
// line with two-space indentation. Nothing is truncated.
class ContentFormatter
{
   public:
    static constexpr const char* CIRCULAR_SENTINEL = "[Circular reference]";
    // Deeper arrays and objects are not pretty-printed
    static constexpr size_t MAX_NESTING_DEPTH = 256;

    explicit ContentFormatter(NoteSink* notes = nullptr) : m_notes(notes) {}

    // A node that is already being printed further up renders as the sentinel string.
    // Graphs nested deeper than MAX_NESTING_DEPTH render as an error string.
    std::string format(const ContentNodePtr& node) const;

    std::string formatJson(const nlohmann::json& value) const;

    // Pretty-prints JSON text when contentType names json or the text looks like
    // JSON; otherwise, or when parsing fails or the text nests deeper than
    // MAX_NESTING_DEPTH, returns content unchanged.
    std::string formatContent(const std::string& content, const std::string& contentType = "") const;

    // Trimmed text starts with '{' or '[' and parses as JSON
    static bool isLikelyJson(const std::string& content);

   private:
    void note(const std::string& message) const;

    NoteSink* m_notes;
};

#endif  // CONTENT_FORMATTER_HPP
