#include "content_formatter.hpp"

#include <sstream>
#include <stdexcept>
#include <string_view>
#include <unordered_set>

#include "har_fields.hpp"
#include "logger.hpp"

using nlohmann::json;

namespace
{

constexpr int INDENT_SIZE = 2;

std::string quote(const std::string& s)
{
    return json(s).dump(-1, ' ', false, json::error_handler_t::replace);
}

std::length_error too_deep()
{
    return std::length_error("nesting deeper than " + std::to_string(ContentFormatter::MAX_NESTING_DEPTH) +
                             " levels");
}

// Bracket nesting of JSON text, ignoring brackets inside strings; stops counting past limit
bool nests_deeper_than(std::string_view text, size_t limit)
{
    size_t depth = 0;
    bool in_string = false;
    for (size_t i = 0; i < text.size(); ++i)
    {
        char c = text[i];
        if (in_string)
        {
            if (c == '\\')
            {
                ++i;
            }
            else if (c == '"')
            {
                in_string = false;
            }
        }
        else if (c == '"')
        {
            in_string = true;
        }
        else if (c == '[' || c == '{')
        {
            if (++depth > limit)
            {
                return true;
            }
        }
        else if ((c == ']' || c == '}') && depth > 0)
        {
            --depth;
        }
    }
    return false;
}

class NodeWriter
{
   public:
    explicit NodeWriter(std::ostream& out) : m_out(out) {}

    void write(const ContentNode* node, int indent)
    {
        if (node == nullptr)
        {
            m_out << "null";
            return;
        }
        if (node->kind() == ContentNode::Kind::Scalar)
        {
            m_out << node->value().dump(-1, ' ', false, json::error_handler_t::replace);
            return;
        }
        if (m_path.count(node) != 0)
        {
            m_out << quote(ContentFormatter::CIRCULAR_SENTINEL);
            return;
        }

        if (m_path.size() >= ContentFormatter::MAX_NESTING_DEPTH)
        {
            throw too_deep();
        }

        m_path.insert(node);
        if (node->kind() == ContentNode::Kind::Array)
        {
            writeArray(*node, indent);
        }
        else
        {
            writeObject(*node, indent);
        }
        m_path.erase(node);
    }

   private:
    void writeArray(const ContentNode& node, int indent)
    {
        m_out << '[';
        bool first = true;
        for (const auto& item : node.items())
        {
            if (!first)
            {
                m_out << ", ";
            }
            first = false;
            write(item.get(), indent);
        }
        m_out << ']';
    }

    void writeObject(const ContentNode& node, int indent)
    {
        if (node.members().empty())
        {
            m_out << "{}";
            return;
        }
        const std::string pad(static_cast<size_t>(indent + INDENT_SIZE), ' ');
        m_out << "{\n";
        bool first = true;
        for (const auto& [key, child] : node.members())
        {
            if (!first)
            {
                m_out << ",\n";
            }
            first = false;
            m_out << pad << quote(key) << ": ";
            write(child.get(), indent + INDENT_SIZE);
        }
        m_out << '\n' << std::string(static_cast<size_t>(indent), ' ') << '}';
    }

    std::ostream& m_out;
    // nodes on the current descent, compared by address
    std::unordered_set<const ContentNode*> m_path;
};

}  // namespace

ContentNodePtr ContentNode::scalar(json value)
{
    ContentNodePtr node(new ContentNode(Kind::Scalar));
    node->m_value = std::move(value);
    return node;
}

ContentNodePtr ContentNode::array()
{
    return ContentNodePtr(new ContentNode(Kind::Array));
}

ContentNodePtr ContentNode::object()
{
    return ContentNodePtr(new ContentNode(Kind::Object));
}

ContentNodePtr ContentNode::fromJson(const json& value, size_t maxDepth)
{
    return fromJson(value, 0, maxDepth);
}

ContentNodePtr ContentNode::fromJson(const json& value, size_t depth, size_t maxDepth)
{
    if (!value.is_array() && !value.is_object())
    {
        return scalar(value);
    }
    if (depth >= maxDepth)
    {
        throw std::length_error("nesting deeper than " + std::to_string(maxDepth) + " levels");
    }

    if (value.is_array())
    {
        ContentNodePtr node = array();
        for (const auto& item : value)
        {
            node->push(fromJson(item, depth + 1, maxDepth));
        }
        return node;
    }
    ContentNodePtr node = object();
    for (auto it = value.begin(); it != value.end(); ++it)
    {
        node->m_members.emplace_back(it.key(), fromJson(it.value(), depth + 1, maxDepth));
    }
    return node;
}

void ContentNode::push(ContentNodePtr item)
{
    m_items.push_back(std::move(item));
}

void ContentNode::set(const std::string& key, ContentNodePtr child)
{
    for (auto& member : m_members)
    {
        if (member.first == key)
        {
            member.second = std::move(child);
            return;
        }
    }
    m_members.emplace_back(key, std::move(child));
}

void ContentNode::clear()
{
    m_items.clear();
    m_members.clear();
}

std::string ContentFormatter::format(const ContentNodePtr& node) const
{
    try
    {
        std::ostringstream out;
        NodeWriter(out).write(node.get(), 0);
        return out.str();
    }
    catch (const std::exception& e)
    {
        note(std::string("Error formatting content: ") + e.what());
        return std::string("[Error formatting content: ") + e.what() + "]";
    }
}

std::string ContentFormatter::formatJson(const json& value) const
{
    ContentNodePtr root;
    try
    {
        root = ContentNode::fromJson(value, MAX_NESTING_DEPTH);
    }
    catch (const std::length_error& e)
    {
        note(std::string("Error formatting content: ") + e.what());
        return std::string("[Error formatting content: ") + e.what() + "]";
    }
    return format(root);
}

bool ContentFormatter::isLikelyJson(const std::string& content)
{
    std::string_view trimmed = trim(content);
    if (trimmed.empty() || (trimmed.front() != '{' && trimmed.front() != '['))
    {
        return false;
    }
    if (nests_deeper_than(trimmed, MAX_NESTING_DEPTH))
    {
        return false;
    }
    return json::accept(trimmed.begin(), trimmed.end());
}

std::string ContentFormatter::formatContent(const std::string& content,
                                            const std::string& contentType) const
{
    if (content.empty())
    {
        return "";
    }

    bool json_type = to_lower(contentType).find("json") != std::string::npos;
    if (!json_type && !isLikelyJson(content))
    {
        return content;
    }
    if (nests_deeper_than(content, MAX_NESTING_DEPTH))
    {
        if (json_type)
        {
            note("Could not pretty-print " + contentType + " content: " + too_deep().what());
        }
        return content;
    }

    try
    {
        return formatJson(json::parse(content));
    }
    catch (const json::exception& e)
    {
        // declared json but not parseable; keep the body as it came
        LOG_DEBUG("Content is not JSON (" << contentType << "): " << e.what());
        if (json_type)
        {
            note("Could not pretty-print " + contentType + " content: " + e.what());
        }
        return content;
    }
}

void ContentFormatter::note(const std::string& message) const
{
    LOG_DEBUG(message);
    if (m_notes != nullptr)
    {
        m_notes->appendSystemNote(message);
    }
}
