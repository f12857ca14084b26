#include "event_stream_reconstructor.hpp"

#include <cstdint>
#include <stdexcept>

#include "har_fields.hpp"
#include "logger.hpp"

using nlohmann::json;

namespace
{

template <class... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

std::optional<std::string> optional_string(const json& obj, const char* key)
{
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
    {
        return std::nullopt;
    }
    if (it->is_string())
    {
        return it->get<std::string>();
    }
    return it->dump();
}

void shallow_merge(json& target, const json& patch)
{
    if (!patch.is_object())
    {
        return;
    }
    for (auto it = patch.begin(); it != patch.end(); ++it)
    {
        target[it.key()] = it.value();
    }
}

void merge_usage(std::optional<json>& usage, const json& patch)
{
    if (!patch.is_object())
    {
        return;
    }
    if (!usage || !usage->is_object())
    {
        usage = json::object();
    }
    shallow_merge(*usage, patch);
}

// "event: x" -> "x"; the single optional space after the colon belongs to the syntax
std::string field_value(std::string_view line, size_t name_len)
{
    std::string_view value = line.substr(name_len + 1);
    if (!value.empty() && value.front() == ' ')
    {
        value.remove_prefix(1);
    }
    return std::string(value);
}

size_t block_index(const json& data)
{
    const json& index = data.at("index");
    if (!index.is_number_unsigned() || index.get<uint64_t>() > MAX_BLOCK_INDEX)
    {
        throw std::out_of_range("content block index " + index.dump() + " is not in [0, " +
                                std::to_string(MAX_BLOCK_INDEX) + "]");
    }
    return index.get<size_t>();
}

}  // namespace

const char* content_block_type(const ContentBlock& block)
{
    return std::visit(overloaded{
                          [](const TextBlock&) { return "text"; },
                          [](const ToolUseBlock&) { return "tool_use"; },
                          [](const ThinkingBlock&) { return "thinking"; },
                          [](const UnknownBlock&) { return "unknown"; },
                      },
                      block);
}

ContentBlock& ReconstructedMessage::upsertBlock(size_t index)
{
    auto it = content.find(index);
    if (it == content.end())
    {
        it = content.emplace(index, UnknownBlock{}).first;
    }
    return it->second;
}

void ReconstructedMessage::startBlock(size_t index, ContentBlock block)
{
    content[index] = std::move(block);
}

json ReconstructedMessage::toJson() const
{
    json out = json::object();
    if (id) out["id"] = *id;
    if (role) out["role"] = *role;
    if (model) out["model"] = *model;
    if (usage) out["usage"] = *usage;
    if (stopReason) out["stop_reason"] = *stopReason;
    if (stopSequence) out["stop_sequence"] = *stopSequence;

    json blocks = json::array();
    size_t next = 0;
    for (const auto& [index, block] : content)
    {
        for (; next < index; ++next)
        {
            blocks.push_back(nullptr);
        }
        json b = {{"type", content_block_type(block)}};
        std::visit(overloaded{
                       [&](const TextBlock& t) { b["text"] = t.text; },
                       [&](const ToolUseBlock& t) { b["tool_use"] = t.fields; },
                       [&](const ThinkingBlock& t) { b["thinking"] = t.thinking; },
                       [&](const UnknownBlock& u) {
                           if (!u.declaredType.empty()) b["declared_type"] = u.declaredType;
                           b["text"] = u.text;
                       },
                   },
                   block);
        std::visit(
            [&](const auto& any) {
                if (!b.contains("text") && !any.text.empty()) b["text"] = any.text;
                if (!b.contains("thinking") && !any.thinking.empty()) b["thinking"] = any.thinking;
                if (!b.contains("tool_use") && !any.fields.empty()) b["tool_use"] = any.fields;
            },
            block);
        blocks.push_back(std::move(b));
        next = index + 1;
    }
    out["content"] = std::move(blocks);

    if (error) out["error"] = *error;
    if (!errors.empty()) out["errors"] = errors;
    return out;
}

json EventSummary::toJson() const
{
    json by_type = json::object();
    for (const auto& [type, count] : byType)
    {
        by_type[type] = count;
    }
    return {{"total", total}, {"by_type", by_type}};
}

void EventStreamReconstructor::applyEvent(const std::string& type, const json& data,
                                          ReconstructedMessage& message)
{
    if (type == "message_start")
    {
        auto it = data.find("message");
        if (it == data.end() || !it->is_object())
        {
            return;
        }
        const json& m = *it;
        message.id = optional_string(m, "id");
        message.role = optional_string(m, "role");
        message.model = optional_string(m, "model");
        auto usage = m.find("usage");
        if (usage != m.end() && !usage->is_null())
        {
            message.usage = *usage;
        }
        message.stopReason = optional_string(m, "stop_reason");
        message.stopSequence = optional_string(m, "stop_sequence");
    }
    else if (type == "content_block_start")
    {
        size_t index = block_index(data);
        std::string block_type = "unknown";
        auto cb = data.find("content_block");
        if (cb != data.end() && cb->is_object())
        {
            block_type = cb->value("type", "unknown");
        }

        if (block_type == "text")
            message.startBlock(index, TextBlock{});
        else if (block_type == "tool_use")
            message.startBlock(index, ToolUseBlock{});
        else if (block_type == "thinking")
            message.startBlock(index, ThinkingBlock{});
        else
            message.startBlock(index, UnknownBlock{block_type == "unknown" ? "" : block_type});
    }
    else if (type == "content_block_delta")
    {
        size_t index = block_index(data);
        const json& delta = data.at("delta");
        std::string delta_type = delta.value("type", "");
        ContentBlock& block = message.upsertBlock(index);

        if (delta_type == "text_delta")
        {
            std::string text = delta.value("text", "");
            std::visit([&](auto& b) { b.text += text; }, block);
        }
        else if (delta_type == "thinking_delta")
        {
            std::string thinking = delta.value("thinking", "");
            std::visit([&](auto& b) { b.thinking += thinking; }, block);
        }
        else if (delta_type == "tool_use_delta")
        {
            json patch = delta.value("tool_use", json::object());
            std::visit([&](auto& b) { shallow_merge(b.fields, patch); }, block);
        }
    }
    else if (type == "message_delta")
    {
        auto delta = data.find("delta");
        if (delta != data.end() && delta->is_object())
        {
            auto stop_reason = optional_string(*delta, "stop_reason");
            if (stop_reason && !stop_reason->empty())
            {
                message.stopReason = stop_reason;
            }
            auto stop_sequence = optional_string(*delta, "stop_sequence");
            if (stop_sequence && !stop_sequence->empty())
            {
                message.stopSequence = stop_sequence;
            }
            auto usage = delta->find("usage");
            if (usage != delta->end())
            {
                merge_usage(message.usage, *usage);
            }
        }
        auto usage = data.find("usage");
        if (usage != data.end())
        {
            merge_usage(message.usage, *usage);
        }
    }
    else if (type == "error")
    {
        message.error = data;
    }
    // ping, message_stop, content_block_stop and unknown types do not change the message
}

ParsedStream EventStreamReconstructor::parse(const std::string& text)
{
    ParsedStream result;
    if (text.empty())
    {
        return result;
    }

    std::string normalized;
    normalized.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i)
    {
        if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n')
        {
            continue;
        }
        normalized.push_back(text[i]);
    }

    std::string_view rest(normalized);
    while (!rest.empty())
    {
        size_t boundary = rest.find("\n\n");
        std::string_view block = rest.substr(0, boundary);
        rest = boundary == std::string_view::npos ? std::string_view() : rest.substr(boundary + 2);

        if (trim(block).empty())
        {
            continue;
        }

        std::optional<std::string> type;
        std::optional<std::string> payload;
        while (!block.empty())
        {
            size_t nl = block.find('\n');
            std::string_view line = block.substr(0, nl);
            block = nl == std::string_view::npos ? std::string_view() : block.substr(nl + 1);

            if (line.rfind("event:", 0) == 0)
            {
                type = std::string(trim(field_value(line, 5)));
            }
            else if (line.rfind("data:", 0) == 0)
            {
                if (payload)
                {
                    *payload += '\n';
                    *payload += field_value(line, 4);
                }
                else
                {
                    payload = field_value(line, 4);
                }
            }
        }

        if (!type || !payload)
        {
            continue;
        }

        StreamEvent event;
        event.type = *type;
        try
        {
            event.data = json::parse(*payload);
        }
        catch (const json::parse_error& e)
        {
            event.parseError = true;
            event.data = {{"raw", *payload}, {"parse_error", e.what()}};
        }

        if (!event.parseError)
        {
            try
            {
                applyEvent(event.type, event.data, result.message);
            }
            catch (const std::exception& e)
            {
                LOG_DEBUG("Could not fold " << event.type << " event: " << e.what());
                result.message.errors.push_back(
                    {{"event_type", event.type}, {"error", e.what()}, {"data", event.data}});
            }
        }
        result.events.push_back(std::move(event));
    }

    return result;
}

bool EventStreamReconstructor::detect(const std::string& contentType, const std::string& body)
{
    if (to_lower(contentType).find("text/event-stream") != std::string::npos)
    {
        return true;
    }
    return body.find("event: message_start") != std::string::npos &&
           body.find("data: {") != std::string::npos &&
           body.find("event: message_stop") != std::string::npos;
}

bool EventStreamReconstructor::detect(const json& response)
{
    if (!response.is_object())
    {
        return false;
    }

    std::string content_type;
    auto headers = response.find("headers");
    if (headers != response.end() && headers->is_array())
    {
        for (const auto& h : *headers)
        {
            if (!h.is_object())
            {
                continue;
            }
            auto name = h.find("name");
            auto value = h.find("value");
            if (name != h.end() && name->is_string() &&
                iequals(name->get<std::string>(), "content-type"))
            {
                if (value != h.end() && value->is_string())
                {
                    content_type = value->get<std::string>();
                }
                break;
            }
        }
    }

    std::string body;
    auto content = response.find("content");
    if (content != response.end() && content->is_object())
    {
        auto text = content->find("text");
        if (text != content->end() && text->is_string())
        {
            body = text->get<std::string>();
        }
    }
    return detect(content_type, body);
}

EventSummary EventStreamReconstructor::summarize(const std::vector<StreamEvent>& events)
{
    EventSummary summary;
    summary.total = events.size();
    for (const auto& e : events)
    {
        ++summary.byType[e.type];
    }
    return summary;
}
