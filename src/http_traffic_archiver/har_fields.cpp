#include "har_fields.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

bool iequals(std::string_view a, std::string_view b)
{
    if (a.size() != b.size())
    {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
        {
            return false;
        }
    }
    return true;
}

std::string to_lower(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view s)
{
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin])))
    {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])))
    {
        --end;
    }
    return s.substr(begin, end - begin);
}

RawHeaders group_header_lines(const std::vector<std::pair<std::string, std::string>>& lines)
{
    RawHeaders grouped;
    for (const auto& [name, value] : lines)
    {
        auto it = std::find_if(grouped.begin(), grouped.end(),
                               [&](const RawHeader& h) { return iequals(h.name, name); });
        if (it == grouped.end())
        {
            grouped.push_back(RawHeader{name, {value}});
        }
        else
        {
            it->values.push_back(value);
        }
    }
    return grouped;
}

const RawHeader* find_header(const RawHeaders& headers, std::string_view name)
{
    for (const auto& h : headers)
    {
        if (iequals(h.name, name))
        {
            return &h;
        }
    }
    return nullptr;
}

static std::string join_values(const std::vector<std::string>& values)
{
    std::string joined;
    for (size_t i = 0; i < values.size(); ++i)
    {
        if (i > 0)
        {
            joined += ", ";
        }
        joined += values[i];
    }
    return joined;
}

std::string header_value(const RawHeaders& headers, std::string_view name)
{
    const RawHeader* h = find_header(headers, name);
    return h != nullptr ? join_values(h->values) : std::string();
}

HeaderList normalize_headers(const RawHeaders& headers)
{
    HeaderList out;
    out.reserve(headers.size());
    for (const auto& h : headers)
    {
        out.push_back(NameValue{h.name, join_values(h.values)});
    }
    return out;
}

int64_t headers_size(const HeaderList& headers)
{
    int64_t size = 0;
    for (const auto& h : headers)
    {
        size += static_cast<int64_t>(h.name.size()) + 2 + static_cast<int64_t>(h.value.size()) + 2;
    }
    return size + 2;
}

// "name=value" split at the first '='; a segment without '=' is a bare name
static std::pair<std::string, std::string> split_pair(std::string_view segment)
{
    segment = trim(segment);
    size_t eq = segment.find('=');
    if (eq == std::string_view::npos)
    {
        return {std::string(segment), std::string()};
    }
    return {std::string(trim(segment.substr(0, eq))), std::string(trim(segment.substr(eq + 1)))};
}

static std::vector<std::string_view> split(std::string_view s, char sep)
{
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (true)
    {
        size_t pos = s.find(sep, start);
        if (pos == std::string_view::npos)
        {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::vector<Cookie> parse_request_cookies(const RawHeaders& headers)
{
    std::vector<Cookie> cookies;
    const RawHeader* h = find_header(headers, "cookie");
    if (h == nullptr)
    {
        return cookies;
    }
    for (const auto& line : h->values)
    {
        for (auto part : split(line, ';'))
        {
            auto [name, value] = split_pair(part);
            if (!name.empty())
            {
                Cookie c;
                c.name = std::move(name);
                c.value = std::move(value);
                cookies.push_back(std::move(c));
            }
        }
    }
    return cookies;
}

std::vector<Cookie> parse_set_cookies(const RawHeaders& headers)
{
    std::vector<Cookie> cookies;
    const RawHeader* h = find_header(headers, "set-cookie");
    if (h == nullptr)
    {
        return cookies;
    }
    for (const auto& line : h->values)
    {
        auto parts = split(line, ';');
        auto [name, value] = split_pair(parts.front());
        if (name.empty())
        {
            continue;
        }

        Cookie c;
        c.name = std::move(name);
        c.value = std::move(value);
        for (size_t i = 1; i < parts.size(); ++i)
        {
            auto [attr, attr_value] = split_pair(parts[i]);
            std::string lower = to_lower(attr);
            if (lower == "expires")
            {
                c.expires = attr_value;
            }
            else if (lower == "path")
            {
                c.path = attr_value;
            }
            else if (lower == "domain")
            {
                c.domain = attr_value;
            }
            else if (lower == "httponly")
            {
                c.httpOnly = true;
            }
            else if (lower == "secure")
            {
                c.secure = true;
            }
        }
        cookies.push_back(std::move(c));
    }
    return cookies;
}

UrlParts split_url(const std::string& url)
{
    UrlParts parts;
    std::string_view rest(url);

    size_t scheme_end = rest.find("://");
    if (scheme_end != std::string_view::npos)
    {
        parts.scheme = to_lower(rest.substr(0, scheme_end));
        rest.remove_prefix(scheme_end + 3);
        size_t path_start = rest.find_first_of("/?#");
        parts.host = std::string(rest.substr(0, path_start));
        rest = path_start == std::string_view::npos ? std::string_view() : rest.substr(path_start);
    }

    size_t fragment = rest.find('#');
    if (fragment != std::string_view::npos)
    {
        rest = rest.substr(0, fragment);
    }

    parts.path = rest.empty() || rest.front() == '?' ? "/" + std::string(rest) : std::string(rest);
    size_t q = rest.find('?');
    if (q != std::string_view::npos)
    {
        parts.query = std::string(rest.substr(q + 1));
    }
    return parts;
}

static int hex_digit(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string url_decode(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i)
    {
        if (s[i] == '+')
        {
            out.push_back(' ');
        }
        else if (s[i] == '%' && i + 2 < s.size() && hex_digit(s[i + 1]) >= 0 &&
                 hex_digit(s[i + 2]) >= 0)
        {
            out.push_back(static_cast<char>(hex_digit(s[i + 1]) * 16 + hex_digit(s[i + 2])));
            i += 2;
        }
        else
        {
            out.push_back(s[i]);
        }
    }
    return out;
}

std::vector<NameValue> parse_form_params(std::string_view encoded)
{
    std::vector<NameValue> params;
    if (encoded.empty())
    {
        return params;
    }
    for (auto part : split(encoded, '&'))
    {
        if (part.empty())
        {
            continue;
        }
        size_t eq = part.find('=');
        if (eq == std::string_view::npos)
        {
            params.push_back(NameValue{url_decode(part), std::string()});
        }
        else
        {
            params.push_back(NameValue{url_decode(part.substr(0, eq)), url_decode(part.substr(eq + 1))});
        }
    }
    return params;
}

std::vector<NameValue> parse_query_string(const std::string& url)
{
    return parse_form_params(split_url(url).query);
}

std::string iso8601(std::chrono::system_clock::time_point tp)
{
    using namespace std::chrono;
    auto ms = duration_cast<milliseconds>(tp.time_since_epoch()).count();
    time_t secs = static_cast<time_t>(ms / 1000);
    struct tm utc;
    gmtime_r(&secs, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << (ms % 1000) << 'Z';
    return oss.str();
}
