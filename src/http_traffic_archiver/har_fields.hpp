#ifndef HAR_FIELDS_HPP
#define HAR_FIELDS_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "archive_types.hpp"

// Pieces of an absolute or origin-form URL needed for correlation keys
struct UrlParts
{
    std::string scheme;
    std::string host;  // includes ":port" when present
    std::string path;  // path plus query, "/" when empty
    std::string query; // without the leading '?'
};

bool iequals(std::string_view a, std::string_view b);
std::string to_lower(std::string_view s);
std::string_view trim(std::string_view s);

// Groups header lines by case-insensitive name, keeping first-seen order
RawHeaders group_header_lines(const std::vector<std::pair<std::string, std::string>>& lines);

// Returns nullptr when the header is absent
const RawHeader* find_header(const RawHeaders& headers, std::string_view name);

// All values of a header joined with ", ", empty when absent
std::string header_value(const RawHeaders& headers, std::string_view name);

// One entry per distinct header, multiple values joined once
HeaderList normalize_headers(const RawHeaders& headers);

// Size of the serialized header block: sum of name + ": " + value + CRLF, plus the final CRLF
int64_t headers_size(const HeaderList& headers);

std::vector<Cookie> parse_request_cookies(const RawHeaders& headers);
std::vector<Cookie> parse_set_cookies(const RawHeaders& headers);

UrlParts split_url(const std::string& url);

// Decodes %XX escapes and '+' as space. Malformed escapes are kept literally.
std::string url_decode(std::string_view s);

// Splits "a=1&b=2" into decoded pairs
std::vector<NameValue> parse_form_params(std::string_view encoded);
std::vector<NameValue> parse_query_string(const std::string& url);

// ISO-8601 UTC timestamp with millisecond precision, e.g. 2024-01-02T03:04:05.678Z
std::string iso8601(std::chrono::system_clock::time_point tp);

#endif  // HAR_FIELDS_HPP
