#ifndef ARCHIVE_TYPES_HPP
#define ARCHIVE_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// One header as it arrived from the observer; repeated headers keep every value
struct RawHeader
{
    std::string name;
    std::vector<std::string> values;
};

using RawHeaders = std::vector<RawHeader>;

// Canonical (name, value) pair used for headers, query strings and form params
struct NameValue
{
    std::string name;
    std::string value;
};

using HeaderList = std::vector<NameValue>;

struct Cookie
{
    std::string name;
    std::string value;
    std::optional<std::string> path;
    std::optional<std::string> domain;
    std::optional<std::string> expires;
    std::optional<bool> httpOnly;
    std::optional<bool> secure;
};

struct PostData
{
    std::string mimeType;
    std::string text;
    std::vector<NameValue> params;  // only for form encoded bodies
};

struct HarRequest
{
    std::string method;
    std::string url;
    std::string httpVersion{"HTTP/1.1"};
    HeaderList headers;
    std::vector<Cookie> cookies;
    std::vector<NameValue> queryString;
    int64_t headersSize{-1};
    int64_t bodySize{0};
    std::optional<PostData> postData;
};

struct HarContent
{
    int64_t size{0};
    int64_t compression{0};
    std::string mimeType;
    std::string text;
};

struct HarResponse
{
    int status{0};  // 0 until the exchange is closed
    std::string statusText;
    std::string httpVersion{"HTTP/1.1"};
    HeaderList headers;
    std::vector<Cookie> cookies;
    HarContent content;
    std::string redirectURL;
    int64_t headersSize{-1};
    int64_t bodySize{-1};
};

// Phase durations in milliseconds, -1 means "not applicable"
struct HarTimings
{
    int64_t blocked{-1};
    int64_t dns{-1};
    int64_t connect{-1};
    int64_t ssl{-1};
    int64_t send{0};
    int64_t wait{0};
    int64_t receive{0};
};

struct ArchiveEntry
{
    std::string id;
    std::string pageref;
    std::string startedDateTime;
    int64_t time{0};
    HarRequest request;
    HarResponse response;
    HarTimings timings;
    std::string serverIPAddress;
    bool secure{false};
    std::string sourceTag;
    bool closed{false};
};

struct ArchivePage
{
    std::string id;
    std::string title;
    std::string startedDateTime;
};

#endif  // ARCHIVE_TYPES_HPP
