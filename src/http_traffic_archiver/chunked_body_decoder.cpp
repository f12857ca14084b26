#include "chunked_body_decoder.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>

#include "har_fields.hpp"
#include "logger.hpp"

namespace
{

constexpr std::string_view CRLF = "\r\n";

enum class SizeParse
{
    Ok,
    Invalid,
    Overflow
};

// Parses the hex size, ignoring ";ext" and surrounding whitespace
SizeParse parse_chunk_size(std::string_view line, std::string& size_hex, size_t& size)
{
    size_t ext = line.find(';');
    size_hex = std::string(trim(ext == std::string_view::npos ? line : line.substr(0, ext)));
    if (size_hex.empty())
    {
        return SizeParse::Invalid;
    }

    size = 0;
    for (char c : size_hex)
    {
        int digit;
        if (c >= '0' && c <= '9')
            digit = c - '0';
        else if (c >= 'a' && c <= 'f')
            digit = c - 'a' + 10;
        else if (c >= 'A' && c <= 'F')
            digit = c - 'A' + 10;
        else
            return SizeParse::Invalid;

        if (size > (std::numeric_limits<size_t>::max() >> 4))
        {
            return SizeParse::Overflow;
        }
        size = (size << 4) | static_cast<size_t>(digit);
    }
    return SizeParse::Ok;
}

}  // namespace

ChunkedBody ChunkedBodyDecoder::decode(std::string_view framed)
{
    ChunkedBody result;
    size_t pos = 0;

    while (true)
    {
        size_t crlf = framed.find(CRLF, pos);
        if (crlf == std::string_view::npos)
        {
            throw StructuralDecodeError(pos >= framed.size() ? "missing terminating chunk"
                                                             : "missing chunk size delimiter");
        }

        Chunk chunk;
        chunk.offset = pos;
        switch (parse_chunk_size(framed.substr(pos, crlf - pos), chunk.sizeHex, chunk.size))
        {
            case SizeParse::Invalid:
                throw StructuralDecodeError("invalid chunk size '" + chunk.sizeHex + "' at offset " +
                                            std::to_string(pos));
            case SizeParse::Overflow:
                throw StructuralDecodeError("chunk size overflow at offset " + std::to_string(pos));
            case SizeParse::Ok:
                break;
        }

        pos = crlf + CRLF.size();
        chunk.dataOffset = pos;

        if (chunk.size == 0)
        {
            chunk.endOffset = pos;
            result.chunks.push_back(std::move(chunk));
            break;
        }

        if (chunk.size > framed.size() - pos || framed.size() - pos - chunk.size < CRLF.size())
        {
            throw StructuralDecodeError("incomplete chunk data at offset " + std::to_string(pos) +
                                        " (need " + std::to_string(chunk.size) + " bytes)");
        }
        if (framed.substr(pos + chunk.size, CRLF.size()) != CRLF)
        {
            throw StructuralDecodeError("missing chunk data delimiter at offset " +
                                        std::to_string(pos + chunk.size));
        }

        chunk.data.assign(framed.data() + pos, chunk.size);
        chunk.endOffset = pos + chunk.size + CRLF.size();
        result.body += chunk.data;
        pos = chunk.endOffset;
        result.chunks.push_back(std::move(chunk));
    }

    // trailer section, terminated by an empty line (tolerated when absent)
    while (pos < framed.size())
    {
        size_t crlf = framed.find(CRLF, pos);
        std::string_view line =
            framed.substr(pos, crlf == std::string_view::npos ? std::string_view::npos : crlf - pos);
        if (line.empty())
        {
            break;
        }
        size_t colon = line.find(':');
        if (colon != std::string_view::npos && colon > 0)
        {
            result.trailers.push_back(NameValue{std::string(trim(line.substr(0, colon))),
                                                std::string(trim(line.substr(colon + 1)))});
        }
        if (crlf == std::string_view::npos)
        {
            break;
        }
        pos = crlf + CRLF.size();
    }

    LOG_DEBUG("Decoded chunked body: chunks=" << result.chunks.size()
              << " body=" << result.body.size() << " trailers=" << result.trailers.size());
    return result;
}

bool ChunkedBodyDecoder::detect(const RawHeaders& headers)
{
    const RawHeader* te = find_header(headers, "transfer-encoding");
    if (te == nullptr)
    {
        return false;
    }
    for (const auto& value : te->values)
    {
        std::string_view rest(value);
        while (!rest.empty())
        {
            size_t comma = rest.find(',');
            std::string_view token = trim(rest.substr(0, comma));
            // transfer-coding parameters follow ';'
            token = trim(token.substr(0, token.find(';')));
            if (iequals(token, "chunked"))
            {
                return true;
            }
            if (comma == std::string_view::npos)
            {
                break;
            }
            rest.remove_prefix(comma + 1);
        }
    }
    return false;
}

bool ChunkedBodyDecoder::isComplete(std::string_view framed)
{
    return framedLength(framed) != 0;
}

size_t ChunkedBodyDecoder::framedLength(std::string_view framed)
{
    size_t pos = 0;
    while (true)
    {
        size_t crlf = framed.find(CRLF, pos);
        if (crlf == std::string_view::npos)
        {
            return 0;
        }

        std::string size_hex;
        size_t size = 0;
        if (parse_chunk_size(framed.substr(pos, crlf - pos), size_hex, size) != SizeParse::Ok)
        {
            return framed.size();
        }
        pos = crlf + CRLF.size();

        if (size == 0)
        {
            break;
        }
        if (size > framed.size() - pos || framed.size() - pos - size < CRLF.size())
        {
            return 0;
        }
        if (framed.substr(pos + size, CRLF.size()) != CRLF)
        {
            return framed.size();
        }
        pos += size + CRLF.size();
    }

    // trailers end with an empty line
    while (true)
    {
        size_t crlf = framed.find(CRLF, pos);
        if (crlf == std::string_view::npos)
        {
            return 0;
        }
        if (crlf == pos)
        {
            return crlf + CRLF.size();
        }
        pos = crlf + CRLF.size();
    }
}

std::string ChunkedBodyDecoder::encode(std::string_view body, const std::vector<size_t>& chunkSizes)
{
    std::ostringstream out;
    out << std::hex;
    size_t pos = 0;

    auto emit = [&](size_t n) {
        out << n << CRLF;
        out.write(body.data() + pos, static_cast<std::streamsize>(n));
        out << CRLF;
        pos += n;
    };

    for (size_t requested : chunkSizes)
    {
        size_t n = std::min(requested, body.size() - pos);
        if (n == 0)
        {
            continue;
        }
        emit(n);
    }
    if (pos < body.size())
    {
        emit(body.size() - pos);
    }
    out << "0" << CRLF << CRLF;
    return out.str();
}
