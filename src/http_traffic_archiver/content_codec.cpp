#include "content_codec.hpp"

#include <brotli/decode.h>
#include <brotli/encode.h>
#include <zlib.h>

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "har_fields.hpp"
#include "logger.hpp"

constexpr size_t INFLATE_BUFFER_SIZE = 16 * 1024;
constexpr int GZIP_WINDOW_BITS = 16 + MAX_WBITS;
constexpr int ZLIB_WINDOW_BITS = MAX_WBITS;
constexpr int RAW_WINDOW_BITS = -MAX_WBITS;

namespace
{

CodecResult unchanged(std::string_view input, std::string error)
{
    CodecResult r;
    r.decoded = false;
    r.bytes.assign(input.data(), input.size());
    r.error = std::move(error);
    return r;
}

// Runs inflate with the given window bits. Concatenated gzip members are all decoded.
CodecResult inflate_with(std::string_view input, int window_bits)
{
    if (input.empty())
    {
        return unchanged(input, "empty input");
    }

    z_stream zs{};
    if (inflateInit2(&zs, window_bits) != Z_OK)
    {
        return unchanged(input, "inflateInit2 failed");
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    zs.avail_in = static_cast<uInt>(input.size());

    std::string out;
    char buffer[INFLATE_BUFFER_SIZE];
    int ret = Z_OK;

    while (true)
    {
        zs.next_out = reinterpret_cast<Bytef*>(buffer);
        zs.avail_out = sizeof(buffer);
        ret = inflate(&zs, Z_NO_FLUSH);
        out.append(buffer, sizeof(buffer) - zs.avail_out);

        if (ret == Z_STREAM_END)
        {
            if (window_bits == GZIP_WINDOW_BITS && zs.avail_in > 0)
            {
                // next gzip member
                if (inflateReset(&zs) != Z_OK)
                {
                    break;
                }
                continue;
            }
            break;
        }
        if (ret != Z_OK)
        {
            break;
        }
        if (zs.avail_in == 0 && zs.avail_out != 0)
        {
            // input exhausted before the end of stream
            ret = Z_BUF_ERROR;
            break;
        }
    }

    std::string message = zs.msg != nullptr ? zs.msg : "";
    inflateEnd(&zs);

    if (ret != Z_STREAM_END)
    {
        if (message.empty())
        {
            message = ret == Z_BUF_ERROR ? "unexpected end of data" : "zlib error " + std::to_string(ret);
        }
        return unchanged(input, message);
    }

    CodecResult r;
    r.decoded = true;
    r.bytes = std::move(out);
    return r;
}

std::string deflate_with(std::string_view input, int window_bits)
{
    z_stream zs{};
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, window_bits, 8, Z_DEFAULT_STRATEGY) !=
        Z_OK)
    {
        throw std::runtime_error("deflateInit2 failed");
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    zs.avail_in = static_cast<uInt>(input.size());

    std::string out;
    char buffer[INFLATE_BUFFER_SIZE];
    int ret = Z_OK;
    do
    {
        zs.next_out = reinterpret_cast<Bytef*>(buffer);
        zs.avail_out = sizeof(buffer);
        ret = deflate(&zs, Z_FINISH);
        out.append(buffer, sizeof(buffer) - zs.avail_out);
    } while (ret == Z_OK);

    deflateEnd(&zs);
    if (ret != Z_STREAM_END)
    {
        throw std::runtime_error("deflate failed: " + std::to_string(ret));
    }
    return out;
}

}  // namespace

CodecResult ContentCodec::gunzip(std::string_view input)
{
    return inflate_with(input, GZIP_WINDOW_BITS);
}

CodecResult ContentCodec::inflateZlib(std::string_view input)
{
    return inflate_with(input, ZLIB_WINDOW_BITS);
}

CodecResult ContentCodec::inflateRaw(std::string_view input)
{
    return inflate_with(input, RAW_WINDOW_BITS);
}

CodecResult ContentCodec::brotliDecode(std::string_view input)
{
    if (input.empty())
    {
        return unchanged(input, "empty input");
    }

    BrotliDecoderState* state = BrotliDecoderCreateInstance(nullptr, nullptr, nullptr);
    if (state == nullptr)
    {
        return unchanged(input, "BrotliDecoderCreateInstance failed");
    }

    size_t available_in = input.size();
    const uint8_t* next_in = reinterpret_cast<const uint8_t*>(input.data());
    std::string out;
    uint8_t buffer[INFLATE_BUFFER_SIZE];
    BrotliDecoderResult result = BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT;

    while (result == BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT)
    {
        size_t available_out = sizeof(buffer);
        uint8_t* next_out = buffer;
        result = BrotliDecoderDecompressStream(state, &available_in, &next_in, &available_out,
                                               &next_out, nullptr);
        out.append(reinterpret_cast<const char*>(buffer), sizeof(buffer) - available_out);
    }

    std::string error;
    if (result == BROTLI_DECODER_RESULT_ERROR)
    {
        error = BrotliDecoderErrorString(BrotliDecoderGetErrorCode(state));
    }
    else if (result == BROTLI_DECODER_RESULT_NEEDS_MORE_INPUT)
    {
        error = "unexpected end of data";
    }
    else if (available_in > 0)
    {
        error = "trailing data after end of stream";
        result = BROTLI_DECODER_RESULT_ERROR;
    }
    BrotliDecoderDestroyInstance(state);

    if (result != BROTLI_DECODER_RESULT_SUCCESS)
    {
        return unchanged(input, error);
    }

    CodecResult r;
    r.decoded = true;
    r.bytes = std::move(out);
    return r;
}

CodecResult ContentCodec::firstSuccess(const std::vector<CodecAttempt>& attempts,
                                       std::string_view input)
{
    CodecResult last = unchanged(input, "no decoder attempted");
    for (const auto& attempt : attempts)
    {
        last = attempt(input);
        if (last.decoded)
        {
            return last;
        }
    }
    return last;
}

CodecResult ContentCodec::decodeStage(const std::string& encoding, std::string_view input)
{
    if (encoding == "gzip" || encoding == "x-gzip")
    {
        return gunzip(input);
    }
    if (encoding == "deflate")
    {
        // servers disagree on whether "deflate" carries the zlib wrapper
        return firstSuccess({&ContentCodec::inflateZlib, &ContentCodec::inflateRaw}, input);
    }
    if (encoding == "br")
    {
        return brotliDecode(input);
    }
    return unchanged(input, "unsupported content encoding");
}

bool ContentCodec::hasGzipMagic(std::string_view bytes)
{
    return bytes.size() >= 2 && static_cast<uint8_t>(bytes[0]) == 0x1F &&
           static_cast<uint8_t>(bytes[1]) == 0x8B;
}

bool ContentCodec::hasZlibHeader(std::string_view bytes)
{
    if (bytes.size() < 2 || static_cast<uint8_t>(bytes[0]) != 0x78)
    {
        return false;
    }
    uint8_t flg = static_cast<uint8_t>(bytes[1]);
    return flg == 0x01 || flg == 0x9C || flg == 0xDA;
}

std::vector<std::string> ContentCodec::splitEncodings(const std::string& header)
{
    std::vector<std::string> tokens;
    std::string_view rest(header);
    while (!rest.empty())
    {
        size_t comma = rest.find(',');
        std::string_view token = trim(rest.substr(0, comma));
        if (!token.empty())
        {
            tokens.push_back(to_lower(token));
        }
        if (comma == std::string_view::npos)
        {
            break;
        }
        rest.remove_prefix(comma + 1);
    }
    return tokens;
}

std::string ContentCodec::decompress(std::string_view bytes, const std::string& contentEncoding) const
{
    if (bytes.empty())
    {
        return "";
    }

    std::string current(bytes);
    bool decompressed = false;

    auto stages = splitEncodings(contentEncoding);
    for (auto it = stages.rbegin(); it != stages.rend(); ++it)
    {
        if (*it == "identity")
        {
            continue;
        }
        CodecResult r = decodeStage(*it, current);
        if (r.decoded)
        {
            LOG_DEBUG("Decoded " << *it << " stage: " << current.size() << " -> " << r.bytes.size()
                                 << " bytes");
            current = std::move(r.bytes);
            decompressed = true;
        }
        else
        {
            note("Decompression error (" + *it + "): " + r.error);
        }
    }

    // only the 3+ byte bodies are worth sniffing
    if (!decompressed && bytes.size() >= 3)
    {
        if (hasGzipMagic(bytes))
        {
            CodecResult r = gunzip(bytes);
            if (r.decoded)
            {
                current = std::move(r.bytes);
                decompressed = true;
                note("Auto-detected gzip compression and decompressed successfully");
            }
        }
        else if (hasZlibHeader(bytes))
        {
            CodecResult r = inflateZlib(bytes);
            if (r.decoded)
            {
                current = std::move(r.bytes);
                note("Auto-detected zlib compression and decompressed successfully");
            }
            else
            {
                r = inflateRaw(bytes);
                if (r.decoded)
                {
                    current = std::move(r.bytes);
                    note("Auto-detected raw deflate compression and decompressed successfully");
                }
            }
        }
    }

    return toText(current);
}

std::string ContentCodec::encode(std::string_view input, const std::string& encoding)
{
    if (encoding == "gzip" || encoding == "x-gzip")
    {
        return deflate_with(input, GZIP_WINDOW_BITS);
    }
    if (encoding == "deflate")
    {
        return deflate_with(input, ZLIB_WINDOW_BITS);
    }
    if (encoding == "br")
    {
        size_t encoded_size = BrotliEncoderMaxCompressedSize(input.size());
        if (encoded_size == 0)
        {
            encoded_size = input.size() + 1024;
        }
        std::string out(encoded_size, '\0');
        if (!BrotliEncoderCompress(BROTLI_DEFAULT_QUALITY, BROTLI_DEFAULT_WINDOW, BROTLI_MODE_GENERIC,
                                   input.size(), reinterpret_cast<const uint8_t*>(input.data()),
                                   &encoded_size, reinterpret_cast<uint8_t*>(&out[0])))
        {
            throw std::runtime_error("BrotliEncoderCompress failed");
        }
        out.resize(encoded_size);
        return out;
    }
    if (encoding == "identity")
    {
        return std::string(input);
    }
    throw std::runtime_error("unsupported content encoding: " + encoding);
}

bool ContentCodec::isValidUtf8(std::string_view bytes)
{
    size_t i = 0;
    while (i < bytes.size())
    {
        uint8_t c = static_cast<uint8_t>(bytes[i]);
        size_t extra = 0;
        uint32_t cp = 0;
        if (c < 0x80)
        {
            ++i;
            continue;
        }
        else if ((c & 0xE0) == 0xC0)
        {
            extra = 1;
            cp = c & 0x1F;
        }
        else if ((c & 0xF0) == 0xE0)
        {
            extra = 2;
            cp = c & 0x0F;
        }
        else if ((c & 0xF8) == 0xF0)
        {
            extra = 3;
            cp = c & 0x07;
        }
        else
        {
            return false;
        }

        if (i + extra >= bytes.size())
        {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k)
        {
            uint8_t cc = static_cast<uint8_t>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80)
            {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        // overlong forms, surrogates, out of range
        if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000) ||
            cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
        {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

std::string ContentCodec::hexDump(std::string_view bytes)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < bytes.size(); ++i)
    {
        if (i > 0)
        {
            oss << ' ';
        }
        oss << std::setw(2) << static_cast<int>(static_cast<uint8_t>(bytes[i]));
    }
    return oss.str();
}

std::string ContentCodec::toText(std::string_view bytes)
{
    if (isValidUtf8(bytes))
    {
        return std::string(bytes);
    }
    return hexDump(bytes);
}

void ContentCodec::note(const std::string& message) const
{
    LOG_DEBUG(message);
    if (m_notes != nullptr)
    {
        m_notes->appendSystemNote(message);
    }
}
