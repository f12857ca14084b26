#ifndef CONTENT_CODEC_HPP
#define CONTENT_CODEC_HPP

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "note_sink.hpp"

// Outcome of one decode attempt. On failure bytes holds the unchanged input.
struct CodecResult
{
    bool decoded{false};
    std::string bytes;
    std::string error;
};

using CodecAttempt = std::function<CodecResult(std::string_view)>;

// Content-Encoding decoding with signature based fallback.
// Never throws from decompress(); failures are noted and the data passes through.
class ContentCodec
{
   public:
    explicit ContentCodec(NoteSink* notes = nullptr) : m_notes(notes) {}

    // Decodes a body whose Content-Encoding header is contentEncoding (may be empty
    // or a comma list such as "gzip, br"). Stages are undone in reverse order.
    std::string decompress(std::string_view bytes, const std::string& contentEncoding = "") const;

    // Single stage by token: gzip, x-gzip, deflate, br. Unknown tokens fail.
    static CodecResult decodeStage(const std::string& encoding, std::string_view input);

    // Tries attempts left to right and returns the first success, or the last failure
    static CodecResult firstSuccess(const std::vector<CodecAttempt>& attempts, std::string_view input);

    static CodecResult gunzip(std::string_view input);
    static CodecResult inflateZlib(std::string_view input);
    static CodecResult inflateRaw(std::string_view input);
    static CodecResult brotliDecode(std::string_view input);

    static bool hasGzipMagic(std::string_view bytes);
    static bool hasZlibHeader(std::string_view bytes);

    // Compresses with gzip, deflate (zlib stream) or br. Throws std::runtime_error.
    static std::string encode(std::string_view input, const std::string& encoding);

    // Valid UTF-8 is returned unchanged, anything else as a space separated lowercase hex dump
    static std::string toText(std::string_view bytes);
    static std::string hexDump(std::string_view bytes);
    static bool isValidUtf8(std::string_view bytes);

    // Lower-cased, trimmed tokens of a Content-Encoding value, in application order
    static std::vector<std::string> splitEncodings(const std::string& header);

   private:
    void note(const std::string& message) const;

    NoteSink* m_notes;
};

#endif  // CONTENT_CODEC_HPP
