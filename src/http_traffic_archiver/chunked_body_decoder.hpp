#ifndef CHUNKED_BODY_DECODER_HPP
#define CHUNKED_BODY_DECODER_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "archive_types.hpp"

// Raised when chunk framing is structurally broken. The stream is desynchronized
// at that point, so callers get the error instead of a truncated body.
class StructuralDecodeError : public std::runtime_error
{
   public:
    explicit StructuralDecodeError(const std::string& what)
        : std::runtime_error("malformed chunk framing: " + what)
    {
    }
};

// One chunk as it appeared on the wire. Offsets index the framed input.
struct Chunk
{
    std::string sizeHex;
    size_t size{0};
    size_t offset{0};      // start of the size line
    size_t dataOffset{0};  // first data byte
    size_t endOffset{0};   // one past the CRLF following the data
    std::string data;
};

struct ChunkedBody
{
    std::string body;
    std::vector<Chunk> chunks;
    HeaderList trailers;
};

// HTTP/1.1 Transfer-Encoding: chunked
class ChunkedBodyDecoder
{
   public:
    // Throws StructuralDecodeError on missing delimiters, bad sizes or overruns
    static ChunkedBody decode(std::string_view framed);

    // True iff Transfer-Encoding lists the chunked coding
    static bool detect(const RawHeaders& headers);

    // True when framed holds the terminal chunk and the blank line after the trailers,
    // or when the framing is already known to be broken (decode() then reports why).
    // False while more bytes are needed.
    static bool isComplete(std::string_view framed);

    // Bytes the complete framing occupies, trailers included. 0 while incomplete,
    // framed.size() once the framing is known to be broken.
    static size_t framedLength(std::string_view framed);

    // Frames body using the given chunk sizes followed by the terminal chunk. Zero
    // sizes are skipped since an empty chunk terminates the body. Bytes left over
    // after the listed sizes go into one last chunk.
    static std::string encode(std::string_view body, const std::vector<size_t>& chunkSizes);
};

#endif  // CHUNKED_BODY_DECODER_HPP
