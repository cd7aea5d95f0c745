#ifndef DBDOCK_RUNTIME_DECODER_HPP
#define DBDOCK_RUNTIME_DECODER_HPP

#include "errors.hpp"
#include "http_message.hpp"

#include <string>
#include <string_view>

namespace dbdock::runtime {

enum class BodyMode {
  Text,  // chunk framing removed, then sanitized
  Binary // chunk framing removed, bytes otherwise untouched
};

// Splits a raw response into status, headers and body. Accepts CRLF and
// bare-LF framing. Anything that does not start with an HTTP/1.x status
// line is a Decode error.
GatewayResult<RawResponse> decode_response(std::string_view raw,
                                           BodyMode mode = BodyMode::Text);

// Simplified chunked-transfer decode. Chunk-size lines delimit the
// payloads, but nothing is validated: a short final chunk is taken as-is,
// trailers are dropped, and a size line that is not hex ends decoding with
// the remainder appended verbatim.
std::string dechunk(std::string_view body);

// Drops C0/C1 control characters (keeping tab and newline), normalizes CRLF
// and CR to LF, trims surrounding whitespace. Lossy by intent.
std::string sanitize_text(std::string_view body);

// Stricter pass run right before a JSON parse: also drops tab/newline and
// the escaped NUL sequence.
std::string sanitize_for_json(std::string_view body);

} // namespace dbdock::runtime

#endif // DBDOCK_RUNTIME_DECODER_HPP
