// Copyright 2026 uamask Authors
// SPDX-License-Identifier: MIT

// Response glue - turns a raw response body from the external transport into
// text for the caller's HTML/JSON parser.

#ifndef UAMASK_HTTP_RESPONSE_TEXT_H_
#define UAMASK_HTTP_RESPONSE_TEXT_H_

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "uamask/http/ordered_headers.h"
#include "uamask/types.h"

namespace uamask {
namespace http {

// Response as delivered by the transport: header metadata plus the body
// bytes exactly as read (possibly still chunk-framed and/or compressed)
struct RawResponse {
  headers::OrderedHeaders headers;
  std::vector<uint8_t> body;
};

// Decode a response body to UTF-8 text:
//   1. De-chunk when transfer-encoding is chunked and the body carries
//      complete chunk framing (otherwise the body is used as is)
//   2. Decompress per content-encoding
//   3. Gunzip bodies that carry gzip magic without a content-encoding
//   4. Transcode ISO-8859-1 to UTF-8 when the content-type says so
// Fails with kDecodeError.
Result<std::string> DecodeResponseText(const RawResponse& response);

// Remove HTTP/1.1 chunk framing. Fails with kDecodeError on malformed input.
Result<std::vector<uint8_t>> DecodeChunked(std::vector<uint8_t> body);

// Charset parameter of a content-type value, lowercased ("" if absent)
std::string ParseCharset(std::string_view content_type);

// ISO-8859-1 bytes to UTF-8
std::string Latin1ToUtf8(std::string_view latin1);

}  // namespace http
}  // namespace uamask

#endif  // UAMASK_HTTP_RESPONSE_TEXT_H_
