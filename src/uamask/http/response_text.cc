// Copyright 2026 uamask Authors
// SPDX-License-Identifier: MIT

#include "uamask/http/response_text.h"

#include <picohttpparser.h>

#include <cctype>
#include <cstring>
#include <utility>

#include "uamask/util/decompressor.h"
#include "uamask/util/log.h"
#include "uamask/util/sv_util.h"

namespace uamask {
namespace http {

namespace {

// Chunk framing starts with a hex size line: "1a2b\r\n" or "1a;ext\r\n"
bool LooksChunked(const std::vector<uint8_t>& body) {
  size_t i = 0;
  while (i < body.size() && std::isxdigit(body[i])) {
    ++i;
  }
  if (i == 0 || i >= body.size()) {
    return false;
  }
  return body[i] == '\r' || body[i] == ';';
}

bool IsLatin1Charset(std::string_view charset) {
  return charset == "iso-8859-1" || charset == "latin1" ||
         charset == "latin-1" || charset == "iso8859-1";
}

// Decode chunk framing in place, resizing body to the decoded length.
// Returns the phr_decode_chunked status: -1 malformed, -2 incomplete.
ssize_t RemoveChunkFraming(std::vector<uint8_t>& body) {
  phr_chunked_decoder decoder = {};
  decoder.consume_trailer = 1;

  size_t len = body.size();
  ssize_t pret = phr_decode_chunked(
      &decoder, reinterpret_cast<char*>(body.data()), &len);
  if (pret != -1) {
    body.resize(len);
  }
  return pret;
}

}  // namespace

Result<std::vector<uint8_t>> DecodeChunked(std::vector<uint8_t> body) {
  ssize_t pret = RemoveChunkFraming(body);
  if (pret == -1) {
    return Error::Decode("Failed to decode chunked response");
  }
  if (pret == -2) {
    // Incomplete framing: keep what was decoded
    log::Warn("Chunked response body is truncated");
  }
  return body;
}

std::string ParseCharset(std::string_view content_type) {
  size_t pos = sv::FindIgnoreCase(content_type, "charset=");
  if (pos == std::string_view::npos) {
    return {};
  }
  std::string_view value = content_type.substr(pos + 8);
  value = value.substr(0, value.find(';'));
  value = sv::Trim(value);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    value = value.substr(1, value.size() - 2);
  }
  return sv::ToLower(value);
}

std::string Latin1ToUtf8(std::string_view latin1) {
  std::string result;
  result.reserve(latin1.size());
  for (char c : latin1) {
    auto byte = static_cast<unsigned char>(c);
    if (byte < 0x80) {
      result += c;
    } else {
      result += static_cast<char>(0xC0 | (byte >> 6));
      result += static_cast<char>(0x80 | (byte & 0x3F));
    }
  }
  return result;
}

Result<std::string> DecodeResponseText(const RawResponse& response) {
  std::vector<uint8_t> body = response.body;

  std::string_view transfer_encoding =
      headers::Get(response.headers, "transfer-encoding");
  if (sv::FindIgnoreCase(transfer_encoding, "chunked") !=
          std::string_view::npos &&
      LooksChunked(body)) {
    // A body the transport already de-chunked can still open with a
    // hex-looking line; only complete framing is taken as chunked
    std::vector<uint8_t> dechunked = body;
    if (RemoveChunkFraming(dechunked) >= 0) {
      body = std::move(dechunked);
    } else {
      log::Warn("Chunked response body has no complete framing; "
                "using it as is");
    }
  }

  std::string_view encoding_header =
      headers::Get(response.headers, "content-encoding");
  util::ContentEncoding encoding = util::ParseContentEncoding(encoding_header);

  // Some servers compress without declaring it
  if (encoding == util::ContentEncoding::kIdentity &&
      util::LooksLikeGzip(body.data(), body.size())) {
    encoding = util::ContentEncoding::kGzip;
  }

  if (encoding != util::ContentEncoding::kIdentity) {
    auto decoded = util::Decompress(encoding, body.data(), body.size());
    if (!decoded) {
      return Error::Decode(std::string("Cannot decode ") +
                           util::ContentEncodingToString(encoding) +
                           " body: " + decoded.error().message());
    }
    body = std::move(decoded).value();
  }

  std::string text(body.begin(), body.end());
  std::string charset =
      ParseCharset(headers::Get(response.headers, "content-type"));
  if (IsLatin1Charset(charset)) {
    return Latin1ToUtf8(text);
  }
  return text;
}

}  // namespace http
}  // namespace uamask
