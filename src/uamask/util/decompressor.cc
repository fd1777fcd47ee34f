// Copyright 2026 uamask Authors
// SPDX-License-Identifier: MIT

#include "uamask/util/decompressor.h"

#include <brotli/decode.h>
#include <zlib.h>
#include <zstd.h>

#include <algorithm>
#include <string>

#include "uamask/util/sv_util.h"

namespace uamask {
namespace util {

namespace {

// Initial output estimate, grown by doubling
size_t InitialOutputSize(size_t len) {
  return std::clamp<size_t>(len * 4, 1024, kMaxDecompressedSize);
}

// Inflate with the given zlib window bits:
//   16 + MAX_WBITS  gzip wrapper
//   MAX_WBITS       zlib wrapper
//   -MAX_WBITS      raw deflate
Result<Bytes> Inflate(const uint8_t* data, size_t len, int window_bits,
                      const char* what) {
  z_stream strm = {};
  if (inflateInit2(&strm, window_bits) != Z_OK) {
    return Error::Decode(std::string("Failed to initialize zlib for ") + what);
  }

  Bytes output(InitialOutputSize(len));
  strm.avail_in = static_cast<uInt>(len);
  strm.next_in = const_cast<Bytef*>(data);
  strm.avail_out = static_cast<uInt>(output.size());
  strm.next_out = output.data();

  int ret = Z_OK;
  while (ret != Z_STREAM_END) {
    ret = inflate(&strm, Z_NO_FLUSH);

    if (ret == Z_STREAM_END) {
      break;
    }

    if (ret == Z_OK && strm.avail_out == 0) {
      // Need more output space
      size_t new_size = output.size() * 2;
      if (new_size > kMaxDecompressedSize) {
        inflateEnd(&strm);
        return Error::Decode("Decompressed size exceeds limit");
      }
      output.resize(new_size);
      strm.avail_out = static_cast<uInt>(new_size - strm.total_out);
      strm.next_out = output.data() + strm.total_out;
      continue;
    }

    if (ret != Z_OK) {
      // Z_BUF_ERROR with output space left means truncated input
      std::string message = std::string(what) + " decompression failed: " +
                            (strm.msg ? strm.msg : "truncated input");
      inflateEnd(&strm);
      return Error::Decode(message);
    }
  }

  output.resize(strm.total_out);
  inflateEnd(&strm);
  return output;
}

}  // namespace

ContentEncoding ParseContentEncoding(std::string_view value) {
  value = sv::Trim(value);
  if (value.empty()) {
    return ContentEncoding::kIdentity;
  }

  std::string normalized = sv::ToLower(value);

  if (normalized == "br" || normalized == "brotli") {
    return ContentEncoding::kBrotli;
  }
  if (normalized == "gzip" || normalized == "x-gzip") {
    return ContentEncoding::kGzip;
  }
  if (normalized == "deflate") {
    return ContentEncoding::kDeflate;
  }
  if (normalized == "zstd") {
    return ContentEncoding::kZstd;
  }
  if (normalized == "identity") {
    return ContentEncoding::kIdentity;
  }
  return ContentEncoding::kUnknown;
}

const char* ContentEncodingToString(ContentEncoding encoding) {
  switch (encoding) {
    case ContentEncoding::kIdentity:
      return "identity";
    case ContentEncoding::kGzip:
      return "gzip";
    case ContentEncoding::kDeflate:
      return "deflate";
    case ContentEncoding::kBrotli:
      return "br";
    case ContentEncoding::kZstd:
      return "zstd";
    case ContentEncoding::kUnknown:
      return "unknown";
  }
  return "unknown";
}

bool LooksLikeGzip(const uint8_t* data, size_t len) {
  return len >= 2 && data[0] == 0x1f && data[1] == 0x8b;
}

Result<Bytes> DecompressGzip(const uint8_t* data, size_t len) {
  if (len == 0) return Bytes{};
  return Inflate(data, len, 16 + MAX_WBITS, "gzip");
}

Result<Bytes> DecompressDeflate(const uint8_t* data, size_t len) {
  if (len == 0) return Bytes{};

  // Servers disagree on "deflate": zlib-wrapped per RFC, raw in practice
  auto wrapped = Inflate(data, len, MAX_WBITS, "deflate");
  if (wrapped) {
    return wrapped;
  }
  return Inflate(data, len, -MAX_WBITS, "deflate");
}

Result<Bytes> DecompressBrotli(const uint8_t* data, size_t len) {
  if (len == 0) return Bytes{};

  BrotliDecoderState* state =
      BrotliDecoderCreateInstance(nullptr, nullptr, nullptr);
  if (!state) {
    return Error::Decode("Failed to create Brotli decoder");
  }

  Bytes output(InitialOutputSize(len));
  size_t available_in = len;
  const uint8_t* next_in = data;
  size_t available_out = output.size();
  uint8_t* next_out = output.data();
  size_t total_out = 0;

  BrotliDecoderResult result;
  do {
    result = BrotliDecoderDecompressStream(
        state, &available_in, &next_in, &available_out, &next_out, &total_out);

    if (result == BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT) {
      size_t new_size = output.size() * 2;
      if (new_size > kMaxDecompressedSize) {
        BrotliDecoderDestroyInstance(state);
        return Error::Decode("Decompressed size exceeds limit");
      }
      output.resize(new_size);
      available_out = new_size - total_out;
      next_out = output.data() + total_out;
    }
  } while (result == BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT);

  BrotliDecoderDestroyInstance(state);

  if (result != BROTLI_DECODER_RESULT_SUCCESS) {
    return Error::Decode("Brotli decompression failed");
  }
  output.resize(total_out);
  return output;
}

Result<Bytes> DecompressZstd(const uint8_t* data, size_t len) {
  if (len == 0) return Bytes{};

  unsigned long long content_size = ZSTD_getFrameContentSize(data, len);
  if (content_size == ZSTD_CONTENTSIZE_ERROR) {
    return Error::Decode("Invalid Zstd frame");
  }
  if (content_size != ZSTD_CONTENTSIZE_UNKNOWN &&
      content_size > kMaxDecompressedSize) {
    return Error::Decode("Decompressed size exceeds limit");
  }

  if (content_size != ZSTD_CONTENTSIZE_UNKNOWN) {
    Bytes output(static_cast<size_t>(content_size));
    size_t result = ZSTD_decompress(output.data(), output.size(), data, len);
    if (ZSTD_isError(result)) {
      return Error::Decode(std::string("Zstd decompression failed: ") +
                           ZSTD_getErrorName(result));
    }
    output.resize(result);
    return output;
  }

  // Size unknown: stream into a growing buffer
  ZSTD_DCtx* dctx = ZSTD_createDCtx();
  if (!dctx) {
    return Error::Decode("Failed to create Zstd decoder");
  }

  Bytes output;
  Bytes chunk(ZSTD_DStreamOutSize());
  ZSTD_inBuffer in = {data, len, 0};
  ZSTD_outBuffer out = {chunk.data(), chunk.size(), 0};
  size_t ret = 0;
  // A full output chunk means the decoder may still hold buffered data,
  // so keep draining after the input is consumed
  do {
    out = {chunk.data(), chunk.size(), 0};
    ret = ZSTD_decompressStream(dctx, &out, &in);
    if (ZSTD_isError(ret)) {
      ZSTD_freeDCtx(dctx);
      return Error::Decode(std::string("Zstd decompression failed: ") +
                           ZSTD_getErrorName(ret));
    }
    if (output.size() + out.pos > kMaxDecompressedSize) {
      ZSTD_freeDCtx(dctx);
      return Error::Decode("Decompressed size exceeds limit");
    }
    output.insert(output.end(), chunk.data(), chunk.data() + out.pos);
  } while (in.pos < in.size || out.pos == out.size);

  if (ret != 0) {
    // Input ended inside a frame
    ZSTD_freeDCtx(dctx);
    return Error::Decode("Zstd stream is truncated");
  }
  ZSTD_freeDCtx(dctx);
  return output;
}

Result<Bytes> Decompress(ContentEncoding encoding, const uint8_t* data,
                         size_t len) {
  switch (encoding) {
    case ContentEncoding::kGzip:
      return DecompressGzip(data, len);
    case ContentEncoding::kDeflate:
      return DecompressDeflate(data, len);
    case ContentEncoding::kBrotli:
      return DecompressBrotli(data, len);
    case ContentEncoding::kZstd:
      return DecompressZstd(data, len);
    case ContentEncoding::kIdentity:
      return Bytes(data, data + len);
    case ContentEncoding::kUnknown:
      break;
  }
  return Error::Decode("Unsupported content encoding");
}

}  // namespace util
}  // namespace uamask
