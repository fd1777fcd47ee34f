// Copyright 2026 uamask Authors
// SPDX-License-Identifier: MIT

#ifndef UAMASK_UTIL_DECOMPRESSOR_H_
#define UAMASK_UTIL_DECOMPRESSOR_H_

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include "uamask/types.h"

namespace uamask {
namespace util {

using Bytes = std::vector<uint8_t>;

// Content-Encoding types
enum class ContentEncoding {
  kIdentity,  // No compression (pass-through)
  kGzip,
  kDeflate,
  kBrotli,
  kZstd,
  kUnknown
};

// Parse Content-Encoding header value to enum
// Handles: "br", "gzip", "x-gzip", "deflate", "zstd", "identity"
ContentEncoding ParseContentEncoding(std::string_view value);

// Convert encoding enum to string (for debugging)
const char* ContentEncodingToString(ContentEncoding encoding);

// Maximum decompressed size (100MB) to prevent decompression bombs
inline constexpr size_t kMaxDecompressedSize = 100 * 1024 * 1024;

// Whether data starts with the gzip magic bytes 1f 8b
bool LooksLikeGzip(const uint8_t* data, size_t len);

// Decompress data based on Content-Encoding.
// Identity passes data through; kUnknown is a kDecodeError.
Result<Bytes> Decompress(ContentEncoding encoding, const uint8_t* data,
                         size_t len);

// Individual decompression functions
Result<Bytes> DecompressGzip(const uint8_t* data, size_t len);
Result<Bytes> DecompressDeflate(const uint8_t* data, size_t len);
Result<Bytes> DecompressBrotli(const uint8_t* data, size_t len);
Result<Bytes> DecompressZstd(const uint8_t* data, size_t len);

}  // namespace util
}  // namespace uamask

#endif  // UAMASK_UTIL_DECOMPRESSOR_H_
