// Copyright 2026 uamask Authors
// SPDX-License-Identifier: MIT

// OrderedHeaders - HTTP headers with O(1) case-insensitive lookup and
// insertion order preservation.
// Data-oriented design: struct with public data, free functions operate on data.

#ifndef UAMASK_HTTP_ORDERED_HEADERS_H_
#define UAMASK_HTTP_ORDERED_HEADERS_H_

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "uamask/types.h"

namespace uamask {
namespace http {
namespace headers {

// Case-insensitive hash for header names
struct CaseInsensitiveHash {
  size_t operator()(std::string_view s) const noexcept;
};

// Case-insensitive equality for header names
struct CaseInsensitiveEqual {
  bool operator()(std::string_view a, std::string_view b) const noexcept;
};

// OrderedHeaders: HTTP headers with O(1) lookup and insertion order.
//
// - Public data: headers vector + index map
// - Index keys view names owned by the vector, so never copy the struct
//   directly; use Copy() which rebuilds the index.
struct OrderedHeaders {
  // Contiguous storage
  std::vector<Header> headers;

  // name -> index of first occurrence
  std::unordered_map<std::string_view, size_t, CaseInsensitiveHash,
                     CaseInsensitiveEqual>
      index;
};

// === Single-value operations ===

// Set header (replaces if exists, inserts at end if not)
void Set(OrderedHeaders& h, std::string_view name, std::string_view value);

// Insert header only when no header of that name exists.
// Returns true if inserted.
bool SetIfAbsent(OrderedHeaders& h, std::string_view name,
                 std::string_view value);

// Get header value (returns empty if not found)
std::string_view Get(const OrderedHeaders& h, std::string_view name);

// Check if header exists
bool Has(const OrderedHeaders& h, std::string_view name);

// Remove every header with this name (returns true if any removed)
bool Delete(OrderedHeaders& h, std::string_view name);

// Remove every header whose name starts with prefix, case-insensitively.
// Returns number of headers removed.
size_t DeleteWithPrefix(OrderedHeaders& h, std::string_view prefix);

// Add header (allows duplicates, appends to end)
void Add(OrderedHeaders& h, std::string_view name, std::string_view value);

// === Utility ===

// Clear all headers
void Clear(OrderedHeaders& h);

// Rebuild index after structural changes
void RebuildIndex(OrderedHeaders& h);

// Build from vector
OrderedHeaders FromVector(const std::vector<Header>& headers);

// Copy headers (rebuilds index to point to new strings)
OrderedHeaders Copy(const OrderedHeaders& h);

}  // namespace headers
}  // namespace http
}  // namespace uamask

#endif  // UAMASK_HTTP_ORDERED_HEADERS_H_
