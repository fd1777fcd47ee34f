// Copyright 2026 uamask Authors
// SPDX-License-Identifier: MIT

#include "uamask/http/ordered_headers.h"

#include <algorithm>

#include "uamask/util/sv_util.h"

namespace uamask {
namespace http {
namespace headers {

namespace {

// Append a header, keeping index keys valid across vector reallocation
void Append(OrderedHeaders& h, std::string_view name, std::string_view value) {
  size_t old_capacity = h.headers.capacity();
  size_t idx = h.headers.size();
  h.headers.push_back({std::string(name), std::string(value)});

  if (h.headers.capacity() != old_capacity) {
    // Strings moved; every key view must be re-pointed
    RebuildIndex(h);
    return;
  }
  h.index.try_emplace(h.headers[idx].name, idx);
}

}  // namespace

// FNV-1a hash with case folding - no allocation
size_t CaseInsensitiveHash::operator()(std::string_view s) const noexcept {
  size_t hash = 14695981039346656037ULL;  // FNV offset basis
  for (char c : s) {
    hash ^= static_cast<unsigned char>(sv::ToLowerChar(c));
    hash *= 1099511628211ULL;  // FNV prime
  }
  return hash;
}

bool CaseInsensitiveEqual::operator()(std::string_view a,
                                      std::string_view b) const noexcept {
  return sv::EqualsIgnoreCase(a, b);
}

void RebuildIndex(OrderedHeaders& h) {
  h.index.clear();
  for (size_t i = 0; i < h.headers.size(); ++i) {
    // Only store first occurrence of each name
    h.index.try_emplace(h.headers[i].name, i);
  }
}

OrderedHeaders Copy(const OrderedHeaders& h) {
  OrderedHeaders result;
  result.headers = h.headers;
  RebuildIndex(result);
  return result;
}

OrderedHeaders FromVector(const std::vector<Header>& headers) {
  OrderedHeaders result;
  result.headers = headers;
  RebuildIndex(result);
  return result;
}

void Set(OrderedHeaders& h, std::string_view name, std::string_view value) {
  auto it = h.index.find(name);
  if (it != h.index.end()) {
    // Update existing - preserve position
    h.headers[it->second].value = std::string(value);
    return;
  }
  Append(h, name, value);
}

bool SetIfAbsent(OrderedHeaders& h, std::string_view name,
                 std::string_view value) {
  if (Has(h, name)) {
    return false;
  }
  Append(h, name, value);
  return true;
}

std::string_view Get(const OrderedHeaders& h, std::string_view name) {
  auto it = h.index.find(name);
  if (it != h.index.end()) {
    return h.headers[it->second].value;
  }
  return {};
}

bool Has(const OrderedHeaders& h, std::string_view name) {
  return h.index.find(name) != h.index.end();
}

bool Delete(OrderedHeaders& h, std::string_view name) {
  if (!Has(h, name)) {
    return false;
  }

  // Copy the name: it may view a string we are about to erase
  std::string target(name);
  CaseInsensitiveEqual eq;
  auto new_end =
      std::remove_if(h.headers.begin(), h.headers.end(),
                     [&](const Header& hdr) { return eq(hdr.name, target); });
  h.headers.erase(new_end, h.headers.end());
  RebuildIndex(h);
  return true;
}

size_t DeleteWithPrefix(OrderedHeaders& h, std::string_view prefix) {
  std::string target(prefix);
  auto new_end = std::remove_if(
      h.headers.begin(), h.headers.end(), [&](const Header& hdr) {
        return sv::StartsWithIgnoreCase(hdr.name, target);
      });
  size_t removed = static_cast<size_t>(h.headers.end() - new_end);
  if (removed > 0) {
    h.headers.erase(new_end, h.headers.end());
    RebuildIndex(h);
  }
  return removed;
}

void Add(OrderedHeaders& h, std::string_view name, std::string_view value) {
  Append(h, name, value);
}

void Clear(OrderedHeaders& h) {
  h.headers.clear();
  h.index.clear();
}

}  // namespace headers
}  // namespace http
}  // namespace uamask
