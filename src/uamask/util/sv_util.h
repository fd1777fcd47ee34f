// Copyright 2026 uamask Authors
// SPDX-License-Identifier: MIT

// String view utilities - locale-free ASCII operations used by the identity
// parser and header policy.

#ifndef UAMASK_UTIL_SV_UTIL_H_
#define UAMASK_UTIL_SV_UTIL_H_

#include <charconv>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace uamask {
namespace sv {

// Trim ASCII whitespace from both ends (no allocation)
inline std::string_view Trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t' ||
                        s.front() == '\n' || s.front() == '\r')) {
    s.remove_prefix(1);
  }
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' ||
                        s.back() == '\n' || s.back() == '\r')) {
    s.remove_suffix(1);
  }
  return s;
}

// Branchless ASCII lowercase character (avoids std::tolower locale overhead)
inline constexpr char ToLowerChar(char c) {
  return static_cast<char>(c + ((c >= 'A' && c <= 'Z') * 32));
}

// Case-insensitive equality (no allocation)
inline bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (ToLowerChar(a[i]) != ToLowerChar(b[i])) {
      return false;
    }
  }
  return true;
}

// Convert to lowercase string
inline std::string ToLower(std::string_view s) {
  std::string result;
  result.resize_and_overwrite(s.size(), [&](char* buf, size_t n) {
    for (size_t i = 0; i < n; ++i) {
      buf[i] = ToLowerChar(s[i]);
    }
    return n;
  });
  return result;
}

// Check if string starts with prefix (case-insensitive)
inline bool StartsWithIgnoreCase(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() &&
         EqualsIgnoreCase(s.substr(0, prefix.size()), prefix);
}

// Find substring case-insensitively (npos if absent)
inline size_t FindIgnoreCase(std::string_view haystack,
                             std::string_view needle) {
  if (needle.size() > haystack.size()) return std::string_view::npos;
  for (size_t i = 0; i + needle.size() <= haystack.size(); ++i) {
    if (EqualsIgnoreCase(haystack.substr(i, needle.size()), needle)) {
      return i;
    }
  }
  return std::string_view::npos;
}

// Parse a base-10 integer that spans the whole (trimmed) input.
// Returns nullopt on empty input, stray characters or overflow.
inline std::optional<int> ParseInt(std::string_view s) {
  s = Trim(s);
  if (s.empty()) return std::nullopt;
  int value = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc() || ptr != s.data() + s.size()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace sv
}  // namespace uamask

#endif  // UAMASK_UTIL_SV_UTIL_H_
