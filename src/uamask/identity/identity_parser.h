// Copyright 2026 uamask Authors
// SPDX-License-Identifier: MIT

// Identity parser - decomposes a User-Agent string into browser and platform
// facts. Parsing never fails: fields that cannot be extracted fall back to
// "unknown" values (-1 versions, empty strings) and a diagnostic is logged.

#ifndef UAMASK_IDENTITY_IDENTITY_PARSER_H_
#define UAMASK_IDENTITY_IDENTITY_PARSER_H_

#include <optional>
#include <string>
#include <string_view>

namespace uamask {
namespace identity {

// Browser family indicated by a User-Agent
enum class BrowserFamily {
  kNone,  // No recognizable token
  kChrome,
  kEdge,
  kFirefox,
  kOpera,
  kSafari,
};

// Convert family to string (for debugging)
const char* BrowserFamilyToString(BrowserFamily family);

// Official brand shown in client hints ("Google Chrome", "Microsoft Edge",
// "Opera"). Empty for families without Chromium branding.
std::string_view BrandName(BrowserFamily family);

// Sentinel for versions that are unknown or not applicable
inline constexpr int kUnknownVersion = -1;

struct BrowserFacts {
  BrowserFamily family = BrowserFamily::kNone;
  int version = kUnknownVersion;

  // Major version of the Chromium engine, kUnknownVersion when the browser
  // is not Chromium-based
  int chromium_version = kUnknownVersion;

  bool UsesChromium() const { return chromium_version >= 0; }
};

struct PlatformFacts {
  std::string platform_type;  // e.g. "Windows NT 10.0", "Macintosh", "Linux"
  std::string os;             // e.g. "Windows", "Intel Mac OS X"
  std::string os_version;     // e.g. "NT 10.0", "10_15_7"
  bool is_mobile = false;
};

struct IdentityFacts {
  BrowserFacts browser;
  PlatformFacts platform;
};

// Detect browser family and versions.
//
// Tokens are searched in a fixed priority order:
//   1. Firefox
//   2. Edge, then Opera (these also carry a Chrome token)
//   3. Chrome - always recorded as the Chromium version; sets the family
//      only if steps 1-2 found nothing
//   4. Safari - only when no Chrome token is present
BrowserFacts ParseBrowser(std::string_view identity);

// Detect platform from the parenthesized system-info section
PlatformFacts ParsePlatform(std::string_view identity);

// Parse both browser and platform facts
IdentityFacts ParseIdentity(std::string_view identity);

// Parse the major version from text following a token separator:
// everything up to the first '.' (or the end of the product token)
// must be an integer. Returns nullopt otherwise.
std::optional<int> ParseMajorVersion(std::string_view text);

// Text between the first '(' and its matching ')'. Empty if absent.
std::string_view ExtractSystemInfo(std::string_view identity);

}  // namespace identity
}  // namespace uamask

#endif  // UAMASK_IDENTITY_IDENTITY_PARSER_H_
