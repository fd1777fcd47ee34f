// Copyright 2026 uamask Authors
// SPDX-License-Identifier: MIT

#include "uamask/identity/identity_parser.h"

#include <array>
#include <string>
#include <utility>

#include "uamask/util/log.h"
#include "uamask/util/sv_util.h"

namespace uamask {
namespace identity {

namespace {

// Product tokens per family. Each is matched as "<token>/".
// Edge and Opera tokens are limited to Chromium builds: EdgiOS and
// Presto-era "Opera/" carry no Chrome token, and CriOS runs on WebKit.
constexpr std::array<std::string_view, 2> kFirefoxTokens = {"Firefox",
                                                            "FxiOS"};
constexpr std::array<std::string_view, 3> kEdgeTokens = {"Edg", "Edge",
                                                         "EdgA"};
constexpr std::array<std::string_view, 1> kOperaTokens = {"OPR"};
constexpr std::array<std::string_view, 1> kChromeTokens = {"Chrome"};
constexpr std::array<std::string_view, 1> kSafariTokens = {"Safari"};

constexpr char kVersionSeparator = '/';

// Token match: position just past the separator, or npos
struct TokenMatch {
  std::string_view token;
  size_t version_pos = std::string_view::npos;

  bool found() const { return version_pos != std::string_view::npos; }
};

template <size_t N>
TokenMatch FindToken(std::string_view identity,
                     const std::array<std::string_view, N>& tokens) {
  for (std::string_view token : tokens) {
    std::string pattern(token);
    pattern += kVersionSeparator;
    size_t pos = identity.find(pattern);
    if (pos != std::string_view::npos) {
      return {token, pos + pattern.size()};
    }
  }
  return {};
}

// Version of a matched token, kUnknownVersion (with a diagnostic) on failure
int VersionAt(std::string_view identity, const TokenMatch& match) {
  std::optional<int> version =
      ParseMajorVersion(identity.substr(match.version_pos));
  if (!version) {
    log::Warn("Unparseable " + std::string(match.token) +
              " version in user-agent: " + std::string(identity));
    return kUnknownVersion;
  }
  return *version;
}

// Split at the first occurrence of delim: {before, after}.
// If delim is absent, after is empty.
std::pair<std::string_view, std::string_view> SplitOnce(std::string_view s,
                                                        std::string_view delim) {
  size_t pos = s.find(delim);
  if (pos == std::string_view::npos) {
    return {s, {}};
  }
  return {s.substr(0, pos), s.substr(pos + delim.size())};
}

void ParseWindows(std::string_view info, PlatformFacts& out) {
  // "Windows NT 10.0; Win64; x64"
  std::string_view type = SplitOnce(info, ";").first;
  out.platform_type = std::string(sv::Trim(type));

  auto [os, rest] = SplitOnce(info, " ");
  out.os = std::string(sv::Trim(os));
  out.os_version = std::string(sv::Trim(rest));
}

void ParseMacintosh(std::string_view info, PlatformFacts& out) {
  // "Macintosh; Intel Mac OS X 10_15_7"
  out.platform_type = "Macintosh";

  auto [head, rest] = SplitOnce(info, "; ");
  if (rest.empty()) {
    log::Warn("Macintosh system info lacks OS section: " + std::string(info));
    return;
  }
  // Only the OS section itself, if more sections follow
  rest = SplitOnce(rest, ";").first;

  size_t last_space = rest.rfind(' ');
  if (last_space == std::string_view::npos) {
    out.os = std::string(sv::Trim(rest));
    return;
  }
  out.os = std::string(sv::Trim(rest.substr(0, last_space)));
  out.os_version = std::string(sv::Trim(rest.substr(last_space + 1)));
}

void ParseX11(std::string_view info, PlatformFacts& out) {
  // "X11; Linux x86_64" or "X11; Ubuntu; Linux x86_64"
  out.platform_type = "Linux";

  auto [first, rest] = SplitOnce(sv::Trim(info), " ");
  std::string_view second = SplitOnce(sv::Trim(rest), " ").first;
  while (!second.empty() && second.back() == ';') {
    second.remove_suffix(1);
  }
  out.os = std::string(second);
}

void ParseAndroid(std::string_view identity, std::string_view info,
                  PlatformFacts& out) {
  // "Linux; Android 10; K"
  out.platform_type = "Android";
  out.os = "Android";

  size_t pos = info.find("Android");
  std::string_view rest = info.substr(pos + std::string_view("Android").size());
  out.os_version = std::string(sv::Trim(SplitOnce(rest, ";").first));

  // Phones carry "Mobile" next to the Safari token, tablets do not
  out.is_mobile = identity.find(" Mobile") != std::string_view::npos;
}

}  // namespace

const char* BrowserFamilyToString(BrowserFamily family) {
  switch (family) {
    case BrowserFamily::kNone:
      return "none";
    case BrowserFamily::kChrome:
      return "chrome";
    case BrowserFamily::kEdge:
      return "edge";
    case BrowserFamily::kFirefox:
      return "firefox";
    case BrowserFamily::kOpera:
      return "opera";
    case BrowserFamily::kSafari:
      return "safari";
  }
  return "none";
}

std::string_view BrandName(BrowserFamily family) {
  switch (family) {
    case BrowserFamily::kChrome:
      return "Google Chrome";
    case BrowserFamily::kEdge:
      return "Microsoft Edge";
    case BrowserFamily::kOpera:
      return "Opera";
    case BrowserFamily::kNone:
    case BrowserFamily::kFirefox:
    case BrowserFamily::kSafari:
      return {};
  }
  return {};
}

std::optional<int> ParseMajorVersion(std::string_view text) {
  // The major version ends at the first '.', or where the product token
  // ends when the version has no minor part ("Edg/119 ...").
  size_t end = text.find_first_of(". ;)");
  return sv::ParseInt(text.substr(0, end));
}

std::string_view ExtractSystemInfo(std::string_view identity) {
  size_t open = identity.find('(');
  if (open == std::string_view::npos) {
    return {};
  }

  int depth = 0;
  for (size_t i = open; i < identity.size(); ++i) {
    if (identity[i] == '(') {
      ++depth;
    } else if (identity[i] == ')') {
      if (--depth == 0) {
        return identity.substr(open + 1, i - open - 1);
      }
    }
  }
  // Unterminated: take the rest
  return identity.substr(open + 1);
}

BrowserFacts ParseBrowser(std::string_view identity) {
  BrowserFacts facts;

  TokenMatch firefox = FindToken(identity, kFirefoxTokens);
  if (firefox.found()) {
    facts.family = BrowserFamily::kFirefox;
    facts.version = VersionAt(identity, firefox);
    return facts;
  }

  // Edge and Opera strings also carry a Chrome token, so the specific brand
  // must be checked first
  TokenMatch edge = FindToken(identity, kEdgeTokens);
  TokenMatch opera = FindToken(identity, kOperaTokens);
  if (edge.found()) {
    facts.family = BrowserFamily::kEdge;
    facts.version = VersionAt(identity, edge);
  } else if (opera.found()) {
    facts.family = BrowserFamily::kOpera;
    facts.version = VersionAt(identity, opera);
  }

  TokenMatch chrome = FindToken(identity, kChromeTokens);
  if (chrome.found()) {
    facts.chromium_version = VersionAt(identity, chrome);
    if (facts.family == BrowserFamily::kNone) {
      facts.family = BrowserFamily::kChrome;
      facts.version = facts.chromium_version;
    }
    return facts;
  }

  TokenMatch safari = FindToken(identity, kSafariTokens);
  if (safari.found() && facts.family == BrowserFamily::kNone) {
    facts.family = BrowserFamily::kSafari;
    facts.version = VersionAt(identity, safari);
  }
  return facts;
}

PlatformFacts ParsePlatform(std::string_view identity) {
  PlatformFacts facts;
  if (identity.empty()) {
    log::Warn("The user-agent is empty");
    return facts;
  }

  std::string_view info = ExtractSystemInfo(identity);
  if (info.find("Windows") != std::string_view::npos) {
    ParseWindows(info, facts);
  } else if (info.find("Macintosh") != std::string_view::npos) {
    ParseMacintosh(info, facts);
  } else if (info.find("X11") != std::string_view::npos) {
    ParseX11(info, facts);
  } else if (info.find("Android") != std::string_view::npos) {
    ParseAndroid(identity, info, facts);
  } else {
    log::Warn("System info section of user-agent cannot be parsed: (" +
              std::string(info) + ")");
    facts.platform_type = std::string(SplitOnce(identity, " ").first);
  }
  return facts;
}

IdentityFacts ParseIdentity(std::string_view identity) {
  return {ParseBrowser(identity), ParsePlatform(identity)};
}

}  // namespace identity
}  // namespace uamask
