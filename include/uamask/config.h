// Copyright 2026 uamask Authors
// SPDX-License-Identifier: MIT

#ifndef UAMASK_CONFIG_H_
#define UAMASK_CONFIG_H_

#include <chrono>
#include <string>

namespace uamask {

// Seconds per day: default corpus staleness threshold
inline constexpr std::chrono::seconds kOneDay{86400};

// Identity corpus configuration
struct CorpusConfig {
  // Single-line JSON file holding [{"ua": ..., "pct": ...}, ...]
  std::string path = "user-agent.json";

  // A corpus file older than this is due for a refresh
  std::chrono::seconds max_age = kOneDay;
};

// Default values for headers every emulated browser sends
struct HeaderConfig {
  std::string accept_language = "en-US,en;q=0.9";

  // Do-Not-Track request header
  std::string do_not_track_name = "dnt";
  std::string do_not_track_value = "1";

  // Used for JSON/HTML request kinds
  std::string accept_encoding = "gzip, deflate, br";
};

// Complete configuration
struct Config {
  CorpusConfig corpus;
  HeaderConfig headers;

  static Config Default() { return Config{}; }
};

}  // namespace uamask

#endif  // UAMASK_CONFIG_H_
