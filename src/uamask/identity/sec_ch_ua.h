// Copyright 2026 uamask Authors
// SPDX-License-Identifier: MIT

#ifndef UAMASK_IDENTITY_SEC_CH_UA_H_
#define UAMASK_IDENTITY_SEC_CH_UA_H_

#include <array>
#include <string>
#include <string_view>
#include <vector>

#include "uamask/identity/identity_parser.h"
#include "uamask/util/random.h"

namespace uamask {
namespace identity {

// One (brand, major version) entry of the Sec-CH-UA list
struct Brand {
  std::string label;
  int version = kUnknownVersion;
};

// Brand list sent by Chromium-based browsers. Empty for everything else.
struct ClientHintBrands {
  std::vector<Brand> entries;

  bool empty() const { return entries.empty(); }
};

// Render brands as a Sec-CH-UA header value:
//   "Not;A Brand"; v="42", "Chromium"; v="119", "Microsoft Edge"; v="119"
std::string FormatBrands(const ClientHintBrands& brands);

// Synthesizes Sec-CH-UA brand lists the way Chromium does.
//
// Chromium adds a GREASE "not-a-brand" entry with noisy punctuation and a
// random version to prevent ecosystem ossification, and randomizes the order
// of the three entries per session. Every call to Synthesize() draws fresh
// GREASE and a fresh order from the injected generator, so a fixed seed
// reproduces the output exactly.
//
// The GREASE pattern:
// - Template: "<f>Not<f>A<f>Brand", each <f> drawn independently from
//   "", " ", "_", ";", "(", ")"
// - Version: uniform in [1, 100]
class ClientHintSynthesizer {
 public:
  // The generator must outlive the synthesizer
  explicit ClientHintSynthesizer(Rng& rng) : rng_(rng) {}

  // Build the shuffled 3-entry brand list, or an empty list when the
  // browser is not Chromium-based
  ClientHintBrands Synthesize(const BrowserFacts& facts);

  // Generate a GREASE brand label
  std::string GenerateGreaseBrand();

  // Generate a GREASE brand version
  int GenerateGreaseVersion();

  // Get sec-ch-ua-mobile header value
  static std::string_view GetMobile(bool is_mobile);

  // Get sec-ch-ua-platform header value (quoted platform type)
  static std::string GetPlatform(std::string_view platform_type);

 private:
  Rng& rng_;
};

// GREASE filler choices
inline constexpr std::array<std::string_view, 6> kGreaseFillers = {
    "", " ", "_", ";", "(", ")"};

inline constexpr int kMinGreaseVersion = 1;
inline constexpr int kMaxGreaseVersion = 100;

}  // namespace identity
}  // namespace uamask

#endif  // UAMASK_IDENTITY_SEC_CH_UA_H_
