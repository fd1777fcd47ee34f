// Copyright 2026 uamask Authors
// SPDX-License-Identifier: MIT

#include "uamask/identity/sec_ch_ua.h"

#include <algorithm>
#include <utility>

namespace uamask {
namespace identity {

std::string FormatBrands(const ClientHintBrands& brands) {
  std::string result;
  for (size_t i = 0; i < brands.entries.size(); ++i) {
    if (i > 0) {
      result += ", ";
    }
    const Brand& brand = brands.entries[i];
    result += "\"" + brand.label + "\"; v=\"" + std::to_string(brand.version) +
              "\"";
  }
  return result;
}

ClientHintBrands ClientHintSynthesizer::Synthesize(const BrowserFacts& facts) {
  ClientHintBrands brands;
  if (!facts.UsesChromium()) {
    return brands;
  }

  std::string grease_brand = GenerateGreaseBrand();
  int grease_version = GenerateGreaseVersion();

  brands.entries.reserve(3);
  brands.entries.push_back({std::move(grease_brand), grease_version});
  brands.entries.push_back({std::string(BrandName(facts.family)), facts.version});
  brands.entries.push_back({"Chromium", facts.chromium_version});

  // Uniform shuffle - every ordering equally likely
  std::shuffle(brands.entries.begin(), brands.entries.end(), rng_);
  return brands;
}

std::string ClientHintSynthesizer::GenerateGreaseBrand() {
  std::uniform_int_distribution<size_t> filler_dist(0,
                                                    kGreaseFillers.size() - 1);

  // Build: "<f>Not<f>A<f>Brand"
  std::string brand;
  brand.reserve(12);
  brand += kGreaseFillers[filler_dist(rng_)];
  brand += "Not";
  brand += kGreaseFillers[filler_dist(rng_)];
  brand += 'A';
  brand += kGreaseFillers[filler_dist(rng_)];
  brand += "Brand";
  return brand;
}

int ClientHintSynthesizer::GenerateGreaseVersion() {
  std::uniform_int_distribution<int> version_dist(kMinGreaseVersion,
                                                  kMaxGreaseVersion);
  return version_dist(rng_);
}

std::string_view ClientHintSynthesizer::GetMobile(bool is_mobile) {
  return is_mobile ? "?1" : "?0";
}

std::string ClientHintSynthesizer::GetPlatform(std::string_view platform_type) {
  return "\"" + std::string(platform_type) + "\"";
}

}  // namespace identity
}  // namespace uamask
