// Copyright 2026 uamask Authors
// SPDX-License-Identifier: MIT

#include "uamask/session/emulated_session.h"

#include <utility>

namespace uamask {
namespace session {

EmulatedSession::EmulatedSession(std::string user_agent,
                                 identity::IdentityFacts facts,
                                 identity::ClientHintBrands brands)
    : identity_(std::move(user_agent)),
      browser_(facts.browser),
      platform_(std::move(facts.platform)),
      brands_(std::move(brands)),
      sec_ch_ua_(identity::FormatBrands(brands_)) {}

Result<EmulatedSession> EmulatedSession::Create(corpus::IdentityCorpus& corpus,
                                                Rng& rng) {
  auto loaded = corpus.EnsureLoaded();
  if (!loaded) {
    return loaded.error();
  }

  auto entry = corpus.Draw(rng);
  if (!entry) {
    return entry.error();
  }
  return FromIdentity(std::move(entry).value().identity, rng);
}

EmulatedSession EmulatedSession::FromIdentity(std::string user_agent,
                                              Rng& rng) {
  identity::IdentityFacts facts = identity::ParseIdentity(user_agent);

  identity::ClientHintBrands brands;
  if (facts.browser.UsesChromium()) {
    identity::ClientHintSynthesizer synthesizer(rng);
    brands = synthesizer.Synthesize(facts.browser);
  }
  return EmulatedSession(std::move(user_agent), std::move(facts),
                         std::move(brands));
}

}  // namespace session
}  // namespace uamask
