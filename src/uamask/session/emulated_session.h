// Copyright 2026 uamask Authors
// SPDX-License-Identifier: MIT

#ifndef UAMASK_SESSION_EMULATED_SESSION_H_
#define UAMASK_SESSION_EMULATED_SESSION_H_

#include <string>
#include <string_view>

#include "uamask/corpus/identity_corpus.h"
#include "uamask/identity/identity_parser.h"
#include "uamask/identity/sec_ch_ua.h"
#include "uamask/types.h"
#include "uamask/util/random.h"

namespace uamask {
namespace session {

// EmulatedSession - one internally consistent browser persona.
//
// Holds the drawn User-Agent, its parsed browser/platform facts and (for
// Chromium-based browsers) the synthesized client-hint brands. Immutable
// after creation: every request of a logical session reuses the same
// instance, and rotating identity means creating a new one. Safe to read
// from any number of threads.
class EmulatedSession {
 public:
  // Draw a persona from the corpus, loading it from file on first use.
  // Fails with the corpus error (kIoError, kFormatError, kEmptyCorpus).
  static Result<EmulatedSession> Create(corpus::IdentityCorpus& corpus,
                                        Rng& rng);

  // Build a persona for a known User-Agent string
  static EmulatedSession FromIdentity(std::string user_agent, Rng& rng);

  const std::string& identity() const { return identity_; }
  const identity::BrowserFacts& browser() const { return browser_; }
  const identity::PlatformFacts& platform() const { return platform_; }
  const identity::ClientHintBrands& brands() const { return brands_; }

  // Pre-formatted sec-ch-ua value (empty for non-Chromium browsers)
  const std::string& sec_ch_ua() const { return sec_ch_ua_; }

  bool UsesChromium() const { return browser_.UsesChromium(); }

 private:
  EmulatedSession(std::string user_agent, identity::IdentityFacts facts,
                  identity::ClientHintBrands brands);

  std::string identity_;
  identity::BrowserFacts browser_;
  identity::PlatformFacts platform_;
  identity::ClientHintBrands brands_;
  std::string sec_ch_ua_;
};

}  // namespace session
}  // namespace uamask

#endif  // UAMASK_SESSION_EMULATED_SESSION_H_
