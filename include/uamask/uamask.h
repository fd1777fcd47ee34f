// Copyright 2026 uamask Authors
// SPDX-License-Identifier: MIT

// uamask - browser identity emulation for HTTP clients.
//
// Usage:
//   uamask::corpus::IdentityCorpus corpus(config.corpus);
//   uamask::Rng rng = uamask::MakeRng();
//
//   auto session = uamask::session::EmulatedSession::Create(corpus, rng);
//   if (!session) { /* kIoError, kFormatError or kEmptyCorpus */ }
//
//   // Once per outbound request, reusing the same session
//   auto headers = uamask::http::ApplyHeaderPolicy(session.value(), base,
//                                                  config.headers);

#ifndef UAMASK_UAMASK_H_
#define UAMASK_UAMASK_H_

#include "uamask/config.h"
#include "uamask/error.h"
#include "uamask/types.h"

#include "uamask/corpus/corpus_refresher.h"
#include "uamask/corpus/identity_corpus.h"
#include "uamask/http/header_policy.h"
#include "uamask/http/ordered_headers.h"
#include "uamask/http/response_text.h"
#include "uamask/identity/identity_parser.h"
#include "uamask/identity/sec_ch_ua.h"
#include "uamask/session/emulated_session.h"
#include "uamask/util/random.h"

#endif  // UAMASK_UAMASK_H_
