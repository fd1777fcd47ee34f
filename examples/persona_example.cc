// Copyright 2026 uamask Authors
// SPDX-License-Identifier: MIT

// Example: draw a browser persona and print the headers it sends
//
// Usage: persona_example [corpus-file]
//
// The corpus file is the single-line JSON written by the corpus refresher
// (default: user-agent.json in the working directory).

#include <iostream>

#include "uamask/uamask.h"

using namespace uamask;

namespace {

void PrintHeaders(const char* title, const http::headers::OrderedHeaders& h) {
  std::cout << "=== " << title << " ===\n";
  for (const auto& header : h.headers) {
    std::cout << header.name << ": " << header.value << "\n";
  }
  std::cout << "\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  Config config = Config::Default();
  if (argc > 1) {
    config.corpus.path = argv[1];
  }

  corpus::IdentityCorpus corpus(config.corpus);
  Rng rng = MakeRng();

  auto result = session::EmulatedSession::Create(corpus, rng);
  if (!result) {
    std::cerr << "Failed to create session: " << result.error().message()
              << " (" << ErrorCodeToString(result.error().code()) << ")\n";
    return 1;
  }
  const session::EmulatedSession& session = result.value();

  std::cout << "Identity:  " << session.identity() << "\n";
  std::cout << "Browser:   "
            << identity::BrowserFamilyToString(session.browser().family)
            << " " << session.browser().version << "\n";
  std::cout << "Chromium:  " << session.browser().chromium_version << "\n";
  std::cout << "Platform:  " << session.platform().platform_type << " ("
            << session.platform().os << " " << session.platform().os_version
            << ")\n\n";

  http::headers::OrderedHeaders base;
  http::headers::Set(base, "Referer", "https://example.com/");

  PrintHeaders("JSON request",
               http::ApplyHeaderPolicy(session, base, config.headers,
                                       http::RequestKind::kJson));
  PrintHeaders("HTML request",
               http::ApplyHeaderPolicy(session, base, config.headers,
                                       http::RequestKind::kHtml));

  if (corpus.IsStale(config.corpus.max_age)) {
    std::cerr << "Note: corpus file " << config.corpus.path
              << " is older than its max age\n";
  }
  return 0;
}
