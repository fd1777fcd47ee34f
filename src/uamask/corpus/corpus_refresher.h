// Copyright 2026 uamask Authors
// SPDX-License-Identifier: MIT

// CorpusRefresher - keeps the persisted identity corpus current.
//
// The statistics page is fetched by an external transport supplied as a
// PageFetcher; this module only extracts the embedded JSON payload, persists
// it as a single-line file and reloads the catalog.

#ifndef UAMASK_CORPUS_CORPUS_REFRESHER_H_
#define UAMASK_CORPUS_CORPUS_REFRESHER_H_

#include <functional>
#include <string>
#include <string_view>

#include "uamask/corpus/identity_corpus.h"
#include "uamask/types.h"

namespace uamask {
namespace corpus {

// Public page listing the most common desktop User-Agents
inline constexpr std::string_view kCorpusSourceUrl =
    "https://www.useragents.me/";

// Headers the fetcher should send; the refresh needs no masking
inline constexpr std::string_view kUpdaterUserAgent = "Updater Bot";

// Returns the decoded HTML of the statistics page
using PageFetcher = std::function<Result<std::string>()>;

// Extract the JSON payload from the statistics page: the <textarea> that
// follows the "JSON" heading of the most-common-desktop section.
// Fails with kNotFound if the page has no such payload.
Result<std::string> ExtractCorpusJson(std::string_view page);

// Re-serialize corpus JSON onto a single line.
// Fails with kFormatError if the text is not JSON.
Result<std::string> CompactCorpusJson(std::string_view json);

// Write content to path, replacing the file
Result<void> WriteCorpusFile(const std::string& path, std::string_view content);

class CorpusRefresher {
 public:
  // The corpus must outlive the refresher
  CorpusRefresher(IdentityCorpus& corpus, PageFetcher fetcher);

  // Fetch, extract, validate, persist and reload.
  // Only call when no sessions are being created from the corpus.
  Result<void> Refresh();

  // Refresh when forced or when the corpus file is stale.
  // Returns whether a refresh happened.
  Result<bool> Setup(bool force = false);

  // Whether the corpus file is missing or older than the configured max age.
  // Always false after a successful refresh in this process.
  bool NeedsUpdate(TimePoint now = Clock::now()) const;

  bool refreshed() const { return refreshed_; }

 private:
  IdentityCorpus& corpus_;
  PageFetcher fetcher_;
  bool refreshed_ = false;
};

}  // namespace corpus
}  // namespace uamask

#endif  // UAMASK_CORPUS_CORPUS_REFRESHER_H_
