// Copyright 2026 uamask Authors
// SPDX-License-Identifier: MIT

// IdentityCorpus - weighted catalog of real-world User-Agent strings.
//
// Lifecycle: construct one catalog per process (or per worker group) and pass
// it by reference to session construction. The first session loads it from
// the configured file; a refresh replaces the entries wholesale. Reloads are
// serialized internally, but callers should still quiesce in-flight work
// before refreshing so that one batch never mixes two corpus generations.

#ifndef UAMASK_CORPUS_IDENTITY_CORPUS_H_
#define UAMASK_CORPUS_IDENTITY_CORPUS_H_

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include "uamask/config.h"
#include "uamask/types.h"
#include "uamask/util/random.h"

namespace uamask {
namespace corpus {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// One identity string and its observed popularity (relative weight)
struct IdentityEntry {
  std::string identity;
  double weight = 0.0;
};

class IdentityCorpus {
 public:
  explicit IdentityCorpus(CorpusConfig config = {});
  ~IdentityCorpus() = default;

  // Non-copyable, non-movable (owns a mutex)
  IdentityCorpus(const IdentityCorpus&) = delete;
  IdentityCorpus& operator=(const IdentityCorpus&) = delete;

  // Replace all entries with the records of a JSON array:
  //   [{"ua": "Mozilla/5.0 ...", "pct": 12.5}, ...]
  // On kFormatError the previous entries are kept.
  // The staleness clock is set to loaded_at.
  Result<void> Load(std::string_view json, TimePoint loaded_at);
  Result<void> Load(std::string_view json) { return Load(json, Clock::now()); }

  // Load the first line of the configured corpus file.
  // The staleness clock is set to the file's modification time.
  Result<void> LoadFile();

  // Load from file unless already loaded
  Result<void> EnsureLoaded();

  // Weighted random selection (with replacement).
  // Fails with kEmptyCorpus when no entries are loaded.
  Result<IdentityEntry> Draw(Rng& rng) const;

  // Whether the last successful load/refresh is older than max_age.
  // A corpus that was never loaded is always stale.
  bool IsStale(std::chrono::seconds max_age = kOneDay,
               TimePoint now = Clock::now()) const;

  // Reset the staleness clock without reloading
  void MarkRefreshed(TimePoint now = Clock::now());

  // Whether any load succeeded
  bool loaded() const;

  size_t Size() const;
  bool Empty() const;

  // Snapshot of the current entries
  std::vector<IdentityEntry> Entries() const;

  const CorpusConfig& config() const { return config_; }

 private:
  CorpusConfig config_;

  mutable std::mutex mutex_;
  std::vector<IdentityEntry> entries_;
  mutable std::discrete_distribution<size_t> distribution_;
  std::optional<TimePoint> last_refresh_;
  bool loaded_ = false;
};

// Parse corpus JSON into entries without touching any catalog
Result<std::vector<IdentityEntry>> ParseCorpusJson(std::string_view json);

// Modification time of a file, nullopt if it cannot be read
std::optional<TimePoint> FileModificationTime(const std::string& path);

}  // namespace corpus
}  // namespace uamask

#endif  // UAMASK_CORPUS_IDENTITY_CORPUS_H_
