// Copyright 2026 uamask Authors
// SPDX-License-Identifier: MIT

#include "uamask/corpus/identity_corpus.h"

#include <cassert>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

using namespace uamask;
using namespace uamask::corpus;

namespace {

constexpr const char* kTwoEntries =
    R"([{"ua": "A", "pct": 90}, {"ua": "B", "pct": 10}])";

std::string TempPath(const std::string& name) {
  return (std::filesystem::temp_directory_path() / name).string();
}

void WriteFile(const std::string& path, const std::string& content) {
  std::ofstream file(path, std::ios::trunc);
  file << content;
}

}  // namespace

void TestLoadAndDraw() {
  std::cout << "Testing Load and Draw... ";

  IdentityCorpus corpus;
  assert(!corpus.loaded());

  auto result = corpus.Load(kTwoEntries);
  assert(result.ok());
  assert(corpus.loaded());
  assert(corpus.Size() == 2);

  auto entries = corpus.Entries();
  assert(entries[0].identity == "A");
  assert(entries[0].weight == 90.0);
  assert(entries[1].identity == "B");

  Rng rng = MakeRng(3);
  auto drawn = corpus.Draw(rng);
  assert(drawn.ok());
  assert(drawn.value().identity == "A" || drawn.value().identity == "B");

  std::cout << "PASSED\n";
}

void TestWeightedDistribution() {
  std::cout << "Testing weighted draw distribution... ";

  IdentityCorpus corpus;
  assert(corpus.Load(kTwoEntries).ok());

  Rng rng = MakeRng(12345);
  constexpr int kDraws = 10000;
  int a_count = 0;
  for (int i = 0; i < kDraws; ++i) {
    auto drawn = corpus.Draw(rng);
    assert(drawn.ok());
    if (drawn.value().identity == "A") ++a_count;
  }

  // Expected 9000, standard deviation 30
  assert(a_count > 8800 && a_count < 9200);

  std::cout << "PASSED\n";
}

void TestZeroWeightNeverDrawn() {
  std::cout << "Testing zero-weight entries are never drawn... ";

  IdentityCorpus corpus;
  assert(corpus.Load(R"([{"ua": "never", "pct": 0}, {"ua": "always", "pct": 0.5}])")
             .ok());

  Rng rng = MakeRng(8);
  for (int i = 0; i < 1000; ++i) {
    assert(corpus.Draw(rng).value().identity == "always");
  }

  std::cout << "PASSED\n";
}

void TestEmptyCorpus() {
  std::cout << "Testing empty corpus draw fails... ";

  Rng rng = MakeRng(1);

  IdentityCorpus never_loaded;
  auto drawn = never_loaded.Draw(rng);
  assert(!drawn.ok());
  assert(drawn.error().code() == ErrorCode::kEmptyCorpus);

  IdentityCorpus empty;
  assert(empty.Load("[]").ok());
  assert(empty.loaded());
  assert(empty.Empty());
  drawn = empty.Draw(rng);
  assert(drawn.has_error());
  assert(drawn.error().code() == ErrorCode::kEmptyCorpus);

  std::cout << "PASSED\n";
}

void TestFormatErrors() {
  std::cout << "Testing malformed sources fail with FormatError... ";

  const char* bad_sources[] = {
      "",
      "not json",
      R"({"ua": "A", "pct": 1})",
      R"([{"ua": "A", "pct": 1},)",
      R"(["Mozilla/5.0"])",
      R"([{"pct": 1}])",
      R"([{"ua": 5, "pct": 1}])",
      R"([{"ua": "A"}])",
      R"([{"ua": "A", "pct": "50"}])",
      R"([{"ua": "A", "pct": -1}])",
      R"([{"ua": "A", "pct": 0}, {"ua": "B", "pct": 0}])",
  };

  for (const char* source : bad_sources) {
    IdentityCorpus corpus;
    auto result = corpus.Load(source);
    assert(!result.ok());
    assert(result.error().code() == ErrorCode::kFormatError);
    assert(!result.error().message().empty());
    assert(!corpus.loaded());
  }

  std::cout << "PASSED\n";
}

void TestFailedLoadKeepsEntries() {
  std::cout << "Testing failed load keeps previous entries... ";

  IdentityCorpus corpus;
  assert(corpus.Load(kTwoEntries).ok());
  assert(!corpus.Load("[{").ok());
  assert(corpus.Size() == 2);

  // Successful load replaces
  assert(corpus.Load(R"([{"ua": "C", "pct": 1, "extra": true}])").ok());
  assert(corpus.Size() == 1);
  assert(corpus.Entries()[0].identity == "C");

  std::cout << "PASSED\n";
}

void TestStaleness() {
  std::cout << "Testing staleness... ";

  IdentityCorpus corpus;
  assert(corpus.IsStale());

  auto now = Clock::now();
  assert(corpus.Load(kTwoEntries, now - std::chrono::hours(30)).ok());
  assert(corpus.IsStale(kOneDay, now));
  assert(!corpus.IsStale(std::chrono::hours(48), now));

  corpus.MarkRefreshed(now);
  assert(!corpus.IsStale(kOneDay, now));
  assert(corpus.IsStale(kOneDay, now + std::chrono::hours(25)));

  // MarkRefreshed does not reload
  assert(corpus.Size() == 2);

  std::cout << "PASSED\n";
}

void TestLoadFile() {
  std::cout << "Testing LoadFile... ";

  std::string path = TempPath("uamask_test_corpus.json");
  WriteFile(path, std::string(kTwoEntries) + "\nignored second line\n");

  CorpusConfig config;
  config.path = path;
  IdentityCorpus corpus(config);

  assert(corpus.EnsureLoaded().ok());
  assert(corpus.Size() == 2);

  // Freshly written file is not stale
  assert(!corpus.IsStale());

  // Backdate the file: staleness follows its modification time
  IdentityCorpus old_corpus(config);
  std::filesystem::last_write_time(
      path, std::filesystem::file_time_type::clock::now() -
                std::chrono::hours(48));
  assert(old_corpus.LoadFile().ok());
  assert(old_corpus.IsStale());

  std::filesystem::remove(path);

  std::cout << "PASSED\n";
}

void TestLoadFileMissing() {
  std::cout << "Testing LoadFile on missing file... ";

  CorpusConfig config;
  config.path = TempPath("uamask_does_not_exist.json");
  IdentityCorpus corpus(config);

  auto result = corpus.EnsureLoaded();
  assert(!result.ok());
  assert(result.error().code() == ErrorCode::kIoError);
  assert(!corpus.loaded());

  std::cout << "PASSED\n";
}

int main() {
  std::cout << "=== IdentityCorpus Unit Tests ===\n\n";

  TestLoadAndDraw();
  TestWeightedDistribution();
  TestZeroWeightNeverDrawn();
  TestEmptyCorpus();
  TestFormatErrors();
  TestFailedLoadKeepsEntries();
  TestStaleness();
  TestLoadFile();
  TestLoadFileMissing();

  std::cout << "\nAll IdentityCorpus tests passed!\n";
  return 0;
}
