// Copyright 2026 uamask Authors
// SPDX-License-Identifier: MIT

#include "uamask/corpus/identity_corpus.h"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

namespace uamask {
namespace corpus {

namespace {

constexpr const char* kIdentityField = "ua";
constexpr const char* kWeightField = "pct";

std::discrete_distribution<size_t> MakeDistribution(
    const std::vector<IdentityEntry>& entries) {
  std::vector<double> weights;
  weights.reserve(entries.size());
  for (const auto& entry : entries) {
    weights.push_back(entry.weight);
  }
  return std::discrete_distribution<size_t>(weights.begin(), weights.end());
}

}  // namespace

Result<std::vector<IdentityEntry>> ParseCorpusJson(std::string_view json) {
  rapidjson::Document doc;
  doc.Parse(json.data(), json.size());

  if (doc.HasParseError()) {
    return Error::Format(std::string("Corpus JSON parse error at offset ") +
                         std::to_string(doc.GetErrorOffset()) + ": " +
                         rapidjson::GetParseError_En(doc.GetParseError()));
  }
  if (!doc.IsArray()) {
    return Error::Format("Corpus JSON must be an array of records");
  }

  std::vector<IdentityEntry> entries;
  entries.reserve(doc.Size());
  double total_weight = 0.0;

  for (rapidjson::SizeType i = 0; i < doc.Size(); ++i) {
    const rapidjson::Value& record = doc[i];
    std::string where = "Corpus record " + std::to_string(i);

    if (!record.IsObject()) {
      return Error::Format(where + " is not an object");
    }

    auto ua = record.FindMember(kIdentityField);
    if (ua == record.MemberEnd() || !ua->value.IsString()) {
      return Error::Format(where + " lacks a string \"ua\" field");
    }

    auto pct = record.FindMember(kWeightField);
    if (pct == record.MemberEnd() || !pct->value.IsNumber()) {
      return Error::Format(where + " lacks a numeric \"pct\" field");
    }

    double weight = pct->value.GetDouble();
    if (!std::isfinite(weight) || weight < 0.0) {
      return Error::Format(where + " has an invalid weight");
    }

    total_weight += weight;
    entries.push_back(
        {std::string(ua->value.GetString(), ua->value.GetStringLength()),
         weight});
  }

  if (!entries.empty() && total_weight <= 0.0) {
    return Error::Format("Corpus weights sum to zero");
  }
  return entries;
}

std::optional<TimePoint> FileModificationTime(const std::string& path) {
  std::error_code ec;
  auto ftime = std::filesystem::last_write_time(path, ec);
  if (ec) {
    return std::nullopt;
  }
  return std::chrono::time_point_cast<Clock::duration>(
      std::chrono::file_clock::to_sys(ftime));
}

IdentityCorpus::IdentityCorpus(CorpusConfig config)
    : config_(std::move(config)) {}

Result<void> IdentityCorpus::Load(std::string_view json, TimePoint loaded_at) {
  auto parsed = ParseCorpusJson(json);
  if (!parsed) {
    return parsed.error();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  entries_ = std::move(parsed).value();
  distribution_ = MakeDistribution(entries_);
  last_refresh_ = loaded_at;
  loaded_ = true;
  return {};
}

Result<void> IdentityCorpus::LoadFile() {
  std::ifstream file(config_.path);
  if (!file) {
    return Error::Io("Cannot open corpus file: " + config_.path);
  }

  // The persisted corpus is a single line
  std::string content;
  if (!std::getline(file, content)) {
    return Error::Io("Cannot read corpus file: " + config_.path);
  }

  auto mtime = FileModificationTime(config_.path);
  return Load(content, mtime.value_or(Clock::now()));
}

Result<void> IdentityCorpus::EnsureLoaded() {
  if (loaded()) {
    return {};
  }
  return LoadFile();
}

Result<IdentityEntry> IdentityCorpus::Draw(Rng& rng) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (entries_.empty()) {
    return Error::EmptyCorpus();
  }
  return entries_[distribution_(rng)];
}

bool IdentityCorpus::IsStale(std::chrono::seconds max_age,
                             TimePoint now) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!last_refresh_) {
    return true;
  }
  return *last_refresh_ < now - max_age;
}

void IdentityCorpus::MarkRefreshed(TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  last_refresh_ = now;
}

bool IdentityCorpus::loaded() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return loaded_;
}

size_t IdentityCorpus::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

bool IdentityCorpus::Empty() const { return Size() == 0; }

std::vector<IdentityEntry> IdentityCorpus::Entries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_;
}

}  // namespace corpus
}  // namespace uamask
