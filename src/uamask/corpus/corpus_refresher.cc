// Copyright 2026 uamask Authors
// SPDX-License-Identifier: MIT

#include "uamask/corpus/corpus_refresher.h"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <array>
#include <fstream>
#include <utility>

#include "uamask/util/log.h"
#include "uamask/util/sv_util.h"

namespace uamask {
namespace corpus {

namespace {

constexpr std::string_view kSectionAnchor =
    "id=\"most-common-desktop-useragents-json-csv\"";
constexpr std::string_view kJsonHeading = "<h3>JSON</h3>";
constexpr std::string_view kTextareaOpen = "<textarea";
constexpr std::string_view kTextareaClose = "</textarea>";

struct Entity {
  std::string_view encoded;
  char decoded;
};

constexpr std::array<Entity, 6> kEntities = {{
    {"&quot;", '"'},
    {"&#34;", '"'},
    {"&#39;", '\''},
    {"&lt;", '<'},
    {"&gt;", '>'},
    {"&amp;", '&'},
}};

// Textarea content is HTML-escaped
std::string DecodeEntities(std::string_view text) {
  std::string result;
  result.reserve(text.size());

  size_t i = 0;
  while (i < text.size()) {
    if (text[i] == '&') {
      bool matched = false;
      for (const auto& entity : kEntities) {
        if (text.substr(i, entity.encoded.size()) == entity.encoded) {
          result += entity.decoded;
          i += entity.encoded.size();
          matched = true;
          break;
        }
      }
      if (matched) continue;
    }
    result += text[i++];
  }
  return result;
}

}  // namespace

Result<std::string> ExtractCorpusJson(std::string_view page) {
  // Start at the desktop section when present so that other JSON blocks
  // on the page are never picked up
  size_t start = page.find(kSectionAnchor);
  if (start == std::string_view::npos) {
    start = 0;
  }

  size_t heading = page.find(kJsonHeading, start);
  if (heading == std::string_view::npos) {
    return Error::NotFound("The JSON heading could not be found");
  }

  size_t textarea = page.find(kTextareaOpen, heading + kJsonHeading.size());
  if (textarea == std::string_view::npos) {
    return Error::NotFound("The JSON textarea could not be found");
  }

  size_t content_begin = page.find('>', textarea + kTextareaOpen.size());
  if (content_begin == std::string_view::npos) {
    return Error::NotFound("The JSON textarea is not terminated");
  }
  ++content_begin;

  size_t content_end = page.find(kTextareaClose, content_begin);
  if (content_end == std::string_view::npos) {
    return Error::NotFound("The JSON textarea is not closed");
  }

  std::string json = DecodeEntities(
      sv::Trim(page.substr(content_begin, content_end - content_begin)));
  if (json.empty()) {
    return Error::NotFound("The JSON data is empty");
  }
  return json;
}

Result<std::string> CompactCorpusJson(std::string_view json) {
  rapidjson::Document doc;
  doc.Parse(json.data(), json.size());
  if (doc.HasParseError()) {
    return Error::Format(std::string("Corpus JSON parse error: ") +
                         rapidjson::GetParseError_En(doc.GetParseError()));
  }

  rapidjson::StringBuffer buffer;
  rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
  doc.Accept(writer);
  return std::string(buffer.GetString(), buffer.GetSize());
}

Result<void> WriteCorpusFile(const std::string& path,
                             std::string_view content) {
  std::ofstream file(path, std::ios::out | std::ios::trunc);
  if (!file) {
    return Error::Io("Cannot open corpus file for writing: " + path);
  }
  file.write(content.data(), static_cast<std::streamsize>(content.size()));
  file.flush();
  if (!file) {
    return Error::Io("Cannot write corpus file: " + path);
  }
  return {};
}

CorpusRefresher::CorpusRefresher(IdentityCorpus& corpus, PageFetcher fetcher)
    : corpus_(corpus), fetcher_(std::move(fetcher)) {}

Result<void> CorpusRefresher::Refresh() {
  if (!fetcher_) {
    return Error::Internal("No page fetcher configured");
  }

  auto page = fetcher_();
  if (!page) {
    return Error::FetchFailed("Corpus page fetch failed: " +
                              page.error().message());
  }

  auto json = ExtractCorpusJson(page.value());
  if (!json) {
    log::Warn("Unfamiliar corpus page data (" +
              std::to_string(page.value().size()) + " bytes)");
    return json.error();
  }

  auto compact = CompactCorpusJson(json.value());
  if (!compact) {
    return compact.error();
  }

  // Validate by loading before the file on disk is replaced
  auto loaded = corpus_.Load(compact.value());
  if (!loaded) {
    return loaded.error();
  }

  auto written = WriteCorpusFile(corpus_.config().path, compact.value());
  if (!written) {
    return written.error();
  }

  corpus_.MarkRefreshed();
  refreshed_ = true;
  return {};
}

Result<bool> CorpusRefresher::Setup(bool force) {
  if (!force && !NeedsUpdate()) {
    return false;
  }
  auto result = Refresh();
  if (!result) {
    return result.error();
  }
  return true;
}

bool CorpusRefresher::NeedsUpdate(TimePoint now) const {
  if (refreshed_) {
    return false;
  }
  auto mtime = FileModificationTime(corpus_.config().path);
  if (!mtime) {
    return true;
  }
  return *mtime < now - corpus_.config().max_age;
}

}  // namespace corpus
}  // namespace uamask
