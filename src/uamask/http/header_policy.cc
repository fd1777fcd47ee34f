// Copyright 2026 uamask Authors
// SPDX-License-Identifier: MIT

#include "uamask/http/header_policy.h"

#include <string_view>

namespace uamask {
namespace http {

namespace {

constexpr std::string_view kSecPrefix = "sec-";

void ApplyRequestKind(headers::OrderedHeaders& h, const HeaderConfig& config,
                      RequestKind kind) {
  switch (kind) {
    case RequestKind::kGeneric:
      return;
    case RequestKind::kJson:
      headers::SetIfAbsent(h, "accept", "application/json");
      break;
    case RequestKind::kHtml:
      headers::SetIfAbsent(h, "accept", "text/html");
      break;
  }
  headers::SetIfAbsent(h, "accept-encoding", config.accept_encoding);
}

}  // namespace

headers::OrderedHeaders ApplyHeaderPolicy(
    const session::EmulatedSession& session,
    const headers::OrderedHeaders& base, const HeaderConfig& config,
    RequestKind kind) {
  headers::OrderedHeaders result = headers::Copy(base);

  ApplyRequestKind(result, config, kind);

  headers::SetIfAbsent(result, "accept-language", config.accept_language);
  headers::SetIfAbsent(result, config.do_not_track_name,
                       config.do_not_track_value);
  headers::SetIfAbsent(result, "user-agent", session.identity());

  if (session.UsesChromium()) {
    headers::SetIfAbsent(result, "sec-ch-ua", session.sec_ch_ua());
    headers::SetIfAbsent(
        result, "sec-ch-ua-mobile",
        identity::ClientHintSynthesizer::GetMobile(session.platform().is_mobile));
    headers::SetIfAbsent(result, "sec-ch-ua-platform",
                         identity::ClientHintSynthesizer::GetPlatform(
                             session.platform().platform_type));
  } else {
    headers::DeleteWithPrefix(result, kSecPrefix);
  }
  return result;
}

}  // namespace http
}  // namespace uamask
