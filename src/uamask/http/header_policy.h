// Copyright 2026 uamask Authors
// SPDX-License-Identifier: MIT

#ifndef UAMASK_HTTP_HEADER_POLICY_H_
#define UAMASK_HTTP_HEADER_POLICY_H_

#include "uamask/config.h"
#include "uamask/http/ordered_headers.h"
#include "uamask/session/emulated_session.h"

namespace uamask {
namespace http {

// What the request expects back; selects accept/accept-encoding defaults
enum class RequestKind {
  kGeneric,  // No extra defaults
  kJson,     // accept: application/json
  kHtml,     // accept: text/html
};

// Produce the outbound header set for one request of a session.
//
// Set-if-absent throughout: headers the caller already set (any case) are
// never overwritten. Every persona adds accept-language, do-not-track and
// user-agent. Chromium personas add sec-ch-ua, sec-ch-ua-mobile and
// sec-ch-ua-platform. Other personas have every sec-* header removed, even
// caller-supplied ones: Firefox and Safari never send them.
//
// The base set is not modified.
headers::OrderedHeaders ApplyHeaderPolicy(
    const session::EmulatedSession& session,
    const headers::OrderedHeaders& base, const HeaderConfig& config = {},
    RequestKind kind = RequestKind::kGeneric);

}  // namespace http
}  // namespace uamask

#endif  // UAMASK_HTTP_HEADER_POLICY_H_
