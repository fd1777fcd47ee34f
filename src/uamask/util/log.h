// Copyright 2026 uamask Authors
// SPDX-License-Identifier: MIT

// Diagnostics for conditions that are reported but never fatal
// (unparseable identity fields, unrecognised platform info, ...).

#ifndef UAMASK_UTIL_LOG_H_
#define UAMASK_UTIL_LOG_H_

#include <functional>
#include <string_view>

namespace uamask {
namespace log {

// Receives every diagnostic message
using Handler = std::function<void(std::string_view message)>;

// Install a handler (nullptr restores the default stderr writer).
// Returns the previously installed handler.
Handler SetHandler(Handler handler);

// Emit a warning-level diagnostic
void Warn(std::string_view message);

}  // namespace log
}  // namespace uamask

#endif  // UAMASK_UTIL_LOG_H_
