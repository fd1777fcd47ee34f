// Copyright 2026 uamask Authors
// SPDX-License-Identifier: MIT

#ifndef UAMASK_ERROR_H_
#define UAMASK_ERROR_H_

#include <string>
#include <string_view>
#include <utility>

namespace uamask {

// Error codes for corpus, refresh and response-decoding operations.
// Field-level identity parsing never produces an Error; it degrades to
// "unknown" sentinels instead.
enum class ErrorCode {
  kOk = 0,

  // Corpus errors
  kFormatError,  // Corpus source cannot be decoded into {ua, pct} records
  kEmptyCorpus,  // Draw attempted with zero entries
  kIoError,      // Corpus file missing, unreadable or unwritable

  // Refresh errors
  kFetchFailed,  // External page fetcher reported a failure
  kNotFound,     // Statistics page does not contain the JSON payload

  // Response glue errors
  kDecodeError,

  // Internal errors
  kInternalError,
};

// Convert error code to string (for diagnostics)
const char* ErrorCodeToString(ErrorCode code);

// Error information with code and message
class Error {
 public:
  Error() : code_(ErrorCode::kOk) {}
  Error(ErrorCode code, std::string message)
      : code_(code), message_(std::move(message)) {}

  // Factory methods
  static Error Ok() { return {}; }

  static Error Format(std::string_view msg) {
    return {ErrorCode::kFormatError, std::string(msg)};
  }

  static Error EmptyCorpus() {
    return {ErrorCode::kEmptyCorpus, "identity corpus is empty"};
  }

  static Error Io(std::string_view msg) {
    return {ErrorCode::kIoError, std::string(msg)};
  }

  static Error FetchFailed(std::string_view msg) {
    return {ErrorCode::kFetchFailed, std::string(msg)};
  }

  static Error NotFound(std::string_view msg) {
    return {ErrorCode::kNotFound, std::string(msg)};
  }

  static Error Decode(std::string_view msg) {
    return {ErrorCode::kDecodeError, std::string(msg)};
  }

  static Error Internal(std::string_view msg) {
    return {ErrorCode::kInternalError, std::string(msg)};
  }

  // Check if error occurred
  explicit operator bool() const { return code_ != ErrorCode::kOk; }
  bool ok() const { return code_ == ErrorCode::kOk; }

  // Accessors
  ErrorCode code() const { return code_; }
  const std::string& message() const { return message_; }

 private:
  ErrorCode code_;
  std::string message_;
};

}  // namespace uamask

#endif  // UAMASK_ERROR_H_
