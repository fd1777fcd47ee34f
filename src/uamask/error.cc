// Copyright 2026 uamask Authors
// SPDX-License-Identifier: MIT

#include "uamask/error.h"

namespace uamask {

const char* ErrorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:
      return "ok";
    case ErrorCode::kFormatError:
      return "format error";
    case ErrorCode::kEmptyCorpus:
      return "empty corpus";
    case ErrorCode::kIoError:
      return "i/o error";
    case ErrorCode::kFetchFailed:
      return "fetch failed";
    case ErrorCode::kNotFound:
      return "not found";
    case ErrorCode::kDecodeError:
      return "decode error";
    case ErrorCode::kInternalError:
      return "internal error";
  }
  return "unknown";
}

}  // namespace uamask
