// Copyright 2026 uamask Authors
// SPDX-License-Identifier: MIT

#ifndef UAMASK_TYPES_H_
#define UAMASK_TYPES_H_

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "uamask/error.h"

namespace uamask {

// HTTP header pair
struct Header {
  std::string name;
  std::string value;
};

// Collection of HTTP headers
using Headers = std::vector<Header>;

// Result type for operations that can fail
// Holds either a value or an error
template <typename T>
class Result {
 public:
  Result(T value) : data_(std::move(value)) {}
  Result(Error error) : data_(std::move(error)) {}

  bool ok() const { return std::holds_alternative<T>(data_); }
  bool has_error() const { return std::holds_alternative<Error>(data_); }

  explicit operator bool() const { return ok(); }

  T& value() & { return std::get<T>(data_); }
  const T& value() const& { return std::get<T>(data_); }
  T&& value() && { return std::get<T>(std::move(data_)); }

  Error& error() & { return std::get<Error>(data_); }
  const Error& error() const& { return std::get<Error>(data_); }

 private:
  std::variant<T, Error> data_;
};

// Specialization for void
template <>
class Result<void> {
 public:
  Result() : error_(std::nullopt) {}
  Result(Error error) : error_(std::move(error)) {}

  bool ok() const { return !error_.has_value(); }
  bool has_error() const { return error_.has_value(); }

  explicit operator bool() const { return ok(); }

  Error& error() & { return *error_; }
  const Error& error() const& { return *error_; }

 private:
  std::optional<Error> error_;
};

}  // namespace uamask

#endif  // UAMASK_TYPES_H_
