// Copyright 2025 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef VECRO_STATUS_H
#define VECRO_STATUS_H

#include "vecro/version.h"
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace vecro {
VECRO_INLINE_NAMESPACE_BEGIN

/**
 * Well-known status codes with `grpc::StatusCode`-compatible values.
 *
 * The workload pipeline only produces a handful of these, the transport maps
 * each one to an HTTP status.
 */
enum class StatusCode {
  /// Not an error; returned on success.
  kOk = 0,
  /// The operation was cancelled, typically by the caller.
  kCancelled = 1,
  kUnknown = 2,
  /// The caller sent a request that cannot be mapped to a workload request.
  kInvalidArgument = 3,
  /// The call deadline expired before the operation could complete.
  kDeadlineExceeded = 4,
  kNotFound = 5,
  kAlreadyExists = 6,
  kPermissionDenied = 7,
  kResourceExhausted = 8,
  kFailedPrecondition = 9,
  kAborted = 10,
  kOutOfRange = 11,
  kUnimplemented = 12,
  kInternal = 13,
  /// The backing store could not serve the request.
  kUnavailable = 14,
  kDataLoss = 15,
  kUnauthenticated = 16,
};

/// Convert @p code to a human readable string.
std::string StatusCodeToString(StatusCode code);

/// Integration with `std::iostreams`.
std::ostream& operator<<(std::ostream& os, StatusCode code);

/**
 * Describes the cause of the error with structured details.
 *
 * @see https://cloud.google.com/apis/design/errors#error_info
 */
class ErrorInfo {
 public:
  ErrorInfo() = default;

  explicit ErrorInfo(std::string reason, std::string domain,
                     std::unordered_map<std::string, std::string> metadata)
      : reason_(std::move(reason)),
        domain_(std::move(domain)),
        metadata_(std::move(metadata)) {}

  /// A constant value identifying the proximate cause, in UPPER_SNAKE_CASE.
  std::string const& reason() const { return reason_; }

  /// The logical grouping to which the "reason" belongs, `vecro` for errors
  /// generated by this service.
  std::string const& domain() const { return domain_; }

  std::unordered_map<std::string, std::string> const& metadata() const {
    return metadata_;
  }

  friend bool operator==(ErrorInfo const&, ErrorInfo const&);
  friend bool operator!=(ErrorInfo const&, ErrorInfo const&);

 private:
  std::string reason_;
  std::string domain_;
  std::unordered_map<std::string, std::string> metadata_;
};

/**
 * Represents success or an error with info about the error.
 *
 * A default-constructed `Status` is OK. Non-OK statuses keep their details in
 * a heap allocated object, OK statuses allocate nothing.
 */
class Status {
 public:
  Status();
  ~Status();
  Status(Status const&);
  Status& operator=(Status const&);
  Status(Status&&) noexcept;
  Status& operator=(Status&&) noexcept;

  /**
   * Construct from a status code, message and (optional) error info.
   *
   * @param code the status code for the new `Status`.
   * @param message ignored if @p code is `StatusCode::kOk`.
   * @param info ignored if @p code is `StatusCode::kOk`.
   */
  explicit Status(StatusCode code, std::string message, ErrorInfo info = {});

  /// Returns true if the status code is `StatusCode::kOk`.
  bool ok() const { return !impl_; }

  StatusCode code() const;

  /// Always empty if `code()` is `StatusCode::kOk`.
  std::string const& message() const;

  /// Always a default-constructed error info if `code()` is `kOk`.
  ErrorInfo const& error_info() const;

  friend bool operator==(Status const& a, Status const& b) {
    return (a.ok() && b.ok()) || Equals(a, b);
  }
  friend bool operator!=(Status const& a, Status const& b) { return !(a == b); }

 private:
  static bool Equals(Status const& a, Status const& b);

  class Impl;
  std::unique_ptr<Impl> impl_;
};

/// Stream @p s to @p os, including the error info when present.
std::ostream& operator<<(std::ostream& os, Status const& s);

/// A `std::runtime_error` carrying a `Status`.
class RuntimeStatusError : public std::runtime_error {
 public:
  explicit RuntimeStatusError(Status status);

  Status const& status() const { return status_; }

 private:
  Status status_;
};

VECRO_INLINE_NAMESPACE_END
}  // namespace vecro

#endif  // VECRO_STATUS_H
