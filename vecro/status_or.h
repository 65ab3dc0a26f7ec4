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

#ifndef VECRO_STATUS_OR_H
#define VECRO_STATUS_OR_H

#include "vecro/status.h"
#include "vecro/version.h"
#include "absl/types/variant.h"
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace vecro {
VECRO_INLINE_NAMESPACE_BEGIN

/**
 * Holds a value or a `Status` indicating why there is no value.
 *
 * @code
 * StatusOr<WorkloadResponse> response = service->Execute(context, request);
 * if (!response) return std::move(response).status();
 * std::cout << response->bytes << "\n";
 * @endcode
 *
 * @tparam T the type of the value.
 */
template <typename T>
class StatusOr final {
 public:
  using value_type = T;

  /// Initializes with an error status (UNKNOWN).
  StatusOr() : StatusOr(Status(StatusCode::kUnknown, "default")) {}

  StatusOr(StatusOr const&) = default;
  StatusOr& operator=(StatusOr const&) = default;
  StatusOr(StatusOr&&) = default;
  StatusOr& operator=(StatusOr&&) = default;

  /**
   * Creates a new `StatusOr<T>` holding the error condition @p status.
   *
   * @throws std::invalid_argument if `status.ok()`.
   */
  // NOLINTNEXTLINE(google-explicit-constructor)
  StatusOr(Status status) : v_(std::move(status)) {
    if (absl::get<Status>(v_).ok()) {
      throw std::invalid_argument("StatusOr constructed with an OK status");
    }
  }

  StatusOr& operator=(Status status) {
    *this = StatusOr(std::move(status));
    return *this;
  }

  template <typename U = T>
  typename std::enable_if<  // NOLINT(misc-unconventional-assign-operator)
      !std::is_same<StatusOr, typename std::decay<U>::type>::value,
      StatusOr>::type&
  operator=(U&& u) {
    v_.template emplace<T>(std::forward<U>(u));
    return *this;
  }

  // NOLINTNEXTLINE(google-explicit-constructor)
  StatusOr(T&& value) : v_(std::move(value)) {}

  // NOLINTNEXTLINE(google-explicit-constructor)
  StatusOr(T const& value) : v_(value) {}

  bool ok() const { return absl::holds_alternative<T>(v_); }
  explicit operator bool() const { return ok(); }

  ///@{
  /**
   * @name Deference operators.
   *
   * @warning Using these operators when `ok() == false` results in undefined
   *     behavior.
   */
  T& operator*() & { return absl::get<T>(v_); }
  T const& operator*() const& { return absl::get<T>(v_); }
  T&& operator*() && { return absl::get<T>(std::move(v_)); }
  T const&& operator*() const&& { return absl::get<T>(std::move(v_)); }

  T* operator->() & { return &**this; }
  T const* operator->() const& { return &**this; }
  ///@}

  ///@{
  /**
   * @name Value accessors.
   *
   * @throws `RuntimeStatusError` with the contents of `status()` if the object
   *   does not contain a value, i.e., if `ok() == false`.
   */
  T& value() & {
    CheckHasValue();
    return **this;
  }
  T const& value() const& {
    CheckHasValue();
    return **this;
  }
  T&& value() && {
    CheckHasValue();
    return std::move(**this);
  }
  ///@}

  ///@{
  /// @name Status accessors.
  Status const& status() const& {
    static auto const* const kOk = new Status{};
    if (ok()) return *kOk;
    return absl::get<Status>(v_);
  }
  Status&& status() && {
    if (ok()) v_ = Status{};
    return absl::get<Status>(std::move(v_));
  }
  ///@}

 private:
  void CheckHasValue() const {
    if (!ok()) throw RuntimeStatusError(status());
  }

  absl::variant<Status, T> v_;
};

template <typename T>
bool operator==(StatusOr<T> const& a, StatusOr<T> const& b) {
  if (!a || !b) return a.status() == b.status();
  return *a == *b;
}

template <typename T>
bool operator!=(StatusOr<T> const& a, StatusOr<T> const& b) {
  return !(a == b);
}

template <typename T>
StatusOr<T> make_status_or(T rhs) {
  return StatusOr<T>(std::move(rhs));
}

VECRO_INLINE_NAMESPACE_END
}  // namespace vecro

#endif  // VECRO_STATUS_OR_H
