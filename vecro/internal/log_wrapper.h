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

#ifndef VECRO_INTERNAL_LOG_WRAPPER_H
#define VECRO_INTERNAL_LOG_WRAPPER_H

#include "vecro/log.h"
#include "vecro/status_or.h"
#include "vecro/version.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include <chrono>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

namespace vecro {
VECRO_INLINE_NAMESPACE_BEGIN
namespace internal {

template <typename T>
struct IsStatusOr : public std::false_type {};
template <typename T>
struct IsStatusOr<StatusOr<T>> : public std::true_type {};

/// Formats @p d for log lines, e.g. `1.5ms`.
std::string FormatTook(std::chrono::nanoseconds d);

void LogRequest(absl::string_view where, absl::string_view message);

Status LogResponse(Status response, absl::string_view where,
                   std::chrono::nanoseconds took);

template <typename T>
StatusOr<T> LogResponse(StatusOr<T> response, absl::string_view where,
                        std::chrono::nanoseconds took) {
  if (!response) {
    return LogResponse(std::move(response).status(), where, took);
  }
  VECRO_LOG(INFO) << where << " >> response=" << *response
                  << " took=" << FormatTook(took);
  return response;
}

/**
 * Logs the call to @p functor, its result and its duration.
 *
 * The result is returned unchanged, errors are never suppressed.
 */
template <typename Functor, typename Context, typename Request,
          typename Result =
              std::invoke_result_t<Functor, Context, Request const&>>
Result LogWrapper(Functor&& functor, Context&& context, Request const& request,
                  char const* where) {
  static_assert(
      IsStatusOr<Result>::value || std::is_same<Result, Status>::value,
      "LogWrapper() requires functions returning Status or StatusOr");
  std::ostringstream os;
  os << request;
  LogRequest(where, os.str());
  auto const start = std::chrono::steady_clock::now();
  auto result = functor(std::forward<Context>(context), request);
  return LogResponse(std::move(result), where,
                     std::chrono::steady_clock::now() - start);
}

}  // namespace internal
VECRO_INLINE_NAMESPACE_END
}  // namespace vecro

#endif  // VECRO_INTERNAL_LOG_WRAPPER_H
