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

#ifndef VECRO_INTERNAL_MAKE_STATUS_H
#define VECRO_INTERNAL_MAKE_STATUS_H

#include "vecro/status.h"
#include "vecro/version.h"
#include "absl/strings/string_view.h"
#include "absl/types/optional.h"
#include <string>
#include <unordered_map>

namespace vecro {
VECRO_INLINE_NAMESPACE_BEGIN
namespace internal {

/// The domain for all the errors created by this service.
auto constexpr kErrorDomain = "vecro";

Status CancelledError(std::string msg, ErrorInfo info = {});
Status UnknownError(std::string msg, ErrorInfo info = {});
Status InvalidArgumentError(std::string msg, ErrorInfo info = {});
Status DeadlineExceededError(std::string msg, ErrorInfo info = {});
Status NotFoundError(std::string msg, ErrorInfo info = {});
Status InternalError(std::string msg, ErrorInfo info = {});
Status UnavailableError(std::string msg, ErrorInfo info = {});

/**
 * Build `ErrorInfo` instances from parts.
 *
 * This is typically used in conjunction with the `VECRO_ERROR_INFO()` macro:
 *
 * @code
 * StatusOr<std::size_t> ReadOne(CallContext& context, std::string key) {
 *   if (!connected) {
 *     return UnavailableError(
 *         "store unreachable",
 *         VECRO_ERROR_INFO().WithReason("STORE_OPERATION_FAILED")
 *             .WithMetadata("operation", "read"));
 *   }
 *   ...
 * }
 * @endcode
 */
class ErrorInfoBuilder {
 public:
  ErrorInfoBuilder(std::string file, int line, std::string function);

  /// Add a metadata pair, existing values are not replaced.
  ErrorInfoBuilder&& WithMetadata(absl::string_view key,
                                  absl::string_view value) && {
    metadata_.emplace(std::string(key), std::string(value));
    return std::move(*this);
  }

  ErrorInfoBuilder&& WithReason(std::string reason) && {
    reason_ = std::move(reason);
    return std::move(*this);
  }

  ErrorInfo Build(StatusCode code) &&;

 private:
  absl::optional<std::string> reason_;
  std::unordered_map<std::string, std::string> metadata_;
};

#define VECRO_ERROR_INFO() \
  ::vecro::internal::ErrorInfoBuilder(__FILE__, __LINE__, __func__)

Status CancelledError(std::string msg, ErrorInfoBuilder b);
Status UnknownError(std::string msg, ErrorInfoBuilder b);
Status InvalidArgumentError(std::string msg, ErrorInfoBuilder b);
Status DeadlineExceededError(std::string msg, ErrorInfoBuilder b);
Status NotFoundError(std::string msg, ErrorInfoBuilder b);
Status InternalError(std::string msg, ErrorInfoBuilder b);
Status UnavailableError(std::string msg, ErrorInfoBuilder b);

}  // namespace internal
VECRO_INLINE_NAMESPACE_END
}  // namespace vecro

#endif  // VECRO_INTERNAL_MAKE_STATUS_H
