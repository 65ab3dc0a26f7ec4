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

#include "vecro/internal/log_wrapper.h"

namespace vecro {
VECRO_INLINE_NAMESPACE_BEGIN
namespace internal {

std::string FormatTook(std::chrono::nanoseconds d) {
  return absl::FormatDuration(absl::FromChrono(d));
}

void LogRequest(absl::string_view where, absl::string_view message) {
  VECRO_LOG(INFO) << where << '(' << message << ')';
}

Status LogResponse(Status response, absl::string_view where,
                   std::chrono::nanoseconds took) {
  VECRO_LOG(INFO) << where << " >> status=" << response
                  << " took=" << FormatTook(took);
  return response;
}

}  // namespace internal
VECRO_INLINE_NAMESPACE_END
}  // namespace vecro
