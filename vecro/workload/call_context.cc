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

#include "vecro/workload/call_context.h"
#include "vecro/internal/make_status.h"
#include <algorithm>
#include <cctype>

namespace vecro {
namespace workload {
VECRO_INLINE_NAMESPACE_BEGIN
namespace {

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

}  // namespace

CallContext& CallContext::AddHeader(std::string name, std::string value) {
  headers_[ToLower(std::move(name))] = std::move(value);
  return *this;
}

absl::optional<std::string> CallContext::GetHeader(std::string name) const {
  auto i = headers_.find(ToLower(std::move(name)));
  if (i == headers_.end()) return absl::nullopt;
  return i->second;
}

absl::optional<std::chrono::milliseconds> CallContext::remaining() const {
  if (!deadline_) return absl::nullopt;
  auto const now = Clock::now();
  if (*deadline_ <= now) return std::chrono::milliseconds(0);
  return std::chrono::duration_cast<std::chrono::milliseconds>(*deadline_ -
                                                               now);
}

Status CallContext::CheckActive() const {
  if (cancelled()) {
    return internal::CancelledError("call cancelled", VECRO_ERROR_INFO());
  }
  if (deadline_ && Clock::now() >= *deadline_) {
    return internal::DeadlineExceededError("call deadline exceeded",
                                           VECRO_ERROR_INFO());
  }
  return Status{};
}

VECRO_INLINE_NAMESPACE_END
}  // namespace workload
}  // namespace vecro
