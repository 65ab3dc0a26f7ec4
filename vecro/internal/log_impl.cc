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

#include "vecro/internal/log_impl.h"

namespace vecro {
VECRO_INLINE_NAMESPACE_BEGIN
namespace internal {

void StdClogBackend::Process(LogRecord const& lr) {
  std::lock_guard<std::mutex> lk(mu_);
  if (lr.severity < min_severity_) return;
  std::clog << lr << "\n";
  if (lr.severity >= Severity::VECRO_LS_WARNING) {
    std::clog << std::flush;
  }
}

void StdClogBackend::Flush() {
  std::lock_guard<std::mutex> lk(mu_);
  std::clog << std::flush;
}

}  // namespace internal
VECRO_INLINE_NAMESPACE_END
}  // namespace vecro
